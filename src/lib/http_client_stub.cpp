#include "vmedia/net/http_client_stub.h"

#include "vmedia/core/logging.h"

namespace vmedia::net {

static constexpr const char* TAG = "http";

HttpStatus StubHttpClient::get(const HttpGetRequest& req, HttpResponseHandler& handler)
{
    (void)handler;
    VM_LOGW(TAG, "No HTTP backend in this build; cannot GET %s", req.url.c_str());
    return HttpStatus::Unsupported;
}

} // namespace vmedia::net
