#pragma once

#include "vmedia/net/http_client.h"

namespace vmedia::net {

// Placeholder backend for builds without an HTTP library.
// Every request fails with HttpStatus::Unsupported.
class StubHttpClient final : public IHttpClient {
public:
    HttpStatus get(const HttpGetRequest& req, HttpResponseHandler& handler) override;
};

} // namespace vmedia::net
