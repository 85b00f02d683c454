#include "vmedia/platform/http_registry.h"

#include "vmedia/net/http_client_stub.h"

#if VM_WITH_CURL == 1
#include "vmedia/platform/posix/http_client_curl.h"
#endif

namespace vmedia::platform {

net::HttpClientRegistry make_default_http_registry()
{
    net::HttpClientRegistry r;

#if VM_WITH_CURL == 1
    r.register_scheme("http", [] { return std::make_unique<posix::HttpClientCurl>(); });
    r.register_scheme("https", [] { return std::make_unique<posix::HttpClientCurl>(); });
#else
    r.register_scheme("http", [] { return std::make_unique<net::StubHttpClient>(); });
    r.register_scheme("https", [] { return std::make_unique<net::StubHttpClient>(); });
#endif

    return r;
}

} // namespace vmedia::platform
