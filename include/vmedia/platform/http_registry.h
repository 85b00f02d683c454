#pragma once

#include "vmedia/net/http_client_registry.h"

namespace vmedia::platform {

// Build a default URL-scheme -> HTTP backend registry for the current platform.
net::HttpClientRegistry make_default_http_registry();

} // namespace vmedia::platform
