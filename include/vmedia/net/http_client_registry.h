#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace vmedia::net {

class IHttpClient;

// URL scheme -> client backend factory. A fresh client is created per request.
class HttpClientRegistry {
public:
    using Factory = std::function<std::unique_ptr<IHttpClient>()>;

    bool register_scheme(std::string schemeLower, Factory factory);

    // Returns nullptr if the scheme is not registered.
    std::unique_ptr<IHttpClient> create(std::string_view schemeLower) const;

    // Creates a client for the scheme of `url` (case-insensitive).
    std::unique_ptr<IHttpClient> create_for_url(std::string_view url) const;

private:
    std::unordered_map<std::string, Factory> _factories;
};

// Lowercased scheme of "scheme://..." or empty if the URL has none.
std::string url_scheme(std::string_view url);

} // namespace vmedia::net
