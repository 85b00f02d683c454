#include "vmedia/net/http_client_registry.h"

#include "vmedia/net/http_client.h"

#include <cctype>

namespace vmedia::net {

namespace {

bool ieq(std::string_view a, std::string_view b)
{
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace

const char* to_string(HttpStatus s) noexcept
{
    switch (s) {
        case HttpStatus::Ok:             return "ok";
        case HttpStatus::InvalidRequest: return "invalid request";
        case HttpStatus::ConnectFailed:  return "connect failed";
        case HttpStatus::Timeout:        return "timeout";
        case HttpStatus::IOError:        return "I/O error";
        case HttpStatus::Aborted:        return "aborted";
        case HttpStatus::Unsupported:    return "unsupported";
        case HttpStatus::InternalError:  return "internal error";
    }
    return "unknown";
}

const std::string* find_header(const HttpHeaders& headers, std::string_view name)
{
    for (const auto& kv : headers) {
        if (ieq(kv.first, name)) {
            return &kv.second;
        }
    }
    return nullptr;
}

bool HttpClientRegistry::register_scheme(std::string schemeLower, Factory factory)
{
    if (schemeLower.empty() || !factory) {
        return false;
    }

    auto it = _factories.find(schemeLower);
    if (it != _factories.end()) {
        // already registered
        return false;
    }

    _factories.emplace(std::move(schemeLower), std::move(factory));
    return true;
}

std::unique_ptr<IHttpClient> HttpClientRegistry::create(std::string_view schemeLower) const
{
    auto it = _factories.find(std::string(schemeLower));
    if (it == _factories.end()) {
        return nullptr;
    }
    return (it->second)();
}

std::unique_ptr<IHttpClient> HttpClientRegistry::create_for_url(std::string_view url) const
{
    const std::string scheme = url_scheme(url);
    if (scheme.empty()) {
        return nullptr;
    }
    return create(scheme);
}

std::string url_scheme(std::string_view url)
{
    const std::size_t sep = url.find("://");
    if (sep == std::string_view::npos || sep == 0) {
        return {};
    }

    std::string out(url.substr(0, sep));
    for (auto& ch : out) {
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '+' && ch != '-' && ch != '.') {
            return {};
        }
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

} // namespace vmedia::net
