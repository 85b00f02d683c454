#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vmedia::net {

// Transport-level outcome of a request. HTTP error statuses (4xx/5xx) are
// not transport failures: they come back as Ok with the status in
// HttpResponseHandler::on_response.
enum class HttpStatus : std::uint8_t {
    Ok = 0,
    InvalidRequest,
    ConnectFailed,
    Timeout,
    IOError,
    Aborted,        // a handler callback returned false
    Unsupported,
    InternalError,
};

const char* to_string(HttpStatus s) noexcept;

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

// Case-insensitive header lookup. Returns nullptr when absent.
const std::string* find_header(const HttpHeaders& headers, std::string_view name);

struct HttpGetRequest {
    std::string url;

    // Applied to connecting and to any stall while reading the body.
    std::chrono::seconds timeout{60};

    bool followRedirects{true};
    bool verifyTls{false};
};

// Receives a streaming response.
// on_response is called exactly once, before any on_body call, as soon as the
// final status line and headers are known. Returning false from either
// callback aborts the transfer (the client then reports HttpStatus::Aborted).
class HttpResponseHandler {
public:
    virtual ~HttpResponseHandler() = default;

    virtual bool on_response(std::uint16_t httpStatus, const HttpHeaders& headers) = 0;
    virtual bool on_body(const std::uint8_t* data, std::size_t len) = 0;
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Performs a blocking GET, streaming the body into `handler`.
    virtual HttpStatus get(const HttpGetRequest& req, HttpResponseHandler& handler) = 0;
};

} // namespace vmedia::net
