#include "vmedia/platform/posix/http_client_curl.h"

#if VM_WITH_CURL == 1

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

#include "vmedia/core/logging.h"

// curl headers are only included in curl-specific files
#include <curl/curl.h>

namespace vmedia::platform::posix {

using net::HttpStatus;

static constexpr const char* TAG = "http";

static void ensure_curl_global_init()
{
    static const bool inited = []{
        curl_global_init(CURL_GLOBAL_DEFAULT);
        return true;
    }();
    (void)inited;
}

static std::string_view trim(std::string_view s)
{
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) {
        s.remove_suffix(1);
    }
    return s;
}

static HttpStatus map_curl_error(CURLcode res)
{
    switch (res) {
        case CURLE_OK:                  return HttpStatus::Ok;
        case CURLE_OPERATION_TIMEDOUT:  return HttpStatus::Timeout;
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:     return HttpStatus::ConnectFailed;
        case CURLE_URL_MALFORMAT:       return HttpStatus::InvalidRequest;
        case CURLE_UNSUPPORTED_PROTOCOL:return HttpStatus::Unsupported;
        default:                        return HttpStatus::IOError;
    }
}

HttpClientCurl::~HttpClientCurl()
{
    reset();
}

void HttpClientCurl::reset()
{
    _handler = nullptr;
    _httpStatus = 0;
    _headers.clear();
    _responseDispatched = false;
    _aborted = false;

    if (_curl) {
        curl_easy_cleanup(_curl);
        _curl = nullptr;
    }
}

bool HttpClientCurl::dispatch_response()
{
    if (_responseDispatched) {
        return !_aborted;
    }
    _responseDispatched = true;

    long httpCode = 0;
    curl_easy_getinfo(_curl, CURLINFO_RESPONSE_CODE, &httpCode);
    _httpStatus = static_cast<std::uint16_t>(httpCode < 0 ? 0 : httpCode);

    if (!_handler->on_response(_httpStatus, _headers)) {
        _aborted = true;
    }
    return !_aborted;
}

std::size_t HttpClientCurl::write_body_cb(
    char *ptr,
    std::size_t size,
    std::size_t nmemb,
    void *userdata)
{
    auto *self = static_cast<HttpClientCurl *>(userdata);
    if (!self || !self->_handler)
        return 0;

    // Guard overflow: n = size * nmemb
    if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size))
    {
        return 0; // abort transfer
    }

    const std::size_t n = size * nmemb;
    if (n == 0)
        return 0;
    if (!ptr)
        return 0;

    if (!self->dispatch_response())
        return 0;

    if (!self->_handler->on_body(reinterpret_cast<const std::uint8_t *>(ptr), n))
    {
        self->_aborted = true;
        return 0;
    }
    return n;
}

std::size_t HttpClientCurl::write_header_cb(
    char *ptr,
    std::size_t size,
    std::size_t nmemb,
    void *userdata)
{
    auto *self = static_cast<HttpClientCurl *>(userdata);
    if (!self)
        return 0;

    if (size != 0 && nmemb > (std::numeric_limits<std::size_t>::max() / size))
    {
        return 0; // abort transfer
    }

    const std::size_t n = size * nmemb;
    if (n == 0 || !ptr)
        return n;

    const std::string_view line(ptr, n);

    // A new status line starts a new response (redirect hop, 100-continue):
    // only the headers of the final response are reported.
    if (line.rfind("HTTP/", 0) == 0)
    {
        self->_headers.clear();
        return n;
    }

    const std::size_t colon = line.find(':');
    if (colon != std::string_view::npos)
    {
        self->_headers.emplace_back(
            std::string(trim(line.substr(0, colon))),
            std::string(trim(line.substr(colon + 1))));
    }
    return n;
}

HttpStatus HttpClientCurl::get(const net::HttpGetRequest& req, net::HttpResponseHandler& handler)
{
    reset();

    if (req.url.empty()) {
        return HttpStatus::InvalidRequest;
    }

    ensure_curl_global_init();

    _curl = curl_easy_init();
    if (!_curl) {
        return HttpStatus::InternalError;
    }
    _handler = &handler;

    const long timeoutSecs = static_cast<long>(req.timeout.count());

    curl_easy_setopt(_curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(_curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(_curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(_curl, CURLOPT_WRITEFUNCTION, &HttpClientCurl::write_body_cb);
    curl_easy_setopt(_curl, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(_curl, CURLOPT_HEADERFUNCTION, &HttpClientCurl::write_header_cb);
    curl_easy_setopt(_curl, CURLOPT_HEADERDATA, this);

    curl_easy_setopt(_curl, CURLOPT_FOLLOWLOCATION, req.followRedirects ? 1L : 0L);

    // Per-phase timeout: connect, then abort if the body stalls for the same
    // period. A large image may legitimately take longer than that in total.
    if (timeoutSecs > 0) {
        curl_easy_setopt(_curl, CURLOPT_CONNECTTIMEOUT, timeoutSecs);
        curl_easy_setopt(_curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(_curl, CURLOPT_LOW_SPEED_TIME, timeoutSecs);
    }

    curl_easy_setopt(_curl, CURLOPT_SSL_VERIFYPEER, req.verifyTls ? 1L : 0L);
    curl_easy_setopt(_curl, CURLOPT_SSL_VERIFYHOST, req.verifyTls ? 2L : 0L);

    const CURLcode res = curl_easy_perform(_curl);

    HttpStatus st = HttpStatus::Ok;
    if (_aborted) {
        st = HttpStatus::Aborted;
    } else if (res != CURLE_OK) {
        VM_LOGD(TAG, "GET %s failed: %s", req.url.c_str(), curl_easy_strerror(res));
        st = map_curl_error(res);
    } else if (!dispatch_response()) {
        // Empty body: the response was never reported by the body callback.
        st = HttpStatus::Aborted;
    }

    reset();
    return st;
}

} // namespace vmedia::platform::posix

#endif // VM_WITH_CURL
