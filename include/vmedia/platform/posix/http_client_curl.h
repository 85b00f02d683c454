#pragma once

#include "vmedia/net/http_client.h"

#if VM_WITH_CURL == 1

#include <cstdint>
#include <string>

#include <curl/curl.h>

namespace vmedia::platform::posix {

// libcurl easy-interface backend. One instance serves one request at a time.
class HttpClientCurl final : public net::IHttpClient {
public:
    HttpClientCurl() = default;
    ~HttpClientCurl() override;

    HttpClientCurl(const HttpClientCurl&) = delete;
    HttpClientCurl& operator=(const HttpClientCurl&) = delete;

    net::HttpStatus get(const net::HttpGetRequest& req, net::HttpResponseHandler& handler) override;

private:
    static std::size_t write_body_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);
    static std::size_t write_header_cb(char* ptr, std::size_t size, std::size_t nmemb, void* userdata);

    // Delivers on_response once; returns the handler's verdict.
    bool dispatch_response();
    void reset();

    CURL* _curl = nullptr;
    net::HttpResponseHandler* _handler = nullptr;

    std::uint16_t _httpStatus{0};
    net::HttpHeaders _headers;
    bool _responseDispatched{false};
    bool _aborted{false};
};

} // namespace vmedia::platform::posix

#endif // VM_WITH_CURL
