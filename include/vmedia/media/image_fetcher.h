#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <string_view>

#include "vmedia/fs/filesystem.h"
#include "vmedia/media/media_types.h"
#include "vmedia/net/http_client.h"
#include "vmedia/net/http_client_registry.h"

namespace vmedia::media {

struct FetchPolicy {
    int maxAttempts{5};
    std::chrono::milliseconds initialBackoff{1000};
    int backoffMultiplier{2};

    std::chrono::seconds timeout{60};
    std::size_t chunkSize{8192};
    bool verifyTls{false};

    std::string defaultFileName{"image.iso"};
};

// Downloads a remote image into a file owned by the caller.
//
// Each attempt streams the body into a fresh temp file in workDir, then
// renames it into a new uniquely named directory beside it, under the
// name announced by the server (content-disposition), the last URL path
// segment, or FetchPolicy::defaultFileName. Failed attempts leave nothing
// behind. Attempts are separated by exponential backoff on the calling
// thread.
class ImageFetcher {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    // An empty sleeper means std::this_thread::sleep_for.
    ImageFetcher(fs::IFileSystem& fs,
                 std::string workDir,
                 net::HttpClientRegistry http,
                 FetchPolicy policy = {},
                 Sleeper sleeper = {});

    // On success outPath holds the FS-relative path of the new file.
    // On failure the result carries MediaError::FetchFailed and the code of
    // the last attempt: 502 (server error), 400 (client error) or 500.
    MediaResult fetch(const std::string& url, std::string& outPath);

    const FetchPolicy& policy() const noexcept { return _policy; }
    fs::IFileSystem& filesystem() noexcept { return _fs; }

private:
    MediaResult fetch_once(const std::string& url, std::string& outPath);
    std::string resolve_file_name(const std::string& url, const net::HttpHeaders& headers) const;

    fs::IFileSystem& _fs;
    std::string _workDir;
    net::HttpClientRegistry _http;
    FetchPolicy _policy;
    Sleeper _sleep;
};

// Value of filename="..." in a content-disposition header, reduced to its
// last path component. Empty if absent or unusable ("", ".", "..").
std::string parse_content_disposition_filename(std::string_view header);

// Last path segment of a URL, ignoring query and fragment. Empty when the
// path is empty or ends with '/'.
std::string url_file_name(std::string_view url);

} // namespace vmedia::media
