#include "vmedia/media/image_fetcher.h"

#include "vmedia/core/logging.h"
#include "vmedia/fs/path_utils.h"
#include "vmedia/net/http_client.h"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <thread>
#include <utility>
#include <vector>

namespace vmedia::media {

static constexpr const char* TAG = "fetch";

// Amount of an error response body kept for the log.
static constexpr std::size_t ERROR_BODY_MAX = 1024;

namespace {

// Streams a response into an open file in fixed-size chunks.
// Bodies of error responses are not written; their start is kept for logging.
class ImageDownload final : public net::HttpResponseHandler {
public:
    ImageDownload(fs::IFile& file, std::size_t chunkSize)
        : _file(file)
        , _chunkSize(chunkSize == 0 ? 1 : chunkSize)
    {
        _chunk.reserve(_chunkSize);
    }

    bool on_response(std::uint16_t httpStatus, const net::HttpHeaders& headers) override
    {
        _status = httpStatus;
        _headers = headers;
        return true;
    }

    bool on_body(const std::uint8_t* data, std::size_t len) override
    {
        if (failed_status()) {
            const std::size_t room = ERROR_BODY_MAX - _errorBody.size();
            _errorBody.append(reinterpret_cast<const char*>(data), std::min(room, len));
            return _errorBody.size() < ERROR_BODY_MAX;
        }

        while (len > 0) {
            const std::size_t n = std::min(len, _chunkSize - _chunk.size());
            _chunk.insert(_chunk.end(), data, data + n);
            data += n;
            len -= n;

            if (_chunk.size() == _chunkSize && !write_chunk()) {
                return false;
            }
        }
        return true;
    }

    // Writes any partial trailing chunk and flushes the file.
    bool finish()
    {
        if (_writeFailed) {
            return false;
        }
        if (!_chunk.empty() && !write_chunk()) {
            return false;
        }
        return _file.flush();
    }

    bool failed_status() const noexcept { return _status >= 400; }
    bool write_failed() const noexcept { return _writeFailed; }

    std::uint16_t status() const noexcept { return _status; }
    const net::HttpHeaders& headers() const noexcept { return _headers; }
    const std::string& error_body() const noexcept { return _errorBody; }
    std::uint64_t bytes_written() const noexcept { return _written; }

private:
    bool write_chunk()
    {
        std::size_t off = 0;
        while (off < _chunk.size()) {
            const std::size_t n = _file.write(_chunk.data() + off, _chunk.size() - off);
            if (n == 0) {
                _writeFailed = true;
                return false;
            }
            off += n;
        }
        _written += _chunk.size();
        _chunk.clear();
        return true;
    }

    fs::IFile& _file;
    std::size_t _chunkSize;
    std::vector<std::uint8_t> _chunk;

    std::uint16_t _status{0};
    net::HttpHeaders _headers;
    std::string _errorBody;

    std::uint64_t _written{0};
    bool _writeFailed{false};
};

int code_for_http_status(std::uint16_t status)
{
    if (status >= 500) return 502;
    if (status >= 400) return 400;
    return 500;
}

bool usable_file_name(std::string_view name)
{
    return !name.empty() && name != "." && name != "..";
}

} // namespace

std::string parse_content_disposition_filename(std::string_view header)
{
    static constexpr std::string_view KEY = "filename=\"";

    const std::size_t pos = header.find(KEY);
    if (pos == std::string_view::npos) {
        return {};
    }

    // Greedy: the value runs to the last quote on the line.
    const std::size_t start = pos + KEY.size();
    const std::size_t end = header.rfind('"');
    if (end == std::string_view::npos || end <= start) {
        return {};
    }

    const std::string_view name = fs::base_name(header.substr(start, end - start));
    return usable_file_name(name) ? std::string(name) : std::string();
}

std::string url_file_name(std::string_view url)
{
    std::string_view path = url;

    if (const std::size_t sep = path.find("://"); sep != std::string_view::npos) {
        path.remove_prefix(sep + 3);
        const std::size_t slash = path.find_first_of("/?#");
        if (slash == std::string_view::npos || path[slash] != '/') {
            return {};
        }
        path.remove_prefix(slash);
    }

    if (const std::size_t cut = path.find_first_of("?#"); cut != std::string_view::npos) {
        path = path.substr(0, cut);
    }

    const std::string_view name = fs::base_name(path);
    return usable_file_name(name) ? std::string(name) : std::string();
}

ImageFetcher::ImageFetcher(fs::IFileSystem& fs,
                           std::string workDir,
                           net::HttpClientRegistry http,
                           FetchPolicy policy,
                           Sleeper sleeper)
    : _fs(fs)
    , _workDir(std::move(workDir))
    , _http(std::move(http))
    , _policy(std::move(policy))
    , _sleep(std::move(sleeper))
{
    if (!_sleep) {
        _sleep = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
    if (_policy.maxAttempts < 1) {
        _policy.maxAttempts = 1;
    }
    if (_policy.defaultFileName.empty()) {
        _policy.defaultFileName = "image.iso";
    }
}

MediaResult ImageFetcher::fetch(const std::string& url, std::string& outPath)
{
    auto backoff = _policy.initialBackoff;

    for (int attempt = 1;; ++attempt) {
        std::string path;
        MediaResult r = fetch_once(url, path);
        if (r.ok()) {
            VM_LOGD(TAG, "Fetched '%s' into '%s'", url.c_str(), path.c_str());
            outPath = std::move(path);
            return r;
        }

        if (attempt >= _policy.maxAttempts) {
            VM_LOGE(TAG, "Max retries reached. Failed fetching image from URL %s: %s",
                    url.c_str(), r.message.c_str());
            return MediaResult::failure(
                MediaError::FetchFailed, r.code,
                "Failed fetching image from URL " + url + ": " + r.message);
        }

        VM_LOGW(TAG, "Attempt %d failed fetching image from URL %s: %s. Retrying after %lld ms...",
                attempt, url.c_str(), r.message.c_str(),
                static_cast<long long>(backoff.count()));

        _sleep(backoff);
        backoff *= _policy.backoffMultiplier;
    }
}

MediaResult ImageFetcher::fetch_once(const std::string& url, std::string& outPath)
{
    auto client = _http.create_for_url(url);
    if (!client) {
        return MediaResult::failure(MediaError::InvalidRequest, 500,
                                    "Unsupported URL scheme in '" + url + "'");
    }

    std::string tmpPath;
    auto file = _fs.createTempFile(_workDir, tmpPath);
    if (!file) {
        return MediaResult::failure(MediaError::InternalError, 500,
                                    "Cannot create temporary file in '" + _workDir + "'");
    }

    net::HttpGetRequest req{};
    req.url = url;
    req.timeout = _policy.timeout;
    req.followRedirects = true;
    req.verifyTls = _policy.verifyTls;

    ImageDownload download(*file, _policy.chunkSize);
    const net::HttpStatus st = client->get(req, download);
    const bool written = !download.failed_status() && download.finish();
    file.reset();

    auto discard = [&](MediaResult r) {
        if (!_fs.removeFile(tmpPath)) {
            VM_LOGW(TAG, "Cannot remove temporary file '%s'", tmpPath.c_str());
        }
        return r;
    };

    if (download.failed_status()) {
        VM_LOGE(TAG, "Failed fetching image from URL %s: got HTTP error %u:\n%s",
                url.c_str(), static_cast<unsigned>(download.status()),
                download.error_body().c_str());
        return discard(MediaResult::failure(
            MediaError::FetchFailed, code_for_http_status(download.status()),
            "Cannot download virtual media: got error " +
                std::to_string(download.status()) + " from the server"));
    }

    if (st != net::HttpStatus::Ok) {
        return discard(MediaResult::failure(
            MediaError::FetchFailed, 500,
            std::string("Transfer failed: ") + net::to_string(st)));
    }

    if (!written || download.write_failed()) {
        return discard(MediaResult::failure(
            MediaError::InternalError, 500,
            "Cannot write temporary file '" + tmpPath + "'"));
    }

    const std::string name = resolve_file_name(url, download.headers());

    std::string dir;
    if (!_fs.createTempDirectory(fs::parent_path(tmpPath), dir)) {
        return discard(MediaResult::failure(
            MediaError::InternalError, 500,
            "Cannot create directory for '" + name + "'"));
    }

    const std::string finalPath = fs::join_paths(dir, name);
    if (!_fs.rename(tmpPath, finalPath)) {
        (void)_fs.removeDirectory(dir);
        return discard(MediaResult::failure(
            MediaError::InternalError, 500,
            "Cannot move image into '" + finalPath + "'"));
    }

    VM_LOGV(TAG, "Stored %llu bytes as '%s'",
            static_cast<unsigned long long>(download.bytes_written()), finalPath.c_str());

    outPath = finalPath;
    return MediaResult::success();
}

std::string ImageFetcher::resolve_file_name(const std::string& url,
                                            const net::HttpHeaders& headers) const
{
    if (const std::string* cd = net::find_header(headers, "content-disposition")) {
        if (std::string name = parse_content_disposition_filename(*cd); !name.empty()) {
            return name;
        }
    }

    if (std::string name = url_file_name(url); !name.empty()) {
        return name;
    }

    return _policy.defaultFileName;
}

} // namespace vmedia::media
