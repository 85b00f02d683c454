#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace vmedia::media {

// Identifies one virtual media device: the owning resource (e.g. a
// simulated server) plus a device name drawn from the catalog.
struct DeviceKey {
    std::string identity;
    std::string device;

    bool operator==(const DeviceKey& o) const noexcept
    {
        return identity == o.identity && device == o.device;
    }
    bool operator!=(const DeviceKey& o) const noexcept { return !(*this == o); }
};

struct DeviceKeyHash {
    std::size_t operator()(const DeviceKey& k) const noexcept
    {
        const std::size_t h1 = std::hash<std::string>{}(k.identity);
        const std::size_t h2 = std::hash<std::string>{}(k.device);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};

// Persistent per-device state.
struct DeviceInfo {
    std::string name;                     // display name, from the catalog
    std::vector<std::string> mediaTypes;  // from the catalog

    std::string image;                    // URL of the inserted media, empty if none
    std::string imageName;
    bool inserted{false};
    bool writeProtected{false};

    // Locally owned copy of the image (path within the cache filesystem).
    // Deleted by the registry on eject or when superseded.
    std::string localFilePath;
};

// Catalog template for a device name.
struct CatalogEntry {
    std::string device;                   // e.g. "Cd"
    std::string name;                     // e.g. "Virtual CD"
    std::vector<std::string> mediaTypes;  // e.g. {"CD", "DVD"}
};

// Projection returned by VirtualMediaRegistry::image_info.
struct ImageInfo {
    std::string imageName;
    std::string imagePath;
    bool inserted{false};
    bool writeProtected{false};
};

struct InsertOptions {
    bool inserted{true};
    bool writeProtected{true};
};

enum class MediaError : std::uint8_t {
    None = 0,
    NotFound,       // unknown device name for the identity
    FetchFailed,    // image download failed after all retries
    InvalidRequest,
    InternalError,
};

// Outcome of a registry or fetcher operation.
// `code` is an HTTP-style status class the front-end can map onto its
// transport error (404, 400, 502, 500); 0 on success.
struct MediaResult {
    MediaError error{MediaError::None};
    int code{0};
    std::string message;

    bool ok() const noexcept { return error == MediaError::None; }

    static MediaResult success() { return MediaResult{}; }
    static MediaResult failure(MediaError e, int code, std::string message)
    {
        return MediaResult{e, code, std::move(message)};
    }
};

const char* to_string(MediaError e) noexcept;

} // namespace vmedia::media
