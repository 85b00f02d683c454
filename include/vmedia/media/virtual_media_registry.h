#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "vmedia/fs/filesystem.h"
#include "vmedia/media/device_catalog.h"
#include "vmedia/media/device_store.h"
#include "vmedia/media/image_fetcher.h"
#include "vmedia/media/media_types.h"

namespace vmedia::media {

// Virtual media devices of every resource identity.
//
// Devices are created lazily: the first lookup for an identity seeds one
// record per catalog entry. insert_image downloads the image before any
// state changes; eject_image clears the state and then deletes the local
// copy. Calls on the same (identity, device) are serialized; reads are not.
class VirtualMediaRegistry {
public:
    // The store, fetcher and filesystem must outlive the registry.
    // Local copies returned by the fetcher live on the fetcher's filesystem.
    VirtualMediaRegistry(DeviceCatalog catalog, DeviceStore& store, ImageFetcher& fetcher);

    VirtualMediaRegistry(const VirtualMediaRegistry&) = delete;
    VirtualMediaRegistry& operator=(const VirtualMediaRegistry&) = delete;

    static constexpr const char* DRIVER_NAME = "<static-vmedia>";

    const char* driver() const noexcept { return DRIVER_NAME; }

    // Catalog device names, in catalog order.
    std::vector<std::string> devices() const;

    MediaResult device_name(const std::string& identity, const std::string& device, std::string& out);
    MediaResult media_types(const std::string& identity, const std::string& device,
                            std::vector<std::string>& out);
    MediaResult image_info(const std::string& identity, const std::string& device, ImageInfo& out);

    // Full record, for diagnostics.
    MediaResult device_info(const std::string& identity, const std::string& device, DeviceInfo& out);

    MediaResult insert_image(const std::string& identity,
                             const std::string& device,
                             const std::string& url,
                             const InsertOptions& opts,
                             std::string& outLocalPath);

    MediaResult eject_image(const std::string& identity, const std::string& device);

    const DeviceCatalog& catalog() const noexcept { return _catalog; }

    // Keys that have held an insert/eject lock; only catalog devices get one.
    std::size_t locked_key_count() const;

private:
    MediaResult resolve(const DeviceKey& key, DeviceInfo& out);
    void seed_identity(const std::string& identity);

    std::mutex& key_mutex(const DeviceKey& key);

    // Removes a local copy and, if now empty, the directory created for it.
    void remove_local_copy(const std::string& path);

    DeviceCatalog _catalog;
    DeviceStore& _store;
    ImageFetcher& _fetcher;

    mutable std::mutex _locksMutex;
    std::unordered_map<DeviceKey, std::unique_ptr<std::mutex>, DeviceKeyHash> _locks;
};

} // namespace vmedia::media
