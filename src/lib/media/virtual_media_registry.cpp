#include "vmedia/media/virtual_media_registry.h"

#include "vmedia/core/logging.h"
#include "vmedia/fs/path_utils.h"

#include <utility>

namespace vmedia::media {

static constexpr const char* TAG = "vmedia";

VirtualMediaRegistry::VirtualMediaRegistry(DeviceCatalog catalog, DeviceStore& store, ImageFetcher& fetcher)
    : _catalog(std::move(catalog))
    , _store(store)
    , _fetcher(fetcher)
{
    if (_catalog.empty()) {
        VM_LOGW(TAG, "Device catalog is empty; every lookup will fail");
    }
}

std::vector<std::string> VirtualMediaRegistry::devices() const
{
    return _catalog.device_names();
}

void VirtualMediaRegistry::seed_identity(const std::string& identity)
{
    std::vector<DeviceStore::Entry> entries;
    entries.reserve(_catalog.size());
    for (const auto& e : _catalog.entries()) {
        entries.emplace_back(DeviceKey{identity, e.device}, DeviceCatalog::make_device_info(e));
    }

    const std::size_t added = _store.seed_missing(entries);
    if (added > 0) {
        VM_LOGI(TAG, "Initialized %zu virtual media devices for '%s'", added, identity.c_str());
    }
}

static MediaResult no_such_device(const DeviceKey& key)
{
    return MediaResult::failure(
        MediaError::NotFound, 404,
        "No such virtual media device " + key.device + " owned by resource " + key.identity);
}

MediaResult VirtualMediaRegistry::resolve(const DeviceKey& key, DeviceInfo& out)
{
    // Records left behind by an older catalog are not served. The identity
    // is still seeded, as for any first lookup.
    if (!_catalog.find(key.device)) {
        seed_identity(key.identity);
        return no_such_device(key);
    }

    if (_store.get(key, out)) {
        return MediaResult::success();
    }

    seed_identity(key.identity);

    if (_store.get(key, out)) {
        return MediaResult::success();
    }

    return no_such_device(key);
}

std::mutex& VirtualMediaRegistry::key_mutex(const DeviceKey& key)
{
    std::lock_guard<std::mutex> lock(_locksMutex);
    auto& m = _locks[key];
    if (!m) {
        m = std::make_unique<std::mutex>();
    }
    return *m;
}

std::size_t VirtualMediaRegistry::locked_key_count() const
{
    std::lock_guard<std::mutex> lock(_locksMutex);
    return _locks.size();
}

MediaResult VirtualMediaRegistry::device_name(const std::string& identity, const std::string& device, std::string& out)
{
    DeviceInfo info{};
    MediaResult r = resolve(DeviceKey{identity, device}, info);
    if (!r.ok()) return r;

    out = info.name.empty() ? identity : info.name;
    return r;
}

MediaResult VirtualMediaRegistry::media_types(const std::string& identity, const std::string& device,
                                              std::vector<std::string>& out)
{
    DeviceInfo info{};
    MediaResult r = resolve(DeviceKey{identity, device}, info);
    if (!r.ok()) return r;

    out = std::move(info.mediaTypes);
    return r;
}

MediaResult VirtualMediaRegistry::image_info(const std::string& identity, const std::string& device, ImageInfo& out)
{
    DeviceInfo info{};
    MediaResult r = resolve(DeviceKey{identity, device}, info);
    if (!r.ok()) return r;

    out.imageName = std::move(info.imageName);
    out.imagePath = std::move(info.image);
    out.inserted = info.inserted;
    out.writeProtected = info.writeProtected;
    return r;
}

MediaResult VirtualMediaRegistry::device_info(const std::string& identity, const std::string& device, DeviceInfo& out)
{
    return resolve(DeviceKey{identity, device}, out);
}

MediaResult VirtualMediaRegistry::insert_image(const std::string& identity,
                                               const std::string& device,
                                               const std::string& url,
                                               const InsertOptions& opts,
                                               std::string& outLocalPath)
{
    const DeviceKey key{identity, device};

    if (url.empty()) {
        return MediaResult::failure(MediaError::InvalidRequest, 400, "Image URL is empty");
    }
    if (!_catalog.find(device)) {
        DeviceInfo unused{};
        return resolve(key, unused);
    }

    std::lock_guard<std::mutex> lock(key_mutex(key));

    DeviceInfo info{};
    MediaResult r = resolve(key, info);
    if (!r.ok()) return r;

    std::string localPath;
    r = _fetcher.fetch(url, localPath);
    if (!r.ok()) {
        return r;
    }

    VM_LOGD(TAG, "Fetched image %s for %s",
            std::string(fs::base_name(localPath)).c_str(), identity.c_str());

    const std::string superseded = info.localFilePath;

    // ImageName is left as it was.
    info.image = url;
    info.inserted = opts.inserted;
    info.writeProtected = opts.writeProtected;
    info.localFilePath = localPath;

    if (!_store.set(key, info)) {
        VM_LOGE(TAG, "Inserted %s into %s/%s but could not persist the change",
                url.c_str(), identity.c_str(), device.c_str());
    }

    if (!superseded.empty() && superseded != localPath) {
        remove_local_copy(superseded);
    }

    outLocalPath = localPath;
    return MediaResult::success();
}

MediaResult VirtualMediaRegistry::eject_image(const std::string& identity, const std::string& device)
{
    const DeviceKey key{identity, device};
    if (!_catalog.find(device)) {
        DeviceInfo unused{};
        return resolve(key, unused);
    }

    std::lock_guard<std::mutex> lock(key_mutex(key));

    DeviceInfo info{};
    MediaResult r = resolve(key, info);
    if (!r.ok()) return r;

    const std::string localFile = info.localFilePath;

    info.image.clear();
    info.imageName.clear();
    info.inserted = false;
    info.writeProtected = false;
    info.localFilePath.clear();

    if (!_store.set(key, info)) {
        VM_LOGE(TAG, "Ejected %s/%s but could not persist the change",
                identity.c_str(), device.c_str());
    }

    if (!localFile.empty()) {
        remove_local_copy(localFile);
        VM_LOGD(TAG, "Removed local file %s for %s", localFile.c_str(), identity.c_str());
    }

    return MediaResult::success();
}

void VirtualMediaRegistry::remove_local_copy(const std::string& path)
{
    fs::IFileSystem& cache = _fetcher.filesystem();

    if (!cache.removeFile(path)) {
        VM_LOGW(TAG, "Cannot remove local image '%s' on '%s'", path.c_str(), cache.name().c_str());
        return;
    }

    const std::string dir = fs::parent_path(path);
    if (dir != "/" && !cache.removeDirectory(dir)) {
        VM_LOGD(TAG, "Left directory '%s' in place", dir.c_str());
    }
}

} // namespace vmedia::media
