#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "vmedia/fs/filesystem.h"
#include "vmedia/media/media_types.h"

namespace vmedia::media {

// Composite-key map of device state. Thread-safe; every accessor copies
// records in or out, so callers never hold references into the map.
//
// In-memory until make_permanent() binds it to "<namespace>.yaml" on a
// filesystem; from then on every mutation rewrites that file (temp file +
// rename), so state survives process restarts.
class DeviceStore {
public:
    using Entry = std::pair<DeviceKey, DeviceInfo>;

    DeviceStore() = default;

    DeviceStore(const DeviceStore&) = delete;
    DeviceStore& operator=(const DeviceStore&) = delete;

    // Loads any existing state for the namespace and persists from now on.
    // Returns false (and stays in-memory) if fs is null or the existing
    // state file cannot be read or parsed.
    bool make_permanent(fs::IFileSystem* fs, std::string nameSpace);
    bool permanent() const;

    bool get(const DeviceKey& key, DeviceInfo& out) const;
    bool contains(const DeviceKey& key) const;

    // The in-memory record is always replaced; returns false if persisting failed.
    bool set(const DeviceKey& key, const DeviceInfo& info);
    bool update(const std::vector<Entry>& entries);

    // Atomically inserts only the entries whose key is absent.
    // Returns how many were inserted.
    std::size_t seed_missing(const std::vector<Entry>& entries);

    void for_each(const std::function<void(const DeviceKey&, const DeviceInfo&)>& fn) const;
    std::size_t size() const;

private:
    bool save_locked();
    bool load_locked(fs::IFileSystem& vol, const std::string& relPath);

    mutable std::mutex _mutex;
    std::unordered_map<DeviceKey, DeviceInfo, DeviceKeyHash> _devices;

    fs::IFileSystem* _fs = nullptr;
    std::string _relPath; // e.g. "vmedia.yaml"
};

} // namespace vmedia::media
