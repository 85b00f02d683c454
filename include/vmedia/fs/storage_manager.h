#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>

#include "vmedia/fs/filesystem.h"

namespace vmedia::fs {

// Owns the host volumes the emulator works on: "state" for persisted device
// records and "cache" for downloaded images. Looked up by fs->name().
class StorageManager {
public:
    StorageManager() = default;

    StorageManager(const StorageManager&) = delete;
    StorageManager& operator=(const StorageManager&) = delete;

    // Returns false if fs is null or its name is taken.
    bool registerFileSystem(std::unique_ptr<IFileSystem> fs);

    IFileSystem* get(const std::string& name);

    std::size_t size() const noexcept { return _fileSystems.size(); }

private:
    std::map<std::string, std::unique_ptr<IFileSystem>> _fileSystems;
};

} // namespace vmedia::fs
