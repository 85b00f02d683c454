#include "vmedia/fs/storage_manager.h"

#include "vmedia/core/logging.h"

namespace vmedia::fs {

static constexpr const char* TAG = "storage";

bool StorageManager::registerFileSystem(std::unique_ptr<IFileSystem> fs)
{
    if (!fs) {
        return false;
    }

    std::string name = fs->name();
    if (_fileSystems.count(name) > 0) {
        VM_LOGW(TAG, "Filesystem '%s' already registered", name.c_str());
        return false;
    }

    VM_LOGD(TAG, "Registered filesystem '%s'", name.c_str());
    _fileSystems.emplace(std::move(name), std::move(fs));
    return true;
}

IFileSystem* StorageManager::get(const std::string& name)
{
    auto it = _fileSystems.find(name);
    if (it == _fileSystems.end()) {
        VM_LOGD(TAG, "No filesystem named '%s'", name.c_str());
        return nullptr;
    }
    return it->second.get();
}

} // namespace vmedia::fs
