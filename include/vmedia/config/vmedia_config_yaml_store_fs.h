#pragma once

#include <string>

#include "vmedia/config/vmedia_config.h"
#include "vmedia/fs/filesystem.h"

namespace vmedia::config {

// vmedia.yaml on a filesystem. A missing file is created with defaults;
// a file that cannot be parsed yields defaults and is left untouched.
class YamlVmediaConfigStoreFs : public VmediaConfigStore {
public:
    YamlVmediaConfigStoreFs(fs::IFileSystem* fs, std::string relativePath);

    VmediaConfig load() override;
    void save(const VmediaConfig& cfg) override;

private:
    fs::IFileSystem* _fs;
    std::string      _relPath; // e.g. "vmedia.yaml"

    VmediaConfig loadFromFs(fs::IFileSystem& vol);
    void saveToFs(fs::IFileSystem& vol, const VmediaConfig& cfg);
};

} // namespace vmedia::config
