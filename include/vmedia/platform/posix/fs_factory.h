#pragma once

#include <memory>
#include <string>

#include "vmedia/fs/filesystem.h"

namespace vmedia::platform::posix {

// Host filesystem rooted at rootDir (created if missing, including parents).
// Returns nullptr if the root cannot be created.
std::unique_ptr<vmedia::fs::IFileSystem>
create_host_filesystem(const std::string& rootDir, const std::string& name);

} // namespace vmedia::platform::posix
