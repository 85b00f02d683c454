#pragma once

#include <string>
#include <string_view>

#include "vmedia/fs/filesystem.h"

namespace vmedia::fs {

// Reads the remainder of the file into a string.
std::string read_all(IFile& file);

// Returns false on a short write.
bool write_all(IFile& file, std::string_view data);

// Writes `data` to "<path>.tmp", flushes, then renames it over `path`.
// On failure the temp file is removed and `path` is left untouched.
bool write_file_atomic(IFileSystem& fs, const std::string& path, std::string_view data);

} // namespace vmedia::fs
