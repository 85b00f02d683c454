#pragma once

#include <string>
#include <string_view>

namespace vmedia::fs {

// Joins two FS-relative path pieces with exactly one '/' between them.
std::string join_paths(std::string_view base, std::string_view name);

// Last path component ("/a/b/c.iso" -> "c.iso", "/a/b/" -> "").
std::string_view base_name(std::string_view path);

// Everything before the last component ("/a/b/c.iso" -> "/a/b", "c.iso" -> "/").
std::string parent_path(std::string_view path);

} // namespace vmedia::fs
