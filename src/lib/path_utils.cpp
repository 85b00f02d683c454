#include "vmedia/fs/path_utils.h"

namespace vmedia::fs {

std::string join_paths(std::string_view base, std::string_view name)
{
    while (!name.empty() && name.front() == '/') {
        name.remove_prefix(1);
    }

    if (base.empty() || base == "/") {
        return std::string("/").append(name);
    }

    std::string out(base);
    if (out.back() != '/') {
        out.push_back('/');
    }
    out.append(name);
    return out;
}

std::string_view base_name(std::string_view path)
{
    const std::size_t slash = path.find_last_of('/');
    if (slash == std::string_view::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

std::string parent_path(std::string_view path)
{
    while (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    const std::size_t slash = path.find_last_of('/');
    if (slash == std::string_view::npos || slash == 0) {
        return "/";
    }
    return std::string(path.substr(0, slash));
}

} // namespace vmedia::fs
