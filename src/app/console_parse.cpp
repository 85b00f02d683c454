#include "vmedia/console/console_parse.h"

#include <algorithm>
#include <cctype>

namespace vmedia::console {

static bool is_ws(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string_view trim_ws(std::string_view s)
{
    while (!s.empty() && is_ws(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_ws(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<std::string_view> split_ws(std::string_view s)
{
    std::vector<std::string_view> out;
    for (s = trim_ws(s); !s.empty(); s = trim_ws(s)) {
        const auto end = std::find_if(s.begin(), s.end(), is_ws);
        const std::size_t len = static_cast<std::size_t>(end - s.begin());
        out.push_back(s.substr(0, len));
        s.remove_prefix(len);
    }
    return out;
}

bool take_flag(std::vector<std::string_view>& argv, std::string_view flag)
{
    const auto it = std::remove(argv.begin(), argv.end(), flag);
    const bool found = it != argv.end();
    argv.erase(it, argv.end());
    return found;
}

} // namespace vmedia::console
