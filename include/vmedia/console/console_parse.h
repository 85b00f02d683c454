#pragma once

#include <string_view>
#include <vector>

namespace vmedia::console {

std::string_view trim_ws(std::string_view s);

// Split on ASCII whitespace, after trimming ends.
std::vector<std::string_view> split_ws(std::string_view s);

// Removes every occurrence of `flag` from argv. Returns true if one was present.
bool take_flag(std::vector<std::string_view>& argv, std::string_view flag);

} // namespace vmedia::console
