#pragma once

#include <string_view>

namespace vmedia {

std::string_view version();

} // namespace vmedia
