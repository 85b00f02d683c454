#include "vmedia/core/version.h"

// Set by the build from project(VERSION).
#ifndef VM_VERSION
#define VM_VERSION "0.0.0"
#endif

namespace vmedia {

std::string_view version()
{
    static constexpr std::string_view v = VM_VERSION;
    return v;
}

} // namespace vmedia
