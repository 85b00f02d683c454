#pragma once

#include <cstdarg>
#include <string_view>

namespace vmedia::log {

enum class Level {
    Error = 0,
    Warn,
    Info,
    Debug,
    Verbose,
};

void early_logf(const char* fmt, ...);

// Parses "error", "warn", "info", "debug", "verbose". Unknown strings map to Info.
Level parse_level(std::string_view s);

#if defined(VM_DEBUG)

// Messages above this level are dropped. Default: Info.
void set_level(Level level);
Level level();

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args);
void logf(Level level, const char* tag, const char* fmt, ...);
void log(Level level, const char* tag, std::string_view message);

#else

inline void set_level(Level) {}
inline Level level() { return Level::Error; }

inline void vlogf(Level, const char*, const char*, std::va_list) {}

template <typename... Args>
inline void logf(Level, const char*, const char*, Args&&...) {}

inline void log(Level, const char*, std::string_view) {}

#endif // VM_DEBUG

} // namespace vmedia::log

// ------------------------------------------------------------------
// Convenience macros
// ------------------------------------------------------------------

#define VM_ELOG(fmt, ...) ::vmedia::log::early_logf(fmt "\n", ##__VA_ARGS__)

#if defined(VM_DEBUG)

#define VM_LOGE(tag, fmt, ...) \
    ::vmedia::log::logf(::vmedia::log::Level::Error,   tag, fmt, ##__VA_ARGS__)

#define VM_LOGW(tag, fmt, ...) \
    ::vmedia::log::logf(::vmedia::log::Level::Warn,    tag, fmt, ##__VA_ARGS__)

#define VM_LOGI(tag, fmt, ...) \
    ::vmedia::log::logf(::vmedia::log::Level::Info,    tag, fmt, ##__VA_ARGS__)

#define VM_LOGD(tag, fmt, ...) \
    ::vmedia::log::logf(::vmedia::log::Level::Debug,   tag, fmt, ##__VA_ARGS__)

#define VM_LOGV(tag, fmt, ...) \
    ::vmedia::log::logf(::vmedia::log::Level::Verbose, tag, fmt, ##__VA_ARGS__)

#else

// The whole macro invocation (including arguments / fmt strings)
// disappears at preprocessing time.

#define VM_LOGE(tag, fmt, ...) ((void)0)
#define VM_LOGW(tag, fmt, ...) ((void)0)
#define VM_LOGI(tag, fmt, ...) ((void)0)
#define VM_LOGD(tag, fmt, ...) ((void)0)
#define VM_LOGV(tag, fmt, ...) ((void)0)

#endif // VM_DEBUG
