#pragma once

#include <cstdarg>
#include <string_view>

namespace tftpkit::log {

enum class Level {
    Error = 0,
    Warn,
    Info,
    Debug,
    Verbose,
};

#if defined(TFTPKIT_DEBUG)

// Real functions exist only in debug builds.
void vlogf(Level level, const char* tag, const char* fmt, std::va_list args);
void logf(Level level, const char* tag, const char* fmt, ...);
void log(Level level, const char* tag, std::string_view message);

#else

// In non-debug builds, provide inline no-op stubs so
// any direct calls from the library still compile but vanish.
inline void vlogf(Level, const char*, const char*, std::va_list) {}

template <typename... Args>
inline void logf(Level, const char*, const char*, Args&&...) {}

inline void log(Level, const char*, std::string_view) {}

#endif // TFTPKIT_DEBUG

const char* to_string(Level level);

} // namespace tftpkit::log

// ------------------------------------------------------------------
// Convenience macros
// ------------------------------------------------------------------

#if defined(TFTPKIT_DEBUG)

#define TFTPKIT_LOGE(tag, fmt, ...) \
    ::tftpkit::log::logf(::tftpkit::log::Level::Error,   tag, fmt, ##__VA_ARGS__)

#define TFTPKIT_LOGW(tag, fmt, ...) \
    ::tftpkit::log::logf(::tftpkit::log::Level::Warn,    tag, fmt, ##__VA_ARGS__)

#define TFTPKIT_LOGI(tag, fmt, ...) \
    ::tftpkit::log::logf(::tftpkit::log::Level::Info,    tag, fmt, ##__VA_ARGS__)

#define TFTPKIT_LOGD(tag, fmt, ...) \
    ::tftpkit::log::logf(::tftpkit::log::Level::Debug,   tag, fmt, ##__VA_ARGS__)

#define TFTPKIT_LOGV(tag, fmt, ...) \
    ::tftpkit::log::logf(::tftpkit::log::Level::Verbose, tag, fmt, ##__VA_ARGS__)

#else

// In non-debug builds they compile to a single no-op expression.
// The whole macro invocation (including arguments / fmt strings)
// disappears at preprocessing time.

#define TFTPKIT_LOGE(tag, fmt, ...) ((void)0)
#define TFTPKIT_LOGW(tag, fmt, ...) ((void)0)
#define TFTPKIT_LOGI(tag, fmt, ...) ((void)0)
#define TFTPKIT_LOGD(tag, fmt, ...) ((void)0)
#define TFTPKIT_LOGV(tag, fmt, ...) ((void)0)

#endif // TFTPKIT_DEBUG
