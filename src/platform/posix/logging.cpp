#include "tftpkit/core/logging.h"

#include <cstdarg>
#include <cstdio>

namespace tftpkit::log {

const char* to_string(Level lvl)
{
    switch (lvl) {
    case Level::Error:   return "E";
    case Level::Warn:    return "W";
    case Level::Info:    return "I";
    case Level::Debug:   return "D";
    case Level::Verbose: return "V";
    }
    return "?";
}

#if defined(TFTPKIT_DEBUG)

static FILE* stream_for(Level level)
{
    return (level == Level::Error || level == Level::Warn) ? stderr : stdout;
}

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args)
{
    FILE* out = stream_for(level);

    std::fprintf(out, "[%s] %s: ", to_string(level), tag ? tag : "log");
    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
}

void logf(Level level, const char* tag, const char* fmt, ...)
{
    std::va_list args;
    va_start(args, fmt);
    vlogf(level, tag, fmt, args);
    va_end(args);
}

void log(Level level, const char* tag, std::string_view message)
{
    std::fprintf(stream_for(level), "[%s] %s: %.*s\n",
                 to_string(level),
                 tag ? tag : "log",
                 static_cast<int>(message.size()),
                 message.data());
}

#endif // defined(TFTPKIT_DEBUG)

} // namespace tftpkit::log
