#include "Logger.h"

#include <libchroma/Platform/LogSink.h>
#include <libchroma/Platform/LogLevel.h>
#include <libchroma/Platform/LogMessage.h>

#include <algorithm>
#include <array>
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <string_view>

void chroma::Logger::log_message(LogLevel level, const char* fmt, ...)
{
    if (level < level_) {
        return;
    }

    // create the log message
    thread_local std::array<char, 2048> buffer;
    size_t n = 0;
    {
        va_list args;
        va_start(args, fmt);
        const int rv = std::vsnprintf(buffer.data(), buffer.size(), fmt, args);
        va_end(args);

        if (rv <= 0) {
            return;
        }
        n = std::min(static_cast<size_t>(rv), buffer.size()-1);
    }
    const LogMessage message{name_, std::string_view{buffer.data(), n}, level};

    // sink it
    for (const auto& sink : sinks_) {
        if (sink->should_log(message.level())) {
            sink->sink_message(message);
        }
    }
}
