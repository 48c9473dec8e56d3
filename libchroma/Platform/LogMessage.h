#pragma once

#include <libchroma/Platform/LogLevel.h>

#include <chrono>
#include <string_view>

namespace chroma
{
    // a log message
    //
    // to prevent needless runtime allocs, this does not own its data
    class LogMessage final {
    public:
        LogMessage() = default;

        LogMessage(
            std::string_view logger_name,
            std::string_view payload,
            LogLevel level) :

            logger_name_{logger_name},
            time_{std::chrono::system_clock::now()},
            payload_{payload},
            level_{level}
        {}

        std::string_view logger_name() const { return logger_name_; }
        std::chrono::system_clock::time_point time() const { return time_; }
        std::string_view payload() const { return payload_; }
        LogLevel level() const { return level_; }

    private:
        std::string_view logger_name_;
        std::chrono::system_clock::time_point time_;
        std::string_view payload_;
        LogLevel level_ = LogLevel::info;
    };
}
