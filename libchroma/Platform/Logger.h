#pragma once

#include <libchroma/Platform/LogSink.h>
#include <libchroma/Platform/LogLevel.h>
#include <libchroma/Utils/CStringView.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

// this implementation takes heavy inspiration from `spdlog`
namespace chroma
{
    class Logger final {
    public:
        explicit Logger(std::string name) :
            name_{std::move(name)}
        {}

        Logger(std::string name, std::shared_ptr<LogSink> sink) :
            name_{std::move(name)},
            sinks_{std::move(sink)}
        {}

        // formats `fmt` + varargs (printf-style) and sinks the result into each
        // sink that wants a message of level `level`
        void log_message(LogLevel level, const char* fmt, ...);

        template<typename... Args>
        void trace(CStringView fmt, const Args&... args)
        {
            log_message(LogLevel::trace, fmt.c_str(), args...);
        }

        template<typename... Args>
        void debug(CStringView fmt, const Args&... args)
        {
            log_message(LogLevel::debug, fmt.c_str(), args...);
        }

        template<typename... Args>
        void info(CStringView fmt, const Args&... args)
        {
            log_message(LogLevel::info, fmt.c_str(), args...);
        }

        template<typename... Args>
        void warn(CStringView fmt, const Args&... args)
        {
            log_message(LogLevel::warn, fmt.c_str(), args...);
        }

        template<typename... Args>
        void error(CStringView fmt, const Args&... args)
        {
            log_message(LogLevel::err, fmt.c_str(), args...);
        }

        template<typename... Args>
        void critical(CStringView fmt, const Args&... args)
        {
            log_message(LogLevel::critical, fmt.c_str(), args...);
        }

        const std::string& name() const { return name_; }

        const std::vector<std::shared_ptr<LogSink>>& sinks() const { return sinks_; }
        std::vector<std::shared_ptr<LogSink>>& sinks() { return sinks_; }

        LogLevel level() const { return level_; }
        void set_level(LogLevel level) { level_ = level; }

    private:
        std::string name_;
        std::vector<std::shared_ptr<LogSink>> sinks_;
        LogLevel level_ = LogLevel::DEFAULT;
    };
}
