#pragma once

#include <libchroma/Platform/LogLevel.h>
#include <libchroma/Platform/Logger.h>
#include <libchroma/Utils/CStringView.h>

#include <memory>

// log: global logging API
//
// messages are printf-formatted, so callers must pass `std::string`s
// via `.c_str()`
namespace chroma
{
    std::shared_ptr<Logger> global_default_logger();
    Logger* global_default_logger_raw();

    // sets the level of the default logger (its sinks are unaffected)
    void global_set_log_level(LogLevel);
    LogLevel global_get_log_level();

    template<typename... Args>
    void log_message(LogLevel level, CStringView fmt, const Args&... args)
    {
        global_default_logger_raw()->log_message(level, fmt.c_str(), args...);
    }

    template<typename... Args>
    void log_trace(CStringView fmt, const Args&... args)
    {
        global_default_logger_raw()->trace(fmt, args...);
    }

    template<typename... Args>
    void log_debug(CStringView fmt, const Args&... args)
    {
        global_default_logger_raw()->debug(fmt, args...);
    }

    template<typename... Args>
    void log_info(CStringView fmt, const Args&... args)
    {
        global_default_logger_raw()->info(fmt, args...);
    }

    template<typename... Args>
    void log_warn(CStringView fmt, const Args&... args)
    {
        global_default_logger_raw()->warn(fmt, args...);
    }

    template<typename... Args>
    void log_error(CStringView fmt, const Args&... args)
    {
        global_default_logger_raw()->error(fmt, args...);
    }

    template<typename... Args>
    void log_critical(CStringView fmt, const Args&... args)
    {
        global_default_logger_raw()->critical(fmt, args...);
    }
}
