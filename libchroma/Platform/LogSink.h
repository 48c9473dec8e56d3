#pragma once

#include <libchroma/Platform/LogLevel.h>

namespace chroma { class LogMessage; }

namespace chroma
{
    // something that receives log messages, filtered by its own level
    //
    // concrete sinks implement `impl_sink_message`. A sink's level defaults to
    // `LogLevel::trace`, so filtering is left to the `Logger` until a caller
    // raises it
    class LogSink {
    protected:
        LogSink() = default;
        LogSink(const LogSink&) = default;
        LogSink(LogSink&&) noexcept = default;
        LogSink& operator=(const LogSink&) = default;
        LogSink& operator=(LogSink&&) noexcept = default;
    public:
        virtual ~LogSink() noexcept = default;

        void sink_message(const LogMessage& message) { impl_sink_message(message); }

        LogLevel level() const { return level_; }
        void set_level(LogLevel level) { level_ = level; }
        bool should_log(LogLevel message_level) const { return message_level >= level_; }

    private:
        virtual void impl_sink_message(const LogMessage&) = 0;

        LogLevel level_ = LogLevel::trace;
    };
}
