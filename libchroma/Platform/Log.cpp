#include "Log.h"

#include <libchroma/Platform/LogLevel.h>
#include <libchroma/Platform/LogMessage.h>
#include <libchroma/Platform/LogSink.h>
#include <libchroma/Platform/Logger.h>

#include <iostream>
#include <memory>
#include <mutex>

using namespace chroma;

namespace
{
    class StderrSink final : public LogSink {
    private:
        void impl_sink_message(const LogMessage& message) final
        {
            const std::lock_guard lock{mutex_};
            std::cerr << '[' << message.logger_name() << "] [" << to_cstringview(message.level()) << "] " << message.payload() << std::endl;
        }

        std::mutex mutex_;
    };

    struct GlobalSinks final {
        std::shared_ptr<Logger> default_logger = std::make_shared<Logger>("chroma", std::make_shared<StderrSink>());
    };

    GlobalSinks& get_global_sinks()
    {
        static GlobalSinks s_global_sinks;
        return s_global_sinks;
    }
}

std::shared_ptr<Logger> chroma::global_default_logger()
{
    return get_global_sinks().default_logger;
}

Logger* chroma::global_default_logger_raw()
{
    return get_global_sinks().default_logger.get();
}

void chroma::global_set_log_level(LogLevel level)
{
    global_default_logger_raw()->set_level(level);
}

LogLevel chroma::global_get_log_level()
{
    return global_default_logger_raw()->level();
}
