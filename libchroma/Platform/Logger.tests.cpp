#include "Logger.h"

#include <libchroma/Platform/Log.h>
#include <libchroma/Platform/LogLevel.h>
#include <libchroma/Platform/LogMessage.h>
#include <libchroma/Platform/LogSink.h>

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <utility>
#include <vector>

using namespace chroma;

namespace
{
    struct CapturedMessage final {
        std::string logger_name;
        std::string payload;
        LogLevel level;
    };

    class CapturingLogSink final : public LogSink {
    public:
        const std::vector<CapturedMessage>& messages() const { return messages_; }
    private:
        void impl_sink_message(const LogMessage& message) final
        {
            messages_.push_back({
                std::string{message.logger_name()},
                std::string{message.payload()},
                message.level(),
            });
        }

        std::vector<CapturedMessage> messages_;
    };
}

TEST(Logger, formats_printf_style_arguments_into_payload)
{
    auto sink = std::make_shared<CapturingLogSink>();
    Logger logger{"test", sink};

    logger.info("%s has %i channels", "Color", 4);

    ASSERT_EQ(sink->messages().size(), size_t{1});
    ASSERT_EQ(sink->messages().front().logger_name, "test");
    ASSERT_EQ(sink->messages().front().payload, "Color has 4 channels");
    ASSERT_EQ(sink->messages().front().level, LogLevel::info);
}

TEST(Logger, drops_messages_below_logger_level)
{
    auto sink = std::make_shared<CapturingLogSink>();
    Logger logger{"test", sink};
    logger.set_level(LogLevel::warn);

    logger.debug("ignored");
    logger.info("ignored");
    logger.warn("kept");
    logger.error("kept");

    ASSERT_EQ(sink->messages().size(), size_t{2});
    ASSERT_EQ(sink->messages().at(0).level, LogLevel::warn);
    ASSERT_EQ(sink->messages().at(1).level, LogLevel::err);
}

TEST(Logger, drops_messages_below_sink_level)
{
    auto noisy = std::make_shared<CapturingLogSink>();
    auto quiet = std::make_shared<CapturingLogSink>();
    quiet->set_level(LogLevel::critical);

    Logger logger{"test"};
    logger.set_level(LogLevel::trace);
    logger.sinks().push_back(noisy);
    logger.sinks().push_back(quiet);

    logger.trace("a");
    logger.critical("b");

    ASSERT_EQ(noisy->messages().size(), size_t{2});
    ASSERT_EQ(quiet->messages().size(), size_t{1});
    ASSERT_EQ(quiet->messages().front().payload, "b");
}

TEST(Logger, off_level_drops_everything)
{
    auto sink = std::make_shared<CapturingLogSink>();
    Logger logger{"test", sink};
    logger.set_level(LogLevel::off);

    logger.critical("ignored");

    ASSERT_TRUE(sink->messages().empty());
}

TEST(Logger, truncates_very_long_messages_rather_than_overflowing)
{
    auto sink = std::make_shared<CapturingLogSink>();
    Logger logger{"test", sink};

    const std::string long_payload(10000, 'x');
    logger.info("%s", long_payload.c_str());

    ASSERT_EQ(sink->messages().size(), size_t{1});
    ASSERT_LT(sink->messages().front().payload.size(), long_payload.size());
}

TEST(Logger, default_level_is_info)
{
    ASSERT_EQ(Logger{"test"}.level(), LogLevel::info);
}

TEST(global_set_log_level, changes_default_logger_level)
{
    const LogLevel original = global_get_log_level();

    global_set_log_level(LogLevel::err);
    ASSERT_EQ(global_get_log_level(), LogLevel::err);
    ASSERT_EQ(global_default_logger()->level(), LogLevel::err);

    global_set_log_level(original);
}

TEST(global_default_logger, is_named_chroma)
{
    ASSERT_EQ(global_default_logger()->name(), "chroma");
}

TEST(LogSink, level_defaults_to_trace_and_can_be_raised)
{
    CapturingLogSink sink;
    ASSERT_EQ(sink.level(), LogLevel::trace);
    ASSERT_TRUE(sink.should_log(LogLevel::trace));

    sink.set_level(LogLevel::err);
    ASSERT_EQ(sink.level(), LogLevel::err);
    ASSERT_FALSE(sink.should_log(LogLevel::warn));
    ASSERT_TRUE(sink.should_log(LogLevel::err));
}
