#include "LogLevel.h"

#include <libchroma/Utils/EnumHelpers.h>

#include <gtest/gtest.h>

using namespace chroma;

TEST(LogLevel, try_parse_as_log_level_round_trips_every_level)
{
    for (LogLevel level : make_option_iterable<LogLevel>()) {
        ASSERT_EQ(try_parse_as_log_level(to_cstringview(level)), level);
    }
}

TEST(LogLevel, try_parse_as_log_level_is_case_insensitive_and_ignores_whitespace)
{
    ASSERT_EQ(try_parse_as_log_level("WARNING"), LogLevel::warn);
    ASSERT_EQ(try_parse_as_log_level(" Debug\n"), LogLevel::debug);
}

TEST(LogLevel, try_parse_as_log_level_returns_nullopt_for_unknown_names)
{
    ASSERT_FALSE(try_parse_as_log_level("verbose").has_value());
    ASSERT_FALSE(try_parse_as_log_level("").has_value());
}

TEST(LogLevel, levels_are_ordered_by_severity)
{
    static_assert(LogLevel::trace < LogLevel::debug);
    static_assert(LogLevel::warn < LogLevel::err);
    static_assert(LogLevel::critical < LogLevel::off);
    static_assert(LogLevel::DEFAULT == LogLevel::info);
}
