#include "TextStyle.h"

#include <libchroma/Utils/EnumHelpers.h>

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace chroma;

TEST(TextStyle, escape_sequence_returns_expected_sgr_codes)
{
    ASSERT_EQ(escape_sequence(TextStyle::Reset), "\x1b[0m");
    ASSERT_EQ(escape_sequence(TextStyle::Bold), "\x1b[1m");
    ASSERT_EQ(escape_sequence(TextStyle::NormalWeight), "\x1b[22m");
    ASSERT_EQ(escape_sequence(TextStyle::Underline), "\x1b[4m");
    ASSERT_EQ(escape_sequence(TextStyle::Swap), "\x1b[7m");
    ASSERT_EQ(escape_sequence(TextStyle::Italic), "\x1b[3m");
    ASSERT_EQ(escape_sequence(TextStyle::Strikethrough), "\x1b[9m");
}

TEST(TextStyle, try_parse_text_style_round_trips_every_name)
{
    for (TextStyle style : make_option_iterable<TextStyle>()) {
        ASSERT_EQ(try_parse_text_style(to_cstringview(style)), style);
    }
}

TEST(TextStyle, try_parse_text_style_is_case_insensitive)
{
    ASSERT_EQ(try_parse_text_style("bold"), TextStyle::Bold);
    ASSERT_EQ(try_parse_text_style("ITALIC"), TextStyle::Italic);
}

TEST(TextStyle, try_parse_text_style_returns_nullopt_for_unknown_name)
{
    ASSERT_FALSE(try_parse_text_style("blink").has_value());
    ASSERT_FALSE(try_parse_text_style("").has_value());
}

TEST(TextStyle, stylize_wraps_text_in_style_and_reset)
{
    ASSERT_EQ(stylize("x", TextStyle::Underline), "\x1b[4mx\x1b[0m");
}

TEST(TextStyle, operator_stream_writes_style_name)
{
    std::stringstream ss;
    ss << TextStyle::Strikethrough;
    ASSERT_EQ(ss.str(), "Strikethrough");
}
