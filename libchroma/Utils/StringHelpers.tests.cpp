#include "StringHelpers.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

using namespace chroma;

TEST(is_equal_case_insensitive, returns_true_for_differently_cased_strings)
{
    ASSERT_TRUE(is_equal_case_insensitive("Catppuccin.Mocha", "CATPPUCCIN.mocha"));
    ASSERT_TRUE(is_equal_case_insensitive("", ""));
}

TEST(is_equal_case_insensitive, returns_false_for_different_lengths)
{
    ASSERT_FALSE(is_equal_case_insensitive("abc", "abcd"));
}

TEST(strip_whitespace, removes_leading_and_trailing_whitespace)
{
    ASSERT_EQ(strip_whitespace("  \t#fff\r\n"), "#fff");
    ASSERT_EQ(strip_whitespace("a b"), "a b");
    ASSERT_EQ(strip_whitespace("   "), "");
    ASSERT_EQ(strip_whitespace(""), "");
}

TEST(substring_after_last, returns_content_after_last_delimiter)
{
    ASSERT_EQ(substring_after_last("Catppuccin.Mocha.MAUVE", '.'), "MAUVE");
    ASSERT_EQ(substring_after_last("nodelimiter", '.'), "nodelimiter");
    ASSERT_EQ(substring_after_last("trailing.", '.'), "");
}

TEST(substring_before_last, returns_content_before_last_delimiter)
{
    ASSERT_EQ(substring_before_last("Catppuccin.Mocha.MAUVE", '.'), "Catppuccin.Mocha");
    ASSERT_EQ(substring_before_last("nodelimiter", '.'), "");
    ASSERT_EQ(substring_before_last(".leading", '.'), "");
}

TEST(split, splits_on_every_delimiter_including_empty_parts)
{
    const std::vector<std::string_view> expected = {"a", "b", "", "c"};
    ASSERT_EQ(split("a,b,,c", ','), expected);
}

TEST(split, returns_single_element_when_no_delimiter_present)
{
    const std::vector<std::string_view> expected = {"abc"};
    ASSERT_EQ(split("abc", ','), expected);
}

TEST(split, of_empty_string_returns_single_empty_element)
{
    const std::vector<std::string_view> expected = {""};
    ASSERT_EQ(split("", ','), expected);
}

TEST(to_hex_chars, returns_uppercase_nibbles)
{
    ASSERT_EQ(to_hex_chars(0x00), std::make_pair('0', '0'));
    ASSERT_EQ(to_hex_chars(0xf0), std::make_pair('F', '0'));
    ASSERT_EQ(to_hex_chars(0x02), std::make_pair('0', '2'));
    ASSERT_EQ(to_hex_chars(0xab), std::make_pair('A', 'B'));
}

TEST(try_parse_hex_chars_as_byte, parses_every_byte_produced_by_to_hex_chars)
{
    for (int i = 0; i <= 0xff; ++i) {
        const auto b = static_cast<uint8_t>(i);
        const auto [hi, lo] = to_hex_chars(b);
        ASSERT_EQ(try_parse_hex_chars_as_byte(hi, lo), b);
    }
}

TEST(try_parse_hex_chars_as_byte, is_case_insensitive)
{
    ASSERT_EQ(try_parse_hex_chars_as_byte('f', 'F'), uint8_t{0xff});
}

TEST(try_parse_hex_chars_as_byte, returns_nullopt_for_non_hex_chars)
{
    ASSERT_FALSE(try_parse_hex_chars_as_byte('g', '0').has_value());
    ASSERT_FALSE(try_parse_hex_chars_as_byte('0', ' ').has_value());
}

TEST(try_parse_as_int, parses_signed_decimal_integers)
{
    ASSERT_EQ(try_parse_as_int("0"), 0);
    ASSERT_EQ(try_parse_as_int("255"), 255);
    ASSERT_EQ(try_parse_as_int("-12"), -12);
    ASSERT_EQ(try_parse_as_int("+7"), 7);
    ASSERT_EQ(try_parse_as_int("  42 "), 42);
}

TEST(try_parse_as_int, returns_nullopt_for_non_integers)
{
    ASSERT_FALSE(try_parse_as_int("").has_value());
    ASSERT_FALSE(try_parse_as_int("+").has_value());
    ASSERT_FALSE(try_parse_as_int("+-1").has_value());
    ASSERT_FALSE(try_parse_as_int("1.5").has_value());
    ASSERT_FALSE(try_parse_as_int("1e3").has_value());
    ASSERT_FALSE(try_parse_as_int("12abc").has_value());
    ASSERT_FALSE(try_parse_as_int("0x10").has_value());
}

TEST(try_parse_as_int, returns_nullopt_for_out_of_range_integers)
{
    ASSERT_FALSE(try_parse_as_int("99999999999999999999").has_value());
}
