#include "ColorParsing.h"

#include <libchroma/Graphics/Color.h>
#include <libchroma/Graphics/ColorError.h>

#include <gtest/gtest.h>

using namespace chroma;

TEST(try_parse_color, parses_hex_strings)
{
    ASSERT_EQ(try_parse_color("#A1B2C3").value(), Color(161, 178, 195, 255));
}

TEST(try_parse_color, ignores_surrounding_whitespace)
{
    ASSERT_EQ(try_parse_color("  #a1b2c3\n").value(), Color(161, 178, 195, 255));
    ASSERT_EQ(try_parse_color(" 1, 2, 3, 4 ").value(), Color(1, 2, 3, 4));
}

TEST(try_parse_color, parses_comma_separated_channel_tuples)
{
    ASSERT_EQ(try_parse_color("255,0,0,128").value(), Color(255, 0, 0, 128));
}

TEST(try_parse_color, parses_parenthesized_channel_tuples)
{
    ASSERT_EQ(try_parse_color("(255, 0, 0, 128)").value(), Color(255, 0, 0, 128));
}

TEST(try_parse_color, returns_InvalidFormat_for_wrong_tuple_arity)
{
    ASSERT_EQ(try_parse_color("(1, 2, 3)").error(), ColorError::InvalidFormat);
    ASSERT_EQ(try_parse_color("1,2,3,4,5").error(), ColorError::InvalidFormat);
    ASSERT_EQ(try_parse_color("(5)").error(), ColorError::InvalidFormat);
}

TEST(try_parse_color, returns_InvalidFormat_for_non_integer_components)
{
    ASSERT_EQ(try_parse_color("(1.5, 2, 3, 4)").error(), ColorError::InvalidFormat);
    ASSERT_EQ(try_parse_color("(1, two, 3, 4)").error(), ColorError::InvalidFormat);
    ASSERT_EQ(try_parse_color("(1, , 3, 4)").error(), ColorError::InvalidFormat);
    ASSERT_EQ(try_parse_color("(1e2, 2, 3, 4)").error(), ColorError::InvalidFormat);
}

TEST(try_parse_color, returns_InvalidFormat_for_out_of_range_components)
{
    ASSERT_EQ(try_parse_color("(256, 0, 0, 255)").error(), ColorError::InvalidFormat);
    ASSERT_EQ(try_parse_color("(0, -1, 0, 255)").error(), ColorError::InvalidFormat);
}

TEST(try_parse_color, returns_InvalidFormat_for_unbalanced_parentheses)
{
    ASSERT_EQ(try_parse_color("(1, 2, 3, 4").error(), ColorError::InvalidFormat);
    ASSERT_EQ(try_parse_color("1, 2, 3, 4)").error(), ColorError::InvalidFormat);
}

TEST(try_parse_color, returns_InvalidFormat_for_malformed_hex)
{
    ASSERT_EQ(try_parse_color("#ZZZZZZ").error(), ColorError::InvalidFormat);
    ASSERT_EQ(try_parse_color("#FFF").error(), ColorError::InvalidFormat);
}

TEST(try_parse_color, resolves_qualified_palette_color_names)
{
    ASSERT_EQ(try_parse_color("Dracula.PURPLE").value(), Color(0xbd, 0x93, 0xf9));
    ASSERT_EQ(try_parse_color("Catppuccin.Mocha.MAUVE").value(), Color(0xcb, 0xa6, 0xf7));
    ASSERT_EQ(try_parse_color("basic.red").value(), Color(0xff, 0x00, 0x00));
}

TEST(try_parse_color, returns_InvalidFormat_for_any_other_shape)
{
    ASSERT_EQ(try_parse_color("").error(), ColorError::InvalidFormat);
    ASSERT_EQ(try_parse_color("red").error(), ColorError::InvalidFormat);
    ASSERT_EQ(try_parse_color("42").error(), ColorError::InvalidFormat);
    ASSERT_EQ(try_parse_color("Dracula.NOT_A_COLOR").error(), ColorError::InvalidFormat);
}
