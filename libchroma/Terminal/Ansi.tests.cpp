#include "Ansi.h"

#include <libchroma/Graphics/Color.h>

#include <gtest/gtest.h>

#include <string_view>

using namespace chroma;

TEST(ansi, reset_returns_sgr_reset_sequence)
{
    ASSERT_EQ(ansi::reset(), "\x1b[0m");
}

TEST(ansi, foreground_returns_24bit_foreground_sequence)
{
    ASSERT_EQ(ansi::foreground(Color(255, 0, 0, 255)), "\x1b[38;2;255;0;0m");
    ASSERT_EQ(ansi::foreground(Color(1, 22, 133, 255)), "\x1b[38;2;1;22;133m");
}

TEST(ansi, background_returns_24bit_background_sequence)
{
    ASSERT_EQ(ansi::background(Color(0, 128, 255, 255)), "\x1b[48;2;0;128;255m");
}

TEST(ansi, foreground_and_background_ignore_alpha)
{
    ASSERT_EQ(ansi::foreground(Color(10, 20, 30, 0)), ansi::foreground(Color(10, 20, 30, 255)));
    ASSERT_EQ(ansi::background(Color(10, 20, 30, 0)), ansi::background(Color(10, 20, 30, 255)));
}

TEST(ansi, colorize_wraps_text_in_foreground_and_reset)
{
    ASSERT_EQ(ansi::colorize(Color(255, 0, 0, 255), "hi"), "\x1b[38;2;255;0;0mhi\x1b[0m");
}

TEST(ansi, colorize_of_empty_text_still_emits_sequences)
{
    ASSERT_EQ(ansi::colorize(Color(0, 0, 0, 255), ""), "\x1b[38;2;0;0;0m\x1b[0m");
}

TEST(ansi, colorize_background_wraps_text_in_background_and_reset)
{
    ASSERT_EQ(ansi::colorize_background(Color(1, 2, 3, 255), "  "), "\x1b[48;2;1;2;3m  \x1b[0m");
}

TEST(ansi, colorize_matches_Color_apply)
{
    const Color c{12, 34, 56, 78};
    ASSERT_EQ(ansi::colorize(c, "text"), c.apply("text"));
    ASSERT_EQ(ansi::foreground(c), c.to_ansi_foreground());
}
