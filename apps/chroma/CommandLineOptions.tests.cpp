#include "CommandLineOptions.h"

#include <libchroma/Graphics/Color.h>
#include <libchroma/Platform/Log.h>
#include <libchroma/Platform/LogLevel.h>
#include <libchroma/Terminal/TextStyle.h>

#include <gtest/gtest.h>

#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <vector>

using namespace chroma;

namespace
{
    // silences the (expected) error logs that invalid command lines produce
    class ScopedLogLevel final {
    public:
        explicit ScopedLogLevel(LogLevel level) :
            original_{global_get_log_level()}
        {
            global_set_log_level(level);
        }
        ScopedLogLevel(const ScopedLogLevel&) = delete;
        ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;
        ~ScopedLogLevel() noexcept { global_set_log_level(original_); }
    private:
        LogLevel original_;
    };

    std::optional<CommandLineOptions> parse(std::initializer_list<std::string_view> args)
    {
        const std::vector<std::string_view> v(args);
        return try_parse_command_line(v);
    }
}

TEST(try_parse_command_line, empty_command_line_parses_but_has_no_work)
{
    const auto options = parse({});
    ASSERT_TRUE(options.has_value());
    ASSERT_FALSE(options->has_work());
}

TEST(try_parse_command_line, parses_colors_in_every_accepted_form)
{
    const auto options = parse({"#A1B2C3", "1,2,3,4", "Dracula.PURPLE"});
    ASSERT_TRUE(options.has_value());
    ASSERT_EQ(options->colors, (std::vector<Color>{Color(161, 178, 195), Color(1, 2, 3, 4), Color(0xbd, 0x93, 0xf9)}));
    ASSERT_TRUE(options->has_work());
}

TEST(try_parse_command_line, parses_every_option)
{
    const auto options = parse({
        "--config", "some/chroma.toml",
        "--palettes",
        "--palette", "Solarized",
        "--random", "3",
        "--blend", "#000000", "0.25",
        "--style", "italic",
    });
    ASSERT_TRUE(options.has_value());
    ASSERT_EQ(options->config_path, std::filesystem::path{"some/chroma.toml"});
    ASSERT_TRUE(options->list_palettes);
    ASSERT_EQ(options->palette_name, "Solarized");
    ASSERT_EQ(options->num_random_colors, 3);
    ASSERT_EQ(options->blend_color, Color(0, 0, 0));
    ASSERT_DOUBLE_EQ(options->blend_ratio, 0.25);
    ASSERT_EQ(options->label_style, TextStyle::Italic);
}

TEST(try_parse_command_line, help_stops_parsing)
{
    const auto options = parse({"--help", "not-a-color"});
    ASSERT_TRUE(options.has_value());
    ASSERT_TRUE(options->show_help);
}

TEST(try_parse_command_line, random_colors_are_counted_rather_than_generated)
{
    const auto options = parse({"--random", "2000000000"});
    ASSERT_TRUE(options.has_value());
    ASSERT_EQ(options->num_random_colors, 2000000000);
    ASSERT_TRUE(options->colors.empty());
    ASSERT_TRUE(options->has_work());
}

TEST(try_parse_command_line, accepts_blend_ratios_at_both_ends_of_range)
{
    ASSERT_TRUE(parse({"#FF0000", "--blend", "#000000", "0"}).has_value());
    ASSERT_TRUE(parse({"#FF0000", "--blend", "#000000", "1.0"}).has_value());
}

TEST(try_parse_command_line, rejects_out_of_range_blend_ratio_before_any_output)
{
    const ScopedLogLevel quiet{LogLevel::off};
    ASSERT_FALSE(parse({"#FF0000", "#00FF00", "--blend", "#000000", "1.5"}).has_value());
    ASSERT_FALSE(parse({"--palettes", "--blend", "#000000", "7"}).has_value());
    ASSERT_FALSE(parse({"#FF0000", "--blend", "#000000", "-0.1"}).has_value());
}

TEST(try_parse_command_line, rejects_non_finite_blend_ratio)
{
    const ScopedLogLevel quiet{LogLevel::off};
    ASSERT_FALSE(parse({"#FF0000", "--blend", "#000000", "nan"}).has_value());
    ASSERT_FALSE(parse({"#FF0000", "--blend", "#000000", "inf"}).has_value());
}

TEST(try_parse_command_line, rejects_non_numeric_blend_ratio)
{
    const ScopedLogLevel quiet{LogLevel::off};
    ASSERT_FALSE(parse({"#FF0000", "--blend", "#000000", "half"}).has_value());
    ASSERT_FALSE(parse({"#FF0000", "--blend", "#000000", "0.5x"}).has_value());
}

TEST(try_parse_command_line, rejects_invalid_blend_color)
{
    const ScopedLogLevel quiet{LogLevel::off};
    ASSERT_FALSE(parse({"#FF0000", "--blend", "#GGGGGG", "0.5"}).has_value());
}

TEST(try_parse_command_line, rejects_invalid_colors)
{
    const ScopedLogLevel quiet{LogLevel::off};
    ASSERT_FALSE(parse({"#ZZZZZZ"}).has_value());
    ASSERT_FALSE(parse({"(1, 2, 3)"}).has_value());
    ASSERT_FALSE(parse({"red"}).has_value());
}

TEST(try_parse_command_line, rejects_missing_option_values)
{
    const ScopedLogLevel quiet{LogLevel::off};
    ASSERT_FALSE(parse({"--config"}).has_value());
    ASSERT_FALSE(parse({"--palette"}).has_value());
    ASSERT_FALSE(parse({"--random"}).has_value());
    ASSERT_FALSE(parse({"--blend", "#000000"}).has_value());
    ASSERT_FALSE(parse({"--style"}).has_value());
}

TEST(try_parse_command_line, rejects_invalid_option_values)
{
    const ScopedLogLevel quiet{LogLevel::off};
    ASSERT_FALSE(parse({"--random", "-1"}).has_value());
    ASSERT_FALSE(parse({"--random", "many"}).has_value());
    ASSERT_FALSE(parse({"--style", "blink"}).has_value());
}

TEST(try_parse_command_line, rejects_unknown_options)
{
    const ScopedLogLevel quiet{LogLevel::off};
    ASSERT_FALSE(parse({"--frobnicate"}).has_value());
}
