#include "Color.h"

#include <libchroma/Graphics/ColorError.h>
#include <libchroma/Graphics/ColorHSL.h>

#include <gtest/gtest.h>

#include <array>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <random>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <vector>

using namespace chroma;

namespace
{
    constexpr auto c_example_colors = std::to_array<Color>({
        Color{0x00, 0x00, 0x00},
        Color{0xff, 0xff, 0xff},
        Color{0xa1, 0xb2, 0xc3},
        Color{0x12, 0x34, 0x56, 0x78},
        Color{0xff, 0x00, 0x80, 0x00},
        Color{0x01, 0xfe, 0x7f, 0xff},
    });
}

TEST(Color, is_trivially_copyable)
{
    static_assert(std::is_trivially_copyable_v<Color>);
}

TEST(Color, default_constructed_is_opaque_black)
{
    static_assert(Color{} == Color{0x00, 0x00, 0x00, 0xff});
}

TEST(Color, channel_constructor_defaults_to_opaque_alpha)
{
    constexpr Color color{0x10, 0x20, 0x30};
    static_assert(color.a == 0xff);
}

TEST(Color, try_from_hex_parses_each_channel_pair)
{
    const auto parsed = Color::try_from_hex("#A1B2C3");
    ASSERT_TRUE(parsed.has_value());
    ASSERT_EQ(*parsed, Color(161, 178, 195, 255));
}

TEST(Color, try_from_hex_is_case_insensitive)
{
    ASSERT_EQ(Color::try_from_hex("#a1b2c3"), Color::try_from_hex("#A1B2C3"));
    ASSERT_EQ(Color::try_from_hex("#aBcDeF").value(), Color(0xab, 0xcd, 0xef));
}

TEST(Color, try_from_hex_round_trips_through_to_hex_in_uppercase)
{
    ASSERT_EQ(Color::try_from_hex("#A1B2C3")->to_hex(), "#A1B2C3");
    ASSERT_EQ(Color::try_from_hex("#a1b2c3")->to_hex(), "#A1B2C3");
}

TEST(Color, try_from_hex_returns_InvalidFormat_for_non_hex_digits)
{
    const auto parsed = Color::try_from_hex("#ZZZZZZ");
    ASSERT_FALSE(parsed.has_value());
    ASSERT_EQ(parsed.error(), ColorError::InvalidFormat);
}

TEST(Color, try_from_hex_returns_InvalidFormat_for_wrong_length)
{
    for (const auto* str : {"#", "#FFF", "#FFFFF", "#FFFFFFF", "#FFFFFFFF"}) {
        const auto parsed = Color::try_from_hex(str);
        ASSERT_FALSE(parsed.has_value()) << str;
        ASSERT_EQ(parsed.error(), ColorError::InvalidFormat) << str;
    }
}

TEST(Color, try_from_hex_returns_InvalidFormat_if_hash_is_missing)
{
    ASSERT_EQ(Color::try_from_hex("A1B2C3").error(), ColorError::InvalidFormat);
    ASSERT_EQ(Color::try_from_hex("").error(), ColorError::InvalidFormat);
}

TEST(Color, try_from_hex_returns_InvalidFormat_for_signs_or_whitespace_within_pairs)
{
    ASSERT_EQ(Color::try_from_hex("#+1B2C3").error(), ColorError::InvalidFormat);
    ASSERT_EQ(Color::try_from_hex("# 1B2C3").error(), ColorError::InvalidFormat);
    ASSERT_EQ(Color::try_from_hex("##A1B2C3").error(), ColorError::InvalidFormat);
}

TEST(Color, try_from_channels_works_for_four_in_range_components)
{
    const std::array<int, 4> channels = {255, 0, 0, 128};
    ASSERT_EQ(Color::try_from_channels(channels).value(), Color(255, 0, 0, 128));
}

TEST(Color, try_from_channels_accepts_boundary_values)
{
    ASSERT_TRUE(Color::try_from_channels(std::array{0, 0, 0, 0}).has_value());
    ASSERT_TRUE(Color::try_from_channels(std::array{255, 255, 255, 255}).has_value());
}

TEST(Color, try_from_channels_returns_InvalidFormat_for_wrong_arity)
{
    ASSERT_EQ(Color::try_from_channels(std::array{1, 2, 3}).error(), ColorError::InvalidFormat);
    ASSERT_EQ(Color::try_from_channels(std::array{1, 2, 3, 4, 5}).error(), ColorError::InvalidFormat);
    ASSERT_EQ(Color::try_from_channels(std::vector<int>{}).error(), ColorError::InvalidFormat);
}

TEST(Color, try_from_channels_returns_InvalidFormat_for_out_of_range_components)
{
    ASSERT_EQ(Color::try_from_channels(std::array{256, 0, 0, 255}).error(), ColorError::InvalidFormat);
    ASSERT_EQ(Color::try_from_channels(std::array{0, -1, 0, 255}).error(), ColorError::InvalidFormat);
    ASSERT_EQ(Color::try_from_channels(std::array{0, 0, 0, 1000}).error(), ColorError::InvalidFormat);
}

TEST(Color, complement_inverts_rgb_but_keeps_alpha)
{
    static_assert(Color(10, 20, 30, 40).complement() == Color(245, 235, 225, 40));
}

TEST(Color, complement_of_complement_is_original_color)
{
    for (const Color& color : c_example_colors) {
        ASSERT_EQ(color.complement().complement(), color);
    }
}

TEST(Color, complement_does_not_mutate_the_receiver)
{
    const Color color{1, 2, 3, 4};
    [[maybe_unused]] const Color complement = color.complement();
    ASSERT_EQ(color, Color(1, 2, 3, 4));
}

TEST(Color, brighten_by_zero_returns_black_with_same_alpha)
{
    for (const Color& color : c_example_colors) {
        ASSERT_EQ(color.brighten(0.0), Color(0, 0, 0, color.a));
    }
}

TEST(Color, brighten_clamps_rather_than_wraps)
{
    ASSERT_EQ(Color(100, 100, 100, 255).brighten(10.0), Color(255, 255, 255, 255));
}

TEST(Color, brighten_clamps_negative_factors_to_zero)
{
    ASSERT_EQ(Color(100, 150, 200, 7).brighten(-2.0), Color(0, 0, 0, 7));
}

TEST(Color, brighten_rounds_to_nearest)
{
    ASSERT_EQ(Color(7, 9, 100).brighten(0.3), Color(2, 3, 30));
}

TEST(Color, brighten_rounds_ties_to_even)
{
    // 0.5 * 5 == 2.5 --> 2, 0.5 * 3 == 1.5 --> 2, 0.5 * 11 == 5.5 --> 6
    ASSERT_EQ(Color(5, 3, 11).brighten(0.5), Color(2, 2, 6));
}

TEST(Color, brighten_by_one_is_identity)
{
    for (const Color& color : c_example_colors) {
        ASSERT_EQ(color.brighten(1.0), color);
    }
}

TEST(Color, brighten_with_NaN_returns_black)
{
    ASSERT_EQ(Color(100, 100, 100, 5).brighten(std::nan("")), Color(0, 0, 0, 5));
}

TEST(Color, with_alpha_only_replaces_alpha)
{
    ASSERT_EQ(Color(1, 2, 3, 4).with_alpha(200).value(), Color(1, 2, 3, 200));
}

TEST(Color, with_alpha_accepts_boundary_values)
{
    ASSERT_TRUE(Color{}.with_alpha(0).has_value());
    ASSERT_TRUE(Color{}.with_alpha(255).has_value());
}

TEST(Color, with_alpha_returns_OutOfRange_for_out_of_range_values)
{
    ASSERT_EQ(Color{}.with_alpha(256).error(), ColorError::OutOfRange);
    ASSERT_EQ(Color{}.with_alpha(-1).error(), ColorError::OutOfRange);
}

TEST(Color, blend_at_zero_returns_receiver)
{
    for (const Color& a : c_example_colors) {
        for (const Color& b : c_example_colors) {
            ASSERT_EQ(a.blend(b, 0.0).value(), a);
        }
    }
}

TEST(Color, blend_at_one_returns_other)
{
    for (const Color& a : c_example_colors) {
        for (const Color& b : c_example_colors) {
            ASSERT_EQ(a.blend(b, 1.0).value(), b);
        }
    }
}

TEST(Color, blend_interpolates_alpha_and_truncates)
{
    // 0.5*0 + 0.5*255 == 127.5 --> 127
    const Color blended = Color(0, 0, 0, 0).blend(Color(255, 255, 255, 255), 0.5).value();
    ASSERT_EQ(blended, Color(127, 127, 127, 127));
}

TEST(Color, blend_returns_OutOfRange_for_ratios_outside_unit_interval)
{
    ASSERT_EQ(Color{}.blend(Color{}, -0.01).error(), ColorError::OutOfRange);
    ASSERT_EQ(Color{}.blend(Color{}, 1.01).error(), ColorError::OutOfRange);
    ASSERT_EQ(Color{}.blend(Color{}, std::nan("")).error(), ColorError::OutOfRange);
}

TEST(Color, gray_is_fixed_point_for_equal_channels)
{
    for (int v = 0; v <= 255; ++v) {
        const auto c = static_cast<uint8_t>(v);
        ASSERT_EQ(Color(c, c, c, 255).gray(), Color(c, c, c, 255));
    }
}

TEST(Color, gray_uses_truncated_luma)
{
    // 0.299*255 == 76.245 --> 76
    ASSERT_EQ(Color(255, 0, 0, 9).gray(), Color(76, 76, 76, 9));
    // 0.587*255 == 149.685 --> 149
    ASSERT_EQ(Color(0, 255, 0).gray(), Color(149, 149, 149));
    // 0.114*255 == 29.07 --> 29
    ASSERT_EQ(Color(0, 0, 255).gray(), Color(29, 29, 29));
}

TEST(Color, is_bright_uses_luma_threshold)
{
    ASSERT_TRUE(Color(255, 255, 255).is_bright());
    ASSERT_FALSE(Color(0, 0, 0).is_bright());
    ASSERT_FALSE(Color(128, 128, 128).is_bright());  // luma == 128 (not strictly greater)
    ASSERT_TRUE(Color(129, 129, 129).is_bright());
    ASSERT_TRUE(Color(0, 255, 0).is_bright());
    ASSERT_FALSE(Color(0, 0, 255).is_bright());
}

TEST(Color, hsl_of_achromatic_colors_has_zero_hue_and_saturation)
{
    ASSERT_EQ(Color(0, 0, 0).hsl(), ColorHSL{});
    const ColorHSL white = Color(255, 255, 255).hsl();
    ASSERT_EQ(white.hue, 0.0f);
    ASSERT_EQ(white.saturation, 0.0f);
    ASSERT_FLOAT_EQ(white.lightness, 100.0f);
}

TEST(Color, hsl_of_primaries)
{
    const ColorHSL red = Color(255, 0, 0).hsl();
    ASSERT_FLOAT_EQ(red.hue, 0.0f);
    ASSERT_FLOAT_EQ(red.saturation, 100.0f);
    ASSERT_FLOAT_EQ(red.lightness, 50.0f);

    const ColorHSL green = Color(0, 255, 0).hsl();
    ASSERT_FLOAT_EQ(green.hue, 120.0f);
    ASSERT_FLOAT_EQ(green.saturation, 100.0f);
    ASSERT_FLOAT_EQ(green.lightness, 50.0f);

    const ColorHSL blue = Color(0, 0, 255).hsl();
    ASSERT_FLOAT_EQ(blue.hue, 240.0f);
    ASSERT_FLOAT_EQ(blue.saturation, 100.0f);
    ASSERT_FLOAT_EQ(blue.lightness, 50.0f);
}

TEST(Color, hsl_wraps_hue_when_red_is_max_and_green_is_less_than_blue)
{
    const ColorHSL magenta_ish = Color(255, 0, 128).hsl();
    ASSERT_GT(magenta_ish.hue, 300.0f);
    ASSERT_LT(magenta_ish.hue, 360.0f);
    ASSERT_NEAR(magenta_ish.hue, 329.88f, 0.01f);
}

TEST(Color, hsl_uses_light_saturation_formula_above_half_lightness)
{
    // max = 1.0, min = 0.8, lightness = 0.9 --> saturation = 0.2 / (2 - 1.8) = 1.0
    const ColorHSL hsl = Color(255, 204, 204).hsl();
    ASSERT_FLOAT_EQ(hsl.hue, 0.0f);
    ASSERT_NEAR(hsl.saturation, 100.0f, 0.001f);
    ASSERT_NEAR(hsl.lightness, 90.0f, 0.001f);
}

TEST(Color, hsl_stays_within_documented_ranges)
{
    std::default_random_engine rng{42};
    for (int i = 0; i < 1000; ++i) {
        const ColorHSL hsl = Color::random(rng).hsl();
        ASSERT_GE(hsl.hue, 0.0f);
        ASSERT_LT(hsl.hue, 360.0f);
        ASSERT_GE(hsl.saturation, 0.0f);
        ASSERT_LE(hsl.saturation, 100.0f + 1e-4f);
        ASSERT_GE(hsl.lightness, 0.0f);
        ASSERT_LE(hsl.lightness, 100.0f);
    }
}

TEST(Color, distance_between_black_and_white_is_diagonal_of_rgb_cube)
{
    const double d = Color::try_from_hex("#000000")->distance(*Color::try_from_hex("#FFFFFF"));
    ASSERT_DOUBLE_EQ(d, std::sqrt(3.0 * 255.0 * 255.0));
    ASSERT_NEAR(d, 441.67, 0.01);
}

TEST(Color, distance_ignores_alpha)
{
    ASSERT_EQ(Color(1, 2, 3, 0).distance(Color(1, 2, 3, 255)), 0.0);
}

TEST(Color, distance_is_symmetric)
{
    const Color a{10, 20, 30};
    const Color b{40, 60, 30};
    ASSERT_DOUBLE_EQ(a.distance(b), 50.0);
    ASSERT_DOUBLE_EQ(b.distance(a), 50.0);
}

TEST(Color, random_with_same_seed_is_deterministic)
{
    std::default_random_engine rng1{1234};
    std::default_random_engine rng2{1234};
    for (int i = 0; i < 16; ++i) {
        ASSERT_EQ(Color::random(rng1), Color::random(rng2));
    }
}

TEST(Color, random_is_always_opaque)
{
    for (int i = 0; i < 100; ++i) {
        ASSERT_EQ(Color::random().a, 0xff);
    }
}

TEST(Color, random_produces_varied_colors)
{
    std::unordered_set<Color> seen;
    for (int i = 0; i < 64; ++i) {
        seen.insert(Color::random());
    }
    ASSERT_GT(seen.size(), size_t{1});
}

TEST(Color, to_css_normalizes_alpha_to_two_decimals)
{
    ASSERT_EQ(Color(255, 0, 0, 128).to_css(), "rgba(255, 0, 0, 0.50)");
    ASSERT_EQ(Color(1, 2, 3, 255).to_css(), "rgba(1, 2, 3, 1.00)");
    ASSERT_EQ(Color(1, 2, 3, 0).to_css(), "rgba(1, 2, 3, 0.00)");
}

TEST(Color, to_hex_does_not_encode_alpha)
{
    ASSERT_EQ(Color(0x12, 0x34, 0x56, 0x00).to_hex(), "#123456");
}

TEST(Color, to_ansi_foreground_returns_true_color_sequence)
{
    ASSERT_EQ(Color(161, 178, 195).to_ansi_foreground(), "\x1b[38;2;161;178;195m");
}

TEST(Color, to_ansi_foreground_ignores_alpha)
{
    ASSERT_EQ(Color(1, 2, 3, 0).to_ansi_foreground(), Color(1, 2, 3, 255).to_ansi_foreground());
}

TEST(Color, apply_wraps_text_in_foreground_and_reset)
{
    ASSERT_EQ(Color(255, 0, 0).apply("hello"), "\x1b[38;2;255;0;0mhello\x1b[0m");
}

TEST(Color, stream_operator_writes_hex)
{
    std::stringstream ss;
    ss << Color(0xab, 0xcd, 0xef);
    ASSERT_EQ(ss.str(), "#ABCDEF");
}

TEST(Color, hash_differs_when_only_alpha_differs)
{
    const std::hash<Color> hasher;
    ASSERT_NE(hasher(Color(1, 2, 3, 4)), hasher(Color(1, 2, 3, 5)));
}
