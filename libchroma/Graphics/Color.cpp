#include "Color.h"

#include <libchroma/Graphics/ColorError.h>
#include <libchroma/Graphics/ColorHSL.h>
#include <libchroma/Shims/Cpp23/expected.h>
#include <libchroma/Terminal/Ansi.h>
#include <libchroma/Utils/StringHelpers.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <ostream>
#include <random>
#include <span>
#include <sstream>
#include <string>
#include <string_view>

using namespace chroma;

namespace
{
    constexpr cpp23::unexpected<ColorError> c_invalid_format{ColorError::InvalidFormat};
    constexpr cpp23::unexpected<ColorError> c_out_of_range{ColorError::OutOfRange};

    // luma weights (ITU-R BT.601), scaled by 1000 so that luma can be computed
    // exactly with integer arithmetic
    constexpr int c_red_luma_weight = 299;
    constexpr int c_green_luma_weight = 587;
    constexpr int c_blue_luma_weight = 114;
    constexpr int c_luma_weight_scale = 1000;

    constexpr int scaled_luma(const Color& c)
    {
        return c_red_luma_weight*c.r + c_green_luma_weight*c.g + c_blue_luma_weight*c.b;
    }

    uint8_t scale_and_clamp_channel(uint8_t channel, double factor)
    {
        const double scaled = std::nearbyint(factor * static_cast<double>(channel));  // ties to even
        if (not (scaled > 0.0)) {  // also catches NaN
            return 0x00;
        }
        if (scaled >= 255.0) {
            return 0xff;
        }
        return static_cast<uint8_t>(scaled);
    }

    uint8_t lerp_channel(uint8_t a, uint8_t b, double t)
    {
        const double v = static_cast<double>(a)*(1.0 - t) + static_cast<double>(b)*t;
        return static_cast<uint8_t>(std::clamp(v, 0.0, 255.0));
    }

    bool is_in_channel_range(int v)
    {
        return 0x00 <= v and v <= 0xff;
    }
}

cpp23::expected<Color, ColorError> chroma::Color::try_from_hex(std::string_view str)
{
    if (not str.starts_with('#')) {
        return c_invalid_format;
    }
    str.remove_prefix(1);

    if (str.size() != 6) {
        return c_invalid_format;
    }

    const auto red = try_parse_hex_chars_as_byte(str[0], str[1]);
    const auto green = try_parse_hex_chars_as_byte(str[2], str[3]);
    const auto blue = try_parse_hex_chars_as_byte(str[4], str[5]);
    if (not red or not green or not blue) {
        return c_invalid_format;
    }
    return Color{*red, *green, *blue};
}

cpp23::expected<Color, ColorError> chroma::Color::try_from_channels(std::span<const int> channels)
{
    if (channels.size() != 4) {
        return c_invalid_format;
    }
    if (not std::ranges::all_of(channels, is_in_channel_range)) {
        return c_invalid_format;
    }
    return Color{
        static_cast<uint8_t>(channels[0]),
        static_cast<uint8_t>(channels[1]),
        static_cast<uint8_t>(channels[2]),
        static_cast<uint8_t>(channels[3]),
    };
}

Color chroma::Color::random()
{
    thread_local std::default_random_engine s_prng{std::random_device{}()};
    return random(s_prng);
}

Color chroma::Color::brighten(double factor) const
{
    return Color{
        scale_and_clamp_channel(r, factor),
        scale_and_clamp_channel(g, factor),
        scale_and_clamp_channel(b, factor),
        a,
    };
}

cpp23::expected<Color, ColorError> chroma::Color::with_alpha(int alpha) const
{
    if (not is_in_channel_range(alpha)) {
        return c_out_of_range;
    }
    return Color{r, g, b, static_cast<uint8_t>(alpha)};
}

cpp23::expected<Color, ColorError> chroma::Color::blend(const Color& other, double ratio) const
{
    if (not (0.0 <= ratio and ratio <= 1.0)) {  // also catches NaN
        return c_out_of_range;
    }
    return Color{
        lerp_channel(r, other.r, ratio),
        lerp_channel(g, other.g, ratio),
        lerp_channel(b, other.b, ratio),
        lerp_channel(a, other.a, ratio),
    };
}

Color chroma::Color::gray() const
{
    const auto luma = static_cast<uint8_t>(scaled_luma(*this) / c_luma_weight_scale);
    return Color{luma, luma, luma, a};
}

bool chroma::Color::is_bright() const
{
    return scaled_luma(*this) > 128*c_luma_weight_scale;
}

ColorHSL chroma::Color::hsl() const
{
    const double red = static_cast<double>(r) / 255.0;
    const double green = static_cast<double>(g) / 255.0;
    const double blue = static_cast<double>(b) / 255.0;

    const double max = std::max({red, green, blue});
    const double min = std::min({red, green, blue});
    const double lightness = 0.5 * (max + min);

    if (max == min) {
        return ColorHSL{.hue = 0.0f, .saturation = 0.0f, .lightness = static_cast<float>(100.0 * lightness)};
    }

    const double delta = max - min;
    const double saturation = lightness > 0.5 ? delta / (2.0 - max - min) : delta / (max + min);

    double hue = 0.0;
    if (max == red) {
        hue = (green - blue)/delta + (green < blue ? 6.0 : 0.0);
    }
    else if (max == green) {
        hue = (blue - red)/delta + 2.0;
    }
    else {
        hue = (red - green)/delta + 4.0;
    }
    hue /= 6.0;

    return ColorHSL{
        .hue = static_cast<float>(360.0 * hue),
        .saturation = static_cast<float>(100.0 * saturation),
        .lightness = static_cast<float>(100.0 * lightness),
    };
}

double chroma::Color::distance(const Color& other) const
{
    const double dr = static_cast<double>(r) - static_cast<double>(other.r);
    const double dg = static_cast<double>(g) - static_cast<double>(other.g);
    const double db = static_cast<double>(b) - static_cast<double>(other.b);
    return std::sqrt(dr*dr + dg*dg + db*db);
}

std::string chroma::Color::to_hex() const
{
    std::string rv;
    rv.reserve(7);
    rv.push_back('#');
    for (const uint8_t channel : {r, g, b}) {
        const auto [msn, lsn] = to_hex_chars(channel);
        rv.push_back(msn);
        rv.push_back(lsn);
    }
    return rv;
}

std::string chroma::Color::to_css() const
{
    std::stringstream ss;
    ss << "rgba("
       << static_cast<int>(r) << ", "
       << static_cast<int>(g) << ", "
       << static_cast<int>(b) << ", "
       << std::fixed << std::setprecision(2) << static_cast<double>(a)/255.0
       << ')';
    return std::move(ss).str();
}

std::string chroma::Color::to_ansi_foreground() const
{
    return ansi::foreground(*this);
}

std::string chroma::Color::apply(std::string_view text) const
{
    return ansi::colorize(*this, text);
}

std::ostream& chroma::operator<<(std::ostream& out, const Color& color)
{
    return out << color.to_hex();
}
