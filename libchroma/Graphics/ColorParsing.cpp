#include "ColorParsing.h"

#include <libchroma/Graphics/Color.h>
#include <libchroma/Graphics/ColorError.h>
#include <libchroma/Graphics/Palettes.h>
#include <libchroma/Shims/Cpp23/expected.h>
#include <libchroma/Utils/StringHelpers.h>

#include <optional>
#include <string_view>
#include <vector>

using namespace chroma;

namespace
{
    constexpr cpp23::unexpected<ColorError> c_invalid_format{ColorError::InvalidFormat};

    cpp23::expected<Color, ColorError> try_parse_channel_tuple(std::string_view str)
    {
        if (str.starts_with('(') != str.ends_with(')')) {
            return c_invalid_format;  // unbalanced parentheses
        }
        if (str.starts_with('(')) {
            str = str.substr(1, str.size() - 2);
        }

        std::vector<int> channels;
        for (const std::string_view component : split(str, ',')) {
            const std::optional<int> channel = try_parse_as_int(component);
            if (not channel) {
                return c_invalid_format;  // non-integer (or empty) component
            }
            channels.push_back(*channel);
        }
        return Color::try_from_channels(channels);
    }

    bool looks_like_channel_tuple(std::string_view str)
    {
        return str.starts_with('(') or str.find(',') != std::string_view::npos;
    }
}

cpp23::expected<Color, ColorError> chroma::try_parse_color(std::string_view str)
{
    str = strip_whitespace(str);

    if (str.starts_with('#')) {
        return Color::try_from_hex(str);
    }
    else if (looks_like_channel_tuple(str)) {
        return try_parse_channel_tuple(str);
    }
    else if (const std::optional<Color> palette_color = find_palette_color(str)) {
        return *palette_color;
    }
    else {
        return c_invalid_format;
    }
}
