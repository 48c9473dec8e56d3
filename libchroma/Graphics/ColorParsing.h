#pragma once

#include <libchroma/Graphics/Color.h>
#include <libchroma/Graphics/ColorError.h>
#include <libchroma/Shims/Cpp23/expected.h>

#include <string_view>

namespace chroma
{
    // Tries to parse user-provided text (e.g. from the command line or a configuration
    // file) as a color. Surrounding whitespace is ignored. Accepted forms are:
    //
    // - a hex color string, e.g. "#A1B2C3" (see `Color::try_from_hex`)
    // - a comma-separated channel tuple, optionally in parentheses, e.g. "(161, 178, 195, 255)"
    //   (see `Color::try_from_channels`), where each component must be a base-10 integer
    // - a qualified palette color name, e.g. "Dracula.PURPLE" (see `find_palette_color`)
    //
    // Anything else returns `ColorError::InvalidFormat`.
    cpp23::expected<Color, ColorError> try_parse_color(std::string_view str);
}
