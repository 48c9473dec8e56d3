#pragma once

#include <libchroma/Utils/CStringView.h>

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace chroma
{
    // a fixed (parameterless) ANSI SGR text style
    enum class TextStyle {
        Reset,
        Bold,
        NormalWeight,
        Underline,
        Swap,  // reverse video
        Italic,
        Strikethrough,
        NUM_OPTIONS,
    };

    // returns the literal SGR sequence for `style` (e.g. `ESC[1m` for `TextStyle::Bold`)
    CStringView escape_sequence(TextStyle style);

    // returns the name of `style` (e.g. "Bold")
    CStringView to_cstringview(TextStyle style);

    // case-insensitively parses `str` as the name of a `TextStyle`
    std::optional<TextStyle> try_parse_text_style(std::string_view str);

    // returns `text` prefixed with `style`'s sequence and suffixed with an SGR reset
    std::string stylize(std::string_view text, TextStyle style);

    std::ostream& operator<<(std::ostream&, TextStyle);
}
