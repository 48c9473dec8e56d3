#pragma once

#include <libchroma/Graphics/Color.h>
#include <libchroma/Utils/CStringView.h>

#include <string>
#include <string_view>

// ansi: ANSI SGR escape sequences for 24-bit ("true color") terminal output
namespace chroma::ansi
{
    // control sequence introducer
    inline constexpr CStringView c_csi = "\x1b[";

    // returns the SGR sequence that resets all text attributes (`ESC[0m`)
    CStringView reset();

    // returns `ESC[38;2;<r>;<g>;<b>m` (alpha is ignored)
    std::string foreground(const Color&);

    // returns `ESC[48;2;<r>;<g>;<b>m` (alpha is ignored)
    std::string background(const Color&);

    // returns `text` wrapped in `color`'s foreground sequence and a trailing reset
    std::string colorize(const Color& color, std::string_view text);

    // returns `text` wrapped in `color`'s background sequence and a trailing reset
    std::string colorize_background(const Color& color, std::string_view text);
}
