#include "Ansi.h"

#include <libchroma/Graphics/Color.h>
#include <libchroma/Utils/CStringView.h>

#include <string>
#include <string_view>

using namespace chroma;

namespace
{
    std::string true_color_sequence(std::string_view selector, const Color& color)
    {
        std::string rv{ansi::c_csi};
        rv += selector;
        rv += ";2;";
        rv += std::to_string(static_cast<int>(color.r));
        rv += ';';
        rv += std::to_string(static_cast<int>(color.g));
        rv += ';';
        rv += std::to_string(static_cast<int>(color.b));
        rv += 'm';
        return rv;
    }

    std::string wrap(std::string prefix, std::string_view text)
    {
        prefix += text;
        prefix += ansi::reset();
        return prefix;
    }
}

CStringView chroma::ansi::reset()
{
    return "\x1b[0m";
}

std::string chroma::ansi::foreground(const Color& color)
{
    return true_color_sequence("38", color);
}

std::string chroma::ansi::background(const Color& color)
{
    return true_color_sequence("48", color);
}

std::string chroma::ansi::colorize(const Color& color, std::string_view text)
{
    return wrap(foreground(color), text);
}

std::string chroma::ansi::colorize_background(const Color& color, std::string_view text)
{
    return wrap(background(color), text);
}
