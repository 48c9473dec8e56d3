#include "TextStyle.h"

#include <libchroma/Terminal/Ansi.h>
#include <libchroma/Utils/CStringView.h>
#include <libchroma/Utils/EnumHelpers.h>
#include <libchroma/Utils/StringHelpers.h>

#include <array>
#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

using namespace chroma;

namespace
{
    struct TextStyleMetadata final {
        CStringView name;
        CStringView escape_sequence;
    };

    constexpr auto c_text_style_metadata = std::to_array<TextStyleMetadata>({
        {"Reset",         "\x1b[0m"},
        {"Bold",          "\x1b[1m"},
        {"NormalWeight",  "\x1b[22m"},
        {"Underline",     "\x1b[4m"},
        {"Swap",          "\x1b[7m"},
        {"Italic",        "\x1b[3m"},
        {"Strikethrough", "\x1b[9m"},
    });
    static_assert(c_text_style_metadata.size() == num_options<TextStyle>());

    const TextStyleMetadata& metadata_of(TextStyle style)
    {
        return c_text_style_metadata.at(static_cast<size_t>(style));
    }
}

CStringView chroma::escape_sequence(TextStyle style)
{
    return metadata_of(style).escape_sequence;
}

CStringView chroma::to_cstringview(TextStyle style)
{
    return metadata_of(style).name;
}

std::optional<TextStyle> chroma::try_parse_text_style(std::string_view str)
{
    str = strip_whitespace(str);
    for (const TextStyle style : make_option_iterable<TextStyle>()) {
        if (is_equal_case_insensitive(str, to_cstringview(style))) {
            return style;
        }
    }
    return std::nullopt;
}

std::string chroma::stylize(std::string_view text, TextStyle style)
{
    std::string rv{escape_sequence(style)};
    rv += text;
    rv += ansi::reset();
    return rv;
}

std::ostream& chroma::operator<<(std::ostream& out, TextStyle style)
{
    return out << to_cstringview(style);
}
