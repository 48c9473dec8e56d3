#include "LogLevel.h"

#include <libchroma/Utils/CStringView.h>
#include <libchroma/Utils/EnumHelpers.h>
#include <libchroma/Utils/StringHelpers.h>

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

using namespace chroma;

namespace
{
    constexpr auto c_log_level_strings = std::to_array<CStringView>({
        "trace",
        "debug",
        "info",
        "warning",
        "error",
        "critical",
        "off",
    });
    static_assert(c_log_level_strings.size() == num_options<LogLevel>());
}

CStringView chroma::to_cstringview(LogLevel level)
{
    return c_log_level_strings.at(static_cast<size_t>(level));
}

std::optional<LogLevel> chroma::try_parse_as_log_level(std::string_view sv)
{
    sv = strip_whitespace(sv);
    for (size_t i = 0; i < c_log_level_strings.size(); ++i) {
        if (is_equal_case_insensitive(sv, c_log_level_strings[i])) {
            return static_cast<LogLevel>(i);
        }
    }
    return std::nullopt;
}
