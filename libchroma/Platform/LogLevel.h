#pragma once

#include <libchroma/Utils/CStringView.h>

#include <optional>
#include <string_view>

namespace chroma
{
    enum class LogLevel {
        trace = 0,
        debug,
        info,
        warn,
        err,
        critical,
        off,
        NUM_OPTIONS,

        DEFAULT = info,
    };

    CStringView to_cstringview(LogLevel);

    // case-insensitively parses `sv` as a log level name (e.g. "warning" --> `LogLevel::warn`)
    std::optional<LogLevel> try_parse_as_log_level(std::string_view sv);
}
