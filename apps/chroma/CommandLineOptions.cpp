#include "CommandLineOptions.h"

#include <libchroma/Graphics/Color.h>
#include <libchroma/Graphics/ColorError.h>
#include <libchroma/Graphics/ColorParsing.h>
#include <libchroma/Platform/Log.h>
#include <libchroma/Terminal/TextStyle.h>
#include <libchroma/Utils/StringHelpers.h>

#include <cmath>
#include <cstddef>
#include <exception>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

using namespace chroma;

namespace
{
    // returns the argument after `args[i]` (+ advances `i`), or `std::nullopt` (+ logs it) if there isn't one
    std::optional<std::string_view> next_argument(std::span<const std::string_view> args, size_t& i)
    {
        if (i + 1 >= args.size()) {
            log_error("%s: missing value", std::string{args[i]}.c_str());
            return std::nullopt;
        }
        return args[++i];
    }

    std::optional<Color> parse_color_or_log(std::string_view str)
    {
        const auto parsed = try_parse_color(str);
        if (not parsed) {
            log_error("%s: cannot be parsed as a color (%s)", std::string{str}.c_str(), to_cstringview(parsed.error()).c_str());
            return std::nullopt;
        }
        return *parsed;
    }

    std::optional<double> parse_ratio_or_log(std::string_view str)
    {
        try {
            size_t pos = 0;
            const std::string s{strip_whitespace(str)};
            const double rv = std::stod(s, &pos);
            if (pos != s.size()) {
                log_error("%s: cannot be parsed as a blend ratio", std::string{str}.c_str());
                return std::nullopt;
            }
            if (not std::isfinite(rv) or rv < 0.0 or rv > 1.0) {
                log_error("%s: blend ratio must be between 0.0 and 1.0", std::string{str}.c_str());
                return std::nullopt;
            }
            return rv;
        }
        catch (const std::exception&) {
            log_error("%s: cannot be parsed as a blend ratio", std::string{str}.c_str());
            return std::nullopt;
        }
    }
}

std::optional<CommandLineOptions> chroma::try_parse_command_line(std::span<const std::string_view> args)
{
    CommandLineOptions rv;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string_view arg = args[i];

        if (arg.empty()) {
            log_error("empty argument");
            return std::nullopt;
        }
        else if (arg == "--help") {
            rv.show_help = true;
            return rv;  // the rest of the command line is irrelevant
        }
        else if (arg == "--config") {
            const auto path = next_argument(args, i);
            if (not path) {
                return std::nullopt;
            }
            rv.config_path = std::filesystem::path{*path};
        }
        else if (arg == "--palettes") {
            rv.list_palettes = true;
        }
        else if (arg == "--palette") {
            const auto name = next_argument(args, i);
            if (not name) {
                return std::nullopt;
            }
            rv.palette_name = std::string{*name};
        }
        else if (arg == "--random") {
            const auto n = next_argument(args, i);
            if (not n) {
                return std::nullopt;
            }
            const std::optional<int> parsed = try_parse_as_int(*n);
            if (not parsed or *parsed < 0) {
                log_error("--random: expected a non-negative integer");
                return std::nullopt;
            }
            rv.num_random_colors = *parsed;
        }
        else if (arg == "--blend") {
            const auto color = next_argument(args, i);
            if (not color) {
                return std::nullopt;
            }
            const auto ratio = next_argument(args, i);
            if (not ratio) {
                return std::nullopt;
            }
            rv.blend_color = parse_color_or_log(*color);
            const std::optional<double> parsed_ratio = parse_ratio_or_log(*ratio);
            if (not rv.blend_color or not parsed_ratio) {
                return std::nullopt;
            }
            rv.blend_ratio = *parsed_ratio;
        }
        else if (arg == "--style") {
            const auto name = next_argument(args, i);
            if (not name) {
                return std::nullopt;
            }
            const std::optional<TextStyle> style = try_parse_text_style(*name);
            if (not style) {
                log_error("--style: expected the name of a text style (e.g. Bold, Italic)");
                return std::nullopt;
            }
            rv.label_style = *style;
        }
        else if (arg.starts_with("--")) {
            log_error("%s: unknown option", std::string{arg}.c_str());
            return std::nullopt;
        }
        else if (const auto color = parse_color_or_log(arg)) {
            rv.colors.push_back(*color);
        }
        else {
            return std::nullopt;
        }
    }
    return rv;
}
