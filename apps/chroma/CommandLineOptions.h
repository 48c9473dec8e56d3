#pragma once

#include <libchroma/Graphics/Color.h>
#include <libchroma/Terminal/TextStyle.h>

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace chroma
{
    // everything the `chroma` command-line tool was asked to do
    struct CommandLineOptions final {

        // returns `true` if the options ask for any output at all
        bool has_work() const
        {
            return list_palettes or palette_name or num_random_colors > 0 or not colors.empty();
        }

        bool show_help = false;
        std::optional<std::filesystem::path> config_path;
        bool list_palettes = false;
        std::optional<std::string> palette_name;
        int num_random_colors = 0;
        std::optional<Color> blend_color;
        double blend_ratio = 0.5;
        TextStyle label_style = TextStyle::Bold;
        std::vector<Color> colors;
    };

    // tries to parse `args` (i.e. `argv`, excluding the program name) as options
    // for the `chroma` tool
    //
    // every problem is logged as an error before returning `std::nullopt`, so that
    // nothing is printed to stdout for a command line that is going to fail. Parsing
    // stops at `--help`
    std::optional<CommandLineOptions> try_parse_command_line(std::span<const std::string_view> args);
}
