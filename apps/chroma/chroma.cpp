#include "CommandLineOptions.h"

#include <libchroma/chroma.h>

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

using namespace chroma;

namespace
{
    constexpr std::string_view c_usage = "usage: chroma [--help] [--config PATH] [--palettes] [--palette NAME] [--random N] [--blend COLOR RATIO] [--style NAME] [COLOR...]\n";

    constexpr std::string_view c_help = R"(ARGUMENTS
    COLOR
        A color to inspect. Either a hex string (e.g. '#A1B2C3'), a channel
        tuple (e.g. '161,178,195,255'), or a qualified palette color name
        (e.g. 'Dracula.PURPLE').

OPTIONS
    --help
        Show this help
    --config PATH
        Load settings from PATH, rather than from $CHROMA_CONFIG or ./chroma.toml
    --palettes
        List the names of all available palettes
    --palette NAME
        Print every color in the palette called NAME. If NAME is empty, prints
        the configured `default_palette`
    --random N
        Print N randomly-generated colors
    --blend COLOR RATIO
        Also print each inspected color blended with COLOR by RATIO (0.0 - 1.0)
    --style NAME
        Render labels with the given text style (e.g. Bold, Italic, Underline)
)";

    std::string format_hsl(const ColorHSL& hsl)
    {
        std::stringstream ss;
        ss << std::fixed << std::setprecision(1)
           << "hsl(" << hsl.hue << ", " << hsl.saturation << "%, " << hsl.lightness << "%)";
        return std::move(ss).str();
    }

    class ColorPrinter final {
    public:
        ColorPrinter(
            const ChromaSettings& settings,
            TextStyle label_style,
            std::optional<Color> blend_color,
            double blend_ratio) :

            swatch_{settings.swatch()},
            label_style_{label_style},
            blend_color_{blend_color},
            blend_ratio_{blend_ratio}
        {}

        void print_swatch_line(std::ostream& out, std::string_view label, const Color& color) const
        {
            out << ansi::colorize_background(color, swatch_) << ' '
                << stylize(label, label_style_) << ' '
                << color.apply(color.to_hex()) << '\n';
        }

        void print_details(std::ostream& out, const Color& color) const
        {
            out << ansi::colorize_background(color, swatch_) << ' ' << stylize(color.to_hex(), label_style_) << '\n';
            print_field(out, "css", color.to_css());
            print_field(out, "hsl", format_hsl(color.hsl()));
            print_field(out, "brightness", color.is_bright() ? "bright" : "dark");
            print_field(out, "complement", color.complement().apply(color.complement().to_hex()));
            print_field(out, "gray", color.gray().apply(color.gray().to_hex()));
            if (blend_color_) {
                // the ratio was range-checked when the command line was parsed
                const Color blended = color.blend(*blend_color_, blend_ratio_).value();
                print_field(out, "blend", blended.apply(blended.to_hex()));
            }
        }

        void print_field(std::ostream& out, std::string_view label, std::string_view value) const
        {
            out << "    " << stylize(label, label_style_) << ": " << value << '\n';
        }

    private:
        std::string swatch_;
        TextStyle label_style_;
        std::optional<Color> blend_color_;
        double blend_ratio_;
    };

    void print_palette(std::ostream& out, const ColorPrinter& printer, const Palette& palette)
    {
        out << palette.name << '\n';
        for (const PaletteEntry& entry : palette.entries) {
            printer.print_swatch_line(out, entry.name, to_color(entry));
        }
    }
}

int main(int argc, char* argv[])
{
    std::vector<std::string_view> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }
    const std::optional<CommandLineOptions> options = try_parse_command_line(args);
    if (not options) {
        std::cerr << c_usage;
        return EXIT_FAILURE;
    }
    if (options->show_help) {
        std::cout << c_usage << '\n' << c_help << '\n';
        return EXIT_SUCCESS;
    }
    if (not options->has_work()) {
        std::cerr << c_usage;
        return EXIT_FAILURE;
    }

    // init top-level application state
    const ChromaSettings settings = options->config_path ?
        ChromaSettings::load(*options->config_path) :
        ChromaSettings::load_default();
    global_set_log_level(settings.log_level());
    if (settings.enable_virtual_terminal()) {
        enable_virtual_terminal_processing();
    }

    // resolve the palette before printing anything, so that a bad name doesn't produce partial output
    const Palette* palette = nullptr;
    if (options->palette_name) {
        const std::string_view name = options->palette_name->empty() ?
            std::string_view{settings.default_palette()} :
            std::string_view{*options->palette_name};
        palette = find_palette(name);
        if (not palette) {
            log_error("%s: no such palette (use --palettes to list them)", std::string{name}.c_str());
            return EXIT_FAILURE;
        }
    }

    const ColorPrinter printer{settings, options->label_style, options->blend_color, options->blend_ratio};

    if (options->list_palettes) {
        for (const Palette& p : palettes()) {
            std::cout << p.name << '\n';
        }
    }

    if (palette) {
        print_palette(std::cout, printer, *palette);
    }

    for (const Color& color : options->colors) {
        printer.print_details(std::cout, color);
    }

    for (int i = 0; i < options->num_random_colors; ++i) {
        printer.print_details(std::cout, Color::random());
    }

    return EXIT_SUCCESS;
}
