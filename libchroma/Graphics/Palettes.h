#pragma once

#include <libchroma/Graphics/Color.h>
#include <libchroma/Utils/CStringView.h>

#include <optional>
#include <span>
#include <string_view>

// palettes: read-only tables of named colors, grouped by theme
namespace chroma
{
    // a named color within a palette (e.g. `{"MAUVE", "#8839ef"}`)
    struct PaletteEntry final {
        CStringView name;
        CStringView hex;
    };

    // a themed collection of named colors (e.g. "Catppuccin.Mocha")
    struct Palette final {
        CStringView name;
        std::span<const PaletteEntry> entries;
    };

    // returns all palettes that ship with libchroma, in a stable order
    std::span<const Palette> palettes();

    // returns the palette with the given (case-insensitive) name, or `nullptr` if
    // no such palette exists
    const Palette* find_palette(std::string_view name);

    // returns the entry with the given (case-insensitive) name from `palette`, or
    // `nullptr` if `palette` doesn't contain it
    const PaletteEntry* find_palette_entry(const Palette& palette, std::string_view name);

    // returns the color referred to by a qualified palette color name, which is the
    // name of a palette followed by a `.` and the name of one of its entries, e.g.
    // "Dracula.PURPLE" or "Catppuccin.Mocha.MAUVE"
    std::optional<Color> find_palette_color(std::string_view qualified_name);

    // returns the color of `entry`
    Color to_color(const PaletteEntry& entry);
}
