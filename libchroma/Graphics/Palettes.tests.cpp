#include "Palettes.h"

#include <libchroma/Graphics/Color.h>

#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_set>

using namespace chroma;

TEST(Palettes, every_entry_is_a_valid_hex_color)
{
    for (const Palette& palette : palettes()) {
        for (const PaletteEntry& entry : palette.entries) {
            ASSERT_TRUE(Color::try_from_hex(entry.hex).has_value()) << palette.name << '.' << entry.name;
        }
    }
}

TEST(Palettes, palette_names_are_unique)
{
    std::unordered_set<std::string_view> names;
    for (const Palette& palette : palettes()) {
        ASSERT_TRUE(names.insert(palette.name).second) << palette.name;
    }
}

TEST(Palettes, entry_names_are_unique_within_each_palette)
{
    for (const Palette& palette : palettes()) {
        std::unordered_set<std::string_view> names;
        for (const PaletteEntry& entry : palette.entries) {
            ASSERT_TRUE(names.insert(entry.name).second) << palette.name << '.' << entry.name;
        }
    }
}

TEST(Palettes, contains_expected_themes_with_expected_sizes)
{
    struct Expectation final {
        std::string_view name;
        size_t num_entries;
    };
    for (const auto& [name, num_entries] : {
            Expectation{"Basic", 8},
            Expectation{"Catppuccin.Latte", 26},
            Expectation{"Catppuccin.Frappe", 26},
            Expectation{"Catppuccin.Macchiato", 26},
            Expectation{"Catppuccin.Mocha", 26},
            Expectation{"Solarized", 16},
            Expectation{"Dracula", 12},
            Expectation{"Dracula.Pro", 10},
            Expectation{"Monokai", 10},
            Expectation{"Monokai.Pro", 10}}) {

        const Palette* palette = find_palette(name);
        ASSERT_NE(palette, nullptr) << name;
        ASSERT_EQ(palette->entries.size(), num_entries) << name;
    }
    ASSERT_EQ(palettes().size(), size_t{10});
}

TEST(find_palette, is_case_insensitive)
{
    ASSERT_EQ(find_palette("catppuccin.mocha"), find_palette("Catppuccin.Mocha"));
    ASSERT_NE(find_palette("SOLARIZED"), nullptr);
}

TEST(find_palette, returns_nullptr_for_unknown_palette)
{
    ASSERT_EQ(find_palette("Gruvbox"), nullptr);
    ASSERT_EQ(find_palette(""), nullptr);
}

TEST(find_palette_entry, returns_matching_entry)
{
    const Palette* solarized = find_palette("Solarized");
    ASSERT_NE(solarized, nullptr);

    const PaletteEntry* base03 = find_palette_entry(*solarized, "base03");
    ASSERT_NE(base03, nullptr);
    ASSERT_EQ(std::string_view{base03->hex}, "#002b36");
}

TEST(find_palette_entry, returns_nullptr_for_unknown_entry)
{
    const Palette* monokai = find_palette("Monokai");
    ASSERT_NE(monokai, nullptr);
    ASSERT_EQ(find_palette_entry(*monokai, "MAUVE"), nullptr);
}

TEST(find_palette_color, resolves_nested_theme_names)
{
    ASSERT_EQ(find_palette_color("Catppuccin.Latte.BASE"), Color(0xef, 0xf1, 0xf5));
    ASSERT_EQ(find_palette_color("Dracula.Pro.BACKGROUND"), Color(0x1e, 0x1f, 0x29));
    ASSERT_EQ(find_palette_color("Monokai.Pro.FOREGROUND"), Color(0xd6, 0xd6, 0xd6));
}

TEST(find_palette_color, distinguishes_themes_with_shared_prefixes)
{
    ASSERT_EQ(find_palette_color("Dracula.BACKGROUND"), Color(0x28, 0x2a, 0x36));
    ASSERT_EQ(find_palette_color("Dracula.Pro.BACKGROUND"), Color(0x1e, 0x1f, 0x29));
}

TEST(find_palette_color, returns_nullopt_for_unqualified_or_unknown_names)
{
    ASSERT_FALSE(find_palette_color("RED").has_value());
    ASSERT_FALSE(find_palette_color("Catppuccin.RED").has_value());
    ASSERT_FALSE(find_palette_color("Basic.ORANGE").has_value());
    ASSERT_FALSE(find_palette_color("").has_value());
}

TEST(to_color, converts_entry_hex_to_opaque_color)
{
    ASSERT_EQ(to_color(PaletteEntry{"X", "#8839ef"}), Color(0x88, 0x39, 0xef, 0xff));
}
