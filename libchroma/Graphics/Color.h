#pragma once

#include <libchroma/Graphics/ColorError.h>
#include <libchroma/Graphics/ColorHSL.h>
#include <libchroma/Shims/Cpp23/expected.h>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <random>
#include <span>
#include <string>
#include <string_view>

namespace chroma
{
    // Represents an sRGB color with 8-bit red, green, blue, and (straight, not
    // premultiplied) alpha channels.
    //
    // `Color` is a value type. The hex (`#RRGGBB`) and channel-tuple views of it
    // are always derived from its four channels, and every derivation (`complement`,
    // `brighten`, `blend`, etc.) returns a new `Color` rather than mutating the
    // receiver.
    //
    // Alpha is tracked and can be blended, but it has no effect on terminal output
    // (e.g. `to_ansi_foreground`), because terminals have no transparency channel.
    struct Color final {

        // Tries to parse `str` as a `#RRGGBB` hex color string (case-insensitive).
        //
        // The returned color is fully opaque (`a == 255`). Returns `ColorError::InvalidFormat`
        // if `str` doesn't start with `#`, if it doesn't contain exactly six characters
        // after the `#`, or if any of those characters aren't hex digits.
        static cpp23::expected<Color, ColorError> try_from_hex(std::string_view str);

        // Tries to construct a color from a `(r, g, b, a)` channel tuple.
        //
        // Returns `ColorError::InvalidFormat` if `channels` doesn't contain exactly four
        // elements, or if any element is outside of [0, 255].
        static cpp23::expected<Color, ColorError> try_from_channels(std::span<const int> channels);

        // Returns an opaque color with uniformly-distributed random red, green, and
        // blue channels, drawn from `rng`.
        template<std::uniform_random_bit_generator Rng>
        static Color random(Rng& rng)
        {
            std::uniform_int_distribution<int> distribution{0, 0xff};
            const auto red = static_cast<uint8_t>(distribution(rng));
            const auto green = static_cast<uint8_t>(distribution(rng));
            const auto blue = static_cast<uint8_t>(distribution(rng));
            return Color{red, green, blue};
        }

        // Returns an opaque color with uniformly-distributed random red, green, and
        // blue channels, drawn from a thread-local, nondeterministically-seeded engine.
        static Color random();

        constexpr Color() = default;

        constexpr Color(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 0xff) :
            r{r_}, g{g_}, b{b_}, a{a_}
        {}

        friend constexpr bool operator==(const Color&, const Color&) = default;

        // returns `(255-r, 255-g, 255-b, a)`
        constexpr Color complement() const
        {
            return Color{
                static_cast<uint8_t>(0xff - r),
                static_cast<uint8_t>(0xff - g),
                static_cast<uint8_t>(0xff - b),
                a,
            };
        }

        // returns a color where each of the red, green, and blue channels has been
        // multiplied by `factor`, rounded to the nearest integer (ties to even, e.g.
        // 2.5 --> 2), and clamped to [0, 255] (alpha is unchanged)
        Color brighten(double factor) const;

        // returns a copy of this color with its alpha set to `alpha`, or `ColorError::OutOfRange`
        // if `alpha` is outside of [0, 255]
        cpp23::expected<Color, ColorError> with_alpha(int alpha) const;

        // returns the per-channel (incl. alpha) linear interpolation between this
        // color and `other`, truncated to integers
        //
        // returns `ColorError::OutOfRange` if `ratio` is outside of [0.0, 1.0]
        cpp23::expected<Color, ColorError> blend(const Color& other, double ratio) const;

        // returns a grey color with the same luma as this one (alpha is unchanged)
        Color gray() const;

        // returns `true` if this color's luma (`0.299r + 0.587g + 0.114b`) is greater than 128
        bool is_bright() const;

        ColorHSL hsl() const;

        // returns the Euclidean distance between this color and `other` in RGB space
        // (alpha is ignored)
        double distance(const Color& other) const;

        // returns a `#RRGGBB` representation of this color (uppercase, no alpha)
        std::string to_hex() const;

        // returns a CSS `rgba(r, g, b, a)` representation of this color, where `a` is
        // normalized to [0.0, 1.0] and written with two decimal places
        std::string to_css() const;

        // returns the 24-bit ANSI SGR sequence that sets the terminal's foreground
        // to this color (alpha is ignored)
        std::string to_ansi_foreground() const;

        // returns `text` wrapped in this color's foreground sequence and an SGR reset
        std::string apply(std::string_view text) const;

        uint8_t r = 0x00;
        uint8_t g = 0x00;
        uint8_t b = 0x00;
        uint8_t a = 0xff;
    };

    // writes the `#RRGGBB` representation of the color to the output stream
    std::ostream& operator<<(std::ostream&, const Color&);
}

template<>
struct std::hash<chroma::Color> final {
    size_t operator()(const chroma::Color& color) const noexcept
    {
        const uint32_t packed =
            (static_cast<uint32_t>(color.r) << 24) |
            (static_cast<uint32_t>(color.g) << 16) |
            (static_cast<uint32_t>(color.b) << 8)  |
            (static_cast<uint32_t>(color.a) << 0);
        return std::hash<uint32_t>{}(packed);
    }
};
