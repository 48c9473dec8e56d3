#pragma once

#include <iosfwd>

namespace chroma
{
    // a color expressed as hue, saturation, and lightness
    //
    // - `hue` is in degrees, in the range [0, 360)
    // - `saturation` and `lightness` are percentages, in the range [0, 100]
    struct ColorHSL final {
        friend bool operator==(const ColorHSL&, const ColorHSL&) = default;

        float hue = 0.0f;
        float saturation = 0.0f;
        float lightness = 0.0f;
    };

    std::ostream& operator<<(std::ostream&, const ColorHSL&);
}
