#pragma once

#include <libchroma/Utils/CStringView.h>

#include <iosfwd>

namespace chroma
{
    // the reasons why a color operation can fail
    enum class ColorError {
        // construction input isn't a well-formed `#RRGGBB` string or a 4-component
        // channel tuple where each component is an integer in [0, 255]
        InvalidFormat,

        // a parameter (e.g. alpha or blend ratio) is outside of its documented domain
        OutOfRange,

        NUM_OPTIONS,
    };

    CStringView to_cstringview(ColorError);
    std::ostream& operator<<(std::ostream&, ColorError);
}
