#include "ColorError.h"

#include <libchroma/Utils/CStringView.h>
#include <libchroma/Utils/EnumHelpers.h>

#include <array>
#include <cstddef>
#include <ostream>

using namespace chroma;

namespace
{
    constexpr auto c_color_error_strings = std::to_array<CStringView>({
        "InvalidFormat",
        "OutOfRange",
    });
    static_assert(c_color_error_strings.size() == num_options<ColorError>());
}

CStringView chroma::to_cstringview(ColorError e)
{
    return c_color_error_strings.at(static_cast<size_t>(e));
}

std::ostream& chroma::operator<<(std::ostream& out, ColorError e)
{
    return out << to_cstringview(e);
}
