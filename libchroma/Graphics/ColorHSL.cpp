#include "ColorHSL.h"

#include <ostream>

std::ostream& chroma::operator<<(std::ostream& out, const ColorHSL& hsl)
{
    return out << "ColorHSL(hue = " << hsl.hue << ", saturation = " << hsl.saturation << ", lightness = " << hsl.lightness << ')';
}
