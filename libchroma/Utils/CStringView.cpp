#include "CStringView.h"

#include <iostream>
#include <string>
#include <string_view>

std::ostream& chroma::operator<<(std::ostream& out, const CStringView& sv)
{
    return out << std::string_view{sv};
}

std::string chroma::operator+(const char* lhs, const CStringView& rhs)
{
    return lhs + to_string(rhs);
}

std::string chroma::operator+(const std::string& lhs, const CStringView& rhs)
{
    return lhs + to_string(rhs);
}
