#include "ColorError.h"

#include <gtest/gtest.h>

#include <sstream>

using namespace chroma;

TEST(ColorError, to_cstringview_returns_enumerator_name)
{
    ASSERT_EQ(to_cstringview(ColorError::InvalidFormat), "InvalidFormat");
    ASSERT_EQ(to_cstringview(ColorError::OutOfRange), "OutOfRange");
}

TEST(ColorError, operator_stream_writes_enumerator_name)
{
    std::stringstream ss;
    ss << ColorError::OutOfRange;
    ASSERT_EQ(ss.str(), "OutOfRange");
}
