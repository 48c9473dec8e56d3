#include "CStringView.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <sstream>
#include <string>
#include <string_view>

using namespace chroma;

TEST(CStringView, default_constructed_is_empty_and_nul_terminated)
{
    const CStringView sv;
    ASSERT_TRUE(sv.empty());
    ASSERT_EQ(sv.c_str()[0], '\0');
}

TEST(CStringView, can_be_used_in_constant_expressions)
{
    static_assert(CStringView{"#FF0000"}.size() == 7);
    static_assert(CStringView{"abc"} == CStringView{"abc"});
    static_assert(strlen_constexpr("") == 0);
}

TEST(CStringView, constructed_from_std_string_views_its_content)
{
    const std::string s = "Catppuccin";
    const CStringView sv{s};
    ASSERT_EQ(sv.c_str(), s.c_str());
    ASSERT_EQ(sv.size(), s.size());
}

TEST(CStringView, operator_plus_concatenates_into_std_string)
{
    ASSERT_EQ("Basic" + CStringView{".RED"}, "Basic.RED");
    ASSERT_EQ(std::string{"Basic"} + CStringView{".RED"}, "Basic.RED");
}

TEST(CStringView, operator_stream_writes_content)
{
    std::stringstream ss;
    ss << CStringView{"Dracula"};
    ASSERT_EQ(ss.str(), "Dracula");
}

TEST(CStringView, hash_matches_string_view_hash)
{
    const CStringView sv{"MAUVE"};
    ASSERT_EQ(std::hash<CStringView>{}(sv), std::hash<std::string_view>{}("MAUVE"));
}
