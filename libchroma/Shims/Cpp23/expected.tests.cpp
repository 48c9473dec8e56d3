#include "expected.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <string>

using namespace chroma;

namespace
{
    enum class TestError { A, B };
}

TEST(expected, value_constructed_has_value)
{
    const cpp23::expected<int, TestError> e = 7;
    ASSERT_TRUE(e.has_value());
    ASSERT_TRUE(static_cast<bool>(e));
    ASSERT_EQ(*e, 7);
    ASSERT_EQ(e.value(), 7);
}

TEST(expected, unexpected_constructed_has_error)
{
    const cpp23::expected<int, TestError> e = cpp23::unexpected<TestError>{TestError::B};
    ASSERT_FALSE(e.has_value());
    ASSERT_EQ(e.error(), TestError::B);
}

TEST(expected, value_throws_bad_expected_access_when_holding_error)
{
    const cpp23::expected<int, TestError> e = cpp23::unexpected<TestError>{TestError::A};
    ASSERT_THROW({ [[maybe_unused]] auto v = e.value(); }, cpp23::bad_expected_access<TestError>);
}

TEST(expected, value_or_returns_fallback_when_holding_error)
{
    const cpp23::expected<std::string, TestError> ok = std::string{"ok"};
    const cpp23::expected<std::string, TestError> bad = cpp23::unexpected<TestError>{TestError::A};
    ASSERT_EQ(ok.value_or("fallback"), "ok");
    ASSERT_EQ(bad.value_or("fallback"), "fallback");
}

TEST(expected, arrow_operator_accesses_value_members)
{
    const cpp23::expected<std::string, TestError> e = std::string{"abc"};
    ASSERT_EQ(e->size(), size_t{3});
}

TEST(expected, compares_equal_to_values_and_unexpecteds)
{
    const cpp23::expected<int, TestError> ok = 3;
    const cpp23::expected<int, TestError> bad = cpp23::unexpected<TestError>{TestError::A};

    ASSERT_TRUE(ok == 3);
    ASSERT_FALSE(bad == 3);
    ASSERT_TRUE(bad == cpp23::unexpected<TestError>{TestError::A});
    ASSERT_FALSE(bad == cpp23::unexpected<TestError>{TestError::B});
    ASSERT_FALSE(ok == cpp23::unexpected<TestError>{TestError::A});
}
