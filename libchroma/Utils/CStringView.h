#pragma once

#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

namespace chroma
{
    // evaluate the length of a string at compile-time
    constexpr size_t strlen_constexpr(const char* s) noexcept
    {
        size_t len = 0;
        while (*s++ != char{0}) {
            ++len;
        }
        return len;
    }

    // represents a view into a NUL-terminated C string
    class CStringView final {
    public:
        constexpr CStringView() noexcept : data_{""}, size_{0} {}
        constexpr CStringView(const CStringView&) noexcept = default;
        constexpr CStringView& operator=(const CStringView&) noexcept = default;
        constexpr CStringView(const char* s) : data_{s}, size_{strlen_constexpr(s)} {}
        CStringView(const std::string& s) : data_{s.c_str()}, size_{s.size()} {}
        constexpr CStringView(std::nullptr_t) = delete;

        constexpr size_t size() const noexcept { return size_; }
        constexpr size_t length() const noexcept { return size_; }
        constexpr bool empty() const noexcept { return size_ == 0; }
        constexpr const char* c_str() const noexcept { return data_; }
        constexpr operator std::string_view () const noexcept { return std::string_view{data_, size_}; }

        friend constexpr bool operator==(const CStringView& lhs, const CStringView& rhs)
        {
            return std::string_view{lhs} == std::string_view{rhs};
        }

    private:
        const char* data_;
        size_t size_;
    };

    inline std::string to_string(const CStringView& sv)
    {
        return std::string{sv};
    }

    std::ostream& operator<<(std::ostream&, const CStringView&);
    std::string operator+(const char*, const CStringView&);
    std::string operator+(const std::string&, const CStringView&);
}

template<>
struct std::hash<chroma::CStringView> final {
    size_t operator()(const chroma::CStringView& sv) const noexcept
    {
        return std::hash<std::string_view>{}(sv);
    }
};
