#include "StringHelpers.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace rgs = std::ranges;

namespace
{
    bool is_whitespace(char c)
    {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    std::optional<uint8_t> try_parse_hex_char_as_nibble(char c)
    {
        if ('0' <= c and c <= '9') {
            return static_cast<uint8_t>(c - '0');
        }
        if ('a' <= c and c <= 'f') {
            return static_cast<uint8_t>(10 + (c - 'a'));
        }
        if ('A' <= c and c <= 'F') {
            return static_cast<uint8_t>(10 + (c - 'A'));
        }
        return std::nullopt;
    }
}

bool chroma::is_equal_case_insensitive(std::string_view a, std::string_view b)
{
    const auto equal_lowercase = [](char c1, char c2)
    {
        return std::tolower(static_cast<unsigned char>(c1)) == std::tolower(static_cast<unsigned char>(c2));
    };
    return rgs::equal(a, b, equal_lowercase);
}

std::string_view chroma::strip_whitespace(std::string_view sv)
{
    const auto front = rgs::find_if_not(sv, is_whitespace);
    if (front == sv.end()) {
        return {};
    }
    const auto back = std::find_if_not(sv.rbegin(), sv.rend(), is_whitespace).base();
    return std::string_view{front, back};
}

std::string_view chroma::substring_after_last(std::string_view sv, std::string_view::value_type delimiter)
{
    const size_t pos = sv.rfind(delimiter);
    return pos != std::string_view::npos ? sv.substr(pos + 1) : sv;
}

std::string_view chroma::substring_before_last(std::string_view sv, std::string_view::value_type delimiter)
{
    const size_t pos = sv.rfind(delimiter);
    return pos != std::string_view::npos ? sv.substr(0, pos) : std::string_view{};
}

std::vector<std::string_view> chroma::split(std::string_view sv, std::string_view::value_type delimiter)
{
    std::vector<std::string_view> rv;
    size_t start = 0;
    for (size_t pos = sv.find(delimiter); pos != std::string_view::npos; pos = sv.find(delimiter, start)) {
        rv.push_back(sv.substr(start, pos - start));
        start = pos + 1;
    }
    rv.push_back(sv.substr(start));
    return rv;
}

std::pair<char, char> chroma::to_hex_chars(uint8_t b)
{
    constexpr std::string_view c_nibble_to_char = "0123456789ABCDEF";
    return {c_nibble_to_char[(b >> 4) & 0xf], c_nibble_to_char[b & 0xf]};
}

std::optional<uint8_t> chroma::try_parse_hex_chars_as_byte(char a, char b)
{
    const auto msn = try_parse_hex_char_as_nibble(a);
    const auto lsn = try_parse_hex_char_as_nibble(b);
    if (not msn or not lsn) {
        return std::nullopt;
    }
    return static_cast<uint8_t>((*msn << 4) | *lsn);
}

std::optional<int> chroma::try_parse_as_int(std::string_view sv)
{
    sv = strip_whitespace(sv);
    if (sv.starts_with('+')) {
        sv.remove_prefix(1);
        if (sv.starts_with('-')) {
            return std::nullopt;  // e.g. "+-1"
        }
    }
    if (sv.empty()) {
        return std::nullopt;
    }

    int rv{};
    const auto [ptr, err] = std::from_chars(sv.data(), sv.data() + sv.size(), rv);
    if (err != std::errc{} or ptr != sv.data() + sv.size()) {
        return std::nullopt;
    }
    return rv;
}
