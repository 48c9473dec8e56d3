#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace chroma
{
    // returns true if `a` is equal to `b` (case-insensitive)
    bool is_equal_case_insensitive(std::string_view a, std::string_view b);

    // returns a substring of `sv` without leading/trailing whitespace
    std::string_view strip_whitespace(std::string_view sv);

    // returns the end of the string between the last occurrence of `delimiter` and
    // the end of `sv`, or `sv` if `delimiter` does not occur within `sv`.
    std::string_view substring_after_last(std::string_view sv, std::string_view::value_type delimiter);

    // returns the start of the string up to (but excluding) the last occurrence of
    // `delimiter`, or an empty string if `delimiter` does not occur within `sv`
    std::string_view substring_before_last(std::string_view sv, std::string_view::value_type delimiter);

    // returns each substring of `sv` that is separated by `delimiter`
    //
    // e.g. "a,b,,c" --> {"a", "b", "", "c"}
    std::vector<std::string_view> split(std::string_view sv, std::string_view::value_type delimiter);

    // converts the given byte into a 2-length uppercase hex character representation
    //
    // e.g. 0x00 --> ('0', '0')
    //      0xf0 --> ('F', '0')
    //      0x02 --> ('0', '2')
    std::pair<char, char> to_hex_chars(uint8_t);

    // tries to parse two (case-insensitive) hex characters as a byte, e.g. ('f', 'F') --> 0xff
    std::optional<uint8_t> try_parse_hex_chars_as_byte(char, char);

    // (tries to) parse the entirety of `sv` as a base-10 integer
    //
    // - leading/trailing whitespace is ignored
    // - a leading `+` or `-` sign is accepted
    // - anything else (decimal points, exponents, trailing garbage) fails
    std::optional<int> try_parse_as_int(std::string_view sv);
}
