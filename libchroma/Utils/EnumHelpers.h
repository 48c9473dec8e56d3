#pragma once

#include <array>
#include <cstddef>
#include <type_traits>

namespace chroma
{
    // satisfied if `T` is an enum that has a `NUM_OPTIONS` member that counts its options
    template<typename T>
    concept DenselyPackedOptionsEnum = std::is_enum_v<T> and requires { T::NUM_OPTIONS; };

    template<DenselyPackedOptionsEnum T>
    constexpr size_t num_options()
    {
        return static_cast<size_t>(T::NUM_OPTIONS);
    }

    // returns an array containing every option of `T`, in declaration order
    template<DenselyPackedOptionsEnum T>
    constexpr std::array<T, num_options<T>()> make_option_iterable()
    {
        std::array<T, num_options<T>()> rv{};
        for (size_t i = 0; i < rv.size(); ++i) {
            rv[i] = static_cast<T>(i);
        }
        return rv;
    }
}
