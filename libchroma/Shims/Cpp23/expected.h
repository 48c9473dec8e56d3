#pragma once

#include <version>  // __cpp_lib_expected

#ifdef __cpp_lib_expected
    #include <expected>
#else
    #include <exception>
    #include <type_traits>
    #include <utility>
    #include <variant>
#endif

namespace chroma::cpp23
{
#ifdef __cpp_lib_expected
    template<class E>
    using unexpected = std::unexpected<E>;

    template<class E>
    using bad_expected_access = std::bad_expected_access<E>;

    template<class T, class E>
    using expected = std::expected<T, E>;
#else
    // libchroma shim for `std::unexpected<E>`
    template<class E>
    class unexpected final {
    public:
        constexpr explicit unexpected(const E& e) : error_{e} {}
        constexpr explicit unexpected(E&& e) : error_{std::move(e)} {}

        constexpr const E& error() const & noexcept { return error_; }
        constexpr E& error() & noexcept { return error_; }
        constexpr E&& error() && noexcept { return std::move(error_); }

        friend constexpr bool operator==(const unexpected&, const unexpected&) = default;
    private:
        E error_;
    };

    template<class E>
    unexpected(E) -> unexpected<E>;

    // libchroma shim for `std::bad_expected_access<E>`
    template<class E>
    class bad_expected_access final : public std::exception {
    public:
        explicit bad_expected_access(E e) : error_{std::move(e)} {}

        const char* what() const noexcept override { return "bad access to cpp23::expected without expected value"; }
        const E& error() const & noexcept { return error_; }
    private:
        E error_;
    };

    // libchroma shim for `std::expected<T, E>`
    //
    // only implements the subset of the C++23 API that libchroma uses (no monadic
    // operations, no `void` specialization)
    template<class T, class E>
    class expected final {
    public:
        using value_type = T;
        using error_type = E;
        using unexpected_type = unexpected<E>;

        constexpr expected() requires std::is_default_constructible_v<T> :
            data_{std::in_place_index<0>}
        {}

        template<class U = T>
        requires (
            std::is_constructible_v<T, U> and
            not std::is_same_v<std::remove_cvref_t<U>, expected> and
            not std::is_same_v<std::remove_cvref_t<U>, unexpected<E>> and
            not std::is_same_v<std::remove_cvref_t<U>, std::in_place_t>
        )
        constexpr explicit(not std::is_convertible_v<U, T>) expected(U&& v) :
            data_{std::in_place_index<0>, std::forward<U>(v)}
        {}

        template<class G>
        requires std::is_constructible_v<E, const G&>
        constexpr explicit(not std::is_convertible_v<const G&, E>) expected(const unexpected<G>& e) :
            data_{std::in_place_index<1>, e.error()}
        {}

        template<class G>
        requires std::is_constructible_v<E, G>
        constexpr explicit(not std::is_convertible_v<G, E>) expected(unexpected<G>&& e) :
            data_{std::in_place_index<1>, std::move(e).error()}
        {}

        constexpr bool has_value() const noexcept { return data_.index() == 0; }
        constexpr explicit operator bool () const noexcept { return has_value(); }

        constexpr const T& value() const &
        {
            if (not has_value()) {
                throw bad_expected_access<E>{error()};
            }
            return *std::get_if<0>(&data_);
        }

        constexpr T& value() &
        {
            if (not has_value()) {
                throw bad_expected_access<E>{error()};
            }
            return *std::get_if<0>(&data_);
        }

        constexpr T&& value() &&
        {
            if (not has_value()) {
                throw bad_expected_access<E>{error()};
            }
            return std::move(*std::get_if<0>(&data_));
        }

        template<class U>
        constexpr T value_or(U&& default_value) const &
        {
            return has_value() ? **this : static_cast<T>(std::forward<U>(default_value));
        }

        constexpr const T& operator*() const & noexcept { return *std::get_if<0>(&data_); }
        constexpr T& operator*() & noexcept { return *std::get_if<0>(&data_); }
        constexpr const T* operator->() const noexcept { return std::get_if<0>(&data_); }
        constexpr T* operator->() noexcept { return std::get_if<0>(&data_); }

        constexpr const E& error() const & noexcept { return *std::get_if<1>(&data_); }
        constexpr E& error() & noexcept { return *std::get_if<1>(&data_); }

        friend constexpr bool operator==(const expected& lhs, const expected& rhs)
        {
            return lhs.data_ == rhs.data_;
        }

        template<class T2>
        requires (not std::is_same_v<std::remove_cvref_t<T2>, expected>)
        friend constexpr bool operator==(const expected& lhs, const T2& rhs)
        {
            return lhs.has_value() and static_cast<bool>(*lhs == rhs);
        }

        template<class E2>
        friend constexpr bool operator==(const expected& lhs, const unexpected<E2>& rhs)
        {
            return not lhs.has_value() and static_cast<bool>(lhs.error() == rhs.error());
        }

    private:
        std::variant<T, E> data_;
    };
#endif
}
