#pragma once

#include <concepts>
#include <cstddef>
#include <iterator>
#include <memory>
#include <ranges>
#include <type_traits>
#include <utility>

namespace Rencode {

// Compile-time list of per-field options
template<class... Opts>
struct OptionsPack {
    static constexpr std::size_t Count = sizeof...(Opts);
};

/// Wraps a field value with encoding options; behaves like T in user code.
///
///     struct Point {
///         A<int, options::key<"x_pos">> x;
///         A<Extra, options::skip_nulls> extra;
///     };
template <class T, typename... Options>
struct Annotated {
    T value{};
    using value_type = T;

    constexpr Annotated() = default;
    constexpr Annotated(const Annotated&) = default;
    constexpr Annotated(Annotated&&) = default;
    constexpr Annotated& operator=(const Annotated&) = default;
    constexpr Annotated& operator=(Annotated&&) = default;

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated(U&& u) : value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated& operator=(U&& u) {
        value = std::forward<U>(u);
        return *this;
    }

    constexpr operator T&()             { return value; }
    constexpr operator const T&() const { return value; }

    constexpr T*       operator->()       { return std::addressof(value); }
    constexpr const T* operator->() const { return std::addressof(value); }

    constexpr T&       get()       { return value; }
    constexpr const T& get() const { return value; }

    template<class U = T>
        requires std::ranges::range<U>
    constexpr auto begin() { return std::ranges::begin(value); }

    template<class U = T>
        requires std::ranges::range<const U>
    constexpr auto begin() const { return std::ranges::begin(value); }

    template<class U = T>
        requires std::ranges::range<U>
    constexpr auto end() { return std::ranges::end(value); }

    template<class U = T>
        requires std::ranges::range<const U>
    constexpr auto end() const { return std::ranges::end(value); }

    template<class U = T>
        requires requires (const U& u) { u.size(); }
    constexpr auto size() const { return value.size(); }

    template<class U = T>
        requires requires (U& u) { u[std::size_t{0}]; }
    constexpr decltype(auto) operator[](std::size_t i) { return value[i]; }

    template<class U = T>
        requires requires (const U& u) { u[std::size_t{0}]; }
    constexpr decltype(auto) operator[](std::size_t i) const { return value[i]; }
};

template<class T, class... Opts>
using A = Annotated<T, Opts...>;

template<class T>
struct is_annotated : std::false_type {};

template<class T, class... Opts>
struct is_annotated<Annotated<T, Opts...>> : std::true_type {};

template<class T, class... OptsL, class... OptsR>
constexpr bool operator==(const Annotated<T, OptsL...>& lhs, const Annotated<T, OptsR...>& rhs) {
    return lhs.value == rhs.value;
}

template<class T, class... Opts, class U>
    requires (!is_annotated<U>::value) && requires (const T& t, const U& u) { t == u; }
constexpr bool operator==(const Annotated<T, Opts...>& lhs, const U& rhs) {
    return lhs.value == rhs;
}

} // namespace Rencode
