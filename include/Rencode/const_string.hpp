#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace Rencode {

// Structural string usable as a non-type template argument: key<"name">
template <typename CharT, std::size_t N> struct ConstString
{
    CharT m_data[N+1];
    static constexpr std::size_t Length = N;

    constexpr ConstString(const CharT (&str)[N+1]) {
        for(std::size_t i = 0; i < N+1; i ++) {
            m_data[i] = str[i];
        }
    }

    // Control characters are rejected in keys
    constexpr bool check() const {
        for(std::size_t i = 0; i < N; i ++) {
            if(static_cast<std::uint8_t>(m_data[i]) < 32) return false;
        }
        return true;
    }

    constexpr std::string_view toStringView() const {
        return {&m_data[0], Length};
    }
};
template <typename CharT, std::size_t N>
ConstString(const CharT (&str)[N])->ConstString<CharT, N-1>;

template<class T>
struct is_const_string : std::false_type {};

template<typename CharT, std::size_t N>
struct is_const_string<ConstString<CharT, N>> : std::true_type {};

} // namespace Rencode
