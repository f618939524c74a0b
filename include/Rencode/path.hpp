#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace Rencode {
namespace path {

constexpr std::size_t NOT_AN_INDEX = std::numeric_limits<std::size_t>::max();

// One step of the path to a failing element: a list index, a record field
// name (static storage) or a map key (owned copy).
struct PathElement {
    std::size_t      array_index = NOT_AN_INDEX;
    std::string_view field_name;
    std::string      dynamic_key;
    bool             is_static = true;

    constexpr PathElement() = default;

    constexpr PathElement(std::size_t index)
        : array_index(index)
    {}

    constexpr PathElement(std::string_view key, bool is_static_)
        : is_static(is_static_)
    {
        if (is_static_) {
            field_name = key;
        } else {
            dynamic_key = std::string(key);
        }
    }

    constexpr bool is_index() const {
        return array_index != NOT_AN_INDEX;
    }

    constexpr std::string_view key() const {
        return is_static ? field_name : std::string_view(dynamic_key);
    }
};

namespace detail {

template<class Int>
constexpr std::string integer_to_string(Int v) {
    std::string out;
    const bool negative = v < 0;
    auto mag = static_cast<std::make_unsigned_t<Int>>(v);
    if (negative) {
        mag = static_cast<std::make_unsigned_t<Int>>(0) - mag;
    }
    do {
        out.insert(out.begin(), static_cast<char>('0' + mag % 10));
        mag /= 10;
    } while (mag != 0);
    if (negative) {
        out.insert(out.begin(), '-');
    }
    return out;
}

} // namespace detail

struct Path {
    std::vector<PathElement> storage;

    constexpr Path() = default;

    // Expected-path construction for tests: Path("items", 2, "name")
    template <class... PathElems>
        requires (sizeof...(PathElems) > 0 && (!std::is_same_v<std::remove_cvref_t<PathElems>, Path> && ...))
    constexpr Path(PathElems... args) {
        auto push_one = [this]<class ArgT>(ArgT arg) {
            if constexpr (std::is_convertible_v<ArgT, std::string_view>) {
                storage.emplace_back(std::string_view(arg), true);
            } else if constexpr (std::is_convertible_v<ArgT, std::size_t>) {
                storage.emplace_back(static_cast<std::size_t>(arg));
            } else {
                static_assert(!sizeof(ArgT), "Use integers or string-compatible segments in Path construction");
            }
        };
        (push_one(args), ...);
    }

    constexpr std::size_t size() const {
        return storage.size();
    }

    constexpr const PathElement & operator[](std::size_t i) const {
        return storage[i];
    }

    constexpr void push_index(std::size_t index) {
        storage.emplace_back(index);
    }

    constexpr void push_field(std::string_view key, bool is_static) {
        storage.emplace_back(key, is_static);
    }

    template<class Int>
    constexpr void push_integer_key(Int key) {
        storage.emplace_back(std::string_view(detail::integer_to_string(key)), false);
    }

    constexpr void pop() {
        storage.pop_back();
    }

    // Index and key wise comparison; static and owned keys compare equal
    constexpr bool operator==(const Path & other) const {
        if (storage.size() != other.storage.size()) {
            return false;
        }
        for (std::size_t i = 0; i < storage.size(); i ++) {
            if (storage[i].array_index != other.storage[i].array_index ||
                storage[i].key() != other.storage[i].key()) {
                return false;
            }
        }
        return true;
    }
};

} // namespace path
} // namespace Rencode
