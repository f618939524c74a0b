#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace Rencode {

/// Dictionary with unique string keys kept in sorted order, so that
/// iteration (and therefore encoding) is deterministic. A template so that
/// it can be instantiated with the still incomplete Value.
template<class V>
class BasicDict {
public:
    using key_type       = std::string;
    using mapped_type    = V;
    using value_type     = std::pair<std::string, V>;
    using container_type = std::vector<value_type>;
    using iterator       = typename container_type::iterator;
    using const_iterator = typename container_type::const_iterator;

    constexpr BasicDict() = default;

    constexpr BasicDict(std::initializer_list<value_type> init) {
        for (const auto & entry : init) {
            insert_or_assign(entry.first, entry.second);
        }
    }

    // Inserts only if `key` is absent; {position, inserted}
    constexpr std::pair<iterator, bool> try_emplace(std::string key, V value) {
        auto it = lower_bound(key);
        if (it != entries_.end() && it->first == key) {
            return {it, false};
        }
        it = entries_.emplace(it, std::move(key), std::move(value));
        return {it, true};
    }

    constexpr V & insert_or_assign(std::string key, V value) {
        auto it = lower_bound(key);
        if (it != entries_.end() && it->first == key) {
            it->second = std::move(value);
            return it->second;
        }
        return entries_.emplace(it, std::move(key), std::move(value))->second;
    }

    constexpr V & operator[](std::string_view key) {
        auto it = lower_bound(key);
        if (it == entries_.end() || it->first != key) {
            it = entries_.emplace(it, std::string(key), V{});
        }
        return it->second;
    }

    // nullptr when absent
    constexpr const V * find(std::string_view key) const {
        auto it = std::lower_bound(entries_.begin(), entries_.end(), key, key_less);
        if (it == entries_.end() || it->first != key) {
            return nullptr;
        }
        return &it->second;
    }

    constexpr bool contains(std::string_view key) const {
        return find(key) != nullptr;
    }

    constexpr std::size_t size() const { return entries_.size(); }
    constexpr bool empty() const { return entries_.empty(); }
    constexpr void clear() { entries_.clear(); }

    constexpr const_iterator begin() const { return entries_.begin(); }
    constexpr const_iterator end() const { return entries_.end(); }

    friend constexpr bool operator==(const BasicDict & a, const BasicDict & b) {
        return a.entries_ == b.entries_;
    }

private:
    container_type entries_;

    static constexpr bool key_less(const value_type & entry, std::string_view key) {
        return std::string_view(entry.first) < key;
    }

    constexpr iterator lower_bound(std::string_view key) {
        return std::lower_bound(entries_.begin(), entries_.end(), key, key_less);
    }
};

/// Any encodable value, for data without a statically known shape.
/// Decoding produces I64 for every integer and F64 for both float widths.
class Value {
public:
    using List    = std::vector<Value>;
    using Dict    = BasicDict<Value>;
    using Storage = std::variant<std::monostate, bool, std::int64_t, std::uint64_t, double, std::string, List, Dict>;

    // Same order as the Storage alternatives
    enum class Type { None, Bool, I64, U64, F64, String, List, Dict };

    constexpr Value() = default;
    constexpr Value(std::nullptr_t) {}
    constexpr Value(bool b) : data_(b) {}

    template<class Int>
        requires (std::is_integral_v<Int> && !std::is_same_v<Int, bool>)
    constexpr Value(Int v) {
        if constexpr (std::is_signed_v<Int>) {
            data_.template emplace<std::int64_t>(v);
        } else {
            data_.template emplace<std::uint64_t>(v);
        }
    }

    constexpr Value(float v) : data_(static_cast<double>(v)) {}
    constexpr Value(double v) : data_(v) {}
    constexpr Value(const char * s) : data_(std::string(s)) {}
    constexpr Value(std::string_view s) : data_(std::string(s)) {}
    constexpr Value(std::string s) : data_(std::move(s)) {}
    constexpr Value(List l) : data_(std::move(l)) {}
    constexpr Value(Dict d) : data_(std::move(d)) {}

    constexpr Type type() const {
        return static_cast<Type>(data_.index());
    }

    constexpr bool is_none() const { return type() == Type::None; }
    constexpr bool is_integer() const { return type() == Type::I64 || type() == Type::U64; }

    // nullptr unless the value currently holds T
    template<class T>
    constexpr const T * get_if() const {
        return std::get_if<T>(&data_);
    }

    template<class T>
    constexpr T * get_if() {
        return std::get_if<T>(&data_);
    }

    constexpr const Storage & storage() const {
        return data_;
    }

    constexpr Storage & storage() {
        return data_;
    }

    // I64 and U64 holding the same number compare equal
    friend constexpr bool operator==(const Value & a, const Value & b) {
        if (a.type() == Type::I64 && b.type() == Type::U64) {
            return same_number(std::get<std::int64_t>(a.data_), std::get<std::uint64_t>(b.data_));
        }
        if (a.type() == Type::U64 && b.type() == Type::I64) {
            return same_number(std::get<std::int64_t>(b.data_), std::get<std::uint64_t>(a.data_));
        }
        return a.data_ == b.data_;
    }

private:
    Storage data_;

    static constexpr bool same_number(std::int64_t s, std::uint64_t u) {
        return s >= 0 && static_cast<std::uint64_t>(s) == u;
    }
};

} // namespace Rencode
