#pragma once

#include <Rencode/parser.hpp>
#include <Rencode/serializer.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>
#include <pfr.hpp>

namespace TestHelpers {

// ============================================================================
// Byte Helpers
// ============================================================================

using Bytes = std::vector<std::uint8_t>;

/// Bytes from a list of integers: B({194, 1, 2})
constexpr Bytes B(std::initializer_list<int> values) {
    Bytes out;
    for (int v : values) {
        out.push_back(static_cast<std::uint8_t>(v));
    }
    return out;
}

/// Bytes of a text, without terminator: Text("8:rustlang")
constexpr Bytes Text(std::string_view text) {
    Bytes out;
    for (char c : text) {
        out.push_back(static_cast<std::uint8_t>(c));
    }
    return out;
}

/// `count` copies of `byte`
constexpr Bytes Repeat(std::uint8_t byte, std::size_t count) {
    return Bytes(count, byte);
}

/// Concatenation of byte sequences: Cat(B({59}), Repeat(1, 80), B({127}))
template<typename... Rest>
constexpr Bytes Cat(Bytes first, const Rest&... rest) {
    (first.insert(first.end(), rest.begin(), rest.end()), ...);
    return first;
}

// ============================================================================
// Parse Helpers
// ============================================================================

/// Check that parsing succeeds
template<typename Obj, typename Container>
constexpr bool ParseSucceeds(Obj& obj, const Container& bytes) {
    return static_cast<bool>(Rencode::Parse(obj, bytes));
}

/// Check that parsing fails (any error)
template<typename Obj, typename Container>
constexpr bool ParseFails(Obj& obj, const Container& bytes) {
    return !Rencode::Parse(obj, bytes);
}

/// Check that parsing fails with specific error code, either a ParseError
/// or a ReaderError reported by the decoder
template<typename Obj, class ErrorT, typename Container>
constexpr bool ParseFailsWith(Obj& obj, const Container& bytes, ErrorT expected_error) {
    auto result = Rencode::Parse(obj, bytes);
    if constexpr(std::is_same_v<ErrorT, Rencode::ParseError>) {
        return !result && result.error() == expected_error;
    } else {
        return !result
            && result.error() == Rencode::ParseError::READER_ERROR
            && result.readerError() == expected_error;
    }
}

/// Same, with explicit decoder limits
template<typename Obj, class ErrorT, typename Container>
constexpr bool ParseFailsWith(Obj& obj, const Container& bytes, ErrorT expected_error, Rencode::ReaderLimits limits) {
    auto result = Rencode::Parse(obj, bytes, limits);
    if constexpr(std::is_same_v<ErrorT, Rencode::ParseError>) {
        return !result && result.error() == expected_error;
    } else {
        return !result
            && result.error() == Rencode::ParseError::READER_ERROR
            && result.readerError() == expected_error;
    }
}

/// Check that parsing fails with specific error after `offset` consumed bytes
template<typename Obj, class ErrorT>
constexpr bool ParseFailsAt(Obj& obj, const Bytes& bytes, ErrorT expected_error, std::size_t offset) {
    auto result = Rencode::Parse(obj, bytes);
    if (result) return false;
    if constexpr(std::is_same_v<Rencode::ParseError, ErrorT>) {
        if (result.error() != expected_error) return false;
    } else {
        if (result.readerError() != expected_error) return false;
    }
    return result.offset() == offset;
}

// ============================================================================
// Serialize Helpers
// ============================================================================

/// Encoded form of `obj`, empty when serialization fails
template<typename Obj>
constexpr Bytes Encode(const Obj& obj) {
    Bytes out;
    if (!Rencode::Serialize(obj, out)) {
        return Bytes{};
    }
    return out;
}

/// One-line serialize test: TestSerialize(obj, B({...}))
template<typename Obj>
constexpr bool TestSerialize(const Obj& obj, const Bytes& expected) {
    Bytes out;
    if (!Rencode::Serialize(obj, out)) {
        return false;
    }
    return out == expected;
}

/// Serialization fails with the given writer error
template<typename Obj>
constexpr bool TestSerializeError(const Obj& obj, Rencode::WriterError expected) {
    Bytes out;
    auto result = Rencode::Serialize(obj, out);
    return !result
        && result.error() == Rencode::SerializeError::WRITER_ERROR
        && result.writerError() == expected;
}

// ============================================================================
// String Comparison Helpers
// ============================================================================

/// Compare char array with string literal, up to the NUL terminator
template<std::size_t N>
constexpr bool CStrEqual(const std::array<char, N>& arr, const char* str) {
    std::size_t i = 0;
    while (i < N && str[i] != '\0') {
        if (arr[i] != str[i]) return false;
        ++i;
    }
    return i < N && arr[i] == '\0' && str[i] == '\0';
}

template<std::size_t N>
constexpr bool CStrEqual(const char (&arr)[N], const char* str) {
    std::size_t i = 0;
    while (i < N && str[i] != '\0') {
        if (arr[i] != str[i]) return false;
        ++i;
    }
    return i < N && arr[i] == '\0' && str[i] == '\0';
}

// ============================================================================
// Struct Comparison Helpers (Using PFR)
// ============================================================================

template<typename U>
constexpr bool is_annotated_v = Rencode::is_annotated<std::remove_cvref_t<U>>::value;

template<typename U>
constexpr bool is_char_buffer_v = Rencode::static_schema::static_string_traits<std::remove_cvref_t<U>>::is_static;

/// Compare two values field-by-field (constexpr-safe)
/// Handles nested structs, containers, optionals, unique_ptr and Annotated
template<typename U>
constexpr bool DeepEqual(const U& a, const U& b) {
    if constexpr (is_annotated_v<U>) {
        return DeepEqual(a.get(), b.get());
    }
    else if constexpr (std::is_arithmetic_v<U> || std::is_enum_v<U>) {
        return a == b;
    }
    // Character buffers hold a NUL-terminated string
    else if constexpr (is_char_buffer_v<U>) {
        const std::size_t n = std::size(a);
        for (std::size_t i = 0; i < n; ++i) {
            if (a[i] != b[i]) return false;
            if (a[i] == '\0') return true;
        }
        return true;
    }
    else if constexpr (std::is_same_v<U, std::string> || std::is_same_v<U, Rencode::Value>) {
        return a == b;
    }
    else if constexpr (requires { a.has_value(); a.value(); }) {
        if (a.has_value() != b.has_value()) return false;
        if (!a.has_value()) return true;
        return DeepEqual(a.value(), b.value());
    }
    else if constexpr (requires { a.get(); a.operator bool(); }) {
        bool a_null = (a.get() == nullptr);
        bool b_null = (b.get() == nullptr);
        if (a_null != b_null) return false;
        if (a_null) return true;
        return DeepEqual(*a, *b);
    }
    else if constexpr (std::is_array_v<U>) {
        for (std::size_t i = 0; i < std::extent_v<U>; ++i) {
            if (!DeepEqual(a[i], b[i])) return false;
        }
        return true;
    }
    else if constexpr (requires { a.begin(); a.end(); a.size(); }) {
        if (a.size() != b.size()) return false;
        auto it_a = a.begin();
        auto it_b = b.begin();
        while (it_a != a.end()) {
            if (!DeepEqual(*it_a, *it_b)) return false;
            ++it_a;
            ++it_b;
        }
        return true;
    }
    else if constexpr (requires { a.first; a.second; }) {
        return DeepEqual(a.first, b.first) && DeepEqual(a.second, b.second);
    }
    else if constexpr (pfr::is_implicitly_reflectable_v<U, U>) {
        constexpr std::size_t fields_count = pfr::tuple_size_v<U>;
        return [&]<std::size_t... I>(std::index_sequence<I...>) {
            return (true && ... && DeepEqual(pfr::get<I>(a), pfr::get<I>(b)));
        }(std::make_index_sequence<fields_count>{});
    }
    else {
        return a == b;
    }
}

/// Parse and compare result with expected object
template<typename Obj>
constexpr bool ParseAndCompare(Obj& obj, const Bytes& bytes, const Obj& expected) {
    if (!Rencode::Parse(obj, bytes)) {
        return false;
    }
    return DeepEqual(obj, expected);
}

/// Parse and verify using custom comparison lambda
template<typename Obj, typename Comparator>
constexpr bool ParseAndVerify(Obj& obj, const Bytes& bytes, Comparator&& cmp) {
    if (!Rencode::Parse(obj, bytes)) {
        return false;
    }
    return cmp(obj);
}

// ============================================================================
// Ultra-Minimal Test Helpers
// ============================================================================

/// One-line parse test: TestParse(B({...}), expected)
template<typename Obj>
constexpr bool TestParse(const Bytes& bytes, const Obj& expected) {
    Obj obj{};
    return ParseAndCompare(obj, bytes, expected);
}

/// One-line parse test with custom verification: TestParse<Type>(B({...}), lambda)
template<typename Obj, typename Verifier>
    requires std::is_invocable_r_v<bool, Verifier, const Obj&>
constexpr bool TestParse(const Bytes& bytes, Verifier&& verify) {
    Obj obj{};
    return ParseAndVerify(obj, bytes, std::forward<Verifier>(verify));
}

/// One-line error test: TestParseError<Type>(B({...}), error_code)
template<typename Obj, class ErrorClass>
constexpr bool TestParseError(const Bytes& bytes, ErrorClass expected_error) {
    Obj obj{};
    return ParseFailsWith(obj, bytes, expected_error);
}

/// Encode, decode into a fresh object, compare
template<typename Obj>
constexpr bool TestRoundTrip(const Obj& original) {
    Bytes encoded;
    if (!Rencode::Serialize(original, encoded)) {
        return false;
    }
    Obj decoded{};
    if (!Rencode::Parse(decoded, encoded)) {
        return false;
    }
    return DeepEqual(original, decoded);
}

/// Encode, decode, encode again: both encodings must be identical
template<typename Obj>
constexpr bool TestReencodeStable(const Obj& original) {
    Bytes first;
    if (!Rencode::Serialize(original, first)) {
        return false;
    }
    Obj decoded{};
    if (!Rencode::Parse(decoded, first)) {
        return false;
    }
    Bytes second;
    if (!Rencode::Serialize(decoded, second)) {
        return false;
    }
    return first == second;
}

// ============================================================================
// Error Path Helpers
// ============================================================================

/// Test parsing fails and verify entire path chain
/// Usage: TestParseErrorWithPath<T>(bytes, error, "field1", 3, "field2")
/// describes $.field1[3].field2
template<typename Obj, class ErrorT, typename... PathComponents>
constexpr bool TestParseErrorWithPath(
    const Bytes& bytes,
    ErrorT expected_error,
    PathComponents... expected_path)
{
    Obj obj{};
    auto result = Rencode::Parse(obj, bytes);
    if constexpr(std::is_same_v<Rencode::ParseError, ErrorT>) {
        if (result || result.error() != expected_error) {
            return false;
        }
    } else {
        if (result || result.readerError() != expected_error) {
            return false;
        }
    }
    if constexpr (sizeof...(PathComponents) == 0) {
        return result.errorPath().size() == 0;
    } else {
        return result.errorPath() == Rencode::path::Path(expected_path...);
    }
}

} // namespace TestHelpers
