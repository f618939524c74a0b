#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>

namespace Rencode {

namespace reader {
enum class TryParseStatus {
    no_match,   // not our case, input unchanged
    ok,         // parsed and consumed
    error       // malformed, reader already has error
};

enum class StringChunkStatus {
    ok,       // wrote some bytes (maybe zero), no error
    no_match, // not at a string and not already inside one
    error     // decode error set in reader
};

struct StringChunkResult {
    StringChunkStatus status;
    std::size_t       bytes_written; // how many bytes we put into `out`
    bool              done;          // true if the last payload byte was consumed
};

struct IterationStatus {
    TryParseStatus status = TryParseStatus::error;
    bool has_value = false;
};

// Shape of the next value, as told by its leading byte
enum class ValueKind {
    none,
    boolean,
    integer,
    floating,
    string,
    array,
    map,
    error       // input exhausted, terminator or reserved code; reader has error
};


/// ReaderLike is the decoder side of the visitation contract: the parser
/// pulls primitives and container cursors from it to build a typed target.
template<typename R>
concept ReaderLike = requires(R reader,
                               R& mutable_reader,
                               bool& bool_ref,
                               std::int8_t& i8_ref,
                               std::int64_t& i64_ref,
                               std::uint64_t& u64_ref,
                               float& float_ref,
                               double& double_ref,
                               char* char_ptr,
                               std::size_t size,
                               typename R::ArrayFrame & arrFrameRef,
                               typename R::MapFrame & mapFrameRef
                              ) {

    // ========== Type Requirements ==========
    typename R::iterator_type;
    typename R::ArrayFrame;
    typename R::MapFrame;
    typename R::error_type;

    // ========== Position and error state ==========
    { reader.current() } -> std::same_as<typename R::iterator_type>;
    { reader.offset() } -> std::same_as<std::size_t>;
    { reader.getError() } -> std::same_as<typename R::error_type>;

    { mutable_reader.read_array_begin(arrFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.read_map_begin(mapFrameRef) } -> std::same_as<IterationStatus>;

    // Containers
    { mutable_reader.advance_after_value(arrFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.advance_after_value(mapFrameRef) } -> std::same_as<IterationStatus>;
    { mutable_reader.move_to_value(mapFrameRef) } -> std::same_as<bool>;

    // ========== Primitive values ==========
    { mutable_reader.start_value_and_try_read_null() } -> std::same_as<TryParseStatus>;
    { mutable_reader.read_bool(bool_ref) } -> std::same_as<TryParseStatus>;

    { mutable_reader.template read_number<std::int8_t>(i8_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.template read_number<std::int64_t>(i64_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.template read_number<std::uint64_t>(u64_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.template read_number<float>(float_ref) } -> std::same_as<TryParseStatus>;
    { mutable_reader.template read_number<double>(double_ref) } -> std::same_as<TryParseStatus>;

    // String parsing (chunked, for streaming)
    { mutable_reader.read_string_chunk(char_ptr, size) } -> std::same_as<StringChunkResult>;

    // ========== Utility Operations ==========
    { mutable_reader.peek_kind() } -> std::same_as<ValueKind>;

    // Ensure the whole input was consumed
    { mutable_reader.finish() } -> std::same_as<bool>;

    // Skip an entire value, nested containers included
    { mutable_reader.template skip_value<2>() } -> std::same_as<bool>;
};

template<typename R>
constexpr bool is_reader_like_v = ReaderLike<R>;


} // namespace reader

} // namespace Rencode
