#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>

namespace Rencode {

namespace writer {

/// WriterLike is the encoder side of the visitation contract. Container
/// sizes are passed up front; SIZE_MAX means "unknown ahead of time".
/// advance_after_value() is called once after every element (array) or
/// every value (map), the last one included.
template<typename R>
concept WriterLike = requires(R writer,
                               R& mutable_writer,
                               const bool& bool_ref,
                               const std::int64_t& i64_ref,
                               const std::uint64_t& u64_ref,
                               const float& float_ref,
                               const double& double_ref,
                               const char* char_ptr,
                               std::size_t size,
                               const std::size_t & sizeRef,
                               typename R::ArrayFrame & arrFrameRef,
                               typename R::MapFrame & mapFrameRef
                              ) {

    // ========== Type Requirements ==========
    typename R::iterator_type;
    typename R::ArrayFrame;
    typename R::MapFrame;
    typename R::error_type;

    // ========== Position and error state ==========
    { writer.current() } -> std::same_as<typename R::iterator_type &>;
    { writer.bytesWritten() } -> std::same_as<std::size_t>;
    { writer.getError() } -> std::same_as<typename R::error_type>;

    { mutable_writer.write_array_begin(sizeRef, arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_map_begin(sizeRef, mapFrameRef) } -> std::same_as<bool>;

    // Containers
    { mutable_writer.advance_after_value(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.advance_after_value(mapFrameRef) } -> std::same_as<bool>;
    { mutable_writer.move_to_value(mapFrameRef) } -> std::same_as<bool>;

    { mutable_writer.write_array_end(arrFrameRef) } -> std::same_as<bool>;
    { mutable_writer.write_map_end(mapFrameRef) } -> std::same_as<bool>;

    // ========== Primitive values ==========
    { mutable_writer.write_null() } -> std::same_as<bool>;
    { mutable_writer.write_bool(bool_ref) } -> std::same_as<bool>;

    { mutable_writer.template write_number<std::int64_t>(i64_ref) } -> std::same_as<bool>;
    { mutable_writer.template write_number<std::uint64_t>(u64_ref) } -> std::same_as<bool>;
    { mutable_writer.template write_number<float>(float_ref) } -> std::same_as<bool>;
    { mutable_writer.template write_number<double>(double_ref) } -> std::same_as<bool>;

    { mutable_writer.write_string(char_ptr, size, false) } -> std::same_as<bool>;

    // ========== Utility Operations ==========
    { mutable_writer.finish() } -> std::same_as<bool>;
};

template<typename R>
constexpr bool is_writer_like_v = WriterLike<R>;


} // namespace writer

} // namespace Rencode
