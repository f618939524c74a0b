#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "options.hpp"
#include "struct_introspection.hpp"

namespace Rencode {

class Value;

enum class stream_read_result : std::uint8_t {
    value,  // one value produced; keep going
    end,    // normal end-of-stream
    error   // unrecoverable error; abort
};

enum class stream_write_result : std::uint8_t {
    slot_allocated,   // storage ready for the next element
    overflow,         // fixed capacity exhausted, or duplicate map key
    error,            // consumer rejected the data; abort
    value_processed,
};

namespace static_schema {

// Element count passed to writers when it is not known ahead of time
constexpr std::size_t UNKNOWN_SIZE = std::numeric_limits<std::size_t>::max();

namespace input_checks {

template<class T>
struct is_directly_forbidden {
    using D = std::remove_cvref_t<T>;
    static constexpr bool value =
        std::is_void_v<D> ||
        std::is_pointer_v<D> ||
        std::is_member_pointer_v<D> ||
        std::is_null_pointer_v<D> ||
        std::is_function_v<D> ||
        std::is_reference_v<T>;
};

template<class T>
constexpr bool is_directly_forbidden_v = is_directly_forbidden<T>::value;

} // namespace input_checks

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

using options::detail::annotation_meta_getter;

template<class Field>
using AnnotatedValue = typename annotation_meta_getter<Field>::value_t;


/* ######## Sequence cursors ######## */

template<class C>
struct array_read_cursor{};

template<class C>
concept ArrayReadable = requires(C& c) {
    typename array_read_cursor<C>::element_type;
    { array_read_cursor<C>{c}.read_more() } -> std::same_as<stream_read_result>;
    { array_read_cursor<C>{c}.get() } -> std::same_as<const typename array_read_cursor<C>::element_type&>;
    { array_read_cursor<C>{c}.size() } -> std::same_as<std::size_t>;
    array_read_cursor<C>{c}.reset();
};

// Any range that is not map-like
template<class C>
    requires std::ranges::range<const C> && (!requires { typename C::mapped_type; })
struct array_read_cursor<C> {
    using element_type = std::ranges::range_value_t<C>;
    const C& c;
    std::ranges::iterator_t<const C> it = std::ranges::begin(c);
    bool first = true;

    constexpr const element_type& get() const {
        return *it;
    }
    constexpr stream_read_result read_more() {
        if(first) {
            first = false;
        } else {
            ++it;
        }
        if(it != std::ranges::end(c)) return stream_read_result::value;
        else return stream_read_result::end;
    }
    constexpr std::size_t size() const {
        if constexpr (std::ranges::sized_range<const C>) {
            return static_cast<std::size_t>(std::ranges::size(c));
        } else if constexpr (std::ranges::forward_range<const C>) {
            return static_cast<std::size_t>(std::ranges::distance(c));
        } else {
            return UNKNOWN_SIZE;
        }
    }
    constexpr void reset() {
        it = std::ranges::begin(c);
        first = true;
    }
};

template<class T, std::size_t N>
struct array_read_cursor<std::array<T, N>> {
    using element_type = T;
    const std::array<T, N>& c;
    std::size_t index = 0;
    bool first = true;

    constexpr const element_type& get() const {
        return c[index];
    }
    constexpr stream_read_result read_more() {
        if(first) {
            first = false;
        } else {
            index ++;
        }
        if(index < N) return stream_read_result::value;
        else return stream_read_result::end;
    }
    constexpr std::size_t size() const {
        return N;
    }
    constexpr void reset() {
        index = 0;
        first = true;
    }
};

template<class T, std::size_t N>
struct array_read_cursor<T[N]> {
    using element_type = T;
    const T(&c)[N];
    std::size_t index = 0;
    bool first = true;

    constexpr const element_type& get() const {
        return c[index];
    }
    constexpr stream_read_result read_more() {
        if(first) {
            first = false;
        } else {
            index ++;
        }
        if(index < N) return stream_read_result::value;
        else return stream_read_result::end;
    }
    constexpr std::size_t size() const {
        return N;
    }
    constexpr void reset() {
        index = 0;
        first = true;
    }
};

template<class C>
struct array_write_cursor;

template<class C>
concept ArrayWritable = requires(C& c) {
    typename array_write_cursor<C>::element_type;
    { array_write_cursor<C>{c}.allocate_slot() } -> std::same_as<stream_write_result>;
    { array_write_cursor<C>{c}.get_slot() } -> std::same_as<typename array_write_cursor<C>::element_type&>;
    { array_write_cursor<C>{c}.finalize(std::declval<bool>()) } -> std::same_as<stream_write_result>;
    { array_write_cursor<C>{c}.finalize_item(std::declval<bool>()) } -> std::same_as<stream_write_result>;
    array_write_cursor<C>{c}.reset();
};

// Growable containers: std::vector, std::list, std::deque
template<class C>
    requires requires(C& c) {
        { c.emplace_back() } -> std::same_as<typename C::value_type & >;
        c.clear();
    }
struct array_write_cursor<C> {
    using element_type = typename C::value_type;
    C& c;

    constexpr stream_write_result allocate_slot() {
        return stream_write_result::slot_allocated;
    }
    constexpr element_type & get_slot() {
        return c.emplace_back();
    }
    constexpr stream_write_result finalize(bool) {
        return stream_write_result::value_processed;
    }
    constexpr stream_write_result finalize_item(bool) {
        return stream_write_result::value_processed;
    }
    constexpr void reset(){
        c.clear();
    }
};

template<class T, std::size_t N>
struct array_write_cursor<std::array<T, N>> {
    using element_type = T;
    std::array<T, N>& c;
    std::size_t index = 0;
    bool first = true;

    constexpr stream_write_result allocate_slot() {
        if(first) {
            index = 0;
            first = false;
        } else {
            index ++;
        }
        return index < N ? stream_write_result::slot_allocated : stream_write_result::overflow;
    }
    constexpr element_type & get_slot() {
        return c[index];
    }
    constexpr stream_write_result finalize(bool) {
        return stream_write_result::value_processed;
    }
    constexpr stream_write_result finalize_item(bool) {
        return stream_write_result::value_processed;
    }
    constexpr void reset(){
        index = 0;
        first = true;
    }
};

template<class T, std::size_t N>
struct array_write_cursor<T[N]> {
    using element_type = T;
    T (&c)[N];
    std::size_t index = 0;
    bool first = true;

    constexpr stream_write_result allocate_slot() {
        if(first) {
            index = 0;
            first = false;
        } else {
            index ++;
        }
        return index < N ? stream_write_result::slot_allocated : stream_write_result::overflow;
    }
    constexpr element_type & get_slot() {
        return c[index];
    }
    constexpr stream_write_result finalize(bool) {
        return stream_write_result::value_processed;
    }
    constexpr stream_write_result finalize_item(bool) {
        return stream_write_result::value_processed;
    }
    constexpr void reset(){
        index = 0;
        first = true;
    }
};


/* ######## Map cursors ######## */

template<class C>
struct map_write_cursor;

template<class C>
concept MapWritable = requires(C& c) {
    typename map_write_cursor<C>::key_type;
    typename map_write_cursor<C>::mapped_type;
    { map_write_cursor<C>{c}.allocate_key() } -> std::same_as<stream_write_result>;
    { map_write_cursor<C>{c}.key_ref() } -> std::same_as<typename map_write_cursor<C>::key_type&>;
    { map_write_cursor<C>{c}.allocate_value_for_parsed_key() } -> std::same_as<stream_write_result>;
    { map_write_cursor<C>{c}.value_ref() } -> std::same_as<typename map_write_cursor<C>::mapped_type&>;
    { map_write_cursor<C>{c}.finalize_pair(std::declval<bool>()) } -> std::same_as<stream_write_result>;
    { map_write_cursor<C>{c}.finalize(std::declval<bool>()) } -> std::same_as<stream_write_result>;
    map_write_cursor<C>{c}.reset();
};

template<class C>
struct map_read_cursor;

template<class C>
concept MapReadable = requires(C& c) {
    typename map_read_cursor<C>::key_type;
    typename map_read_cursor<C>::mapped_type;
    { map_read_cursor<C>{c}.read_more() } -> std::same_as<stream_read_result>;
    { map_read_cursor<C>{c}.get_key() } -> std::same_as<const typename map_read_cursor<C>::key_type&>;
    { map_read_cursor<C>{c}.get_value() } -> std::same_as<const typename map_read_cursor<C>::mapped_type&>;
    { map_read_cursor<C>{c}.size() } -> std::same_as<std::size_t>;
    map_read_cursor<C>{c}.reset();
};

// Map-like containers with try_emplace: std::map, std::unordered_map
template<class M>
    requires requires(M& m) {
        typename M::key_type;
        typename M::mapped_type;
        { m.try_emplace(std::declval<typename M::key_type>(), std::declval<typename M::mapped_type>()) };
        m.clear();
    }
struct map_write_cursor<M> {
    using key_type = typename M::key_type;
    using mapped_type = typename M::mapped_type;

    M& m;
    key_type current_key{};
    mapped_type current_value{};

    constexpr stream_write_result allocate_key() {
        current_key = key_type{};
        return stream_write_result::slot_allocated;
    }
    constexpr key_type& key_ref() {
        return current_key;
    }
    constexpr stream_write_result allocate_value_for_parsed_key() {
        current_value = mapped_type{};
        return stream_write_result::slot_allocated;
    }
    constexpr mapped_type& value_ref() {
        return current_value;
    }
    constexpr stream_write_result finalize_pair(bool ok) {
        if (!ok) return stream_write_result::error;

        auto [it, inserted] = m.try_emplace(std::move(current_key), std::move(current_value));
        return inserted ? stream_write_result::value_processed
                        : stream_write_result::overflow;  // duplicate key
    }
    constexpr stream_write_result finalize(bool) {
        return stream_write_result::value_processed;
    }
    constexpr void reset() {
        m.clear();
    }
};

template<class M>
    requires requires(const M& m) {
        typename M::key_type;
        typename M::mapped_type;
        { m.begin() } -> std::same_as<typename M::const_iterator>;
        { m.end() } -> std::same_as<typename M::const_iterator>;
        { m.size() } -> std::convertible_to<std::size_t>;
    }
struct map_read_cursor<M> {
    using key_type = typename M::key_type;
    using mapped_type = typename M::mapped_type;

    const M& m;
    typename M::const_iterator it = m.begin();
    bool first = true;

    constexpr stream_read_result read_more() {
        if (first) {
            first = false;
        } else {
            ++it;
        }
        return (it != m.end()) ? stream_read_result::value
                               : stream_read_result::end;
    }
    constexpr const key_type& get_key() const {
        return it->first;
    }
    constexpr const mapped_type& get_value() const {
        return it->second;
    }
    constexpr std::size_t size() const {
        return static_cast<std::size_t>(m.size());
    }
    constexpr void reset() {
        it = m.begin();
        first = true;
    }
};


/* ######## Generic value ######## */
template<class C>
concept GenericValue = std::same_as<AnnotatedValue<C>, Value>;

/* ######## Bool type detection ######## */
template<class C>
concept BoolValue = std::same_as<AnnotatedValue<C>, bool>;

/* ######## Number type detection ######## */
template<class C>
concept NumberValue =
    !BoolValue<C> &&
    (std::is_integral_v<AnnotatedValue<C>> || std::is_floating_point_v<AnnotatedValue<C>>);

/* ######## String type detection ######## */
template<class C>
concept StringValue =
    std::same_as<AnnotatedValue<C>, std::string>      ||
    std::same_as<AnnotatedValue<C>, std::string_view> ||
    (std::ranges::contiguous_range<AnnotatedValue<C>> &&
     std::same_as<std::ranges::range_value_t<AnnotatedValue<C>>, char>);

// Fixed-capacity character buffers hold a NUL-terminated string
template<class T>
struct static_string_traits {
    static constexpr bool is_static = false;
};

template<std::size_t N>
struct static_string_traits<std::array<char, N>> {
    static constexpr bool is_static = true;

    static constexpr char* data(std::array<char, N>& s) { return s.data(); }
    static constexpr const char* data(const std::array<char, N>& s) { return s.data(); }
    static constexpr std::size_t max_size(const std::array<char, N>&) { return N ? N - 1 : 0; }
};

template<std::size_t N>
struct static_string_traits<char[N]> {
    static constexpr bool is_static = true;

    static constexpr char* data(char (&s)[N]) { return s; }
    static constexpr const char* data(const char (&s)[N]) { return s; }
    static constexpr std::size_t max_size(const char (&)[N]) { return N ? N - 1 : 0; }
};

// Strings that can receive decoded bytes
template<class C>
concept ParsableString = StringValue<C> &&
    (static_string_traits<AnnotatedValue<C>>::is_static ||
     requires(AnnotatedValue<C>& s) { s.push_back(char{}); s.clear(); });

template<class K>
concept MapKey = StringValue<K> || (std::is_integral_v<K> && !std::same_as<K, bool>);

/* ######## Object type detection ######## */

template<typename T>
struct is_object {
    static constexpr bool value = [] {
        using U = AnnotatedValue<T>;
        if constexpr (GenericValue<T> || BoolValue<T> || StringValue<T> || NumberValue<T>) {
            return false;
        } else if constexpr (std::ranges::range<U>) {
            return false;
        } else if constexpr (ArrayReadable<U> || ArrayWritable<U>) {
            return false;
        } else if constexpr (MapReadable<U> || MapWritable<U>) {
            return false;
        } else if constexpr (!std::is_class_v<U>) {
            return false;
        } else if constexpr (!std::is_aggregate_v<U>) {
            return false;
        } else {
            return true;
        }
    }();
};

template<class C>
concept ObjectValue = is_object<C>::value;


/* ######## Serializable shapes ######## */

template<class T> struct is_serializable_value;

template<class T>
struct is_serializable_array {
    static constexpr bool value = []{
        using U = AnnotatedValue<T>;
        if constexpr (GenericValue<T> || StringValue<T> || BoolValue<T> || NumberValue<T>) {
            return false;
        } else if constexpr (ArrayReadable<U>) {
            return is_serializable_value<typename array_read_cursor<U>::element_type>::value;
        } else {
            return false;
        }
    }();
};

template<class C>
concept SerializableArray = is_serializable_array<C>::value;

template<typename T>
struct is_serializable_map {
    static constexpr bool value = [] {
        using U = AnnotatedValue<T>;
        if constexpr (GenericValue<T> || BoolValue<T> || StringValue<T> || NumberValue<T>) {
            return false;
        } else if constexpr (is_object<T>::value || is_serializable_array<T>::value) {
            return false;
        } else if constexpr (MapReadable<U>) {
            using Cursor = map_read_cursor<U>;
            return MapKey<typename Cursor::key_type> &&
                   is_serializable_value<typename Cursor::mapped_type>::value;
        } else {
            return false;
        }
    }();
};

template<class C>
concept SerializableMap = is_serializable_map<C>::value;

template<class T>
struct is_non_null_serializable_value {
    static constexpr bool value =
        GenericValue<T> || BoolValue<T> || NumberValue<T> || StringValue<T> ||
        is_object<T>::value || is_serializable_array<T>::value || is_serializable_map<T>::value;
};

template<class Field>
struct is_nullable_serializable_value {
    using AV = AnnotatedValue<Field>;
    static constexpr bool value = []{
        if constexpr (is_specialization_of<AV, std::optional>::value) {
            return is_non_null_serializable_value<typename AV::value_type>::value;
        } else if constexpr (is_specialization_of<AV, std::unique_ptr>::value) {
            return is_non_null_serializable_value<typename AV::element_type>::value;
        } else {
            return false;
        }
    }();
};

template<class Field>
concept NullableSerializableValue = is_nullable_serializable_value<Field>::value;

template<class Field>
concept NonNullableSerializableValue = is_non_null_serializable_value<Field>::value;

template<class T>
struct is_serializable_value {
    static constexpr bool value = is_non_null_serializable_value<T>::value
                                  || is_nullable_serializable_value<T>::value;
};

template<class C>
concept SerializableValue = !input_checks::is_directly_forbidden_v<C> && is_serializable_value<C>::value;


/* ######## Parsable shapes ######## */

template<class T> struct is_parsable_value;

template<class T>
struct is_parsable_array {
    static constexpr bool value = []{
        using U = AnnotatedValue<T>;
        if constexpr (GenericValue<T> || StringValue<T> || BoolValue<T> || NumberValue<T>) {
            return false;
        } else if constexpr (ArrayWritable<U>) {
            return is_parsable_value<typename array_write_cursor<U>::element_type>::value;
        } else {
            return false;
        }
    }();
};

template<class C>
concept ParsableArray = is_parsable_array<C>::value;

template<typename T>
struct is_parsable_map {
    static constexpr bool value = [] {
        using U = AnnotatedValue<T>;
        if constexpr (GenericValue<T> || BoolValue<T> || StringValue<T> || NumberValue<T>) {
            return false;
        } else if constexpr (is_object<T>::value || is_parsable_array<T>::value) {
            return false;
        } else if constexpr (MapWritable<U>) {
            using Cursor = map_write_cursor<U>;
            return (ParsableString<typename Cursor::key_type> ||
                    (MapKey<typename Cursor::key_type> && !StringValue<typename Cursor::key_type>)) &&
                   is_parsable_value<typename Cursor::mapped_type>::value;
        } else {
            return false;
        }
    }();
};

template<class C>
concept ParsableMap = is_parsable_map<C>::value;

template<class T>
struct is_non_null_parsable_value {
    static constexpr bool value =
        GenericValue<T> || BoolValue<T> || NumberValue<T> || ParsableString<T> ||
        is_object<T>::value || is_parsable_array<T>::value || is_parsable_map<T>::value;
};

template<class Field>
struct is_nullable_parsable_value {
    using AV = AnnotatedValue<Field>;
    static constexpr bool value = []{
        if constexpr (is_specialization_of<AV, std::optional>::value) {
            return is_non_null_parsable_value<typename AV::value_type>::value;
        } else if constexpr (is_specialization_of<AV, std::unique_ptr>::value) {
            return is_non_null_parsable_value<typename AV::element_type>::value;
        } else {
            return false;
        }
    }();
};

template<class Field>
concept NullableParsableValue = is_nullable_parsable_value<Field>::value;

template<class Field>
concept NonNullableParsableValue = is_non_null_parsable_value<Field>::value;

template<class T>
struct is_parsable_value {
    static constexpr bool value = is_non_null_parsable_value<T>::value
                                  || is_nullable_parsable_value<T>::value;
};

template<class C>
concept ParsableValue = !input_checks::is_directly_forbidden_v<C> && is_parsable_value<C>::value;


/* ######## Generic data access ######## */

template <NullableParsableValue Field>
constexpr void setNull(Field &f) {
    annotation_meta_getter<Field>::getRef(f).reset(); // same for std::optional and std::unique_ptr
}

template <NullableSerializableValue Field>
constexpr bool isNull(const Field &f) {
    using AV = AnnotatedValue<Field>;
    if constexpr (is_specialization_of<AV, std::optional>::value) {
        return !annotation_meta_getter<Field>::getRef(f).has_value();
    } else {
        return annotation_meta_getter<Field>::getRef(f) == nullptr;
    }
}

// Engages an empty nullable so the parser can fill it in place
template<NullableParsableValue Field>
constexpr decltype(auto) getRef(Field & f) {
    using S = annotation_meta_getter<Field>;
    auto& holder = S::getRef(f);
    if constexpr (is_specialization_of<typename S::value_t, std::optional>::value) {
        if(!holder)
            return (holder.emplace());
        else
            return (*holder);
    } else {
        if(holder == nullptr)
            holder = std::make_unique<typename S::value_t::element_type>();
        return (*holder);
    }
}

// Only after isNull() returned false
template<NullableSerializableValue Field>
constexpr decltype(auto) getRef(const Field & f) {
    using S = annotation_meta_getter<Field>;
    return (*S::getRef(f));
}

template<NonNullableParsableValue Field>
constexpr decltype(auto) getRef(Field & f) {
    using S = annotation_meta_getter<Field>;
    return (S::getRef(f));
}

template<NonNullableSerializableValue Field>
constexpr decltype(auto) getRef(const Field & f) {
    using S = annotation_meta_getter<Field>;
    return (S::getRef(f));
}

} // namespace static_schema


/* ######## Streamers ######## */

// Receives list elements one at a time instead of storing the whole list
template<class S>
concept ConsumingStreamerLike =
        static_schema::ParsableValue<typename S::value_type>
        && requires(S& s, const typename S::value_type& v) {
            { s.consume(v) } -> std::same_as<bool>;
            { s.finalize(std::declval<bool>()) } -> std::same_as<bool>;
            { s.reset() } -> std::same_as<void>;
        };

// Produces list elements one at a time: `read` fills its argument and
// returns value, or returns end/error. Serialization only sees the
// streamer as const, so `read` and `reset` are const members.
template<class S>
concept ProducingStreamerLike =
        static_schema::SerializableValue<typename S::value_type>
        && requires(const S& s, typename S::value_type& v) {
           { s.read(v) } -> std::same_as<stream_read_result>;
           requires (!requires {
               s.read(std::move(v));
           });
           { s.reset() } -> std::same_as<void>;
        };

namespace static_schema {

// Producing streamers are encoded as open lists: their length is unknown
template<ProducingStreamerLike Streamer>
struct array_read_cursor<Streamer> {
    using element_type = typename Streamer::value_type;
    const Streamer & streamer;
    element_type buffer{};

    constexpr const element_type& get() const {
        return buffer;
    }
    constexpr stream_read_result read_more() {
        return streamer.read(buffer);
    }
    constexpr std::size_t size() const {
        return UNKNOWN_SIZE;
    }
    constexpr void reset() {
        streamer.reset();
    }
};

template<ConsumingStreamerLike Streamer>
struct array_write_cursor<Streamer> {
    using element_type = typename Streamer::value_type;
    Streamer & streamer;
    element_type buffer{};

    constexpr stream_write_result allocate_slot() {
        buffer = element_type{};
        return stream_write_result::slot_allocated;
    }
    constexpr element_type& get_slot() {
        return buffer;
    }
    constexpr stream_write_result finalize(bool res) {
        return streamer.finalize(res) ? stream_write_result::value_processed
                                      : stream_write_result::error;
    }
    constexpr stream_write_result finalize_item(bool ok) {
        if (!ok) return stream_write_result::error;
        return streamer.consume(buffer) ? stream_write_result::value_processed
                                        : stream_write_result::error;
    }
    constexpr void reset(){
        streamer.reset();
    }
};

} // namespace static_schema

} // namespace Rencode
