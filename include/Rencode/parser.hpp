#pragma once

#include <array>
#include <bitset>
#include <cstdint>
#include <limits>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "static_schema.hpp"
#include "options.hpp"
#include "io.hpp"
#include "value.hpp"

#include "struct_introspection.hpp"
#include "path.hpp"
#include "rencode.hpp"
#include "errors.hpp"
#include "parse_result.hpp"
#include "struct_fields_helper.hpp"

namespace Rencode {

namespace  parser_details {


template <class InpIter, class ReaderError>
class DeserializationContext {
    ReaderError reader_error = {};
    ParseError error = ParseError::NO_ERROR;
    InpIter m_pos{};
    std::size_t m_offset = 0;

    path::Path currentPath;

public:
    // Pops the path element on scope exit, unless an error froze the path
    struct PathGuard {
        DeserializationContext & ctx;

        constexpr ~PathGuard() {
            if(ctx.error == ParseError::NO_ERROR)
                ctx.currentPath.pop();
        }
    };

    constexpr bool withParseError(ParseError err, const reader::ReaderLike auto & reader) {
        error = err;
        if(err == ParseError::NO_ERROR) {
            error = ParseError::READER_ERROR;
        }
        reader_error = reader.getError();
        m_pos = reader.current();
        m_offset = reader.offset();
        return false;
    }

    constexpr bool withReaderError(const reader::ReaderLike auto & reader) {
        error = ParseError::READER_ERROR;
        reader_error = reader.getError();
        m_pos = reader.current();
        m_offset = reader.offset();
        return false;
    }

    constexpr void atEnd(const reader::ReaderLike auto & reader) {
        m_pos = reader.current();
        m_offset = reader.offset();
    }

    constexpr ParseError currentError() const {return error;}

    constexpr ParseResult<InpIter, ReaderError> result() const {
        return ParseResult<InpIter, ReaderError>(error, reader_error, m_pos, m_offset, currentPath);
    }

    constexpr PathGuard getArrayItemGuard(std::size_t index) {
        currentPath.push_index(index);
        return PathGuard{*this};
    }
    constexpr PathGuard getMapItemGuard(std::string_view key, bool is_static = true) {
        currentPath.push_field(key, is_static);
        return PathGuard{*this};
    }
    template<class Int>
    constexpr PathGuard getIntegerKeyGuard(Int key) {
        currentPath.push_integer_key(key);
        return PathGuard{*this};
    }
};


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::BoolValue<ObjT>
constexpr bool ParseNonNullValue(ObjT & obj, Tokenizer & reader, CTX &ctx) {
    if (reader::TryParseStatus st = reader.read_bool(obj); st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_BOOL_IN_BOOL_VALUE, reader);
    }
    return true;
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::NumberValue<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    if (reader::TryParseStatus st = reader.template read_number<ObjT>(obj);
                st == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else if (st == reader::TryParseStatus::no_match) {
        if constexpr (std::is_integral_v<ObjT>) {
            if(reader.peek_kind() == reader::ValueKind::floating) {
                return ctx.withParseError(ParseError::FLOAT_IN_INTEGER_STORAGE, reader);
            }
        }
        return ctx.withParseError(ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE, reader);
    }
    return true;
}


constexpr std::size_t STRING_CHUNK_SIZE = 64;

// Reads one whole string value into `out`, at most max_len bytes.
// `out` is either a char buffer (static storage) or a growable string.
// On overflow, read_rest_on_overflow consumes the rest of the payload so
// the reader stays in sync; the error is FIXED_SIZE_CONTAINER_OVERFLOW
// either way. A reader error leaves `err` as NO_ERROR.
template<class Reader, class Cont>
constexpr bool read_string_into(
    Reader&      reader,
    Cont&        out,
    std::size_t  max_len,
    ParseError&  err,
    std::size_t& outSize,
    bool         read_rest_on_overflow = false
    )
{
    constexpr bool dynamic = !std::is_pointer_v<Cont>;
    std::size_t total = 0;
    char buf[STRING_CHUNK_SIZE];

    for (;;) {
        const std::size_t remaining = max_len - total;
        const std::size_t ask = remaining < STRING_CHUNK_SIZE ? remaining : STRING_CHUNK_SIZE;

        // A zero-sized request still consumes the header, so an empty
        // string fits any storage.
        reader::StringChunkResult res;
        if constexpr (dynamic) {
            res = reader.read_string_chunk(buf, ask);
        } else {
            res = reader.read_string_chunk(out + total, ask);
        }

        switch (res.status) {
        case reader::StringChunkStatus::no_match:
            err = ParseError::NON_STRING_IN_STRING_STORAGE;
            return false;
        case reader::StringChunkStatus::error:
            return false;
        case reader::StringChunkStatus::ok:
            break;
        }

        if constexpr (dynamic) {
            if constexpr (requires { out.append(buf, res.bytes_written); }) {
                out.append(buf, res.bytes_written);
            } else {
                for (std::size_t i = 0; i < res.bytes_written; i ++) {
                    out.push_back(buf[i]);
                }
            }
        }
        total += res.bytes_written;

        if (res.done) {
            outSize = total;
            return true;
        }

        if (res.bytes_written == 0) {
            // storage is full and the payload is not
            break;
        }
    }

    outSize = total;
    err = ParseError::FIXED_SIZE_CONTAINER_OVERFLOW;
    if (read_rest_on_overflow) {
        for (;;) {
            reader::StringChunkResult rest = reader.read_string_chunk(buf, STRING_CHUNK_SIZE);
            if (rest.status != reader::StringChunkStatus::ok) {
                err = ParseError::NO_ERROR;
                return false;
            }
            if (rest.done) {
                return false;
            }
        }
    }
    return false;
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::ParsableString<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    std::size_t parsedSize = 0;
    ParseError err{ParseError::NO_ERROR};
    if constexpr (static_schema::static_string_traits<ObjT>::is_static) {
        char * b = static_schema::static_string_traits<ObjT>::data(obj);
        if(!read_string_into(reader, b, static_schema::static_string_traits<ObjT>::max_size(obj), err, parsedSize)) {
            return ctx.withParseError(err, reader);
        }
        b[parsedSize] = 0;
    } else {
        obj.clear();
        if(!read_string_into(reader, obj, std::numeric_limits<std::size_t>::max(), err, parsedSize)) {
            return ctx.withParseError(err, reader);
        }
    }
    return true;
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::ParsableArray<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {

    typename Tokenizer::ArrayFrame fr;
    reader::IterationStatus iterStatus = reader.read_array_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE, reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }
    std::size_t parsed_items_count = 0;

    using FH   = static_schema::array_write_cursor<ObjT>;
    FH cursor{ obj };
    cursor.reset();

    while(iterStatus.has_value) {
        stream_write_result alloc_r = cursor.allocate_slot();
        if(alloc_r != stream_write_result::slot_allocated) {
            if(alloc_r == stream_write_result::overflow) {
                return ctx.withParseError(ParseError::FIXED_SIZE_CONTAINER_OVERFLOW, reader);
            } else {
                return ctx.withParseError(ParseError::DATA_CONSUMER_ERROR, reader);
            }
        }

        typename FH::element_type & newItem = cursor.get_slot();
        typename CTX::PathGuard guard = ctx.getArrayItemGuard(parsed_items_count);

        using Meta = options::detail::annotation_meta_getter<typename FH::element_type>;
        if(!ParseValue<typename Meta::options>(Meta::getRef(newItem), reader, ctx)) {
            cursor.finalize_item(false);
            cursor.finalize(false);
            return false;
        }

        stream_write_result finalize_r = cursor.finalize_item(true);
        if(finalize_r != stream_write_result::value_processed) {
            return ctx.withParseError(ParseError::DATA_CONSUMER_ERROR, reader);
        }
        parsed_items_count ++;

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            cursor.finalize(false);
            return ctx.withReaderError(reader);
        }
    }
    if(cursor.finalize(true) != stream_write_result::value_processed) {
        return ctx.withParseError(ParseError::DATA_CONSUMER_ERROR, reader);
    }
    return true;
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::ParsableMap<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {

    typename Tokenizer::MapFrame fr;

    reader::IterationStatus iterStatus = reader.read_map_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_MAP_IN_MAP_LIKE_VALUE, reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    using FH = static_schema::map_write_cursor<ObjT>;
    FH cursor{ obj };
    cursor.reset();

    while(iterStatus.has_value) {
        stream_write_result alloc_r = cursor.allocate_key();
        if(alloc_r != stream_write_result::slot_allocated) {
            if(alloc_r == stream_write_result::overflow) {
                return ctx.withParseError(ParseError::FIXED_SIZE_CONTAINER_OVERFLOW, reader);
            } else {
                return ctx.withParseError(ParseError::DATA_CONSUMER_ERROR, reader);
            }
        }

        typename FH::key_type& key = cursor.key_ref();
        if constexpr(std::is_integral_v<typename FH::key_type>) {
            if(!ParseNonNullValue<options::detail::no_options>(key, reader, ctx)) {
                cursor.finalize(false);
                return false;
            }
        } else {
            std::size_t parsedSize = 0;
            ParseError err{ParseError::NO_ERROR};
            if constexpr (static_schema::static_string_traits<typename FH::key_type>::is_static) {
                char * b = static_schema::static_string_traits<typename FH::key_type>::data(key);
                if(!read_string_into(reader, b,
                                     static_schema::static_string_traits<typename FH::key_type>::max_size(key),
                                     err, parsedSize)) {
                    cursor.finalize(false);
                    return ctx.withParseError(err, reader);
                }
                b[parsedSize] = 0;
            } else {
                if(!read_string_into(reader, key, std::numeric_limits<std::size_t>::max(), err, parsedSize)) {
                    cursor.finalize(false);
                    return ctx.withParseError(err, reader);
                }
            }
        }

        if (!reader.move_to_value(fr)) {
            cursor.finalize(false);
            return ctx.withReaderError(reader);
        }

        alloc_r = cursor.allocate_value_for_parsed_key();
        if(alloc_r != stream_write_result::slot_allocated) {
            if(alloc_r == stream_write_result::overflow) {
                return ctx.withParseError(ParseError::FIXED_SIZE_CONTAINER_OVERFLOW, reader);
            } else {
                return ctx.withParseError(ParseError::DATA_CONSUMER_ERROR, reader);
            }
        }

        typename FH::mapped_type& value = cursor.value_ref();
        {
            auto guard = [&]() {
                if constexpr(std::is_integral_v<typename FH::key_type>) {
                    return ctx.getIntegerKeyGuard(key);
                } else {
                    if constexpr (static_schema::static_string_traits<typename FH::key_type>::is_static) {
                        return ctx.getMapItemGuard(std::string_view(key.data()), false);
                    } else {
                        return ctx.getMapItemGuard(std::string_view(key.data(), key.size()), false);
                    }
                }
            }();

            using Meta = options::detail::annotation_meta_getter<typename FH::mapped_type>;
            if(!ParseValue<typename Meta::options>(Meta::getRef(value), reader, ctx)) {
                cursor.finalize(false);
                return false;
            }

            // still under the key's path element
            stream_write_result finalize_r = cursor.finalize_pair(true);
            if(finalize_r != stream_write_result::value_processed) {
                if(finalize_r == stream_write_result::overflow) {
                    return ctx.withParseError(ParseError::DUPLICATE_KEY_IN_MAP, reader);
                } else {
                    return ctx.withParseError(ParseError::DATA_CONSUMER_ERROR, reader);
                }
            }
        }

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            cursor.finalize(false);
            return ctx.withReaderError(reader);
        }
    }

    cursor.finalize(true);
    return true;
}



template<class StructT, std::size_t StructIndex>
using StructFieldMeta = options::detail::annotation_meta_getter<
    introspection::structureElementTypeByIndex<StructIndex, StructT>
>;

template <class ObjT, reader::ReaderLike Tokenizer, class CTX, std::size_t... StructIndex>
    requires static_schema::ObjectValue<ObjT>
constexpr bool ParseStructField(ObjT& structObj, Tokenizer & reader, CTX &ctx, std::index_sequence<StructIndex...>, std::size_t requiredIndex) {
    bool ok = false;
    (
        (requiredIndex == StructIndex
             ? (
                ok = ParseValue< options::detail::aggregate_field_opts_getter<ObjT, StructIndex>>(
                       StructFieldMeta<ObjT, StructIndex>::getRef(
                           introspection::getStructElementByIndex<StructIndex>(structObj)
                           ),
                       reader, ctx
                       )
                , 0)
             : 0),
        ...
        );
    return ok;
}

// Fields that never appeared: nullable ones become null, others are missing
template <std::size_t StructIndex, class ObjT, class Bits, reader::ReaderLike Tokenizer, class CTX>
constexpr bool FinishStructField(ObjT& structObj, const Bits & parsedFieldsByIndex, Tokenizer & reader, CTX &ctx) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    if constexpr (struct_fields_helper::fieldIsExcluded<ObjT, StructIndex>()) {
        return true;
    } else {
        constexpr std::size_t encodedIndex = FH::template encodedIndex<StructIndex>();
        if(parsedFieldsByIndex[encodedIndex]) {
            return true;
        }
        using Field = introspection::structureElementTypeByIndex<StructIndex, ObjT>;
        if constexpr (static_schema::NullableParsableValue<Field>) {
            static_schema::setNull(introspection::getStructElementByIndex<StructIndex>(structObj));
            return true;
        } else {
            typename CTX::PathGuard guard = ctx.getMapItemGuard(FH::fieldIndexesToFieldNames[encodedIndex].name);
            return ctx.withParseError(ParseError::MISSING_FIELD, reader);
        }
    }
}

template <class ObjT, class Bits, reader::ReaderLike Tokenizer, class CTX, std::size_t... StructIndex>
constexpr bool FinishStructFields(ObjT& structObj, const Bits & parsedFieldsByIndex, Tokenizer & reader, CTX &ctx, std::index_sequence<StructIndex...>) {
    return (FinishStructField<StructIndex>(structObj, parsedFieldsByIndex, reader, ctx) && ...);
}


template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::ObjectValue<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {

    typename Tokenizer::MapFrame fr;

    reader::IterationStatus iterStatus = reader.read_map_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_MAP_IN_MAP_LIKE_VALUE, reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static_assert(FH::fieldsAreUnique, "[[[ Rencode ]]] Field keys are not unique");

    std::bitset<FH::fieldsCount> parsedFieldsByIndex{};

    while(iterStatus.has_value) {
        std::size_t arrayIndex = FH::npos;

        {
            char keyBuf[FH::maxFieldNameLength + 1] = {};
            char * b = keyBuf;
            std::size_t parsedSize = 0;
            ParseError err{ParseError::NO_ERROR};
            if(read_string_into(reader, b, FH::maxFieldNameLength, err, parsedSize, true)) {
                arrayIndex = FH::find(std::string_view(b, parsedSize));
            } else if(err != ParseError::FIXED_SIZE_CONTAINER_OVERFLOW) {
                // longer than any field name: unknown key, anything else is fatal
                return ctx.withParseError(err, reader);
            }
        }

        if (!reader.move_to_value(fr)) {
            return ctx.withReaderError(reader);
        }

        if(arrayIndex == FH::npos) {
            if constexpr (Opts::template has_option<options::detail::allow_excess_fields_tag>) {
                using Opt = typename Opts::template get_option<options::detail::allow_excess_fields_tag>;

                if(!reader.template skip_value<Opt::SkipDepthLimit>()) {
                    return ctx.withReaderError(reader);
                }
            } else {
                return ctx.withParseError(ParseError::EXCESS_FIELD, reader);
            }
        } else {
            const struct_fields_helper::FieldDescr & descr = FH::fieldIndexesToFieldNames[arrayIndex];
            typename CTX::PathGuard guard = ctx.getMapItemGuard(descr.name);

            if(parsedFieldsByIndex[arrayIndex]) {
                return ctx.withParseError(ParseError::DUPLICATE_KEY_IN_MAP, reader);
            }

            if(!ParseStructField(obj, reader, ctx, std::make_index_sequence<FH::rawFieldsCount>{}, descr.originalIndex)) {
                return false;
            }

            parsedFieldsByIndex[arrayIndex] = true;
        }

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }

    return FinishStructFields(obj, parsedFieldsByIndex, reader, ctx, std::make_index_sequence<FH::rawFieldsCount>{});
}


/* #### Records encoded as lists #### */

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::ObjectValue<ObjT>
             &&
             Opts::template has_option<options::detail::as_array_tag>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    typename Tokenizer::ArrayFrame fr;
    reader::IterationStatus iterStatus = reader.read_array_begin(fr);
    if(iterStatus.status == reader::TryParseStatus::no_match) {
        return ctx.withParseError(ParseError::NON_ARRAY_IN_DESTRUCTURED_STRUCT, reader);
    } else if(iterStatus.status == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    }

    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    std::size_t parsed_items_count = 0;

    while(iterStatus.has_value) {
        if(parsed_items_count >= FH::fieldsCount) {
            return ctx.withParseError(ParseError::ARRAY_DESTRUCTURING_SCHEMA_ERROR, reader);
        }

        typename CTX::PathGuard guard = ctx.getArrayItemGuard(parsed_items_count);
        if(!ParseStructField(obj, reader, ctx, std::make_index_sequence<FH::rawFieldsCount>{},
                             FH::fieldIndexesToFieldNames[parsed_items_count].originalIndex)) {
            return false;
        }

        parsed_items_count ++;

        iterStatus = reader.advance_after_value(fr);
        if (iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }
    }

    if(parsed_items_count != FH::fieldsCount) {
        return ctx.withParseError(ParseError::ARRAY_DESTRUCTURING_SCHEMA_ERROR, reader);
    }
    return true;
}


/* #### Generic values #### */

template <class Opts, class ObjT, reader::ReaderLike Tokenizer, class CTX>
    requires static_schema::GenericValue<ObjT>
constexpr bool ParseNonNullValue(ObjT& obj, Tokenizer & reader, CTX &ctx) {
    switch(reader.peek_kind()) {
    case reader::ValueKind::error:
        return ctx.withReaderError(reader);

    case reader::ValueKind::none:
        // normally consumed by ParseValue
        obj = Value{};
        return true;

    case reader::ValueKind::boolean: {
        bool b = false;
        if(!ParseNonNullValue<Opts>(b, reader, ctx)) {
            return false;
        }
        obj = Value(b);
        return true;
    }

    case reader::ValueKind::integer: {
        std::int64_t i = 0;
        if(!ParseNonNullValue<Opts>(i, reader, ctx)) {
            return false;
        }
        obj = Value(i);
        return true;
    }

    case reader::ValueKind::floating: {
        double d = 0;
        if(!ParseNonNullValue<Opts>(d, reader, ctx)) {
            return false;
        }
        obj = Value(d);
        return true;
    }

    case reader::ValueKind::string: {
        std::string s;
        if(!ParseNonNullValue<Opts>(s, reader, ctx)) {
            return false;
        }
        obj = Value(std::move(s));
        return true;
    }

    case reader::ValueKind::array: {
        Value::List list;
        if(!ParseNonNullValue<Opts>(list, reader, ctx)) {
            return false;
        }
        obj = Value(std::move(list));
        return true;
    }

    case reader::ValueKind::map: {
        typename Tokenizer::MapFrame fr;
        reader::IterationStatus iterStatus = reader.read_map_begin(fr);
        if(iterStatus.status != reader::TryParseStatus::ok) {
            return ctx.withReaderError(reader);
        }

        Value::Dict dict;
        while(iterStatus.has_value) {
            // Dict keys are strings only
            const reader::ValueKind keyKind = reader.peek_kind();
            if(keyKind == reader::ValueKind::error) {
                return ctx.withReaderError(reader);
            } else if(keyKind != reader::ValueKind::string) {
                return ctx.withParseError(ParseError::NON_STRING_IN_STRING_STORAGE, reader);
            }
            std::string key;
            if(!ParseNonNullValue<Opts>(key, reader, ctx)) {
                return false;
            }
            if (!reader.move_to_value(fr)) {
                return ctx.withReaderError(reader);
            }

            typename CTX::PathGuard guard = ctx.getMapItemGuard(key, false);
            Value item;
            if(!ParseValue<options::detail::no_options>(item, reader, ctx)) {
                return false;
            }
            if(!dict.try_emplace(std::move(key), std::move(item)).second) {
                return ctx.withParseError(ParseError::DUPLICATE_KEY_IN_MAP, reader);
            }

            iterStatus = reader.advance_after_value(fr);
            if (iterStatus.status != reader::TryParseStatus::ok) {
                return ctx.withReaderError(reader);
            }
        }
        obj = Value(std::move(dict));
        return true;
    }
    }
    return ctx.withReaderError(reader);
}


template <class FieldOptions, static_schema::ParsableValue Field, reader::ReaderLike Tokenizer, class CTX>
constexpr bool ParseValue(Field & field, Tokenizer & reader, CTX &ctx) {
    if(reader::TryParseStatus r = reader.start_value_and_try_read_null(); r == reader::TryParseStatus::ok) {
        if constexpr(static_schema::NullableParsableValue<Field>) {
            static_schema::setNull(field);
            return true;
        } else if constexpr(static_schema::GenericValue<Field>) {
            options::detail::annotation_meta_getter<Field>::getRef(field) = Value{};
            return true;
        } else {
            return ctx.withParseError(ParseError::NULL_IN_NON_OPTIONAL, reader);
        }
    } else if(r == reader::TryParseStatus::error) {
        return ctx.withReaderError(reader);
    } else {
        return ParseNonNullValue<FieldOptions>(static_schema::getRef(field), reader, ctx);
    }
}


} // namespace parser_details


// With wholeInput, bytes left after the value are EXCESS_CHARACTERS;
// otherwise the reader stops right after the value.
template <static_schema::ParsableValue InputObjectT, reader::ReaderLike Reader>
constexpr auto ParseWithReader(InputObjectT & obj, Reader & reader, bool wholeInput = true) {
    using CtxT = parser_details::DeserializationContext<typename Reader::iterator_type, typename Reader::error_type>;

    CtxT ctx;

    using Meta = options::detail::annotation_meta_getter<InputObjectT>;

    parser_details::ParseValue<typename Meta::options>(obj, reader, ctx);

    if(ctx.currentError() == ParseError::NO_ERROR) {
        if(wholeInput && !reader.finish()) {
            ctx.withReaderError(reader);
        } else {
            ctx.atEnd(reader);
        }
    }
    return ctx.result();
}

template <static_schema::ParsableValue InputObjectT, ByteInputIterator It, class Sent>
    requires ByteSentinelFor<It, Sent>
constexpr auto Parse(InputObjectT & obj, It begin, const Sent & end, ReaderLimits limits = {}) {
    RencodeReader<It, Sent> reader(begin, end, limits);
    return ParseWithReader(obj, reader);
}

// Any byte container: std::vector<std::uint8_t>, std::array, std::string, std::string_view, C arrays
template<static_schema::ParsableValue InputObjectT, class ContainterT>
    requires (!std::is_pointer_v<ContainterT>) && requires(const ContainterT& c) { std::ranges::begin(c); std::ranges::end(c); }
constexpr auto Parse(InputObjectT & obj, const ContainterT & c, ReaderLimits limits = {}) {
    return Parse(obj, std::ranges::begin(c), std::ranges::end(c), limits);
}

/// Decodes exactly one value from the front of the input and leaves the
/// rest unread, so that values sent back to back on one stream can be
/// decoded one call at a time. On success `pos()` is the position just
/// past the value: pass it as `begin` of the next call.
///
///     std::istreambuf_iterator<char> it(stream), end;
///     auto first = ParseOne(header, it, end);
///     auto second = ParseOne(body, first.pos(), end);
template <static_schema::ParsableValue InputObjectT, ByteInputIterator It, class Sent>
    requires ByteSentinelFor<It, Sent>
constexpr auto ParseOne(InputObjectT & obj, It begin, const Sent & end, ReaderLimits limits = {}) {
    RencodeReader<It, Sent> reader(begin, end, limits);
    return ParseWithReader(obj, reader, false);
}

template<static_schema::ParsableValue InputObjectT, class ContainterT>
    requires (!std::is_pointer_v<ContainterT>) && requires(const ContainterT& c) { std::ranges::begin(c); std::ranges::end(c); }
constexpr auto ParseOne(InputObjectT & obj, const ContainterT & c, ReaderLimits limits = {}) {
    return ParseOne(obj, std::ranges::begin(c), std::ranges::end(c), limits);
}

template <class T>
    requires (!static_schema::ParsableValue<T>)
constexpr auto Parse(T&, auto, auto) {
    static_assert(!sizeof(T),
                  "[[[ Rencode ]]] T is not a supported Rencode parsable value model type.\n"
                  "see ParsableValue concept for full rules");
}

template <class T>
    requires (!static_schema::ParsableValue<T>)
constexpr auto Parse(T&, auto) {
    static_assert(!sizeof(T),
                  "[[[ Rencode ]]] T is not a supported Rencode parsable value model type.\n"
                  "see ParsableValue concept for full rules");
}


} // namespace Rencode
