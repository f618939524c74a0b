#pragma once

#include <cstdint>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <type_traits>
#include <vector>
#include "struct_introspection.hpp"
#include "static_schema.hpp"
#include "struct_fields_helper.hpp"
#include "value.hpp"

#include "options.hpp"
#include "io.hpp"
#include "errors.hpp"

#include "rencode.hpp"

namespace Rencode {

template <ByteOutputIterator OutIter, class WriterError>
class SerializeResult {
    SerializeError m_error = SerializeError::NO_ERROR;
    WriterError m_writerError{};
    OutIter m_pos;
    std::size_t m_bytesWritten = 0;
public:
    constexpr SerializeResult(SerializeError err, WriterError werr, OutIter pos, std::size_t bytesWritten):
        m_error(err), m_writerError(werr), m_pos(pos), m_bytesWritten(bytesWritten)
    {}
    constexpr operator bool() const {
        return m_error == SerializeError::NO_ERROR;
    }
    constexpr OutIter pos() const {
        return m_pos;
    }
    constexpr SerializeError error() const {
        return m_error;
    }
    constexpr WriterError writerError() const {
        return m_writerError;
    }
    // Bytes emitted before the call returned, failures included
    constexpr std::size_t bytesWritten() const {
        return m_bytesWritten;
    }
};


namespace  serializer_details {


template <ByteOutputIterator OutIter, class WriterError>
class SerializationContext {

    SerializeError error = SerializeError::NO_ERROR;
    WriterError writerError{};
    OutIter m_pos;
    std::size_t m_bytesWritten = 0;

public:
    constexpr SerializationContext(OutIter it): m_pos(it){}

    template<class Writer>
    constexpr bool withWriterError(Writer & writer) {
        error = SerializeError::WRITER_ERROR;
        writerError = writer.getError();
        m_pos = writer.current();
        m_bytesWritten = writer.bytesWritten();
        return false;
    }

    template<class Writer>
    constexpr bool withError(SerializeError err, Writer & writer) {
        error = err;
        if(err == SerializeError::NO_ERROR) {
            error = SerializeError::WRITER_ERROR;
        }
        writerError = writer.getError();
        m_pos = writer.current();
        m_bytesWritten = writer.bytesWritten();
        return false;
    }

    template<class Writer>
    constexpr void atEnd(Writer & writer) {
        m_pos = writer.current();
        m_bytesWritten = writer.bytesWritten();
    }

    constexpr SerializeError currentError() const {
        return error;
    }

    constexpr SerializeResult<OutIter, WriterError> result() const {
        return SerializeResult<OutIter, WriterError>(error, writerError, m_pos, m_bytesWritten);
    }
};


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::BoolValue<ObjT>
constexpr bool SerializeNonNullValue(const ObjT & obj, Writer & writer, CTX &ctx) {
    if(!writer.write_bool(obj)) {
        return ctx.withWriterError(writer);
    }
    return true;
}


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::NumberValue<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    if(!writer.write_number(obj)) {
        return ctx.withWriterError(writer);
    }
    return true;
}


template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::StringValue<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {

    if constexpr(!static_schema::static_string_traits<ObjT>::is_static) {
        if(!writer.write_string(obj.data(), obj.size())) {
            return ctx.withWriterError(writer);
        }

    } else {
        if(!writer.write_string(static_schema::static_string_traits<ObjT>::data(obj),
                                 static_schema::static_string_traits<ObjT>::max_size(obj), true)) {
            return ctx.withWriterError(writer);
        }
    }
    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::SerializableArray<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {

    using FH   = static_schema::array_read_cursor<ObjT>;
    FH cursor{ obj };

    typename Writer::ArrayFrame fr;
    if(!writer.write_array_begin(cursor.size(), fr)) {
        return ctx.withWriterError(writer);
    }

    cursor.reset();
    stream_read_result res = cursor.read_more();

    while(res != stream_read_result::end) {

        if(res == stream_read_result::error) {
            return ctx.withError(SerializeError::INPUT_STREAM_ERROR, writer);
        }

        const auto &ch = cursor.get();

        using Meta = options::detail::annotation_meta_getter<typename FH::element_type>;
        if(!SerializeValue<typename Meta::options>(Meta::getRef(ch), writer, ctx)) {
            return false;
        }
        if(!writer.advance_after_value(fr)) {
            return ctx.withWriterError(writer);
        }
        res = cursor.read_more();
    }
    if(!writer.write_array_end(fr)) {
        return ctx.withWriterError(writer);
    }

    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::SerializableMap<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {

    using FH = static_schema::map_read_cursor<ObjT>;
    FH cursor{ obj };

    constexpr bool skipNulls = static_schema::NullableSerializableValue<typename FH::mapped_type> &&
                               Opts::template has_option<options::detail::skip_nulls_tag>;

    // The header announces the entries that are actually written
    std::size_t count = cursor.size();
    if constexpr(skipNulls) {
        count = 0;
        cursor.reset();
        while(cursor.read_more() == stream_read_result::value) {
            if(!static_schema::isNull(cursor.get_value())) {
                count ++;
            }
        }
    }

    typename Writer::MapFrame fr;
    if(!writer.write_map_begin(count, fr)) {
        return ctx.withWriterError(writer);
    }

    cursor.reset();
    stream_read_result res = cursor.read_more();
    while(res != stream_read_result::end) {

        if(res == stream_read_result::error) {
            return ctx.withError(SerializeError::INPUT_STREAM_ERROR, writer);
        }
        const auto& key = cursor.get_key();
        const auto& value = cursor.get_value();

        if constexpr(skipNulls) {
            if(static_schema::isNull(value)) {
                res = cursor.read_more();
                continue;
            }
        }

        if constexpr(std::is_integral_v<typename FH::key_type>) {
            if(!writer.write_number(key)) {
                return ctx.withWriterError(writer);
            }
        } else if constexpr(!static_schema::static_string_traits<typename FH::key_type>::is_static) {
            if(!writer.write_string(key.data(), key.size())) {
                return ctx.withWriterError(writer);
            }
        } else {
            if(!writer.write_string(static_schema::static_string_traits<typename FH::key_type>::data(key),
                                     static_schema::static_string_traits<typename FH::key_type>::max_size(key), true)) {
                return ctx.withWriterError(writer);
            }
        }

        if(!writer.move_to_value(fr)) {
            return ctx.withWriterError(writer);
        }

        using Meta = options::detail::annotation_meta_getter<typename FH::mapped_type>;
        if(!SerializeValue<typename Meta::options>(Meta::getRef(value), writer, ctx)) {
            return false;
        }
        if(!writer.advance_after_value(fr)) {
            return ctx.withWriterError(writer);
        }
        res = cursor.read_more();
    }

    if(!writer.write_map_end(fr)) {
        return ctx.withWriterError(writer);
    }

    return true;
}


template <bool SkipNulls, std::size_t StructIndex, class ObjT>
constexpr std::size_t CountOneStructField(const ObjT& structObj) {
    if constexpr (struct_fields_helper::fieldIsExcluded<ObjT, StructIndex>()) {
        return 0;
    } else {
        using Field = introspection::structureElementTypeByIndex<StructIndex, ObjT>;
        if constexpr (SkipNulls && static_schema::NullableSerializableValue<Field>) {
            return static_schema::isNull(introspection::getStructElementByIndex<StructIndex>(structObj)) ? 0 : 1;
        } else {
            return 1;
        }
    }
}

// Number of fields that will actually be written
template <bool SkipNulls, class ObjT, std::size_t... StructIndex>
constexpr std::size_t CountStructFields(const ObjT& structObj, std::index_sequence<StructIndex...>) {
    return (std::size_t{0} + ... + CountOneStructField<SkipNulls, StructIndex>(structObj));
}

template <bool AsArray, bool SkipNulls, std::size_t StructIndex, class Frame, class ObjT, writer::WriterLike Writer, class CTX>
constexpr bool SerializeOneStructField(Frame & fr, const ObjT& structObj, Writer & writer, CTX &ctx) {
    using Field   = introspection::structureElementTypeByIndex<StructIndex, ObjT>;
    using Meta = options::detail::annotation_meta_getter<Field>;
    using FieldOpts = options::detail::aggregate_field_opts_getter<ObjT, StructIndex>;
    if constexpr (FieldOpts::template has_option<options::detail::exclude_tag>) {
        return true;
    } else {
        const auto & field = introspection::getStructElementByIndex<StructIndex>(structObj);
        if constexpr(static_schema::NullableSerializableValue<Field> && SkipNulls){
            if(static_schema::isNull(field)) {
                return true;
            }
        }
        if constexpr(!AsArray) {
            constexpr std::string_view name = struct_fields_helper::FieldsHelper<ObjT>::template fieldName<StructIndex>();
            if(!writer.write_string(name.data(), name.size())) {
                return ctx.withWriterError(writer);
            }
            if(!writer.move_to_value(fr)) {
                return ctx.withWriterError(writer);
            }
        }

        if(!SerializeValue<FieldOpts>(Meta::getRef(field), writer, ctx)) {
            return false;
        }
        if(!writer.advance_after_value(fr)) {
            return ctx.withWriterError(writer);
        }
        return true;
    }
}

template <bool AsArray, bool SkipNulls, class Frame, class ObjT, writer::WriterLike Writer, class CTX, std::size_t... StructIndex>
constexpr bool SerializeStructFields(Frame &fr, const ObjT& structObj, Writer & writer, CTX &ctx, std::index_sequence<StructIndex...>) {
    return (
        SerializeOneStructField<AsArray, SkipNulls, StructIndex>(fr, structObj, writer, ctx)
        && ...
        );
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ObjectValue<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    using FH = struct_fields_helper::FieldsHelper<ObjT>;
    static_assert(FH::fieldsAreUnique, "[[[ Rencode ]]] Field keys are not unique");
    constexpr bool skipNulls = Opts::template has_option<options::detail::skip_nulls_tag>;
    using Indexes = std::make_index_sequence<introspection::structureElementsCount<ObjT>>;

    typename Writer::MapFrame fr;
    if(!writer.write_map_begin(CountStructFields<skipNulls>(obj, Indexes{}), fr)) {
        return ctx.withWriterError(writer);
    }

    if(!SerializeStructFields<false, skipNulls>(fr, obj, writer, ctx, Indexes{}))
        return false;

    if(!writer.write_map_end(fr)) {
        return ctx.withWriterError(writer);
    }
    return true;

}

// Positional: every field is written, nulls included
template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::ObjectValue<ObjT>
        && Opts::template has_option<options::detail::as_array_tag>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    typename Writer::ArrayFrame fr;
    if(!writer.write_array_begin(struct_fields_helper::FieldsHelper<ObjT>::fieldsCount, fr)) {
        return ctx.withWriterError(writer);
    }
    if(!SerializeStructFields<true, false>(fr, obj, writer, ctx, std::make_index_sequence<introspection::structureElementsCount<ObjT>>{}))
        return false;

    if(!writer.write_array_end(fr)) {
        return ctx.withWriterError(writer);
    }

    return true;
}

template <class Opts, class ObjT, writer::WriterLike Writer, class CTX>
    requires static_schema::GenericValue<ObjT>
constexpr bool SerializeNonNullValue(const ObjT& obj, Writer & writer, CTX &ctx) {
    bool ok = false;
    switch(obj.type()) {
    case Value::Type::None:
        ok = writer.write_null();
        break;
    case Value::Type::Bool:
        ok = writer.write_bool(*obj.template get_if<bool>());
        break;
    case Value::Type::I64:
        ok = writer.write_number(*obj.template get_if<std::int64_t>());
        break;
    case Value::Type::U64:
        ok = writer.write_number(*obj.template get_if<std::uint64_t>());
        break;
    case Value::Type::F64:
        ok = writer.write_number(*obj.template get_if<double>());
        break;
    case Value::Type::String: {
        const std::string & s = *obj.template get_if<std::string>();
        ok = writer.write_string(s.data(), s.size());
        break;
    }
    case Value::Type::List:
        return SerializeNonNullValue<Opts>(*obj.template get_if<Value::List>(), writer, ctx);
    case Value::Type::Dict:
        // sorted storage, so the key order is deterministic
        return SerializeNonNullValue<Opts>(*obj.template get_if<Value::Dict>(), writer, ctx);
    }
    if(!ok) {
        return ctx.withWriterError(writer);
    }
    return true;
}

template <class FieldOptions, static_schema::SerializableValue Field, writer::WriterLike Writer, class CTX>
constexpr  bool SerializeValue(const Field & obj, Writer & writer, CTX &ctx) {
    if constexpr(static_schema::NullableSerializableValue<Field>) {
        if(static_schema::isNull(obj)) {
            if(!writer.write_null()) {
                return ctx.withWriterError(writer);
            } else {
                return true;
            }
        }
    }
    return SerializeNonNullValue<FieldOptions>(static_schema::getRef(obj), writer, ctx);
}

} // namespace serializer_details



template <static_schema::SerializableValue InputObjectT, writer::WriterLike Writer>
constexpr auto SerializeWithWriter(const InputObjectT & obj, Writer & writer) {
    serializer_details::SerializationContext<typename Writer::iterator_type, typename Writer::error_type> ctx(writer.current());
    using Meta = options::detail::annotation_meta_getter<InputObjectT>;

    serializer_details::SerializeValue<typename Meta::options>(obj, writer, ctx);

    if(ctx.currentError() == SerializeError::NO_ERROR) {
        if(!writer.finish()) {
            ctx.withWriterError(writer);
        } else {
            ctx.atEnd(writer);
        }
    }
    return ctx.result();
}

template <static_schema::SerializableValue InputObjectT, ByteOutputIterator It, class Sent>
    requires ByteSentinelForOut<Sent, It>
constexpr SerializeResult<It, WriterError> Serialize(const InputObjectT & obj, It begin, const Sent & end) {
    RencodeWriter<It, Sent> writer(begin, end);
    return SerializeWithWriter(obj, writer);
}


namespace io_details {

// Never reached: growable outputs have no end
struct limitless_sentinel {
    template<class C>
    friend constexpr bool operator==(const std::back_insert_iterator<C>&,
                                     const limitless_sentinel&) noexcept {
        return false;
    }
};

}

template<static_schema::SerializableValue InputObjectT>
constexpr auto Serialize(const InputObjectT& obj, std::string& out)
{
    out.clear();
    return Serialize(obj, std::back_inserter(out), io_details::limitless_sentinel{});
}

template<static_schema::SerializableValue InputObjectT>
constexpr auto Serialize(const InputObjectT& obj, std::vector<std::uint8_t>& out)
{
    out.clear();
    return Serialize(obj, std::back_inserter(out), io_details::limitless_sentinel{});
}


template <class T>
    requires (!static_schema::SerializableValue<T>)
constexpr auto Serialize(const T&, auto) {
    static_assert(!sizeof(T),
                  "[[[ Rencode ]]] T is not a supported Rencode serializable value model type.\n"
                  "see SerializableValue concept for full rules");
}


template <class T>
    requires (!static_schema::SerializableValue<T>)
constexpr auto Serialize(const T&, auto, auto) {
    static_assert(!sizeof(T),
                  "[[[ Rencode ]]] T is not a supported Rencode serializable value model type.\n"
                  "see SerializableValue concept for full rules");
}


} // namespace Rencode
