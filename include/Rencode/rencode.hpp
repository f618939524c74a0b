#pragma once

#include <bit>
#include <cstdint>
#include <cstddef>
#include <limits>
#include <optional>
#include <string_view>
#include <type_traits>

#include "reader_concept.hpp"
#include "writer_concept.hpp"
#include "typecodes.hpp"
#include "utf8.hpp"

#ifndef RENCODE_DEFAULT_MAX_NESTING_DEPTH
#define RENCODE_DEFAULT_MAX_NESTING_DEPTH 256
#endif

#ifndef RENCODE_DEFAULT_MAX_STRING_LENGTH
#define RENCODE_DEFAULT_MAX_STRING_LENGTH (64u * 1024u * 1024u)
#endif

namespace Rencode {

struct ReaderLimits {
    std::size_t max_depth         = RENCODE_DEFAULT_MAX_NESTING_DEPTH;  // nested lists/maps
    std::size_t max_string_length = RENCODE_DEFAULT_MAX_STRING_LENGTH;  // declared byte length
};

enum class ReaderError {
    NO_ERROR,
    UNEXPECTED_END_OF_DATA,
    ILLFORMED_LENGTH_PREFIX,
    INVALID_UTF8,
    UNKNOWN_TYPECODE,
    UNEXPECTED_END_OF_STRUCTURE,
    NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE,
    NESTING_DEPTH_EXCEEDED,
    STRING_LENGTH_LIMIT_EXCEEDED,
    EXCESS_CHARACTERS,
    SKIPPING_STACK_OVERFLOW
};

constexpr std::string_view reader_error_to_string(ReaderError e) {
    switch(e) {
    case ReaderError::NO_ERROR: return "NO_ERROR";
    case ReaderError::UNEXPECTED_END_OF_DATA: return "UNEXPECTED_END_OF_DATA";
    case ReaderError::ILLFORMED_LENGTH_PREFIX: return "ILLFORMED_LENGTH_PREFIX";
    case ReaderError::INVALID_UTF8: return "INVALID_UTF8";
    case ReaderError::UNKNOWN_TYPECODE: return "UNKNOWN_TYPECODE";
    case ReaderError::UNEXPECTED_END_OF_STRUCTURE: return "UNEXPECTED_END_OF_STRUCTURE";
    case ReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE: return "NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE";
    case ReaderError::NESTING_DEPTH_EXCEEDED: return "NESTING_DEPTH_EXCEEDED";
    case ReaderError::STRING_LENGTH_LIMIT_EXCEEDED: return "STRING_LENGTH_LIMIT_EXCEEDED";
    case ReaderError::EXCESS_CHARACTERS: return "EXCESS_CHARACTERS";
    case ReaderError::SKIPPING_STACK_OVERFLOW: return "SKIPPING_STACK_OVERFLOW";
    }
    return "N/A";
}

enum class WriterError {
    none,
    invalid_argument,       // container count mismatch or misused map protocol
    unsigned_out_of_range,  // unsigned value above INT64_MAX
    sink_error              // output range exhausted
};

constexpr std::string_view writer_error_to_string(WriterError e) {
    switch(e) {
    case WriterError::none: return "none";
    case WriterError::invalid_argument: return "invalid_argument";
    case WriterError::unsigned_out_of_range: return "unsigned_out_of_range";
    case WriterError::sink_error: return "sink_error";
    }
    return "N/A";
}

namespace rencode_detail {

constexpr bool is_integer_code(typecodes::CodeClass c) {
    using typecodes::CodeClass;
    return c == CodeClass::positive_int || c == CodeClass::negative_int
        || c == CodeClass::int8 || c == CodeClass::int16
        || c == CodeClass::int32 || c == CodeClass::int64;
}

constexpr bool is_float_code(typecodes::CodeClass c) {
    return c == typecodes::CodeClass::float32 || c == typecodes::CodeClass::float64;
}

constexpr bool is_finite(double d) {
    return d == d && d - d == 0.0;
}

// Two's complement sign extension of a `width`-byte big-endian payload
constexpr std::int64_t sign_extend(std::uint64_t raw, std::size_t width) {
    if (width < 8) {
        const std::uint64_t sign = std::uint64_t{1} << (width * 8 - 1);
        if (raw & sign) {
            raw |= ~((std::uint64_t{1} << (width * 8)) - 1);
        }
    }
    return static_cast<std::int64_t>(raw);
}

} // namespace rencode_detail


/// Pull-style decoder over a byte range. Keeps a single byte of lookahead:
/// the typecode of the next value is peeked, dispatched on, and consumed
/// only once it is known to match the requested shape.
template<class It, class Sent>
class RencodeReader {
public:
    using ParseError    = ReaderError;
    using error_type    = ReaderError;
    using iterator_type = It;

    struct ArrayFrame {
        std::uint64_t remaining = 0;  // elements left (unused for open lists)
        bool open = false;            // terminated by CHR_TERM
    };

    struct MapFrame {
        std::uint64_t remaining_pairs = 0;
        bool open = false;
    };

    constexpr RencodeReader(It first, Sent last, ReaderLimits limits = {})
        : cur_(first), end_(last), limits_(limits)
    {}

    // ========== Introspection ==========

    // Underlying position; a peeked but unconsumed byte is already behind it
    constexpr iterator_type current() const {
        return cur_;
    }

    // Number of bytes consumed so far
    constexpr std::size_t offset() const {
        return offset_;
    }

    constexpr ParseError getError() const {
        return err_;
    }

    constexpr const ReaderLimits & limits() const {
        return limits_;
    }

    // ========== Primitive Value Parsing ==========

    constexpr reader::TryParseStatus start_value_and_try_read_null() {
        reset_value_string_state();
        std::uint8_t b;
        typecodes::CodeClass c;
        if (!peek_value_byte(b, c)) {
            return reader::TryParseStatus::error;
        }
        if (c == typecodes::CodeClass::none) {
            drop_peeked();
            return reader::TryParseStatus::ok;
        }
        return reader::TryParseStatus::no_match;
    }

    constexpr reader::TryParseStatus read_bool(bool& out) {
        std::uint8_t b;
        typecodes::CodeClass c;
        if (!peek_value_byte(b, c)) {
            return reader::TryParseStatus::error;
        }
        if (c == typecodes::CodeClass::boolean_true || c == typecodes::CodeClass::boolean_false) {
            out = c == typecodes::CodeClass::boolean_true;
            drop_peeked();
            return reader::TryParseStatus::ok;
        }
        return reader::TryParseStatus::no_match;
    }

    // Integer codes fit any storage they are in range of; float codes only
    // fit floating storage. A float code in integer storage is no_match.
    template<class NumberT>
    constexpr reader::TryParseStatus read_number(NumberT& storage) {
        static_assert(std::is_integral_v<NumberT> || std::is_floating_point_v<NumberT>,
                      "RencodeReader::read_number requires integral or floating type");

        std::uint8_t b;
        typecodes::CodeClass c;
        if (!peek_value_byte(b, c)) {
            return reader::TryParseStatus::error;
        }

        if constexpr (std::is_integral_v<NumberT>) {
            if (!rencode_detail::is_integer_code(c)) {
                return reader::TryParseStatus::no_match;
            }
            std::int64_t v;
            if (!decode_integer(b, c, v)) {
                return reader::TryParseStatus::error;
            }
            if constexpr (std::is_unsigned_v<NumberT>) {
                if (v < 0 || static_cast<std::uint64_t>(v) > std::numeric_limits<NumberT>::max()) {
                    setError(ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
                    return reader::TryParseStatus::error;
                }
            } else {
                if (v < static_cast<std::int64_t>(std::numeric_limits<NumberT>::lowest()) ||
                    v > static_cast<std::int64_t>(std::numeric_limits<NumberT>::max())) {
                    setError(ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
                    return reader::TryParseStatus::error;
                }
            }
            storage = static_cast<NumberT>(v);
            return reader::TryParseStatus::ok;
        } else {
            double dv{};
            if (rencode_detail::is_float_code(c)) {
                if (!decode_float(c, dv)) {
                    return reader::TryParseStatus::error;
                }
            } else if (rencode_detail::is_integer_code(c)) {
                std::int64_t v;
                if (!decode_integer(b, c, v)) {
                    return reader::TryParseStatus::error;
                }
                dv = static_cast<double>(v);
            } else {
                return reader::TryParseStatus::no_match;
            }
            // Infinities and NaN pass through unchanged
            if (rencode_detail::is_finite(dv) &&
                (dv < static_cast<double>(std::numeric_limits<NumberT>::lowest()) ||
                 dv > static_cast<double>(std::numeric_limits<NumberT>::max()))) {
                setError(ParseError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE);
                return reader::TryParseStatus::error;
            }
            storage = static_cast<NumberT>(dv);
            return reader::TryParseStatus::ok;
        }
    }

    // ========== String parsing (chunked) ==========

    // Used for string values and for map keys. The first call consumes the
    // header; later calls continue the same payload until `done`.
    constexpr reader::StringChunkResult read_string_chunk(char* out, std::size_t capacity) {
        reader::StringChunkResult res{};
        res.status        = reader::StringChunkStatus::error;
        res.bytes_written = 0;
        res.done          = false;

        if (!value_str_active_) {
            std::uint8_t b;
            typecodes::CodeClass c;
            if (!peek_value_byte(b, c)) {
                return res;
            }
            if (c != typecodes::CodeClass::fixed_string && c != typecodes::CodeClass::decimal_string) {
                res.status = reader::StringChunkStatus::no_match;
                return res;
            }
            std::uint64_t len;
            if (!read_string_header(b, c, len)) {
                return res;
            }
            value_str_len_    = len;
            value_str_offset_ = 0;
            value_str_active_ = true;
            utf8_.reset();
        }

        const std::uint64_t remaining = value_str_len_ - value_str_offset_;
        const std::size_t n = remaining < capacity ? static_cast<std::size_t>(remaining) : capacity;

        for (std::size_t i = 0; i < n; i ++) {
            std::uint8_t byte;
            if (!next_byte(byte)) {
                return res;
            }
            if (!utf8_.feed(byte)) {
                setError(ParseError::INVALID_UTF8);
                return res;
            }
            out[i] = static_cast<char>(byte);
        }
        value_str_offset_ += n;

        res.bytes_written = n;
        res.done          = value_str_offset_ >= value_str_len_;

        if (res.done) {
            if (!utf8_.complete()) {
                setError(ParseError::INVALID_UTF8);
                return res;
            }
            reset_value_string_state();
        }
        res.status = reader::StringChunkStatus::ok;
        return res;
    }

    // ========== Arrays ==========

    constexpr reader::IterationStatus read_array_begin(ArrayFrame& frame) {
        reader::IterationStatus ret;
        reset_value_string_state();

        std::uint8_t b;
        typecodes::CodeClass c;
        if (!peek_value_byte(b, c)) {
            return ret;
        }

        if (c == typecodes::CodeClass::open_list) {
            if (!enter_container()) {
                return ret;
            }
            drop_peeked();
            frame.open = true;
            frame.remaining = 0;
            return next_in_open_container(ret);
        }
        if (c == typecodes::CodeClass::fixed_list) {
            if (!enter_container()) {
                return ret;
            }
            drop_peeked();
            frame.open = false;
            frame.remaining = b - typecodes::LIST_FIXED_START;
            return next_in_fixed_container(ret, frame.remaining);
        }
        ret.status = reader::TryParseStatus::no_match;
        return ret;
    }

    constexpr reader::IterationStatus advance_after_value(ArrayFrame& frame) {
        reader::IterationStatus ret;
        reset_value_string_state();
        if (frame.open) {
            return next_in_open_container(ret);
        }
        --frame.remaining;
        return next_in_fixed_container(ret, frame.remaining);
    }

    // ========== Maps ==========

    constexpr reader::IterationStatus read_map_begin(MapFrame& frame) {
        reader::IterationStatus ret;
        reset_value_string_state();

        std::uint8_t b;
        typecodes::CodeClass c;
        if (!peek_value_byte(b, c)) {
            return ret;
        }

        if (c == typecodes::CodeClass::open_dict) {
            if (!enter_container()) {
                return ret;
            }
            drop_peeked();
            frame.open = true;
            frame.remaining_pairs = 0;
            return next_in_open_container(ret);
        }
        if (c == typecodes::CodeClass::fixed_dict) {
            if (!enter_container()) {
                return ret;
            }
            drop_peeked();
            frame.open = false;
            frame.remaining_pairs = b - typecodes::DICT_FIXED_START;
            return next_in_fixed_container(ret, frame.remaining_pairs);
        }
        ret.status = reader::TryParseStatus::no_match;
        return ret;
    }

    // Keys and values are plain consecutive values: nothing to consume
    constexpr bool move_to_value(MapFrame& frame) {
        (void)frame;
        reset_value_string_state();
        return true;
    }

    constexpr reader::IterationStatus advance_after_value(MapFrame& frame) {
        reader::IterationStatus ret;
        reset_value_string_state();
        if (frame.open) {
            return next_in_open_container(ret);
        }
        --frame.remaining_pairs;
        return next_in_fixed_container(ret, frame.remaining_pairs);
    }

    // ========== Utility Operations ==========

    constexpr reader::ValueKind peek_kind() {
        using typecodes::CodeClass;
        std::uint8_t b;
        CodeClass c;
        if (!peek_value_byte(b, c)) {
            return reader::ValueKind::error;
        }
        switch (c) {
        case CodeClass::none:
            return reader::ValueKind::none;
        case CodeClass::boolean_true:
        case CodeClass::boolean_false:
            return reader::ValueKind::boolean;
        case CodeClass::float32:
        case CodeClass::float64:
            return reader::ValueKind::floating;
        case CodeClass::decimal_string:
        case CodeClass::fixed_string:
            return reader::ValueKind::string;
        case CodeClass::open_list:
        case CodeClass::fixed_list:
            return reader::ValueKind::array;
        case CodeClass::open_dict:
        case CodeClass::fixed_dict:
            return reader::ValueKind::map;
        default:
            return reader::ValueKind::integer;
        }
    }

    template<std::size_t MAX_SKIP_NESTING>
    constexpr bool skip_value() {
        reset_value_string_state();
        return skip_one<MAX_SKIP_NESTING>(0);
    }

    // The top-level value must be the whole input
    constexpr bool finish() {
        if (peeked_.has_value() || cur_ != end_) {
            setError(ParseError::EXCESS_CHARACTERS);
            return false;
        }
        return true;
    }

private:
    It cur_;
    Sent end_;
    ReaderLimits limits_;

    std::optional<std::uint8_t> peeked_;
    std::size_t offset_ = 0;
    std::size_t depth_  = 0;
    ParseError err_ = ParseError::NO_ERROR;

    // State for the string (value or key) being streamed
    std::uint64_t   value_str_len_    = 0;
    std::uint64_t   value_str_offset_ = 0;
    bool            value_str_active_ = false;
    utf8::Validator utf8_;

    // Longest accepted decimal length prefix; 19 digits always fit in 64 bits
    static constexpr std::size_t MAX_LENGTH_DIGITS = 19;

    // ---- Helpers ----

    constexpr void setError(ParseError e) {
        if (err_ == ParseError::NO_ERROR) {
            err_ = e;
        }
    }

    constexpr void reset_value_string_state() {
        value_str_len_    = 0;
        value_str_offset_ = 0;
        value_str_active_ = false;
    }

    constexpr bool peek_byte(std::uint8_t& b) {
        if (!peeked_.has_value()) {
            if (cur_ == end_) {
                setError(ParseError::UNEXPECTED_END_OF_DATA);
                return false;
            }
            peeked_ = static_cast<std::uint8_t>(*cur_);
            ++cur_;
        }
        b = *peeked_;
        return true;
    }

    constexpr void drop_peeked() {
        peeked_.reset();
        ++offset_;
    }

    constexpr bool next_byte(std::uint8_t& b) {
        if (peeked_.has_value()) {
            b = *peeked_;
            drop_peeked();
            return true;
        }
        if (cur_ == end_) {
            setError(ParseError::UNEXPECTED_END_OF_DATA);
            return false;
        }
        b = static_cast<std::uint8_t>(*cur_);
        ++cur_;
        ++offset_;
        return true;
    }

    // Peek a byte that must start a value: terminator and reserved codes
    // are errors here.
    constexpr bool peek_value_byte(std::uint8_t& b, typecodes::CodeClass& c) {
        if (!peek_byte(b)) {
            return false;
        }
        c = typecodes::classify(b);
        if (c == typecodes::CodeClass::terminator) {
            setError(ParseError::UNEXPECTED_END_OF_STRUCTURE);
            return false;
        }
        if (c == typecodes::CodeClass::reserved) {
            setError(ParseError::UNKNOWN_TYPECODE);
            return false;
        }
        return true;
    }

    constexpr bool enter_container() {
        if (depth_ >= limits_.max_depth) {
            setError(ParseError::NESTING_DEPTH_EXCEEDED);
            return false;
        }
        ++depth_;
        return true;
    }

    constexpr void leave_container() {
        if (depth_ > 0) {
            --depth_;
        }
    }

    constexpr reader::IterationStatus next_in_open_container(reader::IterationStatus ret) {
        std::uint8_t b;
        if (!peek_byte(b)) {
            ret.status = reader::TryParseStatus::error;
            return ret;
        }
        ret.status = reader::TryParseStatus::ok;
        if (b == typecodes::CHR_TERM) {
            drop_peeked();
            leave_container();
            ret.has_value = false;
        } else {
            ret.has_value = true;
        }
        return ret;
    }

    constexpr reader::IterationStatus next_in_fixed_container(reader::IterationStatus ret, std::uint64_t remaining) {
        ret.status = reader::TryParseStatus::ok;
        ret.has_value = remaining != 0;
        if (!ret.has_value) {
            leave_container();
        }
        return ret;
    }

    constexpr bool read_be(std::size_t width, std::uint64_t& out) {
        out = 0;
        for (std::size_t i = 0; i < width; i ++) {
            std::uint8_t byte;
            if (!next_byte(byte)) {
                return false;
            }
            out = (out << 8) | byte;
        }
        return true;
    }

    constexpr bool skip_bytes(std::uint64_t n) {
        for (std::uint64_t i = 0; i < n; i ++) {
            std::uint8_t byte;
            if (!next_byte(byte)) {
                return false;
            }
        }
        return true;
    }

    // `b` is the peeked typecode, not consumed yet
    constexpr bool decode_integer(std::uint8_t b, typecodes::CodeClass c, std::int64_t& v) {
        using typecodes::CodeClass;
        drop_peeked();
        if (c == CodeClass::positive_int) {
            v = static_cast<std::int64_t>(b) - typecodes::INT_POS_FIXED_START;
            return true;
        }
        if (c == CodeClass::negative_int) {
            v = static_cast<std::int64_t>(typecodes::INT_NEG_FIXED_START) - 1 - b;
            return true;
        }
        const std::size_t width = typecodes::payload_width(c);
        std::uint64_t raw;
        if (!read_be(width, raw)) {
            return false;
        }
        v = rencode_detail::sign_extend(raw, width);
        return true;
    }

    constexpr bool decode_float(typecodes::CodeClass c, double& out) {
        drop_peeked();
        std::uint64_t raw;
        if (c == typecodes::CodeClass::float32) {
            if (!read_be(4, raw)) {
                return false;
            }
            out = static_cast<double>(std::bit_cast<float>(static_cast<std::uint32_t>(raw)));
            return true;
        }
        if (!read_be(8, raw)) {
            return false;
        }
        out = std::bit_cast<double>(raw);
        return true;
    }

    // "<digits>:" with the first digit still peeked
    constexpr bool read_decimal_length(std::uint64_t& len) {
        len = 0;
        std::size_t digits = 0;
        for (;;) {
            std::uint8_t b;
            if (!next_byte(b)) {
                return false;
            }
            if (b == typecodes::STR_LENGTH_DELIM) {
                break;
            }
            if (!typecodes::is_digit(b) || digits == MAX_LENGTH_DIGITS) {
                setError(ParseError::ILLFORMED_LENGTH_PREFIX);
                return false;
            }
            len = len * 10 + (b - '0');
            ++digits;
        }
        if (digits == 0) {
            setError(ParseError::ILLFORMED_LENGTH_PREFIX);
            return false;
        }
        return true;
    }

    constexpr bool read_string_header(std::uint8_t b, typecodes::CodeClass c, std::uint64_t& len) {
        if (c == typecodes::CodeClass::fixed_string) {
            drop_peeked();
            len = b - typecodes::STR_FIXED_START;
        } else if (!read_decimal_length(len)) {
            return false;
        }
        if (len > limits_.max_string_length) {
            setError(ParseError::STRING_LENGTH_LIMIT_EXCEEDED);
            return false;
        }
        return true;
    }

    template<std::size_t MAX_SKIP_NESTING>
    constexpr bool skip_container_entries(std::size_t depth, bool open, std::uint64_t count, std::size_t valuesPerEntry) {
        if (!enter_container()) {
            return false;
        }
        drop_peeked();
        if (open) {
            for (;;) {
                std::uint8_t b;
                if (!peek_byte(b)) {
                    return false;
                }
                if (b == typecodes::CHR_TERM) {
                    drop_peeked();
                    break;
                }
                for (std::size_t k = 0; k < valuesPerEntry; k ++) {
                    if (!skip_one<MAX_SKIP_NESTING>(depth + 1)) {
                        return false;
                    }
                }
            }
        } else {
            for (std::uint64_t i = 0; i < count * valuesPerEntry; i ++) {
                if (!skip_one<MAX_SKIP_NESTING>(depth + 1)) {
                    return false;
                }
            }
        }
        leave_container();
        return true;
    }

    template<std::size_t MAX_SKIP_NESTING>
    constexpr bool skip_one(std::size_t depth) {
        using typecodes::CodeClass;
        if (depth > MAX_SKIP_NESTING) {
            setError(ParseError::SKIPPING_STACK_OVERFLOW);
            return false;
        }

        std::uint8_t b;
        CodeClass c;
        if (!peek_value_byte(b, c)) {
            return false;
        }

        switch (c) {
        case CodeClass::positive_int:
        case CodeClass::negative_int:
        case CodeClass::boolean_true:
        case CodeClass::boolean_false:
        case CodeClass::none:
            drop_peeked();
            return true;

        case CodeClass::int8:
        case CodeClass::int16:
        case CodeClass::int32:
        case CodeClass::int64:
        case CodeClass::float32:
        case CodeClass::float64:
            drop_peeked();
            return skip_bytes(typecodes::payload_width(c));

        case CodeClass::fixed_string:
        case CodeClass::decimal_string: {
            std::uint64_t len;
            if (!read_string_header(b, c, len)) {
                return false;
            }
            return skip_bytes(len);
        }

        case CodeClass::open_list:
            return skip_container_entries<MAX_SKIP_NESTING>(depth, true, 0, 1);
        case CodeClass::fixed_list:
            return skip_container_entries<MAX_SKIP_NESTING>(depth, false, b - typecodes::LIST_FIXED_START, 1);
        case CodeClass::open_dict:
            return skip_container_entries<MAX_SKIP_NESTING>(depth, true, 0, 2);
        case CodeClass::fixed_dict:
            return skip_container_entries<MAX_SKIP_NESTING>(depth, false, b - typecodes::DICT_FIXED_START, 2);

        default:
            // terminator and reserved codes are rejected by peek_value_byte
            return false;
        }
    }
};

static_assert(reader::ReaderLike<RencodeReader<const std::uint8_t*, const std::uint8_t*>>);
static_assert(reader::ReaderLike<RencodeReader<const char*, const char*>>);


/// Push-style encoder into an output iterator range. Picks the smallest
/// representation for integers, strings and containers of known size.
template<class It, class Sent>
class RencodeWriter {
public:
    using RencodeWriterError = WriterError;
    using iterator_type = It;
    using error_type    = WriterError;

    static constexpr std::size_t UNKNOWN_SIZE = std::numeric_limits<std::size_t>::max();

    struct ArrayFrame {
        std::size_t expected_size = 0;  // UNKNOWN_SIZE when not announced
        std::size_t written       = 0;
        bool        open          = false;
    };

    struct MapFrame {
        std::size_t expected_pairs = 0;
        std::size_t written_pairs  = 0;
        bool        expecting_key  = true;
        bool        open           = false;
    };

    constexpr RencodeWriter(It first, Sent last)
        : m_current(first), end_(last)
    {}

    constexpr It & current() {
        return m_current;
    }

    constexpr std::size_t bytesWritten() const {
        return m_written;
    }

    constexpr error_type getError() const {
        return err_;
    }

    // ========= Containers =========

    constexpr bool write_array_begin(const std::size_t& size, ArrayFrame& frame) {
        frame.expected_size = size;
        frame.written       = 0;
        frame.open          = size >= typecodes::LIST_FIXED_COUNT;  // UNKNOWN_SIZE included
        if (frame.open) {
            return write_byte(typecodes::CHR_LIST);
        }
        return write_byte(static_cast<std::uint8_t>(typecodes::LIST_FIXED_START + size));
    }

    constexpr bool write_array_end(ArrayFrame& frame) {
        if (frame.expected_size != UNKNOWN_SIZE && frame.written != frame.expected_size) {
            setError(WriterError::invalid_argument);
            return false;
        }
        if (frame.open) {
            return write_byte(typecodes::CHR_TERM);
        }
        return true;
    }

    constexpr bool write_map_begin(const std::size_t& size, MapFrame& frame) {
        frame.expected_pairs = size;
        frame.written_pairs  = 0;
        frame.expecting_key  = true;
        frame.open           = size >= typecodes::DICT_FIXED_COUNT;
        if (frame.open) {
            return write_byte(typecodes::CHR_DICT);
        }
        return write_byte(static_cast<std::uint8_t>(typecodes::DICT_FIXED_START + size));
    }

    constexpr bool write_map_end(MapFrame& frame) {
        if (!frame.expecting_key ||
            (frame.expected_pairs != UNKNOWN_SIZE && frame.written_pairs != frame.expected_pairs)) {
            setError(WriterError::invalid_argument);
            return false;
        }
        if (frame.open) {
            return write_byte(typecodes::CHR_TERM);
        }
        return true;
    }

    // After every array element
    constexpr bool advance_after_value(ArrayFrame& frame) {
        if (frame.expected_size != UNKNOWN_SIZE && frame.written >= frame.expected_size) {
            setError(WriterError::invalid_argument);
            return false;
        }
        ++frame.written;
        return true;
    }

    // After every map value
    constexpr bool advance_after_value(MapFrame& frame) {
        if (frame.expecting_key) {
            setError(WriterError::invalid_argument);
            return false;
        }
        if (frame.expected_pairs != UNKNOWN_SIZE && frame.written_pairs >= frame.expected_pairs) {
            setError(WriterError::invalid_argument);
            return false;
        }
        ++frame.written_pairs;
        frame.expecting_key = true;
        return true;
    }

    // Between key and value
    constexpr bool move_to_value(MapFrame& frame) {
        if (!frame.expecting_key) {
            setError(WriterError::invalid_argument);
            return false;
        }
        frame.expecting_key = false;
        return true;
    }

    // ========= Primitive values =========

    constexpr bool write_null() {
        return write_byte(typecodes::CHR_NONE);
    }

    constexpr bool write_bool(const bool& b) {
        return write_byte(b ? typecodes::CHR_TRUE : typecodes::CHR_FALSE);
    }

    template<class NumberT>
    constexpr bool write_number(const NumberT& n) {
        if constexpr (std::is_integral_v<NumberT>) {
            if constexpr (std::is_unsigned_v<NumberT>) {
                if (static_cast<std::uint64_t>(n) > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    setError(WriterError::unsigned_out_of_range);
                    return false;
                }
            }
            return write_integral(static_cast<std::int64_t>(n));
        } else if constexpr (std::is_same_v<NumberT, float>) {
            return write_float32(n);
        } else if constexpr (std::is_floating_point_v<NumberT>) {
            // double / long double
            return write_float64(static_cast<double>(n));
        } else {
            static_assert(!sizeof(NumberT), "RencodeWriter::write_number only supports integral or floating point types");
        }
    }

    // With null_terminated, the string ends at the first NUL within `size`
    constexpr bool write_string(const char* data, std::size_t size, bool null_terminated = false) {
        if (null_terminated) {
            std::size_t len = 0;
            while (len < size && data[len] != '\0') {
                len ++;
            }
            size = len;
        }
        if (!write_string_header(size)) {
            return false;
        }
        for (std::size_t i = 0; i < size; ++i) {
            if (!write_byte(static_cast<std::uint8_t>(data[i]))) {
                return false;
            }
        }
        return true;
    }

    // ========= Finalization =========

    constexpr bool finish() {
        return err_ == WriterError::none;
    }

private:
    It m_current;
    Sent end_;
    std::size_t m_written = 0;
    error_type err_ = WriterError::none;

    constexpr void setError(error_type e) {
        if (err_ == WriterError::none) {
            err_ = e;
        }
    }

    constexpr bool write_byte(std::uint8_t b) {
        if (m_current == end_) {
            setError(WriterError::sink_error);
            return false;
        }
        *m_current = b;
        ++m_current;
        ++m_written;
        return true;
    }

    constexpr bool write_be(std::uint64_t bits, std::size_t width) {
        for (std::size_t i = width; i > 0; --i) {
            if (!write_byte(static_cast<std::uint8_t>((bits >> (8 * (i - 1))) & 0xFFu))) {
                return false;
            }
        }
        return true;
    }

    // Smallest representation wins
    constexpr bool write_integral(std::int64_t v) {
        if (v >= -static_cast<std::int64_t>(typecodes::INT_NEG_FIXED_COUNT) && v < 0) {
            return write_byte(static_cast<std::uint8_t>(typecodes::INT_NEG_FIXED_START - 1 - v));
        }
        if (v >= 0 && v < typecodes::INT_POS_FIXED_COUNT) {
            return write_byte(static_cast<std::uint8_t>(typecodes::INT_POS_FIXED_START + v));
        }
        const auto bits = static_cast<std::uint64_t>(v);
        if (v >= std::numeric_limits<std::int8_t>::lowest() && v <= std::numeric_limits<std::int8_t>::max()) {
            return write_byte(typecodes::CHR_INT1) && write_be(bits, 1);
        }
        if (v >= std::numeric_limits<std::int16_t>::lowest() && v <= std::numeric_limits<std::int16_t>::max()) {
            return write_byte(typecodes::CHR_INT2) && write_be(bits, 2);
        }
        if (v >= std::numeric_limits<std::int32_t>::lowest() && v <= std::numeric_limits<std::int32_t>::max()) {
            return write_byte(typecodes::CHR_INT4) && write_be(bits, 4);
        }
        return write_byte(typecodes::CHR_INT8) && write_be(bits, 8);
    }

    constexpr bool write_float32(float f) {
        static_assert(sizeof(float) == 4);
        return write_byte(typecodes::CHR_FLOAT32) && write_be(std::bit_cast<std::uint32_t>(f), 4);
    }

    constexpr bool write_float64(double d) {
        static_assert(sizeof(double) == 8);
        return write_byte(typecodes::CHR_FLOAT64) && write_be(std::bit_cast<std::uint64_t>(d), 8);
    }

    constexpr bool write_string_header(std::size_t size) {
        if (size < typecodes::STR_FIXED_COUNT) {
            return write_byte(static_cast<std::uint8_t>(typecodes::STR_FIXED_START + size));
        }
        char digits[20];
        std::size_t n = 0;
        do {
            digits[n++] = static_cast<char>('0' + size % 10);
            size /= 10;
        } while (size != 0);
        while (n > 0) {
            if (!write_byte(static_cast<std::uint8_t>(digits[--n]))) {
                return false;
            }
        }
        return write_byte(typecodes::STR_LENGTH_DELIM);
    }
};

static_assert(writer::WriterLike<RencodeWriter<std::uint8_t*, std::uint8_t*>>);
static_assert(writer::WriterLike<RencodeWriter<char*, char*>>);

} // namespace Rencode
