#pragma once

#include <string_view>

namespace Rencode {

// Mismatch between the decoded data and the target type
enum class ParseError {
    NO_ERROR,

    FIXED_SIZE_CONTAINER_OVERFLOW,

    NON_NUMERIC_IN_NUMERIC_STORAGE,
    FLOAT_IN_INTEGER_STORAGE,
    NON_BOOL_IN_BOOL_VALUE,
    NON_STRING_IN_STRING_STORAGE,
    NON_ARRAY_IN_ARRAY_LIKE_VALUE,
    NON_MAP_IN_MAP_LIKE_VALUE,
    NON_ARRAY_IN_DESTRUCTURED_STRUCT,
    NULL_IN_NON_OPTIONAL,

    EXCESS_FIELD,
    MISSING_FIELD,
    ARRAY_DESTRUCTURING_SCHEMA_ERROR,

    DATA_CONSUMER_ERROR,
    DUPLICATE_KEY_IN_MAP,

    READER_ERROR
};

constexpr std::string_view error_to_string(ParseError e) {
    switch(e) {
    case ParseError::NO_ERROR: return "NO_ERROR";
    case ParseError::FIXED_SIZE_CONTAINER_OVERFLOW: return "FIXED_SIZE_CONTAINER_OVERFLOW";
    case ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE: return "NON_NUMERIC_IN_NUMERIC_STORAGE";
    case ParseError::FLOAT_IN_INTEGER_STORAGE: return "FLOAT_IN_INTEGER_STORAGE";
    case ParseError::NON_BOOL_IN_BOOL_VALUE: return "NON_BOOL_IN_BOOL_VALUE";
    case ParseError::NON_STRING_IN_STRING_STORAGE: return "NON_STRING_IN_STRING_STORAGE";
    case ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE: return "NON_ARRAY_IN_ARRAY_LIKE_VALUE";
    case ParseError::NON_MAP_IN_MAP_LIKE_VALUE: return "NON_MAP_IN_MAP_LIKE_VALUE";
    case ParseError::NON_ARRAY_IN_DESTRUCTURED_STRUCT: return "NON_ARRAY_IN_DESTRUCTURED_STRUCT";
    case ParseError::NULL_IN_NON_OPTIONAL: return "NULL_IN_NON_OPTIONAL";
    case ParseError::EXCESS_FIELD: return "EXCESS_FIELD";
    case ParseError::MISSING_FIELD: return "MISSING_FIELD";
    case ParseError::ARRAY_DESTRUCTURING_SCHEMA_ERROR: return "ARRAY_DESTRUCTURING_SCHEMA_ERROR";
    case ParseError::DATA_CONSUMER_ERROR: return "DATA_CONSUMER_ERROR";
    case ParseError::DUPLICATE_KEY_IN_MAP: return "DUPLICATE_KEY_IN_MAP";
    case ParseError::READER_ERROR: return "READER_ERROR";
    }
    return "N/A";
}

enum class SerializeError {
    NO_ERROR,
    INPUT_STREAM_ERROR,   // a producing streamer reported an error
    WRITER_ERROR
};

constexpr std::string_view error_to_string(SerializeError e) {
    switch(e) {
    case SerializeError::NO_ERROR: return "NO_ERROR";
    case SerializeError::INPUT_STREAM_ERROR: return "INPUT_STREAM_ERROR";
    case SerializeError::WRITER_ERROR: return "WRITER_ERROR";
    }
    return "N/A";
}

} // namespace Rencode
