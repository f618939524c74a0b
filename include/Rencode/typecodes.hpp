#pragma once

#include <cstdint>
#include <cstddef>

namespace Rencode {

namespace typecodes {

// Explicit-width and marker codes
constexpr std::uint8_t CHR_LIST    = 59;
constexpr std::uint8_t CHR_DICT    = 60;
constexpr std::uint8_t CHR_INT1    = 62;
constexpr std::uint8_t CHR_INT2    = 63;
constexpr std::uint8_t CHR_INT4    = 64;
constexpr std::uint8_t CHR_INT8    = 65;
constexpr std::uint8_t CHR_FLOAT32 = 66;
constexpr std::uint8_t CHR_FLOAT64 = 44;
constexpr std::uint8_t CHR_TRUE    = 67;
constexpr std::uint8_t CHR_FALSE   = 68;
constexpr std::uint8_t CHR_NONE    = 69;
constexpr std::uint8_t CHR_TERM    = 127;

// Separator of the decimal-length string form: "<digits>:<bytes>"
constexpr std::uint8_t STR_LENGTH_DELIM = ':';

// Embedded ranges: [START, START + COUNT)
constexpr std::uint8_t INT_POS_FIXED_START = 0;
constexpr std::uint8_t INT_POS_FIXED_COUNT = 44;

constexpr std::uint8_t INT_NEG_FIXED_START = 70;
constexpr std::uint8_t INT_NEG_FIXED_COUNT = 32;

constexpr std::uint8_t DICT_FIXED_START = 102;
constexpr std::uint8_t DICT_FIXED_COUNT = 25;

constexpr std::uint8_t STR_FIXED_START = 128;
constexpr std::uint8_t STR_FIXED_COUNT = 64;

constexpr std::uint8_t LIST_FIXED_START = 192;
constexpr std::uint8_t LIST_FIXED_COUNT = 64;

enum class CodeClass : std::uint8_t {
    positive_int,    // 0..43, value = byte
    negative_int,    // 70..101, value = 69 - byte
    int8,
    int16,
    int32,
    int64,
    float32,
    float64,
    boolean_true,
    boolean_false,
    none,
    decimal_string,  // '0'..'9'
    fixed_string,    // 128..191
    open_list,
    fixed_list,      // 192..255
    open_dict,
    fixed_dict,      // 102..126
    terminator,
    reserved         // 45..47, 58, 61
};

constexpr bool is_digit(std::uint8_t b) {
    return b >= '0' && b <= '9';
}

constexpr bool in_range(std::uint8_t b, std::uint8_t start, std::uint8_t count) {
    return b >= start && static_cast<unsigned>(b) < static_cast<unsigned>(start) + count;
}

constexpr bool is_embedded_positive_int(std::uint8_t b) {
    return in_range(b, INT_POS_FIXED_START, INT_POS_FIXED_COUNT);
}
constexpr bool is_embedded_negative_int(std::uint8_t b) {
    return in_range(b, INT_NEG_FIXED_START, INT_NEG_FIXED_COUNT);
}
constexpr bool is_fixed_dict(std::uint8_t b) {
    return in_range(b, DICT_FIXED_START, DICT_FIXED_COUNT);
}
constexpr bool is_fixed_string(std::uint8_t b) {
    return in_range(b, STR_FIXED_START, STR_FIXED_COUNT);
}
constexpr bool is_fixed_list(std::uint8_t b) {
    return in_range(b, LIST_FIXED_START, LIST_FIXED_COUNT);
}

// Digits are tested first: the decimal-length string form owns '0'..'9'.
constexpr CodeClass classify(std::uint8_t b) {
    if (is_digit(b))                  return CodeClass::decimal_string;
    if (is_embedded_positive_int(b))  return CodeClass::positive_int;
    if (is_embedded_negative_int(b))  return CodeClass::negative_int;
    if (is_fixed_string(b))           return CodeClass::fixed_string;
    if (is_fixed_list(b))             return CodeClass::fixed_list;
    if (is_fixed_dict(b))             return CodeClass::fixed_dict;

    switch (b) {
    case CHR_LIST:    return CodeClass::open_list;
    case CHR_DICT:    return CodeClass::open_dict;
    case CHR_INT1:    return CodeClass::int8;
    case CHR_INT2:    return CodeClass::int16;
    case CHR_INT4:    return CodeClass::int32;
    case CHR_INT8:    return CodeClass::int64;
    case CHR_FLOAT32: return CodeClass::float32;
    case CHR_FLOAT64: return CodeClass::float64;
    case CHR_TRUE:    return CodeClass::boolean_true;
    case CHR_FALSE:   return CodeClass::boolean_false;
    case CHR_NONE:    return CodeClass::none;
    case CHR_TERM:    return CodeClass::terminator;
    default:          return CodeClass::reserved;
    }
}

// Payload width in bytes of the explicit-width numeric codes, 0 otherwise
constexpr std::size_t payload_width(CodeClass c) {
    switch (c) {
    case CodeClass::int8:    return 1;
    case CodeClass::int16:   return 2;
    case CodeClass::int32:   return 4;
    case CodeClass::int64:   return 8;
    case CodeClass::float32: return 4;
    case CodeClass::float64: return 8;
    default:                 return 0;
    }
}

namespace detail {

// Every byte value must belong to exactly one range/marker.
consteval bool ranges_are_disjoint() {
    for (unsigned v = 0; v < 256; ++v) {
        const auto b = static_cast<std::uint8_t>(v);
        int owners = 0;
        owners += is_digit(b) ? 1 : 0;
        owners += is_embedded_positive_int(b) && !is_digit(b) ? 1 : 0;
        owners += is_embedded_negative_int(b) ? 1 : 0;
        owners += is_fixed_dict(b) ? 1 : 0;
        owners += is_fixed_string(b) ? 1 : 0;
        owners += is_fixed_list(b) ? 1 : 0;
        const std::uint8_t markers[] = {CHR_LIST, CHR_DICT, CHR_INT1, CHR_INT2, CHR_INT4, CHR_INT8,
                                        CHR_FLOAT32, CHR_FLOAT64, CHR_TRUE, CHR_FALSE, CHR_NONE, CHR_TERM};
        for (std::uint8_t m : markers) {
            owners += (m == b) ? 1 : 0;
        }
        const bool reserved = b == 45 || b == 46 || b == 47 || b == 58 || b == 61;
        if (reserved ? owners != 0 : owners != 1) {
            return false;
        }
        if (reserved != (classify(b) == CodeClass::reserved)) {
            return false;
        }
    }
    return true;
}

} // namespace detail

static_assert(detail::ranges_are_disjoint(), "[[[ Rencode ]]] typecode ranges overlap");
static_assert(INT_POS_FIXED_START + INT_POS_FIXED_COUNT == CHR_FLOAT64);
static_assert(DICT_FIXED_START + DICT_FIXED_COUNT == CHR_TERM);

} // namespace typecodes

} // namespace Rencode
