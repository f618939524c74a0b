#include "../test_helpers.hpp"
#include <cstdint>
#include <limits>

using namespace TestHelpers;
using Rencode::ParseError;
using Rencode::ReaderError;

// ============================================================================
// Every integer form decodes into int64
// ============================================================================

static_assert(TestParse(B({5}), std::int64_t{5}));
static_assert(TestParse(B({74}), std::int64_t{-5}));
static_assert(TestParse(B({62, 100}), std::int64_t{100}));
static_assert(TestParse(B({62, 156}), std::int64_t{-100}));
static_assert(TestParse(B({63, 0, 200}), std::int64_t{200}));
static_assert(TestParse(B({63, 255, 56}), std::int64_t{-200}));
static_assert(TestParse(B({64, 0, 1, 134, 160}), std::int64_t{100000}));
static_assert(TestParse(B({64, 255, 254, 121, 96}), std::int64_t{-100000}));
static_assert(TestParse(B({65, 0, 0, 0, 93, 33, 219, 160, 0}), std::int64_t{400000000000}));
static_assert(TestParse(B({65, 255, 255, 255, 162, 222, 36, 96, 0}), std::int64_t{-400000000000}));

static_assert(TestParse(B({62, 223}), -33));
static_assert(TestParse(B({101}), -32));
static_assert(TestParse(B({70}), -1));
static_assert(TestParse(B({43}), 43));
static_assert(TestParse(B({0}), 0));

// ============================================================================
// Non-canonical widths are accepted
// ============================================================================

static_assert(TestParse(B({62, 5}), 5), "small value in the int8 form");
static_assert(TestParse(B({65, 0, 0, 0, 0, 0, 0, 0, 7}), 7), "small value in the int64 form");
static_assert(TestParse(B({63, 255, 255}), -1), "sign extension of int16");

// ============================================================================
// Range of the target storage
// ============================================================================

static_assert(TestParse(B({63, 0, 200}), std::uint8_t{200}));
static_assert(TestParse(B({62, 128}), std::int8_t{-128}));
static_assert(TestParseError<std::int8_t>(B({63, 0, 200}), ReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE));
static_assert(TestParseError<std::uint8_t>(B({74}), ReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE),
              "negative into unsigned");
static_assert(TestParseError<std::uint16_t>(B({64, 0, 1, 0, 0}), ReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE));
static_assert(TestParseError<std::int32_t>(B({65, 0, 0, 0, 1, 0, 0, 0, 0}), ReaderError::NUMERIC_VALUE_IS_OUT_OF_STORAGE_TYPE_RANGE));
static_assert(TestParse(B({65, 127, 255, 255, 255, 255, 255, 255, 255}), std::numeric_limits<std::uint64_t>::max() / 2));
static_assert(TestParse(B({65, 128, 0, 0, 0, 0, 0, 0, 0}), std::numeric_limits<std::int64_t>::min()));

// ============================================================================
// Integers are accepted by floating storage
// ============================================================================

static_assert(TestParse(B({5}), 5.0));
static_assert(TestParse(B({74}), -5.0f));
static_assert(TestParse(B({64, 0, 1, 134, 160}), 100000.0));

// ============================================================================
// Other kinds in integer storage
// ============================================================================

static_assert(TestParseError<int>(B({66, 0x3F, 0xC0, 0, 0}), ParseError::FLOAT_IN_INTEGER_STORAGE));
static_assert(TestParseError<int>(B({44, 0x3F, 0xF8, 0, 0, 0, 0, 0, 0}), ParseError::FLOAT_IN_INTEGER_STORAGE));
static_assert(TestParseError<int>(B({67}), ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE));
static_assert(TestParseError<int>(B({131, 97, 98, 99}), ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE));
static_assert(TestParseError<int>(B({192}), ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE));
static_assert(TestParseError<int>(B({69}), ParseError::NULL_IN_NON_OPTIONAL));
