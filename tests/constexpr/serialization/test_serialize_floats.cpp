#include "../test_helpers.hpp"
#include <limits>

using namespace TestHelpers;

// ============================================================================
// float is written as F32 (code 66), double as F64 (code 44), big-endian
// ============================================================================

static_assert(TestSerialize(1.5f, B({66, 0x3F, 0xC0, 0x00, 0x00})));
static_assert(TestSerialize(0.5f, B({66, 0x3F, 0x00, 0x00, 0x00})));
static_assert(TestSerialize(-2.0f, B({66, 0xC0, 0x00, 0x00, 0x00})));
static_assert(TestSerialize(0.0f, B({66, 0, 0, 0, 0})));

static_assert(TestSerialize(1.5, B({44, 0x3F, 0xF8, 0, 0, 0, 0, 0, 0})));
static_assert(TestSerialize(-2.0, B({44, 0xC0, 0x00, 0, 0, 0, 0, 0, 0})));
static_assert(TestSerialize(0.0, B({44, 0, 0, 0, 0, 0, 0, 0, 0})));

static_assert(TestSerialize(std::numeric_limits<double>::infinity(),
                            B({44, 0x7F, 0xF0, 0, 0, 0, 0, 0, 0})));

// ============================================================================
// Integral-valued floats keep their float encoding
// ============================================================================

static_assert(Encode(3.0).size() == 9);
static_assert(Encode(3.0f).size() == 5);
static_assert(Encode(std::vector<double>{1.0, 2.0}).size() == 1 + 2 * 9);
