#include "../test_helpers.hpp"
#include <array>
#include <string>
#include <vector>

using namespace TestHelpers;
using Rencode::ParseError;
using Rencode::ReaderError;

// ============================================================================
// Fixed and open forms
// ============================================================================

static_assert(TestParse(B({195, 1, 2, 3}), std::vector<int>{1, 2, 3}));
static_assert(TestParse(B({192}), std::vector<int>{}));
static_assert(TestParse(B({59, 1, 2, 3, 127}), std::vector<int>{1, 2, 3}));
static_assert(TestParse(B({59, 127}), std::vector<int>{}));
static_assert(TestParse(Cat(B({59}), Repeat(1, 80), B({127})), std::vector<int>(80, 1)));
static_assert(TestParse(B({194, 131, 97, 98, 99, 128}), std::vector<std::string>{"abc", ""}));

// ============================================================================
// A terminator belongs to the innermost open list
// ============================================================================

static_assert(TestParse(B({59, 59, 1, 127, 59, 2, 3, 127, 127}),
                        std::vector<std::vector<int>>{{1}, {2, 3}}));
static_assert(TestParse(B({59, 194, 1, 2, 59, 127, 127}),
                        std::vector<std::vector<int>>{{1, 2}, {}}), "fixed inside open");
static_assert(TestParse(B({194, 59, 1, 127, 193, 2}),
                        std::vector<std::vector<int>>{{1}, {2}}), "open inside fixed");

static_assert(TestParseError<std::vector<std::vector<int>>>(B({59, 59, 1, 127}), ReaderError::UNEXPECTED_END_OF_DATA),
              "outer list left open");
static_assert(TestParseError<std::vector<int>>(B({194, 1}), ReaderError::UNEXPECTED_END_OF_DATA),
              "fixed list shorter than its count");
static_assert(TestParseError<std::vector<int>>(B({193, 127}), ReaderError::UNEXPECTED_END_OF_STRUCTURE),
              "terminator inside a fixed list");
static_assert(TestParseError<std::vector<int>>(B({194, 1, 2, 3}), ReaderError::EXCESS_CHARACTERS));

// ============================================================================
// Fixed-capacity storage
// ============================================================================

static_assert(TestParse(B({195, 1, 2, 3}), std::array<int, 3>{1, 2, 3}));
static_assert(TestParseError<std::array<int, 2>>(B({195, 1, 2, 3}), ParseError::FIXED_SIZE_CONTAINER_OVERFLOW));
static_assert(TestParseError<std::array<int, 2>>(B({59, 1, 2, 3, 127}), ParseError::FIXED_SIZE_CONTAINER_OVERFLOW));
static_assert(TestParse<std::array<int, 4>>(B({194, 5, 6}), [](const std::array<int, 4>& a) {
    return a[0] == 5 && a[1] == 6;
}), "shorter input fills a prefix");

static_assert([]() constexpr {
    int raw[3] = {};
    return ParseSucceeds(raw, B({195, 4, 5, 6})) && raw[0] == 4 && raw[2] == 6;
}(), "C arrays");

// ============================================================================
// Reuse of storage
// ============================================================================

static_assert([]() constexpr {
    std::vector<int> v{9, 9, 9};
    return ParseSucceeds(v, B({193, 1})) && v == std::vector<int>{1};
}(), "parsing replaces previous content");

// ============================================================================
// Kind mismatches
// ============================================================================

static_assert(TestParseError<std::vector<int>>(B({5}), ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE));
static_assert(TestParseError<std::vector<int>>(B({102}), ParseError::NON_ARRAY_IN_ARRAY_LIKE_VALUE));
static_assert(TestParseError<std::vector<int>>(B({194, 1, 67}), ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE));
