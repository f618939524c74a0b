#include "../test_helpers.hpp"
#include <array>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace TestHelpers;
using Rencode::A;
using Rencode::BasicDict;
namespace options = Rencode::options;

namespace roundtrip_models_test {

struct Limits {
    std::int8_t   i8;
    std::uint8_t  u8;
    std::int16_t  i16;
    std::uint16_t u16;
    std::int32_t  i32;
    std::uint32_t u32;
    std::int64_t  i64;
    std::uint64_t u64;
};

struct Sample {
    float  f;
    double d;
    bool   on;
};

struct Tag {
    std::string name;
    std::optional<int> weight;
};

struct Document {
    std::string title;
    std::string body;
    std::vector<Tag> tags;
    std::vector<std::int64_t> history;
    BasicDict<std::string> meta;
    std::array<char, 16> code;
    std::unique_ptr<Tag> pinned;
    A<Tag, options::as_array> summary;
};

struct Reading {
    int x;
    std::vector<int> y;
};

} // namespace roundtrip_models_test

using namespace roundtrip_models_test;

// ============================================================================
// Integer storage limits
// ============================================================================

static_assert(TestRoundTrip(Limits{
    std::numeric_limits<std::int8_t>::min(),  std::numeric_limits<std::uint8_t>::max(),
    std::numeric_limits<std::int16_t>::min(), std::numeric_limits<std::uint16_t>::max(),
    std::numeric_limits<std::int32_t>::min(), std::numeric_limits<std::uint32_t>::max(),
    std::numeric_limits<std::int64_t>::min(), static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())
}));

static_assert(TestRoundTrip(Limits{-1, 0, 44, 43, -32, 127, -33, 128}));

// ============================================================================
// Floats keep their width
// ============================================================================

static_assert(TestRoundTrip(Sample{0.1f, 0.1, true}));
static_assert(TestRoundTrip(Sample{-0.0f, 1e300, false}));
static_assert(TestRoundTrip(std::vector<double>{std::numeric_limits<double>::denorm_min(),
                                                std::numeric_limits<double>::max()}));

// ============================================================================
// Strings across the fixed/decimal boundary
// ============================================================================

static_assert([]() constexpr {
    for (std::size_t n : {0u, 1u, 62u, 63u, 64u, 65u, 99u, 100u, 1000u}) {
        if (!TestRoundTrip(std::string(n, 's'))) return false;
    }
    return true;
}());

// ============================================================================
// Containers across the fixed/open boundary
// ============================================================================

static_assert([]() constexpr {
    for (std::size_t n : {0u, 1u, 63u, 64u, 65u, 200u}) {
        if (!TestRoundTrip(std::vector<int>(n, 44))) return false;
    }
    return true;
}());

static_assert([]() constexpr {
    for (int n : {0, 1, 24, 25, 26, 100}) {
        BasicDict<int> d;
        for (int i = 0; i < n; ++i) {
            d.insert_or_assign("k" + std::string(1, static_cast<char>('A' + i % 26)) + std::string(1, static_cast<char>('a' + i / 26)), i);
        }
        if (!TestRoundTrip(d)) return false;
    }
    return true;
}());

// ============================================================================
// Whole document
// ============================================================================

static_assert([]() constexpr {
    Document doc;
    doc.title = "Notes";
    doc.body = std::string(300, 'b');
    doc.tags = {{"a", 1}, {"b", std::nullopt}};
    for (std::int64_t i = -40; i < 40; ++i) {
        doc.history.push_back(i * 1000003);
    }
    doc.meta["lang"] = "en";
    doc.meta["rev"] = "7";
    doc.code = {'X', '1', '\0'};
    doc.pinned = std::make_unique<Tag>(Tag{"p", 3});
    doc.summary = Tag{"s", std::nullopt};
    return TestRoundTrip(doc) && TestReencodeStable(doc);
}(), "document round trip");

// ============================================================================
// Canonical input decodes and re-encodes to the same bytes
// ============================================================================

static_assert([]() constexpr {
    Bytes canonical = B({104, 129, 'x', 62, 100, 129, 'y', 194, 74, 0});
    Reading r{};
    return ParseSucceeds(r, canonical) && r.x == 100 && Encode(r) == canonical;
}());

static_assert([]() constexpr {
    std::vector<std::vector<std::int64_t>> v;
    Bytes canonical = Cat(B({194, 59}), Repeat(7, 70), B({127, 195, 65, 0, 0, 0, 93, 33, 219, 160, 0, 74, 0}));
    return ParseSucceeds(v, canonical) && Encode(v) == canonical;
}());
