#include "../test_helpers.hpp"
#include <string>
#include <vector>

using namespace TestHelpers;
using Rencode::ReaderError;

namespace value_sequence_test {

struct Header {
    int version;
    std::string kind;
};

} // namespace value_sequence_test

using namespace value_sequence_test;

// ============================================================================
// ParseOne stops after one value and reports where the next one starts
// ============================================================================

static_assert([]() constexpr {
    Bytes in = B({5, 130, 'a', 'b'});
    int first = 0;
    auto r1 = Rencode::ParseOne(first, in.begin(), in.end());
    if (!r1 || first != 5 || r1.offset() != 1 || r1.pos() != in.begin() + 1) return false;

    std::string second;
    auto r2 = Rencode::ParseOne(second, r1.pos(), in.end());
    return r2 && second == "ab" && r2.offset() == 3 && r2.pos() == in.end();
}(), "two values back to back");

static_assert([]() constexpr {
    Bytes in = B({59, 1, 127, 193, 2, 7});
    std::vector<int> a, b;
    int c = 0;
    auto r1 = Rencode::ParseOne(a, in.begin(), in.end());
    auto r2 = Rencode::ParseOne(b, r1.pos(), in.end());
    auto r3 = Rencode::ParseOne(c, r2.pos(), in.end());
    return r1 && r2 && r3
        && r1.offset() == 3 && r2.offset() == 2 && r3.offset() == 1
        && a == std::vector<int>{1} && b == std::vector<int>{2} && c == 7;
}(), "containers end at their own last byte");

static_assert([]() constexpr {
    Bytes in = Cat(Encode(Header{2, "log"}), Encode(Header{3, "tail"}));
    std::vector<Header> headers;
    auto it = in.begin();
    while (it != in.end()) {
        Header h{};
        auto r = Rencode::ParseOne(h, it, in.end());
        if (!r) return false;
        headers.push_back(h);
        it = r.pos();
    }
    return headers.size() == 2 && headers[1].version == 3 && headers[1].kind == "tail";
}(), "a stream of records");

static_assert([]() constexpr {
    Bytes in = B({5});
    int v = 0;
    auto r = Rencode::ParseOne(v, in.begin() + 1, in.end());
    return !r && r.readerError() == ReaderError::UNEXPECTED_END_OF_DATA;
}(), "nothing left to read");

static_assert([]() constexpr {
    Bytes in = B({130, 'a', 5});
    int v = 0;
    auto r = Rencode::ParseOne(v, in);
    return !r && r.error() == Rencode::ParseError::NON_NUMERIC_IN_NUMERIC_STORAGE;
}(), "type mismatch");

// Parse keeps requiring the whole input
static_assert([]() constexpr {
    int v = 0;
    return ParseFailsWith(v, B({5, 130, 'a', 'b'}), ReaderError::EXCESS_CHARACTERS) && v == 5;
}());
