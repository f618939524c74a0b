#include <cassert>
#include <cstdint>
#include <iostream>
#include <list>
#include <iterator>
#include <map>
#include <sstream>
#include <string>
#include <vector>

#include <Rencode/parser.hpp>
#include <Rencode/serializer.hpp>
#include <Rencode/value.hpp>
#include <Rencode/error_formatting.hpp>

using Rencode::Value;
using Rencode::ParseError;
using Rencode::ReaderError;
using Bytes = std::vector<std::uint8_t>;

namespace {

Bytes encode(const auto & obj) {
    Bytes out;
    auto r = Rencode::Serialize(obj, out);
    if(!r) {
        std::cerr << Rencode::SerializeResultToString(r) << std::endl;
    }
    assert(r);
    return out;
}

Value decode(const Bytes & bytes) {
    Value v;
    auto r = Rencode::Parse(v, bytes);
    if(!r) {
        std::cerr << Rencode::ParseResultToString(r, bytes) << std::endl;
    }
    assert(r);
    return v;
}

Value list_of(std::initializer_list<Value> items) {
    return Value(Value::List(items));
}

void print(const Bytes & bytes) {
    for(std::uint8_t b : bytes) {
        std::cout << int(b) << ' ';
    }
    std::cout << std::endl;
}

} // namespace

int main() {

    // Canonical integer widths through the generic value
    {
        assert(encode(Value(5))   == Bytes({5}));
        assert(encode(Value(-5))  == Bytes({74}));
        assert(encode(Value(100)) == Bytes({62, 100}));
        assert(encode(Value(200)) == Bytes({63, 0, 200}));
        assert(encode(Value(100000)).front() == 64);
        assert(encode(Value(std::int64_t{400000000000})).front() == 65);
        assert(encode(Value(std::uint64_t{7})) == Bytes({7}));

        assert(decode(Bytes({74})) == Value(-5));
        assert(decode(Bytes({63, 0, 200})).type() == Value::Type::I64);
    }

    // Every variant round trips
    {
        Value::Dict inner;
        inner["flag"] = true;
        inner["ratio"] = 0.25;
        inner["none"] = nullptr;

        Value original = list_of({
            Value(), true, false,
            -32, -33, 43, 44, std::int64_t{-9000000000},
            std::uint64_t{1} << 40,
            1.5, std::string(64, 'x'), "short",
            list_of({1, list_of({2, list_of({3})})}),
            Value(inner)
        });

        const Bytes bytes = encode(original);
        Value decoded = decode(bytes);
        assert(decoded == original);
        assert(encode(decoded) == bytes);
    }

    // Integer variants compare by number
    {
        assert(Value(std::int64_t{3}) == Value(std::uint64_t{3}));
        assert(!(Value(std::int64_t{-1}) == Value(~std::uint64_t{0})));
        assert(!(Value(1) == Value(1.0)));
    }

    // Dict keys are emitted sorted, whatever the insertion order
    {
        Value::Dict d;
        d["b"] = 2;
        d["a"] = 1;
        d["c"] = 3;
        assert(encode(Value(d)) == Bytes({105, 129, 'a', 1, 129, 'b', 2, 129, 'c', 3}));

        Value decoded = decode(Bytes({104, 129, 'z', 0, 129, 'a', 1}));
        assert(encode(decoded) == Bytes({104, 129, 'a', 1, 129, 'z', 0}));
    }

    // Generic value errors
    {
        Value v;
        auto dup = Rencode::Parse(v, Bytes({104, 129, 'k', 1, 129, 'k', 2}));
        assert(!dup);
        assert(dup.error() == ParseError::DUPLICATE_KEY_IN_MAP);
        std::cerr << Rencode::ParseResultToString(dup, Bytes({104, 129, 'k', 1, 129, 'k', 2})) << std::endl;

        auto intKey = Rencode::Parse(v, Bytes({103, 1, 2}));
        assert(!intKey);
        assert(intKey.error() == ParseError::NON_STRING_IN_STRING_STORAGE);

        const Bytes reserved{194, 1, 45};
        auto bad = Rencode::Parse(v, reserved);
        assert(!bad);
        assert(bad.readerError() == ReaderError::UNKNOWN_TYPECODE);
        assert(bad.errorPath() == Rencode::path::Path(1));
        std::cerr << Rencode::ParseResultToString(bad, reserved) << std::endl;

        auto bare = Rencode::Parse(v, Bytes({127}));
        assert(!bare);
        assert(bare.readerError() == ReaderError::UNEXPECTED_END_OF_STRUCTURE);

        auto trailing = Rencode::Parse(v, Bytes({1, 2}));
        assert(!trailing);
        assert(trailing.readerError() == ReaderError::EXCESS_CHARACTERS);
    }

    // Nesting guard
    {
        Bytes deep(300, 193);
        deep.push_back(0);

        Value v;
        auto r = Rencode::Parse(v, deep);
        assert(!r);
        assert(r.readerError() == ReaderError::NESTING_DEPTH_EXCEEDED);

        auto shallow = Rencode::Parse(v, Bytes({193, 193, 0}), Rencode::ReaderLimits{.max_depth = 2});
        assert(shallow);
        auto tooDeep = Rencode::Parse(v, Bytes({193, 193, 193, 0}), Rencode::ReaderLimits{.max_depth = 2});
        assert(!tooDeep);
        assert(tooDeep.readerError() == ReaderError::NESTING_DEPTH_EXCEEDED);

        auto longString = Rencode::Parse(v, Bytes({'9', '9', '9', '9', '9', ':'}), Rencode::ReaderLimits{.max_string_length = 1024});
        assert(!longString);
        assert(longString.readerError() == ReaderError::STRING_LENGTH_LIMIT_EXCEEDED);
    }

    // Standard maps, including integer keys
    {
        std::map<int, std::string> m{{1, "a"}};
        assert(encode(m) == Bytes({103, 1, 129, 97}));

        std::map<int, int> parsed;
        assert(Rencode::Parse(parsed, Bytes({104, 1, 2, 3, 4})));
        assert((parsed == std::map<int, int>{{1, 2}, {3, 4}}));

        std::map<std::string, int> big;
        for(int i = 0; i < 80; i ++) {
            big["key" + std::to_string(i)] = i;
        }
        const Bytes bytes = encode(big);
        assert(bytes.front() == 60);
        assert(bytes.back() == 127);

        std::map<std::string, int> back;
        assert(Rencode::Parse(back, bytes));
        assert(back == big);

        std::map<int, int> dup;
        auto r = Rencode::Parse(dup, Bytes({104, 1, 2, 1, 3}));
        assert(!r);
        assert(r.error() == ParseError::DUPLICATE_KEY_IN_MAP);
        assert(r.errorPath() == Rencode::path::Path("1"));
    }

    // Standard lists
    {
        std::list<std::string> names{"ann", "bob"};
        const Bytes bytes = encode(names);
        assert(bytes == Bytes({194, 131, 'a', 'n', 'n', 131, 'b', 'o', 'b'}));

        std::list<std::string> back{"stale"};
        assert(Rencode::Parse(back, bytes));
        assert(back == names);

        std::list<int> many(80, 1);
        const Bytes open = encode(many);
        assert(open.size() == 82);
        assert(open.front() == 59);
        assert(open.back() == 127);
    }

    // Open containers nested in an open map
    {
        const Bytes nested{60, 129, 'a', 60, 129, 'b', 1, 127, 129, 'c', 59, 2, 127, 127};
        Value::Dict inner;
        inner["b"] = 1;
        Value::Dict outer;
        outer["a"] = Value(inner);
        outer["c"] = list_of({2});

        Value decoded = decode(nested);
        assert(decoded == Value(outer));
        assert(encode(decoded) == Bytes({104, 129, 'a', 103, 129, 'b', 1, 129, 'c', 193, 2}));
    }

    // Values sent back to back on one stream
    {
        std::istringstream stream(std::string("\x05\x82" "ab", 4));
        std::istreambuf_iterator<char> it(stream), end;

        Value first;
        auto r1 = Rencode::ParseOne(first, it, end);
        assert(r1);
        assert(first == Value(5));
        assert(r1.offset() == 1);

        std::string second;
        auto r2 = Rencode::ParseOne(second, r1.pos(), end);
        assert(r2);
        assert(second == "ab");
        assert(r2.pos() == end);

        Value none;
        auto r3 = Rencode::ParseOne(none, r2.pos(), end);
        assert(!r3);
        assert(r3.readerError() == ReaderError::UNEXPECTED_END_OF_DATA);
    }

    {
        std::string wire;
        for(int i = 0; i < 3; i ++) {
            Value::Dict msg;
            msg["seq"] = i;
            msg["body"] = std::string(70 * i, 'm');
            const Bytes one = encode(Value(msg));
            wire.append(one.begin(), one.end());
        }

        std::istringstream stream(wire);
        std::istreambuf_iterator<char> it(stream), end;
        std::vector<Value> received;
        while(it != end) {
            Value v;
            auto r = Rencode::ParseOne(v, it, end);
            if(!r) {
                std::cerr << Rencode::ParseResultToString(r, wire) << std::endl;
            }
            assert(r);
            received.push_back(std::move(v));
            it = r.pos();
        }
        assert(received.size() == 3);
        assert(*received[2].get_if<Value::Dict>()->find("seq") == Value(2));

        // Parse wants the stream to end after the value
        std::istringstream again(wire);
        Value v;
        auto whole = Rencode::Parse(v, std::istreambuf_iterator<char>(again), std::istreambuf_iterator<char>());
        assert(!whole);
        assert(whole.readerError() == ReaderError::EXCESS_CHARACTERS);
    }

    // Writer failure reporting
    {
        std::uint8_t buf[2];
        auto r = Rencode::Serialize(std::string("abc"), buf, buf + 2);
        assert(!r);
        assert(r.error() == Rencode::SerializeError::WRITER_ERROR);
        assert(r.writerError() == Rencode::WriterError::sink_error);
        std::cerr << Rencode::SerializeResultToString(r) << std::endl;

        Bytes out;
        auto big = Rencode::Serialize(Value(~std::uint64_t{0}), out);
        assert(!big);
        assert(big.writerError() == Rencode::WriterError::unsigned_out_of_range);
    }

    {
        Value::Dict d;
        d["pi"] = 3.25;
        d["tags"] = list_of({"x", "y"});
        print(encode(Value(d)));
    }

    std::cout << "value tests passed" << std::endl;
    return 0;
}
