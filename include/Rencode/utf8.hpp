#pragma once

#include <cstdint>

namespace Rencode {

namespace utf8 {

// Incremental UTF-8 checker (RFC 3629): rejects overlong forms, surrogates
// and code points above U+10FFFF. Bytes may arrive split across chunks.
class Validator {
    std::uint8_t need_ = 0;     // continuation bytes still expected
    std::uint8_t lo_   = 0x80;  // allowed range of the next continuation byte
    std::uint8_t hi_   = 0xBF;

    constexpr bool expect(std::uint8_t n, std::uint8_t lo, std::uint8_t hi) {
        need_ = n;
        lo_ = lo;
        hi_ = hi;
        return true;
    }

public:
    constexpr void reset() {
        need_ = 0;
        lo_ = 0x80;
        hi_ = 0xBF;
    }

    constexpr bool feed(std::uint8_t b) {
        if (need_ == 0) {
            if (b < 0x80)                          return true;
            if (b >= 0xC2 && b <= 0xDF)            return expect(1, 0x80, 0xBF);
            if (b == 0xE0)                         return expect(2, 0xA0, 0xBF);
            if (b == 0xED)                         return expect(2, 0x80, 0x9F); // no surrogates
            if (b >= 0xE1 && b <= 0xEF)            return expect(2, 0x80, 0xBF);
            if (b == 0xF0)                         return expect(3, 0x90, 0xBF);
            if (b >= 0xF1 && b <= 0xF3)            return expect(3, 0x80, 0xBF);
            if (b == 0xF4)                         return expect(3, 0x80, 0x8F);
            return false;
        }
        if (b < lo_ || b > hi_) {
            return false;
        }
        lo_ = 0x80;
        hi_ = 0xBF;
        --need_;
        return true;
    }

    constexpr bool complete() const {
        return need_ == 0;
    }
};

} // namespace utf8

} // namespace Rencode
