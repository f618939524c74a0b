#pragma once

#include <cstddef>

#include "path.hpp"
#include "errors.hpp"

namespace Rencode {

template <class InpIter, class ReaderError>
class ParseResult {
    ParseError m_error = ParseError::NO_ERROR;
    ReaderError m_readerError{};
    InpIter m_pos;
    std::size_t m_offset = 0;
    path::Path currentPath;

public:
    using iterator_type = InpIter;
    constexpr ParseResult(ParseError err, ReaderError rerr, InpIter pos, std::size_t offset, path::Path errPath):
        m_error(err), m_readerError(rerr), m_pos(pos), m_offset(offset), currentPath(std::move(errPath))
    {}
    constexpr operator bool() const {
        return m_error == ParseError::NO_ERROR;
    }
    constexpr InpIter pos() const {
        return m_pos;
    }
    // Bytes consumed before the call returned
    constexpr std::size_t offset() const {
        return m_offset;
    }
    constexpr ParseError error() const {
        return m_error;
    }
    constexpr ReaderError readerError() const {
        return m_readerError;
    }
    constexpr const path::Path & errorPath() const {
        return currentPath;
    }
};

} // namespace Rencode
