#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <iterator>
#include <ranges>
#include <string>
#include <type_traits>

#include "errors.hpp"
#include "path.hpp"
#include "parse_result.hpp"
#include "rencode.hpp"
#include "serializer.hpp"

namespace Rencode {

namespace error_formatting_detail {

// $.items[2].name
inline std::string path_to_string(const path::Path & p) {
    std::string out = "$";
    for(std::size_t i = 0; i < p.size(); i ++) {
        if(p[i].is_index()) {
            out += std::format("[{}]", p[i].array_index);
        } else {
            out += std::format(".{}", p[i].key());
        }
    }
    return out;
}

}

/// Human readable description of a failed parse: error path, error names
/// and a hex dump of the input around the failing byte, e.g.
///
///     When parsing $.tags[1], parsing error 'READER_ERROR' (reader error
///     'UNKNOWN_TYPECODE') at byte 5: 'c3 02 83 61 62 [2d] 01'
template <class InpIter, class ReaderErrorT, class DataIter>
std::string ParseResultToString(const ParseResult<InpIter, ReaderErrorT> & res, DataIter inp, const DataIter end, std::size_t window = 8) {
    if(res) {
        return "no error";
    }
    std::string text = std::format("When parsing {}, parsing error '{}'",
                                   error_formatting_detail::path_to_string(res.errorPath()),
                                   error_to_string(res.error()));
    if constexpr (std::is_same_v<ReaderErrorT, ReaderError>) {
        if(res.readerError() != ReaderError::NO_ERROR) {
            text += std::format(" (reader error '{}')", reader_error_to_string(res.readerError()));
        }
    }
    text += std::format(" at byte {}", res.offset());

    const auto total = static_cast<std::size_t>(std::distance(inp, end));
    const std::size_t pos  = std::min(res.offset(), total);
    const std::size_t from = pos > window ? pos - window : 0;
    const std::size_t to   = std::min(total, pos + window + 1);

    std::string fragment = from > 0 ? "..." : "";
    std::size_t i = 0;
    for(DataIter it = inp; it != end && i < to; ++it, ++i) {
        if(i < from) {
            continue;
        }
        if(!fragment.empty() && fragment != "...") {
            fragment += ' ';
        }
        const auto byte = static_cast<unsigned>(static_cast<std::uint8_t>(*it));
        fragment += i == pos ? std::format("[{:02x}]", byte) : std::format("{:02x}", byte);
    }
    if(pos >= total) {
        fragment += " [end]";
    } else if(to < total) {
        fragment += "...";
    }
    return std::format("{}: '{}'", text, fragment);
}

template <class InpIter, class ReaderErrorT, class Container>
std::string ParseResultToString(const ParseResult<InpIter, ReaderErrorT> & res, const Container & input, std::size_t window = 8) {
    return ParseResultToString(res, std::ranges::begin(input), std::ranges::end(input), window);
}

template <class OutIter, class WriterErrorT>
std::string SerializeResultToString(const SerializeResult<OutIter, WriterErrorT> & res) {
    if(res) {
        return "no error";
    }
    std::string text = std::format("Serialization error '{}'", error_to_string(res.error()));
    if constexpr (std::is_same_v<WriterErrorT, WriterError>) {
        if(res.writerError() != WriterError::none) {
            text += std::format(" (writer error '{}')", writer_error_to_string(res.writerError()));
        }
    }
    return std::format("{} after {} bytes", text, res.bytesWritten());
}

} // namespace Rencode
