#pragma once

#include <cstdint>

#include "source.hpp"

namespace smir {

struct SourceLoc {
    std::uint32_t line = 1;
    std::uint32_t column = 1;
    std::uint32_t offset = 0;  // byte offset into the file text
};

struct Span {
    FileId file = 0;
    SourceLoc begin{};
    SourceLoc end{};

    bool from_expansion = false;

    bool operator==(const Span& o) const {
        return file == o.file && begin.offset == o.begin.offset &&
               end.offset == o.end.offset &&
               from_expansion == o.from_expansion;
    }
};

}  // namespace smir
