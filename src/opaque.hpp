#pragma once

#include <iosfwd>
#include <string>

#include "span.hpp"
#include "types.hpp"

namespace smir {

class TyCtxt;

namespace stable {

// Display-only stand-in for an internal value that has no stable structure
// yet. Only the rendered text is meaningful.
struct Opaque {
    std::string text{};

    const std::string& to_string() const { return text; }
};

std::ostream& operator<<(std::ostream& os, const Opaque& o);

}  // namespace stable

stable::Opaque opaque(const Region& region);
stable::Opaque opaque(const TyCtxt& tcx, const TyConst& c);
stable::Opaque opaque(const Span& span);

}  // namespace smir
