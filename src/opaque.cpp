#include "opaque.hpp"

#include <ostream>
#include <sstream>

#include "mir.hpp"
#include "tcx.hpp"

namespace smir {

namespace stable {

std::ostream& operator<<(std::ostream& os, const Opaque& o) {
    return os << o.text;
}

}  // namespace stable

stable::Opaque opaque(const Region& region) {
    return stable::Opaque{to_string(region)};
}

stable::Opaque opaque(const TyCtxt& tcx, const TyConst& c) {
    return stable::Opaque{tcx.const_to_string(c)};
}

stable::Opaque opaque(const Span& span) {
    std::ostringstream os;
    print_span(os, span);
    return stable::Opaque{os.str()};
}

}  // namespace smir
