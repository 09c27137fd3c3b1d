#pragma once

#include <iosfwd>
#include <string>

#include "parse_state.hpp"

namespace smir {

ParseState parse_file(FileId file, const std::string& text);
void dump_tokens(FileId file, const std::string& text, std::ostream& os);

}  // namespace smir
