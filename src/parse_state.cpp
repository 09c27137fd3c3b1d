#include "parse_state.hpp"

#include <cstdlib>
#include <memory>
#include <utility>

namespace smir {

ParseState* g_parse_state = nullptr;

ParseScope::ParseScope(ParseState& state, const std::string& text) {
  g_parse_state = &state;
  lexer_open(text);
}

ParseScope::~ParseScope() {
  lexer_close();
  g_parse_state = nullptr;
}

Span source_span(SourceLoc begin, SourceLoc end) {
  return Span{.file = g_parse_state ? g_parse_state->file : kNoFile, .begin = begin, .end = end};
}

// Identifiers arrive from the scanner as malloc'd C strings.
std::string take_str(char* s) {
  std::unique_ptr<char, decltype(&std::free)> owned(s, &std::free);
  return owned ? std::string(owned.get()) : std::string{};
}

std::string take_string(std::string* s) {
  std::unique_ptr<std::string> owned(s);
  return owned ? std::move(*owned) : std::string{};
}

void push_error(Span span, std::string message) {
  if (!g_parse_state) return;
  g_parse_state->diags.push_back(Diagnostic{
      .severity = Severity::Error,
      .span = span,
      .message = std::move(message),
  });
}

}  // namespace smir
