#pragma once

#include "ast.hpp"
#include "diag.hpp"

#include <string>
#include <utility>
#include <vector>

namespace smir {

struct ParseState {
  FileId file = 0;
  AstArena arena{};
  FileAst* root = nullptr;
  std::vector<Diagnostic> diags{};
};

// Grammar actions and the scanner report into this state.
extern ParseState* g_parse_state;

// Points the scanner at `text` and routes grammar actions to `state` until the
// scope ends. The scanner is global, so scopes do not nest.
class ParseScope {
 public:
  ParseScope(ParseState& state, const std::string& text);
  ~ParseScope();

  ParseScope(const ParseScope&) = delete;
  ParseScope& operator=(const ParseScope&) = delete;
};

// Defined in lexer.l.
void lexer_open(const std::string& text);
void lexer_close();

// Span in the file being parsed.
Span source_span(SourceLoc begin, SourceLoc end);

std::string take_str(char* s);
std::string take_string(std::string* s);
void push_error(Span span, std::string message);

// Takes ownership of a list built up by the grammar and deletes it.
template <typename T>
std::vector<T> take_vec(std::vector<T>* v) {
  if (!v) return {};
  std::vector<T> out = std::move(*v);
  delete v;
  return out;
}

template <typename T, typename... Args>
T* mk(Span span, Args&&... args) {
  if (!g_parse_state) return nullptr;
  return g_parse_state->arena.make<T>(std::move(span), std::forward<Args>(args)...);
}

}  // namespace smir
