#pragma once

#include "source.hpp"
#include "span.hpp"

#include <optional>
#include <string>

namespace smir {

enum class Severity : std::uint8_t { Error, Warning, Note };

// Identifies diagnostics that callers match on. Plain messages use `None`.
enum class DiagCode : std::uint8_t {
  None,
  NotYetImplemented,
  InvariantViolated,
  ReadZeroByteVec,
};

enum class Applicability : std::uint8_t {
  MachineApplicable,
  MaybeIncorrect,
  HasPlaceholders,
  Unspecified,
};

struct Suggestion {
  Span span{};
  std::string message{};
  std::string replacement{};
  Applicability applicability = Applicability::Unspecified;
};

struct Diagnostic {
  Severity severity = Severity::Error;
  Span span{};
  std::string message{};
  DiagCode code = DiagCode::None;
  std::optional<Suggestion> suggestion{};
};

const char* diag_code_name(DiagCode code);
const char* applicability_name(Applicability a);

std::string format_diagnostic(const SourceManager& sm, const Diagnostic& d);

}  // namespace smir
