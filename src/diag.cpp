#include "diag.hpp"

#include <sstream>

namespace smir {

static const char* severity_name(Severity s) {
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Note:
      return "note";
  }
  return "error";
}

const char* diag_code_name(DiagCode code) {
  switch (code) {
    case DiagCode::None:
      return "";
    case DiagCode::NotYetImplemented:
      return "not_yet_implemented";
    case DiagCode::InvariantViolated:
      return "invariant_violated";
    case DiagCode::ReadZeroByteVec:
      return "read_zero_byte_vec";
  }
  return "";
}

const char* applicability_name(Applicability a) {
  switch (a) {
    case Applicability::MachineApplicable:
      return "machine-applicable";
    case Applicability::MaybeIncorrect:
      return "maybe-incorrect";
    case Applicability::HasPlaceholders:
      return "has-placeholders";
    case Applicability::Unspecified:
      return "unspecified";
  }
  return "unspecified";
}

static void write_location(std::ostringstream& out, const SourceManager& sm,
                           const Span& span) {
  // Query-layer diagnostics are not tied to a source file.
  if (span.file >= sm.file_count()) return;
  out << sm.path(span.file) << ":" << span.begin.line << ":"
      << span.begin.column << ": ";
}

std::string format_diagnostic(const SourceManager& sm, const Diagnostic& d) {
  std::ostringstream out;
  write_location(out, sm, d.span);
  out << severity_name(d.severity) << ": " << d.message;
  if (d.code != DiagCode::None) out << " [" << diag_code_name(d.code) << "]";
  if (d.suggestion) {
    out << "\n";
    write_location(out, sm, d.suggestion->span);
    out << "help: " << d.suggestion->message << ": `"
        << d.suggestion->replacement << "` ("
        << applicability_name(d.suggestion->applicability) << ")";
  }
  return out.str();
}

}  // namespace smir
