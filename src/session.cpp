#include "session.hpp"

#include <utility>

namespace smir {

std::filesystem::path normalize_path(std::filesystem::path path) {
  std::error_code ec{};
  std::filesystem::path abs = std::filesystem::absolute(path, ec);
  if (ec) abs = std::move(path);
  return abs.lexically_normal();
}

std::optional<FileId> Session::add_file(std::filesystem::path path) {
  std::filesystem::path normalized = normalize_path(std::move(path));
  std::error_code ec{};
  std::optional<FileId> file{};
  if (std::filesystem::is_regular_file(normalized, ec)) file = sources.add_file(normalized.string());
  if (!file) {
    diags.push_back(Diagnostic{
        .severity = Severity::Error,
        .span = Span{.file = kNoFile},
        .message = "could not open file: " + normalized.string(),
    });
  }
  return file;
}

FileId Session::add_source(std::string name, std::string text) {
  return sources.add_source(std::move(name), std::move(text));
}

ParseState* Session::parse(FileId file) {
  if (file >= parsed_.size()) parsed_.resize(static_cast<size_t>(file) + 1);
  if (parsed_[file]) return parsed_[file].get();

  auto state = std::make_unique<ParseState>(parse_file(file, sources.file(file).text));
  for (auto& d : state->diags) diags.push_back(std::move(d));
  state->diags.clear();
  parsed_[file] = std::move(state);
  return parsed_[file].get();
}

bool Session::has_errors() const {
  for (const auto& d : diags) {
    if (d.severity == Severity::Error) return true;
  }
  return false;
}

std::size_t Session::error_count(DiagCode code) const {
  std::size_t n = 0;
  for (const auto& d : diags) {
    if (d.severity == Severity::Error && d.code == code) n++;
  }
  return n;
}

}  // namespace smir
