#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace smir {

using FileId = std::uint32_t;

// Spans of diagnostics that do not point into any source file.
inline constexpr FileId kNoFile = 0xffffffffu;

struct SourceFile {
  FileId id = 0;
  std::string path{};
  std::string text{};
};

struct Span;

class SourceManager {
 public:
  // nullopt if the file cannot be read.
  std::optional<FileId> add_file(std::string path);
  FileId add_source(std::string name, std::string text);
  std::optional<FileId> find_file(std::string_view path) const;

  const SourceFile& file(FileId id) const;
  const std::string& path(FileId id) const;
  std::size_t file_count() const { return files_.size(); }

  // Source text covered by `span`, or `fallback` if the span does not lie
  // inside its file.
  std::string snippet(const Span& span, std::string_view fallback) const;

 private:
  std::vector<SourceFile> files_{};
  std::unordered_map<std::string, FileId> by_path_{};
};

}  // namespace smir
