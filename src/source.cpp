#include "source.hpp"

#include <fstream>
#include <iterator>

#include "span.hpp"

namespace smir {

static std::optional<std::string> read_text(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    std::string text(std::istreambuf_iterator<char>(in), {});
    if (in.bad()) return std::nullopt;
    return text;
}

std::optional<FileId> SourceManager::add_file(std::string path) {
    if (auto it = by_path_.find(path); it != by_path_.end()) return it->second;

    std::optional<std::string> text = read_text(path);
    if (!text) return std::nullopt;

    FileId id = static_cast<FileId>(files_.size());
    files_.push_back(
        SourceFile{.id = id, .path = std::move(path), .text = std::move(*text)});
    by_path_.insert({files_.back().path, id});
    return id;
}

FileId SourceManager::add_source(std::string name, std::string text) {
    FileId id = static_cast<FileId>(files_.size());
    files_.push_back(
        SourceFile{.id = id, .path = std::move(name), .text = std::move(text)});
    by_path_.insert_or_assign(files_.back().path, id);
    return id;
}

std::optional<FileId> SourceManager::find_file(std::string_view path) const {
    if (auto it = by_path_.find(std::string(path)); it != by_path_.end())
        return it->second;
    return std::nullopt;
}

const SourceFile& SourceManager::file(FileId id) const {
    return files_.at(static_cast<size_t>(id));
}

const std::string& SourceManager::path(FileId id) const {
    return file(id).path;
}

std::string SourceManager::snippet(const Span& span,
                                   std::string_view fallback) const {
    if (span.file >= files_.size()) return std::string(fallback);
    const std::string& text = files_[span.file].text;
    if (span.begin.offset > span.end.offset || span.end.offset > text.size())
        return std::string(fallback);
    return text.substr(span.begin.offset, span.end.offset - span.begin.offset);
}

}  // namespace smir
