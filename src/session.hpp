#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "diag.hpp"
#include "parse.hpp"
#include "source.hpp"

namespace smir {

std::filesystem::path normalize_path(std::filesystem::path path);

enum class InternStrategy : std::uint8_t {
    LinearScan,  // compare against every interned type
    HashCons,    // structural hash bucket, then compare
};

enum class LintLevel : std::uint8_t { Allow, Warn, Deny };

struct SessionOptions {
    InternStrategy intern_strategy = InternStrategy::HashCons;
    LintLevel read_zero_byte_vec = LintLevel::Deny;
    bool debug = false;
};

struct Session {
    SessionOptions options{};
    SourceManager sources{};
    std::vector<Diagnostic> diags{};

    // Reports "could not open file" and returns nullopt for anything that is
    // not a readable regular file.
    std::optional<FileId> add_file(std::filesystem::path path);
    FileId add_source(std::string name, std::string text);
    ParseState* parse(FileId file);

    bool has_errors() const;
    std::size_t error_count(DiagCode code) const;

   private:
    std::vector<std::unique_ptr<ParseState>> parsed_{};
};

}  // namespace smir
