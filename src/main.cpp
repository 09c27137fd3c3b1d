#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <llvm/Support/Debug.h>

#include "ast.hpp"
#include "diag.hpp"
#include "parse.hpp"
#include "read_zero_byte_vec.hpp"
#include "session.hpp"

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0
              << " [--dump-ast] [--dump-tokens] "
                 "[-A|-W|-D read_zero_byte_vec] [--debug] <file.rs>...\n";
}

static bool parse_lint_flag(std::string_view flag, std::string_view lint,
                            smir::SessionOptions& options) {
    if (lint != "read_zero_byte_vec") return false;
    if (flag == "-A")
        options.read_zero_byte_vec = smir::LintLevel::Allow;
    else if (flag == "-W")
        options.read_zero_byte_vec = smir::LintLevel::Warn;
    else
        options.read_zero_byte_vec = smir::LintLevel::Deny;
    return true;
}

int main(int argc, char** argv) {
    bool dump_ast = false;
    bool dump_tokens = false;
    smir::SessionOptions options{};
    std::vector<std::string> inputs{};

    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg == "--dump-ast") {
            dump_ast = true;
            continue;
        }
        if (arg == "--dump-tokens") {
            dump_tokens = true;
            continue;
        }
        if (arg == "--debug") {
            options.debug = true;
            continue;
        }
        if (arg == "-A" || arg == "-W" || arg == "-D") {
            if (i + 1 >= argc || !parse_lint_flag(arg, argv[i + 1], options)) {
                usage(argv[0]);
                return 2;
            }
            i++;
            continue;
        }
        if (!arg.empty() && arg[0] == '-') {
            usage(argv[0]);
            return 2;
        }
        inputs.emplace_back(arg);
    }

    if (inputs.empty()) {
        usage(argv[0]);
        return 2;
    }

#ifndef NDEBUG
    llvm::DebugFlag = options.debug;
#endif

    smir::Session session{};
    session.options = options;

    for (const std::string& input : inputs) {
        std::optional<smir::FileId> added = session.add_file(input);
        if (!added) continue;

        smir::FileId file = *added;
        if (dump_tokens) {
            smir::dump_tokens(file, session.sources.file(file).text, std::cout);
            continue;
        }

        smir::ParseState* parsed = session.parse(file);
        if (!parsed || !parsed->root) continue;
        if (dump_ast) smir::dump_ast(std::cout, parsed->root);
        smir::check_read_zero_byte_vec(session, *parsed->root);
    }

    for (const auto& d : session.diags)
        std::cerr << smir::format_diagnostic(session.sources, d) << "\n";
    return session.has_errors() ? 1 : 0;
}
