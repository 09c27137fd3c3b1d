#pragma once

#include <cstdint>
#include <optional>

#include "ast.hpp"
#include "session.hpp"

namespace smir {

// How a `Vec` binding was initialized.
struct VecInitKind {
    enum class Tag : std::uint8_t {
        New,                // `Vec::new()`
        Default,            // `Vec::default()`, or `Default::default()` annotated as `Vec`
        WithConstCapacity,  // `Vec::with_capacity(<constant>)`
        WithExprCapacity,   // `Vec::with_capacity(<expr>)`
    };

    Tag tag = Tag::New;
    std::uint64_t capacity = 0;         // WithConstCapacity
    const Expr* capacity_expr = nullptr;  // WithExprCapacity
};

// Integer value of `expr` if it is built only from integer literals and
// `+ - * / %`. Overflow and division by zero are not constant.
std::optional<std::uint64_t> const_int(const Expr* expr);

std::optional<VecInitKind> vec_init_kind(const Expr* init,
                                         const Type* annotation = nullptr);

// Flags a `read`/`read_exact` into a freshly created, still empty `Vec`.
// Diagnostics go to `session.diags` at the level set by
// `SessionOptions::read_zero_byte_vec`.
void check_read_zero_byte_vec(Session& session, const FileAst& file);

}  // namespace smir
