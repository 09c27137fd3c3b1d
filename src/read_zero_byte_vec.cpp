#include "read_zero_byte_vec.hpp"

#include <string>
#include <utility>

#include <llvm/ADT/APInt.h>
#include <llvm/ADT/STLFunctionalExtras.h>
#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>

#define DEBUG_TYPE "smir"

namespace smir {
namespace {

constexpr const char* kMessage = "reading zero byte data to `Vec`";

bool is_vec_type(const Type* type) {
    if (!type || type->kind != AstNodeKind::TypePath) return false;
    const Path* path = static_cast<const TypePath*>(type)->path;
    return path && !path->segments.empty() && path->segments.back()->text == "Vec";
}

const Path* callee_path(const ExprCall* call) {
    if (!call->callee || call->callee->kind != AstNodeKind::ExprPath) return nullptr;
    return static_cast<const ExprPath*>(call->callee)->path;
}

// Calls `fn` on each expression in evaluation order. Children are skipped when
// `fn` returns false.
class ExprWalker {
   public:
    explicit ExprWalker(llvm::function_ref<bool(const Expr&)> fn) : fn_(fn) {}

    void walk_stmt(const Stmt* stmt) {
        if (!stmt) return;
        switch (stmt->kind) {
            case AstNodeKind::StmtLet:
                walk_expr(static_cast<const StmtLet*>(stmt)->init);
                break;
            case AstNodeKind::StmtExpr:
                walk_expr(static_cast<const StmtExpr*>(stmt)->expr);
                break;
            default:
                break;
        }
    }

    void walk_block(const Block* block) {
        if (!block) return;
        for (const Stmt* s : block->stmts) walk_stmt(s);
        walk_expr(block->tail);
    }

    void walk_expr(const Expr* expr) {
        if (!expr || !fn_(*expr)) return;
        switch (expr->kind) {
            case AstNodeKind::ExprBlock:
                walk_block(static_cast<const ExprBlock*>(expr)->block);
                break;
            case AstNodeKind::ExprIf: {
                auto* e = static_cast<const ExprIf*>(expr);
                walk_expr(e->cond);
                walk_block(e->then_block);
                walk_expr(e->else_expr);
                break;
            }
            case AstNodeKind::ExprCall: {
                auto* e = static_cast<const ExprCall*>(expr);
                walk_expr(e->callee);
                for (const Expr* a : e->args) walk_expr(a);
                break;
            }
            case AstNodeKind::ExprMethodCall: {
                auto* e = static_cast<const ExprMethodCall*>(expr);
                walk_expr(e->receiver);
                for (const Expr* a : e->args) walk_expr(a);
                break;
            }
            case AstNodeKind::ExprMacro:
                for (const Expr* a : static_cast<const ExprMacro*>(expr)->args) walk_expr(a);
                break;
            case AstNodeKind::ExprField:
                walk_expr(static_cast<const ExprField*>(expr)->base);
                break;
            case AstNodeKind::ExprUnary:
                walk_expr(static_cast<const ExprUnary*>(expr)->expr);
                break;
            case AstNodeKind::ExprBinary: {
                auto* e = static_cast<const ExprBinary*>(expr);
                walk_expr(e->lhs);
                walk_expr(e->rhs);
                break;
            }
            case AstNodeKind::ExprAssign: {
                auto* e = static_cast<const ExprAssign*>(expr);
                walk_expr(e->lhs);
                walk_expr(e->rhs);
                break;
            }
            case AstNodeKind::ExprTry:
                walk_expr(static_cast<const ExprTry*>(expr)->expr);
                break;
            default:
                break;
        }
    }

   private:
    llvm::function_ref<bool(const Expr&)> fn_;
};

// `_.read(&mut <name>)` or `_.read_exact(&mut <name>)`.
bool is_read_into(const Expr& expr, const std::string& name) {
    if (expr.kind != AstNodeKind::ExprMethodCall) return false;
    auto& call = static_cast<const ExprMethodCall&>(expr);
    if (call.method != "read" && call.method != "read_exact") return false;
    if (call.args.size() != 1) return false;

    const Expr* arg = call.args[0];
    if (!arg || arg->kind != AstNodeKind::ExprUnary) return false;
    auto* borrow = static_cast<const ExprUnary*>(arg);
    if (borrow->op != UnaryOp::AddrOfMut || !borrow->expr) return false;
    if (borrow->expr->kind != AstNodeKind::ExprPath) return false;

    const Path* path = static_cast<const ExprPath*>(borrow->expr)->path;
    return path && path->segments.size() == 1 && path->segments[0]->text == name;
}

class ReadZeroByteVec {
   public:
    explicit ReadZeroByteVec(Session& session) : session_(session) {}

    void check_fn(const ItemFn& fn) { check_block(fn.body); }

   private:
    void check_block(const Block* block) {
        if (!block) return;
        check_stmts(*block);

        // Nested blocks are checked on their own.
        for (const Stmt* s : block->stmts) visit_nested(s);
        visit_nested_expr(block->tail);
    }

    void visit_nested(const Stmt* stmt) {
        if (!stmt) return;
        if (stmt->kind == AstNodeKind::StmtLet) {
            visit_nested_expr(static_cast<const StmtLet*>(stmt)->init);
        } else if (stmt->kind == AstNodeKind::StmtExpr) {
            visit_nested_expr(static_cast<const StmtExpr*>(stmt)->expr);
        }
    }

    void visit_nested_expr(const Expr* expr) {
        auto visit = [&](const Expr& e) {
            if (e.kind == AstNodeKind::ExprBlock) {
                check_block(static_cast<const ExprBlock&>(e).block);
                return false;
            }
            if (e.kind == AstNodeKind::ExprIf) {
                auto& if_expr = static_cast<const ExprIf&>(e);
                visit_nested_expr(if_expr.cond);
                check_block(if_expr.then_block);
                visit_nested_expr(if_expr.else_expr);
                return false;
            }
            return true;
        };
        ExprWalker{visit}.walk_expr(expr);
    }

    void check_stmts(const Block& block) {
        for (std::size_t idx = 0; idx < block.stmts.size(); idx++) {
            const Stmt* stmt = block.stmts[idx];
            if (stmt->span.from_expansion || stmt->kind != AstNodeKind::StmtLet) continue;

            auto* local = static_cast<const StmtLet*>(stmt);
            if (!local->init || !local->pat || local->pat->kind != AstNodeKind::PatBinding) continue;
            std::optional<VecInitKind> init = vec_init_kind(local->init, local->type_ann);
            if (!init) continue;

            const std::string& name = static_cast<const PatBinding*>(local->pat)->name;
            bool read_found = false;
            auto find_read = [&](const Expr& e) {
                if (is_read_into(e, name)) read_found = true;
                return !read_found;
            };
            ExprWalker walker{find_read};

            Span next_span{};
            if (idx + 1 == block.stmts.size()) {
                if (!block.tail) return;
                walker.walk_expr(block.tail);
                next_span = block.tail->span;
            } else {
                const Stmt* next = block.stmts[idx + 1];
                walker.walk_stmt(next);
                next_span = next->span;
            }

            if (read_found && !next_span.from_expansion) report(name, *init, next_span);
        }
    }

    void report(const std::string& name, const VecInitKind& init, Span span) {
        Severity severity = Severity::Error;
        switch (session_.options.read_zero_byte_vec) {
            case LintLevel::Allow:
                return;
            case LintLevel::Warn:
                severity = Severity::Warning;
                break;
            case LintLevel::Deny:
                severity = Severity::Error;
                break;
        }

        LLVM_DEBUG(llvm::dbgs() << "read_zero_byte_vec: `" << name << "` at "
                                << span.begin.line << ":" << span.begin.column << "\n");

        Diagnostic diag{
            .severity = severity,
            .span = span,
            .message = kMessage,
            .code = DiagCode::ReadZeroByteVec,
        };

        std::string len{};
        switch (init.tag) {
            case VecInitKind::Tag::WithConstCapacity:
                len = std::to_string(init.capacity);
                break;
            case VecInitKind::Tag::WithExprCapacity:
                len = session_.sources.snippet(init.capacity_expr->span, "..");
                break;
            case VecInitKind::Tag::New:
            case VecInitKind::Tag::Default:
                break;
        }
        if (!len.empty()) {
            diag.suggestion = Suggestion{
                .span = span,
                .message = "try",
                .replacement = name + ".resize(" + len + ", 0); " + session_.sources.snippet(span, ".."),
                .applicability = Applicability::MaybeIncorrect,
            };
        }
        session_.diags.push_back(std::move(diag));
    }

    Session& session_;
};

}  // namespace

std::optional<std::uint64_t> const_int(const Expr* expr) {
    if (!expr) return std::nullopt;
    if (expr->kind == AstNodeKind::ExprInt) return static_cast<const ExprInt*>(expr)->value;
    if (expr->kind != AstNodeKind::ExprBinary) return std::nullopt;

    auto* bin = static_cast<const ExprBinary*>(expr);
    std::optional<std::uint64_t> lhs = const_int(bin->lhs);
    std::optional<std::uint64_t> rhs = const_int(bin->rhs);
    if (!lhs || !rhs) return std::nullopt;

    llvm::APInt a(64, *lhs);
    llvm::APInt b(64, *rhs);
    bool overflow = false;
    llvm::APInt out(64, 0);
    switch (bin->op) {
        case BinaryOp::Add:
            out = a.uadd_ov(b, overflow);
            break;
        case BinaryOp::Sub:
            out = a.usub_ov(b, overflow);
            break;
        case BinaryOp::Mul:
            out = a.umul_ov(b, overflow);
            break;
        case BinaryOp::Div:
            if (*rhs == 0) return std::nullopt;
            return *lhs / *rhs;
        case BinaryOp::Mod:
            if (*rhs == 0) return std::nullopt;
            return *lhs % *rhs;
        default:
            return std::nullopt;
    }
    if (overflow) return std::nullopt;
    return out.getZExtValue();
}

std::optional<VecInitKind> vec_init_kind(const Expr* init, const Type* annotation) {
    if (!init || init->kind != AstNodeKind::ExprCall) return std::nullopt;
    auto* call = static_cast<const ExprCall*>(init);
    const Path* path = callee_path(call);
    if (!path) return std::nullopt;

    if (call->args.empty()) {
        if (path->is("Vec", "new")) return VecInitKind{.tag = VecInitKind::Tag::New};
        if (path->is("Vec", "default")) return VecInitKind{.tag = VecInitKind::Tag::Default};
        if (path->is("Default", "default") && is_vec_type(annotation))
            return VecInitKind{.tag = VecInitKind::Tag::Default};
        return std::nullopt;
    }

    if (call->args.size() == 1 && path->is("Vec", "with_capacity")) {
        const Expr* arg = call->args[0];
        if (std::optional<std::uint64_t> n = const_int(arg))
            return VecInitKind{.tag = VecInitKind::Tag::WithConstCapacity, .capacity = *n};
        return VecInitKind{.tag = VecInitKind::Tag::WithExprCapacity, .capacity_expr = arg};
    }
    return std::nullopt;
}

void check_read_zero_byte_vec(Session& session, const FileAst& file) {
    if (session.options.read_zero_byte_vec == LintLevel::Allow) return;
    ReadZeroByteVec lint{session};
    for (const ItemFn* fn : file.items) {
        if (fn) lint.check_fn(*fn);
    }
}

}  // namespace smir
