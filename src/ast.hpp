#pragma once

#include "span.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace smir {

enum class UnaryOp : std::uint8_t { Neg, Not, Deref, AddrOf, AddrOfMut };
enum class BinaryOp : std::uint8_t {
  Add,
  Sub,
  Mul,
  Div,
  Mod,
  Eq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,
  And,
  Or,
};

enum class AstNodeKind : std::uint16_t {
  File,

  Ident,
  Path,

  // Types
  TypePath,
  TypeRef,

  // Items
  Param,
  ItemFn,

  // Statements
  StmtLet,
  StmtExpr,

  // Patterns
  PatWildcard,
  PatBinding,

  // Expressions
  Block,

  ExprInt,
  ExprBool,
  ExprString,
  ExprPath,
  ExprBlock,
  ExprIf,
  ExprCall,
  ExprMethodCall,
  ExprMacro,
  ExprField,
  ExprUnary,
  ExprBinary,
  ExprAssign,
  ExprTry,
};

struct AstNode {
  AstNodeKind kind{};
  Span span{};

  AstNode(AstNodeKind kind, Span span) : kind(kind), span(span) {}
  virtual ~AstNode() = default;
};

class AstArena {
 public:
  template <typename T, typename... Args>
  T* make(Args&&... args) {
    auto node = std::make_unique<T>(std::forward<Args>(args)...);
    T* raw = node.get();
    nodes_.push_back(std::move(node));
    return raw;
  }

  std::size_t size() const { return nodes_.size(); }

 private:
  std::vector<std::unique_ptr<AstNode>> nodes_{};
};

struct Ident final : AstNode {
  std::string text{};
  explicit Ident(Span span, std::string text)
      : AstNode(AstNodeKind::Ident, span), text(std::move(text)) {}
};

struct Path final : AstNode {
  std::vector<Ident*> segments{};
  explicit Path(Span span, std::vector<Ident*> segments)
      : AstNode(AstNodeKind::Path, span), segments(std::move(segments)) {}

  bool is(std::string_view a, std::string_view b) const {
    return segments.size() == 2 && segments[0]->text == a && segments[1]->text == b;
  }
};

// ---- Types ----

struct Type : AstNode {
  explicit Type(AstNodeKind kind, Span span) : AstNode(kind, span) {}
};

struct TypePath final : Type {
  Path* path = nullptr;
  std::vector<Type*> args{};
  explicit TypePath(Span span, Path* path, std::vector<Type*> args)
      : Type(AstNodeKind::TypePath, span), path(path), args(std::move(args)) {}
};

struct TypeRef final : Type {
  bool is_mut = false;
  Type* pointee = nullptr;
  explicit TypeRef(Span span, bool is_mut, Type* pointee)
      : Type(AstNodeKind::TypeRef, span), is_mut(is_mut), pointee(pointee) {}
};

// ---- Expr / Stmt / Pattern ----

struct Stmt : AstNode {
  explicit Stmt(AstNodeKind kind, Span span) : AstNode(kind, span) {}
};

struct Pattern : AstNode {
  explicit Pattern(AstNodeKind kind, Span span) : AstNode(kind, span) {}
};

struct Expr : AstNode {
  explicit Expr(AstNodeKind kind, Span span) : AstNode(kind, span) {}
};

struct Block final : AstNode {
  std::vector<Stmt*> stmts{};
  Expr* tail = nullptr;  // optional
  explicit Block(Span span, std::vector<Stmt*> stmts, Expr* tail)
      : AstNode(AstNodeKind::Block, span), stmts(std::move(stmts)), tail(tail) {}
};

// ---- Patterns ----

struct PatWildcard final : Pattern {
  explicit PatWildcard(Span span) : Pattern(AstNodeKind::PatWildcard, span) {}
};

struct PatBinding final : Pattern {
  bool is_mut = false;
  std::string name{};
  explicit PatBinding(Span span, bool is_mut, std::string name)
      : Pattern(AstNodeKind::PatBinding, span), is_mut(is_mut), name(std::move(name)) {}
};

// ---- Expressions ----

struct ExprInt final : Expr {
  std::uint64_t value = 0;
  explicit ExprInt(Span span, std::uint64_t value) : Expr(AstNodeKind::ExprInt, span), value(value) {}
};

struct ExprBool final : Expr {
  bool value = false;
  explicit ExprBool(Span span, bool value) : Expr(AstNodeKind::ExprBool, span), value(value) {}
};

struct ExprString final : Expr {
  std::string value{};
  explicit ExprString(Span span, std::string value)
      : Expr(AstNodeKind::ExprString, span), value(std::move(value)) {}
};

struct ExprPath final : Expr {
  Path* path = nullptr;
  explicit ExprPath(Span span, Path* path) : Expr(AstNodeKind::ExprPath, span), path(path) {}
};

struct ExprBlock final : Expr {
  Block* block = nullptr;
  explicit ExprBlock(Span span, Block* block) : Expr(AstNodeKind::ExprBlock, span), block(block) {}
};

struct ExprIf final : Expr {
  Expr* cond = nullptr;
  Block* then_block = nullptr;
  Expr* else_expr = nullptr;  // optional; an ExprBlock or another ExprIf
  explicit ExprIf(Span span, Expr* cond, Block* then_block, Expr* else_expr)
      : Expr(AstNodeKind::ExprIf, span), cond(cond), then_block(then_block), else_expr(else_expr) {}
};

struct ExprCall final : Expr {
  Expr* callee = nullptr;
  std::vector<Expr*> args{};
  explicit ExprCall(Span span, Expr* callee, std::vector<Expr*> args)
      : Expr(AstNodeKind::ExprCall, span), callee(callee), args(std::move(args)) {}
};

struct ExprMethodCall final : Expr {
  Expr* receiver = nullptr;
  std::string method{};
  std::vector<Expr*> args{};
  explicit ExprMethodCall(Span span, Expr* receiver, std::string method, std::vector<Expr*> args)
      : Expr(AstNodeKind::ExprMethodCall, span),
        receiver(receiver),
        method(std::move(method)),
        args(std::move(args)) {}
};

// `name!(args)`. Its expansion is not visible to the lints.
struct ExprMacro final : Expr {
  Path* name = nullptr;
  std::vector<Expr*> args{};
  explicit ExprMacro(Span span, Path* name, std::vector<Expr*> args)
      : Expr(AstNodeKind::ExprMacro, span), name(name), args(std::move(args)) {}
};

struct ExprField final : Expr {
  Expr* base = nullptr;
  std::string field{};
  explicit ExprField(Span span, Expr* base, std::string field)
      : Expr(AstNodeKind::ExprField, span), base(base), field(std::move(field)) {}
};

struct ExprUnary final : Expr {
  UnaryOp op{};
  Expr* expr = nullptr;
  explicit ExprUnary(Span span, UnaryOp op, Expr* expr)
      : Expr(AstNodeKind::ExprUnary, span), op(op), expr(expr) {}
};

struct ExprBinary final : Expr {
  BinaryOp op{};
  Expr* lhs = nullptr;
  Expr* rhs = nullptr;
  explicit ExprBinary(Span span, BinaryOp op, Expr* lhs, Expr* rhs)
      : Expr(AstNodeKind::ExprBinary, span), op(op), lhs(lhs), rhs(rhs) {}
};

struct ExprAssign final : Expr {
  Expr* lhs = nullptr;
  Expr* rhs = nullptr;
  explicit ExprAssign(Span span, Expr* lhs, Expr* rhs)
      : Expr(AstNodeKind::ExprAssign, span), lhs(lhs), rhs(rhs) {}
};

struct ExprTry final : Expr {
  Expr* expr = nullptr;
  explicit ExprTry(Span span, Expr* expr) : Expr(AstNodeKind::ExprTry, span), expr(expr) {}
};

// ---- Statements ----

struct StmtLet final : Stmt {
  Pattern* pat = nullptr;
  Type* type_ann = nullptr;  // optional
  Expr* init = nullptr;      // optional
  explicit StmtLet(Span span, Pattern* pat, Type* type_ann, Expr* init)
      : Stmt(AstNodeKind::StmtLet, span), pat(pat), type_ann(type_ann), init(init) {}
};

struct StmtExpr final : Stmt {
  Expr* expr = nullptr;
  bool has_semi = true;  // false only for block-like expressions
  explicit StmtExpr(Span span, Expr* expr, bool has_semi)
      : Stmt(AstNodeKind::StmtExpr, span), expr(expr), has_semi(has_semi) {}
};

// ---- Items ----

struct Param final : AstNode {
  Pattern* pat = nullptr;
  Type* type = nullptr;
  explicit Param(Span span, Pattern* pat, Type* type)
      : AstNode(AstNodeKind::Param, span), pat(pat), type(type) {}
};

struct ItemFn final : AstNode {
  std::string name{};
  std::vector<Param*> params{};
  Type* ret = nullptr;  // optional; null means ()
  Block* body = nullptr;
  explicit ItemFn(Span span, std::string name, std::vector<Param*> params, Type* ret, Block* body)
      : AstNode(AstNodeKind::ItemFn, span),
        name(std::move(name)),
        params(std::move(params)),
        ret(ret),
        body(body) {}
};

struct FileAst final : AstNode {
  std::vector<ItemFn*> items{};
  explicit FileAst(Span span, std::vector<ItemFn*> items)
      : AstNode(AstNodeKind::File, span), items(std::move(items)) {}
};

std::string_view ast_kind_name(AstNodeKind kind);
void dump_ast(std::ostream& os, const AstNode* node, int indent = 0);

}  // namespace smir
