#include "ast.hpp"

#include <utility>

namespace smir {

std::string_view ast_kind_name(AstNodeKind kind) {
  switch (kind) {
    case AstNodeKind::File:
      return "File";
    case AstNodeKind::Ident:
      return "Ident";
    case AstNodeKind::Path:
      return "Path";
    case AstNodeKind::TypePath:
      return "TypePath";
    case AstNodeKind::TypeRef:
      return "TypeRef";
    case AstNodeKind::Param:
      return "Param";
    case AstNodeKind::ItemFn:
      return "ItemFn";
    case AstNodeKind::StmtLet:
      return "StmtLet";
    case AstNodeKind::StmtExpr:
      return "StmtExpr";
    case AstNodeKind::PatWildcard:
      return "PatWildcard";
    case AstNodeKind::PatBinding:
      return "PatBinding";
    case AstNodeKind::Block:
      return "Block";
    case AstNodeKind::ExprInt:
      return "ExprInt";
    case AstNodeKind::ExprBool:
      return "ExprBool";
    case AstNodeKind::ExprString:
      return "ExprString";
    case AstNodeKind::ExprPath:
      return "ExprPath";
    case AstNodeKind::ExprBlock:
      return "ExprBlock";
    case AstNodeKind::ExprIf:
      return "ExprIf";
    case AstNodeKind::ExprCall:
      return "ExprCall";
    case AstNodeKind::ExprMethodCall:
      return "ExprMethodCall";
    case AstNodeKind::ExprMacro:
      return "ExprMacro";
    case AstNodeKind::ExprField:
      return "ExprField";
    case AstNodeKind::ExprUnary:
      return "ExprUnary";
    case AstNodeKind::ExprBinary:
      return "ExprBinary";
    case AstNodeKind::ExprAssign:
      return "ExprAssign";
    case AstNodeKind::ExprTry:
      return "ExprTry";
  }
  return "Unknown";
}

static void indent_to(std::ostream& os, int indent) {
  for (int i = 0; i < indent; i++) os << "  ";
}

static std::string path_text(const Path* path) {
  std::string out{};
  for (size_t i = 0; i < path->segments.size(); i++) {
    if (i) out += "::";
    out += path->segments[i]->text;
  }
  return out;
}

static void dump_label(std::ostream& os, const AstNode* node) {
  switch (node->kind) {
    case AstNodeKind::Ident:
      os << " \"" << static_cast<const Ident*>(node)->text << '"';
      break;
    case AstNodeKind::Path:
      os << " \"" << path_text(static_cast<const Path*>(node)) << '"';
      break;
    case AstNodeKind::TypeRef:
      if (static_cast<const TypeRef*>(node)->is_mut) os << " mut";
      break;
    case AstNodeKind::ItemFn:
      os << " \"" << static_cast<const ItemFn*>(node)->name << '"';
      break;
    case AstNodeKind::PatBinding: {
      auto* p = static_cast<const PatBinding*>(node);
      os << (p->is_mut ? " mut" : "") << " \"" << p->name << '"';
      break;
    }
    case AstNodeKind::ExprInt:
      os << " " << static_cast<const ExprInt*>(node)->value;
      break;
    case AstNodeKind::ExprBool:
      os << (static_cast<const ExprBool*>(node)->value ? " true" : " false");
      break;
    case AstNodeKind::ExprString:
      os << " \"" << static_cast<const ExprString*>(node)->value << '"';
      break;
    case AstNodeKind::ExprMethodCall:
      os << " ." << static_cast<const ExprMethodCall*>(node)->method;
      break;
    case AstNodeKind::ExprField:
      os << " ." << static_cast<const ExprField*>(node)->field;
      break;
    case AstNodeKind::ExprUnary:
      switch (static_cast<const ExprUnary*>(node)->op) {
        case UnaryOp::Neg:
          os << " -";
          break;
        case UnaryOp::Not:
          os << " !";
          break;
        case UnaryOp::Deref:
          os << " *";
          break;
        case UnaryOp::AddrOf:
          os << " &";
          break;
        case UnaryOp::AddrOfMut:
          os << " &mut";
          break;
      }
      break;
    default:
      break;
  }
  if (node->span.from_expansion) os << " (expansion)";
}

static std::vector<const AstNode*> children(const AstNode* node) {
  std::vector<const AstNode*> out{};
  auto push = [&](const AstNode* child) {
    if (child) out.push_back(child);
  };
  switch (node->kind) {
    case AstNodeKind::File:
      for (auto* item : static_cast<const FileAst*>(node)->items) push(item);
      break;
    case AstNodeKind::TypePath: {
      auto* t = static_cast<const TypePath*>(node);
      push(t->path);
      for (auto* a : t->args) push(a);
      break;
    }
    case AstNodeKind::TypeRef:
      push(static_cast<const TypeRef*>(node)->pointee);
      break;
    case AstNodeKind::Param: {
      auto* p = static_cast<const Param*>(node);
      push(p->pat);
      push(p->type);
      break;
    }
    case AstNodeKind::ItemFn: {
      auto* f = static_cast<const ItemFn*>(node);
      for (auto* p : f->params) push(p);
      push(f->ret);
      push(f->body);
      break;
    }
    case AstNodeKind::StmtLet: {
      auto* s = static_cast<const StmtLet*>(node);
      push(s->pat);
      push(s->type_ann);
      push(s->init);
      break;
    }
    case AstNodeKind::StmtExpr:
      push(static_cast<const StmtExpr*>(node)->expr);
      break;
    case AstNodeKind::Block: {
      auto* b = static_cast<const Block*>(node);
      for (auto* s : b->stmts) push(s);
      push(b->tail);
      break;
    }
    case AstNodeKind::ExprPath:
      push(static_cast<const ExprPath*>(node)->path);
      break;
    case AstNodeKind::ExprBlock:
      push(static_cast<const ExprBlock*>(node)->block);
      break;
    case AstNodeKind::ExprIf: {
      auto* e = static_cast<const ExprIf*>(node);
      push(e->cond);
      push(e->then_block);
      push(e->else_expr);
      break;
    }
    case AstNodeKind::ExprCall: {
      auto* e = static_cast<const ExprCall*>(node);
      push(e->callee);
      for (auto* a : e->args) push(a);
      break;
    }
    case AstNodeKind::ExprMethodCall: {
      auto* e = static_cast<const ExprMethodCall*>(node);
      push(e->receiver);
      for (auto* a : e->args) push(a);
      break;
    }
    case AstNodeKind::ExprMacro: {
      auto* e = static_cast<const ExprMacro*>(node);
      push(e->name);
      for (auto* a : e->args) push(a);
      break;
    }
    case AstNodeKind::ExprField:
      push(static_cast<const ExprField*>(node)->base);
      break;
    case AstNodeKind::ExprUnary:
      push(static_cast<const ExprUnary*>(node)->expr);
      break;
    case AstNodeKind::ExprBinary: {
      auto* e = static_cast<const ExprBinary*>(node);
      push(e->lhs);
      push(e->rhs);
      break;
    }
    case AstNodeKind::ExprAssign: {
      auto* e = static_cast<const ExprAssign*>(node);
      push(e->lhs);
      push(e->rhs);
      break;
    }
    case AstNodeKind::ExprTry:
      push(static_cast<const ExprTry*>(node)->expr);
      break;
    default:
      break;
  }
  return out;
}

void dump_ast(std::ostream& os, const AstNode* node, int indent) {
  indent_to(os, indent);
  if (!node) {
    os << "<null>\n";
    return;
  }
  os << ast_kind_name(node->kind);
  dump_label(os, node);
  os << '\n';
  for (const AstNode* child : children(node)) dump_ast(os, child, indent + 1);
}

}  // namespace smir
