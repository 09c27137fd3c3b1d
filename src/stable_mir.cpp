#include "stable_mir.hpp"

#include <ostream>

#include <llvm/ADT/StringExtras.h>

#include "types.hpp"

namespace smir::stable {

const char* abi_tag_name(AbiTag tag) {
    switch (tag) {
        case AbiTag::Rust:
            return "Rust";
        case AbiTag::C:
            return "C";
        case AbiTag::Cdecl:
            return "Cdecl";
        case AbiTag::Stdcall:
            return "Stdcall";
        case AbiTag::Fastcall:
            return "Fastcall";
        case AbiTag::Vectorcall:
            return "Vectorcall";
        case AbiTag::Thiscall:
            return "Thiscall";
        case AbiTag::Aapcs:
            return "Aapcs";
        case AbiTag::Win64:
            return "Win64";
        case AbiTag::SysV64:
            return "SysV64";
        case AbiTag::PtxKernel:
            return "PtxKernel";
        case AbiTag::Msp430Interrupt:
            return "Msp430Interrupt";
        case AbiTag::X86Interrupt:
            return "X86Interrupt";
        case AbiTag::AmdGpuKernel:
            return "AmdGpuKernel";
        case AbiTag::EfiApi:
            return "EfiApi";
        case AbiTag::AvrInterrupt:
            return "AvrInterrupt";
        case AbiTag::AvrNonBlockingInterrupt:
            return "AvrNonBlockingInterrupt";
        case AbiTag::CCmseNonSecureCall:
            return "CCmseNonSecureCall";
        case AbiTag::Wasm:
            return "Wasm";
        case AbiTag::System:
            return "System";
        case AbiTag::RustIntrinsic:
            return "RustIntrinsic";
        case AbiTag::RustCall:
            return "RustCall";
        case AbiTag::PlatformIntrinsic:
            return "PlatformIntrinsic";
        case AbiTag::Unadjusted:
            return "Unadjusted";
        case AbiTag::RustCold:
            return "RustCold";
    }
    return "?";
}

const char* bin_op_name(BinOp op) {
    switch (op) {
        case BinOp::Add:
            return "Add";
        case BinOp::AddUnchecked:
            return "AddUnchecked";
        case BinOp::Sub:
            return "Sub";
        case BinOp::SubUnchecked:
            return "SubUnchecked";
        case BinOp::Mul:
            return "Mul";
        case BinOp::MulUnchecked:
            return "MulUnchecked";
        case BinOp::Div:
            return "Div";
        case BinOp::Rem:
            return "Rem";
        case BinOp::BitXor:
            return "BitXor";
        case BinOp::BitAnd:
            return "BitAnd";
        case BinOp::BitOr:
            return "BitOr";
        case BinOp::Shl:
            return "Shl";
        case BinOp::ShlUnchecked:
            return "ShlUnchecked";
        case BinOp::Shr:
            return "Shr";
        case BinOp::ShrUnchecked:
            return "ShrUnchecked";
        case BinOp::Eq:
            return "Eq";
        case BinOp::Lt:
            return "Lt";
        case BinOp::Le:
            return "Le";
        case BinOp::Ne:
            return "Ne";
        case BinOp::Ge:
            return "Ge";
        case BinOp::Gt:
            return "Gt";
        case BinOp::Offset:
            return "Offset";
    }
    return "?";
}

const char* un_op_name(UnOp op) {
    switch (op) {
        case UnOp::Not:
            return "Not";
        case UnOp::Neg:
            return "Neg";
    }
    return "?";
}

static void push_unwind(std::vector<std::size_t>& out, const UnwindAction& u) {
    if (const auto* c = std::get_if<UnwindAction::Cleanup>(&u.data))
        out.push_back(c->block);
}

std::vector<std::size_t> successors(const Terminator& term) {
    std::vector<std::size_t> out{};
    std::visit(
        [&](const auto& t) {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, Terminator::Goto>) {
                out.push_back(t.target);
            } else if constexpr (std::is_same_v<T, Terminator::SwitchInt>) {
                for (const SwitchTarget& st : t.targets) out.push_back(st.target);
                out.push_back(t.otherwise);
            } else if constexpr (std::is_same_v<T, Terminator::Resume> ||
                                 std::is_same_v<T, Terminator::Abort> ||
                                 std::is_same_v<T, Terminator::Return> ||
                                 std::is_same_v<T, Terminator::Unreachable>) {
            } else if constexpr (std::is_same_v<T, Terminator::Drop>) {
                out.push_back(t.target);
                push_unwind(out, t.unwind);
            } else if constexpr (std::is_same_v<T, Terminator::Call>) {
                if (t.target) out.push_back(*t.target);
                push_unwind(out, t.unwind);
            } else if constexpr (std::is_same_v<T, Terminator::Assert>) {
                out.push_back(t.target);
                push_unwind(out, t.unwind);
            } else if constexpr (std::is_same_v<T, Terminator::InlineAsm>) {
                if (t.destination) out.push_back(*t.destination);
                push_unwind(out, t.unwind);
            } else {
                static_assert(dependent_false_v<T>, "unhandled terminator");
            }
        },
        term.data);
    return out;
}

namespace {

static void dump_place(std::ostream& os, const Place& p) {
    os << "_" << p.local;
    if (p.projection != "[]") os << p.projection;
}

static void dump_operand(std::ostream& os, const Operand& op) {
    std::visit(
        [&](const auto& o) {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, Operand::Copy>) {
                os << "copy ";
                dump_place(os, o.place);
            } else if constexpr (std::is_same_v<T, Operand::Move>) {
                os << "move ";
                dump_place(os, o.place);
            } else if constexpr (std::is_same_v<T, Operand::Constant>) {
                os << o.text;
            }
        },
        op.data);
}

static void dump_ty(std::ostream& os, Ty ty) { os << "ty#" << ty.id; }

static void dump_rvalue(std::ostream& os, const Rvalue& rv) {
    std::visit(
        [&](const auto& r) {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, Rvalue::Use>) {
                dump_operand(os, r.op);
            } else if constexpr (std::is_same_v<T, Rvalue::Repeat>) {
                os << "[";
                dump_operand(os, r.op);
                os << "; " << r.count << "]";
            } else if constexpr (std::is_same_v<T, Rvalue::Ref>) {
                os << "&";
                if (std::holds_alternative<BorrowKind::Mut>(r.kind.data))
                    os << "mut ";
                else if (std::holds_alternative<BorrowKind::Shallow>(
                             r.kind.data))
                    os << "fake ";
                dump_place(os, r.place);
            } else if constexpr (std::is_same_v<T, Rvalue::ThreadLocalRef>) {
                os << "&/*tls*/ item#" << r.item.def;
            } else if constexpr (std::is_same_v<T, Rvalue::AddressOf>) {
                os << (r.mutbl == Mutability::Mut ? "&raw mut " : "&raw const ");
                dump_place(os, r.place);
            } else if constexpr (std::is_same_v<T, Rvalue::Len>) {
                os << "Len(";
                dump_place(os, r.place);
                os << ")";
            } else if constexpr (std::is_same_v<T, Rvalue::Cast>) {
                dump_operand(os, r.op);
                os << " as ";
                dump_ty(os, r.ty);
            } else if constexpr (std::is_same_v<T, Rvalue::BinaryOp> ||
                                 std::is_same_v<T, Rvalue::CheckedBinaryOp>) {
                if constexpr (std::is_same_v<T, Rvalue::CheckedBinaryOp>)
                    os << "Checked";
                os << bin_op_name(r.op) << "(";
                dump_operand(os, r.lhs);
                os << ", ";
                dump_operand(os, r.rhs);
                os << ")";
            } else if constexpr (std::is_same_v<T, Rvalue::NullaryOp>) {
                if (std::holds_alternative<NullOp::SizeOf>(r.op.data))
                    os << "SizeOf(";
                else if (std::holds_alternative<NullOp::AlignOf>(r.op.data))
                    os << "AlignOf(";
                else
                    os << "OffsetOf(";
                dump_ty(os, r.ty);
                os << ")";
            } else if constexpr (std::is_same_v<T, Rvalue::UnaryOp>) {
                os << un_op_name(r.op) << "(";
                dump_operand(os, r.operand);
                os << ")";
            } else if constexpr (std::is_same_v<T, Rvalue::Discriminant>) {
                os << "discriminant(";
                dump_place(os, r.place);
                os << ")";
            } else if constexpr (std::is_same_v<T, Rvalue::CopyForDeref>) {
                os << "deref_copy ";
                dump_place(os, r.place);
            } else {
                static_assert(dependent_false_v<T>, "unhandled rvalue");
            }
        },
        rv.data);
}

static void dump_unwind(std::ostream& os, const UnwindAction& u) {
    std::visit(
        [&](const auto& a) {
            using T = std::decay_t<decltype(a)>;
            if constexpr (std::is_same_v<T, UnwindAction::Continue>) {
                os << "unwind continue";
            } else if constexpr (std::is_same_v<T, UnwindAction::Unreachable>) {
                os << "unwind unreachable";
            } else if constexpr (std::is_same_v<T, UnwindAction::Terminate>) {
                os << "unwind terminate";
            } else if constexpr (std::is_same_v<T, UnwindAction::Cleanup>) {
                os << "unwind: bb" << a.block;
            }
        },
        u.data);
}

static void dump_terminator(std::ostream& os, const Terminator& term) {
    std::visit(
        [&](const auto& t) {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, Terminator::Goto>) {
                os << "goto -> bb" << t.target;
            } else if constexpr (std::is_same_v<T, Terminator::SwitchInt>) {
                os << "switchInt(";
                dump_operand(os, t.discr);
                os << ") -> [";
                for (const SwitchTarget& st : t.targets)
                    os << llvm::toString(st.value, 10, false) << ": bb"
                       << st.target << ", ";
                os << "otherwise: bb" << t.otherwise << "]";
            } else if constexpr (std::is_same_v<T, Terminator::Resume>) {
                os << "resume";
            } else if constexpr (std::is_same_v<T, Terminator::Abort>) {
                os << "abort";
            } else if constexpr (std::is_same_v<T, Terminator::Return>) {
                os << "return";
            } else if constexpr (std::is_same_v<T, Terminator::Unreachable>) {
                os << "unreachable";
            } else if constexpr (std::is_same_v<T, Terminator::Drop>) {
                os << "drop(";
                dump_place(os, t.place);
                os << ") -> [return: bb" << t.target << ", ";
                dump_unwind(os, t.unwind);
                os << "]";
            } else if constexpr (std::is_same_v<T, Terminator::Call>) {
                dump_place(os, t.destination);
                os << " = ";
                dump_operand(os, t.func);
                os << "(";
                for (std::size_t i = 0; i < t.args.size(); i++) {
                    if (i) os << ", ";
                    dump_operand(os, t.args[i]);
                }
                os << ") -> [";
                if (t.target) os << "return: bb" << *t.target << ", ";
                dump_unwind(os, t.unwind);
                os << "]";
            } else if constexpr (std::is_same_v<T, Terminator::Assert>) {
                os << "assert(" << (t.expected ? "" : "!");
                dump_operand(os, t.cond);
                os << ") -> [success: bb" << t.target << ", ";
                dump_unwind(os, t.unwind);
                os << "]";
            } else if constexpr (std::is_same_v<T, Terminator::InlineAsm>) {
                os << "asm!(" << t.template_ << ", " << t.options << ")";
                if (t.destination) os << " -> bb" << *t.destination;
            } else {
                static_assert(dependent_false_v<T>, "unhandled terminator");
            }
        },
        term.data);
}

}  // namespace

void dump_body(std::ostream& os, const Body& body) {
    for (std::size_t i = 0; i < body.locals.size(); i++) {
        os << "let _" << i << ": ";
        dump_ty(os, body.locals[i]);
        os << ";\n";
    }
    for (std::size_t b = 0; b < body.blocks.size(); b++) {
        const BasicBlock& bb = body.blocks[b];
        os << "bb" << b << ": {\n";
        for (const Statement& stmt : bb.statements) {
            os << "    ";
            if (const auto* a = std::get_if<Statement::Assign>(&stmt.data)) {
                dump_place(os, a->place);
                os << " = ";
                dump_rvalue(os, a->rvalue);
            } else {
                os << "nop";
            }
            os << ";\n";
        }
        os << "    ";
        dump_terminator(os, bb.terminator);
        os << ";\n}\n";
    }
}

}  // namespace smir::stable
