#include "convert.hpp"

#include <iterator>
#include <sstream>
#include <string>

#include <llvm/Support/Debug.h>
#include <llvm/Support/raw_ostream.h>

#include "identity.hpp"
#include "opaque.hpp"
#include "tables.hpp"

#define DEBUG_TYPE "smir"

namespace smir {

namespace {

template <typename Fn>
static std::string render(Fn&& fn) {
    std::ostringstream os;
    fn(os);
    return os.str();
}

static const char* statement_kind_name(const MirStatement& stmt) {
    static constexpr const char* kNames[] = {
        "Assign",       "FakeRead",        "SetDiscriminant",
        "Deinit",       "StorageLive",     "StorageDead",
        "Retag",        "PlaceMention",    "AscribeUserType",
        "Coverage",     "Intrinsic",       "ConstEvalCounter",
        "Nop",
    };
    static_assert(std::size(kNames) ==
                  std::variant_size_v<decltype(MirStatement::data)>);
    return kNames[stmt.data.index()];
}

static const char* type_kind_name(const TypeData& td) {
    static constexpr const char* kNames[] = {
        "Bool",      "Char",    "Int",      "Uint",
        "Float",     "Adt",     "Foreign",  "Str",
        "Array",     "Slice",   "RawPtr",   "Ref",
        "FnDef",     "FnPtr",   "Dynamic",  "Closure",
        "Generator", "GeneratorWitness",    "Never",
        "Tuple",     "Alias",   "Param",    "Bound",
        "Placeholder", "Infer", "Error",
    };
    static_assert(std::size(kNames) ==
                  std::variant_size_v<decltype(TypeData::data)>);
    return kNames[td.data.index()];
}

static stable::Operand unsupported_operand() {
    return stable::Operand{stable::Operand::Constant{"{unsupported}"}};
}

}  // namespace

// ---- Body ----

stable::Body body_to_stable(Tables& tables, const MirBody& body) {
    stable::Body out{};
    out.locals.reserve(body.local_decls.size());
    for (const MirLocalDecl& decl : body.local_decls)
        out.locals.push_back(tables.intern_ty(decl.ty));

    out.blocks.reserve(body.basic_blocks.size());
    for (std::size_t i = 0; i < body.basic_blocks.size(); i++) {
        out.blocks.push_back(to_stable(tables, body.basic_blocks[i],
                                       static_cast<BasicBlock>(i)));
    }
    return out;
}

stable::BasicBlock to_stable(Tables& tables, const MirBasicBlockData& block,
                             BasicBlock index) {
    stable::BasicBlock out{};
    out.statements.reserve(block.statements.size());
    for (const MirStatement& stmt : block.statements)
        out.statements.push_back(to_stable(tables, stmt));

    if (!block.terminator) {
        tables.invariant_violated("basic block bb" + std::to_string(index) +
                                  " has no terminator");
        return out;
    }
    out.terminator = to_stable(tables, *block.terminator);
    return out;
}

// ---- Statements ----

stable::Statement to_stable(Tables& tables, const MirStatement& stmt) {
    return std::visit(
        [&](const auto& s) -> stable::Statement {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, MirStatement::Assign>) {
                return stable::Statement{stable::Statement::Assign{
                    to_stable(tables, s.place), to_stable(tables, s.rvalue)}};
            } else if constexpr (std::is_same_v<T, MirStatement::Nop>) {
                return stable::Statement{stable::Statement::Nop{}};
            } else if constexpr (std::is_same_v<T, MirStatement::FakeRead> ||
                                 std::is_same_v<T,
                                                MirStatement::SetDiscriminant> ||
                                 std::is_same_v<T, MirStatement::Deinit> ||
                                 std::is_same_v<T, MirStatement::StorageLive> ||
                                 std::is_same_v<T, MirStatement::StorageDead> ||
                                 std::is_same_v<T, MirStatement::Retag> ||
                                 std::is_same_v<T,
                                                MirStatement::PlaceMention> ||
                                 std::is_same_v<
                                     T, MirStatement::AscribeUserType> ||
                                 std::is_same_v<T, MirStatement::Coverage> ||
                                 std::is_same_v<T, MirStatement::Intrinsic> ||
                                 std::is_same_v<
                                     T, MirStatement::ConstEvalCounter>) {
                tables.not_yet_implemented(std::string("statement `") +
                                           statement_kind_name(stmt) + "`");
                return stable::Statement{stable::Statement::Nop{}};
            } else {
                static_assert(dependent_false_v<T>, "unhandled statement");
            }
        },
        stmt.data);
}

stable::Rvalue to_stable(Tables& tables, const MirRvalue& rvalue) {
    using R = stable::Rvalue;
    return std::visit(
        [&](const auto& r) -> R {
            using T = std::decay_t<decltype(r)>;
            if constexpr (std::is_same_v<T, MirRvalue::Use>) {
                return R{R::Use{to_stable(tables, r.op)}};
            } else if constexpr (std::is_same_v<T, MirRvalue::Repeat>) {
                return R{R::Repeat{to_stable(tables, r.op),
                                   opaque(tables.tcx, r.count)}};
            } else if constexpr (std::is_same_v<T, MirRvalue::Ref>) {
                return R{R::Ref{opaque(r.region), to_stable(tables, r.kind),
                                to_stable(tables, r.place)}};
            } else if constexpr (std::is_same_v<T, MirRvalue::ThreadLocalRef>) {
                return R{R::ThreadLocalRef{crate_item(tables, r.def)}};
            } else if constexpr (std::is_same_v<T, MirRvalue::AddressOf>) {
                return R{R::AddressOf{to_stable(tables, r.mutbl),
                                      to_stable(tables, r.place)}};
            } else if constexpr (std::is_same_v<T, MirRvalue::Len>) {
                return R{R::Len{to_stable(tables, r.place)}};
            } else if constexpr (std::is_same_v<T, MirRvalue::Cast>) {
                return R{R::Cast{to_stable(tables, r.kind),
                                 to_stable(tables, r.op),
                                 tables.intern_ty(r.ty)}};
            } else if constexpr (std::is_same_v<T, MirRvalue::BinaryOp>) {
                return R{R::BinaryOp{to_stable(tables, r.op),
                                     to_stable(tables, r.lhs),
                                     to_stable(tables, r.rhs)}};
            } else if constexpr (std::is_same_v<T,
                                                MirRvalue::CheckedBinaryOp>) {
                return R{R::CheckedBinaryOp{to_stable(tables, r.op),
                                            to_stable(tables, r.lhs),
                                            to_stable(tables, r.rhs)}};
            } else if constexpr (std::is_same_v<T, MirRvalue::NullaryOp>) {
                return R{R::NullaryOp{to_stable(tables, r.op),
                                      tables.intern_ty(r.ty)}};
            } else if constexpr (std::is_same_v<T, MirRvalue::UnaryOp>) {
                return R{R::UnaryOp{to_stable(tables, r.op),
                                    to_stable(tables, r.operand)}};
            } else if constexpr (std::is_same_v<T, MirRvalue::Discriminant>) {
                return R{R::Discriminant{to_stable(tables, r.place)}};
            } else if constexpr (std::is_same_v<T, MirRvalue::Aggregate>) {
                tables.not_yet_implemented("rvalue `Aggregate`");
                return R{R::Use{unsupported_operand()}};
            } else if constexpr (std::is_same_v<T, MirRvalue::ShallowInitBox>) {
                tables.not_yet_implemented("rvalue `ShallowInitBox`");
                return R{R::Use{unsupported_operand()}};
            } else if constexpr (std::is_same_v<T, MirRvalue::CopyForDeref>) {
                return R{R::CopyForDeref{to_stable(tables, r.place)}};
            } else {
                static_assert(dependent_false_v<T>, "unhandled rvalue");
            }
        },
        rvalue.data);
}

stable::Operand to_stable(Tables& tables, const MirOperand& op) {
    using O = stable::Operand;
    return std::visit(
        [&](const auto& o) -> O {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, MirOperand::Copy>) {
                return O{O::Copy{to_stable(tables, o.place)}};
            } else if constexpr (std::is_same_v<T, MirOperand::Move>) {
                return O{O::Move{to_stable(tables, o.place)}};
            } else if constexpr (std::is_same_v<T, MirOperand::Constant>) {
                return O{O::Constant{render([&](std::ostream& os) {
                    print_constant(os, tables.tcx, o.value);
                })}};
            } else {
                static_assert(dependent_false_v<T>, "unhandled operand");
            }
        },
        op.data);
}

stable::Place to_stable(Tables& tables, const MirPlace& place) {
    return stable::Place{
        .local = static_cast<std::size_t>(place.local),
        .projection = render([&](std::ostream& os) {
            print_place_projection(os, tables.tcx, place.projection);
        }),
    };
}

// ---- Kinds ----

stable::Mutability to_stable(Tables&, Mutability mutbl) {
    switch (mutbl) {
        case Mutability::Not:
            return stable::Mutability::Not;
        case Mutability::Mut:
            return stable::Mutability::Mut;
    }
    return stable::Mutability::Not;
}

stable::BorrowKind to_stable(Tables& tables, const BorrowKind& kind) {
    using B = stable::BorrowKind;
    return std::visit(
        [&](const auto& k) -> B {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, BorrowKind::Shared>) {
                return B{B::Shared{}};
            } else if constexpr (std::is_same_v<T, BorrowKind::Shallow>) {
                return B{B::Shallow{}};
            } else if constexpr (std::is_same_v<T, BorrowKind::Mut>) {
                return B{B::Mut{to_stable(tables, k.kind)}};
            } else {
                static_assert(dependent_false_v<T>, "unhandled borrow kind");
            }
        },
        kind.data);
}

stable::MutBorrowKind to_stable(Tables&, MutBorrowKind kind) {
    switch (kind) {
        case MutBorrowKind::Default:
            return stable::MutBorrowKind::Default;
        case MutBorrowKind::TwoPhaseBorrow:
            return stable::MutBorrowKind::TwoPhaseBorrow;
        case MutBorrowKind::ClosureCapture:
            return stable::MutBorrowKind::ClosureCapture;
    }
    return stable::MutBorrowKind::Default;
}

stable::NullOp to_stable(Tables&, const NullOp& op) {
    using N = stable::NullOp;
    return std::visit(
        [&](const auto& n) -> N {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, NullOp::SizeOf>) {
                return N{N::SizeOf{}};
            } else if constexpr (std::is_same_v<T, NullOp::AlignOf>) {
                return N{N::AlignOf{}};
            } else if constexpr (std::is_same_v<T, NullOp::OffsetOf>) {
                N::OffsetOf out{};
                for (FieldIdx f : n.fields)
                    out.fields.push_back(static_cast<std::size_t>(f));
                return N{std::move(out)};
            } else {
                static_assert(dependent_false_v<T>, "unhandled null op");
            }
        },
        op.data);
}

stable::CastKind to_stable(Tables& tables, const CastKind& kind) {
    using C = stable::CastKind;
    return std::visit(
        [&](const auto& k) -> C {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, CastKind::PointerExposeAddress>) {
                return C{C::PointerExposeAddress{}};
            } else if constexpr (std::is_same_v<
                                     T, CastKind::PointerFromExposedAddress>) {
                return C{C::PointerFromExposedAddress{}};
            } else if constexpr (std::is_same_v<T, CastKind::Coercion>) {
                return C{C::PointerCoercion{to_stable(tables, k.coercion)}};
            } else if constexpr (std::is_same_v<T, CastKind::DynStar>) {
                return C{C::DynStar{}};
            } else if constexpr (std::is_same_v<T, CastKind::IntToInt>) {
                return C{C::IntToInt{}};
            } else if constexpr (std::is_same_v<T, CastKind::FloatToInt>) {
                return C{C::FloatToInt{}};
            } else if constexpr (std::is_same_v<T, CastKind::FloatToFloat>) {
                return C{C::FloatToFloat{}};
            } else if constexpr (std::is_same_v<T, CastKind::IntToFloat>) {
                return C{C::IntToFloat{}};
            } else if constexpr (std::is_same_v<T, CastKind::PtrToPtr>) {
                return C{C::PtrToPtr{}};
            } else if constexpr (std::is_same_v<T, CastKind::FnPtrToPtr>) {
                return C{C::FnPtrToPtr{}};
            } else if constexpr (std::is_same_v<T, CastKind::Transmute>) {
                return C{C::Transmute{}};
            } else {
                static_assert(dependent_false_v<T>, "unhandled cast kind");
            }
        },
        kind.data);
}

stable::PointerCoercion to_stable(Tables& tables, const PointerCoercion& c) {
    using P = stable::PointerCoercion;
    return std::visit(
        [&](const auto& k) -> P {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, PointerCoercion::ReifyFnPointer>) {
                return P{P::ReifyFnPointer{}};
            } else if constexpr (std::is_same_v<
                                     T, PointerCoercion::UnsafeFnPointer>) {
                return P{P::UnsafeFnPointer{}};
            } else if constexpr (std::is_same_v<
                                     T, PointerCoercion::ClosureFnPointer>) {
                return P{P::ClosureFnPointer{to_stable(tables, k.unsafety)}};
            } else if constexpr (std::is_same_v<
                                     T, PointerCoercion::MutToConstPointer>) {
                return P{P::MutToConstPointer{}};
            } else if constexpr (std::is_same_v<
                                     T, PointerCoercion::ArrayToPointer>) {
                return P{P::ArrayToPointer{}};
            } else if constexpr (std::is_same_v<T, PointerCoercion::Unsize>) {
                return P{P::Unsize{}};
            } else {
                static_assert(dependent_false_v<T>, "unhandled coercion");
            }
        },
        c.data);
}

stable::Safety to_stable(Tables&, Unsafety unsafety) {
    switch (unsafety) {
        case Unsafety::Unsafe:
            return stable::Safety::Unsafe;
        case Unsafety::Normal:
            return stable::Safety::Normal;
    }
    return stable::Safety::Normal;
}

stable::UnwindAction to_stable(Tables&, const UnwindAction& unwind) {
    using U = stable::UnwindAction;
    return std::visit(
        [&](const auto& u) -> U {
            using T = std::decay_t<decltype(u)>;
            if constexpr (std::is_same_v<T, UnwindAction::Continue>) {
                return U{U::Continue{}};
            } else if constexpr (std::is_same_v<T, UnwindAction::Unreachable>) {
                return U{U::Unreachable{}};
            } else if constexpr (std::is_same_v<T, UnwindAction::Terminate>) {
                return U{U::Terminate{}};
            } else if constexpr (std::is_same_v<T, UnwindAction::Cleanup>) {
                return U{U::Cleanup{static_cast<std::size_t>(u.block)}};
            } else {
                static_assert(dependent_false_v<T>, "unhandled unwind action");
            }
        },
        unwind.data);
}

stable::AssertMessage to_stable(Tables& tables, const AssertKind& msg) {
    using A = stable::AssertMessage;
    return std::visit(
        [&](const auto& m) -> A {
            using T = std::decay_t<decltype(m)>;
            if constexpr (std::is_same_v<T, AssertKind::BoundsCheck>) {
                return A{A::BoundsCheck{to_stable(tables, m.len),
                                        to_stable(tables, m.index)}};
            } else if constexpr (std::is_same_v<T, AssertKind::Overflow>) {
                return A{A::Overflow{to_stable(tables, m.op),
                                     to_stable(tables, m.lhs),
                                     to_stable(tables, m.rhs)}};
            } else if constexpr (std::is_same_v<T, AssertKind::OverflowNeg>) {
                return A{A::OverflowNeg{to_stable(tables, m.op)}};
            } else if constexpr (std::is_same_v<T, AssertKind::DivisionByZero>) {
                return A{A::DivisionByZero{to_stable(tables, m.op)}};
            } else if constexpr (std::is_same_v<T,
                                                AssertKind::RemainderByZero>) {
                return A{A::RemainderByZero{to_stable(tables, m.op)}};
            } else if constexpr (std::is_same_v<
                                     T, AssertKind::ResumedAfterReturn>) {
                return A{A::ResumedAfterReturn{to_stable(tables, m.kind)}};
            } else if constexpr (std::is_same_v<T,
                                                AssertKind::ResumedAfterPanic>) {
                return A{A::ResumedAfterPanic{to_stable(tables, m.kind)}};
            } else if constexpr (std::is_same_v<
                                     T,
                                     AssertKind::MisalignedPointerDereference>) {
                return A{A::MisalignedPointerDereference{
                    to_stable(tables, m.required), to_stable(tables, m.found)}};
            } else {
                static_assert(dependent_false_v<T>, "unhandled assert kind");
            }
        },
        msg.data);
}

stable::BinOp to_stable(Tables&, BinOp op) {
    using B = stable::BinOp;
    switch (op) {
        case BinOp::Add:
            return B::Add;
        case BinOp::AddUnchecked:
            return B::AddUnchecked;
        case BinOp::Sub:
            return B::Sub;
        case BinOp::SubUnchecked:
            return B::SubUnchecked;
        case BinOp::Mul:
            return B::Mul;
        case BinOp::MulUnchecked:
            return B::MulUnchecked;
        case BinOp::Div:
            return B::Div;
        case BinOp::Rem:
            return B::Rem;
        case BinOp::BitXor:
            return B::BitXor;
        case BinOp::BitAnd:
            return B::BitAnd;
        case BinOp::BitOr:
            return B::BitOr;
        case BinOp::Shl:
            return B::Shl;
        case BinOp::ShlUnchecked:
            return B::ShlUnchecked;
        case BinOp::Shr:
            return B::Shr;
        case BinOp::ShrUnchecked:
            return B::ShrUnchecked;
        case BinOp::Eq:
            return B::Eq;
        case BinOp::Lt:
            return B::Lt;
        case BinOp::Le:
            return B::Le;
        case BinOp::Ne:
            return B::Ne;
        case BinOp::Ge:
            return B::Ge;
        case BinOp::Gt:
            return B::Gt;
        case BinOp::Offset:
            return B::Offset;
    }
    return B::Add;
}

stable::UnOp to_stable(Tables&, UnOp op) {
    switch (op) {
        case UnOp::Not:
            return stable::UnOp::Not;
        case UnOp::Neg:
            return stable::UnOp::Neg;
    }
    return stable::UnOp::Not;
}

stable::GeneratorKind to_stable(Tables&, const GeneratorKind& kind) {
    using G = stable::GeneratorKind;
    return std::visit(
        [&](const auto& k) -> G {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, GeneratorKind::Async>) {
                stable::AsyncGeneratorKind async_kind{};
                switch (k.kind) {
                    case AsyncGeneratorKind::Block:
                        async_kind = stable::AsyncGeneratorKind::Block;
                        break;
                    case AsyncGeneratorKind::Closure:
                        async_kind = stable::AsyncGeneratorKind::Closure;
                        break;
                    case AsyncGeneratorKind::Fn:
                        async_kind = stable::AsyncGeneratorKind::Fn;
                        break;
                }
                return G{G::Async{async_kind}};
            } else if constexpr (std::is_same_v<T, GeneratorKind::Gen>) {
                return G{G::Gen{}};
            } else {
                static_assert(dependent_false_v<T>, "unhandled generator kind");
            }
        },
        kind.data);
}

stable::InlineAsmOperand to_stable(Tables& tables,
                                   const InlineAsmOperand& op) {
    stable::InlineAsmOperand out{};
    std::visit(
        [&](const auto& o) {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, InlineAsmOperand::In>) {
                out.in_value = to_stable(tables, o.value);
            } else if constexpr (std::is_same_v<T, InlineAsmOperand::Out>) {
                if (o.place) out.out_place = to_stable(tables, *o.place);
            } else if constexpr (std::is_same_v<T, InlineAsmOperand::InOut>) {
                out.in_value = to_stable(tables, o.in_value);
                if (o.out_place) out.out_place = to_stable(tables, *o.out_place);
            } else if constexpr (std::is_same_v<T, InlineAsmOperand::Const> ||
                                 std::is_same_v<T, InlineAsmOperand::SymFn> ||
                                 std::is_same_v<T,
                                                InlineAsmOperand::SymStatic>) {
            } else {
                static_assert(dependent_false_v<T>, "unhandled asm operand");
            }
        },
        op.data);
    out.raw_rpr = render([&](std::ostream& os) {
        print_inline_asm_operand(os, tables.tcx, op);
    });
    return out;
}

// ---- Terminators ----

stable::Terminator to_stable(Tables& tables, const MirTerminator& term) {
    using S = stable::Terminator;
    return std::visit(
        [&](const auto& t) -> S {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, MirTerminator::Goto>) {
                return S{S::Goto{static_cast<std::size_t>(t.target)}};
            } else if constexpr (std::is_same_v<T, MirTerminator::SwitchInt>) {
                if (t.targets.targets.size() != t.targets.values.size() + 1) {
                    tables.invariant_violated(
                        "`SwitchInt` with " +
                        std::to_string(t.targets.values.size()) +
                        " values has " +
                        std::to_string(t.targets.targets.size()) + " targets");
                    return S{S::Unreachable{}};
                }
                S::SwitchInt out{.discr = to_stable(tables, t.discr)};
                for (std::size_t i = 0; i < t.targets.values.size(); i++) {
                    out.targets.push_back(stable::SwitchTarget{
                        .value = t.targets.values[i],
                        .target =
                            static_cast<std::size_t>(t.targets.targets[i]),
                    });
                }
                out.otherwise =
                    static_cast<std::size_t>(t.targets.otherwise());
                return S{std::move(out)};
            } else if constexpr (std::is_same_v<T,
                                                MirTerminator::UnwindResume>) {
                return S{S::Resume{}};
            } else if constexpr (std::is_same_v<
                                     T, MirTerminator::UnwindTerminate>) {
                return S{S::Abort{}};
            } else if constexpr (std::is_same_v<T, MirTerminator::Return>) {
                return S{S::Return{}};
            } else if constexpr (std::is_same_v<T, MirTerminator::Unreachable>) {
                return S{S::Unreachable{}};
            } else if constexpr (std::is_same_v<T, MirTerminator::Drop>) {
                return S{S::Drop{to_stable(tables, t.place),
                                 static_cast<std::size_t>(t.target),
                                 to_stable(tables, t.unwind)}};
            } else if constexpr (std::is_same_v<T, MirTerminator::Call>) {
                S::Call out{.func = to_stable(tables, t.func)};
                for (const MirOperand& arg : t.args)
                    out.args.push_back(to_stable(tables, arg));
                out.destination = to_stable(tables, t.destination);
                if (t.target) out.target = static_cast<std::size_t>(*t.target);
                out.unwind = to_stable(tables, t.unwind);
                return S{std::move(out)};
            } else if constexpr (std::is_same_v<T, MirTerminator::Assert>) {
                return S{S::Assert{to_stable(tables, t.cond), t.expected,
                                   to_stable(tables, t.msg),
                                   static_cast<std::size_t>(t.target),
                                   to_stable(tables, t.unwind)}};
            } else if constexpr (std::is_same_v<T, MirTerminator::InlineAsm>) {
                S::InlineAsm out{};
                out.template_ = render([&](std::ostream& os) {
                    print_inline_asm_template(os, t.template_);
                });
                for (const InlineAsmOperand& op : t.operands)
                    out.operands.push_back(to_stable(tables, op));
                out.options = render([&](std::ostream& os) {
                    print_inline_asm_options(os, t.options);
                });
                out.line_spans = render([&](std::ostream& os) {
                    print_line_spans(os, t.line_spans);
                });
                if (t.destination)
                    out.destination = static_cast<std::size_t>(*t.destination);
                out.unwind = to_stable(tables, t.unwind);
                return S{std::move(out)};
            } else if constexpr (std::is_same_v<T, MirTerminator::Yield> ||
                                 std::is_same_v<T,
                                                MirTerminator::GeneratorDrop> ||
                                 std::is_same_v<T, MirTerminator::FalseEdge> ||
                                 std::is_same_v<T, MirTerminator::FalseUnwind>) {
                // Lowered away before optimized MIR is built.
                tables.invariant_violated(
                    "terminator kind cannot appear in optimized MIR");
                return S{S::Unreachable{}};
            } else {
                static_assert(dependent_false_v<T>, "unhandled terminator");
            }
        },
        term.data);
}

// ---- Types ----

stable::GenericArgs to_stable(Tables& tables, const GenericArgs& args) {
    using K = stable::GenericArgKind;
    stable::GenericArgs out{};
    out.args.reserve(args.size());
    for (const GenericArg& arg : args) {
        out.args.push_back(std::visit(
            [&](const auto& a) -> K {
                using T = std::decay_t<decltype(a)>;
                if constexpr (std::is_same_v<T, Region>) {
                    return K{K::Lifetime{opaque(a)}};
                } else if constexpr (std::is_same_v<T, Ty>) {
                    return K{K::Type{tables.intern_ty(a)}};
                } else if constexpr (std::is_same_v<T, TyConst>) {
                    return K{K::Const{opaque(tables.tcx, a)}};
                } else {
                    static_assert(dependent_false_v<T>, "unhandled generic arg");
                }
            },
            arg.data));
    }
    return out;
}

stable::PolyFnSig to_stable(Tables& tables, const PolyFnSig& sig) {
    stable::PolyFnSig out{.value = to_stable(tables, sig.sig)};
    for (const BoundVariableKind& bv : sig.bound_vars)
        out.bound_vars.push_back(to_stable(tables, bv));
    return out;
}

stable::FnSig to_stable(Tables& tables, const FnSig& sig) {
    stable::FnSig out{};
    for (Ty ty : sig.inputs_and_output)
        out.inputs_and_output.push_back(tables.intern_ty(ty));
    out.c_variadic = sig.c_variadic;
    out.safety = to_stable(tables, sig.unsafety);
    out.abi = to_stable(tables, sig.abi);
    return out;
}

stable::Abi to_stable(Tables&, const Abi& abi) {
    using A = stable::AbiTag;
    A tag = A::Rust;
    switch (abi.kind) {
        case AbiKind::Rust:
            tag = A::Rust;
            break;
        case AbiKind::C:
            tag = A::C;
            break;
        case AbiKind::Cdecl:
            tag = A::Cdecl;
            break;
        case AbiKind::Stdcall:
            tag = A::Stdcall;
            break;
        case AbiKind::Fastcall:
            tag = A::Fastcall;
            break;
        case AbiKind::Vectorcall:
            tag = A::Vectorcall;
            break;
        case AbiKind::Thiscall:
            tag = A::Thiscall;
            break;
        case AbiKind::Aapcs:
            tag = A::Aapcs;
            break;
        case AbiKind::Win64:
            tag = A::Win64;
            break;
        case AbiKind::SysV64:
            tag = A::SysV64;
            break;
        case AbiKind::PtxKernel:
            tag = A::PtxKernel;
            break;
        case AbiKind::Msp430Interrupt:
            tag = A::Msp430Interrupt;
            break;
        case AbiKind::X86Interrupt:
            tag = A::X86Interrupt;
            break;
        case AbiKind::AmdGpuKernel:
            tag = A::AmdGpuKernel;
            break;
        case AbiKind::EfiApi:
            tag = A::EfiApi;
            break;
        case AbiKind::AvrInterrupt:
            tag = A::AvrInterrupt;
            break;
        case AbiKind::AvrNonBlockingInterrupt:
            tag = A::AvrNonBlockingInterrupt;
            break;
        case AbiKind::CCmseNonSecureCall:
            tag = A::CCmseNonSecureCall;
            break;
        case AbiKind::Wasm:
            tag = A::Wasm;
            break;
        case AbiKind::System:
            tag = A::System;
            break;
        case AbiKind::RustIntrinsic:
            tag = A::RustIntrinsic;
            break;
        case AbiKind::RustCall:
            tag = A::RustCall;
            break;
        case AbiKind::PlatformIntrinsic:
            tag = A::PlatformIntrinsic;
            break;
        case AbiKind::Unadjusted:
            tag = A::Unadjusted;
            break;
        case AbiKind::RustCold:
            tag = A::RustCold;
            break;
    }
    return stable::Abi{.tag = tag,
                       .unwind = abi_has_unwind(abi.kind) && abi.unwind};
}

stable::BoundVariableKind to_stable(Tables& tables,
                                    const BoundVariableKind& kind) {
    using BV = stable::BoundVariableKind;
    return std::visit(
        [&](const auto& k) -> BV {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, BoundTyKind>) {
                using BT = stable::BoundTyKind;
                if (const auto* p = std::get_if<BoundTyKind::Param>(&k.data))
                    return BV{BT{BT::Param{param_def(tables, p->def), p->name}}};
                return BV{BT{BT::Anon{}}};
            } else if constexpr (std::is_same_v<T, BoundRegionKind>) {
                using BR = stable::BoundRegionKind;
                return std::visit(
                    [&](const auto& r) -> BV {
                        using R = std::decay_t<decltype(r)>;
                        if constexpr (std::is_same_v<R,
                                                     BoundRegionKind::BrAnon>) {
                            BR::BrAnon out{};
                            if (r.span) out.span = opaque(*r.span);
                            return BV{BR{std::move(out)}};
                        } else if constexpr (std::is_same_v<
                                                 R, BoundRegionKind::BrNamed>) {
                            return BV{BR{BR::BrNamed{
                                br_named_def(tables, r.def), r.name}}};
                        } else if constexpr (std::is_same_v<
                                                 R, BoundRegionKind::BrEnv>) {
                            return BV{BR{BR::BrEnv{}}};
                        } else {
                            static_assert(dependent_false_v<R>,
                                          "unhandled bound region");
                        }
                    },
                    k.data);
            } else if constexpr (std::is_same_v<T, BoundVariableKind::Const>) {
                return BV{BV::Const{}};
            } else {
                static_assert(dependent_false_v<T>, "unhandled bound variable");
            }
        },
        kind.data);
}

stable::TyKind ty_kind_of(Tables& tables, Ty ty) {
    using R = stable::RigidTy;
    const TypeData& td = tables.tcx.types.get(ty);
    LLVM_DEBUG(llvm::dbgs() << "ty_kind_of: " << tables.tcx.ty_to_string(ty)
                            << "\n");
    R rigid = std::visit(
        [&](const auto& t) -> R {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, TypeData::Bool>) {
                return R{R::Bool{}};
            } else if constexpr (std::is_same_v<T, TypeData::Char>) {
                return R{R::Char{}};
            } else if constexpr (std::is_same_v<T, TypeData::Int>) {
                switch (t.ty) {
                    case IntTy::Isize:
                        return R{R::Int{stable::IntTy::Isize}};
                    case IntTy::I8:
                        return R{R::Int{stable::IntTy::I8}};
                    case IntTy::I16:
                        return R{R::Int{stable::IntTy::I16}};
                    case IntTy::I32:
                        return R{R::Int{stable::IntTy::I32}};
                    case IntTy::I64:
                        return R{R::Int{stable::IntTy::I64}};
                    case IntTy::I128:
                        return R{R::Int{stable::IntTy::I128}};
                }
                return R{R::Int{}};
            } else if constexpr (std::is_same_v<T, TypeData::Uint>) {
                switch (t.ty) {
                    case UintTy::Usize:
                        return R{R::Uint{stable::UintTy::Usize}};
                    case UintTy::U8:
                        return R{R::Uint{stable::UintTy::U8}};
                    case UintTy::U16:
                        return R{R::Uint{stable::UintTy::U16}};
                    case UintTy::U32:
                        return R{R::Uint{stable::UintTy::U32}};
                    case UintTy::U64:
                        return R{R::Uint{stable::UintTy::U64}};
                    case UintTy::U128:
                        return R{R::Uint{stable::UintTy::U128}};
                }
                return R{R::Uint{}};
            } else if constexpr (std::is_same_v<T, TypeData::Float>) {
                switch (t.ty) {
                    case FloatTy::F32:
                        return R{R::Float{stable::FloatTy::F32}};
                    case FloatTy::F64:
                        return R{R::Float{stable::FloatTy::F64}};
                }
                return R{R::Float{}};
            } else if constexpr (std::is_same_v<T, TypeData::Adt>) {
                return R{R::Adt{adt_def(tables, t.def),
                                to_stable(tables, t.args)}};
            } else if constexpr (std::is_same_v<T, TypeData::Foreign>) {
                return R{R::Foreign{foreign_def(tables, t.def)}};
            } else if constexpr (std::is_same_v<T, TypeData::Str>) {
                return R{R::Str{}};
            } else if constexpr (std::is_same_v<T, TypeData::Array>) {
                return R{R::Array{tables.intern_ty(t.elem),
                                  opaque(tables.tcx, t.len)}};
            } else if constexpr (std::is_same_v<T, TypeData::Slice>) {
                return R{R::Slice{tables.intern_ty(t.elem)}};
            } else if constexpr (std::is_same_v<T, TypeData::RawPtr>) {
                return R{R::RawPtr{tables.intern_ty(t.pointee),
                                   to_stable(tables, t.mutbl)}};
            } else if constexpr (std::is_same_v<T, TypeData::Ref>) {
                return R{R::Ref{opaque(t.region), tables.intern_ty(t.pointee),
                                to_stable(tables, t.mutbl)}};
            } else if constexpr (std::is_same_v<T, TypeData::FnDef>) {
                return R{R::FnDef{fn_def(tables, t.def),
                                  to_stable(tables, t.args)}};
            } else if constexpr (std::is_same_v<T, TypeData::FnPtr>) {
                return R{R::FnPtr{to_stable(tables, t.sig)}};
            } else if constexpr (std::is_same_v<T, TypeData::Closure>) {
                return R{R::Closure{closure_def(tables, t.def),
                                    to_stable(tables, t.args)}};
            } else if constexpr (std::is_same_v<T, TypeData::Generator>) {
                stable::Movability movability =
                    t.movability == Movability::Static
                        ? stable::Movability::Static
                        : stable::Movability::Movable;
                return R{R::Generator{generator_def(tables, t.def),
                                      to_stable(tables, t.args), movability}};
            } else if constexpr (std::is_same_v<T, TypeData::Never>) {
                return R{R::Never{}};
            } else if constexpr (std::is_same_v<T, TypeData::Tuple>) {
                R::Tuple out{};
                for (Ty elem : t.elems) out.elems.push_back(tables.intern_ty(elem));
                return R{std::move(out)};
            } else if constexpr (std::is_same_v<T, TypeData::Dynamic> ||
                                 std::is_same_v<T, TypeData::Alias> ||
                                 std::is_same_v<T, TypeData::Param> ||
                                 std::is_same_v<T, TypeData::Bound>) {
                tables.not_yet_implemented(std::string("type kind `") +
                                           type_kind_name(td) + "`");
                return R{R::Never{}};
            } else if constexpr (std::is_same_v<T, TypeData::Placeholder> ||
                                 std::is_same_v<T,
                                                TypeData::GeneratorWitness> ||
                                 std::is_same_v<T, TypeData::Infer> ||
                                 std::is_same_v<T, TypeData::Error>) {
                // Inference leftovers never reach optimized MIR.
                tables.invariant_violated(std::string("type kind `") +
                                          type_kind_name(td) +
                                          "` cannot appear in optimized MIR");
                return R{R::Never{}};
            } else {
                static_assert(dependent_false_v<T>, "unhandled type kind");
            }
        },
        td.data);
    return stable::TyKind{std::move(rigid)};
}

}  // namespace smir
