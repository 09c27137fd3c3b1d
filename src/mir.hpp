#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <llvm/ADT/APInt.h>

#include "span.hpp"
#include "types.hpp"

namespace smir {

class TyCtxt;

using BasicBlock = std::uint32_t;
using Local = std::uint32_t;
using FieldIdx = std::uint32_t;
using VariantIdx = std::uint32_t;

inline constexpr Local RETURN_PLACE = 0;

struct ProjectionElem {
    struct Deref {};
    struct Field {
        FieldIdx field = 0;
        Ty ty = 0;
    };
    struct Index {
        Local local = 0;
    };
    struct ConstantIndex {
        std::uint64_t offset = 0;
        std::uint64_t min_length = 0;
        bool from_end = false;
    };
    struct Subslice {
        std::uint64_t from = 0;
        std::uint64_t to = 0;
        bool from_end = false;
    };
    struct Downcast {
        std::optional<std::string> name{};
        VariantIdx variant = 0;
    };
    struct OpaqueCast {
        Ty ty = 0;
    };

    std::variant<Deref, Field, Index, ConstantIndex, Subslice, Downcast,
                 OpaqueCast>
        data{};
};

struct MirPlace {
    Local local = 0;
    std::vector<ProjectionElem> projection{};

    static MirPlace from_local(Local l) { return MirPlace{.local = l}; }
};

struct MirConstant {
    Span span{};
    TyConst literal{};
};

struct MirOperand {
    struct Copy {
        MirPlace place{};
    };
    struct Move {
        MirPlace place{};
    };
    struct Constant {
        MirConstant value{};
    };

    std::variant<Copy, Move, Constant> data{};

    static MirOperand copy(MirPlace p) { return MirOperand{Copy{std::move(p)}}; }
    static MirOperand move(MirPlace p) { return MirOperand{Move{std::move(p)}}; }
    static MirOperand constant(TyConst c) {
        return MirOperand{Constant{MirConstant{.literal = std::move(c)}}};
    }
};

enum class BinOp : std::uint8_t {
    Add,
    AddUnchecked,
    Sub,
    SubUnchecked,
    Mul,
    MulUnchecked,
    Div,
    Rem,
    BitXor,
    BitAnd,
    BitOr,
    Shl,
    ShlUnchecked,
    Shr,
    ShrUnchecked,
    Eq,
    Lt,
    Le,
    Ne,
    Ge,
    Gt,
    Offset,
};

enum class UnOp : std::uint8_t { Not, Neg };

enum class MutBorrowKind : std::uint8_t { Default, TwoPhaseBorrow, ClosureCapture };

struct BorrowKind {
    struct Shared {};
    struct Shallow {};
    struct Mut {
        MutBorrowKind kind = MutBorrowKind::Default;
    };

    std::variant<Shared, Shallow, Mut> data{};
};

struct PointerCoercion {
    struct ReifyFnPointer {};
    struct UnsafeFnPointer {};
    struct ClosureFnPointer {
        Unsafety unsafety{};
    };
    struct MutToConstPointer {};
    struct ArrayToPointer {};
    struct Unsize {};

    std::variant<ReifyFnPointer, UnsafeFnPointer, ClosureFnPointer,
                 MutToConstPointer, ArrayToPointer, Unsize>
        data{};
};

struct CastKind {
    struct PointerExposeAddress {};
    struct PointerFromExposedAddress {};
    struct Coercion {
        PointerCoercion coercion{};
    };
    struct DynStar {};
    struct IntToInt {};
    struct FloatToInt {};
    struct FloatToFloat {};
    struct IntToFloat {};
    struct PtrToPtr {};
    struct FnPtrToPtr {};
    struct Transmute {};

    std::variant<PointerExposeAddress, PointerFromExposedAddress, Coercion,
                 DynStar, IntToInt, FloatToInt, FloatToFloat, IntToFloat,
                 PtrToPtr, FnPtrToPtr, Transmute>
        data{};
};

struct NullOp {
    struct SizeOf {};
    struct AlignOf {};
    struct OffsetOf {
        std::vector<FieldIdx> fields{};
    };

    std::variant<SizeOf, AlignOf, OffsetOf> data{};
};

struct AggregateKind {
    struct Array {
        Ty elem = 0;
    };
    struct Tuple {};
    struct Adt {
        DefId def{};
        VariantIdx variant = 0;
        GenericArgs args{};
    };
    struct Closure {
        DefId def{};
        GenericArgs args{};
    };
    struct Generator {
        DefId def{};
        GenericArgs args{};
        Movability movability{};
    };

    std::variant<Array, Tuple, Adt, Closure, Generator> data{};
};

struct MirRvalue {
    struct Use {
        MirOperand op{};
    };
    struct Repeat {
        MirOperand op{};
        TyConst count{};
    };
    struct Ref {
        Region region{};
        BorrowKind kind{};
        MirPlace place{};
    };
    struct ThreadLocalRef {
        DefId def{};
    };
    struct AddressOf {
        Mutability mutbl{};
        MirPlace place{};
    };
    struct Len {
        MirPlace place{};
    };
    struct Cast {
        CastKind kind{};
        MirOperand op{};
        Ty ty = 0;
    };
    struct BinaryOp {
        BinOp op{};
        MirOperand lhs{};
        MirOperand rhs{};
    };
    struct CheckedBinaryOp {
        BinOp op{};
        MirOperand lhs{};
        MirOperand rhs{};
    };
    struct NullaryOp {
        NullOp op{};
        Ty ty = 0;
    };
    struct UnaryOp {
        UnOp op{};
        MirOperand operand{};
    };
    struct Discriminant {
        MirPlace place{};
    };
    struct Aggregate {
        AggregateKind kind{};
        std::vector<MirOperand> fields{};
    };
    struct ShallowInitBox {
        MirOperand op{};
        Ty ty = 0;
    };
    struct CopyForDeref {
        MirPlace place{};
    };

    std::variant<Use, Repeat, Ref, ThreadLocalRef, AddressOf, Len, Cast,
                 BinaryOp, CheckedBinaryOp, NullaryOp, UnaryOp, Discriminant,
                 Aggregate, ShallowInitBox, CopyForDeref>
        data{};
};

struct MirStatement {
    struct Assign {
        MirPlace place{};
        MirRvalue rvalue{};
    };
    struct FakeRead {
        MirPlace place{};
    };
    struct SetDiscriminant {
        MirPlace place{};
        VariantIdx variant = 0;
    };
    struct Deinit {
        MirPlace place{};
    };
    struct StorageLive {
        Local local = 0;
    };
    struct StorageDead {
        Local local = 0;
    };
    struct Retag {
        MirPlace place{};
    };
    struct PlaceMention {
        MirPlace place{};
    };
    struct AscribeUserType {
        MirPlace place{};
    };
    struct Coverage {};
    struct Intrinsic {
        std::vector<MirOperand> args{};
    };
    struct ConstEvalCounter {};
    struct Nop {};

    Span span{};
    std::variant<Assign, FakeRead, SetDiscriminant, Deinit, StorageLive,
                 StorageDead, Retag, PlaceMention, AscribeUserType, Coverage,
                 Intrinsic, ConstEvalCounter, Nop>
        data{Nop{}};
};

struct UnwindAction {
    struct Continue {};
    struct Unreachable {};
    struct Terminate {};
    struct Cleanup {
        BasicBlock block = 0;
    };

    std::variant<Continue, Unreachable, Terminate, Cleanup> data{};
};

enum class AsyncGeneratorKind : std::uint8_t { Block, Closure, Fn };

struct GeneratorKind {
    struct Async {
        AsyncGeneratorKind kind{};
    };
    struct Gen {};

    std::variant<Async, Gen> data{Gen{}};
};

struct AssertKind {
    struct BoundsCheck {
        MirOperand len{};
        MirOperand index{};
    };
    struct Overflow {
        BinOp op{};
        MirOperand lhs{};
        MirOperand rhs{};
    };
    struct OverflowNeg {
        MirOperand op{};
    };
    struct DivisionByZero {
        MirOperand op{};
    };
    struct RemainderByZero {
        MirOperand op{};
    };
    struct ResumedAfterReturn {
        GeneratorKind kind{};
    };
    struct ResumedAfterPanic {
        GeneratorKind kind{};
    };
    struct MisalignedPointerDereference {
        MirOperand required{};
        MirOperand found{};
    };

    std::variant<BoundsCheck, Overflow, OverflowNeg, DivisionByZero,
                 RemainderByZero, ResumedAfterReturn, ResumedAfterPanic,
                 MisalignedPointerDereference>
        data{};
};

// Switch values and their targets; `targets` holds one more entry than
// `values`, the last one being the `otherwise` block.
struct SwitchTargets {
    std::vector<llvm::APInt> values{};
    std::vector<BasicBlock> targets{};

    static SwitchTargets make(
        std::vector<std::pair<std::uint64_t, BasicBlock>> cases,
        BasicBlock otherwise);
    static SwitchTargets if_(std::uint64_t value, BasicBlock then,
                             BasicBlock else_);

    BasicBlock otherwise() const { return targets.back(); }
};

struct InlineAsmTemplatePiece {
    struct String {
        std::string text{};
    };
    struct Placeholder {
        std::size_t operand_idx = 0;
        std::optional<char> modifier{};
        Span span{};
    };

    std::variant<String, Placeholder> data{};
};

// Bitset of `asm!` options.
namespace inline_asm_options {
inline constexpr std::uint16_t PURE = 1 << 0;
inline constexpr std::uint16_t NOMEM = 1 << 1;
inline constexpr std::uint16_t READONLY = 1 << 2;
inline constexpr std::uint16_t PRESERVES_FLAGS = 1 << 3;
inline constexpr std::uint16_t NORETURN = 1 << 4;
inline constexpr std::uint16_t NOSTACK = 1 << 5;
inline constexpr std::uint16_t ATT_SYNTAX = 1 << 6;
inline constexpr std::uint16_t RAW = 1 << 7;
inline constexpr std::uint16_t MAY_UNWIND = 1 << 8;
}  // namespace inline_asm_options

struct InlineAsmOperand {
    struct In {
        std::string reg{};
        MirOperand value{};
    };
    struct Out {
        std::string reg{};
        bool late = false;
        std::optional<MirPlace> place{};
    };
    struct InOut {
        std::string reg{};
        bool late = false;
        MirOperand in_value{};
        std::optional<MirPlace> out_place{};
    };
    struct Const {
        MirConstant value{};
    };
    struct SymFn {
        MirConstant value{};
    };
    struct SymStatic {
        DefId def{};
    };

    std::variant<In, Out, InOut, Const, SymFn, SymStatic> data{};
};

struct MirTerminator {
    struct Goto {
        BasicBlock target = 0;
    };
    struct SwitchInt {
        MirOperand discr{};
        SwitchTargets targets{};
    };
    struct UnwindResume {};
    struct UnwindTerminate {};
    struct Return {};
    struct Unreachable {};
    struct Drop {
        MirPlace place{};
        BasicBlock target = 0;
        UnwindAction unwind{};
        bool replace = false;
    };
    struct Call {
        MirOperand func{};
        std::vector<MirOperand> args{};
        MirPlace destination{};
        std::optional<BasicBlock> target{};
        UnwindAction unwind{};
        Span fn_span{};
    };
    struct Assert {
        MirOperand cond{};
        bool expected = true;
        AssertKind msg{};
        BasicBlock target = 0;
        UnwindAction unwind{};
    };
    struct Yield {
        MirOperand value{};
        BasicBlock resume = 0;
        MirPlace resume_arg{};
        std::optional<BasicBlock> drop{};
    };
    struct GeneratorDrop {};
    struct FalseEdge {
        BasicBlock real_target = 0;
        BasicBlock imaginary_target = 0;
    };
    struct FalseUnwind {
        BasicBlock real_target = 0;
        UnwindAction unwind{};
    };
    struct InlineAsm {
        std::vector<InlineAsmTemplatePiece> template_{};
        std::vector<InlineAsmOperand> operands{};
        std::uint16_t options = 0;
        std::vector<Span> line_spans{};
        std::optional<BasicBlock> destination{};
        UnwindAction unwind{};
    };

    Span span{};
    std::variant<Goto, SwitchInt, UnwindResume, UnwindTerminate, Return,
                 Unreachable, Drop, Call, Assert, Yield, GeneratorDrop,
                 FalseEdge, FalseUnwind, InlineAsm>
        data{Unreachable{}};
};

struct MirBasicBlockData {
    std::vector<MirStatement> statements{};
    // Only absent while a body is under construction.
    std::optional<MirTerminator> terminator{};
    bool is_cleanup = false;
};

struct MirLocalDecl {
    Ty ty = 0;
    Mutability mutbl = Mutability::Mut;
    std::string name{};
};

struct MirBody {
    DefId owner{};
    Span span{};

    // The return place is always local#0, followed by `arg_count` arguments.
    std::vector<MirLocalDecl> local_decls{};
    std::size_t arg_count = 0;

    std::vector<MirBasicBlockData> basic_blocks{};
};

// Debug renderings, in the form the opaque stable values carry.
void print_place_projection(std::ostream& os, const TyCtxt& tcx,
                            const std::vector<ProjectionElem>& projection);
void print_constant(std::ostream& os, const TyCtxt& tcx, const MirConstant& c);
void print_inline_asm_template(std::ostream& os,
                               const std::vector<InlineAsmTemplatePiece>& t);
void print_inline_asm_options(std::ostream& os, std::uint16_t options);
void print_line_spans(std::ostream& os, const std::vector<Span>& spans);
void print_inline_asm_operand(std::ostream& os, const TyCtxt& tcx,
                              const InlineAsmOperand& op);
void print_place(std::ostream& os, const TyCtxt& tcx, const MirPlace& place);
void print_operand(std::ostream& os, const TyCtxt& tcx, const MirOperand& op);
void print_span(std::ostream& os, const Span& span);

}  // namespace smir
