#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <llvm/ADT/APInt.h>

#include "stable_ty.hpp"

namespace smir::stable {

struct Place {
    std::size_t local = 0;
    // Debug rendering of the projection chain, e.g. `[Deref, Field(0, u8)]`.
    std::string projection{};
};

struct Operand {
    struct Copy {
        Place place{};
    };
    struct Move {
        Place place{};
    };
    struct Constant {
        std::string text{};
    };

    std::variant<Copy, Move, Constant> data{};
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

enum class MutBorrowKind : std::uint8_t {
    Default,
    TwoPhaseBorrow,
    ClosureCapture
};

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
        Safety safety{};
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
    struct PointerCoercion {
        stable::PointerCoercion coercion{};
    };
    struct DynStar {};
    struct IntToInt {};
    struct FloatToInt {};
    struct FloatToFloat {};
    struct IntToFloat {};
    struct PtrToPtr {};
    struct FnPtrToPtr {};
    struct Transmute {};

    std::variant<PointerExposeAddress, PointerFromExposedAddress,
                 PointerCoercion, DynStar, IntToInt, FloatToInt, FloatToFloat,
                 IntToFloat, PtrToPtr, FnPtrToPtr, Transmute>
        data{};
};

struct NullOp {
    struct SizeOf {};
    struct AlignOf {};
    struct OffsetOf {
        std::vector<std::size_t> fields{};
    };

    std::variant<SizeOf, AlignOf, OffsetOf> data{};
};

struct Rvalue {
    struct Use {
        Operand op{};
    };
    struct Repeat {
        Operand op{};
        Opaque count{};
    };
    struct Ref {
        Opaque region{};
        BorrowKind kind{};
        Place place{};
    };
    struct ThreadLocalRef {
        CrateItem item{};
    };
    struct AddressOf {
        Mutability mutbl{};
        Place place{};
    };
    struct Len {
        Place place{};
    };
    struct Cast {
        CastKind kind{};
        Operand op{};
        Ty ty{};
    };
    struct BinaryOp {
        stable::BinOp op{};
        Operand lhs{};
        Operand rhs{};
    };
    struct CheckedBinaryOp {
        stable::BinOp op{};
        Operand lhs{};
        Operand rhs{};
    };
    struct NullaryOp {
        NullOp op{};
        Ty ty{};
    };
    struct UnaryOp {
        UnOp op{};
        Operand operand{};
    };
    struct Discriminant {
        Place place{};
    };
    struct CopyForDeref {
        Place place{};
    };

    std::variant<Use, Repeat, Ref, ThreadLocalRef, AddressOf, Len, Cast,
                 BinaryOp, CheckedBinaryOp, NullaryOp, UnaryOp, Discriminant,
                 CopyForDeref>
        data{};
};

struct Statement {
    struct Assign {
        Place place{};
        Rvalue rvalue{};
    };
    struct Nop {};

    std::variant<Assign, Nop> data{Nop{}};
};

struct UnwindAction {
    struct Continue {};
    struct Unreachable {};
    struct Terminate {};
    struct Cleanup {
        std::size_t block = 0;
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

struct AssertMessage {
    struct BoundsCheck {
        Operand len{};
        Operand index{};
    };
    struct Overflow {
        stable::BinOp op{};
        Operand lhs{};
        Operand rhs{};
    };
    struct OverflowNeg {
        Operand op{};
    };
    struct DivisionByZero {
        Operand op{};
    };
    struct RemainderByZero {
        Operand op{};
    };
    struct ResumedAfterReturn {
        GeneratorKind kind{};
    };
    struct ResumedAfterPanic {
        GeneratorKind kind{};
    };
    struct MisalignedPointerDereference {
        Operand required{};
        Operand found{};
    };

    std::variant<BoundsCheck, Overflow, OverflowNeg, DivisionByZero,
                 RemainderByZero, ResumedAfterReturn, ResumedAfterPanic,
                 MisalignedPointerDereference>
        data{};
};

struct SwitchTarget {
    llvm::APInt value{128, 0};
    std::size_t target = 0;
};

struct InlineAsmOperand {
    std::optional<Operand> in_value{};
    std::optional<Place> out_place{};
    // Debug rendering of the whole operand, kept until its shape stabilizes.
    std::string raw_rpr{};
};

struct Terminator {
    struct Goto {
        std::size_t target = 0;
    };
    struct SwitchInt {
        Operand discr{};
        std::vector<SwitchTarget> targets{};
        std::size_t otherwise = 0;
    };
    struct Resume {};
    struct Abort {};
    struct Return {};
    struct Unreachable {};
    struct Drop {
        Place place{};
        std::size_t target = 0;
        UnwindAction unwind{};
    };
    struct Call {
        Operand func{};
        std::vector<Operand> args{};
        Place destination{};
        std::optional<std::size_t> target{};
        UnwindAction unwind{};
    };
    struct Assert {
        Operand cond{};
        bool expected = true;
        AssertMessage msg{};
        std::size_t target = 0;
        UnwindAction unwind{};
    };
    struct InlineAsm {
        std::string template_{};
        std::vector<InlineAsmOperand> operands{};
        std::string options{};
        std::string line_spans{};
        std::optional<std::size_t> destination{};
        UnwindAction unwind{};
    };

    std::variant<Goto, SwitchInt, Resume, Abort, Return, Unreachable, Drop,
                 Call, Assert, InlineAsm>
        data{Unreachable{}};
};

// Every block a terminator may transfer control to, cleanup blocks included.
std::vector<std::size_t> successors(const Terminator& term);

struct BasicBlock {
    std::vector<Statement> statements{};
    Terminator terminator{};
};

struct Body {
    std::vector<BasicBlock> blocks{};
    std::vector<Ty> locals{};
};

const char* bin_op_name(BinOp op);
const char* un_op_name(UnOp op);

void dump_body(std::ostream& os, const Body& body);

}  // namespace smir::stable
