#pragma once

#include "mir.hpp"
#include "stable_mir.hpp"
#include "stable_ty.hpp"
#include "types.hpp"

namespace smir {

class Tables;

// One conversion per internal shape. Shapes without a stable counterpart
// are reported through `Tables` and replaced by a placeholder; callers must
// check `Tables::failure_count()` before handing the result out.

stable::Body body_to_stable(Tables& tables, const MirBody& body);
stable::BasicBlock to_stable(Tables& tables, const MirBasicBlockData& block,
                             BasicBlock index);

stable::Statement to_stable(Tables& tables, const MirStatement& stmt);
stable::Rvalue to_stable(Tables& tables, const MirRvalue& rvalue);
stable::Operand to_stable(Tables& tables, const MirOperand& op);
stable::Place to_stable(Tables& tables, const MirPlace& place);
stable::Terminator to_stable(Tables& tables, const MirTerminator& term);

stable::Mutability to_stable(Tables& tables, Mutability mutbl);
stable::BorrowKind to_stable(Tables& tables, const BorrowKind& kind);
stable::MutBorrowKind to_stable(Tables& tables, MutBorrowKind kind);
stable::NullOp to_stable(Tables& tables, const NullOp& op);
stable::CastKind to_stable(Tables& tables, const CastKind& kind);
stable::PointerCoercion to_stable(Tables& tables, const PointerCoercion& c);
stable::Safety to_stable(Tables& tables, Unsafety unsafety);
stable::UnwindAction to_stable(Tables& tables, const UnwindAction& unwind);
stable::AssertMessage to_stable(Tables& tables, const AssertKind& msg);
stable::BinOp to_stable(Tables& tables, BinOp op);
stable::UnOp to_stable(Tables& tables, UnOp op);
stable::GeneratorKind to_stable(Tables& tables, const GeneratorKind& kind);
stable::InlineAsmOperand to_stable(Tables& tables, const InlineAsmOperand& op);

stable::GenericArgs to_stable(Tables& tables, const GenericArgs& args);
stable::PolyFnSig to_stable(Tables& tables, const PolyFnSig& sig);
stable::FnSig to_stable(Tables& tables, const FnSig& sig);
stable::Abi to_stable(Tables& tables, const Abi& abi);
stable::BoundVariableKind to_stable(Tables& tables,
                                    const BoundVariableKind& kind);

// Structural kind of an internal type. Nested types are interned.
stable::TyKind ty_kind_of(Tables& tables, Ty ty);

}  // namespace smir
