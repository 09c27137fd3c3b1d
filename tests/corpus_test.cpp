#include "convert.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "fixtures.hpp"
#include "identity.hpp"

using namespace smir;
using namespace smir::test;

namespace {

template <typename Alt, typename Stable>
bool is(const Stable& value) {
    return std::holds_alternative<Alt>(value.data);
}

template <typename Alt>
bool is_rigid(const stable::TyKind& kind) {
    return kind.get_if<Alt>() != nullptr;
}

// One input per internal alternative. `failure` is None when the input has a
// stable form, in which case `expect` names the alternative it must map to.
template <typename Internal, typename Stable>
struct Row {
    const char* name = "";
    Internal input{};
    bool (*expect)(const Stable&) = nullptr;
    DiagCode failure = DiagCode::None;
};

using TerminatorRow = Row<MirTerminator, stable::Terminator>;
using RvalueRow = Row<MirRvalue, stable::Rvalue>;
using CastRow = Row<CastKind, stable::CastKind>;

// Number of distinct internal alternatives the rows feed in.
template <typename R>
std::size_t distinct_alternatives(const std::vector<R>& rows) {
    std::set<std::size_t> seen{};
    for (const R& row : rows) seen.insert(row.input.data.index());
    return seen.size();
}

struct TypeRow {
    const char* name = "";
    Ty input = 0;
    bool (*expect)(const stable::TyKind&) = nullptr;
    DiagCode failure = DiagCode::None;
};

}  // namespace

class CorpusTest : public SmirTest {
protected:
    CorpusTest() {
        tls = tcx.add_def(std_crate, DefKind::Static, "thread::CURRENT");
        closure = tcx.add_def(LOCAL_CRATE, DefKind::Closure, "main::{closure#0}");
        generator = tcx.add_def(LOCAL_CRATE, DefKind::Generator, "main::{generator#0}");
        foreign = tcx.add_def(LOCAL_CRATE, DefKind::ForeignTy, "Handle");
        trait = tcx.add_def(std_crate, DefKind::Trait, "fmt::Debug");
        usize_ = tcx.types.uint_(UintTy::Usize);
    }

    MirOperand local(Local l) const { return MirOperand::copy(MirPlace::from_local(l)); }

    // Converts every row and checks either the stable alternative or exactly
    // one new error of the expected code.
    template <typename R, typename Convert>
    void run(const std::vector<R>& rows, Convert convert) {
        for (const R& row : rows) {
            SCOPED_TRACE(row.name);
            std::size_t diags_before = session.diags.size();
            std::size_t nyi_before = session.error_count(DiagCode::NotYetImplemented);
            std::size_t iv_before = session.error_count(DiagCode::InvariantViolated);

            bool matched = convert(row);

            std::size_t nyi = session.error_count(DiagCode::NotYetImplemented) - nyi_before;
            std::size_t iv = session.error_count(DiagCode::InvariantViolated) - iv_before;
            switch (row.failure) {
                case DiagCode::None:
                    EXPECT_EQ(session.diags.size(), diags_before);
                    EXPECT_TRUE(matched);
                    break;
                case DiagCode::NotYetImplemented:
                    EXPECT_EQ(nyi, 1u);
                    EXPECT_EQ(iv, 0u);
                    break;
                case DiagCode::InvariantViolated:
                    EXPECT_EQ(iv, 1u);
                    EXPECT_EQ(nyi, 0u);
                    break;
                case DiagCode::ReadZeroByteVec:
                    ADD_FAILURE() << "not a conversion failure";
                    break;
            }
        }
    }

    Tables tables{session, tcx};
    DefId tls{};
    DefId closure{};
    DefId generator{};
    DefId foreign{};
    DefId trait{};
    Ty usize_ = 0;
};

TEST_F(CorpusTest, EveryTerminatorKind) {
    using S = stable::Terminator;
    MirTerminator::Call call{};
    call.func = MirOperand::constant(TyConst{.ty = tcx.types.fn_def(add_fn, {}), .kind = TyConst::ZeroSized{}});
    call.args = {local(1)};
    call.destination = MirPlace::from_local(0);
    call.target = 1;

    std::vector<TerminatorRow> rows = {
        {"Goto", terminator(MirTerminator::Goto{2}), &is<S::Goto, S>},
        {"SwitchInt", terminator(MirTerminator::SwitchInt{local(1), SwitchTargets::if_(0, 1, 2)}), &is<S::SwitchInt, S>},
        {"UnwindResume", terminator(MirTerminator::UnwindResume{}), &is<S::Resume, S>},
        {"UnwindTerminate", terminator(MirTerminator::UnwindTerminate{}), &is<S::Abort, S>},
        {"Return", terminator(MirTerminator::Return{}), &is<S::Return, S>},
        {"Unreachable", terminator(MirTerminator::Unreachable{}), &is<S::Unreachable, S>},
        {"Drop", terminator(MirTerminator::Drop{.place = MirPlace::from_local(1), .target = 1}), &is<S::Drop, S>},
        {"Call", terminator(std::move(call)), &is<S::Call, S>},
        {"Assert", terminator(MirTerminator::Assert{.cond = local(1), .target = 1}), &is<S::Assert, S>},
        {"Yield", terminator(MirTerminator::Yield{.value = local(1), .resume = 1}), nullptr,
         DiagCode::InvariantViolated},
        {"GeneratorDrop", terminator(MirTerminator::GeneratorDrop{}), nullptr, DiagCode::InvariantViolated},
        {"FalseEdge", terminator(MirTerminator::FalseEdge{1, 2}), nullptr, DiagCode::InvariantViolated},
        {"FalseUnwind", terminator(MirTerminator::FalseUnwind{.real_target = 1}), nullptr,
         DiagCode::InvariantViolated},
        {"InlineAsm", terminator(MirTerminator::InlineAsm{.destination = 1}), &is<S::InlineAsm, S>},
    };
    EXPECT_EQ(distinct_alternatives(rows), std::variant_size_v<decltype(MirTerminator::data)>);

    run(rows, [&](const TerminatorRow& row) {
        S out = to_stable(tables, row.input);
        return row.expect && row.expect(out);
    });
}

TEST_F(CorpusTest, EveryRvalueKind) {
    using S = stable::Rvalue;
    std::vector<RvalueRow> rows = {
        {"Use", MirRvalue{MirRvalue::Use{local(1)}}, &is<S::Use, S>},
        {"Repeat", MirRvalue{MirRvalue::Repeat{local(1), tcx.types.scalar(usize_, 3)}}, &is<S::Repeat, S>},
        {"Ref", MirRvalue{MirRvalue::Ref{Region::erased(), BorrowKind{BorrowKind::Shared{}}, MirPlace::from_local(1)}},
         &is<S::Ref, S>},
        {"ThreadLocalRef", MirRvalue{MirRvalue::ThreadLocalRef{tls}}, &is<S::ThreadLocalRef, S>},
        {"AddressOf", MirRvalue{MirRvalue::AddressOf{Mutability::Mut, MirPlace::from_local(1)}}, &is<S::AddressOf, S>},
        {"Len", MirRvalue{MirRvalue::Len{MirPlace::from_local(2)}}, &is<S::Len, S>},
        {"Cast", MirRvalue{MirRvalue::Cast{CastKind{CastKind::FloatToInt{}}, local(1), i32_}}, &is<S::Cast, S>},
        {"BinaryOp", MirRvalue{MirRvalue::BinaryOp{BinOp::Sub, local(1), local(2)}}, &is<S::BinaryOp, S>},
        {"CheckedBinaryOp", MirRvalue{MirRvalue::CheckedBinaryOp{BinOp::Add, local(1), local(2)}},
         &is<S::CheckedBinaryOp, S>},
        {"NullaryOp", MirRvalue{MirRvalue::NullaryOp{NullOp{NullOp::SizeOf{}}, i32_}}, &is<S::NullaryOp, S>},
        {"UnaryOp", MirRvalue{MirRvalue::UnaryOp{UnOp::Not, local(1)}}, &is<S::UnaryOp, S>},
        {"Discriminant", MirRvalue{MirRvalue::Discriminant{MirPlace::from_local(3)}}, &is<S::Discriminant, S>},
        {"Aggregate", MirRvalue{MirRvalue::Aggregate{.kind = AggregateKind{AggregateKind::Tuple{}}}}, nullptr,
         DiagCode::NotYetImplemented},
        {"ShallowInitBox", MirRvalue{MirRvalue::ShallowInitBox{local(1), i32_}}, nullptr,
         DiagCode::NotYetImplemented},
        {"CopyForDeref", MirRvalue{MirRvalue::CopyForDeref{MirPlace::from_local(1)}}, &is<S::CopyForDeref, S>},
    };
    EXPECT_EQ(distinct_alternatives(rows), std::variant_size_v<decltype(MirRvalue::data)>);

    run(rows, [&](const RvalueRow& row) {
        S out = to_stable(tables, row.input);
        return row.expect && row.expect(out);
    });
}

TEST_F(CorpusTest, EveryCastKind) {
    using S = stable::CastKind;
    std::vector<CastRow> rows = {
        {"PointerExposeAddress", CastKind{CastKind::PointerExposeAddress{}}, &is<S::PointerExposeAddress, S>},
        {"PointerFromExposedAddress", CastKind{CastKind::PointerFromExposedAddress{}},
         &is<S::PointerFromExposedAddress, S>},
        {"Coercion", CastKind{CastKind::Coercion{PointerCoercion{PointerCoercion::Unsize{}}}},
         &is<S::PointerCoercion, S>},
        {"DynStar", CastKind{CastKind::DynStar{}}, &is<S::DynStar, S>},
        {"IntToInt", CastKind{CastKind::IntToInt{}}, &is<S::IntToInt, S>},
        {"FloatToInt", CastKind{CastKind::FloatToInt{}}, &is<S::FloatToInt, S>},
        {"FloatToFloat", CastKind{CastKind::FloatToFloat{}}, &is<S::FloatToFloat, S>},
        {"IntToFloat", CastKind{CastKind::IntToFloat{}}, &is<S::IntToFloat, S>},
        {"PtrToPtr", CastKind{CastKind::PtrToPtr{}}, &is<S::PtrToPtr, S>},
        {"FnPtrToPtr", CastKind{CastKind::FnPtrToPtr{}}, &is<S::FnPtrToPtr, S>},
        {"Transmute", CastKind{CastKind::Transmute{}}, &is<S::Transmute, S>},
    };
    EXPECT_EQ(distinct_alternatives(rows), std::variant_size_v<decltype(CastKind::data)>);

    run(rows, [&](const CastRow& row) {
        S out = to_stable(tables, row.input);
        return row.expect && row.expect(out);
    });
}

TEST_F(CorpusTest, EveryTypeKind) {
    using R = stable::RigidTy;
    PolyFnSig sig{.sig = {.inputs_and_output = {i32_}}};

    std::vector<TypeRow> rows = {
        {"Bool", bool_, &is_rigid<R::Bool>},
        {"Char", tcx.types.char_(), &is_rigid<R::Char>},
        {"Int", tcx.types.int_(IntTy::I8), &is_rigid<R::Int>},
        {"Uint", tcx.types.uint_(UintTy::U128), &is_rigid<R::Uint>},
        {"Float", tcx.types.float_(FloatTy::F32), &is_rigid<R::Float>},
        {"Adt", tcx.types.adt(point, {}), &is_rigid<R::Adt>},
        {"Foreign", tcx.types.foreign(foreign), &is_rigid<R::Foreign>},
        {"Str", tcx.types.str(), &is_rigid<R::Str>},
        {"Array", tcx.types.array(bool_, tcx.types.scalar(usize_, 2)), &is_rigid<R::Array>},
        {"Slice", tcx.types.slice(i32_), &is_rigid<R::Slice>},
        {"RawPtr", tcx.types.raw_ptr(i32_, Mutability::Mut), &is_rigid<R::RawPtr>},
        {"Ref", tcx.types.ref(Region::erased(), i32_, Mutability::Not), &is_rigid<R::Ref>},
        {"FnDef", tcx.types.fn_def(add_fn, {}), &is_rigid<R::FnDef>},
        {"FnPtr", tcx.types.fn_ptr(sig), &is_rigid<R::FnPtr>},
        {"Dynamic", tcx.types.dynamic({trait}, Region::erased()), nullptr, DiagCode::NotYetImplemented},
        {"Closure", tcx.types.closure(closure, {}), &is_rigid<R::Closure>},
        {"Generator", tcx.types.generator(generator, {}, Movability::Movable), &is_rigid<R::Generator>},
        {"GeneratorWitness", tcx.types.generator_witness(generator, {}), nullptr, DiagCode::InvariantViolated},
        {"Never", tcx.types.never(), &is_rigid<R::Never>},
        {"Tuple", tcx.types.tuple({i32_, i32_}), &is_rigid<R::Tuple>},
        {"Alias", tcx.types.alias(AliasKind::Projection, trait, {}), nullptr, DiagCode::NotYetImplemented},
        {"Param", tcx.types.param(0, "T"), nullptr, DiagCode::NotYetImplemented},
        {"Bound", tcx.types.bound(0, 0), nullptr, DiagCode::NotYetImplemented},
        {"Placeholder", tcx.types.placeholder(0, 0), nullptr, DiagCode::InvariantViolated},
        {"Infer", tcx.types.infer(3), nullptr, DiagCode::InvariantViolated},
        {"Error", tcx.types.error(), nullptr, DiagCode::InvariantViolated},
    };
    std::set<std::size_t> seen{};
    for (const TypeRow& row : rows) seen.insert(tcx.types.get(row.input).data.index());
    EXPECT_EQ(seen.size(), std::variant_size_v<decltype(TypeData::data)>);

    run(rows, [&](const TypeRow& row) {
        std::optional<stable::TyKind> out = tables.ty_kind(tables.intern_ty(row.input));
        // A failed query hands out no kind at all.
        EXPECT_EQ(out.has_value(), row.failure == DiagCode::None);
        return out && row.expect && row.expect(*out);
    });
}

TEST_F(CorpusTest, RenamedTerminatorsKeepTheirTargets) {
    stable::Terminator go = to_stable(tables, terminator(MirTerminator::Goto{2}));
    EXPECT_EQ(std::get<stable::Terminator::Goto>(go.data).target, 2u);
    EXPECT_EQ(stable::successors(go), (std::vector<std::size_t>{2}));

    for (auto& term : {terminator(MirTerminator::UnwindResume{}), terminator(MirTerminator::UnwindTerminate{}),
                       terminator(MirTerminator::Unreachable{}), terminator(MirTerminator::Return{})}) {
        EXPECT_TRUE(stable::successors(to_stable(tables, term)).empty());
    }
    EXPECT_FALSE(session.has_errors());
}

TEST_F(CorpusTest, PlaceRvaluesKeepTheirPayloads) {
    stable::Rvalue repeat = to_stable(tables, MirRvalue{MirRvalue::Repeat{local(1), tcx.types.scalar(usize_, 3)}});
    EXPECT_EQ(std::get<stable::Rvalue::Repeat>(repeat.data).count.to_string(), "3_usize");

    stable::Rvalue tls_ref = to_stable(tables, MirRvalue{MirRvalue::ThreadLocalRef{tls}});
    stable::CrateItem item = std::get<stable::Rvalue::ThreadLocalRef>(tls_ref.data).item;
    EXPECT_EQ(item_def_id(tables, item), tls);

    stable::Rvalue len = to_stable(tables, MirRvalue{MirRvalue::Len{MirPlace::from_local(2)}});
    EXPECT_EQ(std::get<stable::Rvalue::Len>(len.data).place.local, 2u);
    stable::Rvalue discr = to_stable(tables, MirRvalue{MirRvalue::Discriminant{MirPlace::from_local(3)}});
    EXPECT_EQ(std::get<stable::Rvalue::Discriminant>(discr.data).place.local, 3u);
    stable::Rvalue copy = to_stable(tables, MirRvalue{MirRvalue::CopyForDeref{MirPlace::from_local(1)}});
    EXPECT_EQ(std::get<stable::Rvalue::CopyForDeref>(copy.data).place.local, 1u);
}

TEST_F(CorpusTest, ClosureGeneratorAndForeignDefinitionsRoundTrip) {
    std::optional<stable::TyKind> c = tables.ty_kind(tables.intern_ty(tcx.types.closure(closure, {})));
    ASSERT_TRUE(c.has_value());
    const auto* closure_ty = c->get_if<stable::RigidTy::Closure>();
    ASSERT_NE(closure_ty, nullptr);
    EXPECT_EQ(tables.def_id(closure_ty->def.def), closure);
    EXPECT_EQ(closure_ty->def, closure_def(tables, closure));

    for (Movability m : {Movability::Static, Movability::Movable}) {
        std::optional<stable::TyKind> g =
            tables.ty_kind(tables.intern_ty(tcx.types.generator(generator, {GenericArg::type(i32_)}, m)));
        ASSERT_TRUE(g.has_value());
        const auto* gen = g->get_if<stable::RigidTy::Generator>();
        ASSERT_NE(gen, nullptr);
        EXPECT_EQ(tables.def_id(gen->def.def), generator);
        EXPECT_EQ(gen->args.args.size(), 1u);
        EXPECT_EQ(gen->movability,
                  m == Movability::Static ? stable::Movability::Static : stable::Movability::Movable);
    }

    std::optional<stable::TyKind> f = tables.ty_kind(tables.intern_ty(tcx.types.foreign(foreign)));
    ASSERT_TRUE(f.has_value());
    const auto* foreign_ty = f->get_if<stable::RigidTy::Foreign>();
    ASSERT_NE(foreign_ty, nullptr);
    EXPECT_EQ(tables.def_id(foreign_ty->def.def), foreign);
    EXPECT_EQ(foreign_ty->def, foreign_def(tables, foreign));
}

TEST_F(CorpusTest, FnPointerAndClosureCoercionShareSafety) {
    PolyFnSig sig{.sig = {.inputs_and_output = {i32_}, .unsafety = Unsafety::Unsafe}};
    std::optional<stable::TyKind> ptr = tables.ty_kind(tables.intern_ty(tcx.types.fn_ptr(sig)));
    ASSERT_TRUE(ptr.has_value());
    stable::Safety from_sig = ptr->get_if<stable::RigidTy::FnPtr>()->sig.value.safety;

    stable::PointerCoercion coercion =
        to_stable(tables, PointerCoercion{PointerCoercion::ClosureFnPointer{Unsafety::Unsafe}});
    stable::Safety from_coercion = std::get<stable::PointerCoercion::ClosureFnPointer>(coercion.data).safety;

    EXPECT_EQ(from_sig, stable::Safety::Unsafe);
    EXPECT_EQ(from_sig, from_coercion);
    EXPECT_EQ(to_stable(tables, Unsafety::Normal), stable::Safety::Normal);
}

TEST_F(CorpusTest, MalformedSwitchTargetsViolateInvariant) {
    stable::Terminator empty = to_stable(tables, terminator(MirTerminator::SwitchInt{local(1), SwitchTargets{}}));
    EXPECT_TRUE(std::holds_alternative<stable::Terminator::Unreachable>(empty.data));
    EXPECT_EQ(session.error_count(DiagCode::InvariantViolated), 1u);
    EXPECT_NE(session.diags.back().message.find("`SwitchInt` with 0 values has 0 targets"), std::string::npos);

    // A value without its own target.
    SwitchTargets short_targets = SwitchTargets::if_(1, 0, 0);
    short_targets.targets.pop_back();
    set_add_block(block({}, terminator(MirTerminator::SwitchInt{local(1), std::move(short_targets)})));
    Tables fresh{session, tcx};
    EXPECT_FALSE(fresh.mir_body(crate_item(fresh, add_fn)).has_value());
    EXPECT_EQ(session.error_count(DiagCode::InvariantViolated), 2u);
    EXPECT_NE(session.diags.back().message.find("1 values has 1 targets"), std::string::npos);
}
