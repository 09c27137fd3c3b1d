#pragma once

#include <string>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "mir.hpp"
#include "session.hpp"
#include "tables.hpp"
#include "tcx.hpp"

namespace smir::test {

inline MirStatement assign(MirPlace place, MirRvalue rvalue) {
    return MirStatement{
        .data = MirStatement::Assign{std::move(place), std::move(rvalue)}};
}

inline MirRvalue use(MirOperand op) {
    return MirRvalue{MirRvalue::Use{std::move(op)}};
}

inline MirTerminator terminator(decltype(MirTerminator::data) data) {
    return MirTerminator{.data = std::move(data)};
}

inline MirBasicBlockData block(std::vector<MirStatement> statements,
                               MirTerminator term) {
    return MirBasicBlockData{.statements = std::move(statements),
                             .terminator = std::move(term)};
}

inline MirPlace field(Local local, FieldIdx idx, Ty ty) {
    return MirPlace{.local = local,
                    .projection = {ProjectionElem{ProjectionElem::Field{idx, ty}}}};
}

// A local crate `demo` depending on `std` and `core`:
//
//   fn main() { let _1 = add(1, 2); }
//   fn add(_1: i32, _2: i32) -> i32 { _1 + _2 }
//   fn extern_decl();      // no body
//   struct Point;
class SmirTest : public ::testing::Test {
   protected:
    SmirTest() {
        std_crate = tcx.add_crate("std");
        core_crate = tcx.add_crate("core");
        vec = tcx.add_def(std_crate, DefKind::Struct, "vec::Vec");

        main_fn = tcx.add_def(LOCAL_CRATE, DefKind::Fn, "main");
        add_fn = tcx.add_def(LOCAL_CRATE, DefKind::Fn, "add");
        extern_decl = tcx.add_def(LOCAL_CRATE, DefKind::Fn, "extern_decl");
        point = tcx.add_def(LOCAL_CRATE, DefKind::Struct, "Point");

        i32_ = tcx.types.int_(IntTy::I32);
        bool_ = tcx.types.bool_();

        tcx.set_optimized_mir(add_body());
        tcx.set_optimized_mir(main_body());
        tcx.set_entry_fn(main_fn);
    }

    MirBody main_body() const {
        MirBody body{.owner = main_fn};
        body.local_decls = {{.ty = tcx.types.unit()}, {.ty = i32_}};

        MirTerminator::Call call{};
        call.func = MirOperand::constant(TyConst{
            .ty = tcx.types.fn_def(add_fn, {}), .kind = TyConst::ZeroSized{}});
        call.args = {MirOperand::constant(tcx.types.scalar(i32_, 1)),
                     MirOperand::constant(tcx.types.scalar(i32_, 2))};
        call.destination = MirPlace::from_local(1);
        call.target = 1;
        call.unwind = UnwindAction{UnwindAction::Continue{}};

        body.basic_blocks.push_back(block({}, terminator(std::move(call))));
        body.basic_blocks.push_back(block({}, terminator(MirTerminator::Return{})));
        return body;
    }

    MirBody add_body() const {
        Ty pair = tcx.types.tuple({i32_, bool_});
        MirBody body{.owner = add_fn, .arg_count = 2};
        body.local_decls = {{.ty = i32_}, {.ty = i32_}, {.ty = i32_}, {.ty = pair}};

        MirRvalue::CheckedBinaryOp add{
            .op = BinOp::Add,
            .lhs = MirOperand::copy(MirPlace::from_local(1)),
            .rhs = MirOperand::copy(MirPlace::from_local(2)),
        };
        MirTerminator::Assert check{
            .cond = MirOperand::move(field(3, 1, bool_)),
            .expected = false,
            .msg = AssertKind{AssertKind::Overflow{
                BinOp::Add, MirOperand::copy(MirPlace::from_local(1)),
                MirOperand::copy(MirPlace::from_local(2))}},
            .target = 1,
            .unwind = UnwindAction{UnwindAction::Continue{}},
        };
        body.basic_blocks.push_back(block(
            {assign(MirPlace::from_local(3), MirRvalue{std::move(add)})},
            terminator(std::move(check))));
        body.basic_blocks.push_back(
            block({assign(MirPlace::from_local(RETURN_PLACE),
                          use(MirOperand::move(field(3, 0, i32_))))},
                  terminator(MirTerminator::Return{})));
        return body;
    }

    // Replaces the body of `add` with a single block.
    void set_add_block(MirBasicBlockData data) {
        MirBody body{.owner = add_fn, .arg_count = 2};
        body.local_decls = {{.ty = i32_}, {.ty = i32_}, {.ty = i32_}, {.ty = i32_}};
        body.basic_blocks.push_back(std::move(data));
        tcx.set_optimized_mir(std::move(body));
    }

    Session session{};
    TyCtxt tcx{"demo"};

    CrateNum std_crate = 0;
    CrateNum core_crate = 0;
    DefId vec{};
    DefId main_fn{};
    DefId add_fn{};
    DefId extern_decl{};
    DefId point{};
    Ty i32_ = 0;
    Ty bool_ = 0;
};

}  // namespace smir::test
