#include "context.hpp"

#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "fixtures.hpp"
#include "identity.hpp"

using namespace smir;
using namespace smir::test;

class QueryTest : public SmirTest {};

TEST_F(QueryTest, LocalAndExternalCrates) {
    run_query_session(session, tcx, [&](Context& cx) {
        stable::Crate local = cx.local_crate();
        EXPECT_EQ(local.id, 0u);
        EXPECT_EQ(local.name, "demo");
        EXPECT_TRUE(local.is_local);

        std::vector<stable::Crate> externals = cx.external_crates();
        ASSERT_EQ(externals.size(), 2u);
        EXPECT_EQ(externals[0].name, "std");
        EXPECT_EQ(externals[0].id, 1u);
        EXPECT_EQ(externals[1].name, "core");
        EXPECT_EQ(externals[1].id, 2u);
        for (const stable::Crate& c : externals) EXPECT_FALSE(c.is_local);
    });
}

TEST_F(QueryTest, FindCrateAgreesWithCrateLists) {
    run_query_session(session, tcx, [&](Context& cx) {
        std::optional<stable::Crate> local = cx.find_crate("demo");
        ASSERT_TRUE(local.has_value());
        EXPECT_EQ(*local, cx.local_crate());

        for (const stable::Crate& c : cx.external_crates()) {
            std::optional<stable::Crate> found = cx.find_crate(c.name);
            ASSERT_TRUE(found.has_value());
            EXPECT_EQ(*found, c);
        }
        EXPECT_FALSE(cx.find_crate("alloc").has_value());
    });
}

TEST_F(QueryTest, FindCratePrefersLocalOverSameNamedExternal) {
    tcx.add_crate("demo");
    run_query_session(session, tcx, [&](Context& cx) {
        std::optional<stable::Crate> found = cx.find_crate("demo");
        ASSERT_TRUE(found.has_value());
        EXPECT_TRUE(found->is_local);
    });
}

TEST_F(QueryTest, LocalItemsAreBodyOwnersInDefinitionOrder) {
    run_query_session(session, tcx, [&](Context& cx) {
        stable::CrateItems items = cx.all_local_items();
        ASSERT_EQ(items.size(), 2u);
        EXPECT_EQ(items[0].def, 0u);
        EXPECT_EQ(items[1].def, 1u);
        // Asking again hands out the same ids.
        EXPECT_EQ(cx.all_local_items(), items);
    });
}

TEST_F(QueryTest, EntryFnIsALocalItem) {
    run_query_session(session, tcx, [&](Context& cx) {
        std::optional<stable::CrateItem> entry = cx.entry_fn();
        ASSERT_TRUE(entry.has_value());
        EXPECT_EQ(*entry, cx.all_local_items()[0]);
    });
}

TEST_F(QueryTest, NoEntryFnInALibrary) {
    TyCtxt lib{"lib"};
    DefId f = lib.add_def(LOCAL_CRATE, DefKind::Fn, "f");
    lib.set_optimized_mir(MirBody{.owner = f});
    run_query_session(session, lib, [&](Context& cx) {
        EXPECT_FALSE(cx.entry_fn().has_value());
        EXPECT_EQ(cx.all_local_items().size(), 1u);
        EXPECT_TRUE(cx.external_crates().empty());
    });
}

TEST_F(QueryTest, BodiesAndLocalTypesThroughTheSurface) {
    run_query_session(session, tcx, [&](Context& cx) {
        std::optional<stable::CrateItem> entry = cx.entry_fn();
        ASSERT_TRUE(entry.has_value());
        std::optional<stable::Body> body = cx.mir_body(*entry);
        ASSERT_TRUE(body.has_value());
        ASSERT_EQ(body->locals.size(), 2u);

        std::optional<stable::TyKind> unit = cx.ty_kind(body->locals[0]);
        ASSERT_TRUE(unit.has_value());
        auto* tuple = unit->get_if<stable::RigidTy::Tuple>();
        ASSERT_NE(tuple, nullptr);
        EXPECT_TRUE(tuple->elems.empty());

        auto& call = std::get<stable::Terminator::Call>(body->blocks[0].terminator.data);
        EXPECT_EQ(call.args.size(), 2u);
        EXPECT_EQ(call.target, std::optional<std::size_t>(1));
        EXPECT_EQ(std::get<stable::Operand::Constant>(call.func.data).text, "const ZeroSized: fn add");
    });
    EXPECT_FALSE(session.has_errors());
}

TEST_F(QueryTest, ItemWithoutBodyReportsFailure) {
    Tables tables{session, tcx};
    EXPECT_FALSE(tables.mir_body(crate_item(tables, extern_decl)).has_value());
    EXPECT_EQ(session.error_count(DiagCode::InvariantViolated), 1u);
    EXPECT_NE(session.diags.back().message.find("`extern_decl` has no optimized MIR"), std::string::npos);
    EXPECT_EQ(tables.failure_count(), 1u);
}

TEST_F(QueryTest, InternalTablesAreReachable) {
    Tables tables{session, tcx};
    stable::Ty handle = tables.intern_ty(i32_);
    tables.with_internal_tables([&](Tables& t) {
        EXPECT_EQ(t.resolve_ty(handle), i32_);
        EXPECT_EQ(t.def_id(crate_item(t, point).def), point);
    });
    EXPECT_EQ(tables.types.size(), 1u);
}

TEST_F(QueryTest, InternStrategyFollowsSessionOptions) {
    session.options.intern_strategy = InternStrategy::LinearScan;
    Tables tables{session, tcx};
    EXPECT_EQ(tables.types.strategy(), InternStrategy::LinearScan);
}

TEST_F(QueryTest, DumpBodyOfEntry) {
    Tables tables{session, tcx};
    std::optional<stable::Body> body = tables.mir_body(crate_item(tables, main_fn));
    ASSERT_TRUE(body.has_value());

    std::ostringstream os;
    stable::dump_body(os, *body);
    EXPECT_EQ(os.str().rfind("let _0: ty#0;\nlet _1: ty#1;\nbb0: {\n", 0), 0u);
    EXPECT_NE(os.str().find("bb1: {\n    return;\n}\n"), std::string::npos);
}
