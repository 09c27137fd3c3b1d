#include "interner.hpp"

#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

using namespace smir;

class InternerTest : public ::testing::TestWithParam<InternStrategy> {
protected:
    TypeStore store{};

    TypeInterner make() { return TypeInterner{store, GetParam()}; }
};

TEST_P(InternerTest, HandlesAreDenseInFirstSeenOrder) {
    TypeInterner interner = make();
    Ty b = store.bool_();
    Ty i = store.int_(IntTy::I32);

    EXPECT_EQ(interner.intern(b).id, 0u);
    EXPECT_EQ(interner.intern(i).id, 1u);
    EXPECT_EQ(interner.intern(b).id, 0u);
    EXPECT_EQ(interner.size(), 2u);
}

TEST_P(InternerTest, StructurallyEqualCompositesShareHandle) {
    TypeInterner interner = make();
    Ty u8 = store.uint_(UintTy::U8);
    Ty a = store.ref(Region::static_(), u8, Mutability::Not);
    Ty b = store.ref(Region::static_(), u8, Mutability::Not);
    ASSERT_NE(a, b);

    stable::Ty ha = interner.intern(a);
    stable::Ty hb = interner.intern(b);
    EXPECT_EQ(ha, hb);
    // The first representative is kept.
    EXPECT_EQ(interner.resolve(hb), a);
}

TEST_P(InternerTest, DistinctTypesGetDistinctHandles) {
    TypeInterner interner = make();
    Ty u8 = store.uint_(UintTy::U8);
    stable::Ty shared = interner.intern(store.ref(Region::erased(), u8, Mutability::Not));
    stable::Ty unique = interner.intern(store.ref(Region::erased(), u8, Mutability::Mut));
    stable::Ty other_region = interner.intern(store.ref(Region::static_(), u8, Mutability::Not));

    EXPECT_NE(shared, unique);
    EXPECT_NE(shared, other_region);
    EXPECT_NE(unique, other_region);
}

TEST_P(InternerTest, NestedArgumentsCompareStructurally) {
    TypeInterner interner = make();
    DefId vec{.krate = 1, .index = 0};
    Ty u8 = store.uint_(UintTy::U8);
    Ty a = store.adt(vec, {GenericArg::type(store.slice(u8))});
    Ty b = store.adt(vec, {GenericArg::type(store.slice(u8))});
    Ty c = store.adt(vec, {GenericArg::type(store.slice(store.uint_(UintTy::U16)))});

    EXPECT_EQ(interner.intern(a), interner.intern(b));
    EXPECT_NE(interner.intern(a), interner.intern(c));
}

TEST_P(InternerTest, ResolveOfUnknownHandleThrows) {
    TypeInterner interner = make();
    interner.intern(store.bool_());
    EXPECT_THROW(interner.resolve(stable::Ty{5}), std::out_of_range);
}

TEST_P(InternerTest, SizeNeverShrinks) {
    TypeInterner interner = make();
    std::size_t last = 0;
    for (int round = 0; round < 3; round++) {
        interner.intern(store.tuple({store.bool_(), store.char_()}));
        interner.intern(store.never());
        EXPECT_GE(interner.size(), last);
        last = interner.size();
    }
    EXPECT_EQ(interner.size(), 2u);
}

INSTANTIATE_TEST_SUITE_P(Strategies, InternerTest,
                         ::testing::Values(InternStrategy::LinearScan, InternStrategy::HashCons));

TEST(InternerStrategies, AssignIdenticalHandleSequences) {
    TypeStore store{};
    Ty u8 = store.uint_(UintTy::U8);
    Ty usize = store.uint_(UintTy::Usize);
    std::vector<Ty> input = {
        u8,
        store.array(u8, store.scalar(usize, 4)),
        store.array(u8, store.scalar(usize, 8)),
        store.array(u8, store.scalar(usize, 4)),
        store.raw_ptr(u8, Mutability::Mut),
        store.tuple({}),
        store.unit(),
        store.raw_ptr(u8, Mutability::Mut),
    };

    TypeInterner linear{store, InternStrategy::LinearScan};
    TypeInterner hashed{store, InternStrategy::HashCons};
    for (Ty ty : input) EXPECT_EQ(linear.intern(ty), hashed.intern(ty));
    EXPECT_EQ(linear.size(), hashed.size());
    EXPECT_EQ(linear.size(), 5u);
}
