#include <mirv/Eval/Validator.hh>

#include <gtest/gtest.h>

using namespace mirv;
using namespace mirv::eval;

namespace {
class ValidatorTest : public ::testing::Test {
protected:
    DataLayout dl;
    Memory mem{dl, 0, true};

    auto Check(Pointer p, u64 len, u64 align, Access access) -> EvalResult<ResolvedAccess> {
        return Validator{mem}.check(p, Size::Bytes(len), Align(align), access);
    }

    static auto KindOf(const EvalResult<ResolvedAccess>& r) -> std::optional<ViolationKind> {
        if (r) return std::nullopt;
        return r.error().violation;
    }
};
} // namespace

TEST_F(ValidatorTest, LivenessBeforeBounds) {
    auto id = mem.allocate(Size::Bytes(4), Align(4), AllocKind::Heap).value();
    ASSERT_TRUE(mem.deallocate(id, AllocKind::Heap));
    EXPECT_EQ(KindOf(Check(Pointer::To(id, 100), 4, 4, Access::Read)), ViolationKind::UseAfterFree);
}

TEST_F(ValidatorTest, BoundsBeforeAlignment) {
    auto id = mem.allocate(Size::Bytes(8), Align(8), AllocKind::Heap).value();
    EXPECT_EQ(KindOf(Check(Pointer::To(id, 7), 4, 4, Access::Read)), ViolationKind::OutOfBounds);
}

TEST_F(ValidatorTest, AlignmentBeforeInit) {
    auto id = mem.allocate(Size::Bytes(8), Align(8), AllocKind::Heap).value();
    EXPECT_EQ(KindOf(Check(Pointer::To(id, 2), 4, 4, Access::Read)), ViolationKind::Unaligned);
    EXPECT_EQ(KindOf(Check(Pointer::To(id, 4), 4, 4, Access::Read)), ViolationKind::UninitializedRead);
}

TEST_F(ValidatorTest, AlignmentCheckCanBeDisabled) {
    Memory lax{dl, 0, false};
    auto id = lax.allocate(Size::Bytes(8), Align(8), AllocKind::Heap).value();
    auto r = Validator{lax}.check(Pointer::To(id, 2), Size::Bytes(4), Align(4), Access::Write);
    EXPECT_TRUE(r) << r.error().str();
}

TEST_F(ValidatorTest, RawReadsSkipInitCheck) {
    auto id = mem.allocate(Size::Bytes(8), Align(8), AllocKind::Heap).value();
    auto r = Check(Pointer::To(id), 8, 1, Access::ReadRaw);
    ASSERT_TRUE(r) << r.error().str();
    EXPECT_EQ(r->alloc->id, id);
    EXPECT_EQ(r->offset, 0u);
}

TEST_F(ValidatorTest, ExtraCheckRunsBeforeProvenance) {
    auto id = mem.allocate(Size::Bytes(4), Align(4), AllocKind::Heap).value();
    ASSERT_TRUE(mem.write_bytes(Pointer::To(id), ArrayRef<u8>{1, 2, 3, 4}));

    auto addr = mem.address_of(Pointer::To(id));
    auto r = Validator{mem}.check(
        Pointer::Wild(addr),
        Size::Bytes(4),
        Align(4),
        Access::Read,
        [&](const Allocation& a, u64) -> EvalResult<> {
            return Violation(ViolationKind::InvalidDiscriminant, a.id, 0, "bad");
        }
    );

    EXPECT_EQ(KindOf(r), ViolationKind::InvalidDiscriminant);
}

TEST_F(ValidatorTest, WildPointers) {
    auto id = mem.allocate(Size::Bytes(4), Align(4), AllocKind::Heap).value();
    auto addr = mem.address_of(Pointer::To(id));

    auto r = Check(Pointer::Wild(addr), 4, 4, Access::Write);
    ASSERT_EQ(KindOf(r), ViolationKind::ProvenanceMismatch);
    EXPECT_EQ(r.error().alloc, id);

    r = Check(Pointer::Wild(0), 1, 1, Access::Read);
    ASSERT_EQ(KindOf(r), ViolationKind::OutOfBounds);
    EXPECT_NE(r.error().message.find("null"), std::string::npos);
}

TEST_F(ValidatorTest, ForeignProvenance) {
    auto a = mem.allocate(Size::Bytes(4), Align(4), AllocKind::Heap).value();
    auto b = mem.allocate(Size::Bytes(4), Align(4), AllocKind::Heap).value();
    Pointer p{b, 0, a};
    ASSERT_TRUE(mem.write_bytes(Pointer::To(b), ArrayRef<u8>{1, 2, 3, 4}));
    EXPECT_EQ(KindOf(Check(p, 4, 4, Access::Read)), ViolationKind::ProvenanceMismatch);
}

TEST_F(ValidatorTest, InboundsOnlyChecksRange) {
    auto id = mem.allocate(Size::Bytes(4), Align(4), AllocKind::Heap).value();
    EXPECT_TRUE(Check(Pointer::To(id, 1), 3, 4, Access::Inbounds));
    EXPECT_TRUE(Check(Pointer::To(id, 4), 0, 1, Access::Inbounds));
    EXPECT_EQ(KindOf(Check(Pointer::To(id, 1), 4, 1, Access::Inbounds)), ViolationKind::OutOfBounds);
}

TEST_F(ValidatorTest, HugeLengthIsOutOfBounds) {
    auto id = mem.allocate(Size::Bytes(8), Align(8), AllocKind::Heap).value();
    EXPECT_EQ(KindOf(Check(Pointer::To(id, 4), u64(1) << 60, 1, Access::ReadRaw)), ViolationKind::OutOfBounds);
    EXPECT_EQ(KindOf(Check(Pointer::To(id, 9), 0, 1, Access::Inbounds)), ViolationKind::OutOfBounds);
    EXPECT_TRUE(Check(Pointer::To(id, 8), 0, 1, Access::Inbounds));
}
