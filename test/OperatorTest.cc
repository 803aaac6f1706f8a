#include "Common.hh"

using namespace mirv;
using namespace mirv::eval;

namespace {
class OperatorTest : public mirv::test::EvalTest {
protected:
    /// Compute 'a op b' in a procedure named 'main'.
    auto Binary(BinOp op, Type ty, i64 a, i64 b, Type result = Type()) -> RunResult {
        ProcBuilder p{mod, "main", result ? result : ty};
        p.assign(0, rv::Binary{op, p.int_(ty, a), p.int_(ty, b)});
        p.ret();
        return Run("main");
    }

    /// Compute a checked 'a op b' and return either the result or
    /// the overflow flag.
    auto Checked(BinOp op, Type ty, i64 a, i64 b, bool flag) -> RunResult {
        ProcBuilder p{mod, "main", flag ? mod.I32Ty : ty};
        auto t = p.local(Tuple({ty, mod.BoolTy}), "t");
        p.assign(t, rv::CheckedBinary{op, p.int_(ty, a), p.int_(ty, b)});
        if (flag) p.assign(0, rv::Cast{CastKind::IntToInt, p.copy(PlaceExpr(t).field(1)), mod.I32Ty});
        else p.assign(0, rv::Use{p.copy(PlaceExpr(t).field(0))});
        p.ret();
        return Run("main");
    }

    auto Option(Type t) -> Type {
        VariantDecl variants[]{
            {"None", 0, {}},
            {"Some", 1, mod.allocate_copy(ArrayRef<Type>{t})},
        };
        return EnumType::Create(mod, "Option", variants);
    }
};
} // namespace

TEST_F(OperatorTest, WrappingArithmetic) {
    EXPECT_EQ(Returned(Binary(BinOp::Add, mod.U8Ty, 250, 10)), 4);
}

TEST_F(OperatorTest, SignedRemainder) {
    EXPECT_EQ(Returned(Binary(BinOp::Rem, mod.I32Ty, -7, 3)), -1);
}

TEST_F(OperatorTest, DivisionByZero) {
    auto r = Binary(BinOp::Div, mod.I32Ty, 1, 0);
    ASSERT_TRUE(r.is(ViolationKind::ArithmeticOverflow)) << r.str();
    EXPECT_EQ(r.error->message, "division by zero");
}

TEST_F(OperatorTest, SignedDivisionOverflow) {
    auto r = Binary(BinOp::Div, mod.I32Ty, std::numeric_limits<i32>::min(), -1);
    ASSERT_TRUE(r.is(ViolationKind::ArithmeticOverflow)) << r.str();
    EXPECT_EQ(r.error->message, "division overflow");
}

TEST_F(OperatorTest, Shifts) {
    EXPECT_EQ(Returned(Binary(BinOp::Shl, mod.I32Ty, 1, 3)), 8);
}

TEST_F(OperatorTest, ArithmeticShiftRight) {
    EXPECT_EQ(Returned(Binary(BinOp::Shr, mod.I32Ty, -16, 2)), -4);
}

TEST_F(OperatorTest, ShiftOutOfRange) {
    auto r = Binary(BinOp::Shl, mod.I32Ty, 1, 32);
    ASSERT_TRUE(r.is(ViolationKind::ArithmeticOverflow)) << r.str();
    EXPECT_NE(r.error->message.find("shift by 32"), std::string::npos) << r.str();
}

TEST_F(OperatorTest, SignedComparison) {
    EXPECT_EQ(Returned(Binary(BinOp::Lt, mod.I32Ty, -1, 1, mod.BoolTy)), 1);
}

TEST_F(OperatorTest, UnsignedComparison) {
    EXPECT_EQ(Returned(Binary(BinOp::Lt, mod.U8Ty, 255, 1, mod.BoolTy)), 0);
}

TEST_F(OperatorTest, CheckedAddSetsFlag) {
    EXPECT_EQ(Returned(Checked(BinOp::Add, mod.I8Ty, 127, 1, true)), 1);
}

TEST_F(OperatorTest, CheckedAddWrapsResult) {
    EXPECT_EQ(Returned(Checked(BinOp::Add, mod.I8Ty, 127, 1, false)), -128);
}

TEST_F(OperatorTest, CheckedAddWithoutOverflow) {
    EXPECT_EQ(Returned(Checked(BinOp::Add, mod.I8Ty, 100, 1, true)), 0);
}

TEST_F(OperatorTest, CheckedAddTraps) {
    ctx.opts.overflow = OverflowPolicy::Trap;
    auto r = Checked(BinOp::Add, mod.I8Ty, 127, 1, false);
    ASSERT_TRUE(r.is(ViolationKind::ArithmeticOverflow)) << r.str();
    EXPECT_NE(r.error->message.find("127 + 1"), std::string::npos) << r.str();
}

TEST_F(OperatorTest, CheckedAddSaturates) {
    ctx.opts.overflow = OverflowPolicy::Saturate;
    EXPECT_EQ(Returned(Checked(BinOp::Add, mod.I8Ty, 127, 1, false)), 127);
}

TEST_F(OperatorTest, CheckedSubSaturatesUnsigned) {
    ctx.opts.overflow = OverflowPolicy::Saturate;
    EXPECT_EQ(Returned(Checked(BinOp::Sub, mod.U32Ty, 1, 2, false)), 0);
}

TEST_F(OperatorTest, CheckedAddWrapPolicyClearsFlag) {
    ctx.opts.overflow = OverflowPolicy::Wrap;
    EXPECT_EQ(Returned(Checked(BinOp::Add, mod.I8Ty, 127, 1, true)), 0);
}

TEST_F(OperatorTest, Negation) {
    ProcBuilder b{mod, "main", mod.I32Ty};
    auto x = b.local(mod.I32Ty);
    b.assign(x, rv::Unary{UnOp::Neg, b.int_(mod.I32Ty, 5)});
    b.assign(0, rv::Unary{UnOp::Not, b.copy(x)});
    b.ret();

    // ~(-5) == 4
    EXPECT_EQ(Returned(Run("main")), 4);
}

TEST_F(OperatorTest, NotOnBool) {
    ProcBuilder b{mod, "main", mod.BoolTy};
    b.assign(0, rv::Unary{UnOp::Not, b.bool_(true)});
    b.ret();
    EXPECT_EQ(Returned(Run("main")), 0);
}

TEST_F(OperatorTest, CastToInvalidChar) {
    ProcBuilder b{mod, "main", mod.CharTy};
    b.assign(0, rv::Cast{CastKind::IntToInt, b.int_(mod.U32Ty, 0xD800), mod.CharTy});
    b.ret();

    auto r = Run("main");
    EXPECT_TRUE(r.is(ViolationKind::InvalidChar)) << r.str();
}

TEST_F(OperatorTest, TruncatingCast) {
    ProcBuilder b{mod, "main", mod.I8Ty};
    b.assign(0, rv::Cast{CastKind::IntToInt, b.int_(mod.I32Ty, 0x1FF), mod.I8Ty});
    b.ret();
    EXPECT_EQ(Returned(Run("main")), -1);
}

TEST_F(OperatorTest, TransmuteToInvalidBool) {
    ProcBuilder b{mod, "main", mod.BoolTy};
    b.assign(0, rv::Cast{CastKind::Transmute, b.int_(mod.U8Ty, 3), mod.BoolTy});
    b.ret();

    auto r = Run("main");
    EXPECT_TRUE(r.is(ViolationKind::InvalidBool)) << r.str();
}

TEST_F(OperatorTest, TransmuteSizeMismatch) {
    ProcBuilder b{mod, "main", mod.U32Ty};
    b.assign(0, rv::Cast{CastKind::Transmute, b.int_(mod.U8Ty, 3), mod.U32Ty});
    b.ret();
    EXPECT_EQ(Run("main").kind, RunResult::Kind::InternalError);
}

TEST_F(OperatorTest, NicheDecoding) {
    auto opt = Option(mod.BoolTy);
    auto Discriminant = [&](StringRef name, i64 byte) {
        ProcBuilder b{mod, name, mod.I64Ty};
        auto o = b.local(opt, "o");
        b.assign(o, rv::Cast{CastKind::Transmute, b.int_(mod.U8Ty, byte), opt});
        b.assign(0, rv::Discriminant{o});
        b.ret();
        return Run(name);
    };

    EXPECT_EQ(Returned(Discriminant("none", 2)), 0);
    EXPECT_EQ(Returned(Discriminant("some", 1)), 1);

    auto r = Discriminant("invalid", 3);
    EXPECT_TRUE(r.is(ViolationKind::InvalidDiscriminant)) << r.str();
}

TEST_F(OperatorTest, InvalidTagInLocal) {
    auto opt = Option(mod.BoolTy);
    ProcBuilder b{mod, "main", mod.I32Ty};
    auto o = b.local(opt, "o");
    auto moved = b.local(opt, "moved");
    b.assign(o, rv::Cast{CastKind::Transmute, b.int_(mod.U8Ty, 3), opt});
    b.assign(moved, rv::Use{b.move(o)});
    b.assign(0, rv::Use{b.int_(mod.I32Ty, 0)});
    b.ret();

    auto r = Run("main");
    ASSERT_TRUE(r.is(ViolationKind::InvalidDiscriminant)) << r.str();
    ASSERT_FALSE(r.trace.empty());
    EXPECT_EQ(r.trace.front().stmt, 0u);
}

TEST_F(OperatorTest, OptionalSliceReferenceNone) {
    auto opt = Option(PtrType::Get(mod, SliceType::Get(mod, mod.U8Ty), PtrKind::Ref, false));
    ProcBuilder b{mod, "main", mod.I64Ty};
    auto o = b.local(opt, "o");
    auto moved = b.local(opt, "moved");
    b.assign(o, rv::Aggregate{AggregateKind::Enum, opt, 0, {}});
    b.assign(moved, rv::Use{b.move(o)});
    b.assign(0, rv::Discriminant{moved});
    b.ret();
    EXPECT_EQ(Returned(Run("main")), 0);
}

TEST_F(OperatorTest, OptionalSliceReferenceSome) {
    auto slice_ref = PtrType::Get(mod, SliceType::Get(mod, mod.U8Ty), PtrKind::Ref, false);
    auto opt = Option(slice_ref);
    ProcBuilder b{mod, "main", mod.UsizeTy};
    auto o = b.local(opt, "o");
    auto moved = b.local(opt, "moved");
    b.assign(o, rv::Aggregate{AggregateKind::Enum, opt, 1, {b.bytes("abc")}});
    b.assign(moved, rv::Use{b.move(o)});
    b.assign(0, rv::Len{PlaceExpr(moved).project(Projection::Downcast(1)).field(0).deref()});
    b.ret();
    EXPECT_EQ(Returned(Run("main")), 3);
}

TEST_F(OperatorTest, EnumAggregates) {
    auto opt = Option(mod.I32Ty);
    ProcBuilder b{mod, "main", mod.I32Ty};
    auto o = b.local(opt, "o");
    b.assign(o, rv::Aggregate{AggregateKind::Enum, opt, 1, {b.int_(mod.I32Ty, 17)}});
    b.assign(0, rv::Use{b.copy(PlaceExpr(o).project(Projection::Downcast(1)).field(0))});
    b.ret();
    EXPECT_EQ(Returned(Run("main")), 17);
}

TEST_F(OperatorTest, SetDiscriminant) {
    auto opt = Option(mod.I32Ty);
    ProcBuilder b{mod, "main", mod.I64Ty};
    auto o = b.local(opt, "o");
    b.set_discriminant(o, 0);
    b.assign(0, rv::Discriminant{o});
    b.ret();
    EXPECT_EQ(Returned(Run("main")), 0);
}

TEST_F(OperatorTest, UninitialisedTag) {
    auto opt = Option(mod.I32Ty);
    ProcBuilder b{mod, "main", mod.I64Ty};
    auto o = b.local(opt, "o");
    b.assign(0, rv::Discriminant{o});
    b.ret();

    auto r = Run("main");
    EXPECT_TRUE(r.is(ViolationKind::UninitializedRead)) << r.str();
}

TEST_F(OperatorTest, PointerOffset) {
    auto arr = ArrayType::Get(mod, mod.I32Ty, 3);
    ProcBuilder b{mod, "main", mod.I32Ty};
    auto a = b.local(arr, "a");
    auto p = b.local(Ptr(mod.I32Ty), "p");
    b.assign(a, rv::Aggregate{AggregateKind::Array, arr, 0, {
        b.int_(mod.I32Ty, 1),
        b.int_(mod.I32Ty, 2),
        b.int_(mod.I32Ty, 3),
    }});
    b.assign(p, rv::AddressOf{PlaceExpr(a).project(Projection::ConstantIndex(0)), true});
    b.assign(p, rv::Binary{BinOp::Offset, b.copy(p), b.int_(mod.UsizeTy, 2)});
    b.assign(0, rv::Use{b.copy(PlaceExpr(p).deref())});
    b.ret();
    EXPECT_EQ(Returned(Run("main")), 3);
}

TEST_F(OperatorTest, OffsetPastTheEnd) {
    auto arr = ArrayType::Get(mod, mod.I32Ty, 3);
    ProcBuilder b{mod, "main", mod.I32Ty};
    auto a = b.local(arr, "a");
    auto p = b.local(Ptr(mod.I32Ty), "p");
    b.assign(a, rv::Repeat{b.int_(mod.I32Ty, 0), arr});
    b.assign(p, rv::AddressOf{PlaceExpr(a).project(Projection::ConstantIndex(0)), true});
    b.assign(p, rv::Binary{BinOp::Offset, b.copy(p), b.int_(mod.UsizeTy, 3)});
    b.assign(0, rv::Use{b.copy(PlaceExpr(p).deref())});
    b.ret();

    auto r = Run("main");
    EXPECT_TRUE(r.is(ViolationKind::OutOfBounds)) << r.str();
}

TEST_F(OperatorTest, OffsetOverflow) {
    ProcBuilder b{mod, "main", mod.I32Ty};
    auto x = b.local(mod.I32Ty, "x");
    auto p = b.local(Ptr(mod.I32Ty), "p");
    b.assign(x, rv::Use{b.int_(mod.I32Ty, 1)});
    b.assign(p, rv::AddressOf{x, true});
    b.assign(p, rv::Binary{BinOp::Offset, b.copy(p), b.int_(mod.IsizeTy, std::numeric_limits<i64>::max() / 2)});
    b.assign(0, rv::Use{b.copy(PlaceExpr(p).deref())});
    b.ret();

    auto r = Run("main");
    EXPECT_TRUE(r.is(ViolationKind::ArithmeticOverflow)) << r.str();
}

TEST_F(OperatorTest, IntegerToPointerHasNoProvenance) {
    ProcBuilder b{mod, "main", mod.I32Ty};
    auto x = b.local(mod.I32Ty, "x");
    auto p = b.local(Ptr(mod.I32Ty), "p");
    auto addr = b.local(mod.UsizeTy, "addr");
    b.assign(x, rv::Use{b.int_(mod.I32Ty, 1)});
    b.assign(p, rv::AddressOf{x, true});
    b.assign(addr, rv::Cast{CastKind::PtrToInt, b.copy(p), mod.UsizeTy});
    b.assign(p, rv::Cast{CastKind::IntToPtr, b.copy(addr), Ptr(mod.I32Ty)});
    b.assign(0, rv::Use{b.copy(PlaceExpr(p).deref())});
    b.ret();

    auto r = Run("main");
    EXPECT_TRUE(r.is(ViolationKind::ProvenanceMismatch)) << r.str();
}

TEST_F(OperatorTest, PointerComparison) {
    ProcBuilder b{mod, "main", mod.BoolTy};
    auto x = b.local(mod.I32Ty, "x");
    auto y = b.local(mod.I32Ty, "y");
    auto p = b.local(Ptr(mod.I32Ty), "p");
    auto q = b.local(Ptr(mod.I32Ty), "q");
    b.assign(x, rv::Use{b.int_(mod.I32Ty, 1)});
    b.assign(y, rv::Use{b.int_(mod.I32Ty, 1)});
    b.assign(p, rv::AddressOf{x, true});
    b.assign(q, rv::AddressOf{y, true});
    b.assign(0, rv::Binary{BinOp::Eq, b.copy(p), b.copy(q)});
    b.ret();
    EXPECT_EQ(Returned(Run("main")), 0);
}

TEST_F(OperatorTest, ArrayLength) {
    auto arr = ArrayType::Get(mod, mod.U8Ty, 12);
    ProcBuilder b{mod, "main", mod.UsizeTy};
    auto a = b.local(arr, "a");
    b.assign(a, rv::Repeat{b.int_(mod.U8Ty, 0), arr});
    b.assign(0, rv::Len{a});
    b.ret();
    EXPECT_EQ(Returned(Run("main")), 12);
}
