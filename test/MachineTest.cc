#include "Common.hh"

using namespace mirv;
using namespace mirv::eval;
using MachineTest = mirv::test::EvalTest;

TEST_F(MachineTest, OnePlusOne) {
    ProcBuilder b{mod, "main", mod.I32Ty};
    b.assign(0, rv::Binary{BinOp::Add, b.int_(mod.I32Ty, 1), b.int_(mod.I32Ty, 1)});
    b.ret();

    auto r = Run("main");
    EXPECT_EQ(Returned(r), 2);
    EXPECT_EQ(r.steps, 2u);
    EXPECT_TRUE(r.trace.empty());
}

TEST_F(MachineTest, Arguments) {
    ProcBuilder b{mod, "sub", mod.I32Ty, {mod.I32Ty, mod.I32Ty}};
    b.assign(0, rv::Binary{BinOp::Sub, b.copy(b.arg(0)), b.copy(b.arg(1))});
    b.ret();

    Value args[]{Value::Int(mod.I32Ty, APInt(32, 50)), Value::Int(mod.I32Ty, APInt(32, 8))};
    EXPECT_EQ(Returned(Run("sub", args)), 42);
}

TEST_F(MachineTest, WrongNumberOfArguments) {
    ProcBuilder b{mod, "f", mod.I32Ty, {mod.I32Ty}};
    b.assign(0, rv::Use{b.copy(b.arg(0))});
    b.ret();

    auto r = Run("f");
    EXPECT_EQ(r.kind, RunResult::Kind::InternalError);
    EXPECT_EQ(r.steps, 0u);
}

TEST_F(MachineTest, UnknownEntry) {
    auto r = Run("main");
    EXPECT_EQ(r.kind, RunResult::Kind::InternalError);
    EXPECT_NE(r.error->message.find("main"), std::string::npos);
}

TEST_F(MachineTest, MalformedIRIsRejected) {
    ProcBuilder b{mod, "main", mod.UnitTy};
    b.goto_(7);

    auto r = Run("main");
    EXPECT_EQ(r.kind, RunResult::Kind::InternalError);
    EXPECT_NE(r.error->message.find("bb7"), std::string::npos) << r.str();
    EXPECT_EQ(r.steps, 0u);
}

TEST_F(MachineTest, SwitchTakesOtherwise) {
    ProcBuilder b{mod, "main", mod.I32Ty};
    auto x = b.local(mod.I32Ty, "x");
    auto one = b.block();
    auto two = b.block();
    auto other = b.block();

    b.assign(x, rv::Use{b.int_(mod.I32Ty, 5)});
    b.switch_int(b.copy(x), {{0, one}, {1, two}}, other);

    b.set_insert_point(one);
    b.assign(0, rv::Use{b.int_(mod.I32Ty, 10)});
    b.ret();

    b.set_insert_point(two);
    b.assign(0, rv::Use{b.int_(mod.I32Ty, 20)});
    b.ret();

    b.set_insert_point(other);
    b.assign(0, rv::Use{b.int_(mod.I32Ty, 30)});
    b.ret();

    EXPECT_EQ(Returned(Run("main")), 30);
}

TEST_F(MachineTest, SwitchOnNegativeValue) {
    ProcBuilder b{mod, "main", mod.I32Ty};
    auto x = b.local(mod.I8Ty, "x");
    auto hit = b.block();
    auto miss = b.block();

    b.assign(x, rv::Use{b.int_(mod.I8Ty, -1)});
    b.switch_int(b.copy(x), {{0xFF, hit}}, miss);

    b.set_insert_point(hit);
    b.assign(0, rv::Use{b.int_(mod.I32Ty, 1)});
    b.ret();

    b.set_insert_point(miss);
    b.assign(0, rv::Use{b.int_(mod.I32Ty, 0)});
    b.ret();

    EXPECT_EQ(Returned(Run("main")), 1);
}

TEST_F(MachineTest, StepBudget) {
    ctx.opts.eval_steps = 10;
    ProcBuilder b{mod, "main", mod.UnitTy};
    b.goto_(0);

    auto r = Run("main");
    ASSERT_EQ(r.kind, RunResult::Kind::ResourceExhausted) << r.str();
    EXPECT_EQ(r.error->resource, ResourceKind::StepBudget);
    EXPECT_EQ(r.steps, 10u);
    ASSERT_EQ(r.trace.size(), 1u);
    EXPECT_EQ(r.trace.front().proc, "main");
}

TEST_F(MachineTest, ReachingTheBudgetOnTheLastStepIsFine) {
    ctx.opts.eval_steps = 2;
    ProcBuilder b{mod, "main", mod.I32Ty};
    b.assign(0, rv::Use{b.int_(mod.I32Ty, 3)});
    b.ret();
    EXPECT_EQ(Returned(Run("main")), 3);
}

TEST_F(MachineTest, UseAfterFreeNamesAllocation) {
    auto box = Ptr(mod.I32Ty, PtrKind::Box);
    ProcBuilder b{mod, "main", mod.I32Ty};
    auto p = b.local(box, "p");
    auto unit = b.local(mod.UnitTy);
    auto after = b.block();

    b.assign(p, rv::Box{mod.I32Ty});
    b.assign(PlaceExpr(p).deref(), rv::Use{b.int_(mod.I32Ty, 5)});
    b.call(
        b.proc_ref("dealloc"),
        {b.copy(p), b.int_(mod.UsizeTy, 4), b.int_(mod.UsizeTy, 4)},
        unit,
        after
    );

    b.set_insert_point(after);
    b.assign(0, rv::Use{b.copy(PlaceExpr(p).deref())});
    b.ret();

    auto r = Run("main");
    ASSERT_TRUE(r.is(ViolationKind::UseAfterFree)) << r.str();
    EXPECT_EQ(r.error->alloc, 1u);
    EXPECT_NE(r.str().find("alloc1"), std::string::npos) << r.str();
    ASSERT_FALSE(r.trace.empty());
    EXPECT_EQ(r.trace.front().block, after);
}

TEST_F(MachineTest, ReadingUninitialisedLocal) {
    ProcBuilder b{mod, "main", mod.I32Ty};
    auto x = b.local(mod.I32Ty, "x");
    b.assign(0, rv::Use{b.copy(x)});
    b.ret();

    auto r = Run("main");
    EXPECT_TRUE(r.is(ViolationKind::UninitializedRead)) << r.str();
}

TEST_F(MachineTest, LocalAfterStorageDead) {
    ProcBuilder b{mod, "main", mod.I32Ty};
    auto x = b.local(mod.I32Ty, "x");
    b.assign(x, rv::Use{b.int_(mod.I32Ty, 1)});
    b.storage_dead(x);
    b.assign(0, rv::Use{b.copy(x)});
    b.ret();

    auto r = Run("main");
    EXPECT_TRUE(r.is(ViolationKind::UseAfterFree)) << r.str();
}

TEST_F(MachineTest, StorageLiveRevivesLocal) {
    ProcBuilder b{mod, "main", mod.I32Ty};
    auto x = b.local(mod.I32Ty, "x");
    b.storage_dead(x);
    b.storage_live(x);
    b.assign(x, rv::Use{b.int_(mod.I32Ty, 9)});
    b.assign(0, rv::Use{b.copy(x)});
    b.ret();
    EXPECT_EQ(Returned(Run("main")), 9);
}

TEST_F(MachineTest, ReachedUnreachable) {
    ProcBuilder b{mod, "main", mod.UnitTy};
    b.unreachable();

    auto r = Run("main");
    EXPECT_TRUE(r.is(ViolationKind::ReachedUnreachable)) << r.str();
    EXPECT_EQ(r.steps, 1u);
}

TEST_F(MachineTest, Calls) {
    {
        ProcBuilder b{mod, "double", mod.I32Ty, {mod.I32Ty}};
        b.assign(0, rv::Binary{BinOp::Mul, b.copy(b.arg(0)), b.int_(mod.I32Ty, 2)});
        b.ret();
    }

    ProcBuilder b{mod, "main", mod.I32Ty};
    auto done = b.block();
    b.call(b.proc_ref("double"), {b.int_(mod.I32Ty, 21)}, 0, done);
    b.set_insert_point(done);
    b.ret();

    auto r = Run("main");
    EXPECT_EQ(Returned(r), 42);
    EXPECT_EQ(r.steps, 4u);
}

TEST_F(MachineTest, Recursion) {
    ProcBuilder b{mod, "fact", mod.U64Ty, {mod.U64Ty}};
    auto cond = b.local(mod.BoolTy);
    auto pred = b.local(mod.U64Ty);
    auto rec = b.local(mod.U64Ty);
    auto base = b.block();
    auto step = b.block();
    auto join = b.block();

    b.assign(cond, rv::Binary{BinOp::Eq, b.copy(b.arg(0)), b.int_(mod.U64Ty, 0)});
    b.switch_int(b.copy(cond), {{0, step}}, base);

    b.set_insert_point(base);
    b.assign(0, rv::Use{b.int_(mod.U64Ty, 1)});
    b.ret();

    b.set_insert_point(step);
    b.assign(pred, rv::Binary{BinOp::Sub, b.copy(b.arg(0)), b.int_(mod.U64Ty, 1)});
    b.call(b.proc_ref("fact"), {b.copy(pred)}, rec, join);

    b.set_insert_point(join);
    b.assign(0, rv::Binary{BinOp::Mul, b.copy(b.arg(0)), b.copy(rec)});
    b.ret();

    Value args[]{Value::Int(mod.U64Ty, APInt(64, 10))};
    EXPECT_EQ(Returned(Run("fact", args)), 3'628'800);
}

TEST_F(MachineTest, StackLimit) {
    ctx.opts.stack_limit = 16;
    ProcBuilder b{mod, "forever", mod.UnitTy};
    auto done = b.block();
    b.call(b.proc_ref("forever"), {}, 0, done);
    b.set_insert_point(done);
    b.ret();

    auto r = Run("forever");
    ASSERT_EQ(r.kind, RunResult::Kind::ResourceExhausted) << r.str();
    EXPECT_EQ(r.error->resource, ResourceKind::StackDepth);
    EXPECT_EQ(r.error->limit, 16u);
    EXPECT_EQ(r.trace.size(), 16u);
}

TEST_F(MachineTest, DanglingReferenceToCalleeLocal) {
    auto ref = Ptr(mod.I32Ty, PtrKind::Ref);
    {
        ProcBuilder b{mod, "escape", ref};
        auto x = b.local(mod.I32Ty, "x");
        b.assign(x, rv::Use{b.int_(mod.I32Ty, 7)});
        b.assign(0, rv::Ref{x});
        b.ret();
    }

    ProcBuilder b{mod, "main", mod.I32Ty};
    auto p = b.local(ref, "p");
    auto done = b.block();
    b.call(b.proc_ref("escape"), {}, p, done);
    b.set_insert_point(done);
    b.assign(0, rv::Use{b.copy(PlaceExpr(p).deref())});
    b.ret();

    auto r = Run("main");
    ASSERT_TRUE(r.is(ViolationKind::UseAfterFree)) << r.str();
    EXPECT_EQ(r.error->alloc, 1u);
}

TEST_F(MachineTest, FunctionPointers) {
    {
        ProcBuilder b{mod, "inc", mod.I32Ty, {mod.I32Ty}};
        b.assign(0, rv::Binary{BinOp::Add, b.copy(b.arg(0)), b.int_(mod.I32Ty, 1)});
        b.ret();
    }

    ProcBuilder b{mod, "main", mod.I32Ty};
    auto f = b.local(FnPtrType::Get(mod, mod.I32Ty, {mod.I32Ty}), "f");
    auto done = b.block();
    b.assign(f, rv::Use{b.proc_ref("inc")});
    b.call(b.copy(f), {b.int_(mod.I32Ty, 41)}, 0, done);
    b.set_insert_point(done);
    b.ret();

    EXPECT_EQ(Returned(Run("main")), 42);
}

TEST_F(MachineTest, CallingADataPointer) {
    auto fn = FnPtrType::Get(mod, mod.UnitTy, {});
    ProcBuilder b{mod, "main", mod.UnitTy};
    auto x = b.local(mod.I32Ty, "x");
    auto p = b.local(Ptr(mod.I32Ty), "p");
    auto f = b.local(fn, "f");
    auto done = b.block();
    b.assign(x, rv::Use{b.int_(mod.I32Ty, 0)});
    b.assign(p, rv::AddressOf{x, true});
    b.assign(f, rv::Cast{CastKind::Transmute, b.copy(p), fn});
    b.call(b.copy(f), {}, 0, done);
    b.set_insert_point(done);
    b.ret();

    auto r = Run("main");
    EXPECT_TRUE(r.is(ViolationKind::InvalidFunctionPointer)) << r.str();
}

TEST_F(MachineTest, Statics) {
    auto& s = mod.create_static("ANSWER", mod.I32Ty);
    s.init = Constant{mod.I32Ty, APInt(32, 42)};

    ProcBuilder b{mod, "main", mod.I32Ty};
    auto p = b.local(Ptr(mod.I32Ty, PtrKind::Ref), "p");
    b.assign(p, rv::Use{b.static_ref("ANSWER", Ptr(mod.I32Ty, PtrKind::Ref))});
    b.assign(0, rv::Use{b.copy(PlaceExpr(p).deref())});
    b.ret();

    EXPECT_EQ(Returned(Run("main")), 42);
}

TEST_F(MachineTest, ImmutableStaticsAreReadOnly) {
    auto& s = mod.create_static("ANSWER", mod.I32Ty);
    s.init = Constant{mod.I32Ty, APInt(32, 42)};

    ProcBuilder b{mod, "main", mod.UnitTy};
    auto p = b.local(Ptr(mod.I32Ty), "p");
    b.assign(p, rv::Use{b.static_ref("ANSWER", Ptr(mod.I32Ty))});
    b.assign(PlaceExpr(p).deref(), rv::Use{b.int_(mod.I32Ty, 1)});
    b.ret();

    auto r = Run("main");
    EXPECT_TRUE(r.is(ViolationKind::WriteToReadOnly)) << r.str();
}

TEST_F(MachineTest, StaticsComputedAtRuntime) {
    {
        ProcBuilder b{mod, "init_base", mod.I32Ty};
        b.assign(0, rv::Binary{BinOp::Mul, b.int_(mod.I32Ty, 6), b.int_(mod.I32Ty, 7)});
        b.ret();
    }

    // Initialisers run in declaration order, so this one sees 'BASE'.
    {
        ProcBuilder b{mod, "init_next", mod.I32Ty};
        auto p = b.local(Ptr(mod.I32Ty, PtrKind::Ref));
        b.assign(p, rv::Use{b.static_ref("BASE", Ptr(mod.I32Ty, PtrKind::Ref))});
        b.assign(0, rv::Binary{BinOp::Add, b.copy(PlaceExpr(p).deref()), b.int_(mod.I32Ty, 1)});
        b.ret();
    }

    mod.create_static("BASE", mod.I32Ty).init_proc = "init_base";
    mod.create_static("NEXT", mod.I32Ty).init_proc = "init_next";

    ProcBuilder b{mod, "main", mod.I32Ty};
    auto p = b.local(Ptr(mod.I32Ty, PtrKind::Ref));
    b.assign(p, rv::Use{b.static_ref("NEXT", Ptr(mod.I32Ty, PtrKind::Ref))});
    b.assign(0, rv::Use{b.copy(PlaceExpr(p).deref())});
    b.ret();

    EXPECT_EQ(Returned(Run("main")), 43);
}

TEST_F(MachineTest, StructFields) {
    FieldDecl fields[]{{"x", mod.I32Ty}, {"y", mod.I32Ty}};
    auto point = StructType::Create(mod, "Point", fields);

    ProcBuilder b{mod, "main", mod.I32Ty};
    auto p = b.local(point, "p");
    b.assign(p, rv::Aggregate{AggregateKind::Struct, point, 0, {b.int_(mod.I32Ty, 3), b.int_(mod.I32Ty, 4)}});
    b.assign(PlaceExpr(p).field(1), rv::Use{b.int_(mod.I32Ty, 10)});
    b.assign(0, rv::Binary{BinOp::Add, b.copy(PlaceExpr(p).field(0)), b.copy(PlaceExpr(p).field(1))});
    b.ret();

    EXPECT_EQ(Returned(Run("main")), 13);
}

TEST_F(MachineTest, IndexOutOfBounds) {
    auto arr = ArrayType::Get(mod, mod.I32Ty, 3);
    ProcBuilder b{mod, "main", mod.I32Ty};
    auto a = b.local(arr, "a");
    auto i = b.local(mod.UsizeTy, "i");
    b.assign(a, rv::Repeat{b.int_(mod.I32Ty, 0), arr});
    b.assign(i, rv::Use{b.int_(mod.UsizeTy, 5)});
    b.assign(0, rv::Use{b.copy(PlaceExpr(a).project(Projection::Index(i)))});
    b.ret();

    auto r = Run("main");
    ASSERT_TRUE(r.is(ViolationKind::OutOfBounds)) << r.str();
    EXPECT_NE(r.error->message.find("length 3"), std::string::npos) << r.str();
}

TEST_F(MachineTest, Indexing) {
    auto arr = ArrayType::Get(mod, mod.I32Ty, 3);
    ProcBuilder b{mod, "main", mod.I32Ty};
    auto a = b.local(arr, "a");
    auto i = b.local(mod.UsizeTy, "i");
    b.assign(a, rv::Aggregate{AggregateKind::Array, arr, 0, {
        b.int_(mod.I32Ty, 1),
        b.int_(mod.I32Ty, 2),
        b.int_(mod.I32Ty, 3),
    }});
    b.assign(i, rv::Use{b.int_(mod.UsizeTy, 2)});
    b.assign(0, rv::Use{b.copy(PlaceExpr(a).project(Projection::Index(i)))});
    b.ret();

    EXPECT_EQ(Returned(Run("main")), 3);
}

TEST_F(MachineTest, Interrupt) {
    ProcBuilder b{mod, "main", mod.UnitTy};
    b.goto_(0);

    Machine m{ctx, mod, layouts, foreign};
    m.interrupt();
    auto r = m.run("main");
    EXPECT_EQ(r.kind, RunResult::Kind::Interrupted);
    EXPECT_EQ(r.steps, 0u);
}

TEST_F(MachineTest, AssertFailureAborts) {
    ProcBuilder b{mod, "main", mod.UnitTy};
    b.assert_(b.bool_(false), true, "assertion failed: x > 0");
    b.ret();

    auto r = Run("main");
    ASSERT_EQ(r.kind, RunResult::Kind::Aborted) << r.str();
    EXPECT_EQ(r.error->message, "assertion failed: x > 0");
    ASSERT_EQ(r.trace.size(), 1u);
    EXPECT_EQ(r.trace.front().stmt, 0u);
}
