#ifndef MIRV_TEST_COMMON_HH
#define MIRV_TEST_COMMON_HH

#include <mirv/Core/Core.hh>
#include <mirv/Core/Diagnostics.hh>
#include <mirv/Eval/Foreign.hh>
#include <mirv/Eval/Machine.hh>
#include <mirv/IR/Builder.hh>
#include <mirv/IR/IR.hh>
#include <mirv/Layout/Layout.hh>

#include <gtest/gtest.h>

namespace mirv::test {
using namespace mirv::eval;

/// Fixture that owns a module and everything needed to run it.
class EvalTest : public ::testing::Test {
protected:
    Context ctx;
    Module mod;
    DefaultLayoutService layouts;
    BuiltinForeignCalls foreign;

    /// Run a procedure on a fresh machine.
    auto Run(StringRef entry, ArrayRef<Value> args = {}) -> RunResult {
        Machine m{ctx, mod, layouts, foreign};
        return m.run(entry, args);
    }

    /// Get the integer a run returned.
    static auto Returned(const RunResult& r) -> i64 {
        EXPECT_EQ(r.kind, RunResult::Kind::Returned) << r.str();
        if (not r.value) return -1;
        return r.value->int_value().getSExtValue();
    }

    auto Ptr(Type elem, PtrKind kind = PtrKind::Raw) -> Type {
        return PtrType::Get(mod, elem, kind);
    }

    auto Tuple(ArrayRef<Type> elems) -> Type {
        return TupleType::Get(mod, elems);
    }
};
} // namespace mirv::test

#endif // MIRV_TEST_COMMON_HH
