#ifndef MIRV_EVAL_FOREIGN_HH
#define MIRV_EVAL_FOREIGN_HH

#include <mirv/Eval/Value.hh>

namespace mirv::eval {
class BuiltinForeignCalls;
class ForeignCallHandler;
class Machine;
struct Effect;

/// What a foreign call produced: a value, or an effect the machine applies.
using ForeignResult = Variant<Value, Effect>;
} // namespace mirv::eval

/// A control-flow effect of a foreign call.
struct mirv::eval::Effect {
    enum struct Kind : u8 {
        /// Start unwinding with a program abort.
        Panic,

        /// Stop evaluation with an exit code.
        Exit,

        /// Return unit.
        None,
    };

    Kind kind = Kind::None;
    std::string message;
    i64 code = 0;

    [[nodiscard]] static auto Exit(i64 code) -> Effect { return Effect{Kind::Exit, "", code}; }
    [[nodiscard]] static auto None() -> Effect { return Effect{}; }
    [[nodiscard]] static auto Panic(std::string message) -> Effect { return Effect{Kind::Panic, std::move(message)}; }
};

/// Handles calls to procedures that are not defined in the module.
class mirv::eval::ForeignCallHandler {
public:
    virtual ~ForeignCallHandler() = default;

    /// Perform a call. 'ret' is the type of the place that
    /// receives the result.
    [[nodiscard]] virtual auto call(
        Machine& m,
        StringRef name,
        ArrayRef<Value> args,
        Type ret
    ) -> EvalResult<ForeignResult> = 0;
};

/// The default foreign call handler.
///
/// This provides an allocator ('alloc', 'alloc_zeroed', 'dealloc',
/// 'realloc'), 'write', whose output is captured, and the process
/// control functions 'exit', 'abort', and 'panic'.
class mirv::eval::BuiltinForeignCalls : public ForeignCallHandler {
    std::string captured;

public:
    [[nodiscard]] auto call(
        Machine& m,
        StringRef name,
        ArrayRef<Value> args,
        Type ret
    ) -> EvalResult<ForeignResult> override;

    /// Get everything written with 'write'.
    [[nodiscard]] auto output() const -> StringRef { return captured; }
};

#endif // MIRV_EVAL_FOREIGN_HH
