#ifndef MIRV_EVAL_ERROR_HH
#define MIRV_EVAL_ERROR_HH

#include <mirv/Core/Utils.hh>
#include <mirv/Macros.hh>

#include <expected>
#include <string>

namespace mirv::eval {
class EvalError;

/// Allocation ids start at 1; 0 means ‘no allocation’.
using AllocId = u64;

template <typename T = void>
using EvalResult = std::expected<T, EvalError>;

enum struct AllocKind : u8;
enum struct ResourceKind : u8;
enum struct ViolationKind : u8;

/// Get a human-readable name for an enum value.
auto Name(AllocKind k) -> std::string_view;
auto Name(ResourceKind k) -> std::string_view;
auto Name(ViolationKind k) -> std::string_view;
} // namespace mirv::eval

enum struct mirv::eval::AllocKind : mirv::u8 {
    Stack,
    Heap,
    Static,

    /// Zero-sized allocation that stands for a procedure; pointers
    /// to these are function pointers.
    Function,
};

enum struct mirv::eval::ResourceKind : mirv::u8 {
    StepBudget,
    MemoryBudget,
    StackDepth,
};

/// Kinds of undefined behaviour.
enum struct mirv::eval::ViolationKind : mirv::u8 {
    UseAfterFree,
    OutOfBounds,
    Unaligned,
    UninitializedRead,
    InvalidDiscriminant,
    DoubleFree,
    AllocationKindMismatch,
    WriteToReadOnly,
    ReachedUnreachable,
    ProvenanceMismatch,
    InvalidBool,
    InvalidChar,
    PointerAsBytes,
    DerefFunctionPointer,
    InvalidFunctionPointer,
    ArithmeticOverflow,
    InvalidDeallocation,
};

/// Reason why evaluation stopped early.
///
/// Program aborts are errors too; the machine catches them and
/// unwinds the stack instead of stopping right away.
class mirv::eval::EvalError {
public:
    enum struct Kind : u8 {
        UndefinedBehaviour,
        Abort,
        ResourceExhausted,
        Interrupted,
        Internal,

        /// The program asked to exit; this is not a failure.
        Exit,
    };

    Kind kind;

    /// For UB: what went wrong, and where.
    ViolationKind violation{};
    AllocId alloc = 0;
    i64 offset = 0;

    /// For resource exhaustion: the limit that was hit, how much
    /// was used, and the limit itself.
    ResourceKind resource{};
    u64 used = 0;
    u64 limit = 0;

    /// For aborts: whether the stack is unwound, or the abort
    /// terminates evaluation immediately.
    bool unwinds = true;

    /// For exits.
    i64 exit_code = 0;

    /// Additional information; this is the message for aborts
    /// and internal errors.
    std::string message;

    static auto Abort(std::string message, bool unwinds = true) -> EvalError;
    static auto Exit(i64 code) -> EvalError;
    static auto Internal(std::string message) -> EvalError;
    static auto Interrupted() -> EvalError;
    static auto Resource(ResourceKind k, u64 used, u64 limit) -> EvalError;
    static auto UB(ViolationKind k, AllocId alloc, i64 offset, std::string message = "") -> EvalError;

    /// Format this error as a single line of text.
    [[nodiscard]] auto str() const -> std::string;

    /// Check whether this is a given kind of undefined behaviour.
    [[nodiscard]] bool is(ViolationKind k) const {
        return kind == Kind::UndefinedBehaviour and violation == k;
    }

private:
    explicit EvalError(Kind k) : kind{k} {}
};

namespace mirv::eval {
/// Shorthand for returning an error from a function that
/// returns an 'EvalResult'.
template <typename... Args>
auto Violation(
    ViolationKind k,
    AllocId alloc,
    i64 offset,
    std::format_string<Args...> fmt,
    Args&&... args
) -> std::unexpected<EvalError> {
    return std::unexpected(EvalError::UB(k, alloc, offset, std::format(fmt, std::forward<Args>(args)...)));
}

template <typename... Args>
auto InternalError(std::format_string<Args...> fmt, Args&&... args) -> std::unexpected<EvalError> {
    return std::unexpected(EvalError::Internal(std::format(fmt, std::forward<Args>(args)...)));
}
} // namespace mirv::eval

#endif // MIRV_EVAL_ERROR_HH
