#ifndef MIRV_EVAL_VALIDATOR_HH
#define MIRV_EVAL_VALIDATOR_HH

#include <mirv/Eval/Memory.hh>

namespace mirv::eval {
struct ResolvedAccess;
enum struct Access : u8;
} // namespace mirv::eval

enum struct mirv::eval::Access : mirv::u8 {
    /// Read initialised bytes.
    Read,

    /// Read bytes that may be uninitialised, e.g. to copy them.
    ReadRaw,

    /// Write bytes.
    Write,

    /// Only check that the range is live and in bounds.
    Inbounds,
};

/// An access that passed validation.
struct mirv::eval::ResolvedAccess {
    const Allocation* alloc;
    u64 offset;
};

/// Checks memory accesses.
///
/// Checks are run in a fixed order, and the first one that fails
/// determines the error:
///
///   1. The allocation must be live.
///   2. The range must be in bounds.
///   3. The address must be aligned, if alignment checking is enabled.
///   4. For reads, every byte must be initialised; for writes, the
///      allocation must be mutable.
///   5. Caller-provided checks on the value, e.g. its discriminant.
///   6. The pointer must have provenance for the allocation.
///
/// Wild pointers are resolved by address so that the first five checks
/// can report something useful; check 6 then always fails for them.
class mirv::eval::Validator {
    const Memory& mem;

public:
    using ExtraCheck = llvm::function_ref<EvalResult<>(const Allocation&, u64)>;

    explicit Validator(const Memory& mem) : mem{mem} {}

    /// Validate an access of 'len' bytes.
    [[nodiscard]] auto check(
        Pointer ptr,
        Size len,
        Align align,
        Access access,
        ExtraCheck extra = nullptr
    ) const -> EvalResult<ResolvedAccess>;

private:
    auto Resolve(Pointer ptr) const -> EvalResult<ResolvedAccess>;
};

#endif // MIRV_EVAL_VALIDATOR_HH
