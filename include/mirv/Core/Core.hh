#ifndef MIRV_CORE_HH
#define MIRV_CORE_HH

#include <mirv/Core/Utils.hh>
#include <mirv/Macros.hh>

#include <llvm/ADT/IntrusiveRefCntPtr.h>
#include <llvm/Support/Allocator.h>
#include <llvm/Support/StringSaver.h>

namespace mirv {
class Context;
class DiagnosticsEngine;
struct EvalOpts;
enum struct OverflowPolicy : u8;
} // namespace mirv

/// How checked arithmetic reacts to overflow.
enum struct mirv::OverflowPolicy : mirv::u8 {
    /// Produce the wrapped result together with an overflow flag.
    Flag,

    /// Overflow is undefined behaviour.
    Trap,

    /// Produce the wrapped result; the flag is never set.
    Wrap,

    /// Clamp to the range of the type; the flag is never set.
    Saturate,
};

/// Options that control a single evaluation.
struct mirv::EvalOpts {
    /// Maximum number of steps before evaluation is aborted. 0
    /// means there is no limit.
    u64 eval_steps = 1 << 20;

    /// Maximum number of bytes that may be live at the same time
    /// across all allocations. 0 means there is no limit.
    u64 memory_limit = u64(256) << 20;

    /// Maximum number of stack frames.
    u32 stack_limit = 1024;

    /// Behaviour of checked arithmetic on overflow.
    OverflowPolicy overflow = OverflowPolicy::Flag;

    /// Reject memory accesses through misaligned pointers.
    bool check_alignment : 1 = true;

    /// Log every statement and terminator to stderr before it is executed.
    bool trace : 1 = false;
};

/// Shared state for evaluation: options and diagnostics.
class mirv::Context {
    MIRV_IMMOVABLE(Context);

    /// Diagnostics engine.
    llvm::IntrusiveRefCntPtr<DiagnosticsEngine> diags_engine;

    /// For saving strings.
    llvm::BumpPtrAllocator alloc;
    llvm::StringSaver saver{alloc};

public:
    /// Evaluation options.
    EvalOpts opts;

    /// Whether to use coloured output.
    bool use_colours = true;

    /// Create a new context with default options.
    explicit Context();
    ~Context();

    /// Get diagnostics engine.
    [[nodiscard]] auto diags() const -> DiagnosticsEngine&;

    /// Save a string in the context.
    [[nodiscard]] auto save(StringRef s) -> StringRef { return saver.save(s); }

    /// Set the diagnostics engine.
    void set_diags(llvm::IntrusiveRefCntPtr<DiagnosticsEngine> diags);
};

#endif // MIRV_CORE_HH
