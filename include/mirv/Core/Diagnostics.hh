#ifndef MIRV_CORE_DIAGNOSTICS_HH
#define MIRV_CORE_DIAGNOSTICS_HH

#include <mirv/Core/Core.hh>
#include <mirv/Core/Location.hh>
#include <mirv/Core/Utils.hh>
#include <mirv/Macros.hh>

#include <llvm/ADT/IntrusiveRefCntPtr.h>

#include <atomic>

namespace mirv {
class Diagnostic;
class DiagnosticsEngine;
class StreamingDiagnosticsEngine;
class CollectingDiagnosticsEngine;
}

/// A diagnostic.
///
/// This holds the data associated with a diagnostic, i.e. the IR
/// location, level, and message.
class mirv::Diagnostic {
public:
    /// Diagnostic severity.
    enum struct Level : u8 {
        Ignored, ///< Do not emit this.
        Note,    ///< Informational note.
        Warning, ///< Warning, but no hard error.
        Error,   ///< Hard error. The program is ill-behaved.
        ICE,     ///< Internal error. The interpreter is in an inconsistent state.
    };

    Level level = Level::Ignored;
    Location where;

    /// Main diagnostic message.
    std::string msg;

    /// Extra data to print after the location.
    std::string extra;

    /// Create an empty diagnostic.
    Diagnostic() = default;

    /// Create a diagnostic.
    Diagnostic(Level lvl, Location where, std::string msg, std::string extra = "");

    /// Render diagnostics to text.
    ///
    /// \p render_colours If false, keep formatting codes in the
    ///    output rather than rendering it.
    static auto Render(
        ArrayRef<Diagnostic> diagnostics,
        bool render_colours = true
    ) -> std::string;
};

/// This class handles dispatching diagnostics. Objects of this
/// type are NOT thread-safe. Create a separate one for each thread.
class mirv::DiagnosticsEngine : public llvm::RefCountedBase<DiagnosticsEngine> {
    MIRV_IMMOVABLE(DiagnosticsEngine);

protected:
    /// The context that owns this engine.
    const Context& ctx;
    std::atomic<bool> error_flag = false;

public:
    using Ptr = llvm::IntrusiveRefCntPtr<DiagnosticsEngine>;
    virtual ~DiagnosticsEngine() = default;
    explicit DiagnosticsEngine(const Context& ctx) : ctx(ctx) {}

    /// Add a remark to a diagnostic as extra information.
    virtual void add_remark(std::string) {}

    /// Issue a diagnostic.
    template <typename... Args>
    void diag(
        Diagnostic::Level lvl,
        Location where,
        std::format_string<Args...> fmt,
        Args&&... args
    ) {
        report(Diagnostic{lvl, where, std::format(fmt, std::forward<Args>(args)...)});
    }

    /// Emit pending diagnostics.
    virtual void flush() {}

    /// Check whether any diagnostics have been issued.
    [[nodiscard]] bool has_error() const { return error_flag.load(std::memory_order_relaxed); }

    /// Issue a diagnostic.
    void report(Diagnostic&& diag);

protected:
    /// Override this to implement the actual reporting.
    virtual void report_impl(Diagnostic&& diag) = 0;
};

/// Diagnostics engine that outputs to a stream.
class mirv::StreamingDiagnosticsEngine final : public DiagnosticsEngine {
    llvm::raw_ostream& stream;

    /// Used to limit how many errors we print before giving up.
    u32 error_limit;
    u32 printed = 0;

    /// Backlog of diagnostics so we can group notes with errors.
    SmallVector<Diagnostic, 20> backlog;

    StreamingDiagnosticsEngine(const Context& ctx, u32 error_limit, llvm::raw_ostream& output_stream);
    ~StreamingDiagnosticsEngine() override;

public:
    /// Create a new diagnostic engine.
    [[nodiscard]] static auto Create(
        const Context& ctx,
        u32 error_limit = 0,
        llvm::raw_ostream& output_stream = llvm::errs()
    ) -> Ptr;

    void add_remark(std::string msg) override;
    void flush() override;

private:
    void report_impl(Diagnostic&&) override;
    void EmitDiagnostics();
};

/// Diagnostics engine that keeps every diagnostic it is given.
///
/// This is used by embedders that want to inspect diagnostics
/// rather than print them.
class mirv::CollectingDiagnosticsEngine final : public DiagnosticsEngine {
    SmallVector<Diagnostic, 0> diags;

    explicit CollectingDiagnosticsEngine(const Context& ctx) : DiagnosticsEngine(ctx) {}

public:
    [[nodiscard]] static auto Create(const Context& ctx) -> llvm::IntrusiveRefCntPtr<CollectingDiagnosticsEngine> {
        return llvm::IntrusiveRefCntPtr(new CollectingDiagnosticsEngine(ctx));
    }

    void add_remark(std::string msg) override;

    /// Get the diagnostics issued so far.
    [[nodiscard]] auto diagnostics() const -> ArrayRef<Diagnostic> { return diags; }

    /// Render everything without colours.
    [[nodiscard]] auto render() const -> std::string;

private:
    void report_impl(Diagnostic&& diag) override { diags.push_back(std::move(diag)); }
};

#endif // MIRV_CORE_DIAGNOSTICS_HH
