#include <mirv/Core/Core.hh>
#include <mirv/Core/Diagnostics.hh>

#include <llvm/ADT/StringExtras.h>

using namespace mirv;

// ============================================================================
//  Diagnostic Formatting
// ============================================================================
/// Get the colour of a diagnostic.
static auto Colour(Diagnostic::Level kind) -> char {
    using Level = Diagnostic::Level;
    switch (kind) {
        case Level::Ignored: return '0';
        case Level::ICE: return '5';
        case Level::Warning: return '3';
        case Level::Note: return '2';
        case Level::Error: return '1';
    }
    Unreachable();
}

/// Get the name of a diagnostic.
static auto Name(Diagnostic::Level kind) -> std::string_view {
    using Level = Diagnostic::Level;
    switch (kind) {
        case Level::Ignored: return "Ignored";
        case Level::ICE: return "Internal Error";
        case Level::Error: return "Error";
        case Level::Warning: return "Warning";
        case Level::Note: return "Note";
    }
    Unreachable();
}

static auto FormatDiagnostic(const Diagnostic& diag) -> std::string {
    std::string out;

    // Print the diagnostic name and message.
    out += std::format(
        "%b(%{}({}:) {})\n",
        Colour(diag.level),
        Name(diag.level),
        diag.msg
    );

    // Print the location.
    if (diag.where.is_valid())
        out += std::format("  at %b4(\002{}\003)\n", diag.where.format());

    // Extra data goes after everything else.
    if (not diag.extra.empty()) out += std::format("\n{}\n", diag.extra);
    return out;
}

auto Diagnostic::Render(ArrayRef<Diagnostic> backlog, bool use_colours) -> std::string {
    std::string buffer;
    bool first_line = true;
    for (usz di = 0; di < backlog.size(); di++) {
        auto out = text::RenderColours(use_colours, FormatDiagnostic(backlog[di]));
        if (out.ends_with('\n')) out.pop_back();

        SmallVector<StringRef> lines;
        StringRef(out).split(lines, '\n');
        for (usz i = 0; i < lines.size(); i++) {
            auto line = lines[i];
            bool last = di == backlog.size() - 1 and i == lines.size() - 1;
            bool only_line = last and first_line;
            if (only_line) {
                // Edge case: print nothing if this is the only line.
            } else if (last) {
                buffer += "╰";
            } else {
                buffer += first_line ? "╭" : "│";
                first_line = false;
            }

            if (not line.empty()) {
                if (not only_line) buffer += ' ';
                buffer += line.str();
            }
            buffer += '\n';
        }
    }

    return buffer;
}

// ============================================================================
//  Diagnostic
// ============================================================================
Diagnostic::Diagnostic(Level lvl, Location where, std::string msg, std::string extra)
    : level(lvl),
      where(where),
      msg(std::move(msg)),
      extra(std::move(extra)) {}

// ============================================================================
//  Streaming Diagnostics Engine
// ============================================================================
void DiagnosticsEngine::report(Diagnostic&& diag) {
    if (diag.level == Diagnostic::Level::Ignored) return;
    if (diag.level == Diagnostic::Level::Error or diag.level == Diagnostic::Level::ICE)
        error_flag.store(true, std::memory_order_relaxed);
    report_impl(std::move(diag));
}

StreamingDiagnosticsEngine::StreamingDiagnosticsEngine(
    const Context& ctx,
    u32 error_limit,
    llvm::raw_ostream& output_stream
) : DiagnosticsEngine(ctx), stream(output_stream), error_limit(error_limit) {}

StreamingDiagnosticsEngine::~StreamingDiagnosticsEngine() {
    Assert(backlog.empty(), "Diagnostics not flushed?");
}

auto StreamingDiagnosticsEngine::Create(
    const Context& ctx,
    u32 error_limit,
    llvm::raw_ostream& output_stream
) -> Ptr {
    return llvm::IntrusiveRefCntPtr(new StreamingDiagnosticsEngine(ctx, error_limit, output_stream));
}

void StreamingDiagnosticsEngine::EmitDiagnostics() {
    if (backlog.empty()) return;
    if (printed) stream << "\n";
    printed++;
    stream << Diagnostic::Render(backlog, ctx.use_colours);
    backlog.clear();
}

void StreamingDiagnosticsEngine::add_remark(std::string msg) {
    if (backlog.empty()) return;
    auto& extra = backlog.back().extra;
    if (not extra.empty()) extra += '\n';
    extra += std::move(msg);
}

void StreamingDiagnosticsEngine::flush() {
    EmitDiagnostics();
    stream.flush();
}

void StreamingDiagnosticsEngine::report_impl(Diagnostic&& diag) {
    // Give up if we’ve printed too many errors.
    if (error_limit and printed >= error_limit) {
        if (printed == error_limit) {
            printed++;
            EmitDiagnostics();
            stream << text::RenderColours(
                ctx.use_colours,
                std::format(
                    "\n%b(%{}(Error:) Too many errors emitted (> {}\033). Not showing any more errors.)\n",
                    Colour(Diagnostic::Level::Error),
                    printed - 1
                )
            );
        }

        return;
    }

    // If this not a note, emit the backlog.
    if (diag.level != Diagnostic::Level::Note) EmitDiagnostics();
    backlog.push_back(std::move(diag));
}

// ============================================================================
//  Collecting Diagnostics Engine
// ============================================================================
void CollectingDiagnosticsEngine::add_remark(std::string msg) {
    if (diags.empty()) return;
    auto& extra = diags.back().extra;
    if (not extra.empty()) extra += '\n';
    extra += std::move(msg);
}

auto CollectingDiagnosticsEngine::render() const -> std::string {
    return Diagnostic::Render(diags, false);
}
