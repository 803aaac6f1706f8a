#include <mirv/Core/Core.hh>
#include <mirv/Core/Diagnostics.hh>

using namespace mirv;

// ============================================================================
//  Context
// ============================================================================
Context::Context() = default;

Context::~Context() {
    if (diags_engine) diags_engine->flush();
}

auto Context::diags() const -> DiagnosticsEngine& {
    Assert(diags_engine, "Diagnostics engine not set!");
    return *diags_engine;
}

void Context::set_diags(llvm::IntrusiveRefCntPtr<DiagnosticsEngine> diags) {
    if (diags_engine) diags_engine->flush();
    diags_engine = std::move(diags);
}
