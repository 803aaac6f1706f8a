#include <mirv/Eval/Machine.hh>

using namespace mirv;
using namespace mirv::eval;

// ============================================================================
//  Run Result
// ============================================================================
auto RunResult::str() const -> std::string {
    switch (kind) {
        case Kind::Returned:
            if (value) return std::format("Returned {}", text::RenderColours(false, value->print().str()));
            return "Returned";

        case Kind::Exited:
        case Kind::UndefinedBehaviour:
        case Kind::Aborted:
        case Kind::ResourceExhausted:
        case Kind::Interrupted:
        case Kind::InternalError:
            return error->str();
    }
    Unreachable();
}

void RunResult::report(DiagnosticsEngine& diags) const {
    if (ok()) return;
    auto where = trace.empty() ? Location() : trace.front();
    auto level = kind == Kind::InternalError ? Diagnostic::Level::ICE : Diagnostic::Level::Error;
    diags.diag(level, where, "{}", error->str());

    if (kind == Kind::ResourceExhausted) {
        switch (error->resource) {
            case ResourceKind::StepBudget:
                diags.add_remark("This may be caused by an infinite loop; the step budget can be raised with 'EvalOpts::eval_steps'.");
                break;
            case ResourceKind::MemoryBudget:
                diags.add_remark("The memory budget can be raised with 'EvalOpts::memory_limit'.");
                break;
            case ResourceKind::StackDepth:
                diags.add_remark("This may be caused by infinite recursion; the maximum stack depth can be raised with 'EvalOpts::stack_limit'.");
                break;
        }
    }

    for (usz i = 1; i < trace.size(); i++)
        diags.diag(Diagnostic::Level::Note, trace[i], "Inside call to '{}'", trace[i - 1].proc);
}

// ============================================================================
//  Machine
// ============================================================================
Machine::Machine(Context& ctx, const Module& mod, LayoutService& layouts, ForeignCallHandler& foreign)
    : ctx{ctx},
      mod{mod},
      layouts{layouts},
      foreign{foreign},
      mem{layouts.data_layout(), ctx.opts.memory_limit, ctx.opts.check_alignment} {}

auto Machine::backtrace() const -> SmallVector<Location, 4> {
    SmallVector<Location, 4> trace;
    for (auto& f : llvm::reverse(frames)) trace.emplace_back(f.proc->name(), f.block, f.stmt);
    return trace;
}

auto Machine::run(StringRef entry, ArrayRef<Value> args) -> RunResult {
    Assert(not started, "A machine can only be run once");
    started = true;
    auto res = Start(entry, args);
    if (res) res = Loop();
    return Finish(std::move(res));
}

auto Machine::Start(StringRef entry, ArrayRef<Value> args) -> EvalResult<> {
    if (auto problem = Verify(mod)) return InternalError(
        "Malformed IR at {}: {}",
        problem->first.format(),
        problem->second
    );

    auto proc = mod.proc(entry);
    if (not proc) return InternalError("No procedure named '{}'", entry);
    if (proc->arg_count() != args.size()) return InternalError(
        "'{}' takes {} arguments, but {} were provided",
        entry,
        proc->arg_count(),
        args.size()
    );

    MIRV_TRY(PushFrame(*proc, Frame::Kind::Entry, args, std::nullopt));
    return InitStatics();
}

auto Machine::InitStatics() -> EvalResult<> {
    // Allocate everything first since initialisers may refer to
    // other statics.
    for (auto& s : mod.statics()) {
        auto& l = layouts.layout_of(s->type);
        statics[s->name] = MIRV_TRY(mem.allocate(l.size, l.align, AllocKind::Static));
    }

    for (auto& s : mod.statics()) {
        if (not s->init) continue;
        auto id = statics.at(s->name);
        auto val = MIRV_TRY(EvalConstant(*s->init));
        MIRV_TRY(write_value(Place{s->type, MemPlace{Pointer::To(id)}}, val));
        MIRV_TRY(FreeTemporaries());
        if (not s->mutable_) mem.freeze(id);
    }

    // Statics that are computed at runtime are initialised before the
    // entry procedure runs, in declaration order; since the last frame
    // pushed runs first, push them in reverse.
    for (auto& s : llvm::reverse(mod.statics())) {
        if (s->init) continue;
        auto id = statics.at(s->name);
        MIRV_TRY(PushFrame(
            *mod.proc(s->init_proc),
            Frame::Kind::StaticInit,
            {},
            Place{s->type, MemPlace{Pointer::To(id)}}
        ));

        frames.back().static_alloc = id;
        frames.back().freeze_static = not s->mutable_;
    }

    return {};
}

auto Machine::Loop() -> EvalResult<> {
    auto budget = ctx.opts.eval_steps;
    while (not frames.empty()) {
        if (interrupted.load(std::memory_order_relaxed)) return std::unexpected(EvalError::Interrupted());
        if (budget != 0 and steps == budget) return std::unexpected(EvalError::Resource(
            ResourceKind::StepBudget,
            steps,
            budget
        ));

        steps++;
        auto res = Step();
        if (res) continue;

        // Unwind program aborts; everything else is fatal.
        auto& err = res.error();
        if (err.kind != EvalError::Kind::Abort or not err.unwinds) return res;
        MIRV_TRY(Raise(std::move(err)));
    }

    return {};
}

auto Machine::Finish(EvalResult<> res) -> RunResult {
    RunResult r;
    r.steps = steps;
    if (res) {
        r.kind = RunResult::Kind::Returned;
        r.value = std::move(result);
        return r;
    }

    auto& err = res.error();
    switch (err.kind) {
        using K = EvalError::Kind;
        case K::UndefinedBehaviour: r.kind = RunResult::Kind::UndefinedBehaviour; break;
        case K::Abort: r.kind = RunResult::Kind::Aborted; break;
        case K::ResourceExhausted: r.kind = RunResult::Kind::ResourceExhausted; break;
        case K::Interrupted: r.kind = RunResult::Kind::Interrupted; break;
        case K::Internal: r.kind = RunResult::Kind::InternalError; break;
        case K::Exit: r.kind = RunResult::Kind::Exited; break;
    }

    // The stack of an unwound abort is gone by now.
    bool unwound = err.kind == EvalError::Kind::Abort and err.unwinds and frames.empty();
    r.trace = unwound ? panic_trace : backtrace();
    r.error = std::move(err);
    return r;
}

// ============================================================================
//  Frames
// ============================================================================
auto Machine::PushFrame(
    const Proc& proc,
    Frame::Kind kind,
    ArrayRef<Value> args,
    std::optional<Place> ret_place
) -> EvalResult<> {
    auto limit = ctx.opts.stack_limit;
    if (limit != 0 and frames.size() >= limit) return std::unexpected(EvalError::Resource(
        ResourceKind::StackDepth,
        frames.size() + 1,
        limit
    ));

    auto& f = frames.emplace_back(&proc, kind);
    f.ret_place = std::move(ret_place);
    f.locals.resize(proc.locals.size());
    auto idx = u32(frames.size() - 1);

    // Aggregates always live in memory; everything else starts out
    // in the frame and is moved to memory if its address is taken.
    for (u32 i = 0; i < proc.locals.size(); i++) {
        auto& l = layouts.layout_of(proc.locals[i].type);
        if (l.abi == Abi::Aggregate and not l.is_zst()) {
            auto id = MIRV_TRY(mem.allocate(l.size, l.align, AllocKind::Stack));
            frames[idx].locals[i].state = LocalSlot::Indirect{id};
        } else {
            frames[idx].locals[i].state = LocalSlot::Direct{};
        }
    }

    for (u32 i = 0; i < args.size(); i++) {
        LocalId local = i + 1;
        MIRV_TRY(write_value(Place{proc.locals[local].type, LocalPlace{idx, local}}, args[i]));
    }

    return {};
}

auto Machine::PopFrame() -> EvalResult<> {
    Assert(not frames.empty(), "Stack underflow");
    for (auto& slot : frames.back().locals)
        if (auto i = std::get_if<LocalSlot::Indirect>(&slot.state))
            MIRV_TRY(mem.deallocate(i->alloc, AllocKind::Stack));
    frames.pop_back();
    return {};
}

auto Machine::Step() -> EvalResult<> {
    auto& f = frames.back();
    if (not f.drops.empty()) return StepDrop();

    auto& block = f.proc->block(f.block);
    if (f.stmt < block.stmts.size()) {
        auto& s = block.stmts[f.stmt];
        if (ctx.opts.trace) Trace(PrintStatement(*f.proc, s).str());
        MIRV_TRY(ExecStatement(s));
        MIRV_TRY(FreeTemporaries());

        // Statements never push or pop frames.
        frames.back().stmt++;
        return {};
    }

    if (ctx.opts.trace) Trace(PrintTerminator(*f.proc, block.term).str());
    auto res = ExecTerminator(block.term);
    MIRV_TRY(FreeTemporaries());
    return res;
}

// ============================================================================
//  Unwinding
// ============================================================================
auto Machine::Raise(EvalError e) -> EvalResult<> {
    if (panic) return std::unexpected(EvalError::Abort(
        std::format("Abort while unwinding from an earlier abort: {}", e.message),
        false
    ));

    panic_trace = backtrace();
    panic = std::move(e);
    BeginUnwind(frames.back());
    return Unwind();
}

void Machine::BeginUnwind(Frame& f) {
    f.unwinding = true;
    f.drops.clear();
    f.drop_target.reset();

    // Drop the locals in reverse order; the last item is run first.
    auto idx = u32(&f - frames.data());
    for (u32 i = 0; i < f.locals.size(); i++) {
        auto& slot = f.locals[i];
        auto ty = f.proc->locals[i].type;
        if (not slot.drop_flag or not ty->needs_drop()) continue;
        slot.drop_flag = false;
        f.drops.push_back(DropItem{DropItem::Kind::DropValue, Place{ty, LocalPlace{idx, i}}});
    }
}

auto Machine::Unwind() -> EvalResult<> {
    while (not frames.empty()) {
        auto& f = frames.back();
        if (not f.unwinding or not f.drops.empty()) return {};

        auto kind = f.kind;
        auto unwind = f.unwind_block;
        MIRV_TRY(PopFrame());
        if (frames.empty()) break;

        // The caller catches the abort if the call has an unwind target.
        auto& caller = frames.back();
        if (kind == Frame::Kind::Call and unwind) {
            caller.caught = std::move(panic);
            panic.reset();
            Jump(*unwind);
            return {};
        }

        BeginUnwind(caller);
    }

    auto e = std::move(*panic);
    panic.reset();
    return std::unexpected(std::move(e));
}
