#include <mirv/Eval/Machine.hh>

using namespace mirv;
using namespace mirv::eval;

namespace {
/// Whether a place is stored in a local of the current frame.
bool RootedInLocal(const PlaceExpr& p) {
    return llvm::none_of(p.projections, [](Projection proj) {
        return proj.kind == Projection::Kind::Deref;
    });
}
} // namespace

void Machine::Jump(BlockId block) {
    auto& f = frames.back();
    f.block = block;
    f.stmt = 0;
}

void Machine::Trace(StringRef what) {
    auto depth = frames.size() - 1;
    llvm::errs() << std::string(depth * 2, ' ') << text::RenderColours(ctx.use_colours, what.str()) << "\n";
}

auto Machine::FreeTemporaries() -> EvalResult<> {
    for (auto id : temps) MIRV_TRY(mem.deallocate(id, AllocKind::Stack));
    temps.clear();
    return {};
}

// ============================================================================
//  Statements
// ============================================================================
auto Machine::ExecStatement(const Statement& s) -> EvalResult<> {
    return std::visit(utils::Overloaded{
        [&](const stmt::Assign& a) -> EvalResult<> {
            auto dest = MIRV_TRY(EvalPlace(a.place));
            auto val = MIRV_TRY(EvalRvalue(a.value, dest.type));
            MIRV_TRY(write_value(dest, val));

            // A local that is written to piecewise needs to be dropped
            // just like one that is assigned as a whole.
            if (not a.place.projections.empty() and RootedInLocal(a.place))
                frames.back().locals[a.place.local].drop_flag = true;
            return {};
        },

        [&](const stmt::Assert& a) -> EvalResult<> {
            auto v = MIRV_TRY(EvalOperand(a.cond));
            bool cond = not v.int_value().isZero();
            if (cond != a.expected) return std::unexpected(EvalError::Abort(a.message));
            return {};
        },

        [&](const stmt::SetDiscriminant& sd) -> EvalResult<> {
            auto place = MIRV_TRY(EvalPlace(sd.place));
            MIRV_TRY(WriteDiscriminant(place, sd.variant));
            if (RootedInLocal(sd.place)) frames.back().locals[sd.place.local].drop_flag = true;
            return {};
        },

        [&](const stmt::StorageLive& sl) -> EvalResult<> {
            auto& f = frames.back();
            auto& slot = f.locals[sl.local];
            if (auto i = std::get_if<LocalSlot::Indirect>(&slot.state))
                MIRV_TRY(mem.deallocate(i->alloc, AllocKind::Stack));

            slot.drop_flag = false;
            auto& l = layouts.layout_of(f.proc->local(sl.local).type);
            if (l.abi == Abi::Aggregate and not l.is_zst()) {
                auto id = MIRV_TRY(mem.allocate(l.size, l.align, AllocKind::Stack));
                slot.state = LocalSlot::Indirect{id};
            } else {
                slot.state = LocalSlot::Direct{};
            }
            return {};
        },

        [&](const stmt::StorageDead& sd) -> EvalResult<> {
            auto& slot = frames.back().locals[sd.local];
            slot.drop_flag = false;
            if (auto i = std::get_if<LocalSlot::Indirect>(&slot.state)) {
                auto id = i->alloc;
                MIRV_TRY(mem.deallocate(id, AllocKind::Stack));
                slot.state = LocalSlot::Dead{id};
            } else if (std::holds_alternative<LocalSlot::Direct>(slot.state)) {
                slot.state = LocalSlot::Dead{};
            }
            return {};
        },

        [&](const stmt::Nop&) -> EvalResult<> { return {}; },
    }, s.kind);
}

// ============================================================================
//  Terminators
// ============================================================================
auto Machine::ExecTerminator(const Terminator& t) -> EvalResult<> {
    return std::visit(utils::Overloaded{
        [&](const term::Goto& g) -> EvalResult<> {
            Jump(g.target);
            return {};
        },

        [&](const term::SwitchInt& s) -> EvalResult<> {
            auto v = MIRV_TRY(EvalOperand(s.discr));
            auto& scalar = v.imm().first();
            if (not std::holds_alternative<APInt>(scalar))
                return InternalError("Cannot switch on a pointer");

            auto& bits = std::get<APInt>(scalar);
            for (auto& [value, target] : s.targets) {
                if (value.zextOrTrunc(bits.getBitWidth()) == bits) {
                    Jump(target);
                    return {};
                }
            }

            if (not s.otherwise) return InternalError("No target for value {}", bits);
            Jump(*s.otherwise);
            return {};
        },

        [&](const term::Call& c) -> EvalResult<> { return Call(c); },

        [&](const term::Return&) -> EvalResult<> { return Return(); },

        [&](const term::Drop& d) -> EvalResult<> {
            auto place = MIRV_TRY(EvalPlace(d.place));
            return Drop(place, d.target);
        },

        [&](const term::Unreachable&) -> EvalResult<> {
            return Violation(ViolationKind::ReachedUnreachable, 0, 0, "entered unreachable code");
        },

        [&](const term::Resume&) -> EvalResult<> {
            auto& f = frames.back();
            if (not f.caught) return InternalError("Resume in '{}' without a caught abort", f.proc->name());
            auto e = std::move(*f.caught);
            f.caught.reset();
            return std::unexpected(std::move(e));
        },

        [&](const term::Abort& a) -> EvalResult<> {
            return std::unexpected(EvalError::Abort(a.message));
        },
    }, t.kind);
}

// ============================================================================
//  Calls
// ============================================================================
auto Machine::Call(const term::Call& c) -> EvalResult<> {
    StringRef name;
    if (
        c.callee.kind() == Operand::Kind::Const and
        std::holds_alternative<Constant::ProcRef>(c.callee.constant().value)
    ) {
        name = std::get<Constant::ProcRef>(c.callee.constant().value).name;
    } else {
        auto callee = MIRV_TRY(EvalOperand(c.callee));
        auto ptr = std::visit(utils::Overloaded{
            [](const APInt& i) { return Pointer::Wild(i.getZExtValue()); },
            [](const Pointer& p) { return p; },
        }, callee.imm().first());
        name = MIRV_TRY(mem.fn_ptr_target(ptr));
    }

    SmallVector<Value, 4> args;
    for (auto& a : c.args) args.push_back(MIRV_TRY(EvalOperand(a)));
    auto dest = MIRV_TRY(EvalPlace(c.dest));

    // Calls to procedures in the module push a new frame.
    if (auto proc = mod.proc(name)) {
        if (proc->arg_count() != args.size()) return InternalError(
            "'{}' takes {} arguments, but {} were provided",
            name,
            proc->arg_count(),
            args.size()
        );

        MIRV_TRY(PushFrame(*proc, Frame::Kind::Call, args, dest));
        auto& f = frames.back();
        f.ret_block = c.target;
        f.unwind_block = c.unwind;
        return {};
    }

    // Everything else is handled by the host.
    auto res = MIRV_TRY(foreign.call(*this, name, args, dest.type));
    auto Continue = [&]() -> EvalResult<> {
        if (not c.target) return Violation(
            ViolationKind::ReachedUnreachable,
            0,
            0,
            "'{}' returned, but the call has no return target",
            name
        );

        Jump(*c.target);
        return {};
    };

    return std::visit(utils::Overloaded{
        [&](const Value& v) -> EvalResult<> {
            MIRV_TRY(write_value(dest, v));
            return Continue();
        },

        [&](const Effect& e) -> EvalResult<> {
            switch (e.kind) {
                case Effect::Kind::Panic: {
                    auto err = EvalError::Abort(e.message);
                    if (not c.unwind) return std::unexpected(std::move(err));

                    // There is no frame to unwind; land in the handler directly.
                    frames.back().caught = std::move(err);
                    Jump(*c.unwind);
                    return {};
                }

                case Effect::Kind::Exit:
                    return std::unexpected(EvalError::Exit(e.code));

                case Effect::Kind::None:
                    if (not layouts.layout_of(dest.type).is_zst())
                        return InternalError("'{}' returned no value, but '{}' was expected", name, dest.type);
                    MIRV_TRY(write_value(dest, Value::Zst(dest.type)));
                    return Continue();
            }

            Unreachable();
        },
    }, res);
}

auto Machine::Return() -> EvalResult<> {
    auto idx = u32(frames.size() - 1);
    auto ret_ty = frames[idx].proc->ret_type();
    auto val = MIRV_TRY(read_value(Place{ret_ty, LocalPlace{idx, 0}}));

    auto& f = frames.back();
    switch (f.kind) {
        case Frame::Kind::Entry: {
            // Copy aggregates out of the frame before it goes away.
            if (val.is_mem()) {
                auto& l = layouts.layout_of(ret_ty);
                auto id = MIRV_TRY(mem.allocate(l.size, l.align, AllocKind::Static));
                MIRV_TRY(mem.copy(val.mem().ptr, Pointer::To(id), l.size, l.align));
                val = Value{ret_ty, MemPlace{Pointer::To(id)}};
            }

            result = std::move(val);
            return PopFrame();
        }

        case Frame::Kind::Call: {
            auto ret_place = *f.ret_place;
            auto target = f.ret_block;
            auto name = f.proc->name();
            MIRV_TRY(write_value(ret_place, val));
            MIRV_TRY(PopFrame());
            if (not target) return Violation(
                ViolationKind::ReachedUnreachable,
                0,
                0,
                "'{}' returned, but the call has no return target",
                name
            );

            Jump(*target);
            return {};
        }

        case Frame::Kind::StaticInit: {
            auto id = f.static_alloc;
            bool freeze = f.freeze_static;
            MIRV_TRY(write_value(*f.ret_place, val));
            MIRV_TRY(PopFrame());
            if (freeze) mem.freeze(id);
            return {};
        }

        case Frame::Kind::DropFn:
            MIRV_TRY(PopFrame());
            return FinishDrops();
    }

    Unreachable();
}
