#include <mirv/Eval/Machine.hh>

using namespace mirv;
using namespace mirv::eval;

auto Machine::Drop(const Place& p, BlockId target) -> EvalResult<> {
    if (auto lp = p.local()) {
        auto& slot = Slot(*lp);
        if (not slot.drop_flag) {
            Jump(target);
            return {};
        }

        slot.drop_flag = false;
    }

    if (not p.type->needs_drop()) {
        Jump(target);
        return {};
    }

    auto& f = frames.back();
    f.drops.push_back(DropItem{DropItem::Kind::DropValue, p});
    f.drop_target = target;
    return {};
}

auto Machine::FinishDrops() -> EvalResult<> {
    auto& f = frames.back();
    if (not f.drops.empty()) return {};
    if (f.unwinding) return Unwind();
    if (f.drop_target) {
        auto target = *f.drop_target;
        f.drop_target.reset();
        Jump(target);
    }
    return {};
}

/// Run one piece of drop glue.
///
/// Dropping a value first calls the drop procedure of its type, if
/// there is one, then drops its fields in declaration order. Boxes
/// drop their contents and then free the heap allocation.
auto Machine::StepDrop() -> EvalResult<> {
    auto idx = frames.size() - 1;
    auto item = frames[idx].drops.pop_back_val();
    SmallVector<DropItem, 8> work;
    auto DropField = [&](Place field) {
        if (field.type->needs_drop()) work.push_back(DropItem{DropItem::Kind::DropValue, std::move(field)});
    };

    switch (item.kind) {
        case DropItem::Kind::Dealloc: {
            auto v = MIRV_TRY(read_value(item.place));
            auto ptr = std::visit(utils::Overloaded{
                [](const APInt& i) { return Pointer::Wild(i.getZExtValue()); },
                [](const Pointer& p) { return p; },
            }, v.imm().first());
            MIRV_TRY(mem.deallocate(ptr, AllocKind::Heap));
        } break;

        case DropItem::Kind::CallDropFn: {
            auto proc = mod.proc(item.drop_proc);
            if (not proc or proc->arg_count() != 1)
                return InternalError("'{}' is not a valid drop procedure", item.drop_proc);

            auto m = MIRV_TRY(ToMem(item.place));
            Value arg{proc->args().front().type, Immediate{m.ptr}};
            return PushFrame(*proc, Frame::Kind::DropFn, arg, std::nullopt);
        }

        case DropItem::Kind::DropValue: {
            auto& p = item.place;
            StringRef drop_proc;
            if (auto ptr = dyn_cast<PtrType>(p.type); ptr and ptr->ptr_kind() == PtrKind::Box) {
                auto pointee = MIRV_TRY(Project(p, Projection::Deref()));
                DropField(std::move(pointee));
                work.push_back(DropItem{DropItem::Kind::Dealloc, p});
            } else if (auto s = dyn_cast<StructType>(p.type)) {
                drop_proc = s->drop_proc();
                for (u32 i = 0; i < s->fields().size(); i++)
                    DropField(MIRV_TRY(Project(p, Projection::Field(i))));
            } else if (auto t = dyn_cast<TupleType>(p.type)) {
                for (u32 i = 0; i < t->fields().size(); i++)
                    DropField(MIRV_TRY(Project(p, Projection::Field(i))));
            } else if (auto a = dyn_cast<ArrayType>(p.type)) {
                if (a->elem()->needs_drop())
                    for (u64 i = 0; i < a->dimension(); i++)
                        DropField(MIRV_TRY(Project(p, Projection::ConstantIndex(u32(i)))));
            } else if (auto sl = dyn_cast<SliceType>(p.type)) {
                auto m = MIRV_TRY(ToMem(p));
                if (sl->elem()->needs_drop() and m.len)
                    for (u64 i = 0; i < *m.len; i++)
                        DropField(MIRV_TRY(Project(p, Projection::ConstantIndex(u32(i)))));
            } else if (auto e = dyn_cast<EnumType>(p.type)) {
                drop_proc = e->drop_proc();
                auto variant = MIRV_TRY(ReadDiscriminant(p));
                auto down = p;
                down.variant = variant;
                for (u32 i = 0; i < e->variants()[variant].fields.size(); i++)
                    DropField(MIRV_TRY(Project(down, Projection::Field(i))));
            }

            if (not drop_proc.empty())
                work.insert(work.begin(), DropItem{DropItem::Kind::CallDropFn, p, drop_proc});
        } break;
    }

    // 'work' is in execution order; the last item on the stack runs first.
    auto& drops = frames[idx].drops;
    drops.append(work.rbegin(), work.rend());
    return FinishDrops();
}
