#include <mirv/Eval/Machine.hh>

#include <llvm/Support/MathExtras.h>

using namespace mirv;
using namespace mirv::eval;

// ============================================================================
//  Helpers
// ============================================================================
namespace {
/// Check whether 'v' lies in '[start, start + count)'.
bool InRange(const APInt& v, u64 start, u64 count) {
    if (v.getActiveBits() > 64) return false;
    auto x = v.getZExtValue();
    return x >= start and x - start < count;
}

/// Map the raw bits of an enum’s tag to a variant index.
auto DecodeTag(const Layout& l, const APInt& bits, Pointer at) -> EvalResult<u32> {
    auto e = cast<EnumType>(l.type);
    auto& tag = l.tag;
    switch (tag.encoding) {
        case TagEncoding::None:
            if (e->variants().size() == 1) return 0;
            break;

        case TagEncoding::Direct: {
            auto value = tag.scalar.is_signed ? bits.getSExtValue() : i64(bits.getZExtValue());
            if (auto v = e->find_variant(value)) return *v;
            return Violation(
                ViolationKind::InvalidDiscriminant,
                at.alloc,
                at.offset,
                "{} is not a valid discriminant for '{}'",
                value,
                e->name()
            );
        }

        case TagEncoding::Niche: {
            u64 count = u64(tag.niche_last - tag.niche_first + 1);
            if (InRange(bits, tag.niche_start, count)) {
                auto v = tag.niche_first + u32(bits.getZExtValue() - tag.niche_start);
                if (v != tag.untagged_variant) return v;
            } else if (not l.niche or not InRange(bits, l.niche->start, l.niche->available)) {
                return tag.untagged_variant;
            }

            return Violation(
                ViolationKind::InvalidDiscriminant,
                at.alloc,
                at.offset,
                "{} does not encode a variant of '{}'",
                llvm::toString(bits, 10, false),
                e->name()
            );
        }
    }

    return Violation(
        ViolationKind::InvalidDiscriminant,
        at.alloc,
        at.offset,
        "'{}' has no variants",
        e->name()
    );
}

/// Check the raw bits of one scalar of a value.
auto ValidateScalar(
    const Layout& l,
    const ScalarLayout& s,
    Size offset,
    const APInt& bits,
    Pointer at
) -> EvalResult<> {
    if (not s.valid(bits)) {
        switch (s.validity) {
            case ScalarValidity::Bool: return Violation(
                ViolationKind::InvalidBool,
                at.alloc,
                at.offset,
                "{} is not a valid bool",
                llvm::toString(bits, 10, false)
            );

            case ScalarValidity::Char: return Violation(
                ViolationKind::InvalidChar,
                at.alloc,
                at.offset,
                "{:#x} is not a valid char",
                bits.getZExtValue()
            );

            // Null references are only diagnosed when they are used.
            case ScalarValidity::NonNull:
            case ScalarValidity::Any:
                break;
        }
    }

    if (isa<EnumType>(l.type) and l.tag.offset == offset) MIRV_TRY(DecodeTag(l, bits, at));
    return {};
}

/// Check that an immediate is a valid value of its type.
auto ValidateImmediate(const Layout& l, const Immediate& imm) -> EvalResult<> {
    auto Check = [&](const ScalarLayout& s, Size offset, const Scalar& v) -> EvalResult<> {
        // A pointer with provenance is never part of a niche.
        if (auto ptr = std::get_if<Pointer>(&v); ptr and not ptr->is_wild()) return {};
        auto bits = std::visit(utils::Overloaded{
            [](const APInt& i) { return i; },
            [&](const Pointer& p) { return APInt(unsigned(s.size.bits()), u64(p.offset)); },
        }, v);
        return ValidateScalar(l, s, offset, bits, Pointer());
    };

    switch (l.abi) {
        case Abi::Scalar:
            return Check(l.first, Size(), imm.first());

        case Abi::ScalarPair:
            MIRV_TRY(Check(l.first, Size(), imm.first()));
            return Check(l.second, l.second_offset, imm.second());

        case Abi::Aggregate:
            return {};
    }

    Unreachable();
}
} // namespace

// ============================================================================
//  Locals and Temporaries
// ============================================================================
auto Machine::Slot(LocalPlace l) -> LocalSlot& {
    return frames[l.frame].locals[l.local];
}

auto Machine::ForceAllocate(LocalPlace lp) -> EvalResult<MemPlace> {
    auto& slot = Slot(lp);
    if (auto i = std::get_if<LocalSlot::Indirect>(&slot.state)) return MemPlace{Pointer::To(i->alloc)};
    if (auto d = std::get_if<LocalSlot::Dead>(&slot.state)) return Violation(
        ViolationKind::UseAfterFree,
        d->last_alloc,
        0,
        "local _{} is not live",
        lp.local
    );

    auto ty = frames[lp.frame].proc->local(lp.local).type;
    auto& l = layouts.layout_of(ty);
    auto id = MIRV_TRY(mem.allocate(l.size, l.align, AllocKind::Stack));
    MemPlace m{Pointer::To(id)};
    auto& direct = std::get<LocalSlot::Direct>(slot.state);
    if (direct.value) MIRV_TRY(WriteImmediate(m, *direct.value, l));
    slot.state = LocalSlot::Indirect{id};
    return m;
}

auto Machine::Temporary(Type ty) -> EvalResult<MemPlace> {
    auto& l = layouts.layout_of(ty);
    auto id = MIRV_TRY(mem.allocate(l.size, l.align, AllocKind::Stack));
    temps.push_back(id);
    return MemPlace{Pointer::To(id)};
}

auto Machine::ToMem(const Place& p) -> EvalResult<MemPlace> {
    if (auto m = p.mem()) return *m;
    return ForceAllocate(*p.local());
}

// ============================================================================
//  Places
// ============================================================================
auto Machine::EvalPlace(const PlaceExpr& p) -> EvalResult<Place> {
    auto idx = u32(frames.size() - 1);
    Place place{frames[idx].proc->local(p.local).type, LocalPlace{idx, p.local}};
    for (auto proj : p.projections) place = MIRV_TRY(Project(place, proj));
    return place;
}

auto Machine::Project(const Place& base, Projection proj) -> EvalResult<Place> {
    switch (proj.kind) {
        case Projection::Kind::Deref: {
            auto ptr_ty = dyn_cast<PtrType>(base.type);
            if (not ptr_ty) return InternalError("Cannot dereference a value of type '{}'", base.type);
            auto v = MIRV_TRY(read_value(base));
            auto& imm = v.imm();
            MemPlace m{std::visit(utils::Overloaded{
                [](const APInt& i) { return Pointer::Wild(i.getZExtValue()); },
                [](const Pointer& p) { return p; },
            }, imm.first())};

            if (ptr_ty->is_fat()) m.len = std::get<APInt>(imm.second()).getZExtValue();
            return Place{ptr_ty->elem(), m};
        }

        case Projection::Kind::Field: {
            auto m = MIRV_TRY(ToMem(base));
            auto& l = layouts.layout_of(base.type);
            Type field;
            Size offset;
            if (auto e = dyn_cast<EnumType>(base.type)) {
                if (not base.variant) return InternalError("Field access on enum '{}' without a downcast", e->name());
                auto fields = e->variants()[*base.variant].fields;
                if (proj.index >= fields.size()) return InternalError("Variant has no field {}", proj.index);
                field = fields[proj.index];
                offset = l.variants[*base.variant].field_offsets[proj.index];
            } else if (auto t = dyn_cast<TupleType>(base.type)) {
                if (proj.index >= t->fields().size()) return InternalError("'{}' has no field {}", base.type, proj.index);
                field = t->fields()[proj.index];
                offset = l.field_offset(proj.index);
            } else if (auto s = dyn_cast<StructType>(base.type)) {
                if (proj.index >= s->fields().size()) return InternalError("'{}' has no field {}", base.type, proj.index);
                field = s->fields()[proj.index].type;
                offset = l.field_offset(proj.index);
            } else {
                return InternalError("Cannot access fields of '{}'", base.type);
            }

            return Place{field, MemPlace{m.ptr + offset}};
        }

        case Projection::Kind::Index:
        case Projection::Kind::ConstantIndex: {
            u64 i = proj.index;
            if (proj.kind == Projection::Kind::Index) {
                auto idx = u32(frames.size() - 1);
                auto& local = frames[idx].proc->local(proj.index);
                auto v = MIRV_TRY(read_value(Place{local.type, LocalPlace{idx, proj.index}}));
                i = v.int_value().getZExtValue();
            }

            auto m = MIRV_TRY(ToMem(base));
            auto& l = layouts.layout_of(base.type);
            Type elem;
            u64 count;
            if (auto a = dyn_cast<ArrayType>(base.type)) {
                elem = a->elem();
                count = a->dimension();
            } else if (auto s = dyn_cast<SliceType>(base.type)) {
                if (not m.len) return InternalError("Slice place without a length");
                elem = s->elem();
                count = *m.len;
            } else {
                return InternalError("Cannot index into '{}'", base.type);
            }

            i64 offset = 0;
            if (
                i >= count or
                i > u64(std::numeric_limits<i64>::max()) or
                llvm::MulOverflow(i64(l.stride.bytes()), i64(i), offset)
            ) return Violation(
                ViolationKind::OutOfBounds,
                m.ptr.alloc,
                m.ptr.offset,
                "index {} is out of bounds for length {}",
                i,
                count
            );

            return Place{elem, MemPlace{m.ptr + offset}};
        }

        case Projection::Kind::Downcast: {
            auto e = dyn_cast<EnumType>(base.type);
            if (not e or proj.index >= e->variants().size())
                return InternalError("Cannot downcast '{}' to variant {}", base.type, proj.index);
            auto p = base;
            p.variant = proj.index;
            return p;
        }
    }

    Unreachable();
}

// ============================================================================
//  Reading and Writing
// ============================================================================
auto Machine::ReadImmediate(const MemPlace& m, const Layout& l) -> EvalResult<Immediate> {
    switch (l.abi) {
        case Abi::Scalar: {
            auto s = MIRV_TRY(mem.read_scalar(m.ptr, l.first, l.align, [&](const APInt& bits) {
                return ValidateScalar(l, l.first, Size(), bits, m.ptr);
            }));
            return Immediate{std::move(s)};
        }

        case Abi::ScalarPair: {
            auto a = MIRV_TRY(mem.read_scalar(m.ptr, l.first, l.align, [&](const APInt& bits) {
                return ValidateScalar(l, l.first, Size(), bits, m.ptr);
            }));

            auto at = m.ptr + l.second_offset;
            auto b = MIRV_TRY(mem.read_scalar(at, l.second, Align(1), [&](const APInt& bits) {
                return ValidateScalar(l, l.second, l.second_offset, bits, at);
            }));

            return Immediate{std::move(a), std::move(b)};
        }

        case Abi::Aggregate:
            if (l.is_zst()) return Immediate{};
            return InternalError("Aggregate '{}' cannot be read as an immediate", l.type);
    }

    Unreachable();
}

auto Machine::WriteImmediate(const MemPlace& m, const Immediate& imm, const Layout& l) -> EvalResult<> {
    switch (l.abi) {
        case Abi::Scalar:
            return mem.write_scalar(m.ptr, imm.first(), l.first, l.align);

        case Abi::ScalarPair:
            MIRV_TRY(mem.write_scalar(m.ptr, imm.first(), l.first, l.align));
            return mem.write_scalar(m.ptr + l.second_offset, imm.second(), l.second, Align(1));

        case Abi::Aggregate:
            if (l.is_zst()) return mem.check_inbounds(m.ptr, Size());
            return InternalError("Cannot write an immediate to aggregate '{}'", l.type);
    }

    Unreachable();
}

auto Machine::read_value(const Place& place) -> EvalResult<Value> {
    auto& l = layouts.layout_of(place.type);
    if (auto lp = place.local()) {
        auto& slot = Slot(*lp);
        if (auto d = std::get_if<LocalSlot::Dead>(&slot.state)) return Violation(
            ViolationKind::UseAfterFree,
            d->last_alloc,
            0,
            "local _{} is not live",
            lp->local
        );

        if (auto d = std::get_if<LocalSlot::Direct>(&slot.state)) {
            if (l.is_zst()) return Value::Zst(place.type);
            if (not d->value) return Violation(
                ViolationKind::UninitializedRead,
                0,
                0,
                "local _{} is uninitialised",
                lp->local
            );

            return Value{place.type, *d->value};
        }

        auto id = std::get<LocalSlot::Indirect>(slot.state).alloc;
        return read_value(Place{place.type, MemPlace{Pointer::To(id)}});
    }

    auto& m = *place.mem();
    if (l.abi == Abi::Aggregate and not l.is_zst()) {
        MIRV_TRY(mem.check_inbounds(m.ptr, l.size));
        return Value{place.type, m};
    }

    if (l.is_zst()) {
        MIRV_TRY(mem.check_inbounds(m.ptr, Size()));
        return Value::Zst(place.type);
    }

    return Value{place.type, MIRV_TRY(ReadImmediate(m, l))};
}

auto Machine::write_value(const Place& place, const Value& value) -> EvalResult<> {
    auto& l = layouts.layout_of(place.type);
    if (auto lp = place.local()) {
        auto& slot = Slot(*lp);
        if (auto d = std::get_if<LocalSlot::Dead>(&slot.state)) return Violation(
            ViolationKind::UseAfterFree,
            d->last_alloc,
            0,
            "local _{} is not live",
            lp->local
        );

        if (auto d = std::get_if<LocalSlot::Direct>(&slot.state)) {
            if (value.is_mem()) {
                d->value = MIRV_TRY(ReadImmediate(value.mem(), l));
            } else {
                MIRV_TRY(ValidateImmediate(l, value.imm()));
                d->value = value.imm();
            }
        } else {
            auto id = std::get<LocalSlot::Indirect>(slot.state).alloc;
            MIRV_TRY(write_value(Place{place.type, MemPlace{Pointer::To(id)}}, value));
        }

        // 'write_value' may have moved the slot.
        Slot(*lp).drop_flag = true;
        return {};
    }

    auto& m = *place.mem();
    if (value.is_mem()) return mem.copy(value.mem().ptr, m.ptr, l.size, l.align);
    return WriteImmediate(m, value.imm(), l);
}

// ============================================================================
//  Discriminants
// ============================================================================
auto Machine::ReadDiscriminant(const Place& p) -> EvalResult<u32> {
    if (not isa<EnumType>(p.type)) return InternalError("'{}' has no discriminant", p.type);
    auto& l = layouts.layout_of(p.type);
    if (l.tag.encoding == TagEncoding::None) return DecodeTag(l, APInt(), Pointer());

    // Enums that are held in a frame are immediates.
    auto v = MIRV_TRY(read_value(p));
    if (not v.is_mem()) {
        auto& imm = v.imm();
        auto& s = l.tag.offset == Size() ? imm.first() : imm.second();
        return std::visit(utils::Overloaded{
            [&](const APInt& bits) { return DecodeTag(l, bits, Pointer()); },
            [&](const Pointer& ptr) -> EvalResult<u32> {
                if (ptr.is_wild()) return DecodeTag(l, APInt(64, u64(ptr.offset)), Pointer());
                return l.tag.untagged_variant;
            },
        }, s);
    }

    std::optional<u32> variant;
    auto at = v.mem().ptr + l.tag.offset;
    auto s = MIRV_TRY(mem.read_scalar(at, l.tag.scalar, Align(1), [&](const APInt& bits) -> EvalResult<> {
        variant = MIRV_TRY(DecodeTag(l, bits, at));
        return {};
    }));

    // A pointer with provenance is never part of a niche.
    if (not variant) {
        Assert(std::holds_alternative<Pointer>(s));
        return l.tag.untagged_variant;
    }

    return *variant;
}

auto Machine::WriteDiscriminant(const Place& p, u32 variant) -> EvalResult<> {
    auto e = dyn_cast<EnumType>(p.type);
    if (not e) return InternalError("'{}' has no discriminant", p.type);
    if (variant >= e->variants().size()) return Violation(
        ViolationKind::InvalidDiscriminant,
        0,
        0,
        "'{}' has no variant {}",
        e->name(),
        variant
    );

    auto& l = layouts.layout_of(p.type);
    APInt tag;
    switch (l.tag.encoding) {
        case TagEncoding::None:
            return {};

        case TagEncoding::Direct:
            tag = APInt(unsigned(l.tag.scalar.size.bits()), u64(e->variants()[variant].discriminant), true);
            break;

        case TagEncoding::Niche:
            if (variant == l.tag.untagged_variant) return {};
            tag = APInt(unsigned(l.tag.scalar.size.bits()), l.tag.niche_start + (variant - l.tag.niche_first));
            break;
    }

    Scalar s = l.tag.scalar.is_pointer ? Scalar{Pointer::Wild(tag.getZExtValue())} : Scalar{std::move(tag)};
    auto m = MIRV_TRY(ToMem(p));
    return mem.write_scalar(m.ptr + l.tag.offset, s, l.tag.scalar, Align(1));
}

// ============================================================================
//  Operands
// ============================================================================
auto Machine::EvalConstant(const Constant& c) -> EvalResult<Value> {
    auto& l = layouts.layout_of(c.type);
    return std::visit(utils::Overloaded{
        [&](std::monostate) -> EvalResult<Value> {
            if (not l.is_zst()) return InternalError("Missing value for constant of type '{}'", c.type);
            return Value::Zst(c.type);
        },

        [&](const APInt& i) -> EvalResult<Value> {
            if (l.abi != Abi::Scalar) return InternalError("Integer constant of type '{}'", c.type);
            if (l.first.is_pointer) return Value{c.type, Immediate{Pointer::Wild(i.getZExtValue())}};
            auto bits = unsigned(l.first.size.bits());
            return Value::Int(c.type, l.first.is_signed ? i.sextOrTrunc(bits) : i.zextOrTrunc(bits));
        },

        [&](const Constant::ProcRef& p) -> EvalResult<Value> {
            return Value{c.type, Immediate{mem.create_fn_ptr(p.name)}};
        },

        [&](const Constant::StaticRef& s) -> EvalResult<Value> {
            auto it = statics.find(s.name);
            if (it == statics.end()) return InternalError("No static named '{}'", s.name);
            return Value{c.type, Immediate{Pointer::To(it->second)}};
        },

        [&](const Constant::Bytes& b) -> EvalResult<Value> {
            if (not byte_strings.count(b.data)) {
                auto new_id = MIRV_TRY(mem.allocate(Size::Bytes(b.data.size()), Align(1), AllocKind::Static));
                ArrayRef<u8> data{reinterpret_cast<const u8*>(b.data.data()), b.data.size()};
                MIRV_TRY(mem.write_bytes(Pointer::To(new_id), data));
                mem.freeze(new_id);
                byte_strings[b.data] = new_id;
            }

            auto ptr = Pointer::To(byte_strings[b.data]);
            if (l.abi != Abi::ScalarPair) return Value{c.type, Immediate{ptr}};
            auto len = APInt(unsigned(l.second.size.bits()), b.data.size());
            return Value{c.type, Immediate{ptr, std::move(len)}};
        },
    }, c.value);
}

auto Machine::EvalOperand(const Operand& op) -> EvalResult<Value> {
    if (op.kind() == Operand::Kind::Const) return EvalConstant(op.constant());
    auto place = MIRV_TRY(EvalPlace(op.place()));
    auto v = MIRV_TRY(read_value(place));

    // Moving out of a local means it no longer needs to be dropped.
    if (op.kind() == Operand::Kind::Move)
        if (auto lp = place.local())
            Slot(*lp).drop_flag = false;

    return v;
}
