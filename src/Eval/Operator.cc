#include <mirv/Eval/Machine.hh>

#include <llvm/Support/MathExtras.h>

using namespace mirv;
using namespace mirv::eval;

namespace {
bool IsSigned(Type ty) {
    auto i = dyn_cast<IntType>(ty);
    return i and i->signed_();
}

auto AsPointer(const Scalar& s) -> Pointer {
    return std::visit(utils::Overloaded{
        [](const APInt& i) { return Pointer::Wild(i.getZExtValue()); },
        [](const Pointer& p) { return p; },
    }, s);
}

auto Overflow(StringRef what) -> std::unexpected<EvalError> {
    return Violation(ViolationKind::ArithmeticOverflow, 0, 0, "{}", what);
}

/// Check that a value is valid for the scalar it is about to become.
auto CheckValidity(const ScalarLayout& s, const APInt& v) -> EvalResult<> {
    if (s.valid(v)) return {};
    switch (s.validity) {
        case ScalarValidity::Bool:
            return Violation(ViolationKind::InvalidBool, 0, 0, "{} is not a valid bool", llvm::toString(v, 10, false));
        case ScalarValidity::Char:
            return Violation(ViolationKind::InvalidChar, 0, 0, "{:#x} is not a valid char", v.getZExtValue());
        case ScalarValidity::NonNull:
        case ScalarValidity::Any:
            return {};
    }
    Unreachable();
}
} // namespace

// ============================================================================
//  Arithmetic
// ============================================================================
auto Machine::Binary(BinOp op, const Value& lhs, const Value& rhs, Type ty) -> EvalResult<Value> {
    auto Bool = [&](bool b) {
        auto bits = unsigned(layouts.layout_of(ty).first.size.bits());
        return Value::Int(ty, APInt(bits, b));
    };

    if (op == BinOp::Offset) {
        auto ptr_ty = dyn_cast<PtrType>(lhs.type());
        if (not ptr_ty) return InternalError("Offset on non-pointer type '{}'", lhs.type());
        auto elem = layouts.layout_of(ptr_ty->elem()).size;
        auto& n = rhs.int_value();
        auto count = IsSigned(rhs.type()) ? n.getSExtValue() : i64(n.getZExtValue());
        auto ptr = AsPointer(lhs.imm().first());
        i64 bytes, offset;
        if (
            (not IsSigned(rhs.type()) and n.getActiveBits() > 63) or
            llvm::MulOverflow(count, i64(elem.bytes()), bytes) or
            llvm::AddOverflow(ptr.offset, bytes, offset)
        ) return Violation(
            ViolationKind::ArithmeticOverflow,
            ptr.alloc,
            ptr.offset,
            "offset of {} by {} elements overflows",
            ptr.str(),
            llvm::toString(n, 10, IsSigned(rhs.type()))
        );

        ptr.offset = offset;
        return Value{lhs.type(), Immediate{ptr}};
    }

    // Pointers can only be compared.
    auto& a_s = lhs.imm().first();
    auto& b_s = rhs.imm().first();
    if (std::holds_alternative<Pointer>(a_s) or std::holds_alternative<Pointer>(b_s)) {
        auto a = AsPointer(a_s);
        auto b = AsPointer(b_s);
        i64 x, y;
        if (not a.is_wild() and not b.is_wild() and a.alloc == b.alloc) {
            x = a.offset;
            y = b.offset;
        } else {
            x = i64(mem.address_of(a));
            y = i64(mem.address_of(b));
        }

        switch (op) {
            case BinOp::Eq: return Bool(x == y);
            case BinOp::Ne: return Bool(x != y);
            case BinOp::Lt: return Bool(u64(x) < u64(y));
            case BinOp::Le: return Bool(u64(x) <= u64(y));
            case BinOp::Gt: return Bool(u64(x) > u64(y));
            case BinOp::Ge: return Bool(u64(x) >= u64(y));
            default: return InternalError("Invalid operation on pointers");
        }
    }

    auto& a = lhs.int_value();
    auto& b = rhs.int_value();
    bool sign = IsSigned(lhs.type());
    auto Int = [&](APInt v) { return Value::Int(lhs.type(), std::move(v)); };
    switch (op) {
        case BinOp::Add: return Int(a + b);
        case BinOp::Sub: return Int(a - b);
        case BinOp::Mul: return Int(a * b);

        case BinOp::Div:
        case BinOp::Rem:
            if (b.isZero()) return Overflow(op == BinOp::Div ? "division by zero" : "remainder by zero");
            if (sign and a.isMinSignedValue() and b.isAllOnes()) return Overflow(
                op == BinOp::Div ? "division overflow" : "remainder overflow"
            );

            if (op == BinOp::Div) return Int(sign ? a.sdiv(b) : a.udiv(b));
            return Int(sign ? a.srem(b) : a.urem(b));

        case BinOp::And: return Int(a & b);
        case BinOp::Or: return Int(a | b);
        case BinOp::Xor: return Int(a ^ b);

        case BinOp::Shl:
        case BinOp::Shr: {
            if ((IsSigned(rhs.type()) and b.isNegative()) or b.uge(a.getBitWidth())) return Overflow(std::format(
                "shift by {} is out of range for a {}-bit integer",
                llvm::toString(b, 10, IsSigned(rhs.type())),
                a.getBitWidth()
            ));

            auto amount = unsigned(b.getZExtValue());
            if (op == BinOp::Shl) return Int(a.shl(amount));
            return Int(sign ? a.ashr(amount) : a.lshr(amount));
        }

        case BinOp::Eq: return Bool(a == b);
        case BinOp::Ne: return Bool(a != b);
        case BinOp::Lt: return Bool(sign ? a.slt(b) : a.ult(b));
        case BinOp::Le: return Bool(sign ? a.sle(b) : a.ule(b));
        case BinOp::Gt: return Bool(sign ? a.sgt(b) : a.ugt(b));
        case BinOp::Ge: return Bool(sign ? a.sge(b) : a.uge(b));

        case BinOp::Offset: Unreachable();
    }

    Unreachable();
}

auto Machine::CheckedBinary(BinOp op, const Value& lhs, const Value& rhs, Type ty) -> EvalResult<Value> {
    auto& a = lhs.int_value();
    auto& b = rhs.int_value();
    bool sign = IsSigned(lhs.type());
    bool ov = false;
    APInt res;
    switch (op) {
        case BinOp::Add: res = sign ? a.sadd_ov(b, ov) : a.uadd_ov(b, ov); break;
        case BinOp::Sub: res = sign ? a.ssub_ov(b, ov) : a.usub_ov(b, ov); break;
        case BinOp::Mul: res = sign ? a.smul_ov(b, ov) : a.umul_ov(b, ov); break;
        case BinOp::Shl:
        case BinOp::Shr: {
            auto width = a.getBitWidth();
            ov = (IsSigned(rhs.type()) and b.isNegative()) or b.uge(width);
            auto amount = unsigned(b.urem(u64(width)));
            if (op == BinOp::Shl) res = a.shl(amount);
            else res = sign ? a.ashr(amount) : a.lshr(amount);
        } break;

        default:
            return InternalError("Operation cannot be checked for overflow");
    }

    switch (ctx.opts.overflow) {
        case OverflowPolicy::Flag:
            break;

        case OverflowPolicy::Trap:
            if (ov) return Overflow(std::format(
                "arithmetic overflow in {} {} {}",
                llvm::toString(a, 10, sign),
                op == BinOp::Add ? "+" : op == BinOp::Sub ? "-" : op == BinOp::Mul ? "*" : op == BinOp::Shl ? "<<" : ">>",
                llvm::toString(b, 10, IsSigned(rhs.type()))
            ));
            break;

        case OverflowPolicy::Wrap:
            ov = false;
            break;

        case OverflowPolicy::Saturate:
            if (op == BinOp::Add) res = sign ? a.sadd_sat(b) : a.uadd_sat(b);
            else if (op == BinOp::Sub) res = sign ? a.ssub_sat(b) : a.usub_sat(b);
            else if (op == BinOp::Mul) res = sign ? a.smul_sat(b) : a.umul_sat(b);
            ov = false;
            break;
    }

    auto& l = layouts.layout_of(ty);
    if (l.abi != Abi::ScalarPair) return InternalError("Checked arithmetic must produce a pair, got '{}'", ty);
    auto flag = APInt(unsigned(l.second.size.bits()), ov);
    return Value{ty, Immediate{std::move(res), std::move(flag)}};
}

auto Machine::Unary(UnOp op, const Value& v) -> EvalResult<Value> {
    auto& s = v.imm().first();
    if (not std::holds_alternative<APInt>(s)) return InternalError("Unary operation on a pointer");
    auto& a = std::get<APInt>(s);
    switch (op) {
        case UnOp::Not:
            if (isa<BoolType>(v.type())) return Value::Int(v.type(), a ^ 1);
            return Value::Int(v.type(), ~a);

        case UnOp::Neg: {
            auto r = a;
            r.negate();
            return Value::Int(v.type(), std::move(r));
        }
    }

    Unreachable();
}

// ============================================================================
//  Casts
// ============================================================================
auto Machine::Cast(CastKind kind, const Value& v, Type to) -> EvalResult<Value> {
    auto& l = layouts.layout_of(to);
    switch (kind) {
        case CastKind::IntToInt: {
            auto& s = v.imm().first();
            if (not std::holds_alternative<APInt>(s)) return InternalError("IntToInt cast of a pointer");
            auto& a = std::get<APInt>(s);
            auto bits = unsigned(l.first.size.bits());
            auto r = IsSigned(v.type()) ? a.sextOrTrunc(bits) : a.zextOrTrunc(bits);
            MIRV_TRY(CheckValidity(l.first, r));
            return Value::Int(to, std::move(r));
        }

        case CastKind::PtrToInt: {
            auto ptr = AsPointer(v.imm().first());
            return Value::Int(to, APInt(unsigned(l.first.size.bits()), mem.address_of(ptr)));
        }

        case CastKind::IntToPtr: {
            auto addr = v.int_value().getZExtValue();
            return Value{to, Immediate{Pointer::Wild(addr)}};
        }

        case CastKind::PtrToPtr: {
            auto& imm = v.imm();
            if (l.abi == Abi::Scalar) return Value{to, Immediate{imm.first()}};
            if (not imm.is_pair()) return InternalError("Cannot cast thin pointer '{}' to fat pointer '{}'", v.type(), to);
            return Value{to, imm};
        }

        case CastKind::Transmute: {
            auto& from = layouts.layout_of(v.type());
            if (from.size != l.size) return InternalError(
                "Cannot transmute '{}' ({} bytes) to '{}' ({} bytes)",
                v.type(),
                from.size.bytes(),
                to,
                l.size.bytes()
            );

            auto id = MIRV_TRY(mem.allocate(l.size, std::max(from.align, l.align), AllocKind::Stack));
            temps.push_back(id);
            MemPlace tmp{Pointer::To(id)};
            MIRV_TRY(write_value(Place{v.type(), tmp}, v));
            return read_value(Place{to, tmp});
        }
    }

    Unreachable();
}

// ============================================================================
//  Rvalues
// ============================================================================
auto Machine::EvalRvalue(const Rvalue& value, Type ty) -> EvalResult<Value> {
    auto Reference = [&](const PlaceExpr& pe, bool check) -> EvalResult<Value> {
        auto place = MIRV_TRY(EvalPlace(pe));
        auto m = MIRV_TRY(ToMem(place));
        auto& pl = layouts.layout_of(place.type);
        auto size = m.len ? pl.stride * *m.len : pl.size;
        if (check) MIRV_TRY(mem.check_inbounds(m.ptr, size));

        auto& l = layouts.layout_of(ty);
        if (l.abi != Abi::ScalarPair) return Value{ty, Immediate{m.ptr}};
        if (not m.len) return InternalError("Cannot create a fat pointer to sized type '{}'", place.type);
        return Value{ty, Immediate{m.ptr, APInt(unsigned(l.second.size.bits()), *m.len)}};
    };

    return std::visit(utils::Overloaded{
        [&](const rv::Use& u) { return EvalOperand(u.op); },
        [&](const rv::Ref& r) { return Reference(r.place, true); },
        [&](const rv::AddressOf& a) { return Reference(a.place, false); },

        [&](const rv::Binary& b) -> EvalResult<Value> {
            auto lhs = MIRV_TRY(EvalOperand(b.lhs));
            auto rhs = MIRV_TRY(EvalOperand(b.rhs));
            return Binary(b.op, lhs, rhs, ty);
        },

        [&](const rv::CheckedBinary& b) -> EvalResult<Value> {
            auto lhs = MIRV_TRY(EvalOperand(b.lhs));
            auto rhs = MIRV_TRY(EvalOperand(b.rhs));
            return CheckedBinary(b.op, lhs, rhs, ty);
        },

        [&](const rv::Unary& u) -> EvalResult<Value> {
            auto v = MIRV_TRY(EvalOperand(u.val));
            return Unary(u.op, v);
        },

        [&](const rv::Aggregate& a) -> EvalResult<Value> {
            auto tmp = MIRV_TRY(Temporary(a.type));
            Place base{a.type, tmp};
            if (a.kind == AggregateKind::Enum) base.variant = a.variant;
            for (u32 i = 0; i < a.ops.size(); i++) {
                auto v = MIRV_TRY(EvalOperand(a.ops[i]));
                auto proj = a.kind == AggregateKind::Array ? Projection::ConstantIndex(i) : Projection::Field(i);
                auto field = MIRV_TRY(Project(base, proj));
                MIRV_TRY(write_value(field, v));
            }

            if (a.kind == AggregateKind::Enum) MIRV_TRY(WriteDiscriminant(base, a.variant));
            return read_value(Place{a.type, tmp});
        },

        [&](const rv::Cast& c) -> EvalResult<Value> {
            auto v = MIRV_TRY(EvalOperand(c.op));
            return Cast(c.kind, v, c.to);
        },

        [&](const rv::Len& len) -> EvalResult<Value> {
            auto place = MIRV_TRY(EvalPlace(len.place));
            u64 n;
            if (auto a = dyn_cast<ArrayType>(place.type)) n = a->dimension();
            else if (place.mem() and place.mem()->len) n = *place.mem()->len;
            else return InternalError("Cannot take the length of '{}'", place.type);
            return Value::Int(ty, APInt(unsigned(layouts.layout_of(ty).first.size.bits()), n));
        },

        [&](const rv::Repeat& r) -> EvalResult<Value> {
            auto arr = dyn_cast<ArrayType>(r.type);
            if (not arr) return InternalError("Repeat of non-array type '{}'", r.type);
            auto v = MIRV_TRY(EvalOperand(r.op));
            auto tmp = MIRV_TRY(Temporary(r.type));
            auto stride = layouts.layout_of(r.type).stride;
            for (u64 i = 0; i < arr->dimension(); i++)
                MIRV_TRY(write_value(Place{arr->elem(), MemPlace{tmp.ptr + stride * i}}, v));
            return read_value(Place{r.type, tmp});
        },

        [&](const rv::Discriminant& d) -> EvalResult<Value> {
            auto place = MIRV_TRY(EvalPlace(d.place));
            auto variant = MIRV_TRY(ReadDiscriminant(place));
            auto discr = cast<EnumType>(place.type)->variants()[variant].discriminant;
            auto bits = unsigned(layouts.layout_of(ty).first.size.bits());
            return Value::Int(ty, APInt(bits, u64(discr), true));
        },

        [&](const rv::Box& b) -> EvalResult<Value> {
            auto& l = layouts.layout_of(b.type);
            auto id = MIRV_TRY(mem.allocate(l.size, l.align, AllocKind::Heap));
            return Value{ty, Immediate{Pointer::To(id)}};
        },
    }, value);
}
