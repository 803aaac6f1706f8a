#include <mirv/Eval/Foreign.hh>
#include <mirv/Eval/Machine.hh>

using namespace mirv;
using namespace mirv::eval;

namespace {
auto GetPointer(const Value& v) -> Pointer {
    return std::visit(utils::Overloaded{
        [](const APInt& i) { return Pointer::Wild(i.getZExtValue()); },
        [](const Pointer& p) { return p; },
    }, v.imm().first());
}

auto GetU64(const Value& v) -> u64 {
    return v.int_value().getZExtValue();
}

/// Get the size of an allocation.
auto GetAllocSize(const Value& v) -> EvalResult<Size> {
    auto n = GetU64(v);
    if (n > Memory::MaxSize) return std::unexpected(EvalError::Resource(ResourceKind::MemoryBudget, n, Memory::MaxSize));
    return Size::Bytes(n);
}

auto GetAlign(const Value& v) -> EvalResult<Align> {
    auto a = GetU64(v);
    if (a == 0 or not llvm::isPowerOf2_64(a)) return Violation(
        ViolationKind::InvalidDeallocation,
        0,
        0,
        "{} is not a valid alignment",
        a
    );
    return Align(a);
}
} // namespace

auto BuiltinForeignCalls::call(
    Machine& m,
    StringRef name,
    ArrayRef<Value> args,
    Type ret
) -> EvalResult<ForeignResult> {
    auto& mem = m.memory();
    auto Expect = [&](usz n) -> EvalResult<> {
        if (args.size() == n) return {};
        return InternalError("'{}' takes {} arguments, but {} were provided", name, n, args.size());
    };

    auto Usize = [&](u64 v) {
        auto bits = unsigned(m.layout_service().layout_of(ret).first.size.bits());
        return Value::Int(ret, APInt(bits, v));
    };

    // Read a buffer that the program passed as a pointer and a length.
    auto ReadBuffer = [&](const Value& p, const Value& n) -> EvalResult<SmallVector<u8, 32>> {
        auto ptr = GetPointer(p);
        auto len = GetU64(n);
        if (len > Memory::MaxSize) {
            MIRV_TRY(mem.check_inbounds(ptr, Size()));
            return Violation(
                ViolationKind::OutOfBounds,
                ptr.alloc,
                ptr.offset,
                "access of {} bytes is larger than any allocation",
                len
            );
        }

        return mem.read_bytes(ptr, Size::Bytes(len));
    };

    if (name == "alloc" or name == "alloc_zeroed") {
        MIRV_TRY(Expect(2));
        auto size = MIRV_TRY(GetAllocSize(args[0]));
        auto id = MIRV_TRY(mem.allocate(size, MIRV_TRY(GetAlign(args[1])), AllocKind::Heap));
        auto ptr = Pointer::To(id);
        if (name == "alloc_zeroed") MIRV_TRY(mem.write_repeat(ptr, 0, size));
        return Value{ret, Immediate{ptr}};
    }

    if (name == "dealloc") {
        MIRV_TRY(Expect(3));
        auto ptr = GetPointer(args[0]);
        auto size = GetU64(args[1]);
        MIRV_TRY(GetAlign(args[2]));

        // Check the size only if the pointer is otherwise fine, so
        // that freeing a dead allocation is still a double free.
        if (not ptr.is_wild() and ptr.offset == 0) {
            auto& a = mem.get(ptr.alloc);
            if (a.live() and a.kind == AllocKind::Heap and a.size.bytes() != size) return Violation(
                ViolationKind::InvalidDeallocation,
                a.id,
                0,
                "allocation has size {}, but was freed with size {}",
                a.size.bytes(),
                size
            );
        }

        MIRV_TRY(mem.deallocate(ptr, AllocKind::Heap));
        return Effect::None();
    }

    if (name == "realloc") {
        MIRV_TRY(Expect(4));
        auto align = MIRV_TRY(GetAlign(args[2]));
        auto size = MIRV_TRY(GetAllocSize(args[3]));
        auto ptr = MIRV_TRY(mem.reallocate(GetPointer(args[0]), size, align));
        return Value{ret, Immediate{ptr}};
    }

    if (name == "write") {
        MIRV_TRY(Expect(3));
        auto bytes = MIRV_TRY(ReadBuffer(args[1], args[2]));
        captured.append(bytes.begin(), bytes.end());
        return Usize(bytes.size());
    }

    if (name == "exit") {
        MIRV_TRY(Expect(1));
        return Effect::Exit(args[0].int_value().getSExtValue());
    }

    if (name == "abort") {
        MIRV_TRY(Expect(0));
        return std::unexpected(EvalError::Abort("program called 'abort'", false));
    }

    if (name == "panic") {
        MIRV_TRY(Expect(2));
        auto bytes = MIRV_TRY(ReadBuffer(args[0], args[1]));
        return Effect::Panic(std::string(bytes.begin(), bytes.end()));
    }

    return InternalError("Call to unknown procedure '{}'", name);
}
