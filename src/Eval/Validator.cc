#include <mirv/Eval/Validator.hh>

using namespace mirv;
using namespace mirv::eval;

auto Validator::Resolve(Pointer ptr) const -> EvalResult<ResolvedAccess> {
    if (not ptr.is_wild()) {
        if (ptr.alloc == 0 or ptr.alloc > mem.allocs.size()) return Violation(
            ViolationKind::OutOfBounds,
            ptr.alloc,
            ptr.offset,
            "pointer into unknown allocation"
        );

        return ResolvedAccess{mem.allocs[ptr.alloc - 1].get(), u64(ptr.offset)};
    }

    // Find the allocation that starts at or before this address.
    auto addr = u64(ptr.offset);
    auto it = mem.by_address.upper_bound(addr);
    if (it == mem.by_address.begin()) {
        if (addr == 0) return Violation(ViolationKind::OutOfBounds, 0, 0, "null pointer dereference");
        return Violation(ViolationKind::OutOfBounds, 0, i64(addr), "address {:#x} is not in any allocation", addr);
    }

    --it;
    auto& a = *mem.allocs[it->second - 1];
    auto end = a.base + std::max<u64>(a.size.bytes(), 1);
    if (addr >= end) return Violation(
        ViolationKind::OutOfBounds,
        0,
        i64(addr),
        "address {:#x} is not in any allocation",
        addr
    );

    return ResolvedAccess{&a, addr - a.base};
}

auto Validator::check(
    Pointer ptr,
    Size len,
    Align align,
    Access access,
    ExtraCheck extra
) const -> EvalResult<ResolvedAccess> {
    auto res = MIRV_TRY(Resolve(ptr));
    auto& a = *res.alloc;
    auto off = i64(res.offset);

    // 1. Liveness.
    if (not a.is_live) return Violation(
        ViolationKind::UseAfterFree,
        a.id,
        off,
        "{} allocation was freed",
        Name(a.kind)
    );

    if (a.kind == AllocKind::Function and access != Access::Inbounds) return Violation(
        ViolationKind::DerefFunctionPointer,
        a.id,
        off,
        "pointer to '{}'",
        a.fn_name
    );

    // 2. Bounds. Pointer offsets may be negative or past the end
    // while they are not used.
    if (off < 0 or len.bytes() > a.size.bytes() or u64(off) > a.size.bytes() - len.bytes()) return Violation(
        ViolationKind::OutOfBounds,
        a.id,
        off,
        "access of {} bytes, but the allocation has {}",
        len.bytes(),
        a.size.bytes()
    );

    // 3. Alignment.
    if (mem.check_alignment and access != Access::Inbounds) {
        auto addr = a.base + u64(off);
        if (addr % align.value().bytes() != 0) return Violation(
            ViolationKind::Unaligned,
            a.id,
            off,
            "address {:#x} is not aligned to {}",
            addr,
            align.value().bytes()
        );
    }

    // 4. Initialisation or mutability.
    if (access == Access::Read and len.bytes() != 0) {
        auto first = a.init.find_first_unset_in(unsigned(off), unsigned(u64(off) + len.bytes()));
        if (first != -1) return Violation(
            ViolationKind::UninitializedRead,
            a.id,
            i64(first),
            "byte {} is uninitialised",
            first
        );
    }

    if (access == Access::Write and not a.is_mutable) return Violation(
        ViolationKind::WriteToReadOnly,
        a.id,
        off,
        "{} allocation is read-only",
        Name(a.kind)
    );

    // 5. Whatever else the caller wants to check.
    if (extra) MIRV_TRY(extra(a, u64(off)));

    // 6. Provenance.
    if (ptr.is_wild()) return Violation(
        ViolationKind::ProvenanceMismatch,
        a.id,
        off,
        "pointer created from the integer {:#x}",
        u64(ptr.offset)
    );

    if (*ptr.tag != ptr.alloc) return Violation(
        ViolationKind::ProvenanceMismatch,
        a.id,
        off,
        "pointer derived from alloc{}",
        *ptr.tag
    );

    return res;
}
