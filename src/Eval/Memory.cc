#include <mirv/Eval/Memory.hh>
#include <mirv/Eval/Validator.hh>

#include <llvm/Support/MathExtras.h>

using namespace mirv;
using namespace mirv::eval;

/// Gap between allocations so that off-by-one addresses never land
/// in a neighbouring allocation.
static constexpr u64 AllocationGap = 16;

auto Pointer::str() const -> std::string {
    if (is_wild()) return std::format("{:#x}", u64(offset));
    if (*tag != alloc) return std::format("alloc{}{:+}[tag alloc{}]", alloc, offset, *tag);
    return std::format("alloc{}{:+}", alloc, offset);
}

bool Allocation::initialised(u64 offset, u64 len) const {
    if (len == 0) return true;
    return init.find_first_unset_in(unsigned(offset), unsigned(offset + len)) == -1;
}

// ============================================================================
//  Helpers
// ============================================================================
auto Memory::Get(AllocId id) -> Allocation& {
    Assert(id != 0 and id <= allocs.size(), "Invalid allocation id {}", id);
    return *allocs[id - 1];
}

auto Memory::get(AllocId id) const -> const Allocation& {
    Assert(id != 0 and id <= allocs.size(), "Invalid allocation id {}", id);
    return *allocs[id - 1];
}

auto Memory::DecodeInt(const Allocation& a, u64 offset, Size size) const -> APInt {
    auto n = size.bytes();
    APInt value{unsigned(n * 8), 0};
    for (u64 i = 0; i < n; i++) {
        auto byte = dl.endianness == Endianness::Little ? a.bytes[offset + i] : a.bytes[offset + n - 1 - i];
        value.insertBits(u64(byte), unsigned(i * 8), 8);
    }
    return value;
}

void Memory::EncodeInt(Allocation& a, u64 offset, Size size, const APInt& value) {
    auto n = size.bytes();
    auto v = value.zextOrTrunc(unsigned(n * 8));
    for (u64 i = 0; i < n; i++) {
        auto byte = u8(v.extractBitsAsZExtValue(8, unsigned(i * 8)));
        if (dl.endianness == Endianness::Little) a.bytes[offset + i] = byte;
        else a.bytes[offset + n - 1 - i] = byte;
    }
}

/// Remove every relocation that overlaps '[offset, offset + len)'. Bytes
/// of a pointer that lie outside that range become uninitialised.
void Memory::ClearRelocations(Allocation& a, u64 offset, u64 len) {
    if (len == 0 or a.relocs.empty()) return;
    auto ps = dl.pointer_size.bytes();
    auto it = a.relocs.lower_bound(offset >= ps - 1 ? offset - (ps - 1) : 0);
    while (it != a.relocs.end() and it->first < offset + len) {
        for (u64 b = it->first; b < it->first + ps; b++)
            if (b < offset or b >= offset + len)
                a.init.reset(unsigned(b));
        it = a.relocs.erase(it);
    }
}

void Memory::MarkInit(Allocation& a, u64 offset, u64 len) {
    if (len == 0) return;
    a.init.set(unsigned(offset), unsigned(offset + len));
}

// ============================================================================
//  Allocation and Deallocation
// ============================================================================
auto Memory::allocate(Size size, Align align, AllocKind kind) -> EvalResult<AllocId> {
    Assert(kind != AllocKind::Function, "Use create_fn_ptr() instead");
    if (size.bytes() > MaxSize) return std::unexpected(EvalError::Resource(
        ResourceKind::MemoryBudget,
        size.bytes(),
        MaxSize
    ));

    bool overflow = false;
    auto total = llvm::SaturatingAdd(live_bytes, size.bytes(), &overflow);
    if (overflow or (limit != 0 and total > limit)) return std::unexpected(EvalError::Resource(
        ResourceKind::MemoryBudget,
        total,
        limit != 0 ? limit : MaxSize
    ));

    auto id = AllocId(allocs.size() + 1);
    auto base = Size::Bytes(next_address).align(align).bytes();
    next_address = base + std::max<u64>(size.bytes(), 1) + AllocationGap;
    allocs.push_back(std::unique_ptr<Allocation>(new Allocation(id, kind, size, align, base)));
    by_address[base] = id;
    live_bytes += size.bytes();
    return id;
}

auto Memory::create_fn_ptr(StringRef proc) -> Pointer {
    if (auto it = functions.find(proc); it != functions.end()) return Pointer::To(it->second);
    auto id = AllocId(allocs.size() + 1);
    auto base = next_address;
    next_address += 1 + AllocationGap;
    auto a = std::unique_ptr<Allocation>(new Allocation(id, AllocKind::Function, Size(), Align(1), base));
    a->fn_name = proc.str();
    a->is_mutable = false;
    allocs.push_back(std::move(a));
    by_address[base] = id;
    functions[proc] = id;
    return Pointer::To(id);
}

auto Memory::deallocate(AllocId id, AllocKind kind) -> EvalResult<> {
    auto& a = Get(id);
    if (a.kind != kind) return Violation(
        ViolationKind::AllocationKindMismatch,
        id,
        0,
        "{} allocation freed as {} memory",
        Name(a.kind),
        Name(kind)
    );

    if (not a.is_live) return Violation(ViolationKind::DoubleFree, id, 0, "{} allocation was already freed", Name(a.kind));

    a.is_live = false;
    live_bytes -= a.size.bytes();

    // The contents can never be accessed again.
    SmallVector<u8, 0>().swap(a.bytes);
    a.init.clear();
    a.relocs.clear();
    return {};
}

auto Memory::deallocate(Pointer ptr, AllocKind kind) -> EvalResult<> {
    if (ptr.is_wild()) {
        // This always fails, but it tells us why.
        MIRV_TRY(Validator{*this}.check(ptr, Size(), Align(1), Access::Inbounds));
        Unreachable();
    }

    if (ptr.alloc == 0 or ptr.alloc > allocs.size()) return Violation(
        ViolationKind::InvalidDeallocation,
        ptr.alloc,
        ptr.offset,
        "pointer into unknown allocation"
    );

    if (*ptr.tag != ptr.alloc) return Violation(
        ViolationKind::ProvenanceMismatch,
        ptr.alloc,
        ptr.offset,
        "pointer derived from alloc{}",
        *ptr.tag
    );

    auto& a = Get(ptr.alloc);
    if (a.kind == kind and a.is_live and ptr.offset != 0) return Violation(
        ViolationKind::InvalidDeallocation,
        a.id,
        ptr.offset,
        "pointer does not point to the start of the allocation"
    );

    return deallocate(ptr.alloc, kind);
}

auto Memory::reallocate(Pointer ptr, Size new_size, Align align) -> EvalResult<Pointer> {
    // Check that the old pointer can be freed before allocating anything.
    MIRV_TRY(Validator{*this}.check(ptr, Size(), Align(1), Access::Inbounds));
    auto& old = get(ptr.alloc);
    if (old.kind != AllocKind::Heap or ptr.offset != 0) {
        auto res = deallocate(ptr, AllocKind::Heap);
        Assert(not res, "Freeing {} should have failed", ptr.str());
        return std::unexpected(std::move(res).error());
    }

    auto old_size = old.size;
    auto id = MIRV_TRY(allocate(new_size, align, AllocKind::Heap));
    auto moved = std::min(old_size, new_size);
    if (moved != Size()) MIRV_TRY(copy(ptr, Pointer::To(id), moved));
    MIRV_TRY(deallocate(ptr, AllocKind::Heap));
    return Pointer::To(id);
}

void Memory::freeze(AllocId id) {
    Get(id).is_mutable = false;
}

// ============================================================================
//  Access
// ============================================================================
auto Memory::address_of(Pointer p) const -> u64 {
    if (p.is_wild()) return u64(p.offset);
    return get(p.alloc).base + u64(p.offset);
}

auto Memory::check_inbounds(Pointer ptr, Size len) const -> EvalResult<> {
    MIRV_TRY(Validator{*this}.check(ptr, len, Align(1), Access::Inbounds));
    return {};
}

auto Memory::copy(Pointer src, Pointer dst, Size len, Align align) -> EvalResult<> {
    if (len == Size()) return {};
    auto n = len.bytes();
    auto ps = dl.pointer_size.bytes();

    // Collect everything first in case the ranges overlap.
    auto from = MIRV_TRY(Validator{*this}.check(src, len, align, Access::ReadRaw));
    auto& s = *from.alloc;
    SmallVector<u8, 64> data{s.bytes.begin() + isz(from.offset), s.bytes.begin() + isz(from.offset + n)};
    llvm::BitVector init(unsigned(n), false);
    for (u64 i = 0; i < n; i++)
        if (s.init.test(unsigned(from.offset + i)))
            init.set(unsigned(i));

    SmallVector<std::pair<u64, Relocation>, 4> relocs;
    auto it = s.relocs.lower_bound(from.offset >= ps - 1 ? from.offset - (ps - 1) : 0);
    for (; it != s.relocs.end() and it->first < from.offset + n; ++it) {
        // Only part of this pointer is copied.
        if (it->first < from.offset or it->first + ps > from.offset + n) {
            for (u64 b = it->first; b < it->first + ps; b++)
                if (b >= from.offset and b < from.offset + n)
                    init.reset(unsigned(b - from.offset));
            continue;
        }

        relocs.emplace_back(it->first - from.offset, it->second);
    }

    auto to = MIRV_TRY(Validator{*this}.check(dst, len, align, Access::Write));
    auto& d = Get(to.alloc->id);
    ClearRelocations(d, to.offset, n);
    std::copy(data.begin(), data.end(), d.bytes.begin() + isz(to.offset));
    for (u64 i = 0; i < n; i++) {
        if (init.test(unsigned(i))) d.init.set(unsigned(to.offset + i));
        else d.init.reset(unsigned(to.offset + i));
    }

    for (auto& [off, r] : relocs) d.relocs[to.offset + off] = r;
    return {};
}

auto Memory::read_bytes(Pointer ptr, Size len) const -> EvalResult<SmallVector<u8, 32>> {
    auto res = MIRV_TRY(Validator{*this}.check(ptr, len, Align(1), Access::Read));
    auto& a = *res.alloc;
    auto n = len.bytes();
    auto ps = dl.pointer_size.bytes();
    auto it = a.relocs.lower_bound(res.offset >= ps - 1 ? res.offset - (ps - 1) : 0);
    if (n != 0 and it != a.relocs.end() and it->first < res.offset + n) return Violation(
        ViolationKind::PointerAsBytes,
        a.id,
        i64(it->first),
        "range contains a pointer to alloc{}",
        it->second.alloc
    );

    return SmallVector<u8, 32>{a.bytes.begin() + isz(res.offset), a.bytes.begin() + isz(res.offset + n)};
}

auto Memory::read_scalar(
    Pointer ptr,
    const ScalarLayout& scalar,
    Align align,
    ScalarCheck check
) const -> EvalResult<Scalar> {
    std::optional<Scalar> out;
    auto Decode = [&](const Allocation& a, u64 off) -> EvalResult<> {
        auto len = scalar.size.bytes();
        auto ps = dl.pointer_size.bytes();
        auto it = a.relocs.lower_bound(off >= ps - 1 ? off - (ps - 1) : 0);
        if (len != 0 and it != a.relocs.end() and it->first < off + len) {
            if (not scalar.is_pointer or it->first != off or len != ps) return Violation(
                ViolationKind::PointerAsBytes,
                a.id,
                i64(it->first),
                "value contains a pointer to alloc{}",
                it->second.alloc
            );

            // A pointer with provenance is never null, so it needs
            // no further checking.
            auto addr = DecodeInt(a, off, scalar.size).getZExtValue();
            auto& target = get(it->second.alloc);
            out = Pointer{target.id, i64(addr) - i64(target.base), it->second.tag};
            return {};
        }

        auto bits = DecodeInt(a, off, scalar.size);
        if (check) MIRV_TRY(check(bits));
        if (scalar.is_pointer) out = Pointer::Wild(bits.getZExtValue());
        else out = std::move(bits);
        return {};
    };

    MIRV_TRY(Validator{*this}.check(ptr, scalar.size, align, Access::Read, Decode));
    return std::move(*out);
}

auto Memory::write_bytes(Pointer ptr, ArrayRef<u8> data) -> EvalResult<> {
    auto res = MIRV_TRY(Validator{*this}.check(ptr, Size::Bytes(data.size()), Align(1), Access::Write));
    auto& a = Get(res.alloc->id);
    ClearRelocations(a, res.offset, data.size());
    std::copy(data.begin(), data.end(), a.bytes.begin() + isz(res.offset));
    MarkInit(a, res.offset, data.size());
    return {};
}

auto Memory::write_repeat(Pointer ptr, u8 byte, Size count) -> EvalResult<> {
    auto res = MIRV_TRY(Validator{*this}.check(ptr, count, Align(1), Access::Write));
    auto& a = Get(res.alloc->id);
    ClearRelocations(a, res.offset, count.bytes());
    std::fill_n(a.bytes.begin() + isz(res.offset), count.bytes(), byte);
    MarkInit(a, res.offset, count.bytes());
    return {};
}

auto Memory::write_scalar(
    Pointer ptr,
    const Scalar& value,
    const ScalarLayout& scalar,
    Align align
) -> EvalResult<> {
    if (std::holds_alternative<Pointer>(value) and scalar.size != dl.pointer_size) return InternalError(
        "Cannot store a pointer in a {}-byte scalar",
        scalar.size.bytes()
    );

    auto res = MIRV_TRY(Validator{*this}.check(ptr, scalar.size, align, Access::Write));
    auto& a = Get(res.alloc->id);
    ClearRelocations(a, res.offset, scalar.size.bytes());
    std::visit(utils::Overloaded{
        [&](const APInt& i) { EncodeInt(a, res.offset, scalar.size, i); },
        [&](const Pointer& p) {
            EncodeInt(a, res.offset, scalar.size, APInt(unsigned(scalar.size.bits()), address_of(p)));
            if (not p.is_wild()) a.relocs[res.offset] = Relocation{p.alloc, p.tag};
        },
    }, value);

    MarkInit(a, res.offset, scalar.size.bytes());
    return {};
}

// ============================================================================
//  Function Pointers
// ============================================================================
auto Memory::fn_ptr_target(Pointer ptr) const -> EvalResult<StringRef> {
    if (ptr.is_wild()) return Violation(
        ViolationKind::InvalidFunctionPointer,
        0,
        ptr.offset,
        "pointer created from the integer {:#x}",
        u64(ptr.offset)
    );

    if (ptr.alloc == 0 or ptr.alloc > allocs.size()) return Violation(
        ViolationKind::InvalidFunctionPointer,
        ptr.alloc,
        ptr.offset,
        "pointer into unknown allocation"
    );

    auto& a = get(ptr.alloc);
    if (a.kind != AllocKind::Function or ptr.offset != 0) return Violation(
        ViolationKind::InvalidFunctionPointer,
        a.id,
        ptr.offset,
        "pointer into {} allocation",
        Name(a.kind)
    );

    if (*ptr.tag != ptr.alloc) return Violation(
        ViolationKind::ProvenanceMismatch,
        a.id,
        ptr.offset,
        "pointer derived from alloc{}",
        *ptr.tag
    );

    return StringRef{a.fn_name};
}

// ============================================================================
//  Debugging
// ============================================================================
auto Memory::dump(AllocId id) const -> std::string {
    auto& a = get(id);
    auto out = std::format(
        "alloc{} ({}, {} bytes, align {}{}{})",
        a.id,
        Name(a.kind),
        a.size.bytes(),
        a.align.value().bytes(),
        a.is_live ? "" : ", freed",
        a.is_mutable ? "" : ", read-only"
    );

    if (a.kind == AllocKind::Function) out += std::format(": fn {}", a.fn_name);
    if (not a.is_live) return out;

    for (u64 i = 0; i < a.size.bytes(); i++) {
        if (i % 16 == 0) out += std::format("\n  {:04x}:", i);
        if (a.init.test(unsigned(i))) out += std::format(" {:02x}", a.bytes[i]);
        else out += " __";
    }

    for (auto& [off, r] : a.relocs) out += std::format("\n  +{}: pointer to alloc{}", off, r.alloc);
    return out;
}

auto Memory::stats() const -> MemoryStats {
    u64 live = 0;
    for (auto& a : allocs)
        if (a->is_live and a->kind != AllocKind::Function)
            live++;

    return MemoryStats{
        .live_bytes = live_bytes,
        .limit = limit,
        .live_allocations = live,
        .next_id = AllocId(allocs.size() + 1),
    };
}
