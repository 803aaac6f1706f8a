#ifndef MIRV_EVAL_MEMORY_HH
#define MIRV_EVAL_MEMORY_HH

#include <mirv/Core/Utils.hh>
#include <mirv/Eval/Error.hh>
#include <mirv/Layout/Layout.hh>
#include <mirv/Macros.hh>

#include <llvm/ADT/BitVector.h>
#include <llvm/ADT/STLFunctionalExtras.h>

#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace mirv::eval {
class Allocation;
class Memory;
class Validator;
struct MemoryStats;
struct Pointer;
struct Relocation;

/// A scalar value: raw bits, or a pointer that carries provenance.
using Scalar = Variant<APInt, Pointer>;

/// Extra checks that run on the raw bits of a scalar while it is being
/// read; these run before the provenance of the access is checked.
using ScalarCheck = llvm::function_ref<EvalResult<>(const APInt&)>;
} // namespace mirv::eval

/// A pointer.
///
/// Pointers are never plain addresses: they name the allocation they
/// point into and an offset relative to its start. The provenance tag
/// is the allocation the pointer was derived from; pointers without
/// a tag are ‘wild’ and store their numeric address in 'offset'.
struct mirv::eval::Pointer {
    AllocId alloc = 0;
    i64 offset = 0;
    std::optional<AllocId> tag;

    /// Create a pointer to an allocation.
    [[nodiscard]] static auto To(AllocId id, i64 offset = 0) -> Pointer {
        return Pointer{id, offset, id};
    }

    /// Create a pointer without provenance.
    [[nodiscard]] static auto Wild(u64 address) -> Pointer {
        return Pointer{0, i64(address), std::nullopt};
    }

    /// Whether this pointer has no provenance.
    [[nodiscard]] bool is_wild() const { return not tag.has_value(); }

    /// Offset this pointer by a number of bytes; this keeps its provenance.
    /// The offset wraps around; out-of-range results are caught when the
    /// pointer is used.
    [[nodiscard]] auto operator+(i64 bytes) const -> Pointer {
        auto p = *this;
        p.offset = i64(u64(p.offset) + u64(bytes));
        return p;
    }

    [[nodiscard]] auto operator+(Size sz) const -> Pointer { return *this + i64(sz.bytes()); }

    [[nodiscard]] friend bool operator==(const Pointer&, const Pointer&) = default;

    /// Format this pointer, e.g. 'alloc3+8'.
    [[nodiscard]] auto str() const -> std::string;
};

/// A pointer stored in memory.
struct mirv::eval::Relocation {
    AllocId alloc;
    std::optional<AllocId> tag;
};

/// A single allocation.
///
/// Allocations stay around after they are freed so that accesses
/// through stale pointers can be diagnosed.
class mirv::eval::Allocation {
    friend Memory;
    friend Validator;

public:
    const AllocId id;
    const AllocKind kind;
    const Size size;
    const Align align;

    /// Numeric address of the first byte.
    const u64 base;

private:
    SmallVector<u8, 0> bytes;
    llvm::BitVector init;

    /// Pointers stored in this allocation, by offset.
    std::map<u64, Relocation> relocs;

    /// Procedure this stands for if this is a function allocation.
    std::string fn_name;

    bool is_mutable = true;
    bool is_live = true;

    Allocation(AllocId id, AllocKind kind, Size size, Align align, u64 base)
        : id{id}, kind{kind}, size{size}, align{align}, base{base},
          bytes(size.bytes(), 0), init(unsigned(size.bytes()), false) {}

public:
    /// Get the raw bytes.
    [[nodiscard]] auto data() const -> ArrayRef<u8> { return bytes; }

    /// Whether every byte in a range has been written.
    [[nodiscard]] bool initialised(u64 offset, u64 len) const;

    [[nodiscard]] bool live() const { return is_live; }
    [[nodiscard]] bool mutable_() const { return is_mutable; }

    /// Get the relocations in this allocation.
    [[nodiscard]] auto relocations() const -> const std::map<u64, Relocation>& { return relocs; }
};

struct mirv::eval::MemoryStats {
    u64 live_bytes;
    u64 limit;
    u64 live_allocations;
    AllocId next_id;
};

/// The allocation table of a machine.
///
/// Every access is checked by the validator before it touches any
/// bytes; an access that fails a check has no effect.
class mirv::eval::Memory {
    MIRV_IMMOVABLE(Memory);
    friend Validator;

    const DataLayout& dl;
    std::vector<std::unique_ptr<Allocation>> allocs;

    /// Base addresses of all allocations, including dead ones.
    std::map<u64, AllocId> by_address;

    /// Function allocations, by procedure name.
    StringMap<AllocId> functions;

    u64 next_address = 0x1000;
    u64 live_bytes = 0;
    u64 limit;
    bool check_alignment;

public:
    /// The largest allocation or access, in bytes.
    static constexpr u64 MaxSize = std::numeric_limits<u32>::max();

    Memory(const DataLayout& dl, u64 memory_limit, bool check_alignment)
        : dl{dl}, limit{memory_limit}, check_alignment{check_alignment} {}

    /// Get the numeric address a pointer points to.
    [[nodiscard]] auto address_of(Pointer p) const -> u64;

    /// Create a new allocation; all of its bytes are uninitialised.
    [[nodiscard]] auto allocate(Size size, Align align, AllocKind kind) -> EvalResult<AllocId>;

    /// Copy 'len' bytes, with their init state and relocations, from
    /// 'src' to 'dst'. The ranges may overlap.
    [[nodiscard]] auto copy(Pointer src, Pointer dst, Size len, Align align = Align(1)) -> EvalResult<>;

    /// Get a pointer to the procedure with the given name.
    [[nodiscard]] auto create_fn_ptr(StringRef proc) -> Pointer;

    /// Free an allocation.
    [[nodiscard]] auto deallocate(AllocId id, AllocKind kind) -> EvalResult<>;

    /// Free the allocation a pointer points to; the pointer must point
    /// to the start of the allocation.
    [[nodiscard]] auto deallocate(Pointer ptr, AllocKind kind) -> EvalResult<>;

    /// Render an allocation as hex.
    [[nodiscard]] auto dump(AllocId id) const -> std::string;

    /// Get the procedure a function pointer points to.
    [[nodiscard]] auto fn_ptr_target(Pointer ptr) const -> EvalResult<StringRef>;

    /// Make an allocation read-only.
    void freeze(AllocId id);

    /// Look up an allocation by id.
    [[nodiscard]] auto get(AllocId id) const -> const Allocation&;

    /// Check that a pointer points to a live range of 'len' bytes.
    [[nodiscard]] auto check_inbounds(Pointer ptr, Size len) const -> EvalResult<>;

    /// Get the data layout.
    [[nodiscard]] auto data_layout() const -> const DataLayout& { return dl; }

    /// Read raw bytes. The bytes must be initialised and must not
    /// contain pointers.
    [[nodiscard]] auto read_bytes(Pointer ptr, Size len) const -> EvalResult<SmallVector<u8, 32>>;

    /// Read a scalar.
    [[nodiscard]] auto read_scalar(
        Pointer ptr,
        const ScalarLayout& scalar,
        Align align,
        ScalarCheck check = nullptr
    ) const -> EvalResult<Scalar>;

    /// Move an allocation’s contents to a new heap allocation and
    /// free the old one.
    [[nodiscard]] auto reallocate(Pointer ptr, Size new_size, Align align) -> EvalResult<Pointer>;

    /// Get memory usage.
    [[nodiscard]] auto stats() const -> MemoryStats;

    /// Write raw bytes.
    [[nodiscard]] auto write_bytes(Pointer ptr, ArrayRef<u8> data) -> EvalResult<>;

    /// Set 'count' bytes to 'byte'.
    [[nodiscard]] auto write_repeat(Pointer ptr, u8 byte, Size count) -> EvalResult<>;

    /// Write a scalar.
    [[nodiscard]] auto write_scalar(
        Pointer ptr,
        const Scalar& value,
        const ScalarLayout& scalar,
        Align align
    ) -> EvalResult<>;

private:
    auto Get(AllocId id) -> Allocation&;
    auto DecodeInt(const Allocation& a, u64 offset, Size size) const -> APInt;
    void EncodeInt(Allocation& a, u64 offset, Size size, const APInt& value);
    void ClearRelocations(Allocation& a, u64 offset, u64 len);
    void MarkInit(Allocation& a, u64 offset, u64 len);
};

#endif // MIRV_EVAL_MEMORY_HH
