#ifndef MIRV_EVAL_VALUE_HH
#define MIRV_EVAL_VALUE_HH

#include <mirv/Eval/Memory.hh>
#include <mirv/IR/IR.hh>

namespace mirv::eval {
class Immediate;
class Place;
class Value;
struct LocalPlace;
struct MemPlace;
} // namespace mirv::eval

/// Zero, one, or two scalars.
///
/// Immediates are what values with a 'Scalar' or 'ScalarPair' layout
/// look like outside of memory; zero-sized values have no scalars.
class mirv::eval::Immediate {
    SmallVector<Scalar, 2> scalars;

public:
    Immediate() = default;
    /* implicit */ Immediate(Scalar s) { scalars.push_back(std::move(s)); }
    Immediate(Scalar a, Scalar b) {
        scalars.push_back(std::move(a));
        scalars.push_back(std::move(b));
    }

    [[nodiscard]] auto first() const -> const Scalar& {
        Assert(not scalars.empty());
        return scalars[0];
    }

    [[nodiscard]] auto second() const -> const Scalar& {
        Assert(scalars.size() == 2);
        return scalars[1];
    }

    [[nodiscard]] bool is_pair() const { return scalars.size() == 2; }
    [[nodiscard]] bool is_zst() const { return scalars.empty(); }
    [[nodiscard]] auto size() const -> usz { return scalars.size(); }

    /// Print this immediate.
    [[nodiscard]] auto print() const -> SmallUnrenderedString;
};

/// A local of some frame.
struct mirv::eval::LocalPlace {
    u32 frame;
    LocalId local;
};

/// A place in memory.
struct mirv::eval::MemPlace {
    Pointer ptr;

    /// Length of the slice this place refers to, if it is unsized.
    std::optional<u64> len;
};

/// A place that can be read from and written to.
class mirv::eval::Place {
public:
    Type type;
    Variant<LocalPlace, MemPlace> loc;

    /// Variant that the enum in this place was downcast to.
    std::optional<u32> variant;

    Place(Type ty, LocalPlace l) : type{ty}, loc{l} {}
    Place(Type ty, MemPlace m) : type{ty}, loc{m} {}

    [[nodiscard]] auto local() const -> const LocalPlace* { return std::get_if<LocalPlace>(&loc); }
    [[nodiscard]] auto mem() const -> const MemPlace* { return std::get_if<MemPlace>(&loc); }
};

/// A value with a type.
///
/// Aggregates are not copied out of memory; instead, the value refers
/// to the place that holds them. Such a value is only valid until the
/// place is written to.
class mirv::eval::Value {
    Type ty;
    Variant<Immediate, MemPlace> repr;

public:
    Value(Type ty, Immediate imm) : ty{ty}, repr{std::move(imm)} {}
    Value(Type ty, MemPlace mem) : ty{ty}, repr{mem} {}

    /// Create an integer, bool, or char value.
    [[nodiscard]] static auto Int(Type ty, APInt value) -> Value {
        return Value{ty, Immediate{Scalar{std::move(value)}}};
    }

    /// Create a value of a zero-sized type.
    [[nodiscard]] static auto Zst(Type ty) -> Value { return Value{ty, Immediate{}}; }

    /// Get the immediate; only valid if this is not in memory.
    [[nodiscard]] auto imm() const -> const Immediate& { return std::get<Immediate>(repr); }

    /// Get the integer value of this; only valid for integer scalars.
    [[nodiscard]] auto int_value() const -> const APInt& { return std::get<APInt>(imm().first()); }

    /// Whether this value refers to memory.
    [[nodiscard]] bool is_mem() const { return std::holds_alternative<MemPlace>(repr); }

    /// Get the memory place this value is stored in.
    [[nodiscard]] auto mem() const -> const MemPlace& { return std::get<MemPlace>(repr); }

    /// Get the pointer value of this; only valid for pointer scalars.
    [[nodiscard]] auto pointer() const -> const Pointer& { return std::get<Pointer>(imm().first()); }

    /// Print this value.
    [[nodiscard]] auto print() const -> SmallUnrenderedString;

    [[nodiscard]] auto type() const -> Type { return ty; }
};

#endif // MIRV_EVAL_VALUE_HH
