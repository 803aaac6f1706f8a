#ifndef MIRV_LAYOUT_LAYOUT_HH
#define MIRV_LAYOUT_LAYOUT_HH

#include <mirv/Core/Utils.hh>
#include <mirv/IR/Type.hh>
#include <mirv/Macros.hh>

#include <memory>

namespace mirv {
class DataLayout;
class Layout;
class LayoutService;
class DefaultLayoutService;
struct Niche;
struct ScalarLayout;
struct TagLayout;
struct VariantLayout;

enum struct Abi : u8;
enum struct Endianness : u8;
enum struct ScalarValidity : u8;
enum struct TagEncoding : u8;
}

enum struct mirv::Endianness : mirv::u8 {
    Little,
    Big,
};

/// How a value is passed around when it is not in memory.
enum struct mirv::Abi : mirv::u8 {
    /// A single integer or pointer.
    Scalar,

    /// Two scalars, e.g. a fat pointer.
    ScalarPair,

    /// Anything else; these are only ever accessed through memory.
    Aggregate,
};

/// Which bit patterns of a scalar are valid.
enum struct mirv::ScalarValidity : mirv::u8 {
    Any,     ///< Every bit pattern.
    Bool,    ///< 0 or 1.
    Char,    ///< A Unicode scalar value.
    NonNull, ///< Anything but 0.
};

/// How the discriminant of an enum is stored.
enum struct mirv::TagEncoding : mirv::u8 {
    /// Not an enum, or an enum with a single variant and no tag.
    None,

    /// The tag holds the discriminant.
    Direct,

    /// Invalid values of a field of the untagged variant encode
    /// the other variants.
    Niche,
};

/// Properties of the target that affect layout.
class mirv::DataLayout {
public:
    /// Size and alignment of a pointer.
    Size pointer_size = Size::Bytes(8);
    Align pointer_align = Align(8);

    /// Byte order of integers in memory.
    Endianness endianness = Endianness::Little;

    /// Alignment cap for integers.
    Align max_int_align = Align(16);

    /// Get a layout for a 32-bit target.
    [[nodiscard]] static auto Target32() -> DataLayout {
        return DataLayout{Size::Bytes(4), Align(4), Endianness::Little, Align(8)};
    }
};

/// Layout of a single integer or pointer.
struct mirv::ScalarLayout {
    Size size;
    bool is_signed = false;
    bool is_pointer = false;
    ScalarValidity validity = ScalarValidity::Any;

    /// Check whether a raw value is valid for this scalar.
    [[nodiscard]] bool valid(const APInt& value) const;
};

/// Layout of one variant of an enum.
struct mirv::VariantLayout {
    i64 discriminant;

    /// Offsets of the fields, relative to the start of the enum.
    SmallVector<Size, 4> field_offsets;
};

/// Location and encoding of an enum’s discriminant.
struct mirv::TagLayout {
    TagEncoding encoding = TagEncoding::None;

    /// Offset and layout of the tag or the niche field.
    Size offset;
    ScalarLayout scalar;

    /// For niche encodings: the variant that has no tag, and the range
    /// of variants that are encoded starting at 'niche_start'.
    u32 untagged_variant = 0;
    u32 niche_first = 0;
    u32 niche_last = 0;
    u64 niche_start = 0;
};

/// A range of invalid values at a known offset that an enum can
/// use to store its tag.
struct mirv::Niche {
    Size offset;
    ScalarLayout scalar;

    /// First invalid value and number of consecutive invalid values.
    u64 start;
    u64 available;
};

/// The memory layout of a type.
class mirv::Layout {
public:
    Type type;
    Size size;
    Align align;
    Abi abi = Abi::Aggregate;

    /// For 'Scalar' and 'ScalarPair': the scalars and the offset
    /// of the second one.
    ScalarLayout first;
    ScalarLayout second;
    Size second_offset;

    /// Field offsets of tuples, structs, and fat pointers.
    SmallVector<Size, 4> field_offsets;

    /// Element size and count of arrays and slices. Slices have
    /// a size of 0 here; their length is only known at runtime.
    Size stride;
    u64 count = 0;

    /// Variants and tag of enums.
    SmallVector<VariantLayout, 2> variants;
    TagLayout tag;

    /// Invalid values that an enclosing enum can use as its tag.
    std::optional<Niche> niche;

    /// Get the offset of a field or element.
    [[nodiscard]] auto field_offset(u32 i) const -> Size;

    /// Whether this is an array or slice.
    [[nodiscard]] bool is_array() const {
        return isa<ArrayType, SliceType>(type);
    }

    /// Whether this type has no storage.
    [[nodiscard]] bool is_zst() const { return size == Size(); }
};

/// Computes and caches the layouts of types.
class mirv::LayoutService {
public:
    virtual ~LayoutService() = default;

    /// Get the target properties layouts are computed for.
    [[nodiscard]] virtual auto data_layout() const -> const DataLayout& = 0;

    /// Get the layout of a type.
    [[nodiscard]] virtual auto layout_of(Type ty) -> const Layout& = 0;
};

/// Layout service that lays out fields in declaration order, like a
/// C compiler would, and uses niches for enums where it can.
class mirv::DefaultLayoutService final : public LayoutService {
    DataLayout dl;
    DenseMap<Type, std::unique_ptr<Layout>> cache;

public:
    explicit DefaultLayoutService(DataLayout dl = {}) : dl{dl} {}

    [[nodiscard]] auto data_layout() const -> const DataLayout& override { return dl; }
    [[nodiscard]] auto layout_of(Type ty) -> const Layout& override;

private:
    auto Compute(Type ty) -> std::unique_ptr<Layout>;
    void ComputeEnum(Layout& l, const EnumType* e);
    void ComputeRecord(Layout& l, ArrayRef<Type> fields);
    auto IntScalar(const IntType* i) const -> ScalarLayout;
    auto PointerScalar(bool non_null) const -> ScalarLayout;
};

#endif // MIRV_LAYOUT_LAYOUT_HH
