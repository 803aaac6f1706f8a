#ifndef MIRV_IR_TYPE_HH
#define MIRV_IR_TYPE_HH

#include <mirv/Core/Utils.hh>
#include <mirv/Macros.hh>

#include <llvm/ADT/FoldingSet.h>
#include <llvm/Support/Casting.h>

namespace mirv {
class Module;
class TypeBase;
class BoolType;
class CharType;
class IntType;
class PtrType;
class FnPtrType;
class ArrayType;
class SliceType;
class TupleType;
class StructType;
class EnumType;
class Type;
struct FieldDecl;
struct VariantDecl;
enum struct PtrKind : u8;
}

/// Base class for all types.
///
/// Types are allocated in the module and are never freed before it;
/// all of them are trivially destructible.
class alignas(8) mirv::TypeBase {
    MIRV_IMMOVABLE(TypeBase);

    friend Type;

public:
    enum struct Kind : u8 {
        Bool,
        Char,
        Int,
        Ptr,
        FnPtr,
        Array,
        Slice,
        Tuple,
        Struct,
        Enum,
    };

    const Kind type_kind;

protected:
    explicit constexpr TypeBase(Kind kind) : type_kind{kind} {}

public:
    // Only allow allocating these in the module.
    void* operator new(usz) = MIRV_DELETED("Use `new (mod) { ... }` instead");
    void* operator new(usz size, Module& mod);

    /// Get the type kind.
    [[nodiscard]] auto kind() const -> Kind { return type_kind; }

    /// Whether dropping a value of this type has any effect.
    [[nodiscard]] bool needs_drop() const;

    /// Whether this is a dynamically sized type.
    [[nodiscard]] bool is_unsized() const { return type_kind == Kind::Slice; }

    /// Whether this is the empty tuple.
    [[nodiscard]] bool is_unit() const;

    /// Print this type, with formatting codes.
    [[nodiscard]] auto print() const -> SmallUnrenderedString;

    /// Print this type to a string.
    [[nodiscard]] auto str(bool use_colours = false) const -> std::string;
};

/// A type.
class mirv::Type {
    TypeBase* pointer = nullptr;

public:
    constexpr Type() = default;
    constexpr Type(std::nullptr_t) {}
    constexpr Type(TypeBase* t) : pointer{t} {}
    constexpr Type(const TypeBase* t) : pointer{const_cast<TypeBase*>(t)} {}

    /// Get the type pointer.
    [[nodiscard]] auto ptr() const -> TypeBase* { return pointer; }

    /// Access the type pointer.
    [[nodiscard]] auto operator->() const -> TypeBase* { return pointer; }

    /// Check if two types are equal.
    [[nodiscard]] auto operator==(Type ty) const -> bool { return pointer == ty.pointer; }
    [[nodiscard]] auto operator==(const TypeBase* ty) const -> bool { return pointer == ty; }

    /// Check whether this holds a valid type.
    [[nodiscard]] explicit operator bool() const { return pointer != nullptr; }

private:
    /// For libassert.
    friend auto operator<<(std::ostream& os, Type ty) -> std::ostream& {
        return os << ty->str();
    }
};

template <>
struct llvm::simplify_type<mirv::Type> {
    using SimpleType = mirv::TypeBase*;
    static SimpleType getSimplifiedValue(mirv::Type v) { return v.ptr(); }
};

template <>
struct llvm::simplify_type<const mirv::Type> {
    using SimpleType = mirv::TypeBase*;
    static SimpleType getSimplifiedValue(mirv::Type v) { return v.ptr(); }
};

template <>
struct llvm::DenseMapInfo<mirv::Type> {
    static auto getEmptyKey() -> mirv::Type { return DenseMapInfo<mirv::TypeBase*>::getEmptyKey(); }
    static auto getTombstoneKey() -> mirv::Type { return DenseMapInfo<mirv::TypeBase*>::getTombstoneKey(); }
    static unsigned getHashValue(mirv::Type t) { return DenseMapInfo<mirv::TypeBase*>::getHashValue(t.ptr()); }
    static bool isEqual(mirv::Type a, mirv::Type b) { return a == b; }
};

/// Flavour of a pointer.
enum struct mirv::PtrKind : u8 {
    Raw, ///< May be null or dangling.
    Ref, ///< Non-null; must point to a live, in-bounds value when created.
    Box, ///< Non-null; owns a heap allocation that is freed when it is dropped.
};

class mirv::BoolType final : public TypeBase {
    friend Module;
    constexpr BoolType() : TypeBase{Kind::Bool} {}

public:
    static bool classof(const TypeBase* e) { return e->kind() == Kind::Bool; }
};

/// A Unicode scalar value.
class mirv::CharType final : public TypeBase {
    friend Module;
    constexpr CharType() : TypeBase{Kind::Char} {}

public:
    static bool classof(const TypeBase* e) { return e->kind() == Kind::Char; }
};

class mirv::IntType final : public TypeBase
    , public FoldingSetNode {
    Size bits;
    bool is_signed;

    explicit IntType(Size bit_width, bool is_signed)
        : TypeBase{Kind::Int}, bits{bit_width}, is_signed{is_signed} {
        Assert(bits.bits() % 8 == 0 and bits.bits() <= 128, "Unsupported integer width: {}", bits.bits());
    }

public:
    /// Get the bit width of this integer type. A width of 0 means
    /// the type is as wide as a pointer.
    [[nodiscard]] auto bit_width() const -> Size { return bits; }

    /// Whether this type is as wide as a pointer on the target.
    [[nodiscard]] bool pointer_sized() const { return bits.bits() == 0; }

    /// Whether this type is signed.
    [[nodiscard]] bool signed_() const { return is_signed; }

    void Profile(FoldingSetNodeID& ID) const { Profile(ID, bits, is_signed); }
    static auto Get(Module& mod, Size bits, bool is_signed) -> IntType*;
    static void Profile(FoldingSetNodeID& ID, Size bit_width, bool is_signed);
    static bool classof(const TypeBase* e) { return e->kind() == Kind::Int; }
};

class mirv::PtrType final : public TypeBase
    , public FoldingSetNode {
    Type pointee;
    PtrKind pkind;
    bool is_mutable;

    PtrType(Type pointee, PtrKind kind, bool is_mutable)
        : TypeBase{Kind::Ptr}, pointee{pointee}, pkind{kind}, is_mutable{is_mutable} {}

public:
    /// Get the type pointed to.
    [[nodiscard]] auto elem() const -> Type { return pointee; }

    /// Whether this is a pointer to an unsized value that carries
    /// its length next to the address.
    [[nodiscard]] bool is_fat() const { return pointee->is_unsized(); }

    /// Whether this pointer may be mutated through.
    [[nodiscard]] bool mutable_() const { return is_mutable; }

    /// Get the pointer flavour.
    [[nodiscard]] auto ptr_kind() const -> PtrKind { return pkind; }

    /// Whether a null value is invalid for this type.
    [[nodiscard]] bool non_null() const { return pkind != PtrKind::Raw; }

    void Profile(FoldingSetNodeID& ID) const { Profile(ID, pointee, pkind, is_mutable); }
    static auto Get(Module& mod, Type pointee, PtrKind kind = PtrKind::Raw, bool is_mutable = true) -> PtrType*;
    static void Profile(FoldingSetNodeID& ID, Type pointee, PtrKind kind, bool is_mutable);
    static bool classof(const TypeBase* e) { return e->kind() == Kind::Ptr; }
};

/// Pointer to a procedure.
class mirv::FnPtrType final : public TypeBase
    , public FoldingSetNode {
    Type ret;
    ArrayRef<Type> param_types;

    FnPtrType(Type ret, ArrayRef<Type> params)
        : TypeBase{Kind::FnPtr}, ret{ret}, param_types{params} {}

public:
    [[nodiscard]] auto params() const -> ArrayRef<Type> { return param_types; }
    [[nodiscard]] auto ret_type() const -> Type { return ret; }

    void Profile(FoldingSetNodeID& ID) const { Profile(ID, ret, param_types); }
    static auto Get(Module& mod, Type ret, ArrayRef<Type> params) -> FnPtrType*;
    static void Profile(FoldingSetNodeID& ID, Type ret, ArrayRef<Type> params);
    static bool classof(const TypeBase* e) { return e->kind() == Kind::FnPtr; }
};

class mirv::ArrayType final : public TypeBase
    , public FoldingSetNode {
    Type element;
    u64 count;

    ArrayType(Type elem, u64 count) : TypeBase{Kind::Array}, element{elem}, count{count} {}

public:
    [[nodiscard]] auto elem() const -> Type { return element; }
    [[nodiscard]] auto dimension() const -> u64 { return count; }

    void Profile(FoldingSetNodeID& ID) const { Profile(ID, element, count); }
    static auto Get(Module& mod, Type elem, u64 count) -> ArrayType*;
    static void Profile(FoldingSetNodeID& ID, Type elem, u64 count);
    static bool classof(const TypeBase* e) { return e->kind() == Kind::Array; }
};

/// A run of elements whose length is only known at runtime. Values of
/// this type can only be accessed through a fat pointer.
class mirv::SliceType final : public TypeBase
    , public FoldingSetNode {
    Type element;

    explicit SliceType(Type elem) : TypeBase{Kind::Slice}, element{elem} {}

public:
    [[nodiscard]] auto elem() const -> Type { return element; }

    void Profile(FoldingSetNodeID& ID) const { Profile(ID, element); }
    static auto Get(Module& mod, Type elem) -> SliceType*;
    static void Profile(FoldingSetNodeID& ID, Type elem);
    static bool classof(const TypeBase* e) { return e->kind() == Kind::Slice; }
};

class mirv::TupleType final : public TypeBase
    , public FoldingSetNode {
    ArrayRef<Type> elems;

    explicit TupleType(ArrayRef<Type> elems) : TypeBase{Kind::Tuple}, elems{elems} {}

public:
    [[nodiscard]] auto fields() const -> ArrayRef<Type> { return elems; }

    void Profile(FoldingSetNodeID& ID) const { Profile(ID, elems); }
    static auto Get(Module& mod, ArrayRef<Type> elems) -> TupleType*;
    static void Profile(FoldingSetNodeID& ID, ArrayRef<Type> elems);
    static bool classof(const TypeBase* e) { return e->kind() == Kind::Tuple; }
};

struct mirv::FieldDecl {
    StringRef name;
    Type type;
};

/// A named record type. Struct types are nominal and not uniqued.
class mirv::StructType final : public TypeBase {
    StringRef struct_name;
    ArrayRef<FieldDecl> field_decls;
    StringRef drop;

    StructType(StringRef name, ArrayRef<FieldDecl> fields, StringRef drop_proc)
        : TypeBase{Kind::Struct}, struct_name{name}, field_decls{fields}, drop{drop_proc} {}

public:
    /// Name of the procedure that is run before the fields of
    /// this struct are dropped; may be empty.
    [[nodiscard]] auto drop_proc() const -> StringRef { return drop; }
    [[nodiscard]] auto fields() const -> ArrayRef<FieldDecl> { return field_decls; }
    [[nodiscard]] auto name() const -> StringRef { return struct_name; }

    static auto Create(
        Module& mod,
        StringRef name,
        ArrayRef<FieldDecl> fields,
        StringRef drop_proc = ""
    ) -> StructType*;

    static bool classof(const TypeBase* e) { return e->kind() == Kind::Struct; }
};

struct mirv::VariantDecl {
    StringRef name;

    /// Declared discriminant value.
    i64 discriminant;

    /// Field types of this variant.
    ArrayRef<Type> fields;
};

/// A tagged union. Enum types are nominal and not uniqued.
class mirv::EnumType final : public TypeBase {
    StringRef enum_name;
    ArrayRef<VariantDecl> variant_decls;
    IntType* tag;
    StringRef drop;

    EnumType(StringRef name, ArrayRef<VariantDecl> variants, IntType* tag, StringRef drop_proc)
        : TypeBase{Kind::Enum}, enum_name{name}, variant_decls{variants}, tag{tag}, drop{drop_proc} {}

public:
    /// Name of the procedure that is run before the active
    /// variant is dropped; may be empty.
    [[nodiscard]] auto drop_proc() const -> StringRef { return drop; }

    /// Whether no variant has any fields.
    [[nodiscard]] bool fieldless() const;

    /// Find the variant with a given discriminant.
    [[nodiscard]] auto find_variant(i64 discriminant) const -> std::optional<u32>;

    [[nodiscard]] auto name() const -> StringRef { return enum_name; }

    /// Integer type used to store a direct tag.
    [[nodiscard]] auto tag_type() const -> IntType* { return tag; }

    [[nodiscard]] auto variants() const -> ArrayRef<VariantDecl> { return variant_decls; }

    /// Create an enum type. If no tag type is given, the smallest
    /// integer type that fits every discriminant is used.
    static auto Create(
        Module& mod,
        StringRef name,
        ArrayRef<VariantDecl> variants,
        IntType* tag_type = nullptr,
        StringRef drop_proc = ""
    ) -> EnumType*;

    static bool classof(const TypeBase* e) { return e->kind() == Kind::Enum; }
};

template <>
struct std::formatter<mirv::Type> : formatter<std::string> {
    template <typename FormatContext>
    auto format(mirv::Type t, FormatContext& ctx) const {
        return formatter<std::string>::format(t->str(), ctx);
    }
};

#endif // MIRV_IR_TYPE_HH
