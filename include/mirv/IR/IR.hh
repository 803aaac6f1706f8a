#ifndef MIRV_IR_IR_HH
#define MIRV_IR_IR_HH

#include <mirv/Core/Location.hh>
#include <mirv/Core/Utils.hh>
#include <mirv/IR/Type.hh>
#include <mirv/Macros.hh>

#include <llvm/Support/Allocator.h>
#include <llvm/Support/StringSaver.h>

#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace mirv {
class Module;
class Proc;
class Constant;
class Operand;
struct BasicBlock;
struct Local;
struct PlaceExpr;
struct Projection;
struct Static;
struct Statement;
struct Terminator;

using LocalId = u32;
using BlockId = u32;

enum struct BinOp : u8;
enum struct UnOp : u8;
enum struct CastKind : u8;
enum struct AggregateKind : u8;

namespace rv {
struct Use;
struct Ref;
struct AddressOf;
struct Binary;
struct CheckedBinary;
struct Unary;
struct Aggregate;
struct Cast;
struct Len;
struct Repeat;
struct Discriminant;
struct Box;
}

namespace stmt {
struct Assign;
struct Assert;
struct SetDiscriminant;
struct StorageLive;
struct StorageDead;
struct Nop;
}

namespace term {
struct Goto;
struct SwitchInt;
struct Call;
struct Return;
struct Drop;
struct Unreachable;
struct Resume;
struct Abort;
}
} // namespace mirv

// ============================================================================
//  Places and Operands
// ============================================================================
/// A step from a place to a place inside of it.
struct mirv::Projection {
    enum struct Kind : u8 {
        Deref,         ///< Follow the pointer stored in the place.
        Field,         ///< Select a field by index.
        Index,         ///< Select an element; the index is stored in a local.
        ConstantIndex, ///< Select an element by a constant index.
        Downcast,      ///< View an enum as one of its variants.
    };

    Kind kind;

    /// Field index, local, constant index, or variant index.
    u32 index = 0;

    static constexpr auto Deref() -> Projection { return {Kind::Deref}; }
    static constexpr auto Field(u32 i) -> Projection { return {Kind::Field, i}; }
    static constexpr auto Index(LocalId l) -> Projection { return {Kind::Index, l}; }
    static constexpr auto ConstantIndex(u32 i) -> Projection { return {Kind::ConstantIndex, i}; }
    static constexpr auto Downcast(u32 variant) -> Projection { return {Kind::Downcast, variant}; }
};

/// A place as it is written in the IR: a local and a list of projections.
struct mirv::PlaceExpr {
    LocalId local = 0;
    SmallVector<Projection, 2> projections;

    PlaceExpr() = default;
    /* implicit */ PlaceExpr(LocalId local) : local{local} {}
    PlaceExpr(LocalId local, ArrayRef<Projection> projs)
        : local{local}, projections{projs.begin(), projs.end()} {}

    /// Get the local if this place has no projections.
    [[nodiscard]] auto as_local() const -> std::optional<LocalId> {
        if (projections.empty()) return local;
        return std::nullopt;
    }

    /// Create a new place that is this one projected further.
    [[nodiscard]] auto project(Projection p) const -> PlaceExpr {
        auto copy = *this;
        copy.projections.push_back(p);
        return copy;
    }

    [[nodiscard]] auto deref() const -> PlaceExpr { return project(Projection::Deref()); }
    [[nodiscard]] auto field(u32 i) const -> PlaceExpr { return project(Projection::Field(i)); }
};

/// A compile-time constant.
class mirv::Constant {
public:
    /// Reference to a procedure; evaluates to a function pointer.
    struct ProcRef { StringRef name; };

    /// Reference to a static; evaluates to a pointer to it.
    struct StaticRef { StringRef name; };

    /// A byte string; evaluates to a fat pointer to read-only memory.
    struct Bytes { std::string data; };

    Type type;
    Variant<std::monostate, APInt, ProcRef, StaticRef, Bytes> value;

    Constant() = default;
    Constant(Type ty, APInt val) : type{ty}, value{std::move(val)} {}
    Constant(Type ty, ProcRef p) : type{ty}, value{p} {}
    Constant(Type ty, StaticRef s) : type{ty}, value{s} {}
    Constant(Type ty, Bytes b) : type{ty}, value{std::move(b)} {}

    /// Create the value of a zero-sized type.
    static auto Zst(Type ty) -> Constant {
        Constant c;
        c.type = ty;
        return c;
    }
};

class mirv::Operand {
public:
    enum struct Kind : u8 {
        Copy,
        Move,
        Const,
    };

private:
    Kind op_kind = Kind::Const;
    PlaceExpr place_expr;
    Constant constant_value;

public:
    Operand() = default;

    static auto Copy(PlaceExpr p) -> Operand {
        Operand o;
        o.op_kind = Kind::Copy;
        o.place_expr = std::move(p);
        return o;
    }

    static auto Move(PlaceExpr p) -> Operand {
        Operand o;
        o.op_kind = Kind::Move;
        o.place_expr = std::move(p);
        return o;
    }

    static auto Const(Constant c) -> Operand {
        Operand o;
        o.constant_value = std::move(c);
        return o;
    }

    /// Get the constant. Only valid for 'Const' operands.
    [[nodiscard]] auto constant() const -> const Constant& {
        Assert(op_kind == Kind::Const);
        return constant_value;
    }

    [[nodiscard]] auto kind() const -> Kind { return op_kind; }

    /// Get the place. Only valid for 'Copy' and 'Move' operands.
    [[nodiscard]] auto place() const -> const PlaceExpr& {
        Assert(op_kind != Kind::Const);
        return place_expr;
    }
};

// ============================================================================
//  Rvalues
// ============================================================================
enum struct mirv::BinOp : u8 {
    Add,
    Sub,
    Mul,
    Div,
    Rem,
    And,
    Or,
    Xor,
    Shl,
    Shr,
    Eq,
    Ne,
    Lt,
    Le,
    Gt,
    Ge,

    /// Pointer plus an element count.
    Offset,
};

enum struct mirv::UnOp : u8 {
    Not,
    Neg,
};

enum struct mirv::CastKind : u8 {
    /// Integer, bool, or char to integer or char.
    IntToInt,

    /// Pointer to integer; exposes the numeric address and drops provenance.
    PtrToInt,

    /// Integer to pointer; the result has no provenance.
    IntToPtr,

    /// Pointer to pointer of a different type or flavour.
    PtrToPtr,

    /// Reinterpret the bytes of a value as another type of the same size.
    Transmute,
};

enum struct mirv::AggregateKind : u8 {
    Tuple,
    Array,
    Struct,
    Enum,
};

struct mirv::rv::Use {
    Operand op;
};

struct mirv::rv::Ref {
    PlaceExpr place;
    bool mutable_ = false;
};

struct mirv::rv::AddressOf {
    PlaceExpr place;
    bool mutable_ = false;
};

struct mirv::rv::Binary {
    BinOp op;
    Operand lhs, rhs;
};

/// Arithmetic that produces a '(result, overflowed)' pair.
struct mirv::rv::CheckedBinary {
    BinOp op;
    Operand lhs, rhs;
};

struct mirv::rv::Unary {
    UnOp op;
    Operand val;
};

struct mirv::rv::Aggregate {
    AggregateKind kind;
    Type type;

    /// Variant index for enum aggregates.
    u32 variant = 0;
    SmallVector<Operand, 4> ops;
};

struct mirv::rv::Cast {
    CastKind kind;
    Operand op;
    Type to;
};

/// Length of an array or slice.
struct mirv::rv::Len {
    PlaceExpr place;
};

/// An array that repeats a single value.
struct mirv::rv::Repeat {
    Operand op;
    Type type;
};

/// Read the discriminant of an enum.
struct mirv::rv::Discriminant {
    PlaceExpr place;
};

/// Allocate uninitialised heap memory for a value; yields a box.
struct mirv::rv::Box {
    Type type;
};

namespace mirv {
using Rvalue = Variant< // clang-format off
    rv::Use,
    rv::Ref,
    rv::AddressOf,
    rv::Binary,
    rv::CheckedBinary,
    rv::Unary,
    rv::Aggregate,
    rv::Cast,
    rv::Len,
    rv::Repeat,
    rv::Discriminant,
    rv::Box
>; // clang-format on
}

// ============================================================================
//  Statements and Terminators
// ============================================================================
struct mirv::stmt::Assign {
    PlaceExpr place;
    Rvalue value;
};

/// Raise a program abort with a message if a condition is not
/// equal to an expected value.
struct mirv::stmt::Assert {
    Operand cond;
    bool expected = true;
    std::string message;
};

struct mirv::stmt::SetDiscriminant {
    PlaceExpr place;
    u32 variant;
};

struct mirv::stmt::StorageLive {
    LocalId local;
};

struct mirv::stmt::StorageDead {
    LocalId local;
};

struct mirv::stmt::Nop {};

struct mirv::Statement {
    Variant< // clang-format off
        stmt::Assign,
        stmt::Assert,
        stmt::SetDiscriminant,
        stmt::StorageLive,
        stmt::StorageDead,
        stmt::Nop
    > kind; // clang-format on
};

struct mirv::term::Goto {
    BlockId target;
};

struct mirv::term::SwitchInt {
    Operand discr;
    SmallVector<std::pair<APInt, BlockId>, 4> targets;
    std::optional<BlockId> otherwise;
};

struct mirv::term::Call {
    /// A procedure constant or a function pointer.
    Operand callee;
    SmallVector<Operand, 4> args;
    PlaceExpr dest;

    /// Where to continue after the call returns. Calls that
    /// never return have no target.
    std::optional<BlockId> target;

    /// If set, a program abort that unwinds out of the callee
    /// resumes normal execution at this block.
    std::optional<BlockId> unwind;
};

struct mirv::term::Return {};

struct mirv::term::Drop {
    PlaceExpr place;
    BlockId target;
};

struct mirv::term::Unreachable {};

/// Continue unwinding with the abort that was caught by this frame.
struct mirv::term::Resume {};

/// Start unwinding with a new program abort.
struct mirv::term::Abort {
    std::string message;
};

struct mirv::Terminator {
    Variant< // clang-format off
        term::Goto,
        term::SwitchInt,
        term::Call,
        term::Return,
        term::Drop,
        term::Unreachable,
        term::Resume,
        term::Abort
    > kind{term::Unreachable{}}; // clang-format on
};

// ============================================================================
//  Procedures and Modules
// ============================================================================
struct mirv::Local {
    Type type;
    std::string name;
};

struct mirv::BasicBlock {
    SmallVector<Statement, 8> stmts;
    Terminator term;
};

/// A procedure.
///
/// Local 0 holds the return value; locals 1 through the argument
/// count hold the arguments.
class mirv::Proc {
    MIRV_IMMOVABLE(Proc);

    friend Module;

    std::string proc_name;
    u32 num_args = 0;

    explicit Proc(std::string name) : proc_name{std::move(name)} {}

public:
    SmallVector<Local, 8> locals;
    std::vector<BasicBlock> blocks;

    /// Get the argument locals.
    [[nodiscard]] auto args() const -> ArrayRef<Local> {
        return ArrayRef<Local>(locals).slice(1, num_args);
    }

    [[nodiscard]] auto arg_count() const -> u32 { return num_args; }

    /// Get a block by id.
    [[nodiscard]] auto block(BlockId id) const -> const BasicBlock& { return blocks[id]; }

    /// Get a local by id.
    [[nodiscard]] auto local(LocalId id) const -> const Local& { return locals[id]; }

    [[nodiscard]] auto name() const -> StringRef { return proc_name; }

    [[nodiscard]] auto ret_type() const -> Type { return locals.front().type; }

    void set_arg_count(u32 n) { num_args = n; }
};

/// A global variable.
struct mirv::Static {
    std::string name;
    Type type;

    /// Constant initialiser; if there is none, the procedure named
    /// by 'init_proc' is run to compute the initial value.
    std::optional<Constant> init;
    std::string init_proc;

    /// Statics that are not mutable are frozen once initialised.
    bool mutable_ = false;
};

/// A module: procedures, statics, and the types they use.
class mirv::Module {
    MIRV_IMMOVABLE(Module);

    friend TypeBase;

    llvm::BumpPtrAllocator alloc;
    llvm::StringSaver saver{alloc};

    std::vector<std::unique_ptr<Proc>> all_procs;
    std::vector<std::unique_ptr<Static>> all_statics;
    StringMap<Proc*> procs_by_name;
    StringMap<Static*> statics_by_name;

public:
    FoldingSet<IntType> int_types;
    FoldingSet<PtrType> ptr_types;
    FoldingSet<FnPtrType> fn_ptr_types;
    FoldingSet<ArrayType> array_types;
    FoldingSet<SliceType> slice_types;
    FoldingSet<TupleType> tuple_types;

    const Type BoolTy;
    const Type CharTy;
    const Type UnitTy;
    const Type I8Ty, I16Ty, I32Ty, I64Ty, I128Ty, IsizeTy;
    const Type U8Ty, U16Ty, U32Ty, U64Ty, U128Ty, UsizeTy;

    Module();
    ~Module();

    /// Allocate memory that lives as long as the module.
    template <typename T>
    [[nodiscard]] auto allocate_copy(ArrayRef<T> data) -> ArrayRef<T> {
        static_assert(std::is_trivially_destructible_v<T>);
        if (data.empty()) return {};
        auto* mem = alloc.Allocate<T>(data.size());
        std::uninitialized_copy(data.begin(), data.end(), mem);
        return {mem, data.size()};
    }

    /// Create a procedure. Its name must be unique.
    auto create_proc(StringRef name) -> Proc&;

    /// Create a static. Its name must be unique.
    auto create_static(StringRef name, Type type) -> Static&;

    /// Print the module, with formatting codes.
    [[nodiscard]] auto print() const -> SmallUnrenderedString;

    /// Dump the module to stderr.
    void dump(bool use_colours = false) const;

    /// Find a procedure by name.
    [[nodiscard]] auto proc(StringRef name) const -> Proc*;

    [[nodiscard]] auto procs() const -> ArrayRef<std::unique_ptr<Proc>> { return all_procs; }

    /// Save a string in the module.
    [[nodiscard]] auto save(StringRef s) -> StringRef { return saver.save(s); }

    /// Find a static by name.
    [[nodiscard]] auto static_(StringRef name) const -> Static*;

    [[nodiscard]] auto statics() const -> ArrayRef<std::unique_ptr<Static>> { return all_statics; }
};

namespace mirv {
/// Print a single statement or terminator, with formatting codes.
auto PrintStatement(const Proc& proc, const Statement& s) -> SmallUnrenderedString;
auto PrintTerminator(const Proc& proc, const Terminator& t) -> SmallUnrenderedString;

/// Print a procedure, with formatting codes.
auto PrintProc(const Proc& proc) -> SmallUnrenderedString;

/// Check that a module is well-formed. Returns a description of
/// the first problem that was found, if any.
auto Verify(const Module& mod) -> std::optional<std::pair<Location, std::string>>;
}

#endif // MIRV_IR_IR_HH
