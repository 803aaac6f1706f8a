#ifndef MIRV_IR_BUILDER_HH
#define MIRV_IR_BUILDER_HH

#include <mirv/IR/IR.hh>

namespace mirv {
class ProcBuilder;
}

/// Helper to construct procedures one block at a time.
///
/// A builder always has an insert point; statements are appended to
/// it, and setting a terminator does not move it.
class mirv::ProcBuilder {
    Module& mod;
    Proc& p;
    BlockId insert = 0;

public:
    ProcBuilder(Module& mod, StringRef name, Type ret, ArrayRef<Type> params = {});

    /// Get the local of the i-th argument, starting at 0.
    [[nodiscard]] static auto arg(u32 i) -> LocalId { return i + 1; }

    /// Get the return local.
    [[nodiscard]] static auto ret_local() -> LocalId { return 0; }

    /// Create a new block. This does not change the insert point.
    [[nodiscard]] auto block() -> BlockId;

    /// Get the block that is currently being inserted into.
    [[nodiscard]] auto insert_point() const -> BlockId { return insert; }

    /// Create a new local.
    [[nodiscard]] auto local(Type ty, StringRef name = "") -> LocalId;

    /// Get the module.
    [[nodiscard]] auto module() -> Module& { return mod; }

    /// Get the procedure.
    [[nodiscard]] auto proc() -> Proc& { return p; }

    /// Set the block to insert into.
    void set_insert_point(BlockId b) { insert = b; }

    // Constants and operands.
    [[nodiscard]] auto bool_(bool value) -> Operand;
    [[nodiscard]] auto bytes(StringRef data) -> Operand;
    [[nodiscard]] auto char_(u32 value) -> Operand;
    [[nodiscard]] static auto copy(PlaceExpr p) -> Operand { return Operand::Copy(std::move(p)); }
    [[nodiscard]] static auto int_(Type ty, i64 value) -> Operand;
    [[nodiscard]] static auto move(PlaceExpr p) -> Operand { return Operand::Move(std::move(p)); }
    [[nodiscard]] auto proc_ref(StringRef name) -> Operand;
    [[nodiscard]] auto static_ref(StringRef name, Type ptr_type) -> Operand;
    [[nodiscard]] auto unit() -> Operand;

    // Statements.
    void assert_(Operand cond, bool expected, std::string message);
    void assign(PlaceExpr place, Rvalue value);
    void nop();
    void set_discriminant(PlaceExpr place, u32 variant);
    void storage_dead(LocalId local);
    void storage_live(LocalId local);

    // Terminators.
    void abort(std::string message);
    void call(
        Operand callee,
        SmallVector<Operand, 4> args,
        PlaceExpr dest,
        std::optional<BlockId> target,
        std::optional<BlockId> unwind = std::nullopt
    );
    void drop(PlaceExpr place, BlockId target);
    void goto_(BlockId target);
    void resume();
    void ret();
    void switch_int(
        Operand discr,
        ArrayRef<std::pair<u64, BlockId>> targets,
        std::optional<BlockId> otherwise
    );
    void unreachable();

private:
    void Add(Statement s);
    void Terminate(Terminator t);
};

#endif // MIRV_IR_BUILDER_HH
