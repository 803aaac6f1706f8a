#ifndef MIRV_EVAL_MACHINE_HH
#define MIRV_EVAL_MACHINE_HH

#include <mirv/Core/Core.hh>
#include <mirv/Core/Diagnostics.hh>
#include <mirv/Eval/Foreign.hh>
#include <mirv/Eval/Memory.hh>
#include <mirv/Eval/Value.hh>
#include <mirv/IR/IR.hh>
#include <mirv/Layout/Layout.hh>

#include <atomic>

namespace mirv::eval {
class Machine;
class RunResult;
struct DropItem;
struct Frame;
struct LocalSlot;
} // namespace mirv::eval

/// The outcome of running a machine.
class mirv::eval::RunResult {
public:
    enum struct Kind : u8 {
        Returned,
        Exited,
        UndefinedBehaviour,
        Aborted,
        ResourceExhausted,
        Interrupted,
        InternalError,
    };

    Kind kind = Kind::Returned;

    /// The value returned by the entry procedure.
    std::optional<Value> value;

    /// Why evaluation stopped, unless the entry procedure returned.
    std::optional<EvalError> error;

    /// The frames on the stack when evaluation stopped, innermost
    /// first. For aborts, this is the stack at the point where the
    /// abort was raised.
    SmallVector<Location, 4> trace;

    /// Number of steps executed.
    u64 steps = 0;

    /// Whether the program ran to completion.
    [[nodiscard]] bool ok() const { return kind == Kind::Returned or kind == Kind::Exited; }

    /// Check whether this is a given kind of undefined behaviour.
    [[nodiscard]] bool is(ViolationKind k) const { return error and error->is(k); }

    /// Issue diagnostics for this result.
    void report(DiagnosticsEngine& diags) const;

    /// Format this result as a single line of text.
    [[nodiscard]] auto str() const -> std::string;
};

/// Storage for one local of a frame.
struct mirv::eval::LocalSlot {
    /// The local is not live; 'last_alloc' is its old backing storage.
    struct Dead { AllocId last_alloc = 0; };

    /// The local is held in the frame; an empty value is uninitialised.
    struct Direct { std::optional<Immediate> value; };

    /// The local lives in a stack allocation.
    struct Indirect { AllocId alloc; };

    Variant<Dead, Direct, Indirect> state{Dead{}};

    /// Whether the local holds a value that must be dropped.
    bool drop_flag = false;
};

/// A pending piece of drop glue.
struct mirv::eval::DropItem {
    enum struct Kind : u8 {
        /// Drop the value in a place; this expands to more work items.
        DropValue,

        /// Call the drop procedure of a type.
        CallDropFn,

        /// Free the heap memory of a box.
        Dealloc,
    };

    Kind kind;
    Place place;
    StringRef drop_proc{};
};

/// A procedure on the stack.
struct mirv::eval::Frame {
    enum struct Kind : u8 {
        /// The procedure evaluation started with.
        Entry,

        /// An ordinary call.
        Call,

        /// Computes the initial value of a static.
        StaticInit,

        /// A drop procedure called by drop glue.
        DropFn,
    };

    const Proc* proc;
    Kind kind;
    SmallVector<LocalSlot, 8> locals;

    /// Where the return value goes, and where the caller continues.
    std::optional<Place> ret_place;
    std::optional<BlockId> ret_block;
    std::optional<BlockId> unwind_block;

    /// For static initialisers: the static and whether to freeze it.
    AllocId static_alloc = 0;
    bool freeze_static = false;

    /// Current position.
    BlockId block = 0;
    u32 stmt = 0;

    /// Pending drop glue; the last item is run next. Once this is
    /// empty, execution continues at 'drop_target'.
    SmallVector<DropItem, 4> drops;
    std::optional<BlockId> drop_target;

    /// Abort that unwound into this frame and can be resumed.
    std::optional<EvalError> caught;

    /// Whether this frame is being unwound.
    bool unwinding = false;

    Frame(const Proc* proc, Kind kind) : proc{proc}, kind{kind} {}
};

/// An abstract machine that executes procedures and checks every
/// operation for undefined behaviour.
///
/// A machine can only be run once.
class mirv::eval::Machine {
    MIRV_IMMOVABLE(Machine);

    Context& ctx;
    const Module& mod;
    LayoutService& layouts;
    ForeignCallHandler& foreign;
    Memory mem;

    SmallVector<Frame, 16> frames;
    StringMap<AllocId> statics;
    StringMap<AllocId> byte_strings;

    /// Temporaries that are freed once the current statement is done.
    SmallVector<AllocId, 4> temps;

    /// The abort that is currently being unwound, and where it was raised.
    std::optional<EvalError> panic;
    SmallVector<Location, 4> panic_trace;

    std::optional<Value> result;
    std::atomic<bool> interrupted = false;
    u64 steps = 0;
    bool started = false;

public:
    Machine(Context& ctx, const Module& mod, LayoutService& layouts, ForeignCallHandler& foreign);

    /// Get the stack, innermost frame first.
    [[nodiscard]] auto backtrace() const -> SmallVector<Location, 4>;

    [[nodiscard]] auto context() -> Context& { return ctx; }

    /// Ask the machine to stop before its next step. This is the only
    /// function that may be called from another thread.
    void interrupt() { interrupted.store(true, std::memory_order_relaxed); }

    [[nodiscard]] auto layout_service() -> LayoutService& { return layouts; }

    [[nodiscard]] auto memory() -> Memory& { return mem; }
    [[nodiscard]] auto memory() const -> const Memory& { return mem; }

    [[nodiscard]] auto module() const -> const Module& { return mod; }

    /// Read the value stored in a place.
    [[nodiscard]] auto read_value(const Place& place) -> EvalResult<Value>;

    /// Run a procedure until it returns or evaluation stops.
    [[nodiscard]] auto run(StringRef entry, ArrayRef<Value> args = {}) -> RunResult;

    /// Get the number of frames on the stack.
    [[nodiscard]] auto stack_depth() const -> usz { return frames.size(); }

    /// Get the number of steps executed so far.
    [[nodiscard]] auto steps_executed() const -> u64 { return steps; }

    /// Write a value to a place.
    [[nodiscard]] auto write_value(const Place& place, const Value& value) -> EvalResult<>;

private:
    // Machine.cc
    auto Finish(EvalResult<> res) -> RunResult;
    auto InitStatics() -> EvalResult<>;
    auto Loop() -> EvalResult<>;
    auto PopFrame() -> EvalResult<>;
    auto PushFrame(
        const Proc& proc,
        Frame::Kind kind,
        ArrayRef<Value> args,
        std::optional<Place> ret_place
    ) -> EvalResult<>;
    auto Raise(EvalError e) -> EvalResult<>;
    auto Start(StringRef entry, ArrayRef<Value> args) -> EvalResult<>;
    auto Step() -> EvalResult<>;
    auto Unwind() -> EvalResult<>;
    void BeginUnwind(Frame& f);

    // Step.cc
    auto Call(const term::Call& c) -> EvalResult<>;
    auto ExecStatement(const Statement& s) -> EvalResult<>;
    auto ExecTerminator(const Terminator& t) -> EvalResult<>;
    auto FreeTemporaries() -> EvalResult<>;
    auto Return() -> EvalResult<>;
    void Jump(BlockId block);
    void Trace(StringRef what);

    // Place.cc
    auto EvalConstant(const Constant& c) -> EvalResult<Value>;
    auto EvalOperand(const Operand& op) -> EvalResult<Value>;
    auto EvalPlace(const PlaceExpr& p) -> EvalResult<Place>;
    auto ForceAllocate(LocalPlace l) -> EvalResult<MemPlace>;
    auto Project(const Place& base, Projection proj) -> EvalResult<Place>;
    auto ReadDiscriminant(const Place& p) -> EvalResult<u32>;
    auto ReadImmediate(const MemPlace& m, const Layout& l) -> EvalResult<Immediate>;
    auto Slot(LocalPlace l) -> LocalSlot&;
    auto Temporary(Type ty) -> EvalResult<MemPlace>;
    auto ToMem(const Place& p) -> EvalResult<MemPlace>;
    auto WriteDiscriminant(const Place& p, u32 variant) -> EvalResult<>;
    auto WriteImmediate(const MemPlace& m, const Immediate& imm, const Layout& l) -> EvalResult<>;

    // Operator.cc
    auto Binary(BinOp op, const Value& lhs, const Value& rhs, Type ty) -> EvalResult<Value>;
    auto Cast(CastKind kind, const Value& v, Type to) -> EvalResult<Value>;
    auto CheckedBinary(BinOp op, const Value& lhs, const Value& rhs, Type ty) -> EvalResult<Value>;
    auto EvalRvalue(const Rvalue& value, Type ty) -> EvalResult<Value>;
    auto Unary(UnOp op, const Value& v) -> EvalResult<Value>;

    // Drop.cc
    auto Drop(const Place& p, BlockId target) -> EvalResult<>;
    auto FinishDrops() -> EvalResult<>;
    auto StepDrop() -> EvalResult<>;
};

#endif // MIRV_EVAL_MACHINE_HH
