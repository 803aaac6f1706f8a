#include <mirv/IR/Builder.hh>

using namespace mirv;

ProcBuilder::ProcBuilder(Module& mod, StringRef name, Type ret, ArrayRef<Type> params)
    : mod{mod}, p{mod.create_proc(name)} {
    p.locals.push_back(Local{ret, "ret"});
    for (auto t : params) p.locals.push_back(Local{t, ""});
    p.set_arg_count(u32(params.size()));
    p.blocks.emplace_back();
}

auto ProcBuilder::block() -> BlockId {
    p.blocks.emplace_back();
    return BlockId(p.blocks.size() - 1);
}

auto ProcBuilder::local(Type ty, StringRef name) -> LocalId {
    p.locals.push_back(Local{ty, name.str()});
    return LocalId(p.locals.size() - 1);
}

void ProcBuilder::Add(Statement s) {
    p.blocks[insert].stmts.push_back(std::move(s));
}

void ProcBuilder::Terminate(Terminator t) {
    p.blocks[insert].term = std::move(t);
}

// ============================================================================
//  Operands
// ============================================================================
auto ProcBuilder::bool_(bool value) -> Operand {
    return Operand::Const(Constant{mod.BoolTy, APInt(8, value ? 1 : 0)});
}

auto ProcBuilder::bytes(StringRef data) -> Operand {
    auto ty = PtrType::Get(mod, SliceType::Get(mod, mod.U8Ty), PtrKind::Ref, false);
    return Operand::Const(Constant{ty, Constant::Bytes{data.str()}});
}

auto ProcBuilder::char_(u32 value) -> Operand {
    return Operand::Const(Constant{mod.CharTy, APInt(32, value)});
}

auto ProcBuilder::int_(Type ty, i64 value) -> Operand {
    auto i = cast<IntType>(ty);

    // The width of pointer-sized integers is not known until a target
    // is picked; the evaluator adjusts constants to the right width.
    auto bits = i->pointer_sized() ? 64 : unsigned(i->bit_width().bits());
    return Operand::Const(Constant{ty, APInt(bits, u64(value), i->signed_())});
}

auto ProcBuilder::proc_ref(StringRef name) -> Operand {
    Type ret = mod.UnitTy;
    SmallVector<Type> params;
    if (auto callee = mod.proc(name)) {
        ret = callee->ret_type();
        for (const auto& a : callee->args()) params.push_back(a.type);
    }

    return Operand::Const(Constant{FnPtrType::Get(mod, ret, params), Constant::ProcRef{mod.save(name)}});
}

auto ProcBuilder::static_ref(StringRef name, Type ptr_type) -> Operand {
    return Operand::Const(Constant{ptr_type, Constant::StaticRef{mod.save(name)}});
}

auto ProcBuilder::unit() -> Operand {
    return Operand::Const(Constant::Zst(mod.UnitTy));
}

// ============================================================================
//  Statements
// ============================================================================
void ProcBuilder::assert_(Operand cond, bool expected, std::string message) {
    Add(Statement{stmt::Assert{std::move(cond), expected, std::move(message)}});
}

void ProcBuilder::assign(PlaceExpr place, Rvalue value) {
    Add(Statement{stmt::Assign{std::move(place), std::move(value)}});
}

void ProcBuilder::nop() {
    Add(Statement{stmt::Nop{}});
}

void ProcBuilder::set_discriminant(PlaceExpr place, u32 variant) {
    Add(Statement{stmt::SetDiscriminant{std::move(place), variant}});
}

void ProcBuilder::storage_dead(LocalId local) {
    Add(Statement{stmt::StorageDead{local}});
}

void ProcBuilder::storage_live(LocalId local) {
    Add(Statement{stmt::StorageLive{local}});
}

// ============================================================================
//  Terminators
// ============================================================================
void ProcBuilder::abort(std::string message) {
    Terminate(Terminator{term::Abort{std::move(message)}});
}

void ProcBuilder::call(
    Operand callee,
    SmallVector<Operand, 4> args,
    PlaceExpr dest,
    std::optional<BlockId> target,
    std::optional<BlockId> unwind
) {
    Terminate(Terminator{term::Call{
        std::move(callee),
        std::move(args),
        std::move(dest),
        target,
        unwind,
    }});
}

void ProcBuilder::drop(PlaceExpr place, BlockId target) {
    Terminate(Terminator{term::Drop{std::move(place), target}});
}

void ProcBuilder::goto_(BlockId target) {
    Terminate(Terminator{term::Goto{target}});
}

void ProcBuilder::resume() {
    Terminate(Terminator{term::Resume{}});
}

void ProcBuilder::ret() {
    Terminate(Terminator{term::Return{}});
}

void ProcBuilder::switch_int(
    Operand discr,
    ArrayRef<std::pair<u64, BlockId>> targets,
    std::optional<BlockId> otherwise
) {
    term::SwitchInt s;
    s.discr = std::move(discr);
    for (auto [val, target] : targets) s.targets.emplace_back(APInt(128, val), target);
    s.otherwise = otherwise;
    Terminate(Terminator{std::move(s)});
}

void ProcBuilder::unreachable() {
    Terminate(Terminator{term::Unreachable{}});
}
