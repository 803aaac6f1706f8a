#include <mirv/IR/IR.hh>

using namespace mirv;

namespace {
struct Verifier {
    const Module& mod;
    const Proc* proc = nullptr;
    Location where;
    std::optional<std::pair<Location, std::string>> problem;

    explicit Verifier(const Module& mod) : mod{mod} {}

    template <typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args) {
        if (problem) return;
        problem.emplace(where, std::format(fmt, std::forward<Args>(args)...));
    }

    void verify_block_id(BlockId id);
    void verify_local(LocalId id);
    void verify_operand(const Operand& o);
    void verify_place(const PlaceExpr& p);
    void verify_proc(const Proc& p);
    void verify_rvalue(const Rvalue& rv);
    void verify_static(const Static& s);
    void verify_stmt(const Statement& s);
    void verify_term(const Terminator& t);
};
} // namespace

void Verifier::verify_block_id(BlockId id) {
    if (id >= proc->blocks.size()) Error("Branch to nonexistent block bb{}", id);
}

void Verifier::verify_local(LocalId id) {
    if (id >= proc->locals.size()) Error("Use of nonexistent local _{}", id);
}

void Verifier::verify_operand(const Operand& o) {
    if (o.kind() != Operand::Kind::Const) return verify_place(o.place());
    const auto& c = o.constant();
    if (not c.type) return Error("Constant without a type");
    if (auto p = std::get_if<Constant::StaticRef>(&c.value); p and not mod.static_(p->name))
        Error("Reference to unknown static '{}'", p->name);
}

void Verifier::verify_place(const PlaceExpr& p) {
    verify_local(p.local);
    for (const auto& proj : p.projections)
        if (proj.kind == Projection::Kind::Index)
            verify_local(proj.index);
}

void Verifier::verify_proc(const Proc& p) {
    proc = &p;
    where = Location{p.name(), 0, 0};
    if (p.locals.empty()) return Error("Procedure '{}' has no return local", p.name());
    if (p.arg_count() + 1 > p.locals.size()) return Error("Procedure '{}' has fewer locals than arguments", p.name());
    if (p.blocks.empty()) return Error("Procedure '{}' has no blocks", p.name());
    for (const auto& l : p.locals) {
        if (not l.type) return Error("Local without a type in '{}'", p.name());
        if (l.type->is_unsized()) return Error("Local of unsized type '{}' in '{}'", l.type, p.name());
    }

    for (u32 b = 0; b < p.blocks.size(); b++) {
        const auto& block = p.blocks[b];
        for (u32 s = 0; s < block.stmts.size(); s++) {
            where = Location{p.name(), b, s};
            verify_stmt(block.stmts[s]);
        }

        where = Location{p.name(), b, u32(block.stmts.size())};
        verify_term(block.term);
    }
}

void Verifier::verify_rvalue(const Rvalue& value) {
    std::visit(utils::Overloaded{
        [&](const rv::Use& u) { verify_operand(u.op); },
        [&](const rv::Ref& r) { verify_place(r.place); },
        [&](const rv::AddressOf& r) { verify_place(r.place); },
        [&](const rv::Binary& b) {
            verify_operand(b.lhs);
            verify_operand(b.rhs);
        },
        [&](const rv::CheckedBinary& b) {
            verify_operand(b.lhs);
            verify_operand(b.rhs);
        },
        [&](const rv::Unary& u) { verify_operand(u.val); },
        [&](const rv::Aggregate& a) {
            if (not a.type) return Error("Aggregate without a type");
            if (a.kind == AggregateKind::Enum and not isa<EnumType>(a.type))
                return Error("Enum aggregate of non-enum type '{}'", a.type);
            for (const auto& o : a.ops) verify_operand(o);
        },
        [&](const rv::Cast& c) {
            if (not c.to) return Error("Cast without a target type");
            verify_operand(c.op);
        },
        [&](const rv::Len& l) { verify_place(l.place); },
        [&](const rv::Repeat& r) {
            if (not r.type or not isa<ArrayType>(r.type)) return Error("Repeat must produce an array");
            verify_operand(r.op);
        },
        [&](const rv::Discriminant& d) { verify_place(d.place); },
        [&](const rv::Box& b) {
            if (not b.type or b.type->is_unsized()) Error("Cannot box an unsized type");
        },
    }, value);
}

void Verifier::verify_static(const Static& s) {
    where = Location{};
    if (not s.type) return Error("Static '{}' has no type", s.name);
    if (s.init.has_value() == not s.init_proc.empty())
        return Error("Static '{}' must have exactly one of a constant or an initialiser procedure", s.name);

    if (not s.init_proc.empty()) {
        auto p = mod.proc(s.init_proc);
        if (not p) return Error("Unknown initialiser '{}' for static '{}'", s.init_proc, s.name);
        if (p->arg_count() != 0) return Error("Initialiser '{}' must not take arguments", s.init_proc);
        if (p->ret_type() != s.type) return Error("Initialiser '{}' returns the wrong type", s.init_proc);
    }
}

void Verifier::verify_stmt(const Statement& s) {
    std::visit(utils::Overloaded{
        [&](const stmt::Assign& a) {
            verify_place(a.place);
            verify_rvalue(a.value);
        },
        [&](const stmt::Assert& a) { verify_operand(a.cond); },
        [&](const stmt::SetDiscriminant& d) { verify_place(d.place); },
        [&](const stmt::StorageLive& l) { verify_local(l.local); },
        [&](const stmt::StorageDead& l) { verify_local(l.local); },
        [&](const stmt::Nop&) {},
    }, s.kind);
}

void Verifier::verify_term(const Terminator& t) {
    std::visit(utils::Overloaded{
        [&](const term::Goto& g) { verify_block_id(g.target); },
        [&](const term::SwitchInt& s) {
            verify_operand(s.discr);
            if (s.targets.empty() and not s.otherwise) Error("SwitchInt without targets");
            for (const auto& [_, target] : s.targets) verify_block_id(target);
            if (s.otherwise) verify_block_id(*s.otherwise);
        },
        [&](const term::Call& c) {
            verify_operand(c.callee);
            for (const auto& a : c.args) verify_operand(a);
            verify_place(c.dest);
            if (c.target) verify_block_id(*c.target);
            if (c.unwind) verify_block_id(*c.unwind);

            // Direct calls to IR procedures must pass the right number of arguments.
            if (c.callee.kind() != Operand::Kind::Const) return;
            auto ref = std::get_if<Constant::ProcRef>(&c.callee.constant().value);
            if (not ref) return Error("Callee is not a procedure");
            if (auto callee = mod.proc(ref->name); callee and callee->arg_count() != c.args.size()) {
                Error(
                    "'{}' takes {} arguments, but {} were passed",
                    ref->name,
                    callee->arg_count(),
                    c.args.size()
                );
            }
        },
        [&](const term::Return&) {},
        [&](const term::Drop& d) {
            verify_place(d.place);
            verify_block_id(d.target);
        },
        [&](const term::Unreachable&) {},
        [&](const term::Resume&) {},
        [&](const term::Abort&) {},
    }, t.kind);
}

auto mirv::Verify(const Module& mod) -> std::optional<std::pair<Location, std::string>> {
    Verifier v{mod};
    for (const auto& s : mod.statics()) {
        v.verify_static(*s);
        if (v.problem) return v.problem;
    }

    for (const auto& p : mod.procs()) {
        v.verify_proc(*p);
        if (v.problem) return v.problem;
    }

    return std::nullopt;
}
