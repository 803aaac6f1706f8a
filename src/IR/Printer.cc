#include <mirv/IR/IR.hh>

using namespace mirv;

namespace {
struct Printer {
    const Proc& proc;
    SmallUnrenderedString out;

    explicit Printer(const Proc& proc) : proc{proc} {}

    void print_constant(const Constant& c);
    void print_operand(const Operand& o);
    void print_place(const PlaceExpr& p);
    void print_proc();
    void print_rvalue(const Rvalue& rv);
    void print_stmt(const Statement& s);
    void print_term(const Terminator& t);

    void print_operands(ArrayRef<Operand> ops) {
        bool first = true;
        for (const auto& o : ops) {
            if (first) first = false;
            else out += ", ";
            print_operand(o);
        }
    }
};
} // namespace

static auto BinOpName(BinOp op) -> std::string_view {
    switch (op) {
        case BinOp::Add: return "Add";
        case BinOp::Sub: return "Sub";
        case BinOp::Mul: return "Mul";
        case BinOp::Div: return "Div";
        case BinOp::Rem: return "Rem";
        case BinOp::And: return "BitAnd";
        case BinOp::Or: return "BitOr";
        case BinOp::Xor: return "BitXor";
        case BinOp::Shl: return "Shl";
        case BinOp::Shr: return "Shr";
        case BinOp::Eq: return "Eq";
        case BinOp::Ne: return "Ne";
        case BinOp::Lt: return "Lt";
        case BinOp::Le: return "Le";
        case BinOp::Gt: return "Gt";
        case BinOp::Ge: return "Ge";
        case BinOp::Offset: return "Offset";
    }
    Unreachable();
}

static auto CastKindName(CastKind k) -> std::string_view {
    switch (k) {
        case CastKind::IntToInt: return "IntToInt";
        case CastKind::PtrToInt: return "PtrToInt";
        case CastKind::IntToPtr: return "IntToPtr";
        case CastKind::PtrToPtr: return "PtrToPtr";
        case CastKind::Transmute: return "Transmute";
    }
    Unreachable();
}

void Printer::print_constant(const Constant& c) {
    std::visit(utils::Overloaded{
        [&](std::monostate) { out += "%5(zst%)"; },
        [&](const APInt& i) {
            if (isa<BoolType>(c.type)) out += i.isZero() ? "%1(false%)" : "%1(true%)";
            else {
                auto is_signed = isa<IntType>(c.type) and cast<IntType>(c.type)->signed_();
                out += std::format("%5({}%)", llvm::toString(i, 10, is_signed));
            }
        },
        [&](const Constant::ProcRef& p) { out += std::format("%2({}%)", p.name); },
        [&](const Constant::StaticRef& s) { out += std::format("%3(@{}%)", s.name); },
        [&](const Constant::Bytes& b) {
            std::string escaped;
            llvm::raw_string_ostream os{escaped};
            llvm::printEscapedString(b.data, os);
            out += std::format("%3(\"\002{}\003\"%)", escaped);
        },
    }, c.value);

    out += ": ";
    out += c.type->print();
}

void Printer::print_operand(const Operand& o) {
    switch (o.kind()) {
        case Operand::Kind::Copy:
            out += "%1(copy%) ";
            print_place(o.place());
            return;

        case Operand::Kind::Move:
            out += "%1(move%) ";
            print_place(o.place());
            return;

        case Operand::Kind::Const:
            out += "%1(const%) ";
            print_constant(o.constant());
            return;
    }
    Unreachable();
}

void Printer::print_place(const PlaceExpr& p) {
    // Derefs wrap the place, everything else is a suffix.
    for (const auto& proj : p.projections)
        if (proj.kind == Projection::Kind::Deref)
            out += "(*";

    out += std::format("%8(_{}%)", p.local);
    for (const auto& proj : p.projections) {
        switch (proj.kind) {
            using K = Projection::Kind;
            case K::Deref: out += ")"; break;
            case K::Field: out += std::format(".{}", proj.index); break;
            case K::Index: out += std::format("[%8(_{}%)]", proj.index); break;
            case K::ConstantIndex: out += std::format("[%5({}%)]", proj.index); break;
            case K::Downcast: out += std::format(" as variant#{}", proj.index); break;
        }
    }
}

void Printer::print_proc() {
    out += std::format("%1(proc%) %2({}%)(", proc.name());
    for (u32 i = 1; i <= proc.arg_count(); i++) {
        if (i != 1) out += ", ";
        out += std::format("%8(_{}%): ", i);
        out += proc.local(i).type->print();
    }
    out += ") -> ";
    out += proc.ret_type()->print();
    out += " {\n";

    for (u32 i = proc.arg_count() + 1; i < proc.locals.size(); i++) {
        out += std::format("    %1(let%) %8(_{}%): ", i);
        out += proc.local(i).type->print();
        if (not proc.local(i).name.empty())
            out += std::format("; // \002{}\003", proc.local(i).name);
        out += "\n";
    }

    for (usz b = 0; b < proc.blocks.size(); b++) {
        out += std::format("\n    %3(bb{}%): {{\n", b);
        for (const auto& s : proc.blocks[b].stmts) {
            out += "        ";
            print_stmt(s);
            out += ";\n";
        }
        out += "        ";
        print_term(proc.blocks[b].term);
        out += ";\n    }\n";
    }

    out += "}\n";
}

void Printer::print_rvalue(const Rvalue& value) {
    std::visit(utils::Overloaded{
        [&](const rv::Use& u) { print_operand(u.op); },
        [&](const rv::Ref& r) {
            out += r.mutable_ ? "%1(&mut%) " : "%1(&%)";
            print_place(r.place);
        },
        [&](const rv::AddressOf& r) {
            out += r.mutable_ ? "%1(&raw mut%) " : "%1(&raw const%) ";
            print_place(r.place);
        },
        [&](const rv::Binary& b) {
            out += std::format("{}(", BinOpName(b.op));
            print_operand(b.lhs);
            out += ", ";
            print_operand(b.rhs);
            out += ")";
        },
        [&](const rv::CheckedBinary& b) {
            out += std::format("Checked{}(", BinOpName(b.op));
            print_operand(b.lhs);
            out += ", ";
            print_operand(b.rhs);
            out += ")";
        },
        [&](const rv::Unary& u) {
            out += u.op == UnOp::Not ? "Not(" : "Neg(";
            print_operand(u.val);
            out += ")";
        },
        [&](const rv::Aggregate& a) {
            out += a.type->print();
            if (a.kind == AggregateKind::Enum) {
                auto e = cast<EnumType>(a.type);
                out += std::format("::{}", e->variants()[a.variant].name);
            }
            out += a.kind == AggregateKind::Array ? " [" : " {";
            print_operands(a.ops);
            out += a.kind == AggregateKind::Array ? "]" : "}";
        },
        [&](const rv::Cast& c) {
            print_operand(c.op);
            out += " %1(as%) ";
            out += c.to->print();
            out += std::format(" ({})", CastKindName(c.kind));
        },
        [&](const rv::Len& l) {
            out += "Len(";
            print_place(l.place);
            out += ")";
        },
        [&](const rv::Repeat& r) {
            out += "[";
            print_operand(r.op);
            out += std::format("; %5({}%)]", cast<ArrayType>(r.type)->dimension());
        },
        [&](const rv::Discriminant& d) {
            out += "discriminant(";
            print_place(d.place);
            out += ")";
        },
        [&](const rv::Box& b) {
            out += "Box::<";
            out += b.type->print();
            out += ">::new_uninit()";
        },
    }, value);
}

void Printer::print_stmt(const Statement& s) {
    std::visit(utils::Overloaded{
        [&](const stmt::Assign& a) {
            print_place(a.place);
            out += " = ";
            print_rvalue(a.value);
        },
        [&](const stmt::Assert& a) {
            out += "%1(assert%)(";
            if (not a.expected) out += "!";
            print_operand(a.cond);
            out += std::format(", \"\002{}\003\")", a.message);
        },
        [&](const stmt::SetDiscriminant& d) {
            out += "discriminant(";
            print_place(d.place);
            out += std::format(") = variant#{}", d.variant);
        },
        [&](const stmt::StorageLive& l) { out += std::format("StorageLive(%8(_{}%))", l.local); },
        [&](const stmt::StorageDead& l) { out += std::format("StorageDead(%8(_{}%))", l.local); },
        [&](const stmt::Nop&) { out += "nop"; },
    }, s.kind);
}

void Printer::print_term(const Terminator& t) {
    std::visit(utils::Overloaded{
        [&](const term::Goto& g) { out += std::format("%1(goto%) -> %3(bb{}%)", g.target); },
        [&](const term::SwitchInt& s) {
            out += "%1(switchInt%)(";
            print_operand(s.discr);
            out += ") -> [";
            bool first = true;
            for (const auto& [val, target] : s.targets) {
                if (first) first = false;
                else out += ", ";
                out += std::format("%5({}%): %3(bb{}%)", llvm::toString(val, 10, false), target);
            }
            if (s.otherwise) {
                if (not first) out += ", ";
                out += std::format("otherwise: %3(bb{}%)", *s.otherwise);
            }
            out += "]";
        },
        [&](const term::Call& c) {
            print_place(c.dest);
            out += " = ";
            print_operand(c.callee);
            out += "(";
            print_operands(c.args);
            out += ")";
            if (c.target) out += std::format(" -> %3(bb{}%)", *c.target);
            if (c.unwind) out += std::format(" unwind %3(bb{}%)", *c.unwind);
        },
        [&](const term::Return&) { out += "%1(return%)"; },
        [&](const term::Drop& d) {
            out += "%1(drop%)(";
            print_place(d.place);
            out += std::format(") -> %3(bb{}%)", d.target);
        },
        [&](const term::Unreachable&) { out += "%1(unreachable%)"; },
        [&](const term::Resume&) { out += "%1(resume%)"; },
        [&](const term::Abort& a) { out += std::format("%1(abort%)(\"\002{}\003\")", a.message); },
    }, t.kind);
}

auto mirv::PrintStatement(const Proc& proc, const Statement& s) -> SmallUnrenderedString {
    Printer p{proc};
    p.print_stmt(s);
    return std::move(p.out);
}

auto mirv::PrintTerminator(const Proc& proc, const Terminator& t) -> SmallUnrenderedString {
    Printer p{proc};
    p.print_term(t);
    return std::move(p.out);
}

auto mirv::PrintProc(const Proc& proc) -> SmallUnrenderedString {
    Printer p{proc};
    p.print_proc();
    return std::move(p.out);
}

auto Module::print() const -> SmallUnrenderedString {
    SmallUnrenderedString out;
    for (const auto& s : all_statics) {
        out += std::format(
            "%1(static{}%) %3(@{}%): ",
            s->mutable_ ? " mut" : "",
            s->name
        );
        out += s->type->print();
        if (not s->init_proc.empty()) out += std::format(" = %2({}%)()", s->init_proc);
        out += ";\n";
    }

    for (const auto& p : all_procs) {
        if (not out.empty()) out += "\n";
        out += PrintProc(*p);
    }

    return out;
}
