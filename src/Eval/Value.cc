#include <mirv/Eval/Value.hh>

using namespace mirv;
using namespace mirv::eval;

static void PrintScalar(SmallUnrenderedString& out, const Scalar& s) {
    std::visit(utils::Overloaded{
        [&](const APInt& i) { out += std::format("%5({}%)", llvm::toString(i, 10, false)); },
        [&](const Pointer& p) { out += std::format("%4({}%)", p.str()); },
    }, s);
}

auto Immediate::print() const -> SmallUnrenderedString {
    SmallUnrenderedString out;
    if (is_zst()) {
        out += "()";
        return out;
    }

    if (not is_pair()) {
        PrintScalar(out, first());
        return out;
    }

    out += "(";
    PrintScalar(out, first());
    out += ", ";
    PrintScalar(out, second());
    out += ")";
    return out;
}

auto Value::print() const -> SmallUnrenderedString {
    SmallUnrenderedString out;
    if (is_mem()) {
        auto& m = mem();
        out += std::format("%1(place%) %4({}%)", m.ptr.str());
        if (m.len) out += std::format(" %1(len%) %5({}%)", *m.len);
    } else {
        out += imm().print();
    }

    out += std::format(": {}", ty->print());
    return out;
}
