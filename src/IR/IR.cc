#include <mirv/IR/IR.hh>

using namespace mirv;

// ============================================================================
//  Module
// ============================================================================
Module::Module()
    : BoolTy{new (*this) BoolType},
      CharTy{new (*this) CharType},
      UnitTy{TupleType::Get(*this, {})},
      I8Ty{IntType::Get(*this, Size::Bits(8), true)},
      I16Ty{IntType::Get(*this, Size::Bits(16), true)},
      I32Ty{IntType::Get(*this, Size::Bits(32), true)},
      I64Ty{IntType::Get(*this, Size::Bits(64), true)},
      I128Ty{IntType::Get(*this, Size::Bits(128), true)},
      IsizeTy{IntType::Get(*this, Size::Bits(0), true)},
      U8Ty{IntType::Get(*this, Size::Bits(8), false)},
      U16Ty{IntType::Get(*this, Size::Bits(16), false)},
      U32Ty{IntType::Get(*this, Size::Bits(32), false)},
      U64Ty{IntType::Get(*this, Size::Bits(64), false)},
      U128Ty{IntType::Get(*this, Size::Bits(128), false)},
      UsizeTy{IntType::Get(*this, Size::Bits(0), false)} {}

Module::~Module() = default;

auto Module::create_proc(StringRef name) -> Proc& {
    Assert(not procs_by_name.contains(name), "Duplicate procedure '{}'", name);
    auto* p = all_procs.emplace_back(new Proc(name.str())).get();
    procs_by_name[p->name()] = p;
    return *p;
}

auto Module::create_static(StringRef name, Type type) -> Static& {
    Assert(not statics_by_name.contains(name), "Duplicate static '{}'", name);
    auto* s = all_statics.emplace_back(std::make_unique<Static>()).get();
    s->name = name.str();
    s->type = type;
    statics_by_name[s->name] = s;
    return *s;
}

void Module::dump(bool use_colours) const {
    std::print(stderr, "{}", text::RenderColours(use_colours, print().str()));
}

auto Module::proc(StringRef name) const -> Proc* {
    return procs_by_name.lookup(name);
}

auto Module::static_(StringRef name) const -> Static* {
    return statics_by_name.lookup(name);
}
