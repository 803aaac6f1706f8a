#include <mirv/IR/IR.hh>
#include <mirv/IR/Type.hh>

using namespace mirv;

// ============================================================================
//  Helpers
// ============================================================================
template <typename T, typename... Args>
auto GetOrCreateType(FoldingSet<T>& Set, auto CreateNew, Args&&... args) -> T* {
    FoldingSetNodeID ID;
    T::Profile(ID, std::forward<Args>(args)...);

    void* pos = nullptr;
    auto* type = Set.FindNodeOrInsertPos(ID, pos);
    if (not type) {
        type = CreateNew();
        Set.InsertNode(type, pos);
    }

    return type;
}

// ============================================================================
//  Type
// ============================================================================
void* TypeBase::operator new(usz size, Module& mod) {
    return mod.alloc.Allocate(size, alignof(TypeBase));
}

bool TypeBase::is_unit() const {
    auto t = dyn_cast<TupleType>(this);
    return t and t->fields().empty();
}

bool TypeBase::needs_drop() const {
    switch (kind()) {
        case Kind::Bool:
        case Kind::Char:
        case Kind::Int:
        case Kind::FnPtr:
            return false;

        case Kind::Ptr:
            return cast<PtrType>(this)->ptr_kind() == PtrKind::Box;

        case Kind::Array: {
            auto a = cast<ArrayType>(this);
            return a->dimension() != 0 and a->elem()->needs_drop();
        }

        case Kind::Slice:
            return cast<SliceType>(this)->elem()->needs_drop();

        case Kind::Tuple:
            return llvm::any_of(cast<TupleType>(this)->fields(), [](Type t) { return t->needs_drop(); });

        case Kind::Struct: {
            auto s = cast<StructType>(this);
            if (not s->drop_proc().empty()) return true;
            return llvm::any_of(s->fields(), [](const FieldDecl& f) { return f.type->needs_drop(); });
        }

        case Kind::Enum: {
            auto e = cast<EnumType>(this);
            if (not e->drop_proc().empty()) return true;
            return llvm::any_of(e->variants(), [](const VariantDecl& v) {
                return llvm::any_of(v.fields, [](Type t) { return t->needs_drop(); });
            });
        }
    }

    Unreachable("Invalid type kind");
}

auto TypeBase::print() const -> SmallUnrenderedString {
    SmallUnrenderedString out;
    switch (kind()) {
        case Kind::Bool: out += "%6(bool%)"; break;
        case Kind::Char: out += "%6(char%)"; break;
        case Kind::Int: {
            auto i = cast<IntType>(this);
            auto prefix = i->signed_() ? 'i' : 'u';
            if (i->pointer_sized()) out += std::format("%6({}size%)", prefix);
            else out += std::format("%6({}{}%)", prefix, i->bit_width().bits());
        } break;

        case Kind::Ptr: {
            auto p = cast<PtrType>(this);
            switch (p->ptr_kind()) {
                case PtrKind::Raw: out += p->mutable_() ? "%1(*mut%) " : "%1(*const%) "; break;
                case PtrKind::Ref: out += p->mutable_() ? "%1(&mut%) " : "%1(&%)"; break;
                case PtrKind::Box: out += "%6(Box%)<"; break;
            }
            out += p->elem()->print();
            if (p->ptr_kind() == PtrKind::Box) out += ">";
        } break;

        case Kind::FnPtr: {
            auto f = cast<FnPtrType>(this);
            out += "%1(fn%)(";
            bool first = true;
            for (auto p : f->params()) {
                if (not first) out += ", ";
                first = false;
                out += p->print();
            }
            out += ") -> ";
            out += f->ret_type()->print();
        } break;

        case Kind::Array: {
            auto a = cast<ArrayType>(this);
            out += "[";
            out += a->elem()->print();
            out += std::format("; %5({}%)]", a->dimension());
        } break;

        case Kind::Slice:
            out += "[";
            out += cast<SliceType>(this)->elem()->print();
            out += "]";
            break;

        case Kind::Tuple: {
            auto fields = cast<TupleType>(this)->fields();
            out += "(";
            for (usz i = 0; i < fields.size(); i++) {
                if (i != 0) out += ", ";
                out += fields[i]->print();
            }
            if (fields.size() == 1) out += ",";
            out += ")";
        } break;

        case Kind::Struct:
            out += std::format("%6({}%)", cast<StructType>(this)->name());
            break;

        case Kind::Enum:
            out += std::format("%6({}%)", cast<EnumType>(this)->name());
            break;
    }

    return out;
}

auto TypeBase::str(bool use_colours) const -> std::string {
    return text::RenderColours(use_colours, print().str());
}

// ============================================================================
//  Types
// ============================================================================
auto ArrayType::Get(Module& mod, Type elem, u64 count) -> ArrayType* {
    auto CreateNew = [&] { return new (mod) ArrayType{elem, count}; };
    return GetOrCreateType(mod.array_types, CreateNew, elem, count);
}

void ArrayType::Profile(FoldingSetNodeID& ID, Type elem, u64 count) {
    ID.AddPointer(elem.ptr());
    ID.AddInteger(count);
}

bool EnumType::fieldless() const {
    return llvm::all_of(variants(), [](const VariantDecl& v) { return v.fields.empty(); });
}

auto EnumType::find_variant(i64 discriminant) const -> std::optional<u32> {
    auto vs = variants();
    for (usz i = 0; i < vs.size(); i++)
        if (vs[i].discriminant == discriminant)
            return u32(i);
    return std::nullopt;
}

auto EnumType::Create(
    Module& mod,
    StringRef name,
    ArrayRef<VariantDecl> variants,
    IntType* tag_type,
    StringRef drop_proc
) -> EnumType* {
    // Pick the smallest tag that can represent every discriminant.
    if (not tag_type) {
        i64 min = 0, max = 0;
        for (const auto& v : variants) {
            min = std::min(min, v.discriminant);
            max = std::max(max, v.discriminant);
        }

        bool is_signed = min < 0;
        u64 bits = 8;
        for (; bits < 64; bits *= 2) {
            if (is_signed) {
                auto lo = -(i64(1) << (bits - 1));
                auto hi = (i64(1) << (bits - 1)) - 1;
                if (min >= lo and max <= hi) break;
            } else if (u64(max) < (u64(1) << bits)) {
                break;
            }
        }

        tag_type = IntType::Get(mod, Size::Bits(bits), is_signed);
    }

    SmallVector<VariantDecl> saved;
    for (const auto& v : variants) {
        saved.push_back(VariantDecl{
            mod.save(v.name),
            v.discriminant,
            mod.allocate_copy(v.fields),
        });
    }

    return new (mod) EnumType{
        mod.save(name),
        mod.allocate_copy(ArrayRef<VariantDecl>(saved)),
        tag_type,
        mod.save(drop_proc),
    };
}

auto FnPtrType::Get(Module& mod, Type ret, ArrayRef<Type> params) -> FnPtrType* {
    auto CreateNew = [&] { return new (mod) FnPtrType{ret, mod.allocate_copy(params)}; };
    return GetOrCreateType(mod.fn_ptr_types, CreateNew, ret, params);
}

void FnPtrType::Profile(FoldingSetNodeID& ID, Type ret, ArrayRef<Type> params) {
    ID.AddPointer(ret.ptr());
    ID.AddInteger(params.size());
    for (auto p : params) ID.AddPointer(p.ptr());
}

auto IntType::Get(Module& mod, Size bits, bool is_signed) -> IntType* {
    auto CreateNew = [&] { return new (mod) IntType{bits, is_signed}; };
    return GetOrCreateType(mod.int_types, CreateNew, bits, is_signed);
}

void IntType::Profile(FoldingSetNodeID& ID, Size bits, bool is_signed) {
    ID.AddInteger(bits.bits());
    ID.AddBoolean(is_signed);
}

auto PtrType::Get(Module& mod, Type pointee, PtrKind kind, bool is_mutable) -> PtrType* {
    auto CreateNew = [&] { return new (mod) PtrType{pointee, kind, is_mutable}; };
    return GetOrCreateType(mod.ptr_types, CreateNew, pointee, kind, is_mutable);
}

void PtrType::Profile(FoldingSetNodeID& ID, Type pointee, PtrKind kind, bool is_mutable) {
    ID.AddPointer(pointee.ptr());
    ID.AddInteger(std::to_underlying(kind));
    ID.AddBoolean(is_mutable);
}

auto SliceType::Get(Module& mod, Type elem) -> SliceType* {
    auto CreateNew = [&] { return new (mod) SliceType{elem}; };
    return GetOrCreateType(mod.slice_types, CreateNew, elem);
}

void SliceType::Profile(FoldingSetNodeID& ID, Type elem) {
    ID.AddPointer(elem.ptr());
}

auto StructType::Create(
    Module& mod,
    StringRef name,
    ArrayRef<FieldDecl> fields,
    StringRef drop_proc
) -> StructType* {
    SmallVector<FieldDecl> saved;
    for (const auto& f : fields) saved.push_back(FieldDecl{mod.save(f.name), f.type});
    return new (mod) StructType{
        mod.save(name),
        mod.allocate_copy(ArrayRef<FieldDecl>(saved)),
        mod.save(drop_proc),
    };
}

auto TupleType::Get(Module& mod, ArrayRef<Type> elems) -> TupleType* {
    auto CreateNew = [&] { return new (mod) TupleType{mod.allocate_copy(elems)}; };
    return GetOrCreateType(mod.tuple_types, CreateNew, elems);
}

void TupleType::Profile(FoldingSetNodeID& ID, ArrayRef<Type> elems) {
    ID.AddInteger(elems.size());
    for (auto e : elems) ID.AddPointer(e.ptr());
}
