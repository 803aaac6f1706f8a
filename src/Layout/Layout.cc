#include <mirv/Layout/Layout.hh>

using namespace mirv;

bool ScalarLayout::valid(const APInt& value) const {
    switch (validity) {
        case ScalarValidity::Any: return true;
        case ScalarValidity::Bool: return value.ule(1);
        case ScalarValidity::NonNull: return not value.isZero();
        case ScalarValidity::Char:
            if (value.ugt(0x10FFFF)) return false;
            return value.ult(0xD800) or value.ugt(0xDFFF);
    }
    Unreachable();
}

auto Layout::field_offset(u32 i) const -> Size {
    if (is_array()) return stride * u64(i);
    Assert(i < field_offsets.size(), "Field index {} out of range for '{}'", i, type);
    return field_offsets[i];
}

// ============================================================================
//  Default Layout Service
// ============================================================================
auto DefaultLayoutService::layout_of(Type ty) -> const Layout& {
    if (auto it = cache.find(ty); it != cache.end()) return *it->second;
    auto l = Compute(ty);
    auto& ref = *l;
    cache[ty] = std::move(l);
    return ref;
}

auto DefaultLayoutService::IntScalar(const IntType* i) const -> ScalarLayout {
    return ScalarLayout{
        .size = i->pointer_sized() ? dl.pointer_size : i->bit_width(),
        .is_signed = i->signed_(),
    };
}

auto DefaultLayoutService::PointerScalar(bool non_null) const -> ScalarLayout {
    return ScalarLayout{
        .size = dl.pointer_size,
        .is_pointer = true,
        .validity = non_null ? ScalarValidity::NonNull : ScalarValidity::Any,
    };
}

auto DefaultLayoutService::Compute(Type ty) -> std::unique_ptr<Layout> {
    auto l = std::make_unique<Layout>();
    l->type = ty;

    // Helper for types that are a single scalar.
    auto SetScalar = [&](ScalarLayout s, Align a) {
        l->abi = Abi::Scalar;
        l->size = s.size;
        l->align = a;
        l->first = s;
    };

    switch (ty->kind()) {
        case TypeBase::Kind::Bool: {
            ScalarLayout s{.size = Size::Bytes(1), .validity = ScalarValidity::Bool};
            SetScalar(s, Align(1));
            l->niche = Niche{Size(), s, 2, 254};
        } break;

        case TypeBase::Kind::Char: {
            ScalarLayout s{.size = Size::Bytes(4), .validity = ScalarValidity::Char};
            SetScalar(s, Align(4));
            l->niche = Niche{Size(), s, 0x110000, 0xFFFF'FFFF - 0x10FFFF};
        } break;

        case TypeBase::Kind::Int: {
            auto s = IntScalar(cast<IntType>(ty));
            SetScalar(s, std::min(Align(s.size.bytes()), dl.max_int_align));
        } break;

        case TypeBase::Kind::FnPtr: {
            auto s = PointerScalar(true);
            SetScalar(s, dl.pointer_align);
            l->niche = Niche{Size(), s, 0, 1};
        } break;

        case TypeBase::Kind::Ptr: {
            auto p = cast<PtrType>(ty);
            auto s = PointerScalar(p->non_null());
            if (p->is_fat()) {
                l->abi = Abi::ScalarPair;
                l->first = s;
                l->second = ScalarLayout{.size = dl.pointer_size};
                l->second_offset = dl.pointer_size;
                l->size = dl.pointer_size * 2;
                l->align = dl.pointer_align;
                l->field_offsets = {Size(), dl.pointer_size};
            } else {
                SetScalar(s, dl.pointer_align);
            }

            if (p->non_null()) l->niche = Niche{Size(), s, 0, 1};
        } break;

        case TypeBase::Kind::Array: {
            auto a = cast<ArrayType>(ty);
            const auto& el = layout_of(a->elem());
            l->stride = el.size;
            l->count = a->dimension();
            l->size = el.size * a->dimension();
            l->align = el.align;
            if (a->dimension() != 0) l->niche = el.niche;
        } break;

        case TypeBase::Kind::Slice: {
            const auto& el = layout_of(cast<SliceType>(ty)->elem());
            l->stride = el.size;
            l->align = el.align;
        } break;

        case TypeBase::Kind::Tuple:
            ComputeRecord(*l, cast<TupleType>(ty)->fields());
            break;

        case TypeBase::Kind::Struct: {
            SmallVector<Type, 8> fields;
            for (const auto& f : cast<StructType>(ty)->fields()) fields.push_back(f.type);
            ComputeRecord(*l, fields);
        } break;

        case TypeBase::Kind::Enum:
            ComputeEnum(*l, cast<EnumType>(ty));
            break;
    }

    return l;
}

void DefaultLayoutService::ComputeRecord(Layout& l, ArrayRef<Type> fields) {
    Size sz;
    Align a;
    SmallVector<const Layout*, 8> field_layouts;
    for (auto f : fields) {
        const auto& fl = layout_of(f);
        sz = sz.align(fl.align);
        l.field_offsets.push_back(sz);
        field_layouts.push_back(&fl);
        sz += fl.size;
        a = std::max(a, fl.align);

        // Use the first niche we find.
        if (fl.niche and not l.niche) {
            l.niche = fl.niche;
            l.niche->offset += l.field_offsets.back();
        }
    }

    l.size = sz.align(a);
    l.align = a;

    // Records that wrap one or two scalars are passed around as such.
    SmallVector<u32, 2> non_zst;
    for (u32 i = 0; i < field_layouts.size(); i++)
        if (not field_layouts[i]->is_zst())
            non_zst.push_back(i);

    if (non_zst.size() == 1) {
        const auto& fl = *field_layouts[non_zst[0]];
        if (fl.size != l.size or l.field_offsets[non_zst[0]] != Size()) return;
        if (fl.abi == Abi::Scalar or fl.abi == Abi::ScalarPair) {
            l.abi = fl.abi;
            l.first = fl.first;
            l.second = fl.second;
            l.second_offset = fl.second_offset;
        }
    } else if (non_zst.size() == 2) {
        const auto& a0 = *field_layouts[non_zst[0]];
        const auto& a1 = *field_layouts[non_zst[1]];
        if (a0.abi != Abi::Scalar or a1.abi != Abi::Scalar) return;
        if (l.field_offsets[non_zst[0]] != Size()) return;
        l.abi = Abi::ScalarPair;
        l.first = a0.first;
        l.second = a1.first;
        l.second_offset = l.field_offsets[non_zst[1]];
    }
}

void DefaultLayoutService::ComputeEnum(Layout& l, const EnumType* e) {
    auto variants = e->variants();
    l.align = Align(1);
    if (variants.empty()) return;

    // Find the variants that actually store data.
    SmallVector<u32, 2> dataful;
    for (u32 i = 0; i < variants.size(); i++) {
        auto HasData = [&](Type t) { return not layout_of(t).is_zst(); };
        if (llvm::any_of(variants[i].fields, HasData)) dataful.push_back(i);
    }

    // If only one variant has data, try to store the discriminant in
    // a niche of its fields.
    if (dataful.size() == 1 and variants.size() >= 2) {
        u32 untagged = dataful.front();
        Layout rec;
        ComputeRecord(rec, variants[untagged].fields);
        u32 first = untagged == 0 ? 1 : 0;
        u32 last = untagged == variants.size() - 1 ? u32(variants.size() - 2) : u32(variants.size() - 1);
        u64 needed = u64(last - first + 1);
        if (rec.niche and rec.niche->available >= needed) {
            l.size = rec.size;
            l.align = rec.align;
            // Writing a tagged variant only sets the niche, so the other
            // half of a pair would be left uninitialised.
            if (rec.abi == Abi::Scalar) {
                l.abi = Abi::Scalar;
                l.first = rec.first;
            }

            l.tag.encoding = TagEncoding::Niche;
            l.tag.offset = rec.niche->offset;
            l.tag.scalar = rec.niche->scalar;
            l.tag.untagged_variant = untagged;
            l.tag.niche_first = first;
            l.tag.niche_last = last;
            l.tag.niche_start = rec.niche->start;

            // The niche values are valid for the enum itself.
            if (l.abi == Abi::Scalar) l.first.validity = ScalarValidity::Any;

            // Whatever is left over can be used by an enclosing enum.
            if (rec.niche->available > needed) {
                l.niche = rec.niche;
                l.niche->start += needed;
                l.niche->available -= needed;
            }

            for (u32 i = 0; i < variants.size(); i++) {
                auto& v = l.variants.emplace_back(VariantLayout{variants[i].discriminant, {}});
                if (i == untagged) v.field_offsets = rec.field_offsets;
                else v.field_offsets.resize(variants[i].fields.size(), Size());
            }
            return;
        }
    }

    // Otherwise, store the discriminant in a tag before the fields.
    auto tag_scalar = IntScalar(e->tag_type());
    auto tag_align = std::min(Align(tag_scalar.size.bytes()), dl.max_int_align);
    Size max_size = tag_scalar.size;
    Align a = tag_align;
    for (const auto& decl : variants) {
        auto& v = l.variants.emplace_back(VariantLayout{decl.discriminant, {}});
        Size off = tag_scalar.size;
        for (auto f : decl.fields) {
            const auto& fl = layout_of(f);
            off = off.align(fl.align);
            v.field_offsets.push_back(off);
            off += fl.size;
            a = std::max(a, fl.align);
        }
        max_size = std::max(max_size, off);
    }

    l.size = max_size.align(a);
    l.align = a;
    l.tag.encoding = TagEncoding::Direct;
    l.tag.offset = Size();
    l.tag.scalar = tag_scalar;
    if (dataful.empty() and l.size == tag_scalar.size) {
        l.abi = Abi::Scalar;
        l.first = tag_scalar;
    }
}
