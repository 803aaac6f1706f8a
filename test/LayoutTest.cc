#include <mirv/IR/IR.hh>
#include <mirv/Layout/Layout.hh>

#include <gtest/gtest.h>

using namespace mirv;

namespace {
class LayoutTest : public ::testing::Test {
protected:
    Module mod;
    DefaultLayoutService layouts;

    auto Option(Type t) -> Type {
        VariantDecl variants[]{
            {"None", 0, {}},
            {"Some", 1, mod.allocate_copy(ArrayRef<Type>{t})},
        };
        return EnumType::Create(mod, "Option", variants);
    }
};
} // namespace

TEST_F(LayoutTest, Scalars) {
    auto& b = layouts.layout_of(mod.BoolTy);
    EXPECT_EQ(b.size, Size::Bytes(1));
    EXPECT_EQ(b.abi, Abi::Scalar);
    EXPECT_EQ(b.first.validity, ScalarValidity::Bool);

    EXPECT_EQ(layouts.layout_of(mod.CharTy).size, Size::Bytes(4));
    EXPECT_EQ(layouts.layout_of(mod.UsizeTy).size, Size::Bytes(8));
    EXPECT_EQ(layouts.layout_of(mod.I128Ty).align, Align(16));
    EXPECT_TRUE(layouts.layout_of(mod.UnitTy).is_zst());
}

TEST_F(LayoutTest, PointerSizeFollowsTarget) {
    DefaultLayoutService small{DataLayout::Target32()};
    EXPECT_EQ(small.layout_of(mod.UsizeTy).size, Size::Bytes(4));
    EXPECT_EQ(small.layout_of(PtrType::Get(mod, mod.I32Ty)).size, Size::Bytes(4));
    EXPECT_EQ(small.layout_of(mod.I64Ty).align, Align(8));
}

TEST_F(LayoutTest, RecordPadding) {
    FieldDecl fields[]{{"a", mod.U8Ty}, {"b", mod.U32Ty}, {"c", mod.U8Ty}};
    auto s = StructType::Create(mod, "S", fields);
    auto& l = layouts.layout_of(s);
    EXPECT_EQ(l.size, Size::Bytes(12));
    EXPECT_EQ(l.align, Align(4));
    EXPECT_EQ(l.field_offset(0), Size::Bytes(0));
    EXPECT_EQ(l.field_offset(1), Size::Bytes(4));
    EXPECT_EQ(l.field_offset(2), Size::Bytes(8));
    EXPECT_EQ(l.abi, Abi::Aggregate);
}

TEST_F(LayoutTest, PairOfScalars) {
    auto& l = layouts.layout_of(TupleType::Get(mod, {mod.I32Ty, mod.BoolTy}));
    EXPECT_EQ(l.abi, Abi::ScalarPair);
    EXPECT_EQ(l.second_offset, Size::Bytes(4));
    EXPECT_EQ(l.size, Size::Bytes(8));
}

TEST_F(LayoutTest, Newtype) {
    FieldDecl fields[]{{"inner", mod.U64Ty}, {"marker", mod.UnitTy}};
    auto& l = layouts.layout_of(StructType::Create(mod, "Wrapper", fields));
    EXPECT_EQ(l.abi, Abi::Scalar);
    EXPECT_EQ(l.size, Size::Bytes(8));
}

TEST_F(LayoutTest, FatPointers) {
    auto& l = layouts.layout_of(PtrType::Get(mod, SliceType::Get(mod, mod.U8Ty), PtrKind::Ref));
    EXPECT_EQ(l.abi, Abi::ScalarPair);
    EXPECT_EQ(l.size, Size::Bytes(16));
    EXPECT_TRUE(l.first.is_pointer);
    EXPECT_FALSE(l.second.is_pointer);
}

TEST_F(LayoutTest, Arrays) {
    auto& l = layouts.layout_of(ArrayType::Get(mod, mod.U16Ty, 5));
    EXPECT_EQ(l.stride, Size::Bytes(2));
    EXPECT_EQ(l.count, 5u);
    EXPECT_EQ(l.size, Size::Bytes(10));
    EXPECT_EQ(l.field_offset(3), Size::Bytes(6));
}

TEST_F(LayoutTest, OptionalReferenceUsesNullNiche) {
    auto& l = layouts.layout_of(Option(PtrType::Get(mod, mod.I32Ty, PtrKind::Ref)));
    EXPECT_EQ(l.size, Size::Bytes(8));
    EXPECT_EQ(l.tag.encoding, TagEncoding::Niche);
    EXPECT_EQ(l.tag.untagged_variant, 1u);
    EXPECT_EQ(l.tag.niche_start, 0u);
    EXPECT_FALSE(l.niche.has_value());
}

TEST_F(LayoutTest, OptionalSliceReferenceIsAggregate) {
    auto& l = layouts.layout_of(Option(PtrType::Get(mod, SliceType::Get(mod, mod.U8Ty), PtrKind::Ref)));
    EXPECT_EQ(l.size, Size::Bytes(16));
    EXPECT_EQ(l.tag.encoding, TagEncoding::Niche);
    EXPECT_EQ(l.tag.offset, Size());
    EXPECT_EQ(l.abi, Abi::Aggregate);
}

TEST_F(LayoutTest, OptionalBoolUsesNiche) {
    auto& l = layouts.layout_of(Option(mod.BoolTy));
    EXPECT_EQ(l.size, Size::Bytes(1));
    EXPECT_EQ(l.tag.encoding, TagEncoding::Niche);
    EXPECT_EQ(l.tag.niche_start, 2u);

    // Nesting uses the next free value.
    auto& nested = layouts.layout_of(Option(Option(mod.BoolTy)));
    EXPECT_EQ(nested.size, Size::Bytes(1));
    EXPECT_EQ(nested.tag.niche_start, 3u);
}

TEST_F(LayoutTest, OptionalIntegerNeedsTag) {
    auto& l = layouts.layout_of(Option(mod.I32Ty));
    EXPECT_EQ(l.tag.encoding, TagEncoding::Direct);
    EXPECT_EQ(l.tag.offset, Size());
    EXPECT_EQ(l.size, Size::Bytes(8));
    EXPECT_EQ(l.variants[1].field_offsets[0], Size::Bytes(4));
}

TEST_F(LayoutTest, FieldlessEnumIsScalar) {
    VariantDecl variants[]{{"A", -1, {}}, {"B", 300, {}}};
    auto& l = layouts.layout_of(EnumType::Create(mod, "E", variants));
    EXPECT_EQ(l.abi, Abi::Scalar);
    EXPECT_EQ(l.size, Size::Bytes(2));
    EXPECT_TRUE(l.first.is_signed);
}

TEST_F(LayoutTest, ScalarValidity) {
    ScalarLayout c{Size::Bytes(4), false, false, ScalarValidity::Char};
    EXPECT_TRUE(c.valid(APInt(32, 'a')));
    EXPECT_FALSE(c.valid(APInt(32, 0xD800)));
    EXPECT_FALSE(c.valid(APInt(32, 0x110000)));

    ScalarLayout b{Size::Bytes(1), false, false, ScalarValidity::Bool};
    EXPECT_TRUE(b.valid(APInt(8, 1)));
    EXPECT_FALSE(b.valid(APInt(8, 2)));
}
