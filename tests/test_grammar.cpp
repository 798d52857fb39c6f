/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "test_helpers.h"

#include "wire/wire_grammar.h"

#include <set>

using namespace mptree::wire;
using mptree::test::catch_error;

TEST(Grammar, EveryMarkerButReservedHasOneVariant) {
    std::size_t covered = 0;
    for (int m = 0; m <= 0xFF; m++) {
        const auto marker = static_cast<std::uint8_t>(m);
        const auto v = try_lookup_marker(marker);
        if (marker == kReservedMarker) {
            EXPECT_FALSE(v.has_value());
            continue;
        }
        ASSERT_TRUE(v.has_value()) << "marker " << m;
        const auto& vs = variant_spec(*v);
        EXPECT_TRUE(vs.contains(marker)) << "marker " << m;
        EXPECT_EQ(vs.category, category_of_marker(marker));
        EXPECT_EQ(&marker_spec(marker), &vs);
        covered++;
    }
    EXPECT_EQ(covered, 255u);
}

TEST(Grammar, VariantRangesDoNotOverlap) {
    std::set<int> seen;
    for (std::size_t i = 0; i < kVariantCount; i++) {
        const auto& vs = variant_spec(static_cast<Variant>(i));
        EXPECT_EQ(vs.variant, static_cast<Variant>(i));
        for (int m = vs.first_marker; m <= vs.last_marker; m++) {
            EXPECT_TRUE(seen.insert(m).second) << vs.name << " overlaps at " << m;
        }
    }
    EXPECT_EQ(seen.size(), 255u);
    EXPECT_EQ(seen.count(kReservedMarker), 0u);
}

TEST(Grammar, FamilyBoundaries) {
    EXPECT_EQ(*try_lookup_marker(0x00), Variant::FixPos);
    EXPECT_EQ(*try_lookup_marker(0x7F), Variant::FixPos);
    EXPECT_EQ(*try_lookup_marker(0x80), Variant::FixMap);
    EXPECT_EQ(*try_lookup_marker(0x8F), Variant::FixMap);
    EXPECT_EQ(*try_lookup_marker(0x90), Variant::FixArray);
    EXPECT_EQ(*try_lookup_marker(0x9F), Variant::FixArray);
    EXPECT_EQ(*try_lookup_marker(0xA0), Variant::FixStr);
    EXPECT_EQ(*try_lookup_marker(0xBF), Variant::FixStr);
    EXPECT_EQ(*try_lookup_marker(0xC0), Variant::Nil);
    EXPECT_EQ(*try_lookup_marker(0xC2), Variant::False);
    EXPECT_EQ(*try_lookup_marker(0xC3), Variant::True);
    EXPECT_EQ(*try_lookup_marker(0xC4), Variant::Bin8);
    EXPECT_EQ(*try_lookup_marker(0xC6), Variant::Bin32);
    EXPECT_EQ(*try_lookup_marker(0xC7), Variant::Ext8);
    EXPECT_EQ(*try_lookup_marker(0xC9), Variant::Ext32);
    EXPECT_EQ(*try_lookup_marker(0xCA), Variant::F32);
    EXPECT_EQ(*try_lookup_marker(0xCB), Variant::F64);
    EXPECT_EQ(*try_lookup_marker(0xCC), Variant::UInt8);
    EXPECT_EQ(*try_lookup_marker(0xCF), Variant::UInt64);
    EXPECT_EQ(*try_lookup_marker(0xD0), Variant::Int8);
    EXPECT_EQ(*try_lookup_marker(0xD3), Variant::Int64);
    EXPECT_EQ(*try_lookup_marker(0xD4), Variant::FixExt1);
    EXPECT_EQ(*try_lookup_marker(0xD8), Variant::FixExt16);
    EXPECT_EQ(*try_lookup_marker(0xD9), Variant::Str8);
    EXPECT_EQ(*try_lookup_marker(0xDB), Variant::Str32);
    EXPECT_EQ(*try_lookup_marker(0xDC), Variant::Array16);
    EXPECT_EQ(*try_lookup_marker(0xDD), Variant::Array32);
    EXPECT_EQ(*try_lookup_marker(0xDE), Variant::Map16);
    EXPECT_EQ(*try_lookup_marker(0xDF), Variant::Map32);
    EXPECT_EQ(*try_lookup_marker(0xE0), Variant::FixNeg);
    EXPECT_EQ(*try_lookup_marker(0xFF), Variant::FixNeg);
}

TEST(Grammar, Categories) {
    EXPECT_EQ(category_of_marker(0xC0), Category::Nil);
    EXPECT_EQ(category_of_marker(0xC2), Category::Bool);
    EXPECT_EQ(category_of_marker(0x05), Category::Number);
    EXPECT_EQ(category_of_marker(0xCA), Category::Number);
    EXPECT_EQ(category_of_marker(0xF0), Category::Number);
    EXPECT_EQ(category_of_marker(0xA3), Category::String);
    EXPECT_EQ(category_of_marker(0xC5), Category::Binary);
    EXPECT_EQ(category_of_marker(0x92), Category::Array);
    EXPECT_EQ(category_of_marker(0xDE), Category::Map);
    EXPECT_EQ(category_of_marker(0xD6), Category::Extension);
}

TEST(Grammar, ReservedMarkerThrows) {
    const auto err = catch_error([] { (void)marker_spec(kReservedMarker); });
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code(), ErrorCode::InvalidMarker);

    const auto err2 = catch_error([] { (void)category_of_marker(0xC1); });
    ASSERT_TRUE(err2.has_value());
    EXPECT_EQ(err2->code(), ErrorCode::InvalidMarker);
}

TEST(Grammar, PayloadRules) {
    const auto& fixstr = variant_spec(Variant::FixStr);
    EXPECT_EQ(fixstr.rule, PayloadRule::Embedded);
    EXPECT_EQ(fixstr.width, 0x1F);

    const auto& u16 = variant_spec(Variant::UInt16);
    EXPECT_EQ(u16.rule, PayloadRule::FixedWidth);
    EXPECT_EQ(u16.width, 2);

    const auto& fixext8 = variant_spec(Variant::FixExt8);
    EXPECT_EQ(fixext8.rule, PayloadRule::FixedWidth);
    EXPECT_EQ(fixext8.width, 8);

    const auto& map32 = variant_spec(Variant::Map32);
    EXPECT_EQ(map32.rule, PayloadRule::LengthPrefixed);
    EXPECT_EQ(map32.width, 4);
    EXPECT_EQ(map32.kind, PayloadKind::Map);
}

TEST(Grammar, NamesRoundTrip) {
    for (std::size_t i = 0; i < kVariantCount; i++) {
        const auto v = static_cast<Variant>(i);
        const auto parsed = parse_variant_name(variant_name(v));
        ASSERT_TRUE(parsed.has_value()) << variant_name(v);
        EXPECT_EQ(*parsed, v);
    }
    for (int i = 0; i <= static_cast<int>(Category::Extension); i++) {
        const auto c = static_cast<Category>(i);
        const auto parsed = parse_category_name(category_name(c));
        ASSERT_TRUE(parsed.has_value()) << category_name(c);
        EXPECT_EQ(*parsed, c);
    }
    EXPECT_EQ(variant_name(Variant::Int32), "Int32");
    EXPECT_EQ(category_name(Category::Number), "Number");
    EXPECT_FALSE(parse_variant_name("Int128").has_value());
    EXPECT_FALSE(parse_variant_name("int32").has_value());
    EXPECT_FALSE(parse_category_name("Float").has_value());
}
