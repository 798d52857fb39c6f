/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "wire/wire_grammar.h"

#include "wire/wire_error.h"

#include <array>
#include <string>
#include <utility>

namespace mptree::wire {
namespace {
using C = Category;
using K = PayloadKind;
using R = PayloadRule;
using V = Variant;

// Indexed by Variant.
const std::array<VariantSpec, kVariantCount> kVariantSpecs = {{
    {V::Nil, C::Nil, R::FixedWidth, K::None, 0xC0, 0xC0, 0, "Nil"},
    {V::False, C::Bool, R::FixedWidth, K::Boolean, 0xC2, 0xC2, 0, "False"},
    {V::True, C::Bool, R::FixedWidth, K::Boolean, 0xC3, 0xC3, 0, "True"},
    {V::FixPos, C::Number, R::Embedded, K::Unsigned, 0x00, 0x7F, 0x7F, "FixPos"},
    {V::FixNeg, C::Number, R::Embedded, K::Signed, 0xE0, 0xFF, 0x1F, "FixNeg"},
    {V::UInt8, C::Number, R::FixedWidth, K::Unsigned, 0xCC, 0xCC, 1, "UInt8"},
    {V::UInt16, C::Number, R::FixedWidth, K::Unsigned, 0xCD, 0xCD, 2, "UInt16"},
    {V::UInt32, C::Number, R::FixedWidth, K::Unsigned, 0xCE, 0xCE, 4, "UInt32"},
    {V::UInt64, C::Number, R::FixedWidth, K::Unsigned, 0xCF, 0xCF, 8, "UInt64"},
    {V::Int8, C::Number, R::FixedWidth, K::Signed, 0xD0, 0xD0, 1, "Int8"},
    {V::Int16, C::Number, R::FixedWidth, K::Signed, 0xD1, 0xD1, 2, "Int16"},
    {V::Int32, C::Number, R::FixedWidth, K::Signed, 0xD2, 0xD2, 4, "Int32"},
    {V::Int64, C::Number, R::FixedWidth, K::Signed, 0xD3, 0xD3, 8, "Int64"},
    {V::F32, C::Number, R::FixedWidth, K::Float32, 0xCA, 0xCA, 4, "F32"},
    {V::F64, C::Number, R::FixedWidth, K::Float64, 0xCB, 0xCB, 8, "F64"},
    {V::FixStr, C::String, R::Embedded, K::Text, 0xA0, 0xBF, 0x1F, "FixStr"},
    {V::Str8, C::String, R::LengthPrefixed, K::Text, 0xD9, 0xD9, 1, "Str8"},
    {V::Str16, C::String, R::LengthPrefixed, K::Text, 0xDA, 0xDA, 2, "Str16"},
    {V::Str32, C::String, R::LengthPrefixed, K::Text, 0xDB, 0xDB, 4, "Str32"},
    {V::Bin8, C::Binary, R::LengthPrefixed, K::Bytes, 0xC4, 0xC4, 1, "Bin8"},
    {V::Bin16, C::Binary, R::LengthPrefixed, K::Bytes, 0xC5, 0xC5, 2, "Bin16"},
    {V::Bin32, C::Binary, R::LengthPrefixed, K::Bytes, 0xC6, 0xC6, 4, "Bin32"},
    {V::FixArray, C::Array, R::Embedded, K::Array, 0x90, 0x9F, 0x0F, "FixArray"},
    {V::Array16, C::Array, R::LengthPrefixed, K::Array, 0xDC, 0xDC, 2, "Array16"},
    {V::Array32, C::Array, R::LengthPrefixed, K::Array, 0xDD, 0xDD, 4, "Array32"},
    {V::FixMap, C::Map, R::Embedded, K::Map, 0x80, 0x8F, 0x0F, "FixMap"},
    {V::Map16, C::Map, R::LengthPrefixed, K::Map, 0xDE, 0xDE, 2, "Map16"},
    {V::Map32, C::Map, R::LengthPrefixed, K::Map, 0xDF, 0xDF, 4, "Map32"},
    {V::FixExt1, C::Extension, R::FixedWidth, K::Extension, 0xD4, 0xD4, 1, "FixExt1"},
    {V::FixExt2, C::Extension, R::FixedWidth, K::Extension, 0xD5, 0xD5, 2, "FixExt2"},
    {V::FixExt4, C::Extension, R::FixedWidth, K::Extension, 0xD6, 0xD6, 4, "FixExt4"},
    {V::FixExt8, C::Extension, R::FixedWidth, K::Extension, 0xD7, 0xD7, 8, "FixExt8"},
    {V::FixExt16, C::Extension, R::FixedWidth, K::Extension, 0xD8, 0xD8, 16, "FixExt16"},
    {V::Ext8, C::Extension, R::LengthPrefixed, K::Extension, 0xC7, 0xC7, 1, "Ext8"},
    {V::Ext16, C::Extension, R::LengthPrefixed, K::Extension, 0xC8, 0xC8, 2, "Ext16"},
    {V::Ext32, C::Extension, R::LengthPrefixed, K::Extension, 0xC9, 0xC9, 4, "Ext32"},
}};

const std::array<std::pair<std::string_view, Category>, 8> kCategoryNames = {{
    {"Nil", C::Nil},
    {"Bool", C::Bool},
    {"Number", C::Number},
    {"String", C::String},
    {"Binary", C::Binary},
    {"Array", C::Array},
    {"Map", C::Map},
    {"Extension", C::Extension},
}};

constexpr int kNoVariant = -1;

const std::array<int, 256>& marker_table() {
    static const std::array<int, 256> table = [] {
        std::array<int, 256> out{};
        out.fill(kNoVariant);
        for (const auto& spec : kVariantSpecs) {
            for (int m = spec.first_marker; m <= spec.last_marker; m++) {
                out[static_cast<std::size_t>(m)] = static_cast<int>(spec.variant);
            }
        }
        return out;
    }();
    return table;
}

std::string to_hex_u8(std::uint8_t v) {
    static const char hexdig[] = "0123456789ABCDEF";
    std::string out = "0x";
    out.push_back(hexdig[(v >> 4) & 0xFu]);
    out.push_back(hexdig[v & 0xFu]);
    return out;
}
}  // namespace

const VariantSpec& variant_spec(Variant variant) {
    return kVariantSpecs[static_cast<std::size_t>(variant)];
}

std::optional<Variant> try_lookup_marker(std::uint8_t marker) {
    const int v = marker_table()[marker];
    if (v == kNoVariant) {
        return std::nullopt;
    }
    return static_cast<Variant>(v);
}

const VariantSpec& marker_spec(std::uint8_t marker) {
    const auto variant = try_lookup_marker(marker);
    if (!variant.has_value()) {
        throw Error(ErrorCode::InvalidMarker, "Reserved marker " + to_hex_u8(marker) + ".");
    }
    return variant_spec(*variant);
}

Category category_of_marker(std::uint8_t marker) {
    return marker_spec(marker).category;
}

std::string_view variant_name(Variant variant) {
    return variant_spec(variant).name;
}

std::optional<Variant> parse_variant_name(std::string_view name) {
    for (const auto& spec : kVariantSpecs) {
        if (spec.name == name) {
            return spec.variant;
        }
    }
    return std::nullopt;
}

std::string_view category_name(Category category) {
    for (const auto& [k, v] : kCategoryNames) {
        if (v == category) {
            return k;
        }
    }
    return "Unknown";
}

std::optional<Category> parse_category_name(std::string_view name) {
    for (const auto& [k, v] : kCategoryNames) {
        if (k == name) {
            return v;
        }
    }
    return std::nullopt;
}

}  // namespace mptree::wire
