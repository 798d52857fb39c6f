/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace mptree::wire {

constexpr std::uint8_t kReservedMarker = 0xC1;
constexpr std::size_t kDefaultMaxDepth = 512;

enum class Category : std::uint8_t {
    Nil,
    Bool,
    Number,
    String,
    Binary,
    Array,
    Map,
    Extension,
};

enum class Variant : std::uint8_t {
    Nil,
    False,
    True,
    FixPos,
    FixNeg,
    UInt8,
    UInt16,
    UInt32,
    UInt64,
    Int8,
    Int16,
    Int32,
    Int64,
    F32,
    F64,
    FixStr,
    Str8,
    Str16,
    Str32,
    Bin8,
    Bin16,
    Bin32,
    FixArray,
    Array16,
    Array32,
    FixMap,
    Map16,
    Map32,
    FixExt1,
    FixExt2,
    FixExt4,
    FixExt8,
    FixExt16,
    Ext8,
    Ext16,
    Ext32,
};

constexpr std::size_t kVariantCount = static_cast<std::size_t>(Variant::Ext32) + 1;

enum class PayloadRule : std::uint8_t {
    Embedded,        // value or count lives in the marker's low bits
    FixedWidth,      // `width` bytes follow the marker
    LengthPrefixed,  // `width`-byte big-endian length, then payload or children
};

// Order matches the alternatives of wire::Payload.
enum class PayloadKind : std::uint8_t {
    None,
    Boolean,
    Unsigned,
    Signed,
    Float32,
    Float64,
    Text,
    Bytes,
    Array,
    Map,
    Extension,
};

struct VariantSpec {
    Variant variant;
    Category category;
    PayloadRule rule;
    PayloadKind kind;
    std::uint8_t first_marker;
    std::uint8_t last_marker;
    // Embedded: mask of the marker bits carrying the value.
    // FixedWidth: payload bytes (FixExtN: data bytes, excluding the type byte).
    // LengthPrefixed: size of the length field.
    std::uint8_t width;
    std::string_view name;

    bool contains(std::uint8_t marker) const {
        return marker >= first_marker && marker <= last_marker;
    }
};

const VariantSpec& variant_spec(Variant variant);

// nullopt only for the reserved marker 0xC1.
std::optional<Variant> try_lookup_marker(std::uint8_t marker);
// Throws Error(InvalidMarker) for 0xC1.
const VariantSpec& marker_spec(std::uint8_t marker);
Category category_of_marker(std::uint8_t marker);

std::string_view variant_name(Variant variant);
std::optional<Variant> parse_variant_name(std::string_view name);
std::string_view category_name(Category category);
std::optional<Category> parse_category_name(std::string_view name);

}  // namespace mptree::wire
