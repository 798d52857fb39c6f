/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "wire_grammar.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace mptree::wire {

class Node;

using Bytes = std::vector<std::uint8_t>;
using Array = std::vector<Node>;
using Map = std::vector<std::pair<Node, Node>>;

struct Extension {
    std::int8_t type = 0;
    Bytes data;

    bool operator==(const Extension& other) const = default;
};

// Alternatives follow PayloadKind.
using Payload = std::variant<
    std::monostate,
    bool,
    std::uint64_t,
    std::int64_t,
    float,
    double,
    std::string,
    Bytes,
    Array,
    Map,
    Extension>;

// One decoded MessagePack value: the marker byte as read (or as it will be
// written), the exact wire variant and its payload. Children are owned.
class Node {
   public:
    Node();
    // Throws Error(InvalidMarker) for 0xC1 and std::invalid_argument when the
    // payload alternative does not match the variant. The marker is not checked
    // against the variant here; the encoder does that.
    Node(std::uint8_t marker, Variant variant, Payload payload);

    // Marker derived from the variant and payload (see implied_marker).
    static Node make(Variant variant, Payload payload);
    static Node nil() { return Node(); }
    static Node boolean(bool value);

    std::uint8_t marker() const { return _marker; }
    Category category() const { return _category; }
    Variant variant() const { return _variant; }
    const Payload& payload() const { return _payload; }
    const VariantSpec& spec() const { return variant_spec(_variant); }

    bool is_container() const {
        return _category == Category::Array || _category == Category::Map;
    }

    bool as_bool() const { return std::get<bool>(_payload); }
    std::uint64_t as_uint() const { return std::get<std::uint64_t>(_payload); }
    std::int64_t as_int() const { return std::get<std::int64_t>(_payload); }
    float as_f32() const { return std::get<float>(_payload); }
    double as_f64() const { return std::get<double>(_payload); }
    const std::string& as_string() const { return std::get<std::string>(_payload); }
    const Bytes& as_binary() const { return std::get<Bytes>(_payload); }
    const Array& as_array() const { return std::get<Array>(_payload); }
    const Map& as_map() const { return std::get<Map>(_payload); }
    const Extension& as_extension() const { return std::get<Extension>(_payload); }

    // Children for containers, bytes for strings, binaries and extension data.
    std::size_t size() const;

    bool operator==(const Node& other) const;

   private:
    std::uint8_t _marker;
    Category _category;
    Variant _variant;
    Payload _payload;
};

}  // namespace mptree::wire
