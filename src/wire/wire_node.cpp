/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "wire/wire_node.h"

#include "wire/wire_encoder.h"
#include "wire/wire_error.h"

#include <stdexcept>

namespace mptree::wire {

Node::Node()
    : _marker(0xC0), _category(Category::Nil), _variant(Variant::Nil), _payload(std::monostate{}) {}

Node::Node(std::uint8_t marker, Variant variant, Payload payload)
    : _marker(marker),
      _category(category_of_marker(marker)),
      _variant(variant),
      _payload(std::move(payload)) {
    const auto& vs = variant_spec(variant);
    if (_payload.index() != static_cast<std::size_t>(vs.kind)) {
        throw std::invalid_argument(
            std::string("Payload does not match variant ") + std::string(vs.name)
        );
    }
    if (variant == Variant::True || variant == Variant::False) {
        if (std::get<bool>(_payload) != (variant == Variant::True)) {
            throw std::invalid_argument(
                std::string("Boolean payload contradicts variant ") + std::string(vs.name)
            );
        }
    }
}

Node Node::make(Variant variant, Payload payload) {
    const std::uint8_t marker = implied_marker(variant, payload);
    return Node(marker, variant, std::move(payload));
}

Node Node::boolean(bool value) {
    return Node(value ? 0xC3 : 0xC2, value ? Variant::True : Variant::False, value);
}

std::size_t Node::size() const {
    switch (spec().kind) {
        case PayloadKind::Text:
            return as_string().size();
        case PayloadKind::Bytes:
            return as_binary().size();
        case PayloadKind::Array:
            return as_array().size();
        case PayloadKind::Map:
            return as_map().size();
        case PayloadKind::Extension:
            return as_extension().data.size();
        default:
            return 0;
    }
}

bool Node::operator==(const Node& other) const {
    return _marker == other._marker && _variant == other._variant && _payload == other._payload;
}

}  // namespace mptree::wire
