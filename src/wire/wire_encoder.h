/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "wire_grammar.h"
#include "wire_node.h"

#include <cstdint>
#include <vector>

namespace mptree::wire {

struct EncodeOptions {
    std::size_t max_depth = kDefaultMaxDepth;
};

// Marker a variant implies for a payload. Embedded families fold the value or
// count into the low bits and throw Error(ValueOutOfRange) when it does not fit.
std::uint8_t implied_marker(Variant variant, const Payload& payload);

// Emits exactly the form the node's variant names, never a shorter one.
std::vector<std::uint8_t> encode_value(const Node& node, const EncodeOptions& options = {});

}  // namespace mptree::wire
