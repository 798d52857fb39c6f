/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "wire_grammar.h"
#include "wire_node.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace mptree::wire {

struct DecodeOptions {
    std::size_t max_depth = kDefaultMaxDepth;
};

struct DecodeResult {
    Node node;
    std::size_t next = 0;
};

// Decodes one value starting at `cursor`; `next` is the offset just past it.
DecodeResult decode_value(
    std::span<const std::uint8_t> buffer,
    std::size_t cursor,
    const DecodeOptions& options = {}
);

// Exactly one value spanning the whole buffer. Leftover bytes throw
// Error(TrailingData).
Node decode_single(std::span<const std::uint8_t> buffer, const DecodeOptions& options = {});

// Zero or more concatenated values.
std::vector<Node>
decode_sequence(std::span<const std::uint8_t> buffer, const DecodeOptions& options = {});

}  // namespace mptree::wire
