/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "wire_grammar.h"
#include "wire_node.h"

#include <nlohmann/json.hpp>

namespace mptree::wire {

struct DocumentOptions {
    std::size_t max_depth = kDefaultMaxDepth;
    // Emit Binary and Extension data as arrays of byte integers instead of
    // "0x..." strings. Both forms are accepted on input.
    bool binary_as_array = false;
};

/*
 * Document layout of one node:
 *   { "raw_marker": <0-255>,
 *     "basic_type": "<category>",
 *     "data": { "type": "<variant>", "value": <payload> } }
 * Arrays hold documents, maps hold [key, value] document pairs.
 */
nlohmann::ordered_json to_document(const Node& node, const DocumentOptions& options = {});

// Throws Error(MalformedDocument) with the JSON pointer of the offending field.
Node from_document(const nlohmann::ordered_json& doc, const DocumentOptions& options = {});

}  // namespace mptree::wire
