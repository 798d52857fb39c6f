/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "wire/wire_error.h"
#include "wire/wire_grammar.h"
#include "wire/wire_node.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mptree {

struct UnpackOptions {
    std::size_t max_depth = wire::kDefaultMaxDepth;
    bool binary_as_array = false;
    bool debug = false;
};

struct PackOptions {
    std::size_t max_depth = wire::kDefaultMaxDepth;
    bool debug = false;
};

class Transcoder {
   public:
    static wire::Node Unpack(std::span<const std::uint8_t> bytes, const UnpackOptions& opt = {});
    static std::vector<wire::Node>
    UnpackSequence(std::span<const std::uint8_t> bytes, const UnpackOptions& opt = {});
    static nlohmann::ordered_json
    UnpackDocument(std::span<const std::uint8_t> bytes, const UnpackOptions& opt = {});
    static std::string UnpackText(
        std::span<const std::uint8_t> bytes,
        bool pretty = false,
        const UnpackOptions& opt = {}
    );
    // JSON array with one document per concatenated value.
    static std::string UnpackSequenceText(
        std::span<const std::uint8_t> bytes,
        bool pretty = false,
        const UnpackOptions& opt = {}
    );

    static std::vector<std::uint8_t> Pack(const wire::Node& node, const PackOptions& opt = {});
    static std::vector<std::uint8_t>
    PackDocument(const nlohmann::ordered_json& doc, const PackOptions& opt = {});
    static std::vector<std::uint8_t> PackText(std::string_view text, const PackOptions& opt = {});
    // Array of documents, packed back to back.
    static std::vector<std::uint8_t>
    PackSequenceText(std::string_view text, const PackOptions& opt = {});
};

}  // namespace mptree
