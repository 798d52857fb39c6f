/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mptree::wire {

// "0x" followed by two upper-case digits per byte; "0x" for an empty buffer.
std::string to_hex_bytes(std::span<const std::uint8_t> bytes);
// Accepts an optional "0x"/"0X" prefix and either digit case. nullopt on odd
// length or a non-hex character.
std::optional<std::vector<std::uint8_t>> parse_hex_bytes(std::string_view s);

bool is_valid_utf8(std::string_view s);

}  // namespace mptree::wire
