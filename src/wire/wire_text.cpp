/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "wire/wire_text.h"

namespace mptree::wire {
namespace {
int hex_nibble(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
        return 10 + (c - 'A');
    }
    return -1;
}
}  // namespace

std::string to_hex_bytes(std::span<const std::uint8_t> bytes) {
    static const char hexdig[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(2 + bytes.size() * 2);
    out.push_back('0');
    out.push_back('x');
    for (const auto b : bytes) {
        out.push_back(hexdig[(b >> 4) & 0xFu]);
        out.push_back(hexdig[b & 0xFu]);
    }
    return out;
}

std::optional<std::vector<std::uint8_t>> parse_hex_bytes(std::string_view s) {
    if (s.rfind("0x", 0) == 0 || s.rfind("0X", 0) == 0) {
        s.remove_prefix(2);
    }
    if ((s.size() & 1) != 0) {
        return std::nullopt;
    }
    std::vector<std::uint8_t> out;
    out.reserve(s.size() / 2);
    for (std::size_t i = 0; i < s.size(); i += 2) {
        const int hi = hex_nibble(s[i]);
        const int lo = hex_nibble(s[i + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

bool is_valid_utf8(std::string_view s) {
    std::size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            i++;
            continue;
        }

        int extra = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if ((c & 0xE0u) == 0xC0u) {
            extra = 1;
            cp = c & 0x1Fu;
            min_cp = 0x80;
        } else if ((c & 0xF0u) == 0xE0u) {
            extra = 2;
            cp = c & 0x0Fu;
            min_cp = 0x800;
        } else if ((c & 0xF8u) == 0xF0u) {
            extra = 3;
            cp = c & 0x07u;
            min_cp = 0x10000;
        } else {
            return false;
        }
        if (s.size() - i <= static_cast<std::size_t>(extra)) {
            return false;
        }
        for (int k = 1; k <= extra; k++) {
            const auto cc = static_cast<unsigned char>(s[i + static_cast<std::size_t>(k)]);
            if ((cc & 0xC0u) != 0x80u) {
                return false;
            }
            cp = (cp << 6) | (cc & 0x3Fu);
        }
        // overlong, surrogate or beyond U+10FFFF
        if (cp < min_cp || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += static_cast<std::size_t>(extra) + 1;
    }
    return true;
}

}  // namespace mptree::wire
