/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <vector>

namespace mptree::wire {
class ByteWriter {
   public:
    explicit ByteWriter(std::size_t initial_bytes = 64) { buf_.reserve(initial_bytes); }

    std::size_t size() const { return buf_.size(); }

    void write_u8(std::uint8_t v) { buf_.push_back(v); }

    // Big-endian, byte_count in [1..8].
    void write_uint_be(std::uint64_t value, int byte_count) {
        if (byte_count < 1 || byte_count > 8) {
            throw std::invalid_argument("byte_count out of range");
        }
        for (int i = byte_count - 1; i >= 0; i--) {
            buf_.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu));
        }
    }

    void write_bytes(std::span<const std::uint8_t> bytes) {
        buf_.insert(buf_.end(), bytes.begin(), bytes.end());
    }

    std::vector<std::uint8_t> take() { return std::move(buf_); }

   private:
    std::vector<std::uint8_t> buf_;
};
}  // namespace mptree::wire
