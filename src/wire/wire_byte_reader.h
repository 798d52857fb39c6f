/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "wire_error.h"

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

namespace mptree::wire {
class ByteReader {
   public:
    explicit ByteReader(std::span<const std::uint8_t> data, std::size_t pos = 0)
        : _data(data), _pos(pos) {
        if (pos > data.size()) {
            throw std::invalid_argument(std::string("cursor past end of buffer"));
        }
    }

    std::size_t position() const { return _pos; }
    std::size_t remaining() const { return _data.size() - _pos; }
    bool at_end() const { return _pos >= _data.size(); }

    void require(std::size_t count, const char* what) const {
        if (count > remaining()) {
            throw Error::at_offset(
                ErrorCode::UnexpectedEof, _pos,
                std::string("need ") + std::to_string(count) + " byte(s) for " + what + ", "
                    + std::to_string(remaining()) + " left"
            );
        }
    }

    std::uint8_t read_u8(const char* what) {
        require(1, what);
        return _data[_pos++];
    }

    // Unsigned big-endian, byte_count in [1..8].
    std::uint64_t read_uint_be(int byte_count, const char* what) {
        if (byte_count < 1 || byte_count > 8) {
            throw std::invalid_argument(std::string("byte_count must be in [1..8]"));
        }
        require(static_cast<std::size_t>(byte_count), what);
        std::uint64_t v = 0;
        for (int i = 0; i < byte_count; i++) {
            v = (v << 8) | _data[_pos++];
        }
        return v;
    }

    std::span<const std::uint8_t> read_bytes(std::size_t count, const char* what) {
        require(count, what);
        const auto out = _data.subspan(_pos, count);
        _pos += count;
        return out;
    }

   private:
    std::span<const std::uint8_t> _data;
    std::size_t _pos;
};
}  // namespace mptree::wire
