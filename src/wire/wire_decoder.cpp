/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "wire/wire_decoder.h"

#include "wire/wire_byte_reader.h"
#include "wire/wire_error.h"
#include "wire/wire_text.h"

#include <cstring>
#include <string>

namespace mptree::wire {
namespace {
std::int64_t sign_extend(std::uint64_t raw, int byte_count) {
    if (byte_count >= 8) {
        return static_cast<std::int64_t>(raw);
    }
    const int shift = 64 - 8 * byte_count;
    return static_cast<std::int64_t>(raw << shift) >> shift;
}

class Decoder {
   public:
    Decoder(
        std::span<const std::uint8_t> buffer,
        std::size_t cursor,
        const DecodeOptions& options
    )
        : _reader(buffer, cursor), _options(options) {}

    std::size_t position() const { return _reader.position(); }
    bool at_end() const { return _reader.at_end(); }

    Node read(std::size_t depth) {
        const std::size_t start = _reader.position();
        const std::uint8_t marker = _reader.read_u8("marker");
        const auto variant = try_lookup_marker(marker);
        if (!variant.has_value()) {
            throw Error::at_offset(
                ErrorCode::InvalidMarker, start, "Reserved marker " + to_hex(marker) + "."
            );
        }
        const auto& vs = variant_spec(*variant);

        switch (vs.kind) {
            case PayloadKind::None:
                return Node(marker, *variant, std::monostate{});
            case PayloadKind::Boolean:
                return Node(marker, *variant, *variant == Variant::True);
            case PayloadKind::Unsigned: {
                const std::uint64_t v = vs.rule == PayloadRule::Embedded
                                            ? static_cast<std::uint64_t>(marker & vs.width)
                                            : _reader.read_uint_be(vs.width, "integer payload");
                return Node(marker, *variant, v);
            }
            case PayloadKind::Signed: {
                if (vs.rule == PayloadRule::Embedded) {
                    const auto v = static_cast<std::int64_t>(static_cast<std::int8_t>(marker));
                    return Node(marker, *variant, v);
                }
                const auto raw = _reader.read_uint_be(vs.width, "integer payload");
                return Node(marker, *variant, sign_extend(raw, vs.width));
            }
            case PayloadKind::Float32: {
                const auto bits = static_cast<std::uint32_t>(_reader.read_uint_be(4, "F32"));
                float f = 0;
                std::memcpy(&f, &bits, sizeof(f));
                return Node(marker, *variant, f);
            }
            case PayloadKind::Float64: {
                const std::uint64_t bits = _reader.read_uint_be(8, "F64");
                double d = 0;
                std::memcpy(&d, &bits, sizeof(d));
                return Node(marker, *variant, d);
            }
            case PayloadKind::Text: {
                const std::size_t len = read_length(marker, vs);
                const auto bytes = _reader.read_bytes(len, "string payload");
                std::string s(reinterpret_cast<const char*>(bytes.data()), bytes.size());
                if (!is_valid_utf8(s)) {
                    throw Error::at_offset(
                        ErrorCode::InvalidUtf8, start, "String is not valid UTF-8."
                    );
                }
                return Node(marker, *variant, std::move(s));
            }
            case PayloadKind::Bytes: {
                const std::size_t len = read_length(marker, vs);
                const auto bytes = _reader.read_bytes(len, "binary payload");
                return Node(marker, *variant, Bytes(bytes.begin(), bytes.end()));
            }
            case PayloadKind::Array: {
                enter(depth, start);
                const std::size_t count = read_length(marker, vs);
                // Every element takes at least one byte.
                _reader.require(count, "array elements");
                Array items;
                items.reserve(count);
                for (std::size_t i = 0; i < count; i++) {
                    items.push_back(read(depth + 1));
                }
                return Node(marker, *variant, std::move(items));
            }
            case PayloadKind::Map: {
                enter(depth, start);
                const std::size_t count = read_length(marker, vs);
                _reader.require(count * 2, "map entries");
                Map pairs;
                pairs.reserve(count);
                for (std::size_t i = 0; i < count; i++) {
                    Node key = read(depth + 1);
                    Node value = read(depth + 1);
                    pairs.emplace_back(std::move(key), std::move(value));
                }
                return Node(marker, *variant, std::move(pairs));
            }
            case PayloadKind::Extension: {
                const std::size_t len = vs.rule == PayloadRule::FixedWidth
                                            ? static_cast<std::size_t>(vs.width)
                                            : read_length(marker, vs);
                Extension ext;
                ext.type = static_cast<std::int8_t>(_reader.read_u8("extension type"));
                const auto bytes = _reader.read_bytes(len, "extension payload");
                ext.data.assign(bytes.begin(), bytes.end());
                return Node(marker, *variant, std::move(ext));
            }
        }
        throw Error::at_offset(ErrorCode::InvalidMarker, start, "Unhandled marker.");
    }

   private:
    static std::string to_hex(std::uint8_t m) {
        return to_hex_bytes(std::span<const std::uint8_t>(&m, 1));
    }

    std::size_t read_length(std::uint8_t marker, const VariantSpec& vs) {
        if (vs.rule == PayloadRule::Embedded) {
            return static_cast<std::size_t>(marker & vs.width);
        }
        return static_cast<std::size_t>(_reader.read_uint_be(vs.width, "length field"));
    }

    void enter(std::size_t depth, std::size_t offset) const {
        if (depth + 1 > _options.max_depth) {
            throw Error::at_offset(
                ErrorCode::DepthExceeded, offset,
                "Nesting deeper than " + std::to_string(_options.max_depth) + " levels."
            );
        }
    }

    ByteReader _reader;
    const DecodeOptions& _options;
};
}  // namespace

DecodeResult decode_value(
    std::span<const std::uint8_t> buffer,
    std::size_t cursor,
    const DecodeOptions& options
) {
    Decoder dec(buffer, cursor, options);
    DecodeResult out{};
    out.node = dec.read(0);
    out.next = dec.position();
    return out;
}

Node decode_single(std::span<const std::uint8_t> buffer, const DecodeOptions& options) {
    auto res = decode_value(buffer, 0, options);
    if (res.next != buffer.size()) {
        throw Error::at_offset(
            ErrorCode::TrailingData, res.next,
            std::to_string(buffer.size() - res.next) + " byte(s) after the top-level value."
        );
    }
    return std::move(res.node);
}

std::vector<Node>
decode_sequence(std::span<const std::uint8_t> buffer, const DecodeOptions& options) {
    std::vector<Node> out;
    std::size_t cursor = 0;
    while (cursor < buffer.size()) {
        auto res = decode_value(buffer, cursor, options);
        cursor = res.next;
        out.push_back(std::move(res.node));
    }
    return out;
}

}  // namespace mptree::wire
