/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "wire/wire_encoder.h"

#include "wire/wire_byte_writer.h"
#include "wire/wire_error.h"
#include "wire/wire_text.h"

#include <cstring>
#include <limits>
#include <string>

namespace mptree::wire {
namespace {
std::string hex_marker(std::uint8_t m) {
    return to_hex_bytes(std::span<const std::uint8_t>(&m, 1));
}

std::uint64_t max_for_width(int byte_count) {
    return byte_count >= 8 ? std::numeric_limits<std::uint64_t>::max()
                           : (std::uint64_t{1} << (8 * byte_count)) - 1;
}

std::size_t embedded_quantity(const Node& node) {
    switch (node.variant()) {
        case Variant::FixStr:
            return node.as_string().size();
        case Variant::FixArray:
            return node.as_array().size();
        case Variant::FixMap:
            return node.as_map().size();
        default:
            return 0;
    }
}

class Encoder {
   public:
    explicit Encoder(const EncodeOptions& options) : _options(options) {}

    std::vector<std::uint8_t> run(const Node& root) {
        std::string path;
        write(root, path, 0);
        return _out.take();
    }

   private:
    void write(const Node& node, std::string& path, std::size_t depth) {
        const auto& vs = node.spec();
        validate_marker(node, path);

        switch (vs.kind) {
            case PayloadKind::None:
            case PayloadKind::Boolean:
                _out.write_u8(node.marker());
                break;
            case PayloadKind::Unsigned:
                write_unsigned(node, path);
                break;
            case PayloadKind::Signed:
                write_signed(node, path);
                break;
            case PayloadKind::Float32: {
                std::uint32_t bits = 0;
                const float f = node.as_f32();
                std::memcpy(&bits, &f, sizeof(bits));
                _out.write_u8(node.marker());
                _out.write_uint_be(bits, 4);
                break;
            }
            case PayloadKind::Float64: {
                std::uint64_t bits = 0;
                const double d = node.as_f64();
                std::memcpy(&bits, &d, sizeof(bits));
                _out.write_u8(node.marker());
                _out.write_uint_be(bits, 8);
                break;
            }
            case PayloadKind::Text: {
                const auto& s = node.as_string();
                if (!is_valid_utf8(s)) {
                    throw Error::at_path(
                        ErrorCode::InvalidUtf8, path, "String is not valid UTF-8."
                    );
                }
                write_head(node, s.size(), path);
                _out.write_bytes(std::span<const std::uint8_t>(
                    reinterpret_cast<const std::uint8_t*>(s.data()), s.size()
                ));
                break;
            }
            case PayloadKind::Bytes:
                write_head(node, node.as_binary().size(), path);
                _out.write_bytes(node.as_binary());
                break;
            case PayloadKind::Array: {
                const auto& items = node.as_array();
                enter(depth, path);
                write_head(node, items.size(), path);
                const std::size_t base = path.size();
                for (std::size_t i = 0; i < items.size(); i++) {
                    path += "/data/value/" + std::to_string(i);
                    write(items[i], path, depth + 1);
                    path.resize(base);
                }
                break;
            }
            case PayloadKind::Map: {
                const auto& pairs = node.as_map();
                enter(depth, path);
                write_head(node, pairs.size(), path);
                const std::size_t base = path.size();
                for (std::size_t i = 0; i < pairs.size(); i++) {
                    path += "/data/value/" + std::to_string(i) + "/0";
                    write(pairs[i].first, path, depth + 1);
                    path.back() = '1';
                    write(pairs[i].second, path, depth + 1);
                    path.resize(base);
                }
                break;
            }
            case PayloadKind::Extension:
                write_extension(node, path);
                break;
        }
    }

    void enter(std::size_t depth, const std::string& path) const {
        if (depth + 1 > _options.max_depth) {
            throw Error::at_path(
                ErrorCode::DepthExceeded, path,
                "Nesting deeper than " + std::to_string(_options.max_depth) + " levels."
            );
        }
    }

    void validate_marker(const Node& node, const std::string& path) const {
        const auto& vs = node.spec();
        const std::uint8_t marker = node.marker();
        if (!vs.contains(marker)) {
            throw Error::at_path(
                ErrorCode::InconsistentMarker, path,
                "Marker " + hex_marker(marker) + " is outside the " + std::string(vs.name)
                    + " range."
            );
        }
        if (vs.rule != PayloadRule::Embedded) {
            return;
        }
        std::uint8_t expected = 0;
        try {
            expected = implied_marker(node.variant(), node.payload());
        } catch (const Error& e) {
            throw Error::at_path(e.code(), path, e.message());
        }
        if (expected == marker) {
            return;
        }
        if (vs.kind == PayloadKind::Unsigned || vs.kind == PayloadKind::Signed) {
            throw Error::at_path(
                ErrorCode::InconsistentMarker, path,
                "Marker " + hex_marker(marker) + " does not encode the stored value (expected "
                    + hex_marker(expected) + ")."
            );
        }
        throw Error::at_path(
            ErrorCode::ValueOutOfRange, path,
            std::string(vs.name) + " marker " + hex_marker(marker) + " declares "
                + std::to_string(marker & vs.width) + " but the node holds "
                + std::to_string(embedded_quantity(node)) + "."
        );
    }

    // Marker plus length field for length-prefixed variants; marker only for
    // embedded ones (validated already).
    void write_head(const Node& node, std::size_t length, const std::string& path) {
        const auto& vs = node.spec();
        _out.write_u8(node.marker());
        if (vs.rule != PayloadRule::LengthPrefixed) {
            return;
        }
        if (static_cast<std::uint64_t>(length) > max_for_width(vs.width)) {
            throw Error::at_path(
                ErrorCode::ValueOutOfRange, path,
                "Length " + std::to_string(length) + " does not fit " + std::string(vs.name)
                    + "."
            );
        }
        _out.write_uint_be(length, vs.width);
    }

    void write_unsigned(const Node& node, const std::string& path) {
        const auto& vs = node.spec();
        const std::uint64_t v = node.as_uint();
        _out.write_u8(node.marker());
        if (vs.rule == PayloadRule::Embedded) {
            return;
        }
        if (v > max_for_width(vs.width)) {
            throw Error::at_path(
                ErrorCode::ValueOutOfRange, path,
                "Value " + std::to_string(v) + " does not fit " + std::string(vs.name) + "."
            );
        }
        _out.write_uint_be(v, vs.width);
    }

    void write_signed(const Node& node, const std::string& path) {
        const auto& vs = node.spec();
        const std::int64_t v = node.as_int();
        _out.write_u8(node.marker());
        if (vs.rule == PayloadRule::Embedded) {
            return;
        }
        if (vs.width < 8) {
            const std::int64_t hi = (std::int64_t{1} << (8 * vs.width - 1)) - 1;
            const std::int64_t lo = -hi - 1;
            if (v < lo || v > hi) {
                throw Error::at_path(
                    ErrorCode::ValueOutOfRange, path,
                    "Value " + std::to_string(v) + " does not fit " + std::string(vs.name) + "."
                );
            }
        }
        _out.write_uint_be(static_cast<std::uint64_t>(v), vs.width);
    }

    void write_extension(const Node& node, const std::string& path) {
        const auto& vs = node.spec();
        const auto& ext = node.as_extension();
        if (vs.rule == PayloadRule::FixedWidth) {
            if (ext.data.size() != vs.width) {
                throw Error::at_path(
                    ErrorCode::ValueOutOfRange, path,
                    std::string(vs.name) + " needs exactly " + std::to_string(vs.width)
                        + " data byte(s), node holds " + std::to_string(ext.data.size()) + "."
                );
            }
            _out.write_u8(node.marker());
        } else {
            write_head(node, ext.data.size(), path);
        }
        _out.write_u8(static_cast<std::uint8_t>(ext.type));
        _out.write_bytes(ext.data);
    }

    const EncodeOptions& _options;
    ByteWriter _out;
};
}  // namespace

std::uint8_t implied_marker(Variant variant, const Payload& payload) {
    const auto& vs = variant_spec(variant);
    if (vs.rule != PayloadRule::Embedded) {
        return vs.first_marker;
    }

    std::uint64_t quantity = 0;
    switch (variant) {
        case Variant::FixPos:
            quantity = std::get<std::uint64_t>(payload);
            break;
        case Variant::FixNeg: {
            const std::int64_t v = std::get<std::int64_t>(payload);
            if (v < -32 || v > -1) {
                throw Error(
                    ErrorCode::ValueOutOfRange,
                    "FixNeg value " + std::to_string(v) + " outside [-32..-1]."
                );
            }
            return static_cast<std::uint8_t>(v);
        }
        case Variant::FixStr:
            quantity = std::get<std::string>(payload).size();
            break;
        case Variant::FixArray:
            quantity = std::get<Array>(payload).size();
            break;
        case Variant::FixMap:
            quantity = std::get<Map>(payload).size();
            break;
        default:
            return vs.first_marker;
    }
    if (quantity > vs.width) {
        throw Error(
            ErrorCode::ValueOutOfRange,
            std::string(vs.name) + " cannot hold " + std::to_string(quantity) + " (max "
                + std::to_string(vs.width) + ")."
        );
    }
    return static_cast<std::uint8_t>(vs.first_marker | quantity);
}

std::vector<std::uint8_t> encode_value(const Node& node, const EncodeOptions& options) {
    Encoder enc(options);
    return enc.run(node);
}

}  // namespace mptree::wire
