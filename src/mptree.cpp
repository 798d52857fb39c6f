/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "mptree.h"

#include "utils/log.h"
#include "wire/wire_decoder.h"
#include "wire/wire_document.h"
#include "wire/wire_encoder.h"

#include <chrono>

namespace mptree {
namespace {
using json = nlohmann::ordered_json;

long long elapsed_us(
    std::chrono::steady_clock::time_point a,
    std::chrono::steady_clock::time_point b
) {
    return static_cast<long long>(
        std::chrono::duration_cast<std::chrono::microseconds>(b - a).count()
    );
}

wire::DecodeOptions decode_options(const UnpackOptions& opt) {
    wire::DecodeOptions out{};
    out.max_depth = opt.max_depth;
    return out;
}

wire::DocumentOptions document_options(const UnpackOptions& opt) {
    wire::DocumentOptions out{};
    out.max_depth = opt.max_depth;
    out.binary_as_array = opt.binary_as_array;
    return out;
}

wire::DocumentOptions document_options(const PackOptions& opt) {
    wire::DocumentOptions out{};
    out.max_depth = opt.max_depth;
    return out;
}

wire::EncodeOptions encode_options(const PackOptions& opt) {
    wire::EncodeOptions out{};
    out.max_depth = opt.max_depth;
    return out;
}

json parse_json_text(std::string_view text) {
    try {
        return json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        throw wire::Error::at_path(wire::ErrorCode::MalformedDocument, std::string{}, e.what());
    }
}

std::string render(const json& doc, bool pretty) {
    return pretty ? doc.dump(2) : doc.dump();
}
}  // namespace

wire::Node Transcoder::Unpack(std::span<const std::uint8_t> bytes, const UnpackOptions& opt) {
    const auto t0 = std::chrono::steady_clock::now();
    auto node = wire::decode_single(bytes, decode_options(opt));
    const auto t1 = std::chrono::steady_clock::now();
    if (opt.debug) {
        MPTREE_LOG_INFO("Unpack: bytes=%zu decode=%lldus", bytes.size(), elapsed_us(t0, t1));
    }
    return node;
}

std::vector<wire::Node>
Transcoder::UnpackSequence(std::span<const std::uint8_t> bytes, const UnpackOptions& opt) {
    const auto t0 = std::chrono::steady_clock::now();
    auto nodes = wire::decode_sequence(bytes, decode_options(opt));
    const auto t1 = std::chrono::steady_clock::now();
    if (opt.debug) {
        MPTREE_LOG_INFO(
            "UnpackSequence: bytes=%zu values=%zu decode=%lldus", bytes.size(), nodes.size(),
            elapsed_us(t0, t1)
        );
    }
    return nodes;
}

json Transcoder::UnpackDocument(std::span<const std::uint8_t> bytes, const UnpackOptions& opt) {
    const auto node = Unpack(bytes, opt);
    return wire::to_document(node, document_options(opt));
}

std::string Transcoder::UnpackText(
    std::span<const std::uint8_t> bytes,
    bool pretty,
    const UnpackOptions& opt
) {
    const auto t0 = std::chrono::steady_clock::now();
    const auto doc = UnpackDocument(bytes, opt);
    const auto t1 = std::chrono::steady_clock::now();
    auto text = render(doc, pretty);
    const auto t2 = std::chrono::steady_clock::now();
    if (opt.debug) {
        MPTREE_LOG_INFO(
            "UnpackText: bytes=%zu tree=%lldus render=%lldus chars=%zu", bytes.size(),
            elapsed_us(t0, t1), elapsed_us(t1, t2), text.size()
        );
    }
    return text;
}

std::string Transcoder::UnpackSequenceText(
    std::span<const std::uint8_t> bytes,
    bool pretty,
    const UnpackOptions& opt
) {
    const auto nodes = UnpackSequence(bytes, opt);
    const auto doc_opt = document_options(opt);
    json arr = json::array();
    for (const auto& node : nodes) {
        arr.push_back(wire::to_document(node, doc_opt));
    }
    return render(arr, pretty);
}

std::vector<std::uint8_t> Transcoder::Pack(const wire::Node& node, const PackOptions& opt) {
    const auto t0 = std::chrono::steady_clock::now();
    auto bytes = wire::encode_value(node, encode_options(opt));
    const auto t1 = std::chrono::steady_clock::now();
    if (opt.debug) {
        MPTREE_LOG_INFO("Pack: bytes=%zu encode=%lldus", bytes.size(), elapsed_us(t0, t1));
    }
    return bytes;
}

std::vector<std::uint8_t> Transcoder::PackDocument(const json& doc, const PackOptions& opt) {
    const auto node = wire::from_document(doc, document_options(opt));
    return Pack(node, opt);
}

std::vector<std::uint8_t> Transcoder::PackText(std::string_view text, const PackOptions& opt) {
    const auto t0 = std::chrono::steady_clock::now();
    const auto doc = parse_json_text(text);
    const auto t1 = std::chrono::steady_clock::now();
    auto bytes = PackDocument(doc, opt);
    if (opt.debug) {
        MPTREE_LOG_INFO(
            "PackText: chars=%zu parse=%lldus bytes=%zu", text.size(), elapsed_us(t0, t1),
            bytes.size()
        );
    }
    return bytes;
}

std::vector<std::uint8_t>
Transcoder::PackSequenceText(std::string_view text, const PackOptions& opt) {
    const auto doc = parse_json_text(text);
    if (!doc.is_array()) {
        throw wire::Error::at_path(
            wire::ErrorCode::MalformedDocument, std::string{}, "Expected an array of documents."
        );
    }
    const auto doc_opt = document_options(opt);
    const auto enc_opt = encode_options(opt);
    std::vector<std::uint8_t> out;
    for (std::size_t i = 0; i < doc.size(); i++) {
        const std::string prefix = "/" + std::to_string(i);
        std::vector<std::uint8_t> bytes;
        try {
            bytes = wire::encode_value(wire::from_document(doc[i], doc_opt), enc_opt);
        } catch (const wire::Error& e) {
            if (e.offset().has_value()) {
                throw;
            }
            throw wire::Error::at_path(e.code(), prefix + e.path(), e.message());
        }
        out.insert(out.end(), bytes.begin(), bytes.end());
    }
    return out;
}

}  // namespace mptree
