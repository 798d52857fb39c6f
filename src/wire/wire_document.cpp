/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "wire/wire_document.h"

#include "wire/wire_error.h"
#include "wire/wire_text.h"

#include <array>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <string_view>

namespace mptree::wire {
namespace {
using json = nlohmann::ordered_json;

constexpr std::string_view kNaN = "NaN";
constexpr std::string_view kInf = "Infinity";
constexpr std::string_view kNegInf = "-Infinity";

// Names written by older tooling.
const std::array<std::pair<std::string_view, Variant>, 9> kVariantAliases = {{
    {"Null", Variant::Nil},
    {"U8", Variant::UInt8},
    {"U16", Variant::UInt16},
    {"U32", Variant::UInt32},
    {"U64", Variant::UInt64},
    {"I8", Variant::Int8},
    {"I16", Variant::Int16},
    {"I32", Variant::Int32},
    {"I64", Variant::Int64},
}};

const std::array<std::pair<std::string_view, Category>, 3> kCategoryAliases = {{
    {"Null", Category::Nil},
    {"Bin", Category::Binary},
    {"Ext", Category::Extension},
}};

json float_to_json(double v) {
    if (std::isnan(v)) {
        return json(std::string(kNaN));
    }
    if (std::isinf(v)) {
        return json(std::string(v > 0 ? kInf : kNegInf));
    }
    return json(v);
}

json bytes_to_json(const Bytes& bytes, const DocumentOptions& opt) {
    if (!opt.binary_as_array) {
        return json(to_hex_bytes(bytes));
    }
    json arr = json::array();
    for (const auto b : bytes) {
        arr.push_back(b);
    }
    return arr;
}

json value_to_json(const Node& node, const DocumentOptions& opt) {
    switch (node.spec().kind) {
        case PayloadKind::None:
            return json(nullptr);
        case PayloadKind::Boolean:
            return json(node.as_bool());
        case PayloadKind::Unsigned:
            return json(node.as_uint());
        case PayloadKind::Signed:
            return json(node.as_int());
        case PayloadKind::Float32:
            return float_to_json(static_cast<double>(node.as_f32()));
        case PayloadKind::Float64:
            return float_to_json(node.as_f64());
        case PayloadKind::Text:
            return json(node.as_string());
        case PayloadKind::Bytes:
            return bytes_to_json(node.as_binary(), opt);
        case PayloadKind::Array: {
            json arr = json::array();
            for (const auto& item : node.as_array()) {
                arr.push_back(to_document(item, opt));
            }
            return arr;
        }
        case PayloadKind::Map: {
            json arr = json::array();
            for (const auto& [k, v] : node.as_map()) {
                json pair = json::array();
                pair.push_back(to_document(k, opt));
                pair.push_back(to_document(v, opt));
                arr.push_back(std::move(pair));
            }
            return arr;
        }
        case PayloadKind::Extension: {
            const auto& ext = node.as_extension();
            json obj = json::object();
            obj["ext_type"] = ext.type;
            obj["data"] = bytes_to_json(ext.data, opt);
            return obj;
        }
    }
    return json(nullptr);
}

class DocumentReader {
   public:
    explicit DocumentReader(const DocumentOptions& options) : _options(options) {}

    Node read(const json& doc, const std::string& path, std::size_t depth) {
        if (!doc.is_object()) {
            fail(path, "Expected an object.");
        }
        for (const auto& kv : doc.items()) {
            if (kv.key() != "raw_marker" && kv.key() != "basic_type" && kv.key() != "data") {
                fail(path + "/" + kv.key(), "Unexpected field.");
            }
        }

        const std::uint8_t marker =
            read_marker(field(doc, "raw_marker", path), path + "/raw_marker");
        const Category category =
            read_category(field(doc, "basic_type", path), path + "/basic_type");

        const auto& data = field(doc, "data", path);
        const std::string data_path = path + "/data";
        if (!data.is_object()) {
            fail(data_path, "Expected an object.");
        }
        for (const auto& kv : data.items()) {
            if (kv.key() != "type" && kv.key() != "value") {
                fail(data_path + "/" + kv.key(), "Unexpected field.");
            }
        }
        const auto& type_json = field(data, "type", data_path);
        const json* value = data.contains("value") ? &data.at("value") : nullptr;
        const std::string value_path = data_path + "/value";

        const Variant variant = read_variant(type_json, value, data_path + "/type");
        const auto& vs = variant_spec(variant);

        if (category_of_marker(marker) != category) {
            fail(
                path + "/basic_type",
                "Category " + std::string(category_name(category)) + " does not match marker "
                    + std::to_string(marker) + "."
            );
        }
        if (vs.category != category || !vs.contains(marker)) {
            fail(
                path + "/raw_marker",
                "Marker " + std::to_string(marker) + " is not a " + std::string(vs.name)
                    + " marker."
            );
        }

        if (value == nullptr) {
            if (vs.kind != PayloadKind::None) {
                fail(data_path, "Missing field 'value'.");
            }
            return Node(marker, variant, std::monostate{});
        }
        return Node(marker, variant, read_payload(vs, *value, value_path, depth));
    }

   private:
    [[noreturn]] static void fail(const std::string& path, const std::string& message) {
        throw Error::at_path(ErrorCode::MalformedDocument, path, message);
    }

    static const json& field(const json& obj, const char* name, const std::string& path) {
        const auto it = obj.find(name);
        if (it == obj.end()) {
            fail(path, std::string("Missing field '") + name + "'.");
        }
        return *it;
    }

    static std::uint8_t read_marker(const json& j, const std::string& path) {
        if (!j.is_number_integer()) {
            fail(path, "Expected an integer.");
        }
        if (!j.is_number_unsigned() || j.get<std::uint64_t>() > 255) {
            fail(path, "Marker outside [0..255].");
        }
        const auto marker = static_cast<std::uint8_t>(j.get<std::uint64_t>());
        if (marker == kReservedMarker) {
            fail(path, "Marker 193 (0xC1) is reserved.");
        }
        return marker;
    }

    static Category read_category(const json& j, const std::string& path) {
        if (!j.is_string()) {
            fail(path, "Expected a string.");
        }
        const auto& name = j.get_ref<const std::string&>();
        if (auto c = parse_category_name(name)) {
            return *c;
        }
        for (const auto& [k, v] : kCategoryAliases) {
            if (k == name) {
                return v;
            }
        }
        fail(path, "Unknown basic type '" + name + "'.");
    }

    static Variant read_variant(const json& j, const json* value, const std::string& path) {
        if (!j.is_string()) {
            fail(path, "Expected a string.");
        }
        const auto& name = j.get_ref<const std::string&>();
        if (auto v = parse_variant_name(name)) {
            return *v;
        }
        if (name == "Bool") {
            if (value == nullptr || !value->is_boolean()) {
                fail(path, "Variant 'Bool' needs a boolean value.");
            }
            return value->get<bool>() ? Variant::True : Variant::False;
        }
        for (const auto& [k, v] : kVariantAliases) {
            if (k == name) {
                return v;
            }
        }
        fail(path, "Unknown variant '" + name + "'.");
    }

    static double read_float(const json& j, const std::string& path) {
        if (j.is_number()) {
            return j.get<double>();
        }
        if (j.is_string()) {
            const auto& s = j.get_ref<const std::string&>();
            if (s == kNaN) {
                return std::numeric_limits<double>::quiet_NaN();
            }
            if (s == kInf) {
                return std::numeric_limits<double>::infinity();
            }
            if (s == kNegInf) {
                return -std::numeric_limits<double>::infinity();
            }
        }
        fail(path, "Expected a number.");
    }

    static Bytes read_bytes(const json& j, const std::string& path) {
        if (j.is_string()) {
            auto bytes = parse_hex_bytes(j.get_ref<const std::string&>());
            if (!bytes.has_value()) {
                fail(path, "Invalid hex byte string.");
            }
            return std::move(*bytes);
        }
        if (j.is_array()) {
            Bytes out;
            out.reserve(j.size());
            for (std::size_t i = 0; i < j.size(); i++) {
                const auto& b = j[i];
                if (!b.is_number_unsigned() || b.get<std::uint64_t>() > 255) {
                    fail(path + "/" + std::to_string(i), "Expected a byte value.");
                }
                out.push_back(static_cast<std::uint8_t>(b.get<std::uint64_t>()));
            }
            return out;
        }
        fail(path, "Expected a hex string or an array of bytes.");
    }

    void enter(std::size_t depth, const std::string& path) const {
        if (depth + 1 > _options.max_depth) {
            throw Error::at_path(
                ErrorCode::DepthExceeded, path,
                "Nesting deeper than " + std::to_string(_options.max_depth) + " levels."
            );
        }
    }

    Payload read_payload(
        const VariantSpec& vs,
        const json& j,
        const std::string& path,
        std::size_t depth
    ) {
        switch (vs.kind) {
            case PayloadKind::None:
                if (!j.is_null()) {
                    fail(path, "Expected null.");
                }
                return std::monostate{};
            case PayloadKind::Boolean:
                if (!j.is_boolean() || j.get<bool>() != (vs.variant == Variant::True)) {
                    fail(path, vs.variant == Variant::True ? "Expected true." : "Expected false.");
                }
                return j.get<bool>();
            case PayloadKind::Unsigned:
                if (!j.is_number_integer()) {
                    fail(path, "Expected an integer.");
                }
                if (!j.is_number_unsigned()) {
                    throw Error::at_path(
                        ErrorCode::ValueOutOfRange, path,
                        std::string(vs.name) + " cannot hold a negative value."
                    );
                }
                return j.get<std::uint64_t>();
            case PayloadKind::Signed:
                if (!j.is_number_integer()) {
                    fail(path, "Expected an integer.");
                }
                if (j.is_number_unsigned()
                    && j.get<std::uint64_t>()
                           > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                    throw Error::at_path(
                        ErrorCode::ValueOutOfRange, path,
                        std::string(vs.name) + " value exceeds the signed 64-bit range."
                    );
                }
                return j.get<std::int64_t>();
            case PayloadKind::Float32: {
                const double d = read_float(j, path);
                if (std::isfinite(d) && std::fabs(d) > std::numeric_limits<float>::max()) {
                    throw Error::at_path(
                        ErrorCode::ValueOutOfRange, path, "Value does not fit F32."
                    );
                }
                return static_cast<float>(d);
            }
            case PayloadKind::Float64:
                return read_float(j, path);
            case PayloadKind::Text:
                if (!j.is_string()) {
                    fail(path, "Expected a string.");
                }
                return j.get<std::string>();
            case PayloadKind::Bytes:
                return read_bytes(j, path);
            case PayloadKind::Array: {
                enter(depth, path);
                if (!j.is_array()) {
                    fail(path, "Expected an array.");
                }
                Array items;
                items.reserve(j.size());
                for (std::size_t i = 0; i < j.size(); i++) {
                    items.push_back(read(j[i], path + "/" + std::to_string(i), depth + 1));
                }
                return items;
            }
            case PayloadKind::Map: {
                enter(depth, path);
                if (!j.is_array()) {
                    fail(path, "Expected an array of [key, value] pairs.");
                }
                Map pairs;
                pairs.reserve(j.size());
                for (std::size_t i = 0; i < j.size(); i++) {
                    const std::string pair_path = path + "/" + std::to_string(i);
                    const auto& pair = j[i];
                    if (!pair.is_array() || pair.size() != 2) {
                        fail(pair_path, "Expected a [key, value] pair.");
                    }
                    Node key = read(pair[0], pair_path + "/0", depth + 1);
                    Node value = read(pair[1], pair_path + "/1", depth + 1);
                    pairs.emplace_back(std::move(key), std::move(value));
                }
                return pairs;
            }
            case PayloadKind::Extension: {
                if (!j.is_object() || j.size() != 2 || !j.contains("ext_type")
                    || !j.contains("data")) {
                    fail(path, "Expected {\"ext_type\", \"data\"}.");
                }
                const auto& t = j.at("ext_type");
                bool in_range = t.is_number_integer();
                if (in_range && t.is_number_unsigned()) {
                    in_range = t.get<std::uint64_t>() <= 127;
                } else if (in_range) {
                    in_range = t.get<std::int64_t>() >= -128 && t.get<std::int64_t>() <= 127;
                }
                if (!in_range) {
                    fail(path + "/ext_type", "Expected an integer in [-128..127].");
                }
                Extension ext;
                ext.type = static_cast<std::int8_t>(t.get<std::int64_t>());
                ext.data = read_bytes(j.at("data"), path + "/data");
                return ext;
            }
        }
        fail(path, "Unsupported variant.");
    }

    const DocumentOptions& _options;
};
}  // namespace

json to_document(const Node& node, const DocumentOptions& options) {
    json data = json::object();
    data["type"] = std::string(variant_name(node.variant()));
    data["value"] = value_to_json(node, options);

    json doc = json::object();
    doc["raw_marker"] = node.marker();
    doc["basic_type"] = std::string(category_name(node.category()));
    doc["data"] = std::move(data);
    return doc;
}

Node from_document(const json& doc, const DocumentOptions& options) {
    DocumentReader reader(options);
    return reader.read(doc, std::string{}, 0);
}

}  // namespace mptree::wire
