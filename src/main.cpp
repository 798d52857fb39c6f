/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "common.h"

#include <charconv>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

struct Settings {
    bool pretty = false;
    bool multi = false;
    bool binary_as_array = false;
    bool debug = false;
    std::size_t max_depth = mptree::wire::kDefaultMaxDepth;
    std::optional<fs::path> out_dir;
};

static void print_usage() {
    MPTREE_LOG_INFO(
        "Usage:\n" \
        "    mptree <file-or-dir> [--pretty] [--multi] [--bin-array] [--max-depth <n>] [--out <dir>] [--debug]\n\n" \
        "Options:\n" \
        "    First argument must be a file or directory\n" \
        "    --pretty        indents JSON output\n" \
        "    --multi         binary inputs hold concatenated values, JSON inputs an array of documents\n" \
        "    --bin-array     writes binary payloads as byte arrays instead of hex strings\n" \
        "    --max-depth     container nesting limit (default 512)\n" \
        "    --out           output root (default: output/ next to the executable)\n" \
        "    --debug         enables extra logging\n"
    );
    MPTREE_LOG_INFO("[INFO] .msgpack/.mp/.bin inputs are unpacked to JSON, .json inputs are packed.");
}

static mptree::UnpackOptions unpack_options(const Settings& settings) {
    mptree::UnpackOptions opt{};
    opt.max_depth = settings.max_depth;
    opt.binary_as_array = settings.binary_as_array;
    opt.debug = settings.debug;
    return opt;
}

static mptree::PackOptions pack_options(const Settings& settings) {
    mptree::PackOptions opt{};
    opt.max_depth = settings.max_depth;
    opt.debug = settings.debug;
    return opt;
}

static bool process_file(const fs::path& path, const fs::path& out_root, const Settings& settings) {
    const std::string base = path.stem().string();
    try {
        if (mptree::fs_utils::is_binary_input(path)) {
            const auto bytes = mptree::fs_utils::read_file(path);
            const auto opt = unpack_options(settings);
            const auto text =
                settings.multi ? mptree::Transcoder::UnpackSequenceText(bytes, settings.pretty, opt)
                               : mptree::Transcoder::UnpackText(bytes, settings.pretty, opt);
            const fs::path json_path = out_root / "json" / (base + std::string(".json"));
            mptree::fs_utils::write_text_file(json_path, text);
            MPTREE_LOG_INFO("Wrote: %s", json_path.string().c_str());
        } else if (mptree::fs_utils::is_json_input(path)) {
            const auto text = mptree::fs_utils::read_text_file(path);
            if (text.empty()) {
                throw std::runtime_error("JSON file is empty: " + path.string());
            }
            const auto opt = pack_options(settings);
            const auto bytes = settings.multi ? mptree::Transcoder::PackSequenceText(text, opt)
                                              : mptree::Transcoder::PackText(text, opt);
            const fs::path mp_path = out_root / "msgpack" / (base + std::string(".msgpack"));
            mptree::fs_utils::write_file(mp_path, bytes);
            MPTREE_LOG_INFO("Wrote: %s", mp_path.string().c_str());
        } else {
            MPTREE_LOG_INFO("Skipped: %s", path.string().c_str());
        }
    } catch (const std::exception& e) {
        MPTREE_LOG_ERROR("Failed: %s (%s)", path.string().c_str(), e.what());
        return false;
    }
    return true;
}

static std::optional<std::size_t> parse_size(std::string_view s) {
    std::size_t v = 0;
    const auto res = std::from_chars(s.data(), s.data() + s.size(), v);
    if (res.ec != std::errc{} || res.ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return v;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage();
        return 2;
    }

    const std::string_view first_arg = argv[1];
    if (!first_arg.empty() && first_arg[0] == '-') {
        MPTREE_LOG_ERROR("First argument must be a file or folder.");
        print_usage();
        return 2;
    }
    const fs::path input = fs::path(std::string(first_arg));
    Settings settings;
    for (int i = 2; i < argc; i++) {
        const std::string_view arg = argv[i];
        if (arg == "--pretty") {
            settings.pretty = true;
            continue;
        }
        if (arg == "--multi") {
            settings.multi = true;
            continue;
        }
        if (arg == "--bin-array") {
            settings.binary_as_array = true;
            continue;
        }
        if (arg == "--debug") {
            settings.debug = true;
            continue;
        }
        if (arg == "--max-depth") {
            if (i + 1 >= argc) {
                MPTREE_LOG_ERROR("Missing value for --max-depth");
                return 2;
            }
            const auto depth = parse_size(argv[++i]);
            if (!depth.has_value() || *depth == 0) {
                MPTREE_LOG_ERROR("Invalid value for --max-depth: %s", argv[i]);
                return 2;
            }
            settings.max_depth = *depth;
            continue;
        }
        if (arg == "--out") {
            if (i + 1 >= argc) {
                MPTREE_LOG_ERROR("Missing value for --out");
                return 2;
            }
            settings.out_dir = fs::path(argv[++i]);
            continue;
        }
        MPTREE_LOG_ERROR("Unknown option: %s", std::string(arg).c_str());
        return 2;
    }

    if (!fs::exists(input)) {
        MPTREE_LOG_ERROR("Input does not exist: %s", input.string().c_str());
        return 2;
    }

    const fs::path out_root = settings.out_dir.has_value()
                                  ? *settings.out_dir
                                  : mptree::fs_utils::executable_dir() / "output";

    bool ok = true;
    if (fs::is_directory(input)) {
        const auto inputs = mptree::fs_utils::collect_inputs(input);
        for (const auto& p : inputs) {
            ok = process_file(p, out_root, settings) && ok;
        }
        return ok ? 0 : 1;
    }

    ok = process_file(input, out_root, settings);
    return ok ? 0 : 1;
}
