/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "wire/wire_error.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <ostream>
#include <vector>

namespace mptree::wire {
inline std::ostream& operator<<(std::ostream& os, ErrorCode code) {
    return os << error_code_name(code);
}
}  // namespace mptree::wire

namespace mptree::test {

inline std::vector<std::uint8_t> bytes(std::initializer_list<int> values) {
    std::vector<std::uint8_t> out;
    out.reserve(values.size());
    for (const int v : values) {
        out.push_back(static_cast<std::uint8_t>(v));
    }
    return out;
}

// Runs fn and returns the wire::Error it throws, nullopt when it returns.
template <typename Fn>
std::optional<wire::Error> catch_error(Fn&& fn) {
    try {
        fn();
    } catch (const wire::Error& e) {
        return e;
    }
    return std::nullopt;
}

}  // namespace mptree::test
