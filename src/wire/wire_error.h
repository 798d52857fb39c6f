/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace mptree::wire {

enum class ErrorCode {
    UnexpectedEof,
    InvalidMarker,
    DepthExceeded,
    TrailingData,
    ValueOutOfRange,
    InconsistentMarker,
    InvalidUtf8,
    MalformedDocument,
};

std::string_view error_code_name(ErrorCode code);

// Decode failures carry the byte offset, encode and document failures the
// JSON pointer of the offending node.
class Error : public std::runtime_error {
   public:
    Error(ErrorCode code, const std::string& message);

    static Error at_offset(ErrorCode code, std::size_t offset, const std::string& message);
    static Error at_path(ErrorCode code, const std::string& path, const std::string& message);

    ErrorCode code() const { return _code; }
    std::optional<std::size_t> offset() const { return _offset; }
    const std::string& path() const { return _path; }
    const std::string& message() const { return _message; }

   private:
    Error(
        ErrorCode code,
        std::optional<std::size_t> offset,
        std::string path,
        const std::string& message,
        const std::string& what
    );

    ErrorCode _code;
    std::optional<std::size_t> _offset;
    std::string _path;
    std::string _message;
};

}  // namespace mptree::wire
