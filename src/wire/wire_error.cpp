/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "wire/wire_error.h"

namespace mptree::wire {

std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::UnexpectedEof:
            return "UnexpectedEof";
        case ErrorCode::InvalidMarker:
            return "InvalidMarker";
        case ErrorCode::DepthExceeded:
            return "DepthExceeded";
        case ErrorCode::TrailingData:
            return "TrailingData";
        case ErrorCode::ValueOutOfRange:
            return "ValueOutOfRange";
        case ErrorCode::InconsistentMarker:
            return "InconsistentMarker";
        case ErrorCode::InvalidUtf8:
            return "InvalidUtf8";
        case ErrorCode::MalformedDocument:
            return "MalformedDocument";
    }
    return "Unknown";
}

Error::Error(ErrorCode code, const std::string& message)
    : Error(
          code, std::nullopt, std::string{}, message,
          std::string(error_code_name(code)) + ": " + message
      ) {}

Error::Error(
    ErrorCode code,
    std::optional<std::size_t> offset,
    std::string path,
    const std::string& message,
    const std::string& what
)
    : std::runtime_error(what),
      _code(code),
      _offset(offset),
      _path(std::move(path)),
      _message(message) {}

Error Error::at_offset(ErrorCode code, std::size_t offset, const std::string& message) {
    std::string what(error_code_name(code));
    what += " at offset " + std::to_string(offset) + ": " + message;
    return Error(code, offset, std::string{}, message, what);
}

Error Error::at_path(ErrorCode code, const std::string& path, const std::string& message) {
    std::string what(error_code_name(code));
    what += " at " + (path.empty() ? std::string("/") : path) + ": " + message;
    return Error(code, std::nullopt, path, message, what);
}

}  // namespace mptree::wire
