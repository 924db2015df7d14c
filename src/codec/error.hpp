#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace LDE {

enum class ErrorCode : uint8_t {
    None = 0,
    InvalidConfig,
    BufferSizeMismatch,
    BitstreamError,
    EncodingFailed
};

const char* error_code_name(ErrorCode code);

struct Error {
    ErrorCode code = ErrorCode::None;
    size_t expected = 0; // BufferSizeMismatch only
    size_t actual = 0;   // BufferSizeMismatch only
    std::string message;

    bool ok() const { return this->code == ErrorCode::None; }
    void clear();
    std::string describe() const;

    // Fills *err when the caller asked for details; always returns false so
    // call sites can `return report(...)`.
    static bool report(Error* err, ErrorCode code, const std::string& message);
    static bool size_mismatch(Error* err, size_t expected, size_t actual);
};

} // namespace LDE
