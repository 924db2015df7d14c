#include "error.hpp"

namespace LDE {

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
        case ErrorCode::BufferSizeMismatch: return "BufferSizeMismatch";
        case ErrorCode::BitstreamError: return "BitstreamError";
        case ErrorCode::EncodingFailed: return "EncodingFailed";
    }
    return "Unknown";
}

void Error::clear() {
    this->code = ErrorCode::None;
    this->expected = 0;
    this->actual = 0;
    this->message.clear();
}

std::string Error::describe() const {
    switch (this->code) {
        case ErrorCode::None:
            return "ok";
        case ErrorCode::InvalidConfig:
            return "Invalid configuration: " + this->message;
        case ErrorCode::BufferSizeMismatch:
            return "Buffer size mismatch: expected " + std::to_string(this->expected) +
                   ", got " + std::to_string(this->actual);
        case ErrorCode::BitstreamError:
            return "Bitstream error: " + this->message;
        case ErrorCode::EncodingFailed:
            return "Encoding failed: " + this->message;
    }
    return this->message;
}

bool Error::report(Error* err, ErrorCode code, const std::string& message) {
    if (err) {
        err->code = code;
        err->expected = 0;
        err->actual = 0;
        err->message = message;
    }
    return false;
}

bool Error::size_mismatch(Error* err, size_t expected, size_t actual) {
    if (err) {
        err->code = ErrorCode::BufferSizeMismatch;
        err->expected = expected;
        err->actual = actual;
        err->message.clear();
    }
    return false;
}

} // namespace LDE
