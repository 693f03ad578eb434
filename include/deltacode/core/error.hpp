#pragma once

/**
 * @file error.hpp
 * @brief Error values reported by the delta engine and its loaders
 *
 * Every fallible operation returns deltacode::Result<T>, whose error side is
 * an Error carrying a machine-readable code and a human-readable message.
 * Callers branch on the code (e.g. DuplicatePath aborts a comparison before
 * matching) and print the message.
 */

#include <string>
#include <utility>

namespace deltacode {

enum class ErrorCode {
    DuplicatePath,    // Two records in one snapshot share a path
    MalformedRecord,  // A record lacks a path or fingerprint, or has a bad size
    InvalidConfig,    // Configuration document has wrong types or values
    Io,               // File could not be opened, read or written
    Parse             // Input is not JSON or lacks the expected layout
};

struct Error {
    ErrorCode code = ErrorCode::Parse;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    std::string to_string() const;
};

class ErrorCodeUtils {
public:
    static const char* to_string(ErrorCode code) {
        switch (code) {
            case ErrorCode::DuplicatePath: return "DuplicatePathError";
            case ErrorCode::MalformedRecord: return "MalformedRecordError";
            case ErrorCode::InvalidConfig: return "InvalidConfigError";
            case ErrorCode::Io: return "IoError";
            case ErrorCode::Parse: return "ParseError";
            default: return "UnknownError";
        }
    }
};

inline std::string Error::to_string() const {
    return std::string(ErrorCodeUtils::to_string(code)) + ": " + message;
}

} // namespace deltacode
