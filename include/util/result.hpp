#pragma once
#include <string>
#include <utility>

namespace docsan {

enum class ErrorKind : int {
    None = 0,
    InputNotFound,
    InvalidArchive,
    MissingCoreFile,
    TransformFailure,
    OutputFailure,
    InvalidConfig,
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:             return "None";
        case ErrorKind::InputNotFound:    return "InputNotFound";
        case ErrorKind::InvalidArchive:   return "InvalidArchive";
        case ErrorKind::MissingCoreFile:  return "MissingCoreFile";
        case ErrorKind::TransformFailure: return "TransformFailure";
        case ErrorKind::OutputFailure:    return "OutputFailure";
        case ErrorKind::InvalidConfig:    return "InvalidConfig";
    }
    return "Unknown";
}

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m) {
        return {.ok = false, .kind = k, .msg = std::move(m)};
    }
};

} // namespace docsan
