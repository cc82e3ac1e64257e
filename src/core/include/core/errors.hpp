#pragma once
#include <string>

namespace tlc::core {

// Failures that abort a build. Everything else degrades and is only logged.
enum class ErrorKind {
    MissingAsset,       // subtitle file or font directory does not exist
    ContractViolation   // malformed descriptor, unknown timeline, broken graph
};

struct BuildError {
    ErrorKind kind = ErrorKind::ContractViolation;
    std::string message;
};

inline const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::MissingAsset: return "MissingAsset";
        case ErrorKind::ContractViolation: return "ContractViolation";
    }
    return "Unknown";
}

inline std::string describe(const BuildError& err) {
    return std::string(error_kind_name(err.kind)) + ": " + err.message;
}

} // namespace tlc::core
