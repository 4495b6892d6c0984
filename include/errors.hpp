#pragma once

#include <string>
#include <string_view>

namespace rproxy {

enum class ErrorCode {
    InvalidUrl,
    InvalidPattern,
    CircuitOpen,
    Unauthorized,
    Forbidden,
    BackendFailure
};

struct Error {
    ErrorCode code;
    std::string message;
};

inline std::string_view to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidUrl: return "invalid url";
        case ErrorCode::InvalidPattern: return "invalid pattern";
        case ErrorCode::CircuitOpen: return "circuit breaker is open";
        case ErrorCode::Unauthorized: return "unauthorized";
        case ErrorCode::Forbidden: return "forbidden";
        case ErrorCode::BackendFailure: return "backend failure";
        default: return "unknown error";
    }
}

} // namespace rproxy
