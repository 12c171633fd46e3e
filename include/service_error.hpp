#pragma once

#include <stdexcept>
#include <string>

namespace shorten {

// Error taxonomy shared by the store, the middlewares and the transports.
enum class ErrorCode {
    VALUE_TOO_LARGE,
    KEY_NOT_FOUND,
    RATE_LIMITED,
    CIRCUIT_OPEN,
    INTERNAL
};

class ServiceError : public std::runtime_error {
public:
    ServiceError(ErrorCode code, const std::string& message, long long retry_after_sec = 0)
        : std::runtime_error(message), code_(code), retry_after_sec_(retry_after_sec) {}

    ErrorCode code() const noexcept { return code_; }

    // Only meaningful for RATE_LIMITED.
    long long retry_after_sec() const noexcept { return retry_after_sec_; }

    // Domain outcomes are expected answers, not faults of the service.
    bool is_domain_error() const noexcept {
        return code_ == ErrorCode::VALUE_TOO_LARGE || code_ == ErrorCode::KEY_NOT_FOUND;
    }

    static ServiceError value_too_large() {
        return ServiceError(ErrorCode::VALUE_TOO_LARGE, "result exceeds maximum size");
    }

    static ServiceError key_not_found() {
        return ServiceError(ErrorCode::KEY_NOT_FOUND, "key not found");
    }

    static ServiceError rate_limited(long long retry_after_sec) {
        return ServiceError(ErrorCode::RATE_LIMITED, "rate limit exceeded", retry_after_sec);
    }

    static ServiceError circuit_open() {
        return ServiceError(ErrorCode::CIRCUIT_OPEN, "circuit breaker is open");
    }

    static ServiceError internal(const std::string& message) {
        return ServiceError(ErrorCode::INTERNAL, message);
    }

private:
    ErrorCode code_;
    long long retry_after_sec_;
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALUE_TOO_LARGE: return "value_too_large";
        case ErrorCode::KEY_NOT_FOUND: return "key_not_found";
        case ErrorCode::RATE_LIMITED: return "rate_limited";
        case ErrorCode::CIRCUIT_OPEN: return "circuit_open";
        case ErrorCode::INTERNAL: return "internal";
        default: return "unknown";
    }
}

}
