#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "key_service.hpp"
#include "rate_limiter.hpp"
#include "circuit_breaker.hpp"

namespace shorten {

// Gates each operation behind its own token bucket and circuit breaker,
// in that order. Refused calls raise RATE_LIMITED or CIRCUIT_OPEN without
// reaching the wrapped service.
//
// Domain errors (VALUE_TOO_LARGE, KEY_NOT_FOUND) are answers, so the breaker
// records them as successes; anything else counts as a failure.
class ResilientService : public KeyService {
public:
    struct Settings {
        std::string name = "server";  // Prefix of the breaker names
        double create_rate = 50.0;
        size_t create_burst = 1;
        double lookup_rate = 100.0;
        size_t lookup_burst = 500;
        unsigned max_consecutive_failures = 5;
        std::chrono::milliseconds open_timeout{60000};
    };

    ResilientService(std::shared_ptr<KeyService> next, const Settings& settings);

    CreateResult create(const std::string& value) override;
    std::string lookup(const std::string& key) override;

    CircuitBreaker& create_breaker() { return create_breaker_; }
    CircuitBreaker& lookup_breaker() { return lookup_breaker_; }

private:
    std::shared_ptr<KeyService> next_;

    RateLimiter create_limiter_;
    RateLimiter lookup_limiter_;
    CircuitBreaker create_breaker_;
    CircuitBreaker lookup_breaker_;

    template<class Fn>
    auto guarded(const char* method, RateLimiter& limiter, CircuitBreaker& breaker, Fn&& call)
        -> decltype(call());
};

}
