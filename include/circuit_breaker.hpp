#pragma once

#include <chrono>
#include <mutex>
#include <string>

namespace shorten {

// Three-state circuit breaker.
//
// CLOSED: calls pass; more than `max_consecutive_failures` failures in a row
//         trip the breaker.
// OPEN:   calls are refused until `open_timeout` has elapsed.
// HALF_OPEN: up to `half_open_max_requests` trial calls pass; one success
//         closes the breaker, one failure opens it again.
class CircuitBreaker {
public:
    enum class State {
        CLOSED,
        OPEN,
        HALF_OPEN
    };

    struct Settings {
        std::string name = "default";
        unsigned max_consecutive_failures = 5;
        std::chrono::milliseconds open_timeout{60000};
        unsigned half_open_max_requests = 1;
    };

    explicit CircuitBreaker(Settings settings);

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;

    // Reserves a slot for one call. Returns false when the call must be refused.
    bool allow();

    // Reports the outcome of a call admitted by allow().
    void record_success();
    void record_failure();

    State state();
    const std::string& name() const { return settings_.name; }

    static const char* state_to_string(State state);

private:
    const Settings settings_;

    State state_ = State::CLOSED;
    unsigned consecutive_failures_ = 0;
    unsigned half_open_in_flight_ = 0;
    std::chrono::steady_clock::time_point opened_at_;
    std::mutex mutex_;

    void advance(std::chrono::steady_clock::time_point now);
    void transition(State next, std::chrono::steady_clock::time_point now);
};

}
