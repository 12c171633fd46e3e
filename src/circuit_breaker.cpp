#include "circuit_breaker.hpp"
#include "metrics.hpp"
#include "service_logger.hpp"
#include <utility>

namespace shorten {

CircuitBreaker::CircuitBreaker(Settings settings)
    : settings_(std::move(settings))
{}

// Moves an open breaker to half-open once its timeout has run out.
void CircuitBreaker::advance(std::chrono::steady_clock::time_point now) {
    if (state_ == State::OPEN && now - opened_at_ >= settings_.open_timeout) {
        transition(State::HALF_OPEN, now);
    }
}

void CircuitBreaker::transition(State next, std::chrono::steady_clock::time_point now) {
    if (state_ == next) return;
    State previous = state_;
    state_ = next;
    consecutive_failures_ = 0;
    half_open_in_flight_ = 0;
    if (next == State::OPEN) {
        opened_at_ = now;
    }

    MetricsRegistry::instance().set_gauge(
        "shorten_circuit_open{breaker=\"" + settings_.name + "\"}", next == State::OPEN ? 1.0 : 0.0);
    ServiceLogger::log(next == State::OPEN ? ServiceLogger::Level::WARNING : ServiceLogger::Level::INFO,
                       ServiceLogger::EventType::CIRCUIT_STATE, "internal",
                       "breaker=" + settings_.name + " from=" + state_to_string(previous) +
                       " to=" + state_to_string(next));
}

bool CircuitBreaker::allow() {
    std::lock_guard<std::mutex> lock(mutex_);
    advance(std::chrono::steady_clock::now());

    switch (state_) {
        case State::CLOSED:
            return true;
        case State::OPEN:
            return false;
        case State::HALF_OPEN:
            if (half_open_in_flight_ >= settings_.half_open_max_requests) {
                return false;
            }
            ++half_open_in_flight_;
            return true;
    }
    return false;
}

void CircuitBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    advance(now);

    if (state_ == State::HALF_OPEN) {
        transition(State::CLOSED, now);
    } else if (state_ == State::CLOSED) {
        consecutive_failures_ = 0;
    }
}

void CircuitBreaker::record_failure() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = std::chrono::steady_clock::now();
    advance(now);

    if (state_ == State::HALF_OPEN) {
        transition(State::OPEN, now);
    } else if (state_ == State::CLOSED) {
        if (++consecutive_failures_ > settings_.max_consecutive_failures) {
            transition(State::OPEN, now);
        }
    }
}

CircuitBreaker::State CircuitBreaker::state() {
    std::lock_guard<std::mutex> lock(mutex_);
    advance(std::chrono::steady_clock::now());
    return state_;
}

const char* CircuitBreaker::state_to_string(State state) {
    switch (state) {
        case State::CLOSED: return "closed";
        case State::OPEN: return "open";
        case State::HALF_OPEN: return "half-open";
        default: return "unknown";
    }
}

}
