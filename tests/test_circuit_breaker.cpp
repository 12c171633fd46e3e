#include <gtest/gtest.h>
#include "circuit_breaker.hpp"
#include "metrics.hpp"
#include <thread>
#include <chrono>

using namespace shorten;

class CircuitBreakerTest : public ::testing::Test {
protected:
    void SetUp() override {
        MetricsRegistry::instance().reset();
    }

    static CircuitBreaker::Settings fast(unsigned failures = 2) {
        CircuitBreaker::Settings s;
        s.name = "test";
        s.max_consecutive_failures = failures;
        s.open_timeout = std::chrono::milliseconds(50);
        return s;
    }

    void trip(CircuitBreaker& breaker, unsigned failures) {
        for (unsigned i = 0; i <= failures; ++i) {
            ASSERT_TRUE(breaker.allow());
            breaker.record_failure();
        }
    }
};

TEST_F(CircuitBreakerTest, StartsClosed) {
    CircuitBreaker breaker(fast());
    EXPECT_EQ(breaker.state(), CircuitBreaker::State::CLOSED);
    EXPECT_TRUE(breaker.allow());
}

TEST_F(CircuitBreakerTest, TripsAfterMoreThanMaxFailures) {
    CircuitBreaker breaker(fast(2));

    breaker.record_failure();
    breaker.record_failure();
    EXPECT_EQ(breaker.state(), CircuitBreaker::State::CLOSED);

    breaker.record_failure();
    EXPECT_EQ(breaker.state(), CircuitBreaker::State::OPEN);
    EXPECT_FALSE(breaker.allow());
    EXPECT_EQ(MetricsRegistry::instance().get_gauge("shorten_circuit_open{breaker=\"test\"}"), 1.0);
}

TEST_F(CircuitBreakerTest, SuccessResetsFailureStreak) {
    CircuitBreaker breaker(fast(2));
    breaker.record_failure();
    breaker.record_failure();
    breaker.record_success();
    breaker.record_failure();
    breaker.record_failure();
    EXPECT_EQ(breaker.state(), CircuitBreaker::State::CLOSED);
}

TEST_F(CircuitBreakerTest, HalfOpensAfterTimeoutAndRecovers) {
    CircuitBreaker breaker(fast(2));
    trip(breaker, 2);
    EXPECT_EQ(breaker.state(), CircuitBreaker::State::OPEN);

    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    EXPECT_EQ(breaker.state(), CircuitBreaker::State::HALF_OPEN);

    // One trial call at a time.
    EXPECT_TRUE(breaker.allow());
    EXPECT_FALSE(breaker.allow());

    breaker.record_success();
    EXPECT_EQ(breaker.state(), CircuitBreaker::State::CLOSED);
    EXPECT_TRUE(breaker.allow());
    EXPECT_EQ(MetricsRegistry::instance().get_gauge("shorten_circuit_open{breaker=\"test\"}"), 0.0);
}

TEST_F(CircuitBreakerTest, FailedTrialReopens) {
    CircuitBreaker breaker(fast(1));
    trip(breaker, 1);

    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    ASSERT_TRUE(breaker.allow());
    breaker.record_failure();

    EXPECT_EQ(breaker.state(), CircuitBreaker::State::OPEN);
    EXPECT_FALSE(breaker.allow());
}

TEST_F(CircuitBreakerTest, StateNames) {
    EXPECT_STREQ(CircuitBreaker::state_to_string(CircuitBreaker::State::CLOSED), "closed");
    EXPECT_STREQ(CircuitBreaker::state_to_string(CircuitBreaker::State::OPEN), "open");
    EXPECT_STREQ(CircuitBreaker::state_to_string(CircuitBreaker::State::HALF_OPEN), "half-open");
}
