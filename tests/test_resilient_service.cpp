#include <gtest/gtest.h>
#include "resilient_service.hpp"
#include "service_error.hpp"
#include "key_store.hpp"
#include "metrics.hpp"
#include <memory>
#include <stdexcept>
#include <thread>

using namespace shorten;

namespace {

class FlakyService : public KeyService {
public:
    int calls = 0;
    bool broken = false;

    CreateResult create(const std::string& value) override {
        ++calls;
        if (broken) throw ServiceError::internal("backend down");
        CreateResult res;
        res.key = value.substr(0, 6);
        res.inserted = true;
        return res;
    }

    std::string lookup(const std::string& key) override {
        ++calls;
        if (broken) throw std::runtime_error("socket closed");
        throw ServiceError::key_not_found();
    }
};

ResilientService::Settings generous() {
    ResilientService::Settings s;
    s.name = "test";
    s.create_rate = 1000.0;
    s.create_burst = 1000;
    s.lookup_rate = 1000.0;
    s.lookup_burst = 1000;
    s.max_consecutive_failures = 2;
    s.open_timeout = std::chrono::milliseconds(50);
    return s;
}

}

class ResilientServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        MetricsRegistry::instance().reset();
        inner = std::make_shared<FlakyService>();
    }

    std::shared_ptr<FlakyService> inner;
};

TEST_F(ResilientServiceTest, PassesResultsThrough) {
    ResilientService svc(std::make_shared<KeyStore>(), generous());
    EXPECT_EQ(svc.create("12345").key, "gnzLDu");
    EXPECT_EQ(svc.lookup("gnzLDu"), "12345");
}

TEST_F(ResilientServiceTest, RateLimitRefusesWithoutCallingThrough) {
    auto settings = generous();
    settings.create_rate = 0.01;
    settings.create_burst = 1;
    ResilientService svc(inner, settings);

    EXPECT_NO_THROW(svc.create("abcdefgh"));
    try {
        svc.create("abcdefgh");
        FAIL() << "expected RATE_LIMITED";
    } catch (const ServiceError& e) {
        EXPECT_EQ(e.code(), ErrorCode::RATE_LIMITED);
        EXPECT_GE(e.retry_after_sec(), 1);
    }
    EXPECT_EQ(inner->calls, 1);
    EXPECT_EQ(MetricsRegistry::instance().get_counter("shorten_rate_limited_total{method=\"create\"}"), 1.0);
}

TEST_F(ResilientServiceTest, DomainErrorsDoNotTripBreaker) {
    ResilientService svc(inner, generous());
    for (int i = 0; i < 10; ++i) {
        EXPECT_THROW(svc.lookup("missing"), ServiceError);
    }
    EXPECT_EQ(svc.lookup_breaker().state(), CircuitBreaker::State::CLOSED);
    EXPECT_EQ(inner->calls, 10);
}

TEST_F(ResilientServiceTest, FailuresOpenBreaker) {
    inner->broken = true;
    ResilientService svc(inner, generous());

    for (int i = 0; i < 3; ++i) {
        EXPECT_THROW(svc.create("abcdefgh"), ServiceError);
    }
    EXPECT_EQ(svc.create_breaker().state(), CircuitBreaker::State::OPEN);

    try {
        svc.create("abcdefgh");
        FAIL() << "expected CIRCUIT_OPEN";
    } catch (const ServiceError& e) {
        EXPECT_EQ(e.code(), ErrorCode::CIRCUIT_OPEN);
    }
    EXPECT_EQ(inner->calls, 3);

    // Lookups have their own breaker.
    EXPECT_EQ(svc.lookup_breaker().state(), CircuitBreaker::State::CLOSED);
}

TEST_F(ResilientServiceTest, NonServiceErrorsCountAsFailuresAndPropagate) {
    inner->broken = true;
    ResilientService svc(inner, generous());

    for (int i = 0; i < 3; ++i) {
        EXPECT_THROW(svc.lookup("k"), std::runtime_error);
    }
    EXPECT_EQ(svc.lookup_breaker().state(), CircuitBreaker::State::OPEN);
}

TEST_F(ResilientServiceTest, BreakerRecoversAfterTimeout) {
    inner->broken = true;
    ResilientService svc(inner, generous());
    for (int i = 0; i < 3; ++i) {
        EXPECT_THROW(svc.create("abcdefgh"), ServiceError);
    }

    inner->broken = false;
    std::this_thread::sleep_for(std::chrono::milliseconds(80));

    EXPECT_EQ(svc.create("abcdefgh").key, "abcdef");
    EXPECT_EQ(svc.create_breaker().state(), CircuitBreaker::State::CLOSED);
}

TEST_F(ResilientServiceTest, BreakerNamesCarryPrefix) {
    ResilientService svc(inner, generous());
    EXPECT_EQ(svc.create_breaker().name(), "test.create");
    EXPECT_EQ(svc.lookup_breaker().name(), "test.lookup");
}
