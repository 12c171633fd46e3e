#include <gtest/gtest.h>
#include "short_client.hpp"
#include "resilient_service.hpp"
#include <stdexcept>

using namespace shorten;

TEST(ShortClientTest, ParsesAddress) {
    ShortClient client("localhost:8081");
    EXPECT_EQ(client.host(), "localhost");
    EXPECT_EQ(client.port(), "8081");
}

TEST(ShortClientTest, StripsSchemeAndTrailingSlash) {
    ShortClient client("http://example.org:9000/");
    EXPECT_EQ(client.host(), "example.org");
    EXPECT_EQ(client.port(), "9000");
}

TEST(ShortClientTest, MissingHostDefaultsToLoopback) {
    ShortClient client(":8081");
    EXPECT_EQ(client.host(), "127.0.0.1");
}

TEST(ShortClientTest, RejectsAddressWithoutPort) {
    EXPECT_THROW(ShortClient("localhost"), std::invalid_argument);
    EXPECT_THROW(ShortClient("localhost:"), std::invalid_argument);
}

TEST(ShortClientTest, StatusMapping) {
    EXPECT_EQ(ShortClient::code_for_status(400, "result exceeds maximum size"), ErrorCode::VALUE_TOO_LARGE);
    EXPECT_EQ(ShortClient::code_for_status(404, "key not found"), ErrorCode::KEY_NOT_FOUND);
    EXPECT_EQ(ShortClient::code_for_status(429, "rate limit exceeded"), ErrorCode::RATE_LIMITED);
    EXPECT_EQ(ShortClient::code_for_status(503, "circuit breaker is open"), ErrorCode::CIRCUIT_OPEN);
    EXPECT_EQ(ShortClient::code_for_status(500, "internal error"), ErrorCode::INTERNAL);
    EXPECT_EQ(ShortClient::code_for_status(418, ""), ErrorCode::INTERNAL);
}

TEST(ShortClientTest, MalformedRequestIsNotValueTooLarge) {
    EXPECT_EQ(ShortClient::code_for_status(400, "invalid request format"), ErrorCode::INTERNAL);
    EXPECT_EQ(ShortClient::code_for_status(400, "Bad Request"), ErrorCode::INTERNAL);
}

TEST(ShortClientTest, UnreachableServerIsInternal) {
    // Port 1 on loopback is not expected to accept connections.
    ShortClient client("127.0.0.1:1", std::chrono::seconds(2));
    try {
        client.lookup("abcdef");
        FAIL() << "expected ServiceError";
    } catch (const ServiceError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INTERNAL);
    }
}

TEST(ShortClientTest, ResilientClientWrapsTransport) {
    auto client = make_resilient_client("127.0.0.1:1");
    auto* resilient = dynamic_cast<ResilientService*>(client.get());
    ASSERT_NE(resilient, nullptr);
    EXPECT_EQ(resilient->create_breaker().name(), "client.create");
    EXPECT_EQ(resilient->lookup_breaker().name(), "client.lookup");
}
