#include <gtest/gtest.h>
#include "handlers/key_handler.hpp"
#include "key_store.hpp"
#include "resilient_service.hpp"
#include "input_validator.hpp"
#include <boost/json.hpp>
#include <memory>
#include <utility>

using namespace shorten;

namespace {

http::request<http::string_body> post_api(const std::string& body) {
    http::request<http::string_body> req{http::verb::post, "/api", 11};
    req.set(http::field::content_type, "application/json");
    req.body() = body;
    req.prepare_payload();
    return req;
}

http::request<http::string_body> get_api(const std::string& key) {
    return http::request<http::string_body>{http::verb::get, "/api/" + key, 11};
}

boost::json::object body_of(const http::response<http::string_body>& res) {
    return InputValidator::safe_parse_json(res.body()).as_object();
}

class FailingService : public KeyService {
public:
    ServiceError error;
    explicit FailingService(ServiceError e) : error(std::move(e)) {}

    CreateResult create(const std::string&) override { throw error; }
    std::string lookup(const std::string&) override { throw error; }
};

}

class KeyHandlerTest : public ::testing::Test {
protected:
    ServerConfig config;
    KeyStore store;
    KeyHandler handler{config, store};
};

TEST_F(KeyHandlerTest, CreateReturnsKey) {
    auto res = handler.handle_create(post_api(R"({"v":"12345"})"), "127.0.0.1");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(std::string(res[http::field::content_type]), "application/json; charset=utf-8");
    EXPECT_EQ(std::string(body_of(res).at("k").as_string()), "gnzLDu");
}

TEST_F(KeyHandlerTest, LookupReturnsValue) {
    handler.handle_create(post_api(R"({"v":"12345"})"), "127.0.0.1");

    auto res = handler.handle_lookup(get_api("gnzLDu"), "gnzLDu", "127.0.0.1");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(std::string(body_of(res).at("v").as_string()), "12345");
}

TEST_F(KeyHandlerTest, LookupMissingIs404) {
    auto res = handler.handle_lookup(get_api("abcdef"), "abcdef", "127.0.0.1");
    EXPECT_EQ(res.result(), http::status::not_found);
    EXPECT_EQ(std::string(body_of(res).at("error").as_string()), "key not found");
}

TEST_F(KeyHandlerTest, LookupOutsideAlphabetIs404) {
    auto res = handler.handle_lookup(get_api("ab%2Fcd"), "ab%2Fcd", "127.0.0.1");
    EXPECT_EQ(res.result(), http::status::not_found);
}

TEST_F(KeyHandlerTest, OversizedValueIs400) {
    std::string value(config.max_value_length + 1, 'x');
    boost::json::object req_body;
    req_body["v"] = value;

    auto res = handler.handle_create(post_api(boost::json::serialize(req_body)), "127.0.0.1");
    EXPECT_EQ(res.result(), http::status::bad_request);
    EXPECT_EQ(std::string(body_of(res).at("error").as_string()), "result exceeds maximum size");
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(KeyHandlerTest, OversizedKeyIs400) {
    std::string key(config.max_value_length + 1, 'k');
    auto res = handler.handle_lookup(get_api(key), key, "127.0.0.1");
    EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(KeyHandlerTest, MalformedBodiesAre400) {
    const char* bodies[] = {
        "not json",
        "[]",
        "{}",
        R"({"v": 42})",
        R"({"value":"x"})",
    };
    for (const char* body : bodies) {
        auto res = handler.handle_create(post_api(body), "127.0.0.1");
        EXPECT_EQ(res.result(), http::status::bad_request) << body;
        EXPECT_EQ(std::string(body_of(res).at("error").as_string()), "invalid request format") << body;
    }
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(KeyHandlerTest, DeeplyNestedJsonIsRejected) {
    std::string body = R"({"v":)" + std::string(64, '[') + std::string(64, ']') + "}";
    auto res = handler.handle_create(post_api(body), "127.0.0.1");
    EXPECT_EQ(res.result(), http::status::bad_request);
}

TEST_F(KeyHandlerTest, SecurityHeadersPresent) {
    auto res = handler.handle_create(post_api(R"({"v":"x"})"), "127.0.0.1");
    EXPECT_EQ(std::string(res["X-Content-Type-Options"]), "nosniff");
    EXPECT_EQ(std::string(res[http::field::cache_control]), "no-store");
}

TEST(KeyHandlerErrorTest, StatusMapping) {
    EXPECT_EQ(KeyHandler::status_for(ErrorCode::VALUE_TOO_LARGE), http::status::bad_request);
    EXPECT_EQ(KeyHandler::status_for(ErrorCode::KEY_NOT_FOUND), http::status::not_found);
    EXPECT_EQ(KeyHandler::status_for(ErrorCode::RATE_LIMITED), http::status::too_many_requests);
    EXPECT_EQ(KeyHandler::status_for(ErrorCode::CIRCUIT_OPEN), http::status::service_unavailable);
    EXPECT_EQ(KeyHandler::status_for(ErrorCode::INTERNAL), http::status::internal_server_error);
}

TEST(KeyHandlerErrorTest, RateLimitedCarriesRetryAfter) {
    ServerConfig config;
    FailingService svc(ServiceError::rate_limited(7));
    KeyHandler handler(config, svc);

    auto res = handler.handle_create(post_api(R"({"v":"x"})"), "127.0.0.1");
    EXPECT_EQ(res.result(), http::status::too_many_requests);
    EXPECT_EQ(std::string(res[http::field::retry_after]), "7");
}

TEST(KeyHandlerErrorTest, CircuitOpenIs503) {
    ServerConfig config;
    FailingService svc(ServiceError::circuit_open());
    KeyHandler handler(config, svc);

    auto res = handler.handle_lookup(get_api("abcdef"), "abcdef", "127.0.0.1");
    EXPECT_EQ(res.result(), http::status::service_unavailable);
    EXPECT_EQ(std::string(body_of(res).at("error").as_string()), "circuit breaker is open");
}

TEST(KeyHandlerErrorTest, InternalDetailsAreHidden) {
    ServerConfig config;
    FailingService svc(ServiceError::internal("candidate window exceeded digest length"));
    KeyHandler handler(config, svc);

    auto res = handler.handle_create(post_api(R"({"v":"x"})"), "127.0.0.1");
    EXPECT_EQ(res.result(), http::status::internal_server_error);
    EXPECT_EQ(std::string(body_of(res).at("error").as_string()), "internal error");
}

TEST(KeyHandlerErrorTest, ServerCreateBurstOfOne) {
    ServerConfig config;
    ResilientService::Settings settings;
    settings.create_rate = 0.01;
    settings.create_burst = config.create_burst;
    ResilientService svc(std::make_shared<KeyStore>(), settings);
    KeyHandler handler(config, svc);

    EXPECT_EQ(handler.handle_create(post_api(R"({"v":"a"})"), "127.0.0.1").result(), http::status::ok);
    EXPECT_EQ(handler.handle_create(post_api(R"({"v":"b"})"), "127.0.0.1").result(),
              http::status::too_many_requests);
}
