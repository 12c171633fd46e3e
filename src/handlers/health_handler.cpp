#include "handlers/health_handler.hpp"
#include "handlers/json_response.hpp"
#include <openssl/crypto.h>

namespace shorten {

http::response<http::string_body> HealthHandler::handle_health(unsigned version) {
    json::object response;
    response["status"] = "healthy";
    response["storage"] = config_.storage;
    response["tls"] = config_.enable_tls;

    return make_json_response(http::status::ok, version, response);
}

http::response<http::string_body> HealthHandler::handle_stats(const http::request<http::string_body>& req) {
    json::object response;
    response["active_connections"] = static_cast<int64_t>(conn_manager_.connection_count());
    response["entries"] = static_cast<int64_t>(store_.size());
    response["max_value_length"] = static_cast<int64_t>(store_.max_length());
    response["min_key_size"] = static_cast<int64_t>(store_.min_key_size());

    return make_json_response(http::status::ok, req.version(), response);
}

http::response<http::string_body> HealthHandler::handle_metrics(unsigned version) {
    auto& registry = MetricsRegistry::instance();
    registry.set_gauge("shorten_entries", static_cast<double>(store_.size()));
    std::string body = registry.collect_prometheus();

    http::response<http::string_body> res{http::status::ok, version};
    res.set(http::field::content_type, "text/plain; version=0.0.4");
    res.body() = body;
    res.prepare_payload();

    add_security_headers(res);

    return res;
}

bool HealthHandler::verify_admin_request(const http::request<http::string_body>& req) {
    // If no token is configured, remote admin access is disabled.
    if (config_.admin_token.empty()) {
        return false;
    }

    auto auth_it = req.find("X-Admin-Token");
    if (auth_it == req.end()) {
        return false;
    }

    std::string provided_token(auth_it->value());
    if (provided_token.size() != config_.admin_token.size()) {
        return false;
    }
    return CRYPTO_memcmp(provided_token.data(), config_.admin_token.data(), provided_token.size()) == 0;
}

} // namespace shorten
