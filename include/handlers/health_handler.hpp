#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include "server_config.hpp"
#include "connection_manager.hpp"
#include "key_store.hpp"
#include "metrics.hpp"

namespace shorten {

namespace http = boost::beast::http;
namespace json = boost::json;

class HealthHandler {
public:
    HealthHandler(const ServerConfig& config, ConnectionManager& conn_manager, const KeyStore& store)
        : config_(config), conn_manager_(conn_manager), store_(store) {}

    http::response<http::string_body> handle_health(unsigned version);
    http::response<http::string_body> handle_stats(const http::request<http::string_body>& req);
    http::response<http::string_body> handle_metrics(unsigned version);

    // Helper used by stats/metrics
    bool verify_admin_request(const http::request<http::string_body>& req);

private:
    const ServerConfig& config_;
    ConnectionManager& conn_manager_;
    const KeyStore& store_;
};

} // namespace shorten
