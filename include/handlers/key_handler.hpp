#pragma once

#include <boost/beast/http.hpp>
#include <string>
#include "server_config.hpp"
#include "key_service.hpp"
#include "service_error.hpp"

namespace shorten {

namespace http = boost::beast::http;

// HTTP binding of the key service.
//
//   POST /api        {"v": "<value>"}  ->  200 {"k": "<key>"}
//   GET  /api/{key}                    ->  200 {"v": "<value>"}
//
// Failures are answered as {"error": "<message>"} with the status given by
// status_for().
class KeyHandler {
public:
    KeyHandler(const ServerConfig& config, KeyService& service)
        : config_(config), service_(service) {}

    http::response<http::string_body> handle_create(const http::request<http::string_body>& req,
                                                    const std::string& remote_addr);
    http::response<http::string_body> handle_lookup(const http::request<http::string_body>& req,
                                                    const std::string& key,
                                                    const std::string& remote_addr);

    static http::status status_for(ErrorCode code);

private:
    const ServerConfig& config_;
    KeyService& service_;

    http::response<http::string_body> handle_error(const ServiceError& e, unsigned version);
};

}
