#include "handlers/key_handler.hpp"
#include "handlers/json_response.hpp"
#include "input_validator.hpp"
#include "service_logger.hpp"

namespace shorten {

http::status KeyHandler::status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::VALUE_TOO_LARGE: return http::status::bad_request;
        case ErrorCode::KEY_NOT_FOUND: return http::status::not_found;
        case ErrorCode::RATE_LIMITED: return http::status::too_many_requests;
        case ErrorCode::CIRCUIT_OPEN: return http::status::service_unavailable;
        case ErrorCode::INTERNAL: return http::status::internal_server_error;
        default: return http::status::internal_server_error;
    }
}

http::response<http::string_body> KeyHandler::handle_error(const ServiceError& e, unsigned version) {
    // Internal details stay in the service log.
    std::string message = e.code() == ErrorCode::INTERNAL ? "internal error" : e.what();
    auto res = make_error_response(status_for(e.code()), version, message);
    if (e.code() == ErrorCode::RATE_LIMITED && e.retry_after_sec() > 0) {
        res.set(http::field::retry_after, std::to_string(e.retry_after_sec()));
    }
    return res;
}

http::response<http::string_body> KeyHandler::handle_create(const http::request<http::string_body>& req,
                                                            const std::string& remote_addr) {
    std::string value;
    try {
        auto json_val = InputValidator::safe_parse_json(req.body());
        if (!json_val.is_object() || !json_val.as_object().contains("v") ||
            !json_val.as_object().at("v").is_string()) {
            ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::EventType::INVALID_INPUT,
                               remote_addr, "create: missing string field v");
            return make_error_response(http::status::bad_request, req.version(), "invalid request format");
        }
        value = std::string(json_val.as_object().at("v").as_string());
    } catch (const std::exception& e) {
        ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::EventType::INVALID_INPUT,
                           remote_addr, std::string("create: malformed JSON: ") + e.what());
        return make_error_response(http::status::bad_request, req.version(), "invalid request format");
    }

    try {
        CreateResult result = service_.create(value);
        json::object response;
        response["k"] = result.key;
        return make_json_response(http::status::ok, req.version(), response);
    } catch (const ServiceError& e) {
        return handle_error(e, req.version());
    } catch (const std::exception& e) {
        ServiceLogger::log(ServiceLogger::Level::ERROR, ServiceLogger::EventType::REQUEST,
                           remote_addr, std::string("create failed: ") + e.what());
        return make_error_response(http::status::internal_server_error, req.version(), "internal error");
    }
}

http::response<http::string_body> KeyHandler::handle_lookup(const http::request<http::string_body>& req,
                                                            const std::string& key,
                                                            const std::string& remote_addr) {
    // Keys are digest windows, so anything outside the alphabet cannot exist.
    // Oversized keys still go to the service, which owns the length rule.
    if (InputValidator::is_within_size_limit(key.size(), config_.max_value_length) &&
        !InputValidator::is_url_safe_key(key)) {
        ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::EventType::INVALID_INPUT,
                           remote_addr, "lookup: key outside URL-safe alphabet");
        return handle_error(ServiceError::key_not_found(), req.version());
    }

    try {
        std::string value = service_.lookup(key);
        json::object response;
        response["v"] = value;
        return make_json_response(http::status::ok, req.version(), response);
    } catch (const ServiceError& e) {
        return handle_error(e, req.version());
    } catch (const std::exception& e) {
        ServiceLogger::log(ServiceLogger::Level::ERROR, ServiceLogger::EventType::REQUEST,
                           remote_addr, std::string("lookup failed: ") + e.what());
        return make_error_response(http::status::internal_server_error, req.version(), "internal error");
    }
}

}
