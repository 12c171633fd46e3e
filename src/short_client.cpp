#include "short_client.hpp"
#include "resilient_service.hpp"
#include "input_validator.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/json.hpp>

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace json = boost::json;
using tcp = boost::asio::ip::tcp;

namespace shorten {

namespace {

// Keeps unreserved characters, percent-encodes the rest.
std::string encode_path_segment(const std::string& segment) {
    std::string out;
    out.reserve(segment.size());
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

// Pulls the "error" member out of an error body, falling back to the status text.
std::string error_message(const http::response<http::string_body>& res) {
    try {
        auto body = InputValidator::safe_parse_json(res.body());
        if (body.is_object() && body.as_object().contains("error") &&
            body.as_object().at("error").is_string()) {
            return std::string(body.as_object().at("error").as_string());
        }
    } catch (const std::exception&) {
        // Not JSON; use the reason phrase below.
    }
    return std::string(res.reason());
}

std::string string_field(const std::string& body, const char* field) {
    json::value parsed;
    try {
        parsed = InputValidator::safe_parse_json(body);
    } catch (const std::exception& e) {
        throw ServiceError::internal(std::string("malformed response: ") + e.what());
    }
    if (!parsed.is_object() || !parsed.as_object().contains(field) ||
        !parsed.as_object().at(field).is_string()) {
        throw ServiceError::internal(std::string("response is missing field ") + field);
    }
    return std::string(parsed.as_object().at(field).as_string());
}

}

ShortClient::ShortClient(const std::string& address, std::chrono::seconds timeout)
    : timeout_(timeout)
{
    std::string rest = address;
    const std::string scheme = "http://";
    if (rest.compare(0, scheme.size(), scheme) == 0) {
        rest = rest.substr(scheme.size());
    }
    while (!rest.empty() && rest.back() == '/') {
        rest.pop_back();
    }

    size_t colon = rest.rfind(':');
    if (colon == std::string::npos || colon + 1 == rest.size()) {
        throw std::invalid_argument("address must be host:port: " + address);
    }
    host_ = rest.substr(0, colon);
    port_ = rest.substr(colon + 1);
    if (host_.empty()) {
        host_ = "127.0.0.1";
    }
}

ErrorCode ShortClient::code_for_status(unsigned status, const std::string& message) {
    switch (status) {
        case 400:
            // The server also answers 400 to bodies it cannot decode.
            return message == ServiceError::value_too_large().what() ? ErrorCode::VALUE_TOO_LARGE
                                                                     : ErrorCode::INTERNAL;
        case 404: return ErrorCode::KEY_NOT_FOUND;
        case 429: return ErrorCode::RATE_LIMITED;
        case 503: return ErrorCode::CIRCUIT_OPEN;
        default: return ErrorCode::INTERNAL;
    }
}

std::string ShortClient::round_trip(bool post, const std::string& target, const std::string& body) {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    http::response<http::string_body> res;

    try {
        auto const results = resolver.resolve(host_, port_);

        stream.expires_after(timeout_);
        stream.connect(results);

        http::request<http::string_body> req{post ? http::verb::post : http::verb::get, target, 11};
        req.set(http::field::host, host_);
        req.set(http::field::user_agent, "shortcli");
        if (post) {
            req.set(http::field::content_type, "application/json");
            req.body() = body;
            req.prepare_payload();
        }

        http::write(stream, req);

        beast::flat_buffer buffer;
        http::read(stream, buffer, res);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        // not_connected happens sometimes, so don't bother reporting it.
    } catch (const boost::system::system_error& e) {
        throw ServiceError::internal(std::string("transport error: ") + e.what());
    }

    if (res.result() == http::status::ok) {
        return res.body();
    }

    std::string message = error_message(res);
    ErrorCode code = code_for_status(res.result_int(), message);
    long long retry_after = 0;
    if (code == ErrorCode::RATE_LIMITED) {
        auto it = res.find(http::field::retry_after);
        if (it != res.end()) {
            try {
                retry_after = std::stoll(std::string(it->value()));
            } catch (const std::exception&) {
                retry_after = 0;
            }
        }
    }
    throw ServiceError(code, message, retry_after);
}

CreateResult ShortClient::create(const std::string& value) {
    json::object request;
    request["v"] = value;

    CreateResult result;
    result.key = string_field(round_trip(true, "/api", json::serialize(request)), "k");
    // The wire format does not say whether the entry was new.
    result.inserted = true;
    return result;
}

std::string ShortClient::lookup(const std::string& key) {
    return string_field(round_trip(false, "/api/" + encode_path_segment(key), ""), "v");
}

std::shared_ptr<KeyService> make_resilient_client(const std::string& address) {
    ResilientService::Settings settings;
    settings.name = "client";
    settings.create_rate = 50.0;
    settings.create_burst = 100;
    settings.lookup_rate = 50.0;
    settings.lookup_burst = 100;
    settings.open_timeout = std::chrono::seconds(5);

    return std::make_shared<ResilientService>(std::make_shared<ShortClient>(address), settings);
}

}
