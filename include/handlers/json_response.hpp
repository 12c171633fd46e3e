#pragma once

#include <boost/beast/http.hpp>
#include <boost/json.hpp>
#include <string>

namespace shorten {

namespace http = boost::beast::http;
namespace json = boost::json;

template<class Body>
void add_security_headers(http::response<Body>& res) {
    res.set("X-Content-Type-Options", "nosniff");
    res.set("X-Frame-Options", "DENY");
    res.set("Content-Security-Policy", "default-src 'none'");
    res.set(http::field::cache_control, "no-store");
}

// Builds a JSON response carrying the security headers.
inline http::response<http::string_body> make_json_response(http::status status, unsigned version,
                                                             const json::object& body) {
    http::response<http::string_body> res{status, version};
    res.set(http::field::content_type, "application/json; charset=utf-8");
    res.body() = json::serialize(body);
    res.prepare_payload();
    add_security_headers(res);
    return res;
}

inline http::response<http::string_body> make_error_response(http::status status, unsigned version,
                                                              const std::string& message) {
    json::object error;
    error["error"] = message;
    return make_json_response(status, version, error);
}

}
