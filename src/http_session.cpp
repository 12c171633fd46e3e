#include "http_session.hpp"
#include "handlers/json_response.hpp"
#include "metrics.hpp"
#include "service_logger.hpp"
#include <boost/json.hpp>

namespace shorten {

static const std::string API_PREFIX = "/api";

// HTTPS Session state (TLS transport)
HttpSession::HttpSession(
    beast::ssl_stream<beast::tcp_stream>&& stream,
    const ServerConfig& config,
    ConnectionManager& conn_manager,
    KeyService& service,
    const KeyStore& store,
    RateLimiter& client_limiter,
    std::shared_ptr<void> conn_guard
)
    : stream_(std::move(stream))
    , is_tls_(true)
    , config_(config)
    , conn_manager_(conn_manager)
    , client_limiter_(client_limiter)
    , health_handler_(config, conn_manager, store)
    , key_handler_(config, service)
    , conn_guard_(std::move(conn_guard))
{
    beast::error_code ec;
    auto& s = std::get<beast::ssl_stream<beast::tcp_stream>>(stream_);
    auto ep = beast::get_lowest_layer(s).socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

// Plaintext HTTP Session state (usually behind a local proxy or for testing)
HttpSession::HttpSession(
    beast::tcp_stream&& stream,
    const ServerConfig& config,
    ConnectionManager& conn_manager,
    KeyService& service,
    const KeyStore& store,
    RateLimiter& client_limiter,
    std::shared_ptr<void> conn_guard
)
    : stream_(std::move(stream))
    , is_tls_(false)
    , config_(config)
    , conn_manager_(conn_manager)
    , client_limiter_(client_limiter)
    , health_handler_(config, conn_manager, store)
    , key_handler_(config, service)
    , conn_guard_(std::move(conn_guard))
{
    beast::error_code ec;
    auto& s = std::get<beast::tcp_stream>(stream_);
    auto ep = s.socket().remote_endpoint(ec);
    remote_addr_ = ec ? "unknown" : ep.address().to_string();
}

// Starts the asynchronous session activity
void HttpSession::run() {
    if (is_tls_) {
        auto self = shared_from_this();
        std::get<beast::ssl_stream<beast::tcp_stream>>(stream_).async_handshake(
            ssl::stream_base::server,
            [self](beast::error_code ec) {
                self->on_handshake(ec);
            });
    } else {
        do_read();
    }
}

void HttpSession::on_handshake(beast::error_code ec) {
    if (ec) {
        // Silent closure on handshake failure to prevent resource exhaustion from scanners
        return;
    }
    do_read();
}

// Initiates the asynchronous read of an HTTP request
void HttpSession::do_read() {
    req_ = {};

    // Idle connections are dropped after the configured timeout
    auto timeout = std::chrono::seconds(config_.connection_timeout_sec);
    if (is_tls_) {
        beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)).expires_after(timeout);
    } else {
        std::get<beast::tcp_stream>(stream_).expires_after(timeout);
    }

    auto self = shared_from_this();
    parser_.emplace();
    parser_->body_limit(config_.max_message_size);

    if (is_tls_) {
        http::async_read(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    } else {
        http::async_read(
            std::get<beast::tcp_stream>(stream_),
            buffer_,
            *parser_,
            [self](beast::error_code ec, std::size_t bytes) {
                self->on_read(ec, bytes);
            });
    }
}

// Handles the completion of an asynchronous read operation
void HttpSession::on_read(beast::error_code ec, std::size_t) {
    if (ec == http::error::end_of_stream) {
        do_close();
        return;
    }
    if (ec == http::error::body_limit) {
        ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::EventType::INVALID_INPUT,
                           remote_addr_, "Request body exceeds size limit");
        auto res = make_error_response(http::status::payload_too_large, 11, "request body too large");
        res.keep_alive(false);
        send_response(std::move(res));
        return;
    }
    if (ec) {
        return;
    }

    req_ = parser_->release();

    // Per-client token bucket, keyed by the blinded address.
    auto limit_res = client_limiter_.check("client:" + conn_manager_.blind_id(remote_addr_));
    if (!limit_res.allowed) {
        ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::EventType::RATE_LIMIT_HIT,
                           remote_addr_, "Client request rate exceeded");
        send_response(handle_rate_limited(limit_res));
        return;
    }

    handle_request();
}

bool HttpSession::is_operator_request() {
    bool is_local = (remote_addr_ == "127.0.0.1" || remote_addr_ == "::1");
    return is_local || health_handler_.verify_admin_request(req_);
}

void HttpSession::handle_request() {
    std::string target(req_.target());
    std::string path = target.substr(0, target.find('?'));
    auto method = req_.method();

    // Handle CORS Preflight
    if (method == http::verb::options) {
        send_response(handle_cors_preflight());
        return;
    }

    // --- Routing Table ---

    // Key API
    if (path == API_PREFIX && method == http::verb::post) {
        send_response(key_handler_.handle_create(req_, remote_addr_));
    } else if (path.size() > API_PREFIX.size() + 1 && path.compare(0, API_PREFIX.size() + 1, API_PREFIX + "/") == 0 &&
               method == http::verb::get) {
        std::string key = path.substr(API_PREFIX.size() + 1);
        send_response(key_handler_.handle_lookup(req_, key, remote_addr_));

    // Health Checks & Metrics
    } else if (path == "/health" && method == http::verb::get) {
        send_response(health_handler_.handle_health(req_.version()));
    } else if (path == "/stats" && method == http::verb::get) {
        if (is_operator_request()) {
            send_response(health_handler_.handle_stats(req_));
        } else {
            send_response(handle_not_found());
        }
    } else if (path == "/metrics" && method == http::verb::get) {
        if (is_operator_request()) {
            send_response(health_handler_.handle_metrics(req_.version()));
        } else {
            send_response(handle_not_found());
        }

    } else {
        send_response(handle_not_found());
    }
}

http::response<http::string_body> HttpSession::handle_cors_preflight() {
    http::response<http::string_body> res{http::status::no_content, req_.version()};
    res.keep_alive(req_.keep_alive());
    add_security_headers(res);
    return res;
}

http::response<http::string_body> HttpSession::handle_not_found() {
    return make_error_response(http::status::not_found, req_.version(), "not found");
}

http::response<http::string_body> HttpSession::handle_rate_limited(const RateLimitResult& res_info) {
    auto res = make_error_response(http::status::too_many_requests, req_.version(), "rate limit exceeded");
    if (res_info.reset_after_sec > 0) {
        res.set(http::field::retry_after, std::to_string(res_info.reset_after_sec));
    }
    return res;
}

template<class Body>
void HttpSession::add_cors_headers(http::response<Body>& res) {
    std::string origin;
    auto origin_it = req_.find(http::field::origin);
    if (origin_it != req_.end()) {
        origin = std::string(origin_it->value());
    }
    if (origin.empty() || config_.allowed_origins.empty()) {
        return;
    }

    bool origin_allowed = false;
    for (const auto& allowed : config_.allowed_origins) {
        if (allowed == "*" || allowed == origin) {
            origin_allowed = true;
            res.set(http::field::access_control_allow_origin, allowed == "*" ? origin : allowed);
            break;
        }
    }

    if (!origin_allowed) {
        ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::EventType::INVALID_INPUT,
                           remote_addr_, "Disallowed origin: " + origin);
        return;
    }

    res.set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type,X-Admin-Token");
    res.set(http::field::access_control_max_age, "86400");
    res.set(http::field::vary, "Origin");
}

void HttpSession::send_response(http::response<http::string_body>&& res) {
    if (res.keep_alive()) {
        res.keep_alive(req_.keep_alive());
    }
    add_cors_headers(res);

    MetricsRegistry::instance().increment_counter(
        "shorten_http_responses_total{code=\"" + std::to_string(res.result_int()) + "\"}");

    auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
    auto self = shared_from_this();

    if (is_tls_) {
        http::async_write(
            std::get<beast::ssl_stream<beast::tcp_stream>>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    } else {
        http::async_write(
            std::get<beast::tcp_stream>(stream_),
            *sp,
            [self, sp](beast::error_code ec, std::size_t bytes) {
                self->on_write(sp->need_eof(), ec, bytes);
            });
    }
}

void HttpSession::on_write(bool close, beast::error_code ec, std::size_t) {
    if (ec) {
        ServiceLogger::log(ServiceLogger::Level::ERROR, ServiceLogger::EventType::REQUEST,
                           remote_addr_, "HTTP write error: " + ec.message());
        return;
    }

    if (close) {
        do_close();
        return;
    }

    do_read();
}

void HttpSession::do_close() {
    beast::error_code ec;
    if (is_tls_) {
        beast::get_lowest_layer(std::get<beast::ssl_stream<beast::tcp_stream>>(stream_)).socket().shutdown(
            tcp::socket::shutdown_send, ec);
    } else {
        std::get<beast::tcp_stream>(stream_).socket().shutdown(tcp::socket::shutdown_send, ec);
    }
}

}
