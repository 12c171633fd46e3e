#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <memory>
#include <functional>
#include <filesystem>
#include <cstdlib>
#include <csignal>

#include "server_config.hpp"
#include "config_loader.hpp"
#include "connection_manager.hpp"
#include "key_store.hpp"
#include "service_middleware.hpp"
#include "resilient_service.hpp"
#include "rate_limiter.hpp"
#include "http_session.hpp"
#include "service_logger.hpp"
#include "metrics.hpp"


namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace shorten {

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(
        net::io_context& ioc,
        ssl::context& ssl_ctx,
        tcp::endpoint endpoint,
        const ServerConfig& config,
        ConnectionManager& conn_manager,
        KeyService& service,
        const KeyStore& store,
        RateLimiter& client_limiter
    )
        : ioc_(ioc)
        , ssl_ctx_(ssl_ctx)
        , acceptor_(net::make_strand(ioc))
        , config_(config)
        , conn_manager_(conn_manager)
        , service_(service)
        , store_(store)
        , client_limiter_(client_limiter)
    {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) {
            throw std::runtime_error("Failed to open acceptor: " + ec.message());
        }

        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (ec) {
            throw std::runtime_error("Failed to set SO_REUSEADDR: " + ec.message());
        }

        acceptor_.bind(endpoint, ec);
        if (ec) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }

        acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Failed to listen: " + ec.message());
        }
    }

    void run() {
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
    }

private:
    net::io_context& ioc_;
    ssl::context& ssl_ctx_;
    tcp::acceptor acceptor_;

    const ServerConfig& config_;
    ConnectionManager& conn_manager_;
    KeyService& service_;
    const KeyStore& store_;
    RateLimiter& client_limiter_;

    void do_accept() {
        acceptor_.async_accept(
            net::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket socket) {
                self->on_accept(ec, std::move(socket));
            });
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted) {
            return;  // Listener stopped
        }

        if (ec) {
            ServiceLogger::log(ServiceLogger::Level::ERROR, ServiceLogger::EventType::CONNECTION_REJECTED,
                               "internal", "Accept error: " + ec.message());
        } else {
            beast::error_code ep_ec;
            auto ep = socket.remote_endpoint(ep_ec);
            std::string remote_ip = ep_ec ? "unknown" : ep.address().to_string();

            if (conn_manager_.connection_count() >= config_.max_global_connections) {
                ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::EventType::CONNECTION_REJECTED,
                                   remote_ip, "Global connection limit reached");
                MetricsRegistry::instance().increment_counter("shorten_connections_rejected_total{reason=\"global\"}");
            } else if (!conn_manager_.increment_ip_count(remote_ip, config_.max_connections_per_ip)) {
                ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::EventType::CONNECTION_REJECTED,
                                   remote_ip, "Per-IP connection limit reached");
                MetricsRegistry::instance().increment_counter("shorten_connections_rejected_total{reason=\"per_ip\"}");
                // Socket will be closed when it goes out of scope here
            } else {
                // Releases the IP slot when the session is destroyed
                auto guard = std::shared_ptr<void>(nullptr, [self_ref = shared_from_this(), remote_ip](void*) {
                    self_ref->conn_manager_.decrement_ip_count(remote_ip);
                });

                if (config_.enable_tls) {
                    auto stream = beast::ssl_stream<beast::tcp_stream>(
                        beast::tcp_stream(std::move(socket)),
                        ssl_ctx_
                    );

                    std::make_shared<HttpSession>(
                        std::move(stream),
                        config_,
                        conn_manager_,
                        service_,
                        store_,
                        client_limiter_,
                        guard
                    )->run();
                } else {
                    std::make_shared<HttpSession>(
                        beast::tcp_stream(std::move(socket)),
                        config_,
                        conn_manager_,
                        service_,
                        store_,
                        client_limiter_,
                        guard
                    )->run();
                }
            }
        }

        do_accept();
    }
};

}

// Configures the SSL context (TLS 1.2+).
static void load_server_certificate(ssl::context& ctx, const std::string& cert_path, const std::string& key_path) {
    ctx.set_options(
        ssl::context::default_workarounds |
        ssl::context::no_sslv2 |
        ssl::context::no_sslv3 |
        ssl::context::no_tlsv1 |
        ssl::context::no_tlsv1_1 |
        ssl::context::single_dh_use
    );

    SSL_CTX_set_options(ctx.native_handle(), SSL_OP_CIPHER_SERVER_PREFERENCE);
    SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);

    SSL_CTX_set_cipher_list(ctx.native_handle(),
        "ECDHE-ECDSA-AES256-GCM-SHA384:"
        "ECDHE-RSA-AES256-GCM-SHA384:"
        "ECDHE-ECDSA-CHACHA20-POLY1305:"
        "ECDHE-RSA-CHACHA20-POLY1305:"
        "ECDHE-ECDSA-AES128-GCM-SHA256:"
        "ECDHE-RSA-AES128-GCM-SHA256"
    );

    ctx.use_certificate_chain_file(cert_path);
    ctx.use_private_key_file(key_path, ssl::context::pem);
}

static void print_usage(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [port] [options]\n"
              << "Options:\n"
              << "  --tls, -t      Enable TLS (certificate paths from SHORTEN_TLS_CERT/SHORTEN_TLS_KEY)\n"
              << "  --no-tls, -n   Disable TLS\n"
              << "  --help, -h     Show this help\n";
}

int main(int argc, char* argv[]) {
    using shorten::ServiceLogger;
    try {
        shorten::ServerConfig config;

        // --- Environment Variable Overrides ---
        shorten::apply_environment(config);

        // --- CLI Argument Parsing (wins over the environment) ---
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--no-tls" || arg == "-n") {
                config.enable_tls = false;
            } else if (arg == "--tls" || arg == "-t") {
                config.enable_tls = true;
            } else if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else {
                try {
                    config.port = shorten::parse_port(arg);
                } catch (const std::invalid_argument&) {
                    std::cerr << "[!] Unknown argument: " << arg << "\n";
                    print_usage(argv[0]);
                    return 1;
                }
            }
        }

        std::string problem = shorten::validate_config(config);
        if (!problem.empty()) {
            std::cerr << "[!] Invalid configuration: " << problem << "\n";
            return 1;
        }

        if (config.thread_count <= 0) {
            config.thread_count = static_cast<int>(std::thread::hardware_concurrency());
            if (config.thread_count == 0) config.thread_count = 4;
        }

        if (config.enable_tls) {
            std::filesystem::path exe_path;
            try {
                exe_path = std::filesystem::canonical("/proc/self/exe").parent_path();
            } catch (const std::exception& e) {
                std::cerr << "[!] Warning: Could not detect executable path via /proc/self/exe: " << e.what() << std::endl;
                exe_path = std::filesystem::current_path();
            }
            if (config.cert_path.rfind("certs/", 0) == 0) {
                config.cert_path = (exe_path / config.cert_path).string();
                config.key_path = (exe_path / config.key_path).string();
            }

            if (!std::filesystem::exists(config.cert_path) ||
                !std::filesystem::exists(config.key_path)) {
                std::cerr << "[!] TLS certificates not found at:\n"
                          << "    " << config.cert_path << "\n"
                          << "    " << config.key_path << "\n";
                return 1;
            }
        }

        ssl::context ssl_ctx{ssl::context::tlsv12};
        if (config.enable_tls) {
            load_server_certificate(ssl_ctx, config.cert_path, config.key_path);
        }

        // --- Service Stack ---
        // store -> instrumentation -> logging -> rate limit + circuit breaker
        auto store = std::make_shared<shorten::KeyStore>(config.max_value_length, config.min_key_size);

        shorten::ResilientService::Settings resilience;
        resilience.name = "server";
        resilience.create_rate = config.create_rate_per_sec;
        resilience.create_burst = config.create_burst;
        resilience.lookup_rate = config.lookup_rate_per_sec;
        resilience.lookup_burst = config.lookup_burst;
        resilience.max_consecutive_failures = config.breaker_max_failures;
        resilience.open_timeout = std::chrono::seconds(config.breaker_open_timeout_sec);

        std::shared_ptr<shorten::KeyService> service = store;
        service = std::make_shared<shorten::InstrumentingService>(service);
        service = std::make_shared<shorten::LoggingService>(service);
        service = std::make_shared<shorten::ResilientService>(service, resilience);

        shorten::ConnectionManager conn_manager(config.secret_salt);
        shorten::RateLimiter client_limiter(config.client_rate_per_sec, config.client_burst);

        // Declared after everything a session references: ~io_context destroys
        // pending session handlers, whose connection guards still call into
        // conn_manager.
        net::io_context ioc{config.thread_count};

        // Idle client buckets are dropped periodically
        net::steady_timer cleanup_timer(ioc, std::chrono::seconds(config.cleanup_interval_sec));
        std::function<void(beast::error_code)> on_cleanup;
        on_cleanup = [&](beast::error_code ec) {
            if (!ec) {
                client_limiter.prune(std::chrono::seconds(config.cleanup_interval_sec));
                cleanup_timer.expires_after(std::chrono::seconds(config.cleanup_interval_sec));
                cleanup_timer.async_wait(on_cleanup);
            }
        };
        cleanup_timer.async_wait(on_cleanup);

        auto listener = std::make_shared<shorten::Listener>(
            ioc,
            ssl_ctx,
            tcp::endpoint{net::ip::make_address(config.address), config.port},
            config,
            conn_manager,
            *service,
            *store,
            client_limiter
        );
        listener->run();

        ServiceLogger::log(ServiceLogger::Level::INFO, ServiceLogger::EventType::LIFECYCLE, "internal",
                           "transport=HTTP addr=" + config.address + ":" + std::to_string(config.port) +
                           " tls=" + (config.enable_tls ? "on" : "off") +
                           " storage=" + config.storage +
                           " threads=" + std::to_string(config.thread_count));

        // Captured SIGINT and SIGTERM to perform a clean shutdown
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&ioc, listener, &cleanup_timer](beast::error_code const&, int sig) {
                ServiceLogger::log(ServiceLogger::Level::INFO, ServiceLogger::EventType::LIFECYCLE, "internal",
                                   "received signal " + std::to_string(sig) + ", shutting down");
                beast::error_code ec;
                cleanup_timer.cancel(ec);
                listener->stop();
                ioc.stop();
            });

        std::vector<std::thread> threads;
        threads.reserve(config.thread_count - 1);

        for (int i = 0; i < config.thread_count - 1; ++i) {
            threads.emplace_back([&ioc] {
                ioc.run();
            });
        }

        ioc.run();

        for (auto& t : threads) {
            t.join();
        }

        ServiceLogger::log(ServiceLogger::Level::INFO, ServiceLogger::EventType::LIFECYCLE, "internal", "exit");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
