#pragma once

#include <string>
#include <cstdint>
#include <vector>

namespace shorten {


// Core server configuration. Defaults live here; main() applies CLI
// arguments and SHORTEN_* environment overrides on top.
struct ServerConfig {
    // --- Network & Infrastructure ---
    std::string address = "0.0.0.0";
    uint16_t port = 8081;
    int thread_count = 0;  // 0 defaults to hardware concurrency
    std::string storage = "inmem";  // Only the in-memory backend exists

    // --- Transport Layer Security (TLS) ---
    bool enable_tls = false;
    std::string cert_path = "certs/server.crt";
    std::string key_path = "certs/server.key";

    // --- Connection & Resource Management ---
    size_t max_message_size = 64 * 1024;  // Request body limit
    size_t max_connections_per_ip = 64;
    size_t max_global_connections = 10000;
    int connection_timeout_sec = 60;
    int cleanup_interval_sec = 300;

    // --- Key Store ---
    size_t max_value_length = 2083;
    size_t min_key_size = 6;

    // --- Per-Client Rate Limiting (Token Bucket keyed by blinded IP) ---
    double client_rate_per_sec = 100.0;
    size_t client_burst = 200;

    // --- Operation Rate Limiting (Token Bucket, shared by all clients) ---
    double create_rate_per_sec = 50.0;
    size_t create_burst = 1;
    double lookup_rate_per_sec = 100.0;
    size_t lookup_burst = 500;

    // --- Circuit Breaker ---
    unsigned breaker_max_failures = 5;
    int breaker_open_timeout_sec = 60;

    // --- Operator Access & Log Blinding ---
    std::string admin_token = "";  // Grants remote access to /stats and /metrics
    std::string secret_salt = "shorten_default_deployment_salt";

    // --- Cross-Origin Resource Sharing (CORS) ---
    std::vector<std::string> allowed_origins = {};
};

}
