#include "config_loader.hpp"
#include "key_digest.hpp"
#include <limits>
#include <type_traits>
#include <cstdlib>
#include <stdexcept>

namespace shorten {

namespace {

[[noreturn]] void reject(const std::string& name, const std::string& text, const char* why) {
    throw std::invalid_argument(name + " " + why + ": " + text);
}

// std::stoi and friends accept trailing garbage and wrap out-of-range values
// on the cast; configuration must not.
template<class T>
T checked_integer(const std::string& name, const std::string& text) {
    size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::out_of_range&) {
        reject(name, text, "is out of range");
    } catch (const std::exception&) {
        reject(name, text, "is not a number");
    }
    if (used != text.size()) {
        reject(name, text, "is not a number");
    }

    bool below = std::is_unsigned<T>::value
        ? value < 0
        : value < static_cast<long long>(std::numeric_limits<T>::lowest());
    bool above = value > 0 &&
        static_cast<unsigned long long>(value) > static_cast<unsigned long long>(std::numeric_limits<T>::max());
    if (below || above) {
        reject(name, text, "is out of range");
    }
    return static_cast<T>(value);
}

double checked_double(const std::string& name, const std::string& text) {
    size_t used = 0;
    double value = 0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        reject(name, text, "is not a number");
    }
    if (used != text.size()) {
        reject(name, text, "is not a number");
    }
    return value;
}

template<class T>
void read_integer(const char* name, T& target) {
    if (const char* raw = std::getenv(name)) {
        target = checked_integer<T>(name, raw);
    }
}

void read_double(const char* name, double& target) {
    if (const char* raw = std::getenv(name)) {
        target = checked_double(name, raw);
    }
}

void read_string(const char* name, std::string& target) {
    if (const char* raw = std::getenv(name)) {
        target = raw;
    }
}

}

uint16_t parse_port(const std::string& text) {
    return checked_integer<uint16_t>("port", text);
}

void apply_environment(ServerConfig& config) {
    read_string("SHORTEN_ADDR", config.address);
    read_integer("SHORTEN_PORT", config.port);
    read_integer("SHORTEN_THREADS", config.thread_count);
    read_string("SHORTEN_STORAGE", config.storage);

    if (const char* tls = std::getenv("SHORTEN_TLS")) {
        std::string flag(tls);
        config.enable_tls = (flag == "1" || flag == "true" || flag == "on");
    }
    read_string("SHORTEN_TLS_CERT", config.cert_path);
    read_string("SHORTEN_TLS_KEY", config.key_path);

    read_integer("SHORTEN_MAX_MESSAGE_SIZE", config.max_message_size);
    read_integer("SHORTEN_MAX_CONNS_PER_IP", config.max_connections_per_ip);
    read_integer("SHORTEN_MAX_CONNS", config.max_global_connections);
    read_integer("SHORTEN_CONN_TIMEOUT", config.connection_timeout_sec);

    read_integer("SHORTEN_MAX_VALUE_LENGTH", config.max_value_length);
    read_integer("SHORTEN_MIN_KEY_SIZE", config.min_key_size);

    if (std::getenv("SHORTEN_RATE_LIMIT")) {
        read_double("SHORTEN_RATE_LIMIT", config.client_rate_per_sec);
        config.client_burst = static_cast<size_t>(config.client_rate_per_sec * 2);
    }
    read_double("SHORTEN_LIMIT_CREATE", config.create_rate_per_sec);
    read_integer("SHORTEN_LIMIT_CREATE_BURST", config.create_burst);
    read_double("SHORTEN_LIMIT_LOOKUP", config.lookup_rate_per_sec);
    read_integer("SHORTEN_LIMIT_LOOKUP_BURST", config.lookup_burst);

    read_integer("SHORTEN_BREAKER_FAILURES", config.breaker_max_failures);
    read_integer("SHORTEN_BREAKER_TIMEOUT", config.breaker_open_timeout_sec);

    read_string("SHORTEN_ADMIN_TOKEN", config.admin_token);
    read_string("SHORTEN_SECRET_SALT", config.secret_salt);

    if (const char* origins = std::getenv("SHORTEN_ALLOWED_ORIGINS")) {
        config.allowed_origins = parse_origin_list(origins);
    }
}

std::vector<std::string> parse_origin_list(const std::string& origins) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= origins.size()) {
        size_t comma = origins.find(',', start);
        if (comma == std::string::npos) comma = origins.size();
        std::string item = origins.substr(start, comma - start);
        if (!item.empty()) out.push_back(item);
        start = comma + 1;
    }
    return out;
}

std::string validate_config(const ServerConfig& config) {
    if (config.storage != "inmem") {
        return "unsupported storage type: " + config.storage;
    }
    if (config.min_key_size == 0) {
        return "min_key_size must be at least 1";
    }
    if (config.min_key_size > KeyDigest::DIGEST_LENGTH) {
        return "min_key_size must not exceed " + std::to_string(KeyDigest::DIGEST_LENGTH);
    }
    if (config.max_value_length == 0) {
        return "max_value_length must be at least 1";
    }
    if (config.client_rate_per_sec <= 0 || config.create_rate_per_sec <= 0 || config.lookup_rate_per_sec <= 0) {
        return "rate limits must be positive";
    }
    if (config.client_burst == 0 || config.create_burst == 0 || config.lookup_burst == 0) {
        return "rate limit bursts must be positive";
    }
    if (config.connection_timeout_sec <= 0) {
        return "connection timeout must be positive";
    }
    return "";
}

}
