#pragma once

#include <string>
#include <unordered_map>
#include <shared_mutex>

namespace shorten {

// Tracks open HTTP connections, globally and per client address, so the
// listener can refuse connections past the configured limits.
// Addresses are stored blinded with the server salt.
class ConnectionManager {
public:
    explicit ConnectionManager(const std::string& salt);
    ~ConnectionManager() = default;

    ConnectionManager(const ConnectionManager&) = delete;
    ConnectionManager& operator=(const ConnectionManager&) = delete;

    // Counts a new connection from `ip` unless that address already holds `limit`.
    bool increment_ip_count(const std::string& ip, size_t limit);
    void decrement_ip_count(const std::string& ip);

    size_t connection_count() const;
    size_t connection_count_for_ip(const std::string& ip) const;

    std::string blind_id(const std::string& id) const;

private:
    std::unordered_map<std::string, size_t> ip_counts_;
    size_t total_ = 0;

    mutable std::shared_mutex mutex_;
    std::string salt_;
};

}
