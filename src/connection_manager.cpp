#include <openssl/sha.h>
#include <iomanip>
#include <sstream>
#include <mutex>
#include "connection_manager.hpp"
#include "metrics.hpp"

namespace shorten {

ConnectionManager::ConnectionManager(const std::string& salt) : salt_(salt) {
}

// Registers a new connection while enforcing the per-IP limit.
bool ConnectionManager::increment_ip_count(const std::string& ip, size_t limit) {
    std::string b_ip = blind_id(ip);
    std::unique_lock lock(mutex_);

    size_t& count = ip_counts_[b_ip];
    if (count >= limit) {
        if (count == 0) ip_counts_.erase(b_ip);
        return false;
    }
    count++;
    total_++;
    MetricsRegistry::instance().increment_gauge("shorten_active_connections");
    return true;
}

// Releases a connection slot when its session is destroyed.
void ConnectionManager::decrement_ip_count(const std::string& ip) {
    std::string b_ip = blind_id(ip);
    std::unique_lock lock(mutex_);

    auto it = ip_counts_.find(b_ip);
    if (it == ip_counts_.end()) return;

    if (it->second > 0) {
        it->second--;
        total_--;
        MetricsRegistry::instance().decrement_gauge("shorten_active_connections");
    }
    if (it->second == 0) {
        ip_counts_.erase(it);
    }
}

size_t ConnectionManager::connection_count() const {
    std::shared_lock lock(mutex_);
    return total_;
}

size_t ConnectionManager::connection_count_for_ip(const std::string& ip) const {
    std::string b_ip = blind_id(ip);
    std::shared_lock lock(mutex_);
    auto it = ip_counts_.find(b_ip);
    if (it != ip_counts_.end()) {
        return it->second;
    }
    return 0;
}

// Generates a salted SHA256 hash of an identifier (Blinded ID).
std::string ConnectionManager::blind_id(const std::string& id) const {
    std::string data = id + salt_;
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

    std::stringstream ss;
    for(int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
    }
    return ss.str();
}

}
