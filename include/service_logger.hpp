#pragma once

#include <string>
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <mutex>
#include <cctype>
#include <exception>
#include <openssl/sha.h>
#include <openssl/rand.h>

namespace shorten {

// Levelled service log. Client addresses are blinded with a salted hash.
class ServiceLogger {
public:
    enum class Level {
        INFO,
        WARNING,
        ERROR,
        CRITICAL
    };

    enum class EventType {
        REQUEST,
        RATE_LIMIT_HIT,
        CIRCUIT_STATE,
        INVALID_INPUT,
        CONNECTION_REJECTED,
        LIFECYCLE
    };

    /**
     * Writes one log line.
     * @param level Severity level of the event.
     * @param event Category of the event.
     * @param remote_addr Source IP address, blinded before logging; "internal" and
     *        "unknown" are written as-is.
     * @param message Optional descriptive message (will be sanitized).
     */
    static void log(Level level, EventType event, const std::string& remote_addr,
                   const std::string& message = "") {
        std::stringstream ss;
        ss << "[" << timestamp() << " UTC] "
           << "[" << level_to_string(level) << "] "
           << "[" << event_to_string(event) << "] "
           << "ip=" << blind(remote_addr);

        if (!message.empty()) {
            ss << " " << sanitize_log_message(message);
        }

        std::lock_guard<std::mutex> lock(output_mutex());
        if (level == Level::ERROR || level == Level::CRITICAL) {
            std::cerr << ss.str() << "\n";
        } else {
            std::cout << ss.str() << "\n";
        }
    }

    // Escapes non-printable characters and quotes to ensure log integrity
    static std::string sanitize_log_message(const std::string& msg) {
        std::string result;
        result.reserve(msg.size());
        for (char c : msg) {
            if (c == '"' || c == '\\' || c == '\n' || c == '\r') {
                result += ' ';
            } else if (std::isprint(static_cast<unsigned char>(c))) {
                result += c;
            }
        }
        return result;
    }

    static std::string level_to_string(Level level) {
        switch (level) {
            case Level::INFO: return "INFO";
            case Level::WARNING: return "WARN";
            case Level::ERROR: return "ERROR";
            case Level::CRITICAL: return "CRIT";
            default: return "UNKNOWN";
        }
    }

    static std::string event_to_string(EventType event) {
        switch (event) {
            case EventType::REQUEST: return "REQUEST";
            case EventType::RATE_LIMIT_HIT: return "RATE_LIMIT";
            case EventType::CIRCUIT_STATE: return "CIRCUIT";
            case EventType::INVALID_INPUT: return "INVALID_INPUT";
            case EventType::CONNECTION_REJECTED: return "CONN_REJECTED";
            case EventType::LIFECYCLE: return "LIFECYCLE";
            default: return "UNKNOWN_EVENT";
        }
    }

private:
    static std::string timestamp() {
        auto time_t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        struct tm gmt;
        gmtime_r(&time_t, &gmt);
        std::stringstream ss;
        ss << std::put_time(&gmt, "%Y-%m-%d %H:%M:%S");
        return ss.str();
    }

    static std::mutex& output_mutex() {
        static std::mutex m;
        return m;
    }

    // The blinding salt is random per process and rotated every 6 hours, so
    // addresses in older log files cannot be correlated with newer ones.
    static std::string blind(const std::string& remote_addr) {
        if (remote_addr == "internal" || remote_addr == "unknown") {
            return remote_addr;
        }

        static std::mutex salt_mutex;
        static std::string log_salt;
        static std::chrono::steady_clock::time_point last_rotation;

        std::string salt;
        {
            std::lock_guard<std::mutex> lock(salt_mutex);
            auto now = std::chrono::steady_clock::now();
            if (log_salt.empty() || std::chrono::duration_cast<std::chrono::hours>(now - last_rotation).count() >= 6) {
                unsigned char b[32];
                if (RAND_bytes(b, 32) != 1) {
                    std::cerr << "[CRITICAL] CSPRNG failure in ServiceLogger. Terminating instance for safety.\n";
                    std::terminate();
                }
                std::stringstream salt_ss;
                for (int i = 0; i < 32; i++) salt_ss << std::hex << std::setw(2) << std::setfill('0') << (int)b[i];
                log_salt = salt_ss.str();
                last_rotation = now;
            }
            salt = log_salt;
        }

        std::string data = remote_addr + salt;
        unsigned char hash[SHA256_DIGEST_LENGTH];
        SHA256(reinterpret_cast<const unsigned char*>(data.c_str()), data.size(), hash);

        std::stringstream hs;
        for (int i = 0; i < 6; i++) hs << std::hex << std::setw(2) << std::setfill('0') << (int)hash[i];
        return "anon_" + hs.str();
    }
};

}
