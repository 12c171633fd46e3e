#pragma once

#include <string>
#include <unordered_map>
#include <chrono>
#include <mutex>

namespace shorten {

struct RateLimitResult {
    bool allowed;
    long long current;          // Whole tokens left after this call
    long long limit;            // Bucket capacity
    long long reset_after_sec;  // Seconds until the refused cost would fit
};


// Protection Layer for Server resource management.
// In-process token bucket: each bucket key refills at `rate` tokens per second
// up to `burst` tokens, and a call is admitted when its cost fits.
class RateLimiter {
public:
    RateLimiter(double rate, size_t burst);
    ~RateLimiter() = default;

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    /**
     * Evaluates a rate-limit request against a specific bucket.
     * @param key Unique identifier for the bucket (operation name, blinded IP, ...).
     * @param cost Tokens consumed by the current operation.
     * @return Detailed success/failure result with retry metadata.
     */
    RateLimitResult check(const std::string& key, int cost = 1);

    // Forgets buckets that have been full and untouched for `idle`.
    void prune(std::chrono::steady_clock::duration idle);

    size_t bucket_count() const;

    double rate() const { return rate_; }
    size_t burst() const { return burst_; }

private:
    struct Bucket {
        double tokens;
        std::chrono::steady_clock::time_point last;
    };

    const double rate_;
    const size_t burst_;

    std::unordered_map<std::string, Bucket> buckets_;
    mutable std::mutex mutex_;

    void refill(Bucket& bucket, std::chrono::steady_clock::time_point now) const;
};

}
