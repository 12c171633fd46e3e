#include "rate_limiter.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace shorten {

RateLimiter::RateLimiter(double rate, size_t burst)
    : rate_(rate)
    , burst_(burst)
{
    if (rate_ <= 0.0 || burst_ == 0) {
        throw std::invalid_argument("rate limiter needs a positive rate and burst");
    }
}

void RateLimiter::refill(Bucket& bucket, std::chrono::steady_clock::time_point now) const {
    double elapsed = std::chrono::duration<double>(now - bucket.last).count();
    if (elapsed > 0) {
        bucket.tokens = std::min(static_cast<double>(burst_), bucket.tokens + elapsed * rate_);
        bucket.last = now;
    }
}

// Takes `cost` tokens from the bucket if they are available.
// A refused call leaves the bucket untouched and reports how long until it would fit.
RateLimitResult RateLimiter::check(const std::string& key, int cost) {
    auto now = std::chrono::steady_clock::now();
    long long limit = static_cast<long long>(burst_);

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        it = buckets_.emplace(key, Bucket{static_cast<double>(burst_), now}).first;
    }
    Bucket& bucket = it->second;
    refill(bucket, now);

    if (cost <= 0) {
        return {true, static_cast<long long>(bucket.tokens), limit, 0};
    }
    if (static_cast<size_t>(cost) > burst_) {
        return {false, static_cast<long long>(bucket.tokens), limit, -1};
    }

    if (bucket.tokens >= cost) {
        bucket.tokens -= cost;
        return {true, static_cast<long long>(bucket.tokens), limit, 0};
    }

    double missing = cost - bucket.tokens;
    auto wait = static_cast<long long>(std::ceil(missing / rate_));
    return {false, static_cast<long long>(bucket.tokens), limit, std::max(1LL, wait)};
}

void RateLimiter::prune(std::chrono::steady_clock::duration idle) {
    auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        auto last_seen = it->second.last;
        refill(it->second, now);
        bool full = it->second.tokens >= static_cast<double>(burst_);
        if (full && now - last_seen >= idle) {
            it = buckets_.erase(it);
        } else {
            ++it;
        }
    }
}

size_t RateLimiter::bucket_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

}
