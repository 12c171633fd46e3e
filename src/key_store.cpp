#include "key_store.hpp"
#include "key_digest.hpp"
#include "service_error.hpp"
#include <stdexcept>
#include <utility>

namespace shorten {

KeyStore::KeyStore(size_t max_length, size_t min_key_size, Digester digester)
    : max_length_(max_length)
    , min_key_size_(min_key_size)
    , digester_(std::move(digester))
{
    if (min_key_size_ == 0) {
        throw std::invalid_argument("min_key_size must be at least 1");
    }
    if (min_key_size_ > KeyDigest::DIGEST_LENGTH) {
        throw std::invalid_argument("min_key_size must not exceed the digest length");
    }
    if (!digester_) {
        digester_ = &KeyDigest::compute;
    }
}

CreateResult KeyStore::create(const std::string& value) {
    if (value.size() > max_length_) {
        throw ServiceError::value_too_large();
    }

    // Hashing needs no shared state, keep it outside the critical section.
    const std::string digest = digester_(value);

    std::lock_guard<std::mutex> lock(mutex_);

    CreateResult result;
    size_t size = min_key_size_;
    size_t offset = 0;
    for (;;) {
        // Every window of this width is taken: widen and rescan from the start.
        if (offset + size > digest.size()) {
            ++size;
            offset = 0;
        }
        // The full digest is the last candidate; running past it means two
        // values produced identical digests.
        if (size > digest.size()) {
            throw ServiceError::internal("candidate window exceeded digest length");
        }

        std::string candidate = digest.substr(offset, size);

        auto it = entries_.find(candidate);
        if (it == entries_.end()) {
            entries_.emplace(candidate, value);
            result.key = std::move(candidate);
            result.inserted = true;
            return result;
        }
        if (it->second == value) {
            result.key = std::move(candidate);
            return result;
        }

        ++result.collisions;
        ++offset;
    }
}

std::string KeyStore::lookup(const std::string& key) {
    if (key.size() > max_length_) {
        throw ServiceError::value_too_large();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        throw ServiceError::key_not_found();
    }
    return it->second;
}

size_t KeyStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

}
