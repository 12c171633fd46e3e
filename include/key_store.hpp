#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

#include "key_service.hpp"

namespace shorten {

// Thread-safe, memory-resident store of short keys.
//
// Keys are windows of the value's digest. A create tries windows of
// `min_key_size` characters sliding left to right; when every window of the
// current width is owned by another value the width grows by one and the
// scan restarts at offset 0. The same value always retraces the same window
// sequence, so re-creating it returns the key it already holds.
//
// One mutex guards the whole map and is held across the full search loop.
class KeyStore : public KeyService {
public:
    using Digester = std::function<std::string(const std::string&)>;

    static constexpr size_t DEFAULT_MAX_LENGTH = 2083;
    static constexpr size_t DEFAULT_MIN_KEY_SIZE = 6;

    /**
     * @param max_length Longest accepted value (and key) in characters.
     * @param min_key_size Width of the first candidate window, 1 to 22.
     * @throws std::invalid_argument when min_key_size is outside that range.
     * @param digester Digest function; defaults to KeyDigest::compute.
     */
    explicit KeyStore(size_t max_length = DEFAULT_MAX_LENGTH,
                      size_t min_key_size = DEFAULT_MIN_KEY_SIZE,
                      Digester digester = nullptr);
    ~KeyStore() override = default;

    KeyStore(const KeyStore&) = delete;
    KeyStore& operator=(const KeyStore&) = delete;

    CreateResult create(const std::string& value) override;
    std::string lookup(const std::string& key) override;

    // Number of stored entries.
    size_t size() const;

    size_t max_length() const { return max_length_; }
    size_t min_key_size() const { return min_key_size_; }

private:
    const size_t max_length_;
    const size_t min_key_size_;
    Digester digester_;

    std::unordered_map<std::string, std::string> entries_;
    mutable std::mutex mutex_;
};

}
