#pragma once

#include <cstddef>
#include <string>

namespace shorten {

// Outcome of a create call.
// `inserted` is false on an idempotent re-create; `collisions` counts the
// candidate windows skipped because they were owned by another value.
struct CreateResult {
    std::string key;
    bool inserted = false;
    size_t collisions = 0;
};


// Abstract interface of the short-key service.
// Implemented by the in-memory KeyStore, by every middleware that wraps it,
// and by the HTTP client, so decorators stack in any order.
class KeyService {
public:
    virtual ~KeyService() = default;

    /**
     * Derives (or re-derives) the short key for a value.
     * @param value Arbitrary string, at most the configured maximum length.
     * @return The key and the collision count.
     * @throws ServiceError VALUE_TOO_LARGE, or INTERNAL on hashing failure.
     */
    virtual CreateResult create(const std::string& value) = 0;

    /**
     * Retrieves the value a key was issued for.
     * @throws ServiceError VALUE_TOO_LARGE or KEY_NOT_FOUND.
     */
    virtual std::string lookup(const std::string& key) = 0;
};

}
