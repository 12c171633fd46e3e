#pragma once

#include <boost/asio/io_context.hpp>
#include <chrono>
#include <memory>
#include <string>

#include "key_service.hpp"
#include "service_error.hpp"

namespace shorten {

// KeyService over HTTP. Each call opens a connection to the server, sends
// one request and maps the response back onto the error taxonomy.
// Calls are blocking; one instance may be shared between threads.
class ShortClient : public KeyService {
public:
    // `address` is "host:port", optionally prefixed with "http://".
    // @throws std::invalid_argument when no port can be found.
    explicit ShortClient(const std::string& address,
                         std::chrono::seconds timeout = std::chrono::seconds(10));

    CreateResult create(const std::string& value) override;
    std::string lookup(const std::string& key) override;

    const std::string& host() const { return host_; }
    const std::string& port() const { return port_; }

    // 404 -> KEY_NOT_FOUND, 429 -> RATE_LIMITED, 503 -> CIRCUIT_OPEN.
    // 400 is VALUE_TOO_LARGE only when `message` is the size error; any
    // other 400 and every other status is INTERNAL.
    static ErrorCode code_for_status(unsigned status, const std::string& message);

private:
    std::string host_;
    std::string port_;
    std::chrono::seconds timeout_;

    // Returns the response body of a 200, throws ServiceError otherwise.
    std::string round_trip(bool post, const std::string& target, const std::string& body);
};

// Wraps a ShortClient in the client-side limiter and circuit breaker
// (50/s with burst 100 for both operations, 5 s open timeout).
std::shared_ptr<KeyService> make_resilient_client(const std::string& address);

}
