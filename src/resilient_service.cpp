#include "resilient_service.hpp"
#include "service_error.hpp"
#include "service_logger.hpp"
#include "metrics.hpp"
#include <utility>

namespace shorten {

namespace {

CircuitBreaker::Settings breaker_settings(const ResilientService::Settings& s, const std::string& method) {
    CircuitBreaker::Settings out;
    out.name = s.name + "." + method;
    out.max_consecutive_failures = s.max_consecutive_failures;
    out.open_timeout = s.open_timeout;
    return out;
}

}

ResilientService::ResilientService(std::shared_ptr<KeyService> next, const Settings& settings)
    : next_(std::move(next))
    , create_limiter_(settings.create_rate, settings.create_burst)
    , lookup_limiter_(settings.lookup_rate, settings.lookup_burst)
    , create_breaker_(breaker_settings(settings, "create"))
    , lookup_breaker_(breaker_settings(settings, "lookup"))
{}

template<class Fn>
auto ResilientService::guarded(const char* method, RateLimiter& limiter, CircuitBreaker& breaker, Fn&& call)
    -> decltype(call())
{
    auto limit = limiter.check(method);
    if (!limit.allowed) {
        MetricsRegistry::instance().increment_counter(
            std::string("shorten_rate_limited_total{method=\"") + method + "\"}");
        ServiceLogger::log(ServiceLogger::Level::WARNING, ServiceLogger::EventType::RATE_LIMIT_HIT,
                           "internal", std::string("method=") + method);
        throw ServiceError::rate_limited(limit.reset_after_sec);
    }

    if (!breaker.allow()) {
        throw ServiceError::circuit_open();
    }

    try {
        auto result = call();
        breaker.record_success();
        return result;
    } catch (const ServiceError& e) {
        if (e.is_domain_error()) {
            breaker.record_success();
        } else {
            breaker.record_failure();
        }
        throw;
    } catch (const std::exception&) {
        breaker.record_failure();
        throw;
    }
}

CreateResult ResilientService::create(const std::string& value) {
    return guarded("create", create_limiter_, create_breaker_,
                   [this, &value]() { return next_->create(value); });
}

std::string ResilientService::lookup(const std::string& key) {
    return guarded("lookup", lookup_limiter_, lookup_breaker_,
                   [this, &key]() { return next_->lookup(key); });
}

}
