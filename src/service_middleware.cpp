#include "service_middleware.hpp"
#include "service_error.hpp"
#include "service_logger.hpp"
#include "metrics.hpp"
#include <chrono>
#include <stdexcept>
#include <utility>

namespace shorten {

namespace {

constexpr size_t MAX_LOGGED_FIELD = 256;

std::string clip(const std::string& field) {
    if (field.size() <= MAX_LOGGED_FIELD) return field;
    return field.substr(0, MAX_LOGGED_FIELD) + "...";
}

void log_call(const std::string& fields, const std::exception* error) {
    if (!error) {
        ServiceLogger::log(ServiceLogger::Level::INFO, ServiceLogger::EventType::REQUEST,
                           "internal", fields + " err=nil");
        return;
    }

    auto level = ServiceLogger::Level::ERROR;
    if (auto* se = dynamic_cast<const ServiceError*>(error)) {
        if (se->is_domain_error()) level = ServiceLogger::Level::INFO;
    }
    ServiceLogger::log(level, ServiceLogger::EventType::REQUEST, "internal",
                       fields + " err=" + error->what());
}

double seconds_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

}

LoggingService::LoggingService(std::shared_ptr<KeyService> next)
    : next_(std::move(next))
{}

CreateResult LoggingService::create(const std::string& value) {
    try {
        CreateResult result = next_->create(value);
        log_call("method=Create v=" + clip(value) + " k=" + result.key, nullptr);
        return result;
    } catch (const std::exception& e) {
        log_call("method=Create v=" + clip(value) + " k=", &e);
        throw;
    }
}

std::string LoggingService::lookup(const std::string& key) {
    try {
        std::string value = next_->lookup(key);
        log_call("method=Lookup k=" + clip(key) + " v=" + clip(value), nullptr);
        return value;
    } catch (const std::exception& e) {
        log_call("method=Lookup k=" + clip(key) + " v=", &e);
        throw;
    }
}


InstrumentingService::InstrumentingService(std::shared_ptr<KeyService> next)
    : next_(std::move(next))
{}

CreateResult InstrumentingService::create(const std::string& value) {
    auto& metrics = MetricsRegistry::instance();
    auto start = std::chrono::steady_clock::now();
    try {
        CreateResult result = next_->create(value);
        metrics.increment_counter("shorten_inserts_total{success=\"true\"}");
        if (result.collisions > 0) {
            metrics.increment_counter("shorten_collisions_total", static_cast<double>(result.collisions));
        }
        metrics.observe("shorten_request_duration_seconds", "{method=\"Create\"}", seconds_since(start));
        return result;
    } catch (const std::exception&) {
        metrics.increment_counter("shorten_inserts_total{success=\"false\"}");
        metrics.observe("shorten_request_duration_seconds", "{method=\"Create\"}", seconds_since(start));
        throw;
    }
}

std::string InstrumentingService::lookup(const std::string& key) {
    auto& metrics = MetricsRegistry::instance();
    auto start = std::chrono::steady_clock::now();
    try {
        std::string value = next_->lookup(key);
        metrics.increment_counter("shorten_lookups_total{success=\"true\"}");
        metrics.observe("shorten_request_duration_seconds", "{method=\"Lookup\"}", seconds_since(start));
        return value;
    } catch (const std::exception&) {
        metrics.increment_counter("shorten_lookups_total{success=\"false\"}");
        metrics.observe("shorten_request_duration_seconds", "{method=\"Lookup\"}", seconds_since(start));
        throw;
    }
}

}
