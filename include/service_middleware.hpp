#pragma once

#include <memory>
#include <string>

#include "key_service.hpp"

namespace shorten {

// Logs every create and lookup with its input, output and error.
// Results and exceptions pass through unchanged.
class LoggingService : public KeyService {
public:
    explicit LoggingService(std::shared_ptr<KeyService> next);

    CreateResult create(const std::string& value) override;
    std::string lookup(const std::string& key) override;

private:
    std::shared_ptr<KeyService> next_;
};


// Counts creates, lookups and key collisions and records call durations
// in the MetricsRegistry.
//
//   shorten_inserts_total{success="true|false"}
//   shorten_lookups_total{success="true|false"}
//   shorten_collisions_total
//   shorten_request_duration_seconds{method="Create|Lookup"}  (summary)
class InstrumentingService : public KeyService {
public:
    explicit InstrumentingService(std::shared_ptr<KeyService> next);

    CreateResult create(const std::string& value) override;
    std::string lookup(const std::string& key) override;

private:
    std::shared_ptr<KeyService> next_;
};

}
