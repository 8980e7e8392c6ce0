#pragma once

#include <memory>
#include <nlohmann/json.hpp>

#include "events/event_types.hpp"
#include "jsonrpc/message.hpp"
#include "service/service_definition.hpp"

namespace mcprouter {
namespace worker {

// Point-in-time counters reported by a strategy
struct StrategyStats {
    size_t live_workers = 0;      // worker processes currently owned
    size_t in_flight = 0;         // requests awaiting a worker response
    size_t waiting = 0;           // callers queued for admission or worker startup
    size_t capacity = 0;          // admission limit (0 = unbounded)
};

// Interface for worker process strategies to enable mocking
class IWorkerStrategy {
public:
    virtual ~IWorkerStrategy() = default;

    // Run one request/response exchange against a worker of `service`.
    // Never throws: failures come back as an outcome carrying request["id"].
    virtual jsonrpc::RpcOutcome dispatch(const std::shared_ptr<const service::ServiceDefinition> &service,
                                         const nlohmann::json &request) = 0;

    // Stop admitting requests, terminate owned workers and wait for them.
    // Idempotent.
    virtual void shutdown() = 0;

    virtual StrategyStats stats() const = 0;
    virtual events::Strategy kind() const = 0;
};

}  // namespace worker
}  // namespace mcprouter
