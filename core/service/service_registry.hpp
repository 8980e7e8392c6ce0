#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "service_definition.hpp"

namespace mcprouter {
namespace service {

/**
 * @brief Thread-safe lookup table from service id to launch definition
 *
 * Populated once at startup from configuration and read concurrently by the
 * router afterwards. Definitions are stored as shared_ptr<const ...> so a
 * lookup result stays valid for the whole request even if the table is
 * cleared during shutdown.
 *
 * Thread Safety:
 * - lookup(), has_service(), service_ids(), service_count() take a shared lock
 * - add_service(), clear() take an exclusive lock
 */
class ServiceRegistry {
public:
    ServiceRegistry() = default;
    ~ServiceRegistry() = default;

    // Non-copyable, non-movable (manages mutex)
    ServiceRegistry(const ServiceRegistry &) = delete;
    ServiceRegistry &operator=(const ServiceRegistry &) = delete;
    ServiceRegistry(ServiceRegistry &&) = delete;
    ServiceRegistry &operator=(ServiceRegistry &&) = delete;

    /**
     * @brief Add or replace a service definition
     *
     * @return false if the definition has an empty id (nothing is stored)
     */
    bool add_service(const ServiceDefinition &definition);

    /**
     * @brief Look up a service by id, O(1)
     *
     * @return Definition, or nullptr if the id is unknown
     */
    std::shared_ptr<const ServiceDefinition> lookup(const std::string &service_id) const;

    bool has_service(const std::string &service_id) const;

    // Snapshot of ids, sorted for stable listings
    std::vector<std::string> service_ids() const;

    size_t service_count() const;

    void clear();

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const ServiceDefinition>> services_;
};

}  // namespace service
}  // namespace mcprouter
