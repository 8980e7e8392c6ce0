#include "service_registry.hpp"

#include <algorithm>
#include <mutex>

namespace mcprouter {
namespace service {

bool ServiceRegistry::add_service(const ServiceDefinition &definition) {
    if (definition.id.empty()) {
        return false;
    }
    auto stored = std::make_shared<const ServiceDefinition>(definition);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    services_[definition.id] = std::move(stored);
    return true;
}

std::shared_ptr<const ServiceDefinition> ServiceRegistry::lookup(const std::string &service_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = services_.find(service_id);
    if (it != services_.end()) {
        return it->second;
    }
    return nullptr;
}

bool ServiceRegistry::has_service(const std::string &service_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return services_.find(service_id) != services_.end();
}

std::vector<std::string> ServiceRegistry::service_ids() const {
    std::vector<std::string> ids;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        ids.reserve(services_.size());
        for (const auto &[id, definition] : services_) {
            static_cast<void>(definition);
            ids.push_back(id);
        }
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

size_t ServiceRegistry::service_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return services_.size();
}

void ServiceRegistry::clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    services_.clear();
}

}  // namespace service
}  // namespace mcprouter
