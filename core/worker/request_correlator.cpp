#include "request_correlator.hpp"

#include <vector>

#include "jsonrpc/message.hpp"

namespace mcprouter {
namespace worker {

std::optional<std::future<RequestCorrelator::Reply>> RequestCorrelator::expect(const nlohmann::json &id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return std::nullopt;
    }

    const std::string key = jsonrpc::id_key(id);
    if (pending_.find(key) != pending_.end()) {
        return std::nullopt;
    }

    Pending entry;
    entry.id = id;
    auto future = entry.promise.get_future();
    pending_.emplace(key, std::move(entry));
    return future;
}

bool RequestCorrelator::resolve(const nlohmann::json &message) {
    if (!jsonrpc::is_response(message)) {
        return false;
    }

    std::promise<Reply> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(jsonrpc::id_key(message["id"]));
        if (it == pending_.end()) {
            return false;
        }
        promise = std::move(it->second.promise);
        pending_.erase(it);
    }

    // Complete outside the lock; the waiter may immediately issue a new request
    promise.set_value(Reply{message, false});
    return true;
}

bool RequestCorrelator::cancel(const nlohmann::json &id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.erase(jsonrpc::id_key(id)) > 0;
}

size_t RequestCorrelator::fail_all(const std::string &message, const nlohmann::json &data) {
    std::vector<Pending> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        close_reason_ = message;
        failed.reserve(pending_.size());
        for (auto &[key, entry] : pending_) {
            static_cast<void>(key);
            failed.push_back(std::move(entry));
        }
        pending_.clear();
    }

    for (auto &entry : failed) {
        auto response = jsonrpc::make_error(entry.id, jsonrpc::kInternalError, message);
        if (!data.is_null()) {
            response["error"]["data"] = data;
        }
        entry.promise.set_value(Reply{std::move(response), true});
    }
    return failed.size();
}

size_t RequestCorrelator::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool RequestCorrelator::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::string RequestCorrelator::close_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_;
}

}  // namespace worker
}  // namespace mcprouter
