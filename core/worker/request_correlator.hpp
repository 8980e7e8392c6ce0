#pragma once

#include <future>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>

namespace mcprouter {
namespace worker {

/**
 * @brief Per-worker table of in-flight requests awaiting a response
 *
 * Each pending request id owns a one-shot continuation (a promise whose
 * future the caller blocks on). Ids only need to be unique among the
 * requests currently pending on the same worker.
 *
 * Thread Safety:
 * - All methods lock internally. resolve() runs on the worker's read loop,
 *   expect()/cancel() on caller threads, fail_all() on the read loop at exit.
 *
 * Once fail_all() has run the table is closed: later expect() calls are
 * refused so no continuation can be registered on a dead worker.
 */
class RequestCorrelator {
public:
    // What a continuation completes with. local_failure is true when the
    // envelope was built by fail_all() rather than received from the worker.
    struct Reply {
        nlohmann::json response;
        bool local_failure = false;
    };

    RequestCorrelator() = default;

    RequestCorrelator(const RequestCorrelator &) = delete;
    RequestCorrelator &operator=(const RequestCorrelator &) = delete;

    // Register a continuation for `id`.
    // Returns std::nullopt if the id is already pending or the table is closed.
    std::optional<std::future<Reply>> expect(const nlohmann::json &id);

    // Complete the continuation whose id matches `message["id"]` and remove it.
    // Returns false when the message carries no pending id.
    bool resolve(const nlohmann::json &message);

    // Drop a continuation without completing it (timeout path).
    // Returns false if it was already resolved or never registered.
    bool cancel(const nlohmann::json &id);

    // Complete every pending continuation with an internal error envelope
    // carrying its own id and `message` (plus `data` when not null), then
    // close the table. Returns the number of continuations failed.
    size_t fail_all(const std::string &message, const nlohmann::json &data = nullptr);

    size_t pending_count() const;
    bool is_closed() const;
    std::string close_reason() const;

private:
    struct Pending {
        nlohmann::json id;
        std::promise<Reply> promise;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Pending> pending_;
    bool closed_ = false;
    std::string close_reason_;
};

}  // namespace worker
}  // namespace mcprouter
