#pragma once

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>

#include "events/event_emitter.hpp"
#include "jsonrpc/message.hpp"
#include "request_correlator.hpp"
#include "service/service_definition.hpp"

namespace mcprouter {
namespace worker {

enum class WorkerState { STARTING, READY, DRAINING, DEAD };

const char *worker_state_to_string(WorkerState state);

struct WorkerOptions {
    events::Strategy strategy = events::Strategy::PERSISTENT;
    std::map<std::string, std::string> default_env;  // Applied below the service's own env
    int shutdown_timeout_ms = 2000;                  // SIGTERM -> SIGKILL escalation
    std::shared_ptr<events::EventEmitter> event_emitter;
};

// WorkerProcess owns one worker OS process speaking newline-delimited
// JSON-RPC over stdin/stdout.
//
// Responsibilities:
// - Spawn the process in its own process group with piped stdin/stdout/stderr
// - Run a single read-loop thread that frames stdout into lines, resolves
//   pending requests by id and logs stderr lines at DEBUG
// - Reap the process and make the one Dead transition: an Exited event is
//   emitted, the exit callback runs, then pending requests are failed
// - Write requests to a non-blocking stdin, bounded by the request timeout
// - Terminate: SIGTERM to the group and stdin closed, SIGKILL after
//   shutdown_timeout_ms
//
// Always held through shared_ptr; the read loop keeps the object alive until
// the process has been reaped.
class WorkerProcess : public std::enable_shared_from_this<WorkerProcess> {
public:
    using ExitCallback = std::function<void(const WorkerProcess &)>;

    static std::shared_ptr<WorkerProcess> create(std::shared_ptr<const service::ServiceDefinition> definition,
                                                 WorkerOptions options);

    WorkerProcess(std::shared_ptr<const service::ServiceDefinition> definition, WorkerOptions options);
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess &) = delete;
    WorkerProcess &operator=(const WorkerProcess &) = delete;

    // Invoked on the read-loop thread when the process is reaped.
    // Must be set before spawn().
    void set_exit_callback(ExitCallback callback);

    // Start the process. Returns false on failure (sets last_error()).
    bool spawn();

    /**
     * @brief Send a request and wait for the response carrying its id
     *
     * Other requests may be in flight on the same worker; pairing is by id
     * only. timeout_ms bounds the write to stdin and the wait for the reply
     * together. On timeout the pending entry is removed and the worker is
     * left running, unless only part of the line reached its stdin; then
     * the worker is terminated.
     *
     * @param request Complete request envelope with a string or integer id
     * @param timeout_ms Maximum wait for the response
     * @return OK with the worker's response, or a failure outcome
     *         (TIMEOUT, PROCESS_EXITED, INTERNAL) carrying the request id
     */
    jsonrpc::RpcOutcome send_and_await(const nlohmann::json &request, int timeout_ms);

    // Block until the first syntactically valid JSON line arrives on stdout,
    // the process dies, or timeout_ms elapses. Returns true only in the first case.
    bool wait_for_output(int timeout_ms);

    // Starting -> Ready. confirmed=false when readiness was assumed.
    void mark_ready(bool confirmed);

    // Request termination. Idempotent; returns immediately.
    void terminate(const std::string &reason);

    // Block until Dead (timeout_ms < 0 waits forever). Returns true if Dead.
    bool wait_for_exit(int timeout_ms);

    WorkerState state() const;
    bool is_alive() const { return state() != WorkerState::DEAD; }
    bool terminate_requested() const;

    pid_t pid() const;
    const std::string &service_id() const { return definition_->id; }
    events::Strategy strategy() const { return options_.strategy; }

    std::optional<int> exit_code() const;
    std::optional<int> term_signal() const;

    std::chrono::steady_clock::time_point spawned_at() const { return spawned_at_; }
    std::chrono::steady_clock::time_point last_used() const;
    int64_t idle_ms() const;
    void touch();

    size_t pending_count() const { return correlator_.pending_count(); }

    const std::string &last_error() const { return error_; }

private:
    enum class WriteStatus { OK, BROKEN_PIPE, FAILED, TIMEOUT };

    // Non-blocking write of the whole line, polling until `deadline`.
    // `written` reports how much reached the pipe.
    WriteStatus write_line(const std::string &line, std::chrono::steady_clock::time_point deadline, size_t &written,
                           std::string &error);

    void read_loop(std::shared_ptr<WorkerProcess> self);
    void handle_stdout_line(const std::string &line);
    void handle_stderr_line(const std::string &line);

    // waitpid(WNOHANG) under the state lock; records the status when reaped
    bool try_reap();
    // SIGKILL the group once the termination deadline has passed
    void escalate_if_due();
    void finish_exit();

    void close_stdin();
    // Signal the whole process group; caller holds state_mutex_ and !reaped_
    void signal_group_locked(int sig);

    std::shared_ptr<const service::ServiceDefinition> definition_;
    WorkerOptions options_;
    std::string error_;

    pid_t pid_ = -1;  // guarded by state_mutex_
    int stdin_fd_ = -1;  // guarded by write_mutex_
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::timed_mutex write_mutex_;

    RequestCorrelator correlator_;
    ExitCallback exit_callback_;

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    WorkerState state_ = WorkerState::STARTING;
    bool reaped_ = false;
    bool saw_output_ = false;
    bool terminate_requested_ = false;
    bool kill_armed_ = false;  // a SIGKILL deadline is set
    bool killed_ = false;
    std::string terminate_reason_;
    std::chrono::steady_clock::time_point kill_deadline_;
    std::optional<int> exit_code_;
    std::optional<int> term_signal_;

    std::chrono::steady_clock::time_point spawned_at_;
    std::chrono::steady_clock::time_point last_used_;

    std::thread reader_;
};

}  // namespace worker
}  // namespace mcprouter
