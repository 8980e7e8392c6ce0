#include "worker_process.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <vector>

#include "line_framer.hpp"
#include "logging/logger.hpp"

extern char **environ;

namespace mcprouter {
namespace worker {

namespace {

constexpr int kPollIntervalMs = 100;
constexpr int kReapIntervalMs = 10;
constexpr size_t kReadChunk = 64 * 1024;
constexpr size_t kLogPreview = 200;

// Stages reported by the child over the exec-status pipe
constexpr int kStageChdir = 1;
constexpr int kStageExec = 2;

std::once_flag sigpipe_once;

bool make_pipe(int fds[2]) { return ::pipe2(fds, O_CLOEXEC) == 0; }

void close_fd(int &fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string preview(const std::string &line) {
    if (line.size() <= kLogPreview) {
        return line;
    }
    return line.substr(0, kLogPreview) + "... (" + std::to_string(line.size()) + " bytes)";
}

// Inherited environment, then router defaults, then the service's own overrides
std::vector<std::string> build_environment(const std::map<std::string, std::string> &defaults,
                                           const std::map<std::string, std::string> &overrides) {
    std::map<std::string, std::string> merged;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const std::string kv(*entry);
        const auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        merged[kv.substr(0, eq)] = kv.substr(eq + 1);
    }
    for (const auto &[key, value] : defaults) {
        merged[key] = value;
    }
    for (const auto &[key, value] : overrides) {
        merged[key] = value;
    }

    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto &[key, value] : merged) {
        result.push_back(key + "=" + value);
    }
    return result;
}

}  // namespace

const char *worker_state_to_string(WorkerState state) {
    switch (state) {
        case WorkerState::STARTING:
            return "STARTING";
        case WorkerState::READY:
            return "READY";
        case WorkerState::DRAINING:
            return "DRAINING";
        case WorkerState::DEAD:
            return "DEAD";
    }
    return "UNKNOWN";
}

std::shared_ptr<WorkerProcess> WorkerProcess::create(std::shared_ptr<const service::ServiceDefinition> definition,
                                                     WorkerOptions options) {
    return std::make_shared<WorkerProcess>(std::move(definition), std::move(options));
}

WorkerProcess::WorkerProcess(std::shared_ptr<const service::ServiceDefinition> definition, WorkerOptions options)
    : definition_(std::move(definition)), options_(std::move(options)) {
    spawned_at_ = std::chrono::steady_clock::now();
    last_used_ = spawned_at_;
}

WorkerProcess::~WorkerProcess() {
    // The read loop holds a reference until it finishes, so the last owner
    // can be the reader thread itself.
    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }
    close_fd(stdin_fd_);
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
}

void WorkerProcess::set_exit_callback(ExitCallback callback) { exit_callback_ = std::move(callback); }

bool WorkerProcess::spawn() {
    std::call_once(sigpipe_once, [] { ::signal(SIGPIPE, SIG_IGN); });

    const auto &def = *definition_;
    if (def.command.empty()) {
        error_ = "Service '" + def.id + "' has no command";
        LOG_ERROR("[" << def.id << "] " << error_);
        return false;
    }

    // Everything the child needs is built before fork()
    std::vector<std::string> arg_strings;
    arg_strings.push_back(def.command);
    arg_strings.insert(arg_strings.end(), def.args.begin(), def.args.end());
    std::vector<char *> argv;
    for (auto &arg : arg_strings) {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_strings = build_environment(options_.default_env, def.env);
    std::vector<char *> envp;
    for (auto &entry : env_strings) {
        envp.push_back(const_cast<char *>(entry.c_str()));
    }
    envp.push_back(nullptr);

    const char *cwd = def.cwd.empty() ? nullptr : def.cwd.c_str();

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        for (int *p : {stdin_pipe, stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (!make_pipe(stdin_pipe) || !make_pipe(stdout_pipe) || !make_pipe(stderr_pipe) || !make_pipe(status_pipe)) {
        error_ = std::string("Failed to create pipes: ") + std::strerror(errno);
        LOG_ERROR("[" << def.id << "] " << error_);
        close_all();
        return false;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        error_ = std::string("fork failed: ") + std::strerror(errno);
        LOG_ERROR("[" << def.id << "] " << error_);
        close_all();
        return false;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);

        ::dup2(stdin_pipe[0], STDIN_FILENO);
        ::dup2(stdout_pipe[1], STDOUT_FILENO);
        ::dup2(stderr_pipe[1], STDERR_FILENO);

        int report[2] = {0, 0};
        if (cwd != nullptr && ::chdir(cwd) != 0) {
            report[0] = kStageChdir;
            report[1] = errno;
        } else {
            ::execvpe(argv[0], argv.data(), envp.data());
            report[0] = kStageExec;
            report[1] = errno;
        }
        ssize_t ignored = ::write(status_pipe[1], report, sizeof(report));
        static_cast<void>(ignored);
        ::_exit(127);
    }

    // Parent. Both sides set the group to avoid racing the child.
    if (::setpgid(pid, pid) < 0 && errno != EACCES && errno != ESRCH) {
        LOG_DEBUG("[" << def.id << "] setpgid failed: " << std::strerror(errno));
    }

    close_fd(stdin_pipe[0]);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    // EOF on the status pipe means exec succeeded (it is close-on-exec)
    int report[2] = {0, 0};
    ssize_t n;
    do {
        n = ::read(status_pipe[0], report, sizeof(report));
    } while (n < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(report))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        if (report[0] == kStageChdir) {
            error_ = "Failed to change directory to '" + def.cwd + "': " + std::strerror(report[1]);
        } else {
            error_ = "Failed to execute '" + def.command + "': " + std::strerror(report[1]);
        }
        LOG_ERROR("[" << def.id << "] Spawn failed: " << error_);
        close_all();
        return false;
    }

    // Writes poll against the request deadline instead of blocking on a full pipe
    const int flags = ::fcntl(stdin_pipe[1], F_GETFL);
    if (flags < 0 || ::fcntl(stdin_pipe[1], F_SETFL, flags | O_NONBLOCK) < 0) {
        LOG_WARN("[" << def.id << "] Could not make worker stdin non-blocking: " << std::strerror(errno));
    }

    // terminate() may run concurrently from a supervisor shutting down
    {
        std::lock_guard<std::timed_mutex> write_lock(write_mutex_);
        stdin_fd_ = stdin_pipe[1];
    }
    stdout_fd_ = stdout_pipe[0];
    stderr_fd_ = stderr_pipe[0];
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pid_ = pid;
        spawned_at_ = std::chrono::steady_clock::now();
        last_used_ = spawned_at_;
    }

    std::string command_line = def.command;
    for (const auto &arg : def.args) {
        command_line += " " + arg;
    }
    LOG_INFO("[" << def.id << "] Spawned " << events::strategy_to_string(options_.strategy)
                 << " worker: " << command_line << " (PID=" << pid << ")");

    if (options_.event_emitter) {
        events::WorkerSpawnedEvent event;
        event.service_id = def.id;
        event.pid = pid;
        event.strategy = options_.strategy;
        options_.event_emitter->emit(events::stamp(event));
    }

    reader_ = std::thread(&WorkerProcess::read_loop, this, shared_from_this());
    return true;
}

WorkerProcess::WriteStatus WorkerProcess::write_line(const std::string &line,
                                                     std::chrono::steady_clock::time_point deadline, size_t &written,
                                                     std::string &error) {
    written = 0;
    std::unique_lock<std::timed_mutex> lock(write_mutex_, deadline);
    if (!lock.owns_lock()) {
        error = "Worker stdin is busy with another request";
        return WriteStatus::TIMEOUT;
    }
    if (stdin_fd_ < 0) {
        error = "Worker stdin is closed";
        return WriteStatus::BROKEN_PIPE;
    }

    while (written < line.size()) {
        const ssize_t n = ::write(stdin_fd_, line.data() + written, line.size() - written);
        if (n >= 0) {
            written += static_cast<size_t>(n);
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno != EAGAIN && errno != EWOULDBLOCK) {
            error = std::string("Write to worker failed: ") + std::strerror(errno);
            return errno == EPIPE ? WriteStatus::BROKEN_PIPE : WriteStatus::FAILED;
        }

        // Pipe full: the worker is not draining its stdin
        const auto remaining =
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            error = "Worker is not reading its stdin (" + std::to_string(written) + " of " +
                    std::to_string(line.size()) + " bytes written)";
            return WriteStatus::TIMEOUT;
        }
        pollfd pfd{stdin_fd_, POLLOUT, 0};
        if (::poll(&pfd, 1, static_cast<int>(std::min<int64_t>(remaining, kPollIntervalMs))) < 0 && errno != EINTR) {
            error = std::string("poll on worker stdin failed: ") + std::strerror(errno);
            return WriteStatus::FAILED;
        }
        // POLLERR/POLLHUP surface as EPIPE on the next write()
    }
    return WriteStatus::OK;
}

jsonrpc::RpcOutcome WorkerProcess::send_and_await(const nlohmann::json &request, int timeout_ms) {
    const nlohmann::json id = request.value("id", nlohmann::json());
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

    auto future = correlator_.expect(id);
    if (!future) {
        if (correlator_.is_closed()) {
            return jsonrpc::make_failure(id, jsonrpc::ErrorKind::PROCESS_EXITED, correlator_.close_reason());
        }
        return jsonrpc::make_failure(id, jsonrpc::ErrorKind::INTERNAL,
                                     "Request id " + id.dump() + " is already pending on this worker");
    }

    const std::string line = request.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
    std::string error;
    size_t written = 0;
    const WriteStatus status = write_line(line, deadline, written, error);
    if (status == WriteStatus::TIMEOUT) {
        correlator_.cancel(id);
        LOG_WARN("[" << service_id() << "] Request " << id.dump() << " timed out after " << timeout_ms
                     << "ms while writing: " << error);
        if (written > 0) {
            // A partial line corrupts framing for every later request
            terminate("stdin write timeout");
        }
        return jsonrpc::make_failure(id, jsonrpc::ErrorKind::TIMEOUT,
                                     "Request timeout after " + std::to_string(timeout_ms) + "ms");
    }
    if (status != WriteStatus::OK) {
        correlator_.cancel(id);
        LOG_WARN("[" << service_id() << "] " << error);
        return jsonrpc::make_failure(id,
                                     status == WriteStatus::BROKEN_PIPE ? jsonrpc::ErrorKind::PROCESS_EXITED
                                                                        : jsonrpc::ErrorKind::INTERNAL,
                                     error);
    }
    touch();

    if (future->wait_until(deadline) == std::future_status::timeout) {
        // If cancel() loses the race the reply is already set; use it
        if (correlator_.cancel(id)) {
            LOG_WARN("[" << service_id() << "] Request " << id.dump() << " timed out after " << timeout_ms << "ms");
            return jsonrpc::make_failure(id, jsonrpc::ErrorKind::TIMEOUT,
                                         "Request timeout after " + std::to_string(timeout_ms) + "ms");
        }
    }

    RequestCorrelator::Reply reply = future->get();
    touch();

    jsonrpc::RpcOutcome outcome;
    outcome.kind = reply.local_failure ? jsonrpc::ErrorKind::PROCESS_EXITED : jsonrpc::ErrorKind::OK;
    outcome.response = std::move(reply.response);
    return outcome;
}

bool WorkerProcess::wait_for_output(int timeout_ms) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                       [this] { return saw_output_ || state_ == WorkerState::DEAD; });
    return saw_output_;
}

void WorkerProcess::mark_ready(bool confirmed) {
    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != WorkerState::STARTING) {
            return;
        }
        state_ = WorkerState::READY;
        pid = pid_;
    }

    if (options_.event_emitter) {
        events::WorkerReadyEvent event;
        event.service_id = service_id();
        event.pid = pid;
        event.strategy = options_.strategy;
        event.confirmed = confirmed;
        options_.event_emitter->emit(events::stamp(event));
    }
}

void WorkerProcess::terminate(const std::string &reason) {
    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pid = pid_;
        if (pid_ <= 0 || reaped_ || terminate_requested_) {
            return;
        }
        terminate_requested_ = true;
        terminate_reason_ = reason;
        state_ = WorkerState::DRAINING;
        if (!kill_armed_) {
            kill_armed_ = true;
            kill_deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.shutdown_timeout_ms);
        }
        signal_group_locked(SIGTERM);
    }

    LOG_INFO("[" << service_id() << "] Terminating worker (PID=" << pid << "): " << reason);

    // A writer blocked on a full pipe is released by the signal; never wait for it here
    std::unique_lock<std::timed_mutex> write_lock(write_mutex_, std::try_to_lock);
    if (write_lock.owns_lock()) {
        close_fd(stdin_fd_);
    }
}

bool WorkerProcess::wait_for_exit(int timeout_ms) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    auto dead = [this] { return state_ == WorkerState::DEAD; };
    if (timeout_ms < 0) {
        state_cv_.wait(lock, dead);
        return true;
    }
    return state_cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), dead);
}

WorkerState WorkerProcess::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool WorkerProcess::terminate_requested() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return terminate_requested_;
}

std::optional<int> WorkerProcess::exit_code() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exit_code_;
}

std::optional<int> WorkerProcess::term_signal() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return term_signal_;
}

pid_t WorkerProcess::pid() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return pid_;
}

std::chrono::steady_clock::time_point WorkerProcess::last_used() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_used_;
}

int64_t WorkerProcess::idle_ms() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - last_used())
        .count();
}

void WorkerProcess::touch() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    last_used_ = std::chrono::steady_clock::now();
}

void WorkerProcess::read_loop(std::shared_ptr<WorkerProcess> self) {
    static_cast<void>(self);

    LineFramer out_framer;
    LineFramer err_framer;
    std::vector<char> buffer(kReadChunk);
    bool out_open = true;
    bool err_open = true;
    bool reaped = false;

    auto drain = [&](int fd, LineFramer &framer, bool &open, bool is_stdout) {
        const ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n > 0) {
            for (const auto &line : framer.feed(buffer.data(), static_cast<size_t>(n))) {
                if (is_stdout) {
                    handle_stdout_line(line);
                } else {
                    handle_stderr_line(line);
                }
            }
        } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
            open = false;
        }
    };

    while ((out_open || err_open) && !reaped) {
        pollfd fds[2];
        nfds_t count = 0;
        int out_index = -1;
        int err_index = -1;
        if (out_open) {
            out_index = static_cast<int>(count);
            fds[count++] = pollfd{stdout_fd_, POLLIN, 0};
        }
        if (err_open) {
            err_index = static_cast<int>(count);
            fds[count++] = pollfd{stderr_fd_, POLLIN, 0};
        }

        const int rc = ::poll(fds, count, kPollIntervalMs);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("[" << service_id() << "] poll failed: " << std::strerror(errno));
            break;
        }

        if (rc == 0) {
            // Idle tick. The child may be gone while a grandchild keeps the pipes open.
            escalate_if_due();
            reaped = try_reap();
            continue;
        }

        const short ready_mask = POLLIN | POLLHUP | POLLERR;
        if (out_index >= 0 && (fds[out_index].revents & ready_mask) != 0) {
            drain(stdout_fd_, out_framer, out_open, true);
        }
        if (err_index >= 0 && (fds[err_index].revents & ready_mask) != 0) {
            drain(stderr_fd_, err_framer, err_open, false);
        }
        escalate_if_due();
    }

    // A final line without its newline is still delivered
    const std::string out_rest = out_framer.take_remainder();
    if (!out_rest.empty()) {
        handle_stdout_line(out_rest);
    }
    const std::string err_rest = err_framer.take_remainder();
    if (!err_rest.empty()) {
        handle_stderr_line(err_rest);
    }
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);

    if (!reaped) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (!kill_armed_) {
                LOG_DEBUG("[" << service_id() << "] stdout closed, waiting for exit (PID=" << pid_ << ")");
                kill_armed_ = true;
                kill_deadline_ =
                    std::chrono::steady_clock::now() + std::chrono::milliseconds(options_.shutdown_timeout_ms);
            }
        }
        while (!try_reap()) {
            escalate_if_due();
            std::this_thread::sleep_for(std::chrono::milliseconds(kReapIntervalMs));
        }
    }

    finish_exit();
}

void WorkerProcess::handle_stdout_line(const std::string &line) {
    nlohmann::json message = nlohmann::json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        LOG_DEBUG("[" << service_id() << "] Ignoring non-JSON output: " << preview(line));
        return;
    }

    bool first = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!saw_output_) {
            saw_output_ = true;
            first = true;
        }
    }
    if (first) {
        state_cv_.notify_all();
    }

    if (!correlator_.resolve(message)) {
        LOG_DEBUG("[" << service_id() << "] Dropping unmatched message: " << preview(line));
    }
}

void WorkerProcess::handle_stderr_line(const std::string &line) {
    LOG_DEBUG("[" << service_id() << "] stderr: " << line);
}

bool WorkerProcess::try_reap() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (reaped_) {
        return true;
    }

    int status = 0;
    const pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        reaped_ = true;
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            term_signal_ = WTERMSIG(status);
        }
    } else if (result < 0 && errno == ECHILD) {
        // Reaped elsewhere; the status is lost
        reaped_ = true;
    }
    return reaped_;
}

void WorkerProcess::escalate_if_due() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!kill_armed_ || killed_ || reaped_ || std::chrono::steady_clock::now() < kill_deadline_) {
        return;
    }
    killed_ = true;
    LOG_WARN("[" << service_id() << "] Worker did not exit within " << options_.shutdown_timeout_ms
                 << "ms, sending SIGKILL (PID=" << pid_ << ")");
    signal_group_locked(SIGKILL);
}

void WorkerProcess::signal_group_locked(int sig) {
    if (::killpg(pid_, sig) < 0 && errno == ESRCH) {
        ::kill(pid_, sig);
    }
}

void WorkerProcess::close_stdin() {
    std::lock_guard<std::timed_mutex> lock(write_mutex_);
    close_fd(stdin_fd_);
}

void WorkerProcess::finish_exit() {
    std::optional<int> code;
    std::optional<int> signal_number;
    bool requested = false;
    std::string reason;
    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        pid = pid_;
        code = exit_code_;
        signal_number = term_signal_;
        requested = terminate_requested_;
        reason = terminate_reason_;
    }

    std::string message;
    nlohmann::json data = nlohmann::json::object();
    if (code) {
        message = "Process exited with code " + std::to_string(*code);
        data["exit_code"] = *code;
    } else if (signal_number) {
        message = "Process killed by signal " + std::to_string(*signal_number);
        data["signal"] = *signal_number;
    } else {
        message = "Process exited";
    }
    if (requested) {
        message += " (" + reason + ")";
    } else {
        message += " without responding";
    }

    const size_t pending = correlator_.pending_count();

    // Emitted before the Dead transition so it precedes anything a waiter does next
    if (options_.event_emitter) {
        events::WorkerExitedEvent event;
        event.service_id = service_id();
        event.pid = pid;
        event.strategy = options_.strategy;
        event.exit_code = code;
        event.term_signal = signal_number;
        event.requested = requested;
        event.failed_requests = pending;
        options_.event_emitter->emit(events::stamp(event));
    }

    if (requested) {
        LOG_INFO("[" << service_id() << "] Worker stopped (PID=" << pid << "): " << message);
    } else {
        LOG_WARN("[" << service_id() << "] Worker exited unexpectedly (PID=" << pid << "): " << message
                     << ", pending requests: " << pending);
    }

    // Unregister before the Dead transition: wait_for_exit() returning means the
    // owner is done with this worker, and failed waiters that retry get a fresh one
    if (exit_callback_) {
        exit_callback_(*this);
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = WorkerState::DEAD;
    }
    state_cv_.notify_all();
    close_stdin();

    const size_t failed = correlator_.fail_all(message, data);
    if (failed > 0) {
        LOG_WARN("[" << service_id() << "] Failed " << failed << " pending request(s): " << message);
    }
}

}  // namespace worker
}  // namespace mcprouter
