/**
 * worker_process_test.cpp - WorkerProcess unit tests
 *
 * Tests run real bash stub workers (see support/stub_workers.hpp):
 * - Spawn failures (missing executable, bad cwd, empty command)
 * - Request/response exchange, non-JSON stdout lines ignored
 * - Concurrent requests answered out of order
 * - Worker error objects are returned untouched
 * - Unexpected exit fails pending requests with the exit code
 * - Timeout removes the pending entry and leaves the worker running
 * - Request timeout also bounds the write to a worker that never reads stdin
 * - SIGTERM, then SIGKILL escalation, across the whole process group
 * - Environment and working directory of the child
 * - Ready probe (first JSON line on stdout)
 */

#include "worker/worker_process.hpp"

#include <gtest/gtest.h>
#include <signal.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

#include "events/event_emitter.hpp"
#include "support/stub_workers.hpp"

using namespace mcprouter;
using namespace mcprouter::worker;
using namespace mcprouter::tests;
using json = nlohmann::json;
using namespace std::chrono_literals;

/**
 * Test Fixture: WorkerProcessTest
 *
 * Owns the stub script directory and an event emitter every worker reports to.
 */
class WorkerProcessTest : public ::testing::Test {
protected:
    void SetUp() override {
        emitter_ = std::make_shared<events::EventEmitter>(256);
        events_ = std::make_unique<events::EventCursor>(*emitter_);
    }

    WorkerOptions options(int shutdown_timeout_ms = 2000) {
        WorkerOptions opts;
        opts.strategy = events::Strategy::PERSISTENT;
        opts.shutdown_timeout_ms = shutdown_timeout_ms;
        opts.event_emitter = emitter_;
        return opts;
    }

    std::shared_ptr<WorkerProcess> spawn(const std::string &id, const std::string &body,
                                         WorkerOptions opts) {
        auto worker = WorkerProcess::create(stubs_.service(id, body), std::move(opts));
        EXPECT_TRUE(worker->spawn()) << worker->last_error();
        workers_.push_back(worker);
        return worker;
    }

    std::shared_ptr<WorkerProcess> spawn(const std::string &id, const std::string &body) {
        return spawn(id, body, options());
    }

    void TearDown() override {
        for (auto &worker : workers_) {
            worker->terminate("test teardown");
            worker->wait_for_exit(5000);
        }
    }

    // Wait for the next event of type T (other events are skipped)
    template <typename T>
    std::optional<T> next_event(int timeout_ms = 3000) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
        while (std::chrono::steady_clock::now() < deadline) {
            auto evt = events_->next(50);
            if (evt && std::holds_alternative<T>(*evt)) {
                return std::get<T>(*evt);
            }
        }
        return std::nullopt;
    }

    StubWorkers stubs_{"mcprouter_worker_test"};
    std::shared_ptr<events::EventEmitter> emitter_;
    std::unique_ptr<events::EventCursor> events_;
    std::vector<std::shared_ptr<WorkerProcess>> workers_;
};

// ============================================================================
// Spawn
// ============================================================================

TEST_F(WorkerProcessTest, SpawnFailsWithNonexistentExecutable) {
    service::ServiceDefinition def;
    def.id = "missing";
    def.command = "/nonexistent_path/mcprouter_fake_worker";
    auto worker = WorkerProcess::create(std::make_shared<const service::ServiceDefinition>(def), options());

    EXPECT_FALSE(worker->spawn());
    EXPECT_NE(worker->last_error().find("Failed to execute"), std::string::npos) << worker->last_error();
    EXPECT_EQ(worker->pid(), -1);
}

TEST_F(WorkerProcessTest, SpawnFailsWithEmptyCommand) {
    service::ServiceDefinition def;
    def.id = "empty";
    auto worker = WorkerProcess::create(std::make_shared<const service::ServiceDefinition>(def), options());

    EXPECT_FALSE(worker->spawn());
    EXPECT_FALSE(worker->last_error().empty());
}

TEST_F(WorkerProcessTest, SpawnFailsWithMissingWorkingDirectory) {
    service::ServiceDefinition def = *stubs_.service("badcwd", kEchoWorker);
    def.cwd = "/nonexistent_path/mcprouter_cwd";
    auto worker = WorkerProcess::create(std::make_shared<const service::ServiceDefinition>(def), options());

    EXPECT_FALSE(worker->spawn());
    EXPECT_NE(worker->last_error().find("Failed to change directory"), std::string::npos) << worker->last_error();
}

TEST_F(WorkerProcessTest, SpawnEmitsSpawnedEvent) {
    auto worker = spawn("echo", kEchoWorker);

    auto spawned = next_event<events::WorkerSpawnedEvent>();
    ASSERT_TRUE(spawned.has_value());
    EXPECT_EQ(spawned->service_id, "echo");
    EXPECT_EQ(spawned->pid, worker->pid());
    EXPECT_EQ(worker->state(), WorkerState::STARTING);
    EXPECT_TRUE(worker->is_alive());
}

// ============================================================================
// Exchange
// ============================================================================

TEST_F(WorkerProcessTest, ExchangesRequestAndIgnoresNonJsonLines) {
    auto worker = spawn("echo", kEchoWorker);

    // The echo stub prints a plain-text line before each default reply
    auto outcome = worker->send_and_await(jsonrpc::make_request("r1", "tools/list", json::object()), 3000);

    ASSERT_TRUE(outcome.ok()) << outcome.response.dump();
    EXPECT_EQ(outcome.response["id"], "r1");
    EXPECT_EQ(outcome.response["result"]["method"], "tools/list");
    EXPECT_EQ(outcome.response["result"]["pid"], worker->pid());
    EXPECT_EQ(worker->pending_count(), 0u);
}

TEST_F(WorkerProcessTest, ConcurrentRequestsResolvedOutOfOrder) {
    auto worker = spawn("reverse", kReverseWorker);

    std::vector<jsonrpc::RpcOutcome> outcomes(3);
    std::vector<std::thread> callers;
    for (int i = 0; i < 3; ++i) {
        callers.emplace_back([&worker, &outcomes, i]() {
            outcomes[i] = worker->send_and_await(jsonrpc::make_request(i + 1, "call", nullptr), 5000);
        });
    }
    for (auto &t : callers) {
        t.join();
    }

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(outcomes[i].ok()) << outcomes[i].response.dump();
        EXPECT_EQ(outcomes[i].response["id"], i + 1);
    }
}

TEST_F(WorkerProcessTest, WorkerErrorIsReturnedAsReply) {
    auto worker = spawn("echo", kEchoWorker);

    auto outcome = worker->send_and_await(jsonrpc::make_request(7, "fail", nullptr), 3000);

    EXPECT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.response["id"], 7);
    EXPECT_EQ(outcome.response["error"]["code"], -32000);
    EXPECT_EQ(outcome.response["error"]["message"], "boom");
    EXPECT_TRUE(worker->is_alive());
}

TEST_F(WorkerProcessTest, DuplicatePendingIdIsRejected) {
    auto worker = spawn("silent", kSilentWorker);

    std::thread first([&worker]() { worker->send_and_await(jsonrpc::make_request("dup", "a", nullptr), 500); });
    for (int i = 0; i < 100 && worker->pending_count() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(worker->pending_count(), 1u);

    auto outcome = worker->send_and_await(jsonrpc::make_request("dup", "b", nullptr), 100);
    first.join();

    EXPECT_EQ(outcome.kind, jsonrpc::ErrorKind::INTERNAL);
    EXPECT_NE(jsonrpc::error_message(outcome.response).find("already pending"), std::string::npos);
}

TEST_F(WorkerProcessTest, TimeoutLeavesWorkerRunning) {
    auto worker = spawn("silent", kSilentWorker);

    const auto start = std::chrono::steady_clock::now();
    auto outcome = worker->send_and_await(jsonrpc::make_request("t1", "hang", nullptr), 50);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(outcome.kind, jsonrpc::ErrorKind::TIMEOUT);
    EXPECT_EQ(outcome.response["id"], "t1");
    EXPECT_EQ(outcome.response["error"]["code"], jsonrpc::kInternalError);
    EXPECT_EQ(outcome.response["error"]["message"], "Request timeout after 50ms");
    EXPECT_GE(elapsed, 45ms);
    EXPECT_LT(elapsed, 2s);

    EXPECT_EQ(worker->pending_count(), 0u);
    EXPECT_TRUE(worker->is_alive());
}

TEST_F(WorkerProcessTest, TimeoutBoundsWriteToWorkerNotReadingStdin) {
    auto worker = spawn("deaf", kDeafWorker);

    // Far larger than a pipe buffer
    const std::string payload(256 * 1024, 'x');
    const auto start = std::chrono::steady_clock::now();
    auto outcome = worker->send_and_await(jsonrpc::make_request(7, "tools/call", {{"blob", payload}}), 200);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(outcome.kind, jsonrpc::ErrorKind::TIMEOUT);
    EXPECT_EQ(outcome.response["id"], 7);
    EXPECT_EQ(outcome.response["error"]["message"], "Request timeout after 200ms");
    EXPECT_GE(elapsed, 150ms);
    EXPECT_LT(elapsed, 2s);
    EXPECT_EQ(worker->pending_count(), 0u);

    // Part of the line reached the pipe, so the stream is unusable
    EXPECT_TRUE(worker->terminate_requested());
    EXPECT_TRUE(worker->wait_for_exit(5000));
}

TEST_F(WorkerProcessTest, ConcurrentWriterWaitsOnlyUntilItsDeadline) {
    auto worker = spawn("deaf", kDeafWorker);

    const std::string payload(256 * 1024, 'x');
    std::thread first([&worker, &payload]() {
        worker->send_and_await(jsonrpc::make_request(1, "tools/call", {{"blob", payload}}), 1000);
    });
    std::this_thread::sleep_for(50ms);

    const auto start = std::chrono::steady_clock::now();
    auto outcome = worker->send_and_await(jsonrpc::make_request(2, "tools/list", nullptr), 100);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    first.join();

    EXPECT_EQ(outcome.kind, jsonrpc::ErrorKind::TIMEOUT);
    EXPECT_EQ(outcome.response["id"], 2);
    EXPECT_LT(elapsed, 900ms);
}

// ============================================================================
// Exit handling
// ============================================================================

TEST_F(WorkerProcessTest, UnexpectedExitFailsPendingRequest) {
    auto worker = spawn("echo", kEchoWorker);

    auto outcome = worker->send_and_await(jsonrpc::make_request("c1", "crash", nullptr), 5000);

    EXPECT_EQ(outcome.kind, jsonrpc::ErrorKind::PROCESS_EXITED);
    EXPECT_EQ(outcome.response["id"], "c1");
    EXPECT_EQ(outcome.response["error"]["code"], jsonrpc::kInternalError);
    EXPECT_EQ(outcome.response["error"]["message"], "Process exited with code 1 without responding");
    EXPECT_EQ(outcome.response["error"]["data"]["exit_code"], 1);

    ASSERT_TRUE(worker->wait_for_exit(2000));
    EXPECT_EQ(worker->exit_code().value_or(-1), 1);
    EXPECT_FALSE(worker->terminate_requested());

    auto exited = next_event<events::WorkerExitedEvent>();
    ASSERT_TRUE(exited.has_value());
    EXPECT_EQ(exited->exit_code.value_or(-1), 1);
    EXPECT_FALSE(exited->requested);
    EXPECT_EQ(exited->failed_requests, 1u);
}

TEST_F(WorkerProcessTest, RequestsAfterExitFailImmediately) {
    auto worker = spawn("quitter", kExitImmediately);
    ASSERT_TRUE(worker->wait_for_exit(3000));
    EXPECT_EQ(worker->exit_code().value_or(-1), 3);

    auto outcome = worker->send_and_await(jsonrpc::make_request(1, "tools/list", nullptr), 1000);
    EXPECT_EQ(outcome.kind, jsonrpc::ErrorKind::PROCESS_EXITED);
    EXPECT_EQ(jsonrpc::error_message(outcome.response), "Process exited with code 3 without responding");
}

TEST_F(WorkerProcessTest, ExitCallbackRunsBeforeDead) {
    auto def = stubs_.service("quitter", kExitImmediately);
    auto worker = WorkerProcess::create(def, options());

    std::atomic<bool> called{false};
    std::atomic<bool> alive_in_callback{false};
    worker->set_exit_callback([&](const WorkerProcess &w) {
        alive_in_callback = w.is_alive();
        called = true;
    });
    ASSERT_TRUE(worker->spawn());
    ASSERT_TRUE(worker->wait_for_exit(3000));

    EXPECT_TRUE(called.load());
    EXPECT_TRUE(alive_in_callback.load());
    EXPECT_EQ(worker->state(), WorkerState::DEAD);
}

// ============================================================================
// Termination
// ============================================================================

TEST_F(WorkerProcessTest, TerminateStopsWorkerAndFailsPending) {
    auto worker = spawn("silent", kSilentWorker);

    jsonrpc::RpcOutcome outcome;
    std::thread caller([&]() { outcome = worker->send_and_await(jsonrpc::make_request("p", "x", nullptr), 5000); });
    for (int i = 0; i < 100 && worker->pending_count() == 0; ++i) {
        std::this_thread::sleep_for(5ms);
    }

    worker->terminate("idle eviction");
    EXPECT_TRUE(worker->terminate_requested());
    EXPECT_TRUE(worker->wait_for_exit(3000));
    caller.join();

    EXPECT_EQ(outcome.kind, jsonrpc::ErrorKind::PROCESS_EXITED);
    const std::string message = jsonrpc::error_message(outcome.response);
    EXPECT_NE(message.find("(idle eviction)"), std::string::npos) << message;

    auto exited = next_event<events::WorkerExitedEvent>();
    ASSERT_TRUE(exited.has_value());
    EXPECT_TRUE(exited->requested);
}

TEST_F(WorkerProcessTest, TerminateBeforeSpawnIsNoOp) {
    auto worker = WorkerProcess::create(stubs_.service("echo", kEchoWorker), options());
    worker->terminate("too early");

    EXPECT_EQ(worker->pid(), -1);
    EXPECT_FALSE(worker->terminate_requested());

    ASSERT_TRUE(worker->spawn()) << worker->last_error();
    workers_.push_back(worker);
    EXPECT_GT(worker->pid(), 0);
    EXPECT_TRUE(worker->is_alive());
}

TEST_F(WorkerProcessTest, TerminateRacingSpawnNeverLeaksWorker) {
    for (int i = 0; i < 5; ++i) {
        auto worker = WorkerProcess::create(stubs_.service("echo", kEchoWorker), options());
        std::atomic<bool> stop{false};
        std::thread terminator([&worker, &stop]() {
            while (!stop) {
                worker->terminate("shutdown");
                std::this_thread::sleep_for(1ms);
            }
        });

        ASSERT_TRUE(worker->spawn()) << worker->last_error();
        // Once spawn() has published the pid, a terminate() call must take effect
        std::this_thread::sleep_for(20ms);
        stop = true;
        terminator.join();

        EXPECT_TRUE(worker->terminate_requested());
        EXPECT_TRUE(worker->wait_for_exit(5000));
    }
}

TEST_F(WorkerProcessTest, TerminateIsIdempotent) {
    auto worker = spawn("silent", kSilentWorker);

    worker->terminate("first");
    worker->terminate("second");
    ASSERT_TRUE(worker->wait_for_exit(3000));
    worker->terminate("after exit");

    EXPECT_EQ(worker->state(), WorkerState::DEAD);
}

TEST_F(WorkerProcessTest, EscalatesToSigkillWhenTermIgnored) {
    auto worker = spawn("stubborn", kStubbornWorker, options(200));

    const auto start = std::chrono::steady_clock::now();
    worker->terminate("test");
    ASSERT_TRUE(worker->wait_for_exit(5000));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(worker->term_signal().value_or(0), SIGKILL);
    EXPECT_GE(elapsed, 150ms);
}

TEST_F(WorkerProcessTest, TerminateReachesGrandchildren) {
    // The background sleep inherits stdout; the worker is only reaped once the whole group is gone
    auto worker = spawn("parent", "sleep 30 &\nwait\n", options(500));

    const auto start = std::chrono::steady_clock::now();
    worker->terminate("test");
    ASSERT_TRUE(worker->wait_for_exit(5000));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 3s);
}

// ============================================================================
// Environment and readiness
// ============================================================================

TEST_F(WorkerProcessTest, ServiceEnvOverridesDefaults) {
    auto opts = options();
    opts.default_env["STUB_VALUE"] = "default";

    auto plain = spawn("env_default", kEchoWorker, opts);
    auto outcome = plain->send_and_await(jsonrpc::make_request(1, "env", nullptr), 3000);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.response["result"]["value"], "default");

    service::ServiceDefinition def = *stubs_.service("env_override", kEchoWorker);
    def.env["STUB_VALUE"] = "override";
    auto overridden = WorkerProcess::create(std::make_shared<const service::ServiceDefinition>(def), opts);
    ASSERT_TRUE(overridden->spawn());
    workers_.push_back(overridden);

    outcome = overridden->send_and_await(jsonrpc::make_request(2, "env", nullptr), 3000);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(outcome.response["result"]["value"], "override");
}

TEST_F(WorkerProcessTest, RunsInConfiguredWorkingDirectory) {
    service::ServiceDefinition def = *stubs_.service("cwd", kEchoWorker);
    def.cwd = stubs_.dir().string();
    auto worker = WorkerProcess::create(std::make_shared<const service::ServiceDefinition>(def), options());
    ASSERT_TRUE(worker->spawn());
    workers_.push_back(worker);

    auto outcome = worker->send_and_await(jsonrpc::make_request(1, "pwd", nullptr), 3000);
    ASSERT_TRUE(outcome.ok());
    EXPECT_EQ(std::filesystem::canonical(outcome.response["result"]["cwd"].get<std::string>()),
              std::filesystem::canonical(stubs_.dir()));
}

TEST_F(WorkerProcessTest, WaitForOutputSeesFirstJsonLine) {
    auto banner = spawn("banner", kBannerWorker);
    EXPECT_TRUE(banner->wait_for_output(3000));

    // stderr output does not count
    auto quiet = spawn("echo", kEchoWorker);
    EXPECT_FALSE(quiet->wait_for_output(100));
}

TEST_F(WorkerProcessTest, MarkReadyEmitsReadyOnce) {
    auto worker = spawn("echo", kEchoWorker);

    worker->mark_ready(false);
    worker->mark_ready(true);
    EXPECT_EQ(worker->state(), WorkerState::READY);

    auto ready = next_event<events::WorkerReadyEvent>();
    ASSERT_TRUE(ready.has_value());
    EXPECT_FALSE(ready->confirmed);
    EXPECT_FALSE(next_event<events::WorkerReadyEvent>(200).has_value());
}
