/**
 * @file idle_reaper_test.cpp
 * @brief Unit tests for IdleReaper.
 *
 * Tests:
 * - start()/stop() lifecycle, double start rejected, stop interrupts the wait
 * - sweep_once() with nothing to evict
 * - Background sweeps evict an idle worker, the next request respawns it
 */

#include "worker/idle_reaper.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

#include "events/event_emitter.hpp"
#include "support/stub_workers.hpp"

using namespace mcprouter;
using namespace mcprouter::worker;
using namespace mcprouter::tests;
using json = nlohmann::json;
using namespace std::chrono_literals;

class IdleReaperTest : public ::testing::Test {
protected:
    void SetUp() override {
        emitter_ = std::make_shared<events::EventEmitter>(1024);

        PersistentOptions options;
        options.request_timeout_ms = 3000;
        options.worker.event_emitter = emitter_;
        options.worker.shutdown_timeout_ms = 500;
        supervisor_ = std::make_unique<PersistentSupervisor>(options);
    }

    void TearDown() override { supervisor_->shutdown(); }

    StubWorkers stubs_{"mcprouter_reaper_test"};
    std::shared_ptr<events::EventEmitter> emitter_;
    std::unique_ptr<PersistentSupervisor> supervisor_;
};

TEST_F(IdleReaperTest, StartStopLifecycle) {
    IdleReaper reaper(*supervisor_, 60000, 30000);
    EXPECT_FALSE(reaper.is_running());

    EXPECT_TRUE(reaper.start());
    EXPECT_TRUE(reaper.is_running());
    EXPECT_FALSE(reaper.start());

    // A 30s sweep interval must not delay stop()
    const auto start = std::chrono::steady_clock::now();
    reaper.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 1s);
    EXPECT_FALSE(reaper.is_running());

    // Safe to repeat
    reaper.stop();
}

TEST_F(IdleReaperTest, SweepWithNothingToEvict) {
    IdleReaper reaper(*supervisor_, 100, 50);

    EXPECT_EQ(reaper.sweep_once(), 0u);
    EXPECT_EQ(reaper.sweep_count(), 1u);
    EXPECT_EQ(reaper.evicted_total(), 0u);
}

TEST_F(IdleReaperTest, KeepsRecentlyUsedWorker) {
    auto service = stubs_.service("echo", kEchoWorker);
    ASSERT_TRUE(supervisor_->dispatch(service, jsonrpc::make_request(1, "tools/list", nullptr)).ok());

    IdleReaper reaper(*supervisor_, 60000, 50);
    EXPECT_EQ(reaper.sweep_once(), 0u);
    EXPECT_EQ(supervisor_->worker_count(), 1u);
}

TEST_F(IdleReaperTest, BackgroundSweepEvictsIdleWorker) {
    auto service = stubs_.service("echo", kEchoWorker);
    events::EventCursor cursor(*emitter_, events::EventFilter::for_service("echo"));

    auto first = supervisor_->dispatch(service, jsonrpc::make_request(1, "tools/list", nullptr));
    ASSERT_TRUE(first.ok()) << first.response.dump();

    IdleReaper reaper(*supervisor_, 100, 50);
    ASSERT_TRUE(reaper.start());

    bool evicted = false;
    for (int i = 0; i < 100 && !evicted; ++i) {
        std::this_thread::sleep_for(20ms);
        evicted = supervisor_->worker_count() == 0;
    }
    reaper.stop();

    ASSERT_TRUE(evicted);
    EXPECT_GE(reaper.evicted_total(), 1u);
    EXPECT_GE(reaper.sweep_count(), 1u);

    bool saw_evicted_event = false;
    while (auto evt = cursor.next()) {
        saw_evicted_event = saw_evicted_event || std::holds_alternative<events::WorkerEvictedEvent>(*evt);
    }
    EXPECT_TRUE(saw_evicted_event);

    // Next use spawns a replacement
    auto second = supervisor_->dispatch(service, jsonrpc::make_request(2, "tools/list", nullptr));
    ASSERT_TRUE(second.ok()) << second.response.dump();
    EXPECT_NE(second.response["result"]["pid"], first.response["result"]["pid"]);
}
