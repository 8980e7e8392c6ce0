/**
 * concurrency_gate_test.cpp - ConcurrencyGate unit tests
 *
 * Tests:
 * 1. Permits up to capacity are granted immediately
 * 2. Waiters are admitted in FIFO order
 * 3. close() rejects waiting and future callers, held permits stay valid
 * 4. wait_idle() returns once every permit is released
 * 5. Active count never exceeds capacity under contention
 */

#include "worker/concurrency_gate.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using namespace mcprouter::worker;
using namespace std::chrono_literals;

namespace {

// Spin until `predicate` holds or 2s pass
template <typename Pred>
bool eventually(Pred predicate) {
    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(2ms);
    }
    return predicate();
}

}  // namespace

TEST(ConcurrencyGateTest, GrantsPermitsUpToCapacity) {
    ConcurrencyGate gate(2);
    EXPECT_EQ(gate.capacity(), 2u);

    auto a = gate.acquire();
    auto b = gate.acquire();
    EXPECT_TRUE(a.valid());
    EXPECT_TRUE(b.valid());
    EXPECT_EQ(gate.active(), 2u);
    EXPECT_EQ(gate.waiting(), 0u);

    a.release();
    EXPECT_FALSE(a.valid());
    EXPECT_EQ(gate.active(), 1u);
}

TEST(ConcurrencyGateTest, ZeroCapacityIsTreatedAsOne) {
    ConcurrencyGate gate(0);
    EXPECT_EQ(gate.capacity(), 1u);
}

TEST(ConcurrencyGateTest, PermitReleasesOnDestruction) {
    ConcurrencyGate gate(1);
    {
        auto permit = gate.acquire();
        EXPECT_EQ(gate.active(), 1u);
    }
    EXPECT_EQ(gate.active(), 0u);
}

TEST(ConcurrencyGateTest, MovedPermitReleasesOnce) {
    ConcurrencyGate gate(1);
    auto first = gate.acquire();
    ConcurrencyGate::Permit second = std::move(first);

    EXPECT_FALSE(first.valid());
    EXPECT_TRUE(second.valid());
    EXPECT_EQ(gate.active(), 1u);

    second.release();
    first.release();
    EXPECT_EQ(gate.active(), 0u);
}

TEST(ConcurrencyGateTest, AdmitsWaitersInArrivalOrder) {
    ConcurrencyGate gate(1);
    auto holder = gate.acquire();

    std::mutex order_mutex;
    std::vector<int> order;
    std::vector<std::thread> threads;

    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([&gate, &order_mutex, &order, i]() {
            auto permit = gate.acquire();
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(i);
        });
        // Each thread is queued before the next starts
        EXPECT_TRUE(eventually([&gate, i]() { return gate.waiting() == static_cast<size_t>(i + 1); }));
    }

    holder.release();
    for (auto &t : threads) {
        t.join();
    }

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
    EXPECT_EQ(gate.active(), 0u);
    EXPECT_EQ(gate.waiting(), 0u);
}

TEST(ConcurrencyGateTest, CloseRejectsWaitersAndLaterCallers) {
    ConcurrencyGate gate(1);
    auto holder = gate.acquire();

    std::atomic<bool> waiter_valid{true};
    std::thread waiter([&gate, &waiter_valid]() { waiter_valid = gate.acquire().valid(); });
    EXPECT_TRUE(eventually([&gate]() { return gate.waiting() == 1u; }));

    gate.close();
    waiter.join();

    EXPECT_TRUE(gate.is_closed());
    EXPECT_FALSE(waiter_valid.load());
    EXPECT_FALSE(gate.acquire().valid());

    // The held permit is unaffected
    EXPECT_TRUE(holder.valid());
    EXPECT_EQ(gate.active(), 1u);
}

TEST(ConcurrencyGateTest, WaitIdleReturnsAfterLastRelease) {
    ConcurrencyGate gate(3);
    auto a = gate.acquire();
    auto b = gate.acquire();

    std::atomic<bool> idle{false};
    std::thread waiter([&gate, &idle]() {
        gate.wait_idle();
        idle = true;
    });

    a.release();
    std::this_thread::sleep_for(20ms);
    EXPECT_FALSE(idle.load());

    b.release();
    waiter.join();
    EXPECT_TRUE(idle.load());
}

TEST(ConcurrencyGateTest, ActiveNeverExceedsCapacity) {
    constexpr size_t kCapacity = 3;
    ConcurrencyGate gate(kCapacity);

    std::atomic<int> current{0};
    std::atomic<int> peak{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < 16; ++i) {
        threads.emplace_back([&]() {
            auto permit = gate.acquire();
            const int now = ++current;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(5ms);
            --current;
        });
    }
    for (auto &t : threads) {
        t.join();
    }

    EXPECT_LE(peak.load(), static_cast<int>(kCapacity));
    EXPECT_GE(peak.load(), 1);
    EXPECT_EQ(gate.active(), 0u);
}
