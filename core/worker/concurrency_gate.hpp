#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace mcprouter {
namespace worker {

/**
 * @brief Counting gate bounding simultaneously running transient workers
 *
 * Admission is FIFO: callers are served in the order they called acquire().
 * Once close() has been called every waiting and future acquire() is
 * rejected; permits already held stay valid until released.
 */
class ConcurrencyGate {
public:
    // Move-only admission token; releases its slot on destruction
    class Permit {
    public:
        Permit() = default;
        ~Permit() { release(); }

        Permit(const Permit &) = delete;
        Permit &operator=(const Permit &) = delete;

        Permit(Permit &&other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Permit &operator=(Permit &&other) noexcept {
            if (this != &other) {
                release();
                gate_ = other.gate_;
                other.gate_ = nullptr;
            }
            return *this;
        }

        // False when admission was rejected (gate closed)
        bool valid() const { return gate_ != nullptr; }
        explicit operator bool() const { return valid(); }

        void release();

    private:
        friend class ConcurrencyGate;
        explicit Permit(ConcurrencyGate *gate) : gate_(gate) {}

        ConcurrencyGate *gate_ = nullptr;
    };

    explicit ConcurrencyGate(size_t capacity);

    ConcurrencyGate(const ConcurrencyGate &) = delete;
    ConcurrencyGate &operator=(const ConcurrencyGate &) = delete;

    // Block until a slot is free and it is this caller's turn.
    // Returns an invalid Permit if the gate is (or becomes) closed.
    Permit acquire();

    // Reject waiters and future acquires
    void close();
    bool is_closed() const;

    // Block until no permit is held
    void wait_idle();

    size_t active() const;
    size_t waiting() const;
    size_t capacity() const { return capacity_; }

private:
    void release_slot();

    const size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t active_ = 0;
    uint64_t next_ticket_ = 0;    // handed to the next caller of acquire()
    uint64_t serving_ticket_ = 0; // oldest ticket still waiting
    bool closed_ = false;
};

}  // namespace worker
}  // namespace mcprouter
