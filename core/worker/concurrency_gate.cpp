#include "concurrency_gate.hpp"

namespace mcprouter {
namespace worker {

void ConcurrencyGate::Permit::release() {
    if (gate_ != nullptr) {
        gate_->release_slot();
        gate_ = nullptr;
    }
}

ConcurrencyGate::ConcurrencyGate(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

ConcurrencyGate::Permit ConcurrencyGate::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (closed_) {
        return Permit();
    }

    const uint64_t ticket = next_ticket_++;
    cv_.wait(lock, [&] { return closed_ || (ticket == serving_ticket_ && active_ < capacity_); });

    // The ticket is consumed either way so later tickets can advance
    ++serving_ticket_;
    if (closed_) {
        cv_.notify_all();
        return Permit();
    }

    ++active_;
    // The next ticket may also fit if capacity remains
    cv_.notify_all();
    return Permit(this);
}

void ConcurrencyGate::release_slot() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --active_;
    }
    cv_.notify_all();
}

void ConcurrencyGate::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ConcurrencyGate::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void ConcurrencyGate::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return active_ == 0; });
}

size_t ConcurrencyGate::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

size_t ConcurrencyGate::waiting() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(next_ticket_ - serving_ticket_);
}

}  // namespace worker
}  // namespace mcprouter
