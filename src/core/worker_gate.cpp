#include "worker_gate.h"

namespace tessera::core {

WorkerGate::WorkerGate(int capacity) : capacity_(std::max(1, capacity)) {}

bool WorkerGate::acquire(const std::atomic<bool>& cancelled) {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return closed_ || cancelled.load() || in_use_ < capacity_; });
    if (closed_ || cancelled.load()) {
        return false;
    }
    ++in_use_;
    return true;
}

void WorkerGate::release() {
    {
        std::scoped_lock lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    cv_.notify_all();
}

void WorkerGate::set_capacity(int capacity) {
    {
        std::scoped_lock lock(mutex_);
        capacity_ = std::max(1, capacity);
    }
    cv_.notify_all();
}

int WorkerGate::capacity() const {
    std::scoped_lock lock(mutex_);
    return capacity_;
}

void WorkerGate::wake_all() {
    // Taking the lock orders the caller's flag store before the waiters' predicate check.
    { std::scoped_lock lock(mutex_); }
    cv_.notify_all();
}

void WorkerGate::close() {
    {
        std::scoped_lock lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

} // namespace tessera::core
