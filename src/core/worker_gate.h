#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>
#include <vector>

namespace tessera::core {

// Counting admission gate for level tasks. Capacity follows the memory budget's parallelism.
class WorkerGate {
public:
    explicit WorkerGate(int capacity);

    // Blocks until a slot is free. Returns false if `cancelled` became true or the gate closed.
    bool acquire(const std::atomic<bool>& cancelled);
    void release();

    void set_capacity(int capacity);
    int capacity() const;
    // Wakes waiters so they can re-check their cancel flag.
    void wake_all();
    void close();

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    int capacity_;
    int in_use_ = 0;
    bool closed_ = false;
};

class WorkerSlot {
public:
    WorkerSlot(WorkerGate& gate, const std::atomic<bool>& cancelled)
        : gate_(gate), acquired_(gate.acquire(cancelled)) {}
    ~WorkerSlot() {
        if (acquired_) {
            gate_.release();
        }
    }
    WorkerSlot(const WorkerSlot&) = delete;
    WorkerSlot& operator=(const WorkerSlot&) = delete;

    bool acquired() const { return acquired_; }

private:
    WorkerGate& gate_;
    bool acquired_;
};

// Runs fn(index) for every index in [0, count) on at most worker_count threads
// that pull indices from a shared counter.
template <typename Fn>
void run_parallel(size_t count, unsigned int worker_count, Fn&& fn) {
    if (count == 0) {
        return;
    }
    worker_count = std::max(1u, std::min<unsigned int>(worker_count, static_cast<unsigned int>(count)));
    if (worker_count == 1) {
        for (size_t i = 0; i < count; ++i) {
            fn(i);
        }
        return;
    }
    std::atomic<size_t> next_index{0};
    std::vector<std::thread> workers;
    workers.reserve(worker_count);
    for (unsigned int i = 0; i < worker_count; ++i) {
        workers.emplace_back([&]() {
            while (true) {
                const size_t idx = next_index.fetch_add(1, std::memory_order_relaxed);
                if (idx >= count) {
                    break;
                }
                fn(idx);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
}

} // namespace tessera::core
