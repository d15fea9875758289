/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace designex {

// Called on a worker thread for each submitted item
using BatchProcessor = std::function<void(const std::string& item, int workerId)>;

// Fixed set of worker threads draining a FIFO. At most workerCount() items are
// in flight at once, which bounds concurrent worker processes in batch mode.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(BatchProcessor processor);
    void stop() noexcept;
    [[nodiscard]] bool submit(const std::string& item) noexcept;
    // Blocks until the queue is empty and no item is being processed
    void waitIdle() noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int workerCount() const noexcept { return workers_; }
    [[nodiscard]] int activeCount() const noexcept { return active_.load(); }

private:
    void workerLoop(int workerId);

    int workers_;
    BatchProcessor processor_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<int> active_{0};

    mutable std::mutex queueMutex_;
    std::condition_variable itemAvailable_;
    std::condition_variable idle_;
    std::queue<std::string> queue_;

    std::vector<std::thread> workerThreads_;
};

}
