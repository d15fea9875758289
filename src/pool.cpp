/*
 * designex - Exterior Design Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "designex/pool.hpp"
#include "designex/logger.hpp"

namespace designex {

Pool::Pool(int workers) noexcept : workers_(workers > 0 ? workers : 1) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(BatchProcessor processor) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }

    if (!processor) {
        LOG_ERROR("Invalid batch processor provided");
        return false;
    }

    processor_ = std::move(processor);
    shutdown_.store(false);
    running_.store(true);

    try {
        workerThreads_.reserve(workers_);
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        LOG_DEBUG("Pool started with " + std::to_string(workers_) + " worker threads");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.load()) {
        return;
    }

    LOG_DEBUG("Stopping pool...");

    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
        running_.store(false);
    }
    itemAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped = queue_.size();
        std::queue<std::string>().swap(queue_);
    }
    idle_.notify_all();

    if (dropped > 0) {
        LOG_WARN("Pool stopped with " + std::to_string(dropped) + " unprocessed item(s)");
    } else {
        LOG_DEBUG("Pool stopped");
    }
}

bool Pool::submit(const std::string& item) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (!running_.load() || shutdown_.load()) {
                LOG_DEBUG("Cannot submit to stopped pool: " + item);
                return false;
            }
            queue_.push(item);
        }
        itemAvailable_.notify_one();
        LOG_DEBUG("Item queued: " + item);
        return true;
    } catch (...) {
        LOG_ERROR("Failed to queue item: " + item);
        return false;
    }
}

void Pool::waitIdle() noexcept {
    try {
        std::unique_lock<std::mutex> lock(queueMutex_);
        idle_.wait(lock, [this] {
            return shutdown_.load() || (queue_.empty() && active_.load() == 0);
        });
    } catch (...) {
        LOG_ERROR("Failed waiting for pool to drain");
    }
}

std::size_t Pool::queueSize() const noexcept {
    try {
        std::lock_guard<std::mutex> lock(queueMutex_);
        return queue_.size();
    } catch (...) {
        return 0;
    }
}

void Pool::workerLoop(int workerId) {
    setThreadName(getThreadName(workerId));
    LOG_TRACE("Worker-" + std::to_string(workerId) + " thread started");

    while (true) {
        std::string item;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            itemAvailable_.wait(lock, [this] {
                return !queue_.empty() || shutdown_.load();
            });
            if (shutdown_.load()) {
                break;
            }
            item = std::move(queue_.front());
            queue_.pop();
            active_.fetch_add(1);
        }

        LOG_DEBUG("Worker-" + std::to_string(workerId) + " claimed: " + item);
        try {
            processor_(item, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " processing error: " +
                      std::string(e.what()) + " (item: " + item + ")");
        } catch (...) {
            LOG_ERROR("Worker " + std::to_string(workerId) + " unknown processing error (item: " + item + ")");
        }

        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            active_.fetch_sub(1);
        }
        idle_.notify_all();
    }

    LOG_TRACE("Worker " + std::to_string(workerId) + " stopped");
}

}
