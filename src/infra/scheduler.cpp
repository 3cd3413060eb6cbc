/*
 * TINYID COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 The TinyId Authors.
 *
 * This source code is licensed under the TinyId Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file scheduler.cpp
 * @brief Implementation of the worker pool.
 */

#include "tinyid/infra/scheduler.hpp"

#include "tinyid/infra/logger.hpp"

#include <algorithm>
#include <exception>
#include <string>

namespace tinyid::infra {

Scheduler::Scheduler(size_t threads)
{
    threads = std::max<size_t>(threads, 1);
    try {
        for (size_t i = 0; i < threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    } catch (const std::exception& e) {
        // Destroying a joinable std::thread terminates; release the started ones first.
        Logger::log(LogLevel::ERROR, "Scheduler: could only start " +
                                         std::to_string(workers_.size()) + " of " +
                                         std::to_string(threads) + " workers: " + e.what());
        shutdown();
        throw;
    }
}

Scheduler::~Scheduler()
{
    shutdown();
}

void Scheduler::shutdown()
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }

    condition_.notify_all();

    for (std::thread& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

/**
 * @brief Worker event loop.
 *
 * A worker exits only once the pool is stopping AND the queue is empty, so
 * every accepted task runs before the destructor returns.
 */
void Scheduler::worker_loop()
{
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        // Execution happens outside the lock so other workers can dequeue.
        if (task) {
            task();
        }

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            --active_;
            if (active_ == 0 && tasks_.empty()) {
                idle_.notify_all();
            }
        }
    }
}

void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }

    condition_.notify_one();
}

void Scheduler::wait_idle()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_.wait(lock, [this] { return active_ == 0 && tasks_.empty(); });
}

} // namespace tinyid::infra
