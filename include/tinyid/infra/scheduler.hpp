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
 * @file scheduler.hpp
 * @brief Fixed-size worker pool for parallel generation runs.
 *
 * @details
 * The tool uses this pool to run independent collision trials concurrently.
 * Each worker draws identifiers from its own thread-local random source, so
 * tasks never share generator state.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace tinyid::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool executing tasks in FIFO order.
 *
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 * - **Barrier:** `wait_idle()` blocks until the queue is drained and no task is running.
 */
class Scheduler {
  public:
    /**
     * @brief Spawns the worker threads.
     *
     * @param threads Number of workers. A value of 0 (e.g., when
     * `hardware_concurrency()` cannot be detected) falls back to a single worker.
     * @throws std::system_error if a worker cannot be started. Workers already
     * running are joined before the exception leaves the constructor.
     */
    explicit Scheduler(size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Drains pending tasks and joins every worker.
     *
     * @note This is a **blocking** operation.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /// Submits a task for asynchronous execution.
    void enqueue(std::function<void()> task);

    /// Blocks until every enqueued task has finished.
    void wait_idle();

    size_t worker_count() const
    {
        return workers_.size();
    }

  private:
    void worker_loop();

    /// Stops the pool and joins every started worker.
    void shutdown();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    /// Protects `tasks_`, `active_` and `stop_`.
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::condition_variable idle_;

    /// Tasks currently executing outside the lock.
    size_t active_ = 0;
    bool stop_ = false;
};

} // namespace tinyid::infra
