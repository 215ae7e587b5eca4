/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file scheduler.hpp
 * @brief Thread pool used for bulk identifier generation.
 *
 * @details
 * This header defines the `Scheduler` class, a fixed-size Producer-Consumer worker pool.
 * The CLI uses it to fan bulk generation requests out over several threads that share a
 * single provider instance, which is also how the concurrency guarantees of the ULID
 * monotonic state are exercised in tests.
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <vector>

namespace nexuid::infra {

/**
 * @class Scheduler
 * @brief A thread-safe worker pool for executing tasks asynchronously.
 *
 * **Concurrency Model:**
 * - **Producers:** Any thread can `enqueue()` or `submit()` a task.
 * - **Consumers:** Worker threads sleep on a condition variable until work is available.
 */
class Scheduler {
  public:
    /**
     * @brief Initializes the pool and spawns worker threads.
     *
     * @param threads The number of worker threads to spawn. Defaults to
     * `std::thread::hardware_concurrency()`; a value of 0 falls back to 2 workers.
     */
    explicit Scheduler(std::size_t threads = std::thread::hardware_concurrency());

    /**
     * @brief Stops accepting work, drains the queue, and joins every worker.
     *
     * @note This is a **blocking** operation.
     */
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    /**
     * @brief Submits a fire-and-forget task.
     *
     * Exceptions escaping @p task are contained by the worker loop; use `submit()` when
     * the caller needs to observe the outcome.
     */
    void enqueue(std::function<void()> task);

    /**
     * @brief Submits a task and returns a future for its result.
     *
     * An exception thrown by @p func is stored in the future and rethrown by `get()`.
     *
     * @code
     * auto fut = scheduler.submit([&] { return manager.generate(IdType::ULID); });
     * nexuid::core::Identifier id = fut.get();
     * @endcode
     */
    template <typename F> auto submit(F func) -> std::future<std::invoke_result_t<F>>
    {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(func));
        std::future<R> result = task->get_future();
        enqueue([task]() { (*task)(); });
        return result;
    }

    /**
     * @brief Blocks until the queue is empty and no worker is executing a task.
     */
    void wait_idle();

    /// @brief Number of worker threads owned by the pool.
    std::size_t size() const { return workers_.size(); }

  private:
    void worker_loop();

    /// @brief The container of active worker threads managed by this pool.
    std::vector<std::thread> workers_;

    /// @brief A FIFO queue storing pending tasks waiting for a worker.
    std::queue<std::function<void()>> tasks_;

    /// @brief Protects `tasks_` and `active_`.
    std::mutex queue_mutex_;

    /// @brief Wakes workers when tasks arrive or shutdown begins.
    std::condition_variable condition_;

    /// @brief Wakes `wait_idle()` callers when the pool drains.
    std::condition_variable idle_condition_;

    /// @brief Number of tasks currently executing.
    std::size_t active_ = 0;

    /// @brief Atomic flag controlling the lifecycle of the event loops.
    std::atomic<bool> stop_;
};

} // namespace nexuid::infra
