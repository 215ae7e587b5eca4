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
 * @file scheduler.cpp
 * @brief Implementation of the worker pool.
 *
 * @details
 * Manages the lifecycle of a fixed worker thread cohort with the producer-consumer
 * pattern, plus idle tracking so callers can wait for a batch to finish.
 */

#include "nexuid/infra/scheduler.hpp"

#include "nexuid/infra/logger.hpp"

#include <exception>

namespace nexuid::infra {

Scheduler::Scheduler(std::size_t threads) : stop_(false)
{
    if (threads == 0) {
        threads = 2;
    }
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

/**
 * @brief Worker thread event loop.
 *
 * Sleeps until a task is queued or shutdown begins. On shutdown the loop exits only
 * once the queue is drained, so every accepted task runs.
 */
void Scheduler::worker_loop()
{
    while (true) {
        std::function<void()> task;

        // --- Critical Section: Task Acquisition ---
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
            try {
                task();
            } catch (const std::exception& e) {
                Logger::log(LogLevel::ERROR, std::string("Scheduler: task failed: ") + e.what());
            }
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            --active_;
            if (active_ == 0 && tasks_.empty()) {
                idle_condition_.notify_all();
            }
        }
    }
}

Scheduler::~Scheduler()
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

void Scheduler::enqueue(std::function<void()> task)
{
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        tasks_.emplace(std::move(task));
    }

    // notify_one() avoids waking the whole cohort for a single task.
    condition_.notify_one();
}

void Scheduler::wait_idle()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_condition_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
}

} // namespace nexuid::infra
