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
 * @file context.hpp
 * @brief Cooperative cancellation token passed into engine operations.
 *
 * @details
 * Engine operations are synchronous and never block, so cancellation is only observed
 * at the entry checkpoint of each public provider call. A cancelled context makes the
 * call fail with `CancelledError` before any work is done.
 */

#pragma once

#include <atomic>
#include <memory>
#include <string>

namespace nexuid::core {

/**
 * @class Context
 * @brief Shareable cancellation flag.
 *
 * Copies share the same underlying flag, so a context handed to worker threads can be
 * cancelled from the thread that created it.
 */
class Context {
  public:
    Context();

    /// @brief A context that is never cancelled. Used as the default argument.
    static const Context& background();

    /// @brief Marks the context (and every copy of it) as cancelled.
    void cancel();

    bool is_cancelled() const;

    /**
     * @brief Raises `CancelledError` naming @p operation when cancelled.
     */
    void throw_if_cancelled(const std::string& operation) const;

  private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace nexuid::core
