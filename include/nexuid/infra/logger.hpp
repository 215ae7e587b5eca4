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
 * @file logger.hpp
 * @brief Thread-safe diagnostic logging facility for NexUID.
 *
 * @details
 * This header declares the `Logger` class, the centralized reporting interface for the
 * engine, the command handler and the CLI. It guarantees atomic output to standard
 * streams (`stdout`/`stderr`) across concurrent threads and filters entries below a
 * process-wide minimum severity.
 */

#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace nexuid::infra {

/**
 * @enum LogLevel
 * @brief Defines the severity hierarchy for diagnostic messages.
 */
enum class LogLevel {
    TRACE, ///< Granular execution flow details (cache lookups, provider reuse).
    DEBUG, ///< Lifecycle events (provider instantiation, cache eviction).
    INFO,  ///< Nominal operational events (startup, configuration summary).
    WARN,  ///< Non-blocking anomalies or potential misconfigurations.
    ERROR, ///< Failed requests that do not halt the process.
    FATAL  ///< Critical failures requiring process termination.
};

/**
 * @class Logger
 * @brief A static utility class providing process-wide logging capabilities.
 *
 * @details
 * The Logger serializes console access through an internal mutex so that entries from
 * worker threads remain distinct. Messages below the configured minimum level are
 * dropped before the lock is taken.
 */
class Logger {
  public:
    /**
     * @brief Writes a formatted diagnostic message to the console.
     *
     * The output includes a timestamp, the severity tag, and the payload.
     *
     * **Stream Routing Logic:**
     * - `TRACE`, `DEBUG`, `INFO`: Routed to `std::cout`.
     * - `WARN`, `ERROR`, `FATAL`: Routed to `std::cerr`.
     *
     * @param level The severity classification of the message.
     * @param message The content payload to be logged.
     *
     * @code
     * nexuid::infra::Logger::log(LogLevel::DEBUG, "Factory: created provider 'ulid'");
     * @endcode
     */
    static void log(LogLevel level, const std::string& message);

    /// @brief Sets the minimum severity that reaches the console. Default: `INFO`.
    static void set_level(LogLevel level);

    static LogLevel level();

    /// @brief True when a message of @p level would be written.
    static bool enabled(LogLevel level);

    /**
     * @brief Resolves a level name (`"trace"`, `"debug"`, `"info"`, `"warn"`, `"error"`,
     * `"fatal"`, case-insensitive) to its enumerator.
     */
    static std::optional<LogLevel> parse_level(std::string_view name);

  private:
    /// @brief Guards access to `std::cout` and `std::cerr`.
    static std::mutex mutex_;

    /// @brief Minimum severity written to the console.
    static std::atomic<LogLevel> threshold_;
};

} // namespace nexuid::infra
