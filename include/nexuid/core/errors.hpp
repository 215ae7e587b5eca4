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
 * @file errors.hpp
 * @brief Exception taxonomy raised by the identifier engine.
 *
 * @details
 * Every failure leaves the engine as a typed exception derived from `nexuid::core::Error`
 * (itself a `std::runtime_error`), so callers can either catch the precise kind or the
 * common base. Nothing in the engine retries, logs, or swallows these errors; they travel
 * to the immediate caller unchanged.
 *
 * | Kind            | Raised when                                                    |
 * |-----------------|----------------------------------------------------------------|
 * | ValidationError | well-formed input with an out-of-range or malformed field      |
 * | ParseError      | input cannot be decoded in any accepted encoding               |
 * | NoTimestampError| a timestamp is requested from a family that carries none       |
 * | ConversionError | a type/encoding transformation is not served                   |
 * | MarshalError    | serialization of a value fails                                 |
 * | UnmarshalError  | deserialization of text, binary or JSON fails                  |
 * | CancelledError  | the caller's `Context` was cancelled before the operation ran  |
 * | EntropyError    | the random source could not deliver bytes                      |
 */

#pragma once

#include "nexuid/core/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace nexuid::core {

/**
 * @class Error
 * @brief Common base of all engine exceptions.
 */
class Error : public std::runtime_error {
  public:
    Error(std::string kind, const std::string& message);

    /// @brief Short machine-readable kind, e.g. `"validation"` or `"parse"`.
    const std::string& kind() const noexcept { return kind_; }

  private:
    std::string kind_;
};

/**
 * @class ValidationError
 * @brief Structurally recognizable input with an invalid field.
 *
 * Carries the offending field, the observed value, and a human-readable reason.
 */
class ValidationError : public Error {
  public:
    ValidationError(std::string field, std::string value, std::string reason,
                    std::optional<IdType> type = std::nullopt);

    const std::string& field() const noexcept { return field_; }
    const std::string& value() const noexcept { return value_; }
    const std::string& reason() const noexcept { return reason_; }
    std::optional<IdType> type() const noexcept { return type_; }

  private:
    std::string field_;
    std::string value_;
    std::string reason_;
    std::optional<IdType> type_;
};

/**
 * @class ParseError
 * @brief Input could not be decoded into any recognized format.
 *
 * `cause()` holds the message of the underlying failure (for example the hex decoder's
 * ValidationError) and is empty when there is none.
 */
class ParseError : public Error {
  public:
    ParseError(std::string input, std::optional<IdType> type, std::string reason,
               std::string cause = "");

    const std::string& input() const noexcept { return input_; }
    std::optional<IdType> type() const noexcept { return type_; }
    const std::string& reason() const noexcept { return reason_; }
    const std::string& cause() const noexcept { return cause_; }

  protected:
    ParseError(std::string kind, std::string input, std::optional<IdType> type,
               std::string reason, std::string cause);

  private:
    std::string input_;
    std::optional<IdType> type_;
    std::string reason_;
    std::string cause_;
};

/**
 * @class NoTimestampError
 * @brief The identifier's family does not embed a timestamp (UUID v4 and friends).
 */
class NoTimestampError : public ParseError {
  public:
    NoTimestampError(std::string input, std::optional<IdType> type, std::string reason);
};

/**
 * @class ConversionError
 * @brief A transformation between two types is not served by the component asked.
 *
 * Projections (canonical, hex, bytes) have no target type, so `target()` is empty for them.
 */
class ConversionError : public Error {
  public:
    ConversionError(IdType source, std::optional<IdType> target, std::string reason);

    IdType source() const noexcept { return source_; }
    std::optional<IdType> target() const noexcept { return target_; }
    const std::string& reason() const noexcept { return reason_; }

  private:
    IdType source_;
    std::optional<IdType> target_;
    std::string reason_;
};

/**
 * @class MarshalError
 * @brief Serialization of a value failed.
 */
class MarshalError : public Error {
  public:
    MarshalError(std::optional<IdType> type, std::string reason, std::string cause = "");

    std::optional<IdType> type() const noexcept { return type_; }
    const std::string& reason() const noexcept { return reason_; }
    const std::string& cause() const noexcept { return cause_; }

  private:
    std::optional<IdType> type_;
    std::string reason_;
    std::string cause_;
};

/**
 * @class UnmarshalError
 * @brief Deserialization from text, binary or JSON failed.
 */
class UnmarshalError : public Error {
  public:
    UnmarshalError(std::optional<IdType> type, std::string reason, std::string cause = "");

    std::optional<IdType> type() const noexcept { return type_; }
    const std::string& reason() const noexcept { return reason_; }
    const std::string& cause() const noexcept { return cause_; }

  private:
    std::optional<IdType> type_;
    std::string reason_;
    std::string cause_;
};

/**
 * @class CancelledError
 * @brief The operation observed a cancelled `Context` at its entry checkpoint.
 */
class CancelledError : public Error {
  public:
    explicit CancelledError(const std::string& operation);
};

/**
 * @class EntropyError
 * @brief The configured random source failed to produce bytes.
 */
class EntropyError : public Error {
  public:
    explicit EntropyError(const std::string& reason);
};

} // namespace nexuid::core
