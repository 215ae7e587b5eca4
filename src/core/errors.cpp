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
 * @file errors.cpp
 * @brief Message formatting for the engine exception hierarchy.
 */

#include "nexuid/core/errors.hpp"

#include <utility>

namespace nexuid::core {

namespace {

std::string type_label(const std::optional<IdType>& type)
{
    return type ? to_string(*type) : std::string("unknown");
}

std::string with_cause(std::string message, const std::string& cause)
{
    if (!cause.empty()) {
        message += " (caused by: " + cause + ")";
    }
    return message;
}

} // namespace

Error::Error(std::string kind, const std::string& message)
    : std::runtime_error(message), kind_(std::move(kind))
{
}

ValidationError::ValidationError(std::string field, std::string value, std::string reason,
                                 std::optional<IdType> type)
    : Error("validation", "validation failed for " + type_label(type) + " (" + field +
                              "): " + value + " - " + reason),
      field_(std::move(field)), value_(std::move(value)), reason_(std::move(reason)),
      type_(type)
{
}

ParseError::ParseError(std::string input, std::optional<IdType> type, std::string reason,
                       std::string cause)
    : ParseError("parse", std::move(input), type, std::move(reason), std::move(cause))
{
}

ParseError::ParseError(std::string kind, std::string input, std::optional<IdType> type,
                       std::string reason, std::string cause)
    : Error(std::move(kind),
            with_cause("parse failed for " + type_label(type) + ": " + input + " - " + reason,
                       cause)),
      input_(std::move(input)), type_(type), reason_(std::move(reason)), cause_(std::move(cause))
{
}

NoTimestampError::NoTimestampError(std::string input, std::optional<IdType> type,
                                   std::string reason)
    : ParseError("no_timestamp", std::move(input), type, std::move(reason), "")
{
}

ConversionError::ConversionError(IdType source, std::optional<IdType> target, std::string reason)
    : Error("conversion", (target ? "conversion failed from " + to_string(source) + " to " +
                                        to_string(*target)
                                  : "conversion failed for " + to_string(source)) +
                              ": " + reason),
      source_(source), target_(target), reason_(std::move(reason))
{
}

MarshalError::MarshalError(std::optional<IdType> type, std::string reason, std::string cause)
    : Error("marshal",
            with_cause("marshal failed for " + type_label(type) + ": " + reason, cause)),
      type_(type), reason_(std::move(reason)), cause_(std::move(cause))
{
}

UnmarshalError::UnmarshalError(std::optional<IdType> type, std::string reason, std::string cause)
    : Error("unmarshal",
            with_cause("unmarshal failed for " + type_label(type) + ": " + reason, cause)),
      type_(type), reason_(std::move(reason)), cause_(std::move(cause))
{
}

CancelledError::CancelledError(const std::string& operation)
    : Error("cancelled", "operation cancelled: " + operation)
{
}

EntropyError::EntropyError(const std::string& reason)
    : Error("entropy", "entropy source failure: " + reason)
{
}

} // namespace nexuid::core
