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
 * @file capabilities.hpp
 * @brief Capability interfaces implemented by identifier providers.
 *
 * @details
 * A provider's surface is split into five small interfaces, so a consumer can depend on
 * exactly what it uses:
 *
 * | Interface     | Responsibility                                              |
 * |---------------|-------------------------------------------------------------|
 * | `Generator`   | Produce fresh identifiers, optionally at a given time.      |
 * | `Parser`      | Decode and validate text and bytes, extract timestamps.     |
 * | `Converter`   | Project between encodings and relabel between types.        |
 * | `Marshaler`   | Serialize to text, binary and JSON.                         |
 * | `Unmarshaler` | Deserialize from text, binary and JSON.                     |
 *
 * `Provider` aggregates all five plus descriptive metadata.
 *
 * Every operation accepts a `core::Context` and fails with `core::CancelledError` before
 * doing any work when that context has been cancelled.
 */

#pragma once

#include "nexuid/core/context.hpp"
#include "nexuid/core/identifier.hpp"

#include <map>
#include <string>
#include <vector>

namespace nexuid::provider {

class Generator {
  public:
    virtual ~Generator() = default;

    /// @brief Generates an identifier stamped with the current time, where applicable.
    virtual core::Identifier generate(const core::Context& ctx = core::Context::background()) = 0;

    /**
     * @brief Generates an identifier embedding @p ts.
     *
     * @throws core::ValidationError when @p ts is outside the type's representable range.
     */
    virtual core::Identifier generate_at(core::Timestamp ts,
                                         const core::Context& ctx = core::Context::background()) = 0;
};

class Parser {
  public:
    virtual ~Parser() = default;

    /// @throws core::ParseError when @p input matches neither the native format nor hex.
    virtual core::Identifier parse(const std::string& input,
                                   const core::Context& ctx = core::Context::background()) const = 0;

    /// @throws core::ParseError unless @p bytes holds exactly 16 bytes.
    virtual core::Identifier parse_bytes(const core::ByteBuffer& bytes,
                                         const core::Context& ctx = core::Context::background()) const = 0;

    /// @throws core::ValidationError describing the first format violation.
    virtual void validate(const std::string& input,
                          const core::Context& ctx = core::Context::background()) const = 0;

    /// @throws core::ValidationError describing the first violation.
    virtual void validate_bytes(const core::ByteBuffer& bytes,
                                const core::Context& ctx = core::Context::background()) const = 0;

    /// @throws core::NoTimestampError when the parsed value has no timestamp.
    virtual core::Timestamp extract_timestamp(const std::string& input,
                                              const core::Context& ctx = core::Context::background()) const = 0;
};

class Converter {
  public:
    virtual ~Converter() = default;

    virtual std::string to_canonical(const core::Identifier& value,
                                     const core::Context& ctx = core::Context::background()) const = 0;

    virtual std::string to_hex(const core::Identifier& value,
                               const core::Context& ctx = core::Context::background()) const = 0;

    virtual core::ByteBuffer to_bytes(const core::Identifier& value,
                                      const core::Context& ctx = core::Context::background()) const = 0;

    /// @brief Relabels @p value as @p target. See convert::Converter for the exact semantics.
    virtual core::Identifier convert_type(const core::Identifier& value, core::IdType target,
                                          const core::Context& ctx = core::Context::background()) const = 0;

    virtual std::map<core::IdType, std::vector<core::IdType>> supported_conversions() const = 0;
};

class Marshaler {
  public:
    virtual ~Marshaler() = default;

    virtual core::ByteBuffer marshal_text(const core::Identifier& value,
                                          const core::Context& ctx = core::Context::background()) const = 0;

    virtual core::ByteBuffer marshal_binary(const core::Identifier& value,
                                            const core::Context& ctx = core::Context::background()) const = 0;

    virtual std::string marshal_json(const core::Identifier& value,
                                     const core::Context& ctx = core::Context::background()) const = 0;
};

class Unmarshaler {
  public:
    virtual ~Unmarshaler() = default;

    virtual core::Identifier unmarshal_text(const core::ByteBuffer& data,
                                            const core::Context& ctx = core::Context::background()) const = 0;

    virtual core::Identifier unmarshal_binary(const core::ByteBuffer& data,
                                              const core::Context& ctx = core::Context::background()) const = 0;

    virtual core::Identifier unmarshal_json(const std::string& data,
                                            const core::Context& ctx = core::Context::background()) const = 0;
};

/**
 * @class Provider
 * @brief The full identifier surface for one family.
 */
class Provider : public Generator,
                 public Parser,
                 public Converter,
                 public Marshaler,
                 public Unmarshaler {
  public:
    /// @brief The type this provider generates.
    virtual core::IdType type() const = 0;

    /// @brief Configured display name, e.g. `"ulid-provider"`.
    virtual const std::string& name() const = 0;

    /// @brief Implementation version string.
    virtual std::string version() const = 0;

    virtual bool is_thread_safe() const = 0;

    /// @brief True when generated values embed a timestamp.
    virtual bool supports_timestamp() const = 0;

    /// @brief Every type this provider parses and serves.
    virtual std::vector<core::IdType> supported_types() const = 0;
};

} // namespace nexuid::provider
