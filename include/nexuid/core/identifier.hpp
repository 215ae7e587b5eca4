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
 * @file identifier.hpp
 * @brief The immutable identifier value returned by every engine operation.
 *
 * @details
 * An `Identifier` bundles the binary identity of an ID (16 bytes) with its text forms and
 * the metadata decoded from it. Instances are only produced by `Identifier::create`, which
 * validates the whole combination first, so a constructed value always satisfies:
 *
 * 1. `bytes()` holds exactly 16 bytes.
 * 2. `hex()` is the lowercase hex of `bytes()`. It is derived inside the constructor and
 *    never supplied by callers.
 * 3. `canonical()` re-encodes `bytes()` in the native format of `type()`.
 * 4. A timestamp is only present for ULID and UUID v1 / v6 / v7.
 * 5. `version()` and `variant()` are only present for UUID types.
 */

#pragma once

#include "nexuid/core/types.hpp"

#include <optional>
#include <string>

namespace nexuid::core {

class Identifier {
  public:
    /**
     * @brief Validates the parts and builds an identifier.
     *
     * @param raw The string as supplied by the caller (or produced by generation).
     * @param canonical The native text form of @p bytes for @p type.
     * @param bytes The 16-byte identity.
     * @param type The identifier family.
     * @param timestamp Embedded time, only for time-based families.
     * @param version UUID version nibble, only for UUID families.
     * @param variant UUID variant, only for UUID families.
     *
     * @throws ValidationError naming the offending field.
     */
    static Identifier create(std::string raw, std::string canonical, const Bytes& bytes,
                             IdType type, std::optional<Timestamp> timestamp = std::nullopt,
                             std::optional<int> version = std::nullopt,
                             std::optional<Variant> variant = std::nullopt);

    const std::string& raw() const noexcept { return raw_; }
    const std::string& canonical() const noexcept { return canonical_; }
    const Bytes& bytes() const noexcept { return bytes_; }
    const std::string& hex() const noexcept { return hex_; }
    IdType type() const noexcept { return type_; }

    bool has_timestamp() const noexcept { return timestamp_.has_value(); }

    /**
     * @brief Returns the embedded timestamp.
     *
     * @throws NoTimestampError when the value carries none. A zero time is never returned.
     */
    Timestamp timestamp() const;

    std::optional<int> version() const noexcept { return version_; }
    std::optional<Variant> variant() const noexcept { return variant_; }

    /// @brief Same as canonical().
    const std::string& str() const noexcept { return canonical_; }

    /// @brief Equal when both type and bytes match.
    bool operator==(const Identifier& other) const noexcept;
    bool operator!=(const Identifier& other) const noexcept { return !(*this == other); }

    /// @brief Byte-wise ordering. For ULIDs this is generation time order.
    bool operator<(const Identifier& other) const noexcept;

  private:
    Identifier(std::string raw, std::string canonical, const Bytes& bytes, IdType type,
               std::optional<Timestamp> timestamp, std::optional<int> version,
               std::optional<Variant> variant);

    std::string raw_;
    std::string canonical_;
    Bytes bytes_;
    std::string hex_;
    IdType type_;
    std::optional<Timestamp> timestamp_;
    std::optional<int> version_;
    std::optional<Variant> variant_;
};

} // namespace nexuid::core
