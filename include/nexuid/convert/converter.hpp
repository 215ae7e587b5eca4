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
 * @file converter.hpp
 * @brief Projections between the three universal encodings, and type relabeling.
 *
 * @details
 * Every identifier has three interchangeable encodings: its canonical text, 32-digit hex,
 * and the raw 16 bytes. Moving between them is lossless and cannot fail for a value the
 * converter serves.
 *
 * `convert_type()` is different. It never re-encodes content:
 *
 * - **ULID -> UUID:** the 16 bytes are reused as-is and rendered in UUID text layout.
 *   Whatever happens to sit in the version and variant bit positions is reported; it is
 *   not patched to match the target label.
 * - **UUID -> ULID:** the bytes are rendered in base32 and the leading 48 bits are read as
 *   a millisecond timestamp.
 * - **UUID -> UUID:** only the type label changes. No timestamp or random bits are
 *   regenerated, so a v1 relabeled as v7 is not a valid v7.
 *
 * Callers must not assume that source and result are semantically equivalent.
 */

#pragma once

#include "nexuid/core/identifier.hpp"

#include <map>
#include <set>
#include <string>
#include <vector>

namespace nexuid::convert {

class Converter {
  public:
    /// @param sources The identifier types this converter accepts as input.
    explicit Converter(std::set<core::IdType> sources);

    /// @throws core::ConversionError when the value's type is not served.
    std::string to_canonical(const core::Identifier& value) const;

    /// @throws core::ConversionError when the value's type is not served.
    std::string to_hex(const core::Identifier& value) const;

    /// @throws core::ConversionError when the value's type is not served.
    core::ByteBuffer to_bytes(const core::Identifier& value) const;

    /**
     * @brief Relabels @p value as @p target.
     *
     * Same type yields a copy.
     *
     * @throws core::ConversionError naming both types when the source is not served.
     */
    core::Identifier convert_type(const core::Identifier& value, core::IdType target) const;

    /// @brief Every served source mapped to the types it can be relabeled as.
    std::map<core::IdType, std::vector<core::IdType>> supported_conversions() const;

    bool serves(core::IdType type) const;

  private:
    void require_served(const core::Identifier& value, const char* projection) const;

    std::set<core::IdType> sources_;
};

} // namespace nexuid::convert
