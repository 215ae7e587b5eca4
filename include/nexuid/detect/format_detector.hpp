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
 * @file format_detector.hpp
 * @brief Classifies an arbitrary string into an identifier family.
 *
 * @details
 * Detection is a length and character-set heuristic, evaluated in order:
 *
 * | Input shape                                   | Result                        |
 * |-----------------------------------------------|-------------------------------|
 * | empty                                         | error "empty string"          |
 * | 26 chars of the ULID alphabet (trimmed)       | `ULID`                        |
 * | 36 chars, 8-4-4-4-12, version char 1/4/6/7    | `UUID_V1/V4/V6/V7`            |
 * | 36 chars, 8-4-4-4-12, any other version char  | `UUID_V4` (fallback)          |
 * | 32 hex chars, no hyphens                      | `UUID_V4` (fallback)          |
 * | anything else                                 | error "unrecognized format"   |
 *
 * The two fallback rows are a best-effort guess. `inspect()` reports them with
 * `exact == false` so callers can tell a guessed v4 from a real one.
 */

#pragma once

#include "nexuid/core/types.hpp"

#include <string>

namespace nexuid::detect {

/// @brief Outcome of FormatDetector::inspect().
struct Detection {
    core::IdType type;
    bool exact; ///< False when @ref type is the v4 fallback guess.
};

class FormatDetector {
  public:
    /**
     * @brief Returns the identifier family of @p input.
     *
     * @throws core::ValidationError (field `input`) for empty or unrecognized input.
     */
    static core::IdType detect(const std::string& input);

    /// @brief Same as detect(), also reporting whether the result was a fallback guess.
    static Detection inspect(const std::string& input);
};

} // namespace nexuid::detect
