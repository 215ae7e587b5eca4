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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to `std::string`
 * holding the text sanitization steps shared by the format detector, the parsers and
 * the configuration loader (trimming, ASCII case folding, hex classification).
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace nexuid::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 *
 * @details
 * All operations are ASCII-only. Identifier alphabets are ASCII, so locale-aware
 * folding would only introduce surprises for non-ASCII input.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * **Whitespace Definitions:** space, `\t`, `\n`, `\r`, `\v`, `\f`.
     *
     * @param s The source string to process.
     * @return std::string A new string without the surrounding whitespace. Returns an
     * empty string if the input is empty or consists solely of whitespace.
     *
     * @code
     * std::string clean = nexuid::infra::String::trim("  01ARZ3NDEKTSV4RRFFQ69G5FAV\n");
     * @endcode
     */
    static std::string trim(const std::string& s);

    /// @brief Returns an ASCII upper-cased copy.
    static std::string to_upper(std::string s);

    /// @brief Returns an ASCII lower-cased copy.
    static std::string to_lower(std::string s);

    /// @brief Returns a copy of @p s with every occurrence of @p c removed.
    static std::string remove_all(const std::string& s, char c);

    /// @brief True when @p c is `0-9`, `a-f` or `A-F`.
    static bool is_hex_digit(char c);

    /**
     * @brief True when @p s is non-empty and every character is a hex digit.
     */
    static bool is_hex(std::string_view s);

    /**
     * @brief Parses a strictly positive decimal count.
     *
     * @return std::nullopt for signs, trailing characters, zero, or values that do not
     * fit in `std::size_t`.
     */
    static std::optional<std::size_t> parse_positive(const std::string& s);
};

} // namespace nexuid::infra
