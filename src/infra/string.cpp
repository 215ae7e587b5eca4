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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "nexuid/infra/string.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace nexuid::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * Implementation Strategy:
 * 1. **Linear Prefix Scan**: Identifies the first non-whitespace character.
 * 2. **Empty State Detection**: Early exit when the string is entirely whitespace.
 * 3. **Linear Suffix Scan**: Identifies the terminal non-whitespace character.
 * 4. **Range Construction**: Substrings the valid range into a new `std::string`.
 *
 * @note `static_cast<unsigned char>` prevents undefined behavior in `std::isspace`
 * for characters with negative values in signed `char` environments.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::string String::to_upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return s;
}

std::string String::to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

std::string String::remove_all(const std::string& s, char c)
{
    std::string out;
    out.reserve(s.size());
    for (char ch : s) {
        if (ch != c) {
            out.push_back(ch);
        }
    }
    return out;
}

bool String::is_hex_digit(char c)
{
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

bool String::is_hex(std::string_view s)
{
    return !s.empty() && std::all_of(s.begin(), s.end(), is_hex_digit);
}

std::optional<std::size_t> String::parse_positive(const std::string& s)
{
    if (s.empty()) {
        return std::nullopt;
    }

    std::size_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        const auto digit = static_cast<std::size_t>(c - '0');
        if (value > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    if (value == 0) {
        return std::nullopt;
    }
    return value;
}

} // namespace nexuid::infra
