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
 * @file format_detector.cpp
 * @brief Implementation of the format detection heuristic.
 */

#include "nexuid/detect/format_detector.hpp"

#include "nexuid/core/errors.hpp"
#include "nexuid/encoding/base32.hpp"
#include "nexuid/encoding/hex.hpp"
#include "nexuid/encoding/uuid_layout.hpp"
#include "nexuid/infra/string.hpp"

#include <algorithm>

namespace nexuid::detect {

namespace {

bool in_ulid_alphabet(const std::string& s)
{
    return std::all_of(s.begin(), s.end(), [](char c) {
        return encoding::kCrockfordAlphabet.find(c) != std::string_view::npos;
    });
}

} // namespace

core::IdType FormatDetector::detect(const std::string& input)
{
    return inspect(input).type;
}

Detection FormatDetector::inspect(const std::string& input)
{
    if (input.empty()) {
        throw core::ValidationError("input", input, "empty string");
    }

    const std::string upper = infra::String::to_upper(infra::String::trim(input));
    if (upper.size() == encoding::kUlidLength && in_ulid_alphabet(upper)) {
        return {core::IdType::ULID, true};
    }

    if (encoding::is_uuid_string(input)) {
        switch (input[14]) {
        case '1':
            return {core::IdType::UUID_V1, true};
        case '4':
            return {core::IdType::UUID_V4, true};
        case '6':
            return {core::IdType::UUID_V6, true};
        case '7':
            return {core::IdType::UUID_V7, true};
        default:
            return {core::IdType::UUID_V4, false};
        }
    }

    if (input.size() == encoding::kHexLength && infra::String::is_hex(input)) {
        return {core::IdType::UUID_V4, false};
    }

    throw core::ValidationError("input", input, "unrecognized format");
}

} // namespace nexuid::detect
