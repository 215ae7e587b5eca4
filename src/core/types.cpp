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
 * @file types.cpp
 * @brief Name tables and classification helpers for identifier families.
 */

#include "nexuid/core/types.hpp"

#include "nexuid/infra/string.hpp"

namespace nexuid::core {

std::string to_string(IdType type)
{
    switch (type) {
    case IdType::ULID:
        return "ulid";
    case IdType::UUID_V1:
        return "uuid_v1";
    case IdType::UUID_V4:
        return "uuid_v4";
    case IdType::UUID_V6:
        return "uuid_v6";
    case IdType::UUID_V7:
        return "uuid_v7";
    }
    return "unknown";
}

std::optional<IdType> type_from_string(std::string_view name)
{
    const std::string key = infra::String::to_lower(std::string(name));
    for (IdType type : kAllTypes) {
        if (to_string(type) == key) {
            return type;
        }
    }
    return std::nullopt;
}

std::string to_string(Variant variant)
{
    switch (variant) {
    case Variant::RESERVED_NCS:
        return "reserved_ncs";
    case Variant::RFC4122:
        return "rfc4122";
    case Variant::RESERVED_MICROSOFT:
        return "reserved_microsoft";
    case Variant::RESERVED_FUTURE:
        return "reserved_future";
    }
    return "unknown";
}

std::optional<Variant> variant_from_string(std::string_view name)
{
    for (Variant v : {Variant::RESERVED_NCS, Variant::RFC4122, Variant::RESERVED_MICROSOFT,
                      Variant::RESERVED_FUTURE}) {
        if (to_string(v) == name) {
            return v;
        }
    }
    return std::nullopt;
}

bool is_uuid(IdType type)
{
    switch (type) {
    case IdType::ULID:
        return false;
    case IdType::UUID_V1:
    case IdType::UUID_V4:
    case IdType::UUID_V6:
    case IdType::UUID_V7:
        return true;
    }
    return false;
}

bool supports_timestamp(IdType type)
{
    switch (type) {
    case IdType::ULID:
    case IdType::UUID_V1:
    case IdType::UUID_V6:
    case IdType::UUID_V7:
        return true;
    case IdType::UUID_V4:
        return false;
    }
    return false;
}

std::optional<int> uuid_version_of(IdType type)
{
    switch (type) {
    case IdType::ULID:
        return std::nullopt;
    case IdType::UUID_V1:
        return 1;
    case IdType::UUID_V4:
        return 4;
    case IdType::UUID_V6:
        return 6;
    case IdType::UUID_V7:
        return 7;
    }
    return std::nullopt;
}

IdType uuid_type_for_version(int version)
{
    switch (version) {
    case 1:
        return IdType::UUID_V1;
    case 6:
        return IdType::UUID_V6;
    case 7:
        return IdType::UUID_V7;
    default:
        // 2, 3 and 5 have no dedicated family.
        return IdType::UUID_V4;
    }
}

} // namespace nexuid::core
