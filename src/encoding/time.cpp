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
 * @file time.cpp
 * @brief Implementation of the timestamp conversions.
 */

#include "nexuid/encoding/time.hpp"

#include "nexuid/core/errors.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace nexuid::encoding {

namespace {

using Days = std::chrono::duration<std::int64_t, std::ratio<86400>>;

constexpr std::int64_t kTicksPerSecond = 10000000;
constexpr std::int64_t kTicksPerMilli = 10000;

struct CivilDate {
    std::int64_t year;
    unsigned month;
    unsigned day;
};

/// @brief Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d)
{
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const auto yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

CivilDate civil_from_days(std::int64_t z)
{
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const auto doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    const std::int64_t y = static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2);
    return {y, m, d};
}

[[noreturn]] void reject(const std::string& text, const std::string& reason)
{
    throw core::ValidationError("timestamp", text, reason);
}

/// @brief Reads exactly @p width digits at @p pos, advancing it.
int read_digits(const std::string& text, std::size_t& pos, std::size_t width)
{
    if (pos + width > text.size()) {
        reject(text, "truncated ISO-8601 timestamp");
    }
    int value = 0;
    for (std::size_t i = 0; i < width; ++i, ++pos) {
        const char c = text[pos];
        if (c < '0' || c > '9') {
            reject(text, "expected digit in ISO-8601 timestamp");
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

void expect(const std::string& text, std::size_t& pos, char c)
{
    if (pos >= text.size() || text[pos] != c) {
        reject(text, std::string("expected '") + c + "' in ISO-8601 timestamp");
    }
    ++pos;
}

bool is_leap(std::int64_t y)
{
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(std::int64_t y, unsigned m)
{
    static constexpr unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return m == 2 && is_leap(y) ? 29 : kDays[m - 1];
}

} // namespace

core::Timestamp now()
{
    return std::chrono::time_point_cast<core::Ticks>(std::chrono::system_clock::now());
}

std::int64_t unix_millis(core::Timestamp ts)
{
    return std::chrono::floor<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

core::Timestamp from_unix_millis(std::int64_t ms)
{
    return core::Timestamp(core::Ticks(ms * kTicksPerMilli));
}

std::int64_t gregorian_ticks(core::Timestamp ts)
{
    return ts.time_since_epoch().count() + kGregorianOffset;
}

core::Timestamp from_gregorian_ticks(std::int64_t ticks)
{
    return core::Timestamp(core::Ticks(ticks - kGregorianOffset));
}

std::int64_t year_of(core::Timestamp ts)
{
    const auto days = std::chrono::floor<Days>(ts.time_since_epoch()).count();
    return civil_from_days(days).year;
}

std::string format_iso8601(core::Timestamp ts)
{
    const core::Ticks since_epoch = ts.time_since_epoch();
    const Days days = std::chrono::floor<Days>(since_epoch);
    const std::int64_t rem = (since_epoch - days).count();

    const CivilDate date = civil_from_days(days.count());
    const std::int64_t secs = rem / kTicksPerSecond;
    const std::int64_t frac = rem % kTicksPerSecond;

    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(4) << date.year << '-' << std::setw(2) << date.month
       << '-' << std::setw(2) << date.day << 'T' << std::setw(2) << secs / 3600 << ':'
       << std::setw(2) << (secs / 60) % 60 << ':' << std::setw(2) << secs % 60 << '.'
       << std::setw(7) << frac << 'Z';
    return ss.str();
}

core::Timestamp parse_iso8601(const std::string& text)
{
    std::size_t pos = 0;

    const int year = read_digits(text, pos, 4);
    expect(text, pos, '-');
    const int month = read_digits(text, pos, 2);
    expect(text, pos, '-');
    const int day = read_digits(text, pos, 2);

    if (pos >= text.size() || (text[pos] != 'T' && text[pos] != 't' && text[pos] != ' ')) {
        reject(text, "expected 'T' in ISO-8601 timestamp");
    }
    ++pos;

    const int hour = read_digits(text, pos, 2);
    expect(text, pos, ':');
    const int minute = read_digits(text, pos, 2);
    expect(text, pos, ':');
    const int second = read_digits(text, pos, 2);

    if (month < 1 || month > 12 || day < 1 ||
        day > static_cast<int>(days_in_month(year, static_cast<unsigned>(month)))) {
        reject(text, "date out of range");
    }
    if (hour > 23 || minute > 59 || second > 59) {
        reject(text, "time of day out of range");
    }

    std::int64_t fraction = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        std::size_t digits = 0;
        std::int64_t scale = kTicksPerSecond;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 7) {
                scale /= 10;
                fraction += (text[pos] - '0') * scale;
            }
            ++digits;
            ++pos;
        }
        if (digits == 0 || digits > 9) {
            reject(text, "fractional seconds must have 1 to 9 digits");
        }
    }

    std::int64_t offset_seconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        const int sign = text[pos] == '-' ? -1 : 1;
        ++pos;
        const int off_h = read_digits(text, pos, 2);
        expect(text, pos, ':');
        const int off_m = read_digits(text, pos, 2);
        if (off_h > 23 || off_m > 59) {
            reject(text, "zone offset out of range");
        }
        offset_seconds = sign * (off_h * 3600 + off_m * 60);
    } else {
        reject(text, "missing zone designator");
    }

    if (pos != text.size()) {
        reject(text, "trailing characters after ISO-8601 timestamp");
    }

    const std::int64_t days =
        days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    const std::int64_t seconds =
        days * 86400 + hour * 3600 + minute * 60 + second - offset_seconds;
    return core::Timestamp(core::Ticks(seconds * kTicksPerSecond + fraction));
}

void validate_timestamp(core::IdType type, core::Timestamp ts)
{
    if (year_of(ts) < 1970) {
        throw core::ValidationError("timestamp", format_iso8601(ts), "timestamp before 1970",
                                    type);
    }

    switch (type) {
    case core::IdType::ULID:
    case core::IdType::UUID_V7:
        if (unix_millis(ts) > kMaxUnixMillis) {
            throw core::ValidationError("timestamp", format_iso8601(ts),
                                        "exceeds 48-bit millisecond range", type);
        }
        break;
    case core::IdType::UUID_V1:
    case core::IdType::UUID_V6:
        if (ts.time_since_epoch().count() > kMaxGregorianTicks - kGregorianOffset) {
            throw core::ValidationError("timestamp", format_iso8601(ts),
                                        "exceeds 60-bit gregorian range", type);
        }
        break;
    case core::IdType::UUID_V4:
        break;
    }
}

} // namespace nexuid::encoding
