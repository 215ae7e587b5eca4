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
 * @file detector_test.cpp
 * @brief Unit tests for input format classification.
 */

#include "framework.hpp"
#include "nexuid/core/errors.hpp"
#include "nexuid/detect/format_detector.hpp"

using nexuid::core::IdType;
using nexuid::detect::FormatDetector;

/**
 * @brief Classifies the canonical text of every supported type.
 */
void test_detect_known_formats()
{
    ASSERT_EQ(FormatDetector::detect("01ARZ3NDEKTSV4RRFFQ69G5FAV"), IdType::ULID);
    ASSERT_EQ(FormatDetector::detect("01arz3ndektsv4rrffq69g5fav"), IdType::ULID);
    ASSERT_EQ(FormatDetector::detect("550e8400-e29b-41d4-a716-446655440000"), IdType::UUID_V4);
    ASSERT_EQ(FormatDetector::detect("550e8400-e29b-11d4-a716-446655440000"), IdType::UUID_V1);
    ASSERT_EQ(FormatDetector::detect("1ec9414c-232a-6b00-b3c8-9f6bdeced846"), IdType::UUID_V6);
    ASSERT_EQ(FormatDetector::detect("017f22e2-79b0-7cc3-98c4-dc0c0c07398f"), IdType::UUID_V7);
}

/**
 * @brief Unknown version nibbles and bare hex fall back to a guessed v4.
 */
void test_detect_fallbacks()
{
    const auto v3 = FormatDetector::inspect("6fa459ea-ee8a-3ca4-894e-db77e160355e");
    ASSERT_EQ(v3.type, IdType::UUID_V4);
    ASSERT_FALSE(v3.exact);

    const auto hex = FormatDetector::inspect("550e8400e29b41d4a716446655440000");
    ASSERT_EQ(hex.type, IdType::UUID_V4);
    ASSERT_FALSE(hex.exact);

    const auto exact = FormatDetector::inspect("550e8400-e29b-41d4-a716-446655440000");
    ASSERT_TRUE(exact.exact);
}

void test_detect_rejections()
{
    ASSERT_THROWS(FormatDetector::detect(""), nexuid::core::ValidationError);
    ASSERT_THROWS(FormatDetector::detect("short"), nexuid::core::ValidationError);
    ASSERT_THROWS(FormatDetector::detect("01ARZ3NDEKTSV4RRFFQ69G5FAU"), nexuid::core::ValidationError);
    ASSERT_THROWS(FormatDetector::detect("550e8400-e29b-41d4-a716-44665544000z"),
                  nexuid::core::ValidationError);
    ASSERT_THROWS(FormatDetector::detect("550e8400e29b41d4a71644665544000"),
                  nexuid::core::ValidationError);

    try {
        FormatDetector::detect("");
        ASSERT_TRUE(false);
    } catch (const nexuid::core::ValidationError& e) {
        ASSERT_EQ(e.reason(), std::string("empty string"));
    }
    try {
        FormatDetector::detect("short");
        ASSERT_TRUE(false);
    } catch (const nexuid::core::ValidationError& e) {
        ASSERT_EQ(e.reason(), std::string("unrecognized format"));
    }
}
