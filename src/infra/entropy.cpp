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
 * @file entropy.cpp
 * @brief Implementation of the random byte sources.
 */

#include "nexuid/infra/entropy.hpp"

#include "nexuid/core/errors.hpp"

#include <climits>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <random>
#include <string>

namespace nexuid::infra {

/**
 * @brief Fills a buffer from the calling thread's Mersenne Twister.
 *
 * Implementation Strategy:
 * 1. **Thread Safety**: `thread_local` engines eliminate lock contention.
 * 2. **Seeding**: each engine is seeded once from `std::random_device`.
 * 3. **Extraction**: 64-bit samples are split into bytes, least significant first.
 */
void RandomEntropy::fill(std::uint8_t* out, std::size_t len)
{
    static thread_local std::random_device rd;
    static thread_local std::mt19937_64 gen(rd());
    static thread_local std::uniform_int_distribution<std::uint64_t> dis;

    std::size_t i = 0;
    while (i < len) {
        std::uint64_t sample = dis(gen);
        for (int b = 0; b < 8 && i < len; ++b, ++i) {
            out[i] = static_cast<std::uint8_t>(sample & 0xFF);
            sample >>= 8;
        }
    }
}

void SecureEntropy::fill(std::uint8_t* out, std::size_t len)
{
    // RAND_bytes takes an int length; split oversized requests.
    while (len > 0) {
        const int chunk = len > static_cast<std::size_t>(INT_MAX) ? INT_MAX : static_cast<int>(len);
        if (RAND_bytes(out, chunk) != 1) {
            throw core::EntropyError("RAND_bytes failed (openssl error " +
                                     std::to_string(ERR_get_error()) + ")");
        }
        out += chunk;
        len -= static_cast<std::size_t>(chunk);
    }
}

std::shared_ptr<EntropySource> make_entropy(bool secure)
{
    if (secure) {
        return std::make_shared<SecureEntropy>();
    }
    return std::make_shared<RandomEntropy>();
}

} // namespace nexuid::infra
