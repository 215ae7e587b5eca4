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
 * @file entropy.hpp
 * @brief Random byte sources injected into identifier providers.
 *
 * @details
 * Providers never reach for randomness directly; they draw from an `EntropySource`
 * supplied at construction. Two implementations ship with the engine:
 * - `RandomEntropy`: a thread-local 64-bit Mersenne Twister seeded from
 *   `std::random_device`. Lock-free and fast; the default.
 * - `SecureEntropy`: OpenSSL's CSPRNG (`RAND_bytes`), for deployments that require
 *   cryptographic-quality identifiers.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>

namespace nexuid::infra {

/**
 * @class EntropySource
 * @brief Bytes-on-demand interface. Implementations must be safe to call concurrently.
 */
class EntropySource {
  public:
    virtual ~EntropySource() = default;

    /**
     * @brief Fills @p out with @p len random bytes.
     *
     * @throws nexuid::core::EntropyError if the source cannot deliver.
     */
    virtual void fill(std::uint8_t* out, std::size_t len) = 0;

    /// @brief Short name used in logs (`"mt19937_64"`, `"openssl"`).
    virtual const char* name() const = 0;
};

/**
 * @class RandomEntropy
 * @brief Thread-local MT19937-64 source.
 *
 * Each thread owns its own engine instance, so concurrent callers never contend.
 */
class RandomEntropy : public EntropySource {
  public:
    void fill(std::uint8_t* out, std::size_t len) override;
    const char* name() const override { return "mt19937_64"; }
};

/**
 * @class SecureEntropy
 * @brief OpenSSL `RAND_bytes` source.
 */
class SecureEntropy : public EntropySource {
  public:
    void fill(std::uint8_t* out, std::size_t len) override;
    const char* name() const override { return "openssl"; }
};

/**
 * @brief Builds the default source for a provider.
 *
 * @param secure `true` selects `SecureEntropy`, `false` selects `RandomEntropy`.
 */
std::shared_ptr<EntropySource> make_entropy(bool secure);

} // namespace nexuid::infra
