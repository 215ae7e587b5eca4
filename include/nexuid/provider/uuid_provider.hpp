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
 * @file uuid_provider.hpp
 * @brief Generation and parsing of UUID versions 1, 4, 6 and 7.
 *
 * @details
 * A provider generates exactly one version (from its configuration) but parses every
 * version; the type of a parsed value follows the version nibble found in its bytes.
 *
 * **Timestamp layouts:**
 * | Version | Bytes 0..7                                                  | Epoch / unit        |
 * |---------|-------------------------------------------------------------|---------------------|
 * | v1      | time_low(32) time_mid(16) ver(4) time_hi(12)                | 1582-10-15, 100 ns  |
 * | v6      | time_high(32) time_mid(16) ver(4) time_low(12)              | 1582-10-15, 100 ns  |
 * | v7      | unix_ms(48) ver(4) rand_a(12)                               | 1970-01-01, 1 ms    |
 *
 * v1 and v6 follow the timestamp with a 14-bit clock sequence (after the variant bits)
 * and a 48-bit node. Both are random unless fixed in the configuration; a random node
 * has its multicast bit set.
 *
 * Version 4 carries no timestamp. Extracting one fails with `NoTimestampError`.
 */

#pragma once

#include "nexuid/config/config.hpp"
#include "nexuid/infra/entropy.hpp"
#include "nexuid/provider/provider_base.hpp"

#include <memory>

namespace nexuid::provider {

class UuidProvider : public ProviderBase {
  public:
    /**
     * @brief Validates @p cfg and constructs the provider.
     *
     * @param cfg Provider settings. `cfg.version` selects what generate() produces.
     * @param entropy Random byte source. Defaults to the thread-local generator.
     *
     * @throws core::ValidationError when @p cfg is invalid.
     */
    explicit UuidProvider(config::UuidConfig cfg,
                          std::shared_ptr<infra::EntropySource> entropy = nullptr);

    /// @throws core::ValidationError when the configured version cannot be generated.
    core::Identifier generate(const core::Context& ctx = core::Context::background()) override;

    /**
     * @brief Generates a v1, v6 or v7 UUID embedding @p ts.
     *
     * A v4 provider still checks that @p ts is not before 1970, then ignores it.
     */
    core::Identifier generate_at(core::Timestamp ts,
                                 const core::Context& ctx = core::Context::background()) override;

    /**
     * @brief Decodes a hyphenated UUID, or 32 hex digits as a fallback.
     *
     * Versions 2, 3 and 5 are accepted and labeled `UUID_V4`; the value keeps its real
     * version number.
     *
     * @throws core::ParseError for malformed input or a version outside [1, 7].
     */
    core::Identifier parse(const std::string& input,
                           const core::Context& ctx = core::Context::background()) const override;
    core::Identifier parse_bytes(const core::ByteBuffer& bytes,
                                 const core::Context& ctx = core::Context::background()) const override;
    void validate(const std::string& input,
                  const core::Context& ctx = core::Context::background()) const override;
    void validate_bytes(const core::ByteBuffer& bytes,
                        const core::Context& ctx = core::Context::background()) const override;
    core::Timestamp extract_timestamp(const std::string& input,
                                      const core::Context& ctx = core::Context::background()) const override;

    /// @brief True for a well-formed hyphenated UUID with a version in [1, 7].
    bool is_valid_uuid(const std::string& input,
                       const core::Context& ctx = core::Context::background()) const;

    core::IdType type() const override { return config_.type; }
    const std::string& name() const override { return config_.name; }
    std::string version() const override { return "1.0.0"; }
    bool is_thread_safe() const override { return config_.thread_safe; }
    bool supports_timestamp() const override;

    const config::UuidConfig& config() const { return config_; }

  private:
    core::Identifier generate_time_based(int version, core::Timestamp ts);
    core::Identifier generate_v7(core::Timestamp ts);
    core::Identifier generate_v4();

    void fill_clock_and_node(core::Bytes& bytes);

    core::Identifier build(const core::Bytes& bytes, std::string raw) const;

    config::UuidConfig config_;
    std::shared_ptr<infra::EntropySource> entropy_;
};

/**
 * @brief Decodes the embedded timestamp of UUID @p bytes of the given @p version.
 *
 * @return std::nullopt for versions without a timestamp.
 */
std::optional<core::Timestamp> uuid_timestamp(const core::Bytes& bytes, int version);

} // namespace nexuid::provider
