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
 * @file ulid_provider.hpp
 * @brief Generation and parsing of ULIDs.
 *
 * @details
 * **Binary layout (big-endian):**
 * | Bytes  | Content                          |
 * |--------|----------------------------------|
 * | 0..5   | Unix time in milliseconds (48b)  |
 * | 6..15  | Entropy (80b)                    |
 *
 * **Monotonic mode:** when two identifiers are generated within the same millisecond
 * on one provider instance, the second reuses the first's entropy incremented by one.
 * The increment happens under the provider mutex, so concurrent callers always receive
 * distinct, strictly ordered values. Running past `2^80 - 1` within one millisecond fails
 * with `ValidationError` rather than wrapping.
 */

#pragma once

#include "nexuid/config/config.hpp"
#include "nexuid/infra/entropy.hpp"
#include "nexuid/provider/provider_base.hpp"

#include <array>
#include <memory>
#include <mutex>

namespace nexuid::provider {

/// @brief Number of entropy bytes in a ULID.
inline constexpr std::size_t kUlidEntropyBytes = 10;

class UlidProvider : public ProviderBase {
  public:
    /**
     * @brief Validates @p cfg and constructs the provider.
     *
     * @param cfg Provider settings.
     * @param entropy Random byte source. When null, it is chosen from `cfg.secure_entropy`.
     *
     * @throws core::ValidationError when @p cfg is invalid.
     */
    explicit UlidProvider(config::UlidConfig cfg,
                          std::shared_ptr<infra::EntropySource> entropy = nullptr);

    UlidProvider(const UlidProvider&) = delete;
    UlidProvider& operator=(const UlidProvider&) = delete;

    core::Identifier generate(const core::Context& ctx = core::Context::background()) override;
    core::Identifier generate_at(core::Timestamp ts,
                                 const core::Context& ctx = core::Context::background()) override;

    /**
     * @brief Decodes a 26-character ULID (case-insensitive).
     *
     * Input that is not in ULID format is retried as 32 hex digits (hyphens ignored).
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

    /// @brief True when @p input is a well-formed ULID whose timestamp is in 1970 or later.
    bool is_valid_ulid(const std::string& input,
                       const core::Context& ctx = core::Context::background()) const;

    core::IdType type() const override { return core::IdType::ULID; }
    const std::string& name() const override { return config_.name; }
    std::string version() const override { return "1.0.0"; }
    bool is_thread_safe() const override { return config_.thread_safe; }
    bool supports_timestamp() const override { return true; }

    const config::UlidConfig& config() const { return config_; }

  private:
    using Entropy = std::array<std::uint8_t, kUlidEntropyBytes>;

    Entropy draw_entropy();
    Entropy next_entropy(std::int64_t ms);

    static core::Identifier build(const core::Bytes& bytes, std::string raw);

    config::UlidConfig config_;
    std::shared_ptr<infra::EntropySource> entropy_;

    /// @brief Guards the monotonic state below.
    std::mutex mutex_;
    std::int64_t last_ms_ = -1;
    Entropy last_entropy_{};
};

} // namespace nexuid::provider
