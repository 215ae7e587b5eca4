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
 * @file provider_base.hpp
 * @brief Conversion and marshaling shared by the concrete providers.
 *
 * @details
 * Conversion and (un)marshaling do not depend on the identifier family beyond the set
 * of types a provider serves, so both concrete providers inherit them from here and only
 * implement generation and parsing.
 */

#pragma once

#include "nexuid/convert/converter.hpp"
#include "nexuid/provider/capabilities.hpp"

#include <set>

namespace nexuid::provider {

class ProviderBase : public Provider {
  public:
    std::string to_canonical(const core::Identifier& value,
                             const core::Context& ctx = core::Context::background()) const override;
    std::string to_hex(const core::Identifier& value,
                       const core::Context& ctx = core::Context::background()) const override;
    core::ByteBuffer to_bytes(const core::Identifier& value,
                              const core::Context& ctx = core::Context::background()) const override;
    core::Identifier convert_type(const core::Identifier& value, core::IdType target,
                                  const core::Context& ctx = core::Context::background()) const override;
    std::map<core::IdType, std::vector<core::IdType>> supported_conversions() const override;

    /// @throws core::MarshalError when the value's type is not served.
    core::ByteBuffer marshal_text(const core::Identifier& value,
                                  const core::Context& ctx = core::Context::background()) const override;
    /// @throws core::MarshalError when the value's type is not served.
    core::ByteBuffer marshal_binary(const core::Identifier& value,
                                    const core::Context& ctx = core::Context::background()) const override;
    /// @throws core::MarshalError when the value's type is not served.
    std::string marshal_json(const core::Identifier& value,
                             const core::Context& ctx = core::Context::background()) const override;

    /// @throws core::UnmarshalError for empty input. Parse failures propagate.
    core::Identifier unmarshal_text(const core::ByteBuffer& data,
                                    const core::Context& ctx = core::Context::background()) const override;
    /// @throws core::UnmarshalError for empty input. Parse failures propagate.
    core::Identifier unmarshal_binary(const core::ByteBuffer& data,
                                      const core::Context& ctx = core::Context::background()) const override;
    /// @throws core::UnmarshalError for empty input, a bad document or an unserved type.
    core::Identifier unmarshal_json(const std::string& data,
                                    const core::Context& ctx = core::Context::background()) const override;

    std::vector<core::IdType> supported_types() const override;

  protected:
    explicit ProviderBase(std::set<core::IdType> served);

    bool serves(core::IdType type) const { return converter_.serves(type); }

  private:
    void require_marshalable(const core::Identifier& value) const;

    convert::Converter converter_;
    std::set<core::IdType> served_;
};

} // namespace nexuid::provider
