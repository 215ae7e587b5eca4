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
 * @file base64.cpp
 * @brief Base64 codec backed by OpenSSL's EVP block encoder.
 */

#include "nexuid/encoding/base64.hpp"

#include "nexuid/core/errors.hpp"

#include <openssl/evp.h>

namespace nexuid::encoding {

namespace {

std::string encode(const std::uint8_t* data, std::size_t len)
{
    if (len == 0) {
        return "";
    }
    // 4 output chars per 3 input bytes, plus the NUL EVP_EncodeBlock writes.
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data,
                                        static_cast<int>(len));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

} // namespace

std::string base64_encode(const core::ByteBuffer& bytes)
{
    return encode(bytes.data(), bytes.size());
}

std::string base64_encode(const core::Bytes& bytes)
{
    return encode(bytes.data(), bytes.size());
}

/**
 * @details
 * `EVP_DecodeBlock` reports the length including the zero bytes that stand in for `=`
 * padding, so the padding count is subtracted afterwards.
 */
core::ByteBuffer base64_decode(const std::string& text)
{
    if (text.empty()) {
        return {};
    }
    if (text.size() % 4 != 0) {
        throw core::ValidationError("base64", text, "length is not a multiple of 4");
    }

    core::ByteBuffer out(text.size() / 4 * 3);
    const int decoded = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (decoded < 0) {
        throw core::ValidationError("base64", text, "invalid base64 data");
    }

    std::size_t padding = 0;
    if (text[text.size() - 1] == '=')
        ++padding;
    if (text[text.size() - 2] == '=')
        ++padding;

    out.resize(static_cast<std::size_t>(decoded) - padding);
    return out;
}

} // namespace nexuid::encoding
