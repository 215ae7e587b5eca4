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
 * @file context.cpp
 * @brief Implementation of the cancellation token.
 */

#include "nexuid/core/context.hpp"

#include "nexuid/core/errors.hpp"

namespace nexuid::core {

Context::Context() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

const Context& Context::background()
{
    static const Context ctx;
    return ctx;
}

void Context::cancel()
{
    cancelled_->store(true, std::memory_order_release);
}

bool Context::is_cancelled() const
{
    return cancelled_->load(std::memory_order_acquire);
}

void Context::throw_if_cancelled(const std::string& operation) const
{
    if (is_cancelled()) {
        throw CancelledError(operation);
    }
}

} // namespace nexuid::core
