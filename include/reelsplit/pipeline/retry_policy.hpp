// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/core/config.hpp>
#include <reelsplit/core/error.hpp>
#include <reelsplit/core/settings.hpp>
#include <chrono>
#include <cstdint>

namespace reelsplit::pipeline {

// Bounded retries of retryable failures with exponential backoff
struct RetryPolicy {
    std::uint32_t max_attempts{core::MAX_ATTEMPTS};
    std::chrono::milliseconds initial_backoff{core::INITIAL_BACKOFF};
    double multiplier{core::BACKOFF_MULTIPLIER};
    std::chrono::milliseconds max_backoff{core::MAX_BACKOFF};

    [[nodiscard]] static RetryPolicy from(const core::RetrySettings& settings) noexcept;

    // attempts_made counts the attempt that just failed
    [[nodiscard]] bool should_retry(const core::AppError& error, std::uint32_t attempts_made) const noexcept;

    // Delay after the given failed attempt (1-based)
    [[nodiscard]] std::chrono::milliseconds backoff_for(std::uint32_t attempts_made) const noexcept;
};

} // namespace reelsplit::pipeline
