// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/pipeline/retry_policy.hpp>
#include <algorithm>
#include <cmath>

namespace reelsplit::pipeline {

RetryPolicy RetryPolicy::from(const core::RetrySettings& settings) noexcept {
    return RetryPolicy{settings.max_attempts, settings.initial_backoff, settings.multiplier, settings.max_backoff};
}

bool RetryPolicy::should_retry(const core::AppError& error, std::uint32_t attempts_made) const noexcept {
    if (error.is_cancellation()) return false;
    return error.retryable && attempts_made < max_attempts;
}

std::chrono::milliseconds RetryPolicy::backoff_for(std::uint32_t attempts_made) const noexcept {
    if (attempts_made == 0) return std::chrono::milliseconds::zero();
    double factor = std::pow(multiplier, static_cast<double>(attempts_made - 1));
    double delay = static_cast<double>(initial_backoff.count()) * factor;
    double capped = std::min(delay, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds(static_cast<std::int64_t>(capped));
}

} // namespace reelsplit::pipeline
