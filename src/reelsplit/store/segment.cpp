// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/store/segment.hpp>
#include <reelsplit/core/config.hpp>
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace reelsplit::store {

std::string Segment::display_name() const {
    return fmt::format("Part {} of {}", part_number, total_parts);
}

std::string Segment::formatted_duration() const {
    auto total = static_cast<std::int64_t>(std::llround(duration_seconds));
    return fmt::format("{}:{:02}", total / 60, total % 60);
}

std::string Segment::formatted_size() const {
    constexpr double KB = 1024.0;
    constexpr double MB = 1024.0 * KB;
    auto bytes = static_cast<double>(size_bytes);
    if (bytes >= MB) {
        return fmt::format("{:.1f} MB", bytes / MB);
    }
    if (bytes >= KB) {
        return fmt::format("{:.0f} KB", bytes / KB);
    }
    return fmt::format("{} B", size_bytes);
}

bool Segment::fits_status_limits() const noexcept {
    using namespace reelsplit::core;
    const double max_seconds = static_cast<double>(STATUS_MAX_DURATION.count()) / 1000.0;
    return duration_seconds <= max_seconds
        && size_bytes <= STATUS_MAX_BYTES - STATUS_SIZE_MARGIN;
}

} // namespace reelsplit::store
