// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace reelsplit::media {

struct TimeRange {
    std::int64_t start_ms{0};
    std::int64_t end_ms{0};

    [[nodiscard]] std::int64_t duration_ms() const noexcept { return end_ms - start_ms; }

    bool operator==(const TimeRange&) const = default;
};

// Walks forward in target_ms steps. A final slice shorter than
// min_trailing_ms is folded into the range before it. Returns a single range
// when total_ms <= target_ms and nothing for non-positive inputs.
[[nodiscard]] std::vector<TimeRange> plan_segments(std::int64_t total_ms,
                                                   std::int64_t target_ms,
                                                   std::int64_t min_trailing_ms);

// part_001.mp4
[[nodiscard]] std::string segment_file_name(std::uint32_t part_number, std::string_view extension);

} // namespace reelsplit::media
