// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/media/split_plan.hpp>
#include <spdlog/fmt/fmt.h>

namespace reelsplit::media {

std::vector<TimeRange> plan_segments(std::int64_t total_ms,
                                     std::int64_t target_ms,
                                     std::int64_t min_trailing_ms) {
    std::vector<TimeRange> ranges;
    if (total_ms <= 0 || target_ms <= 0) {
        return ranges;
    }

    std::int64_t start = 0;
    while (start < total_ms) {
        std::int64_t remaining = total_ms - start;
        if (remaining <= target_ms) {
            ranges.push_back({start, total_ms});
            break;
        }

        std::int64_t proposed_end = start + target_ms;
        std::int64_t after = total_ms - proposed_end;
        if (after > 0 && after < min_trailing_ms) {
            // Tail too short to stand alone
            ranges.push_back({start, total_ms});
            break;
        }

        ranges.push_back({start, proposed_end});
        start = proposed_end;
    }
    return ranges;
}

std::string segment_file_name(std::uint32_t part_number, std::string_view extension) {
    return fmt::format("part_{:03}.{}", part_number, extension);
}

} // namespace reelsplit::media
