// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace reelsplit::store {

// One produced clip before it is given an identity
struct SplitPart {
    std::uint32_t part_number{0};
    std::uint32_t total_parts{0};
    std::filesystem::path file_path;
    std::int64_t start_ms{0};
    std::int64_t end_ms{0};
    std::uint64_t size_bytes{0};
    bool references_source{false};      // Short video, no re-encode

    [[nodiscard]] std::int64_t duration_ms() const noexcept { return end_ms - start_ms; }
};

// Stored output unit. Only `shared` changes after creation.
struct Segment {
    std::string id;
    std::string video_id;
    std::uint32_t part_number{0};
    std::uint32_t total_parts{0};
    std::filesystem::path file_path;
    double start_offset_seconds{0.0};
    double end_offset_seconds{0.0};
    double duration_seconds{0.0};
    std::uint64_t size_bytes{0};
    bool shared{false};

    // "Part 2 of 3"
    [[nodiscard]] std::string display_name() const;

    // "1:30"
    [[nodiscard]] std::string formatted_duration() const;

    // "4.2 MB"
    [[nodiscard]] std::string formatted_size() const;

    // Within the 90 s / 16 MB status limits
    [[nodiscard]] bool fits_status_limits() const noexcept;
};

} // namespace reelsplit::store
