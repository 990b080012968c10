// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/core/config.hpp>
#include <reelsplit/core/error.hpp>
#include <reelsplit/core/executor.hpp>
#include <reelsplit/media/transcoder.hpp>
#include <reelsplit/store/segment.hpp>
#include <chrono>
#include <expected>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <vector>

namespace reelsplit::media {

struct SplitOptions {
    std::chrono::milliseconds target{core::DEFAULT_SEGMENT_DURATION};
    std::chrono::milliseconds min_trailing{core::MIN_TRAILING_DURATION};
};

// fraction is 0.0 when a clip starts and 1.0 once it is verified
struct SplitProgress {
    std::uint32_t current_part{0};
    std::uint32_t total_parts{0};
    double fraction{0.0};
};

using SplitProgressFn = std::function<void(const SplitProgress&)>;

struct SplitResult {
    std::vector<store::SplitPart> parts;
    std::int64_t source_duration_ms{0};
    bool was_split{false};
};

// Cuts a downloaded video into part_NNN files. All-or-nothing: on failure or
// cancellation every part written by this run is removed.
class SplitStage {
public:
    // clip_context is where start_clip() runs, once per clip
    SplitStage(TranscodeEngine& engine, core::Executor& clip_context) noexcept
        : engine_(engine), clip_context_(clip_context) {}

    [[nodiscard]] std::expected<SplitResult, core::AppError>
    split(const std::filesystem::path& input,
          const std::filesystem::path& output_dir,
          const SplitOptions& options,
          const SplitProgressFn& on_progress,
          std::stop_token stop = {});

private:
    [[nodiscard]] std::expected<void, core::AppError>
    run_clip(const ClipRequest& request, std::stop_token stop);

    TranscodeEngine& engine_;
    core::Executor& clip_context_;
};

} // namespace reelsplit::media
