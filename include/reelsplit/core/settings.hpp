// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/core/config.hpp>
#include <reelsplit/core/error.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

namespace reelsplit::core {

struct ToolPaths {
    std::string yt_dlp{"yt-dlp"};
    std::string ffmpeg{"ffmpeg"};
    std::string ffprobe{"ffprobe"};
};

struct TransferSettings {
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t low_speed_timeout_sec{IO_TIMEOUT_SEC};
    std::string user_agent{DEFAULT_USER_AGENT};
};

struct RetrySettings {
    std::uint32_t max_attempts{MAX_ATTEMPTS};
    std::chrono::milliseconds initial_backoff{INITIAL_BACKOFF};
    double multiplier{BACKOFF_MULTIPLIER};
    std::chrono::milliseconds max_backoff{MAX_BACKOFF};
};

// Runtime settings, loaded from a JSON file and overridden from the command line
struct Settings {
    std::filesystem::path work_dir;
    std::chrono::milliseconds segment_duration{DEFAULT_SEGMENT_DURATION};
    std::chrono::milliseconds min_trailing{MIN_TRAILING_DURATION};
    RetrySettings retry;
    std::string log_level{"info"};
    ToolPaths tools;
    TransferSettings transfer;
    std::chrono::hours cache_max_age{24 * 7};

    [[nodiscard]] static std::expected<Settings, AppError> load(const std::filesystem::path& path);
    [[nodiscard]] static std::expected<Settings, AppError> parse(std::string_view json_text);

    // Range checks shared by load() and command-line overrides
    [[nodiscard]] std::expected<void, AppError> validate() const;

    // <temp>/reelsplit when work_dir is unset
    [[nodiscard]] std::filesystem::path effective_work_dir() const;
};

} // namespace reelsplit::core
