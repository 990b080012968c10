// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <chrono>
#include <string_view>

namespace reelsplit::core {

// Transfer
constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t IO_TIMEOUT_SEC = 60;                        // Low-speed abort window
constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;
constexpr std::size_t WRITE_BUFFER_SIZE = 256 * 1024;               // 256 KB
constexpr std::uint64_t SMALL_FILE_WARNING_BYTES = 1024;            // Suspiciously small download
constexpr std::string_view DEFAULT_USER_AGENT = "reelsplit/0.3";

// Retry policy (total attempts = RETRY_COUNT + 1)
constexpr std::uint32_t RETRY_COUNT = 3;
constexpr std::uint32_t MAX_ATTEMPTS = RETRY_COUNT + 1;
constexpr std::chrono::milliseconds INITIAL_BACKOFF{1000};
constexpr double BACKOFF_MULTIPLIER = 2.0;
constexpr std::chrono::milliseconds MAX_BACKOFF{30000};

// Share target limits
constexpr std::chrono::milliseconds STATUS_MAX_DURATION{90'000};
constexpr std::chrono::milliseconds STATUS_SAFETY_MARGIN{1'000};
constexpr std::uint64_t STATUS_MAX_BYTES = 16ull * 1024 * 1024;
constexpr std::uint64_t STATUS_SIZE_MARGIN = 500ull * 1024;

// Split
constexpr std::chrono::milliseconds DEFAULT_SEGMENT_DURATION = STATUS_MAX_DURATION - STATUS_SAFETY_MARGIN;
constexpr std::chrono::milliseconds MIN_TRAILING_DURATION{5'000};
constexpr std::chrono::milliseconds MIN_SEGMENT_DURATION{1'000};
constexpr std::string_view DEFAULT_MEDIA_EXTENSION = "mp4";

// Files
constexpr std::size_t MAX_FILE_NAME_LENGTH = 255;
constexpr std::string_view WORK_FILE_PREFIX = "reelsplit_";
constexpr std::string_view SEGMENT_DIR_PREFIX = "segments_";
constexpr std::string_view WORK_CACHE_DIR = "videos";

// Execution
constexpr std::uint32_t IO_POOL_THREADS = 4;

} // namespace reelsplit::core
