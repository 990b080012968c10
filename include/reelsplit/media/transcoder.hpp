// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/core/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>

namespace reelsplit::media {

// Clip [start_ms, end_ms) of input into output
struct ClipRequest {
    std::filesystem::path input;
    std::filesystem::path output;
    std::int64_t start_ms{0};
    std::int64_t end_ms{0};
};

using ClipHandle = std::uint64_t;

// Exactly one of these fires per started clip, on an engine thread
struct ClipCallbacks {
    std::function<void()> on_complete;
    std::function<void(core::EngineFailure)> on_error;
};

// External media engine. start_clip() may have thread affinity: callers
// submit it through the engine's required context.
class TranscodeEngine {
public:
    virtual ~TranscodeEngine() = default;

    [[nodiscard]] virtual std::expected<std::int64_t, core::EngineFailure>
    probe_duration_ms(const std::filesystem::path& input) = 0;

    [[nodiscard]] virtual std::expected<ClipHandle, core::EngineFailure>
    start_clip(const ClipRequest& request, ClipCallbacks callbacks) = 0;

    virtual void cancel(ClipHandle handle) noexcept = 0;
};

} // namespace reelsplit::media
