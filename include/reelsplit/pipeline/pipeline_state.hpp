// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/core/error.hpp>
#include <reelsplit/store/segment.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace reelsplit::pipeline {

namespace state {

struct Idle {};

struct Resolving {
    std::string locator;
};

struct Transferring {
    int percent{0};
    std::uint64_t bytes_done{0};
    std::uint64_t bytes_total{0};
    std::uint64_t bytes_per_second{0};
    std::uint32_t attempt{1};
};

struct Splitting {
    std::uint32_t current_part{0};
    std::uint32_t total_parts{0};
    int percent{0};
};

struct Complete {
    std::string video_id;
    std::vector<store::Segment> segments;
};

struct Failed {
    std::optional<core::PipelineStage> stage;
    std::string message;
    bool retryable{false};
    core::ErrorKind kind{core::ErrorKind::unknown};
};

// User-initiated stop, not an error
struct Cancelled {
    std::optional<core::PipelineStage> stage;
};

} // namespace state

// Exactly one alternative is active. Every consumer matches all of them.
using PipelineState = std::variant<
    state::Idle,
    state::Resolving,
    state::Transferring,
    state::Splitting,
    state::Complete,
    state::Failed,
    state::Cancelled>;

[[nodiscard]] bool is_terminal(const PipelineState& s) noexcept;

// Stage a state belongs to; nullopt for Idle and terminal states
[[nodiscard]] std::optional<core::PipelineStage> active_stage(const PipelineState& s) noexcept;

[[nodiscard]] std::string_view state_name(const PipelineState& s) noexcept;

// One-line human readable summary
[[nodiscard]] std::string describe(const PipelineState& s);

} // namespace reelsplit::pipeline
