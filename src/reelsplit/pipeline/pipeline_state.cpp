// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/pipeline/pipeline_state.hpp>
#include <reelsplit/core/overloaded.hpp>
#include <spdlog/fmt/fmt.h>

namespace reelsplit::pipeline {

using core::overloaded;
using core::PipelineStage;

bool is_terminal(const PipelineState& s) noexcept {
    return std::visit(overloaded{
        [](const state::Idle&) { return false; },
        [](const state::Resolving&) { return false; },
        [](const state::Transferring&) { return false; },
        [](const state::Splitting&) { return false; },
        [](const state::Complete&) { return true; },
        [](const state::Failed&) { return true; },
        [](const state::Cancelled&) { return true; },
    }, s);
}

std::optional<PipelineStage> active_stage(const PipelineState& s) noexcept {
    return std::visit(overloaded{
        [](const state::Idle&) -> std::optional<PipelineStage> { return std::nullopt; },
        [](const state::Resolving&) -> std::optional<PipelineStage> { return PipelineStage::resolve; },
        [](const state::Transferring&) -> std::optional<PipelineStage> { return PipelineStage::transfer; },
        [](const state::Splitting&) -> std::optional<PipelineStage> { return PipelineStage::split; },
        [](const state::Complete&) -> std::optional<PipelineStage> { return std::nullopt; },
        [](const state::Failed&) -> std::optional<PipelineStage> { return std::nullopt; },
        [](const state::Cancelled&) -> std::optional<PipelineStage> { return std::nullopt; },
    }, s);
}

std::string_view state_name(const PipelineState& s) noexcept {
    return std::visit(overloaded{
        [](const state::Idle&) -> std::string_view { return "idle"; },
        [](const state::Resolving&) -> std::string_view { return "resolving"; },
        [](const state::Transferring&) -> std::string_view { return "transferring"; },
        [](const state::Splitting&) -> std::string_view { return "splitting"; },
        [](const state::Complete&) -> std::string_view { return "complete"; },
        [](const state::Failed&) -> std::string_view { return "failed"; },
        [](const state::Cancelled&) -> std::string_view { return "cancelled"; },
    }, s);
}

std::string describe(const PipelineState& s) {
    return std::visit(overloaded{
        [](const state::Idle&) { return std::string("Waiting to start"); },
        [](const state::Resolving&) { return std::string("Fetching video info..."); },
        [](const state::Transferring& t) {
            if (t.attempt > 1) {
                return fmt::format("Downloading video... {}% (attempt {})", t.percent, t.attempt);
            }
            return fmt::format("Downloading video... {}%", t.percent);
        },
        [](const state::Splitting& sp) {
            if (sp.total_parts == 0) {
                return std::string("Preparing to split...");
            }
            return fmt::format("Splitting part {} of {}...", sp.current_part, sp.total_parts);
        },
        [](const state::Complete& c) {
            return fmt::format("Done: {} segment{}", c.segments.size(), c.segments.size() == 1 ? "" : "s");
        },
        [](const state::Failed& f) {
            if (!f.stage) return fmt::format("Failed: {}", f.message);
            return fmt::format("{} failed: {}", core::to_string(*f.stage), f.message);
        },
        [](const state::Cancelled&) { return std::string("Cancelled"); },
    }, s);
}

} // namespace reelsplit::pipeline
