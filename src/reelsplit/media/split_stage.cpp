// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/media/split_stage.hpp>
#include <reelsplit/media/split_plan.hpp>
#include <reelsplit/core/channel.hpp>
#include <reelsplit/core/log.hpp>
#include <reelsplit/disk/file_ops.hpp>
#include <algorithm>
#include <cctype>
#include <memory>
#include <optional>
#include <spdlog/fmt/fmt.h>

namespace reelsplit::media {

namespace fs = std::filesystem;

using core::AppError;
using core::EngineErrc;
using core::EngineFailure;
using core::ErrorKind;
using core::PipelineStage;

namespace {

// Terminal outcome of one clip; empty failure means success
struct ClipOutcome {
    std::optional<EngineFailure> failure;
};

std::string extension_of(const fs::path& input) {
    auto ext = input.extension().string();
    if (ext.size() <= 1) {
        return std::string(core::DEFAULT_MEDIA_EXTENSION);
    }
    ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

AppError storage_failure(std::error_code ec, const fs::path& path, std::string message) {
    auto err = core::classify(EngineFailure{ec, std::move(message)}, PipelineStage::split);
    err.kind = ErrorKind::storage;
    err.retryable = false;
    err.path = path.string();
    return err;
}

AppError processing_failure(std::error_code ec, std::string message) {
    auto err = core::make_error(ErrorKind::processing, std::move(message), PipelineStage::split, false);
    err.code = ec;
    return err;
}

void rollback(const std::vector<fs::path>& produced) {
    for (const auto& path : produced) {
        disk::remove_file(path);
    }
    if (!produced.empty()) {
        REELSPLIT_LOG_INFO("Rolled back {} segment files", produced.size());
    }
}

} // namespace

std::expected<SplitResult, AppError>
SplitStage::split(const fs::path& input,
                  const fs::path& output_dir,
                  const SplitOptions& options,
                  const SplitProgressFn& on_progress,
                  std::stop_token stop) {
    if (options.target < core::MIN_SEGMENT_DURATION) {
        return std::unexpected(core::classify(
            EngineFailure{make_error_code(EngineErrc::invalid_argument),
                          fmt::format("Segment duration must be at least {} ms",
                                      core::MIN_SEGMENT_DURATION.count())},
            PipelineStage::split));
    }

    if (auto ec = disk::check_readable(input)) {
        return std::unexpected(storage_failure(ec, input,
            fmt::format("Input file is missing or unreadable: {}", input.string())));
    }
    if (auto ec = disk::ensure_writable_directory(output_dir)) {
        return std::unexpected(storage_failure(ec, output_dir,
            fmt::format("Cannot write to output directory: {}", output_dir.string())));
    }

    if (stop.stop_requested()) {
        return std::unexpected(core::cancelled_error(PipelineStage::split));
    }

    auto duration = engine_.probe_duration_ms(input);
    if (!duration) {
        if (duration.error().cancelled()) {
            return std::unexpected(core::cancelled_error(PipelineStage::split));
        }
        REELSPLIT_LOG_ERROR("Probe failed for {}: {}", input.string(), duration.error().detail);
        return std::unexpected(processing_failure(make_error_code(EngineErrc::probe_failed),
            "Could not read video duration. The file may be corrupted."));
    }
    if (*duration <= 0) {
        return std::unexpected(processing_failure(make_error_code(EngineErrc::probe_failed),
            "Invalid video duration. The file may be corrupted."));
    }

    SplitResult result;
    result.source_duration_ms = *duration;

    // Short videos are handed back untouched
    if (*duration <= options.target.count()) {
        auto size = disk::file_size(input);
        if (!size) {
            return std::unexpected(storage_failure(size.error(), input, "Cannot read input file size"));
        }
        store::SplitPart part;
        part.part_number = 1;
        part.total_parts = 1;
        part.file_path = input;
        part.start_ms = 0;
        part.end_ms = *duration;
        part.size_bytes = *size;
        part.references_source = true;
        result.parts.push_back(std::move(part));
        REELSPLIT_LOG_INFO("Video is {} ms, no split needed", *duration);
        return result;
    }

    auto ranges = plan_segments(*duration, options.target.count(), options.min_trailing.count());
    const auto total = static_cast<std::uint32_t>(ranges.size());
    const auto ext = extension_of(input);
    REELSPLIT_LOG_INFO("Splitting {} ms into {} parts", *duration, total);

    std::vector<fs::path> produced;
    produced.reserve(ranges.size());

    for (std::uint32_t i = 0; i < total; ++i) {
        const auto part_number = i + 1;
        const auto& range = ranges[i];

        if (on_progress) on_progress({part_number, total, 0.0});

        ClipRequest request{input, output_dir / segment_file_name(part_number, ext),
                            range.start_ms, range.end_ms};

        auto clipped = run_clip(request, stop);
        if (!clipped) {
            disk::remove_file(request.output);
            rollback(produced);
            return std::unexpected(clipped.error());
        }

        auto size = disk::file_size(request.output);
        if (!size || *size == 0) {
            disk::remove_file(request.output);
            rollback(produced);
            return std::unexpected(processing_failure(
                size ? make_error_code(disk::DiskErrc::empty_file) : size.error(),
                fmt::format("Segment {} was not created", part_number)));
        }
        produced.push_back(request.output);

        store::SplitPart part;
        part.part_number = part_number;
        part.total_parts = total;
        part.file_path = request.output;
        part.start_ms = range.start_ms;
        part.end_ms = range.end_ms;
        part.size_bytes = *size;
        result.parts.push_back(std::move(part));

        if (on_progress) on_progress({part_number, total, 1.0});
    }

    result.was_split = true;
    return result;
}

std::expected<void, AppError> SplitStage::run_clip(const ClipRequest& request, std::stop_token stop) {
    if (stop.stop_requested()) {
        return std::unexpected(core::cancelled_error(PipelineStage::split));
    }

    auto channel = std::make_shared<core::Channel<ClipOutcome>>();
    auto settled = std::make_shared<core::Completion>();
    ClipCallbacks callbacks;
    callbacks.on_complete = [channel, settled] {
        channel->send(ClipOutcome{});
        channel->close();
        settled->set();
    };
    callbacks.on_error = [channel, settled](EngineFailure failure) {
        channel->send(ClipOutcome{std::move(failure)});
        channel->close();
        settled->set();
    };

    REELSPLIT_LOG_DEBUG("Clipping [{}, {}) ms into {}", request.start_ms, request.end_ms,
                        request.output.string());

    auto handle = core::run_on(clip_context_, [&] {
        return engine_.start_clip(request, callbacks);
    });
    if (!handle) {
        return std::unexpected(core::classify(handle.error(), PipelineStage::split));
    }

    auto* engine = &engine_;
    channel->on_cancel([engine, id = *handle] { engine->cancel(id); });
    std::stop_callback on_stop(stop, [channel] { channel->cancel(); });

    auto outcome = channel->receive();
    if (!outcome || stop.stop_requested()) {
        // ffmpeg finalizes its output after SIGTERM; roll back only once it exits
        settled->wait();
        return std::unexpected(core::cancelled_error(PipelineStage::split));
    }
    if (outcome->failure) {
        if (outcome->failure->cancelled()) {
            return std::unexpected(core::cancelled_error(PipelineStage::split));
        }
        auto err = core::classify(*outcome->failure, PipelineStage::split);
        REELSPLIT_LOG_ERROR("Clip {} failed: {}", request.output.string(), err.message);
        return std::unexpected(std::move(err));
    }
    return {};
}

} // namespace reelsplit::media
