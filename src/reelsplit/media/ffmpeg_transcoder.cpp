// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/media/ffmpeg_transcoder.hpp>
#include <reelsplit/core/log.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>
#include <cmath>

namespace reelsplit::media {

using core::EngineErrc;
using core::EngineFailure;
using json = nlohmann::json;

namespace {

std::string seconds_arg(std::int64_t ms) {
    return fmt::format("{:.3f}", static_cast<double>(ms) / 1000.0);
}

EngineFailure spawn_failure(std::error_code ec, const std::string& tool) {
    if (ec == EngineErrc::engine_not_found) {
        return {ec, tool + " is not installed"};
    }
    return {ec, fmt::format("Failed to start {}: {}", tool, ec.message())};
}

std::string last_line(const std::string& text) {
    auto end = text.find_last_not_of("\r\n ");
    if (end == std::string::npos) return {};
    auto start = text.rfind('\n', end);
    return text.substr(start == std::string::npos ? 0 : start + 1, end - (start == std::string::npos ? 0 : start + 1) + 1);
}

} // namespace

//=============================================================================
// FfmpegTranscoder
//=============================================================================

FfmpegTranscoder::FfmpegTranscoder(std::string ffmpeg, std::string ffprobe)
    : ffmpeg_(std::move(ffmpeg))
    , ffprobe_(std::move(ffprobe)) {}

FfmpegTranscoder::~FfmpegTranscoder() {
    std::map<ClipHandle, std::unique_ptr<Job>> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs.swap(jobs_);
    }
    // Terminate first, then let each jthread join on destruction
    for (auto& [handle, job] : jobs) {
        job->process->terminate();
    }
    for (auto& [handle, job] : jobs) {
        if (job->watcher.joinable()) {
            job->watcher.join();
        }
    }
}

std::expected<std::int64_t, EngineFailure>
FfmpegTranscoder::probe_duration_ms(const std::filesystem::path& input) {
    std::vector<std::string> argv{
        ffprobe_,
        "-v", "error",
        "-show_entries", "format=duration",
        "-of", "json",
        input.string(),
    };
    auto result = run_process(argv);
    if (!result) {
        return std::unexpected(spawn_failure(result.error(), ffprobe_));
    }
    if (!result->ok()) {
        return std::unexpected(EngineFailure{make_error_code(EngineErrc::probe_failed), last_line(result->err)});
    }
    return parse_probe(result->out);
}

std::expected<std::int64_t, EngineFailure> FfmpegTranscoder::parse_probe(const std::string& json_text) {
    try {
        auto doc = json::parse(json_text);
        if (!doc.contains("format") || !doc["format"].contains("duration")) {
            return std::unexpected(EngineFailure{make_error_code(EngineErrc::probe_failed),
                                                 "No duration in probe output"});
        }
        const auto& value = doc["format"]["duration"];
        // ffprobe prints the duration as a string
        double seconds = value.is_string() ? std::stod(value.get<std::string>()) : value.get<double>();
        if (!std::isfinite(seconds)) {
            return std::unexpected(EngineFailure{make_error_code(EngineErrc::probe_failed),
                                                 "Duration is not a number"});
        }
        return static_cast<std::int64_t>(std::llround(seconds * 1000.0));
    } catch (const json::exception& e) {
        return std::unexpected(EngineFailure{make_error_code(EngineErrc::probe_failed), e.what()});
    } catch (const std::logic_error& e) {
        return std::unexpected(EngineFailure{make_error_code(EngineErrc::probe_failed), e.what()});
    }
}

std::vector<std::string> FfmpegTranscoder::clip_arguments(const ClipRequest& request) const {
    return {
        ffmpeg_,
        "-y",
        "-hide_banner",
        "-loglevel", "error",
        "-ss", seconds_arg(request.start_ms),
        "-i", request.input.string(),
        "-t", seconds_arg(request.end_ms - request.start_ms),
        "-c:v", "libx264",
        "-preset", "veryfast",
        "-c:a", "aac",
        "-avoid_negative_ts", "make_zero",
        "-movflags", "+faststart",
        request.output.string(),
    };
}

std::expected<ClipHandle, EngineFailure>
FfmpegTranscoder::start_clip(const ClipRequest& request, ClipCallbacks callbacks) {
    if (request.end_ms <= request.start_ms) {
        return std::unexpected(EngineFailure{make_error_code(EngineErrc::invalid_argument), "Empty clip range"});
    }
    reap_finished();

    auto argv = clip_arguments(request);
    auto process = Subprocess::spawn(argv, Subprocess::Output::discard);
    if (!process) {
        return std::unexpected(spawn_failure(process.error(), ffmpeg_));
    }

    auto job = std::make_unique<Job>();
    job->process = std::move(*process);
    auto* raw = job.get();

    ClipHandle handle = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handle = next_handle_++;
        // Watcher starts under the lock so cancel() always finds the job
        raw->watcher = std::jthread([raw, callbacks = std::move(callbacks), output = request.output] {
            auto result = raw->process->wait();
            raw->finished.store(true, std::memory_order_release);
            if (!result) {
                if (callbacks.on_error) {
                    callbacks.on_error(EngineFailure{result.error()});
                }
                return;
            }
            if (!result->ok()) {
                if (callbacks.on_error) {
                    callbacks.on_error(EngineFailure{make_error_code(EngineErrc::engine_failure),
                        fmt::format("ffmpeg exited with {}: {}", result->exit_code, last_line(result->err))});
                }
                return;
            }
            REELSPLIT_LOG_DEBUG("Clip written to {}", output.string());
            if (callbacks.on_complete) {
                callbacks.on_complete();
            }
        });
        jobs_.emplace(handle, std::move(job));
    }
    return handle;
}

void FfmpegTranscoder::cancel(ClipHandle handle) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(handle);
    if (it == jobs_.end()) return;
    if (!it->second->finished.load(std::memory_order_acquire)) {
        REELSPLIT_LOG_DEBUG("Cancelling clip {}", handle);
        it->second->process->terminate();
    }
}

void FfmpegTranscoder::reap_finished() {
    std::vector<std::unique_ptr<Job>> done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = jobs_.begin(); it != jobs_.end();) {
            if (it->second->finished.load(std::memory_order_acquire)) {
                done.push_back(std::move(it->second));
                it = jobs_.erase(it);
            } else {
                ++it;
            }
        }
    }
    // Joins outside the lock
    done.clear();
}

} // namespace reelsplit::media
