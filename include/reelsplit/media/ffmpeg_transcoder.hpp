// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/media/subprocess.hpp>
#include <reelsplit/media/transcoder.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace reelsplit::media {

// Transcoding through the ffprobe/ffmpeg command-line tools. Each clip runs
// as its own child process watched by a dedicated thread.
class FfmpegTranscoder final : public TranscodeEngine {
public:
    FfmpegTranscoder(std::string ffmpeg = "ffmpeg", std::string ffprobe = "ffprobe");
    ~FfmpegTranscoder() override;

    FfmpegTranscoder(const FfmpegTranscoder&) = delete;
    FfmpegTranscoder& operator=(const FfmpegTranscoder&) = delete;

    [[nodiscard]] std::expected<std::int64_t, core::EngineFailure>
    probe_duration_ms(const std::filesystem::path& input) override;

    [[nodiscard]] std::expected<ClipHandle, core::EngineFailure>
    start_clip(const ClipRequest& request, ClipCallbacks callbacks) override;

    void cancel(ClipHandle handle) noexcept override;

    [[nodiscard]] std::vector<std::string> clip_arguments(const ClipRequest& request) const;

    // Reads format.duration from ffprobe JSON output
    [[nodiscard]] static std::expected<std::int64_t, core::EngineFailure>
    parse_probe(const std::string& json_text);

private:
    struct Job {
        std::unique_ptr<Subprocess> process;
        std::jthread watcher;
        std::atomic<bool> finished{false};
    };

    void reap_finished();

    std::string ffmpeg_;
    std::string ffprobe_;
    std::map<ClipHandle, std::unique_ptr<Job>> jobs_;
    ClipHandle next_handle_{1};
    std::mutex mutex_;
};

} // namespace reelsplit::media
