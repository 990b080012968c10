// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/media/ytdlp_resolver.hpp>
#include <reelsplit/media/subprocess.hpp>
#include <reelsplit/core/log.hpp>
#include <nlohmann/json.hpp>

namespace reelsplit::media {

using core::EngineErrc;
using core::EngineFailure;
using json = nlohmann::json;

YtDlpResolver::YtDlpResolver(std::string executable)
    : executable_(std::move(executable)) {}

std::expected<std::string, EngineFailure>
YtDlpResolver::resolve(const std::string& locator, std::stop_token stop) {
    std::vector<std::string> argv{
        executable_,
        "-J",
        "-f", "best[ext=mp4]",
        "--no-playlist",
        "--no-warnings",
        locator,
    };

    auto result = run_process(argv, stop);
    if (!result) {
        if (result.error() == EngineErrc::engine_not_found) {
            return std::unexpected(EngineFailure{result.error(), executable_ + " is not installed"});
        }
        return std::unexpected(EngineFailure{result.error()});
    }
    if (!result->ok()) {
        REELSPLIT_LOG_DEBUG("yt-dlp exited with {}: {}", result->exit_code, result->err);
        return std::unexpected(core::classify_engine_message(result->err));
    }
    return parse_info(result->out);
}

std::expected<std::string, EngineFailure> YtDlpResolver::parse_info(const std::string& json_text) {
    try {
        auto info = json::parse(json_text);
        if (info.contains("url") && info["url"].is_string()) {
            return info["url"].get<std::string>();
        }
        if (info.contains("requested_downloads") && info["requested_downloads"].is_array() &&
            !info["requested_downloads"].empty()) {
            const auto& first = info["requested_downloads"][0];
            if (first.contains("url") && first["url"].is_string()) {
                return first["url"].get<std::string>();
            }
        }
        return std::unexpected(EngineFailure{make_error_code(EngineErrc::empty_result),
                                             "No URL found in video info"});
    } catch (const json::exception& e) {
        return std::unexpected(EngineFailure{make_error_code(EngineErrc::engine_failure),
                                             std::string("Unreadable video info: ") + e.what()});
    }
}

} // namespace reelsplit::media
