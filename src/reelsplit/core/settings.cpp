// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/core/settings.hpp>
#include <reelsplit/core/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace reelsplit::core {

namespace {

using json = nlohmann::json;

AppError invalid(std::string message) {
    return make_error(ErrorKind::invalid_input, std::move(message), std::nullopt, false);
}

template<typename T>
void read_if_present(const json& j, const char* key, T& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = j[key].get<T>();
    }
}

void read_ms(const json& j, const char* key, std::chrono::milliseconds& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = std::chrono::milliseconds(j[key].get<std::int64_t>());
    }
}

void read_seconds(const json& j, const char* key, std::chrono::milliseconds& out) {
    if (j.contains(key) && !j[key].is_null()) {
        out = std::chrono::milliseconds(static_cast<std::int64_t>(j[key].get<double>() * 1000.0));
    }
}

} // namespace

std::expected<Settings, AppError> Settings::load(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        auto err = make_error(ErrorKind::storage,
                              "Cannot read settings file " + path.string(), std::nullopt, false);
        err.path = path.string();
        return std::unexpected(std::move(err));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    REELSPLIT_LOG_DEBUG("Loading settings from {}", path.string());
    return parse(buffer.str());
}

std::expected<Settings, AppError> Settings::parse(std::string_view json_text) {
    Settings settings;
    try {
        auto j = json::parse(json_text);
        if (!j.is_object()) {
            return std::unexpected(invalid("Settings must be a JSON object"));
        }

        if (j.contains("work_dir") && j["work_dir"].is_string()) {
            settings.work_dir = j["work_dir"].get<std::string>();
        }
        read_seconds(j, "segment_seconds", settings.segment_duration);
        read_seconds(j, "min_trailing_seconds", settings.min_trailing);
        read_if_present(j, "max_attempts", settings.retry.max_attempts);
        read_ms(j, "retry_initial_backoff_ms", settings.retry.initial_backoff);
        read_if_present(j, "retry_backoff_multiplier", settings.retry.multiplier);
        read_ms(j, "retry_max_backoff_ms", settings.retry.max_backoff);
        read_if_present(j, "log_level", settings.log_level);

        if (j.contains("tools")) {
            const auto& tools = j["tools"];
            read_if_present(tools, "yt_dlp", settings.tools.yt_dlp);
            read_if_present(tools, "ffmpeg", settings.tools.ffmpeg);
            read_if_present(tools, "ffprobe", settings.tools.ffprobe);
        }
        if (j.contains("transfer")) {
            const auto& transfer = j["transfer"];
            read_if_present(transfer, "connect_timeout_sec", settings.transfer.connect_timeout_sec);
            read_if_present(transfer, "low_speed_timeout_sec", settings.transfer.low_speed_timeout_sec);
            read_if_present(transfer, "user_agent", settings.transfer.user_agent);
        }
        if (j.contains("cache")) {
            std::int64_t hours = settings.cache_max_age.count();
            read_if_present(j["cache"], "max_age_hours", hours);
            settings.cache_max_age = std::chrono::hours(hours);
        }
    } catch (const json::exception& e) {
        return std::unexpected(invalid(std::string("Malformed settings: ") + e.what()));
    }

    if (auto ok = settings.validate(); !ok) {
        return std::unexpected(ok.error());
    }
    return settings;
}

std::expected<void, AppError> Settings::validate() const {
    if (segment_duration < MIN_SEGMENT_DURATION) {
        return std::unexpected(invalid("segment_seconds must be at least 1 second"));
    }
    if (min_trailing.count() < 0 || min_trailing >= segment_duration) {
        return std::unexpected(invalid("min_trailing_seconds must be between 0 and segment_seconds"));
    }
    if (retry.max_attempts == 0) {
        return std::unexpected(invalid("max_attempts must be at least 1"));
    }
    if (retry.initial_backoff.count() < 0 || retry.max_backoff < retry.initial_backoff) {
        return std::unexpected(invalid("retry backoff window is invalid"));
    }
    if (retry.multiplier < 1.0) {
        return std::unexpected(invalid("retry_backoff_multiplier must be >= 1"));
    }
    if (!parse_log_level(log_level)) {
        return std::unexpected(invalid("Unknown log_level '" + log_level + "'"));
    }
    if (tools.yt_dlp.empty() || tools.ffmpeg.empty() || tools.ffprobe.empty()) {
        return std::unexpected(invalid("Tool paths must not be empty"));
    }
    if (cache_max_age.count() <= 0) {
        return std::unexpected(invalid("cache.max_age_hours must be positive"));
    }
    return {};
}

std::filesystem::path Settings::effective_work_dir() const {
    if (!work_dir.empty()) {
        return work_dir;
    }
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    if (ec) {
        tmp = ".";
    }
    return tmp / "reelsplit";
}

} // namespace reelsplit::core
