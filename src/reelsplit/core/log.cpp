// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace reelsplit::core {

namespace {

constexpr const char* LOGGER_NAME = "reelsplit";
constexpr const char* LOG_LEVEL_ENV = "REELSPLIT_LOG_LEVEL";

std::shared_ptr<spdlog::logger> make_logger() {
    if (auto existing = spdlog::get(LOGGER_NAME)) {
        return existing;
    }
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto created = std::make_shared<spdlog::logger>(LOGGER_NAME, std::move(sink));
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    created->set_level(spdlog::level::info);
    spdlog::register_logger(created);
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> const& logger() {
    static std::shared_ptr<spdlog::logger> instance = make_logger();
    return instance;
}

std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto level = spdlog::level::from_str(lowered);
    // from_str falls back to "off" for unknown names
    if (level == spdlog::level::off && lowered != "off") {
        return std::nullopt;
    }
    return level;
}

void init_logging() {
    auto level = spdlog::level::info;
    if (const char* env = std::getenv(LOG_LEVEL_ENV)) {
        if (auto parsed = parse_log_level(env)) {
            level = *parsed;
        } else {
            logger()->warn("Ignoring unknown {} value '{}'", LOG_LEVEL_ENV, env);
        }
    }
    set_log_level(level);
}

void set_log_level(spdlog::level::level_enum level) noexcept {
    logger()->set_level(level);
}

} // namespace reelsplit::core
