// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string_view>

namespace reelsplit::core {

// Shared "reelsplit" logger, created on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> const& logger();

// Level from REELSPLIT_LOG_LEVEL, falling back to info
void init_logging();

void set_log_level(spdlog::level::level_enum level) noexcept;

[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(std::string_view name);

} // namespace reelsplit::core

#define REELSPLIT_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::reelsplit::core::logger(), __VA_ARGS__)
#define REELSPLIT_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::reelsplit::core::logger(), __VA_ARGS__)
#define REELSPLIT_LOG_INFO(...) SPDLOG_LOGGER_INFO(::reelsplit::core::logger(), __VA_ARGS__)
#define REELSPLIT_LOG_WARN(...) SPDLOG_LOGGER_WARN(::reelsplit::core::logger(), __VA_ARGS__)
#define REELSPLIT_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::reelsplit::core::logger(), __VA_ARGS__)
#define REELSPLIT_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::reelsplit::core::logger(), __VA_ARGS__)
