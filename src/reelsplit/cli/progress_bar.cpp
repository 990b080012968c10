// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/cli/progress_bar.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace reelsplit::cli {

namespace {

constexpr std::uint64_t KB = 1024;
constexpr std::uint64_t MB = 1024 * KB;
constexpr std::uint64_t GB = 1024 * MB;

double percent_of(std::uint64_t current, std::uint64_t total) noexcept {
    if (total == 0) return 0.0;
    return std::clamp(static_cast<double>(current) * 100.0 / static_cast<double>(total), 0.0, 100.0);
}

} // namespace

//=============================================================================
// ProgressBar
//=============================================================================

ProgressBar::ProgressBar(std::uint64_t total, std::string_view label, Unit unit)
    : total_(total)
    , label_(label)
    , unit_(unit) {}

void ProgressBar::update(std::uint64_t current, std::uint64_t speed_bps) {
    if (total_ == 0 || finished_) return;

    auto percent = static_cast<int>(percent_of(current, total_));
    if (percent <= last_percent_ && current != total_) return;
    last_percent_ = percent;

    std::cout << render_line(current, speed_bps) << std::flush;
}

void ProgressBar::finish() {
    if (finished_) return;
    if (total_ > 0) {
        std::cout << render_line(total_, 0);
    }
    finished_ = true;
    std::cout << std::endl;
}

void ProgressBar::clear() {
    std::cout << "\r" << std::string(80, ' ') << "\r" << std::flush;
}

std::string ProgressBar::render_line(std::uint64_t current, std::uint64_t speed_bps) const {
    const double percent = percent_of(current, total_);

    std::string line = "\r";
    if (!label_.empty()) {
        line += label_;
        line += ": ";
    }
    line += render_bar(percent);
    line += fmt::format(" {:>3}%", static_cast<int>(percent));

    if (unit_ == Unit::bytes) {
        line += fmt::format(" ({}/{})", format_bytes(current), format_bytes(total_));
        if (speed_bps > 0) {
            line += " @ ";
            line += format_speed(speed_bps);
            if (current < total_) {
                line += " ETA: ";
                line += format_time((total_ - current) / speed_bps);
            }
        }
    }

    // Clear rest of line
    line += std::string(10, ' ');
    return line;
}

std::string ProgressBar::render_bar(double percent, int width) {
    const int filled = static_cast<int>(std::round(width * std::clamp(percent, 0.0, 100.0) / 100.0));

    std::string bar = "[";
    bar.append(static_cast<std::size_t>(filled), '=');
    if (filled < width) {
        bar += '>';
        bar.append(static_cast<std::size_t>(width - filled - 1), ' ');
    }
    bar += "]";
    return bar;
}

std::string ProgressBar::format_speed(std::uint64_t bps) {
    if (bps >= GB) return fmt::format("{:.1f} GB/s", static_cast<double>(bps) / GB);
    if (bps >= MB) return fmt::format("{:.1f} MB/s", static_cast<double>(bps) / MB);
    if (bps >= KB) return fmt::format("{:.1f} KB/s", static_cast<double>(bps) / KB);
    return fmt::format("{} B/s", bps);
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    if (bytes >= GB) return fmt::format("{:.2f} GB", static_cast<double>(bytes) / GB);
    if (bytes >= MB) return fmt::format("{:.1f} MB", static_cast<double>(bytes) / MB);
    if (bytes >= KB) return fmt::format("{:.0f} KB", static_cast<double>(bytes) / KB);
    return fmt::format("{} B", bytes);
}

std::string ProgressBar::format_time(std::uint64_t seconds) {
    std::uint64_t hours = seconds / 3600;
    std::uint64_t minutes = (seconds % 3600) / 60;
    std::uint64_t secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h {:02}m {}s", hours, minutes, secs);
    }
    if (minutes > 0) {
        return fmt::format("{}m {}s", minutes, secs);
    }
    return fmt::format("{}s", secs);
}

} // namespace reelsplit::cli
