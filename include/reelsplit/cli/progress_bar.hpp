// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace reelsplit::cli {

// Single-line terminal progress bar
class ProgressBar {
public:
    enum class Unit : std::uint8_t {
        bytes,      // "(1.2 MB/4.0 MB) @ 512 KB/s ETA: 6s"
        percent,    // Plain percentage, total is 100
    };

    ProgressBar(std::uint64_t total, std::string_view label = {}, Unit unit = Unit::bytes);

    // Redraws when the whole-percent value advances
    void update(std::uint64_t current, std::uint64_t speed_bps = 0);

    void finish();

    // Clear the progress bar line
    void clear();

    [[nodiscard]] std::uint64_t total() const noexcept { return total_; }
    void total(std::uint64_t t) noexcept { total_ = t; }

    [[nodiscard]] const std::string& label() const noexcept { return label_; }
    void label(std::string_view l) { label_ = l; }

    [[nodiscard]] std::string render_line(std::uint64_t current, std::uint64_t speed_bps) const;

    [[nodiscard]] static std::string render_bar(double percent, int width = 30);
    [[nodiscard]] static std::string format_speed(std::uint64_t bps);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);
    [[nodiscard]] static std::string format_time(std::uint64_t seconds);

private:
    std::uint64_t total_{0};
    int last_percent_{-1};
    std::string label_;
    Unit unit_;
    bool finished_{false};
};

} // namespace reelsplit::cli
