// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spdlog/fmt/fmt.h>
#include <cstdint>
#include <string>
#include <string_view>

namespace reelsplit {

constexpr std::string_view PRODUCT_NAME = "ReelSplit";

constexpr struct Version {
    std::uint32_t major = 0;
    std::uint32_t minor = 3;
    std::uint32_t patch = 0;

    // "0.3.0"
    [[nodiscard]] std::string to_string() const {
        return fmt::format("{}.{}.{}", major, minor, patch);
    }

    // "ReelSplit 0.3.0 (Oct 19 2026)"
    [[nodiscard]] std::string banner() const {
        return fmt::format("{} {} ({})", PRODUCT_NAME, to_string(), __DATE__);
    }
} version;

} // namespace reelsplit
