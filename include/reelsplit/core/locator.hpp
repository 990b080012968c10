// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/core/error.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace reelsplit::core {

// A share link that passed the allow-list
struct Locator {
    std::string url;
    std::string reel_id;
};

// Allow-list check: instagram.com / instagr.am with a /reel/, /reels/, /p/
// or /tv/ path (optionally under /share/) followed by a content id.
[[nodiscard]] std::expected<Locator, std::error_code> parse_locator(std::string_view text);

[[nodiscard]] inline bool is_supported_locator(std::string_view text) {
    return parse_locator(text).has_value();
}

// First share link found inside free-form shared text
[[nodiscard]] std::optional<Locator> extract_locator(std::string_view shared_text);

} // namespace reelsplit::core
