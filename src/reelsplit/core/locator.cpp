// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/core/locator.hpp>
#include <reelsplit/core/url.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <regex>

namespace reelsplit::core {

namespace {

constexpr std::array<std::string_view, 4> ALLOWED_HOSTS{
    "instagram.com", "www.instagram.com", "instagr.am", "www.instagr.am"};

constexpr std::array<std::string_view, 4> CONTENT_KINDS{"reel", "reels", "p", "tv"};

bool valid_id(std::string_view id) {
    return !id.empty() && std::all_of(id.begin(), id.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

const std::regex& url_pattern() {
    static const std::regex pattern(R"(https?://[^\s<>"']+)", std::regex::ECMAScript | std::regex::icase);
    return pattern;
}

// Sentence punctuation glued to a link in shared text
void strip_trailing_punctuation(std::string& url) {
    while (!url.empty() && std::string_view(".,;:!?)]}").find(url.back()) != std::string_view::npos) {
        url.pop_back();
    }
}

} // namespace

std::expected<Locator, std::error_code> parse_locator(std::string_view text) {
    auto parsed = Url::parse(text);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    if (!parsed->is_http()) {
        return std::unexpected(make_error_code(EngineErrc::invalid_locator));
    }
    if (std::find(ALLOWED_HOSTS.begin(), ALLOWED_HOSTS.end(), parsed->host()) == ALLOWED_HOSTS.end()) {
        return std::unexpected(make_error_code(EngineErrc::invalid_locator));
    }

    auto segments = parsed->path_segments();
    std::size_t index = 0;
    if (!segments.empty() && segments.front() == "share") {
        index = 1;
    }
    if (segments.size() < index + 2) {
        return std::unexpected(make_error_code(EngineErrc::invalid_locator));
    }
    const auto& kind = segments[index];
    const auto& id = segments[index + 1];
    if (std::find(CONTENT_KINDS.begin(), CONTENT_KINDS.end(), kind) == CONTENT_KINDS.end() || !valid_id(id)) {
        return std::unexpected(make_error_code(EngineErrc::invalid_locator));
    }

    std::string url(text);
    while (url.size() > 1 && url.back() == '/') {
        url.pop_back();
    }
    return Locator{std::move(url), id};
}

std::optional<Locator> extract_locator(std::string_view shared_text) {
    using Iterator = std::regex_iterator<std::string_view::const_iterator>;
    for (Iterator it(shared_text.begin(), shared_text.end(), url_pattern()), end; it != end; ++it) {
        std::string candidate = it->str();
        strip_trailing_punctuation(candidate);
        if (auto locator = parse_locator(candidate)) {
            return std::move(*locator);
        }
    }
    return std::nullopt;
}

} // namespace reelsplit::core
