// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace reelsplit::core {

namespace {

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

bool has_space(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) {
    if (url_str.empty() || has_space(url_str)) {
        return std::unexpected(make_error_code(EngineErrc::invalid_locator));
    }

    auto scheme_end = url_str.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return std::unexpected(make_error_code(EngineErrc::invalid_locator));
    }

    Url url;
    url.scheme_ = to_lower(url_str.substr(0, scheme_end));

    auto rest_start = scheme_end + 3;
    auto host_end = url_str.find_first_of("/?#", rest_start);
    if (host_end == std::string_view::npos) {
        host_end = url_str.size();
    }

    // Drop userinfo
    auto authority = url_str.substr(rest_start, host_end - rest_start);
    if (auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    if (!authority.empty() && authority.front() == '[') {
        auto bracket_end = authority.find(']');
        if (bracket_end == std::string_view::npos) {
            return std::unexpected(make_error_code(EngineErrc::invalid_locator));
        }
        url.host_ = to_lower(authority.substr(0, bracket_end + 1));
        if (bracket_end + 1 < authority.size() && authority[bracket_end + 1] == ':') {
            url.port_ = std::string(authority.substr(bracket_end + 2));
        }
    } else if (auto colon = authority.find(':'); colon != std::string_view::npos) {
        url.host_ = to_lower(authority.substr(0, colon));
        url.port_ = std::string(authority.substr(colon + 1));
    } else {
        url.host_ = to_lower(authority);
    }

    if (url.host_.empty()) {
        return std::unexpected(make_error_code(EngineErrc::invalid_locator));
    }
    if (!std::all_of(url.port_.begin(), url.port_.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return std::unexpected(make_error_code(EngineErrc::invalid_locator));
    }

    auto fragment_start = url_str.find('#', host_end);
    auto query_start = url_str.find('?', host_end);
    if (query_start != std::string_view::npos && fragment_start != std::string_view::npos &&
        query_start > fragment_start) {
        query_start = std::string_view::npos;
    }
    auto path_end = std::min({query_start, fragment_start, url_str.size()});

    url.path_ = host_end < path_end ? std::string(url_str.substr(host_end, path_end - host_end)) : "/";
    if (url.path_.empty() || url.path_.front() != '/') {
        url.path_ = "/";
    }
    if (query_start != std::string_view::npos) {
        auto query_end = fragment_start == std::string_view::npos ? url_str.size() : fragment_start;
        url.query_ = std::string(url_str.substr(query_start + 1, query_end - query_start - 1));
    }
    if (fragment_start != std::string_view::npos) {
        url.fragment_ = std::string(url_str.substr(fragment_start + 1));
    }

    url.str_ = std::string(url_str);
    return url;
}

std::vector<std::string> Url::path_segments() const {
    std::vector<std::string> segments;
    std::size_t pos = 0;
    while (pos < path_.size()) {
        auto next = path_.find('/', pos);
        if (next == std::string::npos) {
            next = path_.size();
        }
        if (next > pos) {
            segments.emplace_back(path_.substr(pos, next - pos));
        }
        pos = next + 1;
    }
    return segments;
}

std::string Url::filename() const {
    auto segments = path_segments();
    if (segments.empty() || path_.back() == '/') {
        return {};
    }
    return segments.back();
}

} // namespace reelsplit::core
