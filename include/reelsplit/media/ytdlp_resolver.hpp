// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/media/resolver.hpp>
#include <string>

namespace reelsplit::media {

// Resolves links by running yt-dlp and reading its JSON info dump
class YtDlpResolver final : public ResolverEngine {
public:
    explicit YtDlpResolver(std::string executable = "yt-dlp");

    [[nodiscard]] std::expected<std::string, core::EngineFailure>
    resolve(const std::string& locator, std::stop_token stop) override;

    // Picks the direct URL out of a yt-dlp -J document
    [[nodiscard]] static std::expected<std::string, core::EngineFailure>
    parse_info(const std::string& json_text);

private:
    std::string executable_;
};

} // namespace reelsplit::media
