// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/core/error.hpp>
#include <expected>
#include <stop_token>
#include <string>
#include <string_view>

namespace reelsplit::media {

// External engine that turns a share link into a directly fetchable URL.
// Blocks until the engine answers or the stop token fires.
class ResolverEngine {
public:
    virtual ~ResolverEngine() = default;

    [[nodiscard]] virtual std::expected<std::string, core::EngineFailure>
    resolve(const std::string& locator, std::stop_token stop) = 0;
};

struct ResolvedMedia {
    std::string direct_url;
};

// Validates the locator against the allow-list, then defers to the engine.
// Never retries.
class ResolverStage {
public:
    explicit ResolverStage(ResolverEngine& engine) noexcept : engine_(engine) {}

    [[nodiscard]] std::expected<ResolvedMedia, core::AppError>
    resolve(std::string_view locator, std::stop_token stop = {});

private:
    ResolverEngine& engine_;
};

} // namespace reelsplit::media
