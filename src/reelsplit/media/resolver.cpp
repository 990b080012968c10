// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/media/resolver.hpp>
#include <reelsplit/core/locator.hpp>
#include <reelsplit/core/log.hpp>
#include <algorithm>
#include <cctype>

namespace reelsplit::media {

using core::AppError;
using core::EngineErrc;
using core::ErrorKind;
using core::PipelineStage;

std::expected<ResolvedMedia, AppError>
ResolverStage::resolve(std::string_view locator, std::stop_token stop) {
    auto parsed = core::parse_locator(locator);
    if (!parsed) {
        return std::unexpected(core::classify(
            core::EngineFailure{parsed.error(), "Unsupported link. Please share a reel or post link."},
            PipelineStage::resolve));
    }

    if (stop.stop_requested()) {
        return std::unexpected(core::cancelled_error(PipelineStage::resolve));
    }

    REELSPLIT_LOG_DEBUG("Resolving {} (id {})", parsed->url, parsed->reel_id);
    auto url = engine_.resolve(parsed->url, stop);
    if (stop.stop_requested()) {
        return std::unexpected(core::cancelled_error(PipelineStage::resolve));
    }
    if (!url) {
        auto err = core::classify(url.error(), PipelineStage::resolve);
        REELSPLIT_LOG_ERROR("Resolve failed for {}: {}", parsed->url, err.message);
        return std::unexpected(std::move(err));
    }

    const auto& direct = *url;
    bool blank = std::all_of(direct.begin(), direct.end(),
                             [](unsigned char c) { return std::isspace(c); });
    if (blank) {
        return std::unexpected(core::classify(
            core::EngineFailure{make_error_code(EngineErrc::empty_result), "No URL found in video info"},
            PipelineStage::resolve));
    }
    return ResolvedMedia{direct};
}

} // namespace reelsplit::media
