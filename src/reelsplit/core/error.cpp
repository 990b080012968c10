// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/core/error.hpp>
#include <reelsplit/disk/error.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <filesystem>
#include <new>
#include <stdexcept>

namespace reelsplit::core {

namespace {

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

template<std::size_t N>
bool contains_any(std::string_view haystack, const std::array<std::string_view, N>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view n) {
        return haystack.find(n) != std::string_view::npos;
    });
}

// yt-dlp prefixes the useful line with "ERROR:"
std::string summarize(std::string_view text) {
    std::size_t start = 0;
    auto marker = text.find("ERROR:");
    if (marker != std::string_view::npos) {
        start = marker + 6;
    }
    auto end = text.find('\n', start);
    auto line = text.substr(start, end == std::string_view::npos ? text.size() - start : end - start);
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.front()))) line.remove_prefix(1);
    while (!line.empty() && std::isspace(static_cast<unsigned char>(line.back()))) line.remove_suffix(1);
    return std::string(line);
}

std::string message_for(const EngineFailure& failure) {
    return failure.detail.empty() ? failure.code.message() : failure.detail;
}

AppError classify_disk(const EngineFailure& failure, std::optional<PipelineStage> stage) {
    using disk::DiskErrc;
    auto errc = static_cast<DiskErrc>(failure.code.value());
    switch (errc) {
        case DiskErrc::empty_file:
            // An empty download means the remote content was unavailable
            if (stage == PipelineStage::transfer) {
                return make_error(ErrorKind::network, message_for(failure), stage, true);
            }
            return make_error(ErrorKind::processing, message_for(failure), stage, false);
        case DiskErrc::create_failed:
        case DiskErrc::write_error:
            return make_error(ErrorKind::storage, message_for(failure), stage, true);
        case DiskErrc::invalid_path:
        case DiskErrc::outside_cache:
            return make_error(ErrorKind::invalid_input, message_for(failure), stage, false);
        default:
            return make_error(ErrorKind::storage, message_for(failure), stage, false);
    }
}

AppError classify_http(const EngineFailure& failure, std::optional<PipelineStage> stage) {
    std::string message = failure.detail.empty()
        ? fmt::format("Server returned HTTP {}", failure.http_status)
        : fmt::format("Server returned HTTP {}: {}", failure.http_status, failure.detail);
    // 4xx will not change on retry
    bool retryable = failure.http_status >= 500 || failure.http_status == 0;
    return make_error(ErrorKind::network, std::move(message), stage, retryable);
}

} // namespace

std::string_view to_string(PipelineStage stage) noexcept {
    switch (stage) {
        case PipelineStage::resolve:  return "Resolve";
        case PipelineStage::transfer: return "Transfer";
        case PipelineStage::split:    return "Split";
    }
    return "Unknown";
}

std::string_view to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::network:       return "network";
        case ErrorKind::processing:    return "processing";
        case ErrorKind::storage:       return "storage";
        case ErrorKind::invalid_input: return "invalid_input";
        case ErrorKind::permission:    return "permission";
        case ErrorKind::unknown:       return "unknown";
    }
    return "unknown";
}

std::string AppError::describe() const {
    if (!stage) {
        return message;
    }
    return fmt::format("{}: {}", to_string(*stage), message);
}

AppError make_error(ErrorKind kind, std::string message,
                    std::optional<PipelineStage> stage, bool retryable) {
    AppError err;
    err.kind = kind;
    err.message = std::move(message);
    err.stage = stage;
    err.retryable = retryable;
    return err;
}

AppError cancelled_error(std::optional<PipelineStage> stage) {
    auto err = make_error(ErrorKind::unknown, "Cancelled", stage, false);
    err.code = make_error_code(EngineErrc::cancelled);
    return err;
}

AppError classify(const EngineFailure& failure, std::optional<PipelineStage> stage) {
    AppError err;
    const auto& code = failure.code;

    if (code == EngineErrc::cancelled) {
        err = cancelled_error(stage);
    } else if (code.category() == engine_errc_category()) {
        switch (static_cast<EngineErrc>(code.value())) {
            case EngineErrc::connection_failed:
            case EngineErrc::connection_lost:
            case EngineErrc::timeout:
            case EngineErrc::dns_error:
            case EngineErrc::ssl_error:
                err = make_error(ErrorKind::network, message_for(failure), stage, true);
                break;
            case EngineErrc::http_error:
                err = classify_http(failure, stage);
                break;
            case EngineErrc::invalid_locator:
            case EngineErrc::unsupported_scheme:
            case EngineErrc::invalid_file_name:
            case EngineErrc::invalid_argument:
                err = make_error(ErrorKind::invalid_input, message_for(failure), stage, false);
                break;
            case EngineErrc::permission_denied:
                err = make_error(ErrorKind::permission, message_for(failure), stage, false);
                break;
            case EngineErrc::content_unavailable:
            case EngineErrc::probe_failed:
            case EngineErrc::engine_not_found:
                err = make_error(ErrorKind::processing, message_for(failure), stage, false);
                break;
            default:
                err = make_error(ErrorKind::processing, message_for(failure), stage, true);
                break;
        }
    } else if (failure.http_status >= 400) {
        err = classify_http(failure, stage);
    } else if (code.category() == disk::disk_errc_category()) {
        err = classify_disk(failure, stage);
    } else if (code.category() == std::generic_category() || code.category() == std::system_category()) {
        if (code == std::errc::timed_out || code == std::errc::connection_refused ||
            code == std::errc::connection_reset || code == std::errc::network_unreachable) {
            err = make_error(ErrorKind::network, message_for(failure), stage, true);
        } else {
            err = make_error(ErrorKind::storage, message_for(failure), stage, false);
        }
    } else {
        err = make_error(ErrorKind::processing, message_for(failure), stage, true);
    }

    err.code = code;
    err.http_status = failure.http_status;
    return err;
}

EngineFailure classify_engine_message(std::string_view text) {
    static constexpr std::array<std::string_view, 3> invalid_phrases{
        "unsupported url", "url format not recognized", "invalid url"};
    static constexpr std::array<std::string_view, 6> permanent_phrases{
        "private", "login required", "restricted", "not found", "does not exist", "deleted"};
    static constexpr std::array<std::string_view, 3> timeout_phrases{
        "timed out", "timeout", "time out"};
    static constexpr std::array<std::string_view, 3> network_phrases{
        "network", "connection", "unable to download"};

    auto lowered = lower(text);
    auto detail = summarize(text);
    if (detail.empty()) {
        detail = "External engine failed";
    }

    // "HTTP Error 503: Service Unavailable"
    auto http = lowered.find("http error ");
    if (http != std::string::npos) {
        std::int32_t status = 0;
        auto pos = http + 11;
        while (pos < lowered.size() && std::isdigit(static_cast<unsigned char>(lowered[pos]))) {
            status = status * 10 + (lowered[pos] - '0');
            ++pos;
        }
        return {make_error_code(EngineErrc::http_error), std::move(detail), status};
    }

    if (contains_any(lowered, timeout_phrases)) {
        return {make_error_code(EngineErrc::timeout), std::move(detail)};
    }
    if (contains_any(lowered, network_phrases)) {
        return {make_error_code(EngineErrc::connection_failed), std::move(detail)};
    }
    if (contains_any(lowered, invalid_phrases)) {
        return {make_error_code(EngineErrc::invalid_locator), std::move(detail)};
    }
    if (contains_any(lowered, permanent_phrases)) {
        return {make_error_code(EngineErrc::content_unavailable), std::move(detail)};
    }
    return {make_error_code(EngineErrc::engine_failure), std::move(detail)};
}

AppError from_exception(const std::exception& ex, std::optional<PipelineStage> stage) {
    if (const auto* fs = dynamic_cast<const std::filesystem::filesystem_error*>(&ex)) {
        auto code = fs->code();
        AppError err;
        if (code == std::errc::permission_denied || code == std::errc::operation_not_permitted) {
            err = make_error(ErrorKind::permission, fs->what(), stage, false);
        } else {
            err = make_error(ErrorKind::storage, fs->what(), stage, false);
        }
        err.code = code;
        err.path = fs->path1().string();
        return err;
    }
    if (const auto* sys = dynamic_cast<const std::system_error*>(&ex)) {
        return classify(EngineFailure{sys->code(), sys->what()}, stage);
    }
    if (dynamic_cast<const std::invalid_argument*>(&ex) != nullptr) {
        return make_error(ErrorKind::invalid_input, ex.what(), stage, false);
    }
    if (dynamic_cast<const std::bad_alloc*>(&ex) != nullptr) {
        return make_error(ErrorKind::unknown, "Out of memory", stage, false);
    }
    std::string message = ex.what();
    if (message.empty()) {
        message = "An unexpected error occurred";
    }
    return make_error(ErrorKind::unknown, std::move(message), stage, true);
}

} // namespace reelsplit::core
