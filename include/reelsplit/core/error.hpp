// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace reelsplit::core {

// Low-level failures reported by the external engines
enum class EngineErrc {
    success = 0,
    connection_failed,
    connection_lost,
    timeout,
    dns_error,
    ssl_error,
    http_error,
    too_many_redirects,
    invalid_locator,
    unsupported_scheme,
    invalid_file_name,
    invalid_argument,
    content_unavailable,
    empty_result,
    probe_failed,
    engine_failure,
    engine_not_found,
    permission_denied,
    cancelled,
};

} // namespace reelsplit::core

namespace std {

template<>
struct is_error_code_enum<reelsplit::core::EngineErrc> : true_type {};

} // namespace std

namespace reelsplit::core {

namespace detail {

struct EngineErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "reelsplit::engine";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<EngineErrc>(ev)) {
            case EngineErrc::success:             return "Success";
            case EngineErrc::connection_failed:   return "Connection failed";
            case EngineErrc::connection_lost:     return "Connection lost";
            case EngineErrc::timeout:             return "Operation timed out";
            case EngineErrc::dns_error:           return "DNS resolution failed";
            case EngineErrc::ssl_error:           return "SSL/TLS error";
            case EngineErrc::http_error:          return "HTTP error";
            case EngineErrc::too_many_redirects:  return "Too many redirects";
            case EngineErrc::invalid_locator:     return "Unsupported or malformed link";
            case EngineErrc::unsupported_scheme:  return "Only HTTP and HTTPS URLs are supported";
            case EngineErrc::invalid_file_name:   return "Invalid file name";
            case EngineErrc::invalid_argument:    return "Invalid argument";
            case EngineErrc::content_unavailable: return "Content is unavailable";
            case EngineErrc::empty_result:        return "Engine returned an empty result";
            case EngineErrc::probe_failed:        return "Could not read media duration";
            case EngineErrc::engine_failure:      return "External engine failed";
            case EngineErrc::engine_not_found:    return "External engine not found";
            case EngineErrc::permission_denied:   return "Permission denied";
            case EngineErrc::cancelled:           return "Operation cancelled";
            default:                              return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::EngineErrcCategory& engine_errc_category() noexcept {
    static detail::EngineErrcCategory category;
    return category;
}

inline std::error_code make_error_code(EngineErrc e) noexcept {
    return {static_cast<int>(e), engine_errc_category()};
}

// What an engine hands back when it fails
struct EngineFailure {
    std::error_code code;
    std::int32_t http_status{0};
    std::string detail;

    EngineFailure() = default;
    EngineFailure(std::error_code ec, std::string text = {}, std::int32_t status = 0)
        : code(ec), http_status(status), detail(std::move(text)) {}

    [[nodiscard]] bool cancelled() const noexcept { return code == EngineErrc::cancelled; }
};

enum class PipelineStage : std::uint8_t {
    resolve,
    transfer,
    split,
};

[[nodiscard]] std::string_view to_string(PipelineStage stage) noexcept;

enum class ErrorKind : std::uint8_t {
    network,
    processing,
    storage,
    invalid_input,
    permission,
    unknown,
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

// Classified failure shared by every stage
struct AppError {
    ErrorKind kind{ErrorKind::unknown};
    std::string message;
    std::optional<PipelineStage> stage;
    bool retryable{false};

    std::error_code code;
    std::int32_t http_status{0};
    std::string path;

    [[nodiscard]] bool is_cancellation() const noexcept { return code == EngineErrc::cancelled; }

    // "Transfer: <message>"
    [[nodiscard]] std::string describe() const;
};

[[nodiscard]] AppError make_error(ErrorKind kind, std::string message,
                                  std::optional<PipelineStage> stage, bool retryable);

[[nodiscard]] AppError cancelled_error(std::optional<PipelineStage> stage);

// Maps an engine failure to an AppError using the fixed priority rules:
// network, HTTP status, storage, invalid input, then processing.
[[nodiscard]] AppError classify(const EngineFailure& failure, std::optional<PipelineStage> stage);

// Turns free-form engine output into a failure code
[[nodiscard]] EngineFailure classify_engine_message(std::string_view text);

[[nodiscard]] AppError from_exception(const std::exception& ex, std::optional<PipelineStage> stage);

} // namespace reelsplit::core
