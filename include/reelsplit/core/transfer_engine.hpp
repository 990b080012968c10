// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/core/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <string>

namespace reelsplit::core {

using TransferHandle = std::uint64_t;

// Engine callbacks arrive on engine threads. on_progress may fire any number
// of times; exactly one of on_complete / on_error follows.
struct TransferCallbacks {
    std::function<void(std::uint64_t bytes_done, std::uint64_t bytes_total)> on_progress;
    std::function<void()> on_complete;
    std::function<void(EngineFailure)> on_error;
};

// External HTTP(S) download engine with cancel-by-handle
class TransferEngine {
public:
    virtual ~TransferEngine() = default;

    [[nodiscard]] virtual std::expected<TransferHandle, EngineFailure>
    start(const std::string& url, const std::filesystem::path& destination, TransferCallbacks callbacks) = 0;

    // Requests the transfer to stop; on_error(cancelled) follows
    virtual void cancel(TransferHandle handle) noexcept = 0;
};

} // namespace reelsplit::core
