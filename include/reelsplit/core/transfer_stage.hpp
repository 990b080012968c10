// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/core/error.hpp>
#include <reelsplit/core/transfer_engine.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>

namespace reelsplit::core {

struct TransferProgress {
    int percent{0};
    std::uint64_t bytes_done{0};
    std::uint64_t bytes_total{0};
    std::uint64_t bytes_per_second{0};
};

using TransferProgressFn = std::function<void(const TransferProgress&)>;

struct TransferResult {
    std::filesystem::path file_path;
    std::uint64_t size_bytes{0};
};

// Adapts a TransferEngine to a blocking, cancellable call. Progress is
// forwarded at the engine's cadence with repeated percentages dropped, and
// the finished file is checked independently of what the engine reported.
class TransferStage {
public:
    explicit TransferStage(TransferEngine& engine) noexcept : engine_(engine) {}

    [[nodiscard]] std::expected<TransferResult, AppError>
    transfer(const std::string& url,
             const std::filesystem::path& destination,
             const TransferProgressFn& on_progress,
             std::stop_token stop = {});

    // Engine operations currently registered by this stage
    [[nodiscard]] std::size_t active_transfers() const;

private:
    void register_handle(TransferHandle handle);
    void release_handle(TransferHandle handle);

    TransferEngine& engine_;
    mutable std::mutex mutex_;
    std::set<TransferHandle> active_;
};

} // namespace reelsplit::core
