// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/core/settings.hpp>
#include <reelsplit/core/transfer_engine.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

namespace reelsplit::core {

// libcurl easy transfers, one worker thread per download
class CurlTransferEngine final : public TransferEngine {
public:
    explicit CurlTransferEngine(TransferSettings settings = {});
    ~CurlTransferEngine() override;

    CurlTransferEngine(const CurlTransferEngine&) = delete;
    CurlTransferEngine& operator=(const CurlTransferEngine&) = delete;

    [[nodiscard]] std::expected<TransferHandle, EngineFailure>
    start(const std::string& url, const std::filesystem::path& destination, TransferCallbacks callbacks) override;

    void cancel(TransferHandle handle) noexcept override;

    // Call once per process before any transfer
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    struct Transfer {
        std::string url;
        std::filesystem::path destination;
        TransferCallbacks callbacks;
        std::atomic<bool> stop_requested{false};
        std::atomic<bool> finished{false};
        std::uint64_t last_done{0};
        std::uint64_t last_total{0};
        std::jthread worker;
    };

    void run(Transfer& transfer) noexcept;
    void reap_finished();

    TransferSettings settings_;
    std::map<TransferHandle, std::unique_ptr<Transfer>> transfers_;
    TransferHandle next_handle_{1};
    std::mutex mutex_;
};

} // namespace reelsplit::core
