// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/core/transfer_stage.hpp>
#include <reelsplit/core/channel.hpp>
#include <reelsplit/core/config.hpp>
#include <reelsplit/core/log.hpp>
#include <reelsplit/core/overloaded.hpp>
#include <reelsplit/core/url.hpp>
#include <reelsplit/disk/file_ops.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <optional>
#include <variant>

namespace reelsplit::core {

namespace fs = std::filesystem;

namespace {

struct ProgressEvent {
    std::uint64_t done;
    std::uint64_t total;
};

struct CompletedEvent {};

struct FailedEvent {
    EngineFailure failure;
};

using TransferEvent = std::variant<ProgressEvent, CompletedEvent, FailedEvent>;

AppError transfer_error(EngineErrc code, std::string message) {
    return classify(EngineFailure{make_error_code(code), std::move(message)}, PipelineStage::transfer);
}

std::string trim(std::string_view text) {
    auto first = std::find_if_not(text.begin(), text.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto last = std::find_if_not(text.rbegin(), text.rend(),
                                 [](unsigned char c) { return std::isspace(c); }).base();
    return first < last ? std::string(first, last) : std::string();
}

// Turns raw byte counts into deduplicated percentages with a speed estimate
class ProgressSampler {
public:
    std::optional<TransferProgress> sample(std::uint64_t done, std::uint64_t total) {
        if (total == 0) {
            return std::nullopt;
        }
        auto percent = static_cast<int>(std::clamp<std::uint64_t>(done * 100 / total, 0, 100));
        if (percent == last_percent_) {
            return std::nullopt;
        }
        last_percent_ = percent;

        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration<double>(now - last_time_).count();
        if (elapsed > 0.0 && done >= last_bytes_) {
            speed_ = static_cast<std::uint64_t>(static_cast<double>(done - last_bytes_) / elapsed);
        }
        last_time_ = now;
        last_bytes_ = done;
        return TransferProgress{percent, done, total, speed_};
    }

private:
    int last_percent_{-1};
    std::uint64_t last_bytes_{0};
    std::uint64_t speed_{0};
    std::chrono::steady_clock::time_point last_time_{std::chrono::steady_clock::now()};
};

} // namespace

std::expected<TransferResult, AppError>
TransferStage::transfer(const std::string& url,
                        const fs::path& destination,
                        const TransferProgressFn& on_progress,
                        std::stop_token stop) {
    auto trimmed_url = trim(url);
    if (trimmed_url.empty()) {
        return std::unexpected(transfer_error(EngineErrc::invalid_argument, "Download URL is empty"));
    }
    auto parsed = Url::parse(trimmed_url);
    if (!parsed || !parsed->is_http()) {
        return std::unexpected(transfer_error(EngineErrc::unsupported_scheme,
                                              "Only HTTP and HTTPS downloads are supported"));
    }

    auto name = disk::sanitize_file_name(destination.filename().string());
    if (!name) {
        return std::unexpected(transfer_error(EngineErrc::invalid_file_name,
                                              "Invalid file name: " + destination.filename().string()));
    }
    const auto target = destination.parent_path() / *name;

    if (!target.parent_path().empty()) {
        if (auto ec = disk::ensure_writable_directory(target.parent_path())) {
            auto err = classify(EngineFailure{ec, "Cannot write to " + target.parent_path().string()},
                                PipelineStage::transfer);
            err.path = target.parent_path().string();
            return std::unexpected(std::move(err));
        }
    }

    if (stop.stop_requested()) {
        return std::unexpected(cancelled_error(PipelineStage::transfer));
    }

    auto channel = std::make_shared<Channel<TransferEvent>>();
    auto settled = std::make_shared<Completion>();
    TransferCallbacks callbacks;
    callbacks.on_progress = [channel](std::uint64_t done, std::uint64_t total) {
        channel->send(ProgressEvent{done, total});
    };
    callbacks.on_complete = [channel, settled] {
        channel->send(CompletedEvent{});
        channel->close();
        settled->set();
    };
    callbacks.on_error = [channel, settled](EngineFailure failure) {
        channel->send(FailedEvent{std::move(failure)});
        channel->close();
        settled->set();
    };

    auto handle = engine_.start(trimmed_url, target, std::move(callbacks));
    if (!handle) {
        return std::unexpected(classify(handle.error(), PipelineStage::transfer));
    }
    register_handle(*handle);

    // Deregisters whichever way the loop below exits
    struct Registration {
        TransferStage& stage;
        TransferHandle handle;
        ~Registration() { stage.release_handle(handle); }
    } registration{*this, *handle};

    channel->on_cancel([this, id = *handle] {
        engine_.cancel(id);
        release_handle(id);
    });
    std::stop_callback on_stop(stop, [channel] { channel->cancel(); });

    ProgressSampler sampler;
    std::optional<EngineFailure> failure;
    bool completed = false;

    while (auto event = channel->receive()) {
        std::visit(overloaded{
            [&](const ProgressEvent& p) {
                if (auto progress = sampler.sample(p.done, p.total); progress && on_progress) {
                    on_progress(*progress);
                }
            },
            [&](const CompletedEvent&) { completed = true; },
            [&](const FailedEvent& f) { failure = f.failure; },
        }, *event);
    }

    if (channel->cancelled() || stop.stop_requested() || (failure && failure->cancelled())) {
        // The engine may still hold the file until it acknowledges the cancel
        settled->wait();
        REELSPLIT_LOG_INFO("Transfer cancelled, partial file left at {}", target.string());
        return std::unexpected(cancelled_error(PipelineStage::transfer));
    }
    if (failure) {
        auto err = classify(*failure, PipelineStage::transfer);
        REELSPLIT_LOG_ERROR("Transfer failed: {}", err.message);
        return std::unexpected(std::move(err));
    }
    if (!completed) {
        return std::unexpected(transfer_error(EngineErrc::engine_failure, "Transfer ended without a result"));
    }

    auto size = disk::file_size(target);
    if (!size) {
        auto err = classify(EngineFailure{make_error_code(disk::DiskErrc::write_error),
                                          "Downloaded file not found"}, PipelineStage::transfer);
        err.path = target.string();
        return std::unexpected(std::move(err));
    }
    if (*size == 0) {
        disk::remove_file(target);
        auto err = classify(EngineFailure{make_error_code(disk::DiskErrc::empty_file),
                                          "Downloaded file is empty. The video may no longer be available."},
                            PipelineStage::transfer);
        err.path = target.string();
        return std::unexpected(std::move(err));
    }
    if (*size < SMALL_FILE_WARNING_BYTES) {
        REELSPLIT_LOG_WARN("Downloaded file is only {} bytes: {}", *size, target.string());
    }

    REELSPLIT_LOG_INFO("Downloaded {} bytes to {}", *size, target.string());
    return TransferResult{target, *size};
}

std::size_t TransferStage::active_transfers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

void TransferStage::register_handle(TransferHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.insert(handle);
}

void TransferStage::release_handle(TransferHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_.erase(handle);
}

} // namespace reelsplit::core
