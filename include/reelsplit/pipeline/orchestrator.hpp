// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/core/executor.hpp>
#include <reelsplit/core/observable.hpp>
#include <reelsplit/core/transfer_stage.hpp>
#include <reelsplit/media/resolver.hpp>
#include <reelsplit/media/split_stage.hpp>
#include <reelsplit/pipeline/pipeline_state.hpp>
#include <reelsplit/pipeline/retry_policy.hpp>
#include <reelsplit/store/segment_store.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <expected>
#include <filesystem>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace reelsplit::pipeline {

// One video to process
struct JobSpec {
    std::string job_id;
    std::string locator;
    std::string video_id;               // Defaults to job_id
    std::filesystem::path work_dir;
    media::SplitOptions split;
};

// Stages are shared between jobs and must be thread-safe
struct PipelineStages {
    media::ResolverStage& resolver;
    core::TransferStage& transfer;
    media::SplitStage& splitter;
};

// Drives one job through Resolve, Transfer and Split and publishes every
// state change. The work runs on the io executor; start(), cancel() and
// retry() return immediately.
//
// Transfer failures marked retryable are retried in place with backoff, up
// to policy.max_attempts. Any other failure ends in Failed and needs an
// explicit retry(), which starts over from Resolving.
class PipelineOrchestrator {
public:
    using Listener = std::function<void(const PipelineState&)>;

    PipelineOrchestrator(JobSpec job,
                         PipelineStages stages,
                         store::SegmentStore& store,
                         core::Executor& io,
                         RetryPolicy policy = {});
    ~PipelineOrchestrator();

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    // Idle -> Resolving. False if the job was already started.
    bool start();

    // Stops the active stage and moves to Cancelled. No-op once terminal.
    void cancel();

    // Failed or Cancelled -> Resolving with a fresh attempt counter
    bool retry();

    [[nodiscard]] PipelineState state() const;

    // Listeners run on the thread that changed the state, one at a time and
    // in transition order. They may call cancel() or retry().
    [[nodiscard]] core::SubscriptionToken subscribe(Listener listener);
    void unsubscribe(core::SubscriptionToken token);

    // Block until the job is terminal and its worker has unwound
    void wait() const;
    [[nodiscard]] bool wait_for(std::chrono::milliseconds timeout) const;

    // Transfer attempts made since the last start() or retry()
    [[nodiscard]] std::uint32_t attempts() const noexcept { return attempts_.load(std::memory_order_acquire); }

    [[nodiscard]] const JobSpec& job() const noexcept { return job_; }
    [[nodiscard]] std::filesystem::path work_file() const;
    [[nodiscard]] std::filesystem::path output_dir() const;

private:
    void launch(std::unique_lock<std::mutex>& lock);
    void run(std::uint64_t generation, std::stop_token stop);
    void execute(std::uint64_t generation, std::stop_token stop);

    [[nodiscard]] std::expected<std::vector<store::Segment>, core::AppError>
    run_attempt(std::uint64_t generation, std::stop_token stop);

    [[nodiscard]] std::expected<core::TransferResult, core::AppError>
    transfer_with_retry(std::uint64_t generation, const std::string& url, std::stop_token stop);

    // Returns false when the wait was interrupted by cancellation
    bool sleep_for(std::chrono::milliseconds delay, std::stop_token stop);

    // Drops updates from superseded generations
    bool publish(std::uint64_t generation, PipelineState next);
    void commit_locked(PipelineState next);
    void deliver_pending();
    void finish_run(bool started);

    JobSpec job_;
    PipelineStages stages_;
    store::SegmentStore& store_;
    core::Executor& io_;
    RetryPolicy policy_;

    mutable std::mutex mutex_;
    mutable std::condition_variable_any cv_;
    PipelineState state_{state::Idle{}};
    std::uint64_t generation_{0};
    std::stop_source stop_source_;
    std::uint32_t queued_runs_{0};
    bool running_{false};

    std::deque<PipelineState> pending_;
    bool delivering_{false};
    core::Observable<PipelineState> feed_;

    std::atomic<std::uint32_t> attempts_{0};
};

} // namespace reelsplit::pipeline
