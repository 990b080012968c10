// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/pipeline/orchestrator.hpp>
#include <reelsplit/core/config.hpp>
#include <reelsplit/core/log.hpp>
#include <reelsplit/disk/file_ops.hpp>
#include <algorithm>
#include <utility>

namespace reelsplit::pipeline {

namespace fs = std::filesystem;
using core::AppError;
using core::PipelineStage;

namespace {

int split_percent(const media::SplitProgress& p) noexcept {
    if (p.total_parts == 0) return 0;
    double fraction = std::clamp(p.fraction, 0.0, 1.0);
    double done = (static_cast<double>(p.current_part) - 1.0 + fraction) / static_cast<double>(p.total_parts);
    return static_cast<int>(std::clamp(done * 100.0, 0.0, 100.0));
}

void discard_parts(const std::vector<store::SplitPart>& parts) {
    for (const auto& part : parts) {
        if (!part.references_source) {
            disk::remove_file(part.file_path);
        }
    }
}

} // namespace

//=============================================================================
// PipelineOrchestrator
//=============================================================================

PipelineOrchestrator::PipelineOrchestrator(JobSpec job,
                                           PipelineStages stages,
                                           store::SegmentStore& store,
                                           core::Executor& io,
                                           RetryPolicy policy)
    : job_(std::move(job))
    , stages_(stages)
    , store_(store)
    , io_(io)
    , policy_(policy) {
    if (job_.video_id.empty()) {
        job_.video_id = job_.job_id;
    }
}

PipelineOrchestrator::~PipelineOrchestrator() {
    cancel();
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return queued_runs_ == 0 && !delivering_; });
}

fs::path PipelineOrchestrator::work_file() const {
    return job_.work_dir / (std::string(core::WORK_FILE_PREFIX) + job_.video_id + "." +
                            std::string(core::DEFAULT_MEDIA_EXTENSION));
}

fs::path PipelineOrchestrator::output_dir() const {
    return job_.work_dir / (std::string(core::SEGMENT_DIR_PREFIX) + job_.video_id);
}

bool PipelineOrchestrator::start() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!std::holds_alternative<state::Idle>(state_)) {
        return false;
    }
    REELSPLIT_LOG_INFO("Starting job {} for {}", job_.job_id, job_.locator);
    launch(lock);
    return true;
}

void PipelineOrchestrator::cancel() {
    std::stop_source previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(state_)) {
            return;
        }
        auto stage = active_stage(state_);
        ++generation_;
        previous = stop_source_;
        commit_locked(state::Cancelled{stage});
        REELSPLIT_LOG_INFO("Job {} cancelled{}", job_.job_id,
                           stage ? " during " + std::string(core::to_string(*stage)) : std::string());
    }
    // Stop callbacks run here and cancel the engine operation synchronously
    previous.request_stop();
    cv_.notify_all();
    deliver_pending();
}

bool PipelineOrchestrator::retry() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!std::holds_alternative<state::Failed>(state_) &&
        !std::holds_alternative<state::Cancelled>(state_)) {
        return false;
    }
    REELSPLIT_LOG_INFO("Retrying job {}", job_.job_id);
    launch(lock);
    return true;
}

PipelineState PipelineOrchestrator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

core::SubscriptionToken PipelineOrchestrator::subscribe(Listener listener) {
    return feed_.subscribe(std::move(listener));
}

void PipelineOrchestrator::unsubscribe(core::SubscriptionToken token) {
    feed_.unsubscribe(token);
}

void PipelineOrchestrator::wait() const {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] {
        return is_terminal(state_) && !running_ && pending_.empty() && !delivering_;
    });
}

bool PipelineOrchestrator::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] {
        return is_terminal(state_) && !running_ && pending_.empty() && !delivering_;
    });
}

//=============================================================================
// Run control
//=============================================================================

void PipelineOrchestrator::launch(std::unique_lock<std::mutex>& lock) {
    auto previous = std::exchange(stop_source_, std::stop_source{});
    const auto generation = ++generation_;
    auto stop = stop_source_.get_token();
    attempts_.store(0, std::memory_order_release);
    ++queued_runs_;
    commit_locked(state::Resolving{job_.locator});
    lock.unlock();

    // The previous attempt unwinds before run() proceeds
    previous.request_stop();
    cv_.notify_all();

    try {
        io_.post([this, generation, stop] { run(generation, stop); });
    } catch (const std::exception& e) {
        REELSPLIT_LOG_ERROR("Could not schedule job {}: {}", job_.job_id, e.what());
        finish_run(false);
        auto err = core::from_exception(e, std::nullopt);
        publish(generation, state::Failed{std::nullopt, err.message, true, err.kind});
        return;
    }
    deliver_pending();
}

void PipelineOrchestrator::run(std::uint64_t generation, std::stop_token stop) {
    bool started = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return !running_ || generation_ != generation; });
        if (generation_ == generation) {
            running_ = true;
            started = true;
        }
    }
    if (started) {
        execute(generation, stop);
    }
    finish_run(started);
}

void PipelineOrchestrator::finish_run(bool started) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (started) {
            running_ = false;
        }
        --queued_runs_;
    }
    cv_.notify_all();
}

void PipelineOrchestrator::execute(std::uint64_t generation, std::stop_token stop) {
    try {
        auto outcome = run_attempt(generation, stop);
        if (outcome) {
            auto count = outcome->size();
            if (publish(generation, state::Complete{job_.video_id, std::move(*outcome)})) {
                REELSPLIT_LOG_INFO("Job {} complete: {} segment(s)", job_.job_id, count);
                return;
            }
            // Cancelled after the segments were stored
            REELSPLIT_LOG_INFO("Job {} cancelled after splitting, discarding {} segment(s)",
                               job_.job_id, count);
            store_.delete_video(job_.video_id);
            return;
        }

        const auto& err = outcome.error();
        if (err.is_cancellation()) {
            // Already Cancelled when cancel() triggered it
            publish(generation, state::Cancelled{err.stage});
            return;
        }
        REELSPLIT_LOG_ERROR("Job {} failed: {}", job_.job_id, err.describe());
        publish(generation, state::Failed{err.stage, err.message, err.retryable, err.kind});
    } catch (const std::exception& e) {
        auto err = core::from_exception(e, std::nullopt);
        REELSPLIT_LOG_ERROR("Job {} aborted by exception: {}", job_.job_id, e.what());
        publish(generation, state::Failed{std::nullopt, err.message, true, err.kind});
    } catch (...) {
        REELSPLIT_LOG_ERROR("Job {} aborted by an unknown exception", job_.job_id);
        publish(generation, state::Failed{std::nullopt, "An unexpected error occurred", true,
                                          core::ErrorKind::unknown});
    }
}

std::expected<std::vector<store::Segment>, AppError>
PipelineOrchestrator::run_attempt(std::uint64_t generation, std::stop_token stop) {
    if (!store_.segments_for(job_.video_id).empty()) {
        REELSPLIT_LOG_WARN("Replacing existing segments of video {}", job_.video_id);
        store_.delete_video(job_.video_id);
    }

    auto resolved = stages_.resolver.resolve(job_.locator, stop);
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    REELSPLIT_LOG_DEBUG("Job {} resolved to {}", job_.job_id, resolved->direct_url);

    auto transferred = transfer_with_retry(generation, resolved->direct_url, stop);
    if (!transferred) {
        return std::unexpected(transferred.error());
    }

    publish(generation, state::Splitting{});
    auto split = stages_.splitter.split(
        transferred->file_path, output_dir(), job_.split,
        [&](const media::SplitProgress& p) {
            publish(generation, state::Splitting{p.current_part, p.total_parts, split_percent(p)});
        },
        stop);
    if (!split) {
        if (split.error().code == core::EngineErrc::probe_failed) {
            REELSPLIT_LOG_WARN("Removing unreadable download {}", transferred->file_path.string());
            disk::remove_file(transferred->file_path);
        }
        return std::unexpected(split.error());
    }

    if (stop.stop_requested()) {
        discard_parts(split->parts);
        return std::unexpected(core::cancelled_error(PipelineStage::split));
    }

    auto stored = store_.insert(job_.video_id, split->parts);
    if (!stored) {
        discard_parts(split->parts);
        return std::unexpected(stored.error());
    }
    if (split->was_split) {
        disk::remove_file(transferred->file_path);
    }
    return std::move(*stored);
}

std::expected<core::TransferResult, AppError>
PipelineOrchestrator::transfer_with_retry(std::uint64_t generation, const std::string& url, std::stop_token stop) {
    for (std::uint32_t attempt = 1;; ++attempt) {
        attempts_.store(attempt, std::memory_order_release);
        publish(generation, state::Transferring{0, 0, 0, 0, attempt});

        auto result = stages_.transfer.transfer(
            url, work_file(),
            [&](const core::TransferProgress& p) {
                publish(generation, state::Transferring{p.percent, p.bytes_done, p.bytes_total,
                                                        p.bytes_per_second, attempt});
            },
            stop);
        if (result || !policy_.should_retry(result.error(), attempt)) {
            return result;
        }

        auto delay = policy_.backoff_for(attempt);
        REELSPLIT_LOG_WARN("Transfer attempt {}/{} failed: {}. Retrying in {} ms",
                           attempt, policy_.max_attempts, result.error().message, delay.count());
        if (!sleep_for(delay, stop)) {
            return std::unexpected(core::cancelled_error(PipelineStage::transfer));
        }
    }
}

bool PipelineOrchestrator::sleep_for(std::chrono::milliseconds delay, std::stop_token stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    // wait_for returns the predicate, which is false on timeout
    cv_.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

//=============================================================================
// State publication
//=============================================================================

bool PipelineOrchestrator::publish(std::uint64_t generation, PipelineState next) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) {
            return false;
        }
        commit_locked(std::move(next));
    }
    cv_.notify_all();
    deliver_pending();
    return true;
}

void PipelineOrchestrator::commit_locked(PipelineState next) {
    state_ = next;
    pending_.push_back(std::move(next));
}

void PipelineOrchestrator::deliver_pending() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (delivering_) {
            // The active deliverer picks up what was just queued
            return;
        }
        delivering_ = true;
    }
    for (;;) {
        PipelineState next;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_.empty()) {
                delivering_ = false;
                break;
            }
            next = std::move(pending_.front());
            pending_.pop_front();
        }
        try {
            feed_.publish(next);
        } catch (const std::exception& e) {
            REELSPLIT_LOG_WARN("State listener of job {} threw: {}", job_.job_id, e.what());
        }
    }
    cv_.notify_all();
}

} // namespace reelsplit::pipeline
