// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/pipeline/pipeline_manager.hpp>
#include <reelsplit/core/log.hpp>

namespace reelsplit::pipeline {

PipelineManager::PipelineManager(PipelineStages stages, store::SegmentStore& store, core::Executor& io,
                                 RetryPolicy policy)
    : stages_(stages)
    , store_(store)
    , io_(io)
    , policy_(policy) {}

PipelineManager::~PipelineManager() {
    cancel_all();
    // Orchestrator destructors wait for their workers
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.clear();
}

std::expected<PipelineOrchestrator*, core::AppError> PipelineManager::create(JobSpec job) {
    if (job.job_id.empty()) {
        return std::unexpected(core::make_error(core::ErrorKind::invalid_input,
                                                "Job id must not be empty", std::nullopt, false));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (jobs_.contains(job.job_id)) {
        return std::unexpected(core::make_error(core::ErrorKind::invalid_input,
                                                "Job already exists: " + job.job_id, std::nullopt, false));
    }

    auto id = job.job_id;
    auto orchestrator = std::make_unique<PipelineOrchestrator>(std::move(job), stages_, store_, io_, policy_);
    auto* ptr = orchestrator.get();
    jobs_.emplace(id, std::move(orchestrator));
    REELSPLIT_LOG_DEBUG("Created job {}", id);
    return ptr;
}

bool PipelineManager::start(const std::string& job_id) {
    auto* job = find(job_id);
    return job != nullptr && job->start();
}

void PipelineManager::cancel(const std::string& job_id) {
    if (auto* job = find(job_id)) {
        job->cancel();
    }
}

bool PipelineManager::retry(const std::string& job_id) {
    auto* job = find(job_id);
    return job != nullptr && job->retry();
}

void PipelineManager::cancel_all() {
    std::vector<PipelineOrchestrator*> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, job] : jobs_) {
            targets.push_back(job.get());
        }
    }
    for (auto* job : targets) {
        job->cancel();
    }
}

std::optional<PipelineState> PipelineManager::state(const std::string& job_id) const {
    if (auto* job = find(job_id)) {
        return job->state();
    }
    return std::nullopt;
}

bool PipelineManager::remove(const std::string& job_id) {
    std::unique_ptr<PipelineOrchestrator> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end() || !is_terminal(it->second->state())) {
            return false;
        }
        removed = std::move(it->second);
        jobs_.erase(it);
    }
    // Joins any worker still unwinding, outside the lock
    removed.reset();
    return true;
}

PipelineOrchestrator* PipelineManager::find(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(job_id);
    return it != jobs_.end() ? it->second.get() : nullptr;
}

std::vector<std::string> PipelineManager::jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(jobs_.size());
    for (const auto& [id, job] : jobs_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace reelsplit::pipeline
