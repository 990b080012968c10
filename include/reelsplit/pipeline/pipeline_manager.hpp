// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/core/error.hpp>
#include <reelsplit/core/executor.hpp>
#include <reelsplit/pipeline/orchestrator.hpp>
#include <reelsplit/pipeline/pipeline_state.hpp>
#include <reelsplit/pipeline/retry_policy.hpp>
#include <reelsplit/store/segment_store.hpp>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace reelsplit::pipeline {

// Owns one orchestrator per job id
class PipelineManager {
public:
    PipelineManager(PipelineStages stages, store::SegmentStore& store, core::Executor& io,
                    RetryPolicy policy = {});
    ~PipelineManager();

    PipelineManager(const PipelineManager&) = delete;
    PipelineManager& operator=(const PipelineManager&) = delete;

    // Register a job. Empty or duplicate ids are rejected. The returned
    // pointer stays valid until remove().
    [[nodiscard]] std::expected<PipelineOrchestrator*, core::AppError> create(JobSpec job);

    [[nodiscard]] bool start(const std::string& job_id);
    void cancel(const std::string& job_id);
    [[nodiscard]] bool retry(const std::string& job_id);

    // Cancel every job that is still running
    void cancel_all();

    [[nodiscard]] std::optional<PipelineState> state(const std::string& job_id) const;

    // Drop a finished job. Returns false for unknown or non-terminal jobs.
    bool remove(const std::string& job_id);

    [[nodiscard]] PipelineOrchestrator* find(const std::string& job_id) const;
    [[nodiscard]] std::vector<std::string> jobs() const;

private:
    PipelineStages stages_;
    store::SegmentStore& store_;
    core::Executor& io_;
    RetryPolicy policy_;

    std::map<std::string, std::unique_ptr<PipelineOrchestrator>> jobs_;
    mutable std::mutex mutex_;
};

} // namespace reelsplit::pipeline
