// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/core/executor.hpp>
#include <reelsplit/core/log.hpp>
#include <algorithm>
#include <stdexcept>

namespace reelsplit::core {

//=============================================================================
// ThreadPool
//=============================================================================

ThreadPool::ThreadPool(std::size_t threads, std::string name)
    : name_(std::move(name)) {
    threads = std::max<std::size_t>(threads, 1);
    workers_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this](std::stop_token stoken) { worker_loop(stoken); });
    }
    for (const auto& worker : workers_) {
        worker_ids_.push_back(worker.get_id());
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) {
            throw std::runtime_error("executor '" + name_ + "' is shut down");
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

bool ThreadPool::runs_on_current_thread() const noexcept {
    auto self = std::this_thread::get_id();
    return std::find(worker_ids_.begin(), worker_ids_.end(), self) != worker_ids_.end();
}

void ThreadPool::shutdown() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accepting_) return;
        accepting_ = false;
    }
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }
}

void ThreadPool::worker_loop(std::stop_token stoken) {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            // Keeps draining after stop until the queue is empty
            if (!cv_.wait(lock, stoken, [this] { return !tasks_.empty(); })) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        try {
            task();
        } catch (const std::exception& e) {
            REELSPLIT_LOG_ERROR("Task on '{}' threw: {}", name_, e.what());
        }
    }
}

} // namespace reelsplit::core
