// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace reelsplit::core {

class Executor {
public:
    virtual ~Executor() = default;

    // Throws std::runtime_error once the executor is shutting down
    virtual void post(std::function<void()> task) = 0;

    [[nodiscard]] virtual bool runs_on_current_thread() const noexcept = 0;
};

// Fixed pool of worker threads for blocking I/O and subprocess calls
class ThreadPool : public Executor {
public:
    explicit ThreadPool(std::size_t threads, std::string name = "pool");
    ~ThreadPool() override;

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    void post(std::function<void()> task) override;
    [[nodiscard]] bool runs_on_current_thread() const noexcept override;

    [[nodiscard]] std::size_t size() const noexcept { return workers_.size(); }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    // Drains queued tasks and joins the workers
    void shutdown() noexcept;

private:
    void worker_loop(std::stop_token stoken);

    std::string name_;
    std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<std::function<void()>> tasks_;
    bool accepting_{true};
    std::vector<std::jthread> workers_;
    std::vector<std::thread::id> worker_ids_;
};

// Single designated thread for engines with thread affinity
class SerialContext final : public ThreadPool {
public:
    explicit SerialContext(std::string name = "serial") : ThreadPool(1, std::move(name)) {}
};

// Runs tasks on the caller's thread
class InlineExecutor final : public Executor {
public:
    void post(std::function<void()> task) override { task(); }
    [[nodiscard]] bool runs_on_current_thread() const noexcept override { return true; }
};

// Runs fn on the executor and blocks for its result. Exceptions thrown by fn
// are rethrown in the caller.
template<typename F>
auto run_on(Executor& executor, F&& fn) -> std::invoke_result_t<F> {
    using Result = std::invoke_result_t<F>;
    if (executor.runs_on_current_thread()) {
        return std::forward<F>(fn)();
    }
    auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(fn));
    auto future = task->get_future();
    executor.post([task] { (*task)(); });
    return future.get();
}

} // namespace reelsplit::core
