// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace reelsplit::core {

// Cancellable single-consumer push channel bridging engine callbacks to a
// blocking reader. Any thread may send; one thread receives. The channel
// closes exactly once, whichever of close() and cancel() gets there first.
template<typename T>
class Channel {
public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // False once closed; the value is dropped
    bool send(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    // True only for the call that actually closed the channel
    bool close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            closed_ = true;
        }
        cv_.notify_all();
        return true;
    }

    // Runs the cancel hook once, discards queued values and closes. No-op
    // once the producer has closed the channel.
    void cancel() {
        std::function<void()> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            cancelled_ = true;
            closed_ = true;
            queue_.clear();
            hook = std::move(cancel_hook_);
        }
        cv_.notify_all();
        if (hook) hook();
    }

    // Hook runs at most once. Registering after cancel() runs it immediately.
    void on_cancel(std::function<void()> hook) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!cancelled_) {
                cancel_hook_ = std::move(hook);
                return;
            }
        }
        if (hook) hook();
    }

    // Blocks for the next value; nullopt once closed and drained
    [[nodiscard]] std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    [[nodiscard]] bool cancelled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancelled_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    std::function<void()> cancel_hook_;
    bool closed_{false};
    bool cancelled_{false};
};

// One-shot flag set by an engine's terminal callback. A caller that cancelled
// waits on it before touching the files the engine was writing.
class Completion {
public:
    void set() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cv_.notify_all();
    }

    void wait() const {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return done_; });
    }

    [[nodiscard]] bool done() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return done_;
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool done_{false};
};

} // namespace reelsplit::core
