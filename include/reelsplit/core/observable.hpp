// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace reelsplit::core {

using SubscriptionToken = std::uint64_t;

// Push-style subscription list. publish() delivers values in publish order;
// listeners run on the publishing thread and must not publish re-entrantly.
template<typename T>
class Observable {
public:
    using Listener = std::function<void(const T&)>;

    [[nodiscard]] SubscriptionToken subscribe(Listener listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto token = next_token_++;
        listeners_.emplace(token, std::move(listener));
        return token;
    }

    void unsubscribe(SubscriptionToken token) {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.erase(token);
    }

    void publish(const T& value) {
        std::lock_guard<std::mutex> order(notify_mutex_);
        std::vector<Listener> targets;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            targets.reserve(listeners_.size());
            for (const auto& [token, listener] : listeners_) {
                targets.push_back(listener);
            }
        }
        for (const auto& listener : targets) {
            listener(value);
        }
    }

    [[nodiscard]] std::size_t listener_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

private:
    mutable std::mutex mutex_;
    std::mutex notify_mutex_;
    std::map<SubscriptionToken, Listener> listeners_;
    SubscriptionToken next_token_{1};
};

} // namespace reelsplit::core
