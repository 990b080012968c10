// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <reelsplit/core/executor.hpp>
#include <reelsplit/core/transfer_engine.hpp>
#include <reelsplit/media/resolver.hpp>
#include <reelsplit/media/transcoder.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace reelsplit::testing {

namespace fs = std::filesystem;

inline core::EngineFailure cancelled_failure() {
    return core::EngineFailure{make_error_code(core::EngineErrc::cancelled)};
}

// Blocks until the token is stopped
inline void park(std::stop_token stop) {
    std::mutex m;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(m);
    cv.wait(lock, stop, [] { return false; });
}

inline void write_bytes(const fs::path& path, std::uint64_t count) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    std::string chunk(64 * 1024, 'x');
    while (count > 0) {
        auto n = std::min<std::uint64_t>(count, chunk.size());
        out.write(chunk.data(), static_cast<std::streamsize>(n));
        count -= n;
    }
}

// Unique scratch directory removed on scope exit
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("reelsplit_test_" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }
    [[nodiscard]] fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

//=============================================================================
// Resolver
//=============================================================================

class FakeResolverEngine final : public media::ResolverEngine {
public:
    std::string direct_url{"https://cdn.example.com/v/clip.mp4"};
    std::optional<core::EngineFailure> failure;
    std::atomic<bool> hold{false};
    bool throws{false};
    bool throws_foreign{false};     // Something that is not a std::exception
    std::atomic<int> calls{0};

    std::expected<std::string, core::EngineFailure>
    resolve(const std::string&, std::stop_token stop) override {
        ++calls;
        if (throws) {
            throw std::runtime_error("Resolver crashed");
        }
        if (throws_foreign) {
            throw 42;
        }
        if (hold) {
            park(stop);
            return std::unexpected(cancelled_failure());
        }
        if (failure) {
            return std::unexpected(*failure);
        }
        return direct_url;
    }
};

//=============================================================================
// Transfer
//=============================================================================

// Writes total_bytes to the destination over `ticks` progress callbacks on
// its own thread
class FakeTransferEngine final : public core::TransferEngine {
public:
    struct Behavior {
        std::uint64_t total_bytes{10'000'000};
        int ticks{5};
        bool report_total{true};
        bool hold{false};           // Wait for cancel
        bool write_empty{false};
        int fail_times{0};          // First n starts fail with `failure`
        core::EngineFailure failure{make_error_code(core::EngineErrc::connection_lost), "Connection reset"};
        std::optional<core::EngineFailure> start_failure;
        std::chrono::milliseconds cancel_delay{0};  // Held transfer keeps writing this long after cancel
    };

    ~FakeTransferEngine() override {
        std::map<core::TransferHandle, std::jthread> workers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            workers.swap(workers_);
        }
    }

    void set(Behavior b) {
        std::lock_guard<std::mutex> lock(mutex_);
        behavior_ = std::move(b);
    }

    std::expected<core::TransferHandle, core::EngineFailure>
    start(const std::string&, const fs::path& destination, core::TransferCallbacks callbacks) override {
        std::lock_guard<std::mutex> lock(mutex_);
        int call = ++starts;
        if (behavior_.start_failure) {
            return std::unexpected(*behavior_.start_failure);
        }
        auto handle = next_handle_++;
        workers_.emplace(handle, std::jthread(
            [this, b = behavior_, call, destination, cb = std::move(callbacks)](std::stop_token stop) {
                int now = ++live;
                int seen = peak_live.load();
                while (now > seen && !peak_live.compare_exchange_weak(seen, now)) {}
                run(b, call, destination, cb, stop);
            }));
        return handle;
    }

    void cancel(core::TransferHandle handle) noexcept override {
        ++cancels;
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = workers_.find(handle); it != workers_.end()) {
            it->second.request_stop();
        }
    }

    std::atomic<int> starts{0};
    std::atomic<int> cancels{0};
    std::atomic<int> live{0};       // Workers that have not reported a result yet
    std::atomic<int> peak_live{0};

private:
    void run(const Behavior& b, int call, const fs::path& destination,
             const core::TransferCallbacks& cb, std::stop_token stop) {
        // Like a real engine, the file is released before the terminal callback
        auto fail = [&](core::EngineFailure failure) {
            --live;
            cb.on_error(std::move(failure));
        };
        auto complete = [&] {
            --live;
            cb.on_complete();
        };

        if (call <= b.fail_times) {
            fail(b.failure);
            return;
        }
        if (b.hold) {
            write_bytes(destination, 1000);
            if (cb.on_progress) cb.on_progress(1000, b.total_bytes);
            park(stop);
            if (b.cancel_delay.count() > 0) {
                std::this_thread::sleep_for(b.cancel_delay);
                write_bytes(destination, 2000);
            }
            fail(cancelled_failure());
            return;
        }
        if (b.write_empty) {
            write_bytes(destination, 0);
            complete();
            return;
        }

        std::ofstream out(destination, std::ios::binary | std::ios::trunc);
        const auto chunk = b.total_bytes / static_cast<std::uint64_t>(b.ticks);
        std::uint64_t done = 0;
        for (int i = 1; i <= b.ticks; ++i) {
            if (stop.stop_requested()) {
                out.close();
                fail(cancelled_failure());
                return;
            }
            // Last tick carries the remainder
            auto n = i == b.ticks ? b.total_bytes - done : chunk;
            std::string piece(static_cast<std::size_t>(n), 'v');
            out.write(piece.data(), static_cast<std::streamsize>(piece.size()));
            done += n;
            if (cb.on_progress) cb.on_progress(done, b.report_total ? b.total_bytes : 0);
        }
        out.close();
        complete();
    }

    Behavior behavior_;
    std::map<core::TransferHandle, std::jthread> workers_;
    core::TransferHandle next_handle_{1};
    std::mutex mutex_;
};

//=============================================================================
// Transcoder
//=============================================================================

class FakeTranscodeEngine final : public media::TranscodeEngine {
public:
    ~FakeTranscodeEngine() override {
        std::map<media::ClipHandle, std::jthread> workers;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            workers.swap(workers_);
        }
    }

    std::expected<std::int64_t, core::EngineFailure>
    probe_duration_ms(const fs::path&) override {
        ++probes;
        if (probe_failure) {
            return std::unexpected(*probe_failure);
        }
        return duration_ms;
    }

    std::expected<media::ClipHandle, core::EngineFailure>
    start_clip(const media::ClipRequest& request, media::ClipCallbacks callbacks) override {
        std::lock_guard<std::mutex> lock(mutex_);
        int clip = static_cast<int>(requests.size()) + 1;
        requests.push_back(request);
        start_threads.push_back(std::this_thread::get_id());

        auto handle = next_handle_++;
        const bool fail = clip == fail_on_clip;
        const bool wait = clip == hold_on_clip;
        const bool empty = write_empty;
        const auto linger = cancel_delay;
        workers_.emplace(handle, std::jthread(
            [request, fail, wait, empty, linger, cb = std::move(callbacks)](std::stop_token stop) {
                if (wait) {
                    write_bytes(request.output, 10);
                    park(stop);
                    if (linger.count() > 0) {
                        // Finalizes the output after being told to stop
                        std::this_thread::sleep_for(linger);
                        write_bytes(request.output, 20);
                    }
                    cb.on_error(cancelled_failure());
                    return;
                }
                write_bytes(request.output, empty ? 0 : 2048);
                if (fail) {
                    cb.on_error(core::EngineFailure{make_error_code(core::EngineErrc::engine_failure),
                                                    "Encoder crashed"});
                    return;
                }
                cb.on_complete();
            }));
        return handle;
    }

    void cancel(media::ClipHandle handle) noexcept override {
        ++cancels;
        std::lock_guard<std::mutex> lock(mutex_);
        if (auto it = workers_.find(handle); it != workers_.end()) {
            it->second.request_stop();
        }
    }

    std::int64_t duration_ms{200'000};
    std::optional<core::EngineFailure> probe_failure;
    int fail_on_clip{0};
    int hold_on_clip{0};
    bool write_empty{false};
    std::chrono::milliseconds cancel_delay{0};

    std::atomic<int> probes{0};
    std::atomic<int> cancels{0};
    std::vector<media::ClipRequest> requests;
    std::vector<std::thread::id> start_threads;

private:
    std::map<media::ClipHandle, std::jthread> workers_;
    media::ClipHandle next_handle_{1};
    std::mutex mutex_;
};

// Polls until pred holds or the timeout passes
template<typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return pred();
}

} // namespace reelsplit::testing
