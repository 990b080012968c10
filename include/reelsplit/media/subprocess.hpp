// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <expected>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <system_error>
#include <vector>
#include <sys/types.h>

namespace reelsplit::media {

struct ProcessResult {
    int exit_code{0};
    std::string out;
    std::string err;

    [[nodiscard]] bool ok() const noexcept { return exit_code == 0; }
};

// Child process started with posix_spawnp. stdout is captured or discarded,
// stderr is always captured. The destructor terminates and reaps a child
// that is still running.
class Subprocess {
    struct Token {};

public:
    enum class Output { capture, discard };

    // engine_not_found when the executable cannot be located
    [[nodiscard]] static std::expected<std::unique_ptr<Subprocess>, std::error_code>
    spawn(const std::vector<std::string>& argv, Output stdout_mode = Output::capture);

    // Use spawn()
    Subprocess(Token, pid_t pid, int out_fd, int err_fd) noexcept;
    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;

    // Collects output until the child exits. A stop request terminates the
    // child and yields EngineErrc::cancelled.
    [[nodiscard]] std::expected<ProcessResult, std::error_code> wait(std::stop_token stop = {});

    // SIGTERM, safe from any thread
    void terminate() noexcept;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

private:
    void close_fds() noexcept;
    int reap() noexcept;

    pid_t pid_{-1};
    int out_fd_{-1};
    int err_fd_{-1};
    bool terminated_{false};
    bool reaped_{false};
    std::mutex mutex_;
};

// Runs argv to completion
[[nodiscard]] std::expected<ProcessResult, std::error_code>
run_process(const std::vector<std::string>& argv, std::stop_token stop = {});

// Shell-style rendering for logs
[[nodiscard]] std::string describe_command(const std::vector<std::string>& argv);

} // namespace reelsplit::media
