// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/media/subprocess.hpp>
#include <reelsplit/core/error.hpp>
#include <reelsplit/core/log.hpp>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace reelsplit::media {

using core::EngineErrc;

namespace {

constexpr int POLL_INTERVAL_MS = 100;
constexpr auto REAP_INTERVAL = std::chrono::milliseconds(20);

// Closes both ends of a pipe on scope exit unless released
struct Pipe {
    int fds[2]{-1, -1};

    ~Pipe() {
        for (int fd : fds) {
            if (fd >= 0) ::close(fd);
        }
    }

    [[nodiscard]] bool open() noexcept { return ::pipe2(fds, O_CLOEXEC) == 0; }

    int release_read() noexcept {
        int fd = fds[0];
        fds[0] = -1;
        return fd;
    }
};

bool drain(int& fd, std::string& sink) {
    char buffer[4096];
    auto n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        sink.append(buffer, static_cast<std::size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    ::close(fd);
    fd = -1;
    return false;
}

} // namespace

//=============================================================================
// Subprocess
//=============================================================================

Subprocess::Subprocess(Token, pid_t pid, int out_fd, int err_fd) noexcept
    : pid_(pid)
    , out_fd_(out_fd)
    , err_fd_(err_fd) {}

Subprocess::~Subprocess() {
    if (!reaped_) {
        terminate();
        (void)reap();
    }
    close_fds();
}

std::expected<std::unique_ptr<Subprocess>, std::error_code>
Subprocess::spawn(const std::vector<std::string>& argv, Output stdout_mode) {
    if (argv.empty()) {
        return std::unexpected(make_error_code(EngineErrc::invalid_argument));
    }

    Pipe out_pipe;
    Pipe err_pipe;
    if ((stdout_mode == Output::capture && !out_pipe.open()) || !err_pipe.open()) {
        return std::unexpected(std::error_code(errno, std::system_category()));
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    if (stdout_mode == Output::capture) {
        posix_spawn_file_actions_adddup2(&actions, out_pipe.fds[1], STDOUT_FILENO);
    } else {
        posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    }
    posix_spawn_file_actions_adddup2(&actions, err_pipe.fds[1], STDERR_FILENO);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    // Children start unblocked with default SIGINT/SIGTERM handling even when
    // the caller has them blocked for sigwait
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t mask;
    sigemptyset(&mask);
    posix_spawnattr_setsigmask(&attr, &mask);
    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGINT);
    sigaddset(&defaults, SIGTERM);
    posix_spawnattr_setsigdefault(&attr, &defaults);
    posix_spawnattr_setflags(&attr, static_cast<short>(POSIX_SPAWN_SETSIGMASK | POSIX_SPAWN_SETSIGDEF));

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, args[0], &actions, &attr, args.data(), environ);
    posix_spawnattr_destroy(&attr);
    posix_spawn_file_actions_destroy(&actions);

    if (rc != 0) {
        if (rc == ENOENT) {
            return std::unexpected(make_error_code(EngineErrc::engine_not_found));
        }
        if (rc == EACCES) {
            return std::unexpected(make_error_code(EngineErrc::permission_denied));
        }
        return std::unexpected(std::error_code(rc, std::system_category()));
    }

    REELSPLIT_LOG_DEBUG("Spawned pid {}: {}", pid, describe_command(argv));
    int out_fd = stdout_mode == Output::capture ? out_pipe.release_read() : -1;
    return std::make_unique<Subprocess>(Token{}, pid, out_fd, err_pipe.release_read());
}

std::expected<ProcessResult, std::error_code> Subprocess::wait(std::stop_token stop) {
    ProcessResult result;
    bool cancelled = false;

    while (out_fd_ >= 0 || err_fd_ >= 0) {
        if (!cancelled && stop.stop_requested()) {
            cancelled = true;
            terminate();
        }

        pollfd fds[2];
        nfds_t count = 0;
        if (out_fd_ >= 0) fds[count++] = {out_fd_, POLLIN, 0};
        if (err_fd_ >= 0) fds[count++] = {err_fd_, POLLIN, 0};

        int ready = ::poll(fds, count, POLL_INTERVAL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;
            if (fds[i].fd == out_fd_) {
                drain(out_fd_, result.out);
            } else if (fds[i].fd == err_fd_) {
                drain(err_fd_, result.err);
            }
        }
    }
    close_fds();

    result.exit_code = reap();
    bool terminated = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        terminated = terminated_;
    }
    if (cancelled || terminated) {
        return std::unexpected(make_error_code(EngineErrc::cancelled));
    }
    return result;
}

void Subprocess::terminate() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (reaped_ || pid_ <= 0) return;
    terminated_ = true;
    ::kill(pid_, SIGTERM);
}

int Subprocess::reap() noexcept {
    int status = 0;
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (reaped_) return -1;
            pid_t rc = ::waitpid(pid_, &status, WNOHANG);
            if (rc == pid_ || (rc < 0 && errno != EINTR)) {
                reaped_ = true;
                break;
            }
        }
        std::this_thread::sleep_for(REAP_INTERVAL);
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void Subprocess::close_fds() noexcept {
    if (out_fd_ >= 0) {
        ::close(out_fd_);
        out_fd_ = -1;
    }
    if (err_fd_ >= 0) {
        ::close(err_fd_);
        err_fd_ = -1;
    }
}

//=============================================================================
// Helpers
//=============================================================================

std::expected<ProcessResult, std::error_code>
run_process(const std::vector<std::string>& argv, std::stop_token stop) {
    auto child = Subprocess::spawn(argv, Subprocess::Output::capture);
    if (!child) {
        return std::unexpected(child.error());
    }
    return (*child)->wait(stop);
}

std::string describe_command(const std::vector<std::string>& argv) {
    std::string line;
    for (const auto& arg : argv) {
        if (!line.empty()) line += ' ';
        if (arg.find_first_of(" \t\"'") != std::string::npos) {
            line += '"';
            line += arg;
            line += '"';
        } else {
            line += arg;
        }
    }
    return line;
}

} // namespace reelsplit::media
