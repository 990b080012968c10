// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/cli/commands.hpp>
#include <reelsplit/core/log.hpp>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iostream>
#include <pthread.h>
#include <stop_token>
#include <thread>

using namespace reelsplit::cli;

// Terminate handler to report exceptions that escape noexcept code
static void reelsplit_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

// Waits for SIGINT/SIGTERM on a dedicated thread and turns the first one
// into a stop request. The signals must already be blocked in every thread.
static std::jthread watch_signals(std::stop_source interrupt, const sigset_t& signals) {
    return std::jthread([interrupt, signals](std::stop_token stoken) mutable {
        const timespec poll{0, 200'000'000};
        while (!stoken.stop_requested()) {
            int sig = sigtimedwait(&signals, nullptr, &poll);
            if (sig == SIGINT || sig == SIGTERM) {
                REELSPLIT_LOG_INFO("Received signal {}, cancelling", sig);
                interrupt.request_stop();
                return;
            }
        }
    });
}

int main(int argc, char* argv[]) {
    std::set_terminate(reelsplit_terminate_handler);
    reelsplit::core::init_logging();

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return EXIT_COMPLETE;
    }
    if (args.version) {
        print_version();
        return EXIT_COMPLETE;
    }
    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_USAGE;
    }

    // Block before any worker thread exists so they all inherit the mask
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    if (int rc = pthread_sigmask(SIG_BLOCK, &signals, nullptr); rc != 0) {
        std::cerr << "Error: cannot install signal mask (" << rc << ")" << std::endl;
        return EXIT_FAILED;
    }

    std::stop_source interrupt;
    auto watcher = watch_signals(interrupt, signals);

    int code = run(args, interrupt.get_token());

    watcher.request_stop();
    return code;
}
