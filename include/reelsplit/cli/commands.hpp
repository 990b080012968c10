// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace reelsplit::cli {

// Process exit codes
inline constexpr int EXIT_COMPLETE = 0;
inline constexpr int EXIT_FAILED = 1;
inline constexpr int EXIT_USAGE = 2;
inline constexpr int EXIT_CANCELLED = 130;

// Command line arguments
struct CliArgs {
    std::string input;                          // Share link or shared text
    std::string work_dir;
    std::string config_file;
    std::optional<std::uint32_t> target_seconds;
    std::optional<std::uint32_t> max_attempts;
    std::optional<std::uint32_t> prune_hours;
    bool clear_cache{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
    std::string error;                          // Set when the arguments are unusable
};

[[nodiscard]] CliArgs parse_args(int argc, char* argv[]);

// Runs the maintenance commands and then the pipeline for args.input.
// A stop request on `interrupt` cancels the running job.
[[nodiscard]] int run(const CliArgs& args, std::stop_token interrupt);

void print_help(std::string_view program_name);

void print_version();

} // namespace reelsplit::cli
