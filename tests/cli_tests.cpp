// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reelsplit/cli/commands.hpp>
#include <reelsplit/cli/progress_bar.hpp>
#include <string>
#include <vector>

using namespace reelsplit::cli;

namespace {

CliArgs parse(std::vector<std::string> words) {
    words.insert(words.begin(), "reelsplit");
    std::vector<char*> argv;
    for (auto& w : words) argv.push_back(w.data());
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(words.size()), argv.data());
}

} // namespace

//=============================================================================
// ProgressBar
//=============================================================================

TEST_CASE("ProgressBar renders bars", "[cli][progress]") {
    CHECK(ProgressBar::render_bar(0.0, 4) == "[>   ]");
    CHECK(ProgressBar::render_bar(50.0, 10) == "[=====>    ]");
    CHECK(ProgressBar::render_bar(100.0, 10) == "[==========]");
    CHECK(ProgressBar::render_bar(250.0, 4) == "[====]");
}

TEST_CASE("ProgressBar formats units", "[cli][progress]") {
    SECTION("Bytes") {
        CHECK(ProgressBar::format_bytes(512) == "512 B");
        CHECK(ProgressBar::format_bytes(2048) == "2 KB");
        CHECK(ProgressBar::format_bytes(1572864) == "1.5 MB");
        CHECK(ProgressBar::format_bytes(2ULL * 1024 * 1024 * 1024) == "2.00 GB");
    }

    SECTION("Speed") {
        CHECK(ProgressBar::format_speed(100) == "100 B/s");
        CHECK(ProgressBar::format_speed(1536) == "1.5 KB/s");
        CHECK(ProgressBar::format_speed(1048576) == "1.0 MB/s");
    }

    SECTION("Time") {
        CHECK(ProgressBar::format_time(7) == "7s");
        CHECK(ProgressBar::format_time(125) == "2m 5s");
        CHECK(ProgressBar::format_time(3723) == "1h 02m 3s");
    }
}

TEST_CASE("ProgressBar builds status lines", "[cli][progress]") {
    SECTION("Byte progress with speed and ETA") {
        ProgressBar bar(1024 * 1024, "Downloading");
        auto line = bar.render_line(512 * 1024, 256 * 1024);
        CHECK(line.starts_with("\rDownloading: ["));
        CHECK(line.find(" 50%") != std::string::npos);
        CHECK(line.find("(512 KB/1.0 MB)") != std::string::npos);
        CHECK(line.find("@ 256.0 KB/s") != std::string::npos);
        CHECK(line.find("ETA: 2s") != std::string::npos);
    }

    SECTION("Percent progress has no byte counts") {
        ProgressBar bar(100, "Part 1/3", ProgressBar::Unit::percent);
        auto line = bar.render_line(40, 0);
        CHECK(line.find(" 40%") != std::string::npos);
        CHECK(line.find(" B") == std::string::npos);
    }
}

//=============================================================================
// Argument parsing
//=============================================================================

TEST_CASE("parse_args reads options", "[cli][args]") {
    SECTION("Link and options") {
        auto args = parse({"-t", "60", "--attempts", "2", "-d", "/tmp/work",
                           "https://www.instagram.com/reel/Cx9AbC12dEf/"});
        CHECK(args.error.empty());
        CHECK(args.input == "https://www.instagram.com/reel/Cx9AbC12dEf/");
        CHECK(args.target_seconds == 60u);
        CHECK(args.max_attempts == 2u);
        CHECK(args.work_dir == "/tmp/work");
    }

    SECTION("Shared text is joined") {
        auto args = parse({"Check", "this", "out", "https://instagr.am/p/B1/"});
        CHECK(args.input == "Check this out https://instagr.am/p/B1/");
    }

    SECTION("Help and version short-circuit") {
        CHECK(parse({"--help", "--bogus"}).help);
        CHECK(parse({"-v"}).version);
    }

    SECTION("Maintenance without a link") {
        auto args = parse({"--clear-cache", "--prune", "48"});
        CHECK(args.error.empty());
        CHECK(args.clear_cache);
        CHECK(args.prune_hours == 48u);
        CHECK(args.input.empty());
    }
}

TEST_CASE("parse_args rejects bad input", "[cli][args]") {
    CHECK_FALSE(parse({"--frobnicate"}).error.empty());
    CHECK_FALSE(parse({"-t"}).error.empty());
    CHECK_FALSE(parse({"-t", "0"}).error.empty());
    CHECK_FALSE(parse({"-t", "ninety"}).error.empty());
    CHECK_FALSE(parse({"--verbose", "--quiet"}).error.empty());
}
