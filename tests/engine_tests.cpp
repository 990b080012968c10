// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reelsplit/core/curl_transfer_engine.hpp>
#include <reelsplit/media/ffmpeg_transcoder.hpp>
#include <reelsplit/media/resolver.hpp>
#include <reelsplit/media/subprocess.hpp>
#include <reelsplit/media/ytdlp_resolver.hpp>
#include "fakes.hpp"

#include <algorithm>
#include <csignal>
#include <future>
#include <pthread.h>

using namespace reelsplit;
using namespace reelsplit::media;
using core::EngineErrc;
using core::ErrorKind;
using reelsplit::testing::TempDir;

namespace {

// Executable /bin/sh script standing in for an external tool
std::string make_tool(const TempDir& dir, const std::string& name, const std::string& body) {
    auto path = dir / name;
    {
        std::ofstream out(path, std::ios::trunc);
        out << "#!/bin/sh\n" << body << "\n";
    }
    std::filesystem::permissions(path,
        std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
            std::filesystem::perms::group_exec);
    return path.string();
}

constexpr const char* kReel = "https://www.instagram.com/reel/Cx9AbC12dEf/";

} // namespace

//=============================================================================
// yt-dlp info parsing
//=============================================================================

TEST_CASE("YtDlpResolver parses info documents", "[engine][ytdlp]") {
    SECTION("Top-level url") {
        auto url = YtDlpResolver::parse_info(R"({"id":"x","url":"https://cdn.example.com/a.mp4"})");
        REQUIRE(url.has_value());
        CHECK(*url == "https://cdn.example.com/a.mp4");
    }

    SECTION("Falls back to requested_downloads") {
        auto url = YtDlpResolver::parse_info(
            R"({"id":"x","requested_downloads":[{"url":"https://cdn.example.com/b.mp4"}]})");
        REQUIRE(url.has_value());
        CHECK(*url == "https://cdn.example.com/b.mp4");
    }

    SECTION("No url at all") {
        auto url = YtDlpResolver::parse_info(R"({"id":"x","requested_downloads":[]})");
        REQUIRE_FALSE(url.has_value());
        CHECK(url.error().code == EngineErrc::empty_result);
    }

    SECTION("Malformed output") {
        auto url = YtDlpResolver::parse_info("WARNING: not json");
        REQUIRE_FALSE(url.has_value());
        CHECK(url.error().code == EngineErrc::engine_failure);
    }
}

//=============================================================================
// ffprobe / ffmpeg arguments
//=============================================================================

TEST_CASE("FfmpegTranscoder parses probe output", "[engine][ffmpeg]") {
    SECTION("String duration") {
        auto ms = FfmpegTranscoder::parse_probe(R"({"format":{"duration":"12.345"}})");
        REQUIRE(ms.has_value());
        CHECK(*ms == 12345);
    }

    SECTION("Numeric duration") {
        auto ms = FfmpegTranscoder::parse_probe(R"({"format":{"duration":90.5}})");
        REQUIRE(ms.has_value());
        CHECK(*ms == 90500);
    }

    SECTION("Missing duration") {
        auto ms = FfmpegTranscoder::parse_probe(R"({"format":{}})");
        REQUIRE_FALSE(ms.has_value());
        CHECK(ms.error().code == EngineErrc::probe_failed);
    }

    SECTION("Garbage") {
        CHECK(FfmpegTranscoder::parse_probe("").error().code == EngineErrc::probe_failed);
        CHECK(FfmpegTranscoder::parse_probe(R"({"format":{"duration":"N/A"}})").error().code ==
              EngineErrc::probe_failed);
    }
}

TEST_CASE("FfmpegTranscoder builds clip arguments", "[engine][ffmpeg]") {
    FfmpegTranscoder transcoder("/opt/ffmpeg", "/opt/ffprobe");
    ClipRequest request{"/work/in.mp4", "/work/out/Part_2.mp4", 90'000, 180'000};

    auto args = transcoder.clip_arguments(request);
    REQUIRE_FALSE(args.empty());
    CHECK(args.front() == "/opt/ffmpeg");
    CHECK(args.back() == "/work/out/Part_2.mp4");

    auto value_after = [&](const std::string& flag) -> std::string {
        auto it = std::find(args.begin(), args.end(), flag);
        if (it == args.end() || std::next(it) == args.end()) return {};
        return *std::next(it);
    };
    CHECK(value_after("-ss") == "90.000");
    CHECK(value_after("-t") == "90.000");
    CHECK(value_after("-i") == "/work/in.mp4");
    CHECK(value_after("-c:v") == "libx264");

    // Input seeking
    auto ss = std::find(args.begin(), args.end(), "-ss");
    auto in = std::find(args.begin(), args.end(), "-i");
    CHECK(ss < in);
}

TEST_CASE("FfmpegTranscoder rejects empty ranges", "[engine][ffmpeg]") {
    FfmpegTranscoder transcoder("/nonexistent/ffmpeg", "/nonexistent/ffprobe");
    auto handle = transcoder.start_clip({"in.mp4", "out.mp4", 5'000, 5'000}, {});
    REQUIRE_FALSE(handle.has_value());
    CHECK(handle.error().code == EngineErrc::invalid_argument);
}

//=============================================================================
// Subprocess
//=============================================================================

TEST_CASE("run_process captures output and exit status", "[engine][subprocess]") {
    SECTION("Success") {
        auto result = run_process({"/bin/sh", "-c", "printf hello; printf oops >&2"});
        REQUIRE(result.has_value());
        CHECK(result->ok());
        CHECK(result->out == "hello");
        CHECK(result->err == "oops");
    }

    SECTION("Non-zero exit") {
        auto result = run_process({"/bin/sh", "-c", "exit 3"});
        REQUIRE(result.has_value());
        CHECK_FALSE(result->ok());
        CHECK(result->exit_code == 3);
    }

    SECTION("Missing executable") {
        auto result = run_process({"reelsplit-no-such-tool-4711"});
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == EngineErrc::engine_not_found);
    }

    SECTION("Stop request terminates the child") {
        std::stop_source source;
        auto started = std::chrono::steady_clock::now();
        std::jthread stopper([&source] {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            source.request_stop();
        });
        auto result = run_process({"/bin/sh", "-c", "exec sleep 30"}, source.get_token());
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == EngineErrc::cancelled);
        CHECK(std::chrono::steady_clock::now() - started < std::chrono::seconds(10));
    }

    SECTION("Stop reaches the child while the caller blocks SIGTERM") {
        sigset_t blocked;
        sigemptyset(&blocked);
        sigaddset(&blocked, SIGINT);
        sigaddset(&blocked, SIGTERM);
        sigset_t previous;
        REQUIRE(pthread_sigmask(SIG_BLOCK, &blocked, &previous) == 0);

        std::stop_source source;
        auto started = std::chrono::steady_clock::now();
        std::jthread stopper([&source] {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            source.request_stop();
        });
        auto result = run_process({"sleep", "4"}, source.get_token());
        auto elapsed = std::chrono::steady_clock::now() - started;
        pthread_sigmask(SIG_SETMASK, &previous, nullptr);

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == EngineErrc::cancelled);
        CHECK(elapsed < std::chrono::seconds(2));
    }
}

TEST_CASE("describe_command quotes arguments", "[engine][subprocess]") {
    CHECK(describe_command({"ffmpeg", "-i", "in.mp4"}) == "ffmpeg -i in.mp4");
    auto text = describe_command({"ffmpeg", "-i", "my clip.mp4"});
    CHECK(text.find("\"my clip.mp4\"") != std::string::npos);
}

//=============================================================================
// Engines driven through stand-in tools
//=============================================================================

TEST_CASE("YtDlpResolver runs the tool", "[engine][ytdlp]") {
    TempDir dir;

    SECTION("Reads the url from the JSON dump") {
        auto tool = make_tool(dir, "yt-dlp",
                              R"(echo '{"id":"Cx9AbC12dEf","url":"https://cdn.example.com/v.mp4"}')");
        YtDlpResolver resolver(tool);
        auto url = resolver.resolve(kReel, {});
        REQUIRE(url.has_value());
        CHECK(*url == "https://cdn.example.com/v.mp4");
    }

    SECTION("Private content is not retryable") {
        auto tool = make_tool(dir, "yt-dlp",
                              "echo 'ERROR: [Instagram] Cx9AbC12dEf: This content is private' >&2\nexit 1");
        YtDlpResolver resolver(tool);
        auto url = resolver.resolve(kReel, {});
        REQUIRE_FALSE(url.has_value());
        CHECK(url.error().code == EngineErrc::content_unavailable);

        auto err = core::classify(url.error(), core::PipelineStage::resolve);
        CHECK(err.kind == ErrorKind::processing);
        CHECK_FALSE(err.retryable);
    }

    SECTION("Network trouble is retryable") {
        auto tool = make_tool(dir, "yt-dlp",
                              "echo 'ERROR: Unable to download webpage: connection reset' >&2\nexit 1");
        YtDlpResolver resolver(tool);
        auto url = resolver.resolve(kReel, {});
        REQUIRE_FALSE(url.has_value());
        auto err = core::classify(url.error(), core::PipelineStage::resolve);
        CHECK(err.kind == ErrorKind::network);
        CHECK(err.retryable);
    }

    SECTION("Tool not installed") {
        YtDlpResolver resolver((dir / "missing-yt-dlp").string());
        auto url = resolver.resolve(kReel, {});
        REQUIRE_FALSE(url.has_value());
        CHECK(url.error().code == EngineErrc::engine_not_found);
    }
}

TEST_CASE("FfmpegTranscoder runs the tools", "[engine][ffmpeg]") {
    TempDir dir;
    auto ffprobe = make_tool(dir, "ffprobe", R"(echo '{"format":{"duration":"200.000"}}')");
    auto ffmpeg = make_tool(dir, "ffmpeg", "for last; do :; done\nprintf clip > \"$last\"");
    auto slow_ffmpeg = make_tool(dir, "slow-ffmpeg", "exec sleep 30");
    auto input = dir / "in.mp4";
    reelsplit::testing::write_bytes(input, 100);

    SECTION("Probe") {
        FfmpegTranscoder transcoder(ffmpeg, ffprobe);
        auto ms = transcoder.probe_duration_ms(input);
        REQUIRE(ms.has_value());
        CHECK(*ms == 200'000);
    }

    SECTION("Probe failure") {
        auto broken = make_tool(dir, "broken-ffprobe", "echo 'in.mp4: Invalid data found' >&2\nexit 1");
        FfmpegTranscoder transcoder(ffmpeg, broken);
        auto ms = transcoder.probe_duration_ms(input);
        REQUIRE_FALSE(ms.has_value());
        CHECK(ms.error().code == EngineErrc::probe_failed);
    }

    SECTION("Clip completes") {
        std::promise<bool> done;
        auto future = done.get_future();
        FfmpegTranscoder transcoder(ffmpeg, ffprobe);
        auto output = dir / "Part_1.mp4";
        auto handle = transcoder.start_clip({input, output, 0, 90'000},
            {[&done] { done.set_value(true); },
             [&done](core::EngineFailure) { done.set_value(false); }});
        REQUIRE(handle.has_value());
        REQUIRE(future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
        CHECK(future.get());
        CHECK(std::filesystem::file_size(output) == 4);
    }

    SECTION("Cancel stops the clip") {
        std::promise<core::EngineFailure> failed;
        auto future = failed.get_future();
        FfmpegTranscoder transcoder(slow_ffmpeg, ffprobe);
        auto handle = transcoder.start_clip({input, dir / "Part_1.mp4", 0, 90'000},
            {[] {}, [&failed](core::EngineFailure f) { failed.set_value(std::move(f)); }});
        REQUIRE(handle.has_value());
        transcoder.cancel(*handle);
        REQUIRE(future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
        CHECK(future.get().cancelled());
    }
}

//=============================================================================
// ResolverStage
//=============================================================================

TEST_CASE("ResolverStage validates and classifies", "[engine][resolver]") {
    reelsplit::testing::FakeResolverEngine engine;
    ResolverStage stage(engine);

    SECTION("Resolves a supported link") {
        auto media = stage.resolve(kReel);
        REQUIRE(media.has_value());
        CHECK(media->direct_url == engine.direct_url);
        CHECK(engine.calls == 1);
    }

    SECTION("Unsupported link never reaches the engine") {
        auto media = stage.resolve("https://example.com/watch?v=1");
        REQUIRE_FALSE(media.has_value());
        CHECK(media.error().kind == ErrorKind::invalid_input);
        CHECK(media.error().stage == core::PipelineStage::resolve);
        CHECK_FALSE(media.error().retryable);
        CHECK(engine.calls == 0);
    }

    SECTION("Blank answer") {
        engine.direct_url = "   ";
        auto media = stage.resolve(kReel);
        REQUIRE_FALSE(media.has_value());
        CHECK(media.error().kind == ErrorKind::processing);
        CHECK(media.error().retryable);
    }

    SECTION("Engine failure keeps its classification") {
        engine.failure = core::EngineFailure{make_error_code(EngineErrc::timeout), "Read timed out"};
        auto media = stage.resolve(kReel);
        REQUIRE_FALSE(media.has_value());
        CHECK(media.error().kind == ErrorKind::network);
        CHECK(media.error().retryable);
        CHECK(engine.calls == 1);
    }

    SECTION("Stop while the engine is working") {
        engine.hold = true;
        std::stop_source source;
        std::jthread stopper([&source] {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            source.request_stop();
        });
        auto media = stage.resolve(kReel, source.get_token());
        REQUIRE_FALSE(media.has_value());
        CHECK(media.error().is_cancellation());
    }

    SECTION("Already stopped") {
        std::stop_source source;
        source.request_stop();
        auto media = stage.resolve(kReel, source.get_token());
        REQUIRE_FALSE(media.has_value());
        CHECK(media.error().is_cancellation());
        CHECK(engine.calls == 0);
    }
}

//=============================================================================
// CurlTransferEngine
//=============================================================================

TEST_CASE("CurlTransferEngine copies what the URL points at", "[engine][curl]") {
    core::CurlTransferEngine::global_init();
    TempDir dir;
    auto source = dir / "source.mp4";
    reelsplit::testing::write_bytes(source, 5000);
    auto destination = dir / "reelsplit_copy.mp4";

    std::promise<std::optional<core::EngineFailure>> outcome;
    auto future = outcome.get_future();
    std::atomic<std::uint64_t> last_done{0};

    core::TransferCallbacks callbacks;
    callbacks.on_progress = [&last_done](std::uint64_t done, std::uint64_t) { last_done = done; };
    callbacks.on_complete = [&outcome] { outcome.set_value(std::nullopt); };
    callbacks.on_error = [&outcome](core::EngineFailure f) { outcome.set_value(std::move(f)); };

    SECTION("Local file") {
        core::CurlTransferEngine engine;
        auto handle = engine.start("file://" + source.string(), destination, std::move(callbacks));
        REQUIRE(handle.has_value());
        REQUIRE(future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
        CHECK_FALSE(future.get().has_value());
        CHECK(std::filesystem::file_size(destination) == 5000);
    }

    SECTION("Refused connection") {
        core::CurlTransferEngine engine;
        auto handle = engine.start("http://127.0.0.1:1/clip.mp4", destination, std::move(callbacks));
        REQUIRE(handle.has_value());
        REQUIRE(future.wait_for(std::chrono::seconds(30)) == std::future_status::ready);
        auto failure = future.get();
        REQUIRE(failure.has_value());
        CHECK(failure->code == EngineErrc::connection_failed);
        CHECK(core::classify(*failure, core::PipelineStage::transfer).retryable);
    }
    core::CurlTransferEngine::global_cleanup();
}
