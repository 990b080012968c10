// Copyright (c) 2026 changcheng967. All rights reserved.

#include <reelsplit/cli/commands.hpp>
#include <reelsplit/cli/progress_bar.hpp>
#include <reelsplit/core/curl_transfer_engine.hpp>
#include <reelsplit/core/executor.hpp>
#include <reelsplit/core/id.hpp>
#include <reelsplit/core/locator.hpp>
#include <reelsplit/core/log.hpp>
#include <reelsplit/core/overloaded.hpp>
#include <reelsplit/core/settings.hpp>
#include <reelsplit/core/transfer_stage.hpp>
#include <reelsplit/disk/work_cache.hpp>
#include <reelsplit/media/ffmpeg_transcoder.hpp>
#include <reelsplit/media/resolver.hpp>
#include <reelsplit/media/split_stage.hpp>
#include <reelsplit/media/ytdlp_resolver.hpp>
#include <reelsplit/pipeline/pipeline_manager.hpp>
#include <reelsplit/store/segment_store.hpp>
#include <reelsplit/version.hpp>
#include <spdlog/fmt/fmt.h>
#include <charconv>
#include <iostream>
#include <optional>

namespace reelsplit::cli {

using core::overloaded;
namespace state = pipeline::state;

namespace {

std::optional<std::uint32_t> parse_count(std::string_view text) {
    std::uint32_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

// Renders pipeline states on the terminal. Called from the job's listener,
// which delivers one state at a time.
class StateView {
public:
    explicit StateView(bool quiet) : quiet_(quiet) {}

    void show(const pipeline::PipelineState& s) {
        if (quiet_) return;
        std::visit(overloaded{
            [](const state::Idle&) {},
            [this](const state::Resolving&) {
                close_bar();
                std::cout << "Fetching video info..." << std::endl;
            },
            [this](const state::Transferring& t) {
                if (t.attempt != attempt_) {
                    close_bar();
                    attempt_ = t.attempt;
                    if (attempt_ > 1) {
                        std::cout << "Retrying download (attempt " << attempt_ << ")" << std::endl;
                    }
                }
                if (!bar_) {
                    bar_.emplace(t.bytes_total, "Downloading", ProgressBar::Unit::bytes);
                }
                bar_->total(t.bytes_total);
                bar_->update(t.bytes_done, t.bytes_per_second);
            },
            [this](const state::Splitting& sp) {
                if (sp.total_parts == 0) {
                    close_bar();
                    std::cout << "Preparing to split..." << std::endl;
                    return;
                }
                if (!splitting_) {
                    close_bar();
                    splitting_ = true;
                    bar_.emplace(100, "", ProgressBar::Unit::percent);
                }
                bar_->label(fmt::format("Part {}/{}", sp.current_part, sp.total_parts));
                bar_->update(static_cast<std::uint64_t>(sp.percent));
            },
            [this](const state::Complete&) { close_bar(); },
            [this](const state::Failed&) { drop_bar(); },
            [this](const state::Cancelled&) { drop_bar(); },
        }, s);
    }

private:
    void close_bar() {
        if (bar_) {
            bar_->finish();
            bar_.reset();
        }
    }

    void drop_bar() {
        if (bar_) {
            bar_->clear();
            bar_.reset();
        }
    }

    bool quiet_;
    std::optional<ProgressBar> bar_;
    std::uint32_t attempt_{0};
    bool splitting_{false};
};

int report(const pipeline::PipelineState& final_state) {
    return std::visit(overloaded{
        [](const state::Complete& c) {
            std::cout << "Created " << c.segments.size() << " segment"
                      << (c.segments.size() == 1 ? "" : "s") << ":\n";
            for (const auto& seg : c.segments) {
                std::cout << fmt::format("  {:<12} {:>6} {:>9}  {}\n", seg.display_name(),
                                         seg.formatted_duration(), seg.formatted_size(),
                                         seg.file_path.string());
                if (!seg.fits_status_limits()) {
                    std::cout << "    warning: exceeds status upload limits\n";
                }
            }
            std::cout << std::flush;
            return EXIT_COMPLETE;
        },
        [](const state::Failed& f) {
            std::cerr << "Error: " << pipeline::describe(f) << std::endl;
            if (f.retryable) {
                std::cerr << "This looks temporary. Run the command again to retry." << std::endl;
            }
            return EXIT_FAILED;
        },
        [](const state::Cancelled&) {
            std::cerr << "Cancelled" << std::endl;
            return EXIT_CANCELLED;
        },
        [](const state::Idle&) { return EXIT_FAILED; },
        [](const state::Resolving&) { return EXIT_FAILED; },
        [](const state::Transferring&) { return EXIT_FAILED; },
        [](const state::Splitting&) { return EXIT_FAILED; },
    }, final_state);
}

// Pairs curl global init and cleanup around a run
struct CurlGlobal {
    CurlGlobal() { core::CurlTransferEngine::global_init(); }
    ~CurlGlobal() { core::CurlTransferEngine::global_cleanup(); }
};

int process(const core::Settings& settings, const core::Locator& locator,
            const disk::WorkCache& cache, bool quiet, std::stop_token interrupt) {
    CurlGlobal curl;

    core::CurlTransferEngine transfer_engine(settings.transfer);
    media::YtDlpResolver resolver_engine(settings.tools.yt_dlp);
    media::FfmpegTranscoder transcoder(settings.tools.ffmpeg, settings.tools.ffprobe);

    core::ThreadPool io(core::IO_POOL_THREADS, "io");
    core::SerialContext clip_context("clip");

    media::ResolverStage resolver(resolver_engine);
    core::TransferStage transfer(transfer_engine);
    media::SplitStage splitter(transcoder, clip_context);

    store::SegmentStore store;
    pipeline::PipelineManager manager({resolver, transfer, splitter}, store, io,
                                      pipeline::RetryPolicy::from(settings.retry));

    pipeline::JobSpec job;
    job.job_id = core::generate_id();
    job.locator = locator.url;
    job.video_id = locator.reel_id;
    job.work_dir = cache.root();
    job.split = media::SplitOptions{settings.segment_duration, settings.min_trailing};

    auto created = manager.create(job);
    if (!created) {
        std::cerr << "Error: " << created.error().message << std::endl;
        return EXIT_FAILED;
    }
    auto* orchestrator = *created;

    StateView view(quiet);
    auto token = orchestrator->subscribe([&view](const pipeline::PipelineState& s) { view.show(s); });
    std::stop_callback on_interrupt(interrupt, [&manager, id = job.job_id] { manager.cancel(id); });

    // Fails only when an interrupt already cancelled the job
    if (manager.start(job.job_id)) {
        orchestrator->wait();
    }
    orchestrator->unsubscribe(token);

    return report(orchestrator->state());
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

CliArgs parse_args(int argc, char* argv[]) {
    CliArgs args;

    auto value_of = [&](int& i, std::string_view option) -> std::optional<std::string> {
        if (i + 1 >= argc) {
            args.error = fmt::format("Option {} needs a value", option);
            return std::nullopt;
        }
        return std::string(argv[++i]);
    };
    auto count_of = [&](int& i, std::string_view option) -> std::optional<std::uint32_t> {
        auto text = value_of(i, option);
        if (!text) return std::nullopt;
        auto value = parse_count(*text);
        if (!value || *value == 0) {
            args.error = fmt::format("Option {} needs a positive number, got '{}'", option, *text);
        }
        return value;
    };

    for (int i = 1; i < argc && args.error.empty(); ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
        } else if (arg == "-d" || arg == "--directory") {
            if (auto v = value_of(i, arg)) args.work_dir = *v;
        } else if (arg == "-c" || arg == "--config") {
            if (auto v = value_of(i, arg)) args.config_file = *v;
        } else if (arg == "-t" || arg == "--target") {
            args.target_seconds = count_of(i, arg);
        } else if (arg == "-a" || arg == "--attempts") {
            args.max_attempts = count_of(i, arg);
        } else if (arg == "--prune") {
            args.prune_hours = count_of(i, arg);
        } else if (arg == "--clear-cache") {
            args.clear_cache = true;
        } else if (arg.starts_with("-") && arg.size() > 1) {
            args.error = fmt::format("Unknown option: {}", arg);
        } else {
            // Free text is joined so a pasted share message works unquoted
            if (!args.input.empty()) args.input += ' ';
            args.input += arg;
        }
    }

    if (args.error.empty() && args.verbose && args.quiet) {
        args.error = "--verbose and --quiet cannot be combined";
    }
    return args;
}

//=============================================================================
// Commands
//=============================================================================

int run(const CliArgs& args, std::stop_token interrupt) {
    core::Settings settings;
    if (!args.config_file.empty()) {
        auto loaded = core::Settings::load(args.config_file);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().message << std::endl;
            return EXIT_USAGE;
        }
        settings = std::move(*loaded);
    }

    if (!args.work_dir.empty()) settings.work_dir = args.work_dir;
    if (args.target_seconds) settings.segment_duration = std::chrono::seconds(*args.target_seconds);
    if (args.max_attempts) settings.retry.max_attempts = *args.max_attempts;

    if (auto valid = settings.validate(); !valid) {
        std::cerr << "Error: " << valid.error().message << std::endl;
        return EXIT_USAGE;
    }

    if (args.verbose) {
        core::set_log_level(spdlog::level::debug);
    } else if (args.quiet) {
        core::set_log_level(spdlog::level::err);
    } else if (auto level = core::parse_log_level(settings.log_level)) {
        core::set_log_level(*level);
    }

    disk::WorkCache cache(settings.effective_work_dir());
    if (auto ec = cache.ensure()) {
        std::cerr << "Error: cannot use work directory " << cache.root().string() << ": "
                  << ec.message() << std::endl;
        return EXIT_FAILED;
    }

    const bool maintenance = args.clear_cache || args.prune_hours.has_value();
    if (args.clear_cache) {
        auto removed = cache.clear();
        if (!args.quiet) std::cout << "Removed " << removed << " cached item(s)" << std::endl;
    } else if (args.prune_hours) {
        auto removed = cache.delete_older_than(std::chrono::hours(*args.prune_hours));
        if (!args.quiet) std::cout << "Pruned " << removed << " cached item(s)" << std::endl;
    }

    if (args.input.empty()) {
        if (maintenance) return EXIT_COMPLETE;
        std::cerr << "Error: No share link specified" << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return EXIT_USAGE;
    }

    auto locator = core::extract_locator(args.input);
    if (!locator) {
        std::cerr << "Error: No supported video link found in input" << std::endl;
        return EXIT_USAGE;
    }
    REELSPLIT_LOG_DEBUG("Using work directory {}", cache.root().string());

    return process(settings, *locator, cache, args.quiet, interrupt);
}

void print_help(std::string_view program_name) {
    std::cout << PRODUCT_NAME << " " << version.to_string() << " - cut shared videos into status-sized parts\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <LINK or shared text>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -v, --version           Show version information\n";
    std::cout << "  -V, --verbose           Enable verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (no progress bar)\n";
    std::cout << "  -d, --directory <DIR>   Work directory for downloads and parts\n";
    std::cout << "  -t, --target <SEC>      Target part length in seconds (default: "
              << std::chrono::duration_cast<std::chrono::seconds>(core::DEFAULT_SEGMENT_DURATION).count() << ")\n";
    std::cout << "  -c, --config <FILE>     Load settings from a JSON file\n";
    std::cout << "  -a, --attempts <N>      Maximum download attempts (default: " << core::MAX_ATTEMPTS << ")\n";
    std::cout << "      --prune <HOURS>     Remove cached files older than HOURS\n";
    std::cout << "      --clear-cache       Remove every cached file\n";
    std::cout << "\n";
    std::cout << "EXIT STATUS:\n";
    std::cout << "  0 complete, 1 failed, 2 usage error, 130 cancelled\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://www.instagram.com/reel/C1a2b3c4d5e/\n";
    std::cout << "  " << program_name << " -t 60 -d ~/Videos/parts https://instagr.am/p/C1a2b3c4d5e\n";
    std::cout << "  " << program_name << " --prune 48\n";
}

void print_version() {
    std::cout << version.banner() << std::endl;
    std::cout << "Uses yt-dlp, ffmpeg and ffprobe from PATH unless configured otherwise\n";
}

} // namespace reelsplit::cli
