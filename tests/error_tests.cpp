// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reelsplit/core/error.hpp>
#include <reelsplit/disk/error.hpp>
#include <filesystem>
#include <new>
#include <stdexcept>

using namespace reelsplit::core;
using reelsplit::disk::DiskErrc;

TEST_CASE("Network failures are retryable", "[error]") {
    for (auto code : {EngineErrc::connection_failed, EngineErrc::connection_lost,
                      EngineErrc::timeout, EngineErrc::dns_error, EngineErrc::ssl_error}) {
        auto err = classify(EngineFailure{make_error_code(code)}, PipelineStage::transfer);
        CHECK(err.kind == ErrorKind::network);
        CHECK(err.retryable);
        CHECK(err.stage == PipelineStage::transfer);
    }
}

TEST_CASE("HTTP status decides retryability", "[error]") {
    SECTION("5xx") {
        auto err = classify(EngineFailure{make_error_code(EngineErrc::http_error), "", 503},
                            PipelineStage::transfer);
        CHECK(err.kind == ErrorKind::network);
        CHECK(err.retryable);
        CHECK(err.http_status == 503);
        CHECK(err.message.find("503") != std::string::npos);
    }

    SECTION("4xx") {
        auto err = classify(EngineFailure{make_error_code(EngineErrc::http_error), "Not Found", 404},
                            PipelineStage::transfer);
        CHECK(err.kind == ErrorKind::network);
        CHECK_FALSE(err.retryable);
    }
}

TEST_CASE("Malformed input is never retryable", "[error]") {
    for (auto code : {EngineErrc::invalid_locator, EngineErrc::unsupported_scheme,
                      EngineErrc::invalid_file_name, EngineErrc::invalid_argument}) {
        auto err = classify(EngineFailure{make_error_code(code)}, PipelineStage::resolve);
        CHECK(err.kind == ErrorKind::invalid_input);
        CHECK_FALSE(err.retryable);
    }
}

TEST_CASE("Engine failures default to retryable processing", "[error]") {
    auto err = classify(EngineFailure{make_error_code(EngineErrc::engine_failure), "exit 1"},
                        PipelineStage::resolve);
    CHECK(err.kind == ErrorKind::processing);
    CHECK(err.retryable);
    CHECK(err.message == "exit 1");

    auto gone = classify(EngineFailure{make_error_code(EngineErrc::content_unavailable)},
                         PipelineStage::resolve);
    CHECK(gone.kind == ErrorKind::processing);
    CHECK_FALSE(gone.retryable);
}

TEST_CASE("Storage failures", "[error]") {
    SECTION("Missing source file is not retryable") {
        auto err = classify(EngineFailure{make_error_code(DiskErrc::file_not_found)}, PipelineStage::split);
        CHECK(err.kind == ErrorKind::storage);
        CHECK_FALSE(err.retryable);
    }

    SECTION("Directory creation race is retryable") {
        auto err = classify(EngineFailure{make_error_code(DiskErrc::create_failed)}, PipelineStage::transfer);
        CHECK(err.kind == ErrorKind::storage);
        CHECK(err.retryable);
    }

    SECTION("Empty download counts as unavailable remote content") {
        auto err = classify(EngineFailure{make_error_code(DiskErrc::empty_file)}, PipelineStage::transfer);
        CHECK(err.kind == ErrorKind::network);
        CHECK(err.retryable);
    }
}

TEST_CASE("Cancellation is distinguishable", "[error]") {
    auto err = classify(EngineFailure{make_error_code(EngineErrc::cancelled)}, PipelineStage::split);
    CHECK(err.is_cancellation());
    CHECK_FALSE(err.retryable);
    CHECK(err.stage == PipelineStage::split);

    CHECK(cancelled_error(std::nullopt).is_cancellation());
    CHECK_FALSE(make_error(ErrorKind::network, "x", std::nullopt, true).is_cancellation());
}

TEST_CASE("classify_engine_message", "[error]") {
    SECTION("Unsupported URL") {
        auto f = classify_engine_message("ERROR: Unsupported URL: https://example.com/x");
        CHECK(f.code == EngineErrc::invalid_locator);
        CHECK(f.detail == "Unsupported URL: https://example.com/x");
    }

    SECTION("Permanent conditions") {
        CHECK(classify_engine_message("ERROR: [Instagram] abc: This content is private").code
              == EngineErrc::content_unavailable);
        CHECK(classify_engine_message("ERROR: Video has been deleted").code
              == EngineErrc::content_unavailable);
    }

    SECTION("HTTP status is parsed") {
        auto f = classify_engine_message("ERROR: unable to download webpage: HTTP Error 503: Service Unavailable");
        CHECK(f.code == EngineErrc::http_error);
        CHECK(f.http_status == 503);
        auto err = classify(f, PipelineStage::resolve);
        CHECK(err.retryable);
    }

    SECTION("HTTP status wins over permanent phrases") {
        auto f = classify_engine_message(
            "ERROR: [Instagram] abc: Unable to download webpage: HTTP Error 404: Not Found");
        CHECK(f.code == EngineErrc::http_error);
        CHECK(f.http_status == 404);
        auto err = classify(f, PipelineStage::resolve);
        CHECK(err.kind == ErrorKind::network);
        CHECK_FALSE(err.retryable);

        auto busy = classify(classify_engine_message("ERROR: HTTP Error 503: restricted proxy"),
                             PipelineStage::resolve);
        CHECK(busy.kind == ErrorKind::network);
        CHECK(busy.retryable);
    }

    SECTION("Network failures mentioning a private host stay retryable") {
        auto err = classify(classify_engine_message("ERROR: Connection to private relay timed out"),
                            PipelineStage::resolve);
        CHECK(err.kind == ErrorKind::network);
        CHECK(err.retryable);
    }

    SECTION("Timeouts and network") {
        CHECK(classify_engine_message("ERROR: The read operation timed out").code == EngineErrc::timeout);
        CHECK(classify_engine_message("ERROR: Connection refused").code == EngineErrc::connection_failed);
    }

    SECTION("Anything else") {
        auto f = classify_engine_message("something odd\nsecond line");
        CHECK(f.code == EngineErrc::engine_failure);
        CHECK(f.detail == "something odd");
        CHECK(classify_engine_message("").detail == "External engine failed");
    }
}

TEST_CASE("from_exception", "[error]") {
    SECTION("Filesystem permission") {
        std::filesystem::filesystem_error ex("open", "/root/x",
                                             std::make_error_code(std::errc::permission_denied));
        auto err = from_exception(ex, PipelineStage::transfer);
        CHECK(err.kind == ErrorKind::permission);
        CHECK_FALSE(err.retryable);
        CHECK(err.path == "/root/x");
    }

    SECTION("Invalid argument") {
        auto err = from_exception(std::invalid_argument("bad"), std::nullopt);
        CHECK(err.kind == ErrorKind::invalid_input);
    }

    SECTION("Anything else is unknown and retryable") {
        auto err = from_exception(std::runtime_error("boom"), std::nullopt);
        CHECK(err.kind == ErrorKind::unknown);
        CHECK(err.retryable);
        CHECK(err.message == "boom");
        CHECK_FALSE(err.stage.has_value());
    }
}

TEST_CASE("AppError::describe names the stage", "[error]") {
    auto err = make_error(ErrorKind::network, "Timed out", PipelineStage::transfer, true);
    CHECK(err.describe() == "Transfer: Timed out");
    err.stage.reset();
    CHECK(err.describe() == "Timed out");
}

TEST_CASE("Error categories", "[error]") {
    auto ec = make_error_code(EngineErrc::timeout);
    CHECK(std::string(ec.category().name()) == "reelsplit::engine");
    CHECK_FALSE(ec.message().empty());

    auto dc = make_error_code(DiskErrc::disk_full);
    CHECK(std::string(dc.category().name()) == "reelsplit::disk");
}
