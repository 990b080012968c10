// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <reelsplit/pipeline/pipeline_manager.hpp>
#include "fakes.hpp"

using namespace reelsplit;
using namespace reelsplit::pipeline;
using namespace reelsplit::testing;
using namespace std::chrono_literals;

namespace {

struct Stack {
    TempDir dir;
    FakeResolverEngine resolver_engine;
    FakeTransferEngine transfer_engine;
    FakeTranscodeEngine transcode_engine;
    core::ThreadPool io{4, "io"};
    core::InlineExecutor clip;
    media::ResolverStage resolver{resolver_engine};
    core::TransferStage transfer{transfer_engine};
    media::SplitStage splitter{transcode_engine, clip};
    store::SegmentStore store;

    Stack() {
        FakeTransferEngine::Behavior b;
        b.total_bytes = 20'000;
        transfer_engine.set(b);
        transcode_engine.duration_ms = 30'000;
    }

    JobSpec job(const std::string& id) const {
        JobSpec spec;
        spec.job_id = id;
        spec.locator = "https://www.instagram.com/reel/" + id + "/";
        spec.work_dir = dir.path();
        return spec;
    }
};

} // namespace

TEST_CASE("PipelineManager registers jobs", "[manager]") {
    Stack stack;
    PipelineManager manager({stack.resolver, stack.transfer, stack.splitter}, stack.store, stack.io);

    auto created = manager.create(stack.job("ReelA1"));
    REQUIRE(created.has_value());
    CHECK((*created)->job().job_id == "ReelA1");
    CHECK((*created)->job().video_id == "ReelA1");
    CHECK(manager.find("ReelA1") == *created);

    SECTION("Duplicate ids are rejected") {
        auto again = manager.create(stack.job("ReelA1"));
        REQUIRE_FALSE(again.has_value());
        CHECK(again.error().kind == core::ErrorKind::invalid_input);
    }

    SECTION("Empty ids are rejected") {
        auto empty = manager.create(stack.job(""));
        REQUIRE_FALSE(empty.has_value());
        CHECK(empty.error().kind == core::ErrorKind::invalid_input);
    }

    SECTION("Unknown ids") {
        CHECK_FALSE(manager.start("nope"));
        CHECK_FALSE(manager.retry("nope"));
        CHECK_FALSE(manager.state("nope").has_value());
        CHECK_FALSE(manager.remove("nope"));
        CHECK(manager.find("nope") == nullptr);
        manager.cancel("nope");
    }

    SECTION("Ids are listed in order") {
        REQUIRE(manager.create(stack.job("ReelB2")).has_value());
        CHECK(manager.jobs() == std::vector<std::string>{"ReelA1", "ReelB2"});
    }
}

TEST_CASE("PipelineManager runs jobs side by side", "[manager]") {
    Stack stack;
    PipelineManager manager({stack.resolver, stack.transfer, stack.splitter}, stack.store, stack.io);

    const std::vector<std::string> ids{"ReelA1", "ReelB2", "ReelC3"};
    for (const auto& id : ids) {
        REQUIRE(manager.create(stack.job(id)).has_value());
        REQUIRE(manager.start(id));
    }
    for (const auto& id : ids) {
        REQUIRE(manager.find(id)->wait_for(10s));
        auto s = manager.state(id);
        REQUIRE(s.has_value());
        CHECK(std::holds_alternative<state::Complete>(*s));
        CHECK(stack.store.segments_for(id).size() == 1);
    }

    SECTION("Finished jobs can be removed") {
        CHECK(manager.remove("ReelB2"));
        CHECK(manager.jobs() == std::vector<std::string>{"ReelA1", "ReelC3"});
        CHECK_FALSE(manager.state("ReelB2").has_value());
        // Segments outlive the job
        CHECK(stack.store.segments_for("ReelB2").size() == 1);
    }
}

TEST_CASE("PipelineManager cancellation", "[manager][cancel]") {
    Stack stack;
    stack.resolver_engine.hold = true;
    PipelineManager manager({stack.resolver, stack.transfer, stack.splitter}, stack.store, stack.io);

    REQUIRE(manager.create(stack.job("ReelA1")).has_value());
    REQUIRE(manager.create(stack.job("ReelB2")).has_value());
    REQUIRE(manager.start("ReelA1"));
    REQUIRE(manager.start("ReelB2"));
    REQUIRE(eventually([&] { return stack.resolver_engine.calls == 2; }));

    SECTION("Running jobs cannot be removed") {
        CHECK_FALSE(manager.remove("ReelA1"));
        manager.cancel("ReelA1");
        REQUIRE(manager.find("ReelA1")->wait_for(5s));
        CHECK(manager.remove("ReelA1"));
        CHECK(std::holds_alternative<state::Resolving>(*manager.state("ReelB2")));
    }

    SECTION("cancel_all stops everything") {
        manager.cancel_all();
        for (const auto& id : manager.jobs()) {
            REQUIRE(manager.find(id)->wait_for(5s));
            CHECK(std::holds_alternative<state::Cancelled>(*manager.state(id)));
        }
    }

    SECTION("Cancelled jobs can be retried") {
        stack.resolver_engine.hold = false;
        manager.cancel("ReelA1");
        REQUIRE(manager.find("ReelA1")->wait_for(5s));
        REQUIRE(manager.retry("ReelA1"));
        REQUIRE(manager.find("ReelA1")->wait_for(10s));
        CHECK(std::holds_alternative<state::Complete>(*manager.state("ReelA1")));
        manager.cancel("ReelB2");
    }
}
