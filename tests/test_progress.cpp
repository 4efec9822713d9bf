#include <catch2/catch_test_macros.hpp>
#include "progress.hpp"
#include <stdexcept>
#include <thread>

using namespace papernotes;

TEST_CASE("ProgressReporter: publishes stage, fraction and run id", "[progress]") {
    EventBus bus;
    std::vector<PipelineProgressEvent> seen;
    subscribe<PipelineProgressEvent>(bus, [&](const PipelineProgressEvent& e) {
        seen.push_back(e);
    });

    ProgressReporter p(&bus, PipelineKind::Ingest, "run-1");
    p.report(Stage::LoadingImage, 0.1f, "Loading image");

    REQUIRE(seen.size() == 1);
    REQUIRE(seen[0].run_id == "run-1");
    REQUIRE(seen[0].pipeline == PipelineKind::Ingest);
    REQUIRE(seen[0].stage == Stage::LoadingImage);
    REQUIRE(seen[0].fraction == 0.1f);
    REQUIRE(seen[0].message == "Loading image");
}

TEST_CASE("ProgressReporter: fraction never goes backwards", "[progress]") {
    EventBus bus;
    std::vector<float> fractions;
    subscribe<PipelineProgressEvent>(bus, [&](const PipelineProgressEvent& e) {
        fractions.push_back(e.fraction);
    });

    ProgressReporter p(&bus, PipelineKind::Query, "r");
    p.report(Stage::GeneratingImageEmbedding, 0.5f, "a");
    p.report(Stage::RunningOcr, 0.3f, "b");
    p.report(Stage::Searching, 0.7f, "c");

    REQUIRE(fractions.size() == 3);
    REQUIRE(fractions[0] == 0.5f);
    REQUIRE(fractions[1] == 0.5f);
    REQUIRE(fractions[2] == 0.7f);
    REQUIRE(p.last_fraction() == 0.7f);
}

TEST_CASE("ProgressReporter: fraction clamped to [0, 1]", "[progress]") {
    EventBus bus;
    float last = -1.0f;
    subscribe<PipelineProgressEvent>(bus, [&](const PipelineProgressEvent& e) {
        last = e.fraction;
    });

    ProgressReporter p(&bus, PipelineKind::Ingest, "r");
    p.report(Stage::Idle, -0.5f, "");
    REQUIRE(last == 0.0f);
    p.report(Stage::Complete, 1.5f, "");
    REQUIRE(last == 1.0f);
}

TEST_CASE("ProgressReporter: null bus is a no-op", "[progress]") {
    ProgressReporter p(nullptr, PipelineKind::Ingest, "r");
    p.report(Stage::Saving, 0.9f, "Saving");
    p.field_failed("clip", "unavailable");
    REQUIRE(p.last_fraction() == 0.0f);
}

TEST_CASE("ProgressReporter: field_failed publishes step and reason", "[progress]") {
    EventBus bus;
    FieldDerivationFailedEvent got;
    subscribe<FieldDerivationFailedEvent>(bus, [&](const FieldDerivationFailedEvent& e) {
        got.run_id = e.run_id;
        got.pipeline = e.pipeline;
        got.step = e.step;
        got.reason = e.reason;
    });

    ProgressReporter p(&bus, PipelineKind::Query, "q-1");
    p.field_failed("ocr_b", "engine unavailable");
    REQUIRE(got.run_id == "q-1");
    REQUIRE(got.pipeline == PipelineKind::Query);
    REQUIRE(got.step == "ocr_b");
    REQUIRE(got.reason == "engine unavailable");
}

TEST_CASE("ProgressReporter: concurrent reports stay monotonic", "[progress]") {
    EventBus bus;
    std::vector<float> fractions;
    // Publishes are serialized by the reporter, so no lock needed here
    subscribe<PipelineProgressEvent>(bus, [&](const PipelineProgressEvent& e) {
        fractions.push_back(e.fraction);
    });

    ProgressReporter p(&bus, PipelineKind::Ingest, "r");
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 50; ++i) {
                p.report(Stage::RunningOcr, static_cast<float>((i * 4 + t) % 97) / 100.0f, "");
            }
        });
    }
    for (auto& t : threads) t.join();

    REQUIRE(fractions.size() == 200);
    for (size_t i = 1; i < fractions.size(); ++i) {
        REQUIRE(fractions[i] >= fractions[i - 1]);
    }
}

TEST_CASE("ProgressReporter: throwing observer is contained", "[progress]") {
    EventBus bus;
    int later = 0;
    bus.subscribe(PipelineProgressEvent::TAG, [](const Event&) {
        throw std::runtime_error("observer failure");
    });
    bus.subscribe_all([&](const Event&) { later++; });

    ProgressReporter p(&bus, PipelineKind::Ingest, "r");
    REQUIRE_NOTHROW(p.report(Stage::Saving, 0.9f, "Saving"));
    REQUIRE(p.last_fraction() == 0.9f);

    NoteIngestedEvent ev;
    REQUIRE_NOTHROW(p.publish(ev));
    REQUIRE(later == 1);
}

TEST_CASE("ProgressReporter: handler may read last_fraction", "[progress]") {
    EventBus bus;
    ProgressReporter p(&bus, PipelineKind::Query, "r");
    float seen = -1.0f;
    bus.subscribe(PipelineProgressEvent::TAG, [&](const Event&) {
        seen = p.last_fraction();
    });

    p.report(Stage::Searching, 0.6f, "");
    REQUIRE(seen == 0.6f);
}
