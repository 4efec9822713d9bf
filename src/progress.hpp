#pragma once
#include "event_bus.hpp"
#include <mutex>
#include <string>

namespace papernotes {

// Publishes one run's events on an EventBus. Reports may arrive from
// several worker threads; the reporter serializes them and never lets the
// published fraction go backwards. A null bus makes every call a no-op.
//
// Observers are informational only: an exception thrown by a handler is
// logged and dropped, never propagated into the pipeline. Handlers may
// read last_fraction() but must not call report() on the same reporter.
class ProgressReporter {
public:
    ProgressReporter(EventBus* bus, PipelineKind pipeline, std::string run_id);

    void report(Stage stage, float fraction, const std::string& message);

    // Report a field that could not be derived (and was left absent).
    void field_failed(const std::string& step, const std::string& reason);

    // Publish any other run event (completion, ingested note) with the
    // same observer isolation as report().
    void publish(const Event& event);

    const std::string& run_id() const { return run_id_; }
    PipelineKind pipeline() const { return pipeline_; }

    // Last fraction published (0 before the first report)
    float last_fraction() const;

private:
    EventBus* bus_;
    PipelineKind pipeline_;
    std::string run_id_;
    std::mutex publish_mutex_;       // held across publish to keep order
    mutable std::mutex state_mutex_; // guards last_fraction_ only
    float last_fraction_ = 0.0f;
};

} // namespace papernotes
