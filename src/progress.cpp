#include "progress.hpp"
#include <algorithm>
#include <iostream>

namespace papernotes {

ProgressReporter::ProgressReporter(EventBus* bus, PipelineKind pipeline, std::string run_id)
    : bus_(bus), pipeline_(pipeline), run_id_(std::move(run_id)) {}

void ProgressReporter::publish(const Event& event) {
    if (!bus_) return;
    try {
        bus_->publish(event);
    } catch (const std::exception& e) {
        std::cerr << "[progress] observer failed on " << event.type_tag << ": "
                  << e.what() << "\n";
    }
}

void ProgressReporter::report(Stage stage, float fraction, const std::string& message) {
    if (!bus_) return;

    PipelineProgressEvent ev;
    ev.run_id = run_id_;
    ev.pipeline = pipeline_;
    ev.stage = stage;
    ev.message = message;

    // Held across publish so concurrent reports reach subscribers in order
    std::lock_guard<std::mutex> order(publish_mutex_);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_fraction_ = std::max(last_fraction_, std::clamp(fraction, 0.0f, 1.0f));
        ev.fraction = last_fraction_;
    }
    publish(ev);
}

void ProgressReporter::field_failed(const std::string& step, const std::string& reason) {
    if (!bus_) return;

    FieldDerivationFailedEvent ev;
    ev.run_id = run_id_;
    ev.pipeline = pipeline_;
    ev.step = step;
    ev.reason = reason;
    publish(ev);
}

float ProgressReporter::last_fraction() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_fraction_;
}

} // namespace papernotes
