#pragma once
#include "event.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace papernotes {

using EventHandler = std::function<void(const Event&)>;

// Synchronous publish/subscribe side-channel. Pipelines publish progress
// and diagnostics here; nothing on the bus affects pipeline control flow.
class EventBus {
public:
    // Subscribe to events with a given tag. Returns a subscription ID.
    uint64_t subscribe(const std::string& tag, EventHandler handler);

    // Subscribe to every event regardless of tag (log sinks).
    uint64_t subscribe_all(EventHandler handler);

    // Publish an event synchronously on the calling thread. Tag handlers
    // run in registration order, then catch-all handlers. Handlers are
    // called without the bus mutex held. Returns the number of handlers called.
    size_t publish(const Event& event);

private:
    struct Subscription {
        uint64_t id;
        EventHandler handler;
    };

    std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Subscription>> handlers_;
    std::vector<Subscription> catch_all_;
    uint64_t next_id_ = 1;
};

// Type-safe subscribe helper: auto-casts Event& to the concrete type.
template<typename E>
uint64_t subscribe(EventBus& bus, std::function<void(const E&)> handler) {
    return bus.subscribe(E::TAG, [h = std::move(handler)](const Event& e) {
        h(static_cast<const E&>(e));
    });
}

} // namespace papernotes
