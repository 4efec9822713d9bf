#include "event_bus.hpp"

namespace papernotes {

std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::Idle:                          return "idle";
        case Stage::LoadingImage:                  return "loading_image";
        case Stage::GeneratingImageEmbedding:      return "generating_image_embedding";
        case Stage::GeneratingVisualTextEmbedding: return "generating_visual_text_embedding";
        case Stage::RunningOcr:                    return "running_ocr";
        case Stage::GeneratingTextEmbedding:       return "generating_text_embedding";
        case Stage::Searching:                     return "searching";
        case Stage::Saving:                        return "saving";
        case Stage::Complete:                      return "complete";
        case Stage::Error:                         return "error";
    }
    return "unknown";
}

std::string pipeline_to_string(PipelineKind kind) {
    return kind == PipelineKind::Ingest ? "ingest" : "query";
}

uint64_t EventBus::subscribe(const std::string& tag, EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    handlers_[tag].push_back(Subscription{id, std::move(handler)});
    return id;
}

uint64_t EventBus::subscribe_all(EventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    catch_all_.push_back(Subscription{id, std::move(handler)});
    return id;
}

size_t EventBus::publish(const Event& event) {
    // Copy handlers out under lock, then call without lock held.
    std::vector<EventHandler> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = handlers_.find(event.type_tag);
        if (it != handlers_.end()) {
            for (const auto& sub : it->second) {
                to_call.push_back(sub.handler);
            }
        }
        for (const auto& sub : catch_all_) {
            to_call.push_back(sub.handler);
        }
    }
    for (const auto& handler : to_call) {
        handler(event);
    }
    return to_call.size();
}

} // namespace papernotes
