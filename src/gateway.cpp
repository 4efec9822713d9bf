#include "gateway.hpp"
#include "config.hpp"
#include "plugin.hpp"
#include "util.hpp"
#include <stdexcept>

namespace papernotes {

std::string image_model_to_string(ImageModel model) {
    switch (model) {
        case ImageModel::Visual:     return "visual";
        case ImageModel::Clip:       return "clip";
        case ImageModel::VisualText: return "visual_text";
    }
    return "unknown";
}

std::string ocr_engine_to_string(OcrEngine engine) {
    return engine == OcrEngine::A ? "A" : "B";
}

std::unique_ptr<EmbeddingGateway> create_gateway(const Config& config, HttpClient& http) {
    auto& registry = PluginRegistry::instance();
    if (!registry.has_gateway(config.gateway.backend)) {
        throw std::invalid_argument("Unknown gateway backend: " + config.gateway.backend +
                                    " (available: " + join(registry.gateway_names(), ", ") + ")");
    }
    return registry.create_gateway(config.gateway.backend, config, http);
}

} // namespace papernotes
