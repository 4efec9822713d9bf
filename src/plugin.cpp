#include "plugin.hpp"
#include "vector_index.hpp"
#include "gateway.hpp"
#include <stdexcept>
#include <algorithm>

namespace papernotes {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_index(const std::string& name, IndexFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    indexes_[name] = std::move(factory);
}

void PluginRegistry::register_gateway(const std::string& name, GatewayFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    gateways_[name] = std::move(factory);
}

std::unique_ptr<VectorIndex> PluginRegistry::create_index(const std::string& name,
                                                          const Config& config) const {
    IndexFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = indexes_.find(name);
        if (it == indexes_.end()) {
            throw std::invalid_argument("Unknown index backend: " + name);
        }
        factory = it->second;
    }
    // Factories may open files; run them without holding the registry lock
    return factory(config);
}

std::unique_ptr<EmbeddingGateway> PluginRegistry::create_gateway(const std::string& name,
                                                                 const Config& config,
                                                                 HttpClient& http) const {
    GatewayFactory factory;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gateways_.find(name);
        if (it == gateways_.end()) {
            throw std::invalid_argument("Unknown gateway backend: " + name);
        }
        factory = it->second;
    }
    return factory(config, http);
}

template <typename Map>
static std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> names;
    names.reserve(map.size());
    for (const auto& [name, _] : map) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> PluginRegistry::index_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_keys(indexes_);
}

std::vector<std::string> PluginRegistry::gateway_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_keys(gateways_);
}

bool PluginRegistry::has_index(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return indexes_.count(name) > 0;
}

bool PluginRegistry::has_gateway(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gateways_.count(name) > 0;
}

} // namespace papernotes
