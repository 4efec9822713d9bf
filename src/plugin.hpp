#pragma once
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace papernotes {

class VectorIndex;      // forward declaration
class EmbeddingGateway; // forward declaration
class HttpClient;       // forward declaration

// Factory function types
using IndexFactory = std::function<std::unique_ptr<VectorIndex>(const Config& config)>;

using GatewayFactory = std::function<std::unique_ptr<EmbeddingGateway>(
    const Config& config, HttpClient& http)>;

// Central registry for self-registering backends.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    // Registration
    void register_index(const std::string& name, IndexFactory factory);
    void register_gateway(const std::string& name, GatewayFactory factory);

    // Creation. Throws std::invalid_argument for unknown names.
    std::unique_ptr<VectorIndex> create_index(const std::string& name,
                                              const Config& config) const;

    std::unique_ptr<EmbeddingGateway> create_gateway(const std::string& name,
                                                     const Config& config,
                                                     HttpClient& http) const;

    // Query
    std::vector<std::string> index_names() const;
    std::vector<std::string> gateway_names() const;
    bool has_index(const std::string& name) const;
    bool has_gateway(const std::string& name) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, IndexFactory> indexes_;
    std::unordered_map<std::string, GatewayFactory> gateways_;
};

// ── Self-registrar helpers (used at file scope in each backend .cpp) ──

struct IndexRegistrar {
    IndexRegistrar(const std::string& name, IndexFactory factory) {
        PluginRegistry::instance().register_index(name, std::move(factory));
    }
};

struct GatewayRegistrar {
    GatewayRegistrar(const std::string& name, GatewayFactory factory) {
        PluginRegistry::instance().register_gateway(name, std::move(factory));
    }
};

} // namespace papernotes
