#pragma once
#include "note.hpp"
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace papernotes {

struct IndexConfig {
#ifdef PAPERNOTES_HAS_SQLITE_INDEX
    std::string backend = "sqlite";
#else
    std::string backend = "json";
#endif
    std::string path;                  // empty = backend default under ~/.papernotes
};

struct GatewayConfig {
    std::string backend = "http";
    std::string base_url = "http://localhost:8900";
    std::string api_key;               // empty = no Authorization header
    uint32_t timeout_seconds = 60;
    // Model names sent to the model server per image embedding kind
    std::string visual_model = "mobilenet_v3_large";
    std::string clip_model = "clip_vit_b32";
    std::string visual_text_model = "trocr_encoder";
    std::string text_model = "all_minilm_l6_v2";
    // OCR engine names sent for engine A and engine B
    std::string ocr_engine_a = "printed";
    std::string ocr_engine_b = "handwriting";
};

struct SearchConfig {
    uint32_t top_k = 10;
    double clip_threshold = 0.2;
    double visual_text_threshold = 0.2;
    double text_a_threshold = 0.2;
    double text_b_threshold = 0.2;
    double visual_threshold = 0.2;     // collection lookup only
    double fused_threshold = 0.2;
};

struct IngestConfig {
    uint32_t min_image_side = 100;
    uint32_t max_image_side = 4000;
    bool preprocess_ocr = true;
};

struct Config {
    IndexConfig index;
    GatewayConfig gateway;
    FieldDimensions dimensions;
    SearchConfig search;
    IngestConfig ingest;
    uint32_t workers = 0;              // 0 = derived from hardware concurrency

    // Load from ~/.papernotes/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Build a Config from already-merged JSON (no file or env access)
    static Config from_json(const nlohmann::json& j);

    // Path of the config file (~/.papernotes/config.json, HOME expanded)
    static std::string config_path();
};

} // namespace papernotes
