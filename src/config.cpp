#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace papernotes {

nlohmann::json Config::defaults_json() {
    GatewayConfig gw;
    SearchConfig s;
    FieldDimensions d;
    IngestConfig in;
    return {
        {"index", {
#ifdef PAPERNOTES_HAS_SQLITE_INDEX
            {"backend", "sqlite"},
#else
            {"backend", "json"},
#endif
            {"path", ""}
        }},
        {"gateway", {
            {"backend", gw.backend},
            {"base_url", gw.base_url},
            {"api_key", ""},
            {"timeout_seconds", gw.timeout_seconds},
            {"models", {
                {"visual", gw.visual_model},
                {"clip", gw.clip_model},
                {"visual_text", gw.visual_text_model},
                {"text", gw.text_model}
            }},
            {"ocr_engines", {
                {"a", gw.ocr_engine_a},
                {"b", gw.ocr_engine_b}
            }}
        }},
        {"dimensions", {
            {"visual", d.visual},
            {"clip", d.clip},
            {"visual_text", d.visual_text},
            {"ocr_text", d.ocr_text}
        }},
        {"search", {
            {"top_k", s.top_k},
            {"thresholds", {
                {"clip", s.clip_threshold},
                {"visual_text", s.visual_text_threshold},
                {"ocr_text_a", s.text_a_threshold},
                {"ocr_text_b", s.text_b_threshold},
                {"visual", s.visual_threshold}
            }},
            {"fused_threshold", s.fused_threshold}
        }},
        {"ingest", {
            {"min_image_side", in.min_image_side},
            {"max_image_side", in.max_image_side},
            {"preprocess_ocr", in.preprocess_ocr}
        }},
        {"workers", 0}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string()) out = obj[key].get<std::string>();
}

static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned()) out = obj[key].get<uint32_t>();
}

static void read_double(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number()) out = obj[key].get<double>();
}

std::string Config::config_path() {
    return expand_home("~/.papernotes/config.json");
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("index") && j["index"].is_object()) {
        auto& ix = j["index"];
        read_string(ix, "backend", cfg.index.backend);
        read_string(ix, "path", cfg.index.path);
    }

    if (j.contains("gateway") && j["gateway"].is_object()) {
        auto& g = j["gateway"];
        read_string(g, "backend", cfg.gateway.backend);
        read_string(g, "base_url", cfg.gateway.base_url);
        read_string(g, "api_key", cfg.gateway.api_key);
        read_u32(g, "timeout_seconds", cfg.gateway.timeout_seconds);
        if (g.contains("models") && g["models"].is_object()) {
            auto& m = g["models"];
            read_string(m, "visual", cfg.gateway.visual_model);
            read_string(m, "clip", cfg.gateway.clip_model);
            read_string(m, "visual_text", cfg.gateway.visual_text_model);
            read_string(m, "text", cfg.gateway.text_model);
        }
        if (g.contains("ocr_engines") && g["ocr_engines"].is_object()) {
            read_string(g["ocr_engines"], "a", cfg.gateway.ocr_engine_a);
            read_string(g["ocr_engines"], "b", cfg.gateway.ocr_engine_b);
        }
    }

    if (j.contains("dimensions") && j["dimensions"].is_object()) {
        auto& d = j["dimensions"];
        read_u32(d, "visual", cfg.dimensions.visual);
        read_u32(d, "clip", cfg.dimensions.clip);
        read_u32(d, "visual_text", cfg.dimensions.visual_text);
        read_u32(d, "ocr_text", cfg.dimensions.ocr_text);
    }

    if (j.contains("search") && j["search"].is_object()) {
        auto& s = j["search"];
        read_u32(s, "top_k", cfg.search.top_k);
        read_double(s, "fused_threshold", cfg.search.fused_threshold);
        if (s.contains("thresholds") && s["thresholds"].is_object()) {
            auto& t = s["thresholds"];
            read_double(t, "clip", cfg.search.clip_threshold);
            read_double(t, "visual_text", cfg.search.visual_text_threshold);
            read_double(t, "ocr_text_a", cfg.search.text_a_threshold);
            read_double(t, "ocr_text_b", cfg.search.text_b_threshold);
            read_double(t, "visual", cfg.search.visual_threshold);
        }
    }

    if (j.contains("ingest") && j["ingest"].is_object()) {
        auto& in = j["ingest"];
        read_u32(in, "min_image_side", cfg.ingest.min_image_side);
        read_u32(in, "max_image_side", cfg.ingest.max_image_side);
        if (in.contains("preprocess_ocr") && in["preprocess_ocr"].is_boolean())
            cfg.ingest.preprocess_ocr = in["preprocess_ocr"].get<bool>();
    }

    read_u32(j, "workers", cfg.workers);

    return cfg;
}

Config Config::load() {
    std::string path = config_path();
    nlohmann::json j;

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                if (atomic_write_file(path, j.dump(4) + "\n")) {
                    std::cerr << "[config] Migrated config with new defaults: "
                              << path << "\n";
                }
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed " << path << " (" << e.what()
                      << "), using defaults\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("PAPERNOTES_GATEWAY_URL"))
        cfg.gateway.base_url = v;
    if (const char* v = std::getenv("PAPERNOTES_GATEWAY_API_KEY"))
        cfg.gateway.api_key = v;
    if (const char* v = std::getenv("PAPERNOTES_INDEX_BACKEND"))
        cfg.index.backend = v;
    if (const char* v = std::getenv("PAPERNOTES_INDEX_PATH"))
        cfg.index.path = v;

    return cfg;
}

} // namespace papernotes
