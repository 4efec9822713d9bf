#include "http_gateway.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <iostream>
#include <stdexcept>

namespace papernotes {

static GatewayRegistrar reg_http("http",
    [](const Config& config, HttpClient& http) {
        const auto& g = config.gateway;
        if (g.base_url.rfind("http://", 0) != 0 && g.base_url.rfind("https://", 0) != 0) {
            throw std::invalid_argument("gateway.base_url must start with http:// or https://: " +
                                        g.base_url);
        }
        HttpGateway::Settings s;
        s.base_url = g.base_url;
        while (!s.base_url.empty() && s.base_url.back() == '/') s.base_url.pop_back();
        s.api_key = g.api_key;
        s.timeout_seconds = static_cast<long>(g.timeout_seconds);
        s.visual_model = g.visual_model;
        s.clip_model = g.clip_model;
        s.visual_text_model = g.visual_text_model;
        s.text_model = g.text_model;
        s.ocr_engine_a = g.ocr_engine_a;
        s.ocr_engine_b = g.ocr_engine_b;
        return std::make_unique<HttpGateway>(std::move(s), http);
    });

std::string base64_encode(const std::string& bytes) {
    if (bytes.empty()) return {};
    std::string out(4 * ((bytes.size() + 2) / 3), '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                            reinterpret_cast<const unsigned char*>(bytes.data()),
                            static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(n));
    return out;
}

static std::optional<Embedding> parse_embedding(const std::string& body) {
    try {
        auto j = nlohmann::json::parse(body);
        const auto& arr = j.at("embedding");
        if (!arr.is_array() || arr.empty()) return std::nullopt;
        Embedding result;
        result.reserve(arr.size());
        for (const auto& val : arr) {
            result.push_back(val.get<float>());
        }
        return result;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[gateway] Malformed embedding reply: " << e.what() << "\n";
        return std::nullopt;
    }
}

HttpGateway::HttpGateway(Settings settings, HttpClient& http)
    : settings_(std::move(settings))
    , http_(http)
{}

std::vector<Header> HttpGateway::headers() const {
    std::vector<Header> h = {
        {"Content-Type", "application/json"}
    };
    if (!settings_.api_key.empty()) {
        h.push_back({"Authorization", "Bearer " + settings_.api_key});
    }
    return h;
}

const std::string& HttpGateway::model_name(ImageModel model) const {
    switch (model) {
        case ImageModel::Visual:     return settings_.visual_model;
        case ImageModel::Clip:       return settings_.clip_model;
        case ImageModel::VisualText: return settings_.visual_text_model;
    }
    return settings_.visual_model;
}

std::optional<std::string> HttpGateway::post_json(const std::string& endpoint,
                                                  const std::string& body,
                                                  const CancelToken& cancel) {
    if (cancel.cancelled()) return std::nullopt;
    auto response = http_.post(settings_.base_url + endpoint, body, headers(),
                               cancel.remaining_seconds(settings_.timeout_seconds),
                               cancel.flag());
    if (cancel.cancelled()) return std::nullopt;
    if (response.status_code < 200 || response.status_code >= 300) {
        std::cerr << "[gateway] " << endpoint << " returned HTTP "
                  << response.status_code << "\n";
        return std::nullopt;
    }
    return std::move(response.body);
}

std::optional<Embedding> HttpGateway::embed_image(const Image& image, ImageModel model,
                                                  const CancelToken& cancel) {
    nlohmann::json body = {
        {"model", model_name(model)},
        {"image", base64_encode(encode_png(image))}
    };
    auto reply = post_json("/v1/embed/image", body.dump(), cancel);
    if (!reply) return std::nullopt;
    return parse_embedding(*reply);
}

std::optional<OcrReading> HttpGateway::recognize_text(const Image& image, OcrEngine engine,
                                                      const CancelToken& cancel) {
    nlohmann::json body = {
        {"engine", engine == OcrEngine::A ? settings_.ocr_engine_a : settings_.ocr_engine_b},
        {"image", base64_encode(encode_png(image))}
    };
    auto reply = post_json("/v1/ocr", body.dump(), cancel);
    if (!reply) return std::nullopt;

    try {
        auto j = nlohmann::json::parse(*reply);
        OcrReading reading;
        reading.text = j.at("text").get<std::string>();
        reading.confidence = j.value("confidence", 0.0f);
        return reading;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[gateway] Malformed OCR reply: " << e.what() << "\n";
        return std::nullopt;
    }
}

std::optional<Embedding> HttpGateway::embed_text(const std::string& text,
                                                 const CancelToken& cancel) {
    nlohmann::json body = {
        {"model", settings_.text_model},
        {"text", text}
    };
    auto reply = post_json("/v1/embed/text", body.dump(), cancel);
    if (!reply) return std::nullopt;
    return parse_embedding(*reply);
}

std::vector<ComponentStatus> HttpGateway::status() {
    std::vector<ComponentStatus> out;
    for (const auto* name : {&settings_.visual_model, &settings_.clip_model,
                             &settings_.visual_text_model, &settings_.text_model,
                             &settings_.ocr_engine_a, &settings_.ocr_engine_b}) {
        out.push_back({*name, false});
    }

    auto response = http_.get(settings_.base_url + "/v1/health", headers(), 10);
    if (response.status_code != 200) {
        std::cerr << "[gateway] Health check failed (HTTP " << response.status_code << ")\n";
        return out;
    }

    try {
        auto j = nlohmann::json::parse(response.body);
        const auto& models = j.at("models");
        for (auto& s : out) {
            auto it = models.find(s.name);
            s.ready = it != models.end() && it->is_boolean() && it->get<bool>();
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[gateway] Malformed health reply: " << e.what() << "\n";
    }
    return out;
}

} // namespace papernotes
