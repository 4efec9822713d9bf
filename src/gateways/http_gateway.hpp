#pragma once
#include "../gateway.hpp"
#include "../http.hpp"
#include <string>

namespace papernotes {

// Gateway backed by a model server speaking JSON over HTTP.
// Endpoints (relative to base_url):
//   POST /v1/embed/image  {model, image}   -> {embedding}
//   POST /v1/ocr          {engine, image}  -> {text, confidence}
//   POST /v1/embed/text   {model, text}    -> {embedding}
//   GET  /v1/health                        -> {models: {name: bool}}
// Images travel as base64-encoded PNG.
class HttpGateway : public EmbeddingGateway {
public:
    struct Settings {
        std::string base_url;          // no trailing slash
        std::string api_key;           // empty = no Authorization header
        long timeout_seconds = 60;
        std::string visual_model;
        std::string clip_model;
        std::string visual_text_model;
        std::string text_model;
        std::string ocr_engine_a;
        std::string ocr_engine_b;
    };

    HttpGateway(Settings settings, HttpClient& http);

    std::optional<Embedding> embed_image(const Image& image, ImageModel model,
                                         const CancelToken& cancel) override;
    std::optional<OcrReading> recognize_text(const Image& image, OcrEngine engine,
                                             const CancelToken& cancel) override;
    std::optional<Embedding> embed_text(const std::string& text,
                                        const CancelToken& cancel) override;
    std::vector<ComponentStatus> status() override;
    std::string gateway_name() const override { return "http"; }

    const Settings& settings() const { return settings_; }

private:
    std::optional<std::string> post_json(const std::string& endpoint,
                                         const std::string& body,
                                         const CancelToken& cancel);
    std::vector<Header> headers() const;
    const std::string& model_name(ImageModel model) const;

    Settings settings_;
    HttpClient& http_;
};

// Standard base64 (RFC 4648, padded)
std::string base64_encode(const std::string& bytes);

} // namespace papernotes
