#pragma once
#include "embedding.hpp"
#include "image.hpp"
#include "note.hpp"
#include "task_group.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace papernotes {

class HttpClient; // forward declare
struct Config;    // forward declare

// Image embedding kinds the gateway can compute
enum class ImageModel { Visual, Clip, VisualText };

// The two independent OCR engines
enum class OcrEngine { A, B };

std::string image_model_to_string(ImageModel model);
std::string ocr_engine_to_string(OcrEngine engine);

struct ComponentStatus {
    std::string name;
    bool ready = false;
};

// Abstract access to the embedding models and OCR engines.
// Every operation returns nullopt on failure (model unavailable, transport
// error, malformed reply, cancellation) and never throws for those cases.
// Implementations must be safe to call concurrently from worker threads.
class EmbeddingGateway {
public:
    virtual ~EmbeddingGateway() = default;

    virtual std::optional<Embedding> embed_image(const Image& image,
                                                 ImageModel model,
                                                 const CancelToken& cancel) = 0;

    virtual std::optional<OcrReading> recognize_text(const Image& image,
                                                     OcrEngine engine,
                                                     const CancelToken& cancel) = 0;

    virtual std::optional<Embedding> embed_text(const std::string& text,
                                                const CancelToken& cancel) = 0;

    // Readiness of each model/engine. Unreachable components report false.
    virtual std::vector<ComponentStatus> status() = 0;

    // Human-readable name (e.g. "http")
    virtual std::string gateway_name() const = 0;
};

// Create the gateway named by config.gateway.backend.
// Throws std::invalid_argument for an unknown backend.
std::unique_ptr<EmbeddingGateway> create_gateway(const Config& config, HttpClient& http);

} // namespace papernotes
