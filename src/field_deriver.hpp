#pragma once
#include "gateway.hpp"
#include "progress.hpp"
#include <string>

namespace papernotes {

// Runs single gateway derivations for a pipeline and applies the shared
// acceptance rules: a vector must be non-empty, of the configured
// dimension and unit-norm, or the field is treated as absent. Every
// failure is logged under `log_tag` and published through the reporter.
// Calls after cancellation return nullopt without reporting a failure.
// Safe to use from several worker threads at once.
class FieldDeriver {
public:
    FieldDeriver(EmbeddingGateway& gateway, const FieldDimensions& dims,
                 ProgressReporter& progress, const CancelToken& cancel,
                 std::string log_tag);

    FieldVector image_vector(const Image& image, EmbeddingField field);

    std::optional<OcrReading> ocr(const Image& image, OcrEngine engine);

    // Blank text is not a failure: returns nullopt without reporting.
    FieldVector text_vector(const std::string& text, EmbeddingField field);

private:
    FieldVector accept(EmbeddingField field, std::optional<Embedding> vec);
    void fail(const std::string& step, const std::string& reason);

    EmbeddingGateway& gateway_;
    FieldDimensions dims_;
    ProgressReporter& progress_;
    CancelToken cancel_;
    std::string log_tag_;
};

// Image model that produces a given image-derived field.
// Throws std::invalid_argument for text fields.
ImageModel image_model_for(EmbeddingField field);

} // namespace papernotes
