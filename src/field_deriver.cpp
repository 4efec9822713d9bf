#include "field_deriver.hpp"
#include "util.hpp"
#include <iostream>
#include <stdexcept>

namespace papernotes {

ImageModel image_model_for(EmbeddingField field) {
    switch (field) {
        case EmbeddingField::Visual:     return ImageModel::Visual;
        case EmbeddingField::Clip:       return ImageModel::Clip;
        case EmbeddingField::VisualText: return ImageModel::VisualText;
        case EmbeddingField::OcrTextA:
        case EmbeddingField::OcrTextB:   break;
    }
    throw std::invalid_argument("no image model for field " + field_to_string(field));
}

FieldDeriver::FieldDeriver(EmbeddingGateway& gateway, const FieldDimensions& dims,
                           ProgressReporter& progress, const CancelToken& cancel,
                           std::string log_tag)
    : gateway_(gateway)
    , dims_(dims)
    , progress_(progress)
    , cancel_(cancel)
    , log_tag_(std::move(log_tag))
{}

void FieldDeriver::fail(const std::string& step, const std::string& reason) {
    std::cerr << "[" << log_tag_ << "] " << step << " failed: " << reason << "\n";
    progress_.field_failed(step, reason);
}

FieldVector FieldDeriver::accept(EmbeddingField field, std::optional<Embedding> vec) {
    std::string step = field_to_string(field);
    if (cancel_.cancelled()) return std::nullopt;
    if (!vec || vec->empty()) {
        fail(step, "model returned no vector");
        return std::nullopt;
    }
    uint32_t expected = dims_.of(field);
    if (vec->size() != expected) {
        fail(step, "expected " + std::to_string(expected) + " dimensions, got " +
                   std::to_string(vec->size()));
        return std::nullopt;
    }
    if (!is_unit_norm(*vec)) {
        fail(step, "vector is not L2-normalized (norm " + std::to_string(l2_norm(*vec)) + ")");
        return std::nullopt;
    }
    return vec;
}

FieldVector FieldDeriver::image_vector(const Image& image, EmbeddingField field) {
    if (cancel_.cancelled()) return std::nullopt;
    std::optional<Embedding> vec;
    try {
        vec = gateway_.embed_image(image, image_model_for(field), cancel_);
    } catch (const std::exception& e) {
        fail(field_to_string(field), e.what());
        return std::nullopt;
    }
    return accept(field, std::move(vec));
}

std::optional<OcrReading> FieldDeriver::ocr(const Image& image, OcrEngine engine) {
    std::string step = "ocr_" + to_lower(ocr_engine_to_string(engine));
    if (cancel_.cancelled()) return std::nullopt;
    std::optional<OcrReading> reading;
    try {
        reading = gateway_.recognize_text(image, engine, cancel_);
    } catch (const std::exception& e) {
        fail(step, e.what());
        return std::nullopt;
    }
    if (cancel_.cancelled()) return std::nullopt;
    if (!reading) {
        fail(step, "engine returned no reading");
        return std::nullopt;
    }
    if (is_blank(reading->text)) {
        std::cerr << "[" << log_tag_ << "] " << step << ": no text detected\n";
    }
    return reading;
}

FieldVector FieldDeriver::text_vector(const std::string& text, EmbeddingField field) {
    if (cancel_.cancelled() || is_blank(text)) return std::nullopt;
    std::optional<Embedding> vec;
    try {
        vec = gateway_.embed_text(text, cancel_);
    } catch (const std::exception& e) {
        fail(field_to_string(field), e.what());
        return std::nullopt;
    }
    return accept(field, std::move(vec));
}

} // namespace papernotes
