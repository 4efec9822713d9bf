#pragma once
#include "embedding.hpp"
#include <array>
#include <string>
#include <optional>
#include <cstdint>

namespace papernotes {

using NoteId = uint64_t;

// The named vector slots of a note. The first four take part in fused
// retrieval (their ordinals are the FieldSet bit positions); Visual is the
// baseline image feature used for collection lookup.
enum class EmbeddingField : uint8_t {
    Clip = 0,
    VisualText = 1,
    OcrTextA = 2,
    OcrTextB = 3,
    Visual = 4,
};

constexpr size_t kFusedFieldCount = 4;
constexpr size_t kFieldCount = 5;

constexpr std::array<EmbeddingField, kFusedFieldCount> kFusedFields = {
    EmbeddingField::Clip, EmbeddingField::VisualText,
    EmbeddingField::OcrTextA, EmbeddingField::OcrTextB};

constexpr std::array<EmbeddingField, kFieldCount> kAllFields = {
    EmbeddingField::Clip, EmbeddingField::VisualText,
    EmbeddingField::OcrTextA, EmbeddingField::OcrTextB,
    EmbeddingField::Visual};

constexpr size_t field_index(EmbeddingField f) { return static_cast<size_t>(f); }

// Stable storage names ("clip", "visual_text", "ocr_text_a", ...)
std::string field_to_string(EmbeddingField field);

// Parse a storage name. Throws std::invalid_argument for unknown names.
EmbeddingField field_from_string(const std::string& s);

// Raw OCR output of one engine. Empty text is a valid reading.
struct OcrReading {
    std::string text;
    float confidence = 0.0f;
};

struct NoteRecord {
    NoteId id = 0;                     // 0 = not yet assigned by the index
    std::string image_path;
    std::string title;
    std::optional<std::string> collection;

    FieldVector visual;
    FieldVector clip;
    FieldVector visual_text;
    FieldVector ocr_text_a;
    FieldVector ocr_text_b;

    OcrReading ocr_a;
    OcrReading ocr_b;

    uint64_t timestamp = 0;            // epoch milliseconds, last modified

    FieldVector& vector(EmbeddingField field);
    const FieldVector& vector(EmbeddingField field) const;

    // Number of present vector slots (0..kFieldCount)
    size_t present_count() const;
};

// Both OCR texts rendered for display, engine A first. Blank texts are skipped.
std::string combined_ocr_text(const NoteRecord& record);

// Per-field vector lengths. Every stored vector of a field has exactly this size.
struct FieldDimensions {
    uint32_t visual = 1280;
    uint32_t clip = 512;
    uint32_t visual_text = 768;
    uint32_t ocr_text = 384;

    uint32_t of(EmbeddingField field) const;
};

} // namespace papernotes
