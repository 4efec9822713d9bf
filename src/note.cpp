#include "note.hpp"
#include "util.hpp"
#include <stdexcept>

namespace papernotes {

std::string field_to_string(EmbeddingField field) {
    switch (field) {
        case EmbeddingField::Clip:       return "clip";
        case EmbeddingField::VisualText: return "visual_text";
        case EmbeddingField::OcrTextA:   return "ocr_text_a";
        case EmbeddingField::OcrTextB:   return "ocr_text_b";
        case EmbeddingField::Visual:     return "visual";
    }
    return "unknown";
}

EmbeddingField field_from_string(const std::string& s) {
    for (auto f : kAllFields) {
        if (field_to_string(f) == s) return f;
    }
    throw std::invalid_argument("unknown embedding field: " + s);
}

FieldVector& NoteRecord::vector(EmbeddingField field) {
    switch (field) {
        case EmbeddingField::Clip:       return clip;
        case EmbeddingField::VisualText: return visual_text;
        case EmbeddingField::OcrTextA:   return ocr_text_a;
        case EmbeddingField::OcrTextB:   return ocr_text_b;
        case EmbeddingField::Visual:     return visual;
    }
    throw std::invalid_argument("unknown embedding field");
}

const FieldVector& NoteRecord::vector(EmbeddingField field) const {
    switch (field) {
        case EmbeddingField::Clip:       return clip;
        case EmbeddingField::VisualText: return visual_text;
        case EmbeddingField::OcrTextA:   return ocr_text_a;
        case EmbeddingField::OcrTextB:   return ocr_text_b;
        case EmbeddingField::Visual:     return visual;
    }
    throw std::invalid_argument("unknown embedding field");
}

size_t NoteRecord::present_count() const {
    size_t n = 0;
    for (auto f : kAllFields) {
        if (vector(f).has_value()) n++;
    }
    return n;
}

std::string combined_ocr_text(const NoteRecord& record) {
    std::string out;
    if (!is_blank(record.ocr_a.text)) {
        out += "Engine A:\n" + record.ocr_a.text + "\n";
    }
    if (!is_blank(record.ocr_b.text)) {
        if (!out.empty()) out += "\n---\n\n";
        out += "Engine B:\n" + record.ocr_b.text;
    }
    return out;
}

uint32_t FieldDimensions::of(EmbeddingField field) const {
    switch (field) {
        case EmbeddingField::Clip:       return clip;
        case EmbeddingField::VisualText: return visual_text;
        case EmbeddingField::OcrTextA:
        case EmbeddingField::OcrTextB:   return ocr_text;
        case EmbeddingField::Visual:     return visual;
    }
    return 0;
}

} // namespace papernotes
