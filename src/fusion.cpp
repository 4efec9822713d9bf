#include "fusion.hpp"
#include "config.hpp"

namespace papernotes {

FieldSet FieldSet::of(std::initializer_list<EmbeddingField> fields) {
    FieldSet s;
    for (auto f : fields) s.insert(f);
    return s;
}

void FieldSet::insert(EmbeddingField f) {
    if (field_index(f) < kFusedFieldCount) {
        bits_ |= static_cast<uint8_t>(1u << field_index(f));
    }
}

bool FieldSet::contains(EmbeddingField f) const {
    return field_index(f) < kFusedFieldCount && (bits_ & (1u << field_index(f))) != 0;
}

size_t FieldSet::size() const {
    size_t n = 0;
    for (uint8_t b = bits_; b != 0; b &= static_cast<uint8_t>(b - 1)) n++;
    return n;
}

// Rows indexed by mask: bit0 clip, bit1 visual_text, bit2 ocr_text_a,
// bit3 ocr_text_b. Columns in the same order.
static const std::array<FieldWeights, kFieldSetCount> kWeightTable = {{
    /* 0b0000 none            */ {0.00, 0.00, 0.00, 0.00},
    /* 0b0001 clip            */ {1.00, 0.00, 0.00, 0.00},
    /* 0b0010 vt              */ {0.00, 1.00, 0.00, 0.00},
    /* 0b0011 clip+vt         */ {0.50, 0.50, 0.00, 0.00},
    /* 0b0100 a               */ {0.00, 0.00, 1.00, 0.00},
    /* 0b0101 clip+a          */ {0.40, 0.00, 0.60, 0.00},
    /* 0b0110 vt+a            */ {0.00, 0.50, 0.50, 0.00},
    /* 0b0111 clip+vt+a       */ {0.35, 0.30, 0.35, 0.00},
    /* 0b1000 b               */ {0.00, 0.00, 0.00, 1.00},
    /* 0b1001 clip+b          */ {0.40, 0.00, 0.00, 0.60},
    /* 0b1010 vt+b            */ {0.00, 0.50, 0.00, 0.50},
    /* 0b1011 clip+vt+b       */ {0.35, 0.35, 0.00, 0.30},
    /* 0b1100 a+b             */ {0.00, 0.00, 0.55, 0.45},
    /* 0b1101 clip+a+b        */ {0.35, 0.00, 0.40, 0.25},
    /* 0b1110 vt+a+b          */ {0.00, 0.40, 0.35, 0.25},
    /* 0b1111 all             */ {0.30, 0.25, 0.25, 0.20},
}};

const FieldWeights& weights_for(FieldSet present) {
    return kWeightTable[present.bits()];
}

FieldSet FusedScore::fields() const {
    FieldSet s;
    for (auto f : kFusedFields) {
        if (evidence[field_index(f)]) s.insert(f);
    }
    return s;
}

FusedScore fuse(const FieldDistances& evidence) {
    FusedScore out;
    out.evidence = evidence;
    FieldSet present = out.fields();
    if (present.empty()) return out;

    const auto& w = weights_for(present);
    double sum = 0.0;
    for (auto f : kFusedFields) {
        size_t i = field_index(f);
        if (evidence[i]) sum += w[i] * *evidence[i];
    }
    out.score = sum;
    return out;
}

FusionPolicy::FusionPolicy() : FusionPolicy(SearchConfig{}) {}

FusionPolicy::FusionPolicy(const SearchConfig& search)
    : visual_threshold_(search.visual_threshold)
    , fused_threshold_(search.fused_threshold)
{
    field_thresholds_[field_index(EmbeddingField::Clip)] = search.clip_threshold;
    field_thresholds_[field_index(EmbeddingField::VisualText)] = search.visual_text_threshold;
    field_thresholds_[field_index(EmbeddingField::OcrTextA)] = search.text_a_threshold;
    field_thresholds_[field_index(EmbeddingField::OcrTextB)] = search.text_b_threshold;
}

double FusionPolicy::threshold(EmbeddingField field) const {
    if (field == EmbeddingField::Visual) return visual_threshold_;
    return field_thresholds_[field_index(field)];
}

bool FusionPolicy::passes(EmbeddingField field, double distance) const {
    return distance < threshold(field);
}

FusedScore FusionPolicy::score(const FieldDistances& observed) const {
    FieldDistances evidence;
    for (auto f : kFusedFields) {
        size_t i = field_index(f);
        if (observed[i] && passes(f, *observed[i])) evidence[i] = observed[i];
    }
    FusedScore out = fuse(evidence);
    out.observed = observed;
    return out;
}

} // namespace papernotes
