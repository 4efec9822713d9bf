#pragma once
#include "note.hpp"
#include <array>
#include <cstdint>
#include <initializer_list>
#include <optional>

namespace papernotes {

struct SearchConfig; // forward declare

// Subset of the four fused fields, as a 4-bit mask. Bit i is the field
// with field_index() == i.
class FieldSet {
public:
    constexpr FieldSet() = default;
    constexpr explicit FieldSet(uint8_t bits) : bits_(bits & 0x0F) {}

    static FieldSet of(std::initializer_list<EmbeddingField> fields);

    void insert(EmbeddingField f);
    bool contains(EmbeddingField f) const;
    size_t size() const;
    bool empty() const { return bits_ == 0; }
    uint8_t bits() const { return bits_; }

    bool operator==(const FieldSet& o) const { return bits_ == o.bits_; }
    bool operator!=(const FieldSet& o) const { return bits_ != o.bits_; }

private:
    uint8_t bits_ = 0;
};

constexpr size_t kFieldSetCount = 16;

// Weight per fused field, indexed by field_index(). Fields outside the
// row's subset weigh 0.
using FieldWeights = std::array<double, kFusedFieldCount>;

// Per-field cosine distance, indexed by field_index(); nullopt = no hit.
using FieldDistances = std::array<std::optional<double>, kFusedFieldCount>;

// Weight row for an exact subset of present fields. Every non-empty row
// sums to 1; the empty row is all zeros.
const FieldWeights& weights_for(FieldSet present);

// Score returned when no field carries evidence. Never below any
// sensible global threshold.
constexpr double kNoEvidenceScore = 1.0;

struct FusedScore {
    double score = kNoEvidenceScore;
    // Distances that passed their field threshold and were weighted
    FieldDistances evidence;
    // Raw distance reported by the index for this note, filtered or not
    FieldDistances observed;

    FieldSet fields() const;
};

// Weighted sum over the evidence subset. Pure; evidence is assumed
// already threshold-filtered.
FusedScore fuse(const FieldDistances& evidence);

// Thresholds applied around fuse(): per-field filtering before, global
// acceptance after.
class FusionPolicy {
public:
    FusionPolicy();
    explicit FusionPolicy(const SearchConfig& search);

    double threshold(EmbeddingField field) const;
    double fused_threshold() const { return fused_threshold_; }

    // A hit counts as evidence iff distance < field threshold
    bool passes(EmbeddingField field, double distance) const;

    // Filter the observed distances and fuse the survivors. The returned
    // breakdown keeps every observed distance.
    FusedScore score(const FieldDistances& observed) const;

    // Included iff fused score < global threshold
    bool accepts(const FusedScore& fused) const { return fused.score < fused_threshold_; }

private:
    std::array<double, kFusedFieldCount> field_thresholds_;
    double visual_threshold_;
    double fused_threshold_;
};

} // namespace papernotes
