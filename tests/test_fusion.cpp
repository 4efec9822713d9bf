#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_message.hpp>
#include "fusion.hpp"
#include "config.hpp"
#include <cmath>

using namespace papernotes;

static FieldDistances evidence(std::initializer_list<std::pair<EmbeddingField, double>> items) {
    FieldDistances d;
    for (const auto& [f, dist] : items) d[field_index(f)] = dist;
    return d;
}

// ── FieldSet ─────────────────────────────────────────────────────

TEST_CASE("FieldSet: insert and contains", "[fusion]") {
    FieldSet s;
    REQUIRE(s.empty());
    s.insert(EmbeddingField::Clip);
    s.insert(EmbeddingField::OcrTextB);
    REQUIRE(s.contains(EmbeddingField::Clip));
    REQUIRE(s.contains(EmbeddingField::OcrTextB));
    REQUIRE_FALSE(s.contains(EmbeddingField::VisualText));
    REQUIRE(s.size() == 2);
    REQUIRE(s.bits() == 0b1001);
}

TEST_CASE("FieldSet: baseline visual field is not a fused field", "[fusion]") {
    FieldSet s;
    s.insert(EmbeddingField::Visual);
    REQUIRE(s.empty());
    REQUIRE_FALSE(s.contains(EmbeddingField::Visual));
}

// ── Weight table ─────────────────────────────────────────────────

TEST_CASE("weights_for: every non-empty row sums to one", "[fusion]") {
    for (unsigned bits = 1; bits < kFieldSetCount; ++bits) {
        const auto& w = weights_for(FieldSet(static_cast<uint8_t>(bits)));
        double sum = 0.0;
        for (double x : w) sum += x;
        INFO("mask " << bits);
        REQUIRE(std::abs(sum - 1.0) < 1e-6);
    }
}

TEST_CASE("weights_for: absent fields carry no weight", "[fusion]") {
    for (unsigned bits = 0; bits < kFieldSetCount; ++bits) {
        FieldSet s(static_cast<uint8_t>(bits));
        const auto& w = weights_for(s);
        for (auto f : kFusedFields) {
            if (!s.contains(f)) {
                INFO("mask " << bits << " field " << field_to_string(f));
                REQUIRE(w[field_index(f)] == 0.0);
            }
        }
    }
}

TEST_CASE("weights_for: empty set is all zeros", "[fusion]") {
    for (double x : weights_for(FieldSet())) REQUIRE(x == 0.0);
}

TEST_CASE("weights_for: single field weighs 1.0", "[fusion]") {
    for (auto f : kFusedFields) {
        REQUIRE(weights_for(FieldSet::of({f}))[field_index(f)] == 1.0);
    }
}

TEST_CASE("weights_for: all four fields", "[fusion]") {
    const auto& w = weights_for(FieldSet::of({EmbeddingField::Clip, EmbeddingField::VisualText,
                                              EmbeddingField::OcrTextA, EmbeddingField::OcrTextB}));
    REQUIRE(w[field_index(EmbeddingField::Clip)] == 0.30);
    REQUIRE(w[field_index(EmbeddingField::OcrTextA)] == 0.25);
    REQUIRE(w[field_index(EmbeddingField::OcrTextB)] == 0.20);
    REQUIRE(w[field_index(EmbeddingField::VisualText)] == 0.25);
}

TEST_CASE("weights_for: three-field rows", "[fusion]") {
    using F = EmbeddingField;
    {
        const auto& w = weights_for(FieldSet::of({F::Clip, F::OcrTextA, F::VisualText}));
        REQUIRE(w[field_index(F::Clip)] == 0.35);
        REQUIRE(w[field_index(F::OcrTextA)] == 0.35);
        REQUIRE(w[field_index(F::VisualText)] == 0.30);
    }
    {
        const auto& w = weights_for(FieldSet::of({F::Clip, F::OcrTextA, F::OcrTextB}));
        REQUIRE(w[field_index(F::Clip)] == 0.35);
        REQUIRE(w[field_index(F::OcrTextA)] == 0.40);
        REQUIRE(w[field_index(F::OcrTextB)] == 0.25);
    }
    {
        const auto& w = weights_for(FieldSet::of({F::Clip, F::OcrTextB, F::VisualText}));
        REQUIRE(w[field_index(F::Clip)] == 0.35);
        REQUIRE(w[field_index(F::OcrTextB)] == 0.30);
        REQUIRE(w[field_index(F::VisualText)] == 0.35);
    }
    {
        const auto& w = weights_for(FieldSet::of({F::OcrTextA, F::OcrTextB, F::VisualText}));
        REQUIRE(w[field_index(F::OcrTextA)] == 0.35);
        REQUIRE(w[field_index(F::OcrTextB)] == 0.25);
        REQUIRE(w[field_index(F::VisualText)] == 0.40);
    }
}

TEST_CASE("weights_for: two-field rows", "[fusion]") {
    using F = EmbeddingField;
    auto w_ca = weights_for(FieldSet::of({F::Clip, F::OcrTextA}));
    REQUIRE(w_ca[field_index(F::Clip)] == 0.40);
    REQUIRE(w_ca[field_index(F::OcrTextA)] == 0.60);

    auto w_cb = weights_for(FieldSet::of({F::Clip, F::OcrTextB}));
    REQUIRE(w_cb[field_index(F::Clip)] == 0.40);
    REQUIRE(w_cb[field_index(F::OcrTextB)] == 0.60);

    auto w_cv = weights_for(FieldSet::of({F::Clip, F::VisualText}));
    REQUIRE(w_cv[field_index(F::Clip)] == 0.50);
    REQUIRE(w_cv[field_index(F::VisualText)] == 0.50);

    auto w_ab = weights_for(FieldSet::of({F::OcrTextA, F::OcrTextB}));
    REQUIRE(w_ab[field_index(F::OcrTextA)] == 0.55);
    REQUIRE(w_ab[field_index(F::OcrTextB)] == 0.45);

    auto w_av = weights_for(FieldSet::of({F::OcrTextA, F::VisualText}));
    REQUIRE(w_av[field_index(F::OcrTextA)] == 0.50);
    REQUIRE(w_av[field_index(F::VisualText)] == 0.50);

    auto w_bv = weights_for(FieldSet::of({F::OcrTextB, F::VisualText}));
    REQUIRE(w_bv[field_index(F::OcrTextB)] == 0.50);
    REQUIRE(w_bv[field_index(F::VisualText)] == 0.50);
}

// ── fuse ─────────────────────────────────────────────────────────

TEST_CASE("fuse: CLIP and text A weighted sum", "[fusion]") {
    auto fused = fuse(evidence({{EmbeddingField::Clip, 0.10}, {EmbeddingField::OcrTextA, 0.05}}));
    REQUIRE(std::abs(fused.score - 0.07) < 1e-12);
    REQUIRE(fused.fields() == FieldSet::of({EmbeddingField::Clip, EmbeddingField::OcrTextA}));
    FusionPolicy policy;
    REQUIRE(policy.accepts(fused));
}

TEST_CASE("fuse: single text field uses its distance as-is", "[fusion]") {
    auto fused = fuse(evidence({{EmbeddingField::OcrTextA, 0.50}}));
    REQUIRE(std::abs(fused.score - 0.50) < 1e-12);
    FusionPolicy policy;
    REQUIRE_FALSE(policy.accepts(fused));
}

TEST_CASE("fuse: no evidence yields the 1.0 sentinel", "[fusion]") {
    auto fused = fuse(FieldDistances{});
    REQUIRE(fused.score == kNoEvidenceScore);
    REQUIRE(fused.fields().empty());
    FusionPolicy policy;
    REQUIRE_FALSE(policy.accepts(fused));
}

TEST_CASE("fuse: all four fields", "[fusion]") {
    auto fused = fuse(evidence({{EmbeddingField::Clip, 0.1}, {EmbeddingField::VisualText, 0.2},
                                {EmbeddingField::OcrTextA, 0.1}, {EmbeddingField::OcrTextB, 0.0}}));
    // 0.30*0.1 + 0.25*0.2 + 0.25*0.1 + 0.20*0.0
    REQUIRE(std::abs(fused.score - 0.105) < 1e-12);
}

TEST_CASE("fuse: is deterministic", "[fusion]") {
    auto ev = evidence({{EmbeddingField::Clip, 0.13}, {EmbeddingField::OcrTextB, 0.07}});
    REQUIRE(fuse(ev).score == fuse(ev).score);
}

// ── FusionPolicy ─────────────────────────────────────────────────

TEST_CASE("FusionPolicy: default thresholds are uniform 0.2", "[fusion]") {
    FusionPolicy policy;
    for (auto f : kAllFields) {
        REQUIRE(policy.threshold(f) == 0.2);
    }
    REQUIRE(policy.fused_threshold() == 0.2);
}

TEST_CASE("FusionPolicy: global threshold is exclusive", "[fusion]") {
    FusionPolicy policy;
    FusedScore at;
    at.score = 0.2;
    FusedScore below;
    below.score = 0.1999;
    REQUIRE_FALSE(policy.accepts(at));
    REQUIRE(policy.accepts(below));
}

TEST_CASE("FusionPolicy: per-field threshold is exclusive", "[fusion]") {
    FusionPolicy policy;
    REQUIRE_FALSE(policy.passes(EmbeddingField::Clip, 0.2));
    REQUIRE(policy.passes(EmbeddingField::Clip, 0.1999));
}

TEST_CASE("FusionPolicy: filtered hits stay observed but give no evidence", "[fusion]") {
    FusionPolicy policy;
    FieldDistances observed;
    observed[field_index(EmbeddingField::Clip)] = 0.10;
    observed[field_index(EmbeddingField::OcrTextA)] = 0.35;

    auto fused = policy.score(observed);
    REQUIRE(fused.fields() == FieldSet::of({EmbeddingField::Clip}));
    REQUIRE(std::abs(fused.score - 0.10) < 1e-12);
    REQUIRE(fused.observed[field_index(EmbeddingField::OcrTextA)] == 0.35);
    REQUIRE_FALSE(fused.evidence[field_index(EmbeddingField::OcrTextA)].has_value());
}

TEST_CASE("FusionPolicy: everything filtered out is excluded", "[fusion]") {
    FusionPolicy policy;
    FieldDistances observed;
    observed[field_index(EmbeddingField::Clip)] = 0.25;
    observed[field_index(EmbeddingField::VisualText)] = 0.30;

    auto fused = policy.score(observed);
    REQUIRE(fused.score == kNoEvidenceScore);
    REQUIRE_FALSE(policy.accepts(fused));
}

TEST_CASE("FusionPolicy: thresholds come from config", "[fusion]") {
    SearchConfig s;
    s.clip_threshold = 0.3;
    s.text_a_threshold = 0.1;
    s.visual_threshold = 0.05;
    s.fused_threshold = 0.25;
    FusionPolicy policy(s);
    REQUIRE(policy.threshold(EmbeddingField::Clip) == 0.3);
    REQUIRE(policy.threshold(EmbeddingField::OcrTextA) == 0.1);
    REQUIRE(policy.threshold(EmbeddingField::Visual) == 0.05);
    REQUIRE(policy.fused_threshold() == 0.25);
    REQUIRE(policy.passes(EmbeddingField::Clip, 0.25));
}
