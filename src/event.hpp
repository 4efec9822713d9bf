#pragma once
#include "note.hpp"
#include <string>
#include <cstdint>

namespace papernotes {

// Tag-based event dispatch: no RTTI, no dynamic_cast.
// Events are stack-allocated structs; never deleted through base pointer.

struct Event {
    const char* type_tag;
};

enum class PipelineKind { Ingest, Query };

// Coarse pipeline stages reported to progress observers
enum class Stage {
    Idle,
    LoadingImage,
    GeneratingImageEmbedding,
    GeneratingVisualTextEmbedding,
    RunningOcr,
    GeneratingTextEmbedding,
    Searching,
    Saving,
    Complete,
    Error,
};

std::string stage_to_string(Stage stage);
std::string pipeline_to_string(PipelineKind kind);

// ── Event tags ──────────────────────────────────────────────────

namespace event_tags {
    constexpr const char* PipelineProgress      = "PipelineProgress";
    constexpr const char* FieldDerivationFailed = "FieldDerivationFailed";
    constexpr const char* NoteIngested          = "NoteIngested";
    constexpr const char* SearchCompleted       = "SearchCompleted";
} // namespace event_tags

// ── Event structs ───────────────────────────────────────────────

struct PipelineProgressEvent : Event {
    static constexpr const char* TAG = event_tags::PipelineProgress;
    std::string run_id;
    PipelineKind pipeline = PipelineKind::Ingest;
    Stage stage = Stage::Idle;
    float fraction = 0.0f;       // [0, 1], non-decreasing within a run
    std::string message;

    PipelineProgressEvent() { type_tag = TAG; }
};

// A single embedding or OCR step failed and its field was left absent.
struct FieldDerivationFailedEvent : Event {
    static constexpr const char* TAG = event_tags::FieldDerivationFailed;
    std::string run_id;
    PipelineKind pipeline = PipelineKind::Ingest;
    std::string step;            // e.g. "clip", "ocr_a", "ocr_text_b"
    std::string reason;

    FieldDerivationFailedEvent() { type_tag = TAG; }
};

struct NoteIngestedEvent : Event {
    static constexpr const char* TAG = event_tags::NoteIngested;
    std::string run_id;
    NoteId note_id = 0;
    bool reingested = false;
    size_t present_fields = 0;

    NoteIngestedEvent() { type_tag = TAG; }
};

struct SearchCompletedEvent : Event {
    static constexpr const char* TAG = event_tags::SearchCompleted;
    std::string run_id;
    size_t active_fields = 0;    // query fields that produced a vector
    size_t result_count = 0;

    SearchCompletedEvent() { type_tag = TAG; }
};

} // namespace papernotes
