#include "ingest.hpp"
#include "field_deriver.hpp"
#include "image.hpp"
#include "progress.hpp"
#include "util.hpp"
#include <atomic>
#include <iostream>

namespace papernotes {

// Derivation sub-steps: visual, clip, visual_text, ocr a/b, text a/b
static constexpr int kDeriveSteps = 7;
static constexpr float kDeriveStart = 0.20f;
static constexpr float kDeriveEnd = 0.85f;

std::string ingest_error_to_string(IngestError error) {
    switch (error) {
        case IngestError::None:            return "none";
        case IngestError::ImageLoadFailed: return "image_load_failed";
        case IngestError::Cancelled:       return "cancelled";
        case IngestError::PersistFailed:   return "persist_failed";
    }
    return "unknown";
}

static IngestResult failure(ProgressReporter& progress, IngestError error,
                            const std::string& message) {
    std::cerr << "[ingest] " << message << "\n";
    progress.report(Stage::Error, progress.last_fraction(), message);
    IngestResult r;
    r.error = error;
    r.message = message;
    return r;
}

IngestionPipeline::IngestionPipeline(EmbeddingGateway& gateway, VectorIndex& index,
                                     WorkerPool& pool, const Config& config, EventBus* bus)
    : gateway_(gateway)
    , index_(index)
    , pool_(pool)
    , dims_(config.dimensions)
    , settings_(config.ingest)
    , bus_(bus)
{}

IngestResult IngestionPipeline::ingest(const std::string& image_path, NoteId existing_id,
                                       const CancelToken& cancel) {
    IngestOptions options;
    options.existing_id = existing_id;
    return ingest(image_path, options, cancel);
}

IngestResult IngestionPipeline::ingest(const std::string& image_path,
                                       const IngestOptions& options,
                                       const CancelToken& cancel) {
    std::string run_id = generate_id();
    ProgressReporter progress(bus_, PipelineKind::Ingest, run_id);

    // ── Load and validate ──
    progress.report(Stage::LoadingImage, 0.10f, "Loading image");
    auto image = load_image(image_path);
    if (!image) {
        return failure(progress, IngestError::ImageLoadFailed,
                       "Could not load image: " + image_path);
    }

    auto annotations = validate_image(*image, {settings_.min_image_side, settings_.max_image_side});
    progress.report(Stage::LoadingImage, 0.15f, join(annotations, "; "));
    if (has_warnings(annotations)) {
        std::cerr << "[ingest] " << image_path << ": " << join(annotations, "; ") << "\n";
    }

    if (cancel.cancelled()) {
        return failure(progress, IngestError::Cancelled, "Ingestion cancelled");
    }

    std::optional<NoteRecord> existing;
    if (options.existing_id != 0) {
        try {
            existing = index_.get(options.existing_id);
        } catch (const std::exception& e) {
            return failure(progress, IngestError::PersistFailed,
                           "Could not read note " + std::to_string(options.existing_id) +
                           ": " + e.what());
        }
        if (!existing) {
            std::cerr << "[ingest] Note " << options.existing_id
                      << " not found, creating a new note\n";
        }
    }

    Image ocr_image = *image;
    if (settings_.preprocess_ocr) {
        try {
            ocr_image = preprocess_for_ocr(*image);
        } catch (const cv::Exception& e) {
            std::cerr << "[ingest] OCR preprocessing failed, using the original image: "
                      << e.what() << "\n";
        }
    }

    // ── Derive every field concurrently ──
    progress.report(Stage::GeneratingImageEmbedding, kDeriveStart, "Generating embeddings");

    FieldDeriver derive(gateway_, dims_, progress, cancel, "ingest");
    std::atomic<int> steps_done{0};
    auto step_done = [&](Stage stage, const std::string& message) {
        int done = ++steps_done;
        float f = kDeriveStart + (kDeriveEnd - kDeriveStart) * static_cast<float>(done) / kDeriveSteps;
        progress.report(stage, f, message);
    };

    FieldVector visual, clip, visual_text, text_a, text_b;
    OcrReading ocr_a, ocr_b;
    {
        TaskGroup group(pool_, cancel, "ingest");

        group.spawn("visual", [&]() {
            visual = derive.image_vector(*image, EmbeddingField::Visual);
            step_done(Stage::GeneratingImageEmbedding, "Visual features done");
        });
        group.spawn("clip", [&]() {
            clip = derive.image_vector(*image, EmbeddingField::Clip);
            step_done(Stage::GeneratingImageEmbedding, "CLIP embedding done");
        });
        group.spawn("visual_text", [&]() {
            visual_text = derive.image_vector(*image, EmbeddingField::VisualText);
            step_done(Stage::GeneratingVisualTextEmbedding, "Visual-text embedding done");
        });
        group.spawn("ocr_a", [&]() {
            if (auto r = derive.ocr(ocr_image, OcrEngine::A)) ocr_a = std::move(*r);
            step_done(Stage::RunningOcr, "OCR engine A done");
            text_a = derive.text_vector(ocr_a.text, EmbeddingField::OcrTextA);
            step_done(Stage::GeneratingTextEmbedding, "Text embedding A done");
        });
        group.spawn("ocr_b", [&]() {
            if (auto r = derive.ocr(ocr_image, OcrEngine::B)) ocr_b = std::move(*r);
            step_done(Stage::RunningOcr, "OCR engine B done");
            text_b = derive.text_vector(ocr_b.text, EmbeddingField::OcrTextB);
            step_done(Stage::GeneratingTextEmbedding, "Text embedding B done");
        });

        group.wait();
    }

    if (cancel.cancelled()) {
        return failure(progress, IngestError::Cancelled, "Ingestion cancelled");
    }

    // ── Assemble and persist ──
    uint64_t now = epoch_millis();
    NoteRecord record;
    record.id = existing ? existing->id : 0;
    record.image_path = image_path;
    record.title = existing ? existing->title : "Note " + std::to_string(now);
    if (options.collection) {
        record.collection = options.collection;
    } else if (existing) {
        record.collection = existing->collection;
    }
    record.visual = std::move(visual);
    record.clip = std::move(clip);
    record.visual_text = std::move(visual_text);
    record.ocr_text_a = std::move(text_a);
    record.ocr_text_b = std::move(text_b);
    record.ocr_a = std::move(ocr_a);
    record.ocr_b = std::move(ocr_b);
    record.timestamp = now;

    progress.report(Stage::Saving, 0.90f, "Saving note");
    try {
        record.id = index_.upsert(record);
    } catch (const std::exception& e) {
        return failure(progress, IngestError::PersistFailed,
                       std::string("Could not save note: ") + e.what());
    }

    size_t present = record.present_count();
    std::cerr << "[ingest] Note " << record.id << " saved with " << present << "/"
              << kFieldCount << " fields\n";
    progress.report(Stage::Complete, 1.0f, "Note saved");

    NoteIngestedEvent ev;
    ev.run_id = run_id;
    ev.note_id = record.id;
    ev.reingested = existing.has_value();
    ev.present_fields = present;
    progress.publish(ev);

    IngestResult result;
    result.success = true;
    result.note = std::move(record);
    result.reingested = existing.has_value();
    result.annotations = std::move(annotations);
    return result;
}

} // namespace papernotes
