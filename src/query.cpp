#include "query.hpp"
#include "field_deriver.hpp"
#include "image.hpp"
#include "progress.hpp"
#include "util.hpp"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <map>

namespace papernotes {

// Derivation sub-steps: clip, visual_text, ocr a/b, text a/b
static constexpr int kDeriveSteps = 6;
static constexpr float kDeriveStart = 0.20f;
static constexpr float kDeriveEnd = 0.60f;

QueryPipeline::QueryPipeline(EmbeddingGateway& gateway, VectorIndex& index, WorkerPool& pool,
                             const Config& config, EventBus* bus)
    : gateway_(gateway)
    , index_(index)
    , pool_(pool)
    , dims_(config.dimensions)
    , policy_(config.search)
    , top_k_(config.search.top_k)
    , preprocess_ocr_(config.ingest.preprocess_ocr)
    , bus_(bus)
{}

static void publish_completed(ProgressReporter& progress,
                              size_t active_fields, size_t results) {
    SearchCompletedEvent ev;
    ev.run_id = progress.run_id();
    ev.active_fields = active_fields;
    ev.result_count = results;
    progress.publish(ev);
}

std::vector<SearchResult> QueryPipeline::search(const std::string& image_path,
                                                const CancelToken& cancel) {
    ProgressReporter progress(bus_, PipelineKind::Query, generate_id());

    progress.report(Stage::LoadingImage, 0.10f, "Loading image");
    auto image = load_image(image_path);
    if (!image) {
        std::cerr << "[query] Could not load image: " << image_path << "\n";
        progress.report(Stage::Error, progress.last_fraction(), "Could not load image");
        publish_completed(progress, 0, 0);
        return {};
    }

    Image ocr_image = *image;
    if (preprocess_ocr_) {
        try {
            ocr_image = preprocess_for_ocr(*image);
        } catch (const cv::Exception& e) {
            std::cerr << "[query] OCR preprocessing failed, using the original image: "
                      << e.what() << "\n";
        }
    }

    // ── Query vectors ──
    progress.report(Stage::GeneratingImageEmbedding, kDeriveStart, "Generating query embeddings");

    FieldDeriver derive(gateway_, dims_, progress, cancel, "query");
    std::atomic<int> steps_done{0};
    auto step_done = [&](Stage stage, const std::string& message) {
        int done = ++steps_done;
        float f = kDeriveStart + (kDeriveEnd - kDeriveStart) * static_cast<float>(done) / kDeriveSteps;
        progress.report(stage, f, message);
    };

    std::array<FieldVector, kFusedFieldCount> query;
    {
        TaskGroup group(pool_, cancel, "query");
        auto& clip = query[field_index(EmbeddingField::Clip)];
        auto& visual_text = query[field_index(EmbeddingField::VisualText)];
        auto& text_a = query[field_index(EmbeddingField::OcrTextA)];
        auto& text_b = query[field_index(EmbeddingField::OcrTextB)];

        group.spawn("clip", [&]() {
            clip = derive.image_vector(*image, EmbeddingField::Clip);
            step_done(Stage::GeneratingImageEmbedding, "CLIP embedding done");
        });
        group.spawn("visual_text", [&]() {
            visual_text = derive.image_vector(*image, EmbeddingField::VisualText);
            step_done(Stage::GeneratingVisualTextEmbedding, "Visual-text embedding done");
        });
        group.spawn("ocr_a", [&]() {
            auto reading = derive.ocr(ocr_image, OcrEngine::A);
            step_done(Stage::RunningOcr, "OCR engine A done");
            if (reading) text_a = derive.text_vector(reading->text, EmbeddingField::OcrTextA);
            step_done(Stage::GeneratingTextEmbedding, "Text embedding A done");
        });
        group.spawn("ocr_b", [&]() {
            auto reading = derive.ocr(ocr_image, OcrEngine::B);
            step_done(Stage::RunningOcr, "OCR engine B done");
            if (reading) text_b = derive.text_vector(reading->text, EmbeddingField::OcrTextB);
            step_done(Stage::GeneratingTextEmbedding, "Text embedding B done");
        });

        group.wait();
    }

    if (cancel.cancelled()) {
        std::cerr << "[query] Search cancelled\n";
        progress.report(Stage::Error, progress.last_fraction(), "Search cancelled");
        return {};
    }

    size_t active = 0;
    for (const auto& q : query) {
        if (q) active++;
    }

    // CLIP is the primary signal; without it the other fields alone are
    // not trusted to rank notes.
    if (!query[field_index(EmbeddingField::Clip)]) {
        std::cerr << "[query] CLIP embedding unavailable, returning no results\n";
        progress.report(Stage::Error, progress.last_fraction(), "CLIP embedding unavailable");
        publish_completed(progress, active, 0);
        return {};
    }

    // ── Per-field ANN lookups ──
    progress.report(Stage::Searching, 0.70f, "Searching index");

    std::array<std::vector<Neighbor>, kFusedFieldCount> hits;
    {
        TaskGroup group(pool_, cancel, "query");
        for (auto f : kFusedFields) {
            size_t i = field_index(f);
            if (!query[i]) continue;
            group.spawn("lookup_" + field_to_string(f), [this, f, i, &query, &hits]() {
                try {
                    hits[i] = index_.nearest_neighbors(f, *query[i], top_k_);
                } catch (const std::exception& e) {
                    std::cerr << "[query] " << field_to_string(f)
                              << " lookup failed, field ignored: " << e.what() << "\n";
                    hits[i].clear();
                }
            });
        }
        group.wait();
    }

    if (cancel.cancelled()) {
        std::cerr << "[query] Search cancelled\n";
        progress.report(Stage::Error, progress.last_fraction(), "Search cancelled");
        return {};
    }

    // ── Fuse ──
    std::map<NoteId, FieldDistances> observed;
    for (auto f : kFusedFields) {
        size_t i = field_index(f);
        for (const auto& n : hits[i]) {
            auto& slot = observed[n.id][i];
            if (!slot || n.distance < *slot) slot = n.distance;
        }
    }

    std::vector<std::pair<NoteId, FusedScore>> ranked;
    for (const auto& [id, distances] : observed) {
        FusedScore fused = policy_.score(distances);
        if (policy_.accepts(fused)) ranked.emplace_back(id, std::move(fused));
    }
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second.score != b.second.score) return a.second.score < b.second.score;
        return a.first < b.first;
    });

    progress.report(Stage::Searching, 0.90f, "Loading matching notes");

    std::vector<SearchResult> results;
    results.reserve(ranked.size());
    for (auto& [id, fused] : ranked) {
        std::optional<NoteRecord> note;
        try {
            note = index_.get(id);
        } catch (const std::exception& e) {
            std::cerr << "[query] Could not load note " << id << ": " << e.what() << "\n";
            continue;
        }
        // Removed between lookup and resolution
        if (!note) continue;
        results.push_back({std::move(*note), std::move(fused)});
    }

    std::cerr << "[query] " << results.size() << " result(s) from " << observed.size()
              << " candidate(s) over " << active << " field(s)\n";
    progress.report(Stage::Complete, 1.0f,
                    std::to_string(results.size()) + " matching note(s)");
    publish_completed(progress, active, results.size());
    return results;
}

std::optional<SearchResult> QueryPipeline::find_similar_in_collection(
        const std::string& image_path, const std::string& collection,
        const CancelToken& cancel) {
    ProgressReporter progress(bus_, PipelineKind::Query, generate_id());

    progress.report(Stage::LoadingImage, 0.10f, "Loading image");
    auto image = load_image(image_path);
    if (!image) {
        std::cerr << "[query] Could not load image: " << image_path << "\n";
        progress.report(Stage::Error, progress.last_fraction(), "Could not load image");
        return std::nullopt;
    }

    progress.report(Stage::GeneratingImageEmbedding, 0.30f, "Generating visual features");
    FieldDeriver derive(gateway_, dims_, progress, cancel, "query");
    auto visual = derive.image_vector(*image, EmbeddingField::Visual);
    if (!visual || cancel.cancelled()) {
        progress.report(Stage::Error, progress.last_fraction(), "Visual features unavailable");
        return std::nullopt;
    }

    progress.report(Stage::Searching, 0.60f, "Searching collection " + collection);
    std::vector<Neighbor> hits;
    try {
        hits = index_.nearest_neighbors(EmbeddingField::Visual, *visual, top_k_);
    } catch (const std::exception& e) {
        std::cerr << "[query] visual lookup failed: " << e.what() << "\n";
        progress.report(Stage::Error, progress.last_fraction(), "Index lookup failed");
        return std::nullopt;
    }

    double threshold = policy_.threshold(EmbeddingField::Visual);
    for (const auto& hit : hits) {
        if (hit.distance >= threshold) break;
        std::optional<NoteRecord> note;
        try {
            note = index_.get(hit.id);
        } catch (const std::exception& e) {
            std::cerr << "[query] Could not load note " << hit.id << ": " << e.what() << "\n";
            continue;
        }
        if (!note || note->collection != collection) continue;

        SearchResult result;
        result.note = std::move(*note);
        result.score.score = hit.distance;
        progress.report(Stage::Complete, 1.0f, "Similar note found");
        return result;
    }

    progress.report(Stage::Complete, 1.0f, "No similar note in collection");
    return std::nullopt;
}

} // namespace papernotes
