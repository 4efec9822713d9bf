#pragma once
#include "config.hpp"
#include "event_bus.hpp"
#include "fusion.hpp"
#include "gateway.hpp"
#include "note.hpp"
#include "task_group.hpp"
#include "vector_index.hpp"
#include <optional>
#include <string>
#include <vector>

namespace papernotes {

struct SearchResult {
    NoteRecord note;
    FusedScore score;
};

// Image-to-notes retrieval: derive query vectors per field, look up each
// field in the index concurrently, fuse per-note distances and rank.
class QueryPipeline {
public:
    QueryPipeline(EmbeddingGateway& gateway, VectorIndex& index, WorkerPool& pool,
                  const Config& config, EventBus* bus = nullptr);

    // Ranked matches, ascending by fused score (ties by id). Empty when the
    // image cannot be loaded, the CLIP embedding is unavailable, or the run
    // is cancelled. Never throws for those cases.
    std::vector<SearchResult> search(const std::string& image_path,
                                     const CancelToken& cancel = CancelToken());

    // Closest note in `collection` by baseline visual features, if any
    // is within the visual threshold. score.score holds the raw distance.
    std::optional<SearchResult> find_similar_in_collection(const std::string& image_path,
                                                           const std::string& collection,
                                                           const CancelToken& cancel = CancelToken());

    const FusionPolicy& policy() const { return policy_; }

private:
    EmbeddingGateway& gateway_;
    VectorIndex& index_;
    WorkerPool& pool_;
    FieldDimensions dims_;
    FusionPolicy policy_;
    uint32_t top_k_;
    bool preprocess_ocr_;
    EventBus* bus_;
};

} // namespace papernotes
