#pragma once
#include "config.hpp"
#include "event_bus.hpp"
#include "gateway.hpp"
#include "note.hpp"
#include "task_group.hpp"
#include "vector_index.hpp"
#include <optional>
#include <string>
#include <vector>

namespace papernotes {

enum class IngestError {
    None,
    ImageLoadFailed,   // image missing or undecodable; nothing persisted
    Cancelled,         // cancelled or deadline passed before persistence
    PersistFailed,     // the index rejected or failed the write
};

std::string ingest_error_to_string(IngestError error);

struct IngestResult {
    bool success = false;
    IngestError error = IngestError::None;
    std::string message;
    NoteRecord note;                       // persisted record on success
    bool reingested = false;               // an existing record was replaced
    std::vector<std::string> annotations;  // image validation notes
};

struct IngestOptions {
    NoteId existing_id = 0;                // 0 = always create a new note
    std::optional<std::string> collection; // set on the note when given
};

// Turns one image into one persisted multi-vector note. Field derivations
// run concurrently on the pool; each may fail on its own without failing
// the run. The record is written with a single atomic upsert after every
// derivation has finished.
class IngestionPipeline {
public:
    IngestionPipeline(EmbeddingGateway& gateway, VectorIndex& index, WorkerPool& pool,
                      const Config& config, EventBus* bus = nullptr);

    IngestResult ingest(const std::string& image_path, NoteId existing_id = 0,
                        const CancelToken& cancel = CancelToken());

    IngestResult ingest(const std::string& image_path, const IngestOptions& options,
                        const CancelToken& cancel = CancelToken());

private:
    EmbeddingGateway& gateway_;
    VectorIndex& index_;
    WorkerPool& pool_;
    FieldDimensions dims_;
    IngestConfig settings_;
    EventBus* bus_;
};

} // namespace papernotes
