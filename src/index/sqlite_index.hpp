#pragma once
#include "../vector_index.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace papernotes {

// SQLite-backed vector index. Note metadata lives in `notes`, one row per
// present vector in `note_vectors` (float32 BLOBs). Ids come from
// AUTOINCREMENT and are never reused. Search is a brute-force cosine scan.
class SqliteIndex : public VectorIndex {
public:
    explicit SqliteIndex(const std::string& path);
    ~SqliteIndex() override;

    // Non-copyable
    SqliteIndex(const SqliteIndex&) = delete;
    SqliteIndex& operator=(const SqliteIndex&) = delete;

    std::string backend_name() const override { return "sqlite"; }

    NoteId upsert(const NoteRecord& record) override;
    bool upsert(NoteId id, EmbeddingField field, const FieldVector& vector) override;
    std::vector<Neighbor> nearest_neighbors(EmbeddingField field, const Embedding& query,
                                            uint32_t k) override;
    std::optional<NoteRecord> get(NoteId id) override;
    bool remove(NoteId id) override;
    uint32_t count() override;
    uint32_t count_with(EmbeddingField field) override;

private:
    void init_schema();
    bool exists(NoteId id);
    void write_vector(NoteId id, EmbeddingField field, const FieldVector& vector);

    sqlite3* db_ = nullptr;
    std::string path_;
    mutable std::mutex mutex_;
};

} // namespace papernotes
