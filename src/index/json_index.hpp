#pragma once
#include "../vector_index.hpp"
#include <map>
#include <shared_mutex>
#include <string>

namespace papernotes {

// Vector index kept in memory and mirrored to a JSON file after every
// write. An empty path keeps the index purely in memory.
class JsonIndex : public VectorIndex {
public:
    explicit JsonIndex(const std::string& path);

    std::string backend_name() const override { return "json"; }

    NoteId upsert(const NoteRecord& record) override;
    bool upsert(NoteId id, EmbeddingField field, const FieldVector& vector) override;
    std::vector<Neighbor> nearest_neighbors(EmbeddingField field, const Embedding& query,
                                            uint32_t k) override;
    std::optional<NoteRecord> get(NoteId id) override;
    bool remove(NoteId id) override;
    uint32_t count() override;
    uint32_t count_with(EmbeddingField field) override;

    const std::string& path() const { return path_; }

private:
    void load();
    // Throws std::runtime_error when the file cannot be written
    void save() const;

    std::string path_;
    std::map<NoteId, NoteRecord> notes_;
    NoteId next_id_ = 1;
    mutable std::shared_mutex mutex_;
};

} // namespace papernotes
