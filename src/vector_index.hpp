#pragma once
#include "note.hpp"
#include <string>
#include <vector>
#include <optional>
#include <memory>
#include <cstdint>
#include <stdexcept>

namespace papernotes {

struct Config; // forward declaration

struct Neighbor {
    NoteId id = 0;
    double distance = 0.0; // cosine distance, lower = closer
};

// Thrown when a vector does not fit its field (wrong dimension, not unit-norm).
class InvalidVectorError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Abstract vector store: one record per note, each with zero or more
// named vectors. Implementations must tolerate concurrent readers and
// writers; a single record is always written atomically.
class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    virtual std::string backend_name() const = 0;

    // Insert or fully replace a record. A record with id 0, or with an id
    // the index does not hold, gets a fresh id that was never used before.
    // Absent vectors in `record` remove any stored vector for that field.
    // Returns the id the record was stored under.
    // Throws InvalidVectorError if a present vector fails validation.
    virtual NoteId upsert(const NoteRecord& record) = 0;

    // Set or clear a single field of an existing record.
    // Returns false if no record has that id.
    virtual bool upsert(NoteId id, EmbeddingField field, const FieldVector& vector) = 0;

    // Up to k records closest to `query` in `field`, ascending by distance.
    // Records with no vector for the field are never returned.
    virtual std::vector<Neighbor> nearest_neighbors(EmbeddingField field,
                                                    const Embedding& query,
                                                    uint32_t k) = 0;

    virtual std::optional<NoteRecord> get(NoteId id) = 0;

    // Delete a record. Returns true if found and deleted. The id is not reused.
    virtual bool remove(NoteId id) = 0;

    virtual uint32_t count() = 0;

    // Number of records holding a vector for `field`.
    virtual uint32_t count_with(EmbeddingField field) = 0;

    const FieldDimensions& dimensions() const { return dims_; }
    void set_dimensions(const FieldDimensions& dims) { dims_ = dims; }

protected:
    // Throws InvalidVectorError when a present vector has the wrong size
    // for its field or is not L2-normalized.
    void validate(EmbeddingField field, const FieldVector& vector) const;
    void validate(const NoteRecord& record) const;

    FieldDimensions dims_;
};

// Keep the k closest candidates, ascending by distance then id.
void keep_nearest(std::vector<Neighbor>& candidates, uint32_t k);

// Create the configured index backend through the plugin registry.
// Throws std::invalid_argument for an unknown backend name.
std::unique_ptr<VectorIndex> create_vector_index(const Config& config);

} // namespace papernotes
