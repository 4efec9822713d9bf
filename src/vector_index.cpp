#include "vector_index.hpp"
#include "config.hpp"
#include "plugin.hpp"
#include "util.hpp"
#include <algorithm>
#include <cmath>

namespace papernotes {

void VectorIndex::validate(EmbeddingField field, const FieldVector& vector) const {
    if (!vector) return;
    uint32_t expected = dims_.of(field);
    if (vector->size() != expected) {
        throw InvalidVectorError(field_to_string(field) + ": expected " +
                                 std::to_string(expected) + " dimensions, got " +
                                 std::to_string(vector->size()));
    }
    if (!is_unit_norm(*vector)) {
        throw InvalidVectorError(field_to_string(field) + ": vector is not L2-normalized (norm " +
                                 std::to_string(l2_norm(*vector)) + ")");
    }
}

void VectorIndex::validate(const NoteRecord& record) const {
    for (auto f : kAllFields) {
        validate(f, record.vector(f));
    }
}

void keep_nearest(std::vector<Neighbor>& candidates, uint32_t k) {
    auto closer = [](const Neighbor& a, const Neighbor& b) {
        if (a.distance != b.distance) return a.distance < b.distance;
        return a.id < b.id;
    };
    if (candidates.size() > k) {
        std::partial_sort(candidates.begin(), candidates.begin() + k,
                          candidates.end(), closer);
        candidates.resize(k);
    } else {
        std::sort(candidates.begin(), candidates.end(), closer);
    }
}

std::unique_ptr<VectorIndex> create_vector_index(const Config& config) {
    auto& registry = PluginRegistry::instance();
    if (!registry.has_index(config.index.backend)) {
        throw std::invalid_argument("Unknown index backend: " + config.index.backend +
                                    " (available: " + join(registry.index_names(), ", ") + ")");
    }
    auto index = registry.create_index(config.index.backend, config);
    index->set_dimensions(config.dimensions);
    return index;
}

} // namespace papernotes
