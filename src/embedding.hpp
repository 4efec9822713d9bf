#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace papernotes {

using Embedding = std::vector<float>;

// A vector slot that may not have been computed. nullopt means "absent";
// a present vector is never empty.
using FieldVector = std::optional<Embedding>;

// Allowed deviation of ||v|| from 1.0 for a stored or query vector.
constexpr double kNormTolerance = 1e-2;

// Euclidean norm, accumulated in double.
double l2_norm(const Embedding& v);

// True if v is non-empty and ||v|| is within kNormTolerance of 1.
bool is_unit_norm(const Embedding& v);

// Cosine similarity in [-1, 1]. Returns 0.0 if either vector is empty,
// zero-magnitude, or the lengths differ.
double cosine_similarity(const Embedding& a, const Embedding& b);

// 1 - cosine similarity: 0 = identical direction, 2 = opposite.
// Mismatched or empty vectors yield 1.0 (no information).
double cosine_distance(const Embedding& a, const Embedding& b);

// Serialize a float vector to a binary string (for BLOB storage).
std::string serialize_vector(const Embedding& vec);

// Deserialize a binary string back to a float vector.
// Returns an empty vector if the size is not a multiple of sizeof(float).
Embedding deserialize_vector(const std::string& data);
Embedding deserialize_vector(const void* data, size_t bytes);

} // namespace papernotes
