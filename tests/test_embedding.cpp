#include <catch2/catch_test_macros.hpp>
#include "embedding.hpp"
#include <cmath>

using namespace papernotes;

// ── cosine_similarity ───────────────────────────────────────────

TEST_CASE("cosine_similarity: identical vectors", "[embedding]") {
    Embedding v = {0.6f, 0.8f};
    REQUIRE(std::abs(cosine_similarity(v, v) - 1.0) < 1e-6);
}

TEST_CASE("cosine_similarity: orthogonal vectors", "[embedding]") {
    Embedding a = {1.0f, 0.0f, 0.0f};
    Embedding b = {0.0f, 1.0f, 0.0f};
    REQUIRE(std::abs(cosine_similarity(a, b)) < 1e-9);
}

TEST_CASE("cosine_similarity: opposite vectors", "[embedding]") {
    Embedding a = {1.0f, 0.0f};
    Embedding b = {-1.0f, 0.0f};
    REQUIRE(std::abs(cosine_similarity(a, b) + 1.0) < 1e-9);
}

TEST_CASE("cosine_similarity: scale invariant", "[embedding]") {
    Embedding a = {1.0f, 2.0f, 3.0f};
    Embedding b = {2.0f, 4.0f, 6.0f};
    REQUIRE(std::abs(cosine_similarity(a, b) - 1.0) < 1e-6);
}

TEST_CASE("cosine_similarity: empty, mismatched or zero vectors give 0", "[embedding]") {
    Embedding empty;
    Embedding a = {1.0f, 0.0f};
    Embedding b = {1.0f, 0.0f, 0.0f};
    Embedding zero = {0.0f, 0.0f};
    REQUIRE(cosine_similarity(empty, a) == 0.0);
    REQUIRE(cosine_similarity(a, b) == 0.0);
    REQUIRE(cosine_similarity(a, zero) == 0.0);
}

// ── cosine_distance ─────────────────────────────────────────────

TEST_CASE("cosine_distance: range 0 to 2", "[embedding]") {
    Embedding a = {1.0f, 0.0f};
    Embedding b = {0.0f, 1.0f};
    Embedding c = {-1.0f, 0.0f};
    REQUIRE(std::abs(cosine_distance(a, a)) < 1e-9);
    REQUIRE(std::abs(cosine_distance(a, b) - 1.0) < 1e-9);
    REQUIRE(std::abs(cosine_distance(a, c) - 2.0) < 1e-9);
}

TEST_CASE("cosine_distance: mismatched lengths carry no information", "[embedding]") {
    Embedding a = {1.0f, 0.0f};
    Embedding b = {1.0f, 0.0f, 0.0f};
    REQUIRE(cosine_distance(a, b) == 1.0);
}

// ── Norms ───────────────────────────────────────────────────────

TEST_CASE("l2_norm: known value", "[embedding]") {
    Embedding v = {3.0f, 4.0f};
    REQUIRE(std::abs(l2_norm(v) - 5.0) < 1e-9);
    REQUIRE(l2_norm(Embedding{}) == 0.0);
}

TEST_CASE("is_unit_norm: accepts within tolerance", "[embedding]") {
    REQUIRE(is_unit_norm({0.6f, 0.8f}));
    REQUIRE(is_unit_norm({1.005f, 0.0f}));
}

TEST_CASE("is_unit_norm: rejects empty and unnormalized", "[embedding]") {
    REQUIRE_FALSE(is_unit_norm({}));
    REQUIRE_FALSE(is_unit_norm({3.0f, 4.0f}));
    REQUIRE_FALSE(is_unit_norm({0.0f, 0.0f}));
    REQUIRE_FALSE(is_unit_norm({0.5f, 0.5f}));
}

// ── Serialization ───────────────────────────────────────────────

TEST_CASE("serialize_vector: byte size matches float count", "[embedding]") {
    Embedding v = {0.1f, -0.2f, 0.3f};
    std::string blob = serialize_vector(v);
    REQUIRE(blob.size() == 3 * sizeof(float));
    REQUIRE(deserialize_vector(blob) == v);
}

TEST_CASE("serialize_vector: empty vector gives empty blob", "[embedding]") {
    REQUIRE(serialize_vector({}).empty());
    REQUIRE(deserialize_vector(std::string()).empty());
}

TEST_CASE("deserialize_vector: rejects truncated blob", "[embedding]") {
    std::string blob = serialize_vector({1.0f, 2.0f});
    blob.pop_back();
    REQUIRE(deserialize_vector(blob).empty());
    REQUIRE(deserialize_vector(nullptr, 8).empty());
}
