#include <catch2/catch_test_macros.hpp>
#include "index/json_index.hpp"
#include "config.hpp"
#include "plugin.hpp"
#include "test_helpers.hpp"
#include <cmath>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace papernotes;
using namespace papernotes::testing;

static std::string json_test_path() {
    return temp_path("json_index") + ".json";
}

struct JsonFixture {
    std::string path = json_test_path();
    JsonIndex index{path};

    JsonFixture() { index.set_dimensions(small_dims()); }
    ~JsonFixture() { std::filesystem::remove(path); }
};

static NoteRecord full_note(const std::string& title) {
    auto d = small_dims();
    NoteRecord n;
    n.title = title;
    n.image_path = "/scans/" + title + ".jpg";
    n.collection = "inbox";
    n.visual = basis(d.visual, 0);
    n.clip = basis(d.clip, 1);
    n.visual_text = basis(d.visual_text, 2);
    n.ocr_text_a = basis(d.ocr_text, 0);
    n.ocr_text_b = basis(d.ocr_text, 1);
    n.ocr_a = {"Call Alice", 0.9f};
    n.ocr_b = {"call alice", 0.4f};
    n.timestamp = 1700000000000ULL;
    return n;
}

// ── Upsert and get ───────────────────────────────────────────────

TEST_CASE("JsonIndex: upsert assigns an id and get returns the record", "[json_index]") {
    JsonFixture f;
    NoteId id = f.index.upsert(full_note("first"));
    REQUIRE(id != 0);

    auto note = f.index.get(id);
    REQUIRE(note.has_value());
    REQUIRE(note->id == id);
    REQUIRE(note->title == "first");
    REQUIRE(note->collection == std::optional<std::string>("inbox"));
    REQUIRE(note->ocr_a.text == "Call Alice");
    REQUIRE(note->clip == basis(small_dims().clip, 1));
    REQUIRE(note->present_count() == kFieldCount);
    REQUIRE(note->timestamp == 1700000000000ULL);
}

TEST_CASE("JsonIndex: get of unknown id is empty", "[json_index]") {
    JsonFixture f;
    REQUIRE_FALSE(f.index.get(99).has_value());
}

TEST_CASE("JsonIndex: upsert with existing id replaces the whole record", "[json_index]") {
    JsonFixture f;
    NoteId id = f.index.upsert(full_note("v1"));

    NoteRecord update = full_note("v2");
    update.id = id;
    update.clip.reset();
    update.ocr_text_b.reset();
    REQUIRE(f.index.upsert(update) == id);

    auto note = f.index.get(id);
    REQUIRE(note.has_value());
    REQUIRE(note->title == "v2");
    REQUIRE_FALSE(note->clip.has_value());
    REQUIRE_FALSE(note->ocr_text_b.has_value());
    REQUIRE(f.index.count() == 1);
    REQUIRE(f.index.count_with(EmbeddingField::Clip) == 0);
}

TEST_CASE("JsonIndex: unknown id gets a fresh id", "[json_index]") {
    JsonFixture f;
    NoteRecord n = full_note("ghost");
    n.id = 500;
    NoteId id = f.index.upsert(n);
    REQUIRE(id != 500);
    REQUIRE_FALSE(f.index.get(500).has_value());
}

TEST_CASE("JsonIndex: ids are never reused after remove", "[json_index]") {
    JsonFixture f;
    NoteId a = f.index.upsert(full_note("a"));
    REQUIRE(f.index.remove(a));
    NoteId b = f.index.upsert(full_note("b"));
    REQUIRE(b != a);
    REQUIRE_FALSE(f.index.remove(a));
}

TEST_CASE("JsonIndex: single-field upsert", "[json_index]") {
    JsonFixture f;
    NoteId id = f.index.upsert(full_note("n"));
    auto d = small_dims();

    REQUIRE(f.index.upsert(id, EmbeddingField::Clip, FieldVector(basis(d.clip, 3))));
    REQUIRE(f.index.get(id)->clip == basis(d.clip, 3));

    REQUIRE(f.index.upsert(id, EmbeddingField::Clip, std::nullopt));
    REQUIRE_FALSE(f.index.get(id)->clip.has_value());

    REQUIRE_FALSE(f.index.upsert(id + 100, EmbeddingField::Clip, FieldVector(basis(d.clip, 0))));
}

// ── Validation ───────────────────────────────────────────────────

TEST_CASE("JsonIndex: rejects wrong dimension", "[json_index]") {
    JsonFixture f;
    NoteRecord n = full_note("bad");
    n.clip = basis(small_dims().clip + 1, 0);
    REQUIRE_THROWS_AS(f.index.upsert(n), InvalidVectorError);
    REQUIRE(f.index.count() == 0);
}

TEST_CASE("JsonIndex: rejects non-normalized vectors", "[json_index]") {
    JsonFixture f;
    NoteRecord n = full_note("bad");
    Embedding v(small_dims().ocr_text, 0.5f);
    n.ocr_text_a = v;
    REQUIRE_THROWS_AS(f.index.upsert(n), InvalidVectorError);
    REQUIRE(f.index.count() == 0);
}

// ── Nearest neighbors ────────────────────────────────────────────

TEST_CASE("JsonIndex: nearest_neighbors ascending by distance", "[json_index]") {
    JsonFixture f;
    auto d = small_dims();
    NoteRecord far = full_note("far");
    far.clip = at_distance(d.clip, 0.6);
    NoteRecord near = full_note("near");
    near.clip = at_distance(d.clip, 0.1);
    NoteRecord none = full_note("none");
    none.clip.reset();

    NoteId far_id = f.index.upsert(far);
    NoteId near_id = f.index.upsert(near);
    f.index.upsert(none);

    auto hits = f.index.nearest_neighbors(EmbeddingField::Clip, basis(d.clip, 0), 10);
    REQUIRE(hits.size() == 2);
    REQUIRE(hits[0].id == near_id);
    REQUIRE(std::abs(hits[0].distance - 0.1) < 1e-5);
    REQUIRE(hits[1].id == far_id);
}

TEST_CASE("JsonIndex: nearest_neighbors honours k", "[json_index]") {
    JsonFixture f;
    for (int i = 0; i < 4; i++) f.index.upsert(full_note("n" + std::to_string(i)));
    auto q = basis(small_dims().visual, 0);
    REQUIRE(f.index.nearest_neighbors(EmbeddingField::Visual, q, 3).size() == 3);
    REQUIRE(f.index.nearest_neighbors(EmbeddingField::Visual, q, 0).empty());
}

TEST_CASE("JsonIndex: nearest_neighbors rejects query of wrong dimension", "[json_index]") {
    JsonFixture f;
    f.index.upsert(full_note("n"));
    REQUIRE_THROWS_AS(f.index.nearest_neighbors(EmbeddingField::Clip, basis(9, 0), 5),
                      InvalidVectorError);
}

// ── Persistence ──────────────────────────────────────────────────

TEST_CASE("JsonIndex: records survive reopening", "[json_index]") {
    std::string path = json_test_path();
    NoteId id = 0;
    {
        JsonIndex index(path);
        index.set_dimensions(small_dims());
        id = index.upsert(full_note("persisted"));
    }
    {
        JsonIndex index(path);
        index.set_dimensions(small_dims());
        auto note = index.get(id);
        REQUIRE(note.has_value());
        REQUIRE(note->title == "persisted");
        REQUIRE(note->ocr_text_b == basis(small_dims().ocr_text, 1));

        // Next id continues after the persisted ones
        NoteId next = index.upsert(full_note("next"));
        REQUIRE(next > id);
    }
    std::filesystem::remove(path);
}

TEST_CASE("JsonIndex: corrupt file starts empty", "[json_index]") {
    std::string path = json_test_path();
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    JsonIndex index(path);
    REQUIRE(index.count() == 0);
    std::filesystem::remove(path);
}

TEST_CASE("JsonIndex: empty path keeps everything in memory", "[json_index]") {
    JsonIndex index("");
    index.set_dimensions(small_dims());
    NoteId id = index.upsert(full_note("mem"));
    REQUIRE(index.get(id).has_value());
    REQUIRE(index.path().empty());
}

TEST_CASE("JsonIndex: write failure leaves the index unchanged", "[json_index]") {
    // A directory where the file should be makes the rename fail
    std::string path = json_test_path();
    std::filesystem::create_directories(path);
    std::filesystem::create_directories(path + "/occupied");
    {
        JsonIndex index(path);
        index.set_dimensions(small_dims());
        REQUIRE_THROWS_AS(index.upsert(full_note("lost")), std::runtime_error);
        REQUIRE(index.count() == 0);
    }
    std::filesystem::remove_all(path);
}

// ── Concurrency ──────────────────────────────────────────────────

TEST_CASE("JsonIndex: concurrent writers and readers", "[json_index]") {
    JsonIndex index("");
    index.set_dimensions(small_dims());

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; t++) {
        threads.emplace_back([&index, t]() {
            for (int i = 0; i < 10; i++) {
                index.upsert(full_note("t" + std::to_string(t) + "_" + std::to_string(i)));
                index.nearest_neighbors(EmbeddingField::Clip, basis(small_dims().clip, 1), 5);
            }
        });
    }
    for (auto& th : threads) th.join();

    REQUIRE(index.count() == 40);
    REQUIRE(index.count_with(EmbeddingField::Clip) == 40);
}

// ── Registry ─────────────────────────────────────────────────────

TEST_CASE("JsonIndex: created through the registry", "[json_index]") {
    Config cfg;
    cfg.index.backend = "json";
    cfg.index.path = json_test_path();
    cfg.dimensions = small_dims();

    auto index = create_vector_index(cfg);
    REQUIRE(index->backend_name() == "json");
    REQUIRE(index->dimensions().clip == small_dims().clip);
    std::filesystem::remove(cfg.index.path);
}
