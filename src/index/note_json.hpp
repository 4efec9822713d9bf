#pragma once
#include "../note.hpp"
#include <nlohmann/json.hpp>

namespace papernotes {

// JSON <-> NoteRecord conversion used by JsonIndex and the CLI `get` output.
// Absent vectors are written as null and read back as nullopt.

inline nlohmann::json vector_to_json(const FieldVector& v) {
    if (!v) return nullptr;
    return *v;
}

inline FieldVector vector_from_json(const nlohmann::json& item) {
    if (!item.is_array() || item.empty()) return std::nullopt;
    Embedding emb;
    emb.reserve(item.size());
    for (const auto& val : item) {
        if (!val.is_number()) return std::nullopt;
        emb.push_back(val.get<float>());
    }
    return emb;
}

inline NoteRecord note_from_json(const nlohmann::json& item) {
    NoteRecord note;
    note.id = item.value("id", NoteId{0});
    note.image_path = item.value("image_path", "");
    note.title = item.value("title", "");
    if (item.contains("collection") && item["collection"].is_string()) {
        note.collection = item["collection"].get<std::string>();
    }
    note.timestamp = item.value("timestamp", uint64_t{0});

    if (item.contains("ocr_a") && item["ocr_a"].is_object()) {
        note.ocr_a.text = item["ocr_a"].value("text", "");
        note.ocr_a.confidence = item["ocr_a"].value("confidence", 0.0f);
    }
    if (item.contains("ocr_b") && item["ocr_b"].is_object()) {
        note.ocr_b.text = item["ocr_b"].value("text", "");
        note.ocr_b.confidence = item["ocr_b"].value("confidence", 0.0f);
    }

    if (item.contains("vectors") && item["vectors"].is_object()) {
        const auto& vecs = item["vectors"];
        for (auto f : kAllFields) {
            auto name = field_to_string(f);
            if (vecs.contains(name)) note.vector(f) = vector_from_json(vecs[name]);
        }
    }
    return note;
}

inline nlohmann::json note_to_json(const NoteRecord& note, bool include_vectors = true) {
    nlohmann::json item = {
        {"id", note.id},
        {"image_path", note.image_path},
        {"title", note.title},
        {"timestamp", note.timestamp},
        {"ocr_a", {{"text", note.ocr_a.text}, {"confidence", note.ocr_a.confidence}}},
        {"ocr_b", {{"text", note.ocr_b.text}, {"confidence", note.ocr_b.confidence}}}
    };
    item["collection"] = note.collection ? nlohmann::json(*note.collection) : nlohmann::json(nullptr);

    nlohmann::json vecs = nlohmann::json::object();
    for (auto f : kAllFields) {
        const auto& v = note.vector(f);
        if (include_vectors) {
            vecs[field_to_string(f)] = vector_to_json(v);
        } else {
            // Summary form: dimension or null
            vecs[field_to_string(f)] = v ? nlohmann::json(v->size()) : nlohmann::json(nullptr);
        }
    }
    item["vectors"] = vecs;
    return item;
}

} // namespace papernotes
