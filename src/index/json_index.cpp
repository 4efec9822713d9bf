#include "json_index.hpp"
#include "note_json.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <mutex>

static papernotes::IndexRegistrar reg_json("json",
    [](const papernotes::Config& config) {
        std::string path = config.index.path;
        if (path.empty()) {
            path = papernotes::expand_home("~/.papernotes/index.json");
        }
        return std::make_unique<papernotes::JsonIndex>(path);
    });

namespace papernotes {

JsonIndex::JsonIndex(const std::string& path) : path_(path) {
    load();
}

void JsonIndex::load() {
    if (path_.empty()) return;
    std::ifstream file(path_);
    if (!file.is_open()) return;

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            std::cerr << "[json_index] Unexpected layout in " << path_ << ", starting empty\n";
            return;
        }
        next_id_ = j.value("next_id", NoteId{1});
        if (j.contains("notes") && j["notes"].is_array()) {
            for (const auto& item : j["notes"]) {
                NoteRecord note = note_from_json(item);
                if (note.id == 0) continue;
                if (note.id >= next_id_) next_id_ = note.id + 1;
                notes_[note.id] = std::move(note);
            }
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[json_index] Corrupt index file " << path_ << " (" << e.what()
                  << "), starting empty\n";
        notes_.clear();
        next_id_ = 1;
    }
}

void JsonIndex::save() const {
    if (path_.empty()) return;
    nlohmann::json notes = nlohmann::json::array();
    for (const auto& [id, note] : notes_) {
        notes.push_back(note_to_json(note));
    }
    nlohmann::json j = {
        {"next_id", next_id_},
        {"notes", notes}
    };
    if (!atomic_write_file(path_, j.dump())) {
        throw std::runtime_error("Failed to write index file: " + path_);
    }
}

NoteId JsonIndex::upsert(const NoteRecord& record) {
    validate(record);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    NoteRecord stored = record;
    std::optional<NoteRecord> previous;
    NoteId saved_next = next_id_;

    auto it = notes_.find(record.id);
    if (record.id != 0 && it != notes_.end()) {
        previous = it->second;
        it->second = std::move(stored);
    } else {
        stored.id = next_id_++;
        it = notes_.emplace(stored.id, std::move(stored)).first;
    }
    NoteId id = it->first;

    try {
        save();
    } catch (const std::runtime_error&) {
        // Roll back so the failed write is not observable
        if (previous) {
            it->second = std::move(*previous);
        } else {
            notes_.erase(it);
            next_id_ = saved_next;
        }
        throw;
    }
    return id;
}

bool JsonIndex::upsert(NoteId id, EmbeddingField field, const FieldVector& vector) {
    validate(field, vector);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = notes_.find(id);
    if (it == notes_.end()) return false;

    NoteRecord previous = it->second;
    it->second.vector(field) = vector;
    it->second.timestamp = epoch_millis();
    try {
        save();
    } catch (const std::runtime_error&) {
        it->second = std::move(previous);
        throw;
    }
    return true;
}

std::vector<Neighbor> JsonIndex::nearest_neighbors(EmbeddingField field, const Embedding& query,
                                                   uint32_t k) {
    validate(field, FieldVector(query));
    if (k == 0) return {};

    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<Neighbor> candidates;
    for (const auto& [id, note] : notes_) {
        const auto& v = note.vector(field);
        if (!v) continue;
        candidates.push_back({id, cosine_distance(query, *v)});
    }
    lock.unlock();

    keep_nearest(candidates, k);
    return candidates;
}

std::optional<NoteRecord> JsonIndex::get(NoteId id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = notes_.find(id);
    if (it == notes_.end()) return std::nullopt;
    return it->second;
}

bool JsonIndex::remove(NoteId id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = notes_.find(id);
    if (it == notes_.end()) return false;

    NoteRecord previous = std::move(it->second);
    notes_.erase(it);
    try {
        save();
    } catch (const std::runtime_error&) {
        notes_[id] = std::move(previous);
        throw;
    }
    return true;
}

uint32_t JsonIndex::count() {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<uint32_t>(notes_.size());
}

uint32_t JsonIndex::count_with(EmbeddingField field) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    uint32_t n = 0;
    for (const auto& [id, note] : notes_) {
        if (note.vector(field)) n++;
    }
    return n;
}

} // namespace papernotes
