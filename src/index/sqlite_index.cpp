#include "sqlite_index.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>

static papernotes::IndexRegistrar reg_sqlite("sqlite",
    [](const papernotes::Config& config) {
        std::string path = config.index.path;
        if (path.empty()) {
            path = papernotes::expand_home("~/.papernotes/index.db");
        }
        return std::make_unique<papernotes::SqliteIndex>(path);
    });

namespace papernotes {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

static void exec_or_throw(sqlite3* db, const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : sqlite3_errmsg(db);
        sqlite3_free(err);
        throw std::runtime_error(std::string("SqliteIndex: ") + msg);
    }
}

static void prepare_or_throw(sqlite3* db, const char* sql, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("SqliteIndex: prepare failed: ") +
                                 sqlite3_errmsg(db));
    }
}

static void step_done_or_throw(sqlite3* db, StmtGuard& g) {
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw std::runtime_error(std::string("SqliteIndex: write failed: ") +
                                 sqlite3_errmsg(db));
    }
}

static void bind_text(sqlite3_stmt* stmt, int col, const std::string& s) {
    sqlite3_bind_text(stmt, col, s.c_str(), -1, SQLITE_TRANSIENT);
}

static std::string column_text(sqlite3_stmt* stmt, int col) {
    if (auto* v = sqlite3_column_text(stmt, col)) return reinterpret_cast<const char*>(v);
    return {};
}

// Rolls back unless commit() was reached
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        exec_or_throw(db_, "BEGIN IMMEDIATE;");
    }
    ~Transaction() {
        if (!committed_) {
            if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
                std::cerr << "[sqlite_index] Rollback failed: " << sqlite3_errmsg(db_) << "\n";
            }
        }
    }
    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit() {
        exec_or_throw(db_, "COMMIT;");
        committed_ = true;
    }

private:
    sqlite3* db_;
    bool committed_ = false;
};

SqliteIndex::SqliteIndex(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteIndex: failed to open database: " + err);
    }

    // Performance pragmas
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA temp_store=MEMORY;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);

    try {
        init_schema();
    } catch (const std::runtime_error&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqliteIndex::~SqliteIndex() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteIndex::init_schema() {
    exec_or_throw(db_,
        "CREATE TABLE IF NOT EXISTS notes ("
        "  id          INTEGER PRIMARY KEY AUTOINCREMENT,"
        "  image_path  TEXT NOT NULL,"
        "  title       TEXT NOT NULL,"
        "  collection  TEXT,"
        "  ocr_a_text  TEXT NOT NULL DEFAULT '',"
        "  ocr_a_conf  REAL NOT NULL DEFAULT 0,"
        "  ocr_b_text  TEXT NOT NULL DEFAULT '',"
        "  ocr_b_conf  REAL NOT NULL DEFAULT 0,"
        "  timestamp   INTEGER NOT NULL"
        ");");

    exec_or_throw(db_,
        "CREATE TABLE IF NOT EXISTS note_vectors ("
        "  note_id  INTEGER NOT NULL REFERENCES notes(id) ON DELETE CASCADE,"
        "  field    TEXT NOT NULL,"
        "  vector   BLOB NOT NULL,"
        "  PRIMARY KEY (note_id, field)"
        ");");

    exec_or_throw(db_,
        "CREATE INDEX IF NOT EXISTS idx_note_vectors_field ON note_vectors(field);");
}

bool SqliteIndex::exists(NoteId id) {
    StmtGuard g;
    prepare_or_throw(db_, "SELECT 1 FROM notes WHERE id = ?;", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(id));
    return sqlite3_step(g.stmt) == SQLITE_ROW;
}

void SqliteIndex::write_vector(NoteId id, EmbeddingField field, const FieldVector& vector) {
    if (!vector) {
        StmtGuard g;
        prepare_or_throw(db_, "DELETE FROM note_vectors WHERE note_id = ? AND field = ?;", g);
        sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(id));
        bind_text(g.stmt, 2, field_to_string(field));
        step_done_or_throw(db_, g);
        return;
    }

    StmtGuard g;
    prepare_or_throw(db_,
        "INSERT INTO note_vectors (note_id, field, vector) VALUES (?, ?, ?) "
        "ON CONFLICT(note_id, field) DO UPDATE SET vector = excluded.vector;", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(id));
    bind_text(g.stmt, 2, field_to_string(field));
    std::string blob = serialize_vector(*vector);
    sqlite3_bind_blob(g.stmt, 3, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    step_done_or_throw(db_, g);
}

NoteId SqliteIndex::upsert(const NoteRecord& record) {
    validate(record);

    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);

    NoteId id = record.id;
    if (id != 0 && exists(id)) {
        StmtGuard g;
        prepare_or_throw(db_,
            "UPDATE notes SET image_path = ?, title = ?, collection = ?, "
            "ocr_a_text = ?, ocr_a_conf = ?, ocr_b_text = ?, ocr_b_conf = ?, timestamp = ? "
            "WHERE id = ?;", g);
        bind_text(g.stmt, 1, record.image_path);
        bind_text(g.stmt, 2, record.title);
        if (record.collection) bind_text(g.stmt, 3, *record.collection);
        else sqlite3_bind_null(g.stmt, 3);
        bind_text(g.stmt, 4, record.ocr_a.text);
        sqlite3_bind_double(g.stmt, 5, record.ocr_a.confidence);
        bind_text(g.stmt, 6, record.ocr_b.text);
        sqlite3_bind_double(g.stmt, 7, record.ocr_b.confidence);
        sqlite3_bind_int64(g.stmt, 8, static_cast<sqlite3_int64>(record.timestamp));
        sqlite3_bind_int64(g.stmt, 9, static_cast<sqlite3_int64>(id));
        step_done_or_throw(db_, g);
    } else {
        StmtGuard g;
        prepare_or_throw(db_,
            "INSERT INTO notes (image_path, title, collection, ocr_a_text, ocr_a_conf, "
            "ocr_b_text, ocr_b_conf, timestamp) VALUES (?, ?, ?, ?, ?, ?, ?, ?);", g);
        bind_text(g.stmt, 1, record.image_path);
        bind_text(g.stmt, 2, record.title);
        if (record.collection) bind_text(g.stmt, 3, *record.collection);
        else sqlite3_bind_null(g.stmt, 3);
        bind_text(g.stmt, 4, record.ocr_a.text);
        sqlite3_bind_double(g.stmt, 5, record.ocr_a.confidence);
        bind_text(g.stmt, 6, record.ocr_b.text);
        sqlite3_bind_double(g.stmt, 7, record.ocr_b.confidence);
        sqlite3_bind_int64(g.stmt, 8, static_cast<sqlite3_int64>(record.timestamp));
        step_done_or_throw(db_, g);
        id = static_cast<NoteId>(sqlite3_last_insert_rowid(db_));
    }

    for (auto f : kAllFields) {
        write_vector(id, f, record.vector(f));
    }

    tx.commit();
    return id;
}

bool SqliteIndex::upsert(NoteId id, EmbeddingField field, const FieldVector& vector) {
    validate(field, vector);

    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);
    if (!exists(id)) return false;

    write_vector(id, field, vector);

    StmtGuard g;
    prepare_or_throw(db_, "UPDATE notes SET timestamp = ? WHERE id = ?;", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(epoch_millis()));
    sqlite3_bind_int64(g.stmt, 2, static_cast<sqlite3_int64>(id));
    step_done_or_throw(db_, g);

    tx.commit();
    return true;
}

std::vector<Neighbor> SqliteIndex::nearest_neighbors(EmbeddingField field, const Embedding& query,
                                                     uint32_t k) {
    validate(field, FieldVector(query));
    if (k == 0) return {};

    std::vector<Neighbor> candidates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        StmtGuard g;
        prepare_or_throw(db_, "SELECT note_id, vector FROM note_vectors WHERE field = ?;", g);
        bind_text(g.stmt, 1, field_to_string(field));

        int rc = sqlite3_step(g.stmt);
        while (rc == SQLITE_ROW) {
            auto id = static_cast<NoteId>(sqlite3_column_int64(g.stmt, 0));
            const void* blob = sqlite3_column_blob(g.stmt, 1);
            int bytes = sqlite3_column_bytes(g.stmt, 1);
            Embedding stored = deserialize_vector(blob, static_cast<size_t>(bytes));
            if (!stored.empty()) {
                candidates.push_back({id, cosine_distance(query, stored)});
            }
            rc = sqlite3_step(g.stmt);
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(std::string("SqliteIndex: scan failed: ") +
                                     sqlite3_errmsg(db_));
        }
    }

    keep_nearest(candidates, k);
    return candidates;
}

std::optional<NoteRecord> SqliteIndex::get(NoteId id) {
    std::lock_guard<std::mutex> lock(mutex_);

    NoteRecord note;
    {
        StmtGuard g;
        prepare_or_throw(db_,
            "SELECT id, image_path, title, collection, ocr_a_text, ocr_a_conf, "
            "ocr_b_text, ocr_b_conf, timestamp FROM notes WHERE id = ?;", g);
        sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(id));
        if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;

        note.id = static_cast<NoteId>(sqlite3_column_int64(g.stmt, 0));
        note.image_path = column_text(g.stmt, 1);
        note.title = column_text(g.stmt, 2);
        if (sqlite3_column_type(g.stmt, 3) != SQLITE_NULL) {
            note.collection = column_text(g.stmt, 3);
        }
        note.ocr_a.text = column_text(g.stmt, 4);
        note.ocr_a.confidence = static_cast<float>(sqlite3_column_double(g.stmt, 5));
        note.ocr_b.text = column_text(g.stmt, 6);
        note.ocr_b.confidence = static_cast<float>(sqlite3_column_double(g.stmt, 7));
        note.timestamp = static_cast<uint64_t>(sqlite3_column_int64(g.stmt, 8));
    }

    StmtGuard g;
    prepare_or_throw(db_, "SELECT field, vector FROM note_vectors WHERE note_id = ?;", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(id));
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        std::string name = column_text(g.stmt, 0);
        const void* blob = sqlite3_column_blob(g.stmt, 1);
        int bytes = sqlite3_column_bytes(g.stmt, 1);
        Embedding v = deserialize_vector(blob, static_cast<size_t>(bytes));
        if (v.empty()) continue;
        try {
            note.vector(field_from_string(name)) = std::move(v);
        } catch (const std::invalid_argument& e) {
            std::cerr << "[sqlite_index] Skipping vector for note " << id << ": "
                      << e.what() << "\n";
        }
    }
    return note;
}

bool SqliteIndex::remove(NoteId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);
    {
        StmtGuard g;
        prepare_or_throw(db_, "DELETE FROM note_vectors WHERE note_id = ?;", g);
        sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(id));
        step_done_or_throw(db_, g);
    }
    StmtGuard g;
    prepare_or_throw(db_, "DELETE FROM notes WHERE id = ?;", g);
    sqlite3_bind_int64(g.stmt, 1, static_cast<sqlite3_int64>(id));
    step_done_or_throw(db_, g);
    bool removed = sqlite3_changes(db_) > 0;
    tx.commit();
    return removed;
}

uint32_t SqliteIndex::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare_or_throw(db_, "SELECT COUNT(*) FROM notes;", g);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
}

uint32_t SqliteIndex::count_with(EmbeddingField field) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    prepare_or_throw(db_, "SELECT COUNT(*) FROM note_vectors WHERE field = ?;", g);
    bind_text(g.stmt, 1, field_to_string(field));
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
}

} // namespace papernotes
