#include "../include/store.hpp"
#include "../include/util.hpp"
#include <sqlite3.h>
#include <cstring>
#include <iostream>

using json = nlohmann::json;

static void bind_text(sqlite3_stmt* st, int idx, const std::string& v) {
    sqlite3_bind_text(st, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
}

static void bind_vector(sqlite3_stmt* st, int idx, const std::optional<std::vector<float>>& v) {
    if (!v) {
        sqlite3_bind_null(st, idx);
        return;
    }
    sqlite3_bind_blob(st, idx, v->data(), (int)(v->size() * sizeof(float)), SQLITE_TRANSIENT);
}

static std::string column_text(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? std::string(reinterpret_cast<const char*>(t)) : std::string();
}

static std::vector<float> column_vector(sqlite3_stmt* st, int col) {
    const void* blob = sqlite3_column_blob(st, col);
    int bytes = sqlite3_column_bytes(st, col);
    std::vector<float> vec(bytes / (int)sizeof(float));
    if (blob && !vec.empty()) std::memcpy(vec.data(), blob, vec.size() * sizeof(float));
    return vec;
}

// Resets the statement on scope exit so early returns and throws leave it reusable.
namespace {
struct StmtReset {
    sqlite3_stmt* st;
    explicit StmtReset(sqlite3_stmt* s) : st(s) { sqlite3_reset(st); sqlite3_clear_bindings(st); }
    ~StmtReset() { sqlite3_reset(st); }
};
}

const char* to_string(UpsertResult r) {
    switch (r) {
        case UpsertResult::Inserted: return "inserted";
        case UpsertResult::Skipped: return "skipped";
        case UpsertResult::Replaced: return "replaced";
    }
    return "unknown";
}

ChunkStore::ChunkStore(const std::string& db_path) : db_path_(db_path) {
    if (db_path != ":memory:" && !ensure_parent_dir(db_path)) {
        throw StoreError("Failed to create directory for SQLite DB: " + db_path);
    }
    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open SQLite DB: " + db_path + ": " + msg);
    }
    try {
        init();
        prepare_statements();
    } catch (...) {
        close_statements();
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

ChunkStore::~ChunkStore() {
    close_statements();
    if (db_) sqlite3_close(db_);
}

void ChunkStore::fail(const std::string& what) {
    throw StoreError(what + ": " + sqlite3_errmsg(db_));
}

void ChunkStore::init() {
    exec("PRAGMA journal_mode=WAL;");
    exec("PRAGMA busy_timeout=5000;");

    int version = 0;
    {
        sqlite3_stmt* st = nullptr;
        prepare("PRAGMA user_version;", &st);
        if (sqlite3_step(st) == SQLITE_ROW) version = sqlite3_column_int(st, 0);
        sqlite3_finalize(st);
    }
    if (version > kSchemaVersion) {
        throw StoreError("chunk store schema version " + std::to_string(version) +
                         " is newer than supported version " + std::to_string(kSchemaVersion));
    }

    exec("CREATE TABLE IF NOT EXISTS chunks (\n"
         "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
         "  source_path TEXT NOT NULL,\n"
         "  chunk_index INTEGER NOT NULL,\n"
         "  text TEXT NOT NULL,\n"
         "  fingerprint TEXT NOT NULL UNIQUE,\n"
         "  vector BLOB,\n"
         "  created_at TEXT NOT NULL,\n"
         "  metadata TEXT NOT NULL DEFAULT '{}'\n"
         ");");
    exec("CREATE INDEX IF NOT EXISTS idx_chunks_source_path ON chunks(source_path);");
    exec("PRAGMA user_version = " + std::to_string(kSchemaVersion) + ";");
}

void ChunkStore::exec(const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw StoreError("SQLite error: " + msg);
    }
}

void ChunkStore::prepare(const char* sql, sqlite3_stmt** st) {
    if (sqlite3_prepare_v2(db_, sql, -1, st, nullptr) != SQLITE_OK) {
        fail(std::string("prepare failed (") + sql + ")");
    }
}

void ChunkStore::prepare_statements() {
    prepare("INSERT INTO chunks \n"
            "(source_path, chunk_index, text, fingerprint, vector, created_at, metadata) \n"
            "VALUES (?, ?, ?, ?, ?, ?, ?) \n"
            "ON CONFLICT(fingerprint) DO NOTHING;", &insert_stmt_);
    prepare("INSERT INTO chunks \n"
            "(source_path, chunk_index, text, fingerprint, vector, created_at, metadata) \n"
            "VALUES (?, ?, ?, ?, ?, ?, ?) \n"
            "ON CONFLICT(fingerprint) DO UPDATE SET \n"
            "  source_path = excluded.source_path, chunk_index = excluded.chunk_index, \n"
            "  text = excluded.text, vector = excluded.vector, \n"
            "  created_at = excluded.created_at, metadata = excluded.metadata;", &replace_stmt_);
    prepare("SELECT 1 FROM chunks WHERE fingerprint = ?;", &exists_stmt_);
    prepare("SELECT id, source_path, chunk_index, text, fingerprint, vector, created_at, metadata \n"
            "FROM chunks WHERE fingerprint = ?;", &find_stmt_);
    prepare("SELECT id, source_path, text, vector FROM chunks \n"
            "WHERE vector IS NOT NULL ORDER BY id;", &embedded_stmt_);
    prepare("SELECT COUNT(*), COUNT(DISTINCT source_path) FROM chunks;", &stats_stmt_);
}

void ChunkStore::close_statements() {
    sqlite3_stmt** all[] = {&insert_stmt_, &replace_stmt_, &exists_stmt_,
                            &find_stmt_, &embedded_stmt_, &stats_stmt_};
    for (auto** st : all) {
        if (*st) { sqlite3_finalize(*st); *st = nullptr; }
    }
}

UpsertResult ChunkStore::upsert(const ChunkRecord& c, bool force) {
    bool existed = force && contains(c.fingerprint);
    sqlite3_stmt* st = force ? replace_stmt_ : insert_stmt_;
    StmtReset guard(st);
    bind_text(st, 1, c.source_path);
    sqlite3_bind_int(st, 2, c.chunk_index);
    bind_text(st, 3, c.text);
    bind_text(st, 4, c.fingerprint);
    bind_vector(st, 5, c.vector);
    bind_text(st, 6, c.created_at.empty() ? now_iso8601() : c.created_at);
    bind_text(st, 7, c.metadata.dump());
    if (sqlite3_step(st) != SQLITE_DONE) {
        fail("upsert chunk failed");
    }
    if (force) return existed ? UpsertResult::Replaced : UpsertResult::Inserted;
    return sqlite3_changes(db_) > 0 ? UpsertResult::Inserted : UpsertResult::Skipped;
}

bool ChunkStore::contains(const std::string& fingerprint) {
    StmtReset guard(exists_stmt_);
    bind_text(exists_stmt_, 1, fingerprint);
    int rc = sqlite3_step(exists_stmt_);
    if (rc == SQLITE_ROW) return true;
    if (rc != SQLITE_DONE) fail("fingerprint lookup failed");
    return false;
}

std::optional<ChunkRecord> ChunkStore::find(const std::string& fingerprint) {
    StmtReset guard(find_stmt_);
    bind_text(find_stmt_, 1, fingerprint);
    int rc = sqlite3_step(find_stmt_);
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW) fail("chunk lookup failed");

    ChunkRecord c;
    c.id = sqlite3_column_int64(find_stmt_, 0);
    c.source_path = column_text(find_stmt_, 1);
    c.chunk_index = sqlite3_column_int(find_stmt_, 2);
    c.text = column_text(find_stmt_, 3);
    c.fingerprint = column_text(find_stmt_, 4);
    if (sqlite3_column_type(find_stmt_, 5) != SQLITE_NULL) c.vector = column_vector(find_stmt_, 5);
    c.created_at = column_text(find_stmt_, 6);
    c.metadata = json::parse(column_text(find_stmt_, 7), nullptr, false);
    if (c.metadata.is_discarded()) c.metadata = json::object();
    return c;
}

std::vector<StoredVector> ChunkStore::all_embedded() {
    std::vector<StoredVector> out;
    StmtReset guard(embedded_stmt_);
    int rc;
    while ((rc = sqlite3_step(embedded_stmt_)) == SQLITE_ROW) {
        StoredVector v;
        v.id = sqlite3_column_int64(embedded_stmt_, 0);
        v.source_path = column_text(embedded_stmt_, 1);
        v.text = column_text(embedded_stmt_, 2);
        v.vector = column_vector(embedded_stmt_, 3);
        out.push_back(std::move(v));
    }
    if (rc != SQLITE_DONE) fail("reading embedded chunks failed");
    return out;
}

StoreStats ChunkStore::stats() {
    StoreStats s;
    StmtReset guard(stats_stmt_);
    if (sqlite3_step(stats_stmt_) != SQLITE_ROW) fail("chunk stats failed");
    s.total_chunks = sqlite3_column_int64(stats_stmt_, 0);
    s.distinct_source_files = sqlite3_column_int64(stats_stmt_, 1);
    return s;
}

ChunkStore::Transaction::Transaction(ChunkStore& store) : store_(store) {
    store_.exec("BEGIN IMMEDIATE;");
}

ChunkStore::Transaction::~Transaction() {
    if (done_) return;
    char* err = nullptr;
    if (sqlite3_exec(store_.db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "[chronicle] ROLLBACK failed: " << (err ? err : "unknown") << "\n";
        sqlite3_free(err);
    }
}

void ChunkStore::Transaction::commit() {
    store_.exec("COMMIT;");
    done_ = true;
}
