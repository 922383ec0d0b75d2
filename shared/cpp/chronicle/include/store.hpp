#pragma once
#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <cstdint>
#include <nlohmann/json.hpp>

struct sqlite3;
struct sqlite3_stmt;

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct ChunkRecord {
    int64_t id{0}; // assigned on insert
    std::string source_path;
    int chunk_index{0};
    std::string text;
    std::string fingerprint;
    std::optional<std::vector<float>> vector; // absent in degraded mode
    std::string created_at;
    nlohmann::json metadata = nlohmann::json::object();
};

struct StoredVector {
    int64_t id{0};
    std::string source_path;
    std::string text;
    std::vector<float> vector;
};

struct StoreStats {
    int64_t total_chunks{0};
    int64_t distinct_source_files{0};
};

enum class UpsertResult { Inserted, Skipped, Replaced };

const char* to_string(UpsertResult r);

// Opens (or creates) the SQLite chunk table with a UNIQUE fingerprint column.
class ChunkStore {
public:
    static constexpr int kSchemaVersion = 1;

    explicit ChunkStore(const std::string& db_path);
    ~ChunkStore();
    ChunkStore(const ChunkStore&) = delete;
    ChunkStore& operator=(const ChunkStore&) = delete;

    UpsertResult upsert(const ChunkRecord& chunk, bool force);
    bool contains(const std::string& fingerprint);
    std::optional<ChunkRecord> find(const std::string& fingerprint);
    std::vector<StoredVector> all_embedded();
    StoreStats stats();

    const std::string& path() const { return db_path_; }

    // RAII BEGIN/COMMIT; rolls back unless commit() was called.
    class Transaction {
    public:
        explicit Transaction(ChunkStore& store);
        ~Transaction();
        void commit();
        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;
    private:
        ChunkStore& store_;
        bool done_{false};
    };

private:
    void init();
    void exec(const std::string& sql);
    void prepare_statements();
    void close_statements();
    void prepare(const char* sql, sqlite3_stmt** st);
    [[noreturn]] void fail(const std::string& what);

    std::string db_path_;
    struct sqlite3* db_ {nullptr};
    struct sqlite3_stmt* insert_stmt_ {nullptr};
    struct sqlite3_stmt* replace_stmt_ {nullptr};
    struct sqlite3_stmt* exists_stmt_ {nullptr};
    struct sqlite3_stmt* find_stmt_ {nullptr};
    struct sqlite3_stmt* embedded_stmt_ {nullptr};
    struct sqlite3_stmt* stats_stmt_ {nullptr};
};
