#pragma once
#include "store.hpp"
#include "embedder.hpp"
#include <string>
#include <vector>
#include <utility>

struct ChunkingOptions {
    int window_size{500};
    int overlap{50};
};

struct IndexFailure {
    std::string path;
    std::string error;
};

struct IndexReport {
    int written{0};   // chunks inserted or replaced
    int files{0};     // files visited
    bool degraded{false}; // no embedding provider: chunks stored without vectors
    std::vector<IndexFailure> failures;
};

struct SearchHit {
    std::string source_path;
    std::string text;
    float score{0.0f};
};

enum class SearchStatus { Ok, Unavailable };

struct SearchOutcome {
    SearchStatus status{SearchStatus::Ok};
    std::vector<SearchHit> hits;

    bool available() const { return status == SearchStatus::Ok; }
};

// Exhaustive cosine scan. Rows whose dimension differs from the query are
// skipped; ties keep row order; top_k <= 0 yields nothing.
std::vector<SearchHit> rank_by_cosine(const std::vector<float>& query,
                                      const std::vector<StoredVector>& rows,
                                      int top_k, float min_score);

// Chunking, dedup, embedding and retrieval over a ChunkStore.
// `embedder` may be null (degraded mode); it is not owned.
class SemanticIndex {
public:
    SemanticIndex(const std::string& db_path, EmbeddingProvider* embedder,
                  ChunkingOptions chunking = ChunkingOptions{});

    // Returns the number of chunks written (inserted or replaced).
    // Throws SourceNotFound, DecodeError or StoreError.
    int index_file(const std::string& path, bool force = false);

    // Recursively indexes files whose name matches `pattern`. Per-file
    // failures are recorded in the report and do not stop the walk.
    IndexReport index_directory(const std::string& root, const std::string& pattern = "*.md",
                                bool force = false);

    SearchOutcome search(const std::string& query, int top_k = 5, float min_score = 0.3f);

    StoreStats stats() { return store_.stats(); }
    bool degraded() const { return embedder_ == nullptr; }

    ChunkStore& store() { return store_; }

private:
    ChunkStore store_;
    EmbeddingProvider* embedder_;
    ChunkingOptions chunking_;
};
