#include "../include/semantic.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

std::vector<SearchHit> rank_by_cosine(const std::vector<float>& query,
                                      const std::vector<StoredVector>& rows,
                                      int top_k, float min_score) {
    std::vector<SearchHit> out;
    if (top_k <= 0) return out;
    size_t mismatched = 0;
    for (const auto& row : rows) {
        if (row.vector.size() != query.size()) { ++mismatched; continue; }
        float score = cosine_similarity(query, row.vector);
        if (score >= min_score) out.push_back({row.source_path, row.text, score});
    }
    if (mismatched) {
        std::cerr << "[chronicle] Skipped " << mismatched
                  << " chunks embedded with a different dimension; re-index with --force\n";
    }
    std::stable_sort(out.begin(), out.end(),
                     [](const SearchHit& a, const SearchHit& b){ return a.score > b.score; });
    if ((int)out.size() > top_k) out.resize(top_k);
    return out;
}

SemanticIndex::SemanticIndex(const std::string& db_path, EmbeddingProvider* embedder,
                             ChunkingOptions chunking)
    : store_(db_path), embedder_(embedder), chunking_(chunking) {
    if (chunking_.window_size <= 0 || chunking_.overlap < 0 ||
        chunking_.overlap >= chunking_.window_size) {
        throw std::invalid_argument("invalid chunking: overlap must be in [0, window_size)");
    }
}

int SemanticIndex::index_file(const std::string& path, bool force) {
    std::filesystem::path p(expand_home(path));
    std::error_code ec;
    if (!std::filesystem::exists(p, ec)) throw SourceNotFound(p.string());
    auto abs = std::filesystem::absolute(p, ec);
    if (!ec) p = abs.lexically_normal();

    auto text = read_text_file(p);
    // text with no words comes back as one verbatim chunk
    auto parts = chunk_words(text, chunking_.window_size, chunking_.overlap);
    const std::string source = p.string();

    int written = 0;
    ChunkStore::Transaction tx(store_);
    for (size_t i = 0; i < parts.size(); ++i) {
        ChunkRecord rec;
        rec.fingerprint = content_fingerprint(parts[i]);
        if (!force && store_.contains(rec.fingerprint)) continue;

        rec.source_path = source;
        rec.chunk_index = (int)i;
        rec.text = parts[i];
        if (embedder_) rec.vector = embedder_->embed(rec.text);
        rec.created_at = now_iso8601();
        rec.metadata = {{"source", source}, {"chunk", (int)i}};
        if (embedder_) rec.metadata["embedder"] = embedder_->name();

        if (store_.upsert(rec, force) != UpsertResult::Skipped) ++written;
    }
    tx.commit();
    return written;
}

IndexReport SemanticIndex::index_directory(const std::string& root, const std::string& pattern,
                                           bool force) {
    IndexReport report;
    report.degraded = degraded();
    auto files = list_files(std::filesystem::path(expand_home(root)), pattern);
    for (const auto& f : files) {
        ++report.files;
        try {
            int count = index_file(f.string(), force);
            if (count > 0) {
                std::cout << "[chronicle] Indexed " << f.filename().string() << ": " << count << " chunks\n";
            }
            report.written += count;
        } catch (const std::exception& e) {
            std::cerr << "[chronicle] Failed to index " << f.string() << ": " << e.what() << "\n";
            report.failures.push_back({f.string(), e.what()});
        }
    }
    return report;
}

SearchOutcome SemanticIndex::search(const std::string& query, int top_k, float min_score) {
    SearchOutcome outcome;
    if (!embedder_) {
        outcome.status = SearchStatus::Unavailable;
        return outcome;
    }
    auto qvec = embedder_->embed(query);
    outcome.hits = rank_by_cosine(qvec, store_.all_embedded(), top_k, min_score);
    return outcome;
}
