#pragma once
#include <string>
#include <vector>
#include <memory>
#include <stdexcept>
#include <cstddef>

struct EmbedConfig {
    std::string provider{"ollama"}; // ollama | hash | none
    std::string ollama_url{"http://localhost:11434"};
    std::string embed_model{"all-minilm"};
    std::size_t dimension{0}; // 0 = probe the server (ollama) / 384 (hash)
    int timeout_ms{120000};
};

class EmbeddingError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Maps text to a fixed-length vector. Owned by the caller and passed into
// SemanticIndex; a null provider means semantic search is unavailable.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;
    virtual std::string name() const = 0;
    virtual std::vector<float> embed(const std::string& text) = 0;
    virtual std::size_t dimension() = 0;
};

class OllamaEmbedder : public EmbeddingProvider {
public:
    explicit OllamaEmbedder(EmbedConfig cfg);
    std::string name() const override;
    std::vector<float> embed(const std::string& text) override;
    std::size_t dimension() override;

private:
    EmbedConfig cfg_;
    std::size_t dim_{0};
};

// Feature-hashing embedder: deterministic, offline, no model download.
class HashingEmbedder : public EmbeddingProvider {
public:
    explicit HashingEmbedder(std::size_t dimension = 384);
    std::string name() const override;
    std::vector<float> embed(const std::string& text) override;
    std::size_t dimension() override { return dim_; }

private:
    std::size_t dim_;
};

// Returns nullptr for provider "none". Throws std::invalid_argument on an unknown kind.
std::unique_ptr<EmbeddingProvider> make_embedding_provider(const EmbedConfig& cfg);
