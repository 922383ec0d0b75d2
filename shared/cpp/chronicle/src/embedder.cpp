#include "../include/embedder.hpp"
#include "../include/http.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cmath>
#include <cstdint>

using json = nlohmann::json;

static const char* kDimensionProbe = "chronicle dimension probe";

OllamaEmbedder::OllamaEmbedder(EmbedConfig cfg) : cfg_(std::move(cfg)), dim_(cfg_.dimension) {
    if (!cfg_.ollama_url.empty() && cfg_.ollama_url.back() == '/') cfg_.ollama_url.pop_back();
}

std::string OllamaEmbedder::name() const {
    return "ollama:" + cfg_.embed_model;
}

std::vector<float> OllamaEmbedder::embed(const std::string& text) {
    json body = {
        {"model", cfg_.embed_model},
        {"prompt", text}
    };
    HttpResponse r;
    try {
        r = http_post_json(cfg_.ollama_url + "/api/embeddings", body.dump(), cfg_.timeout_ms);
    } catch (const std::exception& e) {
        throw EmbeddingError(std::string("embedding request failed: ") + e.what());
    }
    if (r.status < 200 || r.status >= 300) {
        throw EmbeddingError("embedding failed: status " + std::to_string(r.status));
    }
    std::vector<float> vec;
    try {
        auto data = json::parse(r.body);
        for (auto& v : data.at("embedding")) vec.push_back(v.get<float>());
    } catch (const json::exception& e) {
        throw EmbeddingError(std::string("malformed embedding response: ") + e.what());
    }
    if (vec.empty()) throw EmbeddingError("empty embedding from model " + cfg_.embed_model);
    if (dim_ == 0) dim_ = vec.size();
    if (vec.size() != dim_) {
        throw EmbeddingError("embedding dimension " + std::to_string(vec.size()) +
                             " does not match expected " + std::to_string(dim_));
    }
    return vec;
}

std::size_t OllamaEmbedder::dimension() {
    if (dim_ == 0) embed(kDimensionProbe);
    return dim_;
}

HashingEmbedder::HashingEmbedder(std::size_t dimension) : dim_(dimension) {
    if (dim_ == 0) throw std::invalid_argument("hash embedder dimension must be positive");
}

std::string HashingEmbedder::name() const {
    return "hash:" + std::to_string(dim_);
}

static uint64_t fnv1a(const std::string& s) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}

std::vector<float> HashingEmbedder::embed(const std::string& text) {
    std::vector<float> v(dim_, 0.0f);
    std::string token;
    auto flush = [&]() {
        if (token.empty()) return;
        size_t idx = fnv1a(token) % dim_;
        v[idx] += 1.0f;
        v[(idx + dim_ - 1) % dim_] += 0.5f;
        v[(idx + 1) % dim_] += 0.5f;
        token.clear();
    };
    for (unsigned char c : text) {
        // bytes >= 0x80 belong to multi-byte UTF-8 sequences; keep them in the token
        if (std::isalnum(c) || c >= 0x80) token += (char)std::tolower(c);
        else flush();
    }
    flush();

    double norm = 0.0;
    for (float x : v) norm += (double)x * (double)x;
    if (norm > 0.0) {
        float inv = (float)(1.0 / std::sqrt(norm));
        for (auto& x : v) x *= inv;
    }
    return v;
}

std::unique_ptr<EmbeddingProvider> make_embedding_provider(const EmbedConfig& cfg) {
    if (cfg.provider == "none" || cfg.provider.empty()) return nullptr;
    if (cfg.provider == "ollama") return std::make_unique<OllamaEmbedder>(cfg);
    if (cfg.provider == "hash") return std::make_unique<HashingEmbedder>(cfg.dimension ? cfg.dimension : 384);
    throw std::invalid_argument("unknown embedding provider: " + cfg.provider);
}
