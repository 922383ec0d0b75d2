#include "../include/config.hpp"
#include "../include/util.hpp"
#include <stdexcept>

static long parse_number(const std::string& v, const std::string& what) {
    try {
        size_t used = 0;
        long n = std::stol(v, &used);
        if (used != v.size()) throw std::invalid_argument(v);
        return n;
    } catch (const std::exception&) {
        throw std::invalid_argument(what + " is not a number: " + v);
    }
}

static long env_number(const char* key, long def) {
    std::string v = getenv_or(key, "");
    return v.empty() ? def : parse_number(v, key);
}

std::size_t parse_dimension(const std::string& value, const std::string& what) {
    long n = parse_number(value, what);
    if (n < 0) throw std::invalid_argument(what + " must not be negative");
    return (std::size_t)n;
}

ChronicleConfig load_config() {
    ChronicleConfig cfg;
    cfg.db_path = getenv_or("CHRONICLE_DB_PATH", cfg.db_path);
    cfg.semantic_db_path = getenv_or("CHRONICLE_SEMANTIC_DB", cfg.semantic_db_path);
    cfg.index_path = getenv_or("CHRONICLE_INDEX_PATH", cfg.index_path);
    cfg.embed.provider = getenv_or("CHRONICLE_EMBEDDER", cfg.embed.provider);
    cfg.embed.ollama_url = getenv_or("OLLAMA_URL", cfg.embed.ollama_url);
    cfg.embed.embed_model = getenv_or("CHRONICLE_EMBED_MODEL", cfg.embed.embed_model);
    std::string dim = getenv_or("CHRONICLE_EMBED_DIM", "");
    if (!dim.empty()) cfg.embed.dimension = parse_dimension(dim, "CHRONICLE_EMBED_DIM");
    cfg.chunking.window_size = (int)env_number("CHRONICLE_CHUNK_SIZE", cfg.chunking.window_size);
    cfg.chunking.overlap = (int)env_number("CHRONICLE_CHUNK_OVERLAP", cfg.chunking.overlap);
    cfg.api_port = (int)env_number("CHRONICLE_API_PORT", cfg.api_port);
    return cfg;
}

void resolve_paths(ChronicleConfig& cfg) {
    cfg.db_path = expand_home(cfg.db_path);
    cfg.semantic_db_path = expand_home(cfg.semantic_db_path);
    cfg.index_path = expand_home(cfg.index_path);
}
