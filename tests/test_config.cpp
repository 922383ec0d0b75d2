#include <gtest/gtest.h>
#include "../shared/cpp/chronicle/include/config.hpp"
#include <cstdlib>

namespace {
const char* kVars[] = {
    "CHRONICLE_DB_PATH", "CHRONICLE_SEMANTIC_DB", "CHRONICLE_INDEX_PATH", "CHRONICLE_EMBEDDER",
    "OLLAMA_URL", "CHRONICLE_EMBED_MODEL", "CHRONICLE_EMBED_DIM", "CHRONICLE_CHUNK_SIZE",
    "CHRONICLE_CHUNK_OVERLAP", "CHRONICLE_API_PORT",
};

class ConfigEnv : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }
    static void clear() { for (auto* v : kVars) unsetenv(v); }
};
}

TEST_F(ConfigEnv, DefaultsWhenUnset) {
    auto cfg = load_config();
    EXPECT_EQ(cfg.db_path, "~/.chronicle/memory.db");
    EXPECT_EQ(cfg.semantic_db_path, "~/.chronicle/semantic.db");
    EXPECT_EQ(cfg.embed.provider, "ollama");
    EXPECT_EQ(cfg.embed.ollama_url, "http://localhost:11434");
    EXPECT_EQ(cfg.embed.embed_model, "all-minilm");
    EXPECT_EQ(cfg.embed.dimension, 0u);
    EXPECT_EQ(cfg.chunking.window_size, 500);
    EXPECT_EQ(cfg.chunking.overlap, 50);
    EXPECT_EQ(cfg.api_port, 7100);
}

TEST_F(ConfigEnv, EnvironmentOverridesDefaults) {
    setenv("CHRONICLE_DB_PATH", "/data/mem.db", 1);
    setenv("CHRONICLE_EMBEDDER", "hash", 1);
    setenv("CHRONICLE_EMBED_DIM", "128", 1);
    setenv("CHRONICLE_CHUNK_SIZE", "200", 1);
    setenv("CHRONICLE_CHUNK_OVERLAP", "20", 1);
    setenv("CHRONICLE_API_PORT", "8088", 1);
    auto cfg = load_config();
    EXPECT_EQ(cfg.db_path, "/data/mem.db");
    EXPECT_EQ(cfg.embed.provider, "hash");
    EXPECT_EQ(cfg.embed.dimension, 128u);
    EXPECT_EQ(cfg.chunking.window_size, 200);
    EXPECT_EQ(cfg.chunking.overlap, 20);
    EXPECT_EQ(cfg.api_port, 8088);
}

TEST_F(ConfigEnv, EmptyValueCountsAsUnset) {
    setenv("CHRONICLE_EMBEDDER", "", 1);
    EXPECT_EQ(load_config().embed.provider, "ollama");
}

TEST_F(ConfigEnv, MalformedNumberNamesVariable) {
    setenv("CHRONICLE_CHUNK_SIZE", "12abc", 1);
    try {
        load_config();
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("CHRONICLE_CHUNK_SIZE"), std::string::npos);
    }
    setenv("CHRONICLE_CHUNK_SIZE", "100", 1);
    setenv("CHRONICLE_EMBED_DIM", "-4", 1);
    EXPECT_THROW(load_config(), std::invalid_argument);
}

TEST(ParseDimension, AcceptsZeroAndPositive) {
    EXPECT_EQ(parse_dimension("0", "--embed-dim"), 0u);
    EXPECT_EQ(parse_dimension("768", "--embed-dim"), 768u);
}

TEST(ParseDimension, RejectsNegativeInsteadOfWrapping) {
    try {
        parse_dimension("-1", "--embed-dim");
        FAIL() << "expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("--embed-dim"), std::string::npos);
    }
    EXPECT_THROW(parse_dimension("12x", "--embed-dim"), std::invalid_argument);
    EXPECT_THROW(parse_dimension("", "--embed-dim"), std::invalid_argument);
}

TEST_F(ConfigEnv, ResolvePathsExpandsHome) {
    const char* home = std::getenv("HOME");
    if (!home || !*home) GTEST_SKIP() << "HOME not set";
    auto cfg = load_config();
    resolve_paths(cfg);
    EXPECT_EQ(cfg.db_path, std::string(home) + "/.chronicle/memory.db");
    EXPECT_EQ(cfg.index_path, std::string(home) + "/.chronicle/notes");
}
