#include <gtest/gtest.h>
#include "../shared/cpp/chronicle/include/memory.hpp"
#include "test_support.hpp"
#include <chrono>
#include <thread>

static void tick() {
    // timestamps carry microseconds; keep consecutive adds strictly ordered
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
}

TEST(MemoryId, SixteenHexCharsOfContentAndTimestamp) {
    auto id = memory_id("hello", "2026-01-01T00:00:00.000000");
    EXPECT_EQ(id.size(), 16u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);
    EXPECT_EQ(id, memory_id("hello", "2026-01-01T00:00:00.000000"));
    EXPECT_NE(id, memory_id("hello", "2026-01-01T00:00:00.000001"));
}

TEST(MemoryStore, AddAndSearchRoundTripsFields) {
    TempDir dir;
    MemoryStore store(dir.file("memory.db"));
    auto m = store.add("Decided to use SQLite for the cache", "claude", "chronicle",
                       {"decision", "storage"}, {{"file", "cache.cpp"}});
    EXPECT_EQ(m.id, memory_id(m.content, m.timestamp));

    auto found = store.search("sqlite");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].id, m.id);
    EXPECT_EQ(found[0].platform, "claude");
    EXPECT_EQ(found[0].project, "chronicle");
    EXPECT_EQ(found[0].tags, (std::vector<std::string>{"decision", "storage"}));
    EXPECT_EQ(found[0].context["file"], "cache.cpp");
    EXPECT_TRUE(store.search("postgres").empty());
}

TEST(MemoryStore, SearchTreatsWildcardsLiterally) {
    TempDir dir;
    MemoryStore store(dir.file("memory.db"));
    store.add("coverage reached 100% today");
    store.add("coverage reached 1000 lines");
    store.add("renamed snake_case helpers");
    store.add("renamed snakeXcase helpers");

    auto pct = store.search("100%");
    ASSERT_EQ(pct.size(), 1u);
    EXPECT_EQ(pct[0].content, "coverage reached 100% today");

    auto underscore = store.search("snake_case");
    ASSERT_EQ(underscore.size(), 1u);
    EXPECT_EQ(underscore[0].content, "renamed snake_case helpers");
}

TEST(MemoryStore, ContextIsNewestFirstAndLimited) {
    TempDir dir;
    MemoryStore store(dir.file("memory.db"));
    store.add("first");
    tick();
    store.add("second");
    tick();
    store.add("third");

    auto recent = store.context(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].content, "third");
    EXPECT_EQ(recent[1].content, "second");
    EXPECT_EQ(store.context().size(), 3u);
}

TEST(MemoryStore, RememberAndRecall) {
    TempDir dir;
    MemoryStore store(dir.file("memory.db"));
    store.remember("the deploy key lives in the vault", "slack", {"ops"});

    auto hits = store.recall("deploy key");
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].text, "the deploy key lives in the vault");
    EXPECT_EQ(hits[0].source, "slack");
    EXPECT_EQ(hits[0].tags, (std::vector<std::string>{"ops"}));
}

TEST(MemoryStore, AsksAreFilteredByQuestion) {
    TempDir dir;
    MemoryStore store(dir.file("memory.db"));
    auto m = store.add("uses port 7100");
    store.ask("Which port does the api use?", "7100", m.id);
    tick();
    store.ask("Where is the database?", "~/.chronicle/memory.db");

    auto all = store.get_asks();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].question, "Where is the database?");
    EXPECT_TRUE(all[0].memory_id.empty());
    EXPECT_EQ(all[1].memory_id, m.id);

    auto port = store.get_asks("port");
    ASSERT_EQ(port.size(), 1u);
    EXPECT_EQ(port[0].answer, "7100");
}

TEST(MemoryStore, StatsGroupByPlatformAndProject) {
    TempDir dir;
    MemoryStore store(dir.file("memory.db"));
    store.add("a", "claude", "alpha");
    store.add("b", "claude", "beta");
    store.add("c", "cli", "alpha");
    store.ask("q", "a");

    auto s = store.stats();
    EXPECT_EQ(s.total_memories, 3);
    EXPECT_EQ(s.total_asks, 1);
    EXPECT_EQ(s.platforms["claude"], 2);
    EXPECT_EQ(s.platforms["cli"], 1);
    EXPECT_EQ(s.projects["alpha"], 2);
    EXPECT_EQ(s.projects["beta"], 1);
    EXPECT_EQ(s.db_path, store.path());
}

TEST(MemoryStore, ToJsonCarriesAllFields) {
    Memory m;
    m.id = "abc";
    m.content = "text";
    m.timestamp = "2026-01-01T00:00:00.000000";
    m.tags = {"t"};
    nlohmann::json j = m;
    EXPECT_EQ(j["id"], "abc");
    EXPECT_EQ(j["platform"], "unknown");
    EXPECT_EQ(j["project"], "default");
    EXPECT_EQ(j["tags"][0], "t");
    EXPECT_TRUE(j["context"].is_object());
}
