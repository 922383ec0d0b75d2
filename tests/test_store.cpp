#include <gtest/gtest.h>
#include "../shared/cpp/chronicle/include/store.hpp"
#include "../shared/cpp/chronicle/include/util.hpp"
#include "test_support.hpp"

static ChunkRecord make_chunk(const std::string& source, int index, const std::string& text,
                              std::optional<std::vector<float>> vec = std::nullopt) {
    ChunkRecord c;
    c.source_path = source;
    c.chunk_index = index;
    c.text = text;
    c.fingerprint = content_fingerprint(text);
    c.vector = std::move(vec);
    c.metadata = {{"source", source}, {"chunk", index}};
    return c;
}

TEST(ChunkStore, InsertThenSkipDuplicateFingerprint) {
    TempDir dir;
    ChunkStore store(dir.file("semantic.db"));
    EXPECT_EQ(store.upsert(make_chunk("/a.md", 0, "shared paragraph"), false), UpsertResult::Inserted);
    EXPECT_EQ(store.upsert(make_chunk("/b.md", 3, "shared paragraph"), false), UpsertResult::Skipped);

    auto s = store.stats();
    EXPECT_EQ(s.total_chunks, 1);
    EXPECT_EQ(s.distinct_source_files, 1);

    auto rec = store.find(content_fingerprint("shared paragraph"));
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->source_path, "/a.md");
    EXPECT_EQ(rec->chunk_index, 0);
}

TEST(ChunkStore, ForceReplacesInPlace) {
    TempDir dir;
    ChunkStore store(dir.file("semantic.db"));
    auto first = make_chunk("/a.md", 0, "paragraph", std::vector<float>{1, 0});
    first.created_at = "2026-01-01T00:00:00.000000";
    ASSERT_EQ(store.upsert(first, false), UpsertResult::Inserted);
    auto id = store.find(first.fingerprint)->id;

    auto second = make_chunk("/b.md", 4, "paragraph", std::vector<float>{0, 1});
    second.created_at = "2026-02-02T00:00:00.000000";
    EXPECT_EQ(store.upsert(second, true), UpsertResult::Replaced);

    auto rec = store.find(first.fingerprint);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->id, id);
    EXPECT_EQ(rec->source_path, "/b.md");
    EXPECT_EQ(rec->chunk_index, 4);
    EXPECT_EQ(rec->created_at, "2026-02-02T00:00:00.000000");
    ASSERT_TRUE(rec->vector.has_value());
    EXPECT_EQ(*rec->vector, (std::vector<float>{0, 1}));
    EXPECT_EQ(rec->metadata["chunk"], 4);
    EXPECT_EQ(store.stats().total_chunks, 1);
}

TEST(ChunkStore, ForceOnNewFingerprintInserts) {
    TempDir dir;
    ChunkStore store(dir.file("semantic.db"));
    EXPECT_EQ(store.upsert(make_chunk("/a.md", 0, "brand new"), true), UpsertResult::Inserted);
    EXPECT_TRUE(store.contains(content_fingerprint("brand new")));
    EXPECT_FALSE(store.contains(content_fingerprint("never stored")));
}

TEST(ChunkStore, AllEmbeddedSkipsNullVectorsInInsertionOrder) {
    TempDir dir;
    ChunkStore store(dir.file("semantic.db"));
    store.upsert(make_chunk("/a.md", 0, "one", std::vector<float>{1, 2, 3}), false);
    store.upsert(make_chunk("/a.md", 1, "two"), false);
    store.upsert(make_chunk("/b.md", 0, "three", std::vector<float>{4, 5, 6}), false);

    auto rows = store.all_embedded();
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].text, "one");
    EXPECT_EQ(rows[0].vector, (std::vector<float>{1, 2, 3}));
    EXPECT_EQ(rows[1].text, "three");
    EXPECT_LT(rows[0].id, rows[1].id);

    auto s = store.stats();
    EXPECT_EQ(s.total_chunks, 3);
    EXPECT_EQ(s.distinct_source_files, 2);
}

TEST(ChunkStore, PersistsAcrossReopen) {
    TempDir dir;
    auto path = dir.file("nested/dir/semantic.db");
    {
        ChunkStore store(path);
        store.upsert(make_chunk("/a.md", 0, "durable", std::vector<float>{0.5f, 0.5f}), false);
    }
    ChunkStore reopened(path);
    auto rec = reopened.find(content_fingerprint("durable"));
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->metadata["source"], "/a.md");
    EXPECT_FALSE(rec->created_at.empty());
}

TEST(ChunkStore, TransactionRollsBackWithoutCommit) {
    TempDir dir;
    ChunkStore store(dir.file("semantic.db"));
    {
        ChunkStore::Transaction tx(store);
        store.upsert(make_chunk("/a.md", 0, "uncommitted"), false);
    }
    EXPECT_EQ(store.stats().total_chunks, 0);
    {
        ChunkStore::Transaction tx(store);
        store.upsert(make_chunk("/a.md", 0, "committed"), false);
        tx.commit();
    }
    EXPECT_EQ(store.stats().total_chunks, 1);
}

TEST(ChunkStore, UnopenablePathThrowsStoreError) {
    TempDir dir;
    auto blocker = dir.write("not-a-dir", "x");
    EXPECT_THROW(ChunkStore(blocker + "/semantic.db"), StoreError);
}
