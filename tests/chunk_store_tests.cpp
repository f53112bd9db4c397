#include "gtest/gtest.h"
#include "test_helpers.h"
#include "utilities/chunk_store.hpp"
#include "utilities/errors.h"
#include <filesystem>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace xferpress;

enum class StoreKind { Memory, Disk };

// Both staging implementations must behave identically.
class ChunkStoreTest : public ::testing::TestWithParam<StoreKind> {
protected:
    void SetUp() override {
        if (GetParam() == StoreKind::Memory) {
            store_ = std::make_unique<MemoryChunkStore>();
        } else {
            root_ = makeScratchDir("chunks");
            store_ = std::make_unique<DiskChunkStore>(root_);
        }
    }
    void TearDown() override {
        if (!root_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(root_, ec);
        }
    }

    std::filesystem::path root_;
    std::unique_ptr<ChunkStore> store_;
};

TEST_P(ChunkStoreTest, PutAndReadBack) {
    store_->put("up1", 0, toBytes("hello"));
    EXPECT_EQ(bytesToString(store_->read("up1", 0)), "hello");
    auto chunks = store_->listOrdered("up1");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].index, 0u);
    EXPECT_EQ(chunks[0].sizeBytes, 5u);
}

TEST_P(ChunkStoreTest, ListOrderedIsNumeric) {
    // Inserted out of order; "10" must come after "9", not after "1".
    for (uint32_t i : {10u, 2u, 9u, 0u, 1u, 11u}) {
        store_->put("up", i, toBytes(std::to_string(i)));
    }
    auto chunks = store_->listOrdered("up");
    std::vector<uint32_t> indices;
    for (const auto& c : chunks) indices.push_back(c.index);
    EXPECT_EQ(indices, (std::vector<uint32_t>{0, 1, 2, 9, 10, 11}));
}

TEST_P(ChunkStoreTest, OverwriteReplacesContent) {
    store_->put("up", 3, toBytes("first"));
    store_->put("up", 3, toBytes("second attempt"));
    auto chunks = store_->listOrdered("up");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].sizeBytes, 14u);
    EXPECT_EQ(bytesToString(store_->read("up", 3)), "second attempt");
}

TEST_P(ChunkStoreTest, UnknownUploadListsEmpty) {
    EXPECT_TRUE(store_->listOrdered("nobody").empty());
}

TEST_P(ChunkStoreTest, RemoveIsNoOpWhenAbsent) {
    EXPECT_NO_THROW(store_->remove("nobody", 7));
    store_->put("up", 0, toBytes("a"));
    store_->put("up", 1, toBytes("b"));
    store_->remove("up", 0);
    EXPECT_NO_THROW(store_->remove("up", 0));
    auto chunks = store_->listOrdered("up");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].index, 1u);
}

TEST_P(ChunkStoreTest, ReadMissingChunkThrows) {
    store_->put("up", 0, toBytes("a"));
    EXPECT_THROW(store_->read("up", 1), CompletenessError);
    EXPECT_THROW(store_->read("other", 0), CompletenessError);
}

TEST_P(ChunkStoreTest, UploadsAreIsolated) {
    store_->put("a", 0, toBytes("from a"));
    store_->put("b", 0, toBytes("from b"));
    EXPECT_EQ(bytesToString(store_->read("a", 0)), "from a");
    EXPECT_EQ(bytesToString(store_->read("b", 0)), "from b");
    store_->remove("a", 0);
    EXPECT_EQ(store_->listOrdered("b").size(), 1u);
}

TEST_P(ChunkStoreTest, ConcurrentPutsForDistinctIndices) {
    const uint32_t total = 32;
    std::vector<std::thread> threads;
    for (uint32_t i = 0; i < total; ++i) {
        threads.emplace_back([this, i]() {
            store_->put("parallel", i, toBytes("chunk-" + std::to_string(i)));
        });
    }
    for (auto& t : threads) t.join();
    auto chunks = store_->listOrdered("parallel");
    ASSERT_EQ(chunks.size(), total);
    for (uint32_t i = 0; i < total; ++i) {
        EXPECT_EQ(chunks[i].index, i);
        EXPECT_EQ(bytesToString(store_->read("parallel", i)),
                  "chunk-" + std::to_string(i));
    }
}

TEST_P(ChunkStoreTest, ManifestRoundTrip) {
    EXPECT_FALSE(store_->readManifest("up").has_value());
    store_->putManifest("up", UploadManifest{3, "report.pdf"});
    auto m = store_->readManifest("up");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->total, 3u);
    EXPECT_EQ(m->filename, "report.pdf");
    EXPECT_FALSE(store_->readManifest("other").has_value());

    store_->removeManifest("up");
    EXPECT_FALSE(store_->readManifest("up").has_value());
    EXPECT_NO_THROW(store_->removeManifest("up"));
}

TEST_P(ChunkStoreTest, ManifestOutlivesChunkRemoval) {
    store_->putManifest("up", UploadManifest{1, "a.txt"});
    store_->put("up", 0, toBytes("a"));
    store_->remove("up", 0);
    ASSERT_TRUE(store_->readManifest("up").has_value());
    EXPECT_TRUE(store_->listOrdered("up").empty());
}

INSTANTIATE_TEST_SUITE_P(Stores, ChunkStoreTest,
                         ::testing::Values(StoreKind::Memory, StoreKind::Disk));

TEST(DiskChunkStoreTest, UploadIdWithSeparatorsStaysUnderRoot) {
    auto root = makeScratchDir("chunks_sep");
    DiskChunkStore store(root);
    store.put("../../escape", 0, toBytes("x"));
    size_t entries = 0;
    for (const auto& e : std::filesystem::directory_iterator(root)) {
        (void)e;
        ++entries;
    }
    EXPECT_EQ(entries, 1u);
    EXPECT_EQ(store.listOrdered("../../escape").size(), 1u);
    std::filesystem::remove_all(root);
}

TEST(DiskChunkStoreTest, IgnoresForeignAndTemporaryFiles) {
    auto root = makeScratchDir("chunks_foreign");
    DiskChunkStore store(root);
    store.put("up", 0, toBytes("real"));
    auto dir = root / hexEncode("up");
    writeFileContents(dir / "1.chunk.deadbeef.tmp", "partial");
    writeFileContents(dir / "notes.txt", "junk");
    writeFileContents(dir / "abc.chunk", "junk");
    auto chunks = store.listOrdered("up");
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0].index, 0u);
    std::filesystem::remove_all(root);
}

TEST(DiskChunkStoreTest, RemovingLastChunkDropsUploadDirectory) {
    auto root = makeScratchDir("chunks_drop");
    DiskChunkStore store(root);
    store.put("up", 0, toBytes("a"));
    EXPECT_TRUE(std::filesystem::exists(root / hexEncode("up")));
    store.remove("up", 0);
    EXPECT_FALSE(std::filesystem::exists(root / hexEncode("up")));
    std::filesystem::remove_all(root);
}

TEST(DiskChunkStoreTest, UnwritableRootRaisesStorageWriteError) {
    auto scratch = makeScratchDir("chunks_bad");
    // A regular file where the staging root should be.
    auto root = scratch / "not_a_dir";
    writeFileContents(root, "occupied");
    DiskChunkStore store(root);
    EXPECT_THROW(store.put("up", 0, toBytes("a")), StorageWriteError);
    std::filesystem::remove_all(scratch);
}

TEST(DiskChunkStoreTest, ManifestSurvivesNewInstance) {
    auto root = makeScratchDir("chunks_manifest");
    {
        DiskChunkStore store(root);
        store.putManifest("up", UploadManifest{4, "clip.mp4"});
    }
    DiskChunkStore reopened(root);
    auto m = reopened.readManifest("up");
    ASSERT_TRUE(m.has_value());
    EXPECT_EQ(m->total, 4u);
    EXPECT_EQ(m->filename, "clip.mp4");
    // The manifest is not mistaken for a chunk.
    EXPECT_TRUE(reopened.listOrdered("up").empty());

    reopened.removeManifest("up");
    EXPECT_FALSE(std::filesystem::exists(root / hexEncode("up")));
    std::filesystem::remove_all(root);
}

TEST(DiskChunkStoreTest, CorruptManifestReadsAsAbsent) {
    auto root = makeScratchDir("chunks_manifest_bad");
    DiskChunkStore store(root);
    store.put("up", 0, toBytes("a"));
    writeFileContents(root / hexEncode("up") / "manifest.json", "{\"total\":");
    EXPECT_FALSE(store.readManifest("up").has_value());
    writeFileContents(root / hexEncode("up") / "manifest.json",
                      "{\"total\":0,\"filename\":\"a\"}");
    EXPECT_FALSE(store.readManifest("up").has_value());
    std::filesystem::remove_all(root);
}
