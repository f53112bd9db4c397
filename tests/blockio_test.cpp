#include "gtest/gtest.h"
#include "test_helpers.h"
#include "utilities/blockio.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

// Helper function to create a vector of bytes with sequential values
std::vector<std::byte> create_byte_vector(size_t size) {
    std::vector<std::byte> vec(size);
    for (size_t i = 0; i < size; ++i) {
        vec[i] = std::byte(i % 256);
    }
    return vec;
}

TEST(BlockIOTest, IngestEmptyHashesLikeNoInput) {
    BlockIO bio;
    std::vector<std::byte> empty_data;
    bio.ingest(empty_data.data(), empty_data.size());
    bio.ingest(nullptr, 0);
    EXPECT_EQ(bio.finalize_hashed().hex,
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(BlockIOTest, SplitIngestMatchesSingleIngest) {
    auto a = create_byte_vector(10);
    auto b = create_byte_vector(20);
    std::vector<std::byte> joined(a);
    joined.insert(joined.end(), b.begin(), b.end());

    BlockIO split;
    split.ingest(a.data(), a.size());
    split.ingest(b.data(), b.size());
    BlockIO whole;
    whole.ingest(joined.data(), joined.size());
    EXPECT_EQ(split.finalize_hashed().digest, whole.finalize_hashed().digest);
}

TEST(BlockIOTest, FinalizeHashedEmpty) {
    BlockIO bio;
    DigestResult result = bio.finalize_hashed();
    EXPECT_EQ(result.hex, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(BlockIOTest, FinalizeHashedSingleChunk) {
    BlockIO bio;
    auto data = toBytes("test");
    bio.ingest(data.data(), data.size());
    DigestResult result = bio.finalize_hashed();
    EXPECT_EQ(result.hex, "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08");
}

TEST(BlockIOTest, FinalizeHashedMultipleChunks) {
    BlockIO bio;
    for (const char* part : {"Chunk1", "Chunk2", "Chunk3"}) {
        auto data = toBytes(part);
        bio.ingest(data.data(), data.size());
    }
    DigestResult result = bio.finalize_hashed();
    EXPECT_EQ(result.hex, "98794e6a0ceb6a747426ac1186cc54d79024b90aa7633b1b407a33d5d8143ca5");
    EXPECT_EQ(result.digest[0], 0x98);
}

TEST(BlockIOTest, FinalizeHashedStateManagement) {
    BlockIO bio;
    auto data = toBytes("initial data");
    bio.ingest(data.data(), data.size());
    bio.finalize_hashed();

    auto more = toBytes("more data");
    ASSERT_THROW(bio.ingest(more.data(), more.size()), std::logic_error);
    ASSERT_THROW(bio.finalize_hashed(), std::logic_error);
}

TEST(BlockIOTest, DecompressStreamRejectsGarbage) {
    std::istringstream junk("this is not a zstd frame");
    std::ostringstream out;
    BlockIO bio;
    EXPECT_THROW(bio.decompress_stream(junk, out), std::runtime_error);
}

TEST(BlockIOTest, DecompressStreamRejectsTruncatedFrame) {
    std::istringstream in(compressibleText(1000));
    std::ostringstream packed;
    BlockIO bio;
    bio.compress_stream(in, packed);
    std::string cut = packed.str().substr(0, packed.str().size() / 2);

    std::istringstream truncated(cut);
    std::ostringstream out;
    EXPECT_THROW(bio.decompress_stream(truncated, out), std::runtime_error);
}

TEST(BlockIOTest, CompressStreamLargerThanOneBuffer) {
    // Several MiB so the stream loop runs over multiple input buffers.
    std::string text = compressibleText(100000);
    std::istringstream in(text);
    std::ostringstream out;
    BlockIO bio;
    uint64_t written = bio.compress_stream(in, out);
    EXPECT_EQ(written, out.str().size());
    EXPECT_LT(written, text.size());

    std::istringstream packed(out.str());
    std::ostringstream restored;
    uint64_t restoredBytes = bio.decompress_stream(packed, restored);
    EXPECT_EQ(restoredBytes, text.size());
    EXPECT_EQ(restored.str(), text);
}

TEST(BlockIOTest, CompressStreamEmptyInput) {
    std::istringstream in("");
    std::ostringstream out;
    BlockIO bio;
    EXPECT_GT(bio.compress_stream(in, out), 0u); // frame header only

    std::istringstream packed(out.str());
    std::ostringstream restored;
    EXPECT_EQ(bio.decompress_stream(packed, restored), 0u);
    EXPECT_TRUE(restored.str().empty());
}

TEST(BlockIOTest, CompressionLevelIsKept) {
    EXPECT_EQ(BlockIO().compression_level(), 3);
    EXPECT_EQ(BlockIO(9).compression_level(), 9);
}
