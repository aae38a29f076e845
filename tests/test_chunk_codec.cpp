#include <gtest/gtest.h>
#include "chunk_codec.hpp"
#include "roomcast/codec_utils.hpp"
#include "roomcast/errors.hpp"

using namespace roomcast;

namespace {

std::string patterned_bytes(size_t size) {
    std::string bytes(size, '\0');
    for (size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<char>((i * 31 + 7) % 251);
    }
    return bytes;
}

} // namespace

TEST(ChunkCodecTest, SplitsIntoFixedSizeChunksWithShortTail) {
    ChunkCodec codec;
    Manifest manifest = codec.split("file-1", patterned_bytes(150000));

    EXPECT_EQ(manifest.file_id, "file-1");
    EXPECT_EQ(manifest.chunk_size, 65536u);
    EXPECT_EQ(manifest.total_size, 150000u);
    ASSERT_EQ(manifest.chunks.size(), 3u);
    EXPECT_EQ(manifest.chunks[0].size, 65536u);
    EXPECT_EQ(manifest.chunks[1].size, 65536u);
    EXPECT_EQ(manifest.chunks[2].size, 18928u);
    EXPECT_EQ(manifest.chunks[1].offset, 65536u);
    EXPECT_EQ(manifest.chunks[2].offset, 131072u);
}

TEST(ChunkCodecTest, ChunkCountIsCeilingOfSize) {
    ChunkCodec codec;
    for (size_t size : {size_t(1), size_t(65535), size_t(65536), size_t(65537), size_t(131072), size_t(200001)}) {
        Manifest manifest = codec.split("f", patterned_bytes(size));
        EXPECT_EQ(manifest.chunks.size(), (size + CHUNK_SIZE - 1) / CHUNK_SIZE) << "size " << size;

        uint64_t total = 0;
        uint64_t expected_offset = 0;
        for (size_t i = 0; i < manifest.chunks.size(); ++i) {
            EXPECT_EQ(manifest.chunks[i].index, i);
            EXPECT_EQ(manifest.chunks[i].offset, expected_offset);
            expected_offset += manifest.chunks[i].size;
            total += manifest.chunks[i].size;
        }
        EXPECT_EQ(total, size);
        EXPECT_TRUE(codec.is_well_formed(manifest));
    }
}

TEST(ChunkCodecTest, EmptyInputHasNoChunks) {
    ChunkCodec codec;
    Manifest manifest = codec.split("empty", "");
    EXPECT_EQ(manifest.total_size, 0u);
    EXPECT_TRUE(manifest.chunks.empty());
}

TEST(ChunkCodecTest, HashesAreDeterministicSha256OfEachSlice) {
    ChunkCodec codec;
    std::string bytes = patterned_bytes(70000);
    Manifest first = codec.split("f", bytes);
    Manifest second = codec.split("f", bytes);

    ASSERT_EQ(first.chunks.size(), 2u);
    for (size_t i = 0; i < first.chunks.size(); ++i) {
        EXPECT_EQ(first.chunks[i].hash, second.chunks[i].hash);
        EXPECT_EQ(first.chunks[i].hash.size(), 64u);
    }
    EXPECT_EQ(first.chunks[0].hash, codec::sha256_hex(bytes.substr(0, 65536)));
    EXPECT_EQ(first.chunks[1].hash, codec::sha256_hex(bytes.substr(65536)));
}

TEST(ChunkCodecTest, ReadAndVerifyChunk) {
    ChunkCodec codec;
    std::string bytes = patterned_bytes(100000);
    Manifest manifest = codec.split("f", bytes);

    std::string tail = codec.read_chunk(bytes, manifest.chunks[1]);
    EXPECT_EQ(tail.size(), 100000u - 65536u);
    EXPECT_TRUE(codec.verify_chunk(manifest.chunks[1], tail));

    tail[0] ^= 0x01;
    EXPECT_FALSE(codec.verify_chunk(manifest.chunks[1], tail));
    EXPECT_FALSE(codec.verify_chunk(manifest.chunks[0], tail));
}

TEST(ChunkCodecTest, ReadChunkOutsideContentIsCorruption) {
    ChunkCodec codec;
    std::string bytes = patterned_bytes(1000);
    Chunk chunk;
    chunk.index = 0;
    chunk.offset = 900;
    chunk.size = 200;
    EXPECT_THROW(codec.read_chunk(bytes, chunk), CorruptRecordError);
}

TEST(ChunkCodecTest, DetectsMalformedManifests) {
    ChunkCodec codec;
    Manifest manifest = codec.split("f", patterned_bytes(140000));

    Manifest gap = manifest;
    gap.chunks[1].offset += 1;
    EXPECT_FALSE(codec.is_well_formed(gap));

    Manifest wrong_total = manifest;
    wrong_total.total_size += 1;
    EXPECT_FALSE(codec.is_well_formed(wrong_total));

    Manifest reordered = manifest;
    std::swap(reordered.chunks[0], reordered.chunks[1]);
    EXPECT_FALSE(codec.is_well_formed(reordered));
}

TEST(ChunkCodecTest, ContentHashCoversWholeBuffer) {
    ChunkCodec codec;
    EXPECT_EQ(codec.content_hash("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
