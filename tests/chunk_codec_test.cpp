/**
 * @file chunk_codec_test.cpp
 * @brief Unit tests for ChunkCodec splitting, reassembly and progress math
 */

#include "peerdrop/ChunkCodec.h"
#include "peerdrop/config.h"
#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

using namespace PeerDrop;

namespace {

std::vector<uint8_t> makeBytes(size_t size) {
    std::vector<uint8_t> bytes(size);
    for (size_t i = 0; i < size; ++i) {
        bytes[i] = static_cast<uint8_t>((i * 31 + 7) & 0xFF);
    }
    return bytes;
}

ChunkCodec::Slots toSlots(const ChunkSequence& sequence) {
    ChunkCodec::Slots slots(sequence.totalChunks());
    for (const ChunkSlice& slice : sequence) {
        slots[slice.chunkIndex] = slice.toVector();
    }
    return slots;
}

} // anonymous namespace

//=============================================================================
// totalChunks
//=============================================================================

TEST(ChunkCodecTest, TotalChunksIsCeilingOfSizeOverChunkSize) {
    EXPECT_EQ(ChunkCodec::totalChunks(0), 0u);
    EXPECT_EQ(ChunkCodec::totalChunks(1), 1u);
    EXPECT_EQ(ChunkCodec::totalChunks(CHUNK_SIZE), 1u);
    EXPECT_EQ(ChunkCodec::totalChunks(CHUNK_SIZE + 1), 2u);
    EXPECT_EQ(ChunkCodec::totalChunks(50000), 4u);
    EXPECT_EQ(ChunkCodec::totalChunks(10, 3), 4u);
}

TEST(ChunkCodecTest, ZeroChunkSizeIsRejected) {
    std::vector<uint8_t> bytes = makeBytes(10);
    EXPECT_THROW(ChunkCodec::totalChunks(10, 0), std::invalid_argument);
    EXPECT_THROW(ChunkCodec::split(bytes, 0), std::invalid_argument);
}

//=============================================================================
// split
//=============================================================================

TEST(ChunkCodecTest, SplitYieldsOrderedSlicesWithShortLastChunk) {
    const auto bytes = makeBytes(50000);
    const ChunkSequence chunks = ChunkCodec::split(bytes);

    ASSERT_EQ(chunks.totalChunks(), 4u);

    uint32_t expectedIndex = 0;
    size_t offset = 0;
    for (const ChunkSlice& slice : chunks) {
        EXPECT_EQ(slice.chunkIndex, expectedIndex);
        EXPECT_EQ(slice.data, bytes.data() + offset);
        offset += slice.size;
        ++expectedIndex;
    }
    EXPECT_EQ(expectedIndex, 4u);
    EXPECT_EQ(offset, bytes.size());
    EXPECT_EQ(chunks.at(0).size, CHUNK_SIZE);
    EXPECT_EQ(chunks.at(3).size, 50000 - 3 * CHUNK_SIZE);
}

TEST(ChunkCodecTest, SplitOfEmptyInputIsEmpty) {
    const std::vector<uint8_t> empty;
    const ChunkSequence chunks = ChunkCodec::split(empty);

    EXPECT_EQ(chunks.totalChunks(), 0u);
    EXPECT_TRUE(chunks.begin() == chunks.end());
}

TEST(ChunkCodecTest, SplitIsDeterministic) {
    const auto bytes = makeBytes(40000);
    const auto first = toSlots(ChunkCodec::split(bytes, 4096));
    const auto second = toSlots(ChunkCodec::split(bytes, 4096));
    EXPECT_EQ(first, second);
}

TEST(ChunkCodecTest, AtOutOfRangeThrows) {
    const auto bytes = makeBytes(100);
    const ChunkSequence chunks = ChunkCodec::split(bytes, 64);
    EXPECT_THROW(chunks.at(2), std::out_of_range);
}

//=============================================================================
// reassemble
//=============================================================================

TEST(ChunkCodecTest, ReassembleInvertsSplitForVariousSizes) {
    const size_t sizes[] = {1, 2, 63, 64, 65, 1000, CHUNK_SIZE, CHUNK_SIZE * 3 + 17};
    const size_t chunkSizes[] = {1, 7, 64, CHUNK_SIZE};

    for (size_t size : sizes) {
        for (size_t chunkSize : chunkSizes) {
            const auto bytes = makeBytes(size);
            const ChunkSequence chunks = ChunkCodec::split(bytes, chunkSize);

            std::vector<uint8_t> out;
            ErrorInfo error;
            ASSERT_TRUE(ChunkCodec::reassemble(toSlots(chunks), chunks.totalChunks(), out, error))
                << "size=" << size << " chunkSize=" << chunkSize << ": " << error.toString();
            EXPECT_EQ(out, bytes) << "size=" << size << " chunkSize=" << chunkSize;
        }
    }
}

TEST(ChunkCodecTest, ReassembleFailsOnMissingSlot) {
    const auto bytes = makeBytes(300);
    auto slots = toSlots(ChunkCodec::split(bytes, 100));
    slots[1].reset();

    std::vector<uint8_t> out = {0xAA};
    ErrorInfo error;
    EXPECT_FALSE(ChunkCodec::reassemble(slots, 3, out, error));
    EXPECT_EQ(error.kind, ErrorKind::INCOMPLETE_TRANSFER);
    // Output untouched on failure
    EXPECT_EQ(out, std::vector<uint8_t>{0xAA});
}

TEST(ChunkCodecTest, ReassembleFailsWhenTooFewSlots) {
    ChunkCodec::Slots slots(2, std::vector<uint8_t>{1, 2});

    std::vector<uint8_t> out;
    ErrorInfo error;
    EXPECT_FALSE(ChunkCodec::reassemble(slots, 3, out, error));
    EXPECT_EQ(error.kind, ErrorKind::INCOMPLETE_TRANSFER);
}

TEST(ChunkCodecTest, ReassembleOfZeroChunksIsEmpty) {
    std::vector<uint8_t> out = {1};
    ErrorInfo error;
    EXPECT_TRUE(ChunkCodec::reassemble({}, 0, out, error));
    EXPECT_TRUE(out.empty());
}

//=============================================================================
// progressPercent
//=============================================================================

TEST(ChunkCodecTest, ProgressRoundsToNearestPercent) {
    EXPECT_EQ(ChunkCodec::progressPercent(0, 4), 0);
    EXPECT_EQ(ChunkCodec::progressPercent(1, 4), 25);
    EXPECT_EQ(ChunkCodec::progressPercent(1, 3), 33);
    EXPECT_EQ(ChunkCodec::progressPercent(2, 3), 67);
    EXPECT_EQ(ChunkCodec::progressPercent(4, 4), 100);
}

TEST(ChunkCodecTest, ProgressReachesHundredOnlyOnLastChunk) {
    const uint32_t total = 1000;
    EXPECT_EQ(ChunkCodec::progressPercent(999, total), 99);
    EXPECT_EQ(ChunkCodec::progressPercent(996, total), 99);
    EXPECT_EQ(ChunkCodec::progressPercent(1000, total), 100);
}

TEST(ChunkCodecTest, ProgressOfEmptyFileIsComplete) {
    EXPECT_EQ(ChunkCodec::progressPercent(0, 0), 100);
}
