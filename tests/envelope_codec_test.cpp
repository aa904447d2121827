/**
 * @file envelope_codec_test.cpp
 * @brief Unit tests for envelope framing
 */

#include "peerdrop/EnvelopeCodec.h"
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace PeerDrop;

namespace {

std::vector<uint8_t> allByteValues() {
    std::vector<uint8_t> bytes;
    for (int round = 0; round < 3; ++round) {
        for (int value = 0; value < 256; ++value) {
            bytes.push_back(static_cast<uint8_t>(value));
        }
    }
    return bytes;
}

std::vector<uint8_t> encodeOrFail(const TransferEnvelope& envelope) {
    std::vector<uint8_t> frame;
    ErrorInfo error;
    EXPECT_TRUE(EnvelopeCodec::encode(envelope, frame, error)) << error.toString();
    return frame;
}

} // anonymous namespace

//=============================================================================
// Header layout
//=============================================================================

/**
 * @test Verify the fixed header carries magic, tag and big-endian length
 */
TEST(EnvelopeCodecTest, CompleteFrameIsBareHeader) {
    const auto frame = encodeOrFail(TransferEnvelope::complete());

    const std::vector<uint8_t> expected = {0x50, 0x44, 0x52, 0x50, 0x03, 0x00, 0x00, 0x00, 0x00};
    EXPECT_EQ(frame, expected);
}

TEST(EnvelopeCodecTest, ChunkFrameHasPrefixedPayload) {
    ChunkMessage chunk;
    chunk.fileIndex = 1;
    chunk.chunkIndex = 2;
    chunk.totalChunks = 3;
    chunk.payload = {0xDE, 0xAD};

    const auto frame = encodeOrFail(TransferEnvelope::chunk(chunk));
    ASSERT_EQ(frame.size(), FRAME_HEADER_SIZE + CHUNK_PREFIX_SIZE + 2);

    FrameHeader header;
    ErrorInfo error;
    ASSERT_TRUE(EnvelopeCodec::decodeHeader(frame.data(), header, error));
    EXPECT_EQ(header.magic, FRAME_MAGIC);
    EXPECT_EQ(header.envelopeType, static_cast<uint8_t>(EnvelopeType::CHUNK));
    EXPECT_EQ(header.payloadLength, CHUNK_PREFIX_SIZE + 2);
}

//=============================================================================
// Lossless payloads
//=============================================================================

/**
 * @test Binary chunk data (NUL bytes, every byte value) survives unchanged
 */
TEST(EnvelopeCodecTest, ChunkDataIsCopiedByteForByte) {
    ChunkMessage chunk;
    chunk.fileIndex = 7;
    chunk.chunkIndex = 41;
    chunk.totalChunks = 42;
    chunk.payload = allByteValues();

    const auto frame = encodeOrFail(TransferEnvelope::chunk(chunk));

    TransferEnvelope decoded;
    ErrorInfo error;
    ASSERT_TRUE(EnvelopeCodec::decode(frame.data(), frame.size(), decoded, error)) << error.toString();
    ASSERT_EQ(decoded.getType(), EnvelopeType::CHUNK);
    EXPECT_EQ(decoded.getChunk().fileIndex, 7u);
    EXPECT_EQ(decoded.getChunk().chunkIndex, 41u);
    EXPECT_EQ(decoded.getChunk().totalChunks, 42u);
    EXPECT_EQ(decoded.getChunk().payload, chunk.payload);
}

TEST(EnvelopeCodecTest, EmptyChunkPayloadIsAccepted) {
    ChunkMessage chunk;
    chunk.totalChunks = 1;

    const auto frame = encodeOrFail(TransferEnvelope::chunk(chunk));

    TransferEnvelope decoded;
    ErrorInfo error;
    ASSERT_TRUE(EnvelopeCodec::decode(frame.data(), frame.size(), decoded, error));
    EXPECT_TRUE(decoded.getChunk().payload.empty());
}

/**
 * @test Metadata preserves names with non-ASCII characters and every field
 */
TEST(EnvelopeCodecTest, MetadataPreservesDescriptors) {
    std::vector<FileDescriptor> files(2);
    files[0].name = "report \xC3\xA9t\xC3\xA9.pdf";
    files[0].size = 123456;
    files[0].mimeType = "application/pdf";
    files[0].lastModified = 1700000000123;
    files[1].name = "empty";
    files[1].size = 0;

    const auto frame = encodeOrFail(TransferEnvelope::metadata(files));

    TransferEnvelope decoded;
    ErrorInfo error;
    ASSERT_TRUE(EnvelopeCodec::decode(frame.data(), frame.size(), decoded, error)) << error.toString();
    ASSERT_EQ(decoded.getType(), EnvelopeType::METADATA);
    EXPECT_EQ(decoded.getFiles(), files);
}

TEST(EnvelopeCodecTest, EmptyMetadataListIsAccepted) {
    const auto frame = encodeOrFail(TransferEnvelope::metadata({}));

    TransferEnvelope decoded;
    ErrorInfo error;
    ASSERT_TRUE(EnvelopeCodec::decode(frame.data(), frame.size(), decoded, error));
    EXPECT_EQ(decoded.getType(), EnvelopeType::METADATA);
    EXPECT_TRUE(decoded.getFiles().empty());
}

//=============================================================================
// Malformed frames
//=============================================================================

TEST(EnvelopeCodecTest, RejectsShortFrame) {
    const std::vector<uint8_t> frame = {0x50, 0x44, 0x52};

    TransferEnvelope decoded;
    ErrorInfo error;
    EXPECT_FALSE(EnvelopeCodec::decode(frame.data(), frame.size(), decoded, error));
    EXPECT_EQ(error.kind, ErrorKind::PROTOCOL_VIOLATION);
}

TEST(EnvelopeCodecTest, RejectsBadMagic) {
    auto frame = encodeOrFail(TransferEnvelope::complete());
    frame[0] = 0x00;

    TransferEnvelope decoded;
    ErrorInfo error;
    EXPECT_FALSE(EnvelopeCodec::decode(frame.data(), frame.size(), decoded, error));
    EXPECT_EQ(error.kind, ErrorKind::PROTOCOL_VIOLATION);
    EXPECT_EQ(error.message, "Bad frame magic");
}

TEST(EnvelopeCodecTest, RejectsUnknownType) {
    auto frame = encodeOrFail(TransferEnvelope::complete());
    frame[4] = 0x09;

    TransferEnvelope decoded;
    ErrorInfo error;
    EXPECT_FALSE(EnvelopeCodec::decode(frame.data(), frame.size(), decoded, error));
    EXPECT_EQ(error.kind, ErrorKind::PROTOCOL_VIOLATION);
}

TEST(EnvelopeCodecTest, RejectsLengthMismatch) {
    ChunkMessage chunk;
    chunk.totalChunks = 1;
    chunk.payload = {1, 2, 3};
    auto frame = encodeOrFail(TransferEnvelope::chunk(chunk));
    frame.pop_back();

    TransferEnvelope decoded;
    ErrorInfo error;
    EXPECT_FALSE(EnvelopeCodec::decode(frame.data(), frame.size(), decoded, error));
    EXPECT_EQ(error.kind, ErrorKind::PROTOCOL_VIOLATION);
}

TEST(EnvelopeCodecTest, RejectsChunkDataLengthDisagreement) {
    ChunkMessage chunk;
    chunk.totalChunks = 1;
    chunk.payload = {1, 2, 3};
    auto frame = encodeOrFail(TransferEnvelope::chunk(chunk));
    // dataLength is the last prefix field
    frame[FRAME_HEADER_SIZE + CHUNK_PREFIX_SIZE - 1] = 4;

    TransferEnvelope decoded;
    ErrorInfo error;
    EXPECT_FALSE(EnvelopeCodec::decode(frame.data(), frame.size(), decoded, error));
    EXPECT_EQ(error.kind, ErrorKind::PROTOCOL_VIOLATION);
}

TEST(EnvelopeCodecTest, RejectsCompleteWithPayload) {
    const std::vector<uint8_t> frame = {0x50, 0x44, 0x52, 0x50, 0x03, 0x00, 0x00, 0x00, 0x01, 0xFF};

    TransferEnvelope decoded;
    ErrorInfo error;
    EXPECT_FALSE(EnvelopeCodec::decode(frame.data(), frame.size(), decoded, error));
    EXPECT_EQ(error.message, "Complete envelope carries a payload");
}

TEST(EnvelopeCodecTest, RejectsMetadataThatIsNotJsonArray) {
    const std::string text = "{\"name\":\"a\"}";
    std::vector<uint8_t> frame = {0x50, 0x44, 0x52, 0x50, 0x01, 0x00, 0x00, 0x00,
                                  static_cast<uint8_t>(text.size())};
    frame.insert(frame.end(), text.begin(), text.end());

    TransferEnvelope decoded;
    ErrorInfo error;
    EXPECT_FALSE(EnvelopeCodec::decode(frame.data(), frame.size(), decoded, error));
    EXPECT_EQ(error.kind, ErrorKind::PROTOCOL_VIOLATION);
}

TEST(EnvelopeCodecTest, RejectsOversizedPayloadLength) {
    const std::vector<uint8_t> header = {0x50, 0x44, 0x52, 0x50, 0x02, 0xFF, 0xFF, 0xFF, 0xFF};

    FrameHeader decoded;
    ErrorInfo error;
    EXPECT_FALSE(EnvelopeCodec::decodeHeader(header.data(), decoded, error));
    EXPECT_EQ(error.kind, ErrorKind::PROTOCOL_VIOLATION);
}

//=============================================================================
// Descriptor JSON
//=============================================================================

TEST(EnvelopeCodecTest, DescriptorRequiresNameAndSize) {
    FileDescriptor descriptor;
    std::string errorMsg;

    EXPECT_FALSE(EnvelopeCodec::descriptorFromJson({{"size", 1}}, descriptor, errorMsg));
    EXPECT_FALSE(EnvelopeCodec::descriptorFromJson({{"name", "a"}}, descriptor, errorMsg));
    EXPECT_FALSE(EnvelopeCodec::descriptorFromJson({{"name", "a"}, {"size", -1}}, descriptor, errorMsg));
    EXPECT_TRUE(EnvelopeCodec::descriptorFromJson({{"name", "a"}, {"size", 1u}}, descriptor, errorMsg));
    EXPECT_EQ(descriptor.name, "a");
    EXPECT_EQ(descriptor.size, 1u);
    EXPECT_TRUE(descriptor.mimeType.empty());
}
