/**
 * @file transfer_session_test.cpp
 * @brief Unit tests for the sending side of a transfer
 */

#include "peerdrop/TransferSession.h"
#include "peerdrop/LoopbackChannel.h"
#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <vector>

using namespace PeerDrop;

namespace {

SourceFile makeFile(const std::string& name, size_t size) {
    SourceFile file;
    file.descriptor.name = name;
    file.descriptor.size = size;
    file.descriptor.mimeType = "application/octet-stream";
    file.data.resize(size);
    for (size_t i = 0; i < size; ++i) {
        file.data[i] = static_cast<uint8_t>(i % 251);
    }
    return file;
}

/**
 * @brief Sender/recorder fixture: the far end only records envelopes
 */
class TransferSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto ends = LoopbackChannel::createPair("receiver", "sender");
        sender = ends.first;
        receiver = ends.second;

        ChannelHandlers handlers;
        handlers.onData = [this](const TransferEnvelope& envelope) {
            std::lock_guard<std::mutex> lock(mutex);
            received.push_back(envelope);
        };
        receiver->setHandlers(handlers);
        receiver->start();
        sender->start();
    }

    std::vector<TransferEnvelope> envelopes() {
        std::lock_guard<std::mutex> lock(mutex);
        return received;
    }

    std::shared_ptr<LoopbackChannel> sender;
    std::shared_ptr<LoopbackChannel> receiver;

    std::mutex mutex;
    std::vector<TransferEnvelope> received;
};

} // anonymous namespace

//=============================================================================
// start()
//=============================================================================

/**
 * @test Starting without a channel fails and sends nothing
 */
TEST_F(TransferSessionTest, StartWithoutChannelFails) {
    TransferSession session;
    ErrorInfo error;

    EXPECT_FALSE(session.start({makeFile("a.txt", 10)}, nullptr, error));
    EXPECT_EQ(error.kind, ErrorKind::NO_ACTIVE_CHANNEL);
    EXPECT_EQ(session.getState(), SenderState::IDLE);
}

TEST_F(TransferSessionTest, StartOnClosedChannelFails) {
    sender->close();

    TransferSession session;
    ErrorInfo error;
    EXPECT_FALSE(session.start({makeFile("a.txt", 10)}, sender, error));
    EXPECT_EQ(error.kind, ErrorKind::NO_ACTIVE_CHANNEL);
}

TEST_F(TransferSessionTest, StartWithNoFilesFails) {
    TransferSession session;
    ErrorInfo error;

    EXPECT_FALSE(session.start({}, sender, error));
    EXPECT_EQ(error.kind, ErrorKind::NO_FILES_SELECTED);
    EXPECT_EQ(session.getState(), SenderState::IDLE);
    EXPECT_TRUE(envelopes().empty());
}

TEST_F(TransferSessionTest, StartRejectsSizeMismatch) {
    SourceFile file = makeFile("a.txt", 10);
    file.descriptor.size = 11;

    TransferSession session;
    ErrorInfo error;
    EXPECT_FALSE(session.start({file}, sender, error));
    EXPECT_EQ(error.kind, ErrorKind::INVALID_ARGUMENT);
}

/**
 * @test start() sends exactly one Metadata envelope and zeroes progress
 */
TEST_F(TransferSessionTest, StartSendsMetadata) {
    TransferSession session;
    ErrorInfo error;

    ASSERT_TRUE(session.start({makeFile("a.txt", 10), makeFile("b.bin", 20)}, sender, error));
    EXPECT_EQ(session.getState(), SenderState::METADATA_SENT);

    const auto sent = envelopes();
    ASSERT_EQ(sent.size(), 1u);
    ASSERT_EQ(sent[0].getType(), EnvelopeType::METADATA);
    ASSERT_EQ(sent[0].getFiles().size(), 2u);
    EXPECT_EQ(sent[0].getFiles()[0].name, "a.txt");
    EXPECT_EQ(sent[0].getFiles()[1].size, 20u);

    const ProgressSnapshot expected = {{0, 0}, {1, 0}};
    EXPECT_EQ(session.getProgress(), expected);
}

/**
 * @test A Latin-1 file name (not valid UTF-8) is sent with U+FFFD in place
 *       of the bad byte instead of aborting start()
 */
TEST_F(TransferSessionTest, StartAcceptsNonUtf8FileName) {
    TransferSession session;
    ErrorInfo error;

    ASSERT_TRUE(session.start({makeFile("caf\xe9.txt", 4)}, sender, error)) << error.toString();
    EXPECT_EQ(session.getState(), SenderState::METADATA_SENT);

    const auto got = envelopes();
    ASSERT_EQ(got.size(), 1u);
    ASSERT_EQ(got[0].getType(), EnvelopeType::METADATA);
    ASSERT_EQ(got[0].getFiles().size(), 1u);
    EXPECT_EQ(got[0].getFiles()[0].name, "caf\xef\xbf\xbd.txt");
    EXPECT_EQ(got[0].getFiles()[0].size, 4u);

    ASSERT_TRUE(session.sendAll(error)) << error.toString();
    EXPECT_EQ(session.getState(), SenderState::COMPLETED);
}

TEST_F(TransferSessionTest, SecondStartFails) {
    TransferSession session;
    ErrorInfo error;

    ASSERT_TRUE(session.start({makeFile("a.txt", 10)}, sender, error));
    EXPECT_FALSE(session.start({makeFile("a.txt", 10)}, sender, error));
    EXPECT_EQ(error.kind, ErrorKind::INVALID_STATE);
}

TEST_F(TransferSessionTest, MetadataSendFailureLeavesStateIdle) {
    sender->setFailSends(true);

    TransferSession session;
    ErrorInfo error;
    EXPECT_FALSE(session.start({makeFile("a.txt", 10)}, sender, error));
    EXPECT_EQ(error.kind, ErrorKind::CHANNEL_ERROR);
    EXPECT_EQ(session.getState(), SenderState::IDLE);
}

//=============================================================================
// sendAll()
//=============================================================================

/**
 * @test Two files of 1 and 50000 bytes yield 1 and 4 chunks, in order
 */
TEST_F(TransferSessionTest, SendsChunksInOrderThenComplete) {
    TransferSession session;
    session.setChunkPacingMs(0);
    ErrorInfo error;

    ASSERT_TRUE(session.start({makeFile("tiny", 1), makeFile("large", 50000)}, sender, error));
    ASSERT_TRUE(session.sendAll(error)) << error.toString();
    EXPECT_EQ(session.getState(), SenderState::COMPLETED);

    const auto sent = envelopes();
    // Metadata + 1 + 4 chunks + Complete
    ASSERT_EQ(sent.size(), 7u);
    EXPECT_EQ(sent[0].getType(), EnvelopeType::METADATA);

    EXPECT_EQ(sent[1].getChunk().fileIndex, 0u);
    EXPECT_EQ(sent[1].getChunk().totalChunks, 1u);
    EXPECT_EQ(sent[1].getChunk().payload.size(), 1u);

    for (uint32_t i = 0; i < 4; ++i) {
        const ChunkMessage& chunk = sent[2 + i].getChunk();
        EXPECT_EQ(sent[2 + i].getType(), EnvelopeType::CHUNK);
        EXPECT_EQ(chunk.fileIndex, 1u);
        EXPECT_EQ(chunk.chunkIndex, i);
        EXPECT_EQ(chunk.totalChunks, 4u);
    }
    EXPECT_EQ(sent[2].getChunk().payload.size(), CHUNK_SIZE);
    EXPECT_EQ(sent[5].getChunk().payload.size(), 50000 - 3 * CHUNK_SIZE);
    EXPECT_EQ(sent[6].getType(), EnvelopeType::COMPLETE);

    EXPECT_EQ(session.getBytesSent(), 50001u);
}

/**
 * @test Per-file progress only increases and reaches 100 exactly once
 */
TEST_F(TransferSessionTest, ProgressIsMonotonicAndEndsAtHundred) {
    std::mutex progressMutex;
    std::map<uint32_t, std::vector<int>> reports;

    TransferSession session([&](const std::string&, uint32_t fileIndex, int percent) {
        std::lock_guard<std::mutex> lock(progressMutex);
        reports[fileIndex].push_back(percent);
    });
    session.setChunkPacingMs(0);

    ErrorInfo error;
    ASSERT_TRUE(session.start({makeFile("a", 5 * CHUNK_SIZE + 3), makeFile("b", 100)}, sender, error));
    ASSERT_TRUE(session.sendAll(error));

    ASSERT_EQ(reports.size(), 2u);
    for (const auto& entry : reports) {
        const auto& values = entry.second;
        ASSERT_FALSE(values.empty());
        for (size_t i = 1; i < values.size(); ++i) {
            EXPECT_LT(values[i - 1], values[i]) << "file " << entry.first;
        }
        EXPECT_EQ(values.back(), 100);
        EXPECT_EQ(std::count(values.begin(), values.end(), 100), 1);
    }
    EXPECT_EQ(reports[0].size(), 6u);
    EXPECT_EQ(session.getFileProgress(0), 100);
    EXPECT_EQ(session.getFileProgress(1), 100);
    EXPECT_EQ(session.getFileProgress(2), -1);
}

TEST_F(TransferSessionTest, EmptyFileSendsNoChunks) {
    std::vector<int> reports;
    TransferSession session([&](const std::string&, uint32_t, int percent) {
        reports.push_back(percent);
    });
    session.setChunkPacingMs(0);

    ErrorInfo error;
    ASSERT_TRUE(session.start({makeFile("empty", 0)}, sender, error));
    ASSERT_TRUE(session.sendAll(error));

    const auto sent = envelopes();
    ASSERT_EQ(sent.size(), 2u);
    EXPECT_EQ(sent[0].getType(), EnvelopeType::METADATA);
    EXPECT_EQ(sent[1].getType(), EnvelopeType::COMPLETE);
    EXPECT_EQ(reports, std::vector<int>{100});
}

TEST_F(TransferSessionTest, SendAllBeforeStartFails) {
    TransferSession session;
    ErrorInfo error;

    EXPECT_FALSE(session.sendAll(error));
    EXPECT_EQ(error.kind, ErrorKind::INVALID_STATE);
}

/**
 * @test A failed chunk write stops the transfer without retry or Complete
 */
TEST_F(TransferSessionTest, ChannelFailureStopsTransfer) {
    TransferSession session;
    session.setChunkPacingMs(0);
    ErrorInfo error;

    ASSERT_TRUE(session.start({makeFile("large", 50000)}, sender, error));
    sender->failAfter(2);

    EXPECT_FALSE(session.sendAll(error));
    EXPECT_EQ(error.kind, ErrorKind::CHANNEL_ERROR);
    EXPECT_EQ(session.getState(), SenderState::TRANSFERRING);

    const auto sent = envelopes();
    ASSERT_EQ(sent.size(), 3u);
    for (const auto& envelope : sent) {
        EXPECT_NE(envelope.getType(), EnvelopeType::COMPLETE);
    }
    EXPECT_EQ(session.getBytesSent(), 2 * CHUNK_SIZE);

    // No resume after a failure
    ErrorInfo retryError;
    EXPECT_FALSE(session.sendAll(retryError));
    EXPECT_EQ(retryError.kind, ErrorKind::INVALID_STATE);
}

TEST_F(TransferSessionTest, ClosingChannelCancelsTransfer) {
    TransferSession session;
    session.setChunkPacingMs(0);
    ErrorInfo error;

    ASSERT_TRUE(session.start({makeFile("large", 50000)}, sender, error));
    receiver->close();

    EXPECT_FALSE(session.sendAll(error));
    EXPECT_EQ(error.kind, ErrorKind::CHANNEL_ERROR);
}

//=============================================================================
// run() / wait()
//=============================================================================

TEST_F(TransferSessionTest, RunReportsCompletionOnWorkerThread) {
    std::mutex doneMutex;
    std::condition_variable doneCv;
    bool done = false;
    bool success = false;
    std::string reportedId;

    TransferSession session(nullptr, [&](const std::string& sessionId, bool ok, const ErrorInfo&) {
        std::lock_guard<std::mutex> lock(doneMutex);
        reportedId = sessionId;
        success = ok;
        done = true;
        doneCv.notify_all();
    });
    session.setChunkPacingMs(1);

    ErrorInfo error;
    ASSERT_TRUE(session.start({makeFile("a", 3 * CHUNK_SIZE)}, sender, error));
    ASSERT_TRUE(session.run());
    EXPECT_FALSE(session.run());

    {
        std::unique_lock<std::mutex> lock(doneMutex);
        ASSERT_TRUE(doneCv.wait_for(lock, std::chrono::seconds(10), [&] { return done; }));
    }
    session.wait();

    EXPECT_TRUE(success);
    EXPECT_EQ(reportedId, session.getSessionId());
    EXPECT_EQ(session.getState(), SenderState::COMPLETED);
    EXPECT_FALSE(session.isRunning());
}

TEST_F(TransferSessionTest, RunBeforeStartIsRejected) {
    TransferSession session;
    EXPECT_FALSE(session.run());
}

TEST(TransferSessionIdTest, SessionIdsAreUniqueAndPrefixed) {
    TransferSession first;
    TransferSession second;

    EXPECT_EQ(first.getSessionId().rfind("sess_", 0), 0u);
    EXPECT_NE(first.getSessionId(), second.getSessionId());
    EXPECT_EQ(first.getChunkPacingMs(), CHUNK_PACING_MS);
}
