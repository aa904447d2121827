/**
 * @file end_to_end_test.cpp
 * @brief Full sender-to-receiver transfers over an in-process channel
 */

#include "peerdrop/ConnectionLifecycle.h"
#include "peerdrop/LoopbackChannel.h"
#include "peerdrop/ReceiveSession.h"
#include "peerdrop/TransferSession.h"
#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <vector>

using namespace PeerDrop;

namespace {

SourceFile makeFile(const std::string& name, size_t size, uint8_t seed) {
    SourceFile file;
    file.descriptor.name = name;
    file.descriptor.size = size;
    file.descriptor.mimeType = "application/octet-stream";
    file.descriptor.lastModified = 1700000000000;
    file.data.resize(size);
    for (size_t i = 0; i < size; ++i) {
        file.data[i] = static_cast<uint8_t>((i * 7 + seed) & 0xFF);
    }
    return file;
}

/**
 * @brief Thread-safe record of what the receiver emitted
 */
struct ReceiverLog {
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<ReceivedFile> files;
    std::vector<std::pair<uint32_t, bool>> completions;
    size_t filesAtCompletion = 0;

    void onFile(const ReceivedFile& file) {
        std::lock_guard<std::mutex> lock(mutex);
        files.push_back(file);
    }

    void onComplete(uint32_t count, bool all) {
        std::lock_guard<std::mutex> lock(mutex);
        completions.emplace_back(count, all);
        filesAtCompletion = files.size();
        cv.notify_all();
    }

    bool waitForCompletion(std::chrono::seconds timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, timeout, [this] { return !completions.empty(); });
    }
};

} // anonymous namespace

/**
 * @test Files of 1 byte, 50000 bytes and 0 bytes arrive byte-identical,
 *       and completion fires once, after every file
 */
TEST(EndToEndTest, LoopbackTransferDeliversIdenticalBytes) {
    ReceiverLog log;
    ReceiveSession receiver(
        [&log](const ReceivedFile& file) { log.onFile(file); },
        [&log](uint32_t count, bool all) { log.onComplete(count, all); });

    auto ends = LoopbackChannel::createPair("receiver", "sender");
    receiver.attach(ends.second);
    ASSERT_TRUE(ends.second->start());
    ASSERT_TRUE(ends.first->start());

    std::vector<SourceFile> files = {
        makeFile("tiny.bin", 1, 1),
        makeFile("large.bin", 50000, 2),
        makeFile("empty.bin", 0, 3),
    };
    const std::vector<SourceFile> originals = files;

    TransferSession sender;
    sender.setChunkPacingMs(0);
    ErrorInfo error;
    ASSERT_TRUE(sender.start(std::move(files), ends.first, error)) << error.toString();
    ASSERT_TRUE(sender.sendAll(error)) << error.toString();

    ASSERT_TRUE(log.waitForCompletion(std::chrono::seconds(5)));

    std::lock_guard<std::mutex> lock(log.mutex);
    ASSERT_EQ(log.completions.size(), 1u);
    EXPECT_EQ(log.completions[0], std::make_pair(3u, true));
    EXPECT_EQ(log.filesAtCompletion, 3u);

    ASSERT_EQ(log.files.size(), 3u);
    for (const ReceivedFile& file : log.files) {
        ASSERT_LT(file.fileIndex, originals.size());
        const SourceFile& original = originals[file.fileIndex];
        EXPECT_EQ(file.descriptor, original.descriptor);
        EXPECT_EQ(file.data, original.data) << file.descriptor.name;
    }
    EXPECT_EQ(receiver.getViolationCount(), 0u);
}

/**
 * @test Sender runs on its worker thread; progress on both sides ends at 100
 */
TEST(EndToEndTest, BackgroundSenderWithProgress) {
    ReceiverLog log;
    std::mutex progressMutex;
    std::vector<int> receiverPercents;

    ReceiveSession receiver(
        [&log](const ReceivedFile& file) { log.onFile(file); },
        [&log](uint32_t count, bool all) { log.onComplete(count, all); },
        [&](uint32_t, int percent) {
            std::lock_guard<std::mutex> lock(progressMutex);
            receiverPercents.push_back(percent);
        });

    auto ends = LoopbackChannel::createPair("receiver", "sender");
    receiver.attach(ends.second);
    ASSERT_TRUE(ends.second->start());
    ASSERT_TRUE(ends.first->start());

    std::mutex doneMutex;
    std::condition_variable doneCv;
    bool senderDone = false;
    bool senderOk = false;

    TransferSession sender(nullptr, [&](const std::string&, bool ok, const ErrorInfo&) {
        std::lock_guard<std::mutex> lock(doneMutex);
        senderOk = ok;
        senderDone = true;
        doneCv.notify_all();
    });
    sender.setChunkPacingMs(1);

    ErrorInfo error;
    ASSERT_TRUE(sender.start({makeFile("photo.jpg", 4 * CHUNK_SIZE + 1, 9)}, ends.first, error));
    ASSERT_TRUE(sender.run());

    ASSERT_TRUE(log.waitForCompletion(std::chrono::seconds(10)));
    {
        std::unique_lock<std::mutex> lock(doneMutex);
        ASSERT_TRUE(doneCv.wait_for(lock, std::chrono::seconds(10), [&] { return senderDone; }));
    }
    sender.wait();

    EXPECT_TRUE(senderOk);
    EXPECT_EQ(sender.getFileProgress(0), 100);

    std::lock_guard<std::mutex> lock(progressMutex);
    ASSERT_EQ(receiverPercents.size(), 5u);
    EXPECT_EQ(receiverPercents.back(), 100);
}

/**
 * @test A transfer cut short by the sender closing the channel never
 *       emits a partial file or a completion
 */
TEST(EndToEndTest, ClosedChannelLeavesNoPartialFiles) {
    ReceiverLog log;
    ReceiveSession receiver(
        [&log](const ReceivedFile& file) { log.onFile(file); },
        [&log](uint32_t count, bool all) { log.onComplete(count, all); });

    auto ends = LoopbackChannel::createPair("receiver", "sender");
    receiver.attach(ends.second);
    ASSERT_TRUE(ends.second->start());
    ASSERT_TRUE(ends.first->start());

    TransferSession sender;
    sender.setChunkPacingMs(0);
    ErrorInfo error;
    ASSERT_TRUE(sender.start({makeFile("large.bin", 50000, 4)}, ends.first, error));

    ends.first->failAfter(2);
    EXPECT_FALSE(sender.sendAll(error));
    EXPECT_EQ(receiver.getOpenBufferCount(), 1u);

    ends.first->close();

    EXPECT_EQ(receiver.getOpenBufferCount(), 0u);
    EXPECT_EQ(receiver.getState(), ReceiverState::AWAITING_METADATA);
    std::lock_guard<std::mutex> lock(log.mutex);
    EXPECT_TRUE(log.files.empty());
    EXPECT_TRUE(log.completions.empty());
}

/**
 * @test Peers find each other through the hub and transfer over the
 *       lifecycle-managed channels
 */
TEST(EndToEndTest, TransferThroughConnectionLifecycle) {
    auto hub = std::make_shared<LoopbackHub>();
    ConnectionLifecycle senderSide(hub->createProvider("alice"), "alice");
    ConnectionLifecycle receiverSide(hub->createProvider("bob"), "bob");

    ReceiverLog log;
    ReceiveSession receiver(
        [&log](const ReceivedFile& file) { log.onFile(file); },
        [&log](uint32_t count, bool all) { log.onComplete(count, all); });
    receiverSide.setSessionHandlers(receiver.makeChannelHandlers());

    ErrorInfo error;
    ASSERT_TRUE(senderSide.connect("bob", error)) << error.toString();
    ASSERT_TRUE(receiverSide.accept(error)) << error.toString();
    EXPECT_EQ(senderSide.getState(), ConnectionState::OPEN);
    EXPECT_EQ(receiverSide.getState(), ConnectionState::OPEN);

    TransferSession sender;
    sender.setChunkPacingMs(0);
    ASSERT_TRUE(sender.start({makeFile("notes.txt", 3000, 5)}, senderSide.getChannel(), error))
        << error.toString();
    ASSERT_TRUE(sender.sendAll(error));

    ASSERT_TRUE(log.waitForCompletion(std::chrono::seconds(5)));
    {
        std::lock_guard<std::mutex> lock(log.mutex);
        ASSERT_EQ(log.files.size(), 1u);
        EXPECT_EQ(log.files[0].data.size(), 3000u);
    }

    senderSide.close();
    EXPECT_EQ(senderSide.getState(), ConnectionState::CLOSED);
    EXPECT_EQ(receiverSide.getState(), ConnectionState::CLOSED);
}
