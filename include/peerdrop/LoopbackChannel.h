/**
 * @file LoopbackChannel.h
 * @brief In-process channel pair and provider
 */

#pragma once

#include "Channel.h"
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace PeerDrop {

/**
 * @class LoopbackChannel
 * @brief One end of an in-process channel pair
 *
 * Every envelope is encoded to a wire frame with EnvelopeCodec and decoded
 * again on the far end, so the loopback exercises exactly the bytes a
 * network transport would carry. Delivery is synchronous on the sending
 * thread; frames sent before the far end has started are queued and flushed
 * by its start().
 *
 * Thread Safety: send(), close() and isOpen() are thread-safe.
 */
class LoopbackChannel final : public Channel,
                              public std::enable_shared_from_this<LoopbackChannel> {
public:
    /**
     * @brief Create two connected ends
     * @param firstPeerId Peer id reported by the first end (who it talks to)
     * @param secondPeerId Peer id reported by the second end
     */
    static std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>>
    createPair(const std::string& firstPeerId, const std::string& secondPeerId);

    explicit LoopbackChannel(const std::string& peerId);

    bool send(const TransferEnvelope& envelope, ErrorInfo& error) override;
    bool start() override;
    void close() override;
    bool isOpen() const override;
    std::string getPeerId() const override { return m_peerId; }

    /**
     * @brief Make every subsequent send() fail with CHANNEL_ERROR
     *
     * Simulates a transport write failure without closing the channel.
     */
    void setFailSends(bool fail);

    /**
     * @brief Fail sends once this many more envelopes have been sent
     * @param remaining Number of sends that still succeed
     */
    void failAfter(uint32_t remaining);

    /// Total frame bytes this end has sent
    uint64_t getBytesSent() const;

private:
    bool deliverFrame(const std::vector<uint8_t>& frame);
    void dispatchFrame(const std::vector<uint8_t>& frame);
    void handleRemoteClose();

    std::string m_peerId;
    std::weak_ptr<LoopbackChannel> m_peer;

    mutable std::mutex m_mutex;
    bool m_started;
    bool m_closed;
    bool m_failSends;
    bool m_failCountdownArmed;
    uint32_t m_sendsBeforeFailure;
    uint64_t m_bytesSent;
    std::deque<std::vector<uint8_t>> m_pendingFrames;

    /// Serializes inbound dispatch so onData events never overlap
    std::mutex m_deliveryMutex;
};

/**
 * @class LoopbackHub
 * @brief Registry that lets in-process peers open channels to each other
 *
 * Each registered peer gets a ChannelProvider. open(peerId) on one provider
 * creates a LoopbackChannel pair and queues the far end for the target
 * provider's accept().
 */
class LoopbackHub : public std::enable_shared_from_this<LoopbackHub> {
public:
    /**
     * @brief Register a peer and get its provider
     * @param localPeerId Identity of the registering peer
     * @param acceptTimeoutMs How long accept() waits before failing
     */
    std::shared_ptr<ChannelProvider> createProvider(const std::string& localPeerId,
                                                    uint32_t acceptTimeoutMs = 5000);

    /**
     * @brief Remove a peer; later open() calls targeting it fail
     */
    void unregister(const std::string& peerId);

private:
    friend class LoopbackProvider;

    struct Inbox {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<std::shared_ptr<Channel>> pending;
    };

    std::shared_ptr<Inbox> findInbox(const std::string& peerId) const;

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::shared_ptr<Inbox>> m_inboxes;
};

}  // namespace PeerDrop
