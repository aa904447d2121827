/**
 * @file LoopbackChannel.cpp
 * @brief In-process channel pair and provider
 */

#include "peerdrop/LoopbackChannel.h"
#include "peerdrop/EnvelopeCodec.h"
#include "peerdrop/Debug.h"
#include <chrono>

namespace PeerDrop {

//=============================================================================
// LoopbackChannel
//=============================================================================

std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>>
LoopbackChannel::createPair(const std::string& firstPeerId, const std::string& secondPeerId) {
    auto first = std::make_shared<LoopbackChannel>(firstPeerId);
    auto second = std::make_shared<LoopbackChannel>(secondPeerId);
    first->m_peer = second;
    second->m_peer = first;
    return {first, second};
}

LoopbackChannel::LoopbackChannel(const std::string& peerId)
    : m_peerId(peerId)
    , m_started(false)
    , m_closed(false)
    , m_failSends(false)
    , m_failCountdownArmed(false)
    , m_sendsBeforeFailure(0)
    , m_bytesSent(0)
{
}

bool LoopbackChannel::send(const TransferEnvelope& envelope, ErrorInfo& error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_started || m_closed) {
            error.set(ErrorKind::CHANNEL_ERROR, "Channel to '" + m_peerId + "' is not open");
            return false;
        }
        if (m_failCountdownArmed) {
            if (m_sendsBeforeFailure == 0) {
                m_failSends = true;
                m_failCountdownArmed = false;
            } else {
                --m_sendsBeforeFailure;
            }
        }
        if (m_failSends) {
            error.set(ErrorKind::CHANNEL_ERROR, "Write to '" + m_peerId + "' failed");
            return false;
        }
    }

    std::vector<uint8_t> frame;
    if (!EnvelopeCodec::encode(envelope, frame, error)) {
        return false;
    }

    auto peer = m_peer.lock();
    if (!peer || !peer->deliverFrame(frame)) {
        error.set(ErrorKind::CHANNEL_ERROR, "Peer '" + m_peerId + "' is gone");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_bytesSent += frame.size();
    return true;
}

bool LoopbackChannel::start() {
    std::lock_guard<std::mutex> delivery(m_deliveryMutex);

    std::deque<std::vector<uint8_t>> pending;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_started || m_closed) {
            return false;
        }
        m_started = true;
        pending.swap(m_pendingFrames);
    }

    emitOpen();
    for (const auto& frame : pending) {
        dispatchFrame(frame);
    }
    return true;
}

void LoopbackChannel::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return;
        }
        m_closed = true;
        m_pendingFrames.clear();
    }

    emitClose();

    if (auto peer = m_peer.lock()) {
        peer->handleRemoteClose();
    }
}

bool LoopbackChannel::isOpen() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_started && !m_closed;
}

void LoopbackChannel::setFailSends(bool fail) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failSends = fail;
    m_failCountdownArmed = false;
}

void LoopbackChannel::failAfter(uint32_t remaining) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failSends = false;
    m_failCountdownArmed = true;
    m_sendsBeforeFailure = remaining;
}

uint64_t LoopbackChannel::getBytesSent() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_bytesSent;
}

bool LoopbackChannel::deliverFrame(const std::vector<uint8_t>& frame) {
    std::lock_guard<std::mutex> delivery(m_deliveryMutex);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return false;
        }
        if (!m_started) {
            m_pendingFrames.push_back(frame);
            return true;
        }
    }
    dispatchFrame(frame);
    return true;
}

void LoopbackChannel::dispatchFrame(const std::vector<uint8_t>& frame) {
    TransferEnvelope envelope;
    ErrorInfo error;
    if (!EnvelopeCodec::decode(frame.data(), frame.size(), envelope, error)) {
        LOG_WARNING("Loopback channel from '" << m_peerId << "' dropped frame: " << error.toString());
        emitError(error);
        return;
    }
    emitData(envelope);
}

void LoopbackChannel::handleRemoteClose() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) {
            return;
        }
        m_closed = true;
        m_pendingFrames.clear();
    }
    emitClose();
}

//=============================================================================
// LoopbackProvider
//=============================================================================

class LoopbackProvider final : public ChannelProvider {
public:
    LoopbackProvider(std::shared_ptr<LoopbackHub> hub,
                     std::string localPeerId,
                     std::shared_ptr<LoopbackHub::Inbox> inbox,
                     uint32_t acceptTimeoutMs)
        : m_hub(std::move(hub))
        , m_localPeerId(std::move(localPeerId))
        , m_inbox(std::move(inbox))
        , m_acceptTimeoutMs(acceptTimeoutMs)
    {
    }

    std::shared_ptr<Channel> open(const std::string& peerId, ErrorInfo& error) override {
        auto target = m_hub->findInbox(peerId);
        if (!target) {
            error.set(ErrorKind::CHANNEL_ERROR, "Unknown peer '" + peerId + "'");
            return nullptr;
        }

        auto ends = LoopbackChannel::createPair(peerId, m_localPeerId);
        {
            std::lock_guard<std::mutex> lock(target->mutex);
            target->pending.push_back(ends.second);
        }
        target->cv.notify_one();
        return ends.first;
    }

    std::shared_ptr<Channel> accept(ErrorInfo& error) override {
        std::unique_lock<std::mutex> lock(m_inbox->mutex);
        const bool ready = m_inbox->cv.wait_for(lock,
                                                std::chrono::milliseconds(m_acceptTimeoutMs),
                                                [this] { return !m_inbox->pending.empty(); });
        if (!ready) {
            error.set(ErrorKind::CHANNEL_ERROR, "No incoming channel for '" + m_localPeerId + "'");
            return nullptr;
        }
        auto channel = m_inbox->pending.front();
        m_inbox->pending.pop_front();
        return channel;
    }

private:
    std::shared_ptr<LoopbackHub> m_hub;
    std::string m_localPeerId;
    std::shared_ptr<LoopbackHub::Inbox> m_inbox;
    uint32_t m_acceptTimeoutMs;
};

//=============================================================================
// LoopbackHub
//=============================================================================

std::shared_ptr<ChannelProvider> LoopbackHub::createProvider(const std::string& localPeerId,
                                                             uint32_t acceptTimeoutMs) {
    auto inbox = std::make_shared<Inbox>();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inboxes[localPeerId] = inbox;
    }
    return std::make_shared<LoopbackProvider>(shared_from_this(), localPeerId, inbox, acceptTimeoutMs);
}

void LoopbackHub::unregister(const std::string& peerId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_inboxes.erase(peerId);
}

std::shared_ptr<LoopbackHub::Inbox> LoopbackHub::findInbox(const std::string& peerId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_inboxes.find(peerId);
    if (it == m_inboxes.end()) {
        return nullptr;
    }
    return it->second;
}

}  // namespace PeerDrop
