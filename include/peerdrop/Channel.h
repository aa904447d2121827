/**
 * @file Channel.h
 * @brief Reliable, ordered, bidirectional envelope channel between two peers
 */

#pragma once

#include "ErrorCodes.h"
#include "TransferEnvelope.h"
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace PeerDrop {

/**
 * @brief Event handlers a channel reports to
 *
 * Any handler may be empty. Handlers run on the thread that produced the
 * event (for TcpChannel: its reader thread; for LoopbackChannel: the
 * sending thread), one event at a time and in order.
 */
struct ChannelHandlers {
    std::function<void()> onOpen;
    std::function<void(const TransferEnvelope&)> onData;
    std::function<void()> onClose;
    std::function<void(const ErrorInfo&)> onError;
};

/**
 * @class Channel
 * @brief Envelope transport used by the transfer protocol
 *
 * Implementations guarantee in-order, exactly-once, reliable delivery of
 * whole envelopes while open. Framing onto the underlying transport is the
 * implementation's business (see EnvelopeCodec).
 *
 * Lifecycle: install handlers with setHandlers(), then call start(), which
 * fires onOpen and begins delivering onData. close() ends the channel; the
 * far side observes onClose.
 */
class Channel {
public:
    virtual ~Channel() = default;

    /**
     * @brief Send one envelope
     * @param envelope Envelope to send
     * @param error CHANNEL_ERROR if the channel is closed or the write failed
     * @return true if the envelope was handed to the transport
     *
     * Thread-safe. Never retries a failed write.
     */
    virtual bool send(const TransferEnvelope& envelope, ErrorInfo& error) = 0;

    /**
     * @brief Begin event delivery (fires onOpen)
     * @return false if already started or already closed
     */
    virtual bool start() = 0;

    /**
     * @brief Close the channel (idempotent)
     */
    virtual void close() = 0;

    /**
     * @brief Check whether envelopes can currently be sent
     */
    virtual bool isOpen() const = 0;

    /**
     * @brief Opaque identifier of the remote peer
     */
    virtual std::string getPeerId() const = 0;

    /**
     * @brief Replace the event handlers
     *
     * Should be called before start(); events raised with no handler
     * installed are dropped.
     */
    void setHandlers(ChannelHandlers handlers) {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        m_handlers = std::move(handlers);
    }

protected:
    void emitOpen() {
        auto handler = copyHandlers().onOpen;
        if (handler) {
            handler();
        }
    }

    void emitData(const TransferEnvelope& envelope) {
        auto handler = copyHandlers().onData;
        if (handler) {
            handler(envelope);
        }
    }

    void emitClose() {
        auto handler = copyHandlers().onClose;
        if (handler) {
            handler();
        }
    }

    void emitError(const ErrorInfo& error) {
        auto handler = copyHandlers().onError;
        if (handler) {
            handler(error);
        }
    }

private:
    ChannelHandlers copyHandlers() const {
        std::lock_guard<std::mutex> lock(m_handlerMutex);
        return m_handlers;
    }

    mutable std::mutex m_handlerMutex;
    ChannelHandlers m_handlers;
};

/**
 * @class ChannelProvider
 * @brief Establishes channels (the signaling / connection substrate)
 */
class ChannelProvider {
public:
    virtual ~ChannelProvider() = default;

    /**
     * @brief Initiate a channel to a peer
     * @param peerId Opaque peer identifier understood by this provider
     * @param error CHANNEL_ERROR on failure
     * @return Channel (not yet started), or nullptr on failure
     */
    virtual std::shared_ptr<Channel> open(const std::string& peerId, ErrorInfo& error) = 0;

    /**
     * @brief Wait for an incoming channel (listener role)
     * @param error CHANNEL_ERROR on failure
     * @return Channel (not yet started), or nullptr on failure
     */
    virtual std::shared_ptr<Channel> accept(ErrorInfo& error) = 0;
};

}  // namespace PeerDrop
