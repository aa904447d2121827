/**
 * @file ConnectionLifecycle.h
 * @brief Peer identity and the single logical channel of a device
 */

#pragma once

#include "Channel.h"
#include "ErrorCodes.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace PeerDrop {

/**
 * @brief State of the logical channel
 */
enum class ConnectionState : uint8_t {
    DISCONNECTED,  ///< No channel requested yet
    CONNECTING,    ///< open()/accept() in progress
    OPEN,          ///< Channel usable
    CLOSED,        ///< Channel ended (locally or by the peer)
    FAILED         ///< Establishment or transport failed
};

inline std::string connectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::DISCONNECTED: return "Disconnected";
        case ConnectionState::CONNECTING:   return "Connecting";
        case ConnectionState::OPEN:         return "Open";
        case ConnectionState::CLOSED:       return "Closed";
        case ConnectionState::FAILED:       return "Failed";
        default:                            return "Unknown";
    }
}

/**
 * @brief Called on every state transition
 * @param state New state
 * @param error Cause of a FAILED transition (NONE otherwise)
 */
using ConnectionStateCallback = std::function<void(ConnectionState state, const ErrorInfo& error)>;

/**
 * @class ConnectionLifecycle
 * @brief Owns the local peer id and at most one channel at a time
 *
 * connect() or accept() establishes the channel, installs handlers that
 * track its state and forward every event to the session handlers, and
 * then starts it. close() is how a sender cancels a transfer.
 *
 * Thread Safety: every method is thread-safe. The state callback runs on
 * the thread that caused the transition and must not call back into
 * connect() or accept().
 */
class ConnectionLifecycle {
public:
    /**
     * @param provider Substrate used to open and accept channels
     * @param localPeerId Identity of this device (generated if empty)
     */
    explicit ConnectionLifecycle(std::shared_ptr<ChannelProvider> provider,
                                 const std::string& localPeerId = "");

    /**
     * @brief Destructor closes the channel
     */
    ~ConnectionLifecycle();

    ConnectionLifecycle(const ConnectionLifecycle&) = delete;
    ConnectionLifecycle& operator=(const ConnectionLifecycle&) = delete;

    /**
     * @brief Open a channel to a peer (initiator role)
     * @param peerId Peer identifier understood by the provider
     * @param error CHANNEL_ERROR if the provider failed, INVALID_STATE if a
     *              channel is already connecting or open
     */
    bool connect(const std::string& peerId, ErrorInfo& error);

    /**
     * @brief Wait for a peer to open a channel (listener role)
     */
    bool accept(ErrorInfo& error);

    /**
     * @brief Close the current channel (idempotent)
     */
    void close();

    /**
     * @brief Handlers that receive the channel's events after state tracking
     *
     * Typically ReceiveSession::makeChannelHandlers(). Applies to channels
     * established after the call.
     */
    void setSessionHandlers(ChannelHandlers handlers);

    void setStateCallback(ConnectionStateCallback callback);

    ConnectionState getState() const { return m_state.load(); }

    /// Current channel, or nullptr
    std::shared_ptr<Channel> getChannel() const;

    const std::string& getLocalPeerId() const { return m_localPeerId; }

    /// Peer id of the current or last channel
    std::string getRemotePeerId() const;

    /// Last error reported by the channel or provider
    ErrorInfo getLastError() const;

private:
    bool beginConnecting(ErrorInfo& error);
    bool establish(std::shared_ptr<Channel> channel, const ErrorInfo& providerError, ErrorInfo& error);
    void transition(ConnectionState state, const ErrorInfo& error);

    void onChannelOpen(const std::shared_ptr<Channel>& channel);
    void onChannelClose(const std::shared_ptr<Channel>& channel);
    void onChannelError(const std::shared_ptr<Channel>& channel, const ErrorInfo& error);

    std::shared_ptr<ChannelProvider> m_provider;
    std::string m_localPeerId;

    mutable std::mutex m_mutex;
    std::shared_ptr<Channel> m_channel;
    std::string m_remotePeerId;
    ChannelHandlers m_sessionHandlers;
    ConnectionStateCallback m_stateCallback;
    ErrorInfo m_lastError;

    std::atomic<ConnectionState> m_state;
};

}  // namespace PeerDrop
