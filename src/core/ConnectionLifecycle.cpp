/**
 * @file ConnectionLifecycle.cpp
 * @brief Peer identity and the single logical channel of a device
 */

#include "peerdrop/ConnectionLifecycle.h"
#include "peerdrop/UuidGenerator.h"
#include "peerdrop/Debug.h"

namespace PeerDrop {

ConnectionLifecycle::ConnectionLifecycle(std::shared_ptr<ChannelProvider> provider,
                                         const std::string& localPeerId)
    : m_provider(std::move(provider))
    , m_localPeerId(localPeerId.empty() ? UuidGenerator::generatePeerId() : localPeerId)
    , m_state(ConnectionState::DISCONNECTED)
{
    LOG_DEBUG("Local peer id " << m_localPeerId);
}

ConnectionLifecycle::~ConnectionLifecycle() {
    std::shared_ptr<Channel> channel;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        channel = std::move(m_channel);
    }
    if (channel) {
        // The channel may outlive us in a session; stop its events first
        channel->setHandlers(ChannelHandlers{});
        channel->close();
    }
}

//=============================================================================
// Establishing
//=============================================================================

bool ConnectionLifecycle::connect(const std::string& peerId, ErrorInfo& error) {
    if (!beginConnecting(error)) {
        return false;
    }

    LOG_INFO("Connecting to " << peerId);
    ErrorInfo providerError;
    auto channel = m_provider->open(peerId, providerError);
    return establish(std::move(channel), providerError, error);
}

bool ConnectionLifecycle::accept(ErrorInfo& error) {
    if (!beginConnecting(error)) {
        return false;
    }

    LOG_INFO("Waiting for an incoming channel as " << m_localPeerId);
    ErrorInfo providerError;
    auto channel = m_provider->accept(providerError);
    return establish(std::move(channel), providerError, error);
}

bool ConnectionLifecycle::beginConnecting(ErrorInfo& error) {
    if (!m_provider) {
        error.set(ErrorKind::CHANNEL_ERROR, "No channel provider configured");
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        const ConnectionState state = m_state.load();
        if (state == ConnectionState::CONNECTING || state == ConnectionState::OPEN) {
            error.set(ErrorKind::INVALID_STATE,
                      "A channel is already " + connectionStateToString(state));
            return false;
        }
        m_channel.reset();
        m_lastError.clear();
    }

    transition(ConnectionState::CONNECTING, ErrorInfo{});
    return true;
}

bool ConnectionLifecycle::establish(std::shared_ptr<Channel> channel,
                                    const ErrorInfo& providerError,
                                    ErrorInfo& error) {
    if (!channel) {
        error = providerError;
        if (!error.hasError()) {
            error.set(ErrorKind::CHANNEL_ERROR, "Channel provider returned no channel");
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_lastError = error;
        }
        LOG_WARNING("Channel establishment failed: " << error.toString());
        transition(ConnectionState::FAILED, error);
        return false;
    }

    ChannelHandlers session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_channel = channel;
        m_remotePeerId = channel->getPeerId();
        session = m_sessionHandlers;
    }

    // Track state first, then hand the event to the session
    std::weak_ptr<Channel> weak = channel;
    ChannelHandlers handlers;
    handlers.onOpen = [this, weak, session] {
        if (auto c = weak.lock()) {
            onChannelOpen(c);
        }
        if (session.onOpen) {
            session.onOpen();
        }
    };
    handlers.onData = session.onData;
    handlers.onClose = [this, weak, session] {
        if (auto c = weak.lock()) {
            onChannelClose(c);
        }
        if (session.onClose) {
            session.onClose();
        }
    };
    handlers.onError = [this, weak, session](const ErrorInfo& channelError) {
        if (auto c = weak.lock()) {
            onChannelError(c, channelError);
        }
        if (session.onError) {
            session.onError(channelError);
        }
    };
    channel->setHandlers(std::move(handlers));

    if (!channel->start()) {
        error.set(ErrorKind::CHANNEL_ERROR, "Channel to " + channel->getPeerId() + " could not be started");
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_lastError = error;
        }
        transition(ConnectionState::FAILED, error);
        return false;
    }
    return true;
}

//=============================================================================
// Channel events
//=============================================================================

void ConnectionLifecycle::onChannelOpen(const std::shared_ptr<Channel>& channel) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (channel != m_channel) {
            return;
        }
    }
    LOG_INFO("Channel to " << channel->getPeerId() << " open");
    transition(ConnectionState::OPEN, ErrorInfo{});
}

void ConnectionLifecycle::onChannelClose(const std::shared_ptr<Channel>& channel) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (channel != m_channel) {
            return;
        }
    }
    // A transport failure stays FAILED after the close that follows it
    if (m_state.load() == ConnectionState::FAILED) {
        return;
    }
    LOG_INFO("Channel to " << channel->getPeerId() << " closed");
    transition(ConnectionState::CLOSED, ErrorInfo{});
}

void ConnectionLifecycle::onChannelError(const std::shared_ptr<Channel>& channel, const ErrorInfo& error) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (channel != m_channel) {
            return;
        }
        m_lastError = error;
    }
    LOG_WARNING("Channel to " << channel->getPeerId() << " failed: " << error.toString());
    transition(ConnectionState::FAILED, error);
}

void ConnectionLifecycle::transition(ConnectionState state, const ErrorInfo& error) {
    ConnectionStateCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state.exchange(state) == state) {
            return;
        }
        callback = m_stateCallback;
    }
    if (callback) {
        callback(state, error);
    }
}

//=============================================================================
// Control and queries
//=============================================================================

void ConnectionLifecycle::close() {
    std::shared_ptr<Channel> channel = getChannel();
    if (!channel) {
        return;
    }

    channel->close();

    // TcpChannel reports the close from its reader thread; settle the state now
    const ConnectionState state = m_state.load();
    if (state == ConnectionState::OPEN || state == ConnectionState::CONNECTING) {
        transition(ConnectionState::CLOSED, ErrorInfo{});
    }
}

void ConnectionLifecycle::setSessionHandlers(ChannelHandlers handlers) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sessionHandlers = std::move(handlers);
}

void ConnectionLifecycle::setStateCallback(ConnectionStateCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stateCallback = std::move(callback);
}

std::shared_ptr<Channel> ConnectionLifecycle::getChannel() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_channel;
}

std::string ConnectionLifecycle::getRemotePeerId() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_remotePeerId;
}

ErrorInfo ConnectionLifecycle::getLastError() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastError;
}

}  // namespace PeerDrop
