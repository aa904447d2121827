/**
 * @file TcpChannel.cpp
 * @brief Envelope channel over a TCP stream socket (POSIX)
 */

#include "peerdrop/TcpChannel.h"
#include "peerdrop/EnvelopeCodec.h"
#include "peerdrop/Debug.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <vector>

namespace PeerDrop {

namespace {

    void tuneSocket(int fd) {
        const int one = 1;
        (void)setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        const int buf = 1024 * 1024;
        (void)setsockopt(fd, SOL_SOCKET, SO_SNDBUF, &buf, sizeof(buf));
        (void)setsockopt(fd, SOL_SOCKET, SO_RCVBUF, &buf, sizeof(buf));
    }

    std::string errnoString(const char* what) {
        return std::string(what) + " failed: " + std::strerror(errno);
    }

    std::string describePeer(const sockaddr_in& addr) {
        char ipStr[INET_ADDRSTRLEN] = {};
        inet_ntop(AF_INET, &addr.sin_addr, ipStr, sizeof(ipStr));
        return std::string(ipStr) + ":" + std::to_string(ntohs(addr.sin_port));
    }

    const char* kPeerClosed = "Connection closed by peer";

    /**
     * @brief Run a handler dispatch while holding the channel alive
     * @return false if the channel is gone afterwards (the caller must not
     *         touch it again)
     *
     * A handler may drop the last reference to its channel. The channel is
     * then destroyed here, on the reader thread, when the local reference is
     * released.
     */
    template <typename Dispatch>
    bool dispatchAlive(const std::weak_ptr<TcpChannel>& weak, Dispatch&& dispatch) {
        std::shared_ptr<TcpChannel> self = weak.lock();
        if (!self) {
            return false;
        }
        dispatch();
        self.reset();
        return !weak.expired();
    }

} // anonymous namespace

//=============================================================================
// Utility Functions
//=============================================================================

bool sendExact(int fd, const uint8_t* data, size_t size, std::string& errorMsg) {
    if (!data || size == 0) {
        return true;  // Nothing to send
    }

    size_t totalSent = 0;
    while (totalSent < size) {
        const ssize_t sendResult = ::send(fd, data + totalSent, size - totalSent, MSG_NOSIGNAL);
        if (sendResult < 0) {
            if (errno == EINTR) {
                continue;
            }
            errorMsg = errnoString("send()");
            return false;
        }
        if (sendResult == 0) {
            errorMsg = kPeerClosed;
            return false;
        }
        totalSent += static_cast<size_t>(sendResult);
    }
    return true;
}

bool recvExact(int fd, uint8_t* buffer, size_t size, std::string& errorMsg) {
    if (!buffer || size == 0) {
        return true;  // Nothing to receive
    }

    size_t totalReceived = 0;
    while (totalReceived < size) {
        const ssize_t recvResult = ::recv(fd, buffer + totalReceived, size - totalReceived, 0);
        if (recvResult < 0) {
            if (errno == EINTR) {
                continue;
            }
            errorMsg = errnoString("recv()");
            return false;
        }
        if (recvResult == 0) {
            errorMsg = kPeerClosed;
            return false;
        }
        totalReceived += static_cast<size_t>(recvResult);
    }
    return true;
}

//=============================================================================
// TcpChannel
//=============================================================================

TcpChannel::TcpChannel(int fd, const std::string& peerId)
    : m_fd(fd)
    , m_peerId(peerId)
    , m_started(false)
    , m_closed(false)
    , m_closeNotified(false)
{
    tuneSocket(m_fd);
}

TcpChannel::~TcpChannel() {
    close();

    if (m_readerThread.joinable()) {
        if (m_readerThread.get_id() == std::this_thread::get_id()) {
            // Last reference released by the reader after a handler dropped
            // its own; dispatchAlive() reports it and the reader returns
            // without touching the channel again.
            m_readerThread.detach();
        } else {
            m_readerThread.join();
        }
    }

    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

bool TcpChannel::send(const TransferEnvelope& envelope, ErrorInfo& error) {
    if (!isOpen()) {
        error.set(ErrorKind::CHANNEL_ERROR, "Channel to " + m_peerId + " is not open");
        return false;
    }

    std::vector<uint8_t> frame;
    if (!EnvelopeCodec::encode(envelope, frame, error)) {
        return false;
    }

    std::lock_guard<std::mutex> lock(m_sendMutex);
    std::string errorMsg;
    if (!sendExact(m_fd, frame.data(), frame.size(), errorMsg)) {
        error.set(ErrorKind::CHANNEL_ERROR, "Send to " + m_peerId + " failed: " + errorMsg);
        return false;
    }
    return true;
}

bool TcpChannel::start() {
    if (m_closed.load() || m_started.exchange(true)) {
        return false;
    }

    emitOpen();
    m_readerThread = std::thread(&TcpChannel::readerThreadFunc, this, weak_from_this());
    return true;
}

void TcpChannel::close() {
    if (m_closed.exchange(true)) {
        return;
    }

    if (m_fd >= 0) {
        ::shutdown(m_fd, SHUT_RDWR);
    }

    // Without a reader thread nobody else will report the close.
    if (!m_started.load()) {
        finish(true);
    }
}

bool TcpChannel::isOpen() const {
    return m_started.load() && !m_closed.load();
}

void TcpChannel::readerThreadFunc(std::weak_ptr<TcpChannel> weak) {
    std::vector<uint8_t> header(FRAME_HEADER_SIZE);
    std::vector<uint8_t> payload;

    try {
        while (!m_closed.load()) {
            std::string errorMsg;
            if (!recvExact(m_fd, header.data(), header.size(), errorMsg)) {
                if (!m_closed.load() && errorMsg != kPeerClosed) {
                    ErrorInfo error;
                    error.set(ErrorKind::CHANNEL_ERROR, "Receive from " + m_peerId + " failed: " + errorMsg);
                    LOG_WARNING(error.toString());
                    if (!dispatchAlive(weak, [&] { emitError(error); })) {
                        return;
                    }
                }
                break;
            }

            // A bad header leaves the stream unsynchronized
            ErrorInfo error;
            FrameHeader frameHeader;
            if (!EnvelopeCodec::decodeHeader(header.data(), frameHeader, error)) {
                LOG_WARNING("Unframed data from " << m_peerId << ": " << error.toString());
                if (!dispatchAlive(weak, [&] { emitError(error); })) {
                    return;
                }
                break;
            }

            payload.resize(frameHeader.payloadLength);
            if (!recvExact(m_fd, payload.data(), payload.size(), errorMsg)) {
                if (!m_closed.load()) {
                    error.set(ErrorKind::CHANNEL_ERROR,
                              "Frame from " + m_peerId + " truncated: " + errorMsg);
                    LOG_WARNING(error.toString());
                    if (!dispatchAlive(weak, [&] { emitError(error); })) {
                        return;
                    }
                }
                break;
            }

            // The whole frame was consumed, so the next header is still in sync
            TransferEnvelope envelope;
            if (!EnvelopeCodec::decodePayload(frameHeader, payload.data(), envelope, error)) {
                LOG_WARNING("Dropping malformed frame from " << m_peerId << ": " << error.toString());
                if (!dispatchAlive(weak, [&] { emitError(error); })) {
                    return;
                }
                continue;
            }

            if (!dispatchAlive(weak, [&] { emitData(envelope); })) {
                return;
            }
        }
    } catch (const std::exception& e) {
        ErrorInfo error;
        error.set(ErrorKind::CHANNEL_ERROR, std::string("Reader thread exception: ") + e.what());
        LOG_ERROR(error.toString());
        if (!dispatchAlive(weak, [&] { emitError(error); })) {
            return;
        }
    }

    (void)dispatchAlive(weak, [this] {
        if (!m_closed.exchange(true) && m_fd >= 0) {
            ::shutdown(m_fd, SHUT_RDWR);
        }
        finish(true);
    });
}

void TcpChannel::finish(bool notifyClose) {
    if (notifyClose && !m_closeNotified.exchange(true)) {
        emitClose();
    }
}

//=============================================================================
// TcpChannelProvider
//=============================================================================

TcpChannelProvider::TcpChannelProvider(uint32_t connectTimeoutMs, const std::string& bindAddress)
    : m_connectTimeoutMs(connectTimeoutMs)
    , m_bindAddress(bindAddress)
    , m_listenFd(-1)
    , m_listenPort(0)
{
}

TcpChannelProvider::~TcpChannelProvider() {
    stopListening();
}

bool TcpChannelProvider::parsePeerId(const std::string& peerId, std::string& host, uint16_t& port) {
    const size_t colon = peerId.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= peerId.size()) {
        return false;
    }

    const std::string portStr = peerId.substr(colon + 1);
    unsigned long value = 0;
    for (char c : portStr) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<unsigned long>(c - '0');
        if (value > 65535) {
            return false;
        }
    }
    if (value == 0) {
        return false;
    }

    host = peerId.substr(0, colon);
    port = static_cast<uint16_t>(value);
    return true;
}

bool TcpChannelProvider::listen(uint16_t port, ErrorInfo& error) {
    if (m_listenFd.load() >= 0) {
        error.set(ErrorKind::CHANNEL_ERROR, "Already listening");
        return false;
    }

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        error.set(ErrorKind::CHANNEL_ERROR, errnoString("socket()"));
        return false;
    }

    const int one = 1;
    (void)setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, m_bindAddress.c_str(), &addr.sin_addr) != 1) {
        ::close(fd);
        error.set(ErrorKind::CHANNEL_ERROR, "Invalid bind address: " + m_bindAddress);
        return false;
    }

    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        error.set(ErrorKind::CHANNEL_ERROR, errnoString("bind()"));
        ::close(fd);
        return false;
    }

    if (::listen(fd, LISTEN_BACKLOG) < 0) {
        error.set(ErrorKind::CHANNEL_ERROR, errnoString("listen()"));
        ::close(fd);
        return false;
    }

    sockaddr_in bound{};
    socklen_t boundLen = sizeof(bound);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &boundLen) < 0) {
        error.set(ErrorKind::CHANNEL_ERROR, errnoString("getsockname()"));
        ::close(fd);
        return false;
    }

    m_listenPort.store(ntohs(bound.sin_port));
    m_listenFd.store(fd);
    LOG_INFO("Listening on " << m_bindAddress << ":" << m_listenPort.load());
    return true;
}

void TcpChannelProvider::stopListening() {
    const int fd = m_listenFd.exchange(-1);
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
        ::close(fd);
        m_listenPort.store(0);
    }
}

std::shared_ptr<Channel> TcpChannelProvider::accept(ErrorInfo& error) {
    const int listenFd = m_listenFd.load();
    if (listenFd < 0) {
        error.set(ErrorKind::CHANNEL_ERROR, "Not listening");
        return nullptr;
    }

    sockaddr_in clientAddr{};
    socklen_t addrLen = sizeof(clientAddr);
    int clientFd = -1;
    do {
        clientFd = ::accept(listenFd, reinterpret_cast<sockaddr*>(&clientAddr), &addrLen);
    } while (clientFd < 0 && errno == EINTR);

    if (clientFd < 0) {
        error.set(ErrorKind::CHANNEL_ERROR, errnoString("accept()"));
        return nullptr;
    }

    const std::string peerId = describePeer(clientAddr);
    LOG_INFO("Accepted channel from " << peerId);
    return std::make_shared<TcpChannel>(clientFd, peerId);
}

std::shared_ptr<Channel> TcpChannelProvider::open(const std::string& peerId, ErrorInfo& error) {
    std::string host;
    uint16_t port = 0;
    if (!parsePeerId(peerId, host, port)) {
        error.set(ErrorKind::CHANNEL_ERROR, "Invalid peer id '" + peerId + "' (expected host:port)");
        return nullptr;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    const int gai = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result);
    if (gai != 0 || !result) {
        error.set(ErrorKind::CHANNEL_ERROR, "Cannot resolve '" + host + "': " + gai_strerror(gai));
        return nullptr;
    }
    sockaddr_in serverAddr{};
    std::memcpy(&serverAddr, result->ai_addr, sizeof(serverAddr));
    freeaddrinfo(result);

    const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        error.set(ErrorKind::CHANNEL_ERROR, errnoString("socket()"));
        return nullptr;
    }

    // Non-blocking connect so the attempt is bounded by m_connectTimeoutMs
    const int flags = fcntl(fd, F_GETFL, 0);
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);

    int rc = ::connect(fd, reinterpret_cast<sockaddr*>(&serverAddr), sizeof(serverAddr));
    if (rc < 0 && errno != EINPROGRESS) {
        error.set(ErrorKind::CHANNEL_ERROR, "Failed to connect to " + peerId + ": " + std::strerror(errno));
        ::close(fd);
        return nullptr;
    }

    if (rc < 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        rc = ::poll(&pfd, 1, static_cast<int>(m_connectTimeoutMs));
        if (rc <= 0) {
            error.set(ErrorKind::CHANNEL_ERROR, "Connect to " + peerId + " timed out");
            ::close(fd);
            return nullptr;
        }
        int soError = 0;
        socklen_t len = sizeof(soError);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) < 0 || soError != 0) {
            error.set(ErrorKind::CHANNEL_ERROR,
                      "Failed to connect to " + peerId + ": " + std::strerror(soError != 0 ? soError : errno));
            ::close(fd);
            return nullptr;
        }
    }

    (void)fcntl(fd, F_SETFL, flags);
    LOG_INFO("Opened channel to " << peerId);
    return std::make_shared<TcpChannel>(fd, peerId);
}

}  // namespace PeerDrop
