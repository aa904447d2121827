/**
 * @file TcpChannel.h
 * @brief Envelope channel over a TCP stream socket (POSIX)
 */

#pragma once

#include "config.h"
#include "Channel.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace PeerDrop {

/**
 * @brief Send exactly N bytes over socket (handles partial sends)
 * @param fd Connected TCP socket
 * @param data Data to send
 * @param size Number of bytes to send
 * @param errorMsg Output error message
 * @return true if all bytes sent successfully
 */
bool sendExact(int fd, const uint8_t* data, size_t size, std::string& errorMsg);

/**
 * @brief Receive exactly N bytes from socket (handles partial receives)
 * @param fd Connected TCP socket
 * @param buffer Buffer to receive data
 * @param size Number of bytes to receive
 * @param errorMsg Output error message ("Connection closed by peer" on EOF)
 * @return true if all bytes received successfully
 */
bool recvExact(int fd, uint8_t* buffer, size_t size, std::string& errorMsg);

/**
 * @class TcpChannel
 * @brief Channel carrying EnvelopeCodec frames over one TCP connection
 *
 * start() spawns a reader thread that reads one frame header, then its
 * payload, decodes the envelope and fires onData. EOF fires onClose. A
 * frame whose payload does not decode fires onError and is dropped; the
 * channel stays open. A socket error or a bad frame header fires onError
 * followed by onClose, because a corrupt length prefix leaves the stream
 * unsynchronized.
 *
 * Instances must be owned by a std::shared_ptr (the providers create them
 * that way). A handler may release the last reference to its own channel.
 *
 * Thread Safety:
 * - send() is thread-safe (writes are serialized)
 * - close() is thread-safe and may be called from a handler
 */
class TcpChannel final : public Channel, public std::enable_shared_from_this<TcpChannel> {
public:
    /**
     * @brief Take ownership of a connected socket
     * @param fd Connected TCP socket (closed by the destructor)
     * @param peerId Peer identifier, "host:port" of the remote end
     */
    TcpChannel(int fd, const std::string& peerId);

    /**
     * @brief Destructor
     *
     * Closes the socket and joins the reader thread (detaches it instead
     * when the destructor runs on the reader thread itself).
     */
    ~TcpChannel() override;

    // Prevent copying
    TcpChannel(const TcpChannel&) = delete;
    TcpChannel& operator=(const TcpChannel&) = delete;

    bool send(const TransferEnvelope& envelope, ErrorInfo& error) override;
    bool start() override;
    void close() override;
    bool isOpen() const override;
    std::string getPeerId() const override { return m_peerId; }

private:
    void readerThreadFunc(std::weak_ptr<TcpChannel> weak);
    void finish(bool notifyClose);

    int m_fd;
    std::string m_peerId;

    std::atomic<bool> m_started;
    std::atomic<bool> m_closed;
    std::atomic<bool> m_closeNotified;

    std::mutex m_sendMutex;
    std::thread m_readerThread;
};

/**
 * @class TcpChannelProvider
 * @brief Opens and accepts TcpChannels
 *
 * Peer ids are "host:port" strings (IPv4 dotted quad or "localhost").
 *
 * Usage:
 * @code
 * TcpChannelProvider listener;
 * ErrorInfo error;
 * if (listener.listen(0, error)) {
 *     uint16_t port = listener.getListenPort();
 *     auto channel = listener.accept(error);
 * }
 * @endcode
 */
class TcpChannelProvider final : public ChannelProvider {
public:
    /**
     * @param connectTimeoutMs Timeout of outgoing connects
     * @param bindAddress Listen address (dotted quad)
     */
    explicit TcpChannelProvider(uint32_t connectTimeoutMs = CONNECT_TIMEOUT_MS,
                                const std::string& bindAddress = "0.0.0.0");
    ~TcpChannelProvider() override;

    TcpChannelProvider(const TcpChannelProvider&) = delete;
    TcpChannelProvider& operator=(const TcpChannelProvider&) = delete;

    /**
     * @brief Bind and listen
     * @param port TCP port, 0 lets the OS choose
     * @param error CHANNEL_ERROR on failure
     */
    bool listen(uint16_t port, ErrorInfo& error);

    /**
     * @brief Stop listening; a blocked accept() returns with an error
     */
    void stopListening();

    /**
     * @brief Port actually bound by listen() (0 if not listening)
     */
    uint16_t getListenPort() const { return m_listenPort.load(); }

    std::shared_ptr<Channel> open(const std::string& peerId, ErrorInfo& error) override;
    std::shared_ptr<Channel> accept(ErrorInfo& error) override;

    /**
     * @brief Split "host:port" into its parts
     * @return false if the port is missing or not a number in [1, 65535]
     */
    static bool parsePeerId(const std::string& peerId, std::string& host, uint16_t& port);

private:
    uint32_t m_connectTimeoutMs;
    std::string m_bindAddress;
    std::atomic<int> m_listenFd;
    std::atomic<uint16_t> m_listenPort;
};

}  // namespace PeerDrop
