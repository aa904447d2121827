/**
 * @file ReceiveSession.h
 * @brief Receiver side of the transfer protocol: reassembly and completion
 */

#pragma once

#include "config.h"
#include "Channel.h"
#include "ChunkCodec.h"
#include "ErrorCodes.h"
#include "TransferEnvelope.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace PeerDrop {

/**
 * @brief State of a receiving session
 */
enum class ReceiverState : uint8_t {
    AWAITING_METADATA,  ///< No file set announced yet
    RECEIVING,          ///< File set announced, chunks flowing
    IDLE                ///< Complete received; the next Metadata starts a new set
};

inline std::string receiverStateToString(ReceiverState state) {
    switch (state) {
        case ReceiverState::AWAITING_METADATA: return "AwaitingMetadata";
        case ReceiverState::RECEIVING:         return "Receiving";
        case ReceiverState::IDLE:              return "Idle";
        default:                               return "Unknown";
    }
}

/**
 * @brief One fully reassembled file
 */
struct ReceivedFile {
    uint32_t fileIndex = 0;
    FileDescriptor descriptor;
    std::vector<uint8_t> data;
};

/// Called once per assembled file, in completion order
using FileReceivedCallback = std::function<void(const ReceivedFile& file)>;

/**
 * @brief Called once per file set when Complete arrives
 * @param filesReceived Number of files emitted for the set
 * @param allReceived True if every announced file was emitted
 */
using TransferCompleteCallback = std::function<void(uint32_t filesReceived, bool allReceived)>;

/// Called each time the percent of one file changes
using ReceiveProgressCallback = std::function<void(uint32_t fileIndex, int percent)>;

/// Called for every protocol violation (the offending envelope is dropped)
using ProtocolErrorCallback = std::function<void(const ErrorInfo& error)>;

/**
 * @class ReceiveSession
 * @brief Consumes an envelope stream and emits assembled files
 *
 * One ReassemblyBuffer per announced file lives from Metadata until its
 * last chunk arrives. A buffer holds only the chunks received so far, so
 * its memory follows the bytes on the wire rather than the announced
 * size. The assembled bytes are emitted only when every chunk is present
 * and the length matches the announced size. Malformed or
 * out-of-order envelopes are reported as PROTOCOL_VIOLATION and dropped;
 * the session keeps going.
 *
 * Thread Safety: every method is thread-safe. Callbacks are invoked
 * outside the internal lock, on the thread that delivered the envelope.
 *
 * The session must outlive any channel it is attached to.
 */
class ReceiveSession {
public:
    explicit ReceiveSession(FileReceivedCallback fileCb = nullptr,
                            TransferCompleteCallback completeCb = nullptr,
                            ReceiveProgressCallback progressCb = nullptr,
                            ProtocolErrorCallback protocolErrorCb = nullptr);

    ReceiveSession(const ReceiveSession&) = delete;
    ReceiveSession& operator=(const ReceiveSession&) = delete;

    /**
     * @brief Process one envelope
     * @param envelope Envelope received from the channel
     * @param error PROTOCOL_VIOLATION if the envelope was rejected
     * @return true if the envelope was accepted
     */
    bool handleEnvelope(const TransferEnvelope& envelope, ErrorInfo& error);

    /**
     * @brief Abrupt end of the stream: discard every open buffer
     */
    void handleChannelClosed();

    /**
     * @brief Record a transport error reported by the channel
     */
    void handleChannelError(const ErrorInfo& error);

    /**
     * @brief Handlers that route channel events into this session
     */
    ChannelHandlers makeChannelHandlers();

    /**
     * @brief Subscribe to a channel's data, close and error events
     *
     * Replaces the channel's handlers; call before channel->start().
     */
    void attach(const std::shared_ptr<Channel>& channel);

    //=========================================================================
    // Status Query Methods
    //=========================================================================

    ReceiverState getState() const;

    /// Snapshot of the current file set's per-file percent
    std::map<uint32_t, int> getProgress() const;

    /// Descriptors of the current file set
    std::vector<FileDescriptor> getFiles() const;

    /// Files of the current set still being reassembled
    size_t getOpenBufferCount() const;

    /// Files emitted for the current set
    uint32_t getFilesReceived() const;

    /// Completion events fired since construction
    uint32_t getCompletedSetCount() const;

    /// Protocol violations reported since construction
    uint32_t getViolationCount() const;

private:
    /**
     * @brief Per-file reassembly state
     */
    struct ReassemblyBuffer {
        FileDescriptor descriptor;
        uint32_t totalChunks = 0;
        std::map<uint32_t, std::vector<uint8_t>> chunks;  ///< Only what has arrived, keyed by chunk index
    };

    using Event = std::function<void()>;

    // Handlers for each envelope tag (m_mutex held)
    bool onMetadata(const std::vector<FileDescriptor>& files, std::vector<Event>& events, ErrorInfo& error);
    bool onChunk(const ChunkMessage& chunk, std::vector<Event>& events, ErrorInfo& error);
    bool onComplete(std::vector<Event>& events, ErrorInfo& error);

    bool violation(const std::string& message, std::vector<Event>& events, ErrorInfo& error);
    void queueProgress(uint32_t fileIndex, int percent, std::vector<Event>& events);
    void queueFile(ReceivedFile file, std::vector<Event>& events);

    mutable std::mutex m_mutex;
    ReceiverState m_state;

    std::vector<FileDescriptor> m_files;
    std::map<uint32_t, ReassemblyBuffer> m_buffers;
    std::vector<bool> m_finished;  ///< Per file: emitted or failed, no further chunks accepted
    std::map<uint32_t, int> m_progress;
    uint32_t m_filesReceived;
    uint32_t m_completedSets;
    uint32_t m_violations;

    FileReceivedCallback m_fileCallback;
    TransferCompleteCallback m_completeCallback;
    ReceiveProgressCallback m_progressCallback;
    ProtocolErrorCallback m_protocolErrorCallback;
};

}  // namespace PeerDrop
