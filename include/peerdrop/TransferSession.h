/**
 * @file TransferSession.h
 * @brief Sender side of one file-set transfer to one connected peer
 */

#pragma once

#include "config.h"
#include "Channel.h"
#include "ErrorCodes.h"
#include "TransferEnvelope.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace PeerDrop {

//=============================================================================
// Session State
//=============================================================================

/**
 * @brief State of a sending session
 */
enum class SenderState : uint8_t {
    IDLE,           ///< Created, nothing sent
    METADATA_SENT,  ///< File list delivered, no chunk sent yet
    TRANSFERRING,   ///< Chunk stream in progress
    COMPLETED       ///< Complete envelope sent
};

/**
 * @brief Convert SenderState to string
 */
inline std::string senderStateToString(SenderState state) {
    switch (state) {
        case SenderState::IDLE:          return "Idle";
        case SenderState::METADATA_SENT: return "MetadataSent";
        case SenderState::TRANSFERRING:  return "Transferring";
        case SenderState::COMPLETED:     return "Completed";
        default:                         return "Unknown";
    }
}

/**
 * @brief One file selected for sending: its descriptor and its bytes
 *
 * descriptor.size must equal data.size().
 */
struct SourceFile {
    FileDescriptor descriptor;
    std::vector<uint8_t> data;
};

/// fileIndex -> percent (0-100)
using ProgressSnapshot = std::map<uint32_t, int>;

//=============================================================================
// Callback Types
//=============================================================================

/**
 * @brief Progress callback function type
 *
 * Called each time the percent of one file changes.
 *
 * @param sessionId Unique session identifier
 * @param fileIndex Position of the file in the Metadata list
 * @param percent New percent (0-100)
 */
using FileProgressCallback = std::function<void(const std::string& sessionId,
                                                uint32_t fileIndex,
                                                int percent)>;

/**
 * @brief Completion callback function type
 *
 * Called once when a run() worker finishes.
 *
 * @param sessionId Unique session identifier
 * @param success True if the Complete envelope was sent
 * @param error Failure details (NONE on success)
 */
using SessionCompletionCallback = std::function<void(const std::string& sessionId,
                                                     bool success,
                                                     const ErrorInfo& error)>;

//=============================================================================
// TransferSession Class
//=============================================================================

/**
 * @class TransferSession
 * @brief Drives Metadata, then the chunk stream, then Complete over a Channel
 *
 * Files are sent sequentially in input order and chunks in ascending
 * index order, with a fixed pause between chunks. A failed channel write
 * ends the attempt with CHANNEL_ERROR and leaves the state where it was;
 * nothing is retried. Closing the channel is the way to cancel.
 *
 * Thread Safety:
 * - getState(), getProgress() and getFileProgress() are thread-safe
 * - start(), sendAll() and run() must not be called concurrently
 *
 * Usage:
 * @code
 * TransferSession session(onProgress, onComplete);
 * ErrorInfo error;
 * if (session.start(std::move(files), channel, error)) {
 *     session.run();
 *     session.wait();
 * }
 * @endcode
 */
class TransferSession {
public:
    /**
     * @param progressCb Optional per-file progress callback
     * @param completionCb Optional completion callback (run() only)
     */
    explicit TransferSession(FileProgressCallback progressCb = nullptr,
                             SessionCompletionCallback completionCb = nullptr);

    /**
     * @brief Destructor
     *
     * Waits for a running worker thread. Close the channel first to make
     * the worker stop early.
     */
    ~TransferSession();

    // Prevent copying
    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    //=========================================================================
    // Session Control Methods
    //=========================================================================

    /**
     * @brief Announce the file set to the peer
     * @param files Files to send, in Metadata order
     * @param channel Open channel to the receiver
     * @param error NO_ACTIVE_CHANNEL, NO_FILES_SELECTED, INVALID_ARGUMENT,
     *              INVALID_STATE or CHANNEL_ERROR
     * @return true if the Metadata envelope was sent (state METADATA_SENT)
     *
     * Only valid from IDLE.
     */
    bool start(std::vector<SourceFile> files,
               std::shared_ptr<Channel> channel,
               ErrorInfo& error);

    /**
     * @brief Send every chunk of every file, then Complete
     * @param error CHANNEL_ERROR on a failed write, INVALID_STATE if
     *              start() has not succeeded
     * @return true if the session reached COMPLETED
     *
     * Blocks for the whole transfer, including pacing pauses.
     */
    bool sendAll(ErrorInfo& error);

    /**
     * @brief Run sendAll() on a dedicated thread
     * @return false if already running or not in METADATA_SENT
     *
     * The completion callback reports the outcome.
     */
    bool run();

    /**
     * @brief Wait for a run() worker to finish
     */
    void wait();

    /**
     * @brief Pause between consecutive chunks (default CHUNK_PACING_MS)
     *
     * 0 disables pacing. Takes effect for the next sendAll().
     */
    void setChunkPacingMs(uint32_t pacingMs) { m_pacingMs.store(pacingMs); }
    uint32_t getChunkPacingMs() const { return m_pacingMs.load(); }

    //=========================================================================
    // Status Query Methods
    //=========================================================================

    SenderState getState() const { return m_state.load(); }

    const std::string& getSessionId() const { return m_sessionId; }

    /**
     * @brief Snapshot of every file's percent
     */
    ProgressSnapshot getProgress() const;

    /**
     * @brief Percent of one file, or -1 if fileIndex is unknown
     */
    int getFileProgress(uint32_t fileIndex) const;

    /// File payload bytes handed to the channel so far
    uint64_t getBytesSent() const { return m_bytesSent.load(); }

    /// Number of files in the current set
    size_t getFileCount() const { return m_files.size(); }

    bool isRunning() const { return m_isRunning.load(); }

private:
    void workerThreadFunc();

    /**
     * @brief Record a file's percent and notify on change
     */
    void setProgress(uint32_t fileIndex, int percent);

    static std::string generateSessionId();

    // Identity
    std::string m_sessionId;
    std::atomic<SenderState> m_state;

    // Transfer inputs
    std::vector<SourceFile> m_files;
    std::shared_ptr<Channel> m_channel;
    std::atomic<uint32_t> m_pacingMs;

    // Progress tracking
    mutable std::mutex m_progressMutex;
    ProgressSnapshot m_progress;
    std::atomic<uint64_t> m_bytesSent;

    // Thread management
    std::thread m_workerThread;
    std::atomic<bool> m_isRunning;

    // Callbacks
    FileProgressCallback m_progressCallback;
    SessionCompletionCallback m_completionCallback;
};

}  // namespace PeerDrop
