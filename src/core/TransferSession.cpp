/**
 * @file TransferSession.cpp
 * @brief Sender side of one file-set transfer to one connected peer
 */

#include "peerdrop/TransferSession.h"
#include "peerdrop/ChunkCodec.h"
#include "peerdrop/UuidGenerator.h"
#include "peerdrop/Debug.h"
#include <chrono>

namespace PeerDrop {

//=============================================================================
// Helper Functions
//=============================================================================

/**
 * @brief Generate unique session ID
 * @return Random session ID string with "sess_" prefix
 */
std::string TransferSession::generateSessionId() {
    return UuidGenerator::generateWithPrefix("sess_");
}

//=============================================================================
// TransferSession: Constructor / Destructor
//=============================================================================

TransferSession::TransferSession(FileProgressCallback progressCb,
                                 SessionCompletionCallback completionCb)
    : m_sessionId(generateSessionId())
    , m_state(SenderState::IDLE)
    , m_pacingMs(CHUNK_PACING_MS)
    , m_bytesSent(0)
    , m_isRunning(false)
    , m_progressCallback(std::move(progressCb))
    , m_completionCallback(std::move(completionCb))
{
}

TransferSession::~TransferSession() {
    wait();
}

//=============================================================================
// TransferSession: start()
//=============================================================================

bool TransferSession::start(std::vector<SourceFile> files,
                            std::shared_ptr<Channel> channel,
                            ErrorInfo& error) {
    if (m_state.load() != SenderState::IDLE) {
        error.set(ErrorKind::INVALID_STATE,
                  "Session " + m_sessionId + " already started (state " +
                  senderStateToString(m_state.load()) + ")");
        return false;
    }

    if (!channel || !channel->isOpen()) {
        error.set(ErrorKind::NO_ACTIVE_CHANNEL, "No open channel to send on");
        return false;
    }

    if (files.empty()) {
        error.set(ErrorKind::NO_FILES_SELECTED, "No files selected");
        return false;
    }

    std::vector<FileDescriptor> descriptors;
    descriptors.reserve(files.size());
    for (const auto& file : files) {
        if (file.descriptor.size != file.data.size()) {
            error.set(ErrorKind::INVALID_ARGUMENT,
                      "Descriptor of '" + file.descriptor.name + "' declares " +
                      std::to_string(file.descriptor.size) + " bytes but " +
                      std::to_string(file.data.size()) + " were supplied");
            return false;
        }
        descriptors.push_back(file.descriptor);
    }

    if (!channel->send(TransferEnvelope::metadata(std::move(descriptors)), error)) {
        LOG_ERROR("Session " << m_sessionId << ": metadata send failed: " << error.toString());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_progressMutex);
        m_progress.clear();
        for (uint32_t i = 0; i < files.size(); ++i) {
            m_progress[i] = 0;
        }
    }

    LOG_INFO("Session " << m_sessionId << ": announced " << files.size()
             << " file(s) to " << channel->getPeerId());

    m_files = std::move(files);
    m_channel = std::move(channel);
    m_state.store(SenderState::METADATA_SENT);
    return true;
}

//=============================================================================
// TransferSession: sendAll()
//=============================================================================

bool TransferSession::sendAll(ErrorInfo& error) {
    if (m_state.load() != SenderState::METADATA_SENT) {
        error.set(ErrorKind::INVALID_STATE,
                  "Cannot send chunks in state " + senderStateToString(m_state.load()));
        return false;
    }

    m_state.store(SenderState::TRANSFERRING);

    const auto pause = std::chrono::milliseconds(m_pacingMs.load());
    bool firstChunk = true;

    for (uint32_t fileIndex = 0; fileIndex < m_files.size(); ++fileIndex) {
        const SourceFile& file = m_files[fileIndex];
        const ChunkSequence chunks = ChunkCodec::split(file.data);
        const uint32_t totalChunks = chunks.totalChunks();

        if (totalChunks == 0) {
            setProgress(fileIndex, 100);
            continue;
        }

        for (const ChunkSlice& slice : chunks) {
            if (!firstChunk && pause.count() > 0) {
                std::this_thread::sleep_for(pause);
            }
            firstChunk = false;

            ChunkMessage message;
            message.fileIndex = fileIndex;
            message.chunkIndex = slice.chunkIndex;
            message.totalChunks = totalChunks;
            message.payload = slice.toVector();

            if (!m_channel->send(TransferEnvelope::chunk(std::move(message)), error)) {
                LOG_ERROR("Session " << m_sessionId << ": chunk " << slice.chunkIndex
                          << "/" << totalChunks << " of '" << file.descriptor.name
                          << "' failed: " << error.toString());
                return false;
            }

            m_bytesSent.fetch_add(slice.size);
            setProgress(fileIndex, ChunkCodec::progressPercent(slice.chunkIndex + 1, totalChunks));
        }

        LOG_DEBUG("Session " << m_sessionId << ": sent '" << file.descriptor.name
                  << "' (" << totalChunks << " chunks)");
    }

    if (!m_channel->send(TransferEnvelope::complete(), error)) {
        LOG_ERROR("Session " << m_sessionId << ": complete send failed: " << error.toString());
        return false;
    }

    m_state.store(SenderState::COMPLETED);
    LOG_INFO("Session " << m_sessionId << ": transfer complete, "
             << m_bytesSent.load() << " bytes sent");
    return true;
}

//=============================================================================
// TransferSession: run() / wait()
//=============================================================================

bool TransferSession::run() {
    if (m_isRunning.load() || m_state.load() != SenderState::METADATA_SENT) {
        return false;
    }

    // A finished worker from an earlier run is still joinable
    if (m_workerThread.joinable()) {
        m_workerThread.join();
    }

    m_isRunning.store(true);
    m_workerThread = std::thread(&TransferSession::workerThreadFunc, this);
    return true;
}

void TransferSession::wait() {
    if (m_workerThread.joinable() && m_workerThread.get_id() != std::this_thread::get_id()) {
        m_workerThread.join();
    }
}

void TransferSession::workerThreadFunc() {
    ErrorInfo error;
    bool success = false;

    try {
        success = sendAll(error);
    } catch (const std::exception& e) {
        error.set(ErrorKind::CHANNEL_ERROR, std::string("Sender exception: ") + e.what());
        LOG_ERROR("Session " << m_sessionId << ": " << error.toString());
    }

    m_isRunning.store(false);

    if (m_completionCallback) {
        m_completionCallback(m_sessionId, success, error);
    }
}

//=============================================================================
// TransferSession: Progress
//=============================================================================

void TransferSession::setProgress(uint32_t fileIndex, int percent) {
    {
        std::lock_guard<std::mutex> lock(m_progressMutex);
        int& current = m_progress[fileIndex];
        // Monotonic: unchanged or lower values are not reported
        if (percent <= current) {
            return;
        }
        current = percent;
    }

    if (m_progressCallback) {
        m_progressCallback(m_sessionId, fileIndex, percent);
    }
}

ProgressSnapshot TransferSession::getProgress() const {
    std::lock_guard<std::mutex> lock(m_progressMutex);
    return m_progress;
}

int TransferSession::getFileProgress(uint32_t fileIndex) const {
    std::lock_guard<std::mutex> lock(m_progressMutex);
    auto it = m_progress.find(fileIndex);
    return it == m_progress.end() ? -1 : it->second;
}

}  // namespace PeerDrop
