/**
 * @file ReceiveSession.cpp
 * @brief Receiver side of the transfer protocol: reassembly and completion
 */

#include "peerdrop/ReceiveSession.h"
#include "peerdrop/Debug.h"
#include <new>
#include <stdexcept>

namespace PeerDrop {

ReceiveSession::ReceiveSession(FileReceivedCallback fileCb,
                               TransferCompleteCallback completeCb,
                               ReceiveProgressCallback progressCb,
                               ProtocolErrorCallback protocolErrorCb)
    : m_state(ReceiverState::AWAITING_METADATA)
    , m_filesReceived(0)
    , m_completedSets(0)
    , m_violations(0)
    , m_fileCallback(std::move(fileCb))
    , m_completeCallback(std::move(completeCb))
    , m_progressCallback(std::move(progressCb))
    , m_protocolErrorCallback(std::move(protocolErrorCb))
{
}

//=============================================================================
// Envelope dispatch
//=============================================================================

bool ReceiveSession::handleEnvelope(const TransferEnvelope& envelope, ErrorInfo& error) {
    std::vector<Event> events;
    bool accepted = false;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        try {
            switch (envelope.getType()) {
                case EnvelopeType::METADATA:
                    accepted = onMetadata(envelope.getFiles(), events, error);
                    break;
                case EnvelopeType::CHUNK:
                    accepted = onChunk(envelope.getChunk(), events, error);
                    break;
                case EnvelopeType::COMPLETE:
                    accepted = onComplete(events, error);
                    break;
                default:
                    accepted = violation("Unknown envelope type", events, error);
                    break;
            }
        } catch (const std::bad_alloc&) {
            // Handlers commit state only after their allocations succeed
            events.clear();
            accepted = violation("Out of memory while handling " +
                                 envelopeTypeToString(envelope.getType()) + " envelope",
                                 events, error);
        }
    }

    for (auto& event : events) {
        event();
    }
    return accepted;
}

bool ReceiveSession::onMetadata(const std::vector<FileDescriptor>& files,
                                std::vector<Event>& events,
                                ErrorInfo& error) {
    if (m_state == ReceiverState::RECEIVING && !m_buffers.empty()) {
        return violation("Metadata received while " + std::to_string(m_buffers.size()) +
                         " file(s) are still being received", events, error);
    }

    // Validate the whole list before touching the current state
    std::vector<uint32_t> chunkCounts;
    chunkCounts.reserve(files.size());
    for (const auto& file : files) {
        try {
            chunkCounts.push_back(ChunkCodec::totalChunks(file.size));
        } catch (const std::invalid_argument& e) {
            return violation("Metadata for '" + file.name + "' rejected: " + e.what(), events, error);
        }
    }

    // Build the new set aside; nothing below may leave a half-replaced state
    std::map<uint32_t, ReassemblyBuffer> buffers;
    std::map<uint32_t, int> progress;
    std::vector<bool> finished(files.size(), false);
    std::vector<Event> pending;
    uint32_t filesReceived = 0;

    for (uint32_t i = 0; i < files.size(); ++i) {
        if (chunkCounts[i] == 0) {
            // Nothing will follow for an empty file
            progress[i] = 100;
            finished[i] = true;
            ++filesReceived;
            queueProgress(i, 100, pending);

            ReceivedFile empty;
            empty.fileIndex = i;
            empty.descriptor = files[i];
            queueFile(std::move(empty), pending);
            continue;
        }

        ReassemblyBuffer buffer;
        buffer.descriptor = files[i];
        buffer.totalChunks = chunkCounts[i];
        buffers.emplace(i, std::move(buffer));
        progress[i] = 0;
    }
    std::vector<FileDescriptor> descriptors = files;
    events.reserve(events.size() + pending.size());

    if (m_state == ReceiverState::RECEIVING) {
        LOG_WARNING("New file set announced before Complete of the previous one");
    }

    m_files.swap(descriptors);
    m_buffers.swap(buffers);
    m_progress.swap(progress);
    m_finished.swap(finished);
    m_filesReceived = filesReceived;
    m_state = ReceiverState::RECEIVING;
    for (auto& event : pending) {
        events.push_back(std::move(event));
    }

    LOG_INFO("Receiving file set of " << m_files.size() << " file(s)");
    return true;
}

bool ReceiveSession::onChunk(const ChunkMessage& chunk,
                             std::vector<Event>& events,
                             ErrorInfo& error) {
    if (m_state != ReceiverState::RECEIVING) {
        return violation("Chunk received in state " + receiverStateToString(m_state),
                         events, error);
    }

    if (chunk.fileIndex >= m_files.size()) {
        return violation("Chunk for undeclared file index " + std::to_string(chunk.fileIndex),
                         events, error);
    }

    if (m_finished[chunk.fileIndex]) {
        return violation("Chunk for already completed file index " + std::to_string(chunk.fileIndex),
                         events, error);
    }

    auto it = m_buffers.find(chunk.fileIndex);
    if (it == m_buffers.end()) {
        return violation("No reassembly buffer for file index " + std::to_string(chunk.fileIndex),
                         events, error);
    }
    ReassemblyBuffer& buffer = it->second;

    if (chunk.totalChunks != buffer.totalChunks) {
        return violation("Chunk declares " + std::to_string(chunk.totalChunks) +
                         " total chunks, metadata implies " + std::to_string(buffer.totalChunks),
                         events, error);
    }
    if (chunk.chunkIndex >= buffer.totalChunks) {
        return violation("Chunk index " + std::to_string(chunk.chunkIndex) +
                         " out of range (total " + std::to_string(buffer.totalChunks) + ")",
                         events, error);
    }
    if (chunk.payload.size() > CHUNK_SIZE) {
        return violation("Chunk payload of " + std::to_string(chunk.payload.size()) +
                         " bytes exceeds chunk size", events, error);
    }

    std::vector<uint8_t> payload = chunk.payload;
    const auto stored = buffer.chunks.insert_or_assign(chunk.chunkIndex, std::move(payload));
    if (!stored.second) {
        LOG_WARNING("Duplicate chunk " << chunk.chunkIndex << " for file index " << chunk.fileIndex);
    }
    const auto receivedCount = static_cast<uint32_t>(buffer.chunks.size());

    const int percent = ChunkCodec::progressPercent(receivedCount, buffer.totalChunks);
    if (percent > m_progress[chunk.fileIndex]) {
        m_progress[chunk.fileIndex] = percent;
        queueProgress(chunk.fileIndex, percent, events);
    }

    if (receivedCount < buffer.totalChunks) {
        return true;
    }

    // Last chunk: drain the buffer whatever the outcome
    ReassemblyBuffer done = std::move(buffer);
    m_buffers.erase(it);
    m_finished[chunk.fileIndex] = true;

    ReceivedFile file;
    file.fileIndex = chunk.fileIndex;
    file.descriptor = done.descriptor;
    ChunkCodec::Slots slots;
    slots.reserve(done.totalChunks);
    for (auto& entry : done.chunks) {
        slots.emplace_back(std::move(entry.second));
    }
    if (!ChunkCodec::reassemble(slots, done.totalChunks, file.data, error)) {
        LOG_ERROR("Reassembly of '" << done.descriptor.name << "' failed: " << error.toString());
        return false;
    }

    if (file.data.size() != done.descriptor.size) {
        return violation("Assembled '" + done.descriptor.name + "' is " +
                         std::to_string(file.data.size()) + " bytes, metadata declared " +
                         std::to_string(done.descriptor.size), events, error);
    }

    ++m_filesReceived;
    LOG_INFO("Received '" << file.descriptor.name << "' (" << file.data.size() << " bytes)");
    queueFile(std::move(file), events);
    return true;
}

bool ReceiveSession::onComplete(std::vector<Event>& events, ErrorInfo& error) {
    if (m_state != ReceiverState::RECEIVING) {
        return violation("Complete received in state " + receiverStateToString(m_state),
                         events, error);
    }

    const size_t openBuffers = m_buffers.size();
    const uint32_t filesReceived = m_filesReceived;
    const bool allReceived = (filesReceived == m_files.size());

    m_buffers.clear();
    m_state = ReceiverState::IDLE;
    ++m_completedSets;

    if (m_completeCallback) {
        auto callback = m_completeCallback;
        events.push_back([callback, filesReceived, allReceived] {
            callback(filesReceived, allReceived);
        });
    }

    LOG_INFO("File set complete: " << filesReceived << "/" << m_files.size() << " file(s) received");

    if (openBuffers > 0) {
        return violation("Complete received with " + std::to_string(openBuffers) +
                         " file(s) unfinished; partial data discarded", events, error);
    }
    return true;
}

//=============================================================================
// Channel events
//=============================================================================

void ReceiveSession::handleChannelClosed() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_buffers.empty()) {
        LOG_WARNING("Channel closed with " << m_buffers.size()
                    << " unfinished file(s); partial data discarded");
    }
    m_buffers.clear();
    if (m_state == ReceiverState::RECEIVING) {
        m_state = ReceiverState::AWAITING_METADATA;
    }
}

void ReceiveSession::handleChannelError(const ErrorInfo& error) {
    LOG_WARNING("Channel error: " << error.toString());

    if (error.kind != ErrorKind::PROTOCOL_VIOLATION) {
        return;
    }

    ProtocolErrorCallback callback;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_violations;
        callback = m_protocolErrorCallback;
    }
    if (callback) {
        callback(error);
    }
}

ChannelHandlers ReceiveSession::makeChannelHandlers() {
    ChannelHandlers handlers;
    handlers.onData = [this](const TransferEnvelope& envelope) {
        ErrorInfo error;
        (void)handleEnvelope(envelope, error);  // Rejections are reported through the callback
    };
    handlers.onClose = [this] { handleChannelClosed(); };
    handlers.onError = [this](const ErrorInfo& error) { handleChannelError(error); };
    return handlers;
}

void ReceiveSession::attach(const std::shared_ptr<Channel>& channel) {
    if (channel) {
        channel->setHandlers(makeChannelHandlers());
    }
}

//=============================================================================
// Helpers (m_mutex held)
//=============================================================================

bool ReceiveSession::violation(const std::string& message,
                               std::vector<Event>& events,
                               ErrorInfo& error) {
    error.set(ErrorKind::PROTOCOL_VIOLATION, message);
    ++m_violations;
    LOG_WARNING(error.toString());

    if (m_protocolErrorCallback) {
        auto callback = m_protocolErrorCallback;
        ErrorInfo copy = error;
        events.push_back([callback, copy] { callback(copy); });
    }
    return false;
}

void ReceiveSession::queueProgress(uint32_t fileIndex, int percent, std::vector<Event>& events) {
    if (m_progressCallback) {
        auto callback = m_progressCallback;
        events.push_back([callback, fileIndex, percent] { callback(fileIndex, percent); });
    }
}

void ReceiveSession::queueFile(ReceivedFile file, std::vector<Event>& events) {
    if (m_fileCallback) {
        auto callback = m_fileCallback;
        auto shared = std::make_shared<ReceivedFile>(std::move(file));
        events.push_back([callback, shared] { callback(*shared); });
    }
}

//=============================================================================
// Status Query Methods
//=============================================================================

ReceiverState ReceiveSession::getState() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

std::map<uint32_t, int> ReceiveSession::getProgress() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_progress;
}

std::vector<FileDescriptor> ReceiveSession::getFiles() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_files;
}

size_t ReceiveSession::getOpenBufferCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_buffers.size();
}

uint32_t ReceiveSession::getFilesReceived() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_filesReceived;
}

uint32_t ReceiveSession::getCompletedSetCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_completedSets;
}

uint32_t ReceiveSession::getViolationCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_violations;
}

}  // namespace PeerDrop
