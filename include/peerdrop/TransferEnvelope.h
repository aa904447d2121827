/**
 * @file TransferEnvelope.h
 * @brief Protocol data model: file descriptors, chunks and envelopes
 */

#pragma once

#include "config.h"
#include <cstdint>
#include <string>
#include <vector>

namespace PeerDrop {

/**
 * @brief Envelope tags of the PeerDrop transfer protocol
 *
 * One METADATA envelope precedes every CHUNK of a file set, and one
 * COMPLETE envelope follows the last CHUNK of the last file.
 */
enum class EnvelopeType : uint8_t {
    METADATA = 0x01,  ///< File list of the transfer
    CHUNK = 0x02,     ///< One slice of one file
    COMPLETE = 0x03   ///< End of the file set
};

/**
 * @brief Get human-readable name of an envelope type
 */
inline std::string envelopeTypeToString(EnvelopeType type) {
    switch (type) {
        case EnvelopeType::METADATA: return "METADATA";
        case EnvelopeType::CHUNK:    return "CHUNK";
        case EnvelopeType::COMPLETE: return "COMPLETE";
        default:                     return "UNKNOWN";
    }
}

/**
 * @brief Check that a raw tag byte names a known envelope type
 */
inline bool isValidEnvelopeType(uint8_t raw) {
    return raw >= static_cast<uint8_t>(EnvelopeType::METADATA) &&
           raw <= static_cast<uint8_t>(EnvelopeType::COMPLETE);
}

/**
 * @brief Descriptive metadata of one file in a transfer
 *
 * Produced once per file when a transfer starts and never modified after.
 */
struct FileDescriptor {
    std::string name;          ///< File name without directory components
    uint64_t size = 0;         ///< Size in bytes
    std::string mimeType;      ///< MIME type (may be empty)
    int64_t lastModified = 0;  ///< Last modification time, ms since epoch

    bool operator==(const FileDescriptor& other) const {
        return name == other.name && size == other.size &&
               mimeType == other.mimeType && lastModified == other.lastModified;
    }
    bool operator!=(const FileDescriptor& other) const { return !(*this == other); }
};

/**
 * @brief One chunk of one file
 *
 * payload.size() <= CHUNK_SIZE; only the last chunk of a file may be shorter.
 */
struct ChunkMessage {
    uint32_t fileIndex = 0;    ///< Position of the file in the Metadata list
    uint32_t chunkIndex = 0;   ///< Position of this chunk, in [0, totalChunks)
    uint32_t totalChunks = 0;  ///< ceil(file size / CHUNK_SIZE)
    std::vector<uint8_t> payload;
};

/**
 * @class TransferEnvelope
 * @brief Tagged union of the three protocol messages
 *
 * Consumers switch on getType() and then read the accessor that belongs to
 * that tag. Accessors of other variants return empty values.
 */
class TransferEnvelope {
public:
    /**
     * @brief Default-constructed envelope is a COMPLETE marker
     */
    TransferEnvelope() : m_type(EnvelopeType::COMPLETE) {}

    static TransferEnvelope metadata(std::vector<FileDescriptor> files) {
        TransferEnvelope env(EnvelopeType::METADATA);
        env.m_files = std::move(files);
        return env;
    }

    static TransferEnvelope chunk(ChunkMessage chunk) {
        TransferEnvelope env(EnvelopeType::CHUNK);
        env.m_chunk = std::move(chunk);
        return env;
    }

    static TransferEnvelope complete() {
        return TransferEnvelope(EnvelopeType::COMPLETE);
    }

    EnvelopeType getType() const { return m_type; }

    /// File list (METADATA only)
    const std::vector<FileDescriptor>& getFiles() const { return m_files; }

    /// Chunk message (CHUNK only)
    const ChunkMessage& getChunk() const { return m_chunk; }

private:
    explicit TransferEnvelope(EnvelopeType type) : m_type(type) {}

    EnvelopeType m_type;
    std::vector<FileDescriptor> m_files;
    ChunkMessage m_chunk;
};

}  // namespace PeerDrop
