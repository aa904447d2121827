/**
 * @file EnvelopeCodec.h
 * @brief Binary framing of TransferEnvelope for byte-oriented channels
 */

#pragma once

#include "config.h"
#include "ErrorCodes.h"
#include "TransferEnvelope.h"
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace PeerDrop {

/**
 * @brief Decoded fixed-size frame header
 */
struct FrameHeader {
    uint32_t magic = 0;
    uint8_t envelopeType = 0;
    uint32_t payloadLength = 0;
};

/**
 * @class EnvelopeCodec
 * @brief Encodes envelopes to length-prefixed frames and back
 *
 * Frame layout (all integers big-endian):
 * @code
 *   magic(4) | type(1) | payloadLength(4) | payload(payloadLength)
 * @endcode
 *
 * Payloads:
 * - METADATA: UTF-8 JSON array of file descriptors
 * - CHUNK:    fileIndex(4) | chunkIndex(4) | totalChunks(4) | dataLength(4) | data
 * - COMPLETE: empty
 *
 * Chunk data is copied byte for byte and never passes through a text
 * encoding, so arbitrary binary content (NUL bytes, invalid UTF-8) survives.
 *
 * Thread Safety: all methods are stateless and thread-safe.
 */
class EnvelopeCodec {
public:
    /**
     * @brief Serialize an envelope into a complete frame
     * @param envelope Envelope to encode
     * @param frame Output buffer (replaced)
     * @param error Filled with PROTOCOL_VIOLATION if the envelope cannot be framed
     * @return true if successful
     */
    static bool encode(const TransferEnvelope& envelope,
                       std::vector<uint8_t>& frame,
                       ErrorInfo& error);

    /**
     * @brief Parse one complete frame
     * @param data Frame bytes (header + payload, nothing more)
     * @param size Number of bytes
     * @param envelope Output envelope
     * @param error Filled with PROTOCOL_VIOLATION on malformed input
     * @return true if successful
     */
    static bool decode(const uint8_t* data, size_t size,
                       TransferEnvelope& envelope,
                       ErrorInfo& error);

    /**
     * @brief Parse and validate the fixed frame header
     * @param data At least FRAME_HEADER_SIZE bytes
     * @param header Output header
     * @param error Filled on bad magic, unknown type or oversized payload
     * @return true if the header is valid
     */
    static bool decodeHeader(const uint8_t* data,
                             FrameHeader& header,
                             ErrorInfo& error);

    /**
     * @brief Parse a frame payload for an already validated header
     */
    static bool decodePayload(const FrameHeader& header,
                              const uint8_t* payload,
                              TransferEnvelope& envelope,
                              ErrorInfo& error);

    //=========================================================================
    // JSON helpers (Metadata payload)
    //=========================================================================

    static nlohmann::json descriptorToJson(const FileDescriptor& descriptor);

    /**
     * @brief Parse one descriptor object
     * @return false if a required field is missing or has the wrong type
     */
    static bool descriptorFromJson(const nlohmann::json& j,
                                   FileDescriptor& descriptor,
                                   std::string& errorMsg);

private:
    EnvelopeCodec() = delete;
};

}  // namespace PeerDrop
