/**
 * @file EnvelopeCodec.cpp
 * @brief Binary framing of TransferEnvelope
 */

#include "peerdrop/EnvelopeCodec.h"
#include <cstring>

namespace PeerDrop {

namespace {

void putU32(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

uint32_t getU32(const uint8_t* in) {
    return (static_cast<uint32_t>(in[0]) << 24) |
           (static_cast<uint32_t>(in[1]) << 16) |
           (static_cast<uint32_t>(in[2]) << 8) |
           static_cast<uint32_t>(in[3]);
}

void writeHeader(std::vector<uint8_t>& frame, EnvelopeType type, uint32_t payloadLength) {
    putU32(frame, FRAME_MAGIC);
    frame.push_back(static_cast<uint8_t>(type));
    putU32(frame, payloadLength);
}

} // anonymous namespace

//=============================================================================
// JSON helpers
//=============================================================================

nlohmann::json EnvelopeCodec::descriptorToJson(const FileDescriptor& descriptor) {
    nlohmann::json entry;
    entry["name"] = descriptor.name;
    entry["size"] = descriptor.size;
    entry["mime_type"] = descriptor.mimeType;
    entry["last_modified"] = descriptor.lastModified;
    return entry;
}

bool EnvelopeCodec::descriptorFromJson(const nlohmann::json& j,
                                       FileDescriptor& descriptor,
                                       std::string& errorMsg)
{
    if (!j.is_object()) {
        errorMsg = "file descriptor is not an object";
        return false;
    }
    if (!j.contains("name") || !j["name"].is_string()) {
        errorMsg = "file descriptor missing string 'name'";
        return false;
    }
    if (!j.contains("size") || !j["size"].is_number_unsigned()) {
        errorMsg = "file descriptor missing unsigned 'size'";
        return false;
    }

    descriptor = FileDescriptor{};
    descriptor.name = j["name"].get<std::string>();
    descriptor.size = j["size"].get<uint64_t>();

    if (j.contains("mime_type") && j["mime_type"].is_string()) {
        descriptor.mimeType = j["mime_type"].get<std::string>();
    }
    if (j.contains("last_modified") && j["last_modified"].is_number_integer()) {
        descriptor.lastModified = j["last_modified"].get<int64_t>();
    }
    return true;
}

//=============================================================================
// Encoding
//=============================================================================

bool EnvelopeCodec::encode(const TransferEnvelope& envelope,
                           std::vector<uint8_t>& frame,
                           ErrorInfo& error)
{
    frame.clear();

    switch (envelope.getType()) {
        case EnvelopeType::METADATA: {
            nlohmann::json files = nlohmann::json::array();
            for (const auto& descriptor : envelope.getFiles()) {
                files.push_back(descriptorToJson(descriptor));
            }
            // Names that are not valid UTF-8 travel with U+FFFD in place of the bad bytes
            const std::string text = files.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            if (text.size() > MAX_FRAME_PAYLOAD) {
                error.set(ErrorKind::PROTOCOL_VIOLATION,
                          "Metadata payload of " + std::to_string(text.size()) + " bytes exceeds frame limit");
                return false;
            }
            frame.reserve(FRAME_HEADER_SIZE + text.size());
            writeHeader(frame, EnvelopeType::METADATA, static_cast<uint32_t>(text.size()));
            frame.insert(frame.end(), text.begin(), text.end());
            return true;
        }

        case EnvelopeType::CHUNK: {
            const ChunkMessage& chunk = envelope.getChunk();
            const size_t payloadLength = CHUNK_PREFIX_SIZE + chunk.payload.size();
            if (payloadLength > MAX_FRAME_PAYLOAD) {
                error.set(ErrorKind::PROTOCOL_VIOLATION,
                          "Chunk payload of " + std::to_string(chunk.payload.size()) + " bytes exceeds frame limit");
                return false;
            }
            frame.reserve(FRAME_HEADER_SIZE + payloadLength);
            writeHeader(frame, EnvelopeType::CHUNK, static_cast<uint32_t>(payloadLength));
            putU32(frame, chunk.fileIndex);
            putU32(frame, chunk.chunkIndex);
            putU32(frame, chunk.totalChunks);
            putU32(frame, static_cast<uint32_t>(chunk.payload.size()));
            frame.insert(frame.end(), chunk.payload.begin(), chunk.payload.end());
            return true;
        }

        case EnvelopeType::COMPLETE:
            writeHeader(frame, EnvelopeType::COMPLETE, 0);
            return true;

        default:
            error.set(ErrorKind::PROTOCOL_VIOLATION, "Unknown envelope type");
            return false;
    }
}

//=============================================================================
// Decoding
//=============================================================================

bool EnvelopeCodec::decodeHeader(const uint8_t* data,
                                 FrameHeader& header,
                                 ErrorInfo& error)
{
    if (!data) {
        error.set(ErrorKind::PROTOCOL_VIOLATION, "Null frame header");
        return false;
    }

    header.magic = getU32(data);
    header.envelopeType = data[4];
    header.payloadLength = getU32(data + 5);

    if (header.magic != FRAME_MAGIC) {
        error.set(ErrorKind::PROTOCOL_VIOLATION, "Bad frame magic");
        return false;
    }
    if (!isValidEnvelopeType(header.envelopeType)) {
        error.set(ErrorKind::PROTOCOL_VIOLATION,
                  "Unknown envelope type " + std::to_string(header.envelopeType));
        return false;
    }
    if (header.payloadLength > MAX_FRAME_PAYLOAD) {
        error.set(ErrorKind::PROTOCOL_VIOLATION,
                  "Frame payload length " + std::to_string(header.payloadLength) + " exceeds limit");
        return false;
    }
    return true;
}

bool EnvelopeCodec::decodePayload(const FrameHeader& header,
                                  const uint8_t* payload,
                                  TransferEnvelope& envelope,
                                  ErrorInfo& error)
{
    const auto type = static_cast<EnvelopeType>(header.envelopeType);
    const uint32_t length = header.payloadLength;

    if (length > 0 && !payload) {
        error.set(ErrorKind::PROTOCOL_VIOLATION, "Missing frame payload");
        return false;
    }

    switch (type) {
        case EnvelopeType::METADATA: {
            const char* text = reinterpret_cast<const char*>(payload);
            nlohmann::json files = nlohmann::json::parse(text, text + length, nullptr, false);
            if (files.is_discarded() || !files.is_array()) {
                error.set(ErrorKind::PROTOCOL_VIOLATION, "Metadata payload is not a JSON array");
                return false;
            }
            if (files.size() > MAX_FILES_PER_TRANSFER) {
                error.set(ErrorKind::PROTOCOL_VIOLATION,
                          "Metadata declares " + std::to_string(files.size()) + " files");
                return false;
            }

            std::vector<FileDescriptor> descriptors;
            descriptors.reserve(files.size());
            for (const auto& entry : files) {
                FileDescriptor descriptor;
                std::string msg;
                if (!descriptorFromJson(entry, descriptor, msg)) {
                    error.set(ErrorKind::PROTOCOL_VIOLATION, "Invalid metadata entry: " + msg);
                    return false;
                }
                descriptors.push_back(std::move(descriptor));
            }
            envelope = TransferEnvelope::metadata(std::move(descriptors));
            return true;
        }

        case EnvelopeType::CHUNK: {
            if (length < CHUNK_PREFIX_SIZE) {
                error.set(ErrorKind::PROTOCOL_VIOLATION, "Chunk payload shorter than its prefix");
                return false;
            }
            ChunkMessage chunk;
            chunk.fileIndex = getU32(payload);
            chunk.chunkIndex = getU32(payload + 4);
            chunk.totalChunks = getU32(payload + 8);
            const uint32_t dataLength = getU32(payload + 12);
            if (dataLength != length - CHUNK_PREFIX_SIZE) {
                error.set(ErrorKind::PROTOCOL_VIOLATION,
                          "Chunk data length " + std::to_string(dataLength) +
                          " disagrees with frame length " + std::to_string(length));
                return false;
            }
            chunk.payload.assign(payload + CHUNK_PREFIX_SIZE, payload + length);
            envelope = TransferEnvelope::chunk(std::move(chunk));
            return true;
        }

        case EnvelopeType::COMPLETE:
            if (length != 0) {
                error.set(ErrorKind::PROTOCOL_VIOLATION, "Complete envelope carries a payload");
                return false;
            }
            envelope = TransferEnvelope::complete();
            return true;

        default:
            error.set(ErrorKind::PROTOCOL_VIOLATION, "Unknown envelope type");
            return false;
    }
}

bool EnvelopeCodec::decode(const uint8_t* data, size_t size,
                           TransferEnvelope& envelope,
                           ErrorInfo& error)
{
    if (!data || size < FRAME_HEADER_SIZE) {
        error.set(ErrorKind::PROTOCOL_VIOLATION,
                  "Frame of " + std::to_string(size) + " bytes is shorter than its header");
        return false;
    }

    FrameHeader header;
    if (!decodeHeader(data, header, error)) {
        return false;
    }

    if (size - FRAME_HEADER_SIZE != header.payloadLength) {
        error.set(ErrorKind::PROTOCOL_VIOLATION,
                  "Frame length " + std::to_string(size) + " disagrees with header payload length " +
                  std::to_string(header.payloadLength));
        return false;
    }

    return decodePayload(header, data + FRAME_HEADER_SIZE, envelope, error);
}

}  // namespace PeerDrop
