/**
 * @file config.h
 * @brief Configuration constants for PeerDrop
 *
 * This file contains all compile-time configuration constants used throughout
 * PeerDrop: chunking, pacing, wire framing, peer identity and content store
 * defaults. Runtime-tunable values live in Settings (Settings.h); the
 * constants here are their defaults.
 *
 * @note Changes to the chunking and framing constants affect protocol
 *       compatibility. Ensure all peers use compatible configurations.
 */

#pragma once

#include <cstddef>
#include <cstdint>

/**
 * @namespace PeerDrop
 * @brief PeerDrop namespace containing all public APIs
 */
namespace PeerDrop {

//=========================================================================
// Chunking
//=========================================================================

/** @defgroup Chunking Chunking Configuration
 * @{
 */

/**
 * @brief Size of one Chunk envelope payload in bytes
 *
 * Every chunk except the last chunk of a file carries exactly this many
 * bytes. The receiver sizes its reassembly buffers from the file size
 * declared in Metadata using this value, so both peers must agree on it.
 */
constexpr size_t CHUNK_SIZE = 16384;

/**
 * @brief Default pause between two Chunk envelopes (milliseconds)
 *
 * The channel does not expose its outbound buffer depth, so the sender paces
 * emission with a fixed delay instead of reacting to backpressure.
 */
constexpr uint32_t CHUNK_PACING_MS = 10;

/** @} */ // end of Chunking

//=========================================================================
// Wire Framing
//=========================================================================

/** @defgroup Framing Envelope Framing
 * @brief Length-prefixed binary frame carrying one TransferEnvelope
 *
 * Frame layout (big-endian):
 * - Offset 0-3: Magic number (4 bytes)
 * - Offset 4:   Envelope type (1 byte)
 * - Offset 5-8: Payload length (4 bytes)
 * - Offset 9-:  Payload
 * @{
 */

/** @brief Frame magic number ("PDRP") */
constexpr uint32_t FRAME_MAGIC = 0x50445250;

/** @brief Size of the fixed frame header in bytes */
constexpr size_t FRAME_HEADER_SIZE = 9;

/** @brief Size of the fixed Chunk payload prefix (4 x uint32) */
constexpr size_t CHUNK_PREFIX_SIZE = 16;

/**
 * @brief Upper bound on a frame payload
 *
 * Chunk frames never exceed CHUNK_PREFIX_SIZE + CHUNK_SIZE. Metadata frames
 * carry a JSON file list, which gets a generous but finite ceiling so a
 * corrupt length prefix cannot trigger an unbounded allocation.
 */
constexpr uint32_t MAX_FRAME_PAYLOAD = 8u * 1024u * 1024u;

/** @brief Maximum number of files accepted in one Metadata envelope */
constexpr size_t MAX_FILES_PER_TRANSFER = 10000;

/** @} */ // end of Framing

//=========================================================================
// Peer Identity / Network
//=========================================================================

/** @brief Length of a generated peer identifier (base-36 characters) */
constexpr size_t PEER_ID_LENGTH = 13;

/** @brief Default TCP port for the receive tool and share origin */
constexpr uint16_t DEFAULT_LISTEN_PORT = 47800;

/** @brief Listen backlog for TcpChannelProvider */
constexpr int LISTEN_BACKLOG = 4;

/** @brief Connect timeout for outgoing TCP channels (milliseconds) */
constexpr uint32_t CONNECT_TIMEOUT_MS = 5000;

//=========================================================================
// Content Store
//=========================================================================

/** @brief Default directory of the file-system durable tier */
constexpr const char* DEFAULT_STORE_DIR = "peerdrop_store";

/** @brief Filename of the metadata-only index inside the store directory */
constexpr const char* STORE_INDEX_FILENAME = "index.json";

/** @brief Prefix of generated content store record ids */
constexpr const char* RECORD_ID_PREFIX = "file_";

/** @brief MIME type used when none is known */
constexpr const char* DEFAULT_MIME_TYPE = "application/octet-stream";

//=========================================================================
// Files
//=========================================================================

/** @brief Maximum filename length accepted from a peer (bytes) */
constexpr size_t MAX_FILENAME_LENGTH = 255;

/** @brief Suffix of a partially written download */
constexpr const char* PARTIAL_FILE_SUFFIX = ".part";

}  // namespace PeerDrop
