/**
 * @file FileRecord.h
 * @brief Records held by the ContentStore and their JSON form
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace PeerDrop {

/// Shared, immutable file bytes
using BlobHandle = std::shared_ptr<const std::vector<uint8_t>>;

/**
 * @brief One stored file
 *
 * A placeholder (hasData == false) carries metadata only; its bytes live on
 * another device.
 */
struct FileRecord {
    std::string id;
    std::string name;
    uint64_t size = 0;
    std::string type;          ///< MIME type
    BlobHandle data;           ///< nullptr for placeholders
    int64_t createdAt = 0;     ///< ms since epoch
    bool hasData = false;

    /// Bytes of the record, or an empty vector for placeholders
    const std::vector<uint8_t>& bytes() const;

    /// Metadata fields only (no bytes)
    nlohmann::json metadataToJson() const;

    /**
     * @brief Parse metadata written by metadataToJson()
     * @return false if id or name is missing
     */
    static bool metadataFromJson(const nlohmann::json& j, FileRecord& out);
};

/**
 * @brief Listing entry and metadata index entry
 */
struct FileSummary {
    std::string id;
    std::string name;
    uint64_t size = 0;
    std::string type;

    bool operator==(const FileSummary& other) const {
        return id == other.id && name == other.name && size == other.size && type == other.type;
    }

    static FileSummary fromRecord(const FileRecord& record);
};

/// Metadata index: summaries of every record, full or placeholder
using StoreIndex = std::vector<FileSummary>;

nlohmann::json indexToJson(const StoreIndex& index);

/**
 * @brief Parse an index document, skipping malformed entries
 * @return false if the document is not a JSON array
 */
bool indexFromJson(const nlohmann::json& j, StoreIndex& out);

}  // namespace PeerDrop
