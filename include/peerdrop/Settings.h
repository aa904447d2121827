/**
 * @file Settings.h
 * @brief Runtime settings persisted as JSON
 */

#pragma once

#include "config.h"
#include "ErrorCodes.h"
#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

namespace PeerDrop {

/**
 * @brief User-adjustable settings of the PeerDrop tools
 *
 * Stored as a flat JSON object. Keys missing from the file keep their
 * defaults; keys of the wrong type are ignored.
 */
struct Settings {
    uint32_t chunkPacingMs = CHUNK_PACING_MS;
    std::string storeDirectory = DEFAULT_STORE_DIR;
    std::string downloadDirectory = ".";
    std::string logFile;              ///< Empty = no trace file
    std::string logLevel = "info";
    uint16_t listenPort = DEFAULT_LISTEN_PORT;
    std::string shareOrigin;          ///< Empty = derived from the local address

    nlohmann::json toJson() const;

    /**
     * @brief Overlay values found in j onto a default Settings
     * @param error INVALID_ARGUMENT if j is not an object or a value is out of range
     */
    static bool fromJson(const nlohmann::json& j, Settings& out, ErrorInfo& error);

    /**
     * @brief Load settings from a file
     * @param path JSON file; a missing file yields the defaults
     * @param error INVALID_ARGUMENT on unreadable or malformed JSON
     */
    static bool load(const std::filesystem::path& path, Settings& out, ErrorInfo& error);

    /**
     * @brief Save settings atomically (temp file, then rename)
     */
    bool save(const std::filesystem::path& path, ErrorInfo& error) const;

    /**
     * @brief Apply logLevel and logFile to the logging subsystem
     */
    bool applyLogging(ErrorInfo& error) const;
};

}  // namespace PeerDrop
