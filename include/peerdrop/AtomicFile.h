/**
 * @file AtomicFile.h
 * @brief Small helpers for atomic file writes (write temp, then rename).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace PeerDrop {

struct AtomicFilePaths {
    std::filesystem::path finalPath;
    std::filesystem::path tempPath;
};

/**
 * @brief Compute a temp path next to finalPath for atomic writes.
 *
 * The temp path is finalPath with PARTIAL_FILE_SUFFIX appended, so callers
 * can clean up partial files on error.
 */
AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath);

/**
 * @brief Move tempPath to finalPath using rename semantics.
 *
 * Requirements:
 * - tempPath must exist as a file.
 * - finalPath must not already exist (callers should choose a unique final name).
 */
bool atomicRenameToFinal(const std::filesystem::path& tempPath,
                         const std::filesystem::path& finalPath,
                         std::string& errorMsg);

/**
 * @brief Write bytes to finalPath, replacing any previous content atomically.
 *
 * Writes the temp file, flushes it, then renames it over finalPath. On
 * failure the temp file is removed and finalPath is left untouched.
 */
bool atomicWriteFile(const std::filesystem::path& finalPath,
                     const uint8_t* data,
                     size_t size,
                     std::string& errorMsg);

/// Convenience overload for text content
bool atomicWriteFile(const std::filesystem::path& finalPath,
                     const std::string& text,
                     std::string& errorMsg);

}  // namespace PeerDrop
