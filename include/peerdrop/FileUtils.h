/**
 * @file FileUtils.h
 * @brief Loading files to send, naming received files, size formatting
 */

#pragma once

#include "ErrorCodes.h"
#include "TransferSession.h"
#include <cstdint>
#include <filesystem>
#include <string>

namespace PeerDrop {

/**
 * @brief Read a file from disk into a SourceFile
 * @param path File to read
 * @param out Descriptor (base name, size, MIME type, mtime) and bytes
 * @param error INVALID_ARGUMENT if the path is not a readable regular file
 */
bool loadSourceFile(const std::filesystem::path& path, SourceFile& out, ErrorInfo& error);

/**
 * @brief MIME type guessed from a file name's extension
 * @return DEFAULT_MIME_TYPE for unknown extensions
 */
std::string guessMimeType(const std::string& fileName);

/**
 * @brief Turn a peer-provided file name into a safe base name, in place
 *
 * Directory components are stripped (both '/' and '\\'). Returns false if
 * nothing usable is left: empty, ".", "..", control characters or a name
 * longer than MAX_FILENAME_LENGTH bytes.
 */
bool sanitizeFileNameInPlace(std::string& name);

/**
 * @brief Size in megabytes with two decimals, e.g. "1.50 MB"
 */
std::string formatFileSize(uint64_t bytes);

}  // namespace PeerDrop
