/**
 * @file DownloadWriter.h
 * @brief Saves received files into a download directory
 */

#pragma once

#include "ErrorCodes.h"
#include "ReceiveSession.h"
#include <filesystem>
#include <mutex>
#include <string>

namespace PeerDrop {

/**
 * @class DownloadWriter
 * @brief Writes assembled files under sanitized, unique names
 *
 * Each file is written to "<name>.part" and renamed into place once all
 * bytes are on disk, so a partially written file never carries the final
 * name. An existing file is never overwritten: "report.pdf" becomes
 * "report (1).pdf", then "report (2).pdf", and so on.
 *
 * Thread Safety: save() is thread-safe.
 */
class DownloadWriter {
public:
    explicit DownloadWriter(std::filesystem::path downloadDir);

    /**
     * @brief Write one received file
     * @param file Assembled file
     * @param savedPath Final path on success
     * @param error INVALID_ARGUMENT for an unusable name or a write failure
     */
    bool save(const ReceivedFile& file, std::filesystem::path& savedPath, ErrorInfo& error);

    const std::filesystem::path& getDirectory() const { return m_downloadDir; }

    /**
     * @brief First free "<stem> (n)<ext>" path in a directory
     */
    static std::filesystem::path generateUniquePath(const std::filesystem::path& directory,
                                                    const std::string& fileName);

private:
    std::filesystem::path m_downloadDir;
    std::mutex m_mutex;
};

}  // namespace PeerDrop
