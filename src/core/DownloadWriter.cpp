/**
 * @file DownloadWriter.cpp
 * @brief Saves received files into a download directory
 */

#include "peerdrop/DownloadWriter.h"
#include "peerdrop/AtomicFile.h"
#include "peerdrop/FileUtils.h"
#include "peerdrop/Debug.h"
#include <fstream>

namespace PeerDrop {

DownloadWriter::DownloadWriter(std::filesystem::path downloadDir)
    : m_downloadDir(std::move(downloadDir))
{
}

std::filesystem::path DownloadWriter::generateUniquePath(const std::filesystem::path& directory,
                                                         const std::string& fileName) {
    std::filesystem::path fullPath = directory / fileName;

    std::string name = fileName;
    std::string ext;
    const size_t dotPos = fileName.find_last_of('.');
    if (dotPos != std::string::npos && dotPos != 0) {
        name = fileName.substr(0, dotPos);
        ext = fileName.substr(dotPos);
    }

    // A leftover .part of the same name also counts as taken
    int counter = 1;
    std::error_code ec;
    while (std::filesystem::exists(fullPath, ec) ||
           std::filesystem::exists(computeAtomicFilePaths(fullPath).tempPath, ec)) {
        fullPath = directory / (name + " (" + std::to_string(counter) + ")" + ext);
        counter++;
    }

    return fullPath;
}

bool DownloadWriter::save(const ReceivedFile& file, std::filesystem::path& savedPath, ErrorInfo& error) {
    std::string fileName = file.descriptor.name;
    if (!sanitizeFileNameInPlace(fileName)) {
        error.set(ErrorKind::INVALID_ARGUMENT, "Unusable file name '" + file.descriptor.name + "'");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);

    std::error_code ec;
    std::filesystem::create_directories(m_downloadDir, ec);
    if (ec) {
        error.set(ErrorKind::INVALID_ARGUMENT,
                  "Cannot create download directory " + m_downloadDir.string() + ": " + ec.message());
        return false;
    }

    const AtomicFilePaths paths = computeAtomicFilePaths(generateUniquePath(m_downloadDir, fileName));

    {
        std::ofstream out(paths.tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            error.set(ErrorKind::INVALID_ARGUMENT, "Failed to create output file: " + paths.tempPath.string());
            return false;
        }
        if (!file.data.empty()) {
            out.write(reinterpret_cast<const char*>(file.data.data()),
                      static_cast<std::streamsize>(file.data.size()));
        }
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(paths.tempPath, ec);
            error.set(ErrorKind::INVALID_ARGUMENT, "Write to " + paths.tempPath.string() + " failed");
            return false;
        }
    }

    std::string errorMsg;
    if (!atomicRenameToFinal(paths.tempPath, paths.finalPath, errorMsg)) {
        std::filesystem::remove(paths.tempPath, ec);
        error.set(ErrorKind::INVALID_ARGUMENT, "Cannot finalize " + paths.finalPath.string() + ": " + errorMsg);
        return false;
    }

    LOG_INFO("Saved '" << file.descriptor.name << "' to " << paths.finalPath.string());
    savedPath = paths.finalPath;
    return true;
}

}  // namespace PeerDrop
