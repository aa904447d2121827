/**
 * @file AtomicFile.cpp
 * @brief Atomic file helpers implementation.
 */

#include "peerdrop/AtomicFile.h"
#include "peerdrop/config.h"
#include <fstream>

namespace PeerDrop {

AtomicFilePaths computeAtomicFilePaths(const std::filesystem::path& finalPath)
{
    AtomicFilePaths out;
    out.finalPath = finalPath;
    out.tempPath = finalPath;
    out.tempPath += PARTIAL_FILE_SUFFIX;
    return out;
}

bool atomicRenameToFinal(const std::filesystem::path& tempPath,
                         const std::filesystem::path& finalPath,
                         std::string& errorMsg)
{
    errorMsg.clear();

    std::error_code ec;
    if (!std::filesystem::is_regular_file(tempPath, ec) || ec) {
        errorMsg = "Temp file does not exist: " + tempPath.string();
        return false;
    }

    if (std::filesystem::exists(finalPath, ec)) {
        errorMsg = "Final file already exists: " + finalPath.string();
        return false;
    }

    std::filesystem::rename(tempPath, finalPath, ec);
    if (ec) {
        errorMsg = std::string("rename failed: ") + ec.message();
        return false;
    }

    return true;
}

bool atomicWriteFile(const std::filesystem::path& finalPath,
                     const uint8_t* data,
                     size_t size,
                     std::string& errorMsg)
{
    errorMsg.clear();
    const AtomicFilePaths paths = computeAtomicFilePaths(finalPath);

    {
        std::ofstream out(paths.tempPath, std::ios::binary | std::ios::trunc);
        if (!out) {
            errorMsg = "Cannot open " + paths.tempPath.string() + " for writing";
            return false;
        }
        if (size > 0) {
            out.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        }
        out.flush();
        if (!out) {
            errorMsg = "Write to " + paths.tempPath.string() + " failed";
            out.close();
            std::error_code ignored;
            std::filesystem::remove(paths.tempPath, ignored);
            return false;
        }
    }

    // rename() replaces an existing target in one step on POSIX
    std::error_code ec;
    std::filesystem::rename(paths.tempPath, paths.finalPath, ec);
    if (ec) {
        errorMsg = std::string("rename failed: ") + ec.message();
        std::error_code ignored;
        std::filesystem::remove(paths.tempPath, ignored);
        return false;
    }
    return true;
}

bool atomicWriteFile(const std::filesystem::path& finalPath,
                     const std::string& text,
                     std::string& errorMsg)
{
    return atomicWriteFile(finalPath,
                           reinterpret_cast<const uint8_t*>(text.data()),
                           text.size(),
                           errorMsg);
}

}  // namespace PeerDrop
