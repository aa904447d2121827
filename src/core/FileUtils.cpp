/**
 * @file FileUtils.cpp
 * @brief Loading files to send, naming received files, size formatting
 */

#include "peerdrop/FileUtils.h"
#include "peerdrop/config.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <sys/stat.h>
#include <unordered_map>

namespace PeerDrop {

namespace {

    std::string toLowerAscii(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return s;
    }

    int64_t modificationTimeMs(const std::filesystem::path& path) {
        struct stat st{};
        if (::stat(path.c_str(), &st) != 0) {
            return 0;
        }
        return static_cast<int64_t>(st.st_mtim.tv_sec) * 1000 +
               static_cast<int64_t>(st.st_mtim.tv_nsec / 1000000);
    }

} // anonymous namespace

bool loadSourceFile(const std::filesystem::path& path, SourceFile& out, ErrorInfo& error) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        error.set(ErrorKind::INVALID_ARGUMENT, "Not a regular file: " + path.string());
        return false;
    }

    const uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        error.set(ErrorKind::INVALID_ARGUMENT, "Cannot stat " + path.string() + ": " + ec.message());
        return false;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error.set(ErrorKind::INVALID_ARGUMENT, "Cannot open " + path.string());
        return false;
    }

    SourceFile file;
    file.data.resize(static_cast<size_t>(size));
    if (size > 0) {
        in.read(reinterpret_cast<char*>(file.data.data()), static_cast<std::streamsize>(size));
        if (static_cast<uintmax_t>(in.gcount()) != size) {
            error.set(ErrorKind::INVALID_ARGUMENT, "Short read of " + path.string());
            return false;
        }
    }

    file.descriptor.name = path.filename().string();
    file.descriptor.size = file.data.size();
    file.descriptor.mimeType = guessMimeType(file.descriptor.name);
    file.descriptor.lastModified = modificationTimeMs(path);

    out = std::move(file);
    return true;
}

std::string guessMimeType(const std::string& fileName) {
    static const std::unordered_map<std::string, std::string> kTypes = {
        {".txt", "text/plain"},
        {".md", "text/markdown"},
        {".csv", "text/csv"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".js", "text/javascript"},
        {".json", "application/json"},
        {".xml", "application/xml"},
        {".pdf", "application/pdf"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".svg", "image/svg+xml"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/wav"},
        {".mp4", "video/mp4"},
        {".webm", "video/webm"},
    };

    const size_t dot = fileName.find_last_of('.');
    if (dot == std::string::npos || dot == 0) {
        return DEFAULT_MIME_TYPE;
    }

    auto it = kTypes.find(toLowerAscii(fileName.substr(dot)));
    return it == kTypes.end() ? std::string(DEFAULT_MIME_TYPE) : it->second;
}

bool sanitizeFileNameInPlace(std::string& name) {
    const size_t sep = name.find_last_of("/\\");
    if (sep != std::string::npos) {
        name.erase(0, sep + 1);
    }

    if (name.empty() || name == "." || name == "..") {
        return false;
    }

    for (char ch : name) {
        const unsigned char uch = static_cast<unsigned char>(ch);
        if (uch < 0x20 || uch == 0x7F) {
            return false;
        }
    }

    return name.size() <= MAX_FILENAME_LENGTH;
}

std::string formatFileSize(uint64_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << (static_cast<double>(bytes) / 1024.0 / 1024.0) << " MB";
    return oss.str();
}

}  // namespace PeerDrop
