/**
 * @file FileSystemDurableStore.cpp
 * @brief DurableStore backed by one directory
 */

#include "peerdrop/DurableStore.h"
#include "peerdrop/AtomicFile.h"
#include "peerdrop/config.h"
#include "peerdrop/Debug.h"
#include <fstream>
#include <iterator>

namespace PeerDrop {

namespace {

    const char* kMetadataExt = ".json";
    const char* kBlobExt = ".bin";
    constexpr size_t kMaxIdLength = 128;

    // A name that is not valid UTF-8 is stored with U+FFFD instead of failing the write
    constexpr auto kDumpErrors = nlohmann::json::error_handler_t::replace;

    bool readWholeFile(const std::filesystem::path& path, std::vector<uint8_t>& out, std::string& errorMsg) {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            errorMsg = "Cannot open " + path.string();
            return false;
        }
        out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad()) {
            errorMsg = "Read of " + path.string() + " failed";
            return false;
        }
        return true;
    }

    bool readJsonFile(const std::filesystem::path& path, nlohmann::json& out, std::string& errorMsg) {
        std::vector<uint8_t> raw;
        if (!readWholeFile(path, raw, errorMsg)) {
            return false;
        }
        out = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
        if (out.is_discarded()) {
            errorMsg = "Malformed JSON in " + path.string();
            return false;
        }
        return true;
    }

} // anonymous namespace

FileSystemDurableStore::FileSystemDurableStore(std::filesystem::path directory)
    : m_directory(std::move(directory))
{
}

bool FileSystemDurableStore::isSafeId(const std::string& id) {
    if (id.empty() || id.size() > kMaxIdLength) {
        return false;
    }
    // The index file shares the directory
    if (id + kMetadataExt == STORE_INDEX_FILENAME) {
        return false;
    }
    for (char c : id) {
        const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                        (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!ok) {
            return false;
        }
    }
    return true;
}

bool FileSystemDurableStore::ensureDirectory(ErrorInfo& error) {
    std::error_code ec;
    if (std::filesystem::is_directory(m_directory, ec)) {
        return true;
    }
    std::filesystem::create_directories(m_directory, ec);
    if (ec) {
        error.set(ErrorKind::STORE_IO_ERROR,
                  "Cannot create store directory " + m_directory.string() + ": " + ec.message());
        return false;
    }
    return true;
}

//=============================================================================
// Records
//=============================================================================

bool FileSystemDurableStore::readRecordFiles(const std::string& id,
                                             std::optional<FileRecord>& out,
                                             ErrorInfo& error) {
    const auto metaPath = m_directory / (id + kMetadataExt);
    std::error_code ec;
    if (!std::filesystem::exists(metaPath, ec)) {
        out.reset();
        return true;
    }

    std::string errorMsg;
    nlohmann::json j;
    if (!readJsonFile(metaPath, j, errorMsg)) {
        error.set(ErrorKind::STORE_IO_ERROR, errorMsg);
        return false;
    }

    FileRecord record;
    if (!FileRecord::metadataFromJson(j, record) || record.id != id) {
        error.set(ErrorKind::STORE_IO_ERROR, "Invalid record metadata in " + metaPath.string());
        return false;
    }

    if (record.hasData) {
        auto bytes = std::make_shared<std::vector<uint8_t>>();
        if (!readWholeFile(m_directory / (id + kBlobExt), *bytes, errorMsg)) {
            error.set(ErrorKind::STORE_IO_ERROR, errorMsg);
            return false;
        }
        if (bytes->size() != record.size) {
            error.set(ErrorKind::STORE_IO_ERROR,
                      "Blob of record " + id + " is " + std::to_string(bytes->size()) +
                      " bytes, metadata declares " + std::to_string(record.size));
            return false;
        }
        record.data = std::move(bytes);
    }

    out = std::move(record);
    return true;
}

bool FileSystemDurableStore::getRecord(const std::string& id,
                                       std::optional<FileRecord>& out,
                                       ErrorInfo& error) {
    if (!isSafeId(id)) {
        error.set(ErrorKind::STORE_IO_ERROR, "Refusing unsafe record id '" + id + "'");
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    return readRecordFiles(id, out, error);
}

bool FileSystemDurableStore::putRecord(const FileRecord& record, ErrorInfo& error) {
    if (!isSafeId(record.id)) {
        error.set(ErrorKind::STORE_IO_ERROR, "Refusing unsafe record id '" + record.id + "'");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureDirectory(error)) {
        return false;
    }

    const auto blobPath = m_directory / (record.id + kBlobExt);
    const auto metaPath = m_directory / (record.id + kMetadataExt);
    std::string errorMsg;

    // Bytes first; the metadata file is what makes the record visible
    if (record.hasData) {
        const auto& bytes = record.bytes();
        if (!atomicWriteFile(blobPath, bytes.data(), bytes.size(), errorMsg)) {
            error.set(ErrorKind::STORE_IO_ERROR, "Blob write failed: " + errorMsg);
            return false;
        }
    } else {
        std::error_code ignored;
        std::filesystem::remove(blobPath, ignored);
    }

    if (!atomicWriteFile(metaPath, record.metadataToJson().dump(2, ' ', false, kDumpErrors), errorMsg)) {
        error.set(ErrorKind::STORE_IO_ERROR, "Metadata write failed: " + errorMsg);
        return false;
    }
    return true;
}

bool FileSystemDurableStore::deleteRecord(const std::string& id, ErrorInfo& error) {
    if (!isSafeId(id)) {
        error.set(ErrorKind::STORE_IO_ERROR, "Refusing unsafe record id '" + id + "'");
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    std::error_code ec;
    std::filesystem::remove(m_directory / (id + kMetadataExt), ec);
    if (ec) {
        error.set(ErrorKind::STORE_IO_ERROR, "Cannot delete metadata of " + id + ": " + ec.message());
        return false;
    }
    std::filesystem::remove(m_directory / (id + kBlobExt), ec);
    if (ec) {
        error.set(ErrorKind::STORE_IO_ERROR, "Cannot delete blob of " + id + ": " + ec.message());
        return false;
    }
    return true;
}

bool FileSystemDurableStore::listRecords(std::vector<FileRecord>& out, ErrorInfo& error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureDirectory(error)) {
        return false;
    }

    std::vector<FileRecord> records;
    std::error_code ec;
    for (std::filesystem::directory_iterator it(m_directory, ec), end; !ec && it != end; it.increment(ec)) {
        const auto& path = it->path();
        if (path.extension() != kMetadataExt || path.filename() == STORE_INDEX_FILENAME) {
            continue;
        }

        const std::string id = path.stem().string();
        if (!isSafeId(id)) {
            continue;
        }

        std::optional<FileRecord> record;
        ErrorInfo recordError;
        if (!readRecordFiles(id, record, recordError)) {
            LOG_WARNING("Skipping unreadable record " << id << ": " << recordError.toString());
            continue;
        }
        if (record) {
            records.push_back(std::move(*record));
        }
    }

    if (ec) {
        error.set(ErrorKind::STORE_IO_ERROR,
                  "Cannot list " + m_directory.string() + ": " + ec.message());
        return false;
    }

    out = std::move(records);
    return true;
}

//=============================================================================
// Index
//=============================================================================

bool FileSystemDurableStore::getIndex(StoreIndex& out, ErrorInfo& error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureDirectory(error)) {
        return false;
    }

    const auto indexPath = m_directory / STORE_INDEX_FILENAME;
    std::error_code ec;
    if (!std::filesystem::exists(indexPath, ec)) {
        out.clear();
        return true;
    }

    std::string errorMsg;
    nlohmann::json j;
    if (!readJsonFile(indexPath, j, errorMsg)) {
        error.set(ErrorKind::STORE_IO_ERROR, errorMsg);
        return false;
    }
    if (!indexFromJson(j, out)) {
        error.set(ErrorKind::STORE_IO_ERROR, "Index " + indexPath.string() + " is not a JSON array");
        return false;
    }
    return true;
}

bool FileSystemDurableStore::putIndex(const StoreIndex& index, ErrorInfo& error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!ensureDirectory(error)) {
        return false;
    }

    std::string errorMsg;
    if (!atomicWriteFile(m_directory / STORE_INDEX_FILENAME, indexToJson(index).dump(2, ' ', false, kDumpErrors), errorMsg)) {
        error.set(ErrorKind::STORE_IO_ERROR, "Index write failed: " + errorMsg);
        return false;
    }
    return true;
}

}  // namespace PeerDrop
