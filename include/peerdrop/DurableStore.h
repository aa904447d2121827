/**
 * @file DurableStore.h
 * @brief Durable key-value tier behind the ContentStore
 */

#pragma once

#include "ErrorCodes.h"
#include "FileRecord.h"
#include <atomic>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace PeerDrop {

/**
 * @class DurableStore
 * @brief Persistence substrate keyed by record id
 *
 * Every operation reports failure as STORE_IO_ERROR. Implementations must
 * be safe to call from the ContentStore mirror thread while other threads
 * call the read operations.
 */
class DurableStore {
public:
    virtual ~DurableStore() = default;

    /**
     * @brief Read one record
     * @param out Set to the record, or reset if the id is unknown
     */
    virtual bool getRecord(const std::string& id, std::optional<FileRecord>& out, ErrorInfo& error) = 0;

    /// Insert or replace a record (metadata and bytes)
    virtual bool putRecord(const FileRecord& record, ErrorInfo& error) = 0;

    /// Delete a record; deleting an unknown id succeeds
    virtual bool deleteRecord(const std::string& id, ErrorInfo& error) = 0;

    /// Every stored record
    virtual bool listRecords(std::vector<FileRecord>& out, ErrorInfo& error) = 0;

    /// The metadata index (empty if never written)
    virtual bool getIndex(StoreIndex& out, ErrorInfo& error) = 0;

    /// Replace the metadata index
    virtual bool putIndex(const StoreIndex& index, ErrorInfo& error) = 0;
};

/**
 * @class MemoryDurableStore
 * @brief In-process DurableStore with an availability switch
 *
 * While unavailable every operation fails with STORE_IO_ERROR, which lets
 * callers exercise the degraded paths of the ContentStore.
 */
class MemoryDurableStore final : public DurableStore {
public:
    MemoryDurableStore();

    bool getRecord(const std::string& id, std::optional<FileRecord>& out, ErrorInfo& error) override;
    bool putRecord(const FileRecord& record, ErrorInfo& error) override;
    bool deleteRecord(const std::string& id, ErrorInfo& error) override;
    bool listRecords(std::vector<FileRecord>& out, ErrorInfo& error) override;
    bool getIndex(StoreIndex& out, ErrorInfo& error) override;
    bool putIndex(const StoreIndex& index, ErrorInfo& error) override;

    void setAvailable(bool available) { m_available.store(available); }
    bool isAvailable() const { return m_available.load(); }

    /// Successful putRecord() calls
    uint32_t getPutCount() const { return m_putCount.load(); }

    /// Calls of any operation rejected while unavailable
    uint32_t getFailedCallCount() const { return m_failedCalls.load(); }

private:
    bool checkAvailable(const char* operation, ErrorInfo& error);

    mutable std::mutex m_mutex;
    std::map<std::string, FileRecord> m_records;
    StoreIndex m_index;

    std::atomic<bool> m_available;
    std::atomic<uint32_t> m_putCount;
    std::atomic<uint32_t> m_failedCalls;
};

/**
 * @class FileSystemDurableStore
 * @brief DurableStore backed by one directory
 *
 * Layout:
 * - <id>.bin   record bytes (absent for placeholders)
 * - <id>.json  record metadata
 * - index.json metadata index
 *
 * Every file is written to a temp name and renamed into place, so a crash
 * leaves either the old or the new version.
 */
class FileSystemDurableStore final : public DurableStore {
public:
    explicit FileSystemDurableStore(std::filesystem::path directory);

    const std::filesystem::path& getDirectory() const { return m_directory; }

    bool getRecord(const std::string& id, std::optional<FileRecord>& out, ErrorInfo& error) override;
    bool putRecord(const FileRecord& record, ErrorInfo& error) override;
    bool deleteRecord(const std::string& id, ErrorInfo& error) override;
    bool listRecords(std::vector<FileRecord>& out, ErrorInfo& error) override;
    bool getIndex(StoreIndex& out, ErrorInfo& error) override;
    bool putIndex(const StoreIndex& index, ErrorInfo& error) override;

    /**
     * @brief Check that an id is usable as a file stem
     *
     * Ids come from other devices' indexes, so anything that could escape
     * the store directory is refused.
     */
    static bool isSafeId(const std::string& id);

private:
    bool ensureDirectory(ErrorInfo& error);
    bool readRecordFiles(const std::string& id, std::optional<FileRecord>& out, ErrorInfo& error);

    std::filesystem::path m_directory;
    std::mutex m_mutex;
};

}  // namespace PeerDrop
