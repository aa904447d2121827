/**
 * @file ContentStore.h
 * @brief Two-tier file store backing "share via link"
 */

#pragma once

#include "config.h"
#include "DurableStore.h"
#include "ErrorCodes.h"
#include "FileRecord.h"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace PeerDrop {

/**
 * @brief Result of ContentStore::put()
 *
 * The record is readable through get() as soon as put() returns; `durable`
 * resolves true once the durable tier holds it, false if mirroring failed.
 */
struct StoreWrite {
    std::string id;
    std::shared_future<bool> durable;
};

/// Called once per failed mirror operation
using StoreErrorCallback = std::function<void(const ErrorInfo& error)>;

/**
 * @class ContentStore
 * @brief In-memory record map mirrored to a DurableStore
 *
 * Reads are served from memory only. Every mutation updates memory first
 * and then queues a mirror job (record write or delete, followed by an
 * index rewrite) for a single worker thread, so durable writes happen in
 * call order. A failed job is reported once as STORE_IO_ERROR to the log
 * and the error callback; nothing is retried.
 *
 * Lifecycle: construct, initialize() to reconcile with the durable tier,
 * then serve. Destruction drains queued jobs.
 *
 * Thread Safety: every public method is thread-safe.
 */
class ContentStore {
public:
    explicit ContentStore(std::shared_ptr<DurableStore> durable,
                          StoreErrorCallback errorCb = nullptr);
    ~ContentStore();

    ContentStore(const ContentStore&) = delete;
    ContentStore& operator=(const ContentStore&) = delete;

    /**
     * @brief Reconcile with the durable tier
     * @param error STORE_IO_ERROR if the durable tier could not be read,
     *              INVALID_STATE if called twice
     * @return true if the durable state was loaded
     *
     * Index entries are loaded as placeholders first, then full durable
     * records replace placeholders of the same id. Records already put in
     * this process are kept. On STORE_IO_ERROR the store keeps serving from
     * memory and stops mirroring.
     */
    bool initialize(ErrorInfo& error);

    bool isInitialized() const { return m_initialized.load(); }

    /// False once initialize() found the durable tier unreadable
    bool isMirroring() const { return m_mirroring.load(); }

    /**
     * @brief Store a file
     * @param name File name
     * @param mimeType MIME type (DEFAULT_MIME_TYPE if empty)
     * @param bytes File content
     */
    StoreWrite put(const std::string& name, const std::string& mimeType, std::vector<uint8_t> bytes);

    /**
     * @brief Look a record up in memory
     */
    std::optional<FileRecord> get(const std::string& id) const;

    /**
     * @brief Snapshot of every record, oldest first
     */
    std::vector<FileSummary> list() const;

    /**
     * @brief Delete a record from memory and the durable tier
     * @return false if the id is unknown
     */
    bool remove(const std::string& id);

    /**
     * @brief Shared handle to a record's bytes
     * @return nullptr for unknown ids, placeholders and empty records
     */
    BlobHandle blobHandle(const std::string& id) const;

    /**
     * @brief Record metadata of a file held by another device
     * @return false if a full record with that id exists (never overwritten)
     *         or the summary has no id
     */
    bool addPlaceholder(const FileSummary& summary);

    /**
     * @brief Block until every queued mirror job has finished
     */
    void flush();

    size_t size() const;

    /// Mirror jobs that failed since construction
    uint32_t getStoreErrorCount() const { return m_storeErrors.load(); }

private:
    struct MirrorJob {
        std::string description;
        std::function<bool(ErrorInfo&)> work;
        std::shared_ptr<std::promise<bool>> done;
    };

    std::shared_future<bool> enqueue(std::string description, std::function<bool(ErrorInfo&)> work);
    void mirrorThreadFunc();
    StoreIndex snapshotIndex() const;
    void reportStoreError(const ErrorInfo& error);

    static std::string generateRecordId();
    static int64_t nowMs();

    std::shared_ptr<DurableStore> m_durable;
    StoreErrorCallback m_errorCallback;

    // Memory tier
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, FileRecord> m_records;

    // Mirror queue (lock order: m_mutex, then m_queueMutex)
    std::mutex m_queueMutex;
    std::condition_variable m_queueCV;
    std::condition_variable m_idleCV;
    std::deque<MirrorJob> m_queue;
    bool m_jobActive;
    bool m_stopRequested;
    std::thread m_mirrorThread;

    std::atomic<bool> m_initialized;
    std::atomic<bool> m_mirroring;
    std::atomic<uint32_t> m_storeErrors;
};

}  // namespace PeerDrop
