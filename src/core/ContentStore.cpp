/**
 * @file ContentStore.cpp
 * @brief Two-tier file store backing "share via link"
 */

#include "peerdrop/ContentStore.h"
#include "peerdrop/UuidGenerator.h"
#include "peerdrop/Debug.h"
#include <algorithm>
#include <chrono>
#include <set>

namespace PeerDrop {

//=============================================================================
// Helper Functions
//=============================================================================

std::string ContentStore::generateRecordId() {
    return UuidGenerator::generateWithPrefix(RECORD_ID_PREFIX);
}

int64_t ContentStore::nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

//=============================================================================
// Constructor / Destructor
//=============================================================================

ContentStore::ContentStore(std::shared_ptr<DurableStore> durable, StoreErrorCallback errorCb)
    : m_durable(std::move(durable))
    , m_errorCallback(std::move(errorCb))
    , m_jobActive(false)
    , m_stopRequested(false)
    , m_initialized(false)
    , m_mirroring(m_durable != nullptr)
    , m_storeErrors(0)
{
    m_mirrorThread = std::thread(&ContentStore::mirrorThreadFunc, this);
}

ContentStore::~ContentStore() {
    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_stopRequested = true;
    }
    m_queueCV.notify_all();

    if (m_mirrorThread.joinable()) {
        m_mirrorThread.join();
    }
}

//=============================================================================
// Startup reconciliation
//=============================================================================

bool ContentStore::initialize(ErrorInfo& error) {
    if (m_initialized.exchange(true)) {
        error.set(ErrorKind::INVALID_STATE, "Content store already initialized");
        return false;
    }

    if (!m_durable) {
        m_mirroring.store(false);
        error.set(ErrorKind::STORE_IO_ERROR, "No durable store configured");
        reportStoreError(error);
        return false;
    }

    StoreIndex index;
    std::vector<FileRecord> records;
    if (!m_durable->getIndex(index, error) || !m_durable->listRecords(records, error)) {
        m_mirroring.store(false);
        reportStoreError(error);
        LOG_WARNING("Content store serving from memory only");
        return false;
    }

    std::set<std::string> indexedIds;
    size_t placeholders = 0;
    size_t loaded = 0;
    bool indexStale = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        for (const auto& summary : index) {
            indexedIds.insert(summary.id);
            if (m_records.count(summary.id) != 0) {
                continue;
            }
            FileRecord placeholder;
            placeholder.id = summary.id;
            placeholder.name = summary.name;
            placeholder.size = summary.size;
            placeholder.type = summary.type;
            placeholder.hasData = false;
            m_records.emplace(summary.id, std::move(placeholder));
        }

        // Durable data supersedes placeholders of the same id; records put
        // in this process before initialize() are already complete
        for (auto& record : records) {
            if (indexedIds.count(record.id) == 0) {
                indexStale = true;
            }
            auto it = m_records.find(record.id);
            if (it != m_records.end() && it->second.hasData) {
                continue;
            }
            m_records[record.id] = std::move(record);
            ++loaded;
        }

        for (const auto& pair : m_records) {
            if (!pair.second.hasData) {
                ++placeholders;
            }
        }
    }

    LOG_INFO("Content store initialized: " << loaded << " durable record(s), "
             << placeholders << " placeholder(s)");

    if (indexStale) {
        enqueue("index rebuild", [this](ErrorInfo& jobError) {
            return m_durable->putIndex(snapshotIndex(), jobError);
        });
    }

    error.clear();
    return true;
}

//=============================================================================
// Operations
//=============================================================================

StoreWrite ContentStore::put(const std::string& name, const std::string& mimeType, std::vector<uint8_t> bytes) {
    StoreWrite result;

    FileRecord record;
    record.id = generateRecordId();
    if (record.id.empty()) {
        ErrorInfo error;
        error.set(ErrorKind::STORE_IO_ERROR, "Random id generation failed; '" + name + "' not stored");
        reportStoreError(error);
        std::promise<bool> failed;
        failed.set_value(false);
        result.durable = failed.get_future().share();
        return result;
    }

    record.name = name;
    record.size = bytes.size();
    const uint64_t bytesStored = record.size;
    record.type = mimeType.empty() ? std::string(DEFAULT_MIME_TYPE) : mimeType;
    record.data = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
    record.createdAt = nowMs();
    record.hasData = true;

    result.id = record.id;
    {
        // Queued under m_mutex so mirror jobs run in the order the records changed
        std::lock_guard<std::mutex> lock(m_mutex);
        m_records[record.id] = record;
        result.durable = enqueue("put " + record.id, [this, record](ErrorInfo& jobError) {
            return m_durable->putRecord(record, jobError) &&
                   m_durable->putIndex(snapshotIndex(), jobError);
        });
    }

    LOG_DEBUG("Stored '" << name << "' as " << result.id << " (" << bytesStored << " bytes)");
    return result;
}

std::optional<FileRecord> ContentStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<FileSummary> ContentStore::list() const {
    return snapshotIndex();
}

bool ContentStore::remove(const std::string& id) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_records.erase(id) == 0) {
            return false;
        }
        enqueue("remove " + id, [this, id](ErrorInfo& jobError) {
            return m_durable->deleteRecord(id, jobError) &&
                   m_durable->putIndex(snapshotIndex(), jobError);
        });
    }

    LOG_DEBUG("Removed " << id);
    return true;
}

BlobHandle ContentStore::blobHandle(const std::string& id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(id);
    if (it == m_records.end() || !it->second.hasData || !it->second.data || it->second.data->empty()) {
        return nullptr;
    }
    return it->second.data;
}

bool ContentStore::addPlaceholder(const FileSummary& summary) {
    if (summary.id.empty()) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_records.find(summary.id);
        if (it != m_records.end() && it->second.hasData) {
            return false;
        }

        FileRecord placeholder;
        placeholder.id = summary.id;
        placeholder.name = summary.name;
        placeholder.size = summary.size;
        placeholder.type = summary.type;
        placeholder.createdAt = (it != m_records.end()) ? it->second.createdAt : nowMs();
        placeholder.hasData = false;
        m_records[summary.id] = std::move(placeholder);
        enqueue("placeholder " + summary.id, [this](ErrorInfo& jobError) {
            return m_durable->putIndex(snapshotIndex(), jobError);
        });
    }
    return true;
}

size_t ContentStore::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

StoreIndex ContentStore::snapshotIndex() const {
    std::vector<const FileRecord*> ordered;
    StoreIndex index;

    std::lock_guard<std::mutex> lock(m_mutex);
    ordered.reserve(m_records.size());
    for (const auto& pair : m_records) {
        ordered.push_back(&pair.second);
    }
    std::sort(ordered.begin(), ordered.end(), [](const FileRecord* a, const FileRecord* b) {
        if (a->createdAt != b->createdAt) {
            return a->createdAt < b->createdAt;
        }
        return a->id < b->id;
    });

    index.reserve(ordered.size());
    for (const FileRecord* record : ordered) {
        index.push_back(FileSummary::fromRecord(*record));
    }
    return index;
}

//=============================================================================
// Mirror worker
//=============================================================================

std::shared_future<bool> ContentStore::enqueue(std::string description,
                                               std::function<bool(ErrorInfo&)> work) {
    auto done = std::make_shared<std::promise<bool>>();
    std::shared_future<bool> future = done->get_future().share();

    if (!m_mirroring.load()) {
        done->set_value(false);
        return future;
    }

    {
        std::lock_guard<std::mutex> lock(m_queueMutex);
        m_queue.push_back(MirrorJob{std::move(description), std::move(work), done});
    }
    m_queueCV.notify_one();
    return future;
}

void ContentStore::flush() {
    std::unique_lock<std::mutex> lock(m_queueMutex);
    m_idleCV.wait(lock, [this] { return m_queue.empty() && !m_jobActive; });
}

void ContentStore::mirrorThreadFunc() {
    while (true) {
        MirrorJob job;
        {
            std::unique_lock<std::mutex> lock(m_queueMutex);
            m_queueCV.wait(lock, [this] { return !m_queue.empty() || m_stopRequested; });

            // Queued jobs are drained before stopping
            if (m_queue.empty()) {
                break;
            }

            job = std::move(m_queue.front());
            m_queue.pop_front();
            m_jobActive = true;
        }

        ErrorInfo error;
        bool ok = false;
        try {
            ok = job.work(error);
        } catch (const std::exception& e) {
            error.set(ErrorKind::STORE_IO_ERROR, std::string("exception: ") + e.what());
        }

        if (!ok) {
            if (!error.hasError()) {
                error.set(ErrorKind::STORE_IO_ERROR, "mirror job failed");
            }
            error.message = job.description + ": " + error.message;
            reportStoreError(error);
        }
        job.done->set_value(ok);

        {
            std::lock_guard<std::mutex> lock(m_queueMutex);
            m_jobActive = false;
        }
        m_idleCV.notify_all();
    }
}

void ContentStore::reportStoreError(const ErrorInfo& error) {
    m_storeErrors.fetch_add(1);
    LOG_ERROR(error.toString());
    if (m_errorCallback) {
        m_errorCallback(error);
    }
}

}  // namespace PeerDrop
