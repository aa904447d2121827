/**
 * @file MemoryDurableStore.cpp
 * @brief In-process DurableStore with an availability switch
 */

#include "peerdrop/DurableStore.h"

namespace PeerDrop {

MemoryDurableStore::MemoryDurableStore()
    : m_available(true)
    , m_putCount(0)
    , m_failedCalls(0)
{
}

bool MemoryDurableStore::checkAvailable(const char* operation, ErrorInfo& error) {
    if (m_available.load()) {
        return true;
    }
    m_failedCalls.fetch_add(1);
    error.set(ErrorKind::STORE_IO_ERROR, std::string(operation) + ": durable store unavailable");
    return false;
}

bool MemoryDurableStore::getRecord(const std::string& id, std::optional<FileRecord>& out, ErrorInfo& error) {
    if (!checkAvailable("getRecord", error)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(id);
    if (it == m_records.end()) {
        out.reset();
    } else {
        out = it->second;
    }
    return true;
}

bool MemoryDurableStore::putRecord(const FileRecord& record, ErrorInfo& error) {
    if (!checkAvailable("putRecord", error)) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_records[record.id] = record;
    }
    m_putCount.fetch_add(1);
    return true;
}

bool MemoryDurableStore::deleteRecord(const std::string& id, ErrorInfo& error) {
    if (!checkAvailable("deleteRecord", error)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.erase(id);
    return true;
}

bool MemoryDurableStore::listRecords(std::vector<FileRecord>& out, ErrorInfo& error) {
    if (!checkAvailable("listRecords", error)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    out.clear();
    out.reserve(m_records.size());
    for (const auto& pair : m_records) {
        out.push_back(pair.second);
    }
    return true;
}

bool MemoryDurableStore::getIndex(StoreIndex& out, ErrorInfo& error) {
    if (!checkAvailable("getIndex", error)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    out = m_index;
    return true;
}

bool MemoryDurableStore::putIndex(const StoreIndex& index, ErrorInfo& error) {
    if (!checkAvailable("putIndex", error)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(m_mutex);
    m_index = index;
    return true;
}

}  // namespace PeerDrop
