/**
 * @file FileRecord.cpp
 * @brief Records held by the ContentStore and their JSON form
 */

#include "peerdrop/FileRecord.h"

namespace PeerDrop {

const std::vector<uint8_t>& FileRecord::bytes() const {
    static const std::vector<uint8_t> kEmpty;
    return data ? *data : kEmpty;
}

nlohmann::json FileRecord::metadataToJson() const {
    nlohmann::json entry;
    entry["id"] = id;
    entry["name"] = name;
    entry["size"] = size;
    entry["type"] = type;
    entry["created_at"] = createdAt;
    entry["has_data"] = hasData;
    return entry;
}

bool FileRecord::metadataFromJson(const nlohmann::json& j, FileRecord& out) {
    if (!j.is_object()) {
        return false;
    }

    FileRecord rec;
    if (j.contains("id") && j["id"].is_string()) {
        rec.id = j["id"].get<std::string>();
    }
    if (j.contains("name") && j["name"].is_string()) {
        rec.name = j["name"].get<std::string>();
    }
    if (j.contains("size") && j["size"].is_number_unsigned()) {
        rec.size = j["size"].get<uint64_t>();
    }
    if (j.contains("type") && j["type"].is_string()) {
        rec.type = j["type"].get<std::string>();
    }
    if (j.contains("created_at") && j["created_at"].is_number_integer()) {
        rec.createdAt = j["created_at"].get<int64_t>();
    }
    if (j.contains("has_data") && j["has_data"].is_boolean()) {
        rec.hasData = j["has_data"].get<bool>();
    }

    if (rec.id.empty() || rec.name.empty()) {
        return false;
    }

    out = std::move(rec);
    return true;
}

FileSummary FileSummary::fromRecord(const FileRecord& record) {
    FileSummary summary;
    summary.id = record.id;
    summary.name = record.name;
    summary.size = record.size;
    summary.type = record.type;
    return summary;
}

nlohmann::json indexToJson(const StoreIndex& index) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& summary : index) {
        nlohmann::json entry;
        entry["id"] = summary.id;
        entry["name"] = summary.name;
        entry["size"] = summary.size;
        entry["type"] = summary.type;
        out.push_back(std::move(entry));
    }
    return out;
}

bool indexFromJson(const nlohmann::json& j, StoreIndex& out) {
    if (!j.is_array()) {
        return false;
    }

    StoreIndex index;
    for (const auto& obj : j) {
        if (!obj.is_object()) {
            continue;
        }

        FileSummary summary;
        if (obj.contains("id") && obj["id"].is_string()) {
            summary.id = obj["id"].get<std::string>();
        }
        if (obj.contains("name") && obj["name"].is_string()) {
            summary.name = obj["name"].get<std::string>();
        }
        if (obj.contains("size") && obj["size"].is_number_unsigned()) {
            summary.size = obj["size"].get<uint64_t>();
        }
        if (obj.contains("type") && obj["type"].is_string()) {
            summary.type = obj["type"].get<std::string>();
        }

        if (summary.id.empty()) {
            continue;
        }
        index.push_back(std::move(summary));
    }

    out = std::move(index);
    return true;
}

}  // namespace PeerDrop
