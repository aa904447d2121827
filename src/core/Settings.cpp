/**
 * @file Settings.cpp
 * @brief Runtime settings persisted as JSON
 */

#include "peerdrop/Settings.h"
#include "peerdrop/AtomicFile.h"
#include "peerdrop/Debug.h"
#include "peerdrop/ThreadSafeLog.h"
#include <fstream>
#include <iterator>

namespace PeerDrop {

namespace {
    // Pacing above a minute per chunk is certainly a typo
    constexpr uint32_t kMaxPacingMs = 60000;
}

nlohmann::json Settings::toJson() const {
    nlohmann::json j;
    j["chunk_pacing_ms"] = chunkPacingMs;
    j["store_directory"] = storeDirectory;
    j["download_directory"] = downloadDirectory;
    j["log_file"] = logFile;
    j["log_level"] = logLevel;
    j["listen_port"] = listenPort;
    j["share_origin"] = shareOrigin;
    return j;
}

bool Settings::fromJson(const nlohmann::json& j, Settings& out, ErrorInfo& error) {
    if (!j.is_object()) {
        error.set(ErrorKind::INVALID_ARGUMENT, "Settings must be a JSON object");
        return false;
    }

    Settings s;

    if (j.contains("chunk_pacing_ms") && j["chunk_pacing_ms"].is_number_integer()) {
        const int64_t pacing = j["chunk_pacing_ms"].get<int64_t>();
        if (pacing < 0 || pacing > kMaxPacingMs) {
            error.set(ErrorKind::INVALID_ARGUMENT,
                      "chunk_pacing_ms out of range: " + std::to_string(pacing));
            return false;
        }
        s.chunkPacingMs = static_cast<uint32_t>(pacing);
    }

    if (j.contains("store_directory") && j["store_directory"].is_string()) {
        s.storeDirectory = j["store_directory"].get<std::string>();
    }

    if (j.contains("download_directory") && j["download_directory"].is_string()) {
        s.downloadDirectory = j["download_directory"].get<std::string>();
    }

    if (j.contains("log_file") && j["log_file"].is_string()) {
        s.logFile = j["log_file"].get<std::string>();
    }

    if (j.contains("log_level") && j["log_level"].is_string()) {
        s.logLevel = j["log_level"].get<std::string>();
        LogLevel parsed;
        if (!parseLogLevel(s.logLevel, parsed)) {
            error.set(ErrorKind::INVALID_ARGUMENT, "Unknown log_level '" + s.logLevel + "'");
            return false;
        }
    }

    if (j.contains("listen_port") && j["listen_port"].is_number_integer()) {
        const int64_t port = j["listen_port"].get<int64_t>();
        if (port < 0 || port > 65535) {
            error.set(ErrorKind::INVALID_ARGUMENT, "listen_port out of range: " + std::to_string(port));
            return false;
        }
        s.listenPort = static_cast<uint16_t>(port);
    }

    if (j.contains("share_origin") && j["share_origin"].is_string()) {
        s.shareOrigin = j["share_origin"].get<std::string>();
    }

    out = std::move(s);
    return true;
}

bool Settings::load(const std::filesystem::path& path, Settings& out, ErrorInfo& error) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        // First run
        out = Settings{};
        return true;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error.set(ErrorKind::INVALID_ARGUMENT, "Cannot open settings file " + path.string());
        return false;
    }
    const std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    const nlohmann::json j = nlohmann::json::parse(data, nullptr, false);
    if (j.is_discarded()) {
        error.set(ErrorKind::INVALID_ARGUMENT, "Malformed JSON in settings file " + path.string());
        return false;
    }

    return fromJson(j, out, error);
}

bool Settings::save(const std::filesystem::path& path, ErrorInfo& error) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            error.set(ErrorKind::INVALID_ARGUMENT,
                      "Cannot create settings directory: " + ec.message());
            return false;
        }
    }

    std::string errorMsg;
    if (!atomicWriteFile(path, toJson().dump(4, ' ', false, nlohmann::json::error_handler_t::replace), errorMsg)) {
        error.set(ErrorKind::INVALID_ARGUMENT, "Cannot save settings: " + errorMsg);
        return false;
    }
    return true;
}

bool Settings::applyLogging(ErrorInfo& error) const {
    LogLevel level;
    if (!parseLogLevel(logLevel, level)) {
        error.set(ErrorKind::INVALID_ARGUMENT, "Unknown log level '" + logLevel + "'");
        return false;
    }
    setLogLevel(level);

    if (!logFile.empty()) {
        std::string errorMsg;
        if (!ThreadSafeLog::initialize(logFile, errorMsg)) {
            error.set(ErrorKind::INVALID_ARGUMENT, errorMsg);
            return false;
        }
    }
    return true;
}

}  // namespace PeerDrop
