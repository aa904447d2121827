/**
 * @file ThreadSafeLog.cpp
 * @brief Thread-safe trace file implementation
 *
 * (c) 2026 PeerDrop Project
 * Licensed under MIT License
 */

#include "peerdrop/ThreadSafeLog.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <thread>

namespace PeerDrop {

std::mutex ThreadSafeLog::s_mutex;
std::ofstream ThreadSafeLog::s_stream;
std::filesystem::path ThreadSafeLog::s_logPath;

namespace {

    /// 2026-10-18T09:41:07.250Z
    std::string utcStamp() {
        const auto now = std::chrono::system_clock::now();
        const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()).count() % 1000;

        std::tm utc{};
        gmtime_r(&seconds, &utc);

        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << millis << 'Z';
        return oss.str();
    }

} // anonymous namespace

bool ThreadSafeLog::initialize(const std::filesystem::path& logPath, std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(s_mutex);

    if (s_stream.is_open()) {
        s_stream.close();
    }
    s_logPath.clear();

    if (logPath.empty()) {
        return true;
    }

    std::error_code ec;
    if (logPath.has_parent_path()) {
        std::filesystem::create_directories(logPath.parent_path(), ec);
        if (ec) {
            errorMsg = "Cannot create log directory " + logPath.parent_path().string() + ": " + ec.message();
            return false;
        }
    }

    s_stream.open(logPath, std::ios::out | std::ios::app);
    if (!s_stream.is_open()) {
        errorMsg = "Cannot open log file " + logPath.string();
        return false;
    }

    s_logPath = logPath;
    return true;
}

void ThreadSafeLog::shutdown() {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_stream.is_open()) {
        s_stream.flush();
        s_stream.close();
    }
    s_logPath.clear();
}

bool ThreadSafeLog::isInitialized() {
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_stream.is_open();
}

std::filesystem::path ThreadSafeLog::getPath() {
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_logPath;
}

void ThreadSafeLog::log(const std::string& message) {
    const std::string stamp = utcStamp();

    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_stream.is_open()) {
        return;
    }

    s_stream << stamp << " [" << std::this_thread::get_id() << "] " << message << '\n';
    s_stream.flush();
}

} // namespace PeerDrop
