/**
 * @file Debug.cpp
 * @brief Leveled logging implementation
 *
 * (c) 2026 PeerDrop Project
 * Licensed under MIT License
 */

#include "peerdrop/Debug.h"
#include "peerdrop/ThreadSafeLog.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace PeerDrop {

namespace {
    // Prevents concurrent writes to std::cerr from interleaving lines
    std::mutex g_logMutex;
    std::atomic<uint8_t> g_logLevel{static_cast<uint8_t>(LogLevel::INFO)};
} // anonymous namespace

std::string getTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm{};
    localtime_r(&time_t, &tm);

    std::ostringstream oss;
    oss << "[" << std::setfill('0') << std::setw(2) << tm.tm_hour
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_min
        << ":" << std::setfill('0') << std::setw(2) << tm.tm_sec
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "]";
    return oss.str();
}

void setLogLevel(LogLevel level) {
    g_logLevel.store(static_cast<uint8_t>(level));
}

LogLevel getLogLevel() {
    return static_cast<LogLevel>(g_logLevel.load());
}

bool isLogEnabled(LogLevel level) {
    return static_cast<uint8_t>(level) >= g_logLevel.load();
}

bool parseLogLevel(const std::string& name, LogLevel& level) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "debug") {
        level = LogLevel::DBG;
    } else if (lower == "info") {
        level = LogLevel::INFO;
    } else if (lower == "warning" || lower == "warn") {
        level = LogLevel::WARN;
    } else if (lower == "error") {
        level = LogLevel::ERR;
    } else {
        return false;
    }
    return true;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DBG:  return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARNING";
        case LogLevel::ERR:  return "ERROR";
        default:             return "UNKNOWN";
    }
}

void writeLogLine(LogLevel level, const std::string& message) {
    const std::string tagged = std::string("[") + logLevelName(level) + "] " + message;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        std::cerr << getTimestamp() << " " << tagged << std::endl;
    }
    ThreadSafeLog::log(tagged);
}

} // namespace PeerDrop
