/**
 * @file Debug.h
 * @brief Leveled logging macros with timestamps
 *
 * (c) 2026 PeerDrop Project
 * Licensed under MIT License
 */

#pragma once

#include <cstdint>
#include <sstream>
#include <string>

namespace PeerDrop {

/**
 * @brief Log severity, ordered from most to least verbose
 */
enum class LogLevel : uint8_t {
    DBG = 0,
    INFO = 1,
    WARN = 2,
    ERR = 3
};

/**
 * @brief Get current timestamp as formatted string
 * @return Timestamp in format [HH:MM:SS.mmm]
 */
std::string getTimestamp();

/**
 * @brief Set the minimum level that is written
 *
 * Thread-safe. Defaults to LogLevel::INFO.
 */
void setLogLevel(LogLevel level);

/**
 * @brief Get the minimum level that is written
 */
LogLevel getLogLevel();

/**
 * @brief Check whether a message at this level would be written
 */
bool isLogEnabled(LogLevel level);

/**
 * @brief Parse "debug", "info", "warning"/"warn", "error" (case-insensitive)
 * @return false if the name is not recognized (level untouched)
 */
bool parseLogLevel(const std::string& name, LogLevel& level);

/**
 * @brief Name of a level as written in log lines ("DEBUG", "INFO", ...)
 */
const char* logLevelName(LogLevel level);

/**
 * @brief Write one formatted line to stderr and mirror it to ThreadSafeLog
 *
 * Serialized by a process-wide mutex so concurrent writers from channel
 * reader threads, session workers and the store mirror never interleave.
 */
void writeLogLine(LogLevel level, const std::string& message);

} // namespace PeerDrop

#define PEERDROP_LOG_AT(level, msg) \
    do { \
        if (PeerDrop::isLogEnabled(level)) { \
            std::ostringstream pd_log_oss_; \
            pd_log_oss_ << msg; \
            PeerDrop::writeLogLine(level, pd_log_oss_.str()); \
        } \
    } while(0)

#define LOG_DEBUG(msg)   PEERDROP_LOG_AT(PeerDrop::LogLevel::DBG, msg)
#define LOG_INFO(msg)    PEERDROP_LOG_AT(PeerDrop::LogLevel::INFO, msg)
#define LOG_WARNING(msg) PEERDROP_LOG_AT(PeerDrop::LogLevel::WARN, msg)
#define LOG_ERROR(msg)   PEERDROP_LOG_AT(PeerDrop::LogLevel::ERR, msg)
