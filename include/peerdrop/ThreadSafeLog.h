/**
 * @file ThreadSafeLog.h
 * @brief Thread-safe append-only trace file
 *
 * (c) 2026 PeerDrop Project
 * Licensed under MIT License
 */

#pragma once

#include <filesystem>
#include <fstream>
#include <mutex>
#include <string>

namespace PeerDrop {

/**
 * @brief Process-wide trace file mirroring every LOG_* line
 *
 * A long-running receiver or share host leaves a persistent record of
 * protocol violations, channel failures and store IO errors here. Lines are
 * stamped in UTC with the writing thread's id, since channel reader threads,
 * session workers and the ContentStore mirror worker all log concurrently.
 */
class ThreadSafeLog {
public:
    /**
     * @brief Open (or switch to) a trace file in append mode
     * @param logPath Path of the log file; parent directories are created
     * @param errorMsg Output error message on failure
     * @return true if the file is open for appending
     *
     * An empty path closes the current file and disables file logging.
     */
    static bool initialize(const std::filesystem::path& logPath, std::string& errorMsg);

    /// Flush and close the trace file
    static void shutdown();

    static bool isInitialized();

    /// Current trace file path (empty when disabled)
    static std::filesystem::path getPath();

    /**
     * @brief Append one stamped line
     *
     * Does nothing while no file is open.
     */
    static void log(const std::string& message);

private:
    static std::mutex s_mutex;
    static std::ofstream s_stream;
    static std::filesystem::path s_logPath;
};

} // namespace PeerDrop
