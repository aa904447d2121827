/**
 * @file peerdrop_send.cpp
 * @brief CLI tool to push a set of files to a listening peer
 *
 * Usage:
 *   peerdrop_send [--config <settings.json>] <host> <port> <file> [file...]
 *
 * Example:
 *   peerdrop_send 192.168.1.20 47800 notes.txt photo.jpg
 */

#include "peerdrop/ConnectionLifecycle.h"
#include "peerdrop/FileUtils.h"
#include "peerdrop/Settings.h"
#include "peerdrop/TcpChannel.h"
#include "peerdrop/TransferSession.h"
#include "peerdrop/config.h"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace PeerDrop;

/**
 * @brief Print usage information
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [--config <settings.json>] <host> <port> <file> [file...]\n";
    std::cout << "\nArguments:\n";
    std::cout << "  host   Address of the receiver (e.g., 192.168.1.20)\n";
    std::cout << "  port   TCP port the receiver listens on (default " << DEFAULT_LISTEN_PORT << ")\n";
    std::cout << "  file   One or more files to send\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << programName << " 192.168.1.20 " << DEFAULT_LISTEN_PORT << " notes.txt photo.jpg\n";
}

/**
 * @brief Format bytes to human-readable string
 */
std::string formatBytes(uint64_t bytes) {
    static const char* kUnits[] = {"KB", "MB", "GB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " bytes";
    }

    double value = static_cast<double>(bytes) / 1024.0;
    size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << kUnits[unit];
    return oss.str();
}

/**
 * @brief Draw one progress bar line, overwriting the previous one
 */
void printProgressBar(const std::string& name, int percent) {
    std::cout << "\r[";
    const int barWidth = 40;
    const int filled = barWidth * percent / 100;
    for (int i = 0; i < barWidth; ++i) {
        std::cout << (i < filled ? "=" : " ");
    }
    std::cout << "] " << std::setw(3) << std::setfill(' ') << percent << "% " << name << "    ";
    if (percent == 100) {
        std::cout << "\n";
    }
    std::cout << std::flush;
}

int main(int argc, char* argv[]) {
    std::cout << "===========================================\n";
    std::cout << "PeerDrop Send\n";
    std::cout << "===========================================\n\n";

    int argIndex = 1;
    Settings settings;
    ErrorInfo error;

    if (argc > 2 && std::string(argv[1]) == "--config") {
        if (!Settings::load(argv[2], settings, error)) {
            std::cerr << "Error: " << error.toString() << "\n";
            return 1;
        }
        argIndex = 3;
    }

    if (argc - argIndex < 3) {
        printUsage(argv[0]);
        return 1;
    }

    if (!settings.applyLogging(error)) {
        std::cerr << "Error: " << error.toString() << "\n";
        return 1;
    }

    const std::string host = argv[argIndex];
    const std::string portStr = argv[argIndex + 1];

    // Parse port
    uint16_t port = 0;
    try {
        const unsigned long value = std::stoul(portStr);
        if (value == 0 || value > 65535) {
            throw std::out_of_range("port");
        }
        port = static_cast<uint16_t>(value);
    } catch (const std::exception&) {
        std::cerr << "Error: Invalid port number: " << portStr << "\n";
        return 1;
    }

    // Load files
    std::vector<SourceFile> files;
    uint64_t totalBytes = 0;
    for (int i = argIndex + 2; i < argc; ++i) {
        SourceFile file;
        if (!loadSourceFile(argv[i], file, error)) {
            std::cerr << "Error: " << error.toString() << "\n";
            return 1;
        }
        totalBytes += file.descriptor.size;
        files.push_back(std::move(file));
    }

    std::cout << "Configuration:\n";
    std::cout << "  Target:      " << host << ":" << port << "\n";
    std::cout << "  Files:       " << files.size() << " (" << formatBytes(totalBytes) << ")\n";
    std::cout << "  Pacing:      " << settings.chunkPacingMs << " ms/chunk\n\n";

    std::vector<std::string> names;
    for (const auto& file : files) {
        std::cout << "  - " << file.descriptor.name << "  " << formatFileSize(file.descriptor.size)
                  << "  " << file.descriptor.mimeType << "\n";
        names.push_back(file.descriptor.name);
    }
    std::cout << "\n";

    // Connect
    auto provider = std::make_shared<TcpChannelProvider>();
    ConnectionLifecycle connection(provider);

    std::cout << "Connecting to " << host << ":" << port << "...\n";
    if (!connection.connect(host + ":" + std::to_string(port), error)) {
        std::cerr << "Error: " << error.toString() << "\n";
        return 1;
    }
    std::cout << "Connected successfully!\n\n";

    // Transfer
    auto startTime = std::chrono::steady_clock::now();

    TransferSession session([&names](const std::string&, uint32_t fileIndex, int percent) {
        printProgressBar(fileIndex < names.size() ? names[fileIndex] : "?", percent);
    });
    session.setChunkPacingMs(settings.chunkPacingMs);

    if (!session.start(std::move(files), connection.getChannel(), error) ||
        !session.sendAll(error)) {
        std::cout << "\n";
        std::cerr << "Error: " << error.toString() << "\n";
        connection.close();
        return 1;
    }

    connection.close();

    // Calculate statistics
    auto endTime = std::chrono::steady_clock::now();
    auto totalTime = std::chrono::duration_cast<std::chrono::milliseconds>(
        endTime - startTime).count();

    std::cout << "\n===========================================\n";
    std::cout << "Files sent successfully!\n";
    std::cout << "===========================================\n\n";
    std::cout << "Transfer Statistics:\n";
    std::cout << "  Session:      " << session.getSessionId() << "\n";
    std::cout << "  Files:        " << session.getFileCount() << "\n";
    std::cout << "  Bytes:        " << formatBytes(session.getBytesSent()) << "\n";
    std::cout << "  Time Taken:   " << std::fixed << std::setprecision(2)
              << (totalTime / 1000.0) << " seconds\n";

    return 0;
}
