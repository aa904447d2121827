/**
 * @file peerdrop_receive.cpp
 * @brief CLI tool to receive one file set from a sending peer
 *
 * Usage:
 *   peerdrop_receive [--config <settings.json>] <port> [download_dir]
 *
 * Example:
 *   peerdrop_receive 47800 ~/Downloads
 */

#include "peerdrop/ConnectionLifecycle.h"
#include "peerdrop/DownloadWriter.h"
#include "peerdrop/FileUtils.h"
#include "peerdrop/ReceiveSession.h"
#include "peerdrop/Settings.h"
#include "peerdrop/ShareLink.h"
#include "peerdrop/TcpChannel.h"
#include "peerdrop/config.h"

#include <condition_variable>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

using namespace PeerDrop;

namespace {

    std::shared_ptr<TcpChannelProvider> g_provider;

    /**
     * @brief Signal handler for Ctrl+C
     *
     * Only async-signal-safe work: shutting the listen socket down makes the
     * blocked accept() return.
     */
    void signalHandler(int signal) {
        if ((signal == SIGINT || signal == SIGTERM) && g_provider) {
            g_provider->stopListening();
        }
    }

} // anonymous namespace

/**
 * @brief Print usage information
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " [--config <settings.json>] <port> [download_dir]\n";
    std::cout << "\nArguments:\n";
    std::cout << "  port          TCP port to listen on (0 picks a free port)\n";
    std::cout << "  download_dir  Directory where received files will be saved\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << programName << " " << DEFAULT_LISTEN_PORT << " ./downloads\n";
}

int main(int argc, char* argv[]) {
    std::cout << "===========================================\n";
    std::cout << "PeerDrop Receive\n";
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

    if (argc - argIndex < 1 || argc - argIndex > 2) {
        printUsage(argv[0]);
        return 1;
    }

    if (!settings.applyLogging(error)) {
        std::cerr << "Error: " << error.toString() << "\n";
        return 1;
    }

    const std::string portStr = argv[argIndex];
    uint16_t port = 0;
    try {
        const unsigned long value = std::stoul(portStr);
        if (value > 65535) {
            throw std::out_of_range("port");
        }
        port = static_cast<uint16_t>(value);
    } catch (const std::exception&) {
        std::cerr << "Error: Invalid port number: " << portStr << "\n";
        return 1;
    }

    const std::string downloadDir = (argc - argIndex == 2) ? argv[argIndex + 1] : settings.downloadDirectory;

    // Listen
    g_provider = std::make_shared<TcpChannelProvider>();
    if (!g_provider->listen(port, error)) {
        std::cerr << "Error: " << error.toString() << "\n";
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const std::string origin = settings.shareOrigin.empty()
        ? buildShareOrigin(getLocalIpAddress(), g_provider->getListenPort())
        : settings.shareOrigin;

    std::cout << "Configuration:\n";
    std::cout << "  Port:         " << g_provider->getListenPort() << "\n";
    std::cout << "  Download Dir: " << downloadDir << "\n";
    std::cout << "  Share Link:   " << buildShareUrl(origin) << "\n\n";

    DownloadWriter writer(downloadDir);

    std::mutex doneMutex;
    std::condition_variable doneCv;
    bool done = false;
    bool success = false;
    uint32_t saved = 0;

    ReceiveSession session(
        [&](const ReceivedFile& file) {
            std::filesystem::path savedPath;
            ErrorInfo saveError;
            if (writer.save(file, savedPath, saveError)) {
                ++saved;
                std::cout << "  Saved " << savedPath.string() << " ("
                          << formatFileSize(file.descriptor.size) << ")\n";
            } else {
                std::cerr << "  Error: " << saveError.toString() << "\n";
            }
        },
        [&](uint32_t filesReceived, bool allReceived) {
            std::lock_guard<std::mutex> lock(doneMutex);
            success = allReceived && saved == filesReceived;
            done = true;
            doneCv.notify_all();
        },
        nullptr,
        [](const ErrorInfo& protocolError) {
            std::cerr << "  Protocol error: " << protocolError.toString() << "\n";
        });

    ConnectionLifecycle connection(g_provider);
    ChannelHandlers handlers = session.makeChannelHandlers();
    auto closeHandler = handlers.onClose;
    handlers.onClose = [&, closeHandler] {
        closeHandler();
        std::lock_guard<std::mutex> lock(doneMutex);
        done = true;
        doneCv.notify_all();
    };
    connection.setSessionHandlers(std::move(handlers));

    std::cout << "Waiting for a sender (Ctrl+C to stop)...\n";
    if (!connection.accept(error)) {
        if (g_provider->getListenPort() == 0) {
            std::cout << "\nStopped.\n";
        } else {
            std::cerr << "Error: " << error.toString() << "\n";
        }
        return 1;
    }
    std::cout << "Connected to " << connection.getRemotePeerId() << "\n\n";

    {
        std::unique_lock<std::mutex> lock(doneMutex);
        doneCv.wait(lock, [&] { return done; });
    }

    connection.close();
    g_provider->stopListening();

    std::cout << "\n===========================================\n";
    if (success) {
        std::cout << "All " << saved << " file(s) received successfully!\n";
    } else {
        std::cout << "Transfer incomplete: " << saved << " of "
                  << session.getFiles().size() << " file(s) saved\n";
    }
    std::cout << "===========================================\n";

    return success ? 0 : 1;
}
