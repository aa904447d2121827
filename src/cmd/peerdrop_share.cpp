/**
 * @file peerdrop_share.cpp
 * @brief CLI tool to manage the local content store behind "share via link"
 *
 * Usage:
 *   peerdrop_share <store_dir> put <file> [file...]
 *   peerdrop_share <store_dir> list
 *   peerdrop_share <store_dir> get <id> <output_path>
 *   peerdrop_share <store_dir> rm <id>
 *   peerdrop_share <store_dir> link [port]
 */

#include "peerdrop/ContentStore.h"
#include "peerdrop/AtomicFile.h"
#include "peerdrop/FileUtils.h"
#include "peerdrop/ShareLink.h"
#include "peerdrop/config.h"

#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace PeerDrop;

/**
 * @brief Print usage information
 */
void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " <store_dir> <command> [args]\n";
    std::cout << "\nCommands:\n";
    std::cout << "  put <file> [file...]     Store files and print their ids\n";
    std::cout << "  list                     List stored files\n";
    std::cout << "  get <id> <output_path>   Write a stored file to disk\n";
    std::cout << "  rm <id>                  Delete a stored file\n";
    std::cout << "  link [port]              Print the receive link of this device\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << programName << " " << DEFAULT_STORE_DIR << " put report.pdf\n";
}

int cmdPut(ContentStore& store, int argc, char* argv[]) {
    if (argc < 4) {
        return -1;
    }

    int failures = 0;
    for (int i = 3; i < argc; ++i) {
        SourceFile file;
        ErrorInfo error;
        if (!loadSourceFile(argv[i], file, error)) {
            std::cerr << "Error: " << error.toString() << "\n";
            ++failures;
            continue;
        }

        const std::string name = file.descriptor.name;
        StoreWrite write = store.put(name, file.descriptor.mimeType, std::move(file.data));
        if (write.id.empty() || !write.durable.get()) {
            std::cerr << "Error: '" << name << "' was not persisted\n";
            ++failures;
            continue;
        }
        std::cout << write.id << "  " << name << "\n";
    }
    return failures == 0 ? 0 : 1;
}

int cmdList(const ContentStore& store) {
    const auto entries = store.list();
    if (entries.empty()) {
        std::cout << "(store is empty)\n";
        return 0;
    }

    for (const auto& entry : entries) {
        const bool local = store.blobHandle(entry.id) != nullptr || entry.size == 0;
        std::cout << std::left << std::setw(30) << entry.id << " "
                  << std::right << std::setw(12) << formatFileSize(entry.size) << "  "
                  << std::left << std::setw(26) << entry.type << " "
                  << entry.name << (local ? "" : "  [remote]") << "\n";
    }
    return 0;
}

int cmdGet(const ContentStore& store, int argc, char* argv[]) {
    if (argc != 5) {
        return -1;
    }

    const auto record = store.get(argv[3]);
    if (!record) {
        std::cerr << "Error: no file with id " << argv[3] << "\n";
        return 1;
    }
    if (!record->hasData) {
        std::cerr << "Error: " << record->name << " is held by another device\n";
        return 1;
    }

    const auto& bytes = record->bytes();
    std::string errorMsg;
    if (!atomicWriteFile(argv[4], bytes.data(), bytes.size(), errorMsg)) {
        std::cerr << "Error: " << errorMsg << "\n";
        return 1;
    }
    std::cout << "Wrote " << record->name << " (" << formatFileSize(bytes.size()) << ") to " << argv[4] << "\n";
    return 0;
}

int cmdRemove(ContentStore& store, int argc, char* argv[]) {
    if (argc != 4) {
        return -1;
    }

    if (!store.remove(argv[3])) {
        std::cerr << "Error: no file with id " << argv[3] << "\n";
        return 1;
    }
    store.flush();
    std::cout << "Removed " << argv[3] << "\n";
    return store.getStoreErrorCount() == 0 ? 0 : 1;
}

int cmdLink(int argc, char* argv[]) {
    uint16_t port = DEFAULT_LISTEN_PORT;
    if (argc == 4) {
        try {
            const unsigned long value = std::stoul(argv[3]);
            if (value == 0 || value > 65535) {
                throw std::out_of_range("port");
            }
            port = static_cast<uint16_t>(value);
        } catch (const std::exception&) {
            std::cerr << "Error: Invalid port number: " << argv[3] << "\n";
            return 1;
        }
    } else if (argc != 3) {
        return -1;
    }

    std::cout << buildShareUrl(buildShareOrigin(getLocalIpAddress(), port)) << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string command = argv[2];
    if (command == "link") {
        const int rc = cmdLink(argc, argv);
        if (rc < 0) {
            printUsage(argv[0]);
            return 1;
        }
        return rc;
    }

    auto durable = std::make_shared<FileSystemDurableStore>(argv[1]);
    ContentStore store(durable);

    ErrorInfo error;
    if (!store.initialize(error)) {
        std::cerr << "Error: " << error.toString() << "\n";
        return 1;
    }

    int rc = -1;
    if (command == "put") {
        rc = cmdPut(store, argc, argv);
    } else if (command == "list") {
        rc = cmdList(store);
    } else if (command == "get") {
        rc = cmdGet(store, argc, argv);
    } else if (command == "rm") {
        rc = cmdRemove(store, argc, argv);
    }

    if (rc < 0) {
        printUsage(argv[0]);
        return 1;
    }

    store.flush();
    return rc;
}
