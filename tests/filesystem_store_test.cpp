/**
 * @file filesystem_store_test.cpp
 * @brief FileSystemDurableStore persistence and ContentStore restarts on disk
 */

#include "peerdrop/ContentStore.h"
#include "peerdrop/DurableStore.h"
#include "peerdrop/UuidGenerator.h"
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace PeerDrop;

namespace {

std::vector<uint8_t> bytesOf(const std::string& text) {
    return std::vector<uint8_t>(text.begin(), text.end());
}

FileRecord makeRecord(const std::string& id, const std::string& content) {
    FileRecord record;
    record.id = id;
    record.name = id + ".txt";
    record.type = "text/plain";
    record.data = std::make_shared<const std::vector<uint8_t>>(bytesOf(content));
    record.size = record.data->size();
    record.createdAt = 1700000000000;
    record.hasData = true;
    return record;
}

} // anonymous namespace

/**
 * @brief Fresh store directory per test, removed afterwards
 */
class FileSystemStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        root = std::filesystem::temp_directory_path() /
               ("peerdrop_store_test_" + UuidGenerator::generatePeerId());
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
    }

    std::filesystem::path root;
};

//=============================================================================
// Record files
//=============================================================================

TEST_F(FileSystemStoreTest, PutGetDeleteRecord) {
    FileSystemDurableStore store(root);
    ErrorInfo error;

    ASSERT_TRUE(store.putRecord(makeRecord("file_a", "alpha"), error)) << error.toString();
    EXPECT_TRUE(std::filesystem::exists(root / "file_a.json"));
    EXPECT_TRUE(std::filesystem::exists(root / "file_a.bin"));

    std::optional<FileRecord> loaded;
    ASSERT_TRUE(store.getRecord("file_a", loaded, error));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->bytes(), bytesOf("alpha"));
    EXPECT_EQ(loaded->createdAt, 1700000000000);

    ASSERT_TRUE(store.deleteRecord("file_a", error));
    ASSERT_TRUE(store.getRecord("file_a", loaded, error));
    EXPECT_FALSE(loaded.has_value());

    // Deleting twice is fine
    EXPECT_TRUE(store.deleteRecord("file_a", error));
}

TEST_F(FileSystemStoreTest, PlaceholderRecordHasNoBlob) {
    FileSystemDurableStore store(root);
    ErrorInfo error;

    FileRecord placeholder;
    placeholder.id = "file_remote";
    placeholder.name = "remote.bin";
    placeholder.size = 1234;
    ASSERT_TRUE(store.putRecord(placeholder, error));
    EXPECT_FALSE(std::filesystem::exists(root / "file_remote.bin"));

    std::optional<FileRecord> loaded;
    ASSERT_TRUE(store.getRecord("file_remote", loaded, error));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->hasData);
    EXPECT_EQ(loaded->size, 1234u);
}

TEST_F(FileSystemStoreTest, TruncatedBlobIsReported) {
    FileSystemDurableStore store(root);
    ErrorInfo error;
    ASSERT_TRUE(store.putRecord(makeRecord("file_b", "bravo"), error));

    {
        std::ofstream out(root / "file_b.bin", std::ios::binary | std::ios::trunc);
        out << "br";
    }

    std::optional<FileRecord> loaded;
    EXPECT_FALSE(store.getRecord("file_b", loaded, error));
    EXPECT_EQ(error.kind, ErrorKind::STORE_IO_ERROR);

    // Listing skips it rather than failing
    std::vector<FileRecord> records;
    ErrorInfo listError;
    EXPECT_TRUE(store.listRecords(records, listError));
    EXPECT_TRUE(records.empty());
}

TEST_F(FileSystemStoreTest, UnsafeIdsAreRefused) {
    EXPECT_TRUE(FileSystemDurableStore::isSafeId("file_0a1b-2c3d"));
    EXPECT_FALSE(FileSystemDurableStore::isSafeId(""));
    EXPECT_FALSE(FileSystemDurableStore::isSafeId("../etc/passwd"));
    EXPECT_FALSE(FileSystemDurableStore::isSafeId("a/b"));
    EXPECT_FALSE(FileSystemDurableStore::isSafeId("index"));
    EXPECT_FALSE(FileSystemDurableStore::isSafeId(std::string(200, 'a')));

    FileSystemDurableStore store(root);
    ErrorInfo error;
    EXPECT_FALSE(store.putRecord(makeRecord("../escape", "x"), error));
    EXPECT_EQ(error.kind, ErrorKind::STORE_IO_ERROR);
}

//=============================================================================
// Index
//=============================================================================

TEST_F(FileSystemStoreTest, MissingIndexIsEmpty) {
    FileSystemDurableStore store(root);
    StoreIndex index = {FileSummary{"stale", "x", 1, ""}};
    ErrorInfo error;

    ASSERT_TRUE(store.getIndex(index, error));
    EXPECT_TRUE(index.empty());
}

TEST_F(FileSystemStoreTest, IndexPersists) {
    FileSystemDurableStore store(root);
    ErrorInfo error;

    const StoreIndex written = {
        FileSummary{"file_1", "one.txt", 1, "text/plain"},
        FileSummary{"file_2", "two.jpg", 2048, "image/jpeg"},
    };
    ASSERT_TRUE(store.putIndex(written, error));

    StoreIndex read;
    ASSERT_TRUE(store.getIndex(read, error));
    EXPECT_EQ(read, written);
}

TEST_F(FileSystemStoreTest, CorruptIndexIsReported) {
    std::filesystem::create_directories(root);
    {
        std::ofstream out(root / STORE_INDEX_FILENAME);
        out << "{not json";
    }

    FileSystemDurableStore store(root);
    StoreIndex index;
    ErrorInfo error;
    EXPECT_FALSE(store.getIndex(index, error));
    EXPECT_EQ(error.kind, ErrorKind::STORE_IO_ERROR);
}

//=============================================================================
// ContentStore over the file system
//=============================================================================

/**
 * @test A content store restarted over the same directory sees the same
 *       records, including placeholders
 */
TEST_F(FileSystemStoreTest, ContentStoreSurvivesRestart) {
    std::string id;
    {
        ContentStore store(std::make_shared<FileSystemDurableStore>(root));
        ErrorInfo error;
        ASSERT_TRUE(store.initialize(error)) << error.toString();

        StoreWrite write = store.put("doc.pdf", "application/pdf", bytesOf("%PDF-1.7"));
        ASSERT_TRUE(write.durable.get());
        id = write.id;

        FileSummary remote{"file_remote-9", "far.png", 77, "image/png"};
        ASSERT_TRUE(store.addPlaceholder(remote));
        store.flush();
        EXPECT_EQ(store.getStoreErrorCount(), 0u);
    }

    ContentStore store(std::make_shared<FileSystemDurableStore>(root));
    ErrorInfo error;
    ASSERT_TRUE(store.initialize(error)) << error.toString();

    auto record = store.get(id);
    ASSERT_TRUE(record.has_value());
    EXPECT_TRUE(record->hasData);
    EXPECT_EQ(record->bytes(), bytesOf("%PDF-1.7"));
    EXPECT_EQ(record->type, "application/pdf");

    auto placeholder = store.get("file_remote-9");
    ASSERT_TRUE(placeholder.has_value());
    EXPECT_FALSE(placeholder->hasData);
    EXPECT_EQ(store.list().size(), 2u);
}

/**
 * @test A name that is not valid UTF-8 neither fails its own write nor
 *       poisons the index for later records
 */
TEST_F(FileSystemStoreTest, NonUtf8NameDoesNotBreakIndex) {
    std::string badId;
    std::string goodId;
    {
        ContentStore store(std::make_shared<FileSystemDurableStore>(root));
        ErrorInfo error;
        ASSERT_TRUE(store.initialize(error)) << error.toString();

        StoreWrite bad = store.put("caf\xe9.txt", "text/plain", bytesOf("latin-1"));
        EXPECT_TRUE(bad.durable.get());
        badId = bad.id;

        StoreWrite good = store.put("good.txt", "text/plain", bytesOf("fine"));
        EXPECT_TRUE(good.durable.get());
        goodId = good.id;

        EXPECT_TRUE(store.remove(goodId));
        store.flush();
        EXPECT_EQ(store.getStoreErrorCount(), 0u);
    }

    ContentStore store(std::make_shared<FileSystemDurableStore>(root));
    ErrorInfo error;
    ASSERT_TRUE(store.initialize(error)) << error.toString();

    auto record = store.get(badId);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->name, "caf\xef\xbf\xbd.txt");
    EXPECT_EQ(record->bytes(), bytesOf("latin-1"));
    EXPECT_FALSE(store.get(goodId).has_value());
    EXPECT_EQ(store.list().size(), 1u);
}

/**
 * @test A record whose index entry was lost is still loaded and the index
 *       is rewritten
 */
TEST_F(FileSystemStoreTest, IndexIsRebuiltFromRecords) {
    {
        FileSystemDurableStore durable(root);
        ErrorInfo error;
        ASSERT_TRUE(durable.putRecord(makeRecord("file_orphan", "orphan"), error));
    }

    auto durable = std::make_shared<FileSystemDurableStore>(root);
    ContentStore store(durable);
    ErrorInfo error;
    ASSERT_TRUE(store.initialize(error));
    store.flush();

    ASSERT_TRUE(store.get("file_orphan").has_value());

    StoreIndex index;
    ASSERT_TRUE(durable->getIndex(index, error));
    ASSERT_EQ(index.size(), 1u);
    EXPECT_EQ(index[0].id, "file_orphan");
}
