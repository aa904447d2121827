/**
 * @file uuid_generator_test.cpp
 * @brief Unit tests for random identifiers
 */

#include "peerdrop/UuidGenerator.h"
#include <gtest/gtest.h>

#include <cctype>
#include <set>

using namespace PeerDrop;

TEST(UuidGeneratorTest, GeneratesVersion4Uuid) {
    const std::string uuid = UuidGenerator::generate();
    ASSERT_EQ(uuid.size(), 36u);
    EXPECT_EQ(uuid[8], '-');
    EXPECT_EQ(uuid[13], '-');
    EXPECT_EQ(uuid[18], '-');
    EXPECT_EQ(uuid[23], '-');
    EXPECT_EQ(uuid[14], '4');

    // Variant 10xx
    const char variant = uuid[19];
    EXPECT_TRUE(variant == '8' || variant == '9' || variant == 'a' || variant == 'b') << uuid;
}

TEST(UuidGeneratorTest, PrefixedIdsAreHex) {
    const std::string id = UuidGenerator::generateWithPrefix("file_");
    ASSERT_EQ(id.size(), 5u + 19u);
    EXPECT_EQ(id.rfind("file_", 0), 0u);

    const std::string body = id.substr(5);
    for (size_t i = 0; i < body.size(); ++i) {
        if (i == 4 || i == 9 || i == 14) {
            EXPECT_EQ(body[i], '-');
        } else {
            EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(body[i]))) << id;
        }
    }
}

TEST(UuidGeneratorTest, PeerIdsAreBase36) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        const std::string id = UuidGenerator::generatePeerId();
        ASSERT_EQ(id.size(), PEER_ID_LENGTH);
        for (char c : id) {
            EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z')) << id;
        }
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);

    EXPECT_EQ(UuidGenerator::generatePeerId(4).size(), 4u);
}
