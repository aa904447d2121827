/**
 * @file UuidGenerator.h
 * @brief Random identifier generation utility
 *
 * Provides centralized id generation for content store records, transfer
 * sessions and peer identities.
 */

#pragma once

#include "config.h"
#include <array>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>
#include <openssl/rand.h>

namespace PeerDrop {

/**
 * @class UuidGenerator
 * @brief Thread-safe random identifier generator
 *
 * All randomness comes from OpenSSL's CSPRNG (RAND_bytes), which is
 * thread-safe. A failing RNG yields an empty string, never a weak id.
 */
class UuidGenerator {
public:
    /**
     * @brief Generate an RFC 4122 version 4 UUID
     * @return "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx", or empty on RNG failure
     */
    static std::string generate() {
        std::array<uint8_t, 16> bytes{};
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            return {};
        }

        bytes[6] = static_cast<uint8_t>(0x40 | (bytes[6] & 0x0F));  // version
        bytes[8] = static_cast<uint8_t>(0x80 | (bytes[8] & 0x3F));  // variant 10xx

        std::string out;
        appendHexGroups(out, bytes.data(), {4, 2, 2, 2, 6});
        return out;
    }

    /**
     * @brief Generate a prefixed ID (e.g., "file_xxxx-xxxx-xxxx-xxxx")
     * @param prefix String prefix to prepend
     * @return Prefixed ID carrying 64 random bits, empty on RNG failure
     */
    static std::string generateWithPrefix(const std::string& prefix) {
        std::array<uint8_t, 8> bytes{};
        if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
            return {};
        }

        std::string out = prefix;
        appendHexGroups(out, bytes.data(), {2, 2, 2, 2});
        return out;
    }

    /**
     * @brief Generate a short lowercase base-36 peer identifier
     * @param length Number of characters (default PEER_ID_LENGTH)
     * @return Identifier such as "k3j9x0a1mz7qp", empty on RNG failure
     */
    static std::string generatePeerId(size_t length = PEER_ID_LENGTH) {
        static const char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
        // 252 = 7 * 36; larger bytes are rejected to keep the draw uniform
        constexpr unsigned kRejectAbove = 252;

        std::string out;
        out.reserve(length);
        std::vector<uint8_t> buf(length * 2 + 8);
        while (out.size() < length) {
            if (RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
                return {};
            }
            for (uint8_t b : buf) {
                if (b >= kRejectAbove) {
                    continue;
                }
                out.push_back(kAlphabet[b % 36]);
                if (out.size() == length) {
                    break;
                }
            }
        }
        return out;
    }

private:
    UuidGenerator() = delete;

    /// Lowercase hex of consecutive byte groups joined by '-'
    static void appendHexGroups(std::string& out, const uint8_t* bytes,
                                std::initializer_list<size_t> groups) {
        static const char kHex[] = "0123456789abcdef";
        bool first = true;
        for (size_t count : groups) {
            if (!first) {
                out.push_back('-');
            }
            first = false;
            for (size_t i = 0; i < count; ++i, ++bytes) {
                out.push_back(kHex[*bytes >> 4]);
                out.push_back(kHex[*bytes & 0x0F]);
            }
        }
    }
};

}  // namespace PeerDrop
