/**
 * @file ChunkCodec.h
 * @brief Splitting file bytes into fixed-size chunks and reassembling them
 */

#pragma once

#include "config.h"
#include "ErrorCodes.h"
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <vector>

namespace PeerDrop {

/**
 * @brief Non-owning view of one chunk produced by ChunkCodec::split()
 */
struct ChunkSlice {
    uint32_t chunkIndex = 0;
    const uint8_t* data = nullptr;
    size_t size = 0;

    std::vector<uint8_t> toVector() const {
        return std::vector<uint8_t>(data, data + size);
    }
};

/**
 * @class ChunkSequence
 * @brief Lazy, ordered, finite sequence of chunks over a byte buffer
 *
 * Slices are computed on demand while iterating; nothing is copied. The
 * sequence only references the source bytes, so the buffer must outlive it.
 *
 * Usage:
 * @code
 * for (const ChunkSlice& slice : ChunkCodec::split(bytes)) {
 *     send(slice.chunkIndex, slice.data, slice.size);
 * }
 * @endcode
 */
class ChunkSequence {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = ChunkSlice;
        using difference_type = std::ptrdiff_t;
        using pointer = const ChunkSlice*;
        using reference = const ChunkSlice&;

        Iterator(const ChunkSequence* sequence, uint32_t index);

        reference operator*() const { return m_slice; }
        pointer operator->() const { return &m_slice; }
        Iterator& operator++();
        bool operator==(const Iterator& other) const { return m_index == other.m_index; }
        bool operator!=(const Iterator& other) const { return m_index != other.m_index; }

    private:
        void load();

        const ChunkSequence* m_sequence;
        uint32_t m_index;
        ChunkSlice m_slice;
    };

    ChunkSequence(const uint8_t* data, size_t size, size_t chunkSize);

    Iterator begin() const { return Iterator(this, 0); }
    Iterator end() const { return Iterator(this, m_totalChunks); }

    /// Number of chunks the sequence yields
    uint32_t totalChunks() const { return m_totalChunks; }

    size_t chunkSize() const { return m_chunkSize; }

    /**
     * @brief Random access to one slice
     * @param index Chunk index, must be < totalChunks()
     */
    ChunkSlice at(uint32_t index) const;

private:
    const uint8_t* m_data;
    size_t m_size;
    size_t m_chunkSize;
    uint32_t m_totalChunks;
};

/**
 * @class ChunkCodec
 * @brief Stateless chunking helpers
 *
 * Thread Safety: all methods are pure and thread-safe.
 */
class ChunkCodec {
public:
    /// Slot array of a reassembly buffer; an empty optional is a missing chunk
    using Slots = std::vector<std::optional<std::vector<uint8_t>>>;

    /**
     * @brief Number of chunks for a file: ceil(size / chunkSize)
     * @throws std::invalid_argument if chunkSize is 0 or the count overflows uint32
     */
    static uint32_t totalChunks(uint64_t size, size_t chunkSize = CHUNK_SIZE);

    /**
     * @brief Split bytes into an ordered chunk sequence
     * @param bytes Source bytes (must outlive the sequence)
     * @param chunkSize Chunk size in bytes, must be > 0
     * @throws std::invalid_argument if chunkSize is 0
     *
     * Deterministic: the same bytes and chunk size always yield the same
     * sequence. Every chunk holds chunkSize bytes except the last, which
     * holds the remainder. Empty input yields an empty sequence.
     */
    static ChunkSequence split(const std::vector<uint8_t>& bytes,
                               size_t chunkSize = CHUNK_SIZE);

    /**
     * @brief Concatenate chunk slots in ascending index order
     * @param slots Slot array (index = chunkIndex)
     * @param expectedTotal Number of chunks that must be present
     * @param out Assembled bytes (only written on success)
     * @param error INCOMPLETE_TRANSFER if any slot in [0, expectedTotal) is absent
     * @return true if all chunks were present
     *
     * Never pads or fills gaps: a missing chunk fails the whole assembly so
     * truncated bytes can never be emitted.
     */
    static bool reassemble(const Slots& slots,
                           uint32_t expectedTotal,
                           std::vector<uint8_t>& out,
                           ErrorInfo& error);

    /**
     * @brief Per-file progress after `done` of `total` chunks
     * @return round(100 * done / total), held at 99 until done == total
     *
     * Rounding alone would report 100 before the last chunk of a file with
     * more than 200 chunks; the cap keeps 100 for the final chunk only.
     * A file with total == 0 is complete and reports 100.
     */
    static int progressPercent(uint32_t done, uint32_t total);

private:
    ChunkCodec() = delete;
};

}  // namespace PeerDrop
