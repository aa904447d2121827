/**
 * @file ChunkCodec.cpp
 * @brief Chunk splitting and reassembly
 */

#include "peerdrop/ChunkCodec.h"
#include <limits>
#include <stdexcept>
#include <string>

namespace PeerDrop {

//=============================================================================
// ChunkSequence
//=============================================================================

ChunkSequence::ChunkSequence(const uint8_t* data, size_t size, size_t chunkSize)
    : m_data(data)
    , m_size(size)
    , m_chunkSize(chunkSize)
    , m_totalChunks(ChunkCodec::totalChunks(size, chunkSize))
{
}

ChunkSlice ChunkSequence::at(uint32_t index) const {
    if (index >= m_totalChunks) {
        throw std::out_of_range("chunk index " + std::to_string(index) +
                                " out of range (total " + std::to_string(m_totalChunks) + ")");
    }
    const size_t offset = static_cast<size_t>(index) * m_chunkSize;
    const size_t remaining = m_size - offset;

    ChunkSlice slice;
    slice.chunkIndex = index;
    slice.data = m_data + offset;
    slice.size = remaining < m_chunkSize ? remaining : m_chunkSize;
    return slice;
}

ChunkSequence::Iterator::Iterator(const ChunkSequence* sequence, uint32_t index)
    : m_sequence(sequence)
    , m_index(index)
{
    load();
}

ChunkSequence::Iterator& ChunkSequence::Iterator::operator++() {
    ++m_index;
    load();
    return *this;
}

void ChunkSequence::Iterator::load() {
    if (m_sequence && m_index < m_sequence->totalChunks()) {
        m_slice = m_sequence->at(m_index);
    } else {
        m_slice = ChunkSlice{};
        m_slice.chunkIndex = m_index;
    }
}

//=============================================================================
// ChunkCodec
//=============================================================================

uint32_t ChunkCodec::totalChunks(uint64_t size, size_t chunkSize) {
    if (chunkSize == 0) {
        throw std::invalid_argument("chunk size must be greater than zero");
    }
    const uint64_t count = size / chunkSize + (size % chunkSize != 0 ? 1 : 0);
    if (count > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("file of " + std::to_string(size) +
                                    " bytes needs more than 2^32-1 chunks");
    }
    return static_cast<uint32_t>(count);
}

ChunkSequence ChunkCodec::split(const std::vector<uint8_t>& bytes, size_t chunkSize) {
    return ChunkSequence(bytes.data(), bytes.size(), chunkSize);
}

bool ChunkCodec::reassemble(const Slots& slots,
                            uint32_t expectedTotal,
                            std::vector<uint8_t>& out,
                            ErrorInfo& error)
{
    if (slots.size() < expectedTotal) {
        error.set(ErrorKind::INCOMPLETE_TRANSFER,
                  "Only " + std::to_string(slots.size()) + " of " +
                  std::to_string(expectedTotal) + " chunk slots allocated");
        return false;
    }

    size_t totalBytes = 0;
    for (uint32_t i = 0; i < expectedTotal; ++i) {
        if (!slots[i].has_value()) {
            error.set(ErrorKind::INCOMPLETE_TRANSFER,
                      "Chunk " + std::to_string(i) + " of " +
                      std::to_string(expectedTotal) + " is missing");
            return false;
        }
        totalBytes += slots[i]->size();
    }

    std::vector<uint8_t> assembled;
    assembled.reserve(totalBytes);
    for (uint32_t i = 0; i < expectedTotal; ++i) {
        assembled.insert(assembled.end(), slots[i]->begin(), slots[i]->end());
    }

    out = std::move(assembled);
    return true;
}

int ChunkCodec::progressPercent(uint32_t done, uint32_t total) {
    if (total == 0 || done >= total) {
        return 100;
    }
    const uint64_t rounded = (static_cast<uint64_t>(done) * 200 + total) / (2 * static_cast<uint64_t>(total));
    return rounded >= 100 ? 99 : static_cast<int>(rounded);
}

}  // namespace PeerDrop
