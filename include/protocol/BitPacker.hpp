#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace basalt::protocol {

/**
 * @brief Packs fixed-width unsigned entries into 64-bit words
 *
 * Entries are packed low bit first. An entry never straddles two words:
 * when it would not fit in the bits left in the current word, those bits
 * stay zero and the entry starts the next word. So each word holds
 * floor(64 / bitsPerEntry) entries.
 *
 * Example with bitsPerEntry = 15 (4 entries per word, 4 padding bits):
 *   word = [pad:4][e3:15][e2:15][e1:15][e0:15]
 */
class BitPacker {
public:
    /**
     * @brief Pack values, each masked to bitsPerEntry bits
     * @param values Entries to pack
     * @param bitsPerEntry Width of every entry (1..63)
     * @return wordCount(values.size(), bitsPerEntry) words
     * @throws std::invalid_argument if bitsPerEntry is out of range
     */
    static std::vector<uint64_t> pack(const std::vector<uint64_t>& values, uint8_t bitsPerEntry);

    /**
     * @brief Inverse of pack()
     * @param words Packed words
     * @param bitsPerEntry Width used when packing
     * @param count Number of entries to extract
     * @throws ProtocolError (MalformedSectionData) if words holds fewer than count entries
     */
    static std::vector<uint64_t> unpack(const std::vector<uint64_t>& words, uint8_t bitsPerEntry, size_t count);

    static size_t entriesPerWord(uint8_t bitsPerEntry);
    static size_t wordCount(size_t count, uint8_t bitsPerEntry);

    /**
     * @brief Reinterpret packed words as the signed longs the wire carries
     */
    static std::vector<int64_t> toSignedWords(const std::vector<uint64_t>& words);
    static std::vector<uint64_t> toUnsignedWords(const std::vector<int64_t>& words);

    static constexpr uint8_t MIN_BITS = 1;
    static constexpr uint8_t MAX_BITS = 63;
};

} // namespace basalt::protocol
