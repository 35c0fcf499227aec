#include "protocol/BitPacker.hpp"
#include "protocol/ProtocolError.hpp"

#include <bit>
#include <stdexcept>
#include <string>

namespace basalt::protocol {

namespace {

void checkBitsPerEntry(uint8_t bitsPerEntry) {
    if (bitsPerEntry < BitPacker::MIN_BITS || bitsPerEntry > BitPacker::MAX_BITS) {
        throw std::invalid_argument("bitsPerEntry must be in 1..63, got " +
                                    std::to_string(bitsPerEntry));
    }
}

} // namespace

size_t BitPacker::entriesPerWord(uint8_t bitsPerEntry) {
    checkBitsPerEntry(bitsPerEntry);
    return 64 / bitsPerEntry;
}

size_t BitPacker::wordCount(size_t count, uint8_t bitsPerEntry) {
    size_t perWord = entriesPerWord(bitsPerEntry);
    return (count + perWord - 1) / perWord;
}

std::vector<uint64_t> BitPacker::pack(const std::vector<uint64_t>& values, uint8_t bitsPerEntry) {
    const size_t perWord = entriesPerWord(bitsPerEntry);
    const uint64_t mask = (uint64_t{1} << bitsPerEntry) - 1;

    std::vector<uint64_t> words;
    words.reserve(wordCount(values.size(), bitsPerEntry));

    uint64_t current = 0;
    size_t entriesInCurrent = 0;
    for (uint64_t value : values) {
        current |= (value & mask) << (bitsPerEntry * entriesInCurrent);
        entriesInCurrent++;

        // Next entry would cross the word boundary: flush with zero padding
        if (entriesInCurrent == perWord) {
            words.push_back(current);
            current = 0;
            entriesInCurrent = 0;
        }
    }

    if (entriesInCurrent > 0) {
        words.push_back(current);
    }
    return words;
}

std::vector<uint64_t> BitPacker::unpack(const std::vector<uint64_t>& words, uint8_t bitsPerEntry, size_t count) {
    const size_t perWord = entriesPerWord(bitsPerEntry);
    const uint64_t mask = (uint64_t{1} << bitsPerEntry) - 1;

    if (words.size() < wordCount(count, bitsPerEntry)) {
        throw ProtocolError(ErrorKind::MalformedSectionData,
                            "Packed array of " + std::to_string(words.size()) + " words cannot hold " +
                            std::to_string(count) + " entries of " + std::to_string(bitsPerEntry) + " bits");
    }

    std::vector<uint64_t> values;
    values.reserve(count);
    for (size_t idx = 0; idx < count; idx++) {
        uint64_t word = words[idx / perWord];
        size_t shift = (idx % perWord) * bitsPerEntry;
        values.push_back((word >> shift) & mask);
    }
    return values;
}

std::vector<int64_t> BitPacker::toSignedWords(const std::vector<uint64_t>& words) {
    std::vector<int64_t> out;
    out.reserve(words.size());
    for (uint64_t word : words) {
        out.push_back(std::bit_cast<int64_t>(word));
    }
    return out;
}

std::vector<uint64_t> BitPacker::toUnsignedWords(const std::vector<int64_t>& words) {
    std::vector<uint64_t> out;
    out.reserve(words.size());
    for (int64_t word : words) {
        out.push_back(std::bit_cast<uint64_t>(word));
    }
    return out;
}

} // namespace basalt::protocol
