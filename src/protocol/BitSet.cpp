#include "protocol/BitSet.hpp"
#include "protocol/BitPacker.hpp"
#include "protocol/Primitives.hpp"

#include <algorithm>
#include <bit>

namespace basalt::protocol {

BitSet BitSet::firstBits(size_t count) {
    BitSet bits;
    for (size_t idx = 0; idx < count; idx++) {
        bits.set(idx);
    }
    return bits;
}

void BitSet::set(size_t index) {
    size_t word = index / 64;
    if (word >= words.size()) {
        words.resize(word + 1, 0);
    }
    words[word] |= uint64_t{1} << (index % 64);
}

bool BitSet::test(size_t index) const {
    size_t word = index / 64;
    if (word >= words.size()) {
        return false;
    }
    return ((words[word] >> (index % 64)) & 1) != 0;
}

size_t BitSet::count() const {
    size_t total = 0;
    for (uint64_t word : words) {
        total += static_cast<size_t>(std::popcount(word));
    }
    return total;
}

void BitSet::encode(ByteSink& sink) const {
    // Trailing zero words carry no bits and are not sent
    auto last = std::find_if(words.rbegin(), words.rend(), [](uint64_t word) { return word != 0; });
    std::vector<uint64_t> trimmed(words.begin(), last.base());
    writeLongArray(sink, BitPacker::toSignedWords(trimmed));
}

BitSet BitSet::decode(ByteSource& source) {
    BitSet bits;
    bits.words = BitPacker::toUnsignedWords(readLongArray(source));
    return bits;
}

bool BitSet::operator==(const BitSet& other) const {
    size_t longest = std::max(words.size(), other.words.size());
    for (size_t idx = 0; idx < longest; idx++) {
        uint64_t lhs = idx < words.size() ? words[idx] : 0;
        uint64_t rhs = idx < other.words.size() ? other.words[idx] : 0;
        if (lhs != rhs) {
            return false;
        }
    }
    return true;
}

} // namespace basalt::protocol
