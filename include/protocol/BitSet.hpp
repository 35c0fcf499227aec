#pragma once

#include "protocol/ByteStream.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace basalt::protocol {

/**
 * @brief Growable bit set in the wire's long-array layout
 *
 * Bit i lives in word i / 64 at position i % 64. Encoded as a VarInt word
 * count followed by big-endian longs; an empty set encodes as a single 0.
 */
class BitSet {
public:
    BitSet() = default;

    /**
     * @brief Set with bits 0..count-1 set
     */
    static BitSet firstBits(size_t count);

    void set(size_t index);
    bool test(size_t index) const;

    /**
     * @brief Number of set bits
     */
    size_t count() const;
    bool empty() const { return count() == 0; }

    const std::vector<uint64_t>& getWords() const { return words; }

    void encode(ByteSink& sink) const;
    static BitSet decode(ByteSource& source);

    bool operator==(const BitSet& other) const;

private:
    std::vector<uint64_t> words;
};

} // namespace basalt::protocol
