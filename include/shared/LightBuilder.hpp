#pragma once

#include "protocol/BitSet.hpp"
#include "shared/Chunk.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace basalt {

/**
 * @brief Light masks and arrays for one chunk column
 *
 * Bit i of a mask refers to the i-th section of the column (bottom first).
 * Arrays appear in ascending section order, one per set bit of the
 * corresponding non-empty mask.
 */
struct LightData {
    protocol::BitSet skyMask;
    protocol::BitSet blockMask;
    protocol::BitSet emptySkyMask;
    protocol::BitSet emptyBlockMask;
    std::vector<std::vector<uint8_t>> skyArrays;
    std::vector<std::vector<uint8_t>> blockArrays;

    /**
     * @brief Masks in wire order, then each array list as count + length-prefixed arrays
     */
    void encode(protocol::ByteSink& sink) const;
};

class LightBuilder {
public:
    /// Every nibble at light level 15
    static constexpr uint8_t FULL_BRIGHT_BYTE = 0xFF;

    /**
     * @brief Every section fully lit for sky and block light
     */
    static LightData fullBright(size_t sectionCount = ServerConfig::SECTION_COUNT);

    /**
     * @brief Light taken from the arrays stored on each section
     *
     * A non-zero array sets the mask bit and is emitted, an all-zero array
     * sets the empty-mask bit, an absent array sets neither.
     * @throws ProtocolError (MalformedSectionData) for an array that is not 2048 bytes
     */
    static LightData fromSections(const std::vector<Section>& sections);
};

} // namespace basalt
