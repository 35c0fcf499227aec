#pragma once

#include "shared/Chunk.hpp"
#include <cstdint>
#include <vector>

namespace basalt {

/**
 * @brief Derives column heightmaps from section block data
 *
 * Heights are stored relative to the bottom of the world: the entry for a
 * column is (topmost non-air y) - MIN_Y + 1, or 0 for an empty column.
 * Entries are ordered z * 16 + x and packed at HEIGHTMAP_BITS per entry.
 */
class HeightmapBuilder {
public:
    /**
     * @brief Per-column heights, 256 entries
     */
    static std::vector<uint64_t> computeHeights(const Chunk& chunk);

    /**
     * @brief Packed heightmap words ready for a long-array tag
     */
    static std::vector<int64_t> compute(const Chunk& chunk);

    /**
     * @brief MOTION_BLOCKING and WORLD_SURFACE for a chunk
     *
     * Both maps carry the same heights; the stub world has no fluids or
     * non-motion-blocking blocks to tell them apart.
     */
    static Heightmaps build(const Chunk& chunk);
};

} // namespace basalt
