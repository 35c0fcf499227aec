#pragma once

#include "shared/Chunk.hpp"
#include "shared/ChunkPos.hpp"

namespace basalt {

/**
 * @brief Static terrain used when no world storage backs a chunk
 *
 * Every section of the column is solid stone under a plains biome, fully lit.
 */
class StubTerrain {
public:
    static Chunk build(const ChunkPos& pos);

    /**
     * @brief One solid stone section at the given section index
     */
    static Section buildSection(int8_t sectionY);
};

} // namespace basalt
