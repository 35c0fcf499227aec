#include "shared/HeightmapBuilder.hpp"
#include "core/ServerConfig.hpp"
#include "protocol/BitPacker.hpp"

#include <algorithm>

namespace basalt {

std::vector<uint64_t> HeightmapBuilder::computeHeights(const Chunk& chunk) {
    constexpr int32_t SIZE = ServerConfig::SECTION_WIDTH;
    std::vector<uint64_t> heights(ServerConfig::HEIGHTMAP_ENTRIES, 0);

    // Walk sections from the top so the first hit per column is the highest
    std::vector<const Section*> ordered;
    ordered.reserve(chunk.sections.size());
    for (const auto& section : chunk.sections) {
        bool inWorld = section.y >= ServerConfig::MIN_SECTION_Y &&
                       section.y < ServerConfig::MIN_SECTION_Y + ServerConfig::SECTION_COUNT;
        if (inWorld && section.blockStates &&
            section.blockStates->indices.size() == ServerConfig::SECTION_VOLUME) {
            ordered.push_back(&section);
        }
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const Section* lhs, const Section* rhs) { return lhs->y > rhs->y; });

    for (int32_t z = 0; z < SIZE; z++) {  // NOLINT(readability-identifier-length)
        for (int32_t x = 0; x < SIZE; x++) {  // NOLINT(readability-identifier-length)
            size_t column = static_cast<size_t>((z * SIZE) + x);

            for (const Section* section : ordered) {
                const auto& palette = section->blockStates->palette;
                const auto& indices = section->blockStates->indices;

                bool found = false;
                for (int32_t localY = SIZE - 1; localY >= 0; localY--) {
                    uint16_t paletteIndex = indices[Section::blockIndex(x, localY, z)];
                    if (paletteIndex < palette.size() && !palette[paletteIndex].isAir()) {
                        int32_t worldY = (section->y * SIZE) + localY;
                        heights[column] = static_cast<uint64_t>(worldY - ServerConfig::MIN_Y + 1);
                        found = true;
                        break;
                    }
                }
                if (found) {
                    break;
                }
            }
        }
    }

    return heights;
}

std::vector<int64_t> HeightmapBuilder::compute(const Chunk& chunk) {
    auto words = protocol::BitPacker::pack(computeHeights(chunk), ServerConfig::HEIGHTMAP_BITS);
    return protocol::BitPacker::toSignedWords(words);
}

Heightmaps HeightmapBuilder::build(const Chunk& chunk) {
    Heightmaps heightmaps;
    heightmaps.motionBlocking = compute(chunk);
    heightmaps.worldSurface = heightmaps.motionBlocking;
    return heightmaps;
}

} // namespace basalt
