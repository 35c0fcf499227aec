#include "server/StubTerrain.hpp"
#include "core/ServerConfig.hpp"
#include "shared/HeightmapBuilder.hpp"

#include <utility>

namespace basalt {

Section StubTerrain::buildSection(int8_t sectionY) {
    Section section;
    section.y = sectionY;

    BlockStates blockStates;
    blockStates.palette = {PaletteEntry{"minecraft:air", {}}, PaletteEntry{"minecraft:stone", {}}};
    blockStates.indices.assign(ServerConfig::SECTION_VOLUME, 1);
    section.blockStates = std::move(blockStates);

    Biomes biomes;
    biomes.palette = {"minecraft:plains"};
    biomes.indices.assign(ServerConfig::BIOME_VOLUME, 0);
    section.biomes = std::move(biomes);

    section.skyLight = std::vector<uint8_t>(ServerConfig::LIGHT_ARRAY_SIZE, 0xFF);
    section.blockLight = std::vector<uint8_t>(ServerConfig::LIGHT_ARRAY_SIZE, 0xFF);
    return section;
}

Chunk StubTerrain::build(const ChunkPos& pos) {
    Chunk chunk;
    chunk.pos = pos;
    chunk.yPos = ServerConfig::MIN_SECTION_Y;

    chunk.sections.reserve(ServerConfig::SECTION_COUNT);
    for (int32_t idx = 0; idx < ServerConfig::SECTION_COUNT; idx++) {
        chunk.sections.push_back(buildSection(static_cast<int8_t>(ServerConfig::MIN_SECTION_Y + idx)));
    }

    chunk.heightmaps = HeightmapBuilder::build(chunk);
    return chunk;
}

} // namespace basalt
