#include "shared/Chunk.hpp"
#include "nbt/TagWriter.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace basalt {

std::string PaletteEntry::stateKey() const {
    if (properties.empty()) {
        return name;
    }

    // std::map keeps the properties sorted, which makes the key canonical
    std::string key = name + "[";
    bool first = true;
    for (const auto& [property, value] : properties) {
        if (!first) {
            key += ",";
        }
        key += property + "=" + value;
        first = false;
    }
    key += "]";
    return key;
}

bool PaletteEntry::isAir() const {
    return name == "minecraft:air" || name == "minecraft:cave_air" || name == "minecraft:void_air";
}

size_t Section::blockIndex(int32_t x, int32_t y, int32_t z) {  // NOLINT(readability-identifier-length)
    constexpr int32_t SIZE = ServerConfig::SECTION_WIDTH;
    if (x < 0 || x >= SIZE || y < 0 || y >= SIZE || z < 0 || z >= SIZE) {
        throw std::out_of_range("Block coordinates (" + std::to_string(x) + ", " +
                                std::to_string(y) + ", " + std::to_string(z) +
                                ") out of section bounds");
    }
    // Layout: X varies fastest, then Z, then Y
    return static_cast<size_t>((y * SIZE * SIZE) + (z * SIZE) + x);
}

const PaletteEntry& Section::getBlock(int32_t x, int32_t y, int32_t z) const {  // NOLINT(readability-identifier-length)
    size_t index = blockIndex(x, y, z);
    if (!blockStates || blockStates->indices.size() != ServerConfig::SECTION_VOLUME) {
        throw std::out_of_range("Section " + std::to_string(this->y) + " has no block states");
    }

    uint16_t paletteIndex = blockStates->indices[index];
    if (paletteIndex >= blockStates->palette.size()) {
        throw std::out_of_range("Palette index " + std::to_string(paletteIndex) +
                                " outside palette of " + std::to_string(blockStates->palette.size()));
    }
    return blockStates->palette[paletteIndex];
}

void Section::setBlock(int32_t x, int32_t y, int32_t z, const PaletteEntry& entry) {  // NOLINT(readability-identifier-length)
    size_t index = blockIndex(x, y, z);
    if (!blockStates) {
        blockStates = BlockStates{{PaletteEntry{"minecraft:air", {}}},
                                  std::vector<uint16_t>(ServerConfig::SECTION_VOLUME, 0)};
    }

    auto& palette = blockStates->palette;
    auto it = std::find(palette.begin(), palette.end(), entry);
    size_t paletteIndex = static_cast<size_t>(std::distance(palette.begin(), it));
    if (it == palette.end()) {
        palette.push_back(entry);
    }

    blockStates->indices.resize(ServerConfig::SECTION_VOLUME, 0);
    blockStates->indices[index] = static_cast<uint16_t>(paletteIndex);
}

void Heightmaps::encode(protocol::ByteSink& sink) const {
    nbt::TagWriter writer(sink);
    writer.beginRoot();
    if (motionBlocking) {
        writer.writeLongArray("MOTION_BLOCKING", *motionBlocking);
    }
    if (motionBlockingNoLeaves) {
        writer.writeLongArray("MOTION_BLOCKING_NO_LEAVES", *motionBlockingNoLeaves);
    }
    if (oceanFloor) {
        writer.writeLongArray("OCEAN_FLOOR", *oceanFloor);
    }
    if (worldSurface) {
        writer.writeLongArray("WORLD_SURFACE", *worldSurface);
    }
    writer.endCompound();
}

const Section* Chunk::findSection(int32_t y) const {  // NOLINT(readability-identifier-length)
    for (const auto& section : sections) {
        if (section.y == y) {
            return &section;
        }
    }
    return nullptr;
}

} // namespace basalt
