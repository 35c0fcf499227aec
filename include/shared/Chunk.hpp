#pragma once

#include "core/ServerConfig.hpp"
#include "protocol/ByteStream.hpp"
#include "shared/ChunkPos.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace basalt {

/**
 * @brief One distinct block state in a section palette
 */
struct PaletteEntry {
    std::string name;                               ///< Namespaced id, e.g. "minecraft:oak_log"
    std::map<std::string, std::string> properties;  ///< State properties, e.g. axis=y

    /**
     * @brief Registry key including properties: "minecraft:oak_log[axis=y]"
     *
     * Returns the bare name when there are no properties.
     */
    std::string stateKey() const;

    bool isAir() const;

    bool operator==(const PaletteEntry& other) const {
        return name == other.name && properties == other.properties;
    }
};

/**
 * @brief Block-state palette and per-voxel indices of one section
 *
 * indices has ServerConfig::SECTION_VOLUME entries in y-z-x order and every
 * index is below palette.size().
 */
struct BlockStates {
    std::vector<PaletteEntry> palette;
    std::vector<uint16_t> indices;
};

/**
 * @brief Biome palette and per-cell indices of one section (4x4x4 cells)
 *
 * Empty indices means every cell uses palette entry 0.
 */
struct Biomes {
    std::vector<std::string> palette;
    std::vector<uint16_t> indices;
};

/**
 * @brief A 16x16x16 slab of a chunk column
 */
struct Section {
    int8_t y = 0;                                   ///< Section index (-4 for the lowest section)
    std::optional<BlockStates> blockStates;         ///< Required for serialization
    std::optional<Biomes> biomes;                   ///< Required for serialization
    std::optional<std::vector<uint8_t>> skyLight;   ///< 2048 bytes, two voxels per byte
    std::optional<std::vector<uint8_t>> blockLight; ///< 2048 bytes, two voxels per byte

    /**
     * @brief Flat voxel index for local coordinates
     * @param x Local X coordinate (0-15)
     * @param y Local Y coordinate (0-15)
     * @param z Local Z coordinate (0-15)
     * @throws std::out_of_range for coordinates outside the section
     */
    static size_t blockIndex(int32_t x, int32_t y, int32_t z);  // NOLINT(readability-identifier-length)

    /**
     * @brief Palette entry of the voxel at local coordinates
     * @throws std::out_of_range if the section has no block states or the
     *         stored index is outside the palette
     */
    const PaletteEntry& getBlock(int32_t x, int32_t y, int32_t z) const;  // NOLINT(readability-identifier-length)

    /**
     * @brief Set the voxel at local coordinates, growing the palette if needed
     *
     * A section without block states is first filled with air.
     */
    void setBlock(int32_t x, int32_t y, int32_t z, const PaletteEntry& entry);  // NOLINT(readability-identifier-length)
};

/**
 * @brief Column heightmaps, each 256 entries packed at 9 bits (37 words)
 */
struct Heightmaps {
    std::optional<std::vector<int64_t>> motionBlocking;
    std::optional<std::vector<int64_t>> motionBlockingNoLeaves;
    std::optional<std::vector<int64_t>> oceanFloor;
    std::optional<std::vector<int64_t>> worldSurface;

    /**
     * @brief Write the heightmaps as a root compound with one long array per present map
     */
    void encode(protocol::ByteSink& sink) const;
};

/**
 * @brief A full chunk column, built per outgoing packet
 */
struct Chunk {
    std::string status = "full";
    int32_t dataVersion = ServerConfig::DATA_VERSION;
    ChunkPos pos;
    int32_t yPos = ServerConfig::MIN_SECTION_Y;     ///< Index of the lowest section
    std::vector<Section> sections;                  ///< Bottom to top
    std::optional<Heightmaps> heightmaps;

    /**
     * @brief Section with index y, or nullptr
     */
    const Section* findSection(int32_t y) const;  // NOLINT(readability-identifier-length)
};

} // namespace basalt
