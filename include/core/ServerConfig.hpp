#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace basalt {

/**
 * @brief Protocol constants and runtime settings for the chunk wire core
 *
 * The static constants describe the fixed world layout the client expects
 * (protocol 763, data version 3465). Runtime settings are loaded from YAML
 * by ConfigLoader.
 */
struct ServerConfig {
    // World layout
    static constexpr int32_t SECTION_COUNT = 24;                 ///< Sections per chunk column
    static constexpr int32_t MIN_SECTION_Y = -4;                 ///< Section index of the lowest section
    static constexpr int32_t SECTION_WIDTH = 16;                 ///< Voxels along each section axis
    static constexpr int32_t MIN_Y = MIN_SECTION_Y * SECTION_WIDTH;       ///< Lowest block y (-64)
    static constexpr int32_t WORLD_HEIGHT = SECTION_COUNT * SECTION_WIDTH; ///< Column height in blocks (384)
    static constexpr size_t SECTION_VOLUME = 4096;               ///< Block states per section (16^3)
    static constexpr size_t BIOME_VOLUME = 64;                   ///< Biome cells per section (4^3)
    static constexpr size_t LIGHT_ARRAY_SIZE = 2048;             ///< Bytes per light array (4096 nibbles)
    static constexpr size_t HEIGHTMAP_ENTRIES = 256;             ///< One heightmap entry per column

    // Wire format
    static constexpr int32_t CHUNK_DATA_PACKET_ID = 0x24;        ///< Chunk Data and Update Light
    static constexpr int32_t DATA_VERSION = 3465;                ///< World data version
    static constexpr int16_t LEGACY_NON_AIR_COUNT = 4096;        ///< Non-air count written for every section
    static constexpr uint8_t FIXED_BLOCK_BITS = 15;              ///< Block bits-per-entry under the fixed policy
    static constexpr uint8_t DIRECT_BLOCK_BITS = 15;             ///< Global palette width for block states
    static constexpr uint8_t DIRECT_BIOME_BITS = 6;              ///< Global palette width for biomes
    static constexpr uint8_t HEIGHTMAP_BITS = 9;                 ///< ceil(log2(WORLD_HEIGHT + 1))

    enum class PaletteMode : uint8_t {
        Fixed,      ///< Fixed block width, palette always emitted
        Vanilla,    ///< Width derived from palette size, single/indirect/direct formats
    };

    enum class LightingMode : uint8_t {
        FullBright, ///< Every section fully lit
        Stored,     ///< Light arrays taken from the sections
    };

    /**
     * @brief Runtime configurable settings
     */
    struct Runtime {
        std::string logLevel = "info";                      ///< spdlog level name
        std::string logFile;                                ///< Log file path, empty for console only
        std::string registryPath;                           ///< Registry YAML, empty for the built-in table
        bool strictRegistry = false;                        ///< Fail on unknown block/biome names
        PaletteMode paletteMode = PaletteMode::Fixed;       ///< Bits-per-entry policy
        LightingMode lightingMode = LightingMode::FullBright;
        bool frameOutput = true;                            ///< Prefix dumped packets with their length
    };
};

} // namespace basalt
