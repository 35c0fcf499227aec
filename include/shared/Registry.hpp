#pragma once

#include "shared/Chunk.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace basalt {

/**
 * @brief How unknown names are resolved
 */
enum class RegistryMode : uint8_t {
    Lenient,    ///< Unknown names resolve to id 0 (air / first biome)
    Strict,     ///< Unknown names throw ProtocolError (UnknownRegistryEntry)
};

/**
 * @brief Name to numeric id tables for block states and biomes
 *
 * Loaded once at startup and read-only afterwards, so one instance can be
 * shared by any number of concurrent packet builds.
 */
class Registry {
public:
    using IdTable = std::unordered_map<std::string, int32_t>;

    Registry() = default;
    Registry(IdTable blockStates, IdTable biomes);

    /**
     * @brief Built-in table covering the block states and biome the stub terrain uses
     */
    static Registry builtin();

    /**
     * @brief Load a registry from YAML
     *
     * Format:
     *   blocks:
     *     minecraft:air: 0
     *     "minecraft:oak_log[axis=y]": 131
     *   biomes:
     *     minecraft:plains: 1
     *
     * @param path YAML file to read
     * @param outRegistry Registry to replace on success
     * @return true if the file was parsed and every id is a non-negative integer
     */
    static bool loadFromFile(const std::string& path, Registry& outRegistry);
    static bool loadFromString(const std::string& yaml, Registry& outRegistry);

    /**
     * @brief Id of a block state, trying "name[props]" first and then the bare name
     */
    std::optional<int32_t> lookupBlockState(const PaletteEntry& entry) const;
    std::optional<int32_t> lookupBlockState(const std::string& name) const;
    std::optional<int32_t> lookupBiome(const std::string& name) const;

    /**
     * @brief Like lookup, but applies mode to unknown names
     * @throws ProtocolError (UnknownRegistryEntry) for unknown names in strict mode
     */
    int32_t resolveBlockState(const PaletteEntry& entry, RegistryMode mode) const;
    int32_t resolveBiome(const std::string& name, RegistryMode mode) const;

    size_t getBlockStateCount() const { return blockStates.size(); }
    size_t getBiomeCount() const { return biomes.size(); }

private:
    IdTable blockStates;
    IdTable biomes;
};

} // namespace basalt
