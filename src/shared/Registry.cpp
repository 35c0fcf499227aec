#include "shared/Registry.hpp"
#include "core/Logger.hpp"
#include "protocol/ProtocolError.hpp"

#include <yaml-cpp/yaml.h>
#include <utility>

namespace basalt {

namespace {

std::optional<int32_t> findId(const Registry::IdTable& table, const std::string& name) {
    auto it = table.find(name);
    if (it != table.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool readTable(const YAML::Node& node, const char* section, Registry::IdTable& outTable) {
    if (!node) {
        return true;  // Section is optional
    }
    if (!node.IsMap()) {
        LOG_ERROR("Registry section '{}' must be a mapping", section);
        return false;
    }

    for (const auto& item : node) {
        if (!item.first.IsScalar()) {
            LOG_ERROR("Registry section '{}' has a non-scalar key at line {}", section,
                      item.first.Mark().line + 1);
            return false;
        }
        std::string name;
        int32_t id = 0;
        try {
            name = item.first.as<std::string>();
            id = item.second.as<int32_t>();
        } catch (const YAML::Exception& e) {
            LOG_ERROR("Registry entry '{}' in '{}' has a non-integer id: {}", name, section, e.what());
            return false;
        }
        if (id < 0) {
            LOG_ERROR("Registry entry '{}' in '{}' has negative id {}", name, section, id);
            return false;
        }
        if (!outTable.emplace(name, id).second) {
            LOG_WARN("Duplicate registry entry '{}' in '{}'; keeping the first id", name, section);
        }
    }
    return true;
}

bool readRegistry(const YAML::Node& doc, Registry& outRegistry) {
    if (!doc.IsMap()) {
        LOG_ERROR("Registry root must be a mapping");
        return false;
    }

    Registry::IdTable blockStates;
    Registry::IdTable biomes;
    if (!readTable(doc["blocks"], "blocks", blockStates) ||
        !readTable(doc["biomes"], "biomes", biomes)) {
        return false;
    }

    outRegistry = Registry(std::move(blockStates), std::move(biomes));
    return true;
}

} // namespace

Registry::Registry(IdTable blockStates, IdTable biomes)
    : blockStates(std::move(blockStates)), biomes(std::move(biomes)) {
}

Registry Registry::builtin() {
    return Registry(
        {
            {"minecraft:air", 0},
            {"minecraft:stone", 1},
            {"minecraft:grass_block", 9},
            {"minecraft:oak_log", 131},
        },
        {
            {"minecraft:plains", 1},
        });
}

bool Registry::loadFromFile(const std::string& path, Registry& outRegistry) {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Error parsing registry file {}: {}", path, e.what());
        return false;
    }

    try {
        if (!readRegistry(doc, outRegistry)) {
            LOG_ERROR("Rejected registry file {}", path);
            return false;
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Rejected registry file {}: {}", path, e.what());
        return false;
    }

    LOG_INFO("Loaded registry {} | {} block states | {} biomes",
             path, outRegistry.getBlockStateCount(), outRegistry.getBiomeCount());
    return true;
}

bool Registry::loadFromString(const std::string& yaml, Registry& outRegistry) {
    YAML::Node doc;
    try {
        doc = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Error parsing registry: {}", e.what());
        return false;
    }

    try {
        return readRegistry(doc, outRegistry);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Rejected registry: {}", e.what());
        return false;
    }
}

std::optional<int32_t> Registry::lookupBlockState(const PaletteEntry& entry) const {
    if (!entry.properties.empty()) {
        if (auto id = findId(blockStates, entry.stateKey())) {
            return id;
        }
    }
    return findId(blockStates, entry.name);
}

std::optional<int32_t> Registry::lookupBlockState(const std::string& name) const {
    return findId(blockStates, name);
}

std::optional<int32_t> Registry::lookupBiome(const std::string& name) const {
    return findId(biomes, name);
}

int32_t Registry::resolveBlockState(const PaletteEntry& entry, RegistryMode mode) const {
    if (auto id = lookupBlockState(entry)) {
        return *id;
    }
    if (mode == RegistryMode::Strict) {
        throw protocol::ProtocolError(protocol::ErrorKind::UnknownRegistryEntry,
                                      "Unknown block state '" + entry.stateKey() + "'");
    }
    return 0;
}

int32_t Registry::resolveBiome(const std::string& name, RegistryMode mode) const {
    if (auto id = lookupBiome(name)) {
        return *id;
    }
    if (mode == RegistryMode::Strict) {
        throw protocol::ProtocolError(protocol::ErrorKind::UnknownRegistryEntry,
                                      "Unknown biome '" + name + "'");
    }
    return 0;
}

} // namespace basalt
