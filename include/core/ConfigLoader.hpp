#pragma once

#include "core/ServerConfig.hpp"
#include <string>

namespace basalt {

/**
 * @brief Loads ServerConfig::Runtime from YAML
 *
 * Keys that are absent keep their defaults. Layout:
 *
 *   logging:  { level: info, file: logs/basalt.log }
 *   registry: { path: config/registry.yaml, strict: false }
 *   chunk:    { palette_mode: fixed, lighting_mode: full_bright, frame_output: true }
 */
class ConfigLoader {
public:
    /**
     * @brief Load settings from a YAML file
     * @param path File to read
     * @param outConfig Settings to update
     * @return true if the file was read and every present key was valid
     */
    static bool load(const std::string& path, ServerConfig::Runtime& outConfig);

    /**
     * @brief Load settings from an in-memory YAML document
     */
    static bool loadFromString(const std::string& yaml, ServerConfig::Runtime& outConfig);

    static const char* paletteModeName(ServerConfig::PaletteMode mode);
    static const char* lightingModeName(ServerConfig::LightingMode mode);
};

} // namespace basalt
