#include "core/ConfigLoader.hpp"
#include "core/Logger.hpp"

#include <yaml-cpp/yaml.h>

namespace basalt {

namespace {

bool parsePaletteMode(const std::string& text, ServerConfig::PaletteMode& outMode) {
    if (text == "fixed") {
        outMode = ServerConfig::PaletteMode::Fixed;
        return true;
    }
    if (text == "vanilla") {
        outMode = ServerConfig::PaletteMode::Vanilla;
        return true;
    }
    return false;
}

bool parseLightingMode(const std::string& text, ServerConfig::LightingMode& outMode) {
    if (text == "full_bright") {
        outMode = ServerConfig::LightingMode::FullBright;
        return true;
    }
    if (text == "stored") {
        outMode = ServerConfig::LightingMode::Stored;
        return true;
    }
    return false;
}

bool apply(const YAML::Node& doc, ServerConfig::Runtime& outConfig) {
    if (!doc || doc.IsNull()) {
        return true;  // Empty document: keep defaults
    }
    if (!doc.IsMap()) {
        LOG_ERROR("Config root must be a mapping");
        return false;
    }

    // Work on a copy so a bad key leaves the caller's settings untouched
    ServerConfig::Runtime config = outConfig;

    try {
        if (const auto logging = doc["logging"]) {
            if (logging["level"]) {
                config.logLevel = logging["level"].as<std::string>();
                if (!Logger::parseLevel(config.logLevel)) {
                    LOG_ERROR("Invalid log level '{}'", config.logLevel);
                    return false;
                }
            }
            if (logging["file"]) {
                config.logFile = logging["file"].as<std::string>();
            }
        }

        if (const auto registry = doc["registry"]) {
            if (registry["path"]) {
                config.registryPath = registry["path"].as<std::string>();
            }
            if (registry["strict"]) {
                config.strictRegistry = registry["strict"].as<bool>();
            }
        }

        if (const auto chunk = doc["chunk"]) {
            if (chunk["palette_mode"]) {
                const auto text = chunk["palette_mode"].as<std::string>();
                if (!parsePaletteMode(text, config.paletteMode)) {
                    LOG_ERROR("Invalid palette_mode '{}' (expected fixed or vanilla)", text);
                    return false;
                }
            }
            if (chunk["lighting_mode"]) {
                const auto text = chunk["lighting_mode"].as<std::string>();
                if (!parseLightingMode(text, config.lightingMode)) {
                    LOG_ERROR("Invalid lighting_mode '{}' (expected full_bright or stored)", text);
                    return false;
                }
            }
            if (chunk["frame_output"]) {
                config.frameOutput = chunk["frame_output"].as<bool>();
            }
        }
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Invalid config value: {}", e.what());
        return false;
    }

    outConfig = config;
    return true;
}

} // namespace

bool ConfigLoader::load(const std::string& path, ServerConfig::Runtime& outConfig) {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Failed to parse config file {}: {}", path, e.what());
        return false;
    }

    if (!apply(doc, outConfig)) {
        LOG_ERROR("Rejected config file {}", path);
        return false;
    }

    LOG_DEBUG("Loaded config {} | palette: {} | lighting: {} | registry: {}",
              path, paletteModeName(outConfig.paletteMode),
              lightingModeName(outConfig.lightingMode),
              outConfig.registryPath.empty() ? "<builtin>" : outConfig.registryPath);
    return true;
}

bool ConfigLoader::loadFromString(const std::string& yaml, ServerConfig::Runtime& outConfig) {
    YAML::Node doc;
    try {
        doc = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("Failed to parse config: {}", e.what());
        return false;
    }
    return apply(doc, outConfig);
}

const char* ConfigLoader::paletteModeName(ServerConfig::PaletteMode mode) {
    switch (mode) {
        case ServerConfig::PaletteMode::Fixed:
            return "fixed";
        case ServerConfig::PaletteMode::Vanilla:
            return "vanilla";
    }
    return "unknown";
}

const char* ConfigLoader::lightingModeName(ServerConfig::LightingMode mode) {
    switch (mode) {
        case ServerConfig::LightingMode::FullBright:
            return "full_bright";
        case ServerConfig::LightingMode::Stored:
            return "stored";
    }
    return "unknown";
}

} // namespace basalt
