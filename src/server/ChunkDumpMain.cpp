#include "core/ConfigLoader.hpp"
#include "core/CrashHandler.hpp"
#include "core/Logger.hpp"
#include "core/ServerConfig.hpp"
#include "protocol/ByteStream.hpp"
#include "protocol/PacketFrame.hpp"
#include "protocol/ProtocolError.hpp"
#include "server/ChunkPacketAssembler.hpp"
#include "shared/PaletteEncoder.hpp"
#include "shared/PalettePolicy.hpp"
#include "shared/Registry.hpp"

#include <cstdint>
#include <exception>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <config.yaml> <chunkX> <chunkZ> <output.bin>\n";
}

std::optional<int32_t> parseCoordinate(const std::string& text) {
    try {
        size_t consumed = 0;
        int value = std::stoi(text, &consumed);
        if (consumed != text.size()) {
            return std::nullopt;
        }
        return static_cast<int32_t>(value);
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

/**
 * @brief Decode the section payload back and check it matches the column layout
 */
void verifyPacket(const basalt::ChunkDataPacket& packet, const basalt::PalettePolicy& policy) {
    auto sections = basalt::PaletteDecoder::decodeSections(packet.data, basalt::ServerConfig::SECTION_COUNT,
                                                           policy);

    size_t distinctStates = 0;
    for (const auto& section : sections) {
        distinctStates += section.blockStates.palette.size();
    }

    LOG_INFO("Verified {} sections | {} palette entries | sky arrays: {} | block arrays: {}",
             sections.size(), distinctStates, packet.light.skyArrays.size(), packet.light.blockArrays.size());
}

} // namespace

int main(int argc, char* argv[]) {
    basalt::Logger::init("Basalt");

    if (argc != 5) {
        printUsage(argv[0]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        return 2;
    }

    const std::string configPath = argv[1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    const std::string outputPath = argv[4];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    auto chunkX = parseCoordinate(argv[2]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    auto chunkZ = parseCoordinate(argv[3]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (!chunkX || !chunkZ) {
        LOG_ERROR("Chunk coordinates must be integers");
        printUsage(argv[0]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        return 2;
    }

    basalt::ServerConfig::Runtime config;
    if (!basalt::ConfigLoader::load(configPath, config)) {
        basalt::Logger::shutdown();
        return 1;
    }

    auto level = basalt::Logger::parseLevel(config.logLevel);
    basalt::Logger::init("Basalt", config.logFile, level.value_or(spdlog::level::info));

    LOG_INFO("=== Basalt chunk dump ===");
    LOG_INFO("Palette mode: {} | lighting: {} | registry: {}",
             basalt::ConfigLoader::paletteModeName(config.paletteMode),
             basalt::ConfigLoader::lightingModeName(config.lightingMode),
             config.strictRegistry ? "strict" : "lenient");

    try {
        basalt::Registry registry = basalt::Registry::builtin();
        if (!config.registryPath.empty() && !basalt::Registry::loadFromFile(config.registryPath, registry)) {
            basalt::Logger::shutdown();
            return 1;
        }
        LOG_DEBUG("Registry: {} block states, {} biomes",
                  registry.getBlockStateCount(), registry.getBiomeCount());

        auto policy = basalt::makePalettePolicy(config.paletteMode);
        basalt::RegistryMode registryMode =
            config.strictRegistry ? basalt::RegistryMode::Strict : basalt::RegistryMode::Lenient;
        basalt::ChunkPacketAssembler assembler(registry, *policy, config.lightingMode, registryMode);

        basalt::ChunkDataPacket packet = assembler.assemblePacket(basalt::ChunkPos(*chunkX, *chunkZ));
        basalt::protocol::BufferSink body;
        packet.encode(body);

        std::ofstream file(outputPath, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            LOG_ERROR("Failed to open output file: {}", outputPath);
            basalt::Logger::shutdown();
            return 1;
        }

        basalt::protocol::StreamByteSink out(file);
        if (config.frameOutput) {
            basalt::protocol::framePacket(body.getBuffer(), out);
        } else {
            out.write(body.getBuffer());
        }
        file.close();

        LOG_INFO("Wrote chunk ({}, {}) to {} | packet: {} bytes{}",
                 *chunkX, *chunkZ, outputPath, body.size(), config.frameOutput ? " (framed)" : "");

        verifyPacket(packet, *policy);

    } catch (const basalt::protocol::ProtocolError& e) {
        LOG_CRITICAL("Chunk assembly failed [{}]: {}", basalt::protocol::errorKindName(e.kind()), e.what());
        basalt::CrashHandler::logStackTrace();
        basalt::Logger::shutdown();
        return 1;
    } catch (const std::exception& e) {
        LOG_CRITICAL("Fatal error: {}", e.what());
        basalt::CrashHandler::logStackTrace();
        basalt::Logger::shutdown();
        return 1;
    }

    basalt::Logger::shutdown();
    return 0;
}
