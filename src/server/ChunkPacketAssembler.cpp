#include "server/ChunkPacketAssembler.hpp"
#include "core/Logger.hpp"
#include "protocol/Primitives.hpp"
#include "protocol/ProtocolError.hpp"
#include "protocol/VarInt.hpp"
#include "server/StubTerrain.hpp"
#include "shared/PaletteEncoder.hpp"

#include <string>
#include <utility>

namespace basalt {

using protocol::ErrorKind;
using protocol::ProtocolError;

uint8_t BlockEntity::packXz(int32_t x, int32_t z) {  // NOLINT(readability-identifier-length)
    return static_cast<uint8_t>(((x & 0x0F) << 4) | (z & 0x0F));
}

void BlockEntity::encode(protocol::ByteSink& sink) const {
    protocol::writeU8(sink, packedXz);
    protocol::writeI16(sink, y);
    protocol::writeVarInt(sink, typeId);
    sink.write(tagPayload);
}

void ChunkDataPacket::encode(protocol::ByteSink& sink) const {
    protocol::writeVarInt(sink, packetId);
    protocol::writeI32(sink, chunkX);
    protocol::writeI32(sink, chunkZ);
    sink.write(heightmaps);
    protocol::writeByteArray(sink, data);

    protocol::writeVarInt(sink, static_cast<int32_t>(blockEntities.size()));
    for (const auto& blockEntity : blockEntities) {
        blockEntity.encode(sink);
    }

    light.encode(sink);
}

ChunkPacketAssembler::ChunkPacketAssembler(const Registry& registry, const PalettePolicy& policy,
                                           ServerConfig::LightingMode lightingMode, RegistryMode registryMode)
    : registry(registry), policy(policy), lightingMode(lightingMode), registryMode(registryMode) {
}

Chunk ChunkPacketAssembler::build(const ChunkPos& pos) const {
    return StubTerrain::build(pos);
}

std::vector<uint8_t> ChunkPacketAssembler::serializeSections(const Chunk& chunk) const {
    if (chunk.sections.size() != static_cast<size_t>(ServerConfig::SECTION_COUNT)) {
        throw ProtocolError(ErrorKind::MissingSectionData,
                            "Chunk (" + std::to_string(chunk.pos.x) + ", " + std::to_string(chunk.pos.z) +
                            ") has " + std::to_string(chunk.sections.size()) + " sections, expected " +
                            std::to_string(ServerConfig::SECTION_COUNT));
    }

    PaletteEncoder encoder(registry, policy, registryMode);
    protocol::BufferSink payload;

    for (size_t idx = 0; idx < chunk.sections.size(); idx++) {
        const Section& section = chunk.sections[idx];
        int32_t expectedY = chunk.yPos + static_cast<int32_t>(idx);
        if (section.y != expectedY) {
            throw ProtocolError(ErrorKind::MalformedSectionData,
                                "Section " + std::to_string(section.y) + " found where section " +
                                std::to_string(expectedY) + " was expected");
        }
        if (!section.blockStates) {
            throw ProtocolError(ErrorKind::MissingSectionData,
                                "Section " + std::to_string(section.y) + " has no block states");
        }
        if (!section.biomes) {
            throw ProtocolError(ErrorKind::MissingSectionData,
                                "Section " + std::to_string(section.y) + " has no biomes");
        }

        encoder.encodeBlockStates(*section.blockStates, payload);
        encoder.encodeBiomes(*section.biomes, payload);
    }

    for (const auto& name : encoder.getUnresolvedNames()) {
        LOG_WARN("Unknown registry name '{}' in chunk ({}, {}), sent as id 0", name, chunk.pos.x, chunk.pos.z);
    }

    LOG_TRACE("Serialized {} sections of chunk ({}, {}) | {} bytes",
              chunk.sections.size(), chunk.pos.x, chunk.pos.z, payload.size());

    return payload.take();
}

LightData ChunkPacketAssembler::buildLight(const Chunk& chunk) const {
    switch (lightingMode) {
        case ServerConfig::LightingMode::FullBright:
            return LightBuilder::fullBright(chunk.sections.size());
        case ServerConfig::LightingMode::Stored:
            return LightBuilder::fromSections(chunk.sections);
    }
    return LightBuilder::fullBright(chunk.sections.size());
}

ChunkDataPacket ChunkPacketAssembler::compose(const Chunk& chunk, std::vector<uint8_t> data) const {
    if (!chunk.heightmaps) {
        throw ProtocolError(ErrorKind::MissingSectionData,
                            "Chunk (" + std::to_string(chunk.pos.x) + ", " + std::to_string(chunk.pos.z) +
                            ") has no heightmaps");
    }

    ChunkDataPacket packet;
    packet.chunkX = chunk.pos.x;
    packet.chunkZ = chunk.pos.z;

    protocol::BufferSink heightmaps;
    chunk.heightmaps->encode(heightmaps);
    packet.heightmaps = heightmaps.take();

    packet.data = std::move(data);
    packet.light = buildLight(chunk);
    return packet;
}

ChunkDataPacket ChunkPacketAssembler::assemblePacket(const ChunkPos& pos) const {
    Chunk chunk = build(pos);
    auto data = serializeSections(chunk);
    return compose(chunk, std::move(data));
}

size_t ChunkPacketAssembler::assemble(const ChunkPos& pos, protocol::ByteSink& sink) const {
    return assemble(build(pos), sink);
}

size_t ChunkPacketAssembler::assemble(const Chunk& chunk, protocol::ByteSink& sink) const {
    ChunkDataPacket packet = compose(chunk, serializeSections(chunk));

    // Encode into a private buffer so a failure never leaves a partial packet in sink
    protocol::BufferSink buffer;
    packet.encode(buffer);
    sink.write(buffer.getBuffer());

    LOG_DEBUG("Assembled chunk packet ({}, {}) | data: {} bytes | total: {} bytes",
              chunk.pos.x, chunk.pos.z, packet.data.size(), buffer.size());
    return buffer.size();
}

} // namespace basalt
