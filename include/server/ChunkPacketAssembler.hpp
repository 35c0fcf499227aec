#pragma once

#include "core/ServerConfig.hpp"
#include "protocol/ByteStream.hpp"
#include "shared/Chunk.hpp"
#include "shared/ChunkPos.hpp"
#include "shared/LightBuilder.hpp"
#include "shared/PalettePolicy.hpp"
#include "shared/Registry.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace basalt {

/**
 * @brief Block entity entry of a chunk data packet
 *
 * Format: [packedXz:u8][y:i16][typeId:VarInt][tag payload]
 */
struct BlockEntity {
    uint8_t packedXz = 0;           ///< Section-relative x in the high nibble, z in the low nibble
    int16_t y = 0;                  ///< Absolute block y
    int32_t typeId = 0;
    std::vector<uint8_t> tagPayload; ///< Pre-encoded network NBT

    static uint8_t packXz(int32_t x, int32_t z);  // NOLINT(readability-identifier-length)

    void encode(protocol::ByteSink& sink) const;
};

/**
 * @brief Chunk Data and Update Light packet (0x24)
 *
 * Wire order:
 *   [packetId:VarInt][chunkX:i32][chunkZ:i32][heightmaps:NBT]
 *   [dataLength:VarInt][data]
 *   [blockEntityCount:VarInt][blockEntity]...
 *   [skyMask][blockMask][emptySkyMask][emptyBlockMask]
 *   [skyArrayCount:VarInt][length:VarInt][bytes]...
 *   [blockArrayCount:VarInt][length:VarInt][bytes]...
 */
struct ChunkDataPacket {
    int32_t packetId = ServerConfig::CHUNK_DATA_PACKET_ID;
    int32_t chunkX = 0;
    int32_t chunkZ = 0;
    std::vector<uint8_t> heightmaps;    ///< Encoded heightmap compound
    std::vector<uint8_t> data;          ///< Concatenated section payloads
    std::vector<BlockEntity> blockEntities;
    LightData light;

    void encode(protocol::ByteSink& sink) const;
};

/**
 * @brief Builds chunk data packets in three phases: build, serialize sections, compose
 *
 * The assembler holds only read-only collaborators, so one instance can serve
 * concurrent builds as long as each writes to its own sink. A failure in any
 * phase aborts the packet and nothing reaches the caller's sink.
 */
class ChunkPacketAssembler {
public:
    ChunkPacketAssembler(const Registry& registry, const PalettePolicy& policy,
                         ServerConfig::LightingMode lightingMode = ServerConfig::LightingMode::FullBright,
                         RegistryMode registryMode = RegistryMode::Lenient);

    /**
     * @brief Phase 1: in-memory chunk for a column
     */
    Chunk build(const ChunkPos& pos) const;

    /**
     * @brief Phase 2: block states then biomes for every section, bottom to top
     * @throws ProtocolError MissingSectionData if a section lacks block states or
     *         biomes, or the column does not have SECTION_COUNT sections
     */
    std::vector<uint8_t> serializeSections(const Chunk& chunk) const;

    /**
     * @brief Phase 3: packet record from a chunk and its serialized sections
     * @throws ProtocolError (MissingSectionData) if the chunk has no heightmaps
     */
    ChunkDataPacket compose(const Chunk& chunk, std::vector<uint8_t> data) const;

    /**
     * @brief Run all phases for a column and return the packet record
     */
    ChunkDataPacket assemblePacket(const ChunkPos& pos) const;

    /**
     * @brief Run all phases and write the encoded packet
     * @return Number of bytes written to sink
     */
    size_t assemble(const ChunkPos& pos, protocol::ByteSink& sink) const;
    size_t assemble(const Chunk& chunk, protocol::ByteSink& sink) const;

    ServerConfig::LightingMode getLightingMode() const { return lightingMode; }

private:
    const Registry& registry;
    const PalettePolicy& policy;
    ServerConfig::LightingMode lightingMode;
    RegistryMode registryMode;

    LightData buildLight(const Chunk& chunk) const;
};

} // namespace basalt
