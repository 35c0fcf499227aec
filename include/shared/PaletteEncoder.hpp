#pragma once

#include "protocol/ByteStream.hpp"
#include "shared/Chunk.hpp"
#include "shared/PalettePolicy.hpp"
#include "shared/Registry.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace basalt {

/**
 * @brief Serializes section palettes into paletted containers
 *
 * Container layout:
 *   [bitsPerEntry:u8]
 *   single value: [id:VarInt][0:VarInt]
 *   indirect:     [paletteLength:VarInt][id:VarInt]...[wordCount:VarInt][word:i64]...
 *   direct:       [wordCount:VarInt][word:i64]...
 *
 * Block-state payloads are preceded by the int16 non-air count. Every input
 * is validated before the first byte is written, so a failed encode leaves
 * the sink untouched.
 *
 * An encoder belongs to a single packet build.
 */
class PaletteEncoder {
public:
    PaletteEncoder(const Registry& registry, const PalettePolicy& policy,
                   RegistryMode mode = RegistryMode::Lenient);

    /**
     * @brief Write the non-air count and the block-state container of a section
     * @throws ProtocolError MissingSectionData for an empty palette,
     *         MalformedSectionData for a wrong index count or an index outside
     *         the palette, UnknownRegistryEntry in strict mode
     */
    void encodeBlockStates(const BlockStates& blockStates, protocol::ByteSink& sink);

    /**
     * @brief Write the biome container of a section
     */
    void encodeBiomes(const Biomes& biomes, protocol::ByteSink& sink);

    /**
     * @brief Names that resolved to id 0 in lenient mode, without duplicates
     */
    const std::vector<std::string>& getUnresolvedNames() const { return unresolvedNames; }

private:
    const Registry& registry;
    const PalettePolicy& policy;
    RegistryMode mode;
    std::vector<std::string> unresolvedNames;

    void encodeContainer(DataKind kind, const std::vector<int32_t>& paletteIds,
                         const std::vector<uint64_t>& indices, protocol::ByteSink& sink) const;
    void noteUnresolved(const std::string& name);
};

/**
 * @brief A paletted container read back from the wire
 */
struct DecodedContainer {
    uint8_t bitsPerEntry = 0;
    PaletteFormat format = PaletteFormat::Indirect;
    std::vector<int32_t> palette;   ///< Empty for direct containers
    std::vector<uint64_t> values;   ///< Palette indices, or global ids when direct

    /**
     * @brief Global id of entry index
     */
    int32_t globalId(size_t index) const;
};

struct DecodedSection {
    int16_t nonAirCount = 0;
    DecodedContainer blockStates;
    DecodedContainer biomes;
};

/**
 * @brief Reads paletted containers; the inverse of PaletteEncoder
 */
class PaletteDecoder {
public:
    /**
     * @brief Read one container of the given kind
     * @throws ProtocolError ShortRead, InvalidLength or MalformedSectionData
     */
    static DecodedContainer decodeContainer(protocol::ByteSource& source, DataKind kind,
                                            const PalettePolicy& policy);

    static DecodedSection decodeSection(protocol::ByteSource& source, const PalettePolicy& policy);

    /**
     * @brief Decode a whole chunk data payload
     * @throws ProtocolError (MalformedSectionData) if bytes remain after sectionCount sections
     */
    static std::vector<DecodedSection> decodeSections(const std::vector<uint8_t>& data, size_t sectionCount,
                                                      const PalettePolicy& policy);
};

} // namespace basalt
