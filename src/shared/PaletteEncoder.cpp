#include "shared/PaletteEncoder.hpp"
#include "core/ServerConfig.hpp"
#include "protocol/BitPacker.hpp"
#include "protocol/Primitives.hpp"
#include "protocol/ProtocolError.hpp"
#include "protocol/VarInt.hpp"

#include <algorithm>
#include <string>

namespace basalt {

using protocol::BitPacker;
using protocol::ErrorKind;
using protocol::ProtocolError;

namespace {

const char* kindName(DataKind kind) {
    return kind == DataKind::BlockStates ? "block state" : "biome";
}

std::vector<uint64_t> checkedIndices(const std::vector<uint16_t>& indices, size_t paletteSize, DataKind kind) {
    if (indices.size() != entryCount(kind)) {
        throw ProtocolError(ErrorKind::MalformedSectionData,
                            std::string("Expected ") + std::to_string(entryCount(kind)) + " " + kindName(kind) +
                            " indices, got " + std::to_string(indices.size()));
    }

    std::vector<uint64_t> values;
    values.reserve(indices.size());
    for (uint16_t index : indices) {
        if (index >= paletteSize) {
            throw ProtocolError(ErrorKind::MalformedSectionData,
                                std::string(kindName(kind)) + " index " + std::to_string(index) +
                                " outside palette of " + std::to_string(paletteSize));
        }
        values.push_back(index);
    }
    return values;
}

void checkWidth(uint8_t bitsPerEntry, uint64_t largestValue, DataKind kind) {
    if (bitsPerEntry < BitPacker::MIN_BITS || bitsPerEntry > BitPacker::MAX_BITS ||
        (largestValue >> bitsPerEntry) != 0) {
        throw ProtocolError(ErrorKind::MalformedSectionData,
                            std::string(kindName(kind)) + " value " + std::to_string(largestValue) +
                            " does not fit in " + std::to_string(bitsPerEntry) + " bits per entry");
    }
}

} // namespace

PaletteEncoder::PaletteEncoder(const Registry& registry, const PalettePolicy& policy, RegistryMode mode)
    : registry(registry), policy(policy), mode(mode) {
}

void PaletteEncoder::encodeBlockStates(const BlockStates& blockStates, protocol::ByteSink& sink) {
    if (blockStates.palette.empty()) {
        throw ProtocolError(ErrorKind::MissingSectionData, "Block states have no palette");
    }
    auto values = checkedIndices(blockStates.indices, blockStates.palette.size(), DataKind::BlockStates);

    std::vector<int32_t> paletteIds;
    paletteIds.reserve(blockStates.palette.size());
    for (const auto& entry : blockStates.palette) {
        if (!registry.lookupBlockState(entry)) {
            noteUnresolved(entry.stateKey());
        }
        paletteIds.push_back(registry.resolveBlockState(entry, mode));
    }

    protocol::BufferSink container;
    encodeContainer(DataKind::BlockStates, paletteIds, values, container);

    // Legacy field, not recomputed from the voxel data
    protocol::writeI16(sink, ServerConfig::LEGACY_NON_AIR_COUNT);
    sink.write(container.getBuffer());
}

void PaletteEncoder::encodeBiomes(const Biomes& biomes, protocol::ByteSink& sink) {
    if (biomes.palette.empty()) {
        throw ProtocolError(ErrorKind::MissingSectionData, "Biomes have no palette");
    }

    std::vector<uint64_t> values;
    if (biomes.indices.empty()) {
        values.assign(ServerConfig::BIOME_VOLUME, 0);
    } else {
        values = checkedIndices(biomes.indices, biomes.palette.size(), DataKind::Biomes);
    }

    std::vector<int32_t> paletteIds;
    paletteIds.reserve(biomes.palette.size());
    for (const auto& name : biomes.palette) {
        if (!registry.lookupBiome(name)) {
            noteUnresolved(name);
        }
        paletteIds.push_back(registry.resolveBiome(name, mode));
    }

    protocol::BufferSink container;
    encodeContainer(DataKind::Biomes, paletteIds, values, container);
    sink.write(container.getBuffer());
}

void PaletteEncoder::encodeContainer(DataKind kind, const std::vector<int32_t>& paletteIds,
                                     const std::vector<uint64_t>& indices, protocol::ByteSink& sink) const {
    const PaletteLayout layout = policy.layoutFor(paletteIds.size(), kind);

    switch (layout.format) {
        case PaletteFormat::SingleValue: {
            if (paletteIds.size() != 1) {
                throw ProtocolError(ErrorKind::MalformedSectionData,
                                    "Single-value layout chosen for a palette of " +
                                    std::to_string(paletteIds.size()) + " entries");
            }
            protocol::writeU8(sink, layout.bitsPerEntry);
            protocol::writeVarInt(sink, paletteIds.front());
            protocol::writeVarInt(sink, 0);
            return;
        }

        case PaletteFormat::Indirect: {
            checkWidth(layout.bitsPerEntry, paletteIds.size() - 1, kind);
            auto words = BitPacker::pack(indices, layout.bitsPerEntry);

            protocol::writeU8(sink, layout.bitsPerEntry);
            protocol::writeVarInt(sink, static_cast<int32_t>(paletteIds.size()));
            for (int32_t id : paletteIds) {
                protocol::writeVarInt(sink, id);
            }
            protocol::writeLongArray(sink, BitPacker::toSignedWords(words));
            return;
        }

        case PaletteFormat::Direct: {
            std::vector<uint64_t> globalIds;
            globalIds.reserve(indices.size());
            for (uint64_t index : indices) {
                globalIds.push_back(static_cast<uint64_t>(paletteIds[index]));
            }
            auto largest = std::max_element(paletteIds.begin(), paletteIds.end());
            checkWidth(layout.bitsPerEntry, static_cast<uint64_t>(*largest), kind);
            auto words = BitPacker::pack(globalIds, layout.bitsPerEntry);

            protocol::writeU8(sink, layout.bitsPerEntry);
            protocol::writeLongArray(sink, BitPacker::toSignedWords(words));
            return;
        }
    }
}

void PaletteEncoder::noteUnresolved(const std::string& name) {
    if (std::find(unresolvedNames.begin(), unresolvedNames.end(), name) == unresolvedNames.end()) {
        unresolvedNames.push_back(name);
    }
}

int32_t DecodedContainer::globalId(size_t index) const {
    switch (format) {
        case PaletteFormat::SingleValue:
            return palette.front();
        case PaletteFormat::Indirect:
            return palette[values[index]];
        case PaletteFormat::Direct:
            return static_cast<int32_t>(values[index]);
    }
    return 0;
}

DecodedContainer PaletteDecoder::decodeContainer(protocol::ByteSource& source, DataKind kind,
                                                 const PalettePolicy& policy) {
    DecodedContainer container;
    container.bitsPerEntry = protocol::readU8(source);
    container.format = policy.formatFor(container.bitsPerEntry, kind);
    const size_t count = entryCount(kind);

    if (container.format == PaletteFormat::SingleValue) {
        container.palette.push_back(protocol::readVarInt(source));
        const auto words = protocol::readLongArray(source);
        if (!words.empty()) {
            throw ProtocolError(ErrorKind::MalformedSectionData,
                                "Single-value container carries " + std::to_string(words.size()) +
                                " data words");
        }
        container.values.assign(count, 0);
        return container;
    }

    if (container.bitsPerEntry > BitPacker::MAX_BITS) {
        throw ProtocolError(ErrorKind::MalformedSectionData,
                            "bitsPerEntry " + std::to_string(container.bitsPerEntry) + " out of range");
    }

    if (container.format == PaletteFormat::Indirect) {
        int32_t paletteLength = protocol::readVarInt(source);
        if (paletteLength <= 0 || static_cast<size_t>(paletteLength) > count) {
            throw ProtocolError(ErrorKind::InvalidLength,
                                "Invalid palette length " + std::to_string(paletteLength));
        }
        container.palette.reserve(static_cast<size_t>(paletteLength));
        for (int32_t idx = 0; idx < paletteLength; idx++) {
            container.palette.push_back(protocol::readVarInt(source));
        }
    }

    auto words = BitPacker::toUnsignedWords(protocol::readLongArray(source));
    container.values = BitPacker::unpack(words, container.bitsPerEntry, count);

    if (container.format == PaletteFormat::Indirect) {
        for (uint64_t value : container.values) {
            if (value >= container.palette.size()) {
                throw ProtocolError(ErrorKind::MalformedSectionData,
                                    "Packed index " + std::to_string(value) + " outside palette of " +
                                    std::to_string(container.palette.size()));
            }
        }
    }
    return container;
}

DecodedSection PaletteDecoder::decodeSection(protocol::ByteSource& source, const PalettePolicy& policy) {
    DecodedSection section;
    section.nonAirCount = protocol::readI16(source);
    section.blockStates = decodeContainer(source, DataKind::BlockStates, policy);
    section.biomes = decodeContainer(source, DataKind::Biomes, policy);
    return section;
}

std::vector<DecodedSection> PaletteDecoder::decodeSections(const std::vector<uint8_t>& data, size_t sectionCount,
                                                           const PalettePolicy& policy) {
    protocol::MemoryByteSource source(data);

    std::vector<DecodedSection> sections;
    sections.reserve(sectionCount);
    for (size_t idx = 0; idx < sectionCount; idx++) {
        sections.push_back(decodeSection(source, policy));
    }

    if (source.remaining() != 0) {
        throw ProtocolError(ErrorKind::MalformedSectionData,
                            std::to_string(source.remaining()) + " trailing bytes after " +
                            std::to_string(sectionCount) + " sections");
    }
    return sections;
}

} // namespace basalt
