#include "shared/LightBuilder.hpp"
#include "protocol/Primitives.hpp"
#include "protocol/ProtocolError.hpp"
#include "protocol/VarInt.hpp"

#include <algorithm>
#include <string>

namespace basalt {

namespace {

void writeArrays(protocol::ByteSink& sink, const std::vector<std::vector<uint8_t>>& arrays) {
    protocol::writeVarInt(sink, static_cast<int32_t>(arrays.size()));
    for (const auto& array : arrays) {
        protocol::writeByteArray(sink, array);
    }
}

void classify(const std::optional<std::vector<uint8_t>>& array, size_t bit, const char* kind, int32_t sectionY,
              protocol::BitSet& mask, protocol::BitSet& emptyMask, std::vector<std::vector<uint8_t>>& out) {
    if (!array) {
        return;
    }
    if (array->size() != ServerConfig::LIGHT_ARRAY_SIZE) {
        throw protocol::ProtocolError(protocol::ErrorKind::MalformedSectionData,
                                      std::string(kind) + " light of section " + std::to_string(sectionY) +
                                      " has " + std::to_string(array->size()) + " bytes");
    }

    bool allZero = std::all_of(array->begin(), array->end(), [](uint8_t value) { return value == 0; });
    if (allZero) {
        emptyMask.set(bit);
    } else {
        mask.set(bit);
        out.push_back(*array);
    }
}

} // namespace

void LightData::encode(protocol::ByteSink& sink) const {
    skyMask.encode(sink);
    blockMask.encode(sink);
    emptySkyMask.encode(sink);
    emptyBlockMask.encode(sink);
    writeArrays(sink, skyArrays);
    writeArrays(sink, blockArrays);
}

LightData LightBuilder::fullBright(size_t sectionCount) {
    LightData light;
    light.skyMask = protocol::BitSet::firstBits(sectionCount);
    light.blockMask = protocol::BitSet::firstBits(sectionCount);

    const std::vector<uint8_t> lit(ServerConfig::LIGHT_ARRAY_SIZE, FULL_BRIGHT_BYTE);
    light.skyArrays.assign(sectionCount, lit);
    light.blockArrays.assign(sectionCount, lit);
    return light;
}

LightData LightBuilder::fromSections(const std::vector<Section>& sections) {
    LightData light;
    for (size_t idx = 0; idx < sections.size(); idx++) {
        const Section& section = sections[idx];
        classify(section.skyLight, idx, "Sky", section.y, light.skyMask, light.emptySkyMask, light.skyArrays);
        classify(section.blockLight, idx, "Block", section.y, light.blockMask, light.emptyBlockMask,
                 light.blockArrays);
    }
    return light;
}

} // namespace basalt
