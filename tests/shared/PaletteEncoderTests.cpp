#include "TestSupport.hpp"
#include "protocol/BitPacker.hpp"
#include "protocol/ByteStream.hpp"
#include "protocol/Primitives.hpp"
#include "protocol/VarInt.hpp"
#include "server/StubTerrain.hpp"
#include "shared/PaletteEncoder.hpp"
#include "shared/PalettePolicy.hpp"
#include "shared/Registry.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

using basalt::BlockStates;
using basalt::Biomes;
using basalt::DataKind;
using basalt::FixedWidthPolicy;
using basalt::PaletteDecoder;
using basalt::PaletteEncoder;
using basalt::PaletteEntry;
using basalt::PaletteFormat;
using basalt::Registry;
using basalt::RegistryMode;
using basalt::VanillaPolicy;
using basalt::test::Expect;
using basalt::test::ExpectProtocolError;
namespace protocol = basalt::protocol;

BlockStates StoneSection() {
    return *basalt::StubTerrain::buildSection(0).blockStates;
}

Biomes PlainsBiomes() {
    return Biomes{{"minecraft:plains"}, std::vector<uint16_t>(64, 0)};
}

bool TestFixedWidthStoneSection() {
    bool passed = true;
    Registry registry = Registry::builtin();
    FixedWidthPolicy policy;
    PaletteEncoder encoder(registry, policy);

    protocol::BufferSink sink;
    encoder.encodeBlockStates(StoneSection(), sink);
    const auto& bytes = sink.getBuffer();

    passed &= Expect(bytes.size() == 2 + 1 + 3 + 2 + (1024 * 8), "Fixed-width stone section should be 8200 bytes.");
    passed &= Expect(bytes[0] == 0x10 && bytes[1] == 0x00, "Non-air count should be 4096.");
    passed &= Expect(bytes[2] == 15, "Fixed policy should use 15 bits per block.");
    passed &= Expect(bytes[3] == 2 && bytes[4] == 0 && bytes[5] == 1,
                     "Palette [air, stone] should encode as length 2, ids 0 and 1.");
    passed &= Expect(bytes[6] == 0x80 && bytes[7] == 0x08, "Word count should be VarInt 1024.");

    protocol::MemoryByteSource source(bytes.data() + 8, 8);
    passed &= Expect(protocol::readU64(source) == 0x0000200040008001ULL,
                     "Each word should hold four 15-bit entries of value 1.");
    return passed;
}

bool TestFixedWidthBiomes() {
    bool passed = true;
    Registry registry = Registry::builtin();
    FixedWidthPolicy policy;
    PaletteEncoder encoder(registry, policy);

    protocol::BufferSink sink;
    encoder.encodeBiomes(PlainsBiomes(), sink);
    passed &= Expect(sink.getBuffer() == std::vector<uint8_t>{0x01, 0x01, 0x01, 0x01, 0, 0, 0, 0, 0, 0, 0, 0},
                     "Plains biomes should be 1 bit, palette [1], one zero word.");

    Biomes noIndices{{"minecraft:plains"}, {}};
    protocol::BufferSink implicitSink;
    encoder.encodeBiomes(noIndices, implicitSink);
    passed &= Expect(implicitSink.getBuffer() == sink.getBuffer(),
                     "Absent biome indices should encode as 64 zeros.");

    Biomes three{{"minecraft:plains", "minecraft:plains", "minecraft:plains"}, std::vector<uint16_t>(64, 2)};
    protocol::BufferSink threeSink;
    encoder.encodeBiomes(three, threeSink);
    passed &= Expect(threeSink.getBuffer()[0] == 2, "Three biome entries should need 2 bits.");
    return passed;
}

bool TestVanillaLayouts() {
    bool passed = true;
    VanillaPolicy policy;
    auto block = [&](size_t size) { return policy.layoutFor(size, DataKind::BlockStates); };
    auto biome = [&](size_t size) { return policy.layoutFor(size, DataKind::Biomes); };

    passed &= Expect(block(1).format == PaletteFormat::SingleValue && block(1).bitsPerEntry == 0,
                     "One block state should be a single value.");
    passed &= Expect(block(2).bitsPerEntry == 4 && block(2).format == PaletteFormat::Indirect,
                     "Small block palettes should use the 4-bit minimum.");
    passed &= Expect(block(17).bitsPerEntry == 5, "17 block states should need 5 bits.");
    passed &= Expect(block(256).bitsPerEntry == 8 && block(256).format == PaletteFormat::Indirect,
                     "256 block states should still be indirect.");
    passed &= Expect(block(257).bitsPerEntry == 15 && block(257).format == PaletteFormat::Direct,
                     "257 block states should switch to direct.");
    passed &= Expect(biome(1).format == PaletteFormat::SingleValue, "One biome should be a single value.");
    passed &= Expect(biome(2).bitsPerEntry == 1 && biome(8).bitsPerEntry == 3, "Biomes should use ceil(log2 n).");
    passed &= Expect(biome(9).bitsPerEntry == 6 && biome(9).format == PaletteFormat::Direct,
                     "Nine biomes should switch to direct.");

    passed &= Expect(policy.formatFor(0, DataKind::BlockStates) == PaletteFormat::SingleValue &&
                         policy.formatFor(8, DataKind::BlockStates) == PaletteFormat::Indirect &&
                         policy.formatFor(15, DataKind::BlockStates) == PaletteFormat::Direct &&
                         policy.formatFor(4, DataKind::Biomes) == PaletteFormat::Direct,
                     "formatFor should invert the layout thresholds.");
    passed &= Expect(basalt::ceilLog2(1) == 0 && basalt::ceilLog2(2) == 1 && basalt::ceilLog2(3) == 2 &&
                         basalt::ceilLog2(256) == 8 && basalt::ceilLog2(257) == 9,
                     "ceilLog2 should round up.");
    return passed;
}

bool TestVanillaStoneSection() {
    bool passed = true;
    Registry registry = Registry::builtin();
    VanillaPolicy policy;
    PaletteEncoder encoder(registry, policy);

    protocol::BufferSink sink;
    encoder.encodeBlockStates(StoneSection(), sink);
    encoder.encodeBiomes(PlainsBiomes(), sink);
    const auto& bytes = sink.getBuffer();

    passed &= Expect(bytes.size() == (2 + 1 + 3 + 2 + (256 * 8)) + 3,
                     "Vanilla stone section should pack 4-bit entries and a single-value biome.");
    passed &= Expect(bytes[2] == 4, "Two block states should use 4 bits.");
    passed &= Expect(bytes[bytes.size() - 3] == 0 && bytes[bytes.size() - 2] == 1 && bytes.back() == 0,
                     "Single-value biome should be bits 0, id 1, no words.");

    auto sections = PaletteDecoder::decodeSections(bytes, 1, policy);
    passed &= Expect(sections[0].blockStates.globalId(4095) == 1, "Decoded voxels should be stone.");
    passed &= Expect(sections[0].biomes.format == PaletteFormat::SingleValue &&
                         sections[0].biomes.globalId(63) == 1,
                     "Decoded biomes should be plains.");
    return passed;
}

bool TestVanillaDirectSection() {
    bool passed = true;
    Registry::IdTable blocks;
    BlockStates states;
    for (int32_t idx = 0; idx < 300; idx++) {
        std::string name = "test:block_" + std::to_string(idx);
        blocks.emplace(name, idx + 1000);
        states.palette.push_back(PaletteEntry{name, {}});
    }
    for (size_t idx = 0; idx < 4096; idx++) {
        states.indices.push_back(static_cast<uint16_t>(idx % 300));
    }
    Registry registry(blocks, {});
    VanillaPolicy policy;
    PaletteEncoder encoder(registry, policy);

    protocol::BufferSink sink;
    encoder.encodeBlockStates(states, sink);
    protocol::MemoryByteSource source(sink.getBuffer());
    protocol::readI16(source);
    auto container = PaletteDecoder::decodeContainer(source, DataKind::BlockStates, policy);

    passed &= Expect(container.format == PaletteFormat::Direct && container.bitsPerEntry == 15,
                     "300 states should be encoded directly at 15 bits.");
    passed &= Expect(container.palette.empty(), "Direct containers should carry no palette.");
    passed &= Expect(container.globalId(0) == 1000 && container.globalId(299) == 1299 &&
                         container.globalId(300) == 1000,
                     "Direct values should be global ids.");
    passed &= Expect(source.remaining() == 0, "The container should be fully consumed.");
    return passed;
}

bool TestDecodeMatchesIndirectInput() {
    bool passed = true;
    Registry registry = Registry::builtin();
    BlockStates states;
    states.palette = {PaletteEntry{"minecraft:air", {}}, PaletteEntry{"minecraft:grass_block", {}},
                      PaletteEntry{"minecraft:oak_log", {}}};
    for (size_t idx = 0; idx < 4096; idx++) {
        states.indices.push_back(static_cast<uint16_t>(idx % 3));
    }

    for (int fixed = 0; fixed < 2; fixed++) {
        FixedWidthPolicy fixedPolicy;
        VanillaPolicy vanillaPolicy;
        const basalt::PalettePolicy& policy =
            fixed != 0 ? static_cast<const basalt::PalettePolicy&>(fixedPolicy) : vanillaPolicy;
        PaletteEncoder encoder(registry, policy);

        protocol::BufferSink sink;
        encoder.encodeBlockStates(states, sink);
        encoder.encodeBiomes(PlainsBiomes(), sink);

        auto sections = PaletteDecoder::decodeSections(sink.getBuffer(), 1, policy);
        const auto& decoded = sections[0].blockStates;
        passed &= Expect(sections[0].nonAirCount == 4096, "Non-air count should decode as 4096.");
        passed &= Expect(decoded.palette == std::vector<int32_t>{0, 9, 131}, "Palette ids should decode in order.");
        passed &= Expect(decoded.values.size() == 4096 && decoded.values[4] == 1 && decoded.values[5] == 2,
                         "Indices should decode to the input pattern.");
        passed &= Expect(decoded.globalId(5) == 131, "globalId should resolve through the palette.");
    }
    return passed;
}

bool TestInvalidSectionsWriteNothing() {
    bool passed = true;
    Registry registry = Registry::builtin();
    FixedWidthPolicy policy;
    PaletteEncoder encoder(registry, policy);
    protocol::BufferSink sink;

    BlockStates noPalette{{}, std::vector<uint16_t>(4096, 0)};
    passed &= ExpectProtocolError([&] { encoder.encodeBlockStates(noPalette, sink); },
                                  protocol::ErrorKind::MissingSectionData,
                                  "An empty palette should be missing section data.");

    BlockStates shortIndices = StoneSection();
    shortIndices.indices.pop_back();
    passed &= ExpectProtocolError([&] { encoder.encodeBlockStates(shortIndices, sink); },
                                  protocol::ErrorKind::MalformedSectionData,
                                  "4095 indices should be malformed.");

    BlockStates outOfPalette = StoneSection();
    outOfPalette.indices[100] = 2;
    passed &= ExpectProtocolError([&] { encoder.encodeBlockStates(outOfPalette, sink); },
                                  protocol::ErrorKind::MalformedSectionData,
                                  "An index past the palette should be malformed.");

    Biomes badBiomes{{"minecraft:plains"}, std::vector<uint16_t>(10, 0)};
    passed &= ExpectProtocolError([&] { encoder.encodeBiomes(badBiomes, sink); },
                                  protocol::ErrorKind::MalformedSectionData,
                                  "Ten biome indices should be malformed.");

    Biomes noBiomePalette{{}, {}};
    passed &= ExpectProtocolError([&] { encoder.encodeBiomes(noBiomePalette, sink); },
                                  protocol::ErrorKind::MissingSectionData,
                                  "An empty biome palette should be missing section data.");

    passed &= Expect(sink.size() == 0, "Rejected sections should leave the sink empty.");
    return passed;
}

bool TestUnknownNames() {
    bool passed = true;
    Registry registry = Registry::builtin();
    FixedWidthPolicy policy;

    BlockStates states = StoneSection();
    states.palette[1] = PaletteEntry{"minecraft:amethyst_block", {}};

    PaletteEncoder lenient(registry, policy, RegistryMode::Lenient);
    protocol::BufferSink sink;
    lenient.encodeBlockStates(states, sink);
    lenient.encodeBlockStates(states, sink);
    lenient.encodeBiomes(Biomes{{"minecraft:cherry_grove"}, {}}, sink);
    passed &= Expect(sink.getBuffer()[3] == 2 && sink.getBuffer()[4] == 0 && sink.getBuffer()[5] == 0,
                     "Unknown blocks should be sent as id 0 in lenient mode.");
    passed &= Expect(lenient.getUnresolvedNames() ==
                         std::vector<std::string>{"minecraft:amethyst_block", "minecraft:cherry_grove"},
                     "Unknown names should be reported once each.");

    PaletteEncoder strict(registry, policy, RegistryMode::Strict);
    protocol::BufferSink strictSink;
    passed &= ExpectProtocolError([&] { strict.encodeBlockStates(states, strictSink); },
                                  protocol::ErrorKind::UnknownRegistryEntry,
                                  "Unknown blocks should fail in strict mode.");
    passed &= Expect(strictSink.size() == 0, "A strict failure should write nothing.");
    return passed;
}

bool TestDecodeRejectsBadInput() {
    bool passed = true;
    FixedWidthPolicy policy;
    Registry registry = Registry::builtin();
    PaletteEncoder encoder(registry, policy);

    protocol::BufferSink sink;
    encoder.encodeBlockStates(StoneSection(), sink);
    encoder.encodeBiomes(PlainsBiomes(), sink);
    std::vector<uint8_t> trailing = sink.getBuffer();
    trailing.push_back(0x00);
    passed &= ExpectProtocolError([&] { PaletteDecoder::decodeSections(trailing, 1, policy); },
                                  protocol::ErrorKind::MalformedSectionData,
                                  "Trailing bytes after the last section should be malformed.");

    std::vector<uint8_t> truncated(sink.getBuffer().begin(), sink.getBuffer().begin() + 100);
    passed &= ExpectProtocolError([&] { PaletteDecoder::decodeSections(truncated, 1, policy); },
                                  protocol::ErrorKind::ShortRead, "A truncated section should be a short read.");

    // bits 4, palette [0], one word holding index 3
    protocol::BufferSink forged;
    protocol::writeU8(forged, 4);
    protocol::writeVarInt(forged, 1);
    protocol::writeVarInt(forged, 0);
    std::vector<int64_t> words(256, 0);
    words[0] = 3;
    protocol::writeLongArray(forged, words);
    passed &= ExpectProtocolError(
        [&] {
            protocol::MemoryByteSource source(forged.getBuffer());
            PaletteDecoder::decodeContainer(source, DataKind::BlockStates, VanillaPolicy());
        },
        protocol::ErrorKind::MalformedSectionData, "Packed indices past the palette should be malformed.");

    // bits 0, id 7, then a data array that must be empty
    std::vector<uint8_t> singleValue{0x00, 0x07, 0x00};
    protocol::MemoryByteSource singleSource(singleValue);
    auto single = PaletteDecoder::decodeContainer(singleSource, DataKind::BlockStates, VanillaPolicy());
    passed &= Expect(single.format == PaletteFormat::SingleValue && single.globalId(4095) == 7,
                     "An empty single-value container should decode to its id.");

    std::vector<uint8_t> singleWithData{0x00, 0x07, 0x01, 0, 0, 0, 0, 0, 0, 0, 0};
    passed &= ExpectProtocolError(
        [&] {
            protocol::MemoryByteSource source(singleWithData);
            PaletteDecoder::decodeContainer(source, DataKind::BlockStates, VanillaPolicy());
        },
        protocol::ErrorKind::MalformedSectionData, "A single-value container with data words should be malformed.");
    return passed;
}

} // namespace

int main() {
    bool passed = true;
    passed &= TestFixedWidthStoneSection();
    passed &= TestFixedWidthBiomes();
    passed &= TestVanillaLayouts();
    passed &= TestVanillaStoneSection();
    passed &= TestVanillaDirectSection();
    passed &= TestDecodeMatchesIndirectInput();
    passed &= TestInvalidSectionsWriteNothing();
    passed &= TestUnknownNames();
    passed &= TestDecodeRejectsBadInput();

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] basalt_palette_encoder_tests\n";
    return 0;
}
