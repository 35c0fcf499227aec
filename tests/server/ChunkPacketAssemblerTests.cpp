#include "TestSupport.hpp"
#include "core/Logger.hpp"
#include "core/ServerConfig.hpp"
#include "protocol/BitSet.hpp"
#include "protocol/ByteStream.hpp"
#include "protocol/Primitives.hpp"
#include "protocol/VarInt.hpp"
#include "server/ChunkPacketAssembler.hpp"
#include "server/StubTerrain.hpp"
#include "shared/PaletteEncoder.hpp"
#include "shared/PalettePolicy.hpp"
#include "shared/Registry.hpp"

#include <cstdint>
#include <iostream>
#include <thread>
#include <utility>
#include <vector>

namespace {

using basalt::Chunk;
using basalt::ChunkDataPacket;
using basalt::ChunkPacketAssembler;
using basalt::ChunkPos;
using basalt::FixedWidthPolicy;
using basalt::Registry;
using basalt::ServerConfig;
using basalt::StubTerrain;
using basalt::test::Expect;
using basalt::test::ExpectProtocolError;
namespace protocol = basalt::protocol;

bool TestPacketRecord() {
    bool passed = true;
    Registry registry = Registry::builtin();
    FixedWidthPolicy policy;
    ChunkPacketAssembler assembler(registry, policy);

    ChunkDataPacket packet = assembler.assemblePacket(ChunkPos(0, 0));
    passed &= Expect(packet.packetId == 0x24, "Packet id should be 0x24.");
    passed &= Expect(packet.chunkX == 0 && packet.chunkZ == 0, "Packet should carry the requested column.");
    passed &= Expect(packet.blockEntities.empty(), "Stub chunks should have no block entities.");
    passed &= Expect(packet.light.skyMask.count() == 24 && packet.light.blockMask.count() == 24,
                     "Sky and block masks should have exactly 24 bits set.");
    passed &= Expect(packet.light.skyArrays.size() == 24 && packet.light.blockArrays.size() == 24,
                     "There should be 24 sky and 24 block light arrays.");

    bool arraysOk = true;
    for (const auto& array : packet.light.skyArrays) {
        arraysOk &= array == std::vector<uint8_t>(2048, 0xFF);
    }
    for (const auto& array : packet.light.blockArrays) {
        arraysOk &= array == std::vector<uint8_t>(2048, 0xFF);
    }
    passed &= Expect(arraysOk, "Every light array should be 2048 bytes of 0xFF.");

    auto sections = basalt::PaletteDecoder::decodeSections(packet.data, 24, policy);
    bool sectionsOk = true;
    for (const auto& section : sections) {
        sectionsOk &= section.nonAirCount == 4096;
        sectionsOk &= section.blockStates.bitsPerEntry == 15;
        sectionsOk &= section.blockStates.palette == std::vector<int32_t>{0, 1};
        sectionsOk &= section.blockStates.globalId(0) == 1 && section.blockStates.globalId(4095) == 1;
        sectionsOk &= section.biomes.palette == std::vector<int32_t>{1};
    }
    passed &= Expect(sectionsOk, "Every section should decode as stone under plains.");

    const auto& data = packet.data;
    passed &= Expect(data.size() > 6 && data[0] == 0x10 && data[1] == 0x00 && data[2] == 15 && data[3] == 2 &&
                         data[4] == 0 && data[5] == 1,
                     "The first section should start with count 4096, 15 bits, palette [0, 1].");
    return passed;
}

bool TestWireLayout() {
    bool passed = true;
    Registry registry = Registry::builtin();
    FixedWidthPolicy policy;
    ChunkPacketAssembler assembler(registry, policy);

    ChunkDataPacket packet = assembler.assemblePacket(ChunkPos(-3, 7));
    protocol::BufferSink sink;
    size_t written = assembler.assemble(ChunkPos(-3, 7), sink);
    passed &= Expect(written == sink.size(), "assemble should report the bytes it wrote.");

    protocol::MemoryByteSource source(sink.getBuffer());
    passed &= Expect(protocol::readVarInt(source) == 0x24, "The packet should start with id 0x24.");
    passed &= Expect(protocol::readI32(source) == -3 && protocol::readI32(source) == 7,
                     "Chunk x and z should follow as int32.");

    std::vector<uint8_t> heightmaps(packet.heightmaps.size());
    protocol::readExact(source, heightmaps.data(), heightmaps.size(), "heightmaps");
    passed &= Expect(heightmaps == packet.heightmaps, "The heightmap compound should follow the coordinates.");
    passed &= Expect(heightmaps.size() > 3 && heightmaps[0] == 0x0A, "Heightmaps should be a root compound.");

    passed &= Expect(protocol::readByteArray(source) == packet.data, "Section data should be length-prefixed.");
    passed &= Expect(protocol::readVarInt(source) == 0, "The block entity count should be 0.");

    passed &= Expect(protocol::BitSet::decode(source).count() == 24, "Sky mask should have 24 bits.");
    passed &= Expect(protocol::BitSet::decode(source).count() == 24, "Block mask should have 24 bits.");
    passed &= Expect(protocol::BitSet::decode(source).empty(), "Empty sky mask should be empty.");
    passed &= Expect(protocol::BitSet::decode(source).empty(), "Empty block mask should be empty.");

    bool arraysOk = protocol::readVarInt(source) == 24;
    for (int idx = 0; idx < 24; idx++) {
        arraysOk &= protocol::readByteArray(source) == std::vector<uint8_t>(2048, 0xFF);
    }
    arraysOk &= protocol::readVarInt(source) == 24;
    for (int idx = 0; idx < 24; idx++) {
        arraysOk &= protocol::readByteArray(source) == std::vector<uint8_t>(2048, 0xFF);
    }
    passed &= Expect(arraysOk, "24 sky then 24 block arrays of 2048 x 0xFF should follow the masks.");
    passed &= Expect(source.remaining() == 0, "Nothing should follow the block light arrays.");
    return passed;
}

bool TestMissingSectionDataEmitsNothing() {
    bool passed = true;
    Registry registry = Registry::builtin();
    FixedWidthPolicy policy;
    ChunkPacketAssembler assembler(registry, policy);

    Chunk noBlocks = StubTerrain::build(ChunkPos(1, 1));
    noBlocks.sections[7].blockStates.reset();
    protocol::BufferSink sink;
    passed &= ExpectProtocolError([&] { assembler.assemble(noBlocks, sink); },
                                  protocol::ErrorKind::MissingSectionData,
                                  "A section without block states should abort the packet.");

    Chunk noBiomes = StubTerrain::build(ChunkPos(1, 1));
    noBiomes.sections[23].biomes.reset();
    passed &= ExpectProtocolError([&] { assembler.assemble(noBiomes, sink); },
                                  protocol::ErrorKind::MissingSectionData,
                                  "A section without biomes should abort the packet.");

    Chunk noHeightmaps = StubTerrain::build(ChunkPos(1, 1));
    noHeightmaps.heightmaps.reset();
    passed &= ExpectProtocolError([&] { assembler.assemble(noHeightmaps, sink); },
                                  protocol::ErrorKind::MissingSectionData,
                                  "A chunk without heightmaps should abort the packet.");

    Chunk shortColumn = StubTerrain::build(ChunkPos(1, 1));
    shortColumn.sections.pop_back();
    passed &= ExpectProtocolError([&] { assembler.assemble(shortColumn, sink); },
                                  protocol::ErrorKind::MissingSectionData,
                                  "A column with 23 sections should abort the packet.");

    Chunk shuffled = StubTerrain::build(ChunkPos(1, 1));
    std::swap(shuffled.sections[0], shuffled.sections[1]);
    passed &= ExpectProtocolError([&] { assembler.assemble(shuffled, sink); },
                                  protocol::ErrorKind::MalformedSectionData,
                                  "Sections out of vertical order should abort the packet.");

    passed &= Expect(sink.size() == 0, "Failed builds should leave the sink untouched.");
    return passed;
}

bool TestStrictRegistryAbortsPacket() {
    bool passed = true;
    Registry registry = Registry::builtin();
    FixedWidthPolicy policy;
    ChunkPacketAssembler strict(registry, policy, ServerConfig::LightingMode::FullBright,
                                basalt::RegistryMode::Strict);
    ChunkPacketAssembler lenient(registry, policy);

    Chunk chunk = StubTerrain::build(ChunkPos(0, 0));
    chunk.sections[3].blockStates->palette[1] = basalt::PaletteEntry{"minecraft:deepslate", {}};

    protocol::BufferSink strictSink;
    passed &= ExpectProtocolError([&] { strict.assemble(chunk, strictSink); },
                                  protocol::ErrorKind::UnknownRegistryEntry,
                                  "Strict mode should reject unknown block states.");
    passed &= Expect(strictSink.size() == 0, "A strict failure should emit nothing.");

    protocol::BufferSink lenientSink;
    passed &= Expect(lenient.assemble(chunk, lenientSink) > 0, "Lenient mode should still build the packet.");
    return passed;
}

bool TestStoredLighting() {
    bool passed = true;
    Registry registry = Registry::builtin();
    FixedWidthPolicy policy;
    ChunkPacketAssembler assembler(registry, policy, ServerConfig::LightingMode::Stored);

    Chunk chunk = StubTerrain::build(ChunkPos(0, 0));
    chunk.sections[0].skyLight = std::vector<uint8_t>(2048, 0x00);
    chunk.sections[1].blockLight.reset();

    ChunkDataPacket packet = assembler.compose(chunk, assembler.serializeSections(chunk));
    passed &= Expect(packet.light.skyMask.count() == 23 && !packet.light.skyMask.test(0),
                     "A dark section should drop out of the sky mask.");
    passed &= Expect(packet.light.emptySkyMask.test(0) && packet.light.emptySkyMask.count() == 1,
                     "A dark section should be flagged in the empty sky mask.");
    passed &= Expect(packet.light.blockMask.count() == 23 && packet.light.emptyBlockMask.empty(),
                     "An absent block light array should set neither block mask.");
    passed &= Expect(packet.light.skyArrays.size() == 23 && packet.light.blockArrays.size() == 23,
                     "Only lit arrays should be sent.");
    return passed;
}

bool TestBlockEntityEncoding() {
    bool passed = true;
    basalt::BlockEntity chest;
    chest.packedXz = basalt::BlockEntity::packXz(3, 12);
    chest.y = -60;
    chest.typeId = 2;
    chest.tagPayload = {0x0A, 0x00, 0x00, 0x00};

    passed &= Expect(chest.packedXz == 0x3C, "x should fill the high nibble and z the low nibble.");
    passed &= Expect(basalt::BlockEntity::packXz(-1, 16) == 0xF0, "Coordinates should wrap to the section.");

    protocol::BufferSink sink;
    chest.encode(sink);
    passed &= Expect(sink.getBuffer() == std::vector<uint8_t>{0x3C, 0xFF, 0xC4, 0x02, 0x0A, 0x00, 0x00, 0x00},
                     "Block entity should be packed xz, int16 y, VarInt type, tag payload.");

    Registry registry = Registry::builtin();
    FixedWidthPolicy policy;
    ChunkPacketAssembler assembler(registry, policy);
    Chunk chunk = StubTerrain::build(ChunkPos(0, 0));
    ChunkDataPacket packet = assembler.compose(chunk, assembler.serializeSections(chunk));
    packet.blockEntities.push_back(chest);

    protocol::BufferSink packetSink;
    packet.encode(packetSink);
    protocol::MemoryByteSource source(packetSink.getBuffer());
    protocol::readVarInt(source);
    protocol::readI32(source);
    protocol::readI32(source);
    source.seek(static_cast<int64_t>(packet.heightmaps.size()), protocol::SeekOrigin::Current);
    protocol::readByteArray(source);
    passed &= Expect(protocol::readVarInt(source) == 1, "Block entity count should precede the entries.");
    passed &= Expect(protocol::readU8(source) == 0x3C, "The entry should follow its count.");
    return passed;
}

bool TestConcurrentBuildsAreIdentical() {
    bool passed = true;
    Registry registry = Registry::builtin();
    FixedWidthPolicy policy;
    ChunkPacketAssembler assembler(registry, policy);

    constexpr size_t THREAD_COUNT = 4;
    std::vector<protocol::BufferSink> sinks(THREAD_COUNT);
    std::vector<std::thread> workers;
    workers.reserve(THREAD_COUNT);
    for (size_t idx = 0; idx < THREAD_COUNT; idx++) {
        workers.emplace_back([&assembler, &sinks, idx]() {
            assembler.assemble(ChunkPos(12, -4), sinks[idx]);
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    protocol::BufferSink reference;
    assembler.assemble(ChunkPos(12, -4), reference);
    bool identical = true;
    for (const auto& sink : sinks) {
        identical &= sink.getBuffer() == reference.getBuffer();
    }
    passed &= Expect(identical, "Concurrent builds of one column should produce identical bytes.");
    return passed;
}

} // namespace

int main() {
    basalt::Logger::init("BasaltTest", "", spdlog::level::off);

    bool passed = true;
    passed &= TestPacketRecord();
    passed &= TestWireLayout();
    passed &= TestMissingSectionDataEmitsNothing();
    passed &= TestStrictRegistryAbortsPacket();
    passed &= TestStoredLighting();
    passed &= TestBlockEntityEncoding();
    passed &= TestConcurrentBuildsAreIdentical();

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] basalt_chunk_packet_assembler_tests\n";
    return 0;
}
