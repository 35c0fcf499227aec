#include "TestSupport.hpp"
#include "protocol/ByteStream.hpp"
#include "protocol/PacketFrame.hpp"
#include "protocol/VarInt.hpp"

#include <cstdint>
#include <iostream>
#include <vector>

namespace {

using basalt::test::Expect;
using basalt::test::ExpectProtocolError;
namespace protocol = basalt::protocol;

bool TestFrameRoundTrip() {
    bool passed = true;
    std::vector<uint8_t> body(200, 0x24);

    protocol::BufferSink sink;
    protocol::framePacket(body, sink);
    passed &= Expect(sink.size() == 2 + body.size(), "A 200-byte body should get a 2-byte length prefix.");

    protocol::MemoryByteSource source(sink.getBuffer());
    passed &= Expect(protocol::readFrame(source) == body, "readFrame should return the framed body.");
    passed &= Expect(source.remaining() == 0, "The frame should be fully consumed.");
    return passed;
}

bool TestConsecutiveFrames() {
    bool passed = true;
    protocol::BufferSink sink;
    protocol::framePacket({0x01}, sink);
    protocol::framePacket({}, sink);
    protocol::framePacket({0x02, 0x03}, sink);

    basalt::test::TrickleByteSource source(sink.take());
    passed &= Expect(protocol::readFrame(source) == std::vector<uint8_t>{0x01}, "First frame should decode.");
    passed &= Expect(protocol::readFrame(source).empty(), "Empty frame should decode.");
    passed &= Expect(protocol::readFrame(source) == std::vector<uint8_t>{0x02, 0x03}, "Third frame should decode.");
    return passed;
}

bool TestOversizedFrameRejected() {
    bool passed = true;
    protocol::BufferSink sink;
    protocol::writeVarInt(sink, static_cast<int32_t>(protocol::MAX_FRAME_BYTES + 1));
    passed &= ExpectProtocolError(
        [&] {
            protocol::MemoryByteSource source(sink.getBuffer());
            protocol::readFrame(source);
        },
        protocol::ErrorKind::InvalidLength, "A declared frame above the limit should be rejected.");

    std::vector<uint8_t> truncated{0x05, 0x01, 0x02};
    passed &= ExpectProtocolError(
        [&] {
            protocol::MemoryByteSource source(truncated);
            protocol::readFrame(source);
        },
        protocol::ErrorKind::ShortRead, "A frame cut short should be a short read.");
    return passed;
}

} // namespace

int main() {
    bool passed = true;
    passed &= TestFrameRoundTrip();
    passed &= TestConsecutiveFrames();
    passed &= TestOversizedFrameRejected();

    if (!passed) {
        return 1;
    }

    std::cout << "[PASS] basalt_packet_frame_tests\n";
    return 0;
}
