#include "protocol/PacketFrame.hpp"
#include "protocol/ProtocolError.hpp"
#include "protocol/VarInt.hpp"

#include <string>

namespace basalt::protocol {

void framePacket(const std::vector<uint8_t>& body, ByteSink& sink) {
    if (body.size() > MAX_FRAME_BYTES) {
        throw ProtocolError(ErrorKind::InvalidLength,
                            "Packet body of " + std::to_string(body.size()) +
                            " bytes exceeds the frame limit of " + std::to_string(MAX_FRAME_BYTES));
    }
    writeVarInt(sink, static_cast<int32_t>(body.size()));
    sink.write(body);
}

std::vector<uint8_t> readFrame(ByteSource& source) {
    int32_t length = readVarInt(source);
    if (length < 0 || static_cast<size_t>(length) > MAX_FRAME_BYTES) {
        throw ProtocolError(ErrorKind::InvalidLength,
                            "Invalid frame length " + std::to_string(length));
    }

    std::vector<uint8_t> body(static_cast<size_t>(length));
    if (!body.empty()) {
        readExact(source, body.data(), body.size(), "frame body");
    }
    return body;
}

} // namespace basalt::protocol
