#include "protocol/VarInt.hpp"
#include "protocol/ProtocolError.hpp"

#include <array>
#include <string>

namespace basalt::protocol {

namespace {

constexpr uint8_t SEGMENT_BITS = 0x7F;
constexpr uint8_t CONTINUE_BIT = 0x80;

template <typename Unsigned, size_t MaxGroups>
Unsigned readGroups(ByteSource& source, const char* what, ErrorKind overflowKind) {
    Unsigned result = 0;
    for (size_t group = 0; group < MaxGroups; group++) {
        // Single-byte reads: the rest of the value may not have arrived yet
        uint8_t byte = 0;
        readExact(source, &byte, 1, what);

        result |= static_cast<Unsigned>(byte & SEGMENT_BITS) << (7 * group);
        if ((byte & CONTINUE_BIT) == 0) {
            return result;
        }
    }
    throw ProtocolError(overflowKind, std::string(what) + " is too big: more than " +
                                      std::to_string(MaxGroups) + " groups");
}

template <typename Unsigned, size_t MaxGroups>
void writeGroups(ByteSink& sink, Unsigned value) {
    std::array<uint8_t, MaxGroups> buffer{};
    size_t length = 0;
    while ((value & ~static_cast<Unsigned>(SEGMENT_BITS)) != 0) {
        buffer[length++] = static_cast<uint8_t>((value & SEGMENT_BITS) | CONTINUE_BIT);
        value >>= 7;
    }
    buffer[length++] = static_cast<uint8_t>(value);
    sink.write(buffer.data(), length);
}

template <typename Unsigned>
size_t groupCount(Unsigned value) {
    size_t count = 1;
    while ((value >>= 7) != 0) {
        count++;
    }
    return count;
}

} // namespace

int32_t readVarInt(ByteSource& source) {
    return static_cast<int32_t>(
        readGroups<uint32_t, MAX_VARINT_BYTES>(source, "VarInt", ErrorKind::InvalidVarInt));
}

int64_t readVarLong(ByteSource& source) {
    return static_cast<int64_t>(
        readGroups<uint64_t, MAX_VARLONG_BYTES>(source, "VarLong", ErrorKind::InvalidVarLong));
}

void writeVarInt(ByteSink& sink, int32_t value) {
    writeGroups<uint32_t, MAX_VARINT_BYTES>(sink, static_cast<uint32_t>(value));
}

void writeVarLong(ByteSink& sink, int64_t value) {
    writeGroups<uint64_t, MAX_VARLONG_BYTES>(sink, static_cast<uint64_t>(value));
}

size_t varIntSize(int32_t value) {
    return groupCount(static_cast<uint32_t>(value));
}

size_t varLongSize(int64_t value) {
    return groupCount(static_cast<uint64_t>(value));
}

} // namespace basalt::protocol
