#include "nbt/TagWriter.hpp"
#include "protocol/Primitives.hpp"
#include "protocol/ProtocolError.hpp"

#include <limits>
#include <stdexcept>

namespace basalt::nbt {

void TagWriter::beginRoot(const std::string& name) {
    if (openCompounds != 0) {
        throw std::logic_error("beginRoot() inside an open compound");
    }
    writeHeader(TagType::Compound, name);
    openCompounds++;
}

void TagWriter::beginCompound(const std::string& name) {
    writeHeader(TagType::Compound, name);
    openCompounds++;
}

void TagWriter::endCompound() {
    if (openCompounds == 0) {
        throw std::logic_error("endCompound() without an open compound");
    }
    protocol::writeU8(sink, static_cast<uint8_t>(TagType::End));
    openCompounds--;
}

void TagWriter::writeByte(const std::string& name, int8_t value) {
    writeHeader(TagType::Byte, name);
    protocol::writeI8(sink, value);
}

void TagWriter::writeShort(const std::string& name, int16_t value) {
    writeHeader(TagType::Short, name);
    protocol::writeI16(sink, value);
}

void TagWriter::writeInt(const std::string& name, int32_t value) {
    writeHeader(TagType::Int, name);
    protocol::writeI32(sink, value);
}

void TagWriter::writeLong(const std::string& name, int64_t value) {
    writeHeader(TagType::Long, name);
    protocol::writeI64(sink, value);
}

void TagWriter::writeString(const std::string& name, const std::string& value) {
    writeHeader(TagType::String, name);
    writeText(value);
}

void TagWriter::writeLongArray(const std::string& name, const std::vector<int64_t>& values) {
    if (values.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw protocol::ProtocolError(protocol::ErrorKind::InvalidLength,
                                      "Long array tag '" + name + "' is too large");
    }
    writeHeader(TagType::LongArray, name);
    // Tag arrays use a fixed int32 length, not a VarInt
    protocol::writeI32(sink, static_cast<int32_t>(values.size()));
    for (int64_t value : values) {
        protocol::writeI64(sink, value);
    }
}

void TagWriter::writeHeader(TagType type, const std::string& name) {
    protocol::writeU8(sink, static_cast<uint8_t>(type));
    writeText(name);
}

void TagWriter::writeText(const std::string& text) {
    if (text.size() > std::numeric_limits<uint16_t>::max()) {
        throw protocol::ProtocolError(protocol::ErrorKind::InvalidLength,
                                      "Tag text of " + std::to_string(text.size()) +
                                      " bytes exceeds 65535");
    }
    protocol::writeU16(sink, static_cast<uint16_t>(text.size()));
    sink.write(reinterpret_cast<const uint8_t*>(text.data()), text.size());  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
}

} // namespace basalt::nbt
