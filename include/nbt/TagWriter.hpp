#pragma once

#include "protocol/ByteStream.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace basalt::nbt {

enum class TagType : uint8_t {
    End = 0,
    Byte = 1,
    Short = 2,
    Int = 3,
    Long = 4,
    Float = 5,
    Double = 6,
    ByteArray = 7,
    String = 8,
    List = 9,
    Compound = 10,
    IntArray = 11,
    LongArray = 12,
};

/**
 * @brief Streaming writer for the named-tag tree format
 *
 * Writes the network variant used by protocol 763: the root compound carries
 * a (normally empty) name. Names and string payloads are written as a u16
 * length plus raw bytes; callers pass ASCII or already-encoded text.
 *
 * Usage:
 *   TagWriter writer(sink);
 *   writer.beginRoot();
 *   writer.writeLongArray("MOTION_BLOCKING", words);
 *   writer.endCompound();
 */
class TagWriter {
public:
    explicit TagWriter(protocol::ByteSink& sink) : sink(sink) {}

    void beginRoot(const std::string& name = "");
    void beginCompound(const std::string& name);

    /**
     * @brief Close the innermost open compound
     * @throws std::logic_error if no compound is open
     */
    void endCompound();

    void writeByte(const std::string& name, int8_t value);
    void writeShort(const std::string& name, int16_t value);
    void writeInt(const std::string& name, int32_t value);
    void writeLong(const std::string& name, int64_t value);
    void writeString(const std::string& name, const std::string& value);
    void writeLongArray(const std::string& name, const std::vector<int64_t>& values);

    /**
     * @brief Number of compounds opened and not yet closed
     */
    size_t depth() const { return openCompounds; }

private:
    protocol::ByteSink& sink;
    size_t openCompounds = 0;

    void writeHeader(TagType type, const std::string& name);
    void writeText(const std::string& text);
};

} // namespace basalt::nbt
