#include "protocol/Primitives.hpp"
#include "protocol/ProtocolError.hpp"
#include "protocol/VarInt.hpp"

#include <algorithm>
#include <array>
#include <bit>
#include <limits>
#include <type_traits>

namespace basalt::protocol {

namespace {

// Cap on up-front allocation for length-prefixed arrays; larger arrays grow as bytes arrive
constexpr size_t MAX_PREALLOCATED_ELEMENTS = 4096;

template <typename T>
T readBigEndian(ByteSource& source, const char* what) {
    static_assert(std::is_unsigned_v<T>);
    std::array<uint8_t, sizeof(T)> bytes{};
    readExact(source, bytes.data(), bytes.size(), what);

    T value = 0;
    for (uint8_t byte : bytes) {
        value = static_cast<T>((value << 8) | byte);
    }
    return value;
}

template <typename T>
void writeBigEndian(ByteSink& sink, T value) {
    static_assert(std::is_unsigned_v<T>);
    std::array<uint8_t, sizeof(T)> bytes{};
    for (size_t idx = 0; idx < sizeof(T); idx++) {
        bytes[sizeof(T) - 1 - idx] = static_cast<uint8_t>(value >> (8 * idx));
    }
    sink.write(bytes.data(), bytes.size());
}

size_t readLength(ByteSource& source, size_t maxLength, const char* what) {
    int32_t length = readVarInt(source);
    if (length < 0 || static_cast<size_t>(length) > maxLength) {
        throw ProtocolError(ErrorKind::InvalidLength,
                            std::string("Invalid ") + what + " length " + std::to_string(length) +
                            " (max " + std::to_string(maxLength) + ")");
    }
    return static_cast<size_t>(length);
}

int32_t checkedLength(size_t length, const char* what) {
    if (length > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw ProtocolError(ErrorKind::InvalidLength,
                            std::string(what) + " of " + std::to_string(length) +
                            " elements does not fit a VarInt length");
    }
    return static_cast<int32_t>(length);
}

} // namespace

bool readBool(ByteSource& source) {
    return readBigEndian<uint8_t>(source, "bool") != 0;
}

uint8_t readU8(ByteSource& source) {
    return readBigEndian<uint8_t>(source, "u8");
}

int8_t readI8(ByteSource& source) {
    return std::bit_cast<int8_t>(readBigEndian<uint8_t>(source, "i8"));
}

uint16_t readU16(ByteSource& source) {
    return readBigEndian<uint16_t>(source, "u16");
}

int16_t readI16(ByteSource& source) {
    return std::bit_cast<int16_t>(readBigEndian<uint16_t>(source, "i16"));
}

uint32_t readU32(ByteSource& source) {
    return readBigEndian<uint32_t>(source, "u32");
}

int32_t readI32(ByteSource& source) {
    return std::bit_cast<int32_t>(readBigEndian<uint32_t>(source, "i32"));
}

uint64_t readU64(ByteSource& source) {
    return readBigEndian<uint64_t>(source, "u64");
}

int64_t readI64(ByteSource& source) {
    return std::bit_cast<int64_t>(readBigEndian<uint64_t>(source, "i64"));
}

float readF32(ByteSource& source) {
    return std::bit_cast<float>(readBigEndian<uint32_t>(source, "f32"));
}

double readF64(ByteSource& source) {
    return std::bit_cast<double>(readBigEndian<uint64_t>(source, "f64"));
}

std::string readString(ByteSource& source, size_t maxBytes) {
    // The length prefix may itself arrive in pieces, so it is read as a VarInt first
    size_t length = readLength(source, maxBytes, "string");

    std::string value(length, '\0');
    if (length > 0) {
        readExact(source, reinterpret_cast<uint8_t*>(value.data()), length, "string");  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
    }

    if (!isValidUtf8(reinterpret_cast<const uint8_t*>(value.data()), value.size())) {  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
        throw ProtocolError(ErrorKind::InvalidUtf8,
                            "String of " + std::to_string(length) + " bytes is not valid UTF-8");
    }
    return value;
}

std::vector<uint8_t> readByteArray(ByteSource& source) {
    size_t length = readLength(source, std::numeric_limits<int32_t>::max(), "byte array");

    std::vector<uint8_t> bytes;
    bytes.reserve(std::min(length, MAX_PREALLOCATED_ELEMENTS));
    std::array<uint8_t, 1024> chunk{};
    while (bytes.size() < length) {
        size_t wanted = std::min(chunk.size(), length - bytes.size());
        readExact(source, chunk.data(), wanted, "byte array");
        bytes.insert(bytes.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(wanted));
    }
    return bytes;
}

std::vector<int64_t> readLongArray(ByteSource& source) {
    size_t count = readLength(source, std::numeric_limits<int32_t>::max(), "long array");

    std::vector<int64_t> words;
    words.reserve(std::min(count, MAX_PREALLOCATED_ELEMENTS));
    for (size_t idx = 0; idx < count; idx++) {
        words.push_back(readI64(source));
    }
    return words;
}

void writeBool(ByteSink& sink, bool value) {
    sink.writeByte(value ? 1 : 0);
}

void writeU8(ByteSink& sink, uint8_t value) {
    sink.writeByte(value);
}

void writeI8(ByteSink& sink, int8_t value) {
    sink.writeByte(std::bit_cast<uint8_t>(value));
}

void writeU16(ByteSink& sink, uint16_t value) {
    writeBigEndian(sink, value);
}

void writeI16(ByteSink& sink, int16_t value) {
    writeBigEndian(sink, std::bit_cast<uint16_t>(value));
}

void writeU32(ByteSink& sink, uint32_t value) {
    writeBigEndian(sink, value);
}

void writeI32(ByteSink& sink, int32_t value) {
    writeBigEndian(sink, std::bit_cast<uint32_t>(value));
}

void writeU64(ByteSink& sink, uint64_t value) {
    writeBigEndian(sink, value);
}

void writeI64(ByteSink& sink, int64_t value) {
    writeBigEndian(sink, std::bit_cast<uint64_t>(value));
}

void writeF32(ByteSink& sink, float value) {
    writeBigEndian(sink, std::bit_cast<uint32_t>(value));
}

void writeF64(ByteSink& sink, double value) {
    writeBigEndian(sink, std::bit_cast<uint64_t>(value));
}

void writeString(ByteSink& sink, std::string_view value) {
    writeVarInt(sink, checkedLength(value.size(), "String"));
    sink.write(reinterpret_cast<const uint8_t*>(value.data()), value.size());  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
}

void writeByteArray(ByteSink& sink, const std::vector<uint8_t>& bytes) {
    writeVarInt(sink, checkedLength(bytes.size(), "Byte array"));
    sink.write(bytes.data(), bytes.size());
}

void writeLongArray(ByteSink& sink, const std::vector<int64_t>& words) {
    writeVarInt(sink, checkedLength(words.size(), "Long array"));
    for (int64_t word : words) {
        writeI64(sink, word);
    }
}

template <> bool read<bool>(ByteSource& source) { return readBool(source); }
template <> uint8_t read<uint8_t>(ByteSource& source) { return readU8(source); }
template <> int8_t read<int8_t>(ByteSource& source) { return readI8(source); }
template <> uint16_t read<uint16_t>(ByteSource& source) { return readU16(source); }
template <> int16_t read<int16_t>(ByteSource& source) { return readI16(source); }
template <> uint32_t read<uint32_t>(ByteSource& source) { return readU32(source); }
template <> int32_t read<int32_t>(ByteSource& source) { return readI32(source); }
template <> uint64_t read<uint64_t>(ByteSource& source) { return readU64(source); }
template <> int64_t read<int64_t>(ByteSource& source) { return readI64(source); }
template <> float read<float>(ByteSource& source) { return readF32(source); }
template <> double read<double>(ByteSource& source) { return readF64(source); }
template <> std::string read<std::string>(ByteSource& source) { return readString(source); }

bool isValidUtf8(const uint8_t* data, size_t size) {
    size_t idx = 0;
    while (idx < size) {
        uint8_t lead = data[idx];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        size_t extra = 0;
        uint32_t codePoint = 0;

        if (lead < 0x80) {
            idx++;
            continue;
        }
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            codePoint = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            codePoint = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            codePoint = lead & 0x07;
        } else {
            return false;  // Continuation byte or 0xF8..0xFF as lead
        }

        if (idx + extra >= size) {
            return false;
        }
        for (size_t k = 1; k <= extra; k++) {
            uint8_t next = data[idx + k];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            codePoint = (codePoint << 6) | (next & 0x3F);
        }

        static constexpr std::array<uint32_t, 4> MIN_CODE_POINT{0, 0x80, 0x800, 0x10000};
        if (codePoint < MIN_CODE_POINT[extra] ||              // overlong
            codePoint > 0x10FFFF ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {   // UTF-16 surrogate
            return false;
        }
        idx += extra + 1;
    }
    return true;
}

} // namespace basalt::protocol
