#pragma once

#include "protocol/ByteStream.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace basalt::protocol {

/**
 * Fixed-width scalars are big-endian. Strings and byte arrays carry a VarInt
 * byte-length prefix. Every read throws ProtocolError (ShortRead) when the
 * source ends early.
 */

/// 32767 UTF-16 units, at most 3 UTF-8 bytes each
constexpr size_t DEFAULT_MAX_STRING_BYTES = 32767 * 3;

bool readBool(ByteSource& source);
uint8_t readU8(ByteSource& source);
int8_t readI8(ByteSource& source);
uint16_t readU16(ByteSource& source);
int16_t readI16(ByteSource& source);
uint32_t readU32(ByteSource& source);
int32_t readI32(ByteSource& source);
uint64_t readU64(ByteSource& source);
int64_t readI64(ByteSource& source);
float readF32(ByteSource& source);
double readF64(ByteSource& source);

/**
 * @brief Read a VarInt-prefixed UTF-8 string
 *
 * The full declared length is consumed before validation.
 *
 * @throws ProtocolError InvalidLength if the prefix is negative or above
 *         maxBytes (nothing past the prefix is read), InvalidUtf8 if the
 *         payload is not UTF-8
 */
std::string readString(ByteSource& source, size_t maxBytes = DEFAULT_MAX_STRING_BYTES);

/**
 * @brief Read VarInt-prefixed raw bytes
 */
std::vector<uint8_t> readByteArray(ByteSource& source);

/**
 * @brief Read a VarInt word count followed by that many big-endian int64
 */
std::vector<int64_t> readLongArray(ByteSource& source);

void writeBool(ByteSink& sink, bool value);
void writeU8(ByteSink& sink, uint8_t value);
void writeI8(ByteSink& sink, int8_t value);
void writeU16(ByteSink& sink, uint16_t value);
void writeI16(ByteSink& sink, int16_t value);
void writeU32(ByteSink& sink, uint32_t value);
void writeI32(ByteSink& sink, int32_t value);
void writeU64(ByteSink& sink, uint64_t value);
void writeI64(ByteSink& sink, int64_t value);
void writeF32(ByteSink& sink, float value);
void writeF64(ByteSink& sink, double value);
void writeString(ByteSink& sink, std::string_view value);
void writeByteArray(ByteSink& sink, const std::vector<uint8_t>& bytes);
void writeLongArray(ByteSink& sink, const std::vector<int64_t>& words);

/**
 * @brief Decode by static type: read<int16_t>(source), read<std::string>(source), ...
 *
 * Only the specializations declared below exist.
 */
template <typename T>
T read(ByteSource& source);

template <> bool read<bool>(ByteSource& source);
template <> uint8_t read<uint8_t>(ByteSource& source);
template <> int8_t read<int8_t>(ByteSource& source);
template <> uint16_t read<uint16_t>(ByteSource& source);
template <> int16_t read<int16_t>(ByteSource& source);
template <> uint32_t read<uint32_t>(ByteSource& source);
template <> int32_t read<int32_t>(ByteSource& source);
template <> uint64_t read<uint64_t>(ByteSource& source);
template <> int64_t read<int64_t>(ByteSource& source);
template <> float read<float>(ByteSource& source);
template <> double read<double>(ByteSource& source);
template <> std::string read<std::string>(ByteSource& source);

/**
 * @brief Encode by static type
 */
inline void write(ByteSink& sink, bool value) { writeBool(sink, value); }
inline void write(ByteSink& sink, uint8_t value) { writeU8(sink, value); }
inline void write(ByteSink& sink, int8_t value) { writeI8(sink, value); }
inline void write(ByteSink& sink, uint16_t value) { writeU16(sink, value); }
inline void write(ByteSink& sink, int16_t value) { writeI16(sink, value); }
inline void write(ByteSink& sink, uint32_t value) { writeU32(sink, value); }
inline void write(ByteSink& sink, int32_t value) { writeI32(sink, value); }
inline void write(ByteSink& sink, uint64_t value) { writeU64(sink, value); }
inline void write(ByteSink& sink, int64_t value) { writeI64(sink, value); }
inline void write(ByteSink& sink, float value) { writeF32(sink, value); }
inline void write(ByteSink& sink, double value) { writeF64(sink, value); }
inline void write(ByteSink& sink, std::string_view value) { writeString(sink, value); }

/**
 * @brief Strict UTF-8 check (no overlongs, surrogates or code points above U+10FFFF)
 */
bool isValidUtf8(const uint8_t* data, size_t size);

} // namespace basalt::protocol
