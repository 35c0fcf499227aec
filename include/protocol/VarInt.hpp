#pragma once

#include "protocol/ByteStream.hpp"
#include <cstddef>
#include <cstdint>

namespace basalt::protocol {

/**
 * VarInt / VarLong: 7 payload bits per byte, least significant group first,
 * high bit set on every byte except the last. Negative values are encoded
 * through their two's-complement bit pattern and always take the maximum
 * number of groups.
 */
constexpr size_t MAX_VARINT_BYTES = 5;
constexpr size_t MAX_VARLONG_BYTES = 10;

/**
 * @brief Decode a VarInt, one byte read at a time
 * @throws ProtocolError ShortRead or InvalidVarInt
 */
int32_t readVarInt(ByteSource& source);

/**
 * @brief Decode a VarLong, one byte read at a time
 * @throws ProtocolError ShortRead or InvalidVarLong
 */
int64_t readVarLong(ByteSource& source);

void writeVarInt(ByteSink& sink, int32_t value);
void writeVarLong(ByteSink& sink, int64_t value);

/**
 * @brief Number of bytes writeVarInt() emits for value
 */
size_t varIntSize(int32_t value);
size_t varLongSize(int64_t value);

} // namespace basalt::protocol
