#pragma once

#include "protocol/ByteStream.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

namespace basalt::protocol {

/// Largest uncompressed frame body the client accepts (2^21 - 1)
constexpr size_t MAX_FRAME_BYTES = (size_t{1} << 21) - 1;

/**
 * @brief Write an uncompressed frame: VarInt body length, then the body
 *
 * The body starts with the packet id VarInt.
 */
void framePacket(const std::vector<uint8_t>& body, ByteSink& sink);

/**
 * @brief Read one uncompressed frame body
 * @throws ProtocolError InvalidLength for negative or oversized lengths
 */
std::vector<uint8_t> readFrame(ByteSource& source);

} // namespace basalt::protocol
