#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace basalt::protocol {

/**
 * @brief Failure categories raised by the wire codecs and the chunk assembler
 */
enum class ErrorKind : uint8_t {
    ShortRead,              ///< Stream ended before a field was complete
    InvalidVarInt,          ///< More than 5 VarInt groups
    InvalidVarLong,         ///< More than 10 VarLong groups
    InvalidUtf8,            ///< String payload is not valid UTF-8
    InvalidLength,          ///< Negative or oversized length prefix
    MissingSectionData,     ///< Section lacks block-state or biome data
    MalformedSectionData,   ///< Section data violates its palette or size invariants
    UnknownRegistryEntry,   ///< Name absent from the registry (strict mode)
    SeekFailed,             ///< Source could not be repositioned
    WriteFailed,            ///< Sink rejected the bytes
};

/**
 * @brief Stable name of an error kind, for log lines
 */
const char* errorKindName(ErrorKind kind);

/**
 * @brief Exception carrying an ErrorKind and a descriptive message
 */
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return errorKind; }

private:
    ErrorKind errorKind;
};

} // namespace basalt::protocol
