#include "protocol/ProtocolError.hpp"

namespace basalt::protocol {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ShortRead:
            return "ShortRead";
        case ErrorKind::InvalidVarInt:
            return "InvalidVarInt";
        case ErrorKind::InvalidVarLong:
            return "InvalidVarLong";
        case ErrorKind::InvalidUtf8:
            return "InvalidUtf8";
        case ErrorKind::InvalidLength:
            return "InvalidLength";
        case ErrorKind::MissingSectionData:
            return "MissingSectionData";
        case ErrorKind::MalformedSectionData:
            return "MalformedSectionData";
        case ErrorKind::UnknownRegistryEntry:
            return "UnknownRegistryEntry";
        case ErrorKind::SeekFailed:
            return "SeekFailed";
        case ErrorKind::WriteFailed:
            return "WriteFailed";
    }
    return "Unknown";
}

ProtocolError::ProtocolError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), errorKind(kind) {
}

} // namespace basalt::protocol
