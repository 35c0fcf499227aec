#include "protocol/ByteStream.hpp"
#include "protocol/ProtocolError.hpp"

#include <algorithm>
#include <cstring>
#include <istream>
#include <limits>
#include <ostream>
#include <string>
#include <utility>

namespace basalt::protocol {

void readExact(ByteSource& source, uint8_t* dst, size_t count, const char* what) {
    size_t total = 0;
    while (total < count) {
        size_t received = source.read(dst + total, count - total);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (received == 0) {
            throw ProtocolError(ErrorKind::ShortRead,
                                std::string("Failed to read ") + what + ": expected " +
                                std::to_string(count) + " bytes, stream ended after " +
                                std::to_string(total));
        }
        total += received;
    }
}

MemoryByteSource::MemoryByteSource(const uint8_t* data, size_t size)
    : data(data), size(size) {
}

MemoryByteSource::MemoryByteSource(const std::vector<uint8_t>& bytes)
    : data(bytes.data()), size(bytes.size()) {
}

size_t MemoryByteSource::read(uint8_t* dst, size_t count) {
    size_t available = std::min(count, size - offset);
    if (available > 0) {
        std::memcpy(dst, data + offset, available);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        offset += available;
    }
    return available;
}

uint64_t MemoryByteSource::seek(int64_t offset, SeekOrigin origin) {
    int64_t base = 0;
    switch (origin) {
        case SeekOrigin::Begin:
            base = 0;
            break;
        case SeekOrigin::Current:
            base = static_cast<int64_t>(this->offset);
            break;
        case SeekOrigin::End:
            base = static_cast<int64_t>(size);
            break;
    }

    // base lies in [0, size], so both bounds are representable
    if (offset < -base || offset > static_cast<int64_t>(size) - base) {
        throw ProtocolError(ErrorKind::SeekFailed,
                            "Seek by " + std::to_string(offset) + " from " + std::to_string(base) +
                            " outside buffer of " + std::to_string(size) + " bytes");
    }

    this->offset = static_cast<size_t>(base + offset);
    return this->offset;
}

StreamByteSource::StreamByteSource(std::istream& stream)
    : stream(stream) {
    auto start = stream.tellg();
    if (start != std::istream::pos_type(-1)) {
        offset = static_cast<uint64_t>(start);
    }
}

size_t StreamByteSource::read(uint8_t* dst, size_t count) {
    if (!stream.good()) {
        return 0;
    }
    stream.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(count));  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
    auto received = static_cast<size_t>(stream.gcount());
    offset += received;
    return received;
}

uint64_t StreamByteSource::seek(int64_t offset, SeekOrigin origin) {
    std::ios_base::seekdir dir = std::ios_base::beg;
    switch (origin) {
        case SeekOrigin::Begin:
            dir = std::ios_base::beg;
            break;
        case SeekOrigin::Current:
            // Relative to the tracked offset; tellg() is unreliable once eof is set
            dir = std::ios_base::beg;
            if (offset > std::numeric_limits<int64_t>::max() - static_cast<int64_t>(this->offset)) {
                throw ProtocolError(ErrorKind::SeekFailed,
                                    "Stream seek by " + std::to_string(offset) + " overflows");
            }
            offset += static_cast<int64_t>(this->offset);
            break;
        case SeekOrigin::End:
            dir = std::ios_base::end;
            break;
    }

    stream.clear();
    stream.seekg(offset, dir);
    auto position = stream.tellg();
    if (stream.fail() || position == std::istream::pos_type(-1)) {
        throw ProtocolError(ErrorKind::SeekFailed,
                            "Stream seek to offset " + std::to_string(offset) + " failed");
    }

    this->offset = static_cast<uint64_t>(position);
    return this->offset;
}

void BufferSink::write(const uint8_t* data, size_t count) {
    buffer.insert(buffer.end(), data, data + count);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
}

std::vector<uint8_t> BufferSink::take() {
    std::vector<uint8_t> out = std::move(buffer);
    buffer.clear();
    return out;
}

void StreamByteSink::write(const uint8_t* data, size_t count) {
    stream.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(count));  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
    if (!stream) {
        throw ProtocolError(ErrorKind::WriteFailed,
                            "Failed to write " + std::to_string(count) + " bytes to stream");
    }
}

} // namespace basalt::protocol
