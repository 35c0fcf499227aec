#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <vector>

namespace basalt::protocol {

enum class SeekOrigin : uint8_t {
    Begin,
    Current,
    End,
};

/**
 * @brief Readable, seekable byte source consumed by every decode operation
 *
 * read() may block until at least one byte is available; a decode that is
 * abandoned part-way leaves the position wherever the last read stopped, so
 * the source must be discarded afterwards. A source is used by one decoder
 * at a time.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Read up to count bytes
     * @return Number of bytes read, 0 once the stream is exhausted or closed
     */
    virtual size_t read(uint8_t* dst, size_t count) = 0;

    /**
     * @brief Move the read position
     * @return The new absolute position
     * @throws ProtocolError (SeekFailed) if the target is out of range
     */
    virtual uint64_t seek(int64_t offset, SeekOrigin origin) = 0;

    virtual uint64_t position() const = 0;
};

/**
 * @brief Read exactly count bytes or throw ProtocolError (ShortRead)
 * @param what Field name used in the error message
 */
void readExact(ByteSource& source, uint8_t* dst, size_t count, const char* what);

/**
 * @brief Source over borrowed contiguous bytes
 *
 * The bytes must outlive the source.
 */
class MemoryByteSource final : public ByteSource {
public:
    MemoryByteSource(const uint8_t* data, size_t size);
    explicit MemoryByteSource(const std::vector<uint8_t>& bytes);

    size_t read(uint8_t* dst, size_t count) override;
    uint64_t seek(int64_t offset, SeekOrigin origin) override;
    uint64_t position() const override { return offset; }

    size_t remaining() const { return size - offset; }

private:
    const uint8_t* data;
    size_t size;
    size_t offset = 0;
};

/**
 * @brief Source over a std::istream (files, string streams)
 */
class StreamByteSource final : public ByteSource {
public:
    explicit StreamByteSource(std::istream& stream);

    size_t read(uint8_t* dst, size_t count) override;
    uint64_t seek(int64_t offset, SeekOrigin origin) override;
    uint64_t position() const override { return offset; }

private:
    std::istream& stream;
    uint64_t offset = 0;
};

/**
 * @brief Byte sink written by every encode operation
 */
class ByteSink {
public:
    virtual ~ByteSink() = default;

    virtual void write(const uint8_t* data, size_t count) = 0;

    void writeByte(uint8_t value) { write(&value, 1); }
    void write(const std::vector<uint8_t>& bytes) { write(bytes.data(), bytes.size()); }
};

/**
 * @brief Sink that accumulates into an owned buffer
 */
class BufferSink final : public ByteSink {
public:
    BufferSink() = default;
    explicit BufferSink(size_t reserveBytes) { buffer.reserve(reserveBytes); }

    using ByteSink::write;
    void write(const uint8_t* data, size_t count) override;

    const std::vector<uint8_t>& getBuffer() const { return buffer; }
    size_t size() const { return buffer.size(); }
    void clear() { buffer.clear(); }

    /**
     * @brief Move the accumulated bytes out, leaving the sink empty
     */
    std::vector<uint8_t> take();

private:
    std::vector<uint8_t> buffer;
};

/**
 * @brief Sink over a std::ostream
 */
class StreamByteSink final : public ByteSink {
public:
    explicit StreamByteSink(std::ostream& stream) : stream(stream) {}

    using ByteSink::write;
    void write(const uint8_t* data, size_t count) override;

private:
    std::ostream& stream;
};

} // namespace basalt::protocol
