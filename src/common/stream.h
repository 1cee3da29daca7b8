#ifndef STATFAN_COMMON_STREAM_H_
#define STATFAN_COMMON_STREAM_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Statfan {

/**
 * Thrown when a binary stream or a document cannot be decoded.
 * Decoders never hand back a partially populated object.
 */
class CodecError : public std::runtime_error {
public:
    explicit CodecError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Upper bounds applied while decoding untrusted streams so that a corrupt
 * length prefix cannot trigger a huge allocation.
 */
struct StreamLimits {
    size_t max_bytes_length = 100UL * 1024 * 1024;
    size_t max_collection_size = 1UL << 20;
};

/**
 * Append-only binary writer. Variable-length integers are little-endian
 * base-128; signed counters use zig-zag so negative values stay compact.
 */
class StreamOutput {
public:
    StreamOutput() = default;

    void WriteByte(uint8_t b) { buffer_.push_back(static_cast<char>(b)); }
    void WriteBool(bool value) { WriteByte(value ? 1 : 0); }
    void WriteVInt(uint32_t value);
    void WriteVLong(uint64_t value);
    void WriteZLong(int64_t value);
    void WriteString(std::string_view value);
    void WriteOptionalString(const std::optional<std::string>& value);
    void WriteBytes(std::string_view bytes);
    // Null and empty arrays are distinct on the wire.
    void WriteStringArrayNullable(const std::vector<std::string>* values);

    const std::string& bytes() const { return buffer_; }
    std::string Release() { return std::move(buffer_); }
    size_t size() const { return buffer_.size(); }

private:
    std::string buffer_;
};

/**
 * Reader over a borrowed byte range. Every read checks the remaining length
 * and throws CodecError instead of running past the end.
 */
class StreamInput {
public:
    StreamInput(const char* data, size_t size, StreamLimits limits = StreamLimits{})
        : data_(data), size_(size), limits_(limits) {}
    explicit StreamInput(std::string_view bytes, StreamLimits limits = StreamLimits{})
        : StreamInput(bytes.data(), bytes.size(), limits) {}

    uint8_t ReadByte();
    bool ReadBool();
    uint32_t ReadVInt();
    uint64_t ReadVLong();
    int64_t ReadZLong();
    std::string ReadString();
    std::optional<std::string> ReadOptionalString();
    std::string ReadBytes();
    std::optional<std::vector<std::string>> ReadStringArrayNullable();

    // Reads a collection length prefix and checks it against the limits.
    size_t ReadCollectionSize();

    size_t position() const { return position_; }
    size_t remaining() const { return size_ - position_; }

    // Throws unless every byte has been consumed.
    void ExpectEnd() const;

private:
    void Require(size_t n, const char* what) const;

    const char* data_;
    size_t size_;
    size_t position_ = 0;
    StreamLimits limits_;
};

} // namespace Statfan

#endif // STATFAN_COMMON_STREAM_H_
