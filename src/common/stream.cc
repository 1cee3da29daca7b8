#include "stream.h"

#include <glog/logging.h>

namespace Statfan {

void StreamOutput::WriteVInt(uint32_t value) {
    while (value >= 0x80) {
        WriteByte(static_cast<uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    WriteByte(static_cast<uint8_t>(value));
}

void StreamOutput::WriteVLong(uint64_t value) {
    while (value >= 0x80) {
        WriteByte(static_cast<uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    WriteByte(static_cast<uint8_t>(value));
}

void StreamOutput::WriteZLong(int64_t value) {
    WriteVLong((static_cast<uint64_t>(value) << 1) ^ static_cast<uint64_t>(value >> 63));
}

void StreamOutput::WriteString(std::string_view value) {
    WriteVInt(static_cast<uint32_t>(value.size()));
    buffer_.append(value.data(), value.size());
}

void StreamOutput::WriteOptionalString(const std::optional<std::string>& value) {
    WriteBool(value.has_value());
    if (value) {
        WriteString(*value);
    }
}

void StreamOutput::WriteBytes(std::string_view bytes) {
    WriteVInt(static_cast<uint32_t>(bytes.size()));
    buffer_.append(bytes.data(), bytes.size());
}

void StreamOutput::WriteStringArrayNullable(const std::vector<std::string>* values) {
    WriteBool(values != nullptr);
    if (values == nullptr) {
        return;
    }
    WriteVInt(static_cast<uint32_t>(values->size()));
    for (const auto& value : *values) {
        WriteString(value);
    }
}

void StreamInput::Require(size_t n, const char* what) const {
    if (n > remaining()) {
        throw CodecError(std::string("truncated stream reading ") + what + ": need " +
                         std::to_string(n) + " bytes at offset " + std::to_string(position_) +
                         ", have " + std::to_string(remaining()));
    }
}

uint8_t StreamInput::ReadByte() {
    Require(1, "byte");
    return static_cast<uint8_t>(data_[position_++]);
}

bool StreamInput::ReadBool() {
    uint8_t b = ReadByte();
    if (b > 1) {
        throw CodecError("malformed bool value " + std::to_string(b) + " at offset " +
                         std::to_string(position_ - 1));
    }
    return b == 1;
}

uint32_t StreamInput::ReadVInt() {
    uint32_t result = 0;
    for (int shift = 0; shift < 35; shift += 7) {
        uint8_t b = ReadByte();
        if (shift == 28 && (b & 0xF0) != 0) {
            throw CodecError("vint overflow at offset " + std::to_string(position_ - 1));
        }
        result |= static_cast<uint32_t>(b & 0x7F) << shift;
        if ((b & 0x80) == 0) {
            return result;
        }
    }
    throw CodecError("vint overflow at offset " + std::to_string(position_));
}

uint64_t StreamInput::ReadVLong() {
    uint64_t result = 0;
    for (int shift = 0; shift < 70; shift += 7) {
        uint8_t b = ReadByte();
        if (shift == 63 && (b & 0xFE) != 0) {
            throw CodecError("vlong overflow at offset " + std::to_string(position_ - 1));
        }
        result |= static_cast<uint64_t>(b & 0x7F) << shift;
        if ((b & 0x80) == 0) {
            return result;
        }
    }
    throw CodecError("vlong overflow at offset " + std::to_string(position_));
}

int64_t StreamInput::ReadZLong() {
    uint64_t raw = ReadVLong();
    return static_cast<int64_t>((raw >> 1) ^ (~(raw & 1) + 1));
}

std::string StreamInput::ReadString() {
    uint32_t length = ReadVInt();
    if (length > limits_.max_bytes_length) {
        throw CodecError("string length " + std::to_string(length) + " exceeds limit");
    }
    Require(length, "string");
    std::string value(data_ + position_, length);
    position_ += length;
    return value;
}

std::optional<std::string> StreamInput::ReadOptionalString() {
    if (!ReadBool()) {
        return std::nullopt;
    }
    return ReadString();
}

std::string StreamInput::ReadBytes() {
    uint32_t length = ReadVInt();
    if (length > limits_.max_bytes_length) {
        throw CodecError("bytes length " + std::to_string(length) + " exceeds limit");
    }
    Require(length, "bytes");
    std::string value(data_ + position_, length);
    position_ += length;
    return value;
}

std::optional<std::vector<std::string>> StreamInput::ReadStringArrayNullable() {
    if (!ReadBool()) {
        return std::nullopt;
    }
    size_t count = ReadCollectionSize();
    std::vector<std::string> values;
    values.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        values.push_back(ReadString());
    }
    return values;
}

size_t StreamInput::ReadCollectionSize() {
    uint32_t count = ReadVInt();
    if (count > limits_.max_collection_size) {
        throw CodecError("collection size " + std::to_string(count) + " exceeds limit");
    }
    return count;
}

void StreamInput::ExpectEnd() const {
    if (remaining() != 0) {
        VLOG(1) << "Stream has " << remaining() << " trailing bytes after offset " << position_;
        throw CodecError(std::to_string(remaining()) + " trailing bytes after decoded object");
    }
}

} // namespace Statfan
