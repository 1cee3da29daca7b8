#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

namespace Statfan {

/**
 * Opaque payload bytes that are either owned or borrowed.
 *
 * A borrowed instance is a view over memory that belongs to someone else
 * (a receive buffer, a pooled block). It stays valid only as long as the
 * owner keeps that memory alive and unchanged. Owned instances share one
 * immutable heap buffer, so copying a PayloadBytes never copies the bytes.
 */
class PayloadBytes {
public:
    PayloadBytes() = default;

    static PayloadBytes Borrow(const void* data, size_t size) {
        PayloadBytes bytes;
        bytes.data_ = static_cast<const char*>(data);
        bytes.size_ = size;
        return bytes;
    }

    static PayloadBytes Own(std::string bytes) {
        PayloadBytes owned;
        owned.owned_ = std::make_shared<const std::string>(std::move(bytes));
        owned.data_ = owned.owned_->data();
        owned.size_ = owned.owned_->size();
        return owned;
    }

    // Deep copy into a fresh owned buffer.
    PayloadBytes CopyBytes() const { return Own(std::string(data_ ? data_ : "", size_)); }

    std::string_view AsStringView() const { return std::string_view(data_ ? data_ : "", size_); }
    const char* Data() const { return data_; }
    size_t Size() const { return size_; }
    bool Empty() const { return size_ == 0; }
    bool IsOwned() const { return owned_ != nullptr; }

    bool operator==(const PayloadBytes& other) const { return AsStringView() == other.AsStringView(); }
    bool operator!=(const PayloadBytes& other) const { return !(*this == other); }

private:
    std::shared_ptr<const std::string> owned_;
    const char* data_ = nullptr;
    size_t size_ = 0;
};

} // namespace Statfan
