#pragma once

#include <optional>
#include <utility>
#include "absl/base/call_once.h"

namespace Statfan {

/**
 * Compute-once cache. The first Get() runs the supplier under
 * absl::call_once; concurrent readers block until the value is published
 * and every later call returns the same object.
 *
 * Seed() pre-populates the value and is only legal before the first Get(),
 * while the owner is still being constructed (document decoding does this).
 */
template<typename T>
class LazyValue {
public:
    LazyValue() = default;
    LazyValue(const LazyValue& other) : value_(other.value_) {}
    LazyValue(LazyValue&& other) noexcept : value_(std::move(other.value_)) {}
    LazyValue& operator=(const LazyValue&) = delete;
    LazyValue& operator=(LazyValue&&) = delete;

    template<typename Supplier>
    const T& Get(Supplier&& supplier) const {
        absl::call_once(once_, [this, &supplier]() {
            if (!value_) {
                value_.emplace(supplier());
            }
        });
        return *value_;
    }

    void Seed(T value) { value_.emplace(std::move(value)); }
    bool has_value() const { return value_.has_value(); }

private:
    mutable absl::once_flag once_;
    mutable std::optional<T> value_;
};

} // namespace Statfan
