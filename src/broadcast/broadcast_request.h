#ifndef STATFAN_BROADCAST_BROADCAST_REQUEST_H_
#define STATFAN_BROADCAST_BROADCAST_REQUEST_H_

#include <cstdint>
#include <string>
#include <vector>

#include "../common/document.h"
#include "../common/stream.h"

namespace Statfan {

/**
 * How index names are resolved against the cluster. Travels as one byte.
 */
class IndicesOptions {
public:
    static constexpr uint8_t kIgnoreUnavailable = 1;
    static constexpr uint8_t kAllowNoIndices = 2;
    static constexpr uint8_t kExpandWildcardsOpen = 4;
    static constexpr uint8_t kExpandWildcardsClosed = 8;

    IndicesOptions() = default;
    explicit IndicesOptions(uint8_t flags) : flags_(flags) {}

    static IndicesOptions StrictExpandOpen() { return IndicesOptions(kAllowNoIndices | kExpandWildcardsOpen); }
    static IndicesOptions LenientExpandOpen() {
        return IndicesOptions(kIgnoreUnavailable | kAllowNoIndices | kExpandWildcardsOpen);
    }

    bool ignore_unavailable() const { return flags_ & kIgnoreUnavailable; }
    bool allow_no_indices() const { return flags_ & kAllowNoIndices; }
    bool expand_wildcards_open() const { return flags_ & kExpandWildcardsOpen; }
    bool expand_wildcards_closed() const { return flags_ & kExpandWildcardsClosed; }
    uint8_t flags() const { return flags_; }

    void WriteTo(StreamOutput& out) const { out.WriteByte(flags_); }
    static IndicesOptions ReadFrom(StreamInput& in);

    bool operator==(const IndicesOptions& other) const { return flags_ == other.flags_; }
    bool operator!=(const IndicesOptions& other) const { return flags_ != other.flags_; }

private:
    uint8_t flags_ = kAllowNoIndices | kExpandWildcardsOpen;
};

/**
 * Base of every request that is fanned out to the shards of a set of
 * indices. No indices means all indices.
 *
 * BeforeStart() is the hook the dispatcher runs on the owning thread before
 * each attempt hands the request to shard tasks.
 */
class BroadcastRequest {
public:
    BroadcastRequest() = default;
    explicit BroadcastRequest(std::vector<std::string> indices) : indices_(std::move(indices)) {}
    virtual ~BroadcastRequest() = default;

    const std::vector<std::string>& indices() const { return indices_; }
    BroadcastRequest& SetIndices(std::vector<std::string> indices) {
        indices_ = std::move(indices);
        return *this;
    }

    const IndicesOptions& indices_options() const { return indices_options_; }
    BroadcastRequest& SetIndicesOptions(IndicesOptions options) {
        indices_options_ = options;
        return *this;
    }

    virtual void BeforeStart() {}

    virtual void WriteTo(StreamOutput& out) const;
    virtual void ReadFrom(StreamInput& in);

    virtual void ToDocument(Document& out) const;
    virtual void FromDocument(const Document& in);

protected:
    std::vector<std::string> indices_;
    IndicesOptions indices_options_;
};

} // namespace Statfan

#endif // STATFAN_BROADCAST_BROADCAST_REQUEST_H_
