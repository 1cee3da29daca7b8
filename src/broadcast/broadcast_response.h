#ifndef STATFAN_BROADCAST_BROADCAST_RESPONSE_H_
#define STATFAN_BROADCAST_BROADCAST_RESPONSE_H_

#include <optional>
#include <string>
#include <vector>

#include "../common/document.h"
#include "../common/stream.h"

namespace Statfan {

/**
 * Why one shard did not answer. Kept next to the successful records;
 * a failed shard is data in the response, never an exception.
 */
struct ShardOperationFailure {
    std::optional<std::string> index;
    int shard_id = -1;
    std::string reason;
    int status = 500;

    void WriteTo(StreamOutput& out) const;
    static ShardOperationFailure ReadFrom(StreamInput& in);

    Document ToDocument() const;
    static ShardOperationFailure FromDocument(const Document& in);

    bool operator==(const ShardOperationFailure& other) const {
        return index == other.index && shard_id == other.shard_id &&
               reason == other.reason && status == other.status;
    }
};

/**
 * Shard accounting shared by every broadcast response: how many shards were
 * targeted, how many answered, and why the others did not.
 */
class BroadcastResponse {
public:
    BroadcastResponse() = default;
    BroadcastResponse(int total_shards, int successful_shards, int failed_shards,
                      std::vector<ShardOperationFailure> shard_failures)
        : total_shards_(total_shards),
          successful_shards_(successful_shards),
          failed_shards_(failed_shards),
          shard_failures_(std::move(shard_failures)) {}

    int total_shards() const { return total_shards_; }
    int successful_shards() const { return successful_shards_; }
    int failed_shards() const { return failed_shards_; }
    const std::vector<ShardOperationFailure>& shard_failures() const { return shard_failures_; }

protected:
    void WriteHeaderTo(StreamOutput& out) const;
    void ReadHeaderFrom(StreamInput& in);

    // Emits the "_shards" object; "failures" only when there are any.
    void BuildShardsHeader(Document& out) const;
    void ReadShardsHeader(const Document& in);

    bool HeaderEquals(const BroadcastResponse& other) const {
        return total_shards_ == other.total_shards_ &&
               successful_shards_ == other.successful_shards_ &&
               failed_shards_ == other.failed_shards_ &&
               shard_failures_ == other.shard_failures_;
    }

private:
    int total_shards_ = 0;
    int successful_shards_ = 0;
    int failed_shards_ = 0;
    std::vector<ShardOperationFailure> shard_failures_;
};

} // namespace Statfan

#endif // STATFAN_BROADCAST_BROADCAST_RESPONSE_H_
