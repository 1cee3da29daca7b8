#ifndef STATFAN_STATS_INDICES_STATS_RESPONSE_H_
#define STATFAN_STATS_INDICES_STATS_RESPONSE_H_

#include <atomic>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "absl/container/flat_hash_map.h"

#include "../broadcast/broadcast_response.h"
#include "../common/lazy_value.h"
#include "index_stats.h"

namespace Statfan {

// How much of the response the document form exposes.
enum class StatsLevel {
    kCluster,  // "_all" only
    kIndices,  // plus one summary per index
    kShards    // plus every shard copy under its index
};

// Case-insensitive; anything but cluster/indices/shards yields nullopt.
std::optional<StatsLevel> ParseStatsLevel(std::string_view level);
const char* StatsLevelName(StatsLevel level);

/**
 * Collected answer of a broadcast stats operation.
 *
 * Holds the per-shard records of every shard copy that answered plus the
 * shard accounting inherited from BroadcastResponse. Index grouping and the
 * cluster rollups are computed on first access and cached for the lifetime
 * of the object; records are never added after construction.
 */
class IndicesStatsResponse : public BroadcastResponse {
public:
    IndicesStatsResponse() = default;
    IndicesStatsResponse(std::vector<ShardStats> shards, int total_shards, int successful_shards,
                         int failed_shards, std::vector<ShardOperationFailure> shard_failures);

    const std::vector<ShardStats>& Shards() const { return shards_; }
    const ShardStats& At(size_t position) const { return shards_.at(position); }

    // Index name -> records of that index, sorted by index name.
    const std::map<std::string, IndexStats>& Indices() const;
    // nullptr when no record belongs to |index|.
    const IndexStats* Index(const std::string& index) const;

    const CommonStats& Total() const;
    const CommonStats& Primaries() const;

    // Shard copy -> its stats (empty stats for records that had none).
    const absl::flat_hash_map<ShardRouting, CommonStats>& AsMap() const;

    // How many times a cluster-level rollup actually walked the records.
    int AggregationPasses() const { return aggregation_passes_.value.load(); }

    // Binary form: shard header, then every record. Never level gated.
    void WriteTo(StreamOutput& out) const;
    static IndicesStatsResponse ReadFrom(StreamInput& in);
    std::string ToBytes() const;
    // Rejects truncated input and trailing bytes.
    static IndicesStatsResponse FromBytes(std::string_view bytes, StreamLimits limits = StreamLimits{});

    /**
     * Renders the document form into |out| at |level|. An unrecognised level
     * leaves |out| untouched and returns false; it is not an error.
     */
    bool Render(Document& out, std::string_view level) const;
    Document ToDocument(std::string_view level) const;
    static IndicesStatsResponse FromDocument(const Document& in);

    std::string ToString() const;

    // Record order is not compared: the document form regroups records by index and shard.
    bool operator==(const IndicesStatsResponse& other) const;
    bool operator!=(const IndicesStatsResponse& other) const { return !(*this == other); }

private:
    struct PassCounter {
        PassCounter() = default;
        PassCounter(const PassCounter& other) : value(other.value.load()) {}
        std::atomic<int> value{0};
    };

    std::vector<ShardStats> shards_;

    LazyValue<std::map<std::string, IndexStats>> indices_;
    LazyValue<CommonStats> total_;
    LazyValue<CommonStats> primaries_;
    LazyValue<absl::flat_hash_map<ShardRouting, CommonStats>> shard_stats_map_;
    mutable PassCounter aggregation_passes_;
};

} // namespace Statfan

#endif // STATFAN_STATS_INDICES_STATS_RESPONSE_H_
