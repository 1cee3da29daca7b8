#pragma once

#include <optional>
#include <string>
#include <utility>

#include "common_stats.h"

namespace Statfan {

/**
 * Identity of one shard copy: which index, which shard number, whether it is
 * the primary copy and (when known) the node holding it.
 */
struct ShardRouting {
    std::string index;
    int shard_id = 0;
    bool primary = false;
    std::optional<std::string> node_id;

    void WriteTo(StreamOutput& out) const;
    static ShardRouting ReadFrom(StreamInput& in);

    bool operator==(const ShardRouting& other) const {
        return index == other.index && shard_id == other.shard_id &&
               primary == other.primary && node_id == other.node_id;
    }
    bool operator!=(const ShardRouting& other) const { return !(*this == other); }

    template<typename H>
    friend H AbslHashValue(H h, const ShardRouting& routing) {
        return H::combine(std::move(h), routing.index, routing.shard_id, routing.primary,
                          routing.node_id.value_or(""));
    }
};

/**
 * Result record of one responding shard copy. Immutable once built.
 * A record may lack stats; aggregation then treats it as the empty merge.
 */
class ShardStats {
public:
    ShardStats() = default;
    ShardStats(ShardRouting routing, std::optional<CommonStats> stats)
        : routing_(std::move(routing)), stats_(std::move(stats)) {}

    const ShardRouting& routing() const { return routing_; }
    const std::string& index() const { return routing_.index; }
    int shard_id() const { return routing_.shard_id; }
    bool primary() const { return routing_.primary; }

    bool has_stats() const { return stats_.has_value(); }
    // nullptr when the shard returned no stats.
    const CommonStats* stats() const { return stats_ ? &*stats_ : nullptr; }

    void WriteTo(StreamOutput& out) const;
    static ShardStats ReadFrom(StreamInput& in);

    // Appends the per-copy entry rendered under "shards.<id>": a routing
    // object followed by the raw stats sections, or by
    // "stats_unavailable: true" for a copy without stats.
    Document ToDocument() const;
    static ShardStats FromDocument(const std::string& index, int shard_id, const Document& in);

    bool operator==(const ShardStats& other) const {
        return routing_ == other.routing_ && stats_ == other.stats_;
    }
    bool operator!=(const ShardStats& other) const { return !(*this == other); }

private:
    ShardRouting routing_;
    std::optional<CommonStats> stats_;
};

} // namespace Statfan
