#include "shard_stats.h"

#include <limits>

namespace Statfan {

void ShardRouting::WriteTo(StreamOutput& out) const {
    out.WriteString(index);
    out.WriteVInt(static_cast<uint32_t>(shard_id));
    out.WriteBool(primary);
    out.WriteOptionalString(node_id);
}

ShardRouting ShardRouting::ReadFrom(StreamInput& in) {
    ShardRouting routing;
    routing.index = in.ReadString();
    uint32_t shard_id = in.ReadVInt();
    if (shard_id > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
        throw CodecError("shard id " + std::to_string(shard_id) + " out of range");
    }
    routing.shard_id = static_cast<int>(shard_id);
    routing.primary = in.ReadBool();
    routing.node_id = in.ReadOptionalString();
    return routing;
}

void ShardStats::WriteTo(StreamOutput& out) const {
    routing_.WriteTo(out);
    out.WriteBool(stats_.has_value());
    if (stats_) {
        stats_->WriteTo(out);
    }
}

ShardStats ShardStats::ReadFrom(StreamInput& in) {
    ShardRouting routing = ShardRouting::ReadFrom(in);
    std::optional<CommonStats> stats;
    if (in.ReadBool()) {
        stats = CommonStats::ReadFrom(in);
    }
    return ShardStats(std::move(routing), std::move(stats));
}

Document ShardStats::ToDocument() const {
    Document entry = NewMapDocument();
    Document routing = NewMapDocument();
    routing["primary"] = routing_.primary;
    if (routing_.node_id) {
        routing["node"] = *routing_.node_id;
    }
    entry["routing"] = routing;
    if (stats_) {
        stats_->ToDocument(entry);
    } else {
        entry["stats_unavailable"] = true;
    }
    return entry;
}

ShardStats ShardStats::FromDocument(const std::string& index, int shard_id, const Document& in) {
    ShardRouting routing;
    routing.index = index;
    routing.shard_id = shard_id;
    const Document routing_node = GetObject(in, "routing");
    routing.primary = GetBool(routing_node, "primary");
    routing.node_id = GetOptionalString(routing_node, "node");

    // Stats that are present but empty stay present.
    std::optional<CommonStats> stats;
    if (!GetBool(in, "stats_unavailable")) {
        stats = CommonStats::FromDocument(in);
    }
    return ShardStats(std::move(routing), std::move(stats));
}

} // namespace Statfan
