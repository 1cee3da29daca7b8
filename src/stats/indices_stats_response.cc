#include "indices_stats_response.h"

#include <algorithm>
#include <cctype>
#include <glog/logging.h>

namespace Statfan {

namespace {

// Each record's binary encoding, sorted; equal records encode identically.
std::vector<std::string> SortedRecordBytes(const std::vector<ShardStats>& shards) {
    std::vector<std::string> encoded;
    encoded.reserve(shards.size());
    for (const ShardStats& shard : shards) {
        StreamOutput out;
        shard.WriteTo(out);
        encoded.push_back(out.Release());
    }
    std::sort(encoded.begin(), encoded.end());
    return encoded;
}

} // namespace

std::optional<StatsLevel> ParseStatsLevel(std::string_view level) {
    std::string lowered(level);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "cluster") {
        return StatsLevel::kCluster;
    }
    if (lowered == "indices") {
        return StatsLevel::kIndices;
    }
    if (lowered == "shards") {
        return StatsLevel::kShards;
    }
    return std::nullopt;
}

const char* StatsLevelName(StatsLevel level) {
    switch (level) {
        case StatsLevel::kCluster: return "cluster";
        case StatsLevel::kIndices: return "indices";
        case StatsLevel::kShards: return "shards";
    }
    return "unknown";
}

IndicesStatsResponse::IndicesStatsResponse(std::vector<ShardStats> shards, int total_shards,
                                           int successful_shards, int failed_shards,
                                           std::vector<ShardOperationFailure> shard_failures)
    : BroadcastResponse(total_shards, successful_shards, failed_shards, std::move(shard_failures)),
      shards_(std::move(shards)) {}

const std::map<std::string, IndexStats>& IndicesStatsResponse::Indices() const {
    return indices_.Get([this]() {
        std::map<std::string, std::vector<ShardStats>> grouped;
        for (const auto& shard : shards_) {
            grouped[shard.index()].push_back(shard);
        }
        std::map<std::string, IndexStats> indices;
        for (auto& [index, records] : grouped) {
            indices.emplace(index, IndexStats(index, std::move(records)));
        }
        VLOG(2) << "Grouped " << shards_.size() << " shard records into " << indices.size() << " indices";
        return indices;
    });
}

const IndexStats* IndicesStatsResponse::Index(const std::string& index) const {
    const auto& indices = Indices();
    auto it = indices.find(index);
    return it == indices.end() ? nullptr : &it->second;
}

const CommonStats& IndicesStatsResponse::Total() const {
    return total_.Get([this]() {
        aggregation_passes_.value.fetch_add(1);
        return FoldShardStats(shards_, false);
    });
}

const CommonStats& IndicesStatsResponse::Primaries() const {
    return primaries_.Get([this]() {
        aggregation_passes_.value.fetch_add(1);
        return FoldShardStats(shards_, true);
    });
}

const absl::flat_hash_map<ShardRouting, CommonStats>& IndicesStatsResponse::AsMap() const {
    return shard_stats_map_.Get([this]() {
        absl::flat_hash_map<ShardRouting, CommonStats> map;
        map.reserve(shards_.size());
        for (const auto& shard : shards_) {
            const CommonStats* stats = shard.stats();
            auto [it, inserted] = map.emplace(shard.routing(), stats ? *stats : CommonStats());
            if (!inserted) {
                VLOG(1) << "Duplicate record for [" << shard.index() << "][" << shard.shard_id()
                        << "], keeping the first";
            }
        }
        return map;
    });
}

void IndicesStatsResponse::WriteTo(StreamOutput& out) const {
    WriteHeaderTo(out);
    out.WriteVInt(static_cast<uint32_t>(shards_.size()));
    for (const auto& shard : shards_) {
        shard.WriteTo(out);
    }
}

IndicesStatsResponse IndicesStatsResponse::ReadFrom(StreamInput& in) {
    IndicesStatsResponse response;
    response.ReadHeaderFrom(in);
    size_t count = in.ReadCollectionSize();
    response.shards_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        response.shards_.push_back(ShardStats::ReadFrom(in));
    }
    return response;
}

bool IndicesStatsResponse::operator==(const IndicesStatsResponse& other) const {
    if (!HeaderEquals(other) || shards_.size() != other.shards_.size()) {
        return false;
    }
    return shards_ == other.shards_ || SortedRecordBytes(shards_) == SortedRecordBytes(other.shards_);
}

std::string IndicesStatsResponse::ToBytes() const {
    StreamOutput out;
    WriteTo(out);
    return out.Release();
}

IndicesStatsResponse IndicesStatsResponse::FromBytes(std::string_view bytes, StreamLimits limits) {
    StreamInput in(bytes, limits);
    IndicesStatsResponse response = ReadFrom(in);
    in.ExpectEnd();
    return response;
}

bool IndicesStatsResponse::Render(Document& out, std::string_view level_name) const {
    std::optional<StatsLevel> level = ParseStatsLevel(level_name);
    if (!level) {
        VLOG(1) << "Ignoring unknown stats level [" << level_name << "]";
        return false;
    }

    BuildShardsHeader(out);

    Document all = NewMapDocument();
    Document primaries = NewMapDocument();
    Primaries().ToDocument(primaries);
    all["primaries"] = primaries;
    Document total = NewMapDocument();
    Total().ToDocument(total);
    all["total"] = total;
    out["_all"] = all;

    if (*level == StatsLevel::kCluster) {
        return true;
    }

    Document indices = NewMapDocument();
    for (const auto& [index, index_stats] : Indices()) {
        Document entry = NewMapDocument();
        index_stats.ToDocument(entry, *level == StatsLevel::kShards);
        indices[index] = entry;
    }
    out["indices"] = indices;
    return true;
}

Document IndicesStatsResponse::ToDocument(std::string_view level) const {
    Document out = NewMapDocument();
    Render(out, level);
    return out;
}

IndicesStatsResponse IndicesStatsResponse::FromDocument(const Document& in) {
    IndicesStatsResponse response;
    response.ReadShardsHeader(in);

    const Document all = GetObject(in, "_all");
    const Document primaries = GetObject(all, "primaries");
    if (primaries.IsMap()) {
        response.primaries_.Seed(CommonStats::FromDocument(primaries));
    }
    const Document total = GetObject(all, "total");
    if (total.IsMap()) {
        response.total_.Seed(CommonStats::FromDocument(total));
    }

    const Document indices = GetObject(in, "indices");
    if (indices.IsMap()) {
        std::map<std::string, IndexStats> by_index;
        for (const auto& entry : indices) {
            const std::string index = entry.first.as<std::string>();
            if (!entry.second.IsMap()) {
                throw CodecError("indices." + index + " must be an object");
            }
            IndexStats index_stats = IndexStats::FromDocument(index, entry.second);
            response.shards_.insert(response.shards_.end(), index_stats.shards().begin(),
                                    index_stats.shards().end());
            by_index.emplace(index, std::move(index_stats));
        }
        response.indices_.Seed(std::move(by_index));
    }
    return response;
}

std::string IndicesStatsResponse::ToString() const {
    try {
        return EmitDocument(ToDocument(StatsLevelName(StatsLevel::kIndices)), DocumentFormat::kFlow);
    } catch (const CodecError& e) {
        return std::string("{ error: \"") + e.what() + "\" }";
    }
}

} // namespace Statfan
