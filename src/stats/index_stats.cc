#include "index_stats.h"

#include <algorithm>
#include <cctype>
#include <limits>

namespace Statfan {

namespace {

int ParseShardId(const std::string& key) {
    if (key.empty() || key.size() > 10 ||
        !std::all_of(key.begin(), key.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw CodecError("shard key [" + key + "] is not a shard number");
    }
    long long id = std::stoll(key);
    if (id > std::numeric_limits<int>::max()) {
        throw CodecError("shard key [" + key + "] out of range");
    }
    return static_cast<int>(id);
}

} // namespace

CommonStats FoldShardStats(const std::vector<ShardStats>& shards, bool primaries_only) {
    CommonStats merged;
    for (const auto& shard : shards) {
        if (primaries_only && !shard.primary()) {
            continue;
        }
        if (const CommonStats* stats = shard.stats()) {
            merged.Add(*stats);
        }
    }
    return merged;
}

const CommonStats& IndexShardStats::Total() const {
    return total_.Get([this]() { return FoldShardStats(shards_, false); });
}

const CommonStats& IndexShardStats::Primary() const {
    return primary_.Get([this]() { return FoldShardStats(shards_, true); });
}

const std::map<int, IndexShardStats>& IndexStats::IndexShards() const {
    return index_shards_.Get([this]() {
        std::map<int, std::vector<ShardStats>> grouped;
        for (const auto& shard : shards_) {
            grouped[shard.shard_id()].push_back(shard);
        }
        std::map<int, IndexShardStats> index_shards;
        for (auto& [shard_id, copies] : grouped) {
            index_shards.emplace(shard_id, IndexShardStats(shard_id, std::move(copies)));
        }
        return index_shards;
    });
}

const CommonStats& IndexStats::Total() const {
    return total_.Get([this]() { return FoldShardStats(shards_, false); });
}

const CommonStats& IndexStats::Primaries() const {
    return primaries_.Get([this]() { return FoldShardStats(shards_, true); });
}

void IndexStats::ToDocument(Document& out, bool include_shards) const {
    Document primaries = NewMapDocument();
    Primaries().ToDocument(primaries);
    out["primaries"] = primaries;

    Document total = NewMapDocument();
    Total().ToDocument(total);
    out["total"] = total;

    if (!include_shards) {
        return;
    }
    Document shards = NewMapDocument();
    for (const auto& [shard_id, index_shard] : IndexShards()) {
        Document copies(YAML::NodeType::Sequence);
        for (const auto& shard : index_shard) {
            copies.push_back(shard.ToDocument());
        }
        shards[std::to_string(shard_id)] = copies;
    }
    out["shards"] = shards;
}

IndexStats IndexStats::FromDocument(const std::string& index, const Document& in) {
    std::vector<ShardStats> records;
    const Document shards = GetObject(in, "shards");
    if (shards.IsMap()) {
        for (const auto& entry : shards) {
            const std::string key = entry.first.as<std::string>();
            int shard_id = ParseShardId(key);
            const Document copies = entry.second;
            if (!copies.IsSequence()) {
                throw CodecError("shards." + key + " of index [" + index + "] must be an array");
            }
            for (const auto& copy : copies) {
                records.push_back(ShardStats::FromDocument(index, shard_id, copy));
            }
        }
    }

    IndexStats stats(index, std::move(records));
    const Document primaries = GetObject(in, "primaries");
    if (primaries.IsMap()) {
        stats.primaries_.Seed(CommonStats::FromDocument(primaries));
    }
    const Document total = GetObject(in, "total");
    if (total.IsMap()) {
        stats.total_.Seed(CommonStats::FromDocument(total));
    }
    return stats;
}

} // namespace Statfan
