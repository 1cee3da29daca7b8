#pragma once

#include <map>
#include <string>
#include <vector>

#include "../common/lazy_value.h"
#include "shard_stats.h"

namespace Statfan {

/**
 * Merges the stats of |shards| into a fresh value. Records without stats
 * contribute nothing. The inputs are never modified.
 */
CommonStats FoldShardStats(const std::vector<ShardStats>& shards, bool primaries_only);

/**
 * All responding copies (primary and replicas) of one shard number.
 */
class IndexShardStats {
public:
    IndexShardStats(int shard_id, std::vector<ShardStats> shards)
        : shard_id_(shard_id), shards_(std::move(shards)) {}

    int shard_id() const { return shard_id_; }
    const std::vector<ShardStats>& shards() const { return shards_; }
    const ShardStats& At(size_t position) const { return shards_.at(position); }

    std::vector<ShardStats>::const_iterator begin() const { return shards_.begin(); }
    std::vector<ShardStats>::const_iterator end() const { return shards_.end(); }

    const CommonStats& Total() const;
    const CommonStats& Primary() const;

private:
    int shard_id_;
    std::vector<ShardStats> shards_;
    LazyValue<CommonStats> total_;
    LazyValue<CommonStats> primary_;
};

/**
 * The records of one index with their own memoized rollups.
 */
class IndexStats {
public:
    IndexStats(std::string index, std::vector<ShardStats> shards)
        : index_(std::move(index)), shards_(std::move(shards)) {}

    const std::string& index() const { return index_; }
    const std::vector<ShardStats>& shards() const { return shards_; }

    // Shard number -> copies of that shard, ascending by shard number.
    const std::map<int, IndexShardStats>& IndexShards() const;

    const CommonStats& Total() const;
    const CommonStats& Primaries() const;

    /**
     * Writes "primaries" and "total" into |out| and, when |include_shards| is
     * set, a "shards" object keyed by shard number whose values are arrays
     * with one entry per responding copy.
     */
    void ToDocument(Document& out, bool include_shards) const;

    /**
     * Rebuilds an index entry from its document. Rendered rollups seed the
     * caches directly, so an entry rendered without shards still reports the
     * primaries and total it was rendered with.
     */
    static IndexStats FromDocument(const std::string& index, const Document& in);

private:
    std::string index_;
    std::vector<ShardStats> shards_;
    LazyValue<std::map<int, IndexShardStats>> index_shards_;
    LazyValue<CommonStats> total_;
    LazyValue<CommonStats> primaries_;
};

} // namespace Statfan
