#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "../stats/shard_stats.h"

namespace Statfan {

class StatsRequest;

/**
 * Failure raised by a shard executor. The status travels into the
 * response's failure record.
 */
class ShardOperationException : public std::runtime_error {
public:
    ShardOperationException(const std::string& what, int status = 500)
        : std::runtime_error(what), status_(status) {}

    int status() const { return status_; }

private:
    int status_;
};

/**
 * Interface for shard routing: turns a request's indices, routing and
 * preference into the concrete shard copies to query.
 */
class IShardRoutingResolver {
public:
    virtual ~IShardRoutingResolver() = default;

    virtual std::vector<ShardRouting> ResolveShards(const StatsRequest& request) = 0;
};

/**
 * Interface for per-shard execution. Receives the request in binary form,
 * exactly as a remote node would, and returns that shard's stats or throws.
 * Called concurrently for different shards.
 */
class IShardStatsExecutor {
public:
    virtual ~IShardStatsExecutor() = default;

    virtual CommonStats ExecuteOnShard(const ShardRouting& shard, const std::string& request_bytes) = 0;
};

} // namespace Statfan
