#pragma once

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/synchronization/mutex.h"

#include "../common/document.h"
#include "../common/stream.h"
#include "interfaces.h"

namespace Statfan {

// Raised when a request names an index the cluster does not hold and the
// request's indices options do not allow skipping it.
class IndexNotFoundError : public std::runtime_error {
public:
    explicit IndexNotFoundError(const std::string& index)
        : std::runtime_error("no such index [" + index + "]"), index_(index) {}

    const std::string& index() const { return index_; }

private:
    std::string index_;
};

/**
 * A cluster described by a YAML document, acting as both shard resolver and
 * shard executor. Used by the CLI and by tests.
 *
 *   indices:
 *     logs:
 *       shards:
 *         - {id: 0, primary: true, node: n1, stats: {docs: {count: 10}}}
 *         - {id: 0, primary: false, node: n2, fail: true, status: 503,
 *            reason: "node left", fail_attempts: 1}
 *
 * A shard with fail: true throws on each of its first fail_attempts calls
 * (every call when fail_attempts is absent).
 */
class FixtureCluster : public IShardRoutingResolver, public IShardStatsExecutor {
public:
    // Throws CodecError on a malformed fixture.
    explicit FixtureCluster(const Document& fixture, StreamLimits limits = StreamLimits{});

    static std::unique_ptr<FixtureCluster> FromString(const std::string& yaml,
                                                      StreamLimits limits = StreamLimits{});
    static std::unique_ptr<FixtureCluster> FromFile(const std::string& path,
                                                    StreamLimits limits = StreamLimits{});

    std::vector<ShardRouting> ResolveShards(const StatsRequest& request) override;
    CommonStats ExecuteOnShard(const ShardRouting& shard, const std::string& request_bytes) override;

    std::vector<std::string> IndexNames() const;
    // Number of ExecuteOnShard calls that reached |shard|.
    int CallCount(const ShardRouting& shard) const;

private:
    struct FixtureShard {
        ShardRouting routing;
        std::optional<CommonStats> stats;
        bool fail = false;
        int fail_attempts = -1;  // -1: every attempt
        int fail_status = 500;
        std::string fail_reason;
    };

    const FixtureShard* Find(const ShardRouting& shard) const;

    std::vector<std::string> index_order_;
    std::vector<FixtureShard> shards_;
    StreamLimits limits_;

    mutable absl::Mutex mu_;
    absl::flat_hash_map<ShardRouting, int> calls_ ABSL_GUARDED_BY(mu_);
};

} // namespace Statfan
