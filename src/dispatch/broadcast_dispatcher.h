#pragma once

#include <string>
#include <vector>

#include "../broadcast/stats_request.h"
#include "../common/configuration.h"
#include "../stats/indices_stats_response.h"
#include "interfaces.h"

namespace Statfan {

struct DispatchOptions {
    int max_retries = 1;
    int max_in_flight = 16;

    static DispatchOptions FromConfig(const Configuration& config) {
        DispatchOptions options;
        options.max_retries = config.getMaxRetries();
        options.max_in_flight = config.getMaxInFlight();
        return options;
    }
};

/**
 * In-process broadcast of a stats request.
 *
 * Resolves the target shards, then runs attempts: each attempt prepares the
 * request for dispatch on the calling thread, serializes it once and hands
 * the same bytes to every pending shard in waves of at most max_in_flight
 * concurrent calls. Shards that fail are retried up to max_retries times;
 * whatever still fails is reported as a ShardOperationFailure. The response
 * is built only after every call of the last attempt has returned.
 */
class BroadcastDispatcher {
public:
    BroadcastDispatcher(IShardRoutingResolver& resolver, IShardStatsExecutor& executor,
                        DispatchOptions options = DispatchOptions{});

    IndicesStatsResponse Execute(StatsRequest& request);

private:
    struct AttemptResult {
        std::vector<ShardStats> successes;
        std::vector<ShardRouting> failed_shards;
        std::vector<ShardOperationFailure> failures;
    };

    AttemptResult RunAttempt(const std::vector<ShardRouting>& shards, const std::string& request_bytes);

    IShardRoutingResolver& resolver_;
    IShardStatsExecutor& executor_;
    DispatchOptions options_;
};

} // namespace Statfan
