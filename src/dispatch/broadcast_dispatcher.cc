#include "broadcast_dispatcher.h"

#include <algorithm>
#include <future>
#include <iterator>
#include <glog/logging.h>

namespace Statfan {

BroadcastDispatcher::BroadcastDispatcher(IShardRoutingResolver& resolver, IShardStatsExecutor& executor,
                                         DispatchOptions options)
    : resolver_(resolver), executor_(executor), options_(options) {
    if (options_.max_in_flight < 1) {
        LOG(WARNING) << "max_in_flight " << options_.max_in_flight << " is invalid, using 1";
        options_.max_in_flight = 1;
    }
    if (options_.max_retries < 0) {
        options_.max_retries = 0;
    }
}

IndicesStatsResponse BroadcastDispatcher::Execute(StatsRequest& request) {
    const std::vector<ShardRouting> shards = resolver_.ResolveShards(request);
    VLOG(1) << "Broadcasting " << request.ToString() << " to " << shards.size() << " shards";

    std::vector<ShardStats> successes;
    std::vector<ShardOperationFailure> failures;
    std::vector<ShardRouting> pending = shards;

    for (int attempt = 0; attempt <= options_.max_retries && !pending.empty(); ++attempt) {
        // Shard tasks below read the serialized request concurrently.
        request.BeforeStart();
        const std::string request_bytes = request.ToBytes();

        AttemptResult result = RunAttempt(pending, request_bytes);
        successes.insert(successes.end(), std::make_move_iterator(result.successes.begin()),
                         std::make_move_iterator(result.successes.end()));
        failures = std::move(result.failures);
        pending = std::move(result.failed_shards);

        if (!pending.empty()) {
            LOG(WARNING) << pending.size() << " shards failed on attempt " << attempt + 1 << " of "
                         << options_.max_retries + 1;
        }
    }

    int total = static_cast<int>(shards.size());
    int successful = static_cast<int>(successes.size());
    int failed = static_cast<int>(failures.size());
    VLOG(1) << "Broadcast finished: total=" << total << " successful=" << successful << " failed=" << failed;
    return IndicesStatsResponse(std::move(successes), total, successful, failed, std::move(failures));
}

BroadcastDispatcher::AttemptResult BroadcastDispatcher::RunAttempt(const std::vector<ShardRouting>& shards,
                                                                   const std::string& request_bytes) {
    AttemptResult result;
    const size_t wave = static_cast<size_t>(options_.max_in_flight);

    for (size_t begin = 0; begin < shards.size(); begin += wave) {
        const size_t end = std::min(shards.size(), begin + wave);

        std::vector<std::future<CommonStats>> calls;
        calls.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            const ShardRouting& shard = shards[i];
            calls.push_back(std::async(std::launch::async, [this, &shard, &request_bytes]() {
                return executor_.ExecuteOnShard(shard, request_bytes);
            }));
        }

        for (size_t i = begin; i < end; ++i) {
            const ShardRouting& shard = shards[i];
            ShardOperationFailure failure;
            failure.index = shard.index;
            failure.shard_id = shard.shard_id;
            try {
                result.successes.emplace_back(shard, calls[i - begin].get());
                continue;
            } catch (const ShardOperationException& e) {
                failure.reason = e.what();
                failure.status = e.status();
            } catch (const std::exception& e) {
                failure.reason = e.what();
                failure.status = 500;
            }
            VLOG(1) << "Shard [" << shard.index << "][" << shard.shard_id << "] failed: " << failure.reason;
            result.failed_shards.push_back(shard);
            result.failures.push_back(std::move(failure));
        }
    }
    return result;
}

} // namespace Statfan
