#include "fixture_cluster.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <glog/logging.h>

#include "../broadcast/stats_request.h"

namespace Statfan {

namespace {

struct CopyFilter {
    bool primaries_only = false;
    bool replicas_only = false;
    std::vector<int> shard_ids;  // empty: every shard
};

std::vector<std::string> Split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::stringstream stream(text);
    std::string part;
    while (std::getline(stream, part, delimiter)) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// "_primary", "_replica" and "_shards:0,2" may be combined with ';'.
CopyFilter ParsePreference(const std::optional<std::string>& preference) {
    CopyFilter filter;
    if (!preference) {
        return filter;
    }
    static const std::string kShardsPrefix = "_shards:";
    for (const std::string& token : Split(*preference, ';')) {
        if (token == "_primary") {
            filter.primaries_only = true;
        } else if (token == "_replica") {
            filter.replicas_only = true;
        } else if (token.compare(0, kShardsPrefix.size(), kShardsPrefix) == 0) {
            for (const std::string& id : Split(token.substr(kShardsPrefix.size()), ',')) {
                try {
                    filter.shard_ids.push_back(std::stoi(id));
                } catch (const std::exception&) {
                    throw CodecError("invalid shard id [" + id + "] in preference");
                }
            }
        } else {
            VLOG(1) << "Ignoring preference [" << token << "]";
        }
    }
    return filter;
}

bool Accepts(const CopyFilter& filter, const ShardRouting& routing) {
    if (filter.primaries_only && !routing.primary) return false;
    if (filter.replicas_only && routing.primary) return false;
    if (!filter.shard_ids.empty() &&
        std::find(filter.shard_ids.begin(), filter.shard_ids.end(), routing.shard_id) == filter.shard_ids.end()) {
        return false;
    }
    return true;
}

bool IsAll(const std::vector<std::string>& indices) {
    return indices.empty() || (indices.size() == 1 && (indices[0] == "_all" || indices[0] == "*"));
}

} // namespace

FixtureCluster::FixtureCluster(const Document& fixture, StreamLimits limits) : limits_(limits) {
    const Document indices = GetObject(fixture, "indices");
    if (!indices.IsMap()) {
        throw CodecError("cluster fixture needs an [indices] object");
    }
    for (const auto& entry : indices) {
        const std::string index = entry.first.as<std::string>();
        index_order_.push_back(index);

        if (entry.second.IsNull()) {
            continue;
        }
        if (!entry.second.IsMap()) {
            throw CodecError("index [" + index + "] must be an object");
        }
        const Document shards = entry.second["shards"];
        if (!shards || shards.IsNull()) {
            continue;
        }
        if (!shards.IsSequence()) {
            throw CodecError("shards of index [" + index + "] must be a list");
        }
        for (const auto& node : shards) {
            if (!node.IsMap() || !node["id"]) {
                throw CodecError("every shard of index [" + index + "] needs an id");
            }
            FixtureShard shard;
            shard.routing.index = index;
            shard.routing.shard_id = static_cast<int>(ScalarAsInt64(node["id"], "id"));
            shard.routing.primary = GetBool(node, "primary");
            shard.routing.node_id = GetOptionalString(node, "node");

            const Document stats = GetObject(node, "stats");
            if (stats.IsMap()) {
                shard.stats = CommonStats::FromDocument(stats);
            }
            shard.fail = GetBool(node, "fail");
            shard.fail_attempts = static_cast<int>(GetInt64(node, "fail_attempts", -1));
            shard.fail_status = static_cast<int>(GetInt64(node, "status", 500));
            shard.fail_reason = GetOptionalString(node, "reason").value_or("shard failure");
            shards_.push_back(std::move(shard));
        }
    }
    LOG(INFO) << "Loaded cluster fixture with " << index_order_.size() << " indices and " << shards_.size()
              << " shard copies";
}

std::unique_ptr<FixtureCluster> FixtureCluster::FromString(const std::string& yaml, StreamLimits limits) {
    return std::make_unique<FixtureCluster>(ParseDocument(yaml), limits);
}

std::unique_ptr<FixtureCluster> FixtureCluster::FromFile(const std::string& path, StreamLimits limits) {
    std::ifstream file(path);
    if (!file) {
        throw CodecError("cannot open cluster fixture " + path);
    }
    std::stringstream contents;
    contents << file.rdbuf();
    return FromString(contents.str(), limits);
}

std::vector<ShardRouting> FixtureCluster::ResolveShards(const StatsRequest& request) {
    const IndicesOptions& options = request.indices_options();

    std::vector<std::string> targets;
    auto add_target = [&targets](const std::string& index) {
        if (std::find(targets.begin(), targets.end(), index) == targets.end()) {
            targets.push_back(index);
        }
    };

    if (IsAll(request.indices())) {
        targets = index_order_;
    } else {
        for (const std::string& name : request.indices()) {
            if (!name.empty() && name.back() == '*') {
                if (!options.expand_wildcards_open()) {
                    VLOG(1) << "Wildcard [" << name << "] not expanded";
                    continue;
                }
                const std::string prefix = name.substr(0, name.size() - 1);
                bool matched = false;
                for (const std::string& index : index_order_) {
                    if (index.compare(0, prefix.size(), prefix) == 0) {
                        add_target(index);
                        matched = true;
                    }
                }
                if (!matched && !options.allow_no_indices()) {
                    throw IndexNotFoundError(name);
                }
                continue;
            }
            if (std::find(index_order_.begin(), index_order_.end(), name) == index_order_.end()) {
                if (options.ignore_unavailable()) {
                    VLOG(1) << "Skipping unavailable index [" << name << "]";
                    continue;
                }
                throw IndexNotFoundError(name);
            }
            add_target(name);
        }
    }

    if (request.routing()) {
        VLOG(1) << "Routing [" << *request.routing() << "] does not narrow stats requests";
    }
    const CopyFilter filter = ParsePreference(request.preference());

    std::vector<ShardRouting> resolved;
    for (const std::string& index : targets) {
        for (const FixtureShard& shard : shards_) {
            if (shard.routing.index == index && Accepts(filter, shard.routing)) {
                resolved.push_back(shard.routing);
            }
        }
    }
    VLOG(1) << "Resolved " << resolved.size() << " shard copies over " << targets.size() << " indices";
    return resolved;
}

CommonStats FixtureCluster::ExecuteOnShard(const ShardRouting& shard, const std::string& request_bytes) {
    // Decode exactly as a remote node would; a corrupt request fails the shard.
    const StatsRequest request = StatsRequest::FromBytes(request_bytes, limits_);
    VLOG(2) << "Shard [" << shard.index << "][" << shard.shard_id << "] executing " << request.ToString();

    int call_number;
    {
        absl::MutexLock lock(&mu_);
        call_number = ++calls_[shard];
    }

    const FixtureShard* fixture = Find(shard);
    if (fixture == nullptr) {
        throw ShardOperationException("no such shard copy", 404);
    }
    if (fixture->fail && (fixture->fail_attempts < 0 || call_number <= fixture->fail_attempts)) {
        throw ShardOperationException(fixture->fail_reason, fixture->fail_status);
    }
    return fixture->stats.value_or(CommonStats{});
}

std::vector<std::string> FixtureCluster::IndexNames() const {
    return index_order_;
}

int FixtureCluster::CallCount(const ShardRouting& shard) const {
    absl::MutexLock lock(&mu_);
    auto it = calls_.find(shard);
    return it == calls_.end() ? 0 : it->second;
}

const FixtureCluster::FixtureShard* FixtureCluster::Find(const ShardRouting& shard) const {
    for (const FixtureShard& candidate : shards_) {
        if (candidate.routing == shard) {
            return &candidate;
        }
    }
    return nullptr;
}

} // namespace Statfan
