#include <gtest/gtest.h>
#include "../../src/stats/indices_stats_response.h"

#include <thread>
#include <vector>

using namespace Statfan;

namespace {

ShardRouting Routing(const std::string& index, int shard_id, bool primary, const std::string& node) {
    ShardRouting routing;
    routing.index = index;
    routing.shard_id = shard_id;
    routing.primary = primary;
    routing.node_id = node;
    return routing;
}

CommonStats Docs(int64_t count) {
    CommonStats stats;
    stats.docs.emplace();
    stats.docs->count = count;
    return stats;
}

ShardOperationFailure Failure(const std::string& index, int shard_id, const std::string& reason, int status) {
    ShardOperationFailure failure;
    failure.index = index;
    failure.shard_id = shard_id;
    failure.reason = reason;
    failure.status = status;
    return failure;
}

} // namespace

/**
 * Five targeted shards: three answered, two failed.
 *   logs[0]    primary  docs 10
 *   logs[0]    replica  docs 10
 *   metrics[0] primary  docs 5, store 100
 */
class IndicesStatsResponseTest : public ::testing::Test {
protected:
    IndicesStatsResponseTest() : response_(Build()) {}

    static IndicesStatsResponse Build() {
        CommonStats metrics = Docs(5);
        metrics.store.emplace();
        metrics.store->size_in_bytes = 100;

        std::vector<ShardStats> shards;
        shards.emplace_back(Routing("logs", 0, true, "node-1"), Docs(10));
        shards.emplace_back(Routing("logs", 0, false, "node-2"), Docs(10));
        shards.emplace_back(Routing("metrics", 0, true, "node-1"), metrics);

        std::vector<ShardOperationFailure> failures;
        failures.push_back(Failure("logs", 1, "node disconnected", 503));
        failures.push_back(Failure("metrics", 1, "shard closed", 500));
        return IndicesStatsResponse(std::move(shards), 5, 3, 2, std::move(failures));
    }

    IndicesStatsResponse response_;
};

TEST_F(IndicesStatsResponseTest, TotalAndPrimaries) {
    ASSERT_TRUE(response_.Total().docs.has_value());
    EXPECT_EQ(response_.Total().docs->count, 25);
    EXPECT_EQ(response_.Primaries().docs->count, 15);
    EXPECT_EQ(response_.Total().store->size_in_bytes, 100);
    EXPECT_EQ(response_.Primaries().store->size_in_bytes, 100);
}

TEST_F(IndicesStatsResponseTest, RollupsAreComputedOnce) {
    EXPECT_EQ(response_.AggregationPasses(), 0);
    const CommonStats* first = &response_.Total();
    const CommonStats* second = &response_.Total();
    EXPECT_EQ(first, second);
    EXPECT_EQ(response_.AggregationPasses(), 1);

    response_.Primaries();
    response_.Primaries();
    EXPECT_EQ(response_.AggregationPasses(), 2);
}

TEST_F(IndicesStatsResponseTest, ConcurrentReadersShareOneRollup) {
    std::vector<const CommonStats*> seen(8, nullptr);
    std::vector<std::thread> readers;
    for (size_t i = 0; i < seen.size(); ++i) {
        readers.emplace_back([this, &seen, i]() { seen[i] = &response_.Total(); });
    }
    for (auto& reader : readers) {
        reader.join();
    }
    for (const CommonStats* stats : seen) {
        EXPECT_EQ(stats, seen[0]);
    }
    EXPECT_EQ(response_.AggregationPasses(), 1);
}

TEST_F(IndicesStatsResponseTest, IndicesGroupsRecordsByName) {
    const auto& indices = response_.Indices();
    ASSERT_EQ(indices.size(), 2u);
    EXPECT_EQ(&indices, &response_.Indices());

    const IndexStats* logs = response_.Index("logs");
    ASSERT_NE(logs, nullptr);
    EXPECT_EQ(logs->shards().size(), 2u);
    EXPECT_EQ(logs->Total().docs->count, 20);
    EXPECT_EQ(logs->Primaries().docs->count, 10);
    EXPECT_EQ(response_.Index("missing"), nullptr);
}

TEST_F(IndicesStatsResponseTest, IndexShardsGroupsCopies) {
    const auto& shards = response_.Index("logs")->IndexShards();
    ASSERT_EQ(shards.size(), 1u);
    const IndexShardStats& shard = shards.at(0);
    EXPECT_EQ(shard.shards().size(), 2u);
    EXPECT_EQ(shard.Primary().docs->count, 10);
    EXPECT_EQ(shard.Total().docs->count, 20);
}

TEST_F(IndicesStatsResponseTest, AsMapLooksUpByRouting) {
    const auto& map = response_.AsMap();
    EXPECT_EQ(map.size(), 3u);
    auto it = map.find(Routing("metrics", 0, true, "node-1"));
    ASSERT_NE(it, map.end());
    EXPECT_EQ(it->second.store->size_in_bytes, 100);
    EXPECT_EQ(map.count(Routing("metrics", 0, false, "node-1")), 0u);
}

TEST_F(IndicesStatsResponseTest, RecordsWithoutStatsAddNothing) {
    std::vector<ShardStats> shards;
    shards.emplace_back(Routing("logs", 0, true, "node-1"), Docs(4));
    shards.emplace_back(Routing("logs", 1, true, "node-1"), std::nullopt);
    IndicesStatsResponse response(std::move(shards), 2, 2, 0, {});

    EXPECT_EQ(response.Total().docs->count, 4);
    EXPECT_TRUE(response.AsMap().at(Routing("logs", 1, true, "node-1")).Empty());
}

TEST_F(IndicesStatsResponseTest, EmptyResponseAggregatesToEmptyStats) {
    IndicesStatsResponse empty;
    EXPECT_TRUE(empty.Total().Empty());
    EXPECT_TRUE(empty.Primaries().Empty());
    EXPECT_TRUE(empty.Indices().empty());
}

TEST_F(IndicesStatsResponseTest, ClusterLevelRendersOnlyRollups) {
    Document doc = response_.ToDocument("cluster");

    EXPECT_EQ(doc["_shards"]["total"].as<int>(), 5);
    EXPECT_EQ(doc["_shards"]["successful"].as<int>(), 3);
    EXPECT_EQ(doc["_shards"]["failed"].as<int>(), 2);
    ASSERT_TRUE(doc["_shards"]["failures"].IsSequence());
    EXPECT_EQ(doc["_shards"]["failures"].size(), 2u);
    EXPECT_EQ(doc["_shards"]["failures"][0]["status"].as<int>(), 503);

    EXPECT_EQ(doc["_all"]["primaries"]["docs"]["count"].as<int64_t>(), 15);
    EXPECT_EQ(doc["_all"]["total"]["docs"]["count"].as<int64_t>(), 25);
    EXPECT_FALSE(doc["indices"]);
}

TEST_F(IndicesStatsResponseTest, IndicesLevelAddsPerIndexSummaries) {
    Document doc = response_.ToDocument("indices");

    ASSERT_TRUE(doc["indices"].IsMap());
    EXPECT_EQ(doc["indices"]["logs"]["primaries"]["docs"]["count"].as<int64_t>(), 10);
    EXPECT_EQ(doc["indices"]["logs"]["total"]["docs"]["count"].as<int64_t>(), 20);
    EXPECT_FALSE(doc["indices"]["logs"]["shards"]);
}

TEST_F(IndicesStatsResponseTest, ShardsLevelAddsEveryCopy) {
    Document doc = response_.ToDocument("SHARDS");

    Document copies = doc["indices"]["logs"]["shards"]["0"];
    ASSERT_TRUE(copies.IsSequence());
    ASSERT_EQ(copies.size(), 2u);
    EXPECT_TRUE(copies[0]["routing"]["primary"].as<bool>());
    EXPECT_EQ(copies[0]["routing"]["node"].as<std::string>(), "node-1");
    EXPECT_FALSE(copies[1]["routing"]["primary"].as<bool>());
    EXPECT_EQ(copies[1]["docs"]["count"].as<int64_t>(), 10);
}

TEST_F(IndicesStatsResponseTest, UnknownLevelRendersNothing) {
    Document doc = NewMapDocument();
    EXPECT_FALSE(response_.Render(doc, "nodes"));
    EXPECT_EQ(doc.size(), 0u);
    EXPECT_EQ(response_.ToDocument("").size(), 0u);
}

TEST_F(IndicesStatsResponseTest, FailuresOmittedWhenNone) {
    std::vector<ShardStats> shards;
    shards.emplace_back(Routing("logs", 0, true, "node-1"), Docs(1));
    IndicesStatsResponse response(std::move(shards), 1, 1, 0, {});

    Document doc = response.ToDocument("cluster");
    EXPECT_FALSE(doc["_shards"]["failures"]);
}

TEST_F(IndicesStatsResponseTest, BinaryFormRoundTrips) {
    IndicesStatsResponse decoded = IndicesStatsResponse::FromBytes(response_.ToBytes());
    EXPECT_EQ(decoded, response_);
    EXPECT_EQ(decoded.Total(), response_.Total());
    EXPECT_EQ(decoded.shard_failures()[1].reason, "shard closed");

    IndicesStatsResponse empty;
    EXPECT_EQ(IndicesStatsResponse::FromBytes(empty.ToBytes()), empty);

    std::vector<ShardStats> one;
    one.emplace_back(Routing("logs", 3, false, "node-9"), std::nullopt);
    IndicesStatsResponse single(std::move(one), 1, 1, 0, {});
    IndicesStatsResponse decoded_single = IndicesStatsResponse::FromBytes(single.ToBytes());
    EXPECT_EQ(decoded_single, single);
    EXPECT_FALSE(decoded_single.At(0).has_stats());
}

TEST_F(IndicesStatsResponseTest, EveryTruncationIsRejected) {
    const std::string bytes = response_.ToBytes();
    for (size_t length = 0; length < bytes.size(); ++length) {
        EXPECT_THROW(IndicesStatsResponse::FromBytes(std::string_view(bytes.data(), length)), CodecError)
            << "prefix of " << length << " bytes";
    }
}

TEST_F(IndicesStatsResponseTest, TrailingBytesAreRejected) {
    std::string bytes = response_.ToBytes();
    bytes.push_back('\0');
    EXPECT_THROW(IndicesStatsResponse::FromBytes(bytes), CodecError);
}

TEST_F(IndicesStatsResponseTest, ShardsLevelDocumentRoundTrips) {
    Document doc = ParseDocument(EmitDocument(response_.ToDocument("shards")));
    IndicesStatsResponse decoded = IndicesStatsResponse::FromDocument(doc);

    EXPECT_EQ(decoded, response_);
    EXPECT_EQ(decoded.Total().docs->count, 25);
    EXPECT_EQ(decoded.AsMap().size(), 3u);
}

TEST_F(IndicesStatsResponseTest, DocumentRegroupingKeepsEquality) {
    std::vector<ShardStats> shards;
    shards.emplace_back(Routing("zeta", 0, true, "node-1"), Docs(1));
    shards.emplace_back(Routing("alpha", 0, true, "node-2"), Docs(2));
    IndicesStatsResponse response(std::move(shards), 2, 2, 0, {});

    IndicesStatsResponse decoded =
        IndicesStatsResponse::FromDocument(ParseDocument(EmitDocument(response.ToDocument("shards"))));
    EXPECT_EQ(decoded.Shards()[0].index(), "alpha");
    EXPECT_EQ(decoded, response);

    std::vector<ShardStats> other;
    other.emplace_back(Routing("zeta", 0, true, "node-1"), Docs(1));
    other.emplace_back(Routing("alpha", 0, true, "node-2"), Docs(3));
    EXPECT_NE(IndicesStatsResponse(std::move(other), 2, 2, 0, {}), response);
}

TEST_F(IndicesStatsResponseTest, DocumentKeepsStatsPresence) {
    std::vector<ShardStats> shards;
    shards.emplace_back(Routing("logs", 0, true, "node-1"), CommonStats{});
    shards.emplace_back(Routing("logs", 1, true, "node-1"), std::nullopt);
    IndicesStatsResponse response(std::move(shards), 2, 2, 0, {});

    IndicesStatsResponse decoded =
        IndicesStatsResponse::FromDocument(ParseDocument(EmitDocument(response.ToDocument("shards"))));
    ASSERT_EQ(decoded.Shards().size(), 2u);
    EXPECT_TRUE(decoded.Shards()[0].has_stats());
    EXPECT_FALSE(decoded.Shards()[1].has_stats());
    EXPECT_EQ(decoded, response);
}

TEST_F(IndicesStatsResponseTest, ClusterLevelDocumentKeepsRollups) {
    Document doc = ParseDocument(EmitDocument(response_.ToDocument("cluster"), DocumentFormat::kFlow));
    IndicesStatsResponse decoded = IndicesStatsResponse::FromDocument(doc);

    EXPECT_TRUE(decoded.Shards().empty());
    EXPECT_EQ(decoded.total_shards(), 5);
    EXPECT_EQ(decoded.shard_failures().size(), 2u);
    EXPECT_EQ(decoded.Primaries().docs->count, 15);
    EXPECT_EQ(decoded.Total().docs->count, 25);
    EXPECT_EQ(decoded.AggregationPasses(), 0);
}

TEST_F(IndicesStatsResponseTest, IndicesLevelDocumentKeepsIndexRollups) {
    IndicesStatsResponse decoded = IndicesStatsResponse::FromDocument(response_.ToDocument("indices"));

    const IndexStats* logs = decoded.Index("logs");
    ASSERT_NE(logs, nullptr);
    EXPECT_EQ(logs->Total().docs->count, 20);
    EXPECT_EQ(logs->Primaries().docs->count, 10);
}

TEST_F(IndicesStatsResponseTest, MalformedDocumentsAreRejected) {
    EXPECT_THROW(IndicesStatsResponse::FromDocument(ParseDocument("{indices: {logs: [1, 2]}}")), CodecError);
    EXPECT_THROW(IndicesStatsResponse::FromDocument(
                     ParseDocument("{indices: {logs: {shards: {zero: []}}}}")), CodecError);
    EXPECT_THROW(IndicesStatsResponse::FromDocument(ParseDocument("{_shards: {total: many}}")), CodecError);
}

TEST_F(IndicesStatsResponseTest, LevelNames) {
    EXPECT_EQ(ParseStatsLevel("Indices").value(), StatsLevel::kIndices);
    EXPECT_FALSE(ParseStatsLevel("node").has_value());
    EXPECT_FALSE(ParseStatsLevel("\xc3\x9c" "ber").has_value());
    EXPECT_FALSE(ParseStatsLevel("SHARDS\xff").has_value());
    EXPECT_STREQ(StatsLevelName(StatsLevel::kShards), "shards");
}

TEST_F(IndicesStatsResponseTest, ToStringIsSingleLine) {
    std::string text = response_.ToString();
    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_NE(text.find("_all"), std::string::npos);
}
