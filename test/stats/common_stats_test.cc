#include <gtest/gtest.h>
#include "../../src/stats/common_stats.h"

#include <limits>

using namespace Statfan;

namespace {

CommonStats Docs(int64_t count, int64_t deleted) {
    CommonStats stats;
    stats.docs.emplace();
    stats.docs->count = count;
    stats.docs->deleted = deleted;
    return stats;
}

CommonStats Store(int64_t size) {
    CommonStats stats;
    stats.store.emplace();
    stats.store->size_in_bytes = size;
    return stats;
}

CommonStats Merged(CommonStats a, const CommonStats& b) {
    a.Add(b);
    return a;
}

} // namespace

TEST(CommonStatsTest, EmptyIsIdentity) {
    CommonStats a = Merged(Docs(10, 1), Store(2048));
    EXPECT_EQ(Merged(a, CommonStats{}), a);
    EXPECT_EQ(Merged(CommonStats{}, a), a);
    EXPECT_TRUE(CommonStats{}.Empty());
    EXPECT_FALSE(a.Empty());
}

TEST(CommonStatsTest, MergeIsCommutativeAndAssociative) {
    CommonStats a = Docs(10, 1);
    CommonStats b = Merged(Docs(5, 0), Store(100));
    CommonStats c = Store(7);

    EXPECT_EQ(Merged(a, b), Merged(b, a));
    EXPECT_EQ(Merged(Merged(a, b), c), Merged(a, Merged(b, c)));
}

TEST(CommonStatsTest, MergeAddsFieldWise) {
    CommonStats merged = Merged(Docs(10, 1), Docs(5, 2));
    ASSERT_TRUE(merged.docs.has_value());
    EXPECT_EQ(merged.docs->count, 15);
    EXPECT_EQ(merged.docs->deleted, 3);
    EXPECT_FALSE(merged.store.has_value());
}

TEST(CommonStatsTest, MergeLeavesArgumentUntouched) {
    CommonStats a = Docs(1, 0);
    CommonStats b = Docs(2, 0);
    a.Add(b);
    EXPECT_EQ(b, Docs(2, 0));
}

TEST(CommonStatsTest, BinaryFormKeepsSectionPresence) {
    CommonStats stats = Merged(Docs(3, 0), Store(0));
    stats.search.emplace();
    stats.search->query_total = -4;

    StreamOutput out;
    stats.WriteTo(out);
    StreamInput in(out.bytes());
    CommonStats decoded = CommonStats::ReadFrom(in);
    EXPECT_EQ(in.remaining(), 0u);

    EXPECT_EQ(decoded, stats);
    EXPECT_TRUE(decoded.store.has_value());
    EXPECT_FALSE(decoded.indexing.has_value());
}

TEST(CommonStatsTest, DocumentFormUsesSectionNames) {
    Document doc = NewMapDocument();
    Docs(42, 2).ToDocument(doc);

    EXPECT_EQ(doc["docs"]["count"].as<int64_t>(), 42);
    EXPECT_EQ(doc["docs"]["deleted"].as<int64_t>(), 2);
    EXPECT_FALSE(doc["store"]);
}

TEST(CommonStatsTest, DocumentDecodingIgnoresUnknownFields) {
    Document doc = ParseDocument("{docs: {count: 9, extra: 1}, fielddata: {memory: 3}}");
    CommonStats stats = CommonStats::FromDocument(doc);

    ASSERT_TRUE(stats.docs.has_value());
    EXPECT_EQ(stats.docs->count, 9);
    EXPECT_EQ(stats.docs->deleted, 0);
    EXPECT_EQ(stats, Docs(9, 0));
}

TEST(CommonStatsTest, DocumentDecodingRejectsNonNumericCounters) {
    Document doc = ParseDocument("{docs: {count: lots}}");
    EXPECT_THROW(CommonStats::FromDocument(doc), CodecError);
}

TEST(CommonStatsTest, MergeSaturatesAtCounterLimits) {
    const int64_t max = std::numeric_limits<int64_t>::max();
    const int64_t min = std::numeric_limits<int64_t>::min();

    CommonStats merged = Merged(Docs(max, 1), Docs(max, 2));
    EXPECT_EQ(merged.docs->count, max);
    EXPECT_EQ(merged.docs->deleted, 3);
    EXPECT_EQ(Merged(Store(min), Store(-1)).store->size_in_bytes, min);

    EXPECT_EQ(SaturatingAdd(max, -1), max - 1);
    EXPECT_EQ(SaturatingAdd(min, max), -1);
}
