#pragma once

#include <optional>

#include "stats_sections.h"

namespace Statfan {

/**
 * Statistics of one shard, or of any merge of shards.
 *
 * Each section is optional: a shard only reports what it was asked for.
 * Add() is the merge: associative, commutative, with the empty instance
 * (no sections) as identity, and it never touches its argument.
 */
struct CommonStats {
    std::optional<DocsStats> docs;
    std::optional<StoreStats> store;
    std::optional<IndexingStats> indexing;
    std::optional<GetStats> get;
    std::optional<SearchStats> search;
    std::optional<MergeStats> merges;
    std::optional<RefreshStats> refresh;
    std::optional<FlushStats> flush;
    std::optional<SegmentsStats> segments;
    std::optional<SuggestStats> suggest;

    void Add(const CommonStats& other);
    bool Empty() const;

    void WriteTo(StreamOutput& out) const;
    static CommonStats ReadFrom(StreamInput& in);

    // Writes one object per present section into |out|, which must be a map.
    void ToDocument(Document& out) const;
    static CommonStats FromDocument(const Document& in);

    bool operator==(const CommonStats& other) const;
    bool operator!=(const CommonStats& other) const { return !(*this == other); }

    // Visits every section slot in wire order.
    template<typename Visitor>
    void ForEachSection(Visitor&& visit) {
        visit(docs); visit(store); visit(indexing); visit(get); visit(search);
        visit(merges); visit(refresh); visit(flush); visit(segments); visit(suggest);
    }

    template<typename Visitor>
    void ForEachSection(Visitor&& visit) const {
        visit(docs); visit(store); visit(indexing); visit(get); visit(search);
        visit(merges); visit(refresh); visit(flush); visit(segments); visit(suggest);
    }
};

} // namespace Statfan
