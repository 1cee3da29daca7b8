#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "../common/document.h"
#include "../common/stream.h"

namespace Statfan {

/**
 * One counter of a stats section: its document name and the member that
 * holds it. Every section publishes a single ordered table of these, and the
 * merge, both binary directions and both document directions walk that same
 * table, so adding a counter is one table entry.
 */
template<typename Section>
struct StatField {
    const char* name;
    int64_t Section::*member;
};

template<typename Section>
using FieldTable = std::vector<StatField<Section>>;

struct DocsStats {
    static constexpr const char* kName = "docs";
    static const FieldTable<DocsStats>& Fields();

    int64_t count = 0;
    int64_t deleted = 0;
};

struct StoreStats {
    static constexpr const char* kName = "store";
    static const FieldTable<StoreStats>& Fields();

    int64_t size_in_bytes = 0;
    int64_t throttle_time_in_millis = 0;
};

struct IndexingStats {
    static constexpr const char* kName = "indexing";
    static const FieldTable<IndexingStats>& Fields();

    int64_t index_total = 0;
    int64_t index_time_in_millis = 0;
    int64_t index_current = 0;
    int64_t delete_total = 0;
    int64_t delete_time_in_millis = 0;
    int64_t delete_current = 0;
};

struct GetStats {
    static constexpr const char* kName = "get";
    static const FieldTable<GetStats>& Fields();

    int64_t total = 0;
    int64_t time_in_millis = 0;
    int64_t exists_total = 0;
    int64_t exists_time_in_millis = 0;
    int64_t missing_total = 0;
    int64_t missing_time_in_millis = 0;
    int64_t current = 0;
};

struct SearchStats {
    static constexpr const char* kName = "search";
    static const FieldTable<SearchStats>& Fields();

    int64_t open_contexts = 0;
    int64_t query_total = 0;
    int64_t query_time_in_millis = 0;
    int64_t query_current = 0;
    int64_t fetch_total = 0;
    int64_t fetch_time_in_millis = 0;
    int64_t fetch_current = 0;
};

struct MergeStats {
    static constexpr const char* kName = "merges";
    static const FieldTable<MergeStats>& Fields();

    int64_t current = 0;
    int64_t current_docs = 0;
    int64_t current_size_in_bytes = 0;
    int64_t total = 0;
    int64_t total_time_in_millis = 0;
    int64_t total_docs = 0;
    int64_t total_size_in_bytes = 0;
};

struct RefreshStats {
    static constexpr const char* kName = "refresh";
    static const FieldTable<RefreshStats>& Fields();

    int64_t total = 0;
    int64_t total_time_in_millis = 0;
};

struct FlushStats {
    static constexpr const char* kName = "flush";
    static const FieldTable<FlushStats>& Fields();

    int64_t total = 0;
    int64_t total_time_in_millis = 0;
};

struct SegmentsStats {
    static constexpr const char* kName = "segments";
    static const FieldTable<SegmentsStats>& Fields();

    int64_t count = 0;
    int64_t memory_in_bytes = 0;
};

struct SuggestStats {
    static constexpr const char* kName = "suggest";
    static const FieldTable<SuggestStats>& Fields();

    int64_t total = 0;
    int64_t time_in_millis = 0;
    int64_t current = 0;
};

// Generic operations over any section type.

// Counters clamp at the int64 range instead of wrapping.
inline int64_t SaturatingAdd(int64_t a, int64_t b) {
    if (b > 0 && a > std::numeric_limits<int64_t>::max() - b) {
        return std::numeric_limits<int64_t>::max();
    }
    if (b < 0 && a < std::numeric_limits<int64_t>::min() - b) {
        return std::numeric_limits<int64_t>::min();
    }
    return a + b;
}

template<typename Section>
void AddSection(Section& into, const Section& from) {
    for (const auto& field : Section::Fields()) {
        into.*field.member = SaturatingAdd(into.*field.member, from.*field.member);
    }
}

template<typename Section>
bool SectionEquals(const Section& a, const Section& b) {
    for (const auto& field : Section::Fields()) {
        if (a.*field.member != b.*field.member) {
            return false;
        }
    }
    return true;
}

template<typename Section>
void WriteSection(StreamOutput& out, const Section& section) {
    for (const auto& field : Section::Fields()) {
        out.WriteZLong(section.*field.member);
    }
}

template<typename Section>
Section ReadSection(StreamInput& in) {
    Section section;
    for (const auto& field : Section::Fields()) {
        section.*field.member = in.ReadZLong();
    }
    return section;
}

template<typename Section>
Document SectionToDocument(const Section& section) {
    Document node = NewMapDocument();
    for (const auto& field : Section::Fields()) {
        node[std::string(field.name)] = section.*field.member;
    }
    return node;
}

// Fields absent from the object stay zero.
template<typename Section>
Section SectionFromDocument(const Document& node) {
    Section section;
    for (const auto& field : Section::Fields()) {
        section.*field.member = GetInt64(node, field.name);
    }
    return section;
}

} // namespace Statfan
