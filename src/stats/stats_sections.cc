#include "stats_sections.h"

namespace Statfan {

const FieldTable<DocsStats>& DocsStats::Fields() {
    static const FieldTable<DocsStats> fields = {
        {"count", &DocsStats::count},
        {"deleted", &DocsStats::deleted},
    };
    return fields;
}

const FieldTable<StoreStats>& StoreStats::Fields() {
    static const FieldTable<StoreStats> fields = {
        {"size_in_bytes", &StoreStats::size_in_bytes},
        {"throttle_time_in_millis", &StoreStats::throttle_time_in_millis},
    };
    return fields;
}

const FieldTable<IndexingStats>& IndexingStats::Fields() {
    static const FieldTable<IndexingStats> fields = {
        {"index_total", &IndexingStats::index_total},
        {"index_time_in_millis", &IndexingStats::index_time_in_millis},
        {"index_current", &IndexingStats::index_current},
        {"delete_total", &IndexingStats::delete_total},
        {"delete_time_in_millis", &IndexingStats::delete_time_in_millis},
        {"delete_current", &IndexingStats::delete_current},
    };
    return fields;
}

const FieldTable<GetStats>& GetStats::Fields() {
    static const FieldTable<GetStats> fields = {
        {"total", &GetStats::total},
        {"time_in_millis", &GetStats::time_in_millis},
        {"exists_total", &GetStats::exists_total},
        {"exists_time_in_millis", &GetStats::exists_time_in_millis},
        {"missing_total", &GetStats::missing_total},
        {"missing_time_in_millis", &GetStats::missing_time_in_millis},
        {"current", &GetStats::current},
    };
    return fields;
}

const FieldTable<SearchStats>& SearchStats::Fields() {
    static const FieldTable<SearchStats> fields = {
        {"open_contexts", &SearchStats::open_contexts},
        {"query_total", &SearchStats::query_total},
        {"query_time_in_millis", &SearchStats::query_time_in_millis},
        {"query_current", &SearchStats::query_current},
        {"fetch_total", &SearchStats::fetch_total},
        {"fetch_time_in_millis", &SearchStats::fetch_time_in_millis},
        {"fetch_current", &SearchStats::fetch_current},
    };
    return fields;
}

const FieldTable<MergeStats>& MergeStats::Fields() {
    static const FieldTable<MergeStats> fields = {
        {"current", &MergeStats::current},
        {"current_docs", &MergeStats::current_docs},
        {"current_size_in_bytes", &MergeStats::current_size_in_bytes},
        {"total", &MergeStats::total},
        {"total_time_in_millis", &MergeStats::total_time_in_millis},
        {"total_docs", &MergeStats::total_docs},
        {"total_size_in_bytes", &MergeStats::total_size_in_bytes},
    };
    return fields;
}

const FieldTable<RefreshStats>& RefreshStats::Fields() {
    static const FieldTable<RefreshStats> fields = {
        {"total", &RefreshStats::total},
        {"total_time_in_millis", &RefreshStats::total_time_in_millis},
    };
    return fields;
}

const FieldTable<FlushStats>& FlushStats::Fields() {
    static const FieldTable<FlushStats> fields = {
        {"total", &FlushStats::total},
        {"total_time_in_millis", &FlushStats::total_time_in_millis},
    };
    return fields;
}

const FieldTable<SegmentsStats>& SegmentsStats::Fields() {
    static const FieldTable<SegmentsStats> fields = {
        {"count", &SegmentsStats::count},
        {"memory_in_bytes", &SegmentsStats::memory_in_bytes},
    };
    return fields;
}

const FieldTable<SuggestStats>& SuggestStats::Fields() {
    static const FieldTable<SuggestStats> fields = {
        {"total", &SuggestStats::total},
        {"time_in_millis", &SuggestStats::time_in_millis},
        {"current", &SuggestStats::current},
    };
    return fields;
}

} // namespace Statfan
