#include "common_stats.h"

#include <string>
#include <type_traits>

namespace Statfan {

namespace {

template<typename Section>
void AddOptional(std::optional<Section>& into, const std::optional<Section>& from) {
    if (!from) {
        return;
    }
    if (!into) {
        into.emplace();
    }
    AddSection(*into, *from);
}

template<typename Section>
bool OptionalEquals(const std::optional<Section>& a, const std::optional<Section>& b) {
    if (a.has_value() != b.has_value()) {
        return false;
    }
    return !a || SectionEquals(*a, *b);
}

} // namespace

void CommonStats::Add(const CommonStats& other) {
    AddOptional(docs, other.docs);
    AddOptional(store, other.store);
    AddOptional(indexing, other.indexing);
    AddOptional(get, other.get);
    AddOptional(search, other.search);
    AddOptional(merges, other.merges);
    AddOptional(refresh, other.refresh);
    AddOptional(flush, other.flush);
    AddOptional(segments, other.segments);
    AddOptional(suggest, other.suggest);
}

bool CommonStats::Empty() const {
    bool empty = true;
    ForEachSection([&empty](const auto& section) {
        if (section) {
            empty = false;
        }
    });
    return empty;
}

bool CommonStats::operator==(const CommonStats& other) const {
    return OptionalEquals(docs, other.docs) &&
           OptionalEquals(store, other.store) &&
           OptionalEquals(indexing, other.indexing) &&
           OptionalEquals(get, other.get) &&
           OptionalEquals(search, other.search) &&
           OptionalEquals(merges, other.merges) &&
           OptionalEquals(refresh, other.refresh) &&
           OptionalEquals(flush, other.flush) &&
           OptionalEquals(segments, other.segments) &&
           OptionalEquals(suggest, other.suggest);
}

void CommonStats::WriteTo(StreamOutput& out) const {
    ForEachSection([&out](const auto& section) {
        out.WriteBool(section.has_value());
        if (section) {
            WriteSection(out, *section);
        }
    });
}

CommonStats CommonStats::ReadFrom(StreamInput& in) {
    CommonStats stats;
    stats.ForEachSection([&in](auto& section) {
        using Section = typename std::decay_t<decltype(section)>::value_type;
        if (in.ReadBool()) {
            section = ReadSection<Section>(in);
        }
    });
    return stats;
}

void CommonStats::ToDocument(Document& out) const {
    ForEachSection([&out](const auto& section) {
        using Section = typename std::decay_t<decltype(section)>::value_type;
        if (section) {
            out[std::string(Section::kName)] = SectionToDocument(*section);
        }
    });
}

CommonStats CommonStats::FromDocument(const Document& in) {
    CommonStats stats;
    stats.ForEachSection([&in](auto& section) {
        using Section = typename std::decay_t<decltype(section)>::value_type;
        const Document node = GetObject(in, Section::kName);
        if (node.IsMap()) {
            section = SectionFromDocument<Section>(node);
        }
    });
    return stats;
}

} // namespace Statfan
