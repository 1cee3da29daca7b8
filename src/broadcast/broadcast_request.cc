#include "broadcast_request.h"

namespace Statfan {

IndicesOptions IndicesOptions::ReadFrom(StreamInput& in) {
    uint8_t flags = in.ReadByte();
    if (flags & 0xF0) {
        throw CodecError("malformed indices options byte " + std::to_string(flags));
    }
    return IndicesOptions(flags);
}

void BroadcastRequest::WriteTo(StreamOutput& out) const {
    // An empty list travels as null: "all indices" either way.
    out.WriteStringArrayNullable(indices_.empty() ? nullptr : &indices_);
    indices_options_.WriteTo(out);
}

void BroadcastRequest::ReadFrom(StreamInput& in) {
    indices_ = in.ReadStringArrayNullable().value_or(std::vector<std::string>{});
    indices_options_ = IndicesOptions::ReadFrom(in);
}

void BroadcastRequest::ToDocument(Document& out) const {
    Document indices(YAML::NodeType::Sequence);
    for (const auto& index : indices_) {
        indices.push_back(index);
    }
    out["indices"] = indices;

    Document options = NewMapDocument();
    options["ignore_unavailable"] = indices_options_.ignore_unavailable();
    options["allow_no_indices"] = indices_options_.allow_no_indices();
    options["expand_wildcards_open"] = indices_options_.expand_wildcards_open();
    options["expand_wildcards_closed"] = indices_options_.expand_wildcards_closed();
    out["indices_options"] = options;
}

void BroadcastRequest::FromDocument(const Document& in) {
    indices_.clear();
    if (in.IsMap()) {
        const Document indices = in["indices"];
        if (indices.IsDefined() && !indices.IsNull()) {
            if (indices.IsScalar()) {
                indices_.push_back(indices.Scalar());
            } else if (indices.IsSequence()) {
                for (const auto& index : indices) {
                    if (!index.IsScalar()) {
                        throw CodecError("indices entries must be strings");
                    }
                    indices_.push_back(index.Scalar());
                }
            } else {
                throw CodecError("indices must be a string or an array");
            }
        }
    }

    const Document options = GetObject(in, "indices_options");
    if (options.IsMap()) {
        uint8_t flags = 0;
        if (GetBool(options, "ignore_unavailable")) flags |= IndicesOptions::kIgnoreUnavailable;
        if (GetBool(options, "allow_no_indices", true)) flags |= IndicesOptions::kAllowNoIndices;
        if (GetBool(options, "expand_wildcards_open", true)) flags |= IndicesOptions::kExpandWildcardsOpen;
        if (GetBool(options, "expand_wildcards_closed")) flags |= IndicesOptions::kExpandWildcardsClosed;
        indices_options_ = IndicesOptions(flags);
    } else {
        indices_options_ = IndicesOptions();
    }
}

} // namespace Statfan
