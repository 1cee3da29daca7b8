#include "stats_request.h"

#include <sstream>
#include <glog/logging.h>

namespace Statfan {

StatsRequest& StatsRequest::SetPayload(PayloadBytes payload, bool unsafe) {
    payload_ = std::move(payload);
    payload_unsafe_ = unsafe;
    return *this;
}

StatsRequest& StatsRequest::SetPayload(std::string payload) {
    return SetPayload(PayloadBytes::Own(std::move(payload)), false);
}

StatsRequest& StatsRequest::SetPayload(const SuggestBuilder& suggest) {
    return SetPayload(suggest.BuildAsBytes());
}

StatsRequest& StatsRequest::SetPayload(const SuggestionBuilder& suggestion) {
    return SetPayload(suggestion.BuildAsBytes());
}

StatsRequest& StatsRequest::SetRouting(std::string routing) {
    routing_ = std::move(routing);
    return *this;
}

StatsRequest& StatsRequest::SetRouting(const std::vector<std::string>& routings) {
    std::string joined;
    for (size_t i = 0; i < routings.size(); ++i) {
        if (i > 0) {
            joined += ',';
        }
        joined += routings[i];
    }
    routing_ = std::move(joined);
    return *this;
}

StatsRequest& StatsRequest::SetPreference(std::string preference) {
    preference_ = std::move(preference);
    return *this;
}

void StatsRequest::PrepareForDispatch() {
    if (!payload_unsafe_) {
        return;
    }
    VLOG(2) << "Copying " << payload_.Size() << " borrowed payload bytes before dispatch";
    payload_ = payload_.CopyBytes();
    payload_unsafe_ = false;
}

void StatsRequest::WriteTo(StreamOutput& out) const {
    BroadcastRequest::WriteTo(out);
    out.WriteOptionalString(routing_);
    out.WriteOptionalString(preference_);
    out.WriteBytes(payload_.AsStringView());
}

void StatsRequest::ReadFrom(StreamInput& in) {
    BroadcastRequest::ReadFrom(in);
    routing_ = in.ReadOptionalString();
    preference_ = in.ReadOptionalString();
    SetPayload(in.ReadBytes());
}

std::string StatsRequest::ToBytes() const {
    StreamOutput out;
    WriteTo(out);
    return out.Release();
}

StatsRequest StatsRequest::FromBytes(std::string_view bytes, StreamLimits limits) {
    StreamInput in(bytes, limits);
    StatsRequest request;
    request.ReadFrom(in);
    in.ExpectEnd();
    return request;
}

void StatsRequest::ToDocument(Document& out) const {
    BroadcastRequest::ToDocument(out);
    if (routing_) {
        out["routing"] = *routing_;
    }
    if (preference_) {
        out["preference"] = *preference_;
    }
    out["source"] = BytesToDocument(payload_.AsStringView());
}

void StatsRequest::FromDocument(const Document& in) {
    BroadcastRequest::FromDocument(in);
    routing_ = GetOptionalString(in, "routing");
    preference_ = GetOptionalString(in, "preference");

    // The source is the payload text or a !!binary scalar; a structured object
    // is accepted too and re-emitted as the payload.
    std::string source;
    if (in.IsMap()) {
        const Document node = in["source"];
        if (node.IsDefined() && !node.IsNull()) {
            source = node.IsScalar() ? BytesFromDocument(node, "source") : EmitDocument(node, DocumentFormat::kFlow);
        }
    }
    SetPayload(std::move(source));
}

std::string StatsRequest::ToString() const {
    std::string rendered = "_na_";
    if (!payload_.Empty()) {
        try {
            rendered = EmitDocument(ParseDocument(payload_.AsStringView()), DocumentFormat::kFlow);
        } catch (const CodecError& e) {
            VLOG(2) << "Payload is not a document: " << e.what();
        }
    }
    std::ostringstream out;
    out << "[";
    for (size_t i = 0; i < indices_.size(); ++i) {
        out << (i > 0 ? ", " : "") << indices_[i];
    }
    out << "], payload[" << rendered << "]";
    return out.str();
}

bool StatsRequest::operator==(const StatsRequest& other) const {
    return indices_ == other.indices_ && indices_options_ == other.indices_options_ &&
           routing_ == other.routing_ && preference_ == other.preference_ &&
           payload_ == other.payload_;
}

} // namespace Statfan
