#include "broadcast_response.h"

#include <limits>

namespace Statfan {

namespace {

int ReadCount(StreamInput& in, const char* what) {
    uint32_t value = in.ReadVInt();
    if (value > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
        throw CodecError(std::string(what) + " count " + std::to_string(value) + " out of range");
    }
    return static_cast<int>(value);
}

int ToInt(int64_t value, const char* what) {
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        throw CodecError(std::string(what) + " value " + std::to_string(value) + " out of range");
    }
    return static_cast<int>(value);
}

} // namespace

void ShardOperationFailure::WriteTo(StreamOutput& out) const {
    out.WriteOptionalString(index);
    out.WriteZLong(shard_id);
    out.WriteString(reason);
    out.WriteVInt(static_cast<uint32_t>(status));
}

ShardOperationFailure ShardOperationFailure::ReadFrom(StreamInput& in) {
    ShardOperationFailure failure;
    failure.index = in.ReadOptionalString();
    failure.shard_id = ToInt(in.ReadZLong(), "shard id");
    failure.reason = in.ReadString();
    failure.status = ReadCount(in, "status");
    return failure;
}

Document ShardOperationFailure::ToDocument() const {
    Document node = NewMapDocument();
    if (index) {
        node["index"] = *index;
    }
    node["shard"] = shard_id;
    node["status"] = status;
    node["reason"] = reason;
    return node;
}

ShardOperationFailure ShardOperationFailure::FromDocument(const Document& in) {
    ShardOperationFailure failure;
    failure.index = GetOptionalString(in, "index");
    failure.shard_id = ToInt(GetInt64(in, "shard", -1), "shard");
    failure.status = ToInt(GetInt64(in, "status", 500), "status");
    failure.reason = GetOptionalString(in, "reason").value_or("");
    return failure;
}

void BroadcastResponse::WriteHeaderTo(StreamOutput& out) const {
    out.WriteVInt(static_cast<uint32_t>(total_shards_));
    out.WriteVInt(static_cast<uint32_t>(successful_shards_));
    out.WriteVInt(static_cast<uint32_t>(failed_shards_));
    out.WriteVInt(static_cast<uint32_t>(shard_failures_.size()));
    for (const auto& failure : shard_failures_) {
        failure.WriteTo(out);
    }
}

void BroadcastResponse::ReadHeaderFrom(StreamInput& in) {
    total_shards_ = ReadCount(in, "total shards");
    successful_shards_ = ReadCount(in, "successful shards");
    failed_shards_ = ReadCount(in, "failed shards");
    size_t failures = in.ReadCollectionSize();
    shard_failures_.clear();
    shard_failures_.reserve(failures);
    for (size_t i = 0; i < failures; ++i) {
        shard_failures_.push_back(ShardOperationFailure::ReadFrom(in));
    }
}

void BroadcastResponse::BuildShardsHeader(Document& out) const {
    Document shards = NewMapDocument();
    shards["total"] = total_shards_;
    shards["successful"] = successful_shards_;
    shards["failed"] = failed_shards_;
    if (!shard_failures_.empty()) {
        Document failures(YAML::NodeType::Sequence);
        for (const auto& failure : shard_failures_) {
            failures.push_back(failure.ToDocument());
        }
        shards["failures"] = failures;
    }
    out["_shards"] = shards;
}

void BroadcastResponse::ReadShardsHeader(const Document& in) {
    const Document shards = GetObject(in, "_shards");
    total_shards_ = ToInt(GetInt64(shards, "total"), "_shards.total");
    successful_shards_ = ToInt(GetInt64(shards, "successful"), "_shards.successful");
    failed_shards_ = ToInt(GetInt64(shards, "failed"), "_shards.failed");
    shard_failures_.clear();
    if (!shards.IsMap()) {
        return;
    }
    const Document failures = shards["failures"];
    if (!failures.IsDefined() || failures.IsNull()) {
        return;
    }
    if (!failures.IsSequence()) {
        throw CodecError("_shards.failures must be an array");
    }
    for (const auto& failure : failures) {
        shard_failures_.push_back(ShardOperationFailure::FromDocument(failure));
    }
}

} // namespace Statfan
