#ifndef STATFAN_BROADCAST_STATS_REQUEST_H_
#define STATFAN_BROADCAST_STATS_REQUEST_H_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "../common/payload_bytes.h"
#include "broadcast_request.h"
#include "suggest_builder.h"

namespace Statfan {

/**
 * Broadcast stats request carrying an opaque query payload to every shard.
 *
 * The payload may be handed in as a borrowed view (payload_unsafe == true),
 * for instance straight out of a receive buffer that will be recycled.
 * Such a payload must not reach more than one consumer: PrepareForDispatch()
 * replaces it with a private copy and clears the flag. The dispatcher calls
 * it before every attempt; after the first call it does nothing.
 */
class StatsRequest : public BroadcastRequest {
public:
    StatsRequest() = default;
    explicit StatsRequest(std::vector<std::string> indices) : BroadcastRequest(std::move(indices)) {}

    const PayloadBytes& payload() const { return payload_; }
    bool payload_unsafe() const { return payload_unsafe_; }

    StatsRequest& SetPayload(PayloadBytes payload, bool unsafe);
    // Takes ownership of |payload|; always safe.
    StatsRequest& SetPayload(std::string payload);
    StatsRequest& SetPayload(const SuggestBuilder& suggest);
    StatsRequest& SetPayload(const SuggestionBuilder& suggestion);

    // Comma separated routing values narrowing the shards that are hit.
    const std::optional<std::string>& routing() const { return routing_; }
    StatsRequest& SetRouting(std::string routing);
    StatsRequest& SetRouting(const std::vector<std::string>& routings);

    const std::optional<std::string>& preference() const { return preference_; }
    StatsRequest& SetPreference(std::string preference);

    void PrepareForDispatch();
    void BeforeStart() override { PrepareForDispatch(); }

    void WriteTo(StreamOutput& out) const override;
    void ReadFrom(StreamInput& in) override;
    std::string ToBytes() const;
    static StatsRequest FromBytes(std::string_view bytes, StreamLimits limits = StreamLimits{});

    void ToDocument(Document& out) const override;
    void FromDocument(const Document& in) override;

    std::string ToString() const;

    bool operator==(const StatsRequest& other) const;
    bool operator!=(const StatsRequest& other) const { return !(*this == other); }

private:
    std::optional<std::string> routing_;
    std::optional<std::string> preference_;
    PayloadBytes payload_;
    bool payload_unsafe_ = false;
};

} // namespace Statfan

#endif // STATFAN_BROADCAST_STATS_REQUEST_H_
