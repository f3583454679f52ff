#pragma once

#include "consensus/aggregator.hh"
#include "consensus/heartbeat.hh"

namespace mesh {

// ============================================================================
// Read API
// ============================================================================

// Read-only accessors served by an external gateway. Depends only on the
// store-backed heartbeat view and the result history.
class ReadApi {
public:
    ReadApi(HeartbeatTracker& heartbeat, const ResultHistory& history);

    // Current unexpired liveness entries
    [[nodiscard]] std::vector<NodeLivenessEntry> nodes();

    // Up to `n` most recent settled epochs, oldest first
    [[nodiscard]] std::vector<EpochResult> recent_results(std::size_t n) const;

    [[nodiscard]] std::optional<EpochResult> result(epoch_t epoch) const;

private:
    HeartbeatTracker& heartbeat_;
    const ResultHistory& history_;
};

}  // namespace mesh
