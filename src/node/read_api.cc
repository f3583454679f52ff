#include "read_api.hh"

namespace mesh {

ReadApi::ReadApi(HeartbeatTracker& heartbeat, const ResultHistory& history)
    : heartbeat_(heartbeat)
    , history_(history) {}

std::vector<NodeLivenessEntry> ReadApi::nodes() {
    return heartbeat_.entries();
}

std::vector<EpochResult> ReadApi::recent_results(std::size_t n) const {
    return history_.recent(n);
}

std::optional<EpochResult> ReadApi::result(epoch_t epoch) const {
    return history_.get(epoch);
}

}  // namespace mesh
