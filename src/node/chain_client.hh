#pragma once

#include "consensus/aggregator.hh"
#include <mutex>
#include <vector>

namespace mesh {

// ============================================================================
// Chain Client Interface
// ============================================================================

// One tuple handed to the chain per target that reached consensus
struct ChainScore {
    peer_id_t target{};
    double score = 0.0;
    double agreement = 0.0;

    bool operator==(const ChainScore&) const = default;
};

[[nodiscard]] std::vector<ChainScore> to_chain_scores(const EpochResult& result);

// Binding finalization happens on the other side of this interface
class ChainClient {
public:
    virtual ~ChainClient() = default;
    virtual void submit(epoch_t epoch, const std::vector<ChainScore>& scores) = 0;
};

// Writes submissions to the log; used when no chain is attached
class LoggingChainClient : public ChainClient {
public:
    void submit(epoch_t epoch, const std::vector<ChainScore>& scores) override;
};

// Keeps every submission in memory
class RecordingChainClient : public ChainClient {
public:
    void submit(epoch_t epoch, const std::vector<ChainScore>& scores) override;

    [[nodiscard]] std::vector<std::pair<epoch_t, std::vector<ChainScore>>> submissions() const;

private:
    std::vector<std::pair<epoch_t, std::vector<ChainScore>>> submissions_;
    mutable std::mutex mutex_;
};

}  // namespace mesh
