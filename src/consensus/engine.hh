#pragma once

#include "consensus/aggregator.hh"
#include "consensus/commit_reveal.hh"
#include "consensus/epoch_clock.hh"
#include "consensus/heartbeat.hh"
#include "core/clock.hh"
#include "dht/store.hh"
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace mesh {

// ============================================================================
// Engine Types
// ============================================================================

enum class EngineState : std::uint8_t {
    IDLE = 0,
    COMMITTED = 1,
    REVEALED = 2,
    SETTLED = 3,
};

[[nodiscard]] constexpr std::string_view engine_state_string(EngineState state) {
    switch (state) {
        case EngineState::IDLE:      return "IDLE";
        case EngineState::COMMITTED: return "COMMITTED";
        case EngineState::REVEALED:  return "REVEALED";
        case EngineState::SETTLED:   return "SETTLED";
    }
    return "UNKNOWN";
}

// Locally observed judgment of each target; opaque to the engine
using ScoreProvider = std::function<ScoreVector(epoch_t epoch, const std::set<peer_id_t>& targets)>;

// Receives every settled epoch; called without the engine lock held
using ResultHandler = std::function<void(const EpochResult& result)>;

struct EngineConfig {
    // Wait into the Settled window before settling so late reveals propagate
    timestamp_t settle_delay = seconds(5);

    // Commitment and reveal expiration, in epochs from publication
    double record_ttl_epochs = 2.0;

    // Per-epoch state kept in memory
    std::size_t max_tracked_epochs = 8;

    void validate() const;
};

struct EngineStats {
    std::uint64_t commits_published = 0;
    std::uint64_t reveals_published = 0;
    std::uint64_t epochs_settled = 0;
    std::uint64_t epochs_missed = 0;
    std::uint64_t store_failures = 0;
};

// ============================================================================
// Commit-Reveal Engine
// ============================================================================

// Drives one node through each epoch: commit during Commit, reveal during
// Reveal once the commitment is confirmed, settle during Settled. All
// progress is derived from the epoch clock on every tick, so a restarted
// engine resumes at the current phase and never publishes into an elapsed
// window.
class CommitRevealEngine {
public:
    CommitRevealEngine(const peer_id_t& self,
                       ReplicatedStore& store,
                       HeartbeatTracker& heartbeat,
                       const EpochClock& epoch_clock,
                       const Clock& clock,
                       const ScoreAggregator& aggregator,
                       ScoreProvider score_provider,
                       EngineConfig config = EngineConfig{});

    void set_result_handler(ResultHandler handler);

    // Advance using clock.now(); throws ClockError before genesis
    void tick();
    void tick(timestamp_t now);

    [[nodiscard]] EngineState state(epoch_t epoch) const;
    [[nodiscard]] std::optional<EpochResult> result(epoch_t epoch) const;
    [[nodiscard]] std::optional<RevealRecord> own_reveal(epoch_t epoch) const;
    [[nodiscard]] EngineStats stats() const;

    [[nodiscard]] const peer_id_t& self() const { return self_; }

private:
    struct EpochState {
        explicit EpochState(epoch_t e) : epoch(e), commitments(e), reveals(e) {}

        epoch_t epoch;
        EngineState state = EngineState::IDLE;
        bool saw_commit_phase = false;
        bool missed = false;

        // Own judgment, fixed once drawn so retries publish the same commitment
        std::optional<RevealRecord> own;

        CommitmentPool commitments;
        RevealPool reveals;
        std::set<peer_id_t> eligible_authors;
        std::optional<EpochResult> result;
    };

    peer_id_t self_;
    ReplicatedStore& store_;
    HeartbeatTracker& heartbeat_;
    const EpochClock& epoch_clock_;
    const Clock& clock_;
    const ScoreAggregator& aggregator_;
    ScoreProvider score_provider_;
    EngineConfig config_;
    ResultHandler result_handler_;

    std::map<epoch_t, std::unique_ptr<EpochState>> epochs_;
    EngineStats stats_;
    mutable std::mutex mutex_;

    // Null when `epoch` is older than the newest tracked epoch
    EpochState* state_for(epoch_t epoch, Phase phase);
    void observe_eligibility(EpochState& st, timestamp_t now);
    void try_commit(EpochState& st, timestamp_t now);
    void try_reveal(EpochState& st, timestamp_t now);
    bool poll_commitments(EpochState& st);
    bool poll_reveals(EpochState& st);
    std::optional<EpochResult> settle(EpochState& st, timestamp_t now);
    void close_stale(epoch_t current);

    [[nodiscard]] timestamp_t record_expiration(timestamp_t now) const;
};

}  // namespace mesh
