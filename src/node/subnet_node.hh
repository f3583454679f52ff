#pragma once

#include "consensus/aggregator.hh"
#include "consensus/engine.hh"
#include "consensus/epoch_clock.hh"
#include "consensus/heartbeat.hh"
#include "consensus/schema_validator.hh"
#include "core/clock.hh"
#include "core/logging.hh"
#include "core/periodic_task.hh"
#include "dht/node.hh"
#include "dht/validation.hh"
#include "node/chain_client.hh"
#include "node/read_api.hh"
#include <memory>

namespace mesh {

// ============================================================================
// Node Configuration
// ============================================================================

struct NodeConfig {
    EpochConfig epoch;
    HeartbeatConfig heartbeat;
    AggregatorConfig aggregator;
    EngineConfig engine;
    SchemaConfig schema;
    DHTConfig dht;

    // Process-wide; the embedding application passes it to init_logging()
    LogConfig log;

    // Engine tick period; a few ticks per window keeps polling near boundaries
    std::chrono::milliseconds tick_interval{1000};

    // Settled epochs kept for the read API
    std::size_t history_depth = 10;

    // Checks each section and the constraints between them
    void validate() const;
};

// Signature and schema validators every store used by a node should run
[[nodiscard]] std::shared_ptr<CompositeValidator> make_record_validator(
    std::shared_ptr<const MLDSAKeyPair> keypair,
    const EpochClock& epoch_clock,
    const Clock& clock,
    const SchemaConfig& schema);

// ============================================================================
// Subnet Node
// ============================================================================

// One peer: heartbeat refresh and engine tick as independent periodic tasks
// sharing nothing but the store and the engine's own state.
class SubnetNode {
public:
    SubnetNode(NodeConfig config,
               const peer_id_t& self,
               std::shared_ptr<ReplicatedStore> store,
               const Clock& clock,
               ScoreProvider score_provider,
               std::shared_ptr<ChainClient> chain = nullptr);
    ~SubnetNode();

    SubnetNode(const SubnetNode&) = delete;
    SubnetNode& operator=(const SubnetNode&) = delete;

    // Throws ClockError if the clock is before genesis
    void start();
    void stop();

    // Single steps of the periodic tasks, for callers driving time by hand
    bool heartbeat_once();
    void tick_once();

    [[nodiscard]] bool running() const;

    [[nodiscard]] const peer_id_t& self() const { return self_; }
    [[nodiscard]] const EpochClock& epoch_clock() const { return epoch_clock_; }
    [[nodiscard]] HeartbeatTracker& heartbeat() { return heartbeat_; }
    [[nodiscard]] CommitRevealEngine& engine() { return engine_; }
    [[nodiscard]] const ResultHistory& history() const { return history_; }
    [[nodiscard]] ReadApi& read_api() { return read_api_; }

private:
    NodeConfig config_;
    peer_id_t self_;
    std::shared_ptr<ReplicatedStore> store_;
    const Clock& clock_;
    std::shared_ptr<ChainClient> chain_;

    EpochClock epoch_clock_;
    ScoreAggregator aggregator_;
    ResultHistory history_;
    HeartbeatTracker heartbeat_;
    CommitRevealEngine engine_;
    ReadApi read_api_;

    std::unique_ptr<PeriodicTask> heartbeat_task_;
    std::unique_ptr<PeriodicTask> engine_task_;

    void on_result(const EpochResult& result);
};

}  // namespace mesh
