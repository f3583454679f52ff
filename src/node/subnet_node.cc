#include "subnet_node.hh"
#include "core/error.hh"
#include <cmath>

namespace mesh {

// ============================================================================
// NodeConfig
// ============================================================================

void NodeConfig::validate() const {
    epoch.validate();
    heartbeat.validate();
    aggregator.validate();
    engine.validate();
    schema.validate();
    dht.validate();

    if (tick_interval.count() <= 0) {
        throw ConfigError("node.tick_interval must be positive");
    }
    if (history_depth == 0) {
        throw ConfigError("node.history_depth must be at least 1");
    }

    auto epoch_us = static_cast<double>(epoch.epoch_length().count());
    if (static_cast<double>(heartbeat.ttl.count()) > epoch_us * schema.heartbeat_max_ttl_epochs) {
        throw ConfigError("heartbeat.ttl exceeds the longest expiration the schema accepts");
    }
    double refreshes = std::ceil(epoch_us / static_cast<double>(heartbeat.interval.count())) + 1.0;
    if (refreshes > static_cast<double>(schema.heartbeat_limit)) {
        throw ConfigError("heartbeat.interval refreshes more often than schema.heartbeat_limit allows");
    }
    if (engine.record_ttl_epochs > schema.record_max_ttl_epochs) {
        throw ConfigError("engine.record_ttl_epochs exceeds schema.record_max_ttl_epochs");
    }
    if (engine.settle_delay >= epoch.settle_window) {
        throw ConfigError("engine.settle_delay must be shorter than the settle window");
    }
}

std::shared_ptr<CompositeValidator> make_record_validator(
    std::shared_ptr<const MLDSAKeyPair> keypair,
    const EpochClock& epoch_clock,
    const Clock& clock,
    const SchemaConfig& schema) {
    auto validator = std::make_shared<CompositeValidator>();
    validator->add(std::make_shared<SignatureValidator>(std::move(keypair)));
    validator->add(std::make_shared<CommitRevealSchemaValidator>(epoch_clock, clock, schema));
    return validator;
}

// ============================================================================
// SubnetNode Implementation
// ============================================================================

namespace {

NodeConfig validated(NodeConfig config) {
    config.validate();
    return config;
}

}  // namespace

SubnetNode::SubnetNode(NodeConfig config,
                       const peer_id_t& self,
                       std::shared_ptr<ReplicatedStore> store,
                       const Clock& clock,
                       ScoreProvider score_provider,
                       std::shared_ptr<ChainClient> chain)
    : config_(validated(std::move(config)))
    , self_(self)
    , store_(std::move(store))
    , clock_(clock)
    , chain_(chain ? std::move(chain) : std::make_shared<LoggingChainClient>())
    , epoch_clock_(config_.epoch)
    , aggregator_(config_.aggregator)
    , history_(config_.history_depth)
    , heartbeat_(self_, *store_, clock_, config_.heartbeat)
    , engine_(self_, *store_, heartbeat_, epoch_clock_, clock_, aggregator_,
              std::move(score_provider), config_.engine)
    , read_api_(heartbeat_, history_) {
    engine_.set_result_handler([this](const EpochResult& result) { on_result(result); });
}

SubnetNode::~SubnetNode() {
    stop();
}

void SubnetNode::on_result(const EpochResult& result) {
    history_.add(result);
    chain_->submit(result.epoch, to_chain_scores(result));
}

bool SubnetNode::heartbeat_once() {
    return heartbeat_.refresh();
}

void SubnetNode::tick_once() {
    engine_.tick();
}

void SubnetNode::start() {
    if (running()) {
        return;
    }

    // Fail fast rather than run as epoch 0
    timestamp_t now = clock_.now();
    epoch_t epoch = epoch_clock_.current_epoch(now);
    MESH_LOG_INFO(log::node) << "Starting node " << short_id(self_) << " in epoch " << epoch
                             << " (" << phase_string(epoch_clock_.current_phase(now)) << ")";

    heartbeat_task_ = std::make_unique<PeriodicTask>(
        "heartbeat",
        std::chrono::duration_cast<std::chrono::milliseconds>(config_.heartbeat.interval),
        [this]() { heartbeat_once(); });
    engine_task_ = std::make_unique<PeriodicTask>(
        "engine", config_.tick_interval, [this]() { tick_once(); });

    heartbeat_task_->start();
    engine_task_->start();
}

void SubnetNode::stop() {
    if (engine_task_) {
        engine_task_->stop();
        engine_task_.reset();
    }
    if (heartbeat_task_) {
        heartbeat_task_->stop();
        heartbeat_task_.reset();
    }
}

bool SubnetNode::running() const {
    return engine_task_ && engine_task_->running();
}

}  // namespace mesh
