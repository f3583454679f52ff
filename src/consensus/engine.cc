#include "engine.hh"
#include "dht/validation.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include "crypto/hash.hh"
#include <cmath>

namespace mesh {

void EngineConfig::validate() const {
    if (settle_delay.count() < 0) {
        throw ConfigError("engine.settle_delay must not be negative");
    }
    if (!std::isfinite(record_ttl_epochs) || record_ttl_epochs < 1.0) {
        throw ConfigError("engine.record_ttl_epochs must be at least 1");
    }
    if (max_tracked_epochs < 2) {
        throw ConfigError("engine.max_tracked_epochs must be at least 2");
    }
}

CommitRevealEngine::CommitRevealEngine(const peer_id_t& self,
                                       ReplicatedStore& store,
                                       HeartbeatTracker& heartbeat,
                                       const EpochClock& epoch_clock,
                                       const Clock& clock,
                                       const ScoreAggregator& aggregator,
                                       ScoreProvider score_provider,
                                       EngineConfig config)
    : self_(self)
    , store_(store)
    , heartbeat_(heartbeat)
    , epoch_clock_(epoch_clock)
    , clock_(clock)
    , aggregator_(aggregator)
    , score_provider_(std::move(score_provider))
    , config_(config) {
    config_.validate();
    if (!score_provider_) {
        throw ConfigError("engine requires a score provider");
    }
    if (config_.settle_delay >= epoch_clock_.config().settle_window) {
        throw ConfigError("engine.settle_delay must be shorter than the settle window");
    }
}

void CommitRevealEngine::set_result_handler(ResultHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    result_handler_ = std::move(handler);
}

timestamp_t CommitRevealEngine::record_expiration(timestamp_t now) const {
    auto ttl = static_cast<double>(epoch_clock_.epoch_length().count()) * config_.record_ttl_epochs;
    return now + timestamp_t{static_cast<std::int64_t>(std::llround(ttl))};
}

void CommitRevealEngine::tick() {
    tick(clock_.now());
}

void CommitRevealEngine::tick(timestamp_t now) {
    epoch_t epoch = epoch_clock_.current_epoch(now);
    Phase phase = epoch_clock_.current_phase(now);

    std::optional<EpochResult> settled;
    ResultHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        close_stale(epoch);

        EpochState* st = state_for(epoch, phase);
        if (!st || st->state == EngineState::SETTLED || st->missed) {
            return;
        }

        switch (phase) {
            case Phase::COMMIT:
                st->saw_commit_phase = true;
                observe_eligibility(*st, now);
                if (st->state == EngineState::IDLE) {
                    try_commit(*st, now);
                }
                break;

            case Phase::REVEAL:
                if (st->state == EngineState::COMMITTED) {
                    try_reveal(*st, now);
                }
                poll_commitments(*st);
                break;

            case Phase::SETTLED:
                if (now >= epoch_clock_.phase_start(epoch, Phase::SETTLED) + config_.settle_delay) {
                    settled = settle(*st, now);
                }
                break;
        }

        if (settled) {
            handler = result_handler_;
        }
    }

    // Outside the lock so the handler may call back into the engine
    if (settled && handler) {
        try {
            handler(*settled);
        } catch (const std::exception& e) {
            MESH_LOG_ERROR(log::consensus) << "Result handler failed for epoch " << settled->epoch
                                           << ": " << e.what();
        }
    }
}

CommitRevealEngine::EpochState* CommitRevealEngine::state_for(epoch_t epoch, Phase phase) {
    auto it = epochs_.find(epoch);
    if (it != epochs_.end()) {
        return it->second.get();
    }

    if (!epochs_.empty() && epoch < epochs_.rbegin()->first) {
        MESH_LOG_WARN(log::consensus) << "Clock moved back to epoch " << epoch
                                      << " after epoch " << epochs_.rbegin()->first << "; ignoring tick";
        return nullptr;
    }

    auto st = std::make_unique<EpochState>(epoch);
    if (phase != Phase::COMMIT) {
        MESH_LOG_INFO(log::consensus) << "Joined epoch " << epoch << " in " << phase_string(phase)
                                      << "; not committing this epoch";
    }
    EpochState* ptr = st.get();
    epochs_.emplace(epoch, std::move(st));

    // The new epoch is the newest, so pruning from the front never reaches it
    while (epochs_.size() > config_.max_tracked_epochs) {
        epochs_.erase(epochs_.begin());
    }
    return ptr;
}

void CommitRevealEngine::close_stale(epoch_t current) {
    for (auto& [epoch, st] : epochs_) {
        if (epoch >= current || st->state == EngineState::SETTLED || st->missed) {
            continue;
        }
        // The Settled window passed without a settlement; records may already
        // be overwritten by the next epoch, so do not settle late
        st->missed = true;
        ++stats_.epochs_missed;
        MESH_LOG_WARN(log::consensus) << "Epoch " << epoch << " closed in state "
                                      << engine_state_string(st->state) << " without settling";
    }
}

void CommitRevealEngine::observe_eligibility(EpochState& st, timestamp_t now) {
    try {
        auto eligible = heartbeat_.eligible_peers(now);
        st.eligible_authors.insert(eligible.begin(), eligible.end());
    } catch (const StoreUnavailable& e) {
        ++stats_.store_failures;
        MESH_LOG_WARN(log::heartbeat) << "Eligibility read failed: " << e.what();
    }
}

// ============================================================================
// Commit
// ============================================================================

void CommitRevealEngine::try_commit(EpochState& st, timestamp_t now) {
    if (!st.eligible_authors.contains(self_)) {
        MESH_LOG_DEBUG(log::commit) << "Not live in epoch " << st.epoch << "; commit deferred";
        return;
    }

    if (!st.own) {
        std::set<peer_id_t> targets = st.eligible_authors;
        targets.erase(self_);

        ScoreVector provided = score_provider_(st.epoch, targets);
        ScoreVector scores;
        for (const auto& [target, score] : provided) {
            if (targets.contains(target)) {
                scores.emplace(target, score);
            }
        }
        if (!validate_score_vector(scores)) {
            MESH_LOG_ERROR(log::commit) << "Score provider returned an invalid vector for epoch "
                                        << st.epoch << "; not committing";
            return;
        }

        RevealRecord own;
        own.epoch = st.epoch;
        own.author = self_;
        own.salt = random_salt();
        own.scores = std::move(scores);
        st.own = std::move(own);
    }

    CommitmentRecord commitment;
    commitment.epoch = st.epoch;
    commitment.author = self_;
    commitment.commitment_hash = st.own->commitment_hash();
    commitment.submitted_at = now;

    bool stored = false;
    try {
        stored = store_.put(std::string(COMMITS_KEY), peer_subkey(self_),
                            commitment.serialize(), record_expiration(now));
    } catch (const StoreUnavailable& e) {
        ++stats_.store_failures;
        MESH_LOG_WARN(log::commit) << "Commit for epoch " << st.epoch << " failed, retrying: " << e.what();
        return;
    }

    if (!stored) {
        MESH_LOG_WARN(log::commit) << "Commit for epoch " << st.epoch << " not accepted by the store";
        return;
    }

    st.state = EngineState::COMMITTED;
    st.commitments.add(commitment);
    ++stats_.commits_published;
    MESH_LOG_INFO(log::commit) << "Committed to " << st.own->scores.size()
                               << " scores for epoch " << st.epoch;
}

// ============================================================================
// Reveal
// ============================================================================

void CommitRevealEngine::try_reveal(EpochState& st, timestamp_t now) {
    if (!st.own) {
        return;
    }

    RevealRecord reveal = *st.own;
    reveal.submitted_at = now;

    bool stored = false;
    try {
        stored = store_.put(std::string(REVEALS_KEY), peer_subkey(self_),
                            reveal.serialize(), record_expiration(now));
    } catch (const StoreUnavailable& e) {
        ++stats_.store_failures;
        MESH_LOG_WARN(log::reveal) << "Reveal for epoch " << st.epoch << " failed, retrying: " << e.what();
        return;
    }

    if (!stored) {
        MESH_LOG_WARN(log::reveal) << "Reveal for epoch " << st.epoch << " not accepted by the store";
        return;
    }

    st.own->submitted_at = now;
    st.state = EngineState::REVEALED;
    st.reveals.add(reveal);
    ++stats_.reveals_published;
    MESH_LOG_INFO(log::reveal) << "Revealed scores for epoch " << st.epoch;
}

// ============================================================================
// Polling
// ============================================================================

bool CommitRevealEngine::poll_commitments(EpochState& st) {
    std::optional<SubkeyMap> values;
    try {
        values = store_.get(std::string(COMMITS_KEY));
    } catch (const StoreUnavailable& e) {
        ++stats_.store_failures;
        MESH_LOG_WARN(log::commit) << "Polling commitments failed: " << e.what();
        return false;
    }
    if (!values) {
        return true;
    }

    for (const auto& [subkey, stored] : *values) {
        auto commitment = CommitmentRecord::deserialize(stored.value);
        if (!commitment) {
            MESH_LOG_DEBUG(log::commit) << "Undecodable commitment under " << subkey;
            continue;
        }
        if (commitment->epoch != st.epoch) {
            continue;
        }
        if (peer_subkey(commitment->author) != subkey) {
            MESH_LOG_DEBUG(log::commit) << "Commitment by " << short_id(commitment->author)
                                        << " under foreign subkey " << subkey;
            continue;
        }
        st.commitments.add(*commitment);
    }
    return true;
}

bool CommitRevealEngine::poll_reveals(EpochState& st) {
    std::optional<SubkeyMap> values;
    try {
        values = store_.get(std::string(REVEALS_KEY));
    } catch (const StoreUnavailable& e) {
        ++stats_.store_failures;
        MESH_LOG_WARN(log::reveal) << "Polling reveals failed: " << e.what();
        return false;
    }
    if (!values) {
        return true;
    }

    for (const auto& [subkey, stored] : *values) {
        auto reveal = RevealRecord::deserialize(stored.value);
        if (!reveal) {
            MESH_LOG_DEBUG(log::reveal) << "Undecodable reveal under " << subkey;
            continue;
        }
        if (reveal->epoch != st.epoch) {
            continue;
        }
        if (peer_subkey(reveal->author) != subkey) {
            MESH_LOG_DEBUG(log::reveal) << "Reveal by " << short_id(reveal->author)
                                        << " under foreign subkey " << subkey;
            continue;
        }
        st.reveals.add(*reveal);
    }
    return true;
}

// ============================================================================
// Settlement
// ============================================================================

std::optional<EpochResult> CommitRevealEngine::settle(EpochState& st, timestamp_t now) {
    if (!poll_commitments(st) || !poll_reveals(st)) {
        return std::nullopt;  // Retry on the next tick
    }

    if (!st.saw_commit_phase) {
        // Started after the Commit window; fall back to peers that were live
        // at some point while it was open, as a watching node would record
        try {
            auto eligible = heartbeat_.peers_live_during(
                epoch_clock_.phase_start(st.epoch, Phase::COMMIT),
                epoch_clock_.phase_deadline(st.epoch, Phase::COMMIT));
            st.eligible_authors.insert(eligible.begin(), eligible.end());
        } catch (const StoreUnavailable& e) {
            ++stats_.store_failures;
            MESH_LOG_WARN(log::consensus) << "Eligibility read failed at settlement: " << e.what();
            return std::nullopt;
        }
    }

    RevealValidation validation = validate_reveals(st.commitments, st.reveals,
                                                   epoch_clock_, st.eligible_authors);

    EpochResult result = aggregator_.aggregate(st.epoch, validation.accepted, st.eligible_authors);
    result.settled_at = now;

    st.result = result;
    st.state = EngineState::SETTLED;
    ++stats_.epochs_settled;

    MESH_LOG_INFO(log::consensus) << "Settled epoch " << st.epoch << ": "
                                  << validation.accepted.size() << " valid reveals, "
                                  << validation.rejected.size() << " rejected, "
                                  << validation.missing.size() << " missing";
    return result;
}

// ============================================================================
// Accessors
// ============================================================================

EngineState CommitRevealEngine::state(epoch_t epoch) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = epochs_.find(epoch);
    return it == epochs_.end() ? EngineState::IDLE : it->second->state;
}

std::optional<EpochResult> CommitRevealEngine::result(epoch_t epoch) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = epochs_.find(epoch);
    if (it == epochs_.end()) {
        return std::nullopt;
    }
    return it->second->result;
}

std::optional<RevealRecord> CommitRevealEngine::own_reveal(epoch_t epoch) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = epochs_.find(epoch);
    if (it == epochs_.end()) {
        return std::nullopt;
    }
    return it->second->own;
}

EngineStats CommitRevealEngine::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

}  // namespace mesh
