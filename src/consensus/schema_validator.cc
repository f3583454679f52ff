#include "schema_validator.hh"
#include "consensus/commit_reveal.hh"
#include "consensus/heartbeat.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include <cmath>

namespace mesh {

void SchemaConfig::validate() const {
    if (!(heartbeat_max_ttl_epochs > 0.0) || !std::isfinite(heartbeat_max_ttl_epochs)) {
        throw ConfigError("schema.heartbeat_max_ttl_epochs must be positive");
    }
    if (!(record_max_ttl_epochs > 0.0) || !std::isfinite(record_max_ttl_epochs)) {
        throw ConfigError("schema.record_max_ttl_epochs must be positive");
    }
    if (heartbeat_limit == 0 || commit_limit == 0 || reveal_limit == 0) {
        throw ConfigError("schema store limits must be at least 1");
    }
    if (max_epoch_history == 0) {
        throw ConfigError("schema.max_epoch_history must be at least 1");
    }
}

CommitRevealSchemaValidator::CommitRevealSchemaValidator(EpochClock epoch_clock,
                                                         const Clock& clock,
                                                         SchemaConfig config)
    : epoch_clock_(std::move(epoch_clock))
    , clock_(clock)
    , config_(config) {
    config_.validate();
}

std::optional<CommitRevealSchemaValidator::KeyType>
CommitRevealSchemaValidator::key_type(std::string_view key) {
    if (key == NODES_KEY) return KeyType::NODE;
    if (key == COMMITS_KEY) return KeyType::COMMIT;
    if (key == REVEALS_KEY) return KeyType::REVEAL;
    return std::nullopt;
}

std::uint32_t CommitRevealSchemaValidator::limit_for(KeyType type) const {
    switch (type) {
        case KeyType::NODE:   return config_.heartbeat_limit;
        case KeyType::COMMIT: return config_.commit_limit;
        case KeyType::REVEAL: return config_.reveal_limit;
    }
    return 1;
}

timestamp_t CommitRevealSchemaValidator::max_ttl_for(KeyType type) const {
    double epochs = type == KeyType::NODE ? config_.heartbeat_max_ttl_epochs
                                          : config_.record_max_ttl_epochs;
    return timestamp_t{static_cast<std::int64_t>(
        std::llround(static_cast<double>(epoch_clock_.epoch_length().count()) * epochs))};
}

bool CommitRevealSchemaValidator::check_payload(const DHTRecord& record, KeyType type,
                                                const peer_id_t& author, epoch_t epoch,
                                                timestamp_t now) const {
    switch (type) {
        case KeyType::NODE: {
            auto entry = NodeLivenessEntry::deserialize(record.value);
            if (!entry || entry->peer_id != author) {
                MESH_LOG_DEBUG(log::validation) << "Bad liveness entry from " << short_id(author);
                return false;
            }
            return true;
        }
        case KeyType::COMMIT: {
            auto commitment = CommitmentRecord::deserialize(record.value);
            if (!commitment || commitment->author != author) {
                MESH_LOG_DEBUG(log::validation) << "Bad commitment from " << short_id(author);
                return false;
            }
            if (commitment->epoch != epoch) {
                MESH_LOG_DEBUG(log::validation) << "Commitment from " << short_id(author)
                                                << " for epoch " << commitment->epoch
                                                << " during epoch " << epoch;
                return false;
            }
            if (!epoch_clock_.within_phase(commitment->epoch, Phase::COMMIT, now)) {
                MESH_LOG_DEBUG(log::validation) << "Commitment from " << short_id(author)
                                                << " for epoch " << commitment->epoch
                                                << " outside its commit window";
                return false;
            }
            return true;
        }
        case KeyType::REVEAL: {
            auto reveal = RevealRecord::deserialize(record.value);
            if (!reveal || reveal->author != author) {
                MESH_LOG_DEBUG(log::validation) << "Bad reveal from " << short_id(author);
                return false;
            }
            if (reveal->epoch != epoch) {
                MESH_LOG_DEBUG(log::validation) << "Reveal from " << short_id(author)
                                                << " for epoch " << reveal->epoch
                                                << " during epoch " << epoch;
                return false;
            }
            if (!epoch_clock_.within_phase(reveal->epoch, Phase::REVEAL, now)) {
                MESH_LOG_DEBUG(log::validation) << "Reveal from " << short_id(author)
                                                << " for epoch " << reveal->epoch
                                                << " outside its reveal window";
                return false;
            }
            return true;
        }
    }
    return false;
}

bool CommitRevealSchemaValidator::validate(const DHTRecord& record, RequestType type) {
    auto author = peer_id_from_hex(record.subkey);
    if (!author) {
        MESH_LOG_DEBUG(log::validation) << "Subkey of " << record.key << " is not a peer id";
        return false;
    }

    if (type == RequestType::GET) {
        return true;
    }

    auto kind = key_type(record.key);
    if (!kind) {
        MESH_LOG_WARN(log::validation) << "Rejected write to unknown key " << record.key
                                       << " from " << short_id(*author);
        return false;
    }

    timestamp_t now = clock_.now();
    epoch_t epoch = 0;
    try {
        epoch = epoch_clock_.current_epoch(now);
    } catch (const ClockError& e) {
        MESH_LOG_WARN(log::validation) << "Rejected write before genesis: " << e.what();
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    cleanup(epoch);

    auto& count = tracker_[epoch][{*kind, *author}];
    if (count >= limit_for(*kind)) {
        MESH_LOG_DEBUG(log::validation) << "Peer " << short_id(*author) << " exceeded store limit for "
                                        << record.key << " in epoch " << epoch
                                        << " (" << count << "/" << limit_for(*kind) << ")";
        return false;
    }

    if (record.expiration_time > now + max_ttl_for(*kind)) {
        MESH_LOG_DEBUG(log::validation) << "Expiration too far ahead for " << record.key
                                        << " from " << short_id(*author);
        return false;
    }

    if (!check_payload(record, *kind, *author, epoch, now)) {
        return false;
    }

    ++count;
    return true;
}

void CommitRevealSchemaValidator::cleanup(epoch_t current_epoch) {
    if (current_epoch <= config_.max_epoch_history) {
        return;
    }
    epoch_t oldest = current_epoch - config_.max_epoch_history;
    auto end = tracker_.lower_bound(oldest);
    for (auto it = tracker_.begin(); it != end; ++it) {
        MESH_LOG_TRACE(log::validation) << "Dropped store counters for epoch " << it->first;
    }
    tracker_.erase(tracker_.begin(), end);
}

std::uint32_t CommitRevealSchemaValidator::store_count(epoch_t epoch, KeyType type,
                                                       const peer_id_t& peer) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = tracker_.find(epoch);
    if (it == tracker_.end()) {
        return 0;
    }
    auto cit = it->second.find({type, peer});
    return cit == it->second.end() ? 0 : cit->second;
}

std::size_t CommitRevealSchemaValidator::tracked_epochs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracker_.size();
}

}  // namespace mesh
