#include "node.hh"
#include "crypto/hash.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include <algorithm>

namespace mesh {

void DHTConfig::validate() const {
    if (replication_factor == 0) {
        throw ConfigError("dht.replication_factor must be at least 1");
    }
}

DHTNode::DHTNode(const peer_id_t& id,
                 std::shared_ptr<DHTTransport> transport,
                 const Clock& clock,
                 DHTConfig config,
                 std::shared_ptr<RecordValidator> validator)
    : id_(id)
    , transport_(std::move(transport))
    , clock_(clock)
    , config_(config)
    , validator_(std::move(validator)) {
    config_.validate();
}

std::vector<peer_id_t> DHTNode::nearest_peers(const std::string& key) const {
    std::vector<peer_id_t> peers;
    if (transport_) {
        peers = transport_->peers();
    }
    peers.erase(std::remove(peers.begin(), peers.end(), id_), peers.end());

    hash_t location = key_location(key);
    std::sort(peers.begin(), peers.end(), [&location](const peer_id_t& a, const peer_id_t& b) {
        return xor_distance(a, location) < xor_distance(b, location);
    });

    if (peers.size() > config_.replication_factor) {
        peers.resize(config_.replication_factor);
    }
    return peers;
}

// ============================================================================
// Inbound
// ============================================================================

StoreResult DHTNode::handle_store(const DHTRecord& record) {
    if (validator_ && !validator_->validate(record, RequestType::PUT)) {
        MESH_LOG_DEBUG(log::dht) << "Rejected inbound write to " << record.key << "/" << record.subkey;
        return StoreResult::REJECTED;
    }
    return storage_.store(record, clock_.now());
}

std::optional<SubkeyMap> DHTNode::handle_find(const std::string& key) const {
    return storage_.get(key, clock_.now());
}

// ============================================================================
// ReplicatedStore
// ============================================================================

bool DHTNode::put(const std::string& key,
                  const std::string& subkey,
                  const bytes_t& value,
                  timestamp_t expires_at) {
    DHTRecord record{key, subkey, value, expires_at, clock_.now()};

    if (validator_) {
        record.value = validator_->sign_value(record);
    }

    StoreResult local = handle_store(record);
    if (local != StoreResult::STORED) {
        MESH_LOG_DEBUG(log::dht) << "Local write to " << key << "/" << subkey
                                 << " failed: " << store_result_string(local);
        return false;
    }

    std::size_t acked = 0;
    auto targets = nearest_peers(key);
    for (const auto& peer : targets) {
        try {
            StoreResult remote = transport_->rpc_store(peer, record);
            if (remote == StoreResult::STORED) {
                ++acked;
            } else {
                MESH_LOG_DEBUG(log::dht) << "Peer " << short_id(peer) << " answered "
                                         << store_result_string(remote) << " for " << key;
            }
        } catch (const StoreUnavailable& e) {
            failed_rpcs_.fetch_add(1);
            MESH_LOG_WARN(log::dht) << "Store to " << short_id(peer) << " failed: " << e.what();
        }
    }

    MESH_LOG_TRACE(log::dht) << "Stored " << key << "/" << subkey << " on "
                             << acked << "/" << targets.size() << " replicas";
    return true;
}

void DHTNode::merge(const std::string& key, const SubkeyMap& incoming, SubkeyMap& merged) const {
    for (const auto& [subkey, stored] : incoming) {
        if (validator_) {
            DHTRecord record{key, subkey, stored.value, stored.expiration, stored.timestamp};
            if (!validator_->validate(record, RequestType::GET)) {
                MESH_LOG_DEBUG(log::dht) << "Dropped invalid value at " << key << "/" << subkey;
                continue;
            }
        }

        auto it = merged.find(subkey);
        if (it == merged.end()) {
            merged.emplace(subkey, stored);
        } else if (supersedes(stored, it->second)) {
            it->second = stored;
        }
    }
}

std::optional<SubkeyMap> DHTNode::get(const std::string& key) {
    SubkeyMap merged;
    if (auto local = handle_find(key)) {
        merge(key, *local, merged);
    }

    auto targets = nearest_peers(key);
    std::size_t failures = 0;
    for (const auto& peer : targets) {
        try {
            if (auto remote = transport_->rpc_find(peer, key)) {
                merge(key, *remote, merged);
            }
        } catch (const StoreUnavailable& e) {
            ++failures;
            failed_rpcs_.fetch_add(1);
            MESH_LOG_WARN(log::dht) << "Find on " << short_id(peer) << " failed: " << e.what();
        }
    }

    if (!targets.empty() && failures == targets.size() && merged.empty()) {
        throw StoreUnavailable("no replica answered for key " + key);
    }

    timestamp_t now = clock_.now();
    for (auto it = merged.begin(); it != merged.end();) {
        if (it->second.expired_at(now)) {
            it = merged.erase(it);
            continue;
        }
        if (validator_) {
            DHTRecord record{key, it->first, it->second.value, it->second.expiration, it->second.timestamp};
            it->second.value = validator_->strip_value(record);
        }
        ++it;
    }

    if (merged.empty()) {
        return std::nullopt;
    }
    return merged;
}

std::optional<StoredValue> DHTNode::get_subkey(const std::string& key, const std::string& subkey) {
    auto all = get(key);
    if (!all) {
        return std::nullopt;
    }
    auto it = all->find(subkey);
    if (it == all->end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t DHTNode::remove_expired() {
    return storage_.remove_expired(clock_.now());
}

}  // namespace mesh
