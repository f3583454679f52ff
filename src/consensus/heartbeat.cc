#include "heartbeat.hh"
#include "dht/validation.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include <algorithm>
#include <cmath>

namespace mesh {

// ============================================================================
// NodeLivenessEntry Implementation
// ============================================================================

bool NodeLivenessEntry::is_live_at(timestamp_t t) const {
    return state == NodeState::ONLINE && t < expires_at();
}

bool NodeLivenessEntry::was_live_during(timestamp_t from, timestamp_t to) const {
    return state == NodeState::ONLINE && online_since < to && from < expires_at();
}

std::vector<std::uint8_t> NodeLivenessEntry::serialize() const {
    bytes_t out;
    append_u8(out, VERSION);
    append_bytes(out, peer_id);
    append_i64(out, online_since.count());
    append_i64(out, last_heartbeat_at.count());
    append_i64(out, ttl.count());
    append_u8(out, static_cast<std::uint8_t>(state));
    append_u8(out, static_cast<std::uint8_t>(role));
    append_f64(out, throughput);
    append_string(out, public_name);
    append_string(out, version);
    return out;
}

std::optional<NodeLivenessEntry> NodeLivenessEntry::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    std::uint8_t format = 0;
    if (!reader.read_u8(format) || format != VERSION) {
        return std::nullopt;
    }

    NodeLivenessEntry entry;
    std::int64_t since = 0;
    std::int64_t heartbeat = 0;
    std::int64_t ttl = 0;
    std::uint8_t state = 0;
    std::uint8_t role = 0;

    if (!reader.read_array(entry.peer_id) ||
        !reader.read_i64(since) ||
        !reader.read_i64(heartbeat) ||
        !reader.read_i64(ttl) ||
        !reader.read_u8(state) ||
        !reader.read_u8(role) ||
        !reader.read_f64(entry.throughput) ||
        !reader.read_string(entry.public_name, 256) ||
        !reader.read_string(entry.version, 64) ||
        !reader.at_end()) {
        return std::nullopt;
    }

    if (ttl <= 0 || since > heartbeat || state > static_cast<std::uint8_t>(NodeState::ONLINE) ||
        role > static_cast<std::uint8_t>(NodeRole::VALIDATOR) ||
        !std::isfinite(entry.throughput) || entry.throughput < 0.0) {
        return std::nullopt;
    }

    entry.online_since = timestamp_t{since};
    entry.last_heartbeat_at = timestamp_t{heartbeat};
    entry.ttl = timestamp_t{ttl};
    entry.state = static_cast<NodeState>(state);
    entry.role = static_cast<NodeRole>(role);
    return entry;
}

// ============================================================================
// HeartbeatConfig
// ============================================================================

void HeartbeatConfig::validate() const {
    if (interval.count() <= 0) {
        throw ConfigError("heartbeat.interval must be positive");
    }
    if (ttl.count() <= 0) {
        throw ConfigError("heartbeat.ttl must be positive");
    }
    if (interval >= ttl) {
        throw ConfigError("heartbeat.interval must be strictly shorter than heartbeat.ttl");
    }
}

// ============================================================================
// HeartbeatTracker Implementation
// ============================================================================

HeartbeatTracker::HeartbeatTracker(const peer_id_t& self,
                                   ReplicatedStore& store,
                                   const Clock& clock,
                                   HeartbeatConfig config)
    : self_(self)
    , store_(store)
    , clock_(clock)
    , config_(std::move(config)) {
    config_.validate();
}

bool HeartbeatTracker::refresh() {
    NodeLivenessEntry entry;
    entry.peer_id = self_;
    entry.last_heartbeat_at = clock_.now();
    entry.ttl = config_.ttl;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry.state = state_;
        entry.online_since = online_since_.value_or(entry.last_heartbeat_at);
    }
    entry.role = config_.role;
    entry.public_name = config_.public_name;
    entry.version = config_.version;

    bool stored = store_.put(std::string(NODES_KEY), peer_subkey(self_),
                             entry.serialize(), entry.expires_at());
    if (!stored) {
        MESH_LOG_WARN(log::heartbeat) << "Heartbeat for " << short_id(self_) << " was not stored";
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (entry.state == NodeState::ONLINE && !online_since_) {
        online_since_ = entry.online_since;
    }
    last_refresh_ = entry.last_heartbeat_at;
    MESH_LOG_TRACE(log::heartbeat) << "Heartbeat refreshed, expires at " << entry.expires_at().count();
    return true;
}

void HeartbeatTracker::set_state(NodeState state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state != NodeState::ONLINE) {
        online_since_.reset();
    }
    state_ = state;
}

NodeState HeartbeatTracker::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<timestamp_t> HeartbeatTracker::last_refresh() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_refresh_;
}

std::vector<NodeLivenessEntry> HeartbeatTracker::decode_all(const SubkeyMap& values) const {
    std::vector<NodeLivenessEntry> result;
    for (const auto& [subkey, stored] : values) {
        auto entry = NodeLivenessEntry::deserialize(stored.value);
        if (!entry) {
            MESH_LOG_DEBUG(log::heartbeat) << "Undecodable liveness entry under " << subkey;
            continue;
        }
        if (peer_subkey(entry->peer_id) != subkey) {
            MESH_LOG_DEBUG(log::heartbeat) << "Liveness entry for " << short_id(entry->peer_id)
                                           << " stored under foreign subkey " << subkey;
            continue;
        }
        result.push_back(std::move(*entry));
    }
    std::sort(result.begin(), result.end(),
        [](const NodeLivenessEntry& a, const NodeLivenessEntry& b) { return a.peer_id < b.peer_id; });
    return result;
}

bool HeartbeatTracker::is_eligible(const peer_id_t& peer_id, timestamp_t at_time) {
    auto stored = store_.get_subkey(std::string(NODES_KEY), peer_subkey(peer_id));
    if (!stored) {
        return false;
    }
    auto entry = NodeLivenessEntry::deserialize(stored->value);
    return entry && entry->peer_id == peer_id && entry->is_live_at(at_time);
}

std::set<peer_id_t> HeartbeatTracker::eligible_peers(timestamp_t at_time) {
    std::set<peer_id_t> result;
    auto values = store_.get(std::string(NODES_KEY));
    if (!values) {
        return result;
    }
    for (const auto& entry : decode_all(*values)) {
        if (entry.is_live_at(at_time)) {
            result.insert(entry.peer_id);
        }
    }
    return result;
}

std::set<peer_id_t> HeartbeatTracker::peers_live_during(timestamp_t from, timestamp_t to) {
    std::set<peer_id_t> result;
    auto values = store_.get(std::string(NODES_KEY));
    if (!values) {
        return result;
    }
    for (const auto& entry : decode_all(*values)) {
        if (entry.was_live_during(from, to)) {
            result.insert(entry.peer_id);
        }
    }
    return result;
}

std::vector<NodeLivenessEntry> HeartbeatTracker::entries() {
    auto values = store_.get(std::string(NODES_KEY));
    if (!values) {
        return {};
    }
    return decode_all(*values);
}

}  // namespace mesh
