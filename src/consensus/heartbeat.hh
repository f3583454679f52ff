#pragma once

#include "core/types.hh"
#include "core/clock.hh"
#include "dht/store.hh"
#include <mutex>
#include <set>
#include <vector>

namespace mesh {

// ============================================================================
// Node Info
// ============================================================================

enum class NodeState : std::uint8_t {
    OFFLINE = 0,
    JOINING = 1,
    ONLINE = 2,
};

[[nodiscard]] constexpr std::string_view node_state_string(NodeState state) {
    switch (state) {
        case NodeState::OFFLINE: return "OFFLINE";
        case NodeState::JOINING: return "JOINING";
        case NodeState::ONLINE:  return "ONLINE";
    }
    return "UNKNOWN";
}

enum class NodeRole : std::uint8_t {
    VALIDATOR = 0,
};

[[nodiscard]] constexpr std::string_view node_role_string(NodeRole role) {
    switch (role) {
        case NodeRole::VALIDATOR: return "VALIDATOR";
    }
    return "UNKNOWN";
}

// ============================================================================
// Node Liveness Entry
// ============================================================================

// Stored under NODES_KEY / peer_subkey(peer_id); expires at
// last_heartbeat_at + ttl
struct NodeLivenessEntry {
    static constexpr std::uint8_t VERSION = 1;

    peer_id_t peer_id{};
    timestamp_t online_since{0};        // First heartbeat of the current run
    timestamp_t last_heartbeat_at{0};
    timestamp_t ttl{0};
    NodeState state = NodeState::ONLINE;
    NodeRole role = NodeRole::VALIDATOR;
    double throughput = 0.0;
    std::string public_name;
    std::string version;

    [[nodiscard]] timestamp_t expires_at() const { return last_heartbeat_at + ttl; }

    // Online and not yet expired at `t`
    [[nodiscard]] bool is_live_at(timestamp_t t) const;

    // Online for some instant of [from, to), assuming no gap since
    // online_since
    [[nodiscard]] bool was_live_during(timestamp_t from, timestamp_t to) const;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<NodeLivenessEntry> deserialize(
        std::span<const std::uint8_t> data);
};

// ============================================================================
// Heartbeat Configuration
// ============================================================================

struct HeartbeatConfig {
    timestamp_t interval = seconds(20);
    timestamp_t ttl = seconds(60);

    NodeRole role = NodeRole::VALIDATOR;
    std::string public_name;
    std::string version = "0.1.0";

    // Refresh must land strictly inside the ttl
    void validate() const;
};

// ============================================================================
// Heartbeat Tracker
// ============================================================================

class HeartbeatTracker {
public:
    HeartbeatTracker(const peer_id_t& self,
                     ReplicatedStore& store,
                     const Clock& clock,
                     HeartbeatConfig config = HeartbeatConfig{});

    // Publish this node's liveness entry; false if the store did not take it.
    // StoreUnavailable propagates to the caller.
    bool refresh();

    void set_state(NodeState state);
    [[nodiscard]] NodeState state() const;

    // Liveness entry for `peer_id` exists and is unexpired at `at_time`
    [[nodiscard]] bool is_eligible(const peer_id_t& peer_id, timestamp_t at_time);

    // All peers eligible at `at_time`, self included, ascending
    [[nodiscard]] std::set<peer_id_t> eligible_peers(timestamp_t at_time);

    // Peers live at some instant of [from, to), for a node that was not
    // watching while that window was open
    [[nodiscard]] std::set<peer_id_t> peers_live_during(timestamp_t from, timestamp_t to);

    // Decoded, unexpired entries under NODES_KEY, ascending by peer id
    [[nodiscard]] std::vector<NodeLivenessEntry> entries();

    [[nodiscard]] std::optional<timestamp_t> last_refresh() const;
    [[nodiscard]] const peer_id_t& self() const { return self_; }
    [[nodiscard]] const HeartbeatConfig& config() const { return config_; }

private:
    peer_id_t self_;
    ReplicatedStore& store_;
    const Clock& clock_;
    HeartbeatConfig config_;

    NodeState state_ = NodeState::ONLINE;
    std::optional<timestamp_t> online_since_;
    std::optional<timestamp_t> last_refresh_;
    mutable std::mutex mutex_;

    [[nodiscard]] std::vector<NodeLivenessEntry> decode_all(const SubkeyMap& values) const;
};

}  // namespace mesh
