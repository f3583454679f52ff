#include <gtest/gtest.h>
#include "consensus/heartbeat.hh"
#include "dht/memory_store.hh"
#include "core/error.hh"

namespace mesh {
namespace {

class HeartbeatTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_.set(seconds(900));
        hub_ = std::make_shared<MemoryStoreHub>(clock_);
        store_a_ = std::make_unique<MemoryStore>(hub_, "a");
        store_b_ = std::make_unique<MemoryStore>(hub_, "b");
        peer_a_.fill(0xA1);
        peer_b_.fill(0xB2);

        config_.interval = seconds(20);
        config_.ttl = seconds(60);
        config_.public_name = "node-a";
    }

    ManualClock clock_;
    std::shared_ptr<MemoryStoreHub> hub_;
    std::unique_ptr<MemoryStore> store_a_;
    std::unique_ptr<MemoryStore> store_b_;
    peer_id_t peer_a_;
    peer_id_t peer_b_;
    HeartbeatConfig config_;
};

TEST_F(HeartbeatTest, EntrySerialization) {
    NodeLivenessEntry entry;
    entry.peer_id = peer_a_;
    entry.last_heartbeat_at = seconds(900);
    entry.ttl = seconds(60);
    entry.throughput = 12.5;
    entry.public_name = "node-a";
    entry.version = "0.1.0";

    auto restored = NodeLivenessEntry::deserialize(entry.serialize());
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->peer_id, peer_a_);
    EXPECT_EQ(restored->expires_at(), seconds(960));
    EXPECT_EQ(restored->state, NodeState::ONLINE);
    EXPECT_EQ(restored->role, NodeRole::VALIDATOR);
    EXPECT_DOUBLE_EQ(restored->throughput, 12.5);
    EXPECT_EQ(restored->public_name, "node-a");

    entry.ttl = seconds(0);
    EXPECT_FALSE(NodeLivenessEntry::deserialize(entry.serialize()).has_value());
}

TEST_F(HeartbeatTest, LivenessWindowIsHalfOpen) {
    NodeLivenessEntry entry;
    entry.last_heartbeat_at = seconds(900);
    entry.ttl = seconds(60);

    EXPECT_TRUE(entry.is_live_at(seconds(900)));
    EXPECT_TRUE(entry.is_live_at(seconds(959)));
    EXPECT_FALSE(entry.is_live_at(seconds(960)));

    entry.state = NodeState::JOINING;
    EXPECT_FALSE(entry.is_live_at(seconds(900)));
}

TEST_F(HeartbeatTest, RefreshMakesPeerEligible) {
    HeartbeatTracker a(peer_a_, *store_a_, clock_, config_);
    HeartbeatTracker b(peer_b_, *store_b_, clock_, config_);

    EXPECT_FALSE(a.last_refresh().has_value());
    ASSERT_TRUE(a.refresh());
    EXPECT_EQ(a.last_refresh(), seconds(900));

    EXPECT_TRUE(b.is_eligible(peer_a_, seconds(900)));
    EXPECT_FALSE(b.is_eligible(peer_b_, seconds(900)));

    ASSERT_TRUE(b.refresh());
    auto eligible = a.eligible_peers(clock_.now());
    EXPECT_EQ(eligible, (std::set<peer_id_t>{peer_a_, peer_b_}));

    auto entries = b.entries();
    ASSERT_EQ(entries.size(), 2);
    EXPECT_EQ(entries[0].peer_id, peer_a_);
    EXPECT_EQ(entries[0].public_name, "node-a");
}

TEST_F(HeartbeatTest, EligibilityLapsesAfterTtl) {
    HeartbeatTracker a(peer_a_, *store_a_, clock_, config_);
    ASSERT_TRUE(a.refresh());

    clock_.set(seconds(959));
    EXPECT_TRUE(a.is_eligible(peer_a_, clock_.now()));

    clock_.set(seconds(960));
    EXPECT_FALSE(a.is_eligible(peer_a_, clock_.now()));
    EXPECT_TRUE(a.eligible_peers(clock_.now()).empty());
}

TEST_F(HeartbeatTest, RefreshExtendsEligibility) {
    HeartbeatTracker a(peer_a_, *store_a_, clock_, config_);
    ASSERT_TRUE(a.refresh());

    clock_.set(seconds(920));
    ASSERT_TRUE(a.refresh());

    clock_.set(seconds(970));
    EXPECT_TRUE(a.is_eligible(peer_a_, clock_.now()));
    // An earlier instant is judged against the newest entry
    EXPECT_TRUE(a.is_eligible(peer_a_, seconds(910)));
}

TEST_F(HeartbeatTest, OnlineSinceKeptAcrossRefreshes) {
    HeartbeatTracker a(peer_a_, *store_a_, clock_, config_);
    ASSERT_TRUE(a.refresh());
    clock_.set(seconds(940));
    ASSERT_TRUE(a.refresh());

    auto entries = a.entries();
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].online_since, seconds(900));
    EXPECT_EQ(entries[0].last_heartbeat_at, seconds(940));

    // Leaving and rejoining starts a new run
    a.set_state(NodeState::JOINING);
    a.set_state(NodeState::ONLINE);
    clock_.set(seconds(950));
    ASSERT_TRUE(a.refresh());
    EXPECT_EQ(a.entries()[0].online_since, seconds(950));
}

TEST_F(HeartbeatTest, LiveDuringWindow) {
    NodeLivenessEntry entry;
    entry.online_since = seconds(930);
    entry.last_heartbeat_at = seconds(990);
    entry.ttl = seconds(60);

    EXPECT_TRUE(entry.was_live_during(seconds(900), seconds(960)));
    EXPECT_FALSE(entry.was_live_during(seconds(900), seconds(930)));
    EXPECT_FALSE(entry.was_live_during(seconds(1050), seconds(1100)));

    entry.online_since = seconds(1000);
    EXPECT_FALSE(NodeLivenessEntry::deserialize(entry.serialize()).has_value());
}

TEST_F(HeartbeatTest, PeersLiveDuringExcludesLaterJoiners) {
    HeartbeatTracker a(peer_a_, *store_a_, clock_, config_);
    HeartbeatTracker b(peer_b_, *store_b_, clock_, config_);
    ASSERT_TRUE(a.refresh());

    clock_.set(seconds(965));
    ASSERT_TRUE(a.refresh());
    ASSERT_TRUE(b.refresh());

    // Both are live now, only a was live while [900, 960) was open
    EXPECT_EQ(a.eligible_peers(seconds(900)), (std::set<peer_id_t>{peer_a_, peer_b_}));
    EXPECT_EQ(a.peers_live_during(seconds(900), seconds(960)), (std::set<peer_id_t>{peer_a_}));
}

TEST_F(HeartbeatTest, NonOnlineStateNotEligible) {
    HeartbeatTracker a(peer_a_, *store_a_, clock_, config_);
    a.set_state(NodeState::JOINING);
    EXPECT_EQ(a.state(), NodeState::JOINING);
    ASSERT_TRUE(a.refresh());

    EXPECT_FALSE(a.is_eligible(peer_a_, clock_.now()));
    EXPECT_EQ(a.entries().size(), 1);
}

TEST_F(HeartbeatTest, ForeignSubkeyIgnored) {
    HeartbeatTracker a(peer_a_, *store_a_, clock_, config_);

    NodeLivenessEntry forged;
    forged.peer_id = peer_b_;
    forged.last_heartbeat_at = clock_.now();
    forged.ttl = seconds(60);
    ASSERT_TRUE(store_a_->put(std::string(NODES_KEY), peer_subkey(peer_a_),
                              forged.serialize(), forged.expires_at()));

    EXPECT_TRUE(a.eligible_peers(clock_.now()).empty());
    EXPECT_FALSE(a.is_eligible(peer_b_, clock_.now()));
    EXPECT_FALSE(a.is_eligible(peer_a_, clock_.now()));
}

TEST_F(HeartbeatTest, UnavailableStorePropagates) {
    HeartbeatTracker a(peer_a_, *store_a_, clock_, config_);
    hub_->set_available(false);
    EXPECT_THROW(a.refresh(), StoreUnavailable);
    EXPECT_FALSE(a.last_refresh().has_value());
}

TEST_F(HeartbeatTest, ConfigValidation) {
    HeartbeatConfig config;
    EXPECT_NO_THROW(config.validate());

    config.interval = seconds(60);
    config.ttl = seconds(60);
    EXPECT_THROW(config.validate(), ConfigError);

    config.interval = seconds(0);
    EXPECT_THROW(config.validate(), ConfigError);

    HeartbeatConfig bad;
    bad.ttl = seconds(10);
    EXPECT_THROW({ HeartbeatTracker tracker(peer_a_, *store_a_, clock_, bad); }, ConfigError);
}

TEST_F(HeartbeatTest, StateNames) {
    EXPECT_EQ(node_state_string(NodeState::ONLINE), "ONLINE");
    EXPECT_EQ(node_state_string(NodeState::OFFLINE), "OFFLINE");
    EXPECT_EQ(node_role_string(NodeRole::VALIDATOR), "VALIDATOR");
}

}  // namespace
}  // namespace mesh
