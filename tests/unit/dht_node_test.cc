#include <gtest/gtest.h>
#include "dht/node.hh"
#include "crypto/hash.hh"
#include "core/error.hh"
#include <map>
#include <set>

namespace mesh {
namespace {

// Routes RPCs straight to in-process nodes
class LoopbackTransport : public DHTTransport {
public:
    void add(DHTNode* node) { nodes_[node->id()] = node; }
    void set_offline(const peer_id_t& peer, bool offline) {
        if (offline) {
            offline_.insert(peer);
        } else {
            offline_.erase(peer);
        }
    }

    std::vector<peer_id_t> peers() const override {
        std::vector<peer_id_t> out;
        for (const auto& [id, node] : nodes_) {
            out.push_back(id);
        }
        return out;
    }

    StoreResult rpc_store(const peer_id_t& peer, const DHTRecord& record) override {
        return target(peer).handle_store(record);
    }

    std::optional<SubkeyMap> rpc_find(const peer_id_t& peer, const std::string& key) override {
        return target(peer).handle_find(key);
    }

private:
    std::map<peer_id_t, DHTNode*> nodes_;
    std::set<peer_id_t> offline_;

    DHTNode& target(const peer_id_t& peer) {
        if (offline_.contains(peer)) {
            throw StoreUnavailable("peer " + short_id(peer) + " is offline");
        }
        return *nodes_.at(peer);
    }
};

peer_id_t make_id(std::uint8_t seed) {
    return sha3_256(&seed, 1);
}

class DHTNodeTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_.set(seconds(100));
        transport_ = std::make_shared<LoopbackTransport>();
        for (std::uint8_t i = 0; i < 4; ++i) {
            nodes_.push_back(std::make_unique<DHTNode>(make_id(i), transport_, clock_));
            transport_->add(nodes_.back().get());
        }
    }

    ManualClock clock_;
    std::shared_ptr<LoopbackTransport> transport_;
    std::vector<std::unique_ptr<DHTNode>> nodes_;
};

TEST_F(DHTNodeTest, PutReplicatesToPeers) {
    ASSERT_TRUE(nodes_[0]->put("nodes", "x", to_bytes("1"), seconds(200)));

    for (const auto& node : nodes_) {
        auto local = node->handle_find("nodes");
        ASSERT_TRUE(local.has_value());
        EXPECT_EQ(local->at("x").value, to_bytes("1"));
    }

    auto seen = nodes_[3]->get("nodes");
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->at("x").value, to_bytes("1"));
}

TEST_F(DHTNodeTest, NearestPeersExcludesSelfAndIsOrdered) {
    auto peers = nodes_[0]->nearest_peers("nodes");
    ASSERT_EQ(peers.size(), 3);
    EXPECT_EQ(std::count(peers.begin(), peers.end(), nodes_[0]->id()), 0);

    hash_t location = key_location("nodes");
    for (std::size_t i = 1; i < peers.size(); ++i) {
        EXPECT_LT(xor_distance(peers[i - 1], location), xor_distance(peers[i], location));
    }
}

TEST_F(DHTNodeTest, ReplicationFactorLimitsTargets) {
    DHTConfig config;
    config.replication_factor = 1;
    DHTNode limited(make_id(9), transport_, clock_, config);
    EXPECT_EQ(limited.nearest_peers("nodes").size(), 1);

    config.replication_factor = 0;
    EXPECT_THROW({ DHTNode invalid(make_id(10), transport_, clock_, config); }, ConfigError);
}

TEST_F(DHTNodeTest, GetMergesFreshestValue) {
    ASSERT_TRUE(nodes_[0]->put("nodes", "x", to_bytes("old"), seconds(200)));

    // A newer write reaches only node 1's replica
    clock_.advance(seconds(1));
    DHTRecord newer{"nodes", "x", to_bytes("new"), seconds(200), clock_.now()};
    ASSERT_EQ(nodes_[1]->handle_store(newer), StoreResult::STORED);

    auto seen = nodes_[2]->get_subkey("nodes", "x");
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->value, to_bytes("new"));
}

TEST_F(DHTNodeTest, OfflinePeersAreTolerated) {
    transport_->set_offline(nodes_[1]->id(), true);

    EXPECT_TRUE(nodes_[0]->put("nodes", "x", to_bytes("1"), seconds(200)));
    EXPECT_EQ(nodes_[0]->failed_rpcs(), 1);
    EXPECT_FALSE(nodes_[1]->handle_find("nodes").has_value());

    auto seen = nodes_[2]->get("nodes");
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->size(), 1);
}

TEST_F(DHTNodeTest, AllPeersOfflineThrowsWhenNothingFound) {
    for (std::size_t i = 1; i < nodes_.size(); ++i) {
        transport_->set_offline(nodes_[i]->id(), true);
    }
    EXPECT_THROW((void)nodes_[0]->get("nodes"), StoreUnavailable);

    // Local data still answers
    ASSERT_TRUE(nodes_[0]->put("nodes", "x", to_bytes("1"), seconds(200)));
    EXPECT_TRUE(nodes_[0]->get("nodes").has_value());
}

TEST_F(DHTNodeTest, RemoveExpired) {
    ASSERT_TRUE(nodes_[0]->put("nodes", "x", to_bytes("1"), seconds(110)));
    clock_.set(seconds(120));
    EXPECT_FALSE(nodes_[1]->get("nodes").has_value());
    EXPECT_EQ(nodes_[0]->remove_expired(), 1);
    EXPECT_EQ(nodes_[0]->storage().value_count(), 0);
}

TEST(DHTNodeValidationTest, ForgedRecordsRejectedOnStore) {
    ManualClock clock(seconds(100));
    auto transport = std::make_shared<LoopbackTransport>();

    auto kp = MLDSAKeyPair::generate();
    ASSERT_TRUE(kp.has_value());
    auto keypair = std::make_shared<const MLDSAKeyPair>(std::move(*kp));
    auto validator = std::make_shared<SignatureValidator>(keypair);

    DHTNode writer(keypair->peer_id(), transport, clock, DHTConfig{}, validator);
    DHTNode replica(make_id(1), transport, clock, DHTConfig{}, validator);
    transport->add(&writer);
    transport->add(&replica);

    std::string own = peer_subkey(keypair->peer_id());
    ASSERT_TRUE(writer.put("nodes", own, to_bytes("alive"), seconds(200)));
    EXPECT_EQ(replica.get_subkey("nodes", own)->value, to_bytes("alive"));

    DHTRecord forged{"nodes", own, to_bytes("forged"), seconds(300), seconds(150)};
    EXPECT_EQ(replica.handle_store(forged), StoreResult::REJECTED);
}

}  // namespace
}  // namespace mesh
