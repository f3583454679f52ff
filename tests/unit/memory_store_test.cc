#include <gtest/gtest.h>
#include "dht/memory_store.hh"
#include "core/error.hh"

namespace mesh {
namespace {

class MemoryStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_.set(seconds(100));
        hub_ = std::make_shared<MemoryStoreHub>(clock_);
    }

    ManualClock clock_;
    std::shared_ptr<MemoryStoreHub> hub_;
};

TEST_F(MemoryStoreTest, WriteVisibleEverywhereWithoutDelay) {
    MemoryStore a(hub_, "a");
    MemoryStore b(hub_, "b");

    ASSERT_TRUE(a.put("nodes", "x", to_bytes("1"), seconds(200)));

    auto seen = b.get("nodes");
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen->at("x").value, to_bytes("1"));
    EXPECT_EQ(seen->at("x").timestamp, seconds(100));
    EXPECT_EQ(hub_->pending_count(), 0);
}

TEST_F(MemoryStoreTest, PropagationDelay) {
    hub_->set_propagation_delay(seconds(5));
    MemoryStore a(hub_, "a");
    MemoryStore b(hub_, "b");

    ASSERT_TRUE(a.put("nodes", "x", to_bytes("1"), seconds(200)));

    // Writer sees its own write at once
    EXPECT_TRUE(a.get_subkey("nodes", "x").has_value());
    EXPECT_FALSE(b.get_subkey("nodes", "x").has_value());
    EXPECT_EQ(hub_->pending_count(), 1);

    clock_.advance(seconds(5));
    EXPECT_TRUE(b.get_subkey("nodes", "x").has_value());
}

TEST_F(MemoryStoreTest, ForcedPropagation) {
    hub_->set_propagation_delay(seconds(60));
    MemoryStore a(hub_, "a");
    MemoryStore b(hub_, "b");

    ASSERT_TRUE(a.put("nodes", "x", to_bytes("1"), seconds(200)));
    hub_->propagate();
    EXPECT_TRUE(b.get_subkey("nodes", "x").has_value());
}

TEST_F(MemoryStoreTest, StaleWriteNotStored) {
    MemoryStore a(hub_, "a");

    ASSERT_TRUE(a.put("nodes", "x", to_bytes("1"), seconds(300)));
    // Same timestamp, earlier expiration
    EXPECT_FALSE(a.put("nodes", "x", to_bytes("2"), seconds(200)));
    EXPECT_EQ(a.get_subkey("nodes", "x")->value, to_bytes("1"));

    clock_.advance(seconds(1));
    EXPECT_TRUE(a.put("nodes", "x", to_bytes("2"), seconds(200)));
    EXPECT_EQ(a.get_subkey("nodes", "x")->value, to_bytes("2"));
}

TEST_F(MemoryStoreTest, ExpiredValuesDisappear) {
    MemoryStore a(hub_, "a");
    EXPECT_FALSE(a.put("nodes", "x", to_bytes("1"), seconds(100)));

    ASSERT_TRUE(a.put("nodes", "x", to_bytes("1"), seconds(110)));
    clock_.set(seconds(110));
    EXPECT_FALSE(a.get("nodes").has_value());
}

TEST_F(MemoryStoreTest, UnavailableThrows) {
    MemoryStore a(hub_, "a");
    hub_->set_available(false);

    EXPECT_THROW((void)a.put("nodes", "x", to_bytes("1"), seconds(200)), StoreUnavailable);
    EXPECT_THROW((void)a.get("nodes"), StoreUnavailable);
    EXPECT_THROW((void)a.get_subkey("nodes", "x"), StoreUnavailable);

    hub_->set_available(true);
    EXPECT_TRUE(a.put("nodes", "x", to_bytes("1"), seconds(200)));
}

TEST_F(MemoryStoreTest, SignedWritesAreValidatedOnRead) {
    auto kp = MLDSAKeyPair::generate();
    ASSERT_TRUE(kp.has_value());
    auto keypair = std::make_shared<const MLDSAKeyPair>(std::move(*kp));
    auto validator = std::make_shared<SignatureValidator>(keypair);

    MemoryStore writer(hub_, "writer", validator);
    MemoryStore plain(hub_, "plain");
    MemoryStore reader(hub_, "reader", validator);

    std::string own = peer_subkey(keypair->peer_id());
    ASSERT_TRUE(writer.put("nodes", own, to_bytes("alive"), seconds(200)));
    EXPECT_EQ(reader.get_subkey("nodes", own)->value, to_bytes("alive"));

    // Raw replica holds the envelope, not the payload
    EXPECT_NE(plain.get_subkey("nodes", own)->value, to_bytes("alive"));

    // A forged overwrite without a validator is dropped by validating readers
    clock_.advance(seconds(1));
    ASSERT_TRUE(plain.put("nodes", own, to_bytes("forged"), seconds(200)));
    EXPECT_FALSE(reader.get_subkey("nodes", own).has_value());
    EXPECT_FALSE(reader.get("nodes").has_value());
}

}  // namespace
}  // namespace mesh
