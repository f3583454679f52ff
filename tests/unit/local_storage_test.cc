#include <gtest/gtest.h>
#include "dht/local_storage.hh"

using namespace mesh;

namespace {

DHTRecord make_record(const std::string& subkey, std::string_view value,
                      timestamp_t timestamp, timestamp_t expiration) {
    return DHTRecord{"nodes", subkey, to_bytes(value), expiration, timestamp};
}

}  // namespace

// ============================================================================
// DHTRecord Tests
// ============================================================================

TEST(DHTRecordTest, Serialization) {
    DHTRecord record = make_record("ab", "payload", seconds(10), seconds(70));

    auto bytes = record.serialize();
    auto restored = DHTRecord::deserialize(bytes);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->key, "nodes");
    EXPECT_EQ(restored->subkey, "ab");
    EXPECT_EQ(restored->value, to_bytes("payload"));
    EXPECT_EQ(restored->expiration_time, seconds(70));
    EXPECT_EQ(restored->timestamp, seconds(10));

    bytes.push_back(0);  // Trailing garbage
    EXPECT_FALSE(DHTRecord::deserialize(bytes).has_value());
}

TEST(DHTRecordTest, SigningBytesCoverEveryField) {
    DHTRecord base = make_record("ab", "v", seconds(1), seconds(2));
    auto reference = record_signing_bytes(base);

    DHTRecord other = base;
    other.key = "commits";
    EXPECT_NE(record_signing_bytes(other), reference);

    other = base;
    other.timestamp = seconds(3);
    EXPECT_NE(record_signing_bytes(other), reference);

    other = base;
    other.expiration_time = seconds(9);
    EXPECT_NE(record_signing_bytes(other), reference);
}

TEST(DHTRecordTest, Supersedes) {
    StoredValue older{to_bytes("b"), seconds(100), seconds(1)};
    StoredValue newer{to_bytes("a"), seconds(50), seconds(2)};
    EXPECT_TRUE(supersedes(newer, older));
    EXPECT_FALSE(supersedes(older, newer));

    // Same timestamp: later expiration wins
    StoredValue longer{to_bytes("a"), seconds(200), seconds(1)};
    EXPECT_TRUE(supersedes(longer, older));

    // Same timestamp and expiration: larger value wins
    StoredValue larger{to_bytes("c"), seconds(100), seconds(1)};
    EXPECT_TRUE(supersedes(larger, older));
    EXPECT_FALSE(supersedes(older, larger));
    EXPECT_FALSE(supersedes(older, older));
}

TEST(SignedEnvelopeTest, RejectsTruncated) {
    SignedEnvelope envelope;
    envelope.public_key.fill(0x01);
    envelope.signature.fill(0x02);
    envelope.payload = to_bytes("body");

    auto bytes = envelope.serialize();
    auto restored = SignedEnvelope::deserialize(bytes);
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(restored->payload, to_bytes("body"));

    bytes.resize(bytes.size() - 1);
    EXPECT_FALSE(SignedEnvelope::deserialize(bytes).has_value());
    EXPECT_FALSE(SignedEnvelope::deserialize(to_bytes("plain")).has_value());
}

// ============================================================================
// LocalStorage Tests
// ============================================================================

TEST(LocalStorageTest, StoreAndGet) {
    LocalStorage storage;
    timestamp_t now = seconds(10);

    EXPECT_EQ(storage.store(make_record("a", "1", now, seconds(60)), now), StoreResult::STORED);
    EXPECT_EQ(storage.store(make_record("b", "2", now, seconds(60)), now), StoreResult::STORED);

    auto values = storage.get("nodes", now);
    ASSERT_TRUE(values.has_value());
    EXPECT_EQ(values->size(), 2);
    EXPECT_EQ(values->at("a").value, to_bytes("1"));

    EXPECT_FALSE(storage.get("commits", now).has_value());
    EXPECT_EQ(storage.key_count(), 1);
    EXPECT_EQ(storage.value_count(), 2);
}

TEST(LocalStorageTest, LastWriterWins) {
    LocalStorage storage;
    timestamp_t now = seconds(10);

    ASSERT_EQ(storage.store(make_record("a", "new", seconds(5), seconds(60)), now),
              StoreResult::STORED);
    EXPECT_EQ(storage.store(make_record("a", "old", seconds(4), seconds(90)), now),
              StoreResult::STALE);

    auto value = storage.get_subkey("nodes", "a", now);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value->value, to_bytes("new"));

    // Identical rewrite is accepted
    EXPECT_EQ(storage.store(make_record("a", "new", seconds(5), seconds(60)), now),
              StoreResult::STORED);
}

TEST(LocalStorageTest, ConflictOrderIndependent) {
    DHTRecord first = make_record("a", "x", seconds(5), seconds(60));
    DHTRecord second = make_record("a", "y", seconds(5), seconds(60));

    LocalStorage forward;
    LocalStorage backward;
    timestamp_t now = seconds(6);
    (void)forward.store(first, now);
    (void)forward.store(second, now);
    (void)backward.store(second, now);
    (void)backward.store(first, now);

    EXPECT_EQ(forward.get_subkey("nodes", "a", now)->value,
              backward.get_subkey("nodes", "a", now)->value);
    EXPECT_EQ(forward.get_subkey("nodes", "a", now)->value, to_bytes("y"));
}

TEST(LocalStorageTest, ExpiredValuesAreAbsent) {
    LocalStorage storage;

    EXPECT_EQ(storage.store(make_record("a", "1", seconds(1), seconds(5)), seconds(5)),
              StoreResult::EXPIRED);

    ASSERT_EQ(storage.store(make_record("a", "1", seconds(1), seconds(20)), seconds(10)),
              StoreResult::STORED);
    EXPECT_TRUE(storage.get_subkey("nodes", "a", seconds(19)).has_value());
    EXPECT_FALSE(storage.get_subkey("nodes", "a", seconds(20)).has_value());
    EXPECT_FALSE(storage.get("nodes", seconds(20)).has_value());

    // An expired value no longer blocks an older write
    EXPECT_EQ(storage.store(make_record("a", "2", seconds(0), seconds(40)), seconds(25)),
              StoreResult::STORED);
}

TEST(LocalStorageTest, RemoveExpired) {
    LocalStorage storage;
    (void)storage.store(make_record("a", "1", seconds(1), seconds(5)), seconds(1));
    (void)storage.store(make_record("b", "2", seconds(1), seconds(50)), seconds(1));

    EXPECT_EQ(storage.remove_expired(seconds(10)), 1);
    EXPECT_EQ(storage.value_count(), 1);
    EXPECT_EQ(storage.remove_expired(seconds(60)), 1);
    EXPECT_EQ(storage.key_count(), 0);
}

TEST(LocalStorageTest, RejectsOversizedValue) {
    LocalStorage storage;
    DHTRecord record = make_record("a", "", seconds(1), seconds(60));
    record.value.assign(MAX_VALUE_SIZE + 1, 0x00);
    EXPECT_EQ(storage.store(record, seconds(1)), StoreResult::TOO_LARGE);
}
