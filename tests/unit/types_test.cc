#include <gtest/gtest.h>
#include "core/types.hh"
#include <cmath>
#include <unordered_set>

using namespace mesh;

// ============================================================================
// Hex Encoding Tests
// ============================================================================

TEST(TypesTest, BytesToHex) {
    std::vector<std::uint8_t> bytes = {0x00, 0x01, 0x0a, 0xff};
    std::string hex = bytes_to_hex(bytes);
    EXPECT_EQ(hex, "00010aff");
}

TEST(TypesTest, HexToBytes) {
    auto result = hex_to_bytes("00010aff");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), 4);
    EXPECT_EQ((*result)[0], 0x00);
    EXPECT_EQ((*result)[1], 0x01);
    EXPECT_EQ((*result)[2], 0x0a);
    EXPECT_EQ((*result)[3], 0xff);
}

TEST(TypesTest, HexToBytesWithPrefix) {
    auto result = hex_to_bytes("0x00010aff");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->size(), 4);
}

TEST(TypesTest, HexToBytesInvalid) {
    EXPECT_FALSE(hex_to_bytes("0xgg").has_value());
    EXPECT_FALSE(hex_to_bytes("123").has_value());  // Odd length
}

TEST(TypesTest, PeerIdFromHex) {
    peer_id_t id{};
    id[0] = 0xAB;
    id[31] = 0xCD;

    auto parsed = peer_id_from_hex(bytes_to_hex(id));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, id);

    EXPECT_FALSE(peer_id_from_hex("abcd").has_value());
    EXPECT_EQ(short_id(id).size(), 12);
}

// ============================================================================
// Encoding Tests
// ============================================================================

TEST(TypesTest, EncodeDecodeU16) {
    std::array<std::uint8_t, 2> buf;
    encode_u16(buf.data(), 0x1234);
    EXPECT_EQ(decode_u16(buf.data()), 0x1234);
}

TEST(TypesTest, EncodeDecodeU32) {
    std::array<std::uint8_t, 4> buf;
    encode_u32(buf.data(), 0x12345678);
    EXPECT_EQ(buf[0], 0x78);  // Little-endian
    EXPECT_EQ(decode_u32(buf.data()), 0x12345678);
}

TEST(TypesTest, EncodeDecodeU64) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), 0x123456789ABCDEF0ULL);
    EXPECT_EQ(decode_u64(buf.data()), 0x123456789ABCDEF0ULL);
}

// ============================================================================
// ByteReader Tests
// ============================================================================

TEST(ByteReaderTest, ReadsWhatWasAppended) {
    bytes_t buf;
    append_u8(buf, 7);
    append_u64(buf, 900);
    append_i64(buf, -5);
    append_f64(buf, 0.25);
    append_string(buf, "nodes");
    append_blob(buf, to_bytes("value"));

    ByteReader reader(buf);
    std::uint8_t u8 = 0;
    std::uint64_t u64 = 0;
    std::int64_t i64 = 0;
    double f64 = 0.0;
    std::string str;
    bytes_t blob;

    ASSERT_TRUE(reader.read_u8(u8));
    ASSERT_TRUE(reader.read_u64(u64));
    ASSERT_TRUE(reader.read_i64(i64));
    ASSERT_TRUE(reader.read_f64(f64));
    ASSERT_TRUE(reader.read_string(str));
    ASSERT_TRUE(reader.read_blob(blob));

    EXPECT_EQ(u8, 7);
    EXPECT_EQ(u64, 900u);
    EXPECT_EQ(i64, -5);
    EXPECT_DOUBLE_EQ(f64, 0.25);
    EXPECT_EQ(str, "nodes");
    EXPECT_EQ(blob, to_bytes("value"));
    EXPECT_TRUE(reader.at_end());
}

TEST(ByteReaderTest, TruncatedInputFails) {
    bytes_t buf;
    append_u32(buf, 100);  // Claims 100 bytes follow
    buf.push_back(1);

    ByteReader reader(buf);
    bytes_t blob;
    EXPECT_FALSE(reader.read_blob(blob));

    ByteReader short_reader(std::span<const std::uint8_t>(buf.data(), 3));
    std::uint64_t val = 0;
    EXPECT_FALSE(short_reader.read_u64(val));
    EXPECT_EQ(val, 0u);
}

TEST(ByteReaderTest, BlobLimitEnforced) {
    bytes_t buf;
    append_blob(buf, bytes_t(64, 0x11));

    ByteReader reader(buf);
    bytes_t blob;
    EXPECT_FALSE(reader.read_blob(blob, 32));
}

TEST(ByteReaderTest, NonFiniteDoublesSurvive) {
    bytes_t buf;
    append_f64(buf, std::nan(""));

    ByteReader reader(buf);
    double val = 0.0;
    ASSERT_TRUE(reader.read_f64(val));
    EXPECT_TRUE(std::isnan(val));
}

// ============================================================================
// Misc
// ============================================================================

TEST(TypesTest, TimeHelpers) {
    EXPECT_EQ(seconds(2).count(), 2'000'000);
    EXPECT_EQ(milliseconds(3).count(), 3'000);
}

TEST(TypesTest, SecureZero) {
    std::array<std::uint8_t, 16> secret;
    secret.fill(0x5A);
    secure_zero(secret);
    for (auto b : secret) {
        EXPECT_EQ(b, 0);
    }
}

TEST(TypesTest, HashUsableInUnorderedSet) {
    std::unordered_set<peer_id_t> set;
    peer_id_t a{};
    peer_id_t b{};
    b[0] = 1;
    set.insert(a);
    set.insert(b);
    set.insert(a);
    EXPECT_EQ(set.size(), 2);
}
