#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <chrono>
#include <compare>

namespace mesh {

// ============================================================================
// Cryptographic Constants
// ============================================================================

// ML-DSA-65 (FIPS 204 / Dilithium Level 3)
inline constexpr std::size_t MLDSA65_PUBLIC_KEY_SIZE = 1952;
inline constexpr std::size_t MLDSA65_SECRET_KEY_SIZE = 4032;
inline constexpr std::size_t MLDSA65_SIGNATURE_SIZE = 3309;  // From liboqs OQS_SIG_ml_dsa_65_length_signature

// SHA3-256 output size
inline constexpr std::size_t HASH_SIZE = 32;

// Peer ids are SHA3(public_key)
inline constexpr std::size_t PEER_ID_SIZE = HASH_SIZE;

// Commit-reveal salt
inline constexpr std::size_t SALT_SIZE = 32;

// ============================================================================
// Record Keys
// ============================================================================

inline constexpr std::string_view NODES_KEY = "nodes";
inline constexpr std::string_view COMMITS_KEY = "commits";
inline constexpr std::string_view REVEALS_KEY = "reveals";

// ============================================================================
// Score Bounds
// ============================================================================

inline constexpr double MIN_SCORE = 0.0;
inline constexpr double MAX_SCORE = 1.0;

// Largest score vector accepted from the wire
inline constexpr std::size_t MAX_SCORE_TARGETS = 10'000;

// Largest value accepted by the replicated store
inline constexpr std::size_t MAX_VALUE_SIZE = 1024 * 1024;

// ============================================================================
// Core Type Aliases
// ============================================================================

using hash_t = std::array<std::uint8_t, HASH_SIZE>;
using peer_id_t = hash_t;
using salt_t = std::array<std::uint8_t, SALT_SIZE>;
using epoch_t = std::uint64_t;
using bytes_t = std::vector<std::uint8_t>;

// ML-DSA keys and signature
using mldsa_public_key_t = std::array<std::uint8_t, MLDSA65_PUBLIC_KEY_SIZE>;
using mldsa_secret_key_t = std::array<std::uint8_t, MLDSA65_SECRET_KEY_SIZE>;
using mldsa_signature_t = std::array<std::uint8_t, MLDSA65_SIGNATURE_SIZE>;

// ============================================================================
// Time Utilities
// ============================================================================

// Microseconds since the unix epoch. Shared by all peers, so wall clock.
using timestamp_t = std::chrono::microseconds;

[[nodiscard]] inline timestamp_t seconds(std::int64_t s) {
    return std::chrono::duration_cast<timestamp_t>(std::chrono::seconds(s));
}

[[nodiscard]] inline timestamp_t milliseconds(std::int64_t ms) {
    return std::chrono::duration_cast<timestamp_t>(std::chrono::milliseconds(ms));
}

// ============================================================================
// Serialization Helpers
// ============================================================================

// Little-endian encoding
inline void encode_u16(std::uint8_t* dst, std::uint16_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
}

inline void encode_u32(std::uint8_t* dst, std::uint32_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
}

inline void encode_u64(std::uint8_t* dst, std::uint64_t val) {
    dst[0] = static_cast<std::uint8_t>(val);
    dst[1] = static_cast<std::uint8_t>(val >> 8);
    dst[2] = static_cast<std::uint8_t>(val >> 16);
    dst[3] = static_cast<std::uint8_t>(val >> 24);
    dst[4] = static_cast<std::uint8_t>(val >> 32);
    dst[5] = static_cast<std::uint8_t>(val >> 40);
    dst[6] = static_cast<std::uint8_t>(val >> 48);
    dst[7] = static_cast<std::uint8_t>(val >> 56);
}

[[nodiscard]] inline std::uint16_t decode_u16(const std::uint8_t* src) {
    return static_cast<std::uint16_t>(src[0]) |
           (static_cast<std::uint16_t>(src[1]) << 8);
}

[[nodiscard]] inline std::uint32_t decode_u32(const std::uint8_t* src) {
    return static_cast<std::uint32_t>(src[0]) |
           (static_cast<std::uint32_t>(src[1]) << 8) |
           (static_cast<std::uint32_t>(src[2]) << 16) |
           (static_cast<std::uint32_t>(src[3]) << 24);
}

[[nodiscard]] inline std::uint64_t decode_u64(const std::uint8_t* src) {
    return static_cast<std::uint64_t>(src[0]) |
           (static_cast<std::uint64_t>(src[1]) << 8) |
           (static_cast<std::uint64_t>(src[2]) << 16) |
           (static_cast<std::uint64_t>(src[3]) << 24) |
           (static_cast<std::uint64_t>(src[4]) << 32) |
           (static_cast<std::uint64_t>(src[5]) << 40) |
           (static_cast<std::uint64_t>(src[6]) << 48) |
           (static_cast<std::uint64_t>(src[7]) << 56);
}

// Append helpers for building wire buffers
void append_u8(bytes_t& out, std::uint8_t val);
void append_u32(bytes_t& out, std::uint32_t val);
void append_u64(bytes_t& out, std::uint64_t val);
void append_i64(bytes_t& out, std::int64_t val);
void append_f64(bytes_t& out, double val);
void append_bytes(bytes_t& out, std::span<const std::uint8_t> data);

// Length-prefixed (u32) byte string
void append_blob(bytes_t& out, std::span<const std::uint8_t> data);
void append_string(bytes_t& out, std::string_view str);

// ============================================================================
// Byte Reader
// ============================================================================

// Bounds-checked cursor over a wire buffer. Every read returns false once the
// buffer is exhausted and leaves the output untouched.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data)
        : data_(data) {}

    [[nodiscard]] bool read_u8(std::uint8_t& out);
    [[nodiscard]] bool read_u32(std::uint32_t& out);
    [[nodiscard]] bool read_u64(std::uint64_t& out);
    [[nodiscard]] bool read_i64(std::int64_t& out);
    [[nodiscard]] bool read_f64(double& out);
    [[nodiscard]] bool read_bytes(std::uint8_t* out, std::size_t len);
    [[nodiscard]] bool read_blob(bytes_t& out, std::size_t max_len = MAX_VALUE_SIZE);
    [[nodiscard]] bool read_string(std::string& out, std::size_t max_len = 1024);

    template<std::size_t N>
    [[nodiscard]] bool read_array(std::array<std::uint8_t, N>& out) {
        return read_bytes(out.data(), N);
    }

    [[nodiscard]] std::size_t remaining() const { return data_.size() - offset_; }
    [[nodiscard]] bool at_end() const { return offset_ == data_.size(); }

private:
    std::span<const std::uint8_t> data_;
    std::size_t offset_ = 0;
};

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

[[nodiscard]] std::string bytes_to_hex(std::span<const std::uint8_t> bytes);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex);

// Short form for log lines
[[nodiscard]] std::string short_id(const peer_id_t& id);

[[nodiscard]] std::optional<peer_id_t> peer_id_from_hex(std::string_view hex);

[[nodiscard]] inline bytes_t to_bytes(std::string_view str) {
    return bytes_t(str.begin(), str.end());
}

// ============================================================================
// Zero Memory (for sensitive data)
// ============================================================================

void secure_zero(void* ptr, std::size_t len);

template<typename T>
void secure_zero(T& container) {
    secure_zero(container.data(), container.size());
}

}  // namespace mesh

// ============================================================================
// Hash specialization for hash_t (enables use in unordered_map/unordered_set)
// ============================================================================

namespace std {

template<>
struct hash<mesh::hash_t> {
    std::size_t operator()(const mesh::hash_t& h) const noexcept {
        // Use first 8 bytes as hash (already cryptographic quality)
        std::size_t result = 0;
        for (std::size_t i = 0; i < sizeof(std::size_t) && i < h.size(); ++i) {
            result |= static_cast<std::size_t>(h[i]) << (i * 8);
        }
        return result;
    }
};

}  // namespace std
