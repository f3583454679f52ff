#pragma once

#include "core/types.hh"
#include <map>
#include <optional>
#include <string>

namespace mesh {

// ============================================================================
// Record Types
// ============================================================================

enum class RequestType : std::uint8_t {
    GET = 0,
    PUT = 1,
};

[[nodiscard]] constexpr std::string_view request_type_string(RequestType type) {
    switch (type) {
        case RequestType::GET: return "GET";
        case RequestType::PUT: return "PUT";
    }
    return "UNKNOWN";
}

// One (key, subkey) write as it travels between peers. `timestamp` is the
// writer's own clock and decides last-writer-wins.
struct DHTRecord {
    std::string key;
    std::string subkey;
    bytes_t value;
    timestamp_t expiration_time{0};
    timestamp_t timestamp{0};

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<DHTRecord> deserialize(std::span<const std::uint8_t> data);
};

// Bytes covered by a record signature (value is the unsigned payload)
[[nodiscard]] bytes_t record_signing_bytes(const DHTRecord& record);

// A value as held by a store, with its per-subkey expiration
struct StoredValue {
    bytes_t value;
    timestamp_t expiration{0};
    timestamp_t timestamp{0};

    [[nodiscard]] bool expired_at(timestamp_t now) const { return expiration <= now; }
};

using SubkeyMap = std::map<std::string, StoredValue>;

// Last-writer-wins order: newer writer timestamp, then later expiration, then
// the larger value. Returns true when `candidate` replaces `current`.
[[nodiscard]] bool supersedes(const StoredValue& candidate, const StoredValue& current);

// ============================================================================
// Store Result
// ============================================================================

enum class StoreResult : std::uint8_t {
    STORED = 0,
    STALE = 1,       // An equal or newer value is already held
    EXPIRED = 2,
    REJECTED = 3,    // Failed validation
    TOO_LARGE = 4,
};

[[nodiscard]] constexpr std::string_view store_result_string(StoreResult result) {
    switch (result) {
        case StoreResult::STORED:    return "STORED";
        case StoreResult::STALE:     return "STALE";
        case StoreResult::EXPIRED:   return "EXPIRED";
        case StoreResult::REJECTED:  return "REJECTED";
        case StoreResult::TOO_LARGE: return "TOO_LARGE";
    }
    return "UNKNOWN";
}

// ============================================================================
// Signed Envelope
// ============================================================================

// Wire form of a value written under a peer-owned subkey
struct SignedEnvelope {
    mldsa_public_key_t public_key;
    mldsa_signature_t signature;
    bytes_t payload;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<SignedEnvelope> deserialize(std::span<const std::uint8_t> data);
};

}  // namespace mesh
