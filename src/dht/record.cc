#include "record.hh"
#include <algorithm>

namespace mesh {

namespace {

constexpr std::string_view RECORD_DOMAIN = "mesh.record.v1";
constexpr std::uint8_t ENVELOPE_VERSION = 1;

}  // namespace

// ============================================================================
// DHTRecord
// ============================================================================

std::vector<std::uint8_t> DHTRecord::serialize() const {
    bytes_t out;
    out.reserve(32 + key.size() + subkey.size() + value.size());
    append_string(out, key);
    append_string(out, subkey);
    append_blob(out, value);
    append_i64(out, expiration_time.count());
    append_i64(out, timestamp.count());
    return out;
}

std::optional<DHTRecord> DHTRecord::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    DHTRecord record;
    std::int64_t expiration = 0;
    std::int64_t ts = 0;

    if (!reader.read_string(record.key) ||
        !reader.read_string(record.subkey) ||
        !reader.read_blob(record.value) ||
        !reader.read_i64(expiration) ||
        !reader.read_i64(ts) ||
        !reader.at_end()) {
        return std::nullopt;
    }

    record.expiration_time = timestamp_t{expiration};
    record.timestamp = timestamp_t{ts};
    return record;
}

bytes_t record_signing_bytes(const DHTRecord& record) {
    bytes_t out;
    append_string(out, RECORD_DOMAIN);
    append_string(out, record.key);
    append_string(out, record.subkey);
    append_blob(out, record.value);
    append_i64(out, record.expiration_time.count());
    append_i64(out, record.timestamp.count());
    return out;
}

bool supersedes(const StoredValue& candidate, const StoredValue& current) {
    if (candidate.timestamp != current.timestamp) {
        return candidate.timestamp > current.timestamp;
    }
    if (candidate.expiration != current.expiration) {
        return candidate.expiration > current.expiration;
    }
    return std::lexicographical_compare(current.value.begin(), current.value.end(),
                                        candidate.value.begin(), candidate.value.end());
}

// ============================================================================
// SignedEnvelope
// ============================================================================

std::vector<std::uint8_t> SignedEnvelope::serialize() const {
    bytes_t out;
    out.reserve(1 + public_key.size() + signature.size() + 4 + payload.size());
    append_u8(out, ENVELOPE_VERSION);
    append_bytes(out, public_key);
    append_bytes(out, signature);
    append_blob(out, payload);
    return out;
}

std::optional<SignedEnvelope> SignedEnvelope::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    std::uint8_t version = 0;
    if (!reader.read_u8(version) || version != ENVELOPE_VERSION) {
        return std::nullopt;
    }

    SignedEnvelope envelope;
    if (!reader.read_array(envelope.public_key) ||
        !reader.read_array(envelope.signature) ||
        !reader.read_blob(envelope.payload) ||
        !reader.at_end()) {
        return std::nullopt;
    }
    return envelope;
}

}  // namespace mesh
