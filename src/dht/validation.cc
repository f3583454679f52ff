#include "validation.hh"
#include "core/logging.hh"
#include <algorithm>
#include <stdexcept>

namespace mesh {

std::string peer_subkey(const peer_id_t& peer_id) {
    return bytes_to_hex(peer_id);
}

// ============================================================================
// CompositeValidator Implementation
// ============================================================================

CompositeValidator::CompositeValidator(std::vector<std::shared_ptr<RecordValidator>> validators) {
    for (auto& validator : validators) {
        add(std::move(validator));
    }
}

void CompositeValidator::add(std::shared_ptr<RecordValidator> validator) {
    if (!validator) {
        return;
    }
    validators_.push_back(std::move(validator));
    std::stable_sort(validators_.begin(), validators_.end(),
        [](const auto& a, const auto& b) { return a->priority() > b->priority(); });
}

bool CompositeValidator::validate(const DHTRecord& record, RequestType type) {
    DHTRecord current = record;
    for (const auto& validator : validators_) {
        if (!validator->validate(current, type)) {
            return false;
        }
        current.value = validator->strip_value(current);
    }
    return true;
}

bytes_t CompositeValidator::sign_value(const DHTRecord& record) {
    // Lowest priority wraps first so the highest-priority layer is outermost
    DHTRecord current = record;
    for (auto it = validators_.rbegin(); it != validators_.rend(); ++it) {
        current.value = (*it)->sign_value(current);
    }
    return current.value;
}

bytes_t CompositeValidator::strip_value(const DHTRecord& record) {
    DHTRecord current = record;
    for (const auto& validator : validators_) {
        current.value = validator->strip_value(current);
    }
    return current.value;
}

// ============================================================================
// SignatureValidator Implementation
// ============================================================================

SignatureValidator::SignatureValidator(std::shared_ptr<const MLDSAKeyPair> keypair)
    : keypair_(std::move(keypair)) {
    if (!keypair_) {
        throw std::invalid_argument("SignatureValidator requires a key pair");
    }
    local_peer_id_ = keypair_->peer_id();
    local_subkey_ = peer_subkey(local_peer_id_);
}

bool SignatureValidator::validate(const DHTRecord& record, RequestType type) {
    auto owner = peer_id_from_hex(record.subkey);
    if (!owner) {
        return true;  // Not a protected record
    }

    auto envelope = SignedEnvelope::deserialize(record.value);
    if (!envelope) {
        MESH_LOG_DEBUG(log::validation) << request_type_string(type) << " " << record.key
                                        << "/" << short_id(*owner) << ": missing signature envelope";
        return false;
    }

    if (peer_id_from_public_key(envelope->public_key) != *owner) {
        MESH_LOG_DEBUG(log::validation) << record.key << "/" << short_id(*owner)
                                        << ": public key does not match subkey";
        return false;
    }

    DHTRecord unsigned_record = record;
    unsigned_record.value = envelope->payload;
    if (!mldsa_verify(envelope->public_key, record_signing_bytes(unsigned_record),
                      envelope->signature)) {
        MESH_LOG_DEBUG(log::validation) << record.key << "/" << short_id(*owner)
                                        << ": invalid signature";
        return false;
    }
    return true;
}

bytes_t SignatureValidator::sign_value(const DHTRecord& record) {
    if (record.subkey != local_subkey_) {
        return record.value;
    }

    auto signature = keypair_->sign(record_signing_bytes(record));
    if (!signature) {
        throw std::runtime_error("failed to sign record " + record.key);
    }

    SignedEnvelope envelope;
    envelope.public_key = keypair_->public_key();
    envelope.signature = *signature;
    envelope.payload = record.value;
    return envelope.serialize();
}

bytes_t SignatureValidator::strip_value(const DHTRecord& record) {
    if (!peer_id_from_hex(record.subkey)) {
        return record.value;
    }
    auto envelope = SignedEnvelope::deserialize(record.value);
    if (!envelope) {
        return record.value;
    }
    return envelope->payload;
}

}  // namespace mesh
