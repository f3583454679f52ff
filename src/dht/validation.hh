#pragma once

#include "dht/record.hh"
#include "crypto/signature.hh"
#include <memory>
#include <vector>

namespace mesh {

// ============================================================================
// Record Validator Interface
// ============================================================================

class RecordValidator {
public:
    virtual ~RecordValidator() = default;

    // Accept or reject a record seen by this peer
    [[nodiscard]] virtual bool validate(const DHTRecord& record, RequestType type) = 0;

    // Wrap a locally written value before it leaves this peer
    [[nodiscard]] virtual bytes_t sign_value(const DHTRecord& record) { return record.value; }

    // Undo sign_value so lower-priority validators see the bare payload
    [[nodiscard]] virtual bytes_t strip_value(const DHTRecord& record) { return record.value; }

    // Higher runs first on validation
    [[nodiscard]] virtual int priority() const { return 0; }
};

// ============================================================================
// Composite Validator
// ============================================================================

class CompositeValidator : public RecordValidator {
public:
    CompositeValidator() = default;
    explicit CompositeValidator(std::vector<std::shared_ptr<RecordValidator>> validators);

    void add(std::shared_ptr<RecordValidator> validator);

    [[nodiscard]] bool validate(const DHTRecord& record, RequestType type) override;
    [[nodiscard]] bytes_t sign_value(const DHTRecord& record) override;
    [[nodiscard]] bytes_t strip_value(const DHTRecord& record) override;

    [[nodiscard]] std::size_t size() const { return validators_.size(); }

private:
    std::vector<std::shared_ptr<RecordValidator>> validators_;  // Descending priority
};

// ============================================================================
// Signature Validator
// ============================================================================

// A record whose subkey is a hex peer id is owned by that peer. Its value must
// be a SignedEnvelope whose public key hashes to the subkey and whose
// signature covers key, subkey, payload, expiration and timestamp.
// Records under other subkeys pass through untouched.
class SignatureValidator : public RecordValidator {
public:
    static constexpr int PRIORITY = 10;

    explicit SignatureValidator(std::shared_ptr<const MLDSAKeyPair> keypair);

    [[nodiscard]] bool validate(const DHTRecord& record, RequestType type) override;
    [[nodiscard]] bytes_t sign_value(const DHTRecord& record) override;
    [[nodiscard]] bytes_t strip_value(const DHTRecord& record) override;
    [[nodiscard]] int priority() const override { return PRIORITY; }

    [[nodiscard]] const peer_id_t& local_peer_id() const { return local_peer_id_; }
    [[nodiscard]] const std::string& local_subkey() const { return local_subkey_; }

private:
    std::shared_ptr<const MLDSAKeyPair> keypair_;
    peer_id_t local_peer_id_;
    std::string local_subkey_;
};

// Subkey under which a peer writes its own records
[[nodiscard]] std::string peer_subkey(const peer_id_t& peer_id);

}  // namespace mesh
