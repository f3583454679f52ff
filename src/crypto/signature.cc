#include "signature.hh"
#include "hash.hh"
#include "core/logging.hh"
#include <oqs/oqs.h>

namespace mesh {

// ============================================================================
// ML-DSA-65 Implementation
// ============================================================================

MLDSAKeyPair::~MLDSAKeyPair() {
    if (secret_key_) {
        secure_zero(*secret_key_);
    }
}

MLDSAKeyPair::MLDSAKeyPair(MLDSAKeyPair&& other) noexcept
    : public_key_(other.public_key_)
    , secret_key_(std::move(other.secret_key_))
    , has_secret_key_(other.has_secret_key_) {
    other.has_secret_key_ = false;
}

MLDSAKeyPair& MLDSAKeyPair::operator=(MLDSAKeyPair&& other) noexcept {
    if (this != &other) {
        if (secret_key_) {
            secure_zero(*secret_key_);
        }
        public_key_ = other.public_key_;
        secret_key_ = std::move(other.secret_key_);
        has_secret_key_ = other.has_secret_key_;
        other.has_secret_key_ = false;
    }
    return *this;
}

std::optional<MLDSAKeyPair> MLDSAKeyPair::generate() {
    OQS_SIG* sig = OQS_SIG_new(OQS_SIG_alg_ml_dsa_65);
    if (!sig) {
        log::crypto.error("Failed to create ML-DSA-65 signature context");
        return std::nullopt;
    }

    MLDSAKeyPair keypair;
    keypair.secret_key_ = std::make_unique<mldsa_secret_key_t>();
    keypair.has_secret_key_ = true;

    if (OQS_SIG_keypair(sig, keypair.public_key_.data(),
                        keypair.secret_key_->data()) != OQS_SUCCESS) {
        log::crypto.error("ML-DSA-65 key generation failed");
        OQS_SIG_free(sig);
        return std::nullopt;
    }

    OQS_SIG_free(sig);
    MESH_LOG_DEBUG(log::crypto) << "Generated ML-DSA-65 keypair for peer "
                                << short_id(keypair.peer_id());
    return keypair;
}

std::optional<MLDSAKeyPair> MLDSAKeyPair::from_keys(
    const mldsa_public_key_t& pk, const mldsa_secret_key_t& sk) {
    MLDSAKeyPair keypair;
    keypair.public_key_ = pk;
    keypair.secret_key_ = std::make_unique<mldsa_secret_key_t>(sk);
    keypair.has_secret_key_ = true;
    return keypair;
}

std::optional<MLDSAKeyPair> MLDSAKeyPair::from_public_key(
    const mldsa_public_key_t& pk) {
    MLDSAKeyPair keypair;
    keypair.public_key_ = pk;
    keypair.has_secret_key_ = false;
    return keypair;
}

const mldsa_secret_key_t* MLDSAKeyPair::secret_key() const {
    return has_secret_key_ ? secret_key_.get() : nullptr;
}

std::optional<mldsa_signature_t> MLDSAKeyPair::sign(
    std::span<const std::uint8_t> message) const {
    if (!has_secret_key_) {
        log::crypto.warn("Attempted to sign without secret key");
        return std::nullopt;
    }

    OQS_SIG* sig = OQS_SIG_new(OQS_SIG_alg_ml_dsa_65);
    if (!sig) {
        log::crypto.error("Failed to create ML-DSA-65 signature context for signing");
        return std::nullopt;
    }

    mldsa_signature_t signature{};
    std::size_t sig_len = MLDSA65_SIGNATURE_SIZE;

    if (OQS_SIG_sign(sig, signature.data(), &sig_len,
                     message.data(), message.size(),
                     secret_key_->data()) != OQS_SUCCESS) {
        log::crypto.error("ML-DSA-65 signing failed");
        OQS_SIG_free(sig);
        return std::nullopt;
    }

    OQS_SIG_free(sig);
    MESH_LOG_TRACE(log::crypto) << "Signed message of " << message.size() << " bytes";
    return signature;
}

bool MLDSAKeyPair::verify(std::span<const std::uint8_t> message,
                          const mldsa_signature_t& signature) const {
    return mldsa_verify(public_key_, message, signature);
}

peer_id_t MLDSAKeyPair::peer_id() const {
    return peer_id_from_public_key(public_key_);
}

bool mldsa_verify(const mldsa_public_key_t& public_key,
                  std::span<const std::uint8_t> message,
                  const mldsa_signature_t& signature) {
    OQS_SIG* sig = OQS_SIG_new(OQS_SIG_alg_ml_dsa_65);
    if (!sig) {
        log::crypto.error("Failed to create ML-DSA-65 context for verification");
        return false;
    }

    bool result = OQS_SIG_verify(sig, message.data(), message.size(),
                                  signature.data(), MLDSA65_SIGNATURE_SIZE,
                                  public_key.data()) == OQS_SUCCESS;

    OQS_SIG_free(sig);

    if (!result) {
        MESH_LOG_DEBUG(log::crypto) << "ML-DSA-65 signature verification failed";
    }
    return result;
}

peer_id_t peer_id_from_public_key(const mldsa_public_key_t& public_key) {
    return sha3_256(public_key);
}

}  // namespace mesh
