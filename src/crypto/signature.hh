#pragma once

#include "core/types.hh"
#include <memory>
#include <span>

namespace mesh {

// ============================================================================
// ML-DSA-65 Key Pair
// ============================================================================

class MLDSAKeyPair {
public:
    ~MLDSAKeyPair();

    MLDSAKeyPair(const MLDSAKeyPair&) = delete;
    MLDSAKeyPair& operator=(const MLDSAKeyPair&) = delete;
    MLDSAKeyPair(MLDSAKeyPair&&) noexcept;
    MLDSAKeyPair& operator=(MLDSAKeyPair&&) noexcept;

    // Generate a new random key pair
    [[nodiscard]] static std::optional<MLDSAKeyPair> generate();

    // Load from existing keys
    [[nodiscard]] static std::optional<MLDSAKeyPair> from_keys(
        const mldsa_public_key_t& pk, const mldsa_secret_key_t& sk);

    // Load public key only (for verification)
    [[nodiscard]] static std::optional<MLDSAKeyPair> from_public_key(
        const mldsa_public_key_t& pk);

    [[nodiscard]] const mldsa_public_key_t& public_key() const { return public_key_; }
    [[nodiscard]] const mldsa_secret_key_t* secret_key() const;
    [[nodiscard]] bool has_secret_key() const { return has_secret_key_; }

    // Sign a message (requires secret key)
    [[nodiscard]] std::optional<mldsa_signature_t> sign(std::span<const std::uint8_t> message) const;

    // Verify a signature (only requires public key)
    [[nodiscard]] bool verify(std::span<const std::uint8_t> message,
                               const mldsa_signature_t& signature) const;

    // SHA3-256 of the public key
    [[nodiscard]] peer_id_t peer_id() const;

private:
    MLDSAKeyPair() = default;

    mldsa_public_key_t public_key_;
    std::unique_ptr<mldsa_secret_key_t> secret_key_;
    bool has_secret_key_ = false;
};

// ============================================================================
// Standalone Verification
// ============================================================================

[[nodiscard]] bool mldsa_verify(
    const mldsa_public_key_t& public_key,
    std::span<const std::uint8_t> message,
    const mldsa_signature_t& signature);

[[nodiscard]] peer_id_t peer_id_from_public_key(const mldsa_public_key_t& public_key);

}  // namespace mesh
