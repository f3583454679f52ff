#pragma once

#include "core/types.hh"
#include <span>
#include <vector>

namespace mesh {

// ============================================================================
// SHA3-256 Hashing
// ============================================================================

class SHA3Hasher {
public:
    SHA3Hasher();
    ~SHA3Hasher();

    SHA3Hasher(const SHA3Hasher&) = delete;
    SHA3Hasher& operator=(const SHA3Hasher&) = delete;
    SHA3Hasher(SHA3Hasher&&) noexcept;
    SHA3Hasher& operator=(SHA3Hasher&&) noexcept;

    void update(std::span<const std::uint8_t> data);
    void update(const void* data, std::size_t len);
    void update(std::string_view str);
    void update_u64(std::uint64_t val);
    [[nodiscard]] hash_t finalize();

    void reset();

private:
    void* ctx_;
};

// Convenience functions
[[nodiscard]] hash_t sha3_256(std::span<const std::uint8_t> data);
[[nodiscard]] hash_t sha3_256(const void* data, std::size_t len);

// Hash multiple inputs (concatenated)
template<typename... Args>
[[nodiscard]] hash_t sha3_256_multi(Args&&... args) {
    SHA3Hasher hasher;
    (hasher.update(std::forward<Args>(args)), ...);
    return hasher.finalize();
}

// ============================================================================
// Secure Randomness
// ============================================================================

// OpenSSL CSPRNG. Throws std::runtime_error if the generator is not seeded.
[[nodiscard]] bytes_t random_bytes(std::size_t len);
[[nodiscard]] salt_t random_salt();

// ============================================================================
// Key Distance
// ============================================================================

// Location of a store key in the peer id space
[[nodiscard]] hash_t key_location(std::string_view key);

// XOR metric; compare results lexicographically
[[nodiscard]] hash_t xor_distance(const hash_t& a, const hash_t& b);

}  // namespace mesh
