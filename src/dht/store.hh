#pragma once

#include "dht/record.hh"

namespace mesh {

// ============================================================================
// Replicated Store Interface
// ============================================================================

// Eventually consistent key -> {subkey -> value} map shared by all peers.
// A get issued after a put has propagated sees a value at least as new as
// that put; before then, reads may be stale or partial.
//
// Implementations throw StoreUnavailable when the store cannot be reached.
class ReplicatedStore {
public:
    virtual ~ReplicatedStore() = default;

    // True once the write is held by at least the local replica
    [[nodiscard]] virtual bool put(const std::string& key,
                                   const std::string& subkey,
                                   const bytes_t& value,
                                   timestamp_t expires_at) = 0;

    // Unexpired values under `key`, nullopt when there are none
    [[nodiscard]] virtual std::optional<SubkeyMap> get(const std::string& key) = 0;

    [[nodiscard]] virtual std::optional<StoredValue> get_subkey(const std::string& key,
                                                                const std::string& subkey) = 0;
};

}  // namespace mesh
