#pragma once

#include "dht/record.hh"
#include <mutex>
#include <unordered_map>

namespace mesh {

// ============================================================================
// Local Storage
// ============================================================================

// The key -> {subkey -> value} map held by one peer. Concurrent writes to the
// same (key, subkey) resolve by supersedes(); expired values read as absent.
class LocalStorage {
public:
    LocalStorage() = default;

    [[nodiscard]] StoreResult store(const DHTRecord& record, timestamp_t now);

    [[nodiscard]] std::optional<SubkeyMap> get(const std::string& key, timestamp_t now) const;
    [[nodiscard]] std::optional<StoredValue> get_subkey(const std::string& key,
                                                        const std::string& subkey,
                                                        timestamp_t now) const;

    // Drop every expired value; returns how many were removed
    std::size_t remove_expired(timestamp_t now);

    [[nodiscard]] std::size_t key_count() const;
    [[nodiscard]] std::size_t value_count() const;

private:
    std::unordered_map<std::string, SubkeyMap> data_;
    mutable std::mutex mutex_;
};

}  // namespace mesh
