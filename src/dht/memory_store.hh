#pragma once

#include "dht/store.hh"
#include "dht/local_storage.hh"
#include "dht/validation.hh"
#include "core/clock.hh"
#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace mesh {

// ============================================================================
// In-Memory Store Hub
// ============================================================================

// Shared state behind a group of MemoryStore views. Every view owns a replica;
// a write lands in the writer's replica at once and in every other replica
// after `propagation_delay` (or on propagate()).
class MemoryStoreHub {
public:
    explicit MemoryStoreHub(const Clock& clock, timestamp_t propagation_delay = timestamp_t{0});

    MemoryStoreHub(const MemoryStoreHub&) = delete;
    MemoryStoreHub& operator=(const MemoryStoreHub&) = delete;

    void attach(const std::string& replica);

    [[nodiscard]] StoreResult publish(const std::string& origin, const DHTRecord& record);
    [[nodiscard]] std::optional<SubkeyMap> read(const std::string& replica, const std::string& key);
    [[nodiscard]] std::optional<StoredValue> read_subkey(const std::string& replica,
                                                         const std::string& key,
                                                         const std::string& subkey);

    // Deliver every pending write regardless of delay
    void propagate();

    void set_propagation_delay(timestamp_t delay);
    void set_available(bool available) { available_.store(available); }
    [[nodiscard]] bool available() const { return available_.load(); }

    [[nodiscard]] std::size_t pending_count() const;
    [[nodiscard]] const Clock& clock() const { return clock_; }

private:
    struct PendingWrite {
        std::string target;
        DHTRecord record;
        timestamp_t visible_at;
    };

    const Clock& clock_;
    timestamp_t propagation_delay_;
    std::atomic<bool> available_{true};

    std::unordered_map<std::string, std::unique_ptr<LocalStorage>> replicas_;
    std::vector<PendingWrite> pending_;
    mutable std::mutex mutex_;

    void deliver_due(timestamp_t now, bool all);
    LocalStorage& replica(const std::string& name);
};

// ============================================================================
// In-Memory Store View
// ============================================================================

// One peer's handle on a MemoryStoreHub. Writes are signed and validated with
// the peer's validator; reads are validated and stripped back to payloads.
class MemoryStore : public ReplicatedStore {
public:
    MemoryStore(std::shared_ptr<MemoryStoreHub> hub,
                std::string name,
                std::shared_ptr<RecordValidator> validator = nullptr);

    [[nodiscard]] bool put(const std::string& key,
                           const std::string& subkey,
                           const bytes_t& value,
                           timestamp_t expires_at) override;

    [[nodiscard]] std::optional<SubkeyMap> get(const std::string& key) override;

    [[nodiscard]] std::optional<StoredValue> get_subkey(const std::string& key,
                                                        const std::string& subkey) override;

    [[nodiscard]] const std::string& name() const { return name_; }

private:
    std::shared_ptr<MemoryStoreHub> hub_;
    std::string name_;
    std::shared_ptr<RecordValidator> validator_;

    void require_available() const;
    [[nodiscard]] std::optional<StoredValue> open(const std::string& key,
                                                  const std::string& subkey,
                                                  const StoredValue& stored) const;
};

}  // namespace mesh
