#pragma once

#include "dht/store.hh"
#include "dht/local_storage.hh"
#include "dht/validation.hh"
#include "core/clock.hh"
#include <atomic>
#include <memory>
#include <vector>

namespace mesh {

// ============================================================================
// DHT Configuration
// ============================================================================

struct DHTConfig {
    // Remote replicas written on put and queried on get
    std::size_t replication_factor = 5;

    void validate() const;
};

// ============================================================================
// Transport Interface
// ============================================================================

// Request/response calls to a remote peer. Connection setup, discovery and
// wire encryption live below this interface. Both calls throw
// StoreUnavailable when the peer cannot be reached.
class DHTTransport {
public:
    virtual ~DHTTransport() = default;

    [[nodiscard]] virtual std::vector<peer_id_t> peers() const = 0;

    [[nodiscard]] virtual StoreResult rpc_store(const peer_id_t& peer, const DHTRecord& record) = 0;
    [[nodiscard]] virtual std::optional<SubkeyMap> rpc_find(const peer_id_t& peer,
                                                            const std::string& key) = 0;
};

// ============================================================================
// DHT Node
// ============================================================================

// Networked store. Writes go to the local replica and to the
// `replication_factor` known peers nearest the key by XOR distance; reads
// query the same peers and keep the freshest validly signed value per subkey.
class DHTNode : public ReplicatedStore {
public:
    DHTNode(const peer_id_t& id,
            std::shared_ptr<DHTTransport> transport,
            const Clock& clock,
            DHTConfig config = DHTConfig{},
            std::shared_ptr<RecordValidator> validator = nullptr);

    // ReplicatedStore
    [[nodiscard]] bool put(const std::string& key,
                           const std::string& subkey,
                           const bytes_t& value,
                           timestamp_t expires_at) override;
    [[nodiscard]] std::optional<SubkeyMap> get(const std::string& key) override;
    [[nodiscard]] std::optional<StoredValue> get_subkey(const std::string& key,
                                                        const std::string& subkey) override;

    // Inbound RPC handlers
    [[nodiscard]] StoreResult handle_store(const DHTRecord& record);
    [[nodiscard]] std::optional<SubkeyMap> handle_find(const std::string& key) const;

    // Peers responsible for `key`, nearest first
    [[nodiscard]] std::vector<peer_id_t> nearest_peers(const std::string& key) const;

    // Drop expired values from the local replica
    std::size_t remove_expired();

    [[nodiscard]] const peer_id_t& id() const { return id_; }
    [[nodiscard]] const LocalStorage& storage() const { return storage_; }
    [[nodiscard]] std::uint64_t failed_rpcs() const { return failed_rpcs_.load(); }

private:
    peer_id_t id_;
    std::shared_ptr<DHTTransport> transport_;
    const Clock& clock_;
    DHTConfig config_;
    std::shared_ptr<RecordValidator> validator_;
    LocalStorage storage_;
    std::atomic<std::uint64_t> failed_rpcs_{0};

    void merge(const std::string& key, const SubkeyMap& incoming, SubkeyMap& merged) const;
};

}  // namespace mesh
