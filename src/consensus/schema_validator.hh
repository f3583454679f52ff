#pragma once

#include "dht/validation.hh"
#include "consensus/epoch_clock.hh"
#include "core/clock.hh"
#include <map>
#include <mutex>
#include <unordered_map>

namespace mesh {

// ============================================================================
// Schema Configuration
// ============================================================================

struct SchemaConfig {
    // Longest expiration accepted, in epochs from now
    double heartbeat_max_ttl_epochs = 1.1;
    double record_max_ttl_epochs = 5.0;

    // Writes accepted per peer per epoch
    std::uint32_t heartbeat_limit = 100;
    std::uint32_t commit_limit = 1;
    std::uint32_t reveal_limit = 1;

    // Store counters older than this many epochs are dropped
    std::uint64_t max_epoch_history = 5;

    void validate() const;
};

// ============================================================================
// Commit-Reveal Schema Validator
// ============================================================================

// Gatekeeper for writes into the commit-reveal key space. A PUT passes only if
// its key is one of NODES_KEY, COMMITS_KEY or REVEALS_KEY, its payload decodes
// and names the subkey's peer as author, commitments land in the Commit window
// and reveals in the Reveal window of the current epoch, the expiration is
// within the per-key maximum, and the author is under its per-epoch limit.
// GETs are always allowed.
//
// Runs after SignatureValidator, on the stripped payload.
class CommitRevealSchemaValidator : public RecordValidator {
public:
    CommitRevealSchemaValidator(EpochClock epoch_clock,
                                const Clock& clock,
                                SchemaConfig config = SchemaConfig{});

    [[nodiscard]] bool validate(const DHTRecord& record, RequestType type) override;
    [[nodiscard]] int priority() const override { return 0; }

    enum class KeyType : std::uint8_t {
        NODE = 0,
        COMMIT = 1,
        REVEAL = 2,
    };

    [[nodiscard]] static std::optional<KeyType> key_type(std::string_view key);

    [[nodiscard]] std::uint32_t store_count(epoch_t epoch, KeyType type, const peer_id_t& peer) const;
    [[nodiscard]] std::size_t tracked_epochs() const;

private:
    EpochClock epoch_clock_;
    const Clock& clock_;
    SchemaConfig config_;

    // epoch -> (key type, peer) -> accepted writes
    std::map<epoch_t, std::map<std::pair<KeyType, peer_id_t>, std::uint32_t>> tracker_;
    mutable std::mutex mutex_;

    // Payload decodes, names `author`, and belongs to the current `epoch`
    [[nodiscard]] bool check_payload(const DHTRecord& record, KeyType type,
                                     const peer_id_t& author, epoch_t epoch,
                                     timestamp_t now) const;
    [[nodiscard]] std::uint32_t limit_for(KeyType type) const;
    [[nodiscard]] timestamp_t max_ttl_for(KeyType type) const;
    void cleanup(epoch_t current_epoch);
};

}  // namespace mesh
