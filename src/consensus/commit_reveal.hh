#pragma once

#include "core/types.hh"
#include "consensus/epoch_clock.hh"
#include <map>
#include <mutex>
#include <set>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace mesh {

// ============================================================================
// Score Vector
// ============================================================================

// Target peer id -> score. std::map keeps targets in the canonical ascending
// order used on the wire and in the commitment hash.
using ScoreVector = std::map<peer_id_t, double>;

[[nodiscard]] bool is_valid_score(double score);

// Finite scores in [MIN_SCORE, MAX_SCORE], at most MAX_SCORE_TARGETS entries
[[nodiscard]] bool validate_score_vector(const ScoreVector& scores);

void append_score_vector(bytes_t& out, const ScoreVector& scores);

// Rejects out-of-range or non-finite scores and targets that are duplicated
// or not in strictly ascending order
[[nodiscard]] bool read_score_vector(ByteReader& reader, ScoreVector& out);

// SHA3-256("mesh.commit.v1" || epoch || author || salt || canonical(scores))
[[nodiscard]] hash_t compute_commitment_hash(epoch_t epoch,
                                             const peer_id_t& author,
                                             const salt_t& salt,
                                             const ScoreVector& scores);

// ============================================================================
// Commitment Record
// ============================================================================

struct CommitmentRecord {
    static constexpr std::uint8_t VERSION = 1;

    epoch_t epoch = 0;
    peer_id_t author{};
    hash_t commitment_hash{};
    timestamp_t submitted_at{0};

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<CommitmentRecord> deserialize(
        std::span<const std::uint8_t> data);

    bool operator==(const CommitmentRecord&) const = default;
};

// ============================================================================
// Reveal Record
// ============================================================================

struct RevealRecord {
    static constexpr std::uint8_t VERSION = 1;

    epoch_t epoch = 0;
    peer_id_t author{};
    salt_t salt{};
    ScoreVector scores;
    timestamp_t submitted_at{0};

    // Hash this reveal commits to
    [[nodiscard]] hash_t commitment_hash() const;

    [[nodiscard]] std::vector<std::uint8_t> serialize() const;
    [[nodiscard]] static std::optional<RevealRecord> deserialize(
        std::span<const std::uint8_t> data);

    bool operator==(const RevealRecord&) const = default;
};

// ============================================================================
// Reveal Validation
// ============================================================================

enum class RevealCheck : std::uint8_t {
    ACCEPTED = 0,
    NO_COMMITMENT = 1,
    HASH_MISMATCH = 2,
    LATE = 3,
    EPOCH_MISMATCH = 4,
    AUTHOR_INELIGIBLE = 5,
    MALFORMED = 6,
    EQUIVOCATION = 7,
};

[[nodiscard]] constexpr std::string_view reveal_check_string(RevealCheck check) {
    switch (check) {
        case RevealCheck::ACCEPTED:          return "ACCEPTED";
        case RevealCheck::NO_COMMITMENT:     return "NO_COMMITMENT";
        case RevealCheck::HASH_MISMATCH:     return "HASH_MISMATCH";
        case RevealCheck::LATE:              return "LATE";
        case RevealCheck::EPOCH_MISMATCH:    return "EPOCH_MISMATCH";
        case RevealCheck::AUTHOR_INELIGIBLE: return "AUTHOR_INELIGIBLE";
        case RevealCheck::MALFORMED:         return "MALFORMED";
        case RevealCheck::EQUIVOCATION:      return "EQUIVOCATION";
    }
    return "UNKNOWN";
}

// Check one reveal against the commitment published by the same author for
// the same epoch. `commitment` is null when none was observed.
[[nodiscard]] RevealCheck check_reveal(const RevealRecord& reveal,
                                       const CommitmentRecord* commitment,
                                       epoch_t epoch,
                                       const EpochClock& clock,
                                       const std::set<peer_id_t>& eligible_authors);

// ============================================================================
// Commitment Pool - Commitments observed for one epoch
// ============================================================================

class CommitmentPool {
public:
    explicit CommitmentPool(epoch_t epoch) : epoch_(epoch) {}

    enum class AddResult {
        ADDED,
        DUPLICATE,
        WRONG_EPOCH,
        EQUIVOCATION,   // Author published two different commitments
    };
    AddResult add(const CommitmentRecord& commitment);

    // Null for unknown and equivocating authors
    [[nodiscard]] std::optional<CommitmentRecord> get(const peer_id_t& author) const;
    [[nodiscard]] bool has(const peer_id_t& author) const;
    [[nodiscard]] bool is_equivocator(const peer_id_t& author) const;

    [[nodiscard]] std::vector<CommitmentRecord> all() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] epoch_t epoch() const { return epoch_; }

private:
    epoch_t epoch_;
    std::unordered_map<peer_id_t, CommitmentRecord> commitments_;
    std::unordered_set<peer_id_t> equivocators_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Reveal Pool - Reveals observed for one epoch
// ============================================================================

class RevealPool {
public:
    explicit RevealPool(epoch_t epoch) : epoch_(epoch) {}

    enum class AddResult {
        ADDED,
        DUPLICATE,
        WRONG_EPOCH,
        EQUIVOCATION,
    };
    AddResult add(const RevealRecord& reveal);

    [[nodiscard]] std::optional<RevealRecord> get(const peer_id_t& author) const;
    [[nodiscard]] bool is_equivocator(const peer_id_t& author) const;

    [[nodiscard]] std::vector<RevealRecord> all() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] epoch_t epoch() const { return epoch_; }

private:
    epoch_t epoch_;
    std::unordered_map<peer_id_t, RevealRecord> reveals_;
    std::unordered_set<peer_id_t> equivocators_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Epoch Validation
// ============================================================================

struct RevealValidation {
    std::vector<RevealRecord> accepted;           // Ascending author order
    std::map<peer_id_t, RevealCheck> rejected;
    std::vector<peer_id_t> missing;               // Committed but never revealed
};

// Build the valid subset of an epoch's reveals
[[nodiscard]] RevealValidation validate_reveals(const CommitmentPool& commitments,
                                                const RevealPool& reveals,
                                                const EpochClock& clock,
                                                const std::set<peer_id_t>& eligible_authors);

}  // namespace mesh
