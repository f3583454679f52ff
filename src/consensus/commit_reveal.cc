#include "commit_reveal.hh"
#include "crypto/hash.hh"
#include "core/logging.hh"
#include <algorithm>
#include <cmath>

namespace mesh {

namespace {

constexpr std::string_view COMMIT_DOMAIN = "mesh.commit.v1";

}  // namespace

// ============================================================================
// Score Vector
// ============================================================================

bool is_valid_score(double score) {
    return std::isfinite(score) && score >= MIN_SCORE && score <= MAX_SCORE;
}

bool validate_score_vector(const ScoreVector& scores) {
    if (scores.size() > MAX_SCORE_TARGETS) {
        return false;
    }
    return std::all_of(scores.begin(), scores.end(),
        [](const auto& entry) { return is_valid_score(entry.second); });
}

void append_score_vector(bytes_t& out, const ScoreVector& scores) {
    append_u32(out, static_cast<std::uint32_t>(scores.size()));
    for (const auto& [target, score] : scores) {
        append_bytes(out, target);
        append_f64(out, score);
    }
}

bool read_score_vector(ByteReader& reader, ScoreVector& out) {
    std::uint32_t count = 0;
    if (!reader.read_u32(count) || count > MAX_SCORE_TARGETS) {
        return false;
    }
    if (reader.remaining() < static_cast<std::size_t>(count) * (PEER_ID_SIZE + 8)) {
        return false;
    }

    ScoreVector scores;
    std::optional<peer_id_t> previous;
    for (std::uint32_t i = 0; i < count; ++i) {
        peer_id_t target;
        double score = 0.0;
        if (!reader.read_array(target) || !reader.read_f64(score)) {
            return false;
        }
        // Strictly ascending also rules out duplicates
        if (previous && !(*previous < target)) {
            return false;
        }
        if (!is_valid_score(score)) {
            return false;
        }
        scores.emplace_hint(scores.end(), target, score);
        previous = target;
    }

    out = std::move(scores);
    return true;
}

hash_t compute_commitment_hash(epoch_t epoch,
                               const peer_id_t& author,
                               const salt_t& salt,
                               const ScoreVector& scores) {
    bytes_t canonical;
    canonical.reserve(4 + scores.size() * (PEER_ID_SIZE + 8));
    append_score_vector(canonical, scores);

    SHA3Hasher hasher;
    hasher.update(COMMIT_DOMAIN);
    hasher.update_u64(epoch);
    hasher.update(author);
    hasher.update(salt);
    hasher.update(canonical);
    return hasher.finalize();
}

// ============================================================================
// CommitmentRecord Implementation
// ============================================================================

std::vector<std::uint8_t> CommitmentRecord::serialize() const {
    bytes_t out;
    out.reserve(1 + 8 + PEER_ID_SIZE + HASH_SIZE + 8);
    append_u8(out, VERSION);
    append_u64(out, epoch);
    append_bytes(out, author);
    append_bytes(out, commitment_hash);
    append_i64(out, submitted_at.count());
    return out;
}

std::optional<CommitmentRecord> CommitmentRecord::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    std::uint8_t version = 0;
    if (!reader.read_u8(version) || version != VERSION) {
        return std::nullopt;
    }

    CommitmentRecord record;
    std::int64_t submitted = 0;
    if (!reader.read_u64(record.epoch) ||
        !reader.read_array(record.author) ||
        !reader.read_array(record.commitment_hash) ||
        !reader.read_i64(submitted) ||
        !reader.at_end()) {
        return std::nullopt;
    }
    record.submitted_at = timestamp_t{submitted};
    return record;
}

// ============================================================================
// RevealRecord Implementation
// ============================================================================

hash_t RevealRecord::commitment_hash() const {
    return compute_commitment_hash(epoch, author, salt, scores);
}

std::vector<std::uint8_t> RevealRecord::serialize() const {
    bytes_t out;
    out.reserve(1 + 8 + PEER_ID_SIZE + SALT_SIZE + 4 + scores.size() * (PEER_ID_SIZE + 8) + 8);
    append_u8(out, VERSION);
    append_u64(out, epoch);
    append_bytes(out, author);
    append_bytes(out, salt);
    append_score_vector(out, scores);
    append_i64(out, submitted_at.count());
    return out;
}

std::optional<RevealRecord> RevealRecord::deserialize(std::span<const std::uint8_t> data) {
    ByteReader reader(data);
    std::uint8_t version = 0;
    if (!reader.read_u8(version) || version != VERSION) {
        return std::nullopt;
    }

    RevealRecord record;
    std::int64_t submitted = 0;
    if (!reader.read_u64(record.epoch) ||
        !reader.read_array(record.author) ||
        !reader.read_array(record.salt) ||
        !read_score_vector(reader, record.scores) ||
        !reader.read_i64(submitted) ||
        !reader.at_end()) {
        return std::nullopt;
    }
    record.submitted_at = timestamp_t{submitted};
    return record;
}

// ============================================================================
// Reveal Validation
// ============================================================================

RevealCheck check_reveal(const RevealRecord& reveal,
                         const CommitmentRecord* commitment,
                         epoch_t epoch,
                         const EpochClock& clock,
                         const std::set<peer_id_t>& eligible_authors) {
    if (!validate_score_vector(reveal.scores) || reveal.scores.contains(reveal.author)) {
        return RevealCheck::MALFORMED;
    }
    if (reveal.epoch != epoch) {
        return RevealCheck::EPOCH_MISMATCH;
    }
    if (!commitment) {
        return RevealCheck::NO_COMMITMENT;
    }
    if (commitment->epoch != epoch || commitment->author != reveal.author) {
        return RevealCheck::EPOCH_MISMATCH;
    }
    if (!eligible_authors.contains(reveal.author)) {
        return RevealCheck::AUTHOR_INELIGIBLE;
    }
    if (!clock.within_phase(epoch, Phase::COMMIT, commitment->submitted_at) ||
        !clock.within_phase(epoch, Phase::REVEAL, reveal.submitted_at)) {
        return RevealCheck::LATE;
    }
    if (reveal.commitment_hash() != commitment->commitment_hash) {
        return RevealCheck::HASH_MISMATCH;
    }
    return RevealCheck::ACCEPTED;
}

RevealValidation validate_reveals(const CommitmentPool& commitments,
                                  const RevealPool& reveals,
                                  const EpochClock& clock,
                                  const std::set<peer_id_t>& eligible_authors) {
    RevealValidation result;
    epoch_t epoch = commitments.epoch();

    auto observed = reveals.all();
    std::sort(observed.begin(), observed.end(),
        [](const RevealRecord& a, const RevealRecord& b) { return a.author < b.author; });

    std::set<peer_id_t> revealed;
    for (const auto& reveal : observed) {
        revealed.insert(reveal.author);

        RevealCheck check;
        if (commitments.is_equivocator(reveal.author) || reveals.is_equivocator(reveal.author)) {
            check = RevealCheck::EQUIVOCATION;
        } else {
            auto commitment = commitments.get(reveal.author);
            check = check_reveal(reveal, commitment ? &*commitment : nullptr,
                                 epoch, clock, eligible_authors);
        }

        if (check == RevealCheck::ACCEPTED) {
            result.accepted.push_back(reveal);
        } else {
            result.rejected.emplace(reveal.author, check);
            MESH_LOG_DEBUG(log::reveal) << "Excluded reveal from " << short_id(reveal.author)
                                        << " for epoch " << epoch << ": "
                                        << reveal_check_string(check);
        }
    }

    for (const auto& commitment : commitments.all()) {
        if (!revealed.contains(commitment.author)) {
            result.missing.push_back(commitment.author);
        }
    }
    std::sort(result.missing.begin(), result.missing.end());

    MESH_LOG_DEBUG(log::reveal) << "Epoch " << epoch << ": " << result.accepted.size()
                                << " accepted, " << result.rejected.size() << " rejected, "
                                << result.missing.size() << " missing";
    return result;
}

// ============================================================================
// CommitmentPool Implementation
// ============================================================================

CommitmentPool::AddResult CommitmentPool::add(const CommitmentRecord& commitment) {
    if (commitment.epoch != epoch_) {
        return AddResult::WRONG_EPOCH;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (equivocators_.contains(commitment.author)) {
        return AddResult::EQUIVOCATION;
    }

    auto it = commitments_.find(commitment.author);
    if (it == commitments_.end()) {
        commitments_.emplace(commitment.author, commitment);
        return AddResult::ADDED;
    }
    if (it->second == commitment) {
        return AddResult::DUPLICATE;
    }

    MESH_LOG_WARN(log::commit) << "Peer " << short_id(commitment.author)
                               << " published conflicting commitments for epoch " << epoch_;
    commitments_.erase(it);
    equivocators_.insert(commitment.author);
    return AddResult::EQUIVOCATION;
}

std::optional<CommitmentRecord> CommitmentPool::get(const peer_id_t& author) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = commitments_.find(author);
    if (it == commitments_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool CommitmentPool::has(const peer_id_t& author) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commitments_.contains(author);
}

bool CommitmentPool::is_equivocator(const peer_id_t& author) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return equivocators_.contains(author);
}

std::vector<CommitmentRecord> CommitmentPool::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<CommitmentRecord> result;
    result.reserve(commitments_.size());
    for (const auto& [author, commitment] : commitments_) {
        result.push_back(commitment);
    }
    return result;
}

std::size_t CommitmentPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return commitments_.size();
}

// ============================================================================
// RevealPool Implementation
// ============================================================================

RevealPool::AddResult RevealPool::add(const RevealRecord& reveal) {
    if (reveal.epoch != epoch_) {
        return AddResult::WRONG_EPOCH;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (equivocators_.contains(reveal.author)) {
        return AddResult::EQUIVOCATION;
    }

    auto it = reveals_.find(reveal.author);
    if (it == reveals_.end()) {
        reveals_.emplace(reveal.author, reveal);
        return AddResult::ADDED;
    }
    if (it->second == reveal) {
        return AddResult::DUPLICATE;
    }

    MESH_LOG_WARN(log::reveal) << "Peer " << short_id(reveal.author)
                               << " published conflicting reveals for epoch " << epoch_;
    reveals_.erase(it);
    equivocators_.insert(reveal.author);
    return AddResult::EQUIVOCATION;
}

std::optional<RevealRecord> RevealPool::get(const peer_id_t& author) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = reveals_.find(author);
    if (it == reveals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool RevealPool::is_equivocator(const peer_id_t& author) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return equivocators_.contains(author);
}

std::vector<RevealRecord> RevealPool::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RevealRecord> result;
    result.reserve(reveals_.size());
    for (const auto& [author, reveal] : reveals_) {
        result.push_back(reveal);
    }
    return result;
}

std::size_t RevealPool::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reveals_.size();
}

}  // namespace mesh
