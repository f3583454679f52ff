#pragma once

#include "consensus/commit_reveal.hh"
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <vector>

namespace mesh {

// ============================================================================
// Aggregator Configuration
// ============================================================================

enum class AggregationMethod : std::uint8_t {
    MEAN = 0,
    MEDIAN = 1,
};

[[nodiscard]] constexpr std::string_view aggregation_method_string(AggregationMethod method) {
    switch (method) {
        case AggregationMethod::MEAN:   return "MEAN";
        case AggregationMethod::MEDIAN: return "MEDIAN";
    }
    return "UNKNOWN";
}

[[nodiscard]] std::optional<AggregationMethod> parse_aggregation_method(std::string_view name);

struct AggregatorConfig {
    AggregationMethod method = AggregationMethod::MEAN;

    // A score agrees when |score - aggregate| <= tolerance
    double tolerance = 0.1;

    // Fewer valid scores than this yields no consensus for the target
    std::size_t min_scores = 1;

    void validate() const;
};

// ============================================================================
// Results
// ============================================================================

struct ConsensusScore {
    peer_id_t target{};

    // nullopt: no consensus this epoch, which is not the same as 0.0
    std::optional<double> score;

    // Fraction of scores within tolerance of `score`
    double agreement = 0.0;
    std::size_t num_scores = 0;

    bool operator==(const ConsensusScore&) const = default;
};

struct EpochResult {
    epoch_t epoch = 0;
    std::vector<ConsensusScore> scores;            // Ascending target order
    std::map<peer_id_t, double> author_accuracy;   // 1.0 = matched every aggregate
    std::size_t num_reveals = 0;
    timestamp_t settled_at{0};

    [[nodiscard]] const ConsensusScore* find(const peer_id_t& target) const;

    // Targets that reached consensus
    [[nodiscard]] std::size_t num_consensus() const;
};

// Jaccard overlap of the (target, score) pairs two results agreed on.
// Scores are equal within 1e-9; two results without consensus compare as 1.0.
[[nodiscard]] double compare_results(const EpochResult& mine, const EpochResult& theirs);

// ============================================================================
// Score Aggregator
// ============================================================================

class ScoreAggregator {
public:
    static constexpr double BASE_ACCURACY = 1.0;
    static constexpr double EPSILON = 1e-8;

    explicit ScoreAggregator(AggregatorConfig config = AggregatorConfig{});

    // Aggregate one epoch's accepted reveals. When `expected_targets` is
    // non-empty it is the full target set: scores for other peers are
    // ignored, and listed targets never scored appear without a score. The
    // result does not depend on the order of `reveals`.
    [[nodiscard]] EpochResult aggregate(epoch_t epoch,
                                        const std::vector<RevealRecord>& reveals,
                                        const std::set<peer_id_t>& expected_targets = {}) const;

    [[nodiscard]] const AggregatorConfig& config() const { return config_; }

private:
    AggregatorConfig config_;

    [[nodiscard]] double combine(std::vector<double>& sorted_scores) const;
};

// ============================================================================
// Result History
// ============================================================================

// Last N settled epochs, newest last
class ResultHistory {
public:
    explicit ResultHistory(std::size_t capacity = 10);

    // Replaces an existing result for the same epoch
    void add(EpochResult result);

    [[nodiscard]] std::vector<EpochResult> recent(std::size_t n) const;
    [[nodiscard]] std::optional<EpochResult> get(epoch_t epoch) const;
    [[nodiscard]] std::optional<EpochResult> latest() const;

    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const { return capacity_; }

private:
    std::size_t capacity_;
    std::deque<EpochResult> results_;
    mutable std::mutex mutex_;
};

}  // namespace mesh
