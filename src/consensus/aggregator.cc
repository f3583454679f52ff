#include "aggregator.hh"
#include "core/error.hh"
#include "core/logging.hh"
#include <algorithm>
#include <cctype>
#include <cmath>

namespace mesh {

namespace {

// Two scores closer than this are the same score
constexpr double SCORE_EPSILON = 1e-9;

}  // namespace

std::optional<AggregationMethod> parse_aggregation_method(std::string_view name) {
    std::string lower;
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "mean") return AggregationMethod::MEAN;
    if (lower == "median") return AggregationMethod::MEDIAN;
    return std::nullopt;
}

void AggregatorConfig::validate() const {
    if (!std::isfinite(tolerance) || tolerance < 0.0 || tolerance > MAX_SCORE - MIN_SCORE) {
        throw ConfigError("aggregator.tolerance must be within the score range");
    }
    if (min_scores == 0) {
        throw ConfigError("aggregator.min_scores must be at least 1");
    }
}

// ============================================================================
// EpochResult
// ============================================================================

const ConsensusScore* EpochResult::find(const peer_id_t& target) const {
    auto it = std::lower_bound(scores.begin(), scores.end(), target,
        [](const ConsensusScore& s, const peer_id_t& t) { return s.target < t; });
    if (it == scores.end() || it->target != target) {
        return nullptr;
    }
    return &*it;
}

std::size_t EpochResult::num_consensus() const {
    return static_cast<std::size_t>(std::count_if(scores.begin(), scores.end(),
        [](const ConsensusScore& s) { return s.score.has_value(); }));
}

double compare_results(const EpochResult& mine, const EpochResult& theirs) {
    std::size_t mine_count = mine.num_consensus();
    std::size_t theirs_count = theirs.num_consensus();

    std::size_t shared = 0;
    for (const auto& score : mine.scores) {
        if (!score.score) {
            continue;
        }
        const ConsensusScore* other = theirs.find(score.target);
        if (other && other->score && std::fabs(*other->score - *score.score) <= SCORE_EPSILON) {
            ++shared;
        }
    }

    std::size_t total = mine_count + theirs_count - shared;
    if (total == 0) {
        return 1.0;
    }
    return static_cast<double>(shared) / static_cast<double>(total);
}

// ============================================================================
// ScoreAggregator Implementation
// ============================================================================

ScoreAggregator::ScoreAggregator(AggregatorConfig config) : config_(config) {
    config_.validate();
}

double ScoreAggregator::combine(std::vector<double>& sorted_scores) const {
    std::size_t n = sorted_scores.size();
    if (config_.method == AggregationMethod::MEDIAN) {
        if (n % 2 == 1) {
            return sorted_scores[n / 2];
        }
        return (sorted_scores[n / 2 - 1] + sorted_scores[n / 2]) / 2.0;
    }

    // Summing in sorted order keeps the mean independent of input order
    double sum = 0.0;
    for (double s : sorted_scores) {
        sum += s;
    }
    return sum / static_cast<double>(n);
}

EpochResult ScoreAggregator::aggregate(epoch_t epoch,
                                       const std::vector<RevealRecord>& reveals,
                                       const std::set<peer_id_t>& expected_targets) const {
    EpochResult result;
    result.epoch = epoch;
    result.num_reveals = reveals.size();

    std::map<peer_id_t, std::vector<double>> by_target;
    for (const auto& target : expected_targets) {
        by_target[target];
    }
    std::size_t dropped = 0;
    for (const auto& reveal : reveals) {
        for (const auto& [target, score] : reveal.scores) {
            if (target == reveal.author) {
                continue;
            }
            if (!expected_targets.empty() && !expected_targets.contains(target)) {
                ++dropped;
                continue;
            }
            by_target[target].push_back(score);
        }
    }
    if (dropped > 0) {
        MESH_LOG_DEBUG(log::aggregator) << "Epoch " << epoch << ": ignored " << dropped
                                        << " scores for targets that were not live";
    }

    result.scores.reserve(by_target.size());
    for (auto& [target, scores] : by_target) {
        ConsensusScore consensus;
        consensus.target = target;
        consensus.num_scores = scores.size();

        if (scores.size() >= config_.min_scores) {
            std::sort(scores.begin(), scores.end());
            double aggregate = combine(scores);
            std::size_t agreeing = static_cast<std::size_t>(std::count_if(scores.begin(), scores.end(),
                [&](double s) { return std::fabs(s - aggregate) <= config_.tolerance + SCORE_EPSILON; }));

            consensus.score = aggregate;
            consensus.agreement = static_cast<double>(agreeing) / static_cast<double>(scores.size());
        }

        result.scores.push_back(consensus);
    }

    // Accuracy: squared error against the consensus, scaled by the largest
    // error the author's scored targets allow
    constexpr double range = MAX_SCORE - MIN_SCORE;
    for (const auto& reveal : reveals) {
        double err = 0.0;
        std::size_t scored = 0;
        for (const auto& [target, score] : reveal.scores) {
            const ConsensusScore* consensus = result.find(target);
            if (target == reveal.author || !consensus || !consensus->score) {
                continue;
            }
            double diff = score - *consensus->score;
            err += diff * diff;
            ++scored;
        }

        double max_err = static_cast<double>(scored) * range * range;
        double accuracy = BASE_ACCURACY * std::max(1.0 - err / (max_err + EPSILON), 0.0);
        result.author_accuracy[reveal.author] = scored == 0 ? BASE_ACCURACY : accuracy;
    }

    MESH_LOG_INFO(log::aggregator) << "Epoch " << epoch << " aggregated ("
                                   << aggregation_method_string(config_.method) << "): "
                                   << result.num_consensus() << "/" << result.scores.size()
                                   << " targets from " << reveals.size() << " reveals";
    return result;
}

// ============================================================================
// ResultHistory Implementation
// ============================================================================

ResultHistory::ResultHistory(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void ResultHistory::add(EpochResult result) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = std::find_if(results_.begin(), results_.end(),
        [&](const EpochResult& r) { return r.epoch == result.epoch; });
    if (it != results_.end()) {
        *it = std::move(result);
        return;
    }

    auto pos = std::upper_bound(results_.begin(), results_.end(), result.epoch,
        [](epoch_t e, const EpochResult& r) { return e < r.epoch; });
    results_.insert(pos, std::move(result));

    while (results_.size() > capacity_) {
        results_.pop_front();
    }
}

std::vector<EpochResult> ResultHistory::recent(std::size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = std::min(n, results_.size());
    return std::vector<EpochResult>(results_.end() - static_cast<std::ptrdiff_t>(count), results_.end());
}

std::optional<EpochResult> ResultHistory::get(epoch_t epoch) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& result : results_) {
        if (result.epoch == epoch) {
            return result;
        }
    }
    return std::nullopt;
}

std::optional<EpochResult> ResultHistory::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (results_.empty()) {
        return std::nullopt;
    }
    return results_.back();
}

std::size_t ResultHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return results_.size();
}

}  // namespace mesh
