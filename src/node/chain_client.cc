#include "chain_client.hh"
#include "core/logging.hh"

namespace mesh {

std::vector<ChainScore> to_chain_scores(const EpochResult& result) {
    std::vector<ChainScore> out;
    out.reserve(result.scores.size());
    for (const auto& consensus : result.scores) {
        if (!consensus.score) {
            continue;
        }
        out.push_back(ChainScore{consensus.target, *consensus.score, consensus.agreement});
    }
    return out;
}

void LoggingChainClient::submit(epoch_t epoch, const std::vector<ChainScore>& scores) {
    MESH_LOG_INFO(log::node) << "Epoch " << epoch << ": submitting " << scores.size() << " scores";
    for (const auto& s : scores) {
        MESH_LOG_DEBUG(log::node) << "  " << short_id(s.target) << " score=" << s.score
                                  << " agreement=" << s.agreement;
    }
}

void RecordingChainClient::submit(epoch_t epoch, const std::vector<ChainScore>& scores) {
    std::lock_guard<std::mutex> lock(mutex_);
    submissions_.emplace_back(epoch, scores);
}

std::vector<std::pair<epoch_t, std::vector<ChainScore>>> RecordingChainClient::submissions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return submissions_;
}

}  // namespace mesh
