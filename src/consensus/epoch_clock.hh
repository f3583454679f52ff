#pragma once

#include "core/types.hh"

namespace mesh {

// ============================================================================
// Phases
// ============================================================================

enum class Phase : std::uint8_t {
    COMMIT = 0,
    REVEAL = 1,
    SETTLED = 2,
};

[[nodiscard]] constexpr std::string_view phase_string(Phase phase) {
    switch (phase) {
        case Phase::COMMIT:  return "COMMIT";
        case Phase::REVEAL:  return "REVEAL";
        case Phase::SETTLED: return "SETTLED";
    }
    return "UNKNOWN";
}

// ============================================================================
// Epoch Configuration
// ============================================================================

struct EpochConfig {
    timestamp_t genesis{0};

    // Epoch length is the sum of the three windows
    timestamp_t commit_window = seconds(60);
    timestamp_t reveal_window = seconds(60);
    timestamp_t settle_window = seconds(60);

    // Slack applied when checking whether a record arrived within a window
    timestamp_t grace = seconds(2);

    void validate() const;

    [[nodiscard]] timestamp_t epoch_length() const {
        return commit_window + reveal_window + settle_window;
    }
};

// ============================================================================
// Epoch Clock
// ============================================================================

// Maps wall-clock time to (epoch, phase). Stateless; every peer with the same
// config derives the same boundaries. Times before genesis throw ClockError.
class EpochClock {
public:
    explicit EpochClock(EpochConfig config);

    [[nodiscard]] epoch_t current_epoch(timestamp_t now) const;
    [[nodiscard]] Phase current_phase(timestamp_t now) const;

    [[nodiscard]] timestamp_t epoch_start(epoch_t epoch) const;
    [[nodiscard]] timestamp_t phase_start(epoch_t epoch, Phase phase) const;

    // Exclusive end of the phase window
    [[nodiscard]] timestamp_t phase_deadline(epoch_t epoch, Phase phase) const;

    // Elapsed fraction of the current epoch, in [0, 1)
    [[nodiscard]] double percent_complete(timestamp_t now) const;

    // phase_start - grace <= t < phase_deadline + grace
    [[nodiscard]] bool within_phase(epoch_t epoch, Phase phase, timestamp_t t) const;

    [[nodiscard]] const EpochConfig& config() const { return config_; }
    [[nodiscard]] timestamp_t epoch_length() const { return config_.epoch_length(); }

private:
    EpochConfig config_;

    [[nodiscard]] timestamp_t offset_in_epoch(timestamp_t now) const;
};

}  // namespace mesh
