#include "epoch_clock.hh"
#include "core/error.hh"
#include "core/logging.hh"

namespace mesh {

void EpochConfig::validate() const {
    if (genesis.count() < 0) {
        throw ConfigError("epoch.genesis must not be negative");
    }
    if (commit_window.count() <= 0) {
        throw ConfigError("epoch.commit_window must be positive");
    }
    if (reveal_window.count() <= 0) {
        throw ConfigError("epoch.reveal_window must be positive");
    }
    if (settle_window.count() <= 0) {
        throw ConfigError("epoch.settle_window must be positive");
    }
    if (grace.count() < 0) {
        throw ConfigError("epoch.grace must not be negative");
    }
    if (grace >= commit_window || grace >= reveal_window) {
        throw ConfigError("epoch.grace must be shorter than the commit and reveal windows");
    }
}

EpochClock::EpochClock(EpochConfig config) : config_(config) {
    config_.validate();
}

timestamp_t EpochClock::offset_in_epoch(timestamp_t now) const {
    if (now < config_.genesis) {
        MESH_LOG_ERROR(log::clock) << "Time " << now.count() << "us is before genesis "
                                   << config_.genesis.count() << "us";
        throw ClockError("time is before genesis");
    }
    return (now - config_.genesis) % epoch_length();
}

epoch_t EpochClock::current_epoch(timestamp_t now) const {
    if (now < config_.genesis) {
        throw ClockError("time is before genesis");
    }
    return static_cast<epoch_t>((now - config_.genesis) / epoch_length());
}

Phase EpochClock::current_phase(timestamp_t now) const {
    timestamp_t offset = offset_in_epoch(now);
    if (offset < config_.commit_window) {
        return Phase::COMMIT;
    }
    if (offset < config_.commit_window + config_.reveal_window) {
        return Phase::REVEAL;
    }
    return Phase::SETTLED;
}

timestamp_t EpochClock::epoch_start(epoch_t epoch) const {
    return config_.genesis + epoch_length() * static_cast<std::int64_t>(epoch);
}

timestamp_t EpochClock::phase_start(epoch_t epoch, Phase phase) const {
    timestamp_t start = epoch_start(epoch);
    switch (phase) {
        case Phase::COMMIT:  return start;
        case Phase::REVEAL:  return start + config_.commit_window;
        case Phase::SETTLED: return start + config_.commit_window + config_.reveal_window;
    }
    return start;
}

timestamp_t EpochClock::phase_deadline(epoch_t epoch, Phase phase) const {
    switch (phase) {
        case Phase::COMMIT:  return phase_start(epoch, Phase::REVEAL);
        case Phase::REVEAL:  return phase_start(epoch, Phase::SETTLED);
        case Phase::SETTLED: return epoch_start(epoch + 1);
    }
    return epoch_start(epoch + 1);
}

double EpochClock::percent_complete(timestamp_t now) const {
    return static_cast<double>(offset_in_epoch(now).count()) /
           static_cast<double>(epoch_length().count());
}

bool EpochClock::within_phase(epoch_t epoch, Phase phase, timestamp_t t) const {
    return t >= phase_start(epoch, phase) - config_.grace &&
           t < phase_deadline(epoch, phase) + config_.grace;
}

}  // namespace mesh
