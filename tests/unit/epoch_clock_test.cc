#include <gtest/gtest.h>
#include "consensus/epoch_clock.hh"
#include "core/error.hh"

using namespace mesh;

namespace {

EpochConfig minute_windows() {
    EpochConfig config;
    config.genesis = seconds(0);
    config.commit_window = seconds(60);
    config.reveal_window = seconds(60);
    config.settle_window = seconds(60);
    config.grace = seconds(2);
    return config;
}

}  // namespace

// ============================================================================
// Configuration
// ============================================================================

TEST(EpochConfigTest, DefaultsAreValid) {
    EpochConfig config;
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.epoch_length(), seconds(180));
}

TEST(EpochConfigTest, RejectsBadWindows) {
    EpochConfig config = minute_windows();
    config.commit_window = seconds(0);
    EXPECT_THROW(config.validate(), ConfigError);

    config = minute_windows();
    config.settle_window = seconds(-1);
    EXPECT_THROW(config.validate(), ConfigError);

    config = minute_windows();
    config.grace = seconds(60);
    EXPECT_THROW(config.validate(), ConfigError);

    config = minute_windows();
    config.genesis = seconds(-5);
    EXPECT_THROW(EpochClock{config}, ConfigError);
}

// ============================================================================
// Epoch and Phase Mapping
// ============================================================================

TEST(EpochClockTest, EpochFiveBoundaries) {
    EpochClock clock(minute_windows());

    EXPECT_EQ(clock.epoch_start(5), seconds(900));
    EXPECT_EQ(clock.phase_start(5, Phase::REVEAL), seconds(960));
    EXPECT_EQ(clock.phase_start(5, Phase::SETTLED), seconds(1020));
    EXPECT_EQ(clock.phase_deadline(5, Phase::COMMIT), seconds(960));
    EXPECT_EQ(clock.phase_deadline(5, Phase::SETTLED), seconds(1080));

    EXPECT_EQ(clock.current_epoch(seconds(900)), 5);
    EXPECT_EQ(clock.current_epoch(seconds(1079)), 5);
    EXPECT_EQ(clock.current_epoch(seconds(1080)), 6);
}

TEST(EpochClockTest, PhaseBoundariesAreHalfOpen) {
    EpochClock clock(minute_windows());

    EXPECT_EQ(clock.current_phase(seconds(900)), Phase::COMMIT);
    EXPECT_EQ(clock.current_phase(seconds(959)), Phase::COMMIT);
    EXPECT_EQ(clock.current_phase(seconds(960)), Phase::REVEAL);
    EXPECT_EQ(clock.current_phase(seconds(1019)), Phase::REVEAL);
    EXPECT_EQ(clock.current_phase(seconds(1020)), Phase::SETTLED);
    EXPECT_EQ(clock.current_phase(seconds(1080)), Phase::COMMIT);
}

TEST(EpochClockTest, NonZeroGenesis) {
    EpochConfig config = minute_windows();
    config.genesis = seconds(1000);
    EpochClock clock(config);

    EXPECT_EQ(clock.current_epoch(seconds(1000)), 0);
    EXPECT_EQ(clock.current_epoch(seconds(1180)), 1);
    EXPECT_EQ(clock.epoch_start(2), seconds(1360));
}

TEST(EpochClockTest, BeforeGenesisThrows) {
    EpochConfig config = minute_windows();
    config.genesis = seconds(1000);
    EpochClock clock(config);

    EXPECT_THROW((void)clock.current_epoch(seconds(999)), ClockError);
    EXPECT_THROW((void)clock.current_phase(seconds(0)), ClockError);
    EXPECT_THROW((void)clock.percent_complete(seconds(0)), ClockError);
}

TEST(EpochClockTest, PercentComplete) {
    EpochClock clock(minute_windows());
    EXPECT_DOUBLE_EQ(clock.percent_complete(seconds(900)), 0.0);
    EXPECT_DOUBLE_EQ(clock.percent_complete(seconds(990)), 0.5);
    EXPECT_LT(clock.percent_complete(seconds(1079)), 1.0);
}

TEST(EpochClockTest, WithinPhaseAppliesGrace) {
    EpochClock clock(minute_windows());

    EXPECT_TRUE(clock.within_phase(5, Phase::COMMIT, seconds(898)));
    EXPECT_FALSE(clock.within_phase(5, Phase::COMMIT, seconds(897)));
    EXPECT_TRUE(clock.within_phase(5, Phase::COMMIT, seconds(961)));
    EXPECT_FALSE(clock.within_phase(5, Phase::COMMIT, seconds(962)));

    EXPECT_TRUE(clock.within_phase(5, Phase::REVEAL, seconds(1021)));
    EXPECT_FALSE(clock.within_phase(5, Phase::REVEAL, seconds(1022)));
}

TEST(EpochClockTest, PhaseNames) {
    EXPECT_EQ(phase_string(Phase::COMMIT), "COMMIT");
    EXPECT_EQ(phase_string(Phase::REVEAL), "REVEAL");
    EXPECT_EQ(phase_string(Phase::SETTLED), "SETTLED");
}
