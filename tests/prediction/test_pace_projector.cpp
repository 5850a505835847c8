#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <limits>
#include <string>
#include "../core/test_base.hpp"
#include "line_ngin/prediction/pace_projector.hpp"

using namespace line_ngin;
using namespace line_ngin::testing;

class PaceProjectorTest : public TestBase {
protected:
    LiveGameState nba_state(int home, int away, double minutes) const {
        LiveGameState state;
        state.home_team_id = "BOS";
        state.away_team_id = "NYK";
        state.home_score = home;
        state.away_score = away;
        state.minutes_elapsed = minutes;
        state.period = static_cast<int>(minutes / 12.0) + 1;
        return state;
    }

    PeriodCalibration nba_calibration() const {
        PeriodCalibration calibration;
        calibration.team_period_averages["BOS"] = {28.0, 27.0, 26.0, 29.0};
        calibration.team_period_averages["NYK"] = {25.0, 26.0, 27.0, 24.0};
        return calibration;
    }
};

TEST_F(PaceProjectorTest, GapBuckets) {
    EXPECT_EQ(PaceProjector::gap_bucket(0), GapBucket::CLOSE);
    EXPECT_EQ(PaceProjector::gap_bucket(4), GapBucket::CLOSE);
    EXPECT_EQ(PaceProjector::gap_bucket(5), GapBucket::SMALL);
    EXPECT_EQ(PaceProjector::gap_bucket(9), GapBucket::SMALL);
    EXPECT_EQ(PaceProjector::gap_bucket(10), GapBucket::MEDIUM);
    EXPECT_EQ(PaceProjector::gap_bucket(-14), GapBucket::MEDIUM);
    EXPECT_EQ(PaceProjector::gap_bucket(15), GapBucket::LARGE);
    EXPECT_EQ(to_string(GapBucket::MEDIUM), "medium");
}

TEST_F(PaceProjectorTest, LeagueClocks) {
    EXPECT_DOUBLE_EQ(PaceConfig::for_sport(Sport::NBA).regulation_minutes(), 48.0);
    EXPECT_DOUBLE_EQ(PaceConfig::for_sport(Sport::NHL).regulation_minutes(), 60.0);
    EXPECT_DOUBLE_EQ(PaceConfig::for_sport(Sport::NFL).regulation_minutes(), 60.0);
    EXPECT_DOUBLE_EQ(PaceConfig::for_sport(Sport::CBB).regulation_minutes(), 40.0);
}

TEST_F(PaceProjectorTest, ElapsedMinutesFromClock) {
    PaceProjector projector(PaceConfig::for_sport(Sport::NBA));
    EXPECT_DOUBLE_EQ(projector.elapsed_minutes(1, 12.0), 0.0);
    EXPECT_DOUBLE_EQ(projector.elapsed_minutes(3, 6.0), 30.0);
    EXPECT_DOUBLE_EQ(projector.elapsed_minutes(4, 0.0), 48.0);
    EXPECT_DOUBLE_EQ(projector.elapsed_minutes(5, 2.0), 51.0);
    EXPECT_DOUBLE_EQ(projector.elapsed_minutes(0, 5.0), 0.0);
}

TEST_F(PaceProjectorTest, Checkpoints) {
    PaceProjector projector(PaceConfig::for_sport(Sport::NBA));
    EXPECT_EQ(projector.checkpoint_for(1), Checkpoint::FIRST_PERIOD);
    EXPECT_EQ(projector.checkpoint_for(2), Checkpoint::HALF);
    EXPECT_EQ(projector.checkpoint_for(3), Checkpoint::LATE);
    EXPECT_EQ(to_string(Checkpoint::FIRST_PERIOD), "Q1");
    EXPECT_EQ(to_string(Checkpoint::HALF), "HALF");
    EXPECT_EQ(to_string(Checkpoint::LATE), "Q3");
}

TEST_F(PaceProjectorTest, RawRunRateProjection) {
    PaceProjector projector(PaceConfig::for_sport(Sport::NBA));
    PaceProjection projection = projector.project(nba_state(60, 50, 24.0)).value();

    ASSERT_TRUE(projection.run_rate.has_value());
    EXPECT_NEAR(*projection.run_rate, 110.0 / 24.0, 1e-12);
    EXPECT_NEAR(*projection.raw_projected_total, 220.0, 1e-9);
    EXPECT_NEAR(*projection.projected_total, 220.0, 1e-9);
    EXPECT_FALSE(projection.calibrated);
    EXPECT_FALSE(projection.projected_home.has_value());
}

TEST_F(PaceProjectorTest, NoProjectionBeforeGameTime) {
    PaceProjector nba(PaceConfig::for_sport(Sport::NBA));
    EXPECT_FALSE(nba.project(nba_state(0, 0, 0.0)).value().projected_total.has_value());

    PaceProjector nhl(PaceConfig::for_sport(Sport::NHL));
    LiveGameState state;
    state.home_score = 1;
    state.minutes_elapsed = 0.5;
    EXPECT_FALSE(nhl.project(state).value().run_rate.has_value());

    state.minutes_elapsed = 20.0;
    PaceProjection projection = nhl.project(state).value();
    ASSERT_TRUE(projection.projected_total.has_value());
    EXPECT_NEAR(*projection.projected_total, 3.0, 1e-12);
}

TEST_F(PaceProjectorTest, CalibratedProjectionUsesRemainingPeriods) {
    PaceProjector projector(PaceConfig::for_sport(Sport::NBA));
    PeriodCalibration calibration = nba_calibration();
    calibration.set_multiplier(Checkpoint::LATE, GapBucket::MEDIUM, 0.9);

    PaceProjection projection =
        projector.project(nba_state(60, 50, 24.0), calibration).value();

    ASSERT_TRUE(projection.calibrated);
    EXPECT_NEAR(*projection.projected_home, 60.0 + 55.0 * 0.9, 1e-9);
    EXPECT_NEAR(*projection.projected_away, 50.0 + 51.0 * 0.9, 1e-9);
    EXPECT_NEAR(*projection.projected_total, 205.4, 1e-9);
    EXPECT_NEAR(*projection.raw_projected_total, 220.0, 1e-9);
}

TEST_F(PaceProjectorTest, PartialPeriodIsProrated) {
    PaceProjector projector(PaceConfig::for_sport(Sport::NBA));

    // Six minutes into the 4th: half of each team's 4th-quarter average remains
    PaceProjection projection =
        projector.project(nba_state(80, 78, 42.0), nba_calibration()).value();
    ASSERT_TRUE(projection.calibrated);
    EXPECT_NEAR(*projection.projected_total, 158.0 + 14.5 + 12.0, 1e-9);
}

TEST_F(PaceProjectorTest, UncalibratedTeamFallsBackToRaw) {
    PaceProjector projector(PaceConfig::for_sport(Sport::NBA));
    PeriodCalibration calibration = nba_calibration();
    calibration.team_period_averages.erase("NYK");

    PaceProjection projection =
        projector.project(nba_state(60, 50, 24.0), calibration).value();
    EXPECT_FALSE(projection.calibrated);
    EXPECT_NEAR(*projection.projected_total, 220.0, 1e-9);
}

TEST_F(PaceProjectorTest, ConfigRoundTripsThroughJson) {
    PaceConfig config = PaceConfig::for_sport(Sport::NHL);
    PaceConfig loaded;
    loaded.from_json(config.to_json());
    EXPECT_EQ(loaded.regulation_periods, 3);
    EXPECT_DOUBLE_EQ(loaded.period_minutes, 20.0);
    EXPECT_DOUBLE_EQ(loaded.min_elapsed_minutes, 1.0);
}

TEST_F(PaceProjectorTest, RejectsBrokenClock) {
    PaceConfig config = PaceConfig::for_sport(Sport::NBA);
    EXPECT_TRUE(config.validate().is_ok());

    config.period_minutes = 0.0;
    EXPECT_TRUE(config.validate().is_error());
    auto zero_length = PaceProjector(config).project(nba_state(60, 50, 24.0), nba_calibration());
    ASSERT_TRUE(zero_length.is_error());
    EXPECT_EQ(zero_length.error()->code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(zero_length.error()->component(), "PaceProjector");

    config = PaceConfig::for_sport(Sport::NBA);
    config.regulation_periods = 0;
    EXPECT_TRUE(PaceProjector(config).project(nba_state(60, 50, 24.0)).is_error());

    config = PaceConfig::for_sport(Sport::NBA);
    config.overtime_minutes = -5.0;
    EXPECT_TRUE(config.validate().is_error());

    PaceProjector projector(PaceConfig::for_sport(Sport::NBA));
    LiveGameState state = nba_state(60, 50, 24.0);
    state.minutes_elapsed = std::numeric_limits<double>::infinity();
    EXPECT_TRUE(projector.project(state, nba_calibration()).is_error());
}

TEST_F(PaceProjectorTest, LoadingRejectsBrokenClock) {
    const std::string path = ::testing::TempDir() + "line_ngin_pace_config.json";
    {
        std::ofstream file(path);
        file << R"({"regulation_periods": 4, "period_minutes": -12.0})";
    }
    PaceConfig config;
    auto loaded = config.load_from_file(path);
    std::remove(path.c_str());
    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error()->code(), ErrorCode::INVALID_ARGUMENT);
}
