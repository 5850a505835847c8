#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "line_ngin/prediction/confidence_tier.hpp"

using namespace line_ngin;
using namespace line_ngin::testing;

class ConfidenceTieringTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        profile_ = SportProfile::for_sport(Sport::NFL);
    }

    SportProfile profile_;
};

TEST_F(ConfidenceTieringTest, TierBoundariesAreInclusive) {
    TierThresholds thresholds{3.0, 1.5};
    EXPECT_EQ(ConfidenceTiering::tier_for(3.0, thresholds), ConfidenceTier::HIGH);
    EXPECT_EQ(ConfidenceTiering::tier_for(2.9, thresholds), ConfidenceTier::MEDIUM);
    EXPECT_EQ(ConfidenceTiering::tier_for(1.5, thresholds), ConfidenceTier::MEDIUM);
    EXPECT_EQ(ConfidenceTiering::tier_for(1.4, thresholds), ConfidenceTier::LOW);
}

TEST_F(ConfidenceTieringTest, EdgesAgainstMarket) {
    ConfidenceTiering tiering(profile_);
    ConfidenceTiers tiers = tiering.evaluate(-1.0, 44.0, 0.5686, make_line("g1", -4.5, 47.0));

    EXPECT_NEAR(tiers.spread_edge, 3.5, 1e-12);
    EXPECT_EQ(tiers.spread, ConfidenceTier::HIGH);
    EXPECT_NEAR(tiers.total_edge, 3.0, 1e-12);
    EXPECT_EQ(tiers.total, ConfidenceTier::HIGH);
    EXPECT_NEAR(tiers.moneyline_edge, 6.86, 1e-9);
    EXPECT_EQ(tiers.moneyline, ConfidenceTier::LOW);
}

TEST_F(ConfidenceTieringTest, MissingLineGivesZeroEdge) {
    ConfidenceTiering tiering(profile_);

    ConfidenceTiers no_line = tiering.evaluate(-7.0, 51.0, 0.8, std::nullopt);
    EXPECT_DOUBLE_EQ(no_line.spread_edge, 0.0);
    EXPECT_DOUBLE_EQ(no_line.total_edge, 0.0);
    EXPECT_EQ(no_line.spread, ConfidenceTier::LOW);
    EXPECT_EQ(no_line.total, ConfidenceTier::LOW);
    EXPECT_EQ(no_line.moneyline, ConfidenceTier::HIGH);

    ConfidenceTiers zero_total = tiering.evaluate(-7.0, 51.0, 0.5, make_line("g1", -6.5, 0.0));
    EXPECT_DOUBLE_EQ(zero_total.total_edge, 0.0);
    EXPECT_EQ(zero_total.total, ConfidenceTier::LOW);
    EXPECT_NEAR(zero_total.spread_edge, 0.5, 1e-12);
}

TEST_F(ConfidenceTieringTest, HighConvictionNeedsMarketSpread) {
    ConfidenceTiering tiering(profile_);
    PredictionRecord prediction;
    prediction.spread = -1.0;

    EXPECT_TRUE(tiering.is_high_conviction(prediction, make_line("g1", -4.0, 44.0)));
    EXPECT_FALSE(tiering.is_high_conviction(prediction, make_line("g1", -3.5, 44.0)));
    EXPECT_FALSE(tiering.is_high_conviction(prediction, make_line("g1", std::nullopt, 44.0)));
    EXPECT_FALSE(tiering.is_high_conviction(prediction, std::nullopt));
}

TEST_F(ConfidenceTieringTest, ThresholdsFollowSport) {
    ConfidenceTiering nba(SportProfile::for_sport(Sport::NBA));
    PredictionRecord prediction;
    prediction.spread = -5.0;

    // NBA flags at a 2 point edge, NFL needs 3
    EXPECT_TRUE(nba.is_high_conviction(prediction, make_line("g1", -7.0, 220.0)));
    EXPECT_FALSE(ConfidenceTiering(profile_).is_high_conviction(prediction,
                                                                make_line("g1", -7.0, 44.0)));
}
