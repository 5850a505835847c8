#include <gtest/gtest.h>
#include <cmath>
#include "../core/test_base.hpp"
#include "line_ngin/rating/rating_store.hpp"
#include "line_ngin/rating/rating_updater.hpp"

using namespace line_ngin;
using namespace line_ngin::testing;

class RatingUpdaterTest : public TestBase {
protected:
    void SetUp() override {
        TestBase::SetUp();
        profile_ = SportProfile::for_sport(Sport::NFL);
    }

    SportProfile profile_;
};

TEST_F(RatingUpdaterTest, ExpectedScoreIsLogistic) {
    EXPECT_DOUBLE_EQ(RatingUpdater::expected_score(1500.0, 1500.0), 0.5);
    EXPECT_NEAR(RatingUpdater::expected_score(1900.0, 1500.0), 1.0 / 1.1, 1e-12);
    EXPECT_NEAR(RatingUpdater::expected_score(1500.0, 1500.0, 48.0), 0.568640, 1e-6);

    double a = RatingUpdater::expected_score(1620.0, 1480.0, 48.0);
    double b = RatingUpdater::expected_score(1480.0, 1620.0, -48.0);
    EXPECT_NEAR(a + b, 1.0, 1e-12);
}

TEST_F(RatingUpdaterTest, MarginMultiplier) {
    EXPECT_DOUBLE_EQ(RatingUpdater::margin_multiplier(0), 1.0);
    EXPECT_NEAR(RatingUpdater::margin_multiplier(7), std::log(8.0) * 0.7 + 0.8, 1e-12);
    EXPECT_DOUBLE_EQ(RatingUpdater::margin_multiplier(-7), RatingUpdater::margin_multiplier(7));
}

TEST_F(RatingUpdaterTest, HomeWinMovesRatingsSymmetrically) {
    RatingUpdater updater(profile_);
    RatingUpdate update = updater.update(1500.0, 1500.0, 24, 17);

    EXPECT_NEAR(update.home_expected, 0.568640, 1e-6);
    EXPECT_NEAR(update.k_applied, 20.0 * (std::log(8.0) * 0.7 + 0.8), 1e-9);
    EXPECT_DOUBLE_EQ(update.home_rating, 1519.0);
    EXPECT_DOUBLE_EQ(update.away_rating, 1481.0);
}

TEST_F(RatingUpdaterTest, TieFavorsUnderdogWithUnscaledK) {
    RatingUpdater updater(profile_);
    RatingUpdate update = updater.update(1500.0, 1500.0, 20, 20);

    EXPECT_DOUBLE_EQ(update.k_applied, 20.0);
    EXPECT_DOUBLE_EQ(update.home_rating, 1499.0);
    EXPECT_DOUBLE_EQ(update.away_rating, 1501.0);
}

TEST_F(RatingUpdaterTest, UnroundedUpdateConservesPoints) {
    profile_.round_ratings = false;
    profile_.margin_of_victory_scaling = false;
    RatingUpdater updater(profile_);

    RatingUpdate update = updater.update(1560.0, 1470.0, 10, 31);
    EXPECT_NEAR(update.home_rating + update.away_rating, 1560.0 + 1470.0, 1e-9);
    EXPECT_LT(update.home_rating, 1560.0);
    EXPECT_DOUBLE_EQ(update.k_applied, 20.0);
}

TEST_F(RatingUpdaterTest, ApplyAdvancesStoreAndStats) {
    RatingUpdater updater(profile_);
    RatingStore store;

    auto result = updater.apply(store, make_final("g1", "KC", "BAL", 27, 20, day(0)));
    ASSERT_TRUE(result.is_ok());

    EXPECT_DOUBLE_EQ(store.get("KC"), result.value().home_rating);
    EXPECT_DOUBLE_EQ(store.get("BAL"), result.value().away_rating);
    EXPECT_GT(store.get("KC"), DEFAULT_RATING);

    ASSERT_TRUE(updater.apply(store, make_final("g2", "BAL", "KC", 30, 10, day(7))).is_ok());

    TeamStats kc = store.get_stats("KC");
    EXPECT_EQ(kc.games_played, 2);
    EXPECT_DOUBLE_EQ(kc.points_scored_avg(), 18.5);
    EXPECT_DOUBLE_EQ(kc.points_allowed_avg(), 25.0);

    TeamStats bal = store.get_stats("BAL");
    EXPECT_DOUBLE_EQ(bal.points_scored_avg(), 25.0);
    EXPECT_DOUBLE_EQ(bal.points_allowed_avg(), 18.5);
}

TEST_F(RatingUpdaterTest, ApplyRejectsUnfinishedGame) {
    RatingUpdater updater(profile_);
    RatingStore store;

    Game game = make_final("g1", "KC", "BAL", 27, 20, day(0));
    game.status = GameStatus::SCHEDULED;
    auto result = updater.apply(store, game);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error()->code(), ErrorCode::INVALID_ARGUMENT);

    game.status = GameStatus::FINAL;
    game.away_score.reset();
    EXPECT_TRUE(updater.apply(store, game).is_error());

    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.get_stats("KC").games_played, 0);
}

class RatingStoreTest : public TestBase {};

TEST_F(RatingStoreTest, UnseenTeamsReadDefault) {
    RatingStore store(1450.0);
    EXPECT_DOUBLE_EQ(store.get("SEA"), 1450.0);
    EXPECT_FALSE(store.contains("SEA"));
    EXPECT_EQ(store.get_stats("SEA").games_played, 0);
    EXPECT_DOUBLE_EQ(store.get_stats("SEA").points_scored_avg(), 0.0);
}

TEST_F(RatingStoreTest, SeedFromTeams) {
    Team kc = make_team("KC");
    kc.rating = 1620.0;
    Team bal = make_team("BAL");
    bal.rating = 1580.0;

    RatingStore store = RatingStore::from_teams({kc, bal});
    EXPECT_EQ(store.size(), 2u);
    EXPECT_DOUBLE_EQ(store.get("KC"), 1620.0);
    EXPECT_DOUBLE_EQ(store.get("BAL"), 1580.0);
    EXPECT_DOUBLE_EQ(store.get("DET"), DEFAULT_RATING);
}
