#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "line_ngin/grading/grading_engine.hpp"

using namespace line_ngin;
using namespace line_ngin::testing;

class GradingEngineTest : public TestBase {
protected:
    static PredictionRecord prediction(double spread, double total, double p_home = 0.6) {
        PredictionRecord record;
        record.game_id = "g1";
        record.spread = spread;
        record.total = total;
        record.home_win_probability = p_home;
        return record;
    }
};

TEST_F(GradingEngineTest, HomeFavoriteWinningByTheNumberPushes) {
    GradedBet bet = GradingEngine::grade_spread_against(-7.0, -3.0, LineSource::MARKET, 20, 17);
    EXPECT_EQ(bet.market, Market::SPREAD);
    EXPECT_EQ(bet.pick, Pick::HOME);
    EXPECT_EQ(bet.outcome, Outcome::PUSH);
    EXPECT_DOUBLE_EQ(bet.line, -3.0);
}

TEST_F(GradingEngineTest, SpreadPickFollowsModelAgainstLine) {
    // Model likes home more than the market
    EXPECT_EQ(GradingEngine::grade_spread_against(-7.0, -3.0, LineSource::MARKET, 24, 17).outcome,
              Outcome::WIN);
    EXPECT_EQ(GradingEngine::grade_spread_against(-7.0, -3.0, LineSource::MARKET, 18, 17).outcome,
              Outcome::LOSS);

    // Model likes home less than the market
    GradedBet away = GradingEngine::grade_spread_against(-1.0, -3.0, LineSource::MARKET, 18, 17);
    EXPECT_EQ(away.pick, Pick::AWAY);
    EXPECT_EQ(away.outcome, Outcome::WIN);
}

TEST_F(GradingEngineTest, SelfReferentialLineTakesPredictedFavorite) {
    GradedBet home = GradingEngine::grade_spread_against(-2.5, -2.5, LineSource::MODEL, 20, 17);
    EXPECT_EQ(home.pick, Pick::HOME);
    EXPECT_EQ(home.outcome, Outcome::WIN);

    GradedBet away = GradingEngine::grade_spread_against(3.0, 3.0, LineSource::MODEL, 10, 17);
    EXPECT_EQ(away.pick, Pick::AWAY);
    EXPECT_EQ(away.outcome, Outcome::WIN);

    GradedBet pickem = GradingEngine::grade_spread_against(0.0, 0.0, LineSource::MODEL, 17, 17);
    EXPECT_EQ(pickem.pick, Pick::AWAY);
    EXPECT_EQ(pickem.outcome, Outcome::PUSH);
}

TEST_F(GradingEngineTest, TotalsOverUnderAndPush) {
    GradedBet over = GradingEngine::grade_total_against(47.0, 44.5, LineSource::MARKET, 27, 21);
    EXPECT_EQ(over.market, Market::TOTAL);
    EXPECT_EQ(over.pick, Pick::OVER);
    EXPECT_EQ(over.outcome, Outcome::WIN);

    GradedBet under = GradingEngine::grade_total_against(41.0, 44.5, LineSource::MARKET, 27, 21);
    EXPECT_EQ(under.pick, Pick::UNDER);
    EXPECT_EQ(under.outcome, Outcome::LOSS);

    EXPECT_EQ(GradingEngine::grade_total_against(41.0, 44.0, LineSource::MARKET, 24, 20).outcome,
              Outcome::PUSH);
}

TEST_F(GradingEngineTest, SpreadMissingLinePolicy) {
    GradingEngine nfl(SportProfile::for_sport(Sport::NFL));
    GradingEngine nba(SportProfile::for_sport(Sport::NBA));
    auto pred = prediction(-3.5, 44.0);

    auto fallback = nfl.grade_spread(pred, std::nullopt, 24, 17);
    ASSERT_TRUE(fallback.has_value());
    EXPECT_EQ(fallback->source, LineSource::MODEL);
    EXPECT_DOUBLE_EQ(fallback->line, -3.5);
    EXPECT_EQ(fallback->outcome, Outcome::WIN);

    EXPECT_FALSE(nba.grade_spread(pred, std::nullopt, 110, 100).has_value());
    EXPECT_FALSE(nba.grade_spread(pred, make_line("g1", std::nullopt, 220.0), 110, 100)
                     .has_value());

    auto market = nba.grade_spread(pred, make_line("g1", -6.5, 220.0), 110, 100);
    ASSERT_TRUE(market.has_value());
    EXPECT_EQ(market->source, LineSource::MARKET);
    EXPECT_EQ(market->pick, Pick::AWAY);
    EXPECT_EQ(market->outcome, Outcome::LOSS);
}

TEST_F(GradingEngineTest, SpreadLineModes) {
    GradingEngine nfl(SportProfile::for_sport(Sport::NFL));
    auto pred = prediction(-3.5, 44.0);

    EXPECT_FALSE(nfl.grade_spread(pred, std::nullopt, 24, 17, SpreadLineMode::MARKET_ONLY)
                     .has_value());

    auto model = nfl.grade_spread(pred, make_line("g1", -7.0, 44.0), 24, 17,
                                  SpreadLineMode::MODEL_ONLY);
    ASSERT_TRUE(model.has_value());
    EXPECT_EQ(model->source, LineSource::MODEL);
    EXPECT_DOUBLE_EQ(model->line, -3.5);

    EXPECT_EQ(spread_line_mode_from_string("market_only"), SpreadLineMode::MARKET_ONLY);
    EXPECT_EQ(to_string(SpreadLineMode::MODEL_ONLY), "model_only");
    EXPECT_FALSE(spread_line_mode_from_string("closing").has_value());
}

TEST_F(GradingEngineTest, TotalMissingLinePolicy) {
    GradingEngine nfl(SportProfile::for_sport(Sport::NFL));
    GradingEngine nhl(SportProfile::for_sport(Sport::NHL));

    auto baseline = nfl.grade_total(prediction(-3.0, 47.0), std::nullopt, 27, 20);
    ASSERT_TRUE(baseline.has_value());
    EXPECT_EQ(baseline->source, LineSource::BASELINE);
    EXPECT_DOUBLE_EQ(baseline->line, 44.0);
    EXPECT_EQ(baseline->pick, Pick::OVER);
    EXPECT_EQ(baseline->outcome, Outcome::WIN);

    // A zero total is no line at all
    auto zero = nfl.grade_total(prediction(-3.0, 47.0), make_line("g1", -3.0, 0.0), 27, 20);
    ASSERT_TRUE(zero.has_value());
    EXPECT_EQ(zero->source, LineSource::BASELINE);

    EXPECT_FALSE(nhl.grade_total(prediction(-0.5, 6.0), std::nullopt, 3, 2).has_value());

    auto market = nhl.grade_total(prediction(-0.5, 6.0), make_line("g1", -1.5, 5.5), 3, 2);
    ASSERT_TRUE(market.has_value());
    EXPECT_EQ(market->source, LineSource::MARKET);
    EXPECT_EQ(market->outcome, Outcome::LOSS);
}

TEST_F(GradingEngineTest, MoneylineAndTies) {
    GradingEngine nfl(SportProfile::for_sport(Sport::NFL));
    GradingEngine nba(SportProfile::for_sport(Sport::NBA));

    auto win = nfl.grade_moneyline(prediction(-3.0, 44.0, 0.62), 21, 14);
    ASSERT_TRUE(win.has_value());
    EXPECT_EQ(win->market, Market::MONEYLINE);
    EXPECT_EQ(win->source, LineSource::MODEL);
    EXPECT_EQ(win->pick, Pick::HOME);
    EXPECT_EQ(win->outcome, Outcome::WIN);

    // An even probability backs the away side
    auto coin = nfl.grade_moneyline(prediction(0.0, 44.0, 0.5), 21, 14);
    ASSERT_TRUE(coin.has_value());
    EXPECT_EQ(coin->pick, Pick::AWAY);
    EXPECT_EQ(coin->outcome, Outcome::LOSS);

    auto tie = nfl.grade_moneyline(prediction(-3.0, 44.0, 0.62), 20, 20);
    ASSERT_TRUE(tie.has_value());
    EXPECT_EQ(tie->outcome, Outcome::PUSH);

    EXPECT_FALSE(nba.grade_moneyline(prediction(-3.0, 220.0, 0.62), 100, 100).has_value());
}
