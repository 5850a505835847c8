#include <gtest/gtest.h>
#include "../core/test_base.hpp"
#include "line_ngin/backtest/backtest_summary.hpp"

using namespace line_ngin;
using namespace line_ngin::backtest;
using namespace line_ngin::testing;

class BacktestSummaryTest : public TestBase {
protected:
    static GradedBet bet(Market market, LineSource source, Outcome outcome) {
        GradedBet graded;
        graded.market = market;
        graded.source = source;
        graded.outcome = outcome;
        return graded;
    }

    static BacktestResult result(const std::string& id, double pred_spread, double pred_total,
                                 int home_score, int away_score) {
        BacktestResult r;
        r.game_id = id;
        r.prediction.spread = pred_spread;
        r.prediction.total = pred_total;
        r.actual_home_score = home_score;
        r.actual_away_score = away_score;
        return r;
    }

    std::vector<BacktestResult> sample_log() const {
        std::vector<BacktestResult> log;

        BacktestResult r1 = result("g1", -3.0, 44.0, 24, 17);
        r1.spread = bet(Market::SPREAD, LineSource::MARKET, Outcome::WIN);
        r1.moneyline = bet(Market::MONEYLINE, LineSource::MODEL, Outcome::WIN);
        r1.total = bet(Market::TOTAL, LineSource::MARKET, Outcome::LOSS);
        r1.is_high_conviction = true;
        log.push_back(r1);

        BacktestResult r2 = result("g2", 2.0, 45.0, 20, 23);
        r2.spread = bet(Market::SPREAD, LineSource::MODEL, Outcome::PUSH);
        r2.moneyline = bet(Market::MONEYLINE, LineSource::MODEL, Outcome::LOSS);
        r2.total = bet(Market::TOTAL, LineSource::BASELINE, Outcome::WIN);
        log.push_back(r2);

        BacktestResult r3 = result("g3", 0.0, 40.0, 10, 10);
        r3.total = bet(Market::TOTAL, LineSource::MARKET, Outcome::WIN);
        log.push_back(r3);

        return log;
    }
};

TEST_F(BacktestSummaryTest, TalliesStaySplitByLineSource) {
    BacktestSummaryCalculator calculator;
    BacktestSummary summary = calculator.calculate(sample_log());

    EXPECT_EQ(summary.total_games, 3);
    EXPECT_EQ(summary.spread.market.wins, 1);
    EXPECT_EQ(summary.spread.market.total_graded(), 1);
    EXPECT_EQ(summary.spread.model.pushes, 1);
    EXPECT_EQ(summary.spread.baseline.total_graded(), 0);

    EXPECT_EQ(summary.moneyline.model.wins, 1);
    EXPECT_EQ(summary.moneyline.model.losses, 1);
    EXPECT_DOUBLE_EQ(summary.moneyline.model.win_pct(), 50.0);

    EXPECT_EQ(summary.total.market.wins, 1);
    EXPECT_EQ(summary.total.market.losses, 1);
    EXPECT_EQ(summary.total.baseline.wins, 1);
}

TEST_F(BacktestSummaryTest, HighConvictionSubset) {
    BacktestSummaryCalculator calculator;
    BacktestSummary summary = calculator.calculate(sample_log());

    EXPECT_EQ(summary.high_conviction_games, 1);
    EXPECT_EQ(summary.high_conviction_spread.market.wins, 1);
    EXPECT_EQ(summary.high_conviction_moneyline.model.wins, 1);
    EXPECT_EQ(summary.high_conviction_total.market.losses, 1);
    EXPECT_EQ(summary.high_conviction_total.baseline.total_graded(), 0);
}

TEST_F(BacktestSummaryTest, MeanAbsoluteErrors) {
    BacktestSummaryCalculator calculator;
    BacktestSummary summary = calculator.calculate(sample_log());

    // Spread errors 4, 1, 0; total errors 3, 2, 20
    EXPECT_NEAR(summary.spread_mae, 5.0 / 3.0, 1e-12);
    EXPECT_NEAR(summary.total_mae, 25.0 / 3.0, 1e-12);
}

TEST_F(BacktestSummaryTest, EmptyLog) {
    BacktestSummaryCalculator calculator;
    BacktestSummary summary = calculator.calculate({});
    EXPECT_EQ(summary.total_games, 0);
    EXPECT_DOUBLE_EQ(summary.spread_mae, 0.0);
    EXPECT_DOUBLE_EQ(summary.spread.market.win_pct(), 0.0);
}

TEST_F(BacktestSummaryTest, PercentagesAndProfit) {
    EXPECT_DOUBLE_EQ(BacktestSummaryCalculator::percentage(2, 3), 66.7);
    EXPECT_DOUBLE_EQ(BacktestSummaryCalculator::percentage(1, 0), 0.0);
    EXPECT_DOUBLE_EQ(BacktestSummaryCalculator::percentage(55, 100), 55.0);

    OutcomeTally tally;
    tally.wins = 1;
    tally.losses = 1;
    tally.pushes = 5;
    // Pushes are refunded and stay out of the denominator
    EXPECT_DOUBLE_EQ(tally.win_pct(), 50.0);
    EXPECT_DOUBLE_EQ(tally.profit(), -10.0);

    tally.wins = 3;
    EXPECT_DOUBLE_EQ(tally.profit(), 190.0);
}

TEST_F(BacktestSummaryTest, JsonLayout) {
    BacktestSummaryCalculator calculator;
    nlohmann::json j = to_json(calculator.calculate(sample_log()));

    EXPECT_EQ(j.at("total_games").get<int>(), 3);
    EXPECT_EQ(j.at("spread").at("market").at("wins").get<int>(), 1);
    EXPECT_EQ(j.at("total").at("baseline").at("total_graded").get<int>(), 1);
    EXPECT_EQ(j.at("high_conviction").at("games").get<int>(), 1);
    EXPECT_DOUBLE_EQ(j.at("moneyline").at("model").at("win_pct").get<double>(), 50.0);
}
