#include "line_ngin/grading/grading_engine.hpp"

namespace line_ngin {

std::string to_string(SpreadLineMode mode) {
    switch (mode) {
        case SpreadLineMode::POLICY:
            return "policy";
        case SpreadLineMode::MARKET_ONLY:
            return "market_only";
        case SpreadLineMode::MODEL_ONLY:
            return "model_only";
    }
    return "unknown";
}

std::optional<SpreadLineMode> spread_line_mode_from_string(const std::string& s) {
    if (s == "policy") return SpreadLineMode::POLICY;
    if (s == "market_only") return SpreadLineMode::MARKET_ONLY;
    if (s == "model_only") return SpreadLineMode::MODEL_ONLY;
    return std::nullopt;
}

GradingEngine::GradingEngine(const SportProfile& profile)
    : spread_missing_line_(profile.spread_missing_line),
      total_missing_line_(profile.total_missing_line),
      total_baseline_(profile.total_baseline),
      allows_ties_(profile.allows_ties) {}

GradedBet GradingEngine::grade_spread_against(double predicted_spread, double line,
                                              LineSource source, int home_score,
                                              int away_score) {
    GradedBet bet;
    bet.market = Market::SPREAD;
    bet.line = line;
    bet.source = source;

    bool pick_home = predicted_spread < line;
    if (predicted_spread == line) {
        // Self-referential line: side with the predicted favorite
        pick_home = predicted_spread < 0.0;
    }
    bet.pick = pick_home ? Pick::HOME : Pick::AWAY;

    const double cover = static_cast<double>(home_score - away_score) + line;
    if (cover == 0.0) {
        bet.outcome = Outcome::PUSH;
    } else if ((cover > 0.0) == pick_home) {
        bet.outcome = Outcome::WIN;
    } else {
        bet.outcome = Outcome::LOSS;
    }
    return bet;
}

GradedBet GradingEngine::grade_total_against(double predicted_total, double line,
                                             LineSource source, int home_score, int away_score) {
    GradedBet bet;
    bet.market = Market::TOTAL;
    bet.line = line;
    bet.source = source;

    const bool pick_over = predicted_total > line;
    bet.pick = pick_over ? Pick::OVER : Pick::UNDER;

    const double actual = static_cast<double>(home_score + away_score);
    if (actual == line) {
        bet.outcome = Outcome::PUSH;
    } else if ((actual > line) == pick_over) {
        bet.outcome = Outcome::WIN;
    } else {
        bet.outcome = Outcome::LOSS;
    }
    return bet;
}

std::optional<GradedBet> GradingEngine::grade_spread(const PredictionRecord& prediction,
                                                     const std::optional<MarketLine>& market_line,
                                                     int home_score, int away_score,
                                                     SpreadLineMode mode) const {
    const bool has_market = market_line && market_line->spread.has_value();

    if (mode == SpreadLineMode::MODEL_ONLY) {
        return grade_spread_against(prediction.spread, prediction.spread, LineSource::MODEL,
                                    home_score, away_score);
    }
    if (has_market) {
        return grade_spread_against(prediction.spread, *market_line->spread, LineSource::MARKET,
                                    home_score, away_score);
    }
    if (mode == SpreadLineMode::MARKET_ONLY || spread_missing_line_ == MissingLinePolicy::SKIP) {
        return std::nullopt;
    }
    return grade_spread_against(prediction.spread, prediction.spread, LineSource::MODEL,
                                home_score, away_score);
}

std::optional<GradedBet> GradingEngine::grade_moneyline(const PredictionRecord& prediction,
                                                        int home_score, int away_score) const {
    GradedBet bet;
    bet.market = Market::MONEYLINE;
    bet.source = LineSource::MODEL;
    bet.line = 0.0;

    const bool pick_home = prediction.home_win_probability > 0.5;
    bet.pick = pick_home ? Pick::HOME : Pick::AWAY;

    if (home_score == away_score) {
        if (!allows_ties_) {
            return std::nullopt;
        }
        bet.outcome = Outcome::PUSH;
        return bet;
    }
    bet.outcome = ((home_score > away_score) == pick_home) ? Outcome::WIN : Outcome::LOSS;
    return bet;
}

std::optional<GradedBet> GradingEngine::grade_total(const PredictionRecord& prediction,
                                                    const std::optional<MarketLine>& market_line,
                                                    int home_score, int away_score) const {
    if (market_line && market_line->total && *market_line->total > 0.0) {
        return grade_total_against(prediction.total, *market_line->total, LineSource::MARKET,
                                   home_score, away_score);
    }
    if (total_missing_line_ == MissingLinePolicy::SKIP) {
        return std::nullopt;
    }
    return grade_total_against(prediction.total, total_baseline_, LineSource::BASELINE,
                               home_score, away_score);
}

}  // namespace line_ngin
