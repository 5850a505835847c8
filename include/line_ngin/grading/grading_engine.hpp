// include/line_ngin/grading/grading_engine.hpp
#pragma once

#include <optional>
#include <string>
#include "line_ngin/core/sport_profile.hpp"
#include "line_ngin/core/types.hpp"

namespace line_ngin {

/**
 * @brief Which line a spread bet is graded against
 */
enum class SpreadLineMode {
    POLICY,       // Market line, else the sport's missing-line policy
    MARKET_ONLY,  // Market line, else ungraded
    MODEL_ONLY    // Always the model's own line
};

std::string to_string(SpreadLineMode mode);
std::optional<SpreadLineMode> spread_line_mode_from_string(const std::string& s);

/**
 * @brief Grades predictions against final scores
 *
 * A market with no usable line follows the sport's MissingLinePolicy; every graded bet
 * carries the LineSource it was graded against. std::nullopt means "not graded".
 */
class GradingEngine {
public:
    explicit GradingEngine(const SportProfile& profile);

    /**
     * @brief Grade a spread bet against a fixed line
     * @param predicted_spread Model spread (away - home)
     * @param line Home-perspective line, negative = home favored
     */
    static GradedBet grade_spread_against(double predicted_spread, double line, LineSource source,
                                          int home_score, int away_score);

    static GradedBet grade_total_against(double predicted_total, double line, LineSource source,
                                         int home_score, int away_score);

    std::optional<GradedBet> grade_spread(const PredictionRecord& prediction,
                                          const std::optional<MarketLine>& market_line,
                                          int home_score, int away_score,
                                          SpreadLineMode mode = SpreadLineMode::POLICY) const;

    /**
     * @brief Grade the moneyline
     *
     * A tied final is a push in sports that allow ties and ungraded otherwise.
     */
    std::optional<GradedBet> grade_moneyline(const PredictionRecord& prediction, int home_score,
                                             int away_score) const;

    std::optional<GradedBet> grade_total(const PredictionRecord& prediction,
                                         const std::optional<MarketLine>& market_line,
                                         int home_score, int away_score) const;

private:
    MissingLinePolicy spread_missing_line_;
    MissingLinePolicy total_missing_line_;
    double total_baseline_;
    bool allows_ties_;
};

}  // namespace line_ngin
