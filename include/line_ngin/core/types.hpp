// include/line_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace line_ngin {

/**
 * @brief Timestamp type for consistent time representation
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Team identifier as issued by the upstream schedule provider
 */
using TeamId = std::string;

/**
 * @brief Rating value (Elo scale, 1500 = league average)
 */
using Rating = double;

constexpr Rating DEFAULT_RATING = 1500.0;

/**
 * @brief Supported leagues
 */
enum class Sport {
    NFL,
    NBA,
    NHL,
    CBB  // NCAA men's basketball
};

enum class GameStatus {
    SCHEDULED,
    FINAL
};

/**
 * @brief Bet markets graded by the engine
 */
enum class Market {
    SPREAD,
    MONEYLINE,
    TOTAL
};

enum class Outcome {
    WIN,
    LOSS,
    PUSH
};

enum class Pick {
    HOME,
    AWAY,
    OVER,
    UNDER
};

/**
 * @brief Where the line a bet was graded against came from
 */
enum class LineSource {
    MARKET,    // Captured sportsbook line
    MODEL,     // The model's own predicted line (self-referential)
    BASELINE   // Sport-wide constant, used for totals when no market line exists
};

enum class ConfidenceTier {
    LOW,
    MEDIUM,
    HIGH
};

/**
 * @brief Team as supplied by the schedule collaborator
 */
struct Team {
    TeamId id;
    std::string abbreviation;
    Rating rating{DEFAULT_RATING};
    double points_scored_avg{0.0};   // Per-game average, 0 when unknown
    double points_allowed_avg{0.0};  // Per-game average, 0 when unknown
    int games_played{0};
};

/**
 * @brief Scheduled or completed game
 */
struct Game {
    std::string id;
    TeamId home_team_id;
    TeamId away_team_id;
    Timestamp scheduled_time;
    GameStatus status{GameStatus::SCHEDULED};
    std::optional<int> home_score;
    std::optional<int> away_score;
    std::optional<double> weather_impact;  // Point-valued, outdoor games only

    bool is_completed() const {
        return status == GameStatus::FINAL && home_score.has_value() && away_score.has_value();
    }
};

/**
 * @brief Sportsbook line for one game
 * Spread is from the home perspective: negative means home favored.
 */
struct MarketLine {
    std::string game_id;
    std::optional<double> spread;
    std::optional<double> total;
    Timestamp captured_at;
    std::optional<Timestamp> locked_at;

    // Snapshots for line movement display
    std::optional<double> opening_spread;
    std::optional<double> opening_total;
    std::optional<double> closing_spread;
    std::optional<double> closing_total;

    /**
     * @brief Closing minus opening spread, when both snapshots exist
     */
    std::optional<double> spread_movement() const {
        if (!opening_spread || !closing_spread) {
            return std::nullopt;
        }
        return *closing_spread - *opening_spread;
    }

    /**
     * @brief Closing minus opening total, when both snapshots exist
     */
    std::optional<double> total_movement() const {
        if (!opening_total || !closing_total) {
            return std::nullopt;
        }
        return *closing_total - *opening_total;
    }
};

/**
 * @brief Confidence metadata attached to a prediction
 * Edges are |model - market| in points (spread/total) or |p - 0.5| * 100 (moneyline).
 */
struct ConfidenceTiers {
    ConfidenceTier spread{ConfidenceTier::LOW};
    ConfidenceTier total{ConfidenceTier::LOW};
    ConfidenceTier moneyline{ConfidenceTier::LOW};
    double spread_edge{0.0};
    double total_edge{0.0};
    double moneyline_edge{0.0};
};

/**
 * @brief Model output for one game
 */
struct PredictionRecord {
    std::string game_id;
    double home_score{0.0};
    double away_score{0.0};
    double spread{0.0};  // away - home after shrinkage, negative = home favored
    double raw_spread{0.0};  // Same, from unrounded scores and before line rounding
    double total{0.0};
    double home_win_probability{0.5};
    ConfidenceTiers confidence;
};

/**
 * @brief One graded bet on one market
 */
struct GradedBet {
    Market market{Market::SPREAD};
    Pick pick{Pick::HOME};
    double line{0.0};  // Spread or total line; 0 for moneyline
    LineSource source{LineSource::MARKET};
    Outcome outcome{Outcome::PUSH};
};

/**
 * @brief Backtest log entry for one historical game
 */
struct BacktestResult {
    std::string game_id;
    Timestamp scheduled_time;
    TeamId home_team_id;
    TeamId away_team_id;
    std::string home_abbreviation;
    std::string away_abbreviation;

    // Pre-game state
    Rating home_rating{DEFAULT_RATING};
    Rating away_rating{DEFAULT_RATING};

    PredictionRecord prediction;
    std::optional<MarketLine> market_line;

    int actual_home_score{0};
    int actual_away_score{0};

    std::optional<GradedBet> spread;
    std::optional<GradedBet> moneyline;
    std::optional<GradedBet> total;

    bool is_high_conviction{false};

    int actual_spread() const {
        return actual_away_score - actual_home_score;
    }
    int actual_total() const {
        return actual_home_score + actual_away_score;
    }
};

// ========== String conversions ==========

inline std::string to_string(Sport sport) {
    switch (sport) {
        case Sport::NFL:
            return "nfl";
        case Sport::NBA:
            return "nba";
        case Sport::NHL:
            return "nhl";
        case Sport::CBB:
            return "cbb";
    }
    return "unknown";
}

inline std::optional<Sport> sport_from_string(const std::string& s) {
    if (s == "nfl") return Sport::NFL;
    if (s == "nba") return Sport::NBA;
    if (s == "nhl") return Sport::NHL;
    if (s == "cbb") return Sport::CBB;
    return std::nullopt;
}

inline std::string to_string(GameStatus status) {
    return status == GameStatus::FINAL ? "final" : "scheduled";
}

inline std::optional<GameStatus> game_status_from_string(const std::string& s) {
    if (s == "final") return GameStatus::FINAL;
    if (s == "scheduled") return GameStatus::SCHEDULED;
    return std::nullopt;
}

inline std::string to_string(Market market) {
    switch (market) {
        case Market::SPREAD:
            return "spread";
        case Market::MONEYLINE:
            return "moneyline";
        case Market::TOTAL:
            return "total";
    }
    return "unknown";
}

inline std::optional<Market> market_from_string(const std::string& s) {
    if (s == "spread") return Market::SPREAD;
    if (s == "moneyline") return Market::MONEYLINE;
    if (s == "total") return Market::TOTAL;
    return std::nullopt;
}

inline std::string to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::WIN:
            return "win";
        case Outcome::LOSS:
            return "loss";
        case Outcome::PUSH:
            return "push";
    }
    return "unknown";
}

inline std::optional<Outcome> outcome_from_string(const std::string& s) {
    if (s == "win") return Outcome::WIN;
    if (s == "loss") return Outcome::LOSS;
    if (s == "push") return Outcome::PUSH;
    return std::nullopt;
}

inline std::string to_string(Pick pick) {
    switch (pick) {
        case Pick::HOME:
            return "home";
        case Pick::AWAY:
            return "away";
        case Pick::OVER:
            return "over";
        case Pick::UNDER:
            return "under";
    }
    return "unknown";
}

inline std::optional<Pick> pick_from_string(const std::string& s) {
    if (s == "home") return Pick::HOME;
    if (s == "away") return Pick::AWAY;
    if (s == "over") return Pick::OVER;
    if (s == "under") return Pick::UNDER;
    return std::nullopt;
}

inline std::string to_string(LineSource source) {
    switch (source) {
        case LineSource::MARKET:
            return "market";
        case LineSource::MODEL:
            return "model";
        case LineSource::BASELINE:
            return "baseline";
    }
    return "unknown";
}

inline std::optional<LineSource> line_source_from_string(const std::string& s) {
    if (s == "market") return LineSource::MARKET;
    if (s == "model") return LineSource::MODEL;
    if (s == "baseline") return LineSource::BASELINE;
    return std::nullopt;
}

inline std::string to_string(ConfidenceTier tier) {
    switch (tier) {
        case ConfidenceTier::LOW:
            return "low";
        case ConfidenceTier::MEDIUM:
            return "medium";
        case ConfidenceTier::HIGH:
            return "high";
    }
    return "unknown";
}

inline std::optional<ConfidenceTier> confidence_tier_from_string(const std::string& s) {
    if (s == "low") return ConfidenceTier::LOW;
    if (s == "medium") return ConfidenceTier::MEDIUM;
    if (s == "high") return ConfidenceTier::HIGH;
    return std::nullopt;
}

}  // namespace line_ngin
