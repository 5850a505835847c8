// include/line_ngin/prediction/pace_projector.hpp
#pragma once

#include <array>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "line_ngin/core/config_base.hpp"
#include "line_ngin/core/error.hpp"
#include "line_ngin/core/types.hpp"

namespace line_ngin {

/**
 * @brief Score-gap bucket used to pick a remaining-scoring multiplier
 */
enum class GapBucket {
    CLOSE,   // gap <= 4
    SMALL,   // gap <= 9
    MEDIUM,  // gap <= 14
    LARGE
};

/**
 * @brief Point in the game a multiplier was measured at
 */
enum class Checkpoint {
    FIRST_PERIOD,
    HALF,
    LATE
};

/**
 * @brief Game clock layout of a league
 */
struct PaceConfig : public ConfigBase {
    int regulation_periods{4};
    double period_minutes{12.0};
    double overtime_minutes{5.0};
    double min_elapsed_minutes{0.0};  // No projection before this much game time

    static PaceConfig for_sport(Sport sport);

    double regulation_minutes() const {
        return regulation_periods * period_minutes;
    }

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Historical per-period scoring used to refine the run-rate projection
 */
struct PeriodCalibration {
    std::unordered_map<TeamId, std::vector<double>> team_period_averages;
    // Indexed [Checkpoint][GapBucket]; missing entries behave as 1
    std::array<std::array<double, 4>, 3> gap_multipliers{{{1.0, 1.0, 1.0, 1.0},
                                                          {1.0, 1.0, 1.0, 1.0},
                                                          {1.0, 1.0, 1.0, 1.0}}};

    void set_multiplier(Checkpoint checkpoint, GapBucket bucket, double value) {
        gap_multipliers[static_cast<size_t>(checkpoint)][static_cast<size_t>(bucket)] = value;
    }
    double multiplier(Checkpoint checkpoint, GapBucket bucket) const {
        return gap_multipliers[static_cast<size_t>(checkpoint)][static_cast<size_t>(bucket)];
    }
};

/**
 * @brief Snapshot of a game in progress
 */
struct LiveGameState {
    TeamId home_team_id;
    TeamId away_team_id;
    int home_score{0};
    int away_score{0};
    int period{1};
    double minutes_elapsed{0.0};
};

struct PaceProjection {
    std::optional<double> run_rate;             // Points per minute so far
    std::optional<double> raw_projected_total;  // run_rate * regulation minutes
    std::optional<double> projected_total;      // Calibrated when possible, else raw
    std::optional<double> projected_home;
    std::optional<double> projected_away;
    bool calibrated{false};
};

/**
 * @brief In-game total projector
 *
 * The raw projection extends the current scoring rate over regulation. With a
 * PeriodCalibration for both teams, remaining per-period averages are scaled by the
 * score-gap multiplier and added to the current score instead.
 */
class PaceProjector {
public:
    explicit PaceProjector(PaceConfig config);

    static GapBucket gap_bucket(int gap);

    /**
     * @brief Game minutes elapsed at a clock reading
     * @param period 1-based period; periods past regulation are overtime
     * @param minutes_remaining Minutes left on the clock in that period
     */
    double elapsed_minutes(int period, double minutes_remaining) const;

    Checkpoint checkpoint_for(int current_period) const;

    /**
     * @brief Project the final total of a game in progress
     * @return Projection (empty before min_elapsed_minutes), or INVALID_ARGUMENT for an
     *         invalid clock layout or a non-finite elapsed time
     */
    Result<PaceProjection> project(const LiveGameState& state,
                                   const std::optional<PeriodCalibration>& calibration =
                                       std::nullopt) const;

private:
    PaceConfig config_;
};

std::string to_string(GapBucket bucket);
std::string to_string(Checkpoint checkpoint);

}  // namespace line_ngin
