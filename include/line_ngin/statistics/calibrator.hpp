// include/line_ngin/statistics/calibrator.hpp
#pragma once

#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include <utility>
#include <vector>
#include "line_ngin/core/error.hpp"
#include "line_ngin/core/simulation_params.hpp"

namespace line_ngin {
namespace statistics {

/**
 * @brief One completed game seen from the home side before kickoff
 */
struct RatingSample {
    double rating_diff{0.0};  // home rating - away rating, pre-game
    int margin{0};            // home score - away score
};

/**
 * @brief Fitted point-spread constants
 */
struct CalibrationResult {
    double rating_to_points{0.0};  // Slope per 100 rating points
    double home_advantage{0.0};    // Intercept, in points
    double r_squared{0.0};
    int sample_size{0};

    // Descriptive statistics of the sample
    double mean_abs_rating_diff{0.0};
    double mean_margin{0.0};
    double home_win_pct{0.0};
};

/**
 * @brief Ordinary least squares fit of margin on rating difference
 *
 * margin ~ slope * rating_diff + intercept. Degenerate input (no samples, or no
 * variance in rating_diff) yields slope and intercept 0 rather than an error.
 */
class Calibrator {
public:
    Calibrator() = default;

    CalibrationResult calibrate(const std::vector<RatingSample>& samples) const;

    /**
     * @brief Fit y = slope * x + intercept
     * @return (slope, intercept), (0, 0) for degenerate input
     */
    static std::pair<double, double> fit_line(const Eigen::VectorXd& x, const Eigen::VectorXd& y);

    static double r_squared(const Eigen::VectorXd& x, const Eigen::VectorXd& y, double slope,
                            double intercept);
};

/**
 * @brief Copy a fit into the point-spread constants the predictor runs on
 * @param calibration Fit from Calibrator::calibrate
 * @param base Params to start from, every other field is kept
 * @return base with rating_to_points and home_advantage replaced, or INVALID_DATA when
 *         the fit is degenerate (fewer than two samples, or a slope that is not positive)
 */
Result<SimulationParams> apply_calibration(const CalibrationResult& calibration,
                                           const SimulationParams& base);

nlohmann::json to_json(const CalibrationResult& result);

}  // namespace statistics
}  // namespace line_ngin
