#include "line_ngin/statistics/calibrator.hpp"
#include <cmath>
#include <string>
#include "line_ngin/core/logger.hpp"

namespace line_ngin {
namespace statistics {

namespace {
constexpr double VARIANCE_EPSILON = 1e-12;
}

std::pair<double, double> Calibrator::fit_line(const Eigen::VectorXd& x,
                                               const Eigen::VectorXd& y) {
    const Eigen::Index n = x.size();
    if (n == 0 || y.size() != n) {
        return {0.0, 0.0};
    }

    Eigen::VectorXd centered = x.array() - x.mean();
    if (centered.squaredNorm() < VARIANCE_EPSILON) {
        return {0.0, 0.0};
    }

    // Design matrix [x 1]
    Eigen::MatrixXd design(n, 2);
    design.col(0) = x;
    design.col(1) = Eigen::VectorXd::Ones(n);

    Eigen::Vector2d coefficients = design.colPivHouseholderQr().solve(y);
    return {coefficients(0), coefficients(1)};
}

double Calibrator::r_squared(const Eigen::VectorXd& x, const Eigen::VectorXd& y, double slope,
                             double intercept) {
    if (y.size() == 0) {
        return 0.0;
    }
    Eigen::VectorXd predicted = (x.array() * slope + intercept).matrix();
    double ss_res = (y - predicted).squaredNorm();
    double ss_tot = (y.array() - y.mean()).matrix().squaredNorm();
    if (ss_tot < VARIANCE_EPSILON) {
        return 0.0;
    }
    return 1.0 - ss_res / ss_tot;
}

CalibrationResult Calibrator::calibrate(const std::vector<RatingSample>& samples) const {
    Logger::register_component("Calibrator");

    CalibrationResult result;
    result.sample_size = static_cast<int>(samples.size());
    if (samples.empty()) {
        WARN("No samples to calibrate on");
        return result;
    }

    const Eigen::Index n = static_cast<Eigen::Index>(samples.size());
    Eigen::VectorXd x(n);
    Eigen::VectorXd y(n);
    int home_wins = 0;
    for (Eigen::Index i = 0; i < n; ++i) {
        x(i) = samples[i].rating_diff;
        y(i) = samples[i].margin;
        if (samples[i].margin > 0) {
            home_wins++;
        }
    }

    auto [slope, intercept] = fit_line(x, y);
    result.rating_to_points = slope * 100.0;
    result.home_advantage = intercept;
    result.r_squared = r_squared(x, y, slope, intercept);

    result.mean_abs_rating_diff = x.array().abs().mean();
    result.mean_margin = y.mean();
    result.home_win_pct = 100.0 * home_wins / static_cast<double>(n);

    INFO("Calibrated on " << n << " games: " << result.rating_to_points
                          << " points per 100 rating, home advantage " << result.home_advantage
                          << ", R^2 " << result.r_squared);
    return result;
}

Result<SimulationParams> apply_calibration(const CalibrationResult& calibration,
                                           const SimulationParams& base) {
    if (calibration.sample_size < 2) {
        return make_error<SimulationParams>(
            ErrorCode::INVALID_DATA,
            "Calibration needs at least 2 samples, got " +
                std::to_string(calibration.sample_size),
            "Calibrator");
    }
    if (!(calibration.rating_to_points > 0.0)) {
        return make_error<SimulationParams>(
            ErrorCode::INVALID_DATA,
            "Calibrated rating_to_points must be positive, got " +
                std::to_string(calibration.rating_to_points),
            "Calibrator");
    }

    SimulationParams params = base;
    params.rating_to_points = calibration.rating_to_points;
    params.home_advantage = calibration.home_advantage;

    auto valid = params.validate();
    if (valid.is_error()) {
        return forward_error<SimulationParams>(*valid.error(), "Calibrator");
    }
    return params;
}

nlohmann::json to_json(const CalibrationResult& result) {
    nlohmann::json j;
    j["rating_to_points"] = result.rating_to_points;
    j["home_advantage"] = result.home_advantage;
    j["r_squared"] = result.r_squared;
    j["sample_size"] = result.sample_size;
    j["mean_abs_rating_diff"] = result.mean_abs_rating_diff;
    j["mean_margin"] = result.mean_margin;
    j["home_win_pct"] = result.home_win_pct;
    return j;
}

}  // namespace statistics
}  // namespace line_ngin
