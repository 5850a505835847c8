// include/line_ngin/core/simulation_params.hpp
#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "line_ngin/core/config_base.hpp"
#include "line_ngin/core/error.hpp"

namespace line_ngin {

/**
 * @brief Tunable fields of SimulationParams, addressable by name
 */
enum class ParamField {
    RATING_TO_POINTS,
    HOME_ADVANTAGE,
    SPREAD_SHRINKAGE,
    RATING_CAP,
    MIN_SPREAD,
    MAX_SPREAD,
    STATS_REGRESSION,
    WEATHER_COEFFICIENT
};

std::string to_string(ParamField field);
std::optional<ParamField> param_field_from_string(const std::string& name);
const std::vector<ParamField>& all_param_fields();

/**
 * @brief Model constants for one prediction/backtest configuration
 */
struct SimulationParams : public ConfigBase {
    double rating_to_points{5.93};    // Points of margin per 100 rating difference
    double home_advantage{2.28};      // Home edge in points, split across both scores
    double spread_shrinkage{0.55};    // Fraction the spread is shrunk toward 0
    double rating_cap{4.0};           // Max total rating adjustment in points (0 = no cap)
    double min_spread{0.0};           // Only bet if |spread| >= this
    double max_spread{100.0};         // Only bet if |spread| <= this
    double stats_regression{0.3};     // Fraction scoring stats regress toward league average
    double weather_coefficient{1.5};  // Total points removed per unit of weather impact

    SimulationParams() = default;
    SimulationParams(double rating_to_points_, double home_advantage_, double spread_shrinkage_,
                     double rating_cap_, double min_spread_, double max_spread_,
                     double stats_regression_, double weather_coefficient_)
        : rating_to_points(rating_to_points_),
          home_advantage(home_advantage_),
          spread_shrinkage(spread_shrinkage_),
          rating_cap(rating_cap_),
          min_spread(min_spread_),
          max_spread(max_spread_),
          stats_regression(stats_regression_),
          weather_coefficient(weather_coefficient_) {}

    double get(ParamField field) const;
    void set(ParamField field, double value);

    /**
     * @brief Check value ranges
     * @return Result indicating whether the parameters are usable
     */
    Result<void> validate() const override;

    bool operator==(const SimulationParams& other) const;
    bool operator!=(const SimulationParams& other) const {
        return !(*this == other);
    }

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

}  // namespace line_ngin
