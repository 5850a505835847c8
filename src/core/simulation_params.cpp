#include "line_ngin/core/simulation_params.hpp"
#include <cmath>

namespace line_ngin {

std::string to_string(ParamField field) {
    switch (field) {
        case ParamField::RATING_TO_POINTS:
            return "rating_to_points";
        case ParamField::HOME_ADVANTAGE:
            return "home_advantage";
        case ParamField::SPREAD_SHRINKAGE:
            return "spread_shrinkage";
        case ParamField::RATING_CAP:
            return "rating_cap";
        case ParamField::MIN_SPREAD:
            return "min_spread";
        case ParamField::MAX_SPREAD:
            return "max_spread";
        case ParamField::STATS_REGRESSION:
            return "stats_regression";
        case ParamField::WEATHER_COEFFICIENT:
            return "weather_coefficient";
    }
    return "unknown";
}

std::optional<ParamField> param_field_from_string(const std::string& name) {
    for (auto field : all_param_fields()) {
        if (to_string(field) == name) {
            return field;
        }
    }
    return std::nullopt;
}

const std::vector<ParamField>& all_param_fields() {
    static const std::vector<ParamField> fields = {
        ParamField::RATING_TO_POINTS, ParamField::HOME_ADVANTAGE,
        ParamField::SPREAD_SHRINKAGE, ParamField::RATING_CAP,
        ParamField::MIN_SPREAD,       ParamField::MAX_SPREAD,
        ParamField::STATS_REGRESSION, ParamField::WEATHER_COEFFICIENT};
    return fields;
}

double SimulationParams::get(ParamField field) const {
    switch (field) {
        case ParamField::RATING_TO_POINTS:
            return rating_to_points;
        case ParamField::HOME_ADVANTAGE:
            return home_advantage;
        case ParamField::SPREAD_SHRINKAGE:
            return spread_shrinkage;
        case ParamField::RATING_CAP:
            return rating_cap;
        case ParamField::MIN_SPREAD:
            return min_spread;
        case ParamField::MAX_SPREAD:
            return max_spread;
        case ParamField::STATS_REGRESSION:
            return stats_regression;
        case ParamField::WEATHER_COEFFICIENT:
            return weather_coefficient;
    }
    return 0.0;
}

void SimulationParams::set(ParamField field, double value) {
    switch (field) {
        case ParamField::RATING_TO_POINTS:
            rating_to_points = value;
            break;
        case ParamField::HOME_ADVANTAGE:
            home_advantage = value;
            break;
        case ParamField::SPREAD_SHRINKAGE:
            spread_shrinkage = value;
            break;
        case ParamField::RATING_CAP:
            rating_cap = value;
            break;
        case ParamField::MIN_SPREAD:
            min_spread = value;
            break;
        case ParamField::MAX_SPREAD:
            max_spread = value;
            break;
        case ParamField::STATS_REGRESSION:
            stats_regression = value;
            break;
        case ParamField::WEATHER_COEFFICIENT:
            weather_coefficient = value;
            break;
    }
}

Result<void> SimulationParams::validate() const {
    for (auto field : all_param_fields()) {
        if (!std::isfinite(get(field))) {
            return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                    to_string(field) + " must be finite", "SimulationParams");
        }
    }
    if (spread_shrinkage < 0.0 || spread_shrinkage >= 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "spread_shrinkage must be in [0, 1)", "SimulationParams");
    }
    if (stats_regression < 0.0 || stats_regression > 1.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "stats_regression must be in [0, 1]", "SimulationParams");
    }
    if (rating_cap < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "rating_cap cannot be negative",
                                "SimulationParams");
    }
    if (min_spread < 0.0 || max_spread < min_spread) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Spread window must satisfy 0 <= min_spread <= max_spread",
                                "SimulationParams");
    }
    if (weather_coefficient < 0.0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "weather_coefficient cannot be negative", "SimulationParams");
    }
    return Result<void>();
}

bool SimulationParams::operator==(const SimulationParams& other) const {
    for (auto field : all_param_fields()) {
        if (get(field) != other.get(field)) {
            return false;
        }
    }
    return true;
}

nlohmann::json SimulationParams::to_json() const {
    nlohmann::json j;
    for (auto field : all_param_fields()) {
        j[to_string(field)] = get(field);
    }
    return j;
}

void SimulationParams::from_json(const nlohmann::json& j) {
    for (auto field : all_param_fields()) {
        const auto name = to_string(field);
        if (j.contains(name)) {
            set(field, j.at(name).get<double>());
        }
    }
}

}  // namespace line_ngin
