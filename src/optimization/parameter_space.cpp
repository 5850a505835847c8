#include "line_ngin/optimization/parameter_space.hpp"
#include <algorithm>
#include <cmath>

namespace line_ngin {
namespace optimization {

ParameterGrid& ParameterGrid::add_axis(ParamField field, std::vector<double> values) {
    axes_.push_back(ParameterAxis{field, std::move(values)});
    return *this;
}

size_t ParameterGrid::size() const {
    if (axes_.empty()) {
        return 0;
    }
    size_t count = 1;
    for (const auto& axis : axes_) {
        count *= axis.values.size();
    }
    return count;
}

Result<std::vector<SimulationParams>> ParameterGrid::expand(
    const SimulationParams& baseline) const {
    for (size_t i = 0; i < axes_.size(); ++i) {
        if (axes_[i].values.empty()) {
            return make_error<std::vector<SimulationParams>>(
                ErrorCode::INVALID_ARGUMENT,
                "Axis " + to_string(axes_[i].field) + " in grid '" + name_ + "' has no values",
                "ParameterGrid");
        }
        for (size_t j = i + 1; j < axes_.size(); ++j) {
            if (axes_[i].field == axes_[j].field) {
                return make_error<std::vector<SimulationParams>>(
                    ErrorCode::INVALID_ARGUMENT,
                    "Field " + to_string(axes_[i].field) + " appears twice in grid '" + name_ +
                        "'",
                    "ParameterGrid");
            }
        }
    }

    std::vector<SimulationParams> combinations;
    if (axes_.empty()) {
        return combinations;
    }
    combinations.reserve(size());

    // Odometer over axis indices, last axis fastest
    std::vector<size_t> index(axes_.size(), 0);
    while (true) {
        SimulationParams params = baseline;
        for (size_t a = 0; a < axes_.size(); ++a) {
            params.set(axes_[a].field, axes_[a].values[index[a]]);
        }
        combinations.push_back(params);

        size_t a = axes_.size();
        while (a > 0) {
            --a;
            if (++index[a] < axes_[a].values.size()) {
                break;
            }
            index[a] = 0;
            if (a == 0) {
                return combinations;
            }
        }
    }
}

ParameterSpace& ParameterSpace::add_grid(ParameterGrid grid) {
    grids_.push_back(std::move(grid));
    return *this;
}

Result<std::vector<SimulationParams>> ParameterSpace::expand(
    const SimulationParams& baseline) const {
    std::vector<SimulationParams> all{baseline};

    for (const auto& grid : grids_) {
        auto expanded = grid.expand(baseline);
        if (expanded.is_error()) {
            return forward_error<std::vector<SimulationParams>>(*expanded.error(),
                                                                "ParameterSpace");
        }
        for (const auto& params : expanded.value()) {
            if (std::find(all.begin(), all.end(), params) == all.end()) {
                all.push_back(params);
            }
        }
    }
    return std::move(all);
}

ParameterSpace ParameterSpace::default_search_plan() {
    ParameterSpace space;

    // Single-axis sweeps against the baseline
    space.add_grid(ParameterGrid("spread_shrinkage")
                       .add_axis(ParamField::SPREAD_SHRINKAGE, {0.1, 0.2, 0.3, 0.4, 0.5}));
    space.add_grid(ParameterGrid("rating_cap").add_axis(ParamField::RATING_CAP, {4, 6, 8, 10}));
    space.add_grid(ParameterGrid("max_spread").add_axis(ParamField::MAX_SPREAD, {3, 5, 7, 10}));
    space.add_grid(ParameterGrid("min_spread").add_axis(ParamField::MIN_SPREAD, {1, 2, 3}));

    // Pairs
    space.add_grid(ParameterGrid("shrinkage_x_max_spread")
                       .add_axis(ParamField::SPREAD_SHRINKAGE, {0.2, 0.3, 0.4})
                       .add_axis(ParamField::MAX_SPREAD, {5, 7, 10}));
    space.add_grid(ParameterGrid("rating_cap_x_shrinkage")
                       .add_axis(ParamField::RATING_CAP, {4, 6, 8})
                       .add_axis(ParamField::SPREAD_SHRINKAGE, {0.2, 0.3}));
    space.add_grid(ParameterGrid("rating_to_points_x_shrinkage")
                       .add_axis(ParamField::RATING_TO_POINTS, {4, 5, 7, 8})
                       .add_axis(ParamField::SPREAD_SHRINKAGE, {0.0, 0.2, 0.3}));

    space.add_grid(
        ParameterGrid("home_advantage").add_axis(ParamField::HOME_ADVANTAGE, {1.5, 2, 2.5, 3}));

    // Refinement around the most promising region
    space.add_grid(ParameterGrid("refinement")
                       .add_axis(ParamField::SPREAD_SHRINKAGE, {0.15, 0.25, 0.35, 0.45})
                       .add_axis(ParamField::RATING_CAP, {0, 5, 7})
                       .add_axis(ParamField::MAX_SPREAD, {6, 8, 12}));
    return space;
}

ParameterSpace ParameterSpace::weather_search_plan() {
    ParameterSpace space;
    space.add_grid(ParameterGrid("weather_coefficient")
                       .add_axis(ParamField::WEATHER_COEFFICIENT, {0.0, 0.75, 1.5, 2.0, 3.0, 4.0}));
    return space;
}

NearDuplicateFilter::NearDuplicateFilter(std::vector<FieldTolerance> tolerances)
    : tolerances_(std::move(tolerances)) {}

NearDuplicateFilter NearDuplicateFilter::defaults() {
    return NearDuplicateFilter({{ParamField::SPREAD_SHRINKAGE, 0.05},
                                {ParamField::RATING_CAP, 1.0},
                                {ParamField::MAX_SPREAD, 1.0}});
}

bool NearDuplicateFilter::is_near_duplicate(const SimulationParams& a,
                                            const SimulationParams& b) const {
    if (tolerances_.empty()) {
        return a == b;
    }
    for (const auto& t : tolerances_) {
        if (std::abs(a.get(t.field) - b.get(t.field)) >= t.tolerance) {
            return false;
        }
    }
    return true;
}

}  // namespace optimization
}  // namespace line_ngin
